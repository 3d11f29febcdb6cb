#pragma once

#include <string>
#include <string_view>

namespace warden::drivers {

inline constexpr const char* kValidatorEntryPoint = "_execute_validator";
inline constexpr const char* kReporterEntryPoint = "_execute_reporter";
inline constexpr const char* kTemplateEntryPoint = "generate_report";
// Global through which the template text reaches the fixed renderer.
inline constexpr const char* kTemplateGlobal = "_template";

// Starter code handed to plugin authors.
std::string_view ValidatorTemplate();
std::string_view ReporterTemplate();
std::string_view ReportHtmlTemplate();

// User code followed by the entry point that normalizes validate() output to
// {passed, issues, message, details}.
std::string WrapValidatorCode(std::string_view user_code);
// User code followed by the entry point that normalizes generate_report()
// output to {content, content_type, filename}.
std::string WrapReporterCode(std::string_view user_code);
// Fixed renderer for template reporters. The template itself is never part of
// the code; it is read from the _template global.
std::string_view TemplateRendererCode();

}  // namespace warden::drivers
