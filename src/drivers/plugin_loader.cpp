#include "warden/drivers/plugin_loader.h"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "warden/common.h"
#include "warden/error.h"
#include "warden/orchestrator/io_util.h"

namespace warden::drivers {

namespace {

[[noreturn]] void ThrowManifestError(const std::filesystem::path& file, size_t line_number,
                                     const std::string& detail) {
  std::string message = file.string();
  if (line_number > 0) {
    message += " line " + std::to_string(line_number);
  }
  throw Error(ErrorDomain::Validation, errors::validation::kMalformedManifest, message + ": " + detail);
}

bool ValidPluginId(std::string_view id) {
  if (id.empty() || id == "." || id == "..") {
    return false;
  }
  return std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
           c == '_' || c == '.';
  });
}

std::filesystem::path ResolveRelative(const std::filesystem::path& directory, std::string_view value,
                                      const std::filesystem::path& manifest, size_t line_number) {
  std::filesystem::path relative{std::string(value)};
  if (relative.empty() || relative.is_absolute()) {
    ThrowManifestError(manifest, line_number, "file paths must be relative to the plugin directory");
  }
  for (const auto& part : relative) {
    if (part == "..") {
      ThrowManifestError(manifest, line_number, "file paths may not leave the plugin directory");
    }
  }
  return directory / relative;
}

// <alg>:<signer>:<hex>[:<unix seconds>]
trust::SignatureInfo ParseSignatureLine(std::string_view value, const std::filesystem::path& manifest,
                                        size_t line_number) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    auto colon = value.find(':', start);
    parts.emplace_back(Trim(value.substr(start, colon == std::string_view::npos ? value.npos : colon - start)));
    if (colon == std::string_view::npos) {
      break;
    }
    start = colon + 1;
  }
  if (parts.size() != 3 && parts.size() != 4) {
    ThrowManifestError(manifest, line_number, "signature expects <algorithm>:<signer>:<hex>[:<timestamp>]");
  }
  auto algorithm = trust::ParseAlgorithm(parts[0]);
  if (!algorithm) {
    ThrowManifestError(manifest, line_number, "unknown signature algorithm '" + parts[0] + "'");
  }
  if (parts[2].empty() || !crypto::HexDecode(parts[2])) {
    ThrowManifestError(manifest, line_number, "signature value must be hex");
  }
  trust::SignatureInfo info;
  info.algorithm = *algorithm;
  info.signer_id = parts[1];
  info.signature = parts[2];
  std::transform(info.signature.begin(), info.signature.end(), info.signature.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (parts.size() == 4) {
    auto timestamp = ParseUint64(parts[3]);
    if (!timestamp) {
      ThrowManifestError(manifest, line_number, "signature timestamp must be unix seconds");
    }
    info.timestamp = static_cast<int64_t>(*timestamp);
  }
  return info;
}

}  // namespace

const char* PluginKindToString(PluginKind kind) {
  switch (kind) {
  case PluginKind::kValidator:
    return "validator";
  case PluginKind::kReporter:
    return "reporter";
  case PluginKind::kPlugin:
    return "plugin";
  }
  return "plugin";
}

std::optional<PluginKind> ParsePluginKind(std::string_view text) {
  if (text == "validator") {
    return PluginKind::kValidator;
  }
  if (text == "reporter") {
    return PluginKind::kReporter;
  }
  if (text == "plugin") {
    return PluginKind::kPlugin;
  }
  return std::nullopt;
}

std::string_view PluginManifest::SignedPayload() const noexcept {
  return code.empty() ? std::string_view(template_text) : std::string_view(code);
}

nlohmann::json PluginManifest::ToJson() const {
  auto signature_list = nlohmann::json::array();
  for (const auto& signature : signatures) {
    signature_list.push_back(signature.ToJson());
  }
  return {
      {"id", id},
      {"name", name},
      {"version", version},
      {"kind", PluginKindToString(kind)},
      {"has_code", !code.empty()},
      {"has_template", !template_text.empty()},
      {"permissions", permissions},
      {"signatures", signature_list},
  };
}

void InMemoryPluginLoader::Add(PluginManifest manifest) {
  std::lock_guard lock(mutex_);
  auto id = manifest.id;
  plugins_[id] = std::move(manifest);
}

PluginManifest InMemoryPluginLoader::Load(std::string_view plugin_id) {
  std::lock_guard lock(mutex_);
  auto it = plugins_.find(plugin_id);
  if (it == plugins_.end()) {
    throw Error(ErrorDomain::Validation, errors::validation::kInvalidArgument,
                "Unknown plugin: " + std::string(plugin_id));
  }
  return it->second;
}

std::vector<std::string> InMemoryPluginLoader::List() {
  std::lock_guard lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(plugins_.size());
  for (const auto& [id, manifest] : plugins_) {
    ids.push_back(id);
  }
  return ids;
}

DirectoryPluginLoader::DirectoryPluginLoader(std::filesystem::path root) : root_(std::move(root)) {}

PluginManifest DirectoryPluginLoader::Load(std::string_view plugin_id) {
  if (!ValidPluginId(plugin_id)) {
    throw Error(ErrorDomain::Validation, errors::validation::kInvalidArgument,
                "Invalid plugin id: " + std::string(plugin_id));
  }
  auto manifest = LoadPluginDirectory(root_ / std::string(plugin_id));
  if (manifest.id != plugin_id) {
    ThrowManifestError(root_ / std::string(plugin_id) / kManifestFileName, 0,
                       "manifest id '" + manifest.id + "' does not match directory name");
  }
  return manifest;
}

std::vector<std::string> DirectoryPluginLoader::List() {
  std::vector<std::string> ids;
  std::error_code ec;
  std::filesystem::directory_iterator it(root_, ec);
  if (ec) {
    throw Error(ErrorDomain::IO, errors::io::kFileUnreadable,
                "Cannot list plugin directory " + root_.string() + ": " + ec.message(), ec.value());
  }
  for (const auto& entry : it) {
    if (entry.is_directory(ec) && std::filesystem::exists(entry.path() / kManifestFileName, ec)) {
      ids.push_back(entry.path().filename().string());
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

PluginManifest LoadPluginDirectory(const std::filesystem::path& directory) {
  const auto manifest_path = directory / kManifestFileName;
  const auto text = orchestrator::ReadTextFile(manifest_path);

  PluginManifest manifest;
  std::optional<std::filesystem::path> code_file;
  std::optional<std::filesystem::path> template_file;

  std::string_view rest = text;
  size_t line_number = 0;
  while (!rest.empty()) {
    auto newline = rest.find('\n');
    auto raw = rest.substr(0, newline);
    rest.remove_prefix(newline == std::string_view::npos ? rest.size() : newline + 1);
    ++line_number;

    auto view = Trim(raw);
    if (view.empty() || view.front() == '#') {
      continue;
    }
    auto equals = view.find('=');
    if (equals == std::string_view::npos) {
      ThrowManifestError(manifest_path, line_number, "expected key=value");
    }
    auto key = Trim(view.substr(0, equals));
    auto value = Trim(view.substr(equals + 1));

    if (key == "id") {
      if (!ValidPluginId(value)) {
        ThrowManifestError(manifest_path, line_number, "invalid plugin id");
      }
      manifest.id = std::string(value);
    } else if (key == "name") {
      manifest.name = std::string(value);
    } else if (key == "version") {
      manifest.version = std::string(value);
    } else if (key == "kind") {
      auto kind = ParsePluginKind(value);
      if (!kind) {
        ThrowManifestError(manifest_path, line_number, "kind must be validator, reporter or plugin");
      }
      manifest.kind = *kind;
    } else if (key == "code_file") {
      code_file = ResolveRelative(directory, value, manifest_path, line_number);
    } else if (key == "template_file") {
      template_file = ResolveRelative(directory, value, manifest_path, line_number);
    } else if (key == "permission") {
      if (value.empty()) {
        ThrowManifestError(manifest_path, line_number, "permission needs a name");
      }
      manifest.permissions.emplace_back(value);
    } else if (key == "signature") {
      manifest.signatures.push_back(ParseSignatureLine(value, manifest_path, line_number));
    } else {
      ThrowManifestError(manifest_path, line_number, "unknown key '" + std::string(key) + "'");
    }
  }

  if (manifest.id.empty()) {
    ThrowManifestError(manifest_path, 0, "missing id");
  }
  if (manifest.name.empty()) {
    manifest.name = manifest.id;
  }
  if (code_file) {
    manifest.code = orchestrator::ReadTextFile(*code_file);
  }
  if (template_file) {
    manifest.template_text = orchestrator::ReadTextFile(*template_file);
  }
  if (manifest.code.empty() && manifest.template_text.empty()) {
    ThrowManifestError(manifest_path, 0, "manifest names neither code_file nor template_file");
  }
  return manifest;
}

}  // namespace warden::drivers
