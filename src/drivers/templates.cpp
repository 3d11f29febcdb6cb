#include "warden/drivers/templates.h"

namespace warden::drivers {

namespace {

constexpr std::string_view kValidatorPrelude = R"PY(import re
import math
import statistics
import json as _warden_json
from datetime import datetime, date
from collections import Counter

)PY";

constexpr std::string_view kValidatorEpilogue = R"PY(

def _warden_plain(value):
    return _warden_json.loads(_warden_json.dumps(value, default=str))


def _execute_validator(column_name, values, params, schema, row_count):
    result = validate(column_name, values, params, schema, row_count)
    if isinstance(result, bool):
        return {
            "passed": result,
            "issues": [],
            "message": "Validation passed" if result else "Validation failed",
            "details": {},
        }
    if isinstance(result, dict):
        return {
            "passed": bool(result.get("passed", False)),
            "issues": _warden_plain(result.get("issues", [])),
            "message": str(result.get("message", "")),
            "details": _warden_plain(result.get("details", {})),
        }
    return {
        "passed": False,
        "issues": [],
        "message": "Invalid result type: %s" % type(result).__name__,
        "details": {},
    }
)PY";

constexpr std::string_view kReporterPrelude = R"PY(import json
from datetime import datetime
from collections import Counter

)PY";

constexpr std::string_view kReporterEpilogue = R"PY(

def _execute_reporter(data, config, format, metadata):
    result = generate_report(data, config, format, metadata)
    if isinstance(result, str):
        return {"content": result, "content_type": "text/html", "filename": "report.html"}
    if isinstance(result, dict):
        return {
            "content": str(result.get("content", "")),
            "content_type": str(result.get("content_type", "text/html")),
            "filename": str(result.get("filename", "report.html")),
        }
    return {"content": str(result), "content_type": "text/plain", "filename": "report.txt"}
)PY";

constexpr std::string_view kTemplateRenderer = R"PY(import json


def _substitute(text, prefix, values):
    if not isinstance(values, dict):
        return text
    for key, value in values.items():
        placeholder = "{{ " + prefix + str(key) + " }}"
        if placeholder in text:
            text = text.replace(placeholder, str(value))
    return text


def generate_report(data, config, format, metadata):
    content = _template
    content = _substitute(content, "", data)
    content = _substitute(content, "metadata.", metadata)
    content = _substitute(content, "config.", config)

    if format == "json":
        return {
            "content": json.dumps(data, indent=2, default=str),
            "content_type": "application/json",
            "filename": "report.json",
        }
    if format == "markdown":
        return {"content": content, "content_type": "text/markdown", "filename": "report.md"}
    if format == "csv":
        return {"content": content, "content_type": "text/csv", "filename": "report.csv"}
    return {"content": content, "content_type": "text/html", "filename": "report.html"}
)PY";

constexpr std::string_view kValidatorTemplate = R"PY(def validate(column_name, values, params, schema, row_count):
    """Checks one column.

    column_name  name of the column under test
    values       list of the column's values
    params       parameter values configured for this validator
    schema       column schema information
    row_count    total number of rows

    Return a bool, or a dict with passed, issues, message and details.
    """
    issues = []

    null_count = sum(1 for v in values if v is None)
    if null_count > 0:
        issues.append({
            "row": None,
            "message": f"Found {null_count} null values",
            "severity": "warning",
        })

    # threshold = params.get("threshold", 0.1)

    return {
        "passed": len(issues) == 0,
        "issues": issues,
        "message": f"Validation completed with {len(issues)} issues",
        "details": {
            "null_count": null_count,
            "total_values": len(values),
        },
    }
)PY";

constexpr std::string_view kReporterTemplate = R"PY(def generate_report(data, config, format, metadata):
    """Builds a report document.

    data      values to report on
    config    reporter configuration
    format    requested output format: html, json, markdown or csv
    metadata  generation metadata such as generated_at

    Return a str (served as HTML), or a dict with content, content_type and
    filename.
    """
    issues = data.get("issues", [])
    rows = "".join(f'<div class="issue">{issue}</div>' for issue in issues)
    html = f"""<!DOCTYPE html>
<html>
<head>
    <title>Validation Report</title>
    <style>
        body {{ font-family: Arial, sans-serif; margin: 20px; }}
        h1 {{ color: #333; }}
        .summary {{ background: #f5f5f5; padding: 15px; border-radius: 5px; }}
        .issue {{ padding: 10px; margin: 5px 0; border-left: 3px solid #fd9e4b; }}
    </style>
</head>
<body>
    <h1>Validation Report</h1>
    <div class="summary">
        <p>Generated: {metadata.get('generated_at', 'Unknown')}</p>
        <p>Total Issues: {len(issues)}</p>
    </div>
    <div class="issues">
        <h2>Issues</h2>
        {rows}
    </div>
</body>
</html>
"""
    return {
        "content": html,
        "content_type": "text/html",
        "filename": "validation_report.html",
    }
)PY";

constexpr std::string_view kReportHtmlTemplate = R"HTML(<!DOCTYPE html>
<html>
<head>
    <title>{{ title }}</title>
    <style>
        body { font-family: Arial, sans-serif; margin: 20px; }
        h1 { color: #fd9e4b; }
        .card { background: #f5f5f5; padding: 15px; border-radius: 5px; margin: 10px 0; }
    </style>
</head>
<body>
    <h1>{{ title }}</h1>
    <div class="card">
        <h3>Summary</h3>
        <p>Generated: {{ metadata.generated_at }}</p>
        <p>Source: {{ source_name }}</p>
        <p>Status: {{ status }}</p>
    </div>
</body>
</html>
)HTML";

}  // namespace

std::string_view ValidatorTemplate() {
  return kValidatorTemplate;
}

std::string_view ReporterTemplate() {
  return kReporterTemplate;
}

std::string_view ReportHtmlTemplate() {
  return kReportHtmlTemplate;
}

std::string WrapValidatorCode(std::string_view user_code) {
  std::string out;
  out.reserve(kValidatorPrelude.size() + user_code.size() + kValidatorEpilogue.size() + 1);
  out.append(kValidatorPrelude);
  out.append(user_code);
  out.push_back('\n');
  out.append(kValidatorEpilogue);
  return out;
}

std::string WrapReporterCode(std::string_view user_code) {
  std::string out;
  out.reserve(kReporterPrelude.size() + user_code.size() + kReporterEpilogue.size() + 1);
  out.append(kReporterPrelude);
  out.append(user_code);
  out.push_back('\n');
  out.append(kReporterEpilogue);
  return out;
}

std::string_view TemplateRendererCode() {
  return kTemplateRenderer;
}

}  // namespace warden::drivers
