#include "loopguard/analysis/violation.h"

namespace loopguard {

std::string to_string(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::BlockingCall:        return "blocking_call";
        case ViolationKind::UnsafeCall:          return "unsafe_call";
        case ViolationKind::GlobalStateAccess:   return "global_state_access";
        case ViolationKind::StaticMutableAccess: return "static_mutable_access";
        case ViolationKind::UnboundedLoop:       return "unbounded_loop";
    }
    return "unknown";
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
    }
    return "unknown";
}

std::string SourceLocation::to_string() const {
    std::string text = file.empty() ? "<unknown>" : file;
    if (line > 0) {
        text += ":" + std::to_string(line);
    }
    if (!function.empty()) {
        text += " (" + function + ")";
    }
    return text;
}

nlohmann::json BlockingViolation::to_json() const {
    nlohmann::json j;
    j["kind"] = to_string(kind);
    j["severity"] = to_string(severity);
    j["symbol"] = symbol;
    j["file"] = location.file;
    j["line"] = location.line;
    if (!location.function.empty()) {
        j["function"] = location.function;
    }
    j["message"] = message;
    j["suggestion"] = suggestion;
    return j;
}

ScanSummary ScanSummary::from(const std::vector<BlockingViolation>& violations) {
    ScanSummary summary;
    summary.total = violations.size();
    for (const auto& v : violations) {
        if (v.severity == Severity::Error) {
            ++summary.blocking;
        } else {
            ++summary.warnings;
        }
    }
    summary.safe = summary.blocking == 0;
    return summary;
}

nlohmann::json ScanSummary::to_json() const {
    return nlohmann::json{
        {"total", total},
        {"blocking", blocking},
        {"warnings", warnings},
        {"safe", safe}
    };
}

ScanReport ScanReport::failed(std::string context, std::string error) {
    ScanReport report;
    report.context = std::move(context);
    report.error = std::move(error);
    report.summary = ScanSummary{};
    return report;
}

nlohmann::json ScanReport::to_json() const {
    nlohmann::json j;
    j["context"] = context;
    if (error) {
        j["error"] = *error;
    }

    j["violations"] = nlohmann::json::array();
    for (const auto& v : violations) {
        j["violations"].push_back(v.to_json());
    }
    j["summary"] = summary.to_json();
    return j;
}

} // namespace loopguard
