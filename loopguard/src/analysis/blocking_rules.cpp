#include "loopguard/analysis/blocking_rules.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace loopguard {

const std::vector<FunctionRule>& blocking_functions() {
    static const std::vector<FunctionRule> rules = {
        {"sleep", "Use $loop->addTimer() instead"},
        {"usleep", "Use $loop->addTimer() instead"},
        {"time_nanosleep", "Use $loop->addTimer() instead"},
        {"time_sleep_until", "Use $loop->addTimer() instead"},
        {"file_get_contents", "Use an async filesystem or HTTP client"},
        {"file_put_contents", "Use an async filesystem writer"},
        {"fopen", "Use non-blocking streams registered with the loop"},
        {"fread", "Use non-blocking streams registered with the loop"},
        {"fwrite", "Use non-blocking streams registered with the loop"},
        {"fgets", "Use non-blocking streams registered with the loop"},
        {"readfile", "Use an async filesystem reader"},
        {"file", "Use an async filesystem reader"},
        {"curl_exec", "Use an async HTTP client"},
        {"curl_multi_exec", "Use an async HTTP client"},
        {"fsockopen", "Use an async socket connector"},
        {"stream_socket_client", "Use an async socket connector"},
        {"socket_connect", "Use an async socket connector"},
        {"socket_read", "Use non-blocking sockets registered with the loop"},
        {"socket_write", "Use non-blocking sockets registered with the loop"},
        {"exec", "Use an async child process"},
        {"system", "Use an async child process"},
        {"passthru", "Use an async child process"},
        {"shell_exec", "Use an async child process"},
        {"proc_open", "Use an async child process"},
        {"popen", "Use an async child process"},
        {"mysqli_query", "Use an async MySQL client"},
        {"pg_query", "Use an async PostgreSQL client"},
        {"exit", "Throw an exception or return an error response"},
        {"die", "Throw an exception or return an error response"},
    };
    return rules;
}

const std::vector<FunctionRule>& unsafe_functions() {
    static const std::vector<FunctionRule> rules = {
        {"session_start", "Use a request-scoped session middleware"},
        {"setcookie", "Set the Set-Cookie header on the response"},
        {"header", "Set headers on the response object"},
        {"http_response_code", "Set the status on the response object"},
        {"ob_start", "Build the response body explicitly"},
        {"set_time_limit", "Use timers to bound long operations"},
        {"ini_set", "Configure the process once at startup"},
        {"putenv", "Pass configuration explicitly instead of mutating the environment"},
        {"setlocale", "Format with an explicit locale instead of changing the process locale"},
    };
    return rules;
}

std::string normalize_function_name(std::string_view name) {
    if (!name.empty() && name.front() == '\\') {
        name.remove_prefix(1);
    }
    std::string normalized(name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

std::optional<RuleMatch> classify_call(std::string_view name) {
    const std::string normalized = normalize_function_name(name);

    auto find_in = [&normalized](const std::vector<FunctionRule>& table) {
        return std::find_if(table.begin(), table.end(),
                            [&normalized](const FunctionRule& rule) { return rule.name == normalized; });
    };

    const auto& blocking = blocking_functions();
    if (auto it = find_in(blocking); it != blocking.end()) {
        return RuleMatch{ViolationKind::BlockingCall, Severity::Error, normalized, std::string(it->suggestion)};
    }

    const auto& unsafe = unsafe_functions();
    if (auto it = find_in(unsafe); it != unsafe.end()) {
        return RuleMatch{ViolationKind::UnsafeCall, Severity::Warning, normalized, std::string(it->suggestion)};
    }

    return std::nullopt;
}

bool is_superglobal(std::string_view variable_name) noexcept {
    static constexpr std::array<std::string_view, 9> superglobals = {
        "GLOBALS", "_SESSION", "_SERVER", "_ENV", "_GET", "_POST", "_COOKIE", "_FILES", "_REQUEST"
    };
    return std::find(superglobals.begin(), superglobals.end(), variable_name) != superglobals.end();
}

} // namespace loopguard
