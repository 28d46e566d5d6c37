#pragma once

#include "loopguard/analysis/violation.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loopguard {

/**
 * @brief Entry of a function rule table
 */
struct FunctionRule {
    std::string_view name;        ///< Lower-case, no namespace prefix
    std::string_view suggestion;
};

/**
 * @brief Result of looking a called function up in the rule tables
 */
struct RuleMatch {
    ViolationKind kind;
    Severity severity;
    std::string symbol;           ///< Normalized function name
    std::string suggestion;
};

/**
 * @brief Functions that halt the event loop while they run
 */
[[nodiscard]] const std::vector<FunctionRule>& blocking_functions();

/**
 * @brief Functions that misbehave when many requests share one process
 */
[[nodiscard]] const std::vector<FunctionRule>& unsafe_functions();

/**
 * @brief Lower-case a called name and strip a leading namespace separator
 *
 * `\Sleep` and `SLEEP` both become `sleep`. Qualified names such as
 * `App\sleep` are left qualified and never match a rule.
 */
[[nodiscard]] std::string normalize_function_name(std::string_view name);

/**
 * @brief Classify a plain function call
 * @return The blocking rule if one matches, else the unsafe rule, else nothing
 */
[[nodiscard]] std::optional<RuleMatch> classify_call(std::string_view name);

/**
 * @brief PHP superglobals whose access is reported as shared state
 */
[[nodiscard]] bool is_superglobal(std::string_view variable_name) noexcept;

} // namespace loopguard
