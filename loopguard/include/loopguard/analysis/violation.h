#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace loopguard {

// ============================================================================
// Violation model
// ============================================================================

enum class ViolationKind : int {
    BlockingCall = 0,        ///< Halts the whole event loop (sleep, sync I/O, exit)
    UnsafeCall = 1,          ///< Safe alone, dangerous with shared execution (header, session_start)
    GlobalStateAccess = 2,   ///< Touches process-wide mutable state
    StaticMutableAccess = 3, ///< State that persists across invocations
    UnboundedLoop = 4        ///< while(true)-shaped loop with no exit
};

enum class Severity : int {
    Error = 0,
    Warning = 1
};

[[nodiscard]] std::string to_string(ViolationKind kind);
[[nodiscard]] std::string to_string(Severity severity);

/**
 * @brief Where a finding was made
 *
 * Static findings carry the scanned file (or context label) and line; runtime
 * findings carry the call frame captured at the last recorded activity.
 */
struct SourceLocation {
    std::string file;
    size_t line = 0;
    std::string function;    ///< Empty for static findings

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief One finding from static or runtime detection
 */
struct BlockingViolation {
    ViolationKind kind = ViolationKind::BlockingCall;
    Severity severity = Severity::Error;
    std::string symbol;      ///< Offending function or variable name
    SourceLocation location;
    std::string message;
    std::string suggestion;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct ScanSummary {
    size_t total = 0;
    size_t blocking = 0;     ///< Error severity count
    size_t warnings = 0;
    bool safe = true;        ///< blocking == 0

    [[nodiscard]] static ScanSummary from(const std::vector<BlockingViolation>& violations);
    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Result of scanning one unit of source text
 *
 * When the source could not be parsed, `error` holds the diagnostic and
 * `violations` is empty.
 */
struct ScanReport {
    std::string context;
    std::vector<BlockingViolation> violations;
    ScanSummary summary;
    std::optional<std::string> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    /**
     * @brief Safe to run on the event loop: parsed and no Error findings
     */
    [[nodiscard]] bool safe() const noexcept { return ok() && summary.safe; }

    [[nodiscard]] static ScanReport failed(std::string context, std::string error);

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace loopguard
