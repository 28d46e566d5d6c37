#pragma once

#include "loopguard/analysis/violation.h"

#include <string>
#include <string_view>
#include <vector>

namespace loopguard {

/**
 * @brief Pattern-based policy check for shared process state
 *
 * Complements BlockingAnalyzer with a cheap textual pass that works on
 * fragments which do not parse. Every match is reported with its line as a
 * Warning, together with the request-scoped alternative.
 */
class GlobalStateChecker {
public:
    /**
     * @brief `literal`, optional whitespace, then `follower`
     *
     * Equivalent to the regex `\b?literal\s*follower` (`\s+` when
     * `needs_space`), matched with a single forward scan per pattern.
     */
    struct Pattern {
        std::string literal;
        char follower;
        bool word_start;    ///< Literal may not continue an identifier
        bool needs_space;   ///< At least one whitespace before the follower
        ViolationKind kind;
        std::string symbol;
        std::string message;
        std::string suggestion;
    };

    GlobalStateChecker();

    /**
     * @brief Report every policy match in `source`
     *
     * Runs in time linear in the size of `source` for each pattern.
     */
    [[nodiscard]] ScanReport check(std::string_view source, const std::string& context = "<source>") const;

    [[nodiscard]] const std::vector<Pattern>& patterns() const noexcept { return patterns_; }

private:
    std::vector<Pattern> patterns_;
};

} // namespace loopguard
