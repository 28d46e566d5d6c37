#pragma once

#include "loopguard/analysis/violation.h"
#include "loopguard/utils/logger.h"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace loopguard {

/**
 * @brief Static scan of PHP source for code that stalls an event loop
 *
 * The source is parsed into a syntax tree and every node is checked:
 *
 * - calls to functions in the blocking table (sleep, synchronous I/O,
 *   process spawning) and the `exit`/`die` constructs are errors
 * - calls to functions in the unsafe table (header, session_start, ...)
 *   are warnings
 * - superglobal access, `global` statements and static variables or
 *   properties are warnings
 * - `while (true)`, `do ... while (true)` and `for (;;)` without a `break`
 *   or `return` that leaves them are errors
 *
 * Loops whose bound is computed at run time are not reported.
 *
 * @code
 * BlockingAnalyzer analyzer;
 * auto report = analyzer.scan(source, "routes.php");
 * if (!report.safe()) {
 *     std::cerr << report.to_json().dump(2);
 * }
 * @endcode
 */
class BlockingAnalyzer {
public:
    explicit BlockingAnalyzer(std::shared_ptr<Logger> logger = nullptr);

    /**
     * @brief Scan source text
     * @param source PHP source, including the opening tag
     * @param context Label used as the file of every finding
     * @return Findings, or a report with `error` set when the source does not parse
     */
    [[nodiscard]] ScanReport scan(std::string_view source, const std::string& context = "<source>") const;

    /**
     * @brief Read and scan a file
     *
     * A missing or unreadable file yields a report with `error` set.
     */
    [[nodiscard]] ScanReport scan_file(const std::filesystem::path& path) const;

private:
    std::shared_ptr<Logger> logger_;
};

/**
 * @brief Read a whole source file
 * @throws SourceReadException if the file is missing or unreadable
 */
[[nodiscard]] std::string read_source_file(const std::filesystem::path& path);

} // namespace loopguard
