#include "loopguard/analysis/global_state_checker.h"

#include <algorithm>
#include <cctype>
#include <tuple>

namespace loopguard {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/**
 * @brief Offsets at which `pattern` matches in `text`
 */
std::vector<size_t> find_matches(std::string_view text, const GlobalStateChecker::Pattern& pattern) {
    std::vector<size_t> offsets;

    size_t pos = text.find(pattern.literal);
    while (pos != std::string_view::npos) {
        const size_t start = pos;
        pos = text.find(pattern.literal, start + 1);

        if (pattern.word_start && start > 0 && is_word_char(text[start - 1])) {
            continue;
        }

        size_t cursor = start + pattern.literal.size();
        const size_t spaces_from = cursor;
        while (cursor < text.size() && is_space(text[cursor])) {
            ++cursor;
        }
        if (pattern.needs_space && cursor == spaces_from) {
            continue;
        }
        if (cursor < text.size() && text[cursor] == pattern.follower) {
            offsets.push_back(start);
        }
    }
    return offsets;
}

} // namespace

GlobalStateChecker::GlobalStateChecker() {
    const auto superglobal = [this](const char* name, const char* message, const char* suggestion) {
        patterns_.push_back(Pattern{std::string("$") + name, '[', false, false,
                                    ViolationKind::GlobalStateAccess, std::string("$") + name,
                                    message, suggestion});
    };
    const auto call = [this](const char* name, const char* message, const char* suggestion) {
        patterns_.push_back(Pattern{name, '(', true, false, ViolationKind::UnsafeCall, name,
                                    message, suggestion});
    };

    superglobal("GLOBALS", "Direct $GLOBALS access is forbidden",
                "Pass values through request attributes or dependency injection");
    superglobal("_SESSION", "Direct $_SESSION access is forbidden", "Use a request-scoped session store");
    superglobal("_GET", "Direct $_GET access reads another request's data",
                "Use $request->getQueryParams() instead");
    superglobal("_POST", "Direct $_POST access reads another request's data",
                "Use $request->getParsedBody() instead");
    superglobal("_COOKIE", "Direct $_COOKIE access reads another request's data",
                "Use $request->getCookieParams() instead");
    superglobal("_SERVER", "Direct $_SERVER access reads another request's data",
                "Use $request->getServerParams() instead");
    superglobal("_FILES", "Direct $_FILES access reads another request's data",
                "Use $request->getUploadedFiles() instead");

    patterns_.push_back(Pattern{"global", '$', true, true, ViolationKind::GlobalStateAccess, "global",
                                "Global keyword is forbidden",
                                "Use request attributes or dependency injection"});

    call("putenv", "putenv() affects all requests", "Pass configuration explicitly");
    call("setlocale", "setlocale() affects all requests", "Format with an explicit locale");
    call("setcookie", "setcookie() writes to a shared response",
         "Use Response->withHeader(\"Set-Cookie\") instead");
    call("session_start", "Native sessions are shared across all requests",
         "Use a request-scoped session store");
}

ScanReport GlobalStateChecker::check(std::string_view source, const std::string& context) const {
    ScanReport report;
    report.context = context;

    // (offset, pattern index) so findings come out in source order
    std::vector<std::tuple<size_t, size_t>> matches;
    for (size_t i = 0; i < patterns_.size(); ++i) {
        for (size_t offset : find_matches(source, patterns_[i])) {
            matches.emplace_back(offset, i);
        }
    }
    std::sort(matches.begin(), matches.end());

    size_t line = 1;
    size_t scanned = 0;
    for (const auto& [offset, index] : matches) {
        line += static_cast<size_t>(std::count(source.begin() + static_cast<std::ptrdiff_t>(scanned),
                                               source.begin() + static_cast<std::ptrdiff_t>(offset), '\n'));
        scanned = offset;

        const Pattern& pattern = patterns_[index];
        BlockingViolation v;
        v.kind = pattern.kind;
        v.severity = Severity::Warning;
        v.symbol = pattern.symbol;
        v.location = SourceLocation{context, line, ""};
        v.message = pattern.message;
        v.suggestion = pattern.suggestion;
        report.violations.push_back(std::move(v));
    }

    report.summary = ScanSummary::from(report.violations);
    return report;
}

} // namespace loopguard
