#include "loopguard/analysis/blocking_analyzer.h"

#include "loopguard/analysis/blocking_rules.h"
#include "loopguard/analysis/php_parser.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace loopguard {

namespace {

using php::Node;
using php::NodeKind;

/**
 * @brief True for literal `true` and non-zero integer literals
 */
bool is_constant_true(const Node* cond) {
    if (cond == nullptr) {
        return false;
    }
    if (cond->kind == NodeKind::Name) {
        return cond->value == "true";
    }
    if (cond->kind == NodeKind::IntegerLiteral) {
        std::string_view digits = cond->value;
        if (digits.size() > 2 && digits[0] == '0' &&
            (digits[1] == 'x' || digits[1] == 'X' || digits[1] == 'b' || digits[1] == 'B' ||
             digits[1] == 'o' || digits[1] == 'O')) {
            digits.remove_prefix(2);
        }
        return digits.find_first_not_of("0_") != std::string_view::npos;
    }
    return false;
}

bool is_breakable(NodeKind kind) {
    return kind == NodeKind::While || kind == NodeKind::DoWhile || kind == NodeKind::For ||
           kind == NodeKind::Foreach || kind == NodeKind::Switch;
}

bool is_function_scope(NodeKind kind) {
    return kind == NodeKind::FunctionDecl || kind == NodeKind::Closure ||
           kind == NodeKind::ArrowFunction || kind == NodeKind::ClassDecl;
}

int break_level(const Node& node) {
    if (node.value.empty()) {
        return 1;
    }
    try {
        return std::max(std::stoi(node.value, nullptr, 0), 1);
    } catch (const std::exception&) {
        return 1;   // "break $n" and friends
    }
}

/**
 * @brief Whether control can leave the loop whose body is `body`
 *
 * A `break` escapes when its level exceeds the breakable constructs
 * between it and the loop. Nested functions and classes are not entered.
 */
bool escapes_loop(const Node& body) {
    std::vector<std::pair<const Node*, int>> pending{{&body, 0}};
    while (!pending.empty()) {
        const auto [node, depth] = pending.back();
        pending.pop_back();

        if (node->kind == NodeKind::Return) {
            return true;
        }
        if (node->kind == NodeKind::Break) {
            if (break_level(*node) > depth) {
                return true;
            }
            continue;
        }
        if (is_function_scope(node->kind)) {
            continue;
        }

        const int child_depth = is_breakable(node->kind) ? depth + 1 : depth;
        for (const auto& child : node->children) {
            if (child) {
                pending.emplace_back(child.get(), child_depth);
            }
        }
    }
    return false;
}

class BlockingVisitor : public php::NodeVisitor {
public:
    explicit BlockingVisitor(std::string context) : context_(std::move(context)) {}

    bool enter(const Node& node) override {
        switch (node.kind) {
            case NodeKind::Call:
                if (!node.name.empty()) {
                    check_call(node);
                }
                return true;

            case NodeKind::Exit: {
                auto rule = classify_call(node.name);
                add(node, ViolationKind::BlockingCall, Severity::Error, node.name,
                    "Language construct '" + node.name + "' kills the entire server",
                    rule ? rule->suggestion : std::string());
                return true;
            }

            case NodeKind::ShellCommand:
                add(node, ViolationKind::BlockingCall, Severity::Error, "shell_exec",
                    "Backtick shell command will freeze the server",
                    classify_call("shell_exec")->suggestion);
                return true;

            case NodeKind::Variable:
                if (is_superglobal(node.name)) {
                    add_global(node, node.name);
                }
                return true;

            case NodeKind::GlobalDecl:
                for (const auto& var : node.children) {
                    if (var && var->kind == NodeKind::Variable && !var->name.empty()) {
                        add_global(*var, var->name);
                    }
                }
                return false;

            case NodeKind::StaticVarDecl:
                for (const auto& var : node.children) {
                    add(*var, ViolationKind::StaticMutableAccess, Severity::Warning, "$" + var->name,
                        "Static variables persist across requests",
                        "Use class properties with proper lifecycle management");
                }
                return true;

            case NodeKind::PropertyDecl:
                if (node.value == "static") {
                    add(node, ViolationKind::StaticMutableAccess, Severity::Warning, "$" + node.name,
                        "Static property $" + node.name + " persists across requests",
                        "Use class properties with proper lifecycle management");
                }
                return true;

            case NodeKind::While:
                check_loop(node, node.child(0), node.child(1), "while(true)");
                return true;

            case NodeKind::DoWhile:
                check_loop(node, node.child(1), node.child(0), "do-while(true)");
                return true;

            case NodeKind::For: {
                const Node* cond = node.child(1);
                const bool endless = cond != nullptr &&
                    (cond->children.empty() ||
                     (cond->children.size() == 1 && is_constant_true(cond->child(0))));
                if (endless && !escapes(node.child(3))) {
                    add_unbounded(node, "for(;;)");
                }
                return true;
            }

            default:
                return true;
        }
    }

    [[nodiscard]] std::vector<BlockingViolation> take() { return std::move(violations_); }

private:
    std::string context_;
    std::vector<BlockingViolation> violations_;

    void add(const Node& node, ViolationKind kind, Severity severity, std::string symbol,
             std::string message, std::string suggestion) {
        BlockingViolation v;
        v.kind = kind;
        v.severity = severity;
        v.symbol = std::move(symbol);
        v.location = SourceLocation{context_, node.line, ""};
        v.message = std::move(message);
        v.suggestion = std::move(suggestion);
        violations_.push_back(std::move(v));
    }

    void add_global(const Node& node, const std::string& name) {
        add(node, ViolationKind::GlobalStateAccess, Severity::Warning, "$" + name,
            "Global variable $" + name + " is shared across all requests",
            "Use request attributes or dependency injection");
    }

    void add_unbounded(const Node& node, const char* shape) {
        add(node, ViolationKind::UnboundedLoop, Severity::Error, shape,
            "Potentially infinite loop will block the server",
            "Add timeout or use periodic timers");
    }

    void check_call(const Node& node) {
        auto rule = classify_call(node.name);
        if (!rule) {
            return;
        }
        if (rule->kind == ViolationKind::BlockingCall) {
            add(node, rule->kind, rule->severity, rule->symbol,
                "Blocking function '" + rule->symbol + "' will freeze the server", rule->suggestion);
        } else {
            add(node, rule->kind, rule->severity, rule->symbol,
                "Function '" + rule->symbol + "' may cause issues on the event loop", rule->suggestion);
        }
    }

    static bool escapes(const Node* body) {
        return body != nullptr && escapes_loop(*body);
    }

    void check_loop(const Node& node, const Node* cond, const Node* body, const char* shape) {
        if (is_constant_true(cond) && !escapes(body)) {
            add_unbounded(node, shape);
        }
    }
};

} // namespace

std::string read_source_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw SourceReadException(path.string(), ec ? ec.message() : "not a regular file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw SourceReadException(path.string(), "open failed");
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw SourceReadException(path.string(), "read failed");
    }
    return buffer.str();
}

BlockingAnalyzer::BlockingAnalyzer(std::shared_ptr<Logger> logger)
    : logger_(logger ? std::move(logger) : LoggerFactory::get_logger("loopguard.analyzer")) {
}

ScanReport BlockingAnalyzer::scan(std::string_view source, const std::string& context) const {
    try {
        auto program = php::Parser::parse(source);

        BlockingVisitor visitor(context);
        php::walk(*program, visitor);

        ScanReport report;
        report.context = context;
        report.violations = visitor.take();
        report.summary = ScanSummary::from(report.violations);

        logger_->debug("Scanned " + context, {
            {"violations", std::to_string(report.summary.total)},
            {"blocking", std::to_string(report.summary.blocking)}
        });
        return report;
    } catch (const php::ParseError& e) {
        logger_->warn("Could not parse " + context, {{"error", e.what()}});
        return ScanReport::failed(context, e.what());
    } catch (const std::exception& e) {
        logger_->error("Analysis of " + context + " failed", {{"error", e.what()}});
        return ScanReport::failed(context, e.what());
    }
}

ScanReport BlockingAnalyzer::scan_file(const std::filesystem::path& path) const {
    std::string source;
    try {
        source = read_source_file(path);
    } catch (const SourceReadException& e) {
        logger_->warn(e.what());
        return ScanReport::failed(path.string(), e.what());
    }
    return scan(source, path.string());
}

} // namespace loopguard
