#include "loopguard/analysis/blocking_analyzer.h"
#include "loopguard/analysis/blocking_rules.h"
#include "loopguard/core/exceptions.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace loopguard;

class BlockingAnalyzerTest : public ::testing::Test {
protected:
    BlockingAnalyzer analyzer{fakes::silent_logger()};

    static size_t count(const ScanReport& report, ViolationKind kind) {
        return static_cast<size_t>(std::count_if(report.violations.begin(), report.violations.end(),
            [kind](const BlockingViolation& v) { return v.kind == kind; }));
    }

    static const BlockingViolation* find(const ScanReport& report, const std::string& symbol) {
        for (const auto& v : report.violations) {
            if (v.symbol == symbol) return &v;
        }
        return nullptr;
    }
};

// ============================================================================
// Rule tables
// ============================================================================

TEST(BlockingRulesTest, NormalizesCallNames) {
    EXPECT_EQ(normalize_function_name("\\Sleep"), "sleep");
    EXPECT_EQ(normalize_function_name("FILE_GET_CONTENTS"), "file_get_contents");
    EXPECT_EQ(normalize_function_name("App\\sleep"), "app\\sleep");
}

TEST(BlockingRulesTest, BlockingTableWinsOverUnsafeTable) {
    auto sleep = classify_call("sleep");
    ASSERT_TRUE(sleep.has_value());
    EXPECT_EQ(sleep->kind, ViolationKind::BlockingCall);
    EXPECT_EQ(sleep->severity, Severity::Error);

    auto header = classify_call("header");
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->kind, ViolationKind::UnsafeCall);
    EXPECT_EQ(header->severity, Severity::Warning);

    EXPECT_FALSE(classify_call("strlen").has_value());
    EXPECT_FALSE(classify_call("App\\sleep").has_value());
}

TEST(BlockingRulesTest, EveryRuleHasSuggestion) {
    for (const auto& rule : blocking_functions()) {
        EXPECT_FALSE(rule.suggestion.empty()) << rule.name;
    }
    for (const auto& rule : unsafe_functions()) {
        EXPECT_FALSE(rule.suggestion.empty()) << rule.name;
    }
}

TEST(BlockingRulesTest, Superglobals) {
    EXPECT_TRUE(is_superglobal("_SESSION"));
    EXPECT_TRUE(is_superglobal("GLOBALS"));
    EXPECT_FALSE(is_superglobal("session"));
    EXPECT_FALSE(is_superglobal("_session"));
}

// ============================================================================
// Calls
// ============================================================================

TEST_F(BlockingAnalyzerTest, SleepIsBlocking) {
    auto report = analyzer.scan("<?php\n$x = 1;\nsleep(5);\n", "worker.php");

    ASSERT_TRUE(report.ok());
    ASSERT_EQ(report.violations.size(), 1u);
    const auto& v = report.violations.front();
    EXPECT_EQ(v.kind, ViolationKind::BlockingCall);
    EXPECT_EQ(v.severity, Severity::Error);
    EXPECT_EQ(v.symbol, "sleep");
    EXPECT_EQ(v.location.file, "worker.php");
    EXPECT_EQ(v.location.line, 3u);
    EXPECT_EQ(v.message, "Blocking function 'sleep' will freeze the server");
    EXPECT_FALSE(v.suggestion.empty());

    EXPECT_FALSE(report.safe());
    EXPECT_EQ(report.summary.blocking, 1u);
}

TEST_F(BlockingAnalyzerTest, CallNamesAreCaseInsensitiveAndRootQualified) {
    auto report = analyzer.scan("<?php \\FILE_GET_CONTENTS('/etc/hosts'); Usleep(10);");

    ASSERT_EQ(report.violations.size(), 2u);
    EXPECT_NE(find(report, "file_get_contents"), nullptr);
    EXPECT_NE(find(report, "usleep"), nullptr);
}

TEST_F(BlockingAnalyzerTest, MethodsWithBlockingNamesAreIgnored) {
    auto report = analyzer.scan("<?php $timer->sleep(1); Clock::sleep(2); $fs->file_get_contents('x');");

    EXPECT_TRUE(report.violations.empty());
    EXPECT_TRUE(report.safe());
}

TEST_F(BlockingAnalyzerTest, UnsafeCallIsWarning) {
    auto report = analyzer.scan("<?php header('Location: /'); session_start();");

    ASSERT_EQ(report.violations.size(), 2u);
    for (const auto& v : report.violations) {
        EXPECT_EQ(v.kind, ViolationKind::UnsafeCall);
        EXPECT_EQ(v.severity, Severity::Warning);
    }
    EXPECT_EQ(report.violations[0].message, "Function 'header' may cause issues on the event loop");
    EXPECT_TRUE(report.safe());
    EXPECT_EQ(report.summary.warnings, 2u);
}

TEST_F(BlockingAnalyzerTest, ExitAndDieKillTheServer) {
    auto report = analyzer.scan("<?php\nif ($bad) { exit(1); }\n$f = fopen('x', 'r') or die;\n");

    const auto* exit_v = find(report, "exit");
    const auto* die_v = find(report, "die");
    ASSERT_NE(exit_v, nullptr);
    ASSERT_NE(die_v, nullptr);
    EXPECT_EQ(exit_v->message, "Language construct 'exit' kills the entire server");
    EXPECT_EQ(exit_v->location.line, 2u);
}

TEST_F(BlockingAnalyzerTest, BacktickIsShellExec) {
    auto report = analyzer.scan("<?php $files = `ls /tmp`;");

    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].symbol, "shell_exec");
    EXPECT_EQ(report.violations[0].kind, ViolationKind::BlockingCall);
}

TEST_F(BlockingAnalyzerTest, CallsInsideStringsAndCommentsAreIgnored) {
    auto report = analyzer.scan("<?php\n// sleep(1);\n$msg = 'do not sleep(1) here';\n/* exec('rm'); */\n");
    EXPECT_TRUE(report.violations.empty());
}

TEST_F(BlockingAnalyzerTest, NestedCallsAreAllReported) {
    auto report = analyzer.scan("<?php echo json_encode(file(realpath(fread($h, 10))));");

    EXPECT_NE(find(report, "file"), nullptr);
    EXPECT_NE(find(report, "fread"), nullptr);
    EXPECT_EQ(count(report, ViolationKind::BlockingCall), 2u);
}

// ============================================================================
// Shared state
// ============================================================================

TEST_F(BlockingAnalyzerTest, SuperglobalAccessIsWarning) {
    auto report = analyzer.scan("<?php $id = $_SESSION['user']; $all = $GLOBALS;");

    ASSERT_EQ(report.violations.size(), 2u);
    const auto* session = find(report, "$_SESSION");
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->kind, ViolationKind::GlobalStateAccess);
    EXPECT_EQ(session->severity, Severity::Warning);
    EXPECT_EQ(session->message, "Global variable $_SESSION is shared across all requests");
    EXPECT_EQ(session->suggestion, "Use request attributes or dependency injection");
    EXPECT_NE(find(report, "$GLOBALS"), nullptr);
}

TEST_F(BlockingAnalyzerTest, InterpolatedSuperglobalsAreReported) {
    auto report = analyzer.scan(R"PHP(<?php
echo "user {$_SESSION['u']}";
$msg = "id $_SERVER[REMOTE_ADDR]";
$page = <<<HTML
<p>
  {$GLOBALS['x']}
</p>
HTML;
$cmd = `grep ${_GET} log`;
)PHP");

    ASSERT_EQ(count(report, ViolationKind::GlobalStateAccess), 4u);
    EXPECT_EQ(find(report, "$_SESSION")->location.line, 2u);
    EXPECT_EQ(find(report, "$_SERVER")->location.line, 3u);
    EXPECT_EQ(find(report, "$GLOBALS")->location.line, 6u);
    EXPECT_EQ(find(report, "$_GET")->location.line, 9u);
}

TEST_F(BlockingAnalyzerTest, LiteralStringsDoNotInterpolate) {
    auto report = analyzer.scan(R"PHP(<?php
echo '$_SESSION is off limits';
echo "costs \$_GET";
$doc = <<<'TXT'
{$GLOBALS['x']}
TXT;
)PHP");

    EXPECT_EQ(count(report, ViolationKind::GlobalStateAccess), 0u);
}

TEST_F(BlockingAnalyzerTest, GlobalStatementReportsEachVariable) {
    auto report = analyzer.scan("<?php function f() { global $db, $config; }");

    EXPECT_EQ(count(report, ViolationKind::GlobalStateAccess), 2u);
    EXPECT_NE(find(report, "$db"), nullptr);
    EXPECT_NE(find(report, "$config"), nullptr);
}

TEST_F(BlockingAnalyzerTest, StaticVariablesAndPropertiesPersist) {
    auto report = analyzer.scan(R"(<?php
class Counter {
    private static $hits = 0;
    private $local = 0;
    public function bump() {
        static $calls = 0;
        return ++$calls;
    }
}
)");

    ASSERT_EQ(count(report, ViolationKind::StaticMutableAccess), 2u);
    const auto* property = find(report, "$hits");
    ASSERT_NE(property, nullptr);
    EXPECT_EQ(property->message, "Static property $hits persists across requests");
    EXPECT_EQ(property->location.line, 3u);

    const auto* local = find(report, "$calls");
    ASSERT_NE(local, nullptr);
    EXPECT_EQ(local->message, "Static variables persist across requests");
    EXPECT_EQ(find(report, "$local"), nullptr);
}

// ============================================================================
// Unbounded loops
// ============================================================================

TEST_F(BlockingAnalyzerTest, WhileTrueWithoutExitIsReported) {
    auto report = analyzer.scan("<?php\nwhile (true) {\n    poll();\n}\n");

    ASSERT_EQ(report.violations.size(), 1u);
    const auto& v = report.violations.front();
    EXPECT_EQ(v.kind, ViolationKind::UnboundedLoop);
    EXPECT_EQ(v.severity, Severity::Error);
    EXPECT_EQ(v.symbol, "while(true)");
    EXPECT_EQ(v.location.line, 2u);
    EXPECT_EQ(v.message, "Potentially infinite loop will block the server");
    EXPECT_EQ(v.suggestion, "Add timeout or use periodic timers");
}

TEST_F(BlockingAnalyzerTest, LoopShapesAreRecognised) {
    auto report = analyzer.scan(R"(<?php
for (;;) { tick(); }
do { tick(); } while (1);
while (TRUE): tick(); endwhile;
for ($i = 0; true; $i++) { tick(); }
)");

    EXPECT_EQ(count(report, ViolationKind::UnboundedLoop), 4u);
    EXPECT_NE(find(report, "for(;;)"), nullptr);
    EXPECT_NE(find(report, "do-while(true)"), nullptr);
}

TEST_F(BlockingAnalyzerTest, BreakOrReturnEscapesLoop) {
    auto report = analyzer.scan(R"(<?php
while (true) {
    if (done()) { break; }
}
function drain() {
    while (true) {
        if (empty_queue()) return;
    }
}
)");

    EXPECT_EQ(count(report, ViolationKind::UnboundedLoop), 0u);
}

TEST_F(BlockingAnalyzerTest, BreakOfInnerLoopDoesNotEscapeOuter) {
    auto report = analyzer.scan(R"(<?php
while (true) {
    foreach ($jobs as $job) {
        if ($job->done) { break; }
    }
    switch ($state) {
        case 1: break;
    }
}
)");

    EXPECT_EQ(count(report, ViolationKind::UnboundedLoop), 1u);
}

TEST_F(BlockingAnalyzerTest, MultiLevelBreakEscapesOuter) {
    auto report = analyzer.scan(R"(<?php
while (true) {
    foreach ($jobs as $job) {
        if ($job->fatal) { break 2; }
    }
}
)");

    EXPECT_EQ(count(report, ViolationKind::UnboundedLoop), 0u);
}

TEST_F(BlockingAnalyzerTest, ReturnInsideClosureDoesNotEscape) {
    auto report = analyzer.scan(R"(<?php
while (true) {
    $cb = function () { return 1; };
}
)");

    EXPECT_EQ(count(report, ViolationKind::UnboundedLoop), 1u);
}

TEST_F(BlockingAnalyzerTest, RuntimeBoundedLoopsAreNotReported) {
    auto report = analyzer.scan("<?php while ($running) { tick(); } while (0) { tick(); } for ($i = 0; $i < 10; $i++) {}");
    EXPECT_EQ(count(report, ViolationKind::UnboundedLoop), 0u);
}

// ============================================================================
// Reports
// ============================================================================

TEST_F(BlockingAnalyzerTest, SyntaxErrorYieldsFailedReport) {
    auto report = analyzer.scan("<?php\nsleep(1);\nfunction (", "broken.php");

    EXPECT_FALSE(report.ok());
    EXPECT_FALSE(report.safe());
    ASSERT_TRUE(report.error.has_value());
    EXPECT_NE(report.error->find("line 3"), std::string::npos);
    EXPECT_TRUE(report.violations.empty());
    EXPECT_EQ(report.context, "broken.php");
}

TEST_F(BlockingAnalyzerTest, ReportSerializesToJson) {
    auto report = analyzer.scan("<?php sleep(1); header('X: y');", "app.php");
    auto j = report.to_json();

    EXPECT_EQ(j["context"], "app.php");
    ASSERT_EQ(j["violations"].size(), 2u);
    EXPECT_EQ(j["violations"][0]["kind"], "blocking_call");
    EXPECT_EQ(j["violations"][0]["severity"], "error");
    EXPECT_EQ(j["violations"][1]["kind"], "unsafe_call");
    EXPECT_EQ(j["summary"]["blocking"], 1);
    EXPECT_EQ(j["summary"]["warnings"], 1);
    EXPECT_EQ(j["summary"]["safe"], false);
    EXPECT_FALSE(j.contains("error"));
}

TEST_F(BlockingAnalyzerTest, ScanFileReadsFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "loopguard_scan_file_test.php";
    {
        std::ofstream out(path);
        out << "<?php\nexec('ls');\n";
    }

    auto report = analyzer.scan_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(report.ok());
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].symbol, "exec");
    EXPECT_EQ(report.violations[0].location.file, path.string());
}

TEST_F(BlockingAnalyzerTest, MissingFileYieldsFailedReport) {
    auto report = analyzer.scan_file("/nonexistent/dir/handler.php");

    EXPECT_FALSE(report.ok());
    ASSERT_TRUE(report.error.has_value());
    EXPECT_NE(report.error->find("/nonexistent/dir/handler.php"), std::string::npos);
    EXPECT_THROW((void)read_source_file("/nonexistent/dir/handler.php"), SourceReadException);
}

// ============================================================================
// Oversized input
// ============================================================================

TEST(BlockingAnalyzerLoggingTest, ScansAreLoggedThroughTheComponentLogger) {
    auto sink = std::make_shared<MemorySink>();
    BlockingAnalyzer analyzer(fakes::capture_logger("loopguard.analyzer", sink));

    EXPECT_TRUE(analyzer.scan("<?php sleep(1);", "ok.php").ok());
    EXPECT_FALSE(analyzer.scan("<?php if (", "broken.php").ok());

    EXPECT_EQ(sink->count(LogLevel::DEBUG), 1u);
    EXPECT_EQ(sink->count(LogLevel::WARN), 1u);
    EXPECT_TRUE(sink->contains("Scanned ok.php"));
    EXPECT_TRUE(sink->contains("Could not parse broken.php"));
}

TEST_F(BlockingAnalyzerTest, DeepNestingYieldsFailedReport) {
    const size_t n = 100000;
    const std::string source = "<?php $x = " + std::string(n, '(') + "1" + std::string(n, ')') + ";";

    auto report = analyzer.scan(source, "deep.php");

    EXPECT_FALSE(report.ok());
    ASSERT_TRUE(report.error.has_value());
    EXPECT_NE(report.error->find("nesting too deep"), std::string::npos);
    EXPECT_TRUE(report.violations.empty());

    EXPECT_FALSE(analyzer.scan("<?php " + std::string(n, '{')).ok());
}

TEST_F(BlockingAnalyzerTest, ModerateNestingStillScans) {
    const std::string source = "<?php $x = " + std::string(100, '(') + "sleep(1)" + std::string(100, ')') + ";";

    auto report = analyzer.scan(source);

    ASSERT_TRUE(report.ok());
    EXPECT_NE(find(report, "sleep"), nullptr);
}

TEST_F(BlockingAnalyzerTest, LongChainsInsideLoopsAreScanned) {
    std::string source = "<?php\nwhile (true) {\n    $t = 1";
    for (int i = 0; i < 200000; ++i) {
        source += " + 1";
    }
    source += ";\n    usleep(10);\n}\n";

    auto report = analyzer.scan(source);

    ASSERT_TRUE(report.ok());
    EXPECT_EQ(count(report, ViolationKind::UnboundedLoop), 1u);
    EXPECT_NE(find(report, "usleep"), nullptr);
}
