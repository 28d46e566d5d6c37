#include "loopguard/analysis/php_lexer.h"
#include "loopguard/analysis/php_parser.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace loopguard::php;

namespace {

std::vector<TokenType> token_types(std::string_view source) {
    std::vector<TokenType> types;
    for (const auto& token : Lexer(source).tokenize()) {
        types.push_back(token.type);
    }
    return types;
}

/**
 * @brief First expression of the first statement
 */
const Node& first_expression(const Node& program) {
    const Node* stmt = program.child(0);
    EXPECT_NE(stmt, nullptr);
    EXPECT_EQ(stmt->kind, NodeKind::ExprStatement);
    return *stmt->child(0);
}

size_t count_kind(const Node& root, NodeKind kind) {
    size_t count = 0;
    for_each_node(root, [&](const Node& node) {
        if (node.kind == kind) ++count;
    });
    return count;
}

} // namespace

// ============================================================================
// Lexer
// ============================================================================

TEST(PhpLexerTest, SplitsInlineHtmlAndCode) {
    auto types = token_types("<h1>Title</h1>\n<?php echo $name; ?>\n<p>done</p>");

    std::vector<TokenType> expected = {
        TokenType::InlineHtml, TokenType::OpenTag, TokenType::Identifier, TokenType::Variable,
        TokenType::Punct, TokenType::CloseTag, TokenType::InlineHtml, TokenType::End
    };
    EXPECT_EQ(types, expected);
}

TEST(PhpLexerTest, ShortEchoTagEmitsEcho) {
    auto tokens = Lexer("<?= $title ?>").tokenize();

    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, TokenType::OpenTag);
    EXPECT_TRUE(tokens[1].is_keyword("echo"));
    EXPECT_EQ(tokens[2].type, TokenType::Variable);
    EXPECT_EQ(tokens[2].text, "title");
}

TEST(PhpLexerTest, CommentsAreDroppedAndLinesCounted) {
    auto tokens = Lexer("<?php\n// sleep(1);\n/* exec('x');\n */\n# die;\nfoo();").tokenize();

    ASSERT_GE(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].type, TokenType::Identifier);
    EXPECT_EQ(tokens[1].text, "foo");
    EXPECT_EQ(tokens[1].line, 6u);
}

TEST(PhpLexerTest, RecognisesCastsAndShellCommands) {
    auto tokens = Lexer("<?php $n = (int) $x; $out = `ls -la`;").tokenize();

    bool saw_cast = false;
    bool saw_shell = false;
    for (const auto& t : tokens) {
        if (t.type == TokenType::Cast) {
            saw_cast = true;
            EXPECT_EQ(t.text, "int");
        }
        if (t.type == TokenType::ShellCommand) {
            saw_shell = true;
            EXPECT_EQ(t.text, "ls -la");
        }
    }
    EXPECT_TRUE(saw_cast);
    EXPECT_TRUE(saw_shell);
}

TEST(PhpLexerTest, InterpolationsCarryTheirLines) {
    auto found = find_interpolations("a $first\n{$second['k']} \\$skipped ${third}\n$4 $", 7);

    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].name, "first");
    EXPECT_EQ(found[0].line, 7u);
    EXPECT_EQ(found[1].name, "second");
    EXPECT_EQ(found[1].line, 8u);
    EXPECT_EQ(found[2].name, "third");
    EXPECT_EQ(found[2].line, 8u);
}

TEST(PhpLexerTest, OnlyInterpolatingStringsCarryVariables) {
    auto tokens = Lexer("<?php '$a'; \"$b\"; `$c`; <<<'N'\n$d\nN;\n<<<E\n$e\nE;\n").tokenize();

    std::vector<std::string> names;
    for (const auto& token : tokens) {
        for (const auto& part : token.interpolations) {
            names.push_back(part.name);
        }
    }
    EXPECT_EQ(names, (std::vector<std::string>{"b", "c", "e"}));
}

TEST(PhpLexerTest, UnterminatedStringReportsLine) {
    try {
        (void)Lexer("<?php\n$a = 1;\n$b = 'never closed;").tokenize();
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 3u);
    }
}

TEST(PhpLexerTest, UnterminatedCommentThrows) {
    EXPECT_THROW((void)Lexer("<?php /* open").tokenize(), ParseError);
}

// ============================================================================
// Parser
// ============================================================================

TEST(PhpParserTest, MultiplicationBindsTighterThanAddition) {
    auto program = Parser::parse("<?php $x = 1 + 2 * 3;");
    const Node& assign = first_expression(*program);

    ASSERT_EQ(assign.kind, NodeKind::Assign);
    EXPECT_EQ(assign.child(0)->kind, NodeKind::Variable);
    EXPECT_EQ(assign.child(0)->name, "x");

    const Node* sum = assign.child(1);
    ASSERT_EQ(sum->kind, NodeKind::Binary);
    EXPECT_EQ(sum->name, "+");
    EXPECT_EQ(sum->child(0)->kind, NodeKind::IntegerLiteral);
    ASSERT_EQ(sum->child(1)->kind, NodeKind::Binary);
    EXPECT_EQ(sum->child(1)->name, "*");
}

TEST(PhpParserTest, AssignmentIsRightAssociative) {
    auto program = Parser::parse("<?php $a = $b = 5;");
    const Node& outer = first_expression(*program);

    ASSERT_EQ(outer.kind, NodeKind::Assign);
    EXPECT_EQ(outer.child(0)->name, "a");
    ASSERT_EQ(outer.child(1)->kind, NodeKind::Assign);
    EXPECT_EQ(outer.child(1)->child(0)->name, "b");
}

TEST(PhpParserTest, KeywordOrBindsLooserThanAssignment) {
    auto program = Parser::parse("<?php $f = fopen('x', 'r') or die('no');");
    const Node& expr = first_expression(*program);

    ASSERT_EQ(expr.kind, NodeKind::Binary);
    EXPECT_EQ(expr.name, "or");
    EXPECT_EQ(expr.child(0)->kind, NodeKind::Assign);
    EXPECT_EQ(expr.child(1)->kind, NodeKind::Exit);
}

TEST(PhpParserTest, CallNamesKeepNamespacePrefix) {
    auto program = Parser::parse("<?php \\sleep(1);");
    const Node& call = first_expression(*program);

    ASSERT_EQ(call.kind, NodeKind::Call);
    EXPECT_EQ(call.name, "\\sleep");
}

TEST(PhpParserTest, MemberChainsNestLeftToRight) {
    auto program = Parser::parse("<?php $db->query($sql)->rows;");
    const Node& fetch = first_expression(*program);

    ASSERT_EQ(fetch.kind, NodeKind::PropertyFetch);
    EXPECT_EQ(fetch.name, "rows");
    const Node* call = fetch.child(0);
    ASSERT_EQ(call->kind, NodeKind::MethodCall);
    EXPECT_EQ(call->name, "query");
    EXPECT_EQ(call->child(0)->name, "db");
}

TEST(PhpParserTest, StaticAccessForms) {
    auto program = Parser::parse("<?php Cache::$items; Cache::flush(); Cache::TTL;");

    EXPECT_EQ(count_kind(*program, NodeKind::StaticPropertyFetch), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::StaticCall), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::ClassConstFetch), 1u);
}

TEST(PhpParserTest, FunctionDeclarationWithTypes) {
    auto program = Parser::parse(R"(<?php
function load(?string $path, int ...$flags): array|false {
    return file($path);
}
)");

    const Node* fn = program->child(0);
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->kind, NodeKind::FunctionDecl);
    EXPECT_EQ(fn->name, "load");
    EXPECT_EQ(fn->line, 2u);
    EXPECT_EQ(count_kind(*fn, NodeKind::Parameter), 2u);
    EXPECT_EQ(count_kind(*fn, NodeKind::Return), 1u);
}

TEST(PhpParserTest, ClassMembersAreStructural) {
    auto program = Parser::parse(R"(<?php
final class Registry extends Base implements Countable {
    use Helpers;
    public const VERSION = '1';
    private static array $items = [];
    protected ?Logger $logger = null;

    public static function instance(): static { return new static(); }
    abstract protected function build(): void;
}
)");

    const Node* cls = program->child(0);
    ASSERT_NE(cls, nullptr);
    ASSERT_EQ(cls->kind, NodeKind::ClassDecl);
    EXPECT_EQ(cls->name, "Registry");
    EXPECT_EQ(cls->value, "class");

    std::vector<const Node*> properties;
    for (const auto& member : cls->children) {
        if (member->kind == NodeKind::PropertyDecl) {
            properties.push_back(member.get());
        }
    }
    ASSERT_EQ(properties.size(), 2u);
    EXPECT_EQ(properties[0]->name, "items");
    EXPECT_EQ(properties[0]->value, "static");
    EXPECT_EQ(properties[1]->name, "logger");
    EXPECT_EQ(properties[1]->value, "");

    EXPECT_EQ(count_kind(*cls, NodeKind::ClassConst), 1u);
    EXPECT_EQ(count_kind(*cls, NodeKind::FunctionDecl), 2u);
}

TEST(PhpParserTest, AlternativeSyntaxLoops) {
    auto program = Parser::parse(R"(<?php
while ($running):
    tick();
endwhile;
foreach ($rows as $key => $row):
    echo $row;
endforeach;
if ($a): ?>
<p>yes</p>
<?php else: ?>
<p>no</p>
<?php endif; ?>
)");

    EXPECT_EQ(count_kind(*program, NodeKind::While), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::Foreach), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::If), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::InlineHtml), 2u);
}

TEST(PhpParserTest, BreakCarriesLevel) {
    auto program = Parser::parse("<?php while (true) { foreach ($a as $b) { break 2; } }");

    const Node* brk = nullptr;
    for_each_node(*program, [&](const Node& node) {
        if (node.kind == NodeKind::Break) brk = &node;
    });
    ASSERT_NE(brk, nullptr);
    EXPECT_EQ(brk->value, "2");
}

TEST(PhpParserTest, ClosuresArrowFunctionsAndMatch) {
    auto program = Parser::parse(R"(<?php
$double = fn($x) => $x * 2;
$handler = static function ($req) use (&$count) { $count++; return $req; };
$label = match ($code) { 200, 201 => 'ok', default => 'error' };
)");

    EXPECT_EQ(count_kind(*program, NodeKind::ArrowFunction), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::Closure), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::Match), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::MatchArm), 2u);
}

TEST(PhpParserTest, GlobalAndStaticDeclarations) {
    auto program = Parser::parse("<?php function f() { global $db, $config; static $calls = 0; }");

    const Node* global = nullptr;
    const Node* statics = nullptr;
    for_each_node(*program, [&](const Node& node) {
        if (node.kind == NodeKind::GlobalDecl) global = &node;
        if (node.kind == NodeKind::StaticVarDecl) statics = &node;
    });

    ASSERT_NE(global, nullptr);
    ASSERT_EQ(global->children.size(), 2u);
    EXPECT_EQ(global->child(1)->name, "config");
    ASSERT_NE(statics, nullptr);
    EXPECT_EQ(statics->child(0)->name, "calls");
}

TEST(PhpParserTest, NamespacesAndImportsAreAccepted) {
    auto program = Parser::parse(R"(<?php
declare(strict_types=1);
namespace App\Http;

use Psr\Http\Message\ResponseInterface as Response;
use function App\helpers\{render, redirect};

#[Route('/health')]
function health(): Response { return render('ok'); }
)");

    EXPECT_EQ(count_kind(*program, NodeKind::Namespace), 1u);
    EXPECT_EQ(count_kind(*program, NodeKind::FunctionDecl), 1u);
}

TEST(PhpParserTest, SyntaxErrorReportsLine) {
    try {
        (void)Parser::parse("<?php\n$a = 1;\nif ($a {\n}\n");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 3u);
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
}

TEST(PhpParserTest, PlainHtmlIsOneNode) {
    auto program = Parser::parse("<html><body>static page</body></html>");
    ASSERT_EQ(program->children.size(), 1u);
    EXPECT_EQ(program->child(0)->kind, NodeKind::InlineHtml);
}

// ============================================================================
// Depth
// ============================================================================

TEST(PhpParserTest, NestingBelowTheLimitParses) {
    const std::string source = "<?php $x = " + std::string(100, '(') + "1" + std::string(100, ')') + ";";
    auto program = Parser::parse(source);
    EXPECT_EQ(count_kind(*program, NodeKind::IntegerLiteral), 1u);
}

TEST(PhpParserTest, NestingPastTheLimitIsASyntaxError) {
    const size_t n = 100000;
    const std::string parens = "<?php\n$x = " + std::string(n, '(') + "1" + std::string(n, ')') + ";";
    try {
        (void)Parser::parse(parens);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.line(), 2u);
        EXPECT_NE(std::string(e.what()).find("nesting too deep"), std::string::npos);
    }

    EXPECT_THROW((void)Parser::parse("<?php " + std::string(n, '{')), ParseError);
    EXPECT_THROW((void)Parser::parse("<?php $x = " + std::string(n, '$') + "y;"), ParseError);

    std::string ifs = "<?php ";
    for (size_t i = 0; i < 1000; ++i) {
        ifs += "if ($a) ";
    }
    EXPECT_THROW((void)Parser::parse(ifs + "tick();"), ParseError);
}

TEST(PhpParserTest, LongLeftDeepChainsAreBuiltAndReleased) {
    const size_t n = 100000;
    std::string index_chain = "<?php $a";
    std::string sum = "<?php $t = 1";
    for (size_t i = 0; i < n; ++i) {
        index_chain += "[0]";
        sum += " + 1";
    }

    {
        auto program = Parser::parse(index_chain + ";");
        EXPECT_EQ(count_kind(*program, NodeKind::Index), n);
    }
    {
        auto program = Parser::parse(sum + ";");
        EXPECT_EQ(count_kind(*program, NodeKind::Binary), n);
    }
}

TEST(PhpParserTest, WalkIsPreOrderWithMatchingLeave) {
    class Recorder : public NodeVisitor {
    public:
        std::vector<std::string> events;

        bool enter(const Node& node) override {
            events.push_back(std::string("+") + to_string(node.kind));
            return node.kind != NodeKind::Closure;
        }
        void leave(const Node& node) override {
            events.push_back(std::string("-") + to_string(node.kind));
        }
    };

    auto program = Parser::parse("<?php f($a); $cb = function () { g(); };");
    Recorder recorder;
    walk(*program, recorder);

    const std::vector<std::string> expected = {
        "+Program",
        "+ExprStatement", "+Call", "+Variable", "-Variable", "-Call", "-ExprStatement",
        "+ExprStatement", "+Assign", "+Variable", "-Variable", "+Closure", "-Closure", "-Assign",
        "-ExprStatement",
        "-Program"
    };
    EXPECT_EQ(recorder.events, expected);
}
