#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace loopguard::php {

enum class NodeKind : int {
    // Structure
    Program,
    Block,
    InlineHtml,
    ExprList,

    // Declarations
    Namespace,
    FunctionDecl,
    ClassDecl,            ///< class, interface, trait, enum
    PropertyDecl,         ///< name = property, value = "static" for static properties
    ClassConst,
    Parameter,
    StaticVarDecl,        ///< function-local `static $x`
    GlobalDecl,           ///< `global $x`

    // Statements
    ExprStatement,
    Echo,
    If,
    While,                ///< [cond, body]
    DoWhile,              ///< [body, cond]
    For,                  ///< [init, cond, step, body], each list an ExprList
    Foreach,
    Switch,
    Case,
    Break,                ///< value = level
    Continue,
    Return,
    Try,
    Catch,
    Goto,
    Label,
    Unset,
    Declare,

    // Expressions
    Variable,             ///< name without '$'; empty for variable-variables
    Name,                 ///< Constant or class name
    IntegerLiteral,
    FloatLiteral,
    StringLiteral,        ///< children are the interpolated Variables
    ShellCommand,         ///< Backtick operator; children as StringLiteral
    ArrayLiteral,
    ArrayItem,
    Call,                 ///< name set when the callee is a plain name
    MethodCall,
    StaticCall,
    New,
    Closure,
    ArrowFunction,
    PropertyFetch,
    StaticPropertyFetch,
    ClassConstFetch,
    Index,
    Assign,
    Binary,
    Unary,
    Cast,
    Ternary,
    Match,
    MatchArm,
    Isset,
    Empty,
    Include,
    Exit,                 ///< name = "exit" or "die"
    Throw,
    Yield,
    Print,
    Clone,
    Spread
};

[[nodiscard]] const char* to_string(NodeKind kind) noexcept;

/**
 * @brief Syntax tree node
 *
 * One node type serves every construct. `name` holds the identifier a
 * construct is about (function, variable, operator), `value` holds literal
 * text, and `children` are ordered as documented on NodeKind.
 */
struct Node {
    NodeKind kind;
    size_t line = 0;
    std::string name;
    std::string value;
    std::vector<std::unique_ptr<Node>> children;

    Node(NodeKind k, size_t l) : kind(k), line(l) {}

    /// Releases the subtree without recursing, so left-deep chains of any length are safe
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    Node* add(std::unique_ptr<Node> child) {
        if (!child) return nullptr;
        children.push_back(std::move(child));
        return children.back().get();
    }

    [[nodiscard]] Node* child(size_t index) const noexcept {
        return index < children.size() ? children[index].get() : nullptr;
    }
};

using NodePtr = std::unique_ptr<Node>;

/**
 * @brief Depth-first traversal with enter/leave hooks
 *
 * Returning false from enter() skips the node's children. The walk keeps its
 * own stack, so tree depth is not bounded by the call stack.
 */
class NodeVisitor {
public:
    virtual ~NodeVisitor() = default;
    virtual bool enter(const Node& node) = 0;
    virtual void leave(const Node& /*node*/) {}
};

void walk(const Node& root, NodeVisitor& visitor);

/**
 * @brief Pre-order walk that calls `fn` on every node
 */
void for_each_node(const Node& root, const std::function<void(const Node&)>& fn);

} // namespace loopguard::php
