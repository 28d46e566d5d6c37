#include "loopguard/analysis/php_ast.h"

namespace loopguard::php {

const char* to_string(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Program:             return "Program";
        case NodeKind::Block:               return "Block";
        case NodeKind::InlineHtml:          return "InlineHtml";
        case NodeKind::ExprList:            return "ExprList";
        case NodeKind::Namespace:           return "Namespace";
        case NodeKind::FunctionDecl:        return "FunctionDecl";
        case NodeKind::ClassDecl:           return "ClassDecl";
        case NodeKind::PropertyDecl:        return "PropertyDecl";
        case NodeKind::ClassConst:          return "ClassConst";
        case NodeKind::Parameter:           return "Parameter";
        case NodeKind::StaticVarDecl:       return "StaticVarDecl";
        case NodeKind::GlobalDecl:          return "GlobalDecl";
        case NodeKind::ExprStatement:       return "ExprStatement";
        case NodeKind::Echo:                return "Echo";
        case NodeKind::If:                  return "If";
        case NodeKind::While:               return "While";
        case NodeKind::DoWhile:             return "DoWhile";
        case NodeKind::For:                 return "For";
        case NodeKind::Foreach:             return "Foreach";
        case NodeKind::Switch:              return "Switch";
        case NodeKind::Case:                return "Case";
        case NodeKind::Break:               return "Break";
        case NodeKind::Continue:            return "Continue";
        case NodeKind::Return:              return "Return";
        case NodeKind::Try:                 return "Try";
        case NodeKind::Catch:               return "Catch";
        case NodeKind::Goto:                return "Goto";
        case NodeKind::Label:               return "Label";
        case NodeKind::Unset:               return "Unset";
        case NodeKind::Declare:             return "Declare";
        case NodeKind::Variable:            return "Variable";
        case NodeKind::Name:                return "Name";
        case NodeKind::IntegerLiteral:      return "IntegerLiteral";
        case NodeKind::FloatLiteral:        return "FloatLiteral";
        case NodeKind::StringLiteral:       return "StringLiteral";
        case NodeKind::ShellCommand:        return "ShellCommand";
        case NodeKind::ArrayLiteral:        return "ArrayLiteral";
        case NodeKind::ArrayItem:           return "ArrayItem";
        case NodeKind::Call:                return "Call";
        case NodeKind::MethodCall:          return "MethodCall";
        case NodeKind::StaticCall:          return "StaticCall";
        case NodeKind::New:                 return "New";
        case NodeKind::Closure:             return "Closure";
        case NodeKind::ArrowFunction:       return "ArrowFunction";
        case NodeKind::PropertyFetch:       return "PropertyFetch";
        case NodeKind::StaticPropertyFetch: return "StaticPropertyFetch";
        case NodeKind::ClassConstFetch:     return "ClassConstFetch";
        case NodeKind::Index:               return "Index";
        case NodeKind::Assign:              return "Assign";
        case NodeKind::Binary:              return "Binary";
        case NodeKind::Unary:               return "Unary";
        case NodeKind::Cast:                return "Cast";
        case NodeKind::Ternary:             return "Ternary";
        case NodeKind::Match:               return "Match";
        case NodeKind::MatchArm:            return "MatchArm";
        case NodeKind::Isset:               return "Isset";
        case NodeKind::Empty:               return "Empty";
        case NodeKind::Include:             return "Include";
        case NodeKind::Exit:                return "Exit";
        case NodeKind::Throw:               return "Throw";
        case NodeKind::Yield:               return "Yield";
        case NodeKind::Print:               return "Print";
        case NodeKind::Clone:               return "Clone";
        case NodeKind::Spread:              return "Spread";
    }
    return "Unknown";
}

Node::~Node() {
    std::vector<NodePtr> pending = std::move(children);
    while (!pending.empty()) {
        NodePtr node = std::move(pending.back());
        pending.pop_back();
        if (node) {
            for (auto& child : node->children) {
                pending.push_back(std::move(child));
            }
            node->children.clear();
        }
    }
}

void walk(const Node& root, NodeVisitor& visitor) {
    struct Frame {
        const Node* node;
        size_t next_child;
    };

    if (!visitor.enter(root)) {
        visitor.leave(root);
        return;
    }

    std::vector<Frame> stack;
    stack.push_back({&root, 0});
    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next_child < top.node->children.size()) {
            const Node* child = top.node->children[top.next_child++].get();
            if (child == nullptr) {
                continue;
            }
            if (visitor.enter(*child)) {
                stack.push_back({child, 0});
            } else {
                visitor.leave(*child);
            }
            continue;
        }

        const Node* finished = top.node;
        stack.pop_back();
        visitor.leave(*finished);
    }
}

void for_each_node(const Node& root, const std::function<void(const Node&)>& fn) {
    std::vector<const Node*> stack{&root};
    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();
        fn(*node);
        // Reverse push keeps pre-order
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            if (*it) {
                stack.push_back(it->get());
            }
        }
    }
}

} // namespace loopguard::php
