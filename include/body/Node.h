/**
 * @file
 * @brief Method body base node declarations.
 */
#pragma once

#include "body/NodeKind.h"

namespace pullup::body {

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;

        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;
    };

    struct Expr : Node {
        using Node::Node;
    };

    struct Stmt : Node {
        using Node::Node;
    };

} // namespace pullup::body
