#pragma once

#include <ast/boolean.hpp>
#include <ast/call_expression.hpp>
#include <ast/identifier.hpp>
#include <ast/infix_expression.hpp>
#include <ast/integer_literal.hpp>
#include <ast/prefix_expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>

/// One overload per concrete node type. A new node type does not compile
/// until every visitor handles it.
struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const program& stmt) = 0;
    virtual void visit(const let_statement& stmt) = 0;
    virtual void visit(const return_statement& stmt) = 0;
    virtual void visit(const expression_statement& stmt) = 0;

    virtual void visit(const identifier& expr) = 0;
    virtual void visit(const integer_literal& expr) = 0;
    virtual void visit(const boolean& expr) = 0;
    virtual void visit(const prefix_expression& expr) = 0;
    virtual void visit(const infix_expression& expr) = 0;
    virtual void visit(const call_expression& expr) = 0;
};
