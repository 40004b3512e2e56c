#pragma once

#include <ast/node.hpp>
#include <ast/visitor.hpp>
#include <object/object.hpp>

/// Tree-walking evaluator. Only program sequencing and the integer and
/// boolean literals have semantics so far, everything else evaluates to an
/// absent result.
struct evaluator final : visitor
{
    evaluator() = default;
    [[nodiscard]] auto evaluate(const node& root) -> object_ptr;

  protected:
    void visit(const program& stmt) final;
    void visit(const let_statement& stmt) final;
    void visit(const return_statement& stmt) final;
    void visit(const expression_statement& stmt) final;

    void visit(const identifier& expr) final;
    void visit(const integer_literal& expr) final;
    void visit(const boolean& expr) final;
    void visit(const prefix_expression& expr) final;
    void visit(const infix_expression& expr) final;
    void visit(const call_expression& expr) final;

  private:
    object_ptr m_result;
};

/// Evaluates a tree with a fresh evaluator.
[[nodiscard]] auto eval(const node& root) -> object_ptr;
