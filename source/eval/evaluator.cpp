#include "evaluator.hpp"

#include <ast/boolean.hpp>
#include <ast/call_expression.hpp>
#include <ast/identifier.hpp>
#include <ast/infix_expression.hpp>
#include <ast/integer_literal.hpp>
#include <ast/prefix_expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <object/object.hpp>

auto evaluator::evaluate(const node& root) -> object_ptr
{
    m_result.reset();
    root.accept(*this);
    return m_result;
}

void evaluator::visit(const program& stmt)
{
    object_ptr result;
    for (const auto& statement : stmt.stmts) {
        result = evaluate(*statement);
    }
    m_result = result;
}

void evaluator::visit(const expression_statement& stmt)
{
    if (!stmt.expr) {
        m_result.reset();
        return;
    }
    m_result = evaluate(*stmt.expr);
}

void evaluator::visit(const integer_literal& expr)
{
    m_result = make_integer(expr.value);
}

void evaluator::visit(const boolean& expr)
{
    m_result = native_bool_to_object(expr.value);
}

// Bindings, returns, identifier lookup, operators and calls have no
// evaluation rules yet.

void evaluator::visit(const let_statement& /*stmt*/)
{
    m_result.reset();
}

void evaluator::visit(const return_statement& /*stmt*/)
{
    m_result.reset();
}

void evaluator::visit(const identifier& /*expr*/)
{
    m_result.reset();
}

void evaluator::visit(const prefix_expression& /*expr*/)
{
    m_result.reset();
}

void evaluator::visit(const infix_expression& /*expr*/)
{
    m_result.reset();
}

void evaluator::visit(const call_expression& /*expr*/)
{
    m_result.reset();
}

auto eval(const node& root) -> object_ptr
{
    auto evltr = evaluator {};
    return evltr.evaluate(root);
}
