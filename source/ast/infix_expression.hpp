#pragma once

#include <lexer/token_type.hpp>

#include "node.hpp"

struct infix_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left;
    token_type op {};
    expression_ptr right;
};
