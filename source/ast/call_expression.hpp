#pragma once

#include "node.hpp"

struct call_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr function;
    expressions arguments;
};
