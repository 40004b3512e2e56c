#include "prefix_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto prefix_expression::string() const -> std::string
{
    return fmt::format("({}{})", op, to_string(right));
}

void prefix_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
