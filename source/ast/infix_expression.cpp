#include "infix_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto infix_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", to_string(left), op, to_string(right));
}

void infix_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
