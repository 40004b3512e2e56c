#include "call_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto call_expression::string() const -> std::string
{
    return fmt::format("{}({})", to_string(function), join(arguments, ", "));
}

void call_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
