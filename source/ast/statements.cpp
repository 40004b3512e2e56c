#include <string>

#include "statements.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto let_statement::string() const -> std::string
{
    return fmt::format("{} {} = {};", tkn.literal, to_string(name), to_string(value));
}

void let_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto return_statement::string() const -> std::string
{
    return fmt::format("{} {};", tkn.literal, to_string(value));
}

void return_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto expression_statement::string() const -> std::string
{
    return to_string(expr);
}

void expression_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
