#include <utility>

#include "boolean.hpp"

#include "visitor.hpp"

boolean::boolean(token tkn, bool val)
    : expression {std::move(tkn)}
    , value {val}
{
}

auto boolean::string() const -> std::string
{
    return tkn.literal;
}

void boolean::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
