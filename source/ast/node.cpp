#include <string_view>
#include <utility>

#include "node.hpp"

node::node(token tkn)
    : tkn {std::move(tkn)}
{
}

auto node::token_literal() const -> std::string_view
{
    return tkn.literal;
}
