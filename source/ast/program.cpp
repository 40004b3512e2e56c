#include "program.hpp"

#include "util.hpp"
#include "visitor.hpp"

program::program()
    : statement {token {}}
{
}

auto program::token_literal() const -> std::string_view
{
    if (stmts.empty()) {
        return {};
    }
    return stmts.front()->token_literal();
}

auto program::string() const -> std::string
{
    return join(stmts);
}

void program::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
