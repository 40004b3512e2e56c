#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <lexer/token.hpp>

struct node
{
    explicit node(token tkn);
    virtual ~node() = default;
    node(const node&) = delete;
    node(node&&) = delete;
    auto operator=(const node&) -> node& = delete;
    auto operator=(node&&) -> node& = delete;

    [[nodiscard]] virtual auto token_literal() const -> std::string_view;
    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;

    token tkn;
};

struct statement : node
{
    using node::node;
};

struct expression : node
{
    using node::node;
};

using statement_ptr = std::unique_ptr<statement>;
using expression_ptr = std::unique_ptr<expression>;
using statements = std::vector<statement_ptr>;
using expressions = std::vector<expression_ptr>;
