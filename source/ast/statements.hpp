#pragma once

#include "identifier.hpp"
#include "node.hpp"

/// Binds a name; the value is not parsed yet, so it stays empty.
struct let_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    identifier_ptr name;
    expression_ptr value;
};

/// The returned expression is skipped by the parser, so value stays empty.
struct return_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr value;
};

struct expression_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};
