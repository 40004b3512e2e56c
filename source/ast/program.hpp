#pragma once

#include <memory>

#include "node.hpp"

struct program final : statement
{
    program();
    [[nodiscard]] auto token_literal() const -> std::string_view final;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    statements stmts;
};

using program_ptr = std::unique_ptr<program>;
