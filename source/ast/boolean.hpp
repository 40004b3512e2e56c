#pragma once

#include "node.hpp"

struct boolean final : expression
{
    boolean(token tkn, bool val);
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    bool value {};
};
