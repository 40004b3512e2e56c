#pragma once

#include <memory>
#include <string>

#include "node.hpp"

struct identifier final : expression
{
    identifier(token tkn, std::string val);
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string value;
};

using identifier_ptr = std::unique_ptr<identifier>;
