#pragma once

#include <ostream>
#include <string>

#include "token_type.hpp"

struct token final
{
    token_type type {token_type::illegal};
    std::string literal;
    auto operator==(const token& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&;

/// Anything the parser can pull tokens from. Once the input is exhausted an
/// implementation keeps handing out eof tokens.
struct token_source
{
    token_source() = default;
    virtual ~token_source() = default;
    token_source(const token_source&) = delete;
    token_source(token_source&&) = delete;
    auto operator=(const token_source&) -> token_source& = delete;
    auto operator=(token_source&&) -> token_source& = delete;

    virtual auto next_token() -> token = 0;
};
