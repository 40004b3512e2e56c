#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "lexer.hpp"

#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table = std::array<token_type, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(illegal);
    arr['*'] = asterisk;
    arr['}'] = rsquirly;
    arr[')'] = rparen;
    arr[','] = comma;
    arr['='] = assign;
    arr['>'] = greater_than;
    arr['<'] = less_than;
    arr['{'] = lsquirly;
    arr['('] = lparen;
    arr[';'] = semicolon;
    arr['/'] = slash;
    arr['+'] = plus;
    arr['-'] = minus;
    arr['!'] = exclamation;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();
constexpr auto keyword_count = 7;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"fn", token_type::function},
        std::pair {"let", token_type::let},
        std::pair {"true", token_type::tru},
        std::pair {"false", token_type::fals},
        std::pair {"if", token_type::eef},
        std::pair {"else", token_type::elze},
        std::pair {"return", token_type::ret},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

}  // namespace

lexer::lexer(std::string_view input)
    : m_input {input}
{
    read_char();
}

auto lexer::next_token() -> token
{
    using enum token_type;
    skip_whitespace();
    if (m_byte == '\0') {
        return token {.type = eof, .literal = ""};
    }
    const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(m_byte)];
    if (char_token_type != illegal) {
        if (peek_char() == '=' && (char_token_type == assign || char_token_type == exclamation)) {
            const auto literal = std::string {m_input.substr(m_position, 2)};
            const auto type = char_token_type == assign ? equals : not_equals;
            return read_char(), read_char(), token {.type = type, .literal = literal};
        }
        const auto literal = std::string {m_input.substr(m_position, 1)};
        return read_char(), token {.type = char_token_type, .literal = literal};
    }
    if (is_letter(m_byte)) {
        return read_identifier_or_keyword();
    }
    if (is_digit(m_byte)) {
        return read_number();
    }
    const auto literal = std::string {m_input.substr(m_position, 1)};
    return read_char(), token {.type = illegal, .literal = literal};
}

auto lexer::read_char() -> void
{
    if (m_read_position >= m_input.size()) {
        m_byte = '\0';
    } else {
        m_byte = m_input[m_read_position];
    }
    m_position = m_read_position;
    m_read_position++;
}

auto lexer::skip_whitespace() -> void
{
    while (m_byte == ' ' || m_byte == '\t' || m_byte == '\n' || m_byte == '\r') {
        read_char();
    }
}

auto lexer::peek_char() const -> std::string_view::value_type
{
    if (m_read_position >= m_input.size()) {
        return '\0';
    }
    return m_input[m_read_position];
}

auto lexer::read_identifier_or_keyword() -> token
{
    const auto position = m_position;
    while (is_letter(m_byte)) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(position, m_position - position);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    if (itr != keyword_tokens.end()) {
        return token {.type = itr->second, .literal = std::string {itr->first}};
    }
    // NOLINTEND(*-qualified-auto)
    return token {.type = token_type::ident, .literal = std::string {identifier_or_keyword}};
}

auto lexer::read_number() -> token
{
    const auto position = m_position;
    while (is_digit(m_byte)) {
        read_char();
    }
    return token {.type = token_type::integer, .literal = std::string {m_input.substr(position, m_position - position)}};
}
