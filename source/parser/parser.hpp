#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ast/node.hpp>
#include <ast/program.hpp>
#include <fmt/format.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

class parser final
{
  public:
    explicit parser(std::unique_ptr<token_source> source);
    explicit parser(std::string_view input);
    [[nodiscard]] auto parse_program() -> program_ptr;
    [[nodiscard]] auto errors() const -> const std::vector<std::string>&;

  private:
    using prefix_parser = auto (parser::*)() -> expression_ptr;
    using infix_parser = auto (parser::*)(expression_ptr) -> expression_ptr;

    auto next_token() -> void;
    auto parse_statement() -> statement_ptr;
    auto parse_let_statement() -> statement_ptr;
    auto parse_return_statement() -> statement_ptr;
    auto parse_expression_statement() -> statement_ptr;
    auto skip_to_semicolon() -> void;

    auto parse_expression(int precedence) -> expression_ptr;
    auto parse_identifier() -> expression_ptr;
    auto parse_integer_literal() -> expression_ptr;
    auto parse_prefix_expression() -> expression_ptr;
    auto parse_infix_expression(expression_ptr left) -> expression_ptr;
    auto parse_boolean() -> expression_ptr;
    auto parse_grouped_expression() -> expression_ptr;
    auto parse_call_expression(expression_ptr function) -> expression_ptr;
    auto parse_call_arguments() -> expressions;

    auto expect_peek(token_type type) -> bool;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    [[nodiscard]] auto peek_token_is(token_type type) const -> bool;
    auto peek_error(token_type type) -> void;
    auto register_prefix(token_type type, prefix_parser prefix) -> void;
    auto register_infix(token_type type, infix_parser infix) -> void;
    auto no_prefix_parse_function_error(token_type type) -> void;
    [[nodiscard]] auto peek_precedence() const -> int;
    [[nodiscard]] auto current_precedence() const -> int;

    template<typename... T>
    auto new_error(fmt::format_string<T...> fmt, T&&... args)
    {
        m_errors.push_back(fmt::format(fmt, std::forward<T>(args)...));
    }

    std::unique_ptr<token_source> m_source;
    token m_current_token {};
    token m_peek_token {};
    std::vector<std::string> m_errors {};

    std::unordered_map<token_type, prefix_parser> m_prefix_parsers;
    std::unordered_map<token_type, infix_parser> m_infix_parsers;
};
