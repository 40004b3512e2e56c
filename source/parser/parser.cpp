#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "parser.hpp"

#include <ast/boolean.hpp>
#include <ast/call_expression.hpp>
#include <ast/identifier.hpp>
#include <ast/infix_expression.hpp>
#include <ast/integer_literal.hpp>
#include <ast/prefix_expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
enum precedence : std::uint8_t
{
    lowest,
    equals,
    lessgreater,
    sum,
    product,
    prefix,
    call,
};

auto precedence_of_token(token_type type) -> std::uint8_t
{
    switch (type) {
        case token_type::equals:
        case token_type::not_equals:
            return equals;
        case token_type::less_than:
        case token_type::greater_than:
            return lessgreater;
        case token_type::plus:
        case token_type::minus:
            return sum;
        case token_type::slash:
        case token_type::asterisk:
            return product;
        case token_type::lparen:
            return call;
        default:
            return lowest;
    }
}
}  // namespace

parser::parser(std::unique_ptr<token_source> source)
    : m_source {std::move(source)}
{
    next_token();
    next_token();
    using enum token_type;
    register_prefix(ident, &parser::parse_identifier);
    register_prefix(integer, &parser::parse_integer_literal);
    register_prefix(exclamation, &parser::parse_prefix_expression);
    register_prefix(minus, &parser::parse_prefix_expression);
    register_prefix(tru, &parser::parse_boolean);
    register_prefix(fals, &parser::parse_boolean);
    register_prefix(lparen, &parser::parse_grouped_expression);
    register_infix(plus, &parser::parse_infix_expression);
    register_infix(minus, &parser::parse_infix_expression);
    register_infix(slash, &parser::parse_infix_expression);
    register_infix(asterisk, &parser::parse_infix_expression);
    register_infix(equals, &parser::parse_infix_expression);
    register_infix(not_equals, &parser::parse_infix_expression);
    register_infix(less_than, &parser::parse_infix_expression);
    register_infix(greater_than, &parser::parse_infix_expression);
    register_infix(lparen, &parser::parse_call_expression);
}

parser::parser(std::string_view input)
    : parser {std::make_unique<lexer>(input)}
{
}

auto parser::parse_program() -> program_ptr
{
    auto prog = std::make_unique<program>();
    while (!current_token_is(token_type::eof)) {
        auto stmt = parse_statement();
        if (stmt) {
            prog->stmts.push_back(std::move(stmt));
        }
        next_token();
    }
    return prog;
}

auto parser::errors() const -> const std::vector<std::string>&
{
    return m_errors;
}

auto parser::next_token() -> void
{
    m_current_token = std::move(m_peek_token);
    m_peek_token = m_source->next_token();
}

auto parser::parse_statement() -> statement_ptr
{
    using enum token_type;
    switch (m_current_token.type) {
        case let:
            return parse_let_statement();
        case ret:
            return parse_return_statement();
        default:
            return parse_expression_statement();
    }
}

auto parser::parse_let_statement() -> statement_ptr
{
    using enum token_type;
    auto stmt = std::make_unique<let_statement>(m_current_token);
    if (!expect_peek(ident)) {
        return {};
    }
    stmt->name = std::make_unique<identifier>(m_current_token, m_current_token.literal);

    if (!expect_peek(assign)) {
        return {};
    }

    // TODO: parse the bound expression once bindings get evaluation rules
    skip_to_semicolon();
    return stmt;
}

auto parser::parse_return_statement() -> statement_ptr
{
    auto stmt = std::make_unique<return_statement>(m_current_token);

    next_token();
    skip_to_semicolon();
    return stmt;
}

auto parser::parse_expression_statement() -> statement_ptr
{
    auto expr_stmt = std::make_unique<expression_statement>(m_current_token);
    expr_stmt->expr = parse_expression(lowest);
    if (peek_token_is(token_type::semicolon)) {
        next_token();
    }
    return expr_stmt;
}

auto parser::skip_to_semicolon() -> void
{
    while (!current_token_is(token_type::semicolon) && !current_token_is(token_type::eof)) {
        next_token();
    }
}

auto parser::parse_expression(int precedence) -> expression_ptr
{
    const auto prefix = m_prefix_parsers.find(m_current_token.type);
    if (prefix == m_prefix_parsers.end()) {
        no_prefix_parse_function_error(m_current_token.type);
        return {};
    }
    auto left_expr = (this->*prefix->second)();
    while (!peek_token_is(token_type::semicolon) && precedence < peek_precedence()) {
        const auto infix = m_infix_parsers.find(m_peek_token.type);
        if (infix == m_infix_parsers.end()) {
            return left_expr;
        }
        next_token();

        left_expr = (this->*infix->second)(std::move(left_expr));
    }
    return left_expr;
}

auto parser::parse_identifier() -> expression_ptr
{
    return std::make_unique<identifier>(m_current_token, m_current_token.literal);
}

auto parser::parse_integer_literal() -> expression_ptr
{
    auto lit = std::make_unique<integer_literal>(m_current_token);
    const auto& literal = m_current_token.literal;
    auto parsed = std::size_t {};
    if (literal.empty() || std::isspace(static_cast<unsigned char>(literal.front())) != 0) {
        new_error("could not parse \"{}\" as integer", literal);
        return {};
    }
    try {
        lit->value = std::stoll(literal, &parsed, 0);
    } catch (const std::invalid_argument&) {
        parsed = 0;
    } catch (const std::out_of_range&) {
        parsed = 0;
    }
    if (parsed == 0 || parsed != literal.size()) {
        new_error("could not parse \"{}\" as integer", literal);
        return {};
    }
    return lit;
}

auto parser::parse_prefix_expression() -> expression_ptr
{
    auto expr = std::make_unique<prefix_expression>(m_current_token);
    expr->op = m_current_token.type;

    next_token();
    expr->right = parse_expression(prefix);
    return expr;
}

auto parser::parse_infix_expression(expression_ptr left) -> expression_ptr
{
    auto expr = std::make_unique<infix_expression>(m_current_token);
    expr->op = m_current_token.type;
    expr->left = std::move(left);

    auto precedence = current_precedence();
    next_token();
    expr->right = parse_expression(precedence);

    return expr;
}

auto parser::parse_boolean() -> expression_ptr
{
    return std::make_unique<boolean>(m_current_token, current_token_is(token_type::tru));
}

auto parser::parse_grouped_expression() -> expression_ptr
{
    next_token();
    auto expr = parse_expression(lowest);
    if (!expect_peek(token_type::rparen)) {
        return {};
    }
    return expr;
}

auto parser::parse_call_expression(expression_ptr function) -> expression_ptr
{
    auto call = std::make_unique<call_expression>(m_current_token);
    call->function = std::move(function);
    call->arguments = parse_call_arguments();
    return call;
}

auto parser::parse_call_arguments() -> expressions
{
    using enum token_type;
    auto args = expressions {};
    if (peek_token_is(rparen)) {
        next_token();
        return args;
    }
    next_token();
    args.push_back(parse_expression(lowest));

    while (peek_token_is(comma)) {
        next_token();
        next_token();
        args.push_back(parse_expression(lowest));
    }

    if (!expect_peek(rparen)) {
        return {};
    }
    return args;
}

auto parser::expect_peek(token_type type) -> bool
{
    if (peek_token_is(type)) {
        next_token();
        return true;
    }
    peek_error(type);
    return false;
}

auto parser::current_token_is(token_type type) const -> bool
{
    return m_current_token.type == type;
}

auto parser::peek_token_is(token_type type) const -> bool
{
    return m_peek_token.type == type;
}

auto parser::peek_error(token_type type) -> void
{
    new_error("expected next token to be {}, got {} instead", type, m_peek_token.type);
}

auto parser::register_prefix(token_type type, prefix_parser prefix) -> void
{
    m_prefix_parsers[type] = prefix;
}

auto parser::register_infix(token_type type, infix_parser infix) -> void
{
    m_infix_parsers[type] = infix;
}

auto parser::no_prefix_parse_function_error(token_type type) -> void
{
    new_error("no prefix parse function for {} found", type);
}

auto parser::peek_precedence() const -> int
{
    return precedence_of_token(m_peek_token.type);
}

auto parser::current_precedence() const -> int
{
    return precedence_of_token(m_current_token.type);
}
