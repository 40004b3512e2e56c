#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case illegal:
            return ostream << "illegal";
        case eof:
            return ostream << "eof";
        case assign:
            return ostream << "=";
        case asterisk:
            return ostream << "*";
        case comma:
            return ostream << ",";
        case exclamation:
            return ostream << "!";
        case greater_than:
            return ostream << ">";
        case less_than:
            return ostream << "<";
        case lparen:
            return ostream << "(";
        case lsquirly:
            return ostream << "{";
        case minus:
            return ostream << "-";
        case plus:
            return ostream << "+";
        case rparen:
            return ostream << ")";
        case rsquirly:
            return ostream << "}";
        case semicolon:
            return ostream << ";";
        case slash:
            return ostream << "/";
        case equals:
            return ostream << "==";
        case not_equals:
            return ostream << "!=";
        case ident:
            return ostream << "identifier";
        case integer:
            return ostream << "integer";
        case let:
            return ostream << "let";
        case function:
            return ostream << "fn";
        case tru:
            return ostream << "true";
        case fals:
            return ostream << "false";
        case eef:
            return ostream << "if";
        case elze:
            return ostream << "else";
        case ret:
            return ostream << "return";
    }
    throw std::invalid_argument("invalid token_type");
}
