#include <ostream>

#include "token.hpp"

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&
{
    return ostream << "token{" << token.type << ", `" << token.literal << "`}";
}
