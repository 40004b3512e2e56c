#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

#include "object.hpp"

auto object::type() const -> object_type
{
    return std::visit(overloaded {
                          [](const integer_value /*val*/) { return object_type::integer; },
                          [](const bool /*val*/) { return object_type::boolean; },
                      },
                      value);
}

auto object::inspect() const -> std::string
{
    return std::visit(overloaded {
                          [](const integer_value val) -> std::string { return std::to_string(val); },
                          [](const bool val) -> std::string { return val ? "true" : "false"; },
                      },
                      value);
}

auto tru() -> const object_ptr&
{
    static const auto true_obj = std::make_shared<const object>(true);
    return true_obj;
}

auto fals() -> const object_ptr&
{
    static const auto false_obj = std::make_shared<const object>(false);
    return false_obj;
}

auto native_bool_to_object(bool val) -> const object_ptr&
{
    if (val) {
        return tru();
    }
    return fals();
}

auto make_integer(integer_value val) -> object_ptr
{
    return std::make_shared<const object>(val);
}

auto operator<<(std::ostream& ostrm, object::object_type type) -> std::ostream&
{
    using enum object::object_type;
    switch (type) {
        case integer:
            return ostrm << "integer";
        case boolean:
            return ostrm << "boolean";
    }
    throw std::invalid_argument("invalid object_type");
}
