#pragma once

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <variant>

#include <fmt/ostream.h>

// helper type for std::visit
template<typename... T>
struct overloaded : T...
{
    using T::operator()...;
};
template<class... T>
overloaded(T...) -> overloaded<T...>;

using integer_value = std::int64_t;
using value_type = std::variant<integer_value, bool>;

struct object final
{
    enum class object_type : std::uint8_t
    {
        integer,
        boolean,
    };

    explicit object(value_type val)
        : value {val}
    {
    }

    template<typename T>
    [[nodiscard]] auto is() const -> bool
    {
        return std::holds_alternative<T>(value);
    }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        return std::get<T>(value);
    }

    [[nodiscard]] auto type() const -> object_type;
    [[nodiscard]] auto inspect() const -> std::string;

    const value_type value;
};

/// Empty when a node has nothing to evaluate to.
using object_ptr = std::shared_ptr<const object>;

auto tru() -> const object_ptr&;
auto fals() -> const object_ptr&;
auto native_bool_to_object(bool val) -> const object_ptr&;
auto make_integer(integer_value val) -> object_ptr;

auto operator<<(std::ostream& ostrm, object::object_type type) -> std::ostream&;

template<>
struct fmt::formatter<object::object_type> : ostream_formatter
{
};
