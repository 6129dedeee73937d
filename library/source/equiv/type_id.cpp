#include <stdexcept> // for std::invalid_argument

#include "equiv/name_checker.hpp"
#include "equiv/type_id.hpp"

namespace equiv {

auto operator<<(std::ostream& os, type_kind value) -> std::ostream&
{
    switch (value) {
    case type_kind::any:
        os << "any";
        break;
    case type_kind::boolean:
        os << "boolean";
        break;
    case type_kind::integer:
        os << "integer";
        break;
    case type_kind::floating:
        os << "floating";
        break;
    case type_kind::string:
        os << "string";
        break;
    case type_kind::sequence:
        os << "sequence";
        break;
    case type_kind::object:
        os << "object";
        break;
    }
    return os;
}

auto operator<<(std::ostream& os, const type_id& value) -> std::ostream&
{
    os << value.name;
    return os;
}

auto object_type(const std::string& name) -> type_id
{
    if (empty(name)) {
        throw std::invalid_argument{"object type name may not be empty"};
    }
    for (auto&& builtin: {
        types::any(), types::boolean(), types::integer(),
        types::floating(), types::string(), types::sequence()}) {
        if (builtin.name == name) {
            throw std::invalid_argument{
                "object type name clashes with built-in type " + name
            };
        }
    }
    return type_id{
        detail::validate_name(name, "object type name"),
        type_kind::object
    };
}

}

namespace equiv::types {

auto any() -> const type_id&
{
    static const auto value = type_id{"object", type_kind::any};
    return value;
}

auto boolean() -> const type_id&
{
    static const auto value = type_id{"bool", type_kind::boolean};
    return value;
}

auto integer() -> const type_id&
{
    static const auto value = type_id{"int64", type_kind::integer};
    return value;
}

auto floating() -> const type_id&
{
    static const auto value = type_id{"double", type_kind::floating};
    return value;
}

auto string() -> const type_id&
{
    static const auto value = type_id{"string", type_kind::string};
    return value;
}

auto sequence() -> const type_id&
{
    static const auto value = type_id{"sequence", type_kind::sequence};
    return value;
}

}
