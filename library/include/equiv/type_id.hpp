#ifndef type_id_hpp
#define type_id_hpp

#include <compare> // for std::strong_ordering
#include <ostream>
#include <string>

namespace equiv {

enum class type_kind: unsigned {
    any, boolean, integer, floating, string, sequence, object
};

auto operator<<(std::ostream& os, type_kind value) -> std::ostream&;

/// @brief Identity of a type as far as equivalency checking is concerned.
/// @note Two identities are the same type only if both their names and
///   kinds are equal. There is no notion of sub-typing other than every
///   type being assignable to the <code>any</code> kind.
struct type_id
{
    std::string name;
    type_kind kind{type_kind::any};

    auto operator<=>(const type_id&) const = default;
};

auto operator<<(std::ostream& os, const type_id& value) -> std::ostream&;

/// @brief Makes the identity of a user defined object type.
/// @throws invalid_name naming @name if it isn't a valid name.
/// @throws std::invalid_argument if @name is empty or clashes with the name
///   of a built-in type.
auto object_type(const std::string& name) -> type_id;

}

namespace equiv::types {

/// @brief The top type, named <code>object</code>.
auto any() -> const type_id&;
auto boolean() -> const type_id&;
auto integer() -> const type_id&;
auto floating() -> const type_id&;
auto string() -> const type_id&;
auto sequence() -> const type_id&;

}

#endif /* type_id_hpp */
