#ifndef value_hpp
#define value_hpp

#include <concepts> // for std::integral, std::floating_point
#include <cstddef> // for std::nullptr_t
#include <cstdint> // for std::int64_t
#include <memory> // for std::shared_ptr
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits> // for std::is_same_v
#include <variant>
#include <vector>

#include "equiv/member_name.hpp"
#include "equiv/type_id.hpp"

namespace equiv {

struct object;
struct sequence;

using object_ptr = std::shared_ptr<object>;
using sequence_ptr = std::shared_ptr<sequence>;

/// @brief Dynamic value that can be the subject or expectation of an
///   equivalency check.
/// @note Objects and sequences are held by shared pointer so graphs of
///   values may share nodes or be cyclic. Their addresses are their
///   identities.
/// @see identity_of, runtime_type.
struct value
{
    using variant_type = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        std::string,
        sequence_ptr,
        object_ptr
    >;

    value() noexcept = default;

    value(std::nullptr_t) noexcept
    {
        // Intentionally empty.
    }

    value(bool v): data{v}
    {
        // Intentionally empty.
    }

    template <std::integral T>
    requires (!std::is_same_v<T, bool>)
    value(T v): data{static_cast<std::int64_t>(v)}
    {
        // Intentionally empty.
    }

    template <std::floating_point T>
    value(T v): data{static_cast<double>(v)}
    {
        // Intentionally empty.
    }

    value(std::string v): data{std::move(v)}
    {
        // Intentionally empty.
    }

    value(std::string_view v): data{std::string{v}}
    {
        // Intentionally empty.
    }

    value(const char* v): data{std::string{v}}
    {
        // Intentionally empty.
    }

    value(sequence_ptr v): data{std::move(v)}
    {
        // Intentionally empty.
    }

    value(object_ptr v): data{std::move(v)}
    {
        // Intentionally empty.
    }

    variant_type data;
};

struct member
{
    member_name name;
    type_id declared_type{types::any()};
    value data;
};

struct object
{
    type_id type{types::any()};
    std::vector<member> members;
};

struct sequence
{
    type_id element_type{types::any()};
    std::vector<value> elements;
};

auto make_object(type_id type, std::vector<member> members = {})
    -> object_ptr;

auto make_sequence(std::vector<value> elements,
                   type_id element_type = types::any())
    -> sequence_ptr;

/// @brief Whether the given value is absent.
/// @note Null object or sequence pointers are absent values too.
auto is_null(const value& v) noexcept -> bool;

/// @brief Gets the runtime type of the given value.
/// @return Type of the value, or nothing for absent values.
auto runtime_type(const value& v) -> std::optional<type_id>;

/// @brief Gets the identity of the given value.
/// @return Address of the shared object or sequence, or a null pointer
///   for absent values and values without reference semantics.
auto identity_of(const value& v) noexcept -> const void*;

auto find_member(const object& obj, const member_name& name)
    -> const member*;

/// @brief Structural equality of scalars, identity equality otherwise.
/// @note Not-a-number doubles equal each other, so equality is reflexive.
auto operator==(const value& lhs, const value& rhs) -> bool;

auto operator<<(std::ostream& os, const value& v) -> std::ostream&;

/// @brief Gets the display string of the given value.
/// @note Strings are double quoted, absent values show as
///   <code>&lt;null&gt;</code>, and objects show as their type name.
auto to_string(const value& v) -> std::string;

}

#endif /* value_hpp */
