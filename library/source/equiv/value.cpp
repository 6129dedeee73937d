#include <cmath> // for std::isnan
#include <sstream> // for std::ostringstream

#include "equiv/reserved.hpp"
#include "equiv/utility.hpp"
#include "equiv/value.hpp"

namespace equiv {

namespace {

constexpr auto max_display_depth = 2;

auto write(std::ostream& os, const value& v, int depth) -> void
{
    if (is_null(v)) {
        os << reserved::null_display;
        return;
    }
    std::visit(detail::overloaded{
        [&os](const std::monostate&) {
            os << reserved::null_display;
        },
        [&os](bool b) {
            os << (b? "true": "false");
        },
        [&os](std::int64_t i) {
            os << i;
        },
        [&os](double d) {
            os << d;
        },
        [&os](const std::string& s) {
            os << '"' << s << '"';
        },
        [&os,depth](const sequence_ptr& p) {
            if (depth >= max_display_depth) {
                os << "{...}";
                return;
            }
            os << "{";
            auto prefix = "";
            for (auto&& element: p->elements) {
                os << prefix;
                write(os, element, depth + 1);
                prefix = ", ";
            }
            os << "}";
        },
        [&os](const object_ptr& p) {
            os << p->type;
        },
    }, v.data);
}

}

auto make_object(type_id type, std::vector<member> members)
    -> object_ptr
{
    return std::make_shared<object>(object{
        std::move(type), std::move(members)
    });
}

auto make_sequence(std::vector<value> elements, type_id element_type)
    -> sequence_ptr
{
    return std::make_shared<sequence>(sequence{
        std::move(element_type), std::move(elements)
    });
}

auto is_null(const value& v) noexcept -> bool
{
    if (std::holds_alternative<std::monostate>(v.data)) {
        return true;
    }
    if (const auto p = std::get_if<object_ptr>(&v.data)) {
        return !*p;
    }
    if (const auto p = std::get_if<sequence_ptr>(&v.data)) {
        return !*p;
    }
    return false;
}

auto runtime_type(const value& v) -> std::optional<type_id>
{
    if (is_null(v)) {
        return {};
    }
    return std::visit(detail::overloaded{
        [](const std::monostate&) -> std::optional<type_id> {
            return {};
        },
        [](bool) -> std::optional<type_id> {
            return types::boolean();
        },
        [](std::int64_t) -> std::optional<type_id> {
            return types::integer();
        },
        [](double) -> std::optional<type_id> {
            return types::floating();
        },
        [](const std::string&) -> std::optional<type_id> {
            return types::string();
        },
        [](const sequence_ptr&) -> std::optional<type_id> {
            return types::sequence();
        },
        [](const object_ptr& p) -> std::optional<type_id> {
            return p->type;
        },
    }, v.data);
}

auto identity_of(const value& v) noexcept -> const void*
{
    if (const auto p = std::get_if<object_ptr>(&v.data)) {
        return p->get();
    }
    if (const auto p = std::get_if<sequence_ptr>(&v.data)) {
        return p->get();
    }
    return nullptr;
}

auto find_member(const object& obj, const member_name& name)
    -> const member*
{
    for (auto&& entry: obj.members) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

auto operator==(const value& lhs, const value& rhs) -> bool
{
    const auto lhs_null = is_null(lhs);
    const auto rhs_null = is_null(rhs);
    if (lhs_null || rhs_null) {
        return lhs_null == rhs_null;
    }
    const auto l = std::get_if<double>(&lhs.data);
    const auto r = std::get_if<double>(&rhs.data);
    if (l && r && std::isnan(*l) && std::isnan(*r)) {
        return true;
    }
    return lhs.data == rhs.data;
}

auto operator<<(std::ostream& os, const value& v) -> std::ostream&
{
    write(os, v, 0);
    return os;
}

auto to_string(const value& v) -> std::string
{
    std::ostringstream os;
    os << v;
    return os.str();
}

}
