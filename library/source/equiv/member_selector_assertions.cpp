#include <sstream> // for std::ostringstream

#include "equiv/member_selector_assertions.hpp"

namespace equiv {

namespace {

template <class Predicate>
auto select(const std::vector<member_info>& members, Predicate pred)
    -> std::vector<const member_info*>
{
    auto result = std::vector<const member_info*>{};
    for (auto&& member: members) {
        if (pred(member)) {
            result.push_back(&member);
        }
    }
    return result;
}

auto describe(const std::vector<const member_info*>& members) -> std::string
{
    auto result = std::string{};
    for (auto&& member: members) {
        if (!empty(result)) {
            result += '\n';
        }
        result += to_string(*member);
    }
    return escape_placeholders(result);
}

}

auto is_decorated_with(const member_info& member, std::string_view attribute)
    -> bool
{
    return member.attributes.find(std::string{attribute})
        != end(member.attributes);
}

auto operator<<(std::ostream& os, const member_info& value) -> std::ostream&
{
    os << value.type.name << ' ';
    os << value.declaring_type.name << '.' << value.name;
    return os;
}

auto to_string(const member_info& value) -> std::string
{
    std::ostringstream os;
    os << value;
    return os.str();
}

member_selector_assertions::member_selector_assertions(
    assertion_chain& chain, std::vector<member_info> members):
    chain_{&chain}, members_{std::move(members)}
{
    // Intentionally empty.
}

auto member_selector_assertions::be_virtual(const reason& because)
    -> member_selector_assertions&
{
    const auto found = select(members_, [](const member_info& member) {
        return !member.is_virtual;
    });
    chain_->begin_assertion();
    chain_->for_condition(empty(found)).because_of(because).fail_with(
        "Expected all selected properties to be virtual{reason}, but the "
        "following properties are not virtual:\n" + describe(found));
    return *this;
}

auto member_selector_assertions::not_be_virtual(const reason& because)
    -> member_selector_assertions&
{
    const auto found = select(members_, [](const member_info& member) {
        return member.is_virtual;
    });
    chain_->begin_assertion();
    chain_->for_condition(empty(found)).because_of(because).fail_with(
        "Expected all selected properties not to be virtual{reason}, but the "
        "following properties are virtual:\n" + describe(found));
    return *this;
}

auto member_selector_assertions::be_writable(const reason& because)
    -> member_selector_assertions&
{
    const auto found = select(members_, [](const member_info& member) {
        return !member.can_write;
    });
    chain_->begin_assertion();
    chain_->for_condition(empty(found)).because_of(because).fail_with(
        "Expected all selected properties to have a setter{reason}, but the "
        "following properties do not:\n" + describe(found));
    return *this;
}

auto member_selector_assertions::not_be_writable(const reason& because)
    -> member_selector_assertions&
{
    const auto found = select(members_, [](const member_info& member) {
        return member.can_write;
    });
    chain_->begin_assertion();
    chain_->for_condition(empty(found)).because_of(because).fail_with(
        "Expected selected properties to not have a setter{reason}, but the "
        "following properties do:\n" + describe(found));
    return *this;
}

auto member_selector_assertions::be_decorated_with(std::string_view attribute,
                                                   const reason& because)
    -> member_selector_assertions&
{
    const auto found = select(members_, [attribute](const member_info& m) {
        return !is_decorated_with(m, attribute);
    });
    chain_->begin_assertion();
    chain_->for_condition(empty(found)).because_of(because).fail_with(
        "Expected all selected properties to be decorated with {0}{reason}, "
        "but the following properties are not:\n" + describe(found), {
            std::string{attribute},
        });
    return *this;
}

auto member_selector_assertions::not_be_decorated_with(
    std::string_view attribute, const reason& because)
    -> member_selector_assertions&
{
    const auto found = select(members_, [attribute](const member_info& m) {
        return is_decorated_with(m, attribute);
    });
    chain_->begin_assertion();
    chain_->for_condition(empty(found)).because_of(because).fail_with(
        "Expected all selected properties not to be decorated with {0}"
        "{reason}, but the following properties are:\n" + describe(found), {
            std::string{attribute},
        });
    return *this;
}

auto member_selector_assertions::members() const noexcept
    -> const std::vector<member_info>&
{
    return members_;
}

auto member_selector_assertions::chain() const noexcept -> assertion_chain&
{
    return *chain_;
}

}
