#ifndef member_selector_assertions_hpp
#define member_selector_assertions_hpp

#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "equiv/assertion_chain.hpp"
#include "equiv/member_name.hpp"
#include "equiv/message_format.hpp"
#include "equiv/type_id.hpp"

namespace equiv {

/// @brief Description of a member as gathered by a member selector.
struct member_info
{
    type_id declaring_type;
    member_name name;
    type_id type{types::any()};
    bool is_virtual{};
    bool can_write{true};
    std::set<std::string> attributes;
};

/// @brief Whether the given member is decorated with the named attribute.
auto is_decorated_with(const member_info& member, std::string_view attribute)
    -> bool;

/// @brief Writes the given member's description.
/// @note Like <code>string Customer.Name</code>.
auto operator<<(std::ostream& os, const member_info& value) -> std::ostream&;

auto to_string(const member_info& value) -> std::string;

/// @brief Assertions on a fixed selection of members.
/// @details Each assertion records at most one failure, listing every
///   offending member of the selection in selection order, one per line.
struct member_selector_assertions
{
    member_selector_assertions(assertion_chain& chain,
                               std::vector<member_info> members);

    auto be_virtual(const reason& because = {})
        -> member_selector_assertions&;
    auto not_be_virtual(const reason& because = {})
        -> member_selector_assertions&;
    auto be_writable(const reason& because = {})
        -> member_selector_assertions&;
    auto not_be_writable(const reason& because = {})
        -> member_selector_assertions&;
    auto be_decorated_with(std::string_view attribute,
                           const reason& because = {})
        -> member_selector_assertions&;
    auto not_be_decorated_with(std::string_view attribute,
                               const reason& because = {})
        -> member_selector_assertions&;

    [[nodiscard]] auto members() const noexcept
        -> const std::vector<member_info>&;
    [[nodiscard]] auto chain() const noexcept -> assertion_chain&;

private:
    assertion_chain* chain_;
    std::vector<member_info> members_;
};

}

#endif /* member_selector_assertions_hpp */
