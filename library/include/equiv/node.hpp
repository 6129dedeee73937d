#ifndef node_hpp
#define node_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <ostream>
#include <string>

#include "equiv/member_name.hpp"
#include "equiv/reserved.hpp"
#include "equiv/type_id.hpp"

namespace equiv {

enum class node_kind { root, member, item };

/// @brief Position within the graphs being compared.
/// @details Nodes form a singly linked chain from a child up to the root of
///   a comparison. A child only refers to its parent so it must not outlive
///   it. This is naturally the case when each recursion level owns the
///   node of the level.
struct node
{
    /// @brief Makes a root node.
    /// @param[in] declared_type Declared type of the root, if known.
    /// @param[in] name Name the root is described by.
    static auto root(std::optional<type_id> declared_type = {},
                     std::string name = reserved::root_name) -> node;

    /// @brief Makes the node of the named member of this node.
    [[nodiscard]] auto member(const member_name& name,
                              type_id declared_type) const -> node;

    /// @brief Makes the node of the indexed item of this node.
    [[nodiscard]] auto item(std::size_t index,
                            type_id declared_type) const -> node;

    /// @brief Path of this node relative to the root.
    /// @note Like <code>Address.City</code> or <code>Items[0].Name</code>.
    ///   Empty for the root.
    [[nodiscard]] auto path() const -> const std::string&;

    /// @brief Path of this node with collection indices left out.
    /// @note Like <code>Items.Name</code> for <code>Items[0].Name</code>.
    [[nodiscard]] auto member_path() const -> const std::string&;

    /// @brief Fully qualified path of this node.
    /// @note Like <code>subject.Address.City</code>.
    [[nodiscard]] auto description() const -> const std::string&;

    [[nodiscard]] auto declared_type() const -> const std::optional<type_id>&;
    [[nodiscard]] auto kind() const noexcept -> node_kind;
    [[nodiscard]] auto parent() const noexcept -> const node*;
    [[nodiscard]] auto depth() const noexcept -> std::size_t;
    [[nodiscard]] auto is_root() const noexcept -> bool;

private:
    node() = default;

    const node* parent_{};
    node_kind kind_{node_kind::root};
    std::optional<type_id> declared_type_;
    std::string path_;
    std::string member_path_;
    std::string description_;
    std::size_t depth_{};
};

/// @brief Writes the given node as a subject of a failure message.
/// @note Like <code>member subject.Address.City</code>.
auto operator<<(std::ostream& os, const node& value) -> std::ostream&;

auto to_string(const node& value) -> std::string;

}

#endif /* node_hpp */
