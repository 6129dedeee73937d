#include <sstream> // for std::ostringstream

#include "equiv/node.hpp"

namespace equiv {

auto node::root(std::optional<type_id> declared_type, std::string name)
    -> node
{
    auto result = node{};
    result.declared_type_ = std::move(declared_type);
    result.description_ = std::move(name);
    return result;
}

auto node::member(const member_name& name, type_id declared_type) const
    -> node
{
    auto result = node{};
    result.parent_ = this;
    result.kind_ = node_kind::member;
    result.declared_type_ = std::move(declared_type);
    result.depth_ = depth_ + 1u;
    result.path_ = path_;
    result.member_path_ = member_path_;
    if (!empty(path_)) {
        result.path_ += reserved::member_separator;
    }
    if (!empty(member_path_)) {
        result.member_path_ += reserved::member_separator;
    }
    result.path_ += name.get();
    result.member_path_ += name.get();
    result.description_ = description_;
    result.description_ += reserved::member_separator;
    result.description_ += name.get();
    return result;
}

auto node::item(std::size_t index, type_id declared_type) const -> node
{
    auto suffix = std::string{reserved::index_prefix};
    suffix += std::to_string(index);
    suffix += reserved::index_suffix;

    auto result = node{};
    result.parent_ = this;
    result.kind_ = node_kind::item;
    result.declared_type_ = std::move(declared_type);
    result.depth_ = depth_ + 1u;
    result.path_ = path_ + suffix;
    result.member_path_ = member_path_;
    result.description_ = description_ + suffix;
    return result;
}

auto node::path() const -> const std::string&
{
    return path_;
}

auto node::member_path() const -> const std::string&
{
    return member_path_;
}

auto node::description() const -> const std::string&
{
    return description_;
}

auto node::declared_type() const -> const std::optional<type_id>&
{
    return declared_type_;
}

auto node::kind() const noexcept -> node_kind
{
    return kind_;
}

auto node::parent() const noexcept -> const node*
{
    return parent_;
}

auto node::depth() const noexcept -> std::size_t
{
    return depth_;
}

auto node::is_root() const noexcept -> bool
{
    return kind_ == node_kind::root;
}

auto operator<<(std::ostream& os, const node& value) -> std::ostream&
{
    switch (value.kind()) {
    case node_kind::root:
        break;
    case node_kind::member:
        os << "member ";
        break;
    case node_kind::item:
        os << "item ";
        break;
    }
    os << value.description();
    return os;
}

auto to_string(const node& value) -> std::string
{
    std::ostringstream os;
    os << value;
    return os.str();
}

}
