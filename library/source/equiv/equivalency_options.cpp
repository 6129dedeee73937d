#include <stdexcept> // for std::invalid_argument

#include "equiv/equivalency_options.hpp"
#include "equiv/member_name.hpp"
#include "equiv/node.hpp"

namespace equiv {

auto equivalency_options::ignoring_case() const -> equivalency_options
{
    auto result = *this;
    result.ignore_case_ = true;
    return result;
}

auto equivalency_options::ignoring_leading_whitespace() const
    -> equivalency_options
{
    auto result = *this;
    result.ignore_leading_whitespace_ = true;
    return result;
}

auto equivalency_options::ignoring_trailing_whitespace() const
    -> equivalency_options
{
    auto result = *this;
    result.ignore_trailing_whitespace_ = true;
    return result;
}

auto equivalency_options::ignoring_newline_style() const
    -> equivalency_options
{
    auto result = *this;
    result.ignore_newline_style_ = true;
    return result;
}

auto equivalency_options::respecting_runtime_types() const
    -> equivalency_options
{
    auto result = *this;
    result.use_runtime_types_ = true;
    return result;
}

auto equivalency_options::respecting_declared_types() const
    -> equivalency_options
{
    auto result = *this;
    result.use_runtime_types_ = false;
    return result;
}

auto equivalency_options::with_max_recursion_depth(std::size_t depth) const
    -> equivalency_options
{
    auto result = *this;
    result.max_recursion_depth_ = depth;
    result.allow_infinite_recursion_ = false;
    return result;
}

auto equivalency_options::allowing_infinite_recursion() const
    -> equivalency_options
{
    auto result = *this;
    result.allow_infinite_recursion_ = true;
    return result;
}

auto equivalency_options::ignoring_cyclic_references() const
    -> equivalency_options
{
    auto result = *this;
    result.cyclic_references_ = cyclic_reference_handling::ignore;
    return result;
}

auto equivalency_options::failing_on_cyclic_references() const
    -> equivalency_options
{
    auto result = *this;
    result.cyclic_references_ = cyclic_reference_handling::fail;
    return result;
}

auto equivalency_options::with_strict_ordering() const
    -> equivalency_options
{
    auto result = *this;
    result.ordering_ = ordering::strict;
    return result;
}

auto equivalency_options::without_strict_ordering() const
    -> equivalency_options
{
    auto result = *this;
    result.ordering_ = ordering::loose;
    return result;
}

auto equivalency_options::excluding(std::string_view path) const
    -> equivalency_options
{
    const auto names = to_member_names(path);
    if (empty(names)) {
        throw std::invalid_argument{"excluded member path may not be empty"};
    }
    auto result = *this;
    result.excluded_paths_.insert(to_member_path(names));
    return result;
}

auto equivalency_options::using_step(equivalency_step step) const
    -> equivalency_options
{
    auto result = *this;
    result.custom_steps_.push_back(std::move(step));
    return result;
}

auto equivalency_options::for_type(const type_id& type,
                                   refinement value) const
    -> equivalency_options
{
    auto result = *this;
    if (std::holds_alternative<no_refinement>(value)) {
        result.refinements_.erase(type);
    }
    else {
        result.refinements_.insert_or_assign(type, std::move(value));
    }
    return result;
}

auto equivalency_options::using_string_options(const string_options& opts)
    const -> equivalency_options
{
    return for_type(types::string(), opts);
}

auto equivalency_options::ignore_case() const noexcept -> bool
{
    return ignore_case_;
}

auto equivalency_options::ignore_leading_whitespace() const noexcept -> bool
{
    return ignore_leading_whitespace_;
}

auto equivalency_options::ignore_trailing_whitespace() const noexcept -> bool
{
    return ignore_trailing_whitespace_;
}

auto equivalency_options::ignore_newline_style() const noexcept -> bool
{
    return ignore_newline_style_;
}

auto equivalency_options::use_runtime_types() const noexcept -> bool
{
    return use_runtime_types_;
}

auto equivalency_options::max_recursion_depth() const noexcept
    -> std::size_t
{
    return max_recursion_depth_;
}

auto equivalency_options::allow_infinite_recursion() const noexcept -> bool
{
    return allow_infinite_recursion_;
}

auto equivalency_options::cyclic_references() const noexcept
    -> cyclic_reference_handling
{
    return cyclic_references_;
}

auto equivalency_options::item_ordering() const noexcept -> ordering
{
    return ordering_;
}

auto equivalency_options::excluded_paths() const noexcept
    -> const std::set<std::string>&
{
    return excluded_paths_;
}

auto equivalency_options::custom_steps() const noexcept -> const step_list&
{
    return custom_steps_;
}

auto equivalency_options::refinement_for(const type_id& type) const
    -> refinement
{
    if (const auto found = refinements_.find(type);
        found != refinements_.end()) {
        return found->second;
    }
    return no_refinement{};
}

auto equivalency_options::is_excluded(const node& member) const -> bool
{
    return excluded_paths_.contains(member.member_path());
}

auto operator<<(std::ostream& os, const equivalency_options& value)
    -> std::ostream&
{
    os << "equivalency_options{";
    os << ".ignore_case=" << value.ignore_case();
    os << ",.ignore_leading_whitespace=" << value.ignore_leading_whitespace();
    os << ",.ignore_trailing_whitespace=" << value.ignore_trailing_whitespace();
    os << ",.ignore_newline_style=" << value.ignore_newline_style();
    os << ",.use_runtime_types=" << value.use_runtime_types();
    os << ",.max_recursion_depth=";
    if (value.allow_infinite_recursion()) {
        os << "none";
    }
    else {
        os << value.max_recursion_depth();
    }
    os << ",.strict_ordering=" << (value.item_ordering() == ordering::strict);
    if (!empty(value.excluded_paths())) {
        os << ",.excluded={";
        auto prefix = "";
        for (auto&& path: value.excluded_paths()) {
            os << prefix << path;
            prefix = ",";
        }
        os << "}";
    }
    if (!empty(value.custom_steps())) {
        os << ",.steps={";
        auto prefix = "";
        for (auto&& step: value.custom_steps()) {
            os << prefix << step.name;
            prefix = ",";
        }
        os << "}";
    }
    os << "}";
    return os;
}

}
