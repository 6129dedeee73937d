#ifndef equivalency_options_hpp
#define equivalency_options_hpp

#include <cstddef> // for std::size_t
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <variant>

#include "equiv/equivalency_step.hpp"
#include "equiv/string_options.hpp"
#include "equiv/type_id.hpp"

namespace equiv {

struct node;

/// @brief Alternative of a <code>refinement</code> for when there is none.
struct no_refinement
{
    auto operator==(const no_refinement&) const -> bool = default;
};

/// @brief Options scoped to a particular type.
/// @note A present refinement fully supersedes the generic flags for
///   values of its type.
using refinement = std::variant<no_refinement, string_options>;

enum class cyclic_reference_handling {
    /// @brief Revisits on the same path are taken to be equivalent.
    ignore,

    /// @brief Revisits on the same path are recorded as failures.
    fail,
};

enum class ordering { loose, strict };

/// @brief Options for judging equivalency.
/// @note Values of this type are never modified. The fluent members make
///   new values instead.
struct equivalency_options
{
    static constexpr auto default_max_recursion_depth = std::size_t{10};

    [[nodiscard]] auto ignoring_case() const -> equivalency_options;
    [[nodiscard]] auto ignoring_leading_whitespace() const
        -> equivalency_options;
    [[nodiscard]] auto ignoring_trailing_whitespace() const
        -> equivalency_options;
    [[nodiscard]] auto ignoring_newline_style() const -> equivalency_options;

    /// @brief Judges nodes by the runtime type of the expectation.
    [[nodiscard]] auto respecting_runtime_types() const
        -> equivalency_options;

    /// @brief Judges nodes by their declared types.
    /// @note This is the default.
    [[nodiscard]] auto respecting_declared_types() const
        -> equivalency_options;

    [[nodiscard]] auto with_max_recursion_depth(std::size_t depth) const
        -> equivalency_options;
    [[nodiscard]] auto allowing_infinite_recursion() const
        -> equivalency_options;

    [[nodiscard]] auto ignoring_cyclic_references() const
        -> equivalency_options;
    [[nodiscard]] auto failing_on_cyclic_references() const
        -> equivalency_options;

    [[nodiscard]] auto with_strict_ordering() const -> equivalency_options;
    [[nodiscard]] auto without_strict_ordering() const
        -> equivalency_options;

    /// @brief Excludes members having the given member path.
    /// @param[in] path Member path without collection indices, like
    ///   <code>Address.City</code> or <code>Orders.Id</code>.
    /// @throws invalid_name naming @path if any of its components isn't a
    ///   valid member name.
    /// @throws std::invalid_argument if @path is empty.
    [[nodiscard]] auto excluding(std::string_view path) const
        -> equivalency_options;

    /// @brief Adds the given step.
    /// @note Added steps are evaluated in the order they're added, before
    ///   any of the built-in steps.
    [[nodiscard]] auto using_step(equivalency_step step) const
        -> equivalency_options;

    /// @brief Scopes the given refinement to values of the given type.
    [[nodiscard]] auto for_type(const type_id& type, refinement value) const
        -> equivalency_options;

    /// @brief Scopes the given string options to string values.
    [[nodiscard]] auto using_string_options(const string_options& opts) const
        -> equivalency_options;

    [[nodiscard]] auto ignore_case() const noexcept -> bool;
    [[nodiscard]] auto ignore_leading_whitespace() const noexcept -> bool;
    [[nodiscard]] auto ignore_trailing_whitespace() const noexcept -> bool;
    [[nodiscard]] auto ignore_newline_style() const noexcept -> bool;
    [[nodiscard]] auto use_runtime_types() const noexcept -> bool;
    [[nodiscard]] auto max_recursion_depth() const noexcept -> std::size_t;
    [[nodiscard]] auto allow_infinite_recursion() const noexcept -> bool;
    [[nodiscard]] auto cyclic_references() const noexcept
        -> cyclic_reference_handling;
    [[nodiscard]] auto item_ordering() const noexcept -> ordering;
    [[nodiscard]] auto excluded_paths() const noexcept
        -> const std::set<std::string>&;
    [[nodiscard]] auto custom_steps() const noexcept -> const step_list&;

    /// @brief Gets the refinement scoped to the given type.
    /// @return <code>no_refinement</code> if there's none.
    [[nodiscard]] auto refinement_for(const type_id& type) const
        -> refinement;

    /// @brief Whether the member at the given node is excluded.
    [[nodiscard]] auto is_excluded(const node& member) const -> bool;

private:
    bool ignore_case_{};
    bool ignore_leading_whitespace_{};
    bool ignore_trailing_whitespace_{};
    bool ignore_newline_style_{};
    bool use_runtime_types_{};
    bool allow_infinite_recursion_{};
    std::size_t max_recursion_depth_{default_max_recursion_depth};
    cyclic_reference_handling cyclic_references_{
        cyclic_reference_handling::ignore
    };
    ordering ordering_{ordering::loose};
    std::set<std::string> excluded_paths_;
    std::map<type_id, refinement> refinements_;
    step_list custom_steps_;
};

auto operator<<(std::ostream& os, const equivalency_options& value)
    -> std::ostream&;

}

#endif /* equivalency_options_hpp */
