#ifndef comparands_hpp
#define comparands_hpp

#include <optional>
#include <ostream>

#include "equiv/type_id.hpp"
#include "equiv/value.hpp"

namespace equiv {

struct equivalency_options;

/// @brief The pair of values being compared at a node.
struct comparands
{
    value subject;
    value expectation;

    /// @brief Declared type of the node, if any.
    std::optional<type_id> compile_time_type;

    /// @brief Gets the runtime type of the expectation.
    /// @return Runtime type of the expectation, or the compile time type if
    ///   the expectation is absent.
    [[nodiscard]] auto runtime_type() const -> std::optional<type_id>;

    /// @brief Gets the type the node is to be judged by.
    /// @details This is the runtime type if the options respect runtime
    ///   types and the compile time type otherwise. When there's no compile
    ///   time type, it's the runtime type of the expectation or else of the
    ///   subject.
    /// @return Type to judge by, or nothing if neither side has a type.
    [[nodiscard]] auto get_expected_type(const equivalency_options& options)
        const -> std::optional<type_id>;
};

auto operator<<(std::ostream& os, const comparands& value) -> std::ostream&;

}

#endif /* comparands_hpp */
