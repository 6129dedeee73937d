#include "equiv/comparands.hpp"
#include "equiv/equivalency_options.hpp"

namespace equiv {

auto comparands::runtime_type() const -> std::optional<type_id>
{
    if (auto type = equiv::runtime_type(expectation)) {
        return type;
    }
    return compile_time_type;
}

auto comparands::get_expected_type(const equivalency_options& options) const
    -> std::optional<type_id>
{
    if (options.use_runtime_types() || !compile_time_type) {
        if (auto type = runtime_type()) {
            return type;
        }
        return equiv::runtime_type(subject);
    }
    return compile_time_type;
}

auto operator<<(std::ostream& os, const comparands& value) -> std::ostream&
{
    os << "comparands{";
    os << ".subject=" << value.subject;
    os << ",.expectation=" << value.expectation;
    if (value.compile_time_type) {
        os << ",.compile_time_type=" << *value.compile_time_type;
    }
    os << "}";
    return os;
}

}
