#include "equiv/builtin_steps.hpp"

namespace equiv {

auto default_steps() -> step_list
{
    // Order matters: the simple equality step applies to everything.
    return step_list{
        {steps::reference_equality_name, steps::reference_equality},
        {steps::sequence_equivalency_name, steps::sequence_equivalency},
        {steps::string_equality_name, steps::string_equality},
        {steps::structural_equality_name, steps::structural_equality},
        {steps::simple_equality_name, steps::simple_equality},
    };
}

}
