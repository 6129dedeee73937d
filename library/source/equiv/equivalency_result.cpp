#include "equiv/equivalency_result.hpp"

namespace equiv {

auto operator<<(std::ostream& os, equivalency_result value) -> std::ostream&
{
    switch (value) {
    case equivalency_result::continue_with_next:
        os << "continue_with_next";
        break;
    case equivalency_result::equivalency_proven:
        os << "equivalency_proven";
        break;
    case equivalency_result::assertion_failed:
        os << "assertion_failed";
        break;
    }
    return os;
}

}
