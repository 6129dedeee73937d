#ifndef reserved_hpp
#define reserved_hpp

namespace equiv::reserved {

constexpr auto root_name = "subject";

constexpr auto member_separator = '.';
constexpr auto index_prefix = '[';
constexpr auto index_suffix = ']';

constexpr auto null_display = "<null>";

}

#endif /* reserved_hpp */
