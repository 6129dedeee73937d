#ifndef string_assertions_hpp
#define string_assertions_hpp

#include <string>
#include <string_view>

#include "equiv/assertion_chain.hpp"
#include "equiv/string_options.hpp"

namespace equiv {

/// @brief Normalizes the given string according to the given options.
/// @details Trims leading whitespace, trims trailing whitespace, and turns
///   <code>"\r\n"</code> and lone <code>'\r'</code> into <code>'\n'</code>,
///   as the options call for. Case isn't changed.
auto normalize(std::string_view text, const string_options& options)
    -> std::string;

/// @brief Asserts that the subject is equivalent to the expectation.
/// @details Opens a logical assertion on the chain, or continues the
///   current one if the chain's reuse flag is set, and records a failure
///   that refers to the chain's subject if the strings aren't equivalent.
/// @note Case insensitive comparison only folds ASCII letters.
/// @return Whether the strings are equivalent.
auto be_equivalent_string(assertion_chain& chain,
                          std::string_view subject,
                          std::string_view expectation,
                          const string_options& options = {}) -> bool;

}

#endif /* string_assertions_hpp */
