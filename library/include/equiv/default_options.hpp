#ifndef default_options_hpp
#define default_options_hpp

#include <functional> // for std::function

#include "equiv/equivalency_options.hpp"

namespace equiv {

using options_configurer =
    std::function<equivalency_options(const equivalency_options&)>;

/// @brief Gets a copy of the process wide default options.
/// @note Safe to call from any thread.
auto default_options() -> equivalency_options;

/// @brief Replaces the process wide default options.
auto set_default_options(equivalency_options options) -> void;

/// @brief Replaces the process wide default options with what the given
///   function makes of them.
/// @note The function is called while holding the lock of the defaults so
///   it must not itself access the defaults.
auto configure_default_options(const options_configurer& configure) -> void;

/// @brief Restores the process wide default options to the values of a
///   default constructed <code>equivalency_options</code>.
auto reset_default_options() -> void;

}

#endif /* default_options_hpp */
