#ifndef equivalency_context_hpp
#define equivalency_context_hpp

#include "equiv/assertion_chain.hpp"
#include "equiv/equivalency_options.hpp"
#include "equiv/node.hpp"

namespace equiv {

/// @brief What a step gets to know about the node it's evaluating.
/// @note Only valid for the duration of the evaluation of the node.
struct equivalency_context
{
    const node& current_node;
    const equivalency_options& options;
    assertion_chain& chain;
};

}

#endif /* equivalency_context_hpp */
