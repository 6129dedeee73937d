#include <mutex>

#include "equiv/default_options.hpp"
#include "equiv/logging.hpp"

namespace equiv {

namespace {

struct options_store
{
    std::mutex mutex;
    equivalency_options options;
};

auto the_options_store() noexcept -> options_store&
{
    static auto store = options_store{};
    return store;
}

}

auto default_options() -> equivalency_options
{
    auto& store = the_options_store();
    const auto lock = std::lock_guard{store.mutex};
    return store.options;
}

auto set_default_options(equivalency_options options) -> void
{
    auto& store = the_options_store();
    const auto lock = std::lock_guard{store.mutex};
    store.options = std::move(options);
    EQUIV_LOG_DEBUG("default options set");
}

auto configure_default_options(const options_configurer& configure) -> void
{
    auto& store = the_options_store();
    const auto lock = std::lock_guard{store.mutex};
    store.options = configure(store.options);
    EQUIV_LOG_DEBUG("default options configured");
}

auto reset_default_options() -> void
{
    set_default_options(equivalency_options{});
}

}
