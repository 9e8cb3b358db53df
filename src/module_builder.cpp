#include "libctdi/module_builder.hpp"
#include "libctdi/composition.hpp"
#include "libctdi/logging.hpp"
#include "libctdi/module.hpp"
#include "module_state.hpp"
#include "stacktrace_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace libctdi {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct module_builder::Impl {
    std::shared_ptr<const composition> bindings;

    // Keyed by implementation type.
    std::unordered_map<std::type_index, std::any> parameters;

    // Keyed by descriptor index.
    std::unordered_map<std::size_t, erased_ptr>       component_overrides;
    std::unordered_map<std::size_t, factory_fn>       provider_overrides;
    std::unordered_map<std::size_t, async_factory_fn> async_provider_overrides;

    std::size_t require_bound(std::type_index interface_type, binding_kind expected,
                              const char* api_name) const {
        auto idx = bindings->index_of(interface_type);
        if (!idx) {
            throw not_found(interface_type,
                std::string(api_name) + " targets an interface with no binding");
        }
        const auto& desc = bindings->descriptors()[*idx];
        if (desc.kind != expected) {
            throw not_found(interface_type,
                std::string(api_name) + " expects a " + std::string(to_string(expected))
                + " binding but the interface is bound as "
                + std::string(to_string(desc.kind)));
        }
        return *idx;
    }
};

namespace {

void require_unconsumed(const void* impl) {
    if (!impl) {
        throw di_error("module_builder has already been consumed");
    }
}

} // namespace

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

module_builder::module_builder(std::shared_ptr<const composition> bindings)
    : impl_(std::make_unique<Impl>())
{
    if (!bindings) {
        throw di_error("module_builder requires a composition");
    }
    impl_->bindings = std::move(bindings);
}

module_builder::~module_builder() = default;

module_builder::module_builder(module_builder&&) noexcept = default;
module_builder& module_builder::operator=(module_builder&&) noexcept = default;

// ---------------------------------------------------------------
// Staging
// ---------------------------------------------------------------

module_builder& module_builder::stage_parameters(std::type_index impl_type,
                                                 binding_kind expected,
                                                 std::any params) {
    require_unconsumed(impl_.get());
    bool found = false;
    for (const auto& desc : impl_->bindings->descriptors()) {
        if (desc.impl_type != impl_type) continue;
        bool kind_ok = expected == binding_kind::component
                           ? desc.kind == binding_kind::component
                           : desc.kind != binding_kind::component;
        if (kind_ok) {
            found = true;
            break;
        }
    }
    if (!found) {
        throw not_found(impl_type,
            "parameters staged for a type that is not a bound "
            + std::string(to_string(expected)) + " implementation");
    }
    impl_->parameters.insert_or_assign(impl_type, std::move(params));
    return *this;
}

module_builder& module_builder::stage_component_override(std::type_index interface_type,
                                                         erased_ptr instance) {
    require_unconsumed(impl_.get());
    auto idx = impl_->require_bound(interface_type, binding_kind::component,
                                    "with_component_override");
    impl_->component_overrides.insert_or_assign(idx, std::move(instance));
    return *this;
}

module_builder& module_builder::stage_provider_override(std::type_index interface_type,
                                                        factory_fn factory) {
    require_unconsumed(impl_.get());
    auto idx = impl_->require_bound(interface_type, binding_kind::provider,
                                    "with_provider_override");
    impl_->provider_overrides.insert_or_assign(idx, std::move(factory));
    return *this;
}

module_builder& module_builder::stage_async_provider_override(std::type_index interface_type,
                                                              async_factory_fn factory) {
    require_unconsumed(impl_.get());
    auto idx = impl_->require_bound(interface_type, binding_kind::async_provider,
                                    "with_async_provider_override");
    impl_->async_provider_overrides.insert_or_assign(idx, std::move(factory));
    return *this;
}

// ---------------------------------------------------------------
// build
// ---------------------------------------------------------------

std::shared_ptr<module> module_builder::build(build_options options) && {
    require_unconsumed(impl_.get());
    auto staged = std::move(impl_);

    const auto& descs = staged->bindings->descriptors();
    auto state = std::make_unique<module::impl>();
    state->cells = std::make_unique<instance_cell[]>(descs.size());
    state->factories.reserve(descs.size());
    state->async_factories.reserve(descs.size());
    for (const auto& desc : descs) {
        state->factories.push_back(desc.factory);
        state->async_factories.push_back(desc.async_factory);
    }

    for (auto& [idx, factory] : staged->provider_overrides) {
        state->factories[idx] = std::move(factory);
    }
    for (auto& [idx, factory] : staged->async_provider_overrides) {
        state->async_factories[idx] = std::move(factory);
    }
    // Seeded cells never run their factory, so a parameter overlay for the
    // same component is simply never consulted.
    for (auto& [idx, instance] : staged->component_overrides) {
        state->cells[idx].set(std::move(instance));
        state->record_constructed(idx);
    }
    state->parameters = std::move(staged->parameters);
    state->bindings = std::move(staged->bindings);

    auto log = get_logger();
    log->debug("built module: {} bindings, {} component overrides, {} provider overrides",
               descs.size(), staged->component_overrides.size(),
               staged->provider_overrides.size() + staged->async_provider_overrides.size());

    auto result = std::shared_ptr<module>(new module(std::move(state)));

    if (options.eager_components) {
        result->instantiate_components();
    }
    return result;
}

} // namespace libctdi
