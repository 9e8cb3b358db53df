#include "libctdi/module.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/logging.hpp"
#include "module_state.hpp"
#include "stacktrace_utils.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <string>
#include <typeindex>
#include <utility>

namespace libctdi {

namespace {

// Provider results are handed out as owning pointers that are never null.
erased_ptr require_instance(erased_ptr instance, std::type_index type, binding_kind kind) {
    if (!instance) {
        throw di_error(std::string(to_string(kind)) + " for " + internal::demangle(type)
                       + " returned a null instance");
    }
    return instance;
}

} // namespace

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

module::module(std::unique_ptr<impl> p_impl)
    : impl_(std::move(p_impl))
{}

module::~module() {
    // Dependents go first so their destructors still see live dependencies.
    auto& order = impl_->construction_order;
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        impl_->cells[*it].reset();
    }
}

module_builder module::builder(std::shared_ptr<const composition> bindings) {
    return module_builder(std::move(bindings));
}

const composition& module::bindings() const noexcept {
    return *impl_->bindings;
}

// ---------------------------------------------------------------
// Internal: resolve a component descriptor by index
// ---------------------------------------------------------------

void* module::resolve_component_by_index(std::size_t idx) const {
    const auto& desc = impl_->bindings->descriptors()[idx];
    auto& cell = impl_->cells[idx];

    if (auto* ready = cell.get()) {
        return ready->get();
    }

    try {
        erased_ptr& instance = cell.get_or_init([&] {
            get_logger()->trace("constructing component {}",
                                internal::describe_binding(desc));
            erased_ptr produced = impl_->factories[idx](*this);
            impl_->record_constructed(idx);
            return produced;
        });
        return instance.get();
    } catch (di_error& e) {
        // Annotate with resolution context so nested failures show the
        // full chain: "... (while resolving IA [impl: A] -> IB [impl: B])".
        e.append_resolution_context(internal::describe_binding(desc));
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(desc);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        auto ex = resolution_error(desc.interface_type, e, desc.registration_location);
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }
}

void module::instantiate_components() {
    const auto& descs = impl_->bindings->descriptors();
    for (std::size_t i = 0; i < descs.size(); ++i) {
        if (descs[i].kind == binding_kind::component) {
            resolve_component_by_index(i);
        }
    }
}

// ---------------------------------------------------------------
// Non-template cores
// ---------------------------------------------------------------

void* module::resolve_component_impl(std::type_index type) const {
    auto idx = impl_->bindings->index_of(type);
    if (!idx || impl_->bindings->descriptors()[*idx].kind != binding_kind::component) {
        throw not_found(type, kind_hint(type, "resolve<I>()"));
    }
    return resolve_component_by_index(*idx);
}

void* module::try_resolve_component_impl(std::type_index type) const {
    auto idx = impl_->bindings->index_of(type);
    if (!idx || impl_->bindings->descriptors()[*idx].kind != binding_kind::component) {
        return nullptr;
    }
    return resolve_component_by_index(*idx);
}

erased_ptr module::provide_impl(std::type_index type) const {
    auto idx = impl_->bindings->index_of(type);
    if (!idx || impl_->bindings->descriptors()[*idx].kind != binding_kind::provider) {
        throw not_found(type, kind_hint(type, "provide<I>()"));
    }
    // Provider failures are the caller's to handle: no wrapping, no retry.
    return require_instance(impl_->factories[*idx](*this), type, binding_kind::provider);
}

std::future<erased_ptr> module::async_provide_impl(std::type_index type) const {
    auto idx = impl_->bindings->index_of(type);
    if (!idx || impl_->bindings->descriptors()[*idx].kind != binding_kind::async_provider) {
        throw not_found(type, kind_hint(type, "async_provide<I>()"));
    }
    return std::async(std::launch::deferred,
        [type, pending = impl_->async_factories[*idx](*this)]() mutable {
            return require_instance(pending.get(), type, binding_kind::async_provider);
        });
}

const std::any* module::find_parameters(std::type_index impl_type) const noexcept {
    auto it = impl_->parameters.find(impl_type);
    if (it == impl_->parameters.end()) return nullptr;
    return &it->second;
}

// ---------------------------------------------------------------
// Diagnostic: kind hint for better not_found messages
// ---------------------------------------------------------------

std::string module::kind_hint(std::type_index type, const char* attempted_method) const {
    const descriptor* desc = impl_->bindings->find(type);
    if (!desc) return {};

    const char* suggestion = "resolve<I>()";
    switch (desc->kind) {
        case binding_kind::component:      suggestion = "resolve<I>()"; break;
        case binding_kind::provider:       suggestion = "provide<I>()"; break;
        case binding_kind::async_provider: suggestion = "async_provide<I>()"; break;
    }
    return "type is bound as " + std::string(to_string(desc->kind))
           + " (use " + suggestion + ") but was requested via " + attempted_method;
}

} // namespace libctdi
