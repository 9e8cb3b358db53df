#pragma once

#include "export.hpp"
#include "binding_kind.hpp"
#include "descriptor.hpp"
#include "erased_ptr.hpp"
#include "exceptions.hpp"
#include "type_traits.hpp"

#include <any>
#include <functional>
#include <future>
#include <memory>
#include <typeindex>
#include <type_traits>
#include <utility>

namespace libctdi {

class composition;
class module;

/// Signature of a provider override: builds a fresh instance of I.
template <typename I>
using provider_fn = std::function<std::unique_ptr<I>(const module&)>;

/// Signature of an async provider override.
template <typename I>
using async_provider_fn = std::function<std::future<std::unique_ptr<I>>(const module&)>;

struct build_options {
    /// Construct every component during build() instead of on first resolve.
    bool eager_components = false;
};

// ---------------------------------------------------------------
// module_builder
// ---------------------------------------------------------------

/// Staging area for per-module overrides.  Every with_* call checks its
/// target against the composition and throws not_found when the target is
/// not bound with the expected kind.  Repeated calls for the same target
/// replace the earlier value.
///
/// build() is only callable on an rvalue, so a builder cannot be touched
/// once it has produced its module:
///
///     auto m = module::builder(comp)
///                  .with_component_parameters<today_writer>({.year = 2020})
///                  .build();
class LIBCTDI_EXPORT module_builder {
public:
    explicit module_builder(std::shared_ptr<const composition> bindings);
    ~module_builder();

    module_builder(const module_builder&) = delete;
    module_builder& operator=(const module_builder&) = delete;
    module_builder(module_builder&&) noexcept;
    module_builder& operator=(module_builder&&) noexcept;

    // ---------------------------------------------------------------
    // Parameter overlays
    // ---------------------------------------------------------------

    /// Replace the declared defaults of component C.  Ignored when the
    /// interface C is bound to also receives an instance override.
    template <typename C>
        requires has_parameters<C>
    module_builder& with_component_parameters(typename C::parameters params) & {
        return stage_parameters(typeid(C), binding_kind::component,
                                std::any(std::move(params)));
    }

    template <typename C>
        requires has_parameters<C>
    module_builder&& with_component_parameters(typename C::parameters params) && {
        return std::move(with_component_parameters<C>(std::move(params)));
    }

    /// Replace the declared defaults of provider P.
    template <typename P>
        requires has_parameters<P>
    module_builder& with_provider_parameters(typename P::parameters params) & {
        return stage_parameters(typeid(P), binding_kind::provider,
                                std::any(std::move(params)));
    }

    template <typename P>
        requires has_parameters<P>
    module_builder&& with_provider_parameters(typename P::parameters params) && {
        return std::move(with_provider_parameters<P>(std::move(params)));
    }

    // ---------------------------------------------------------------
    // Instance / factory overrides
    // ---------------------------------------------------------------

    /// Pre-seed the cell of component interface I.  resolve<I>() returns
    /// exactly this instance and the bound constructor never runs.
    template <typename I>
    module_builder& with_component_override(std::unique_ptr<I> instance) & {
        if (!instance) {
            throw di_error("component override for " + internal::demangle(typeid(I))
                           + " must not be null");
        }
        return stage_component_override(typeid(I), adopt_erased<I>(std::move(instance)));
    }

    template <typename I>
    module_builder&& with_component_override(std::unique_ptr<I> instance) && {
        return std::move(with_component_override<I>(std::move(instance)));
    }

    /// Replace the factory of provider interface I.
    template <typename I>
    module_builder& with_provider_override(provider_fn<I> factory) & {
        if (!factory) {
            throw di_error("provider override for " + internal::demangle(typeid(I))
                           + " must not be empty");
        }
        return stage_provider_override(typeid(I),
            [factory = std::move(factory)](const module& m) -> erased_ptr {
                return adopt_erased<I>(factory(m));
            });
    }

    template <typename I>
    module_builder&& with_provider_override(provider_fn<I> factory) && {
        return std::move(with_provider_override<I>(std::move(factory)));
    }

    /// Replace the factory of async provider interface I.
    template <typename I>
    module_builder& with_async_provider_override(async_provider_fn<I> factory) & {
        if (!factory) {
            throw di_error("async provider override for " + internal::demangle(typeid(I))
                           + " must not be empty");
        }
        return stage_async_provider_override(typeid(I),
            [factory = std::move(factory)](const module& m) -> std::future<erased_ptr> {
                return std::async(std::launch::deferred, [factory, &m] {
                    return adopt_erased<I>(factory(m).get());
                });
            });
    }

    template <typename I>
    module_builder&& with_async_provider_override(async_provider_fn<I> factory) && {
        return std::move(with_async_provider_override<I>(std::move(factory)));
    }

    // ---------------------------------------------------------------
    // Build
    // ---------------------------------------------------------------

    /// Freeze the staged overrides into a module.  Consumes the builder.
    std::shared_ptr<module> build(build_options options = {}) &&;

private:
    module_builder& stage_parameters(std::type_index impl_type, binding_kind expected,
                                     std::any params);
    module_builder& stage_component_override(std::type_index interface_type,
                                             erased_ptr instance);
    module_builder& stage_provider_override(std::type_index interface_type,
                                            factory_fn factory);
    module_builder& stage_async_provider_override(std::type_index interface_type,
                                                  async_factory_fn factory);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace libctdi
