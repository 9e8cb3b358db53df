#pragma once

#include "export.hpp"
#include "composition.hpp"
#include "descriptor.hpp"
#include "erased_ptr.hpp"
#include "exceptions.hpp"
#include "module_builder.hpp"

#include <any>
#include <future>
#include <memory>
#include <string>
#include <typeindex>

namespace libctdi {

/// Built dependency graph.  Owns one lazily-initialized instance per bound
/// component and the (possibly overridden) factory of every provider.
///
/// All resolution entry points are const: after build() the only state that
/// ever changes is the one-shot component cells.
class LIBCTDI_EXPORT module {
public:
    ~module();

    module(const module&) = delete;
    module& operator=(const module&) = delete;

    /// Start building a module over a validated composition.
    static module_builder builder(std::shared_ptr<const composition> bindings);

    // ---------------------------------------------------------------
    // Components
    // ---------------------------------------------------------------

    /// The shared instance bound to I, constructed on first access.
    /// Throws not_found if I is not bound as a component.
    template <typename I>
    I& resolve() const {
        return *static_cast<I*>(resolve_component_impl(typeid(I)));
    }

    /// Like resolve(), but returns nullptr when I is not bound as a component.
    template <typename I>
    I* try_resolve() const {
        return static_cast<I*>(try_resolve_component_impl(typeid(I)));
    }

    // ---------------------------------------------------------------
    // Providers
    // ---------------------------------------------------------------

    /// A fresh instance from the provider bound to I.  Exceptions thrown by
    /// the provider propagate unchanged.
    template <typename I>
    std::unique_ptr<I> provide() const {
        return unwrap_erased<I>(provide_impl(typeid(I)));
    }

    /// A deferred computation producing a fresh instance from the async
    /// provider bound to I.  Nothing runs until the future is waited on.
    template <typename I>
    std::future<std::unique_ptr<I>> async_provide() const {
        return std::async(std::launch::deferred,
            [pending = async_provide_impl(typeid(I))]() mutable {
                return unwrap_erased<I>(pending.get());
            });
    }

    // ---------------------------------------------------------------
    // Introspection
    // ---------------------------------------------------------------

    /// Parameter overlay staged for TImpl, or nullptr.  Used by generated
    /// factories before they fall back to the declared defaults.
    template <typename TImpl>
    const typename TImpl::parameters* parameters_for() const {
        const std::any* overlay = find_parameters(typeid(TImpl));
        if (!overlay) return nullptr;
        return std::any_cast<typename TImpl::parameters>(overlay);
    }

    const composition& bindings() const noexcept;

private:
    friend class module_builder;

    struct impl;

    explicit module(std::unique_ptr<impl> p_impl);

    void* resolve_component_impl(std::type_index type) const;
    void* try_resolve_component_impl(std::type_index type) const;
    void* resolve_component_by_index(std::size_t idx) const;
    erased_ptr provide_impl(std::type_index type) const;
    std::future<erased_ptr> async_provide_impl(std::type_index type) const;
    const std::any* find_parameters(std::type_index impl_type) const noexcept;

    /// Build a diagnostic hint when a type is bound with a different kind.
    std::string kind_hint(std::type_index type, const char* attempted_method) const;

    void instantiate_components();

    std::unique_ptr<impl> impl_;
};

} // namespace libctdi
