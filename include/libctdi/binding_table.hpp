#pragma once

#include "export.hpp"
#include "composition.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "module.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <source_location>
#include <tuple>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace libctdi {

/// A zero-size tag type that carries a compile-time dependency type list.
template <typename... Deps>
struct deps_tag {
    using type_list = std::tuple<Deps...>;
    static constexpr std::size_t count = sizeof...(Deps);
};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

// ---------------------------------------------------------------
// Helpers: resolve dependencies at factory-call time
// ---------------------------------------------------------------
namespace detail {

template <typename D>
auto resolve_dep(const module& m) -> inject_type_t<D> {
    using traits = dep_traits<D>;
    using I = typename traits::interface_type;

    if constexpr (traits::kind == binding_kind::component) {
        return m.resolve<I>();
    } else if constexpr (traits::kind == binding_kind::provider) {
        return m.provide<I>();
    } else {
        // Only reached from inside a deferred async body.
        return m.async_provide<I>().get();
    }
}

template <typename TImpl>
typename TImpl::parameters parameters_or_default(const module& m) {
    using params_t = typename TImpl::parameters;
    if (const params_t* overlay = m.parameters_for<TImpl>()) {
        return *overlay;
    }
    if constexpr (std::is_default_constructible_v<params_t>) {
        return params_t{};
    } else {
        throw missing_parameter_default(typeid(TImpl), typeid(params_t));
    }
}

/// Resolve every dependency in declaration order, then construct TImpl.
template <typename TInterface, typename TImpl, typename... Deps>
erased_ptr construct(const module& m) {
    // Braced initialization sequences the resolutions left to right.
    std::tuple<inject_type_t<Deps>...> args{resolve_dep<Deps>(m)...};
    return std::apply([&m](auto&&... resolved) {
        if constexpr (has_parameters<TImpl>) {
            return make_erased_as<TInterface, TImpl>(
                std::forward<decltype(resolved)>(resolved)...,
                parameters_or_default<TImpl>(m));
        } else {
            (void)m;
            return make_erased_as<TInterface, TImpl>(
                std::forward<decltype(resolved)>(resolved)...);
        }
    }, std::move(args));
}

/// Deferred variant: nothing runs until the caller waits on the future,
/// and each awaited dependency completes before the next one starts.
template <typename TInterface, typename TImpl, typename... Deps>
std::future<erased_ptr> construct_async(const module& m) {
    return std::async(std::launch::deferred, [&m] {
        return construct<TInterface, TImpl, Deps...>(m);
    });
}

template <typename TInterface, typename TProvider>
erased_ptr provide_custom(const module& m) {
    std::unique_ptr<TInterface> instance = TProvider::provide(m);
    return adopt_erased<TInterface>(std::move(instance));
}

/// The user body is only entered once the returned future is waited on.
template <typename TInterface, typename TProvider>
std::future<erased_ptr> provide_custom_async(const module& m) {
    return std::async(std::launch::deferred, [&m] {
        return adopt_erased<TInterface>(TProvider::async_provide(m).get());
    });
}

/// Build a vector<dependency_info> from deps type list.
template <typename... Deps>
std::vector<dependency_info> make_dep_infos() {
    return { dependency_info{
        std::type_index(typeid(typename dep_traits<Deps>::interface_type)),
        dep_traits<Deps>::kind
    }... };
}

template <typename TImpl>
std::optional<parameters_info> make_parameters_info() {
    if constexpr (has_parameters<TImpl>) {
        using params_t = typename TImpl::parameters;
        static_assert(std::is_copy_constructible_v<params_t>,
            "T::parameters must be copy constructible");
        return parameters_info{typeid(params_t),
                               std::is_default_constructible_v<params_t>};
    } else {
        return std::nullopt;
    }
}

template <typename TInterface, typename TImpl, typename... Deps>
descriptor make_descriptor(binding_kind kind, const char* api_name,
                           std::source_location loc) {
    descriptor desc;
    desc.interface_type        = typeid(TInterface);
    desc.impl_type             = typeid(TImpl);
    desc.kind                  = kind;
    desc.dependencies          = make_dep_infos<Deps...>();
    desc.parameters            = make_parameters_info<TImpl>();
    desc.registration_location = loc;
    desc.api_name              = api_name;
    return desc;
}

} // namespace detail

// ---------------------------------------------------------------
// binding_table
// ---------------------------------------------------------------

/// Mutable collection of interface bindings.  Each interface may be bound
/// exactly once, to a component, a provider or an async provider.
/// compose() validates the whole table and freezes it into a composition.
class LIBCTDI_EXPORT binding_table {
public:
    binding_table();
    ~binding_table();

    binding_table(const binding_table&) = delete;
    binding_table& operator=(const binding_table&) = delete;
    binding_table(binding_table&&) noexcept;
    binding_table& operator=(binding_table&&) noexcept;

    // ===============================================================
    // Components
    // ===============================================================

    /// Zero-dep component
    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl>
    binding_table& add_component(std::source_location loc = std::source_location::current()) {
        return add_component<TInterface, TImpl>(deps<>, loc);
    }

    /// Component with deps
    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    binding_table& add_component(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        static_assert(std::is_same_v<TInterface, TImpl>
                   || std::has_virtual_destructor_v<TInterface>,
            "add_component<I,C>: I must have a virtual destructor when I != C");
        static_assert(all_synchronous_v<Deps...>,
            "add_component<I,C>: async_provided<T> is only allowed in async providers");
        auto desc = detail::make_descriptor<TInterface, TImpl, Deps...>(
            binding_kind::component, "add_component", loc);
        desc.factory = [](const module& m) {
            return detail::construct<TInterface, TImpl, Deps...>(m);
        };
        return register_binding(std::move(desc));
    }

    // ===============================================================
    // Providers
    // ===============================================================

    /// Zero-dep provider
    template <typename TInterface, typename TProvider>
        requires custom_provider<TProvider, TInterface>
              || (derived_from_base<TProvider, TInterface>
                  && constructible_from_deps<TProvider>)
    binding_table& add_provider(std::source_location loc = std::source_location::current()) {
        return add_provider<TInterface, TProvider>(deps<>, loc);
    }

    /// Provider with deps.  When TProvider exposes a static
    /// `provide(const module&)`, that function is the factory and Deps only
    /// declares what it resolves; otherwise TProvider is constructed from Deps.
    template <typename TInterface, typename TProvider, typename... Deps>
        requires custom_provider<TProvider, TInterface>
              || (derived_from_base<TProvider, TInterface>
                  && constructible_from_deps<TProvider, Deps...>)
    binding_table& add_provider(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        static_assert(all_synchronous_v<Deps...>,
            "add_provider<I,P>: async_provided<T> is only allowed in async providers");
        auto desc = detail::make_descriptor<TInterface, TProvider, Deps...>(
            binding_kind::provider, "add_provider", loc);
        if constexpr (custom_provider<TProvider, TInterface>) {
            desc.factory = [](const module& m) {
                return detail::provide_custom<TInterface, TProvider>(m);
            };
        } else {
            static_assert(std::is_same_v<TInterface, TProvider>
                       || std::has_virtual_destructor_v<TInterface>,
                "add_provider<I,P>: I must have a virtual destructor when I != P");
            desc.factory = [](const module& m) {
                return detail::construct<TInterface, TProvider, Deps...>(m);
            };
        }
        return register_binding(std::move(desc));
    }

    // ===============================================================
    // Async providers
    // ===============================================================

    template <typename TInterface, typename TProvider>
        requires custom_async_provider<TProvider, TInterface>
              || (derived_from_base<TProvider, TInterface>
                  && constructible_from_deps<TProvider>)
    binding_table& add_async_provider(std::source_location loc = std::source_location::current()) {
        return add_async_provider<TInterface, TProvider>(deps<>, loc);
    }

    /// Async provider with deps.  Generated bodies await the dependencies
    /// strictly in declaration order.
    template <typename TInterface, typename TProvider, typename... Deps>
        requires custom_async_provider<TProvider, TInterface>
              || (derived_from_base<TProvider, TInterface>
                  && constructible_from_deps<TProvider, Deps...>)
    binding_table& add_async_provider(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        auto desc = detail::make_descriptor<TInterface, TProvider, Deps...>(
            binding_kind::async_provider, "add_async_provider", loc);
        if constexpr (custom_async_provider<TProvider, TInterface>) {
            desc.async_factory = [](const module& m) {
                return detail::provide_custom_async<TInterface, TProvider>(m);
            };
        } else {
            static_assert(std::is_same_v<TInterface, TProvider>
                       || std::has_virtual_destructor_v<TInterface>,
                "add_async_provider<I,P>: I must have a virtual destructor when I != P");
            desc.async_factory = [](const module& m) {
                return detail::construct_async<TInterface, TProvider, Deps...>(m);
            };
        }
        return register_binding(std::move(desc));
    }

    // ===============================================================
    // Compose
    // ===============================================================

    /// Validate the table and freeze it.  Throws a di_error subclass on the
    /// first violation; may only be called once.
    std::shared_ptr<const composition> compose(
        std::source_location loc = std::source_location::current());

    const std::vector<descriptor>& descriptors() const;

private:
    binding_table& register_binding(descriptor desc);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace libctdi
