#pragma once

#include "binding_kind.hpp"

#include <concepts>
#include <future>
#include <memory>
#include <type_traits>

namespace libctdi {

class module;

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// T declares a nested `parameters` aggregate consulted during construction.
template <typename T>
concept has_parameters = requires { typename T::parameters; };

/// P builds instances of I by hand instead of through its constructor.
template <typename P, typename I>
concept custom_provider = requires(const module& m) {
    { P::provide(m) } -> std::convertible_to<std::unique_ptr<I>>;
};

/// P builds instances of I asynchronously by hand.
template <typename P, typename I>
concept custom_async_provider = requires(const module& m) {
    { P::async_provide(m) } -> std::same_as<std::future<std::unique_ptr<I>>>;
};

// ---------------------------------------------------------------
// Dependency wrapper tag types
// ---------------------------------------------------------------

/// Explicit component marker (optional: bare T means the same).
template <typename T>
struct component { using type = T; };

/// Marks a dependency as provided.  Constructor receives `std::unique_ptr<T>`.
template <typename T>
struct provided { using type = T; };

/// Marks a dependency as provided asynchronously.  Only async providers may
/// declare it; the constructor receives the awaited `std::unique_ptr<T>`.
template <typename T>
struct async_provided { using type = T; };

// ---------------------------------------------------------------
// dep_traits: extract injection metadata from a dep declaration
// ---------------------------------------------------------------

/// Primary: bare `T` → component, inject as `T&`.
template <typename D>
struct dep_traits {
    using interface_type = D;
    using inject_type    = D&;
    static constexpr binding_kind kind = binding_kind::component;
};

template <typename T>
struct dep_traits<component<T>> {
    using interface_type = T;
    using inject_type    = T&;
    static constexpr binding_kind kind = binding_kind::component;
};

template <typename T>
struct dep_traits<provided<T>> {
    using interface_type = T;
    using inject_type    = std::unique_ptr<T>;
    static constexpr binding_kind kind = binding_kind::provider;
};

template <typename T>
struct dep_traits<async_provided<T>> {
    using interface_type = T;
    using inject_type    = std::unique_ptr<T>;
    static constexpr binding_kind kind = binding_kind::async_provider;
};

/// Helper alias.
template <typename D>
using inject_type_t = typename dep_traits<D>::inject_type;

/// True when none of Deps must be awaited.
template <typename... Deps>
inline constexpr bool all_synchronous_v =
    ((dep_traits<Deps>::kind != binding_kind::async_provider) && ...);

// ---------------------------------------------------------------
// Constructibility concept
// ---------------------------------------------------------------

namespace detail {

template <typename TImpl, typename... Deps>
consteval bool constructible_from_deps_impl() {
    if constexpr (has_parameters<TImpl>) {
        return std::is_constructible_v<TImpl, inject_type_t<Deps>...,
                                       const typename TImpl::parameters&>;
    } else {
        return std::is_constructible_v<TImpl, inject_type_t<Deps>...>;
    }
}

} // namespace detail

/// TImpl must be constructible from the injection types of all declared deps,
/// followed by `const TImpl::parameters&` when TImpl declares parameters.
template <typename TImpl, typename... Deps>
concept constructible_from_deps = detail::constructible_from_deps_impl<TImpl, Deps...>();

} // namespace libctdi
