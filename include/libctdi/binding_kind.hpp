#pragma once

#include <string_view>

namespace libctdi {

/// How an interface is bound inside a composition.
///   component     : one shared instance per module, built lazily
///   provider      : a fresh instance per provide() call
///   async_provider: a fresh instance per async_provide() call
enum class binding_kind {
    component,
    provider,
    async_provider
};

constexpr std::string_view to_string(binding_kind kind) noexcept {
    constexpr std::string_view names[] = {"component", "provider", "async provider"};
    return names[static_cast<int>(kind)];
}

} // namespace libctdi
