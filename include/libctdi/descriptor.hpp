#pragma once

#include "export.hpp"
#include "binding_kind.hpp"
#include "erased_ptr.hpp"

#include <any>
#include <functional>
#include <future>
#include <optional>
#include <source_location>
#include <string>
#include <typeindex>
#include <vector>

namespace libctdi {

class module;

using factory_fn       = std::function<erased_ptr(const module&)>;
using async_factory_fn = std::function<std::future<erased_ptr>(const module&)>;

// ---------------------------------------------------------------
// dependency_info: metadata for a single declared dependency
// ---------------------------------------------------------------

struct dependency_info {
    std::type_index type;
    binding_kind    kind = binding_kind::component;

    bool operator==(const dependency_info&) const = default;
};

// ---------------------------------------------------------------
// parameters_info: metadata for a binding's `parameters` aggregate
// ---------------------------------------------------------------

struct parameters_info {
    std::type_index type;
    bool has_default = true;
};

// ---------------------------------------------------------------
// descriptor: one binding record
// ---------------------------------------------------------------

struct descriptor {
    std::type_index interface_type = std::type_index(typeid(void));
    std::type_index impl_type      = std::type_index(typeid(void));
    binding_kind    kind           = binding_kind::component;

    /// Set for components and providers.
    factory_fn       factory;
    /// Set for async providers.
    async_factory_fn async_factory;

    std::vector<dependency_info>   dependencies;
    std::optional<parameters_info> parameters;

    // Diagnostics
    std::source_location registration_location;
    std::any             registration_stacktrace;
    std::string          api_name;
};

namespace internal {

/// Capture the current call stack when stacktrace support is enabled;
/// returns an empty std::any otherwise.
LIBCTDI_EXPORT std::any capture_stacktrace();

} // namespace internal

} // namespace libctdi
