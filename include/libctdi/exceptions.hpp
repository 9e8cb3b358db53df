#pragma once

#include "export.hpp"
#include "binding_kind.hpp"

#include <stdexcept>
#include <optional>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace libctdi {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
LIBCTDI_EXPORT std::string demangle(std::type_index type);
} // namespace internal

class LIBCTDI_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When a component fails
    /// to construct, each enclosing resolution layer appends its component
    /// info so that the final what() message shows the full chain, e.g.:
    ///   "... (while resolving IB [impl: B] -> IA [impl: A])"
    void append_resolution_context(const std::string& component_info);

    const std::string& resolution_context() const noexcept { return resolution_context_; }

    /// Override to append resolution context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

class LIBCTDI_EXPORT not_found : public di_error {
public:
    explicit not_found(std::type_index type,
                       std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    not_found(std::type_index type, std::string_view hint,
              std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class LIBCTDI_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(const std::vector<std::type_index>& cycle,
                               std::source_location loc = std::source_location::current());

    const std::vector<std::type_index>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::type_index> cycle_;
    static std::string build_message(const std::vector<std::type_index>& cycle);
};

/// A binding depends on something with a shorter lifetime than itself:
/// a component on a provider, or a synchronous provider on an async one.
class LIBCTDI_EXPORT lifetime_mismatch : public di_error {
public:
    lifetime_mismatch(std::type_index consumer, binding_kind consumer_kind,
                      std::type_index dependency, binding_kind dependency_kind,
                      std::optional<std::type_index> consumer_impl = std::nullopt,
                      std::source_location loc = std::source_location::current());

    std::type_index consumer() const noexcept { return consumer_; }
    std::type_index dependency() const noexcept { return dependency_; }
    binding_kind consumer_kind() const noexcept { return consumer_kind_; }
    binding_kind dependency_kind() const noexcept { return dependency_kind_; }

private:
    std::type_index consumer_;
    std::type_index dependency_;
    binding_kind consumer_kind_;
    binding_kind dependency_kind_;

    static std::string build_message(std::type_index consumer, binding_kind consumer_kind,
                                     std::type_index dependency, binding_kind dependency_kind,
                                     std::optional<std::type_index> consumer_impl);
};

class LIBCTDI_EXPORT duplicate_registration : public di_error {
public:
    explicit duplicate_registration(std::type_index type,
                                    std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

/// A binding declares a `parameters` type that cannot be default-constructed.
class LIBCTDI_EXPORT missing_parameter_default : public di_error {
public:
    missing_parameter_default(std::type_index impl_type,
                              std::type_index parameters_type,
                              std::source_location loc = std::source_location::current());

    std::type_index impl_type() const noexcept { return impl_type_; }

private:
    std::type_index impl_type_;
};

/// An instance cell was accessed again while its own initializer was running.
class LIBCTDI_EXPORT reentrant_initialization : public di_error {
public:
    explicit reentrant_initialization(std::source_location loc = std::source_location::current());
};

class LIBCTDI_EXPORT resolution_error : public di_error {
public:
    resolution_error(std::type_index type, const std::exception& inner,
                     std::source_location registration_loc);

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

/// Opaque failure raised by provider bodies.  Nest the underlying cause with
/// `std::throw_with_nested(provision_error(...))`; the core never inspects it.
class LIBCTDI_EXPORT provision_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Render an exception and every nested cause, outermost first, as
/// "outer: inner: innermost".
LIBCTDI_EXPORT std::string describe_error_chain(const std::exception& e);

} // namespace libctdi
