#pragma once

/// @file fwd.hpp
/// Forward declarations for all public libctdi symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <cstddef>

namespace libctdi {

// binding_kind.hpp
enum class binding_kind;

// erased_ptr.hpp
struct erased_ptr;

// descriptor.hpp
struct dependency_info;
struct parameters_info;
struct descriptor;

// exceptions.hpp
class di_error;
class not_found;
class cyclic_dependency;
class lifetime_mismatch;
class duplicate_registration;
class missing_parameter_default;
class reentrant_initialization;
class resolution_error;
class provision_error;

// lazy_cell.hpp
struct thread_safe;
struct single_thread;

// composition.hpp
class composition;

// module_builder.hpp
struct build_options;
class module_builder;

// module.hpp
class module;

// binding_table.hpp
template <typename... Deps>
struct deps_tag;
class binding_table;

} // namespace libctdi
