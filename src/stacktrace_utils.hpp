#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is NOT installed: it is only used by the library's .cpp files.

#include "libctdi/descriptor.hpp"
#include "libctdi/exceptions.hpp"

#include <any>
#include <string>
#include <sstream>

#ifdef LIBCTDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libctdi::internal {

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBCTDI_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Short "IFoo [impl: Foo]" label used in messages.
inline std::string describe_binding(const descriptor& desc) {
    std::string label = demangle(desc.interface_type);
    if (desc.impl_type != desc.interface_type) {
        label += " [impl: " + demangle(desc.impl_type) + "]";
    }
    return label;
}

/// Format one descriptor's registration trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for IFoo [impl: Foo] (called via add_component):\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const descriptor& desc) {
    std::string trace = format_stacktrace(desc.registration_stacktrace);
    if (trace.empty()) return {};

    std::string header = "Registration stacktrace for " + describe_binding(desc);
    if (!desc.api_name.empty()) {
        header += " (called via " + desc.api_name + ")";
    }
    return header + ":\n" + trace;
}

} // namespace libctdi::internal
