#include "libctdi/descriptor.hpp"

#include <any>

#ifdef LIBCTDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libctdi::internal {

std::any capture_stacktrace() {
#ifdef LIBCTDI_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace libctdi::internal
