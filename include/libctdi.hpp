#pragma once

#include "libctdi/export.hpp"
#include "libctdi/fwd.hpp"
#include "libctdi/binding_kind.hpp"
#include "libctdi/erased_ptr.hpp"
#include "libctdi/descriptor.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/type_traits.hpp"
#include "libctdi/lazy_cell.hpp"
#include "libctdi/logging.hpp"
#include "libctdi/composition.hpp"
#include "libctdi/module_builder.hpp"
#include "libctdi/module.hpp"
#include "libctdi/binding_table.hpp"
