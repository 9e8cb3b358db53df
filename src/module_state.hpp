#pragma once

// Internal definition of module::impl, shared by module.cpp and
// module_builder.cpp.  Not installed.

#include "libctdi/composition.hpp"
#include "libctdi/descriptor.hpp"
#include "libctdi/erased_ptr.hpp"
#include "libctdi/lazy_cell.hpp"
#include "libctdi/module.hpp"

#include <any>
#include <cstddef>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace libctdi {

using instance_cell = lazy_cell<erased_ptr>;

struct module::impl {
    std::shared_ptr<const composition> bindings;

    // One cell per descriptor index; only component cells are ever used.
    std::unique_ptr<instance_cell[]> cells;

    // Indices of filled component cells, dependencies before dependents.
    // ~module() releases them back to front.
    std::mutex order_mutex;
    std::vector<std::size_t> construction_order;

    void record_constructed(std::size_t idx) {
        std::lock_guard lock(order_mutex);
        construction_order.push_back(idx);
    }

    // Effective factories per descriptor index, overrides already applied.
    std::vector<factory_fn>       factories;
    std::vector<async_factory_fn> async_factories;

    // Parameter overlays keyed by implementation type.
    std::unordered_map<std::type_index, std::any> parameters;
};

} // namespace libctdi
