#pragma once

#include "export.hpp"
#include "binding_kind.hpp"
#include "descriptor.hpp"
#include "module_builder.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace libctdi {

/// Validated, immutable binding table.  Produced by binding_table::compose()
/// and shared by every module built from it.
class LIBCTDI_EXPORT composition : public std::enable_shared_from_this<composition> {
public:
    ~composition();

    composition(const composition&) = delete;
    composition& operator=(const composition&) = delete;

    /// Start building a module over this composition.
    module_builder builder() const;

    std::size_t size() const noexcept { return descriptors_.size(); }

    const std::vector<descriptor>& descriptors() const noexcept { return descriptors_; }

    /// Index of the binding for `interface_type`, if any.
    std::optional<std::size_t> index_of(std::type_index interface_type) const noexcept;

    /// Binding for `interface_type`, or nullptr.
    const descriptor* find(std::type_index interface_type) const noexcept;

    template <typename I>
    bool contains() const noexcept { return find(typeid(I)) != nullptr; }

    template <typename I>
    std::optional<binding_kind> kind_of() const noexcept {
        const descriptor* desc = find(typeid(I));
        if (!desc) return std::nullopt;
        return desc->kind;
    }

private:
    friend class binding_table;

    explicit composition(std::vector<descriptor> descriptors);

    std::vector<descriptor> descriptors_;
    std::unordered_map<std::type_index, std::size_t> index_;
};

} // namespace libctdi
