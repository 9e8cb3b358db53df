#include "libctdi/binding_table.hpp"
#include "libctdi/composition.hpp"
#include "libctdi/logging.hpp"
#include "stacktrace_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace libctdi {

void validate_descriptors(const std::vector<descriptor>& descriptors,
                          const std::unordered_map<std::type_index, std::size_t>& index,
                          std::source_location loc);

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct binding_table::Impl {
    std::vector<descriptor> descriptors;
    std::unordered_map<std::type_index, std::size_t> index;
    bool composed = false;
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

binding_table::binding_table()
    : impl_(std::make_unique<Impl>())
{}

binding_table::~binding_table() = default;

binding_table::binding_table(binding_table&&) noexcept = default;
binding_table& binding_table::operator=(binding_table&&) noexcept = default;

// ---------------------------------------------------------------
// Non-template registration core
// ---------------------------------------------------------------

binding_table& binding_table::register_binding(descriptor desc) {
    if (impl_->composed) {
        throw di_error("Cannot add bindings after compose() has been called");
    }
    if (desc.kind == binding_kind::async_provider ? !desc.async_factory : !desc.factory) {
        throw di_error("Binding factory cannot be empty");
    }
    if (impl_->index.contains(desc.interface_type)) {
        auto ex = duplicate_registration(desc.interface_type, desc.registration_location);
        const auto& existing = impl_->descriptors[impl_->index.at(desc.interface_type)];
        auto trace = internal::format_registration_trace(existing);
        if (!trace.empty()) ex.set_diagnostic_detail(std::move(trace));
        throw ex;
    }

    desc.registration_stacktrace = internal::capture_stacktrace();
    impl_->index.emplace(desc.interface_type, impl_->descriptors.size());
    impl_->descriptors.push_back(std::move(desc));
    return *this;
}

const std::vector<descriptor>& binding_table::descriptors() const {
    return impl_->descriptors;
}

// ---------------------------------------------------------------
// compose
// ---------------------------------------------------------------

std::shared_ptr<const composition> binding_table::compose(std::source_location loc) {
    if (impl_->composed) {
        throw di_error("compose() can only be called once", loc);
    }

    auto log = get_logger();
    try {
        validate_descriptors(impl_->descriptors, impl_->index, loc);
    } catch (const di_error& e) {
        log->warn("composition rejected: {}", e.what());
        throw;
    }

    impl_->composed = true;
    log->debug("composed {} bindings", impl_->descriptors.size());

    return std::shared_ptr<const composition>(
        new composition(std::move(impl_->descriptors)));
}

// ---------------------------------------------------------------
// composition
// ---------------------------------------------------------------

composition::composition(std::vector<descriptor> descriptors)
    : descriptors_(std::move(descriptors))
{
    for (std::size_t i = 0; i < descriptors_.size(); ++i) {
        index_.emplace(descriptors_[i].interface_type, i);
    }
}

composition::~composition() = default;

module_builder composition::builder() const {
    return module_builder(shared_from_this());
}

std::optional<std::size_t> composition::index_of(std::type_index interface_type) const noexcept {
    auto it = index_.find(interface_type);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

const descriptor* composition::find(std::type_index interface_type) const noexcept {
    auto it = index_.find(interface_type);
    if (it == index_.end()) return nullptr;
    return &descriptors_[it->second];
}

} // namespace libctdi
