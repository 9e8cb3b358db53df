#include "libctdi/descriptor.hpp"
#include "libctdi/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <source_location>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace libctdi {

using binding_index = std::unordered_map<std::type_index, std::size_t>;

namespace {

template <typename Error>
[[noreturn]] void throw_with_trace(Error ex, const descriptor& desc) {
    auto trace = internal::format_registration_trace(desc);
    if (!trace.empty()) ex.set_diagnostic_detail(std::move(trace));
    throw ex;
}

std::string consumer_hint(const descriptor& desc) {
    std::string hint = "required by " + internal::describe_binding(desc)
        + " (" + std::string(to_string(desc.kind)) + ")";
    if (desc.registration_location.file_name()[0]) {
        hint += " registered at "
            + std::string(desc.registration_location.file_name())
            + ":" + std::to_string(desc.registration_location.line());
    }
    return hint;
}

// ------------------------------------------------------------------
// Every dependency must be bound, with a kind the consumer may hold
// ------------------------------------------------------------------
void check_dependencies(const std::vector<descriptor>& descriptors,
                        const binding_index& index,
                        std::source_location loc) {
    for (const auto& desc : descriptors) {
        for (const auto& dep : desc.dependencies) {
            auto it = index.find(dep.type);
            if (it == index.end()) {
                throw_with_trace(not_found(dep.type, consumer_hint(desc), loc), desc);
            }
            const auto& target = descriptors[it->second];

            // A component lives as long as the module; holding a provided
            // value would pin a short-lived instance forever.
            bool captive = desc.kind == binding_kind::component
                        && target.kind != binding_kind::component;
            // A synchronous body cannot await.
            bool blocking = desc.kind == binding_kind::provider
                         && target.kind == binding_kind::async_provider;
            if (captive || blocking) {
                throw_with_trace(lifetime_mismatch(desc.interface_type, desc.kind,
                                                   dep.type, target.kind,
                                                   desc.impl_type, loc), desc);
            }

            if (dep.kind != target.kind) {
                std::string hint = "bound as " + std::string(to_string(target.kind))
                    + " but declared as " + std::string(to_string(dep.kind))
                    + " dependency; " + consumer_hint(desc);
                throw_with_trace(not_found(dep.type, hint, loc), desc);
            }
        }
    }
}

// ------------------------------------------------------------------
// Every declared parameters aggregate needs a default
// ------------------------------------------------------------------
void check_parameter_defaults(const std::vector<descriptor>& descriptors,
                              std::source_location loc) {
    for (const auto& desc : descriptors) {
        if (desc.parameters.has_value() && !desc.parameters->has_default) {
            throw_with_trace(missing_parameter_default(desc.impl_type,
                                                       desc.parameters->type, loc),
                             desc);
        }
    }
}

// ------------------------------------------------------------------
// Cycle detection (DFS over the binding graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

void dfs(std::size_t node,
         const std::vector<descriptor>& descriptors,
         const binding_index& index,
         std::vector<visit_state>& states,
         std::vector<std::size_t>& path,
         std::source_location loc) {
    auto& state = states[node];
    if (state == visit_state::done) return;
    if (state == visit_state::in_progress) {
        // Build cycle path from where the node first appears
        auto it = std::find(path.begin(), path.end(), node);
        std::vector<std::type_index> cycle;
        std::string detail;
        for (; it != path.end(); ++it) {
            const auto& member = descriptors[*it];
            cycle.push_back(member.interface_type);
            std::string trace = internal::format_registration_trace(member);
            if (!trace.empty()) {
                if (!detail.empty()) detail += "\n";
                detail += trace;
            }
        }
        cycle.push_back(descriptors[node].interface_type);
        auto ex = cyclic_dependency(cycle, loc);
        if (!detail.empty()) ex.set_diagnostic_detail(detail);
        throw ex;
    }

    state = visit_state::in_progress;
    path.push_back(node);

    for (const auto& dep : descriptors[node].dependencies) {
        auto it = index.find(dep.type);
        if (it != index.end()) {
            dfs(it->second, descriptors, index, states, path, loc);
        }
    }

    path.pop_back();
    state = visit_state::done;
}

void check_cycles(const std::vector<descriptor>& descriptors,
                  const binding_index& index,
                  std::source_location loc) {
    std::vector<visit_state> states(descriptors.size(), visit_state::unvisited);
    std::vector<std::size_t> path;

    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        if (states[i] == visit_state::unvisited) {
            dfs(i, descriptors, index, states, path, loc);
        }
    }
}

} // anonymous namespace

// ------------------------------------------------------------------
// Entry point called by binding_table::compose
// ------------------------------------------------------------------
void validate_descriptors(const std::vector<descriptor>& descriptors,
                          const binding_index& index,
                          std::source_location loc) {
    check_dependencies(descriptors, index, loc);
    check_parameter_defaults(descriptors, loc);
    check_cycles(descriptors, index, loc);
}

} // namespace libctdi
