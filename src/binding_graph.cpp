#include "libctdi/binding_graph.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/log.hpp"
#include "libctdi/registry.hpp"

#include <deque>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace libctdi {

// ---------------------------------------------------------------
// resolved_bindings
// ---------------------------------------------------------------

std::vector<binding_ptr> resolved_bindings::contribution_bindings() const {
    std::vector<binding_ptr> out;
    for (const auto& b : bindings) {
        if (is_contribution(*b)) out.push_back(b);
    }
    return out;
}

std::vector<binding_ptr> resolved_bindings::members_injection_bindings() const {
    std::vector<binding_ptr> out;
    for (const auto& b : bindings) {
        if (!is_contribution(*b)) out.push_back(b);
    }
    return out;
}

// ---------------------------------------------------------------
// binding_graph
// ---------------------------------------------------------------

binding_graph::binding_graph(component_descriptor component, std::vector<std::string> modules,
                             std::vector<resolved_bindings> resolved)
    : component_(std::move(component))
    , modules_(std::move(modules))
    , resolved_(std::move(resolved))
{
    for (std::size_t i = 0; i < resolved_.size(); ++i) {
        index_.emplace(resolved_[i].binding_key, i);
    }
}

const resolved_bindings* binding_graph::find(const binding_key& bk) const {
    auto it = index_.find(bk);
    return it == index_.end() ? nullptr : &resolved_[it->second];
}

std::size_t binding_graph::index_of(const binding_key& bk) const {
    auto it = index_.find(bk);
    if (it == index_.end()) {
        throw invariant_violation("Binding key " + to_string(bk) + " is not part of the graph of "
                                  + component_.type);
    }
    return it->second;
}

// ---------------------------------------------------------------
// binding_graph_factory
// ---------------------------------------------------------------

namespace {

// Depth-first closure over module includes.  A module is listed before the
// modules it includes and only the first occurrence counts.
void collect_modules(const binding_lookup& lookup, const std::string& owner,
                     const std::vector<std::string>& names,
                     std::set<std::string>& seen, std::vector<std::string>& out) {
    for (const auto& name : names) {
        if (seen.contains(name)) continue;
        const auto* module = lookup.find_module(name);
        if (!module) {
            throw not_found("module", name, "installed by " + owner);
        }
        seen.insert(name);
        out.push_back(name);
        collect_modules(lookup, name, module->includes, seen, out);
    }
}

binding_ptr make_component_binding(const component_descriptor& component) {
    provision_binding b;
    b.key = key{component.type};
    b.kind = binding_kind::component;
    b.element = component.element();
    return make_binding(std::move(b));
}

binding_ptr make_component_provision_binding(const dependency_request& method) {
    provision_binding b;
    b.key = method.key;
    b.kind = binding_kind::component_provision;
    b.element = method.element;
    return make_binding(std::move(b));
}

class graph_builder {
public:
    graph_builder(binding_lookup& lookup, const component_descriptor& component)
        : lookup_(lookup), component_(component)
    {
        std::set<std::string> seen;
        collect_modules(lookup_, component_.type, component_.modules, seen, modules_);

        for (const auto& name : component_.dependencies) {
            const auto* dependency = lookup_.find_component(name);
            if (!dependency) {
                throw not_found("dependency component", name,
                                "declared by " + component_.type);
            }
            dependencies_.push_back(dependency);
        }
    }

    void build() {
        for (const auto& entry : component_.entry_points) {
            enqueue(binding_key_for(entry));
        }
        while (!pending_.empty()) {
            auto bk = std::move(pending_.front());
            pending_.pop_front();
            auto resolved = resolve(bk);
            for (const auto& b : resolved.bindings) {
                for (const auto& dep : implicit_dependencies_of(*b)) {
                    enqueue(binding_key_for(dep));
                }
            }
            resolved_.push_back(std::move(resolved));
        }
        LIBCTDI_LOG_DEBUG("graph", component_.type << ": resolved " << resolved_.size()
                          << " key(s) from " << component_.entry_points.size()
                          << " entry point(s) over " << modules_.size() << " module(s)");
    }

    std::vector<std::string> take_modules() { return std::move(modules_); }
    std::vector<resolved_bindings> take_resolved() { return std::move(resolved_); }

private:
    void enqueue(binding_key bk) {
        if (discovered_.insert(bk).second) {
            pending_.push_back(std::move(bk));
        }
    }

    resolved_bindings resolve(const binding_key& bk) {
        resolved_bindings result{bk, component_.type, {}};

        if (bk.kind == binding_key_kind::members_injection) {
            result.bindings.push_back(lookup_.synthesize_members_injection(bk.key.type));
            return result;
        }

        result.bindings = lookup_.declared_bindings(bk.key, modules_);

        if (bk.key == key{component_.type}) {
            result.bindings.push_back(make_component_binding(component_));
        }

        // Dependencies contribute their own instance and every value their
        // provision methods expose.
        const component_descriptor* provider = nullptr;
        bool single_provider = result.bindings.empty();
        for (const auto* dependency : dependencies_) {
            if (bk.key == key{dependency->type}) {
                result.bindings.push_back(make_component_binding(*dependency));
                single_provider = false;
            }
            for (const auto& method : dependency->entry_points) {
                if (method.kind == request_kind::members_injector || method.key != bk.key) {
                    continue;
                }
                result.bindings.push_back(make_component_provision_binding(method));
                if (provider && provider != dependency) single_provider = false;
                provider = dependency;
            }
        }
        if (single_provider && provider) {
            result.owning_component = provider->type;
        }

        if (result.bindings.empty() && is_valid_implicit_provision_key(bk.key)) {
            if (auto injected = lookup_.synthesize_injectable(bk.key.type)) {
                result.bindings.push_back(std::move(injected));
            }
        }

        if (result.bindings.empty()) {
            if (auto map = synthesize_map(bk.key)) {
                result.bindings.push_back(std::move(map));
            }
        }

        if (result.bindings.empty()) {
            LIBCTDI_LOG_TRACE("graph", component_.type << ": no binding for " << to_string(bk));
        }
        return result;
    }

    // A bare Map<K, V> request is served by the Map<K, Provider<V>>
    // contributions of the installed modules.
    binding_ptr synthesize_map(const key& k) const {
        if (k.wrapper.has_value() || !is_map_type(k.type)) return nullptr;

        key wrapped{k.type, k.qualifier, framework_wrapper::provider};
        if (lookup_.declared_bindings(wrapped, modules_).empty()) return nullptr;

        provision_binding b;
        b.key = k;
        b.type = binding_type::map;
        b.kind = binding_kind::synthetic_map;
        b.element = type_element(k.type, {});
        b.dependencies.push_back({request_kind::provider, std::move(wrapped), b.element});
        return make_binding(std::move(b));
    }

    binding_lookup& lookup_;
    const component_descriptor& component_;
    std::vector<std::string> modules_;
    std::vector<const component_descriptor*> dependencies_;

    std::deque<binding_key> pending_;
    std::set<binding_key> discovered_;
    std::vector<resolved_bindings> resolved_;
};

} // anonymous namespace

binding_graph binding_graph_factory::create(const component_descriptor& component) const {
    graph_builder builder(lookup_, component);
    builder.build();
    return binding_graph(component, builder.take_modules(), builder.take_resolved());
}

} // namespace libctdi
