#pragma once

/// @file fwd.hpp
/// Forward declarations for all public libctdi symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace libctdi {

// key.hpp
enum class framework_wrapper;
enum class binding_key_kind;
struct key;
struct binding_key;

// dependency_request.hpp
enum class element_kind;
enum class request_kind;
struct source_element;
struct dependency_request;

// binding.hpp
enum class binding_type;
enum class binding_kind;
struct provision_binding;
struct production_binding;
struct members_injection_binding;

// component.hpp
struct module_descriptor;
struct injectable_type;
struct component_descriptor;

// builders.hpp
struct dep;
struct provides_options;
class module_builder;
class injectable_builder;
class component_builder;

// exceptions.hpp
class di_error;
class not_found;
class duplicate_registration;
class invariant_violation;
class invalid_option;

// registry.hpp
class binding_lookup;
class binding_registry;

// binding_graph.hpp
struct resolved_bindings;
class binding_graph;
class binding_graph_factory;

// diagnostic.hpp
enum class severity_level;
enum class diagnostic_kind;
struct diagnostic;
class validation_report;

// options.hpp
enum class scope_cycle_validation;
struct validation_options;
struct plan_options;

// validator.hpp
class binding_graph_validator;

// planner.hpp
enum class step_kind;
enum class creation_strategy;
struct initialization_step;
struct initialization_batch;
struct initialization_plan;
class initialization_planner;

// processor.hpp
struct component_result;
class component_processor;

} // namespace libctdi
