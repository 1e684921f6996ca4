#pragma once

#include "export.hpp"
#include "binding_graph.hpp"
#include "diagnostic.hpp"
#include "options.hpp"

namespace libctdi {

class binding_lookup;

/// Checks a binding graph for missing, duplicate and conflicting bindings,
/// dependency cycles, and scope rules across the component hierarchy.
///
/// Every problem in the declared model becomes a diagnostic and validation
/// always runs to completion.  Only broken engine invariants throw
/// (invariant_violation).
class LIBCTDI_EXPORT binding_graph_validator {
public:
    binding_graph_validator(const binding_lookup& lookup,
                            validation_options options = {});

    validation_report validate(const binding_graph& graph) const;

    const validation_options& options() const noexcept { return options_; }

private:
    const binding_lookup& lookup_;
    validation_options options_;
};

} // namespace libctdi
