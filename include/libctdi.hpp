#pragma once

#include "libctdi/export.hpp"
#include "libctdi/fwd.hpp"
#include "libctdi/key.hpp"
#include "libctdi/dependency_request.hpp"
#include "libctdi/binding.hpp"
#include "libctdi/component.hpp"
#include "libctdi/builders.hpp"
#include "libctdi/exceptions.hpp"
#include "libctdi/log.hpp"
#include "libctdi/registry.hpp"
#include "libctdi/binding_graph.hpp"
#include "libctdi/diagnostic.hpp"
#include "libctdi/options.hpp"
#include "libctdi/validator.hpp"
#include "libctdi/planner.hpp"
#include "libctdi/processor.hpp"
