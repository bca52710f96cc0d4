// Umbrella header.
#pragma once
#include "pmatch/edn.hpp"
#include "pmatch/value.hpp"
#include "pmatch/errors.hpp"
#include "pmatch/env.hpp"
#include "pmatch/constraint.hpp"
#include "pmatch/registry.hpp"
#include "pmatch/constructor.hpp"
#include "pmatch/surface.hpp"
#include "pmatch/pattern.hpp"
#include "pmatch/matcher.hpp"
#include "pmatch/tuple.hpp"
#include "pmatch/diagnostics_json.hpp"
