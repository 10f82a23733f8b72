// File: include/prov/yaml/Loader.hpp
// Purpose: Stable façade for loading YAML with provenance and trust tags.
// Key invariants: Re-exports the supported loader interfaces; composer and constructor internals stay internal.
// Ownership/Lifetime: Types mirror the underlying implementations.
// Links: DESIGN.md
#pragma once

#include "support/tags.hpp"
#include "yaml/Errors.hpp"
#include "yaml/InputSource.hpp"
#include "yaml/Loader.hpp"
#include "yaml/LoaderConfig.hpp"
#include "yaml/Value.hpp"

/// @file include/prov/yaml/Loader.hpp
/// @brief Aggregated public header for the YAML loader.  Provides the Loader,
///        its configuration, the value model and the error types while keeping
///        parser event handling and tag dispatch under src/yaml.
