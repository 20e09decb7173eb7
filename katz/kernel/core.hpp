#pragma once

// =============================================================================
/// @file core.hpp
/// @brief Unified Kernel Interface
///
/// Single include point for the graph types and the Katz centrality solvers.
///
/// Usage:
///   #include "katz/kernel/core.hpp"
///
/// Solvers live in katz::kernel::centrality; graph types in katz.
// =============================================================================

#include "katz/core/graph.hpp"
#include "katz/kernel/beta.hpp"
#include "katz/kernel/katz.hpp"
