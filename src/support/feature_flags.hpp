//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
// src/support/feature_flags.hpp
#pragma once

/// @brief Provides default values for optional compile-time feature toggles.
/// @notes Include from translation units that depend on optionally enabled
/// features so builds succeed even when the compiler does not define the
/// corresponding macros.
///
/// GARNET_EVAL_TRACE: when 0, the evaluator's per-node trace hook is compiled
/// out and TraceConfig::mode is ignored.
#ifndef GARNET_EVAL_TRACE
#define GARNET_EVAL_TRACE 1
#endif
