//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Trace.cpp
// Purpose: Implement deterministic tracing of node evaluation.
// Key invariants: Each evaluated node produces at most one flushed line and
//                 emission honours @ref TraceConfig::mode.
// Ownership/Lifetime: Trace sinks emit to externally owned streams.
//
//===----------------------------------------------------------------------===//

#include "interp/Trace.hpp"

#include "ast/AST_Node.hpp"
#include "support/source_location.hpp"

#include <iostream>

namespace garnet::interp
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig c) : cfg(c) {}

void TraceSink::onEval(const garnet::ast::Node &node)
{
    switch (cfg.mode)
    {
        case TraceConfig::Off:
            return;
        case TraceConfig::Nodes:
        {
            std::ostream &os = cfg.out ? *cfg.out : std::cerr;
            os << "[eval] " << garnet::ast::toString(node.kind()) << ' '
               << garnet::support::formatLoc(node.loc(), cfg.sm) << std::endl;
            return;
        }
    }
}

} // namespace garnet::interp
