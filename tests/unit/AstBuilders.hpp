// File: tests/unit/AstBuilders.hpp
// Purpose: Terse helpers for building syntax trees in unit tests.
// Key invariants: Every node gets file id 1 and the requested line.
// Ownership: Helpers return owning pointers; callers keep the tree alive for
//            as long as any context that evaluated it.
#pragma once

#include "ast/AST.hpp"

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace garnet::test
{
using namespace garnet::ast;

inline SourceLoc at(uint32_t line)
{
    return SourceLoc{1, line, 1};
}

template <typename... P> NodeList list(P... parts)
{
    NodeList out;
    (out.push_back(std::move(parts)), ...);
    return out;
}

inline NodePtr nil(uint32_t line = 1)
{
    return std::make_unique<NilNode>(at(line));
}

inline NodePtr fix(int64_t v, uint32_t line = 1)
{
    return std::make_unique<FixnumNode>(at(line), v);
}

inline NodePtr str(std::string v, uint32_t line = 1)
{
    return std::make_unique<StrNode>(at(line), std::move(v));
}

inline NodePtr sym(std::string name, uint32_t line = 1)
{
    return std::make_unique<SymbolNode>(at(line), std::move(name));
}

inline NodePtr lvar(std::string name, uint32_t line = 1)
{
    return std::make_unique<LocalVarNode>(at(line), std::move(name));
}

inline NodePtr lasgn(std::string name, NodePtr value = nullptr, uint32_t line = 1)
{
    return std::make_unique<LocalAsgnNode>(at(line), std::move(name), std::move(value));
}

inline NodePtr block(NodeList stmts, uint32_t line = 1)
{
    return std::make_unique<BlockNode>(at(line), std::move(stmts));
}

inline NodePtr fcall(std::string name, NodeList args = {}, uint32_t line = 1)
{
    return std::make_unique<FCallNode>(at(line), std::move(name), std::move(args));
}

inline std::unique_ptr<DefnNode> defn(std::string name,
                                      std::initializer_list<std::string> params,
                                      NodePtr body = nullptr,
                                      uint32_t line = 1)
{
    std::vector<std::unique_ptr<ArgumentNode>> args;
    for (const auto &p : params)
        args.push_back(std::make_unique<ArgumentNode>(at(line), p));
    return std::make_unique<DefnNode>(
        at(line), std::move(name), std::make_unique<ArgsNode>(at(line), std::move(args)),
        std::move(body));
}

inline NodePtr klass(std::string name,
                     std::optional<std::string> super,
                     NodePtr body = nullptr,
                     uint32_t line = 1)
{
    return std::make_unique<ClassNode>(at(line), std::move(name), std::move(super),
                                       std::move(body));
}

inline NodePtr undef(NodePtr name, uint32_t line = 1)
{
    return std::make_unique<UndefNode>(at(line), std::move(name));
}

inline NodePtr undef(std::string name, uint32_t line = 1)
{
    return undef(sym(std::move(name), line), line);
}

} // namespace garnet::test
