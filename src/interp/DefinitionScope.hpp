//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/DefinitionScope.hpp
// Purpose: Method table of a class being defined.
// Key invariants: An entry whose body is null is an undefined marker: lookup
//                 stops there and does not consult the super scope.
// Ownership/Lifetime: Scopes are owned by their ExecContext. Method bodies
//                     are borrowed from the syntax tree, which must outlive
//                     the context.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace garnet::ast
{
struct DefnNode;
} // namespace garnet::ast

namespace garnet::interp
{

/// @brief A class (or the top-level object) able to hold method definitions.
class DefinitionScope
{
  public:
    explicit DefinitionScope(std::string name, DefinitionScope *superScope = nullptr);

    DefinitionScope(const DefinitionScope &) = delete;
    DefinitionScope &operator=(const DefinitionScope &) = delete;

    const std::string &name() const noexcept
    {
        return name_;
    }

    DefinitionScope *superScope() const noexcept
    {
        return super_;
    }

    /// @brief Define or replace @p name with @p body in this scope.
    void defineMethod(const std::string &name, const ast::DefnNode &body);

    /// @brief Resolve @p name through this scope and its super chain.
    /// @return The defining node, or nullptr when not found or undefined.
    const ast::DefnNode *findMethod(std::string_view name) const;

    bool hasMethod(std::string_view name) const
    {
        return findMethod(name) != nullptr;
    }

    /// @brief Mark @p name undefined in this scope.
    /// @details Hides inherited definitions as well as local ones.
    /// @throws LanguageError NameError when @p name is not reachable; the
    ///         method table is left unchanged.
    void undef(const std::string &name, garnet::support::SourceLoc loc = {});

    /// @brief Sorted names with a live definition in this scope only.
    std::vector<std::string> localMethodNames() const;

  private:
    std::string name_;
    DefinitionScope *super_;
    std::map<std::string, const ast::DefnNode *, std::less<>> methods_;
};

} // namespace garnet::interp
