//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/DefinitionScope.cpp
// Purpose: Method lookup, definition and undefinition for class scopes.
// Key invariants: See DefinitionScope.hpp.
// Ownership/Lifetime: Borrowed DefnNode pointers only.
//
//===----------------------------------------------------------------------===//

#include "interp/DefinitionScope.hpp"

#include "interp/Errors.hpp"

#include <utility>

namespace garnet::interp
{

DefinitionScope::DefinitionScope(std::string name, DefinitionScope *superScope)
    : name_(std::move(name)), super_(superScope)
{
}

void DefinitionScope::defineMethod(const std::string &name, const ast::DefnNode &body)
{
    methods_[name] = &body;
}

const ast::DefnNode *DefinitionScope::findMethod(std::string_view name) const
{
    for (const DefinitionScope *s = this; s; s = s->super_)
    {
        auto it = s->methods_.find(name);
        if (it != s->methods_.end())
            return it->second;
    }
    return nullptr;
}

void DefinitionScope::undef(const std::string &name, garnet::support::SourceLoc loc)
{
    if (!hasMethod(name))
    {
        throw LanguageError(ErrorClass::NameError,
                            "undefined method '" + name + "' for class '" + name_ + "'",
                            loc);
    }
    methods_[name] = nullptr;
}

std::vector<std::string> DefinitionScope::localMethodNames() const
{
    std::vector<std::string> names;
    for (const auto &[name, body] : methods_)
    {
        if (body)
            names.push_back(name);
    }
    return names;
}

} // namespace garnet::interp
