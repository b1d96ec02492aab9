//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/xp/SymbolTable.cpp
// Purpose: Scope stack operations for the X-presso symbol table.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "frontends/xp/SymbolTable.hpp"

#include <utility>

namespace xpresso::frontends::xp
{

SymbolTable::SymbolTable()
{
    clear();
}

void SymbolTable::enterScope(std::string name)
{
    scopes_.push_back(Scope{nextId_++, std::move(name), {}});
}

bool SymbolTable::exitScope()
{
    if (scopes_.size() <= 1)
        return false;
    scopes_.pop_back();
    return true;
}

bool SymbolTable::insert(std::string name, std::string type, SourceLoc loc)
{
    Scope &scope = scopes_.back();
    if (scope.symbols.find(name) != scope.symbols.end())
        return false;

    SymbolEntry entry{name, std::move(type), scope.id, scope.name, loc};
    scope.symbols.emplace(std::move(name), std::move(entry));
    ++declarations_;
    return true;
}

std::optional<SymbolEntry> SymbolTable::lookup(std::string_view name) const
{
    const std::string key(name);
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it)
    {
        auto found = it->symbols.find(key);
        if (found != it->symbols.end())
            return found->second;
    }
    return std::nullopt;
}

std::optional<SymbolEntry> SymbolTable::lookupInCurrentScope(std::string_view name) const
{
    const auto &symbols = scopes_.back().symbols;
    auto found = symbols.find(std::string(name));
    if (found == symbols.end())
        return std::nullopt;
    return found->second;
}

void SymbolTable::clear()
{
    scopes_.clear();
    nextId_ = 0;
    declarations_ = 0;
    enterScope("global");
}

} // namespace xpresso::frontends::xp
