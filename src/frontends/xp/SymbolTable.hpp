//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/xp/SymbolTable.hpp
// Purpose: Stack of named scopes recording declarations seen by the parser.
// Key invariants:
//   - The global scope (id 0, name "global") is always present; exitScope()
//     never removes it.
//   - Lookup searches innermost to outermost, ending at the global scope.
//   - Entries are removed when their scope exits.
// Ownership/Lifetime: Owned by the caller of the parser; the parser mutates
//   it through a reference.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/xp/Token.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xpresso::frontends::xp
{

struct SymbolEntry
{
    std::string name;
    std::string type;
    unsigned scopeId{0};
    std::string scopeName;
    SourceLoc loc{};
};

class SymbolTable
{
  public:
    /// @brief RAII helper entering a scope on construction and leaving it on
    ///        destruction.
    class ScopeGuard
    {
      public:
        ScopeGuard(SymbolTable &table, std::string name) : table_(table)
        {
            table_.enterScope(std::move(name));
        }

        ~ScopeGuard()
        {
            table_.exitScope();
        }

        ScopeGuard(const ScopeGuard &) = delete;
        ScopeGuard &operator=(const ScopeGuard &) = delete;
        ScopeGuard(ScopeGuard &&) = delete;
        ScopeGuard &operator=(ScopeGuard &&) = delete;

      private:
        SymbolTable &table_;
    };

    SymbolTable();

    void enterScope(std::string name);

    /// @brief Leave the innermost scope.
    /// @return False when only the global scope remains.
    bool exitScope();

    /// @brief Declare @p name in the innermost scope.
    /// @return False when the innermost scope already declares @p name.
    bool insert(std::string name, std::string type, SourceLoc loc);

    [[nodiscard]] std::optional<SymbolEntry> lookup(std::string_view name) const;

    [[nodiscard]] std::optional<SymbolEntry> lookupInCurrentScope(std::string_view name) const;

    /// @brief Number of open scopes, the global scope included.
    [[nodiscard]] std::size_t depth() const
    {
        return scopes_.size();
    }

    [[nodiscard]] const std::string &currentScopeName() const
    {
        return scopes_.back().name;
    }

    /// @brief Total number of declarations ever inserted.
    [[nodiscard]] std::size_t declarationCount() const
    {
        return declarations_;
    }

    /// @brief Drop every scope and symbol, leaving an empty global scope.
    void clear();

  private:
    struct Scope
    {
        unsigned id;
        std::string name;
        std::unordered_map<std::string, SymbolEntry> symbols;
    };

    std::vector<Scope> scopes_;
    unsigned nextId_{0};
    std::size_t declarations_{0};
};

} // namespace xpresso::frontends::xp
