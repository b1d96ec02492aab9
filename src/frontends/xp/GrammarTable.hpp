//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/xp/GrammarTable.hpp
// Purpose: Declarative X-presso grammar data consumed by the parser.
// Key invariants:
//   - A GrammarTable is immutable once built; the parser holds it by const&.
//   - Precedence levels are numbered 1 (grouping, binds tightest) to 17
//     (assignment, binds loosest).
//   - validate() succeeds only when every non-terminal referenced from a
//     production is defined in the table or registered as a builtin, and
//     all kPrecedenceLevels levels are present and non-empty.
// Ownership/Lifetime: Value type. The parser borrows it; the caller keeps it
//   alive for the duration of the parse.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/xp/Token.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xpresso::frontends::xp
{

/// @brief Number of precedence levels the parser climbs through.
inline constexpr int kPrecedenceLevels = 17;

/// @brief Terminal (token kind + optional exact text) or non-terminal name.
struct GrammarSymbol
{
    enum class Kind
    {
        Terminal,
        NonTerminal,
    };

    Kind kind{Kind::Terminal};
    TokenKind tokenKind{TokenKind::Eof};

    /// Exact lexeme for terminals (empty matches any text of tokenKind), or
    /// the referenced non-terminal's name.
    std::string text;

    static GrammarSymbol terminal(TokenKind k, std::string text = {})
    {
        return GrammarSymbol{Kind::Terminal, k, std::move(text)};
    }

    static GrammarSymbol nonTerminal(std::string name)
    {
        return GrammarSymbol{Kind::NonTerminal, TokenKind::Eof, std::move(name)};
    }

    [[nodiscard]] bool isTerminal() const
    {
        return kind == Kind::Terminal;
    }

    /// @brief True when @p tok satisfies this terminal.
    [[nodiscard]] bool matches(const Token &tok) const;

    /// @brief Human readable form for diagnostics: `'('`, `identifier`, `Block`.
    [[nodiscard]] std::string describe() const;
};

enum class Repeat
{
    One,
    Optional,
    ZeroOrMore,
};

struct GrammarElement
{
    GrammarSymbol symbol;
    Repeat repeat{Repeat::One};
};

/// @brief One right-hand side; empty means the non-terminal is nullable.
using Alternative = std::vector<GrammarElement>;

struct Production
{
    std::string name;
    std::vector<Alternative> alternatives;

    [[nodiscard]] bool isNullable() const;
};

enum class Assoc
{
    None,
    Left,
    Right,
};

struct OperatorSpec
{
    TokenKind kind;
    std::string_view text;
};

struct PrecedenceLevel
{
    int level{0};
    std::string_view name;
    Assoc assoc{Assoc::None};
    std::vector<OperatorSpec> operators;

    [[nodiscard]] bool matches(const Token &tok) const;
};

/// @brief Named sets of words the parser tests tokens against.
enum class WordClass
{
    AccessModifier,
    ClassModifier,
    MethodModifier,
    FieldModifier,
    DataType,
    DateOperation,
    StatementStart,
};

inline constexpr std::size_t kWordClassCount = 7;

/// @brief Declaration context for non-access modifiers.
enum class ModifierContext
{
    Class,
    Method,
    Field,
};

/// @brief Immutable grammar: productions, word classes and precedence levels.
class GrammarTable
{
  public:
    class Builder;

    /// @brief The X-presso grammar used by the front end.
    static GrammarTable standard();

    /// @brief Production named @p name, or nullptr.
    [[nodiscard]] const Production *production(std::string_view name) const;

    [[nodiscard]] bool hasProduction(std::string_view name) const
    {
        return production(name) != nullptr;
    }

    /// @brief True when @p name is supplied by the parser rather than the table.
    [[nodiscard]] bool isBuiltin(std::string_view name) const;

    [[nodiscard]] const std::set<std::string, std::less<>> &builtins() const
    {
        return builtins_;
    }

    [[nodiscard]] const std::map<std::string, Production, std::less<>> &productions() const
    {
        return productions_;
    }

    /// @brief Precedence level @p n, 1-based.
    /// @pre 1 <= n <= levelCount(); holds for every table that validates.
    [[nodiscard]] const PrecedenceLevel &level(int n) const;

    [[nodiscard]] int levelCount() const
    {
        return static_cast<int>(levels_.size());
    }

    [[nodiscard]] bool inClass(WordClass cls, std::string_view word) const;

    [[nodiscard]] bool isDataType(const Token &tok) const;

    [[nodiscard]] bool isAccessModifier(const Token &tok) const;

    [[nodiscard]] bool isModifierFor(ModifierContext ctx, const Token &tok) const;

    [[nodiscard]] bool isDateOperation(const Token &tok) const;

    [[nodiscard]] bool isStatementStart(const Token &tok) const;

    /// @brief Check that every referenced non-terminal is defined.
    [[nodiscard]] support::Expected<void> validate() const;

  private:
    std::map<std::string, Production, std::less<>> productions_;
    std::set<std::string, std::less<>> builtins_;
    std::array<std::set<std::string, std::less<>>, kWordClassCount> words_;
    std::vector<PrecedenceLevel> levels_;
};

/// @brief Mutable staging area producing a GrammarTable.
class GrammarTable::Builder
{
  public:
    /// @brief Add an alternative to @p name, creating the production if needed.
    Builder &rule(const std::string &name, Alternative alternative);

    Builder &builtin(std::string name);

    Builder &words(WordClass cls, std::initializer_list<std::string_view> list);

    Builder &level(std::string_view name, Assoc assoc, std::vector<OperatorSpec> operators);

    [[nodiscard]] GrammarTable build() &&;

  private:
    GrammarTable table_;
};

//===----------------------------------------------------------------------===//
// Element shorthands used when writing productions
//===----------------------------------------------------------------------===//

namespace grammar
{

inline GrammarElement term(TokenKind kind, std::string text = {}, Repeat repeat = Repeat::One)
{
    return GrammarElement{GrammarSymbol::terminal(kind, std::move(text)), repeat};
}

inline GrammarElement nt(std::string name, Repeat repeat = Repeat::One)
{
    return GrammarElement{GrammarSymbol::nonTerminal(std::move(name)), repeat};
}

inline GrammarElement opt(std::string name)
{
    return nt(std::move(name), Repeat::Optional);
}

inline GrammarElement many(std::string name)
{
    return nt(std::move(name), Repeat::ZeroOrMore);
}

} // namespace grammar

} // namespace xpresso::frontends::xp
