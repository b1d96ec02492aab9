//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/xp/XpTestUtil.hpp
// Purpose: Shared lexing and parsing fixtures for the X-presso unit tests.
// Key invariants: Each fixture owns its engine, sink and symbol table; fixtures
//                 are built in place and never copied.
// Ownership/Lifetime: Trees returned by the fixtures are owned by the caller.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/xp/DiagnosticSink.hpp"
#include "frontends/xp/GrammarTable.hpp"
#include "frontends/xp/Lexer.hpp"
#include "frontends/xp/Parser.hpp"
#include "frontends/xp/SymbolTable.hpp"
#include "support/diagnostics.hpp"

#include <string>
#include <vector>

namespace xpresso::tests::xp
{

namespace fx = xpresso::frontends::xp;

inline const fx::GrammarTable &standardGrammar()
{
    static const fx::GrammarTable grammar = fx::GrammarTable::standard();
    return grammar;
}

/// Lexes a source string to completion.
struct Lexed
{
    explicit Lexed(std::string source) : lexer(std::move(source), 1, sink)
    {
        tokens = lexer.tokenize();
    }

    Lexed(const Lexed &) = delete;
    Lexed &operator=(const Lexed &) = delete;

    /// Tokens without whitespace, comments or the trailing Eof.
    std::vector<fx::Token> significant() const
    {
        std::vector<fx::Token> out;
        for (const auto &tok : tokens)
        {
            if (!tok.isTrivia() && tok.kind != fx::TokenKind::Eof)
                out.push_back(tok);
        }
        return out;
    }

    std::string reconstruct() const
    {
        std::string out;
        for (const auto &tok : tokens)
            out += tok.text;
        return out;
    }

    xpresso::support::DiagnosticEngine engine;
    fx::DiagnosticSink sink{engine};
    fx::Lexer lexer;
    std::vector<fx::Token> tokens;
};

/// Lexer, parser and symbol table over one source string.
struct Parsed
{
    explicit Parsed(std::string source, fx::ParserOptions options = {})
        : lexer(std::move(source), 1, sink), parser(lexer, standardGrammar(), sink, symbols, options)
    {
    }

    Parsed(const Parsed &) = delete;
    Parsed &operator=(const Parsed &) = delete;

    fx::NodePtr program()
    {
        return parser.parseProgram();
    }

    fx::NodePtr expression()
    {
        return parser.parseExpression();
    }

    xpresso::support::DiagnosticEngine engine;
    fx::DiagnosticSink sink{engine};
    fx::SymbolTable symbols;
    fx::Lexer lexer;
    fx::Parser parser;
};

/// Compact rendering: terminals print their lexeme, non-terminals wrap
/// their children in parentheses.
inline std::string shape(const fx::ParseTreeNode &node)
{
    if (node.isTerminal())
        return node.label();
    std::string out = "(";
    bool first = true;
    for (const auto &child : node.children())
    {
        if (!first)
            out += ' ';
        first = false;
        out += shape(*child);
    }
    return out + ")";
}

} // namespace xpresso::tests::xp
