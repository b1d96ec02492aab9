//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Printers.cpp
/// @brief Renderers for tokens, parse trees and diagnostics.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Printers.hpp"

#include <cstdio>

namespace xpresso::frontends::xp
{

namespace
{

bool keepToken(const Token &tok, bool includeTrivia)
{
    return includeTrivia || (!tok.isTrivia() && tok.kind != TokenKind::Eof);
}

void indent(std::ostream &os, int depth)
{
    for (int i = 0; i < depth; ++i)
        os << "  ";
}

void writeLoc(std::ostream &os, SourceLoc loc)
{
    os << '(' << loc.line << ':' << loc.column << ')';
}

/// @brief Printable form of a lexeme: control characters become escapes.
std::string visible(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out += c;
        }
    }
    return out;
}

void printTreeImpl(const ParseTreeNode &node, std::ostream &os, int depth)
{
    indent(os, depth);
    if (node.isTerminal())
        os << '\'' << visible(node.label()) << "' ";
    else
        os << node.label() << ' ';
    writeLoc(os, node.loc());
    os << '\n';
    for (const auto &child : node.children())
        printTreeImpl(*child, os, depth + 1);
}

void printTreeJsonImpl(const ParseTreeNode &node, std::ostream &os, int depth)
{
    indent(os, depth);
    os << "{\"label\": \"" << jsonEscape(node.label()) << "\", "
       << "\"terminal\": " << (node.isTerminal() ? "true" : "false") << ", "
       << "\"line\": " << node.loc().line << ", "
       << "\"column\": " << node.loc().column << ", "
       << "\"children\": [";
    if (node.children().empty())
    {
        os << "]}";
        return;
    }
    os << '\n';
    bool first = true;
    for (const auto &child : node.children())
    {
        if (!first)
            os << ",\n";
        first = false;
        printTreeJsonImpl(*child, os, depth + 1);
    }
    os << '\n';
    indent(os, depth);
    os << "]}";
}

std::string dotEscape(std::string_view text)
{
    std::string out;
    for (char c : visible(text))
    {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out;
}

std::size_t printTreeDotImpl(const ParseTreeNode &node, std::ostream &os, std::size_t &nextId)
{
    const std::size_t id = nextId++;
    os << "  n" << id << " [label=\"" << dotEscape(node.label()) << '"';
    if (node.isTerminal())
        os << ", shape=box";
    os << "];\n";
    for (const auto &child : node.children())
    {
        const std::size_t childId = printTreeDotImpl(*child, os, nextId);
        os << "  n" << id << " -> n" << childId << ";\n";
    }
    return id;
}

} // namespace

std::string jsonEscape(std::string_view text)
{
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
        }
    }
    return out;
}

//===----------------------------------------------------------------------===//
// Parse trees
//===----------------------------------------------------------------------===//

void printTree(const ParseTreeNode &node, std::ostream &os)
{
    printTreeImpl(node, os, 0);
}

void printTreeJson(const ParseTreeNode &node, std::ostream &os)
{
    printTreeJsonImpl(node, os, 0);
    os << '\n';
}

void printTreeDot(const ParseTreeNode &node, std::ostream &os)
{
    os << "digraph ParseTree {\n";
    os << "  node [fontname=\"monospace\"];\n";
    std::size_t nextId = 0;
    printTreeDotImpl(node, os, nextId);
    os << "}\n";
}

//===----------------------------------------------------------------------===//
// Tokens
//===----------------------------------------------------------------------===//

void printTokens(const std::vector<Token> &tokens, std::ostream &os, bool includeTrivia)
{
    for (const auto &tok : tokens)
    {
        if (!keepToken(tok, includeTrivia))
            continue;
        os << tok.loc.line << ':' << tok.loc.column << ' ' << tokenKindToString(tok.kind) << " '"
           << visible(tok.text) << "'\n";
    }
}

void printTokensJson(const std::vector<Token> &tokens, std::ostream &os, bool includeTrivia)
{
    os << '[';
    bool first = true;
    for (const auto &tok : tokens)
    {
        if (!keepToken(tok, includeTrivia))
            continue;
        os << (first ? "\n" : ",\n");
        first = false;
        os << "  {\"type\": \"" << tokenKindToString(tok.kind) << "\", "
           << "\"lexeme\": \"" << jsonEscape(tok.text) << "\", "
           << "\"line\": " << tok.loc.line << ", "
           << "\"column\": " << tok.loc.column << '}';
    }
    os << (first ? "]\n" : "\n]\n");
}

//===----------------------------------------------------------------------===//
// Diagnostics
//===----------------------------------------------------------------------===//

void printDiagnosticsJson(const std::vector<Diagnostic> &diags, std::ostream &os)
{
    os << '[';
    bool first = true;
    for (const auto &d : diags)
    {
        os << (first ? "\n" : ",\n");
        first = false;
        os << "  {\"type\": \"" << errorKindId(d.kind) << "\", "
           << "\"code\": \"" << errorKindCode(d.kind) << "\", "
           << "\"message\": \"" << jsonEscape(d.message) << "\", "
           << "\"line\": " << d.loc.line << ", "
           << "\"column\": " << d.loc.column;
        if (!d.suggestion.empty())
            os << ", \"suggestion\": \"" << jsonEscape(d.suggestion) << '"';
        os << '}';
    }
    os << (first ? "]\n" : "\n]\n");
}

} // namespace xpresso::frontends::xp
