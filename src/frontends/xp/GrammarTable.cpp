//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file GrammarTable.cpp
/// @brief The standard X-presso grammar and its lookup helpers.
///
/// Productions here cover the fixed-shape constructs (print/input, query
/// clauses, conversion and date calls, ALIAS declarations, inheritance lists,
/// type constraints). Structural and recursive constructs are written by
/// hand in the parser and appear here only as builtins.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/GrammarTable.hpp"

#include <cassert>

namespace xpresso::frontends::xp
{

namespace
{

/// @brief Collapse runs of spaces/tabs so `exit  when` compares as `exit when`.
std::string normalizeSpaces(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    bool inGap = false;
    for (char c : text)
    {
        if (c == ' ' || c == '\t')
        {
            inGap = true;
            continue;
        }
        if (inGap && !out.empty())
            out.push_back(' ');
        inGap = false;
        out.push_back(c);
    }
    return out;
}

std::size_t classIndex(WordClass cls)
{
    return static_cast<std::size_t>(cls);
}

} // namespace

//===----------------------------------------------------------------------===//
// Symbols and productions
//===----------------------------------------------------------------------===//

bool GrammarSymbol::matches(const Token &tok) const
{
    if (!isTerminal() || tok.kind != tokenKind)
        return false;
    if (text.empty() || tok.text == text)
        return true;
    return tok.kind == TokenKind::Keyword && normalizeSpaces(tok.text) == text;
}

std::string GrammarSymbol::describe() const
{
    if (!isTerminal())
        return text;
    if (!text.empty())
        return "'" + text + "'";
    switch (tokenKind)
    {
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::IntLiteral:
            return "integer literal";
        case TokenKind::StringLiteral:
            return "string";
        default:
            return tokenKindToString(tokenKind);
    }
}

bool Production::isNullable() const
{
    for (const auto &alt : alternatives)
    {
        bool allOptional = true;
        for (const auto &elem : alt)
        {
            if (elem.repeat == Repeat::One)
            {
                allOptional = false;
                break;
            }
        }
        if (allOptional)
            return true;
    }
    return false;
}

bool PrecedenceLevel::matches(const Token &tok) const
{
    for (const auto &op : operators)
    {
        if (tok.kind == op.kind && tok.text == op.text)
            return true;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Lookups
//===----------------------------------------------------------------------===//

const Production *GrammarTable::production(std::string_view name) const
{
    auto it = productions_.find(name);
    return it == productions_.end() ? nullptr : &it->second;
}

bool GrammarTable::isBuiltin(std::string_view name) const
{
    return builtins_.find(name) != builtins_.end();
}

const PrecedenceLevel &GrammarTable::level(int n) const
{
    assert(n >= 1 && n <= levelCount() && "precedence level out of range");
    return levels_[static_cast<std::size_t>(n - 1)];
}

bool GrammarTable::inClass(WordClass cls, std::string_view word) const
{
    const auto &set = words_[classIndex(cls)];
    return set.find(word) != set.end();
}

bool GrammarTable::isDataType(const Token &tok) const
{
    return tok.kind == TokenKind::ReservedWord && inClass(WordClass::DataType, tok.text);
}

bool GrammarTable::isAccessModifier(const Token &tok) const
{
    return tok.kind == TokenKind::ReservedWord && inClass(WordClass::AccessModifier, tok.text);
}

bool GrammarTable::isModifierFor(ModifierContext ctx, const Token &tok) const
{
    if (tok.kind != TokenKind::ReservedWord)
        return false;
    if (inClass(WordClass::AccessModifier, tok.text))
        return true;
    switch (ctx)
    {
        case ModifierContext::Class:
            return inClass(WordClass::ClassModifier, tok.text);
        case ModifierContext::Method:
            return inClass(WordClass::MethodModifier, tok.text);
        case ModifierContext::Field:
            return inClass(WordClass::FieldModifier, tok.text);
    }
    return false;
}

bool GrammarTable::isDateOperation(const Token &tok) const
{
    return (tok.kind == TokenKind::ReservedWord || tok.kind == TokenKind::Keyword) &&
           inClass(WordClass::DateOperation, tok.text);
}

bool GrammarTable::isStatementStart(const Token &tok) const
{
    if (tok.kind != TokenKind::Keyword && tok.kind != TokenKind::ReservedWord)
        return false;
    return inClass(WordClass::StatementStart, normalizeSpaces(tok.text));
}

support::Expected<void> GrammarTable::validate() const
{
    for (const auto &[name, prod] : productions_)
    {
        if (prod.alternatives.empty())
            return support::makeError({}, "grammar: production '" + name + "' has no alternatives");

        for (const auto &alt : prod.alternatives)
        {
            for (const auto &elem : alt)
            {
                if (elem.symbol.isTerminal())
                    continue;
                const std::string &ref = elem.symbol.text;
                if (!hasProduction(ref) && !isBuiltin(ref))
                    return support::makeError({},
                                              "grammar: production '" + name +
                                                  "' references undefined non-terminal '" + ref +
                                                  "'");
            }
        }
    }

    for (int n = 1; n <= levelCount(); ++n)
    {
        if (levels_[static_cast<std::size_t>(n - 1)].operators.empty())
            return support::makeError({},
                                      "grammar: precedence level " + std::to_string(n) +
                                          " has no operators");
    }
    if (levelCount() != kPrecedenceLevels)
        return support::makeError({},
                                  "grammar: expected " + std::to_string(kPrecedenceLevels) +
                                      " precedence levels, found " + std::to_string(levelCount()));
    return {};
}

//===----------------------------------------------------------------------===//
// Builder
//===----------------------------------------------------------------------===//

GrammarTable::Builder &GrammarTable::Builder::rule(const std::string &name, Alternative alternative)
{
    auto &prod = table_.productions_[name];
    prod.name = name;
    prod.alternatives.push_back(std::move(alternative));
    return *this;
}

GrammarTable::Builder &GrammarTable::Builder::builtin(std::string name)
{
    table_.builtins_.insert(std::move(name));
    return *this;
}

GrammarTable::Builder &GrammarTable::Builder::words(WordClass cls,
                                                    std::initializer_list<std::string_view> list)
{
    auto &set = table_.words_[classIndex(cls)];
    for (auto word : list)
        set.emplace(word);
    return *this;
}

GrammarTable::Builder &GrammarTable::Builder::level(std::string_view name,
                                                    Assoc assoc,
                                                    std::vector<OperatorSpec> operators)
{
    PrecedenceLevel lvl;
    lvl.level = static_cast<int>(table_.levels_.size()) + 1;
    lvl.name = name;
    lvl.assoc = assoc;
    lvl.operators = std::move(operators);
    table_.levels_.push_back(std::move(lvl));
    return *this;
}

GrammarTable GrammarTable::Builder::build() &&
{
    return std::move(table_);
}

//===----------------------------------------------------------------------===//
// The standard grammar
//===----------------------------------------------------------------------===//

GrammarTable GrammarTable::standard()
{
    using namespace grammar;
    using K = TokenKind;

    const auto lparen = [] { return term(K::Delimiter, "("); };
    const auto rparen = [] { return term(K::Delimiter, ")"); };
    const auto semi = [] { return term(K::PunctDelimiter, ";"); };
    const auto comma = [] { return term(K::PunctDelimiter, ","); };
    const auto ident = [] { return term(K::Identifier); };

    Builder b;

    // Non-terminals the parser implements directly.
    b.builtin("Expression").builtin("Lambda").builtin("DataType").builtin("StringLiteral").builtin(
        "Block");

    // Console I/O.
    b.rule("PrintStmt",
           {term(K::Keyword, "Output"),
            term(K::MethodOp, "::"),
            term(K::Keyword, "print"),
            lparen(),
            opt("ArgumentList"),
            rparen(),
            semi()});
    b.rule("ArgumentList", {nt("Expression"), many("ArgumentTail")});
    b.rule("ArgumentTail", {comma(), nt("Expression")});
    b.rule("InputExpr",
           {term(K::ReservedWord, "STRICT", Repeat::Optional),
            term(K::Keyword, "Input"),
            term(K::MethodOp, "::"),
            term(K::Keyword, "get"),
            lparen(),
            opt("StringLiteral"),
            rparen()});

    // Member calls, matched after `.`.
    b.rule("ExportCall",
           {term(K::ReservedWord, "export_as"),
            lparen(),
            nt("StringLiteral"),
            comma(),
            nt("StringLiteral"),
            rparen()});
    b.rule("ToMixedCall", {term(K::ReservedWord, "toMixed"), lparen(), rparen()});
    b.rule("DateOpCall", {term(K::ReservedWord, "before"), lparen(), nt("Expression"), rparen()});
    b.rule("DateOpCall", {term(K::ReservedWord, "after"), lparen(), nt("Expression"), rparen()});
    b.rule("DateOpCall", {term(K::Keyword, "year"), lparen(), rparen()});
    b.rule("DateOpCall", {term(K::Keyword, "month"), lparen(), rparen()});
    b.rule("DateOpCall", {term(K::Keyword, "day"), lparen(), rparen()});
    b.rule("FilterCall", {term(K::ReservedWord, "filter_by"), lparen(), nt("Lambda"), rparen()});
    b.rule("ValidateCall", {term(K::ReservedWord, "validate"), lparen(), nt("Lambda"), rparen()});
    b.rule("ModifyCall", {term(K::ReservedWord, "modify"), lparen(), nt("Lambda"), rparen()});
    b.rule("TodayCall", {term(K::ReservedWord, "today"), lparen(), rparen()});

    // Declarations.
    b.rule("AliasDecl",
           {nt("DataType"),
            ident(),
            term(K::AssignOp, "="),
            term(K::ReservedWord, "ALIAS"),
            ident(),
            semi()});
    b.rule("InheritanceList", {term(K::InheritOp, ":>"), ident(), many("IdentifierTail")});
    b.rule("InterfaceList", {term(K::InheritOp, ":>>"), ident(), many("IdentifierTail")});
    b.rule("IdentifierTail", {comma(), ident()});
    b.rule("TypeConstraint", {term(K::Keyword, "where type"), ident(), many("IdentifierTail")});

    // Blocks with fixed shape.
    b.rule("InspectStmt", {term(K::ReservedWord, "inspect"), nt("Block")});
    b.rule("QueryBlock",
           {term(K::ReservedWord, "inline_query"),
            term(K::Delimiter, "{"),
            nt("QueryFrom"),
            nt("QueryFilter"),
            opt("QueryOrder"),
            opt("QueryLimit"),
            nt("QuerySelect"),
            term(K::Delimiter, "}")});
    b.rule("QueryFrom", {term(K::Identifier, "from"), ident(), semi()});
    b.rule("QueryFilter",
           {term(K::ReservedWord, "filter_by"), lparen(), nt("Lambda"), rparen(), semi()});
    b.rule("QueryOrder",
           {term(K::Identifier, "order_by"), lparen(), ident(), opt("SortOrder"), rparen(), semi()});
    b.rule("SortOrder", {comma(), nt("SortDirection")});
    b.rule("SortDirection", {term(K::Identifier, "asc")});
    b.rule("SortDirection", {term(K::Identifier, "desc")});
    b.rule("QueryLimit",
           {term(K::Identifier, "limit"), lparen(), term(K::IntLiteral), rparen(), semi()});
    b.rule("QuerySelect",
           {term(K::Identifier, "select"), lparen(), nt("Lambda"), rparen(), semi()});

    // Word classes.
    b.words(WordClass::AccessModifier, {"public", "private", "protected"});
    b.words(WordClass::ClassModifier, {"abstract", "final", "static", "strictfp"});
    b.words(WordClass::MethodModifier, {"abstract", "final", "static", "native", "strictfp"});
    b.words(WordClass::FieldModifier, {"final", "static", "transient", "volatile"});
    b.words(WordClass::DataType,
            {"int",
             "char",
             "bool",
             "str",
             "float",
             "double",
             "long",
             "byte",
             "short",
             "Date",
             "Frac",
             "Complex"});
    b.words(WordClass::DateOperation, {"before", "after", "year", "month", "day", "today"});
    b.words(WordClass::StatementStart,
            {"if",
             "switch",
             "switch-fall",
             "while",
             "do",
             "for",
             "break",
             "exit when",
             "Output",
             "Input",
             "STRICT",
             "inspect",
             "inline_query"});

    // Precedence, tightest first.
    b.level("grouping",
            Assoc::None,
            {{K::Delimiter, "("},
             {K::Delimiter, ")"},
             {K::Delimiter, "["},
             {K::Delimiter, "]"},
             {K::Delimiter, "{"},
             {K::Delimiter, "}"}});
    b.level("member", Assoc::Left, {{K::MethodOp, "."}, {K::MethodOp, "::"}, {K::MethodOp, "->"}});
    b.level("postfix", Assoc::Left, {{K::UnaryOp, "++"}, {K::UnaryOp, "--"}, {K::UnaryOp, "**"}});
    // In operand position any `+`/`-` is a sign, including one the lexer
    // classified as binary after a keyword (`case -1`).
    b.level("prefix",
            Assoc::Right,
            {{K::UnaryOp, "+"},
             {K::UnaryOp, "-"},
             {K::ArithmeticOp, "+"},
             {K::ArithmeticOp, "-"},
             {K::LogicalOp, "!"},
             {K::BitwiseOp, "~"},
             {K::UnaryOp, "++"},
             {K::UnaryOp, "--"},
             {K::UnaryOp, "**"}});
    b.level("exponent", Assoc::Right, {{K::ArithmeticOp, "^"}});
    b.level("multiplicative",
            Assoc::Left,
            {{K::ArithmeticOp, "*"}, {K::ArithmeticOp, "/"}, {K::ArithmeticOp, "%"}});
    // After an operand a `+`/`-` lexed in unary position (`f(x) - 1`) is binary.
    b.level("additive",
            Assoc::Left,
            {{K::ArithmeticOp, "+"}, {K::ArithmeticOp, "-"}, {K::UnaryOp, "+"}, {K::UnaryOp, "-"}});
    b.level("shift",
            Assoc::Left,
            {{K::BitwiseOp, "<<"}, {K::BitwiseOp, ">>"}, {K::BitwiseOp, ">>>"}});
    b.level("bitwise-and", Assoc::Left, {{K::BitwiseOp, "&"}});
    b.level("bitwise-xor", Assoc::Left, {{K::BitwiseOp, "^"}});
    b.level("bitwise-or", Assoc::Left, {{K::BitwiseOp, "|"}});
    b.level("relational",
            Assoc::Left,
            {{K::RelationalOp, "<"},
             {K::RelationalOp, "<="},
             {K::RelationalOp, ">"},
             {K::RelationalOp, ">="}});
    b.level("equality", Assoc::Left, {{K::RelationalOp, "=="}, {K::RelationalOp, "!="}});
    b.level("logical-and", Assoc::Left, {{K::LogicalOp, "&&"}});
    b.level("logical-or", Assoc::Left, {{K::LogicalOp, "||"}});
    b.level("ternary", Assoc::Right, {{K::PunctDelimiter, "?"}, {K::PunctDelimiter, ":"}});
    b.level("assignment",
            Assoc::Right,
            {{K::AssignOp, "="},
             {K::AssignOp, "+="},
             {K::AssignOp, "-="},
             {K::AssignOp, "*="},
             {K::AssignOp, "/="},
             {K::AssignOp, "%="},
             {K::AssignOp, "?="}});

    return std::move(b).build();
}

} // namespace xpresso::frontends::xp
