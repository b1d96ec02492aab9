//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token buffering, speculation, error reporting, recovery and the
///        grammar-table interpreter.
///
/// @details parseRule() walks a table production element by element. A
/// production with one alternative, or with only one whose first symbol fits
/// the current token, is parsed directly. Otherwise each fitting alternative
/// is tried under a Speculation guard; the first one that parses without
/// diagnostics wins. When none does, the first viable alternative is parsed
/// again for real so its diagnostic is reported.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Parser.hpp"

#include <string>
#include <utility>

namespace xpresso::frontends::xp
{

namespace
{

std::string describeToken(const Token &tok)
{
    if (tok.kind == TokenKind::Eof)
        return "end of input";
    return "'" + tok.text + "'";
}

} // namespace

Parser::Parser(Lexer &lexer,
               const GrammarTable &grammar,
               DiagnosticSink &diag,
               SymbolTable &symbols,
               ParserOptions options)
    : lexer_(lexer), grammar_(grammar), diag_(diag), symbols_(symbols), options_(options)
{
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

Parser::Speculation::Speculation(Parser &parser, ParseTreeNode *node)
    : parser_(parser),
      node_(node),
      savedChildren_(node ? node->childCount() : 0),
      savedPos_(parser.tokenPos_),
      savedSuppressed_(parser.suppressedErrors_),
      savedHasError_(parser.hasError_)
{
    ++parser_.suppressionDepth_;
}

Parser::Speculation::~Speculation()
{
    --parser_.suppressionDepth_;
    if (!committed_)
    {
        parser_.tokenPos_ = savedPos_;
        parser_.hasError_ = savedHasError_;
        if (node_)
            node_->truncateChildren(savedChildren_);
    }
}

const Token &Parser::peek(std::size_t offset)
{
    while (tokens_.size() <= tokenPos_ + offset)
    {
        Token tok = lexer_.next();
        if (tok.isTrivia())
            continue;
        tokens_.push_back(std::move(tok));
    }
    return tokens_[tokenPos_ + offset];
}

Token Parser::advance()
{
    Token cur = peek();
    if (cur.kind != TokenKind::Eof)
        ++tokenPos_;
    return cur;
}

bool Parser::check(TokenKind kind, std::size_t offset)
{
    return peek(offset).kind == kind;
}

bool Parser::check(TokenKind kind, std::string_view text, std::size_t offset)
{
    const Token &tok = peek(offset);
    return tok.kind == kind && (text.empty() || tok.text == text);
}

bool Parser::checkWord(std::string_view text, std::size_t offset)
{
    const Token &tok = peek(offset);
    return (tok.kind == TokenKind::Identifier || tok.kind == TokenKind::Keyword ||
            tok.kind == TokenKind::ReservedWord) &&
           tok.text == text;
}

bool Parser::match(TokenKind kind, std::string_view text, ParseTreeNode &into)
{
    if (!check(kind, text))
        return false;
    into.addToken(advance());
    return true;
}

bool Parser::expect(TokenKind kind, std::string_view text, const char *context, ParseTreeNode &into)
{
    if (match(kind, text, into))
        return true;

    std::string what = "'" + std::string(text) + "'";
    if (context && *context)
        what += std::string(" ") + context;
    errorExpected(what, ErrorKind::MissingToken, "Insert '" + std::string(text) + "'");
    return false;
}

bool Parser::expectIdentifier(const char *what, ParseTreeNode &into, Token *out)
{
    if (check(TokenKind::Identifier))
    {
        Token tok = advance();
        if (out)
            *out = tok;
        into.addToken(tok);
        return true;
    }
    errorExpected(what, ErrorKind::MissingToken, "Provide a valid identifier");
    return false;
}

bool Parser::isSyncPoint(const Token &tok) const
{
    if (tok.kind == TokenKind::Delimiter && tok.text == "}")
        return true;
    if (grammar_.isStatementStart(tok) || grammar_.isDataType(tok))
        return true;
    // `void` is a contextual identifier but only ever starts a method.
    if (tok.is(TokenKind::Identifier, "void"))
        return true;
    if (grammar_.isModifierFor(ModifierContext::Class, tok) ||
        grammar_.isModifierFor(ModifierContext::Method, tok) ||
        grammar_.isModifierFor(ModifierContext::Field, tok))
        return true;
    return tok.kind == TokenKind::ReservedWord && (tok.text == "class" || tok.text == "main");
}

Parser::NestingGuard::NestingGuard(Parser &parser, unsigned &depth, unsigned limit, const char *what)
    : depth_(depth), ok_(++depth <= limit)
{
    if (ok_)
        return;
    const bool statement = std::string_view(what) != "expression";
    parser.errorAt(parser.peek().loc,
                   ErrorKind::NestingTooDeep,
                   std::string(what) + " nesting too deep (limit: " + std::to_string(limit) + ")",
                   statement ? "Move the inner blocks into separate methods"
                             : "Split the expression into smaller parts");
}

void Parser::synchronize()
{
    while (!check(TokenKind::Eof))
    {
        if (check(TokenKind::PunctDelimiter, ";"))
        {
            advance();
            return;
        }
        if (isSyncPoint(peek()))
            return;
        advance();
    }
}

void Parser::recover(std::size_t startPos)
{
    synchronize();
    if (tokenPos_ == startPos && !check(TokenKind::Eof))
        advance();
}

//===----------------------------------------------------------------------===//
// Error Reporting
//===----------------------------------------------------------------------===//

void Parser::error(ErrorKind kind, const std::string &message, std::string suggestion)
{
    const Token &tok = peek();
    if (tok.kind == TokenKind::Unknown && suppressionDepth_ == 0)
    {
        hasError_ = true;
        return;
    }
    errorAt(tok.loc, kind, message, std::move(suggestion), static_cast<uint32_t>(tok.text.size()));
}

void Parser::errorAt(SourceLoc loc,
                     ErrorKind kind,
                     const std::string &message,
                     std::string suggestion,
                     uint32_t length)
{
    if (suppressionDepth_ > 0)
    {
        ++suppressedErrors_;
        return;
    }
    hasError_ = true;
    // One end-of-input report per parse; enclosing constructs stay quiet.
    if (kind == ErrorKind::UnexpectedEndOfInput)
    {
        if (eofReported_)
            return;
        eofReported_ = true;
    }
    diag_.report(kind, message, loc, std::move(suggestion), length);
}

void Parser::errorExpected(const std::string &what, ErrorKind kind, std::string suggestion)
{
    const Token &tok = peek();
    if (tok.kind == TokenKind::Eof)
    {
        errorAt(tok.loc,
                ErrorKind::UnexpectedEndOfInput,
                "unexpected end of input, expected " + what,
                std::move(suggestion));
        return;
    }
    error(kind, "expected " + what + ", got " + describeToken(tok), std::move(suggestion));
}

void Parser::declare(const Token &name, const std::string &type)
{
    if (symbols_.insert(name.text, type, name.loc))
        return;

    std::string message = "duplicate declaration of '" + name.text + "' in scope '" +
                          symbols_.currentScopeName() + "'";
    if (auto previous = symbols_.lookupInCurrentScope(name.text); previous && previous->loc.isValid())
        message += " (first declared at line " + std::to_string(previous->loc.line) + ")";
    errorAt(name.loc,
            ErrorKind::DuplicateDeclaration,
            message,
            {},
            static_cast<uint32_t>(name.text.size()));
}

//===----------------------------------------------------------------------===//
// Grammar Table Interpretation
//===----------------------------------------------------------------------===//

NodePtr Parser::parseRule(std::string_view name)
{
    const Production *prod = grammar_.production(name);
    if (!prod)
    {
        if (grammar_.isBuiltin(name))
            return parseBuiltin(name);
        error(ErrorKind::InvalidSyntax, "no grammar rule named '" + std::string(name) + "'");
        return nullptr;
    }

    auto node = ParseTreeNode::makeNonTerminal(prod->name, peek().loc);
    if (prod->alternatives.size() == 1)
        return parseAlternative(prod->alternatives.front(), *node) ? std::move(node) : nullptr;

    // A single viable alternative is parsed for real. Speculating on it would
    // parse it twice on failure, and twice again for every nested rule.
    const Alternative *only = nullptr;
    std::size_t viable = 0;
    for (const auto &alt : prod->alternatives)
    {
        if (startsAlternative(alt))
        {
            only = &alt;
            ++viable;
        }
    }
    if (viable == 1)
        return parseAlternative(*only, *node) ? std::move(node) : nullptr;

    for (const auto &alt : prod->alternatives)
    {
        if (!startsAlternative(alt))
            continue;
        Speculation spec(*this, node.get());
        if (parseAlternative(alt, *node) && spec.clean())
        {
            spec.commit();
            return node;
        }
    }

    for (const auto &alt : prod->alternatives)
    {
        if (startsAlternative(alt))
            return parseAlternative(alt, *node) ? std::move(node) : nullptr;
    }

    errorExpected(prod->name, ErrorKind::InvalidSyntax);
    return nullptr;
}

bool Parser::parseAlternative(const Alternative &alt, ParseTreeNode &node)
{
    for (const auto &elem : alt)
    {
        switch (elem.repeat)
        {
            case Repeat::One:
                if (!parseSymbol(elem.symbol, node))
                    return false;
                break;
            case Repeat::Optional:
                if (startsSymbol(elem.symbol) && !parseSymbol(elem.symbol, node))
                    return false;
                break;
            case Repeat::ZeroOrMore:
                while (startsSymbol(elem.symbol))
                {
                    const std::size_t before = tokenPos_;
                    if (!parseSymbol(elem.symbol, node))
                        return false;
                    if (tokenPos_ == before)
                        break;
                }
                break;
        }
    }
    return true;
}

bool Parser::parseSymbol(const GrammarSymbol &sym, ParseTreeNode &node)
{
    if (sym.isTerminal())
    {
        if (sym.matches(peek()))
        {
            node.addToken(advance());
            return true;
        }
        const std::string what = sym.describe();
        errorExpected(what + " in " + node.label(), ErrorKind::MissingToken, "Insert " + what);
        return false;
    }

    NodePtr child = parseRule(sym.text);
    if (!child)
        return false;
    node.addChild(std::move(child));
    return true;
}

bool Parser::startsSymbol(const GrammarSymbol &sym)
{
    if (sym.isTerminal())
        return sym.matches(peek());
    return startsRule(sym.text);
}

bool Parser::startsAlternative(const Alternative &alt)
{
    for (const auto &elem : alt)
    {
        if (elem.repeat == Repeat::One)
            return startsSymbol(elem.symbol);
        if (startsSymbol(elem.symbol))
            return true;
    }
    return true;
}

bool Parser::startsRule(std::string_view name)
{
    if (const Production *prod = grammar_.production(name))
    {
        for (const auto &alt : prod->alternatives)
        {
            if (startsAlternative(alt))
                return true;
        }
        return false;
    }

    if (name == "Expression")
        return canStartExpression();
    if (name == "Lambda")
        return check(TokenKind::Identifier) && check(TokenKind::MethodOp, "->", 1);
    if (name == "DataType")
        return isDeclarationStart();
    if (name == "StringLiteral")
        return check(TokenKind::StringDelimiter);
    if (name == "Block")
        return check(TokenKind::Delimiter, "{");
    return false;
}

NodePtr Parser::parseBuiltin(std::string_view name)
{
    if (name == "Expression")
        return parseExpression();
    if (name == "Lambda")
        return parseLambda();
    if (name == "DataType")
        return parseDataType();
    if (name == "StringLiteral")
        return parseStringLiteral();
    if (name == "Block")
        return parseBlock(true);

    error(ErrorKind::InvalidSyntax, "no parser for grammar builtin '" + std::string(name) + "'");
    return nullptr;
}

} // namespace xpresso::frontends::xp
