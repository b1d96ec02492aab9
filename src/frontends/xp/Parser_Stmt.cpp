//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing for the X-presso parser.
///
/// @details Statements dispatch on their leading token. Fixed-shape forms
/// (print, inspect, inline_query, ALIAS) are delegated to the grammar table
/// through parseRule(); control flow and declarations are parsed here.
///
/// Every statement parser returns nullptr after reporting exactly one
/// diagnostic. The statement loops in parseBlock() and parseCase() then call
/// recover() and continue with the next statement.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Parser.hpp"

#include <optional>
#include <utility>

namespace xpresso::frontends::xp
{

namespace
{

constexpr int kHighestBinaryLevel = 15;

/// @brief Rebuild a token from a terminal node produced by a table rule.
Token tokenOf(const ParseTreeNode &terminal)
{
    Token tok;
    tok.kind = TokenKind::Identifier;
    tok.text = terminal.label();
    tok.loc = terminal.loc();
    return tok;
}

} // namespace

NodePtr Parser::parseStatement()
{
    NestingGuard depth(*this, stmtDepth_, options_.maxStatementDepth, "statement");
    if (!depth.ok())
        return nullptr;
    return parseStatementImpl();
}

NodePtr Parser::parseStatementImpl()
{
    const Token &tok = peek();

    if (tok.is(TokenKind::Delimiter, "{"))
        return parseBlock(true);

    if (tok.is(TokenKind::PunctDelimiter, ";"))
    {
        auto node = ParseTreeNode::makeNonTerminal("EmptyStmt");
        node->addToken(advance());
        return node;
    }

    if (tok.kind == TokenKind::Keyword)
    {
        if (tok.text == "if")
            return parseIf();
        if (tok.text == "switch" || tok.text == "switch-fall")
            return parseSwitch();
        if (tok.text == "while")
            return parseWhile();
        if (tok.text == "do")
            return parseDo();
        if (tok.text == "for")
            return parseFor();
        if (tok.text == "break")
            return parseBreak();
        if (tok.text == "exit when")
            return parseExitWhen(true);
        if (tok.text == "Output")
            return parseRule("PrintStmt");
    }

    if (tok.kind == TokenKind::ReservedWord)
    {
        if (tok.text == "inspect")
            return parseRule("InspectStmt");
        if (tok.text == "inline_query")
            return parseRule("QueryBlock");
    }

    if (isAliasDeclaration())
    {
        NodePtr alias = parseRule("AliasDecl");
        if (!alias)
            return nullptr;
        // AliasDecl := DataType ident '=' ALIAS ident ';'
        if (const ParseTreeNode *name = alias->child(1))
        {
            const ParseTreeNode *type = alias->child(0);
            declare(tokenOf(*name), type ? flattenText(*type) : std::string());
        }
        return alias;
    }

    if (isDeclarationStart())
        return parseDeclaration();

    return parseExpressionStatement();
}

//===----------------------------------------------------------------------===//
// Blocks
//===----------------------------------------------------------------------===//

NodePtr Parser::parseBlock(bool newScope)
{
    auto node = ParseTreeNode::makeNonTerminal("Block");
    if (!expect(TokenKind::Delimiter, "{", "to open block", *node))
        return nullptr;

    std::optional<SymbolTable::ScopeGuard> scope;
    if (newScope)
        scope.emplace(symbols_, "block");

    while (!check(TokenKind::Delimiter, "}") && !check(TokenKind::Eof))
    {
        const std::size_t startPos = tokenPos_;
        if (NodePtr stmt = parseStatement())
            node->addChild(std::move(stmt));
        else
            recover(startPos);
    }

    if (check(TokenKind::Eof))
    {
        errorAt(peek().loc,
                ErrorKind::UnexpectedEndOfInput,
                "unexpected end of input, expected '}' to close block",
                "Insert '}'");
        return node;
    }

    node->addToken(advance());
    return node;
}

NodePtr Parser::parseBody()
{
    if (check(TokenKind::Delimiter, "{"))
        return parseBlock(true);
    return parseStatement();
}

//===----------------------------------------------------------------------===//
// Control flow
//===----------------------------------------------------------------------===//

NodePtr Parser::parseIf()
{
    auto node = ParseTreeNode::makeNonTerminal("IfStmt");
    node->addToken(advance());

    if (!expect(TokenKind::Delimiter, "(", "after 'if'", *node))
        return nullptr;
    NodePtr cond = parseExpression();
    if (!cond)
        return nullptr;
    node->addChild(std::move(cond));
    if (!expect(TokenKind::Delimiter, ")", "after if condition", *node))
        return nullptr;

    NodePtr thenBody = parseBody();
    if (!thenBody)
        return nullptr;
    node->addChild(std::move(thenBody));

    if (match(TokenKind::Keyword, "else", *node))
    {
        // `else if` nests naturally: the else body is an IfStmt.
        NodePtr elseBody = parseBody();
        if (!elseBody)
            return nullptr;
        node->addChild(std::move(elseBody));
    }
    return node;
}

NodePtr Parser::parseSwitch()
{
    auto node = ParseTreeNode::makeNonTerminal("SwitchStmt");
    node->addToken(advance());

    if (!expect(TokenKind::Delimiter, "(", "after switch keyword", *node))
        return nullptr;
    NodePtr subject = parseExpression();
    if (!subject)
        return nullptr;
    node->addChild(std::move(subject));
    if (!expect(TokenKind::Delimiter, ")", "after switch subject", *node))
        return nullptr;
    if (!expect(TokenKind::Delimiter, "{", "to open switch body", *node))
        return nullptr;

    while (!check(TokenKind::Delimiter, "}") && !check(TokenKind::Eof))
    {
        const std::size_t startPos = tokenPos_;
        if (check(TokenKind::Keyword, "case") || check(TokenKind::Keyword, "default"))
        {
            if (NodePtr clause = parseCase())
            {
                node->addChild(std::move(clause));
                continue;
            }
        }
        else
        {
            errorExpected("'case', 'default' or '}' in switch",
                          ErrorKind::UnexpectedToken,
                          "Start each branch with 'case VALUE:' or 'default:'");
        }

        // Resume at the next branch; statement starts inside a broken
        // branch are not useful sync points here.
        while (!check(TokenKind::Keyword, "case") && !check(TokenKind::Keyword, "default") &&
               !check(TokenKind::Delimiter, "}") && !check(TokenKind::Eof))
            advance();
        if (tokenPos_ == startPos && !check(TokenKind::Eof) && !check(TokenKind::Delimiter, "}"))
            advance();
    }

    if (!expect(TokenKind::Delimiter, "}", "to close switch body", *node))
        return nullptr;
    return node;
}

NodePtr Parser::parseCase()
{
    const bool isDefault = check(TokenKind::Keyword, "default");
    auto node = ParseTreeNode::makeNonTerminal(isDefault ? "DefaultClause" : "CaseClause");
    node->addToken(advance());

    if (!isDefault)
    {
        // Stop below the ternary level so the label's ':' is not consumed.
        NodePtr value = parseBinary(kHighestBinaryLevel);
        if (!value)
            return nullptr;
        node->addChild(std::move(value));
    }

    if (!expect(TokenKind::PunctDelimiter, ":", isDefault ? "after 'default'" : "after case label", *node))
        return nullptr;

    while (!check(TokenKind::Keyword, "case") && !check(TokenKind::Keyword, "default") &&
           !check(TokenKind::Delimiter, "}") && !check(TokenKind::Eof))
    {
        const std::size_t startPos = tokenPos_;
        if (NodePtr stmt = parseStatement())
            node->addChild(std::move(stmt));
        else
            recover(startPos);
    }
    return node;
}

NodePtr Parser::parseWhile()
{
    auto node = ParseTreeNode::makeNonTerminal("WhileStmt");
    node->addToken(advance());

    if (!expect(TokenKind::Delimiter, "(", "after 'while'", *node))
        return nullptr;
    NodePtr cond = parseExpression();
    if (!cond)
        return nullptr;
    node->addChild(std::move(cond));
    if (!expect(TokenKind::Delimiter, ")", "after while condition", *node))
        return nullptr;

    if (check(TokenKind::Keyword, "exit when"))
    {
        NodePtr exitClause = parseExitWhen(false);
        if (!exitClause)
            return nullptr;
        node->addChild(std::move(exitClause));
    }

    NodePtr body = parseBody();
    if (!body)
        return nullptr;
    node->addChild(std::move(body));
    return node;
}

NodePtr Parser::parseExitWhen(bool requireSemicolon)
{
    auto node = ParseTreeNode::makeNonTerminal(requireSemicolon ? "ExitWhenStmt" : "ExitWhenClause");
    node->addToken(advance());

    if (!expect(TokenKind::Delimiter, "(", "after 'exit when'", *node))
        return nullptr;
    NodePtr cond = parseExpression();
    if (!cond)
        return nullptr;
    node->addChild(std::move(cond));
    if (!expect(TokenKind::Delimiter, ")", "after exit condition", *node))
        return nullptr;
    if (requireSemicolon && !expect(TokenKind::PunctDelimiter, ";", "after 'exit when' statement", *node))
        return nullptr;
    return node;
}

NodePtr Parser::parseDo()
{
    if (check(TokenKind::Keyword, "for", 1))
    {
        auto node = ParseTreeNode::makeNonTerminal("ForEachStmt");
        node->addToken(advance());
        return parseEnhancedFor(std::move(node));
    }

    auto node = ParseTreeNode::makeNonTerminal("DoWhileStmt");
    node->addToken(advance());

    NodePtr body = parseBlock(true);
    if (!body)
        return nullptr;
    node->addChild(std::move(body));

    if (!expect(TokenKind::Keyword, "while", "after 'do' block", *node))
        return nullptr;
    if (!expect(TokenKind::Delimiter, "(", "after 'while'", *node))
        return nullptr;
    NodePtr cond = parseExpression();
    if (!cond)
        return nullptr;
    node->addChild(std::move(cond));
    if (!expect(TokenKind::Delimiter, ")", "after while condition", *node))
        return nullptr;
    if (!expect(TokenKind::PunctDelimiter, ";", "after do-while loop", *node))
        return nullptr;
    return node;
}

NodePtr Parser::parseEnhancedFor(NodePtr node)
{
    node->addToken(advance());
    if (!expect(TokenKind::Delimiter, "(", "after 'do for'", *node))
        return nullptr;

    SymbolTable::ScopeGuard scope(symbols_, "for");

    if (check(TokenKind::Identifier) && check(TokenKind::Keyword, "in", 1))
    {
        // do for (item in items)
        Token element = advance();
        node->addToken(element);
        declare(element, "element");
        node->addToken(advance());
        if (!expectIdentifier("collection name after 'in'", *node))
            return nullptr;
    }
    else
    {
        // do for (Type item : expr)
        NodePtr type = parseDataType();
        if (!type)
            return nullptr;
        const std::string typeText = flattenText(*type);
        node->addChild(std::move(type));

        Token element;
        if (!expectIdentifier("loop variable name", *node, &element))
            return nullptr;
        declare(element, typeText);

        if (!expect(TokenKind::PunctDelimiter, ":", "after loop variable", *node))
            return nullptr;
        NodePtr source = parseExpression();
        if (!source)
            return nullptr;
        node->addChild(std::move(source));
    }

    if (!expect(TokenKind::Delimiter, ")", "to close loop header", *node))
        return nullptr;

    NodePtr body = parseBody();
    if (!body)
        return nullptr;
    node->addChild(std::move(body));
    return node;
}

NodePtr Parser::parseFor()
{
    auto node = ParseTreeNode::makeNonTerminal("ForStmt");
    node->addToken(advance());
    if (!expect(TokenKind::Delimiter, "(", "after 'for'", *node))
        return nullptr;

    SymbolTable::ScopeGuard scope(symbols_, "for");

    // Initializer; the declaration and expression forms consume their ';'.
    if (!match(TokenKind::PunctDelimiter, ";", *node))
    {
        NodePtr init = isDeclarationStart() ? parseDeclaration() : parseExpressionStatement();
        if (!init)
            return nullptr;
        node->addChild(std::move(init));
    }

    if (!check(TokenKind::PunctDelimiter, ";"))
    {
        NodePtr cond = parseExpression();
        if (!cond)
            return nullptr;
        node->addChild(std::move(cond));
    }
    if (!expect(TokenKind::PunctDelimiter, ";", "after for condition", *node))
        return nullptr;

    if (!check(TokenKind::Delimiter, ")"))
    {
        while (true)
        {
            NodePtr update = parseExpression();
            if (!update)
                return nullptr;
            node->addChild(std::move(update));
            if (!match(TokenKind::PunctDelimiter, ",", *node))
                break;
        }
    }
    if (!expect(TokenKind::Delimiter, ")", "to close for header", *node))
        return nullptr;

    NodePtr body = parseBody();
    if (!body)
        return nullptr;
    node->addChild(std::move(body));
    return node;
}

NodePtr Parser::parseBreak()
{
    auto node = ParseTreeNode::makeNonTerminal("BreakStmt");
    node->addToken(advance());
    if (!expect(TokenKind::PunctDelimiter, ";", "after 'break'", *node))
        return nullptr;
    return node;
}

//===----------------------------------------------------------------------===//
// Declarations and expression statements
//===----------------------------------------------------------------------===//

bool Parser::isDeclarationStart()
{
    if (grammar_.isDataType(peek()) || check(TokenKind::ObjectDelimiter, "<"))
        return true;
    if (!check(TokenKind::Identifier))
        return false;

    // Class-typed locals: `Account acct` or `Account[] list`.
    std::size_t offset = 1;
    while (check(TokenKind::Delimiter, "[", offset) && check(TokenKind::Delimiter, "]", offset + 1))
        offset += 2;
    return check(TokenKind::Identifier, offset);
}

bool Parser::isAliasDeclaration()
{
    if (!startsRule("DataType"))
        return false;

    Speculation spec(*this);
    NodePtr type = parseDataType();
    return type && spec.clean() && check(TokenKind::Identifier) &&
           check(TokenKind::AssignOp, "=", 1) && check(TokenKind::ReservedWord, "ALIAS", 2);
}

NodePtr Parser::parseDataType()
{
    auto node = ParseTreeNode::makeNonTerminal("DataType");

    if (grammar_.isDataType(peek()) || check(TokenKind::Identifier))
    {
        node->addToken(advance());
    }
    else if (check(TokenKind::ObjectDelimiter, "<"))
    {
        node->addToken(advance());
        if (check(TokenKind::StringDelimiter))
        {
            NodePtr name = parseStringLiteral();
            if (!name)
                return nullptr;
            node->addChild(std::move(name));
        }
        else if (!match(TokenKind::StringLiteral, "", *node))
        {
            errorExpected("object type name after '<'", ErrorKind::MissingToken, "Write the type as <Name>");
            return nullptr;
        }
        if (!expect(TokenKind::ObjectDelimiter, ">", "to close object type", *node))
            return nullptr;
    }
    else
    {
        errorExpected("type name",
                      ErrorKind::UnexpectedToken,
                      "Use a built-in type such as int or str, or a class name");
        return nullptr;
    }

    while (check(TokenKind::Delimiter, "[") && check(TokenKind::Delimiter, "]", 1))
    {
        node->addToken(advance());
        node->addToken(advance());
    }
    return node;
}

NodePtr Parser::parseDeclaration()
{
    auto node = ParseTreeNode::makeNonTerminal("Declaration");
    NodePtr type = parseDataType();
    if (!type)
        return nullptr;
    const std::string typeText = flattenText(*type);
    node->addChild(std::move(type));

    // int a, b = 2, c;
    do
    {
        auto declarator = ParseTreeNode::makeNonTerminal("Declarator");
        Token name;
        if (!expectIdentifier("variable name", *declarator, &name))
            return nullptr;
        declare(name, typeText);

        if (match(TokenKind::AssignOp, "=", *declarator))
        {
            NodePtr init = parseExpression();
            if (!init)
                return nullptr;
            declarator->addChild(std::move(init));
        }
        node->addChild(std::move(declarator));
    } while (match(TokenKind::PunctDelimiter, ",", *node));

    if (!expect(TokenKind::PunctDelimiter, ";", "after declaration", *node))
        return nullptr;
    return node;
}

NodePtr Parser::parseExpressionStatement()
{
    auto node = ParseTreeNode::makeNonTerminal("ExpressionStmt");
    NodePtr expr = parseExpression();
    if (!expr)
        return nullptr;
    node->addChild(std::move(expr));
    if (!expect(TokenKind::PunctDelimiter, ";", "after expression", *node))
        return nullptr;
    return node;
}

} // namespace xpresso::frontends::xp
