//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing: assignment, ternary, table-driven binary
///        levels, unary, postfix/member access and primaries.
///
/// @details Binary levels 5-15 are handled by parseBinary(), which reads each
/// level's operators and associativity from the grammar table. Every binary
/// node has children [lhs, operator, rhs].
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Parser.hpp"

#include <utility>

namespace xpresso::frontends::xp
{

namespace
{

constexpr int kPostfixLevel = 3;
constexpr int kPrefixLevel = 4;
constexpr int kLowestBinaryLevel = 5;
constexpr int kHighestBinaryLevel = 15;
constexpr int kAssignmentLevel = 17;

} // namespace

NodePtr Parser::parseExpression()
{
    return parseAssignment();
}

//===----------------------------------------------------------------------===//
// Assignment and ternary
//===----------------------------------------------------------------------===//

NodePtr Parser::parseAssignment()
{
    NestingGuard depth(*this, exprDepth_, options_.maxExpressionDepth, "expression");
    if (!depth.ok())
        return nullptr;

    NodePtr target = parseTernary();
    if (!target)
        return nullptr;
    if (!grammar_.level(kAssignmentLevel).matches(peek()))
        return target;

    auto node = ParseTreeNode::makeNonTerminal("AssignExpr");
    node->addChild(std::move(target));
    node->addToken(advance());

    // Right associative: a = b = 5 is a = (b = 5).
    NodePtr value = parseAssignment();
    if (!value)
        return nullptr;
    node->addChild(std::move(value));
    return node;
}

NodePtr Parser::parseTernary()
{
    NodePtr cond = parseBinary(kHighestBinaryLevel);
    if (!cond)
        return nullptr;
    if (!check(TokenKind::PunctDelimiter, "?"))
        return cond;

    auto node = ParseTreeNode::makeNonTerminal("TernaryExpr");
    node->addChild(std::move(cond));
    node->addToken(advance());

    NodePtr thenExpr = parseAssignment();
    if (!thenExpr)
        return nullptr;
    node->addChild(std::move(thenExpr));

    if (!expect(TokenKind::PunctDelimiter, ":", "in conditional expression", *node))
        return nullptr;

    NodePtr elseExpr = parseTernary();
    if (!elseExpr)
        return nullptr;
    node->addChild(std::move(elseExpr));
    return node;
}

//===----------------------------------------------------------------------===//
// Binary levels
//===----------------------------------------------------------------------===//

NodePtr Parser::parseBinary(int level)
{
    if (level < kLowestBinaryLevel)
        return parseUnary();

    const PrecedenceLevel &lvl = grammar_.level(level);
    NodePtr lhs = parseBinary(level - 1);
    if (!lhs)
        return nullptr;

    while (lvl.matches(peek()))
    {
        auto node = ParseTreeNode::makeNonTerminal("BinaryExpr");
        node->addChild(std::move(lhs));
        node->addToken(advance());

        NodePtr rhs = lvl.assoc == Assoc::Right ? parseBinary(level) : parseBinary(level - 1);
        if (!rhs)
            return nullptr;
        node->addChild(std::move(rhs));
        lhs = std::move(node);
    }
    return lhs;
}

//===----------------------------------------------------------------------===//
// Unary and postfix
//===----------------------------------------------------------------------===//

NodePtr Parser::parseUnary()
{
    if (!grammar_.level(kPrefixLevel).matches(peek()))
        return parsePostfix();

    NestingGuard depth(*this, exprDepth_, options_.maxExpressionDepth, "expression");
    if (!depth.ok())
        return nullptr;

    auto node = ParseTreeNode::makeNonTerminal("UnaryExpr");
    node->addToken(advance());
    NodePtr operand = parseUnary();
    if (!operand)
        return nullptr;
    node->addChild(std::move(operand));
    return node;
}

NodePtr Parser::parsePostfix()
{
    NodePtr expr = parsePrimary();
    if (!expr)
        return nullptr;
    return parsePostfixFrom(std::move(expr));
}

NodePtr Parser::parsePostfixFrom(NodePtr expr)
{
    while (expr)
    {
        if (check(TokenKind::MethodOp))
        {
            expr = parseMemberSuffix(std::move(expr));
            continue;
        }

        if (check(TokenKind::Delimiter, "("))
        {
            auto call = ParseTreeNode::makeNonTerminal("CallExpr");
            call->addChild(std::move(expr));
            call->addToken(advance());
            if (!parseCallArguments(*call))
                return nullptr;
            expr = std::move(call);
            continue;
        }

        if (check(TokenKind::Delimiter, "["))
        {
            auto index = ParseTreeNode::makeNonTerminal("IndexExpr");
            index->addChild(std::move(expr));
            index->addToken(advance());
            NodePtr subscript = parseExpression();
            if (!subscript)
                return nullptr;
            index->addChild(std::move(subscript));
            if (!expect(TokenKind::Delimiter, "]", "to close index", *index))
                return nullptr;
            expr = std::move(index);
            continue;
        }

        if (grammar_.level(kPostfixLevel).matches(peek()))
        {
            auto post = ParseTreeNode::makeNonTerminal("PostfixExpr");
            post->addChild(std::move(expr));
            post->addToken(advance());
            expr = std::move(post);
            continue;
        }

        break;
    }
    return expr;
}

NodePtr Parser::parseMemberSuffix(NodePtr object)
{
    auto node = ParseTreeNode::makeNonTerminal("MemberExpr");
    node->addChild(std::move(object));
    const Token op = advance();
    node->addToken(op);

    const Token &name = peek();
    std::string_view rule;
    if (name.kind == TokenKind::ReservedWord)
    {
        if (name.text == "export_as")
            rule = "ExportCall";
        else if (name.text == "toMixed")
            rule = "ToMixedCall";
        else if (name.text == "filter_by")
            rule = "FilterCall";
        else if (name.text == "validate")
            rule = "ValidateCall";
        else if (name.text == "modify")
            rule = "ModifyCall";
    }
    if (rule.empty() && grammar_.isDateOperation(name) && name.text != "today" &&
        check(TokenKind::Delimiter, "(", 1))
        rule = "DateOpCall";

    if (!rule.empty())
    {
        NodePtr call = parseRule(rule);
        if (!call)
            return nullptr;
        node->addChild(std::move(call));
        return node;
    }

    if (name.kind == TokenKind::Identifier || name.kind == TokenKind::Keyword ||
        name.kind == TokenKind::ReservedWord)
    {
        node->addToken(advance());
        return node;
    }

    errorExpected("member name after '" + op.text + "'", ErrorKind::UnexpectedToken);
    return nullptr;
}

bool Parser::parseCallArguments(ParseTreeNode &call)
{
    if (!check(TokenKind::Delimiter, ")"))
    {
        while (true)
        {
            NodePtr arg = parseExpression();
            if (!arg)
                return false;
            call.addChild(std::move(arg));
            if (!match(TokenKind::PunctDelimiter, ",", call))
                break;
        }
    }
    return expect(TokenKind::Delimiter, ")", "to close argument list", call);
}

//===----------------------------------------------------------------------===//
// Primaries
//===----------------------------------------------------------------------===//

bool Parser::canStartExpression(std::size_t offset)
{
    const Token &tok = peek(offset);
    switch (tok.kind)
    {
        case TokenKind::Identifier:
        case TokenKind::IntLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::BoolLiteral:
        case TokenKind::NullLiteral:
        case TokenKind::DateLiteral:
        case TokenKind::FractionLiteral:
        case TokenKind::ComplexLiteral:
        case TokenKind::CharLiteral:
        case TokenKind::StringDelimiter:
        case TokenKind::Unknown:
            return true;
        case TokenKind::Delimiter:
            return tok.text == "(" || tok.text == "{" || tok.text == "[";
        case TokenKind::Keyword:
            return tok.text == "Input";
        case TokenKind::ReservedWord:
            return tok.text == "STRICT" || tok.text == "today";
        default:
            return grammar_.level(kPrefixLevel).matches(tok);
    }
}

NodePtr Parser::parsePrimary()
{
    const Token &tok = peek();
    switch (tok.kind)
    {
        case TokenKind::Identifier:
            if (check(TokenKind::MethodOp, "->", 1))
                return parseLambda();
            return ParseTreeNode::makeTerminal(advance());

        case TokenKind::IntLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::BoolLiteral:
        case TokenKind::NullLiteral:
        case TokenKind::DateLiteral:
        case TokenKind::FractionLiteral:
        case TokenKind::ComplexLiteral:
        case TokenKind::CharLiteral:
            return ParseTreeNode::makeTerminal(advance());

        case TokenKind::Unknown:
            // Already diagnosed by the lexer; keep it as an operand.
            return ParseTreeNode::makeTerminal(advance());

        case TokenKind::StringDelimiter:
            return parseStringLiteral();

        case TokenKind::Delimiter:
            if (tok.text == "(")
            {
                auto node = ParseTreeNode::makeNonTerminal("ParenExpr");
                node->addToken(advance());
                NodePtr inner = parseExpression();
                if (!inner)
                    return nullptr;
                node->addChild(std::move(inner));
                if (!expect(TokenKind::Delimiter, ")", "to close parenthesized expression", *node))
                    return nullptr;
                return node;
            }
            if (tok.text == "{")
                return parseArrayLiteral();
            if (tok.text == "[")
                return parseBracketLiteral();
            break;

        case TokenKind::Keyword:
            if (tok.text == "Input")
                return parseRule("InputExpr");
            break;

        case TokenKind::ReservedWord:
            if (tok.text == "STRICT")
                return parseRule("InputExpr");
            if (tok.text == "today")
                return parseRule("TodayCall");
            break;

        default:
            break;
    }

    errorExpected("expression",
                  ErrorKind::UnexpectedToken,
                  "Provide a value, variable or parenthesized expression");
    return nullptr;
}

NodePtr Parser::parseBracketLiteral()
{
    std::string label = "BracketExpr";
    if (check(TokenKind::DateLiteral, 1))
        label = "DateLiteral";
    else if (check(TokenKind::FractionLiteral, 1))
        label = "FractionLiteral";

    auto node = ParseTreeNode::makeNonTerminal(label);
    node->addToken(advance());
    NodePtr inner = parseExpression();
    if (!inner)
        return nullptr;
    node->addChild(std::move(inner));
    if (!expect(TokenKind::Delimiter, "]", "to close bracketed literal", *node))
        return nullptr;
    return node;
}

NodePtr Parser::parseArrayLiteral()
{
    auto node = ParseTreeNode::makeNonTerminal("ArrayLiteral");
    node->addToken(advance());

    if (!check(TokenKind::Delimiter, "}"))
    {
        while (true)
        {
            NodePtr element = parseExpression();
            if (!element)
                return nullptr;
            node->addChild(std::move(element));
            if (!match(TokenKind::PunctDelimiter, ",", *node))
                break;
        }
    }

    if (!expect(TokenKind::Delimiter, "}", "to close array literal", *node))
        return nullptr;
    return node;
}

NodePtr Parser::parseStringLiteral()
{
    if (!check(TokenKind::StringDelimiter))
    {
        errorExpected("string literal", ErrorKind::UnexpectedToken);
        return nullptr;
    }

    auto node = ParseTreeNode::makeNonTerminal("StringLiteral");
    node->addToken(advance());
    while (check(TokenKind::StringLiteral) || check(TokenKind::EscapeChar) ||
           check(TokenKind::CharLiteral) || check(TokenKind::Unknown))
        node->addToken(advance());

    // A missing closing quote was reported by the lexer.
    match(TokenKind::StringDelimiter, "", *node);
    return node;
}

//===----------------------------------------------------------------------===//
// Lambdas
//===----------------------------------------------------------------------===//

NodePtr Parser::parseLambda()
{
    auto node = ParseTreeNode::makeNonTerminal("LambdaExpr");
    Token param;
    if (!expectIdentifier("lambda parameter", *node, &param))
        return nullptr;
    if (!expect(TokenKind::MethodOp, "->", "after lambda parameter", *node))
        return nullptr;

    SymbolTable::ScopeGuard scope(symbols_, "lambda");
    declare(param, "lambda parameter");

    NodePtr body = check(TokenKind::Delimiter, "{") ? parseBlock(false) : parseExpression();
    if (!body)
        return nullptr;
    node->addChild(std::move(body));
    return node;
}

} // namespace xpresso::frontends::xp
