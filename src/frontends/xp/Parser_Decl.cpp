//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Decl.cpp
/// @brief Program, class and member parsing for the X-presso parser.
///
/// @details A member's kind is only known after its modifiers, type and name
/// have been read: `(` after the name makes it a Method, anything else a
/// Field. Modifiers are therefore collected first and checked against the
/// member kind once it is known.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Parser.hpp"

#include <utility>
#include <vector>

namespace xpresso::frontends::xp
{

namespace
{

void appendText(const ParseTreeNode &node, std::string &out)
{
    if (node.isTerminal())
    {
        out += node.label();
        return;
    }
    for (const auto &child : node.children())
        appendText(*child, out);
}

const char *contextName(ModifierContext ctx)
{
    switch (ctx)
    {
        case ModifierContext::Class:
            return "class";
        case ModifierContext::Method:
            return "method";
        case ModifierContext::Field:
            return "field";
    }
    return "member";
}

} // namespace

std::string flattenText(const ParseTreeNode &node)
{
    std::string out;
    appendText(node, out);
    return out;
}

//===----------------------------------------------------------------------===//
// Program
//===----------------------------------------------------------------------===//

NodePtr Parser::parseProgram()
{
    auto program = ParseTreeNode::makeNonTerminal("Program", peek().loc);

    while (!check(TokenKind::Eof))
    {
        const std::size_t startPos = tokenPos_;

        if (check(TokenKind::Delimiter, "}"))
        {
            error(ErrorKind::UnexpectedToken,
                  "unexpected '}' outside of any block",
                  "Remove the extra '}'");
            advance();
            continue;
        }

        NodePtr item = isClassStart() ? parseClass() : parseStatement();
        if (item)
            program->addChild(std::move(item));
        else
            recover(startPos);
    }
    return program;
}

//===----------------------------------------------------------------------===//
// Classes
//===----------------------------------------------------------------------===//

bool Parser::isClassStart()
{
    std::size_t offset = 0;
    while (grammar_.isAccessModifier(peek(offset)) ||
           grammar_.isModifierFor(ModifierContext::Class, peek(offset)))
        ++offset;
    return check(TokenKind::ReservedWord, "class", offset);
}

NodePtr Parser::parseClass()
{
    NestingGuard depth(*this, stmtDepth_, options_.maxStatementDepth, "class");
    if (!depth.ok())
        return nullptr;

    auto node = ParseTreeNode::makeNonTerminal("ClassDecl");

    while (grammar_.isAccessModifier(peek()) ||
           grammar_.isModifierFor(ModifierContext::Class, peek()))
        node->addToken(advance());

    if (!expect(TokenKind::ReservedWord, "class", "in class declaration", *node))
        return nullptr;

    Token name;
    if (!expectIdentifier("class name", *node, &name))
        return nullptr;
    declare(name, "class");

    SymbolTable::ScopeGuard scope(symbols_, name.text);

    if (check(TokenKind::InheritOp, ":>"))
    {
        NodePtr parents = parseRule("InheritanceList");
        if (!parents)
            return nullptr;
        node->addChild(std::move(parents));
    }
    if (check(TokenKind::InheritOp, ":>>"))
    {
        NodePtr interfaces = parseRule("InterfaceList");
        if (!interfaces)
            return nullptr;
        node->addChild(std::move(interfaces));
    }

    if (!expect(TokenKind::Delimiter, "{", "to open class body", *node))
        return nullptr;

    while (!check(TokenKind::Delimiter, "}") && !check(TokenKind::Eof))
    {
        const std::size_t startPos = tokenPos_;
        if (NodePtr member = parseMember())
            node->addChild(std::move(member));
        else
            recover(startPos);
    }

    if (check(TokenKind::Eof))
    {
        errorAt(peek().loc,
                ErrorKind::UnexpectedEndOfInput,
                "unexpected end of input, expected '}' to close class '" + name.text + "'",
                "Insert '}'");
        return node;
    }

    node->addToken(advance());
    return node;
}

//===----------------------------------------------------------------------===//
// Members
//===----------------------------------------------------------------------===//

NodePtr Parser::parseMember()
{
    if (isClassStart())
        return parseClass();

    std::vector<Token> modifiers;
    while (grammar_.isAccessModifier(peek()) ||
           grammar_.isModifierFor(ModifierContext::Method, peek()) ||
           grammar_.isModifierFor(ModifierContext::Field, peek()))
        modifiers.push_back(advance());

    const bool voidMain = checkWord("void") && check(TokenKind::ReservedWord, "main", 1);
    if (check(TokenKind::ReservedWord, "main") || voidMain)
    {
        auto node = ParseTreeNode::makeNonTerminal("MainMethod");
        for (const auto &mod : modifiers)
            node->addToken(mod);
        return parseMainMethod(std::move(node));
    }

    NodePtr type;
    std::string typeText;
    if (checkWord("void"))
    {
        type = ParseTreeNode::makeTerminal(advance());
        typeText = "void";
    }
    else
    {
        if (!isDeclarationStart() && !grammar_.isDataType(peek()) && !check(TokenKind::Identifier))
        {
            errorExpected("field, method or 'main' declaration",
                          ErrorKind::UnexpectedToken,
                          "Declare a member as 'TYPE name;' or 'TYPE name(...) { ... }'");
            return nullptr;
        }
        type = parseDataType();
        if (!type)
            return nullptr;
        typeText = flattenText(*type);
    }

    if (!check(TokenKind::Identifier))
    {
        errorExpected("member name after '" + typeText + "'",
                      ErrorKind::MissingToken,
                      "Provide a valid identifier");
        return nullptr;
    }
    const Token name = advance();

    const bool isMethod = check(TokenKind::Delimiter, "(");
    const ModifierContext ctx = isMethod ? ModifierContext::Method : ModifierContext::Field;
    auto node = ParseTreeNode::makeNonTerminal(isMethod ? "Method" : "Field");

    for (const auto &mod : modifiers)
    {
        if (!grammar_.isAccessModifier(mod) && !grammar_.isModifierFor(ctx, mod))
        {
            errorAt(mod.loc,
                    ErrorKind::InvalidSyntax,
                    "modifier '" + mod.text + "' is not allowed on a " + contextName(ctx),
                    "Remove '" + mod.text + "'",
                    static_cast<uint32_t>(mod.text.size()));
        }
        node->addToken(mod);
    }
    node->addChild(std::move(type));

    if (isMethod)
        return parseMethodRest(std::move(node), name, typeText);
    return parseFieldRest(std::move(node), name, typeText);
}

NodePtr Parser::parseMainMethod(NodePtr node)
{
    match(TokenKind::Identifier, "void", *node);

    Token name = peek();
    if (!expect(TokenKind::ReservedWord, "main", "in main declaration", *node))
        return nullptr;
    declare(name, "method");

    if (!expect(TokenKind::Delimiter, "(", "after 'main'", *node))
        return nullptr;

    // main(args) or main(str[] args)
    if (match(TokenKind::ReservedWord, "str", *node))
    {
        if (!expect(TokenKind::Delimiter, "[", "after 'str' in main parameters", *node) ||
            !expect(TokenKind::Delimiter, "]", "after 'str[' in main parameters", *node))
            return nullptr;
    }
    Token args = peek();
    if (!expect(TokenKind::Identifier, "args", "in main parameters", *node))
        return nullptr;
    if (!expect(TokenKind::Delimiter, ")", "to close main parameters", *node))
        return nullptr;

    SymbolTable::ScopeGuard scope(symbols_, "main");
    declare(args, "str[]");

    NodePtr body = parseBlock(false);
    if (!body)
        return nullptr;
    node->addChild(std::move(body));
    return node;
}

NodePtr Parser::parseMethodRest(NodePtr node, const Token &name, const std::string &type)
{
    node->addToken(name);
    declare(name, type);

    SymbolTable::ScopeGuard scope(symbols_, name.text);

    node->addToken(advance()); // (
    if (!check(TokenKind::Delimiter, ")"))
    {
        NodePtr params = parseParameters();
        if (!params)
            return nullptr;
        node->addChild(std::move(params));
    }
    if (!expect(TokenKind::Delimiter, ")", "to close parameter list", *node))
        return nullptr;

    if (check(TokenKind::Keyword, "where type"))
    {
        NodePtr constraint = parseRule("TypeConstraint");
        if (!constraint)
            return nullptr;
        node->addChild(std::move(constraint));
    }

    // Parameters and locals share the method scope.
    NodePtr body = parseBlock(false);
    if (!body)
        return nullptr;
    node->addChild(std::move(body));
    return node;
}

NodePtr Parser::parseFieldRest(NodePtr node, const Token &name, const std::string &type)
{
    Token current = name;
    while (true)
    {
        node->addToken(current);
        declare(current, type);

        if (match(TokenKind::AssignOp, "=", *node))
        {
            NodePtr init = parseExpression();
            if (!init)
                return nullptr;
            node->addChild(std::move(init));
        }

        if (!match(TokenKind::PunctDelimiter, ",", *node))
            break;
        if (!check(TokenKind::Identifier))
        {
            errorExpected("field name after ','", ErrorKind::MissingToken, "Provide a valid identifier");
            return nullptr;
        }
        current = advance();
    }

    if (!expect(TokenKind::PunctDelimiter, ";", "after field declaration", *node))
        return nullptr;
    return node;
}

NodePtr Parser::parseParameters()
{
    auto node = ParseTreeNode::makeNonTerminal("Parameters");
    do
    {
        auto param = ParseTreeNode::makeNonTerminal("Parameter");
        NodePtr type = parseDataType();
        if (!type)
            return nullptr;
        const std::string typeText = flattenText(*type);
        param->addChild(std::move(type));

        Token name;
        if (!expectIdentifier("parameter name", *param, &name))
            return nullptr;
        declare(name, typeText);
        node->addChild(std::move(param));
    } while (match(TokenKind::PunctDelimiter, ",", *node));
    return node;
}

} // namespace xpresso::frontends::xp
