//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.cpp
/// @brief Token kind names and classification helpers.
///
/// The printable names are part of the tool's output format (token dumps and
/// JSON `type` fields) and must stay stable.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/Token.hpp"

namespace xpresso::frontends::xp
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Identifier:
            return "IDENTIFIER";
        case TokenKind::Keyword:
            return "KEYWORD";
        case TokenKind::ReservedWord:
            return "RESERVED";
        case TokenKind::BoolLiteral:
            return "BOOL_LIT";
        case TokenKind::IntLiteral:
            return "INT_LIT";
        case TokenKind::FloatLiteral:
            return "FLOAT_LIT";
        case TokenKind::StringLiteral:
            return "STR_LIT";
        case TokenKind::CharLiteral:
            return "CHAR_LIT";
        case TokenKind::NullLiteral:
            return "NULL_LIT";
        case TokenKind::DateLiteral:
            return "DATE_LIT";
        case TokenKind::FractionLiteral:
            return "FRAC_LIT";
        case TokenKind::ComplexLiteral:
            return "COMP_LIT";
        case TokenKind::ArithmeticOp:
            return "ARITHMETIC_OP";
        case TokenKind::AssignOp:
            return "ASSIGN_OP";
        case TokenKind::RelationalOp:
            return "REL_OP";
        case TokenKind::LogicalOp:
            return "LOG_OP";
        case TokenKind::BitwiseOp:
            return "BIT_OP";
        case TokenKind::UnaryOp:
            return "UNARY_OP";
        case TokenKind::MethodOp:
            return "METHOD_OP";
        case TokenKind::LoopOp:
            return "LOOP_OP";
        case TokenKind::InheritOp:
            return "INHERIT_OP";
        case TokenKind::Delimiter:
            return "DELIM";
        case TokenKind::PunctDelimiter:
            return "PUNC_DELIM";
        case TokenKind::StringDelimiter:
            return "STR_DELIM";
        case TokenKind::ObjectDelimiter:
            return "OBJ_DELIM";
        case TokenKind::Comment:
            return "COMMENT";
        case TokenKind::Whitespace:
            return "WHITESPACE";
        case TokenKind::EscapeChar:
            return "ESCAPE_CHAR";
        case TokenKind::Eof:
            return "EOF";
        case TokenKind::Unknown:
            return "UNKNOWN";
    }
    return "?";
}

bool isOperatorKind(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::ArithmeticOp:
        case TokenKind::AssignOp:
        case TokenKind::RelationalOp:
        case TokenKind::LogicalOp:
        case TokenKind::BitwiseOp:
        case TokenKind::UnaryOp:
        case TokenKind::MethodOp:
        case TokenKind::LoopOp:
        case TokenKind::InheritOp:
            return true;
        default:
            return false;
    }
}

bool Token::isTrivia() const
{
    return kind == TokenKind::Whitespace || kind == TokenKind::Comment;
}

bool Token::isOperator() const
{
    return isOperatorKind(kind);
}

bool Token::isLiteral() const
{
    switch (kind)
    {
        case TokenKind::BoolLiteral:
        case TokenKind::IntLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::NullLiteral:
        case TokenKind::DateLiteral:
        case TokenKind::FractionLiteral:
        case TokenKind::ComplexLiteral:
            return true;
        default:
            return false;
    }
}

} // namespace xpresso::frontends::xp
