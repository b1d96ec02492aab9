//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for the X-presso language.
///
/// @details The parser pulls tokens from the Lexer, drops trivia, and builds
/// a ParseTreeNode tree. Structural constructs (classes, members, statements,
/// expressions) are written by hand; fixed-shape constructs (print/input,
/// query clauses, conversion and date calls, ALIAS declarations, inheritance
/// lists) are read from the GrammarTable and interpreted by parseRule().
///
/// ## Expressions
///
/// Expressions use the 17 precedence levels of the grammar table. Levels
/// 5-15 are binary and share one precedence-climbing routine driven by each
/// level's operator set and associativity:
///
/// | Level | Operators            | Assoc |
/// |-------|----------------------|-------|
/// |   1   | `( ) [ ] { }`        |   -   |
/// |   2   | `. :: ->`            | left  |
/// |   3   | postfix `++ -- **`   | left  |
/// |   4   | prefix `+ - ! ~`     | right |
/// |   5   | `^`                  | right |
/// |  6-15 | `* / %` ... `\|\|`   | left  |
/// |  16   | `? :`                | right |
/// |  17   | `= += -= ...`        | right |
///
/// ## Speculation
///
/// The ALIAS declaration lookahead and table productions with several
/// viable alternatives are decided by parsing ahead inside a Speculation
/// guard. Lambdas need only the two tokens `Identifier '->'`. While a guard
/// is live, diagnostics are counted but not reported; on destruction the
/// token position (and, when a node is attached, its child list) is
/// restored unless commit() was called.
///
/// ## Error Recovery
///
/// A failing rule reports one diagnostic and returns nullptr; callers never
/// report again for the same failure. The enclosing statement or member loop
/// then calls recover(), which skips to just after `;`, or to `}` or a token
/// that starts a statement, member or class.
///
/// @invariant peek() is always valid (may be the Eof token).
/// @invariant Lexer, GrammarTable, DiagnosticSink and SymbolTable outlive
///            the parser.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/xp/DiagnosticSink.hpp"
#include "frontends/xp/GrammarTable.hpp"
#include "frontends/xp/Lexer.hpp"
#include "frontends/xp/Options.hpp"
#include "frontends/xp/ParseTree.hpp"
#include "frontends/xp/SymbolTable.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace xpresso::frontends::xp
{

class Parser
{
  public:
    Parser(Lexer &lexer,
           const GrammarTable &grammar,
           DiagnosticSink &diag,
           SymbolTable &symbols,
           ParserOptions options = {});

    /// @brief Parse a whole compilation unit.
    /// @return A `Program` node; never null.
    NodePtr parseProgram();

    /// @brief Parse one expression; nullptr after a reported error.
    NodePtr parseExpression();

    /// @brief Parse one statement; nullptr after a reported error.
    NodePtr parseStatement();

    /// @brief True once any syntax or scope diagnostic has been reported.
    bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    // Token Handling (Parser_Tokens.cpp)
    //=========================================================================

    const Token &peek(std::size_t offset = 0);

    Token advance();

    bool check(TokenKind kind, std::size_t offset = 0);

    bool check(TokenKind kind, std::string_view text, std::size_t offset = 0);

    /// @brief True for an Identifier, Keyword or ReservedWord spelled @p text.
    bool checkWord(std::string_view text, std::size_t offset = 0);

    /// @brief Consume a matching token into @p into when present.
    bool match(TokenKind kind, std::string_view text, ParseTreeNode &into);

    /// @brief Require @p text; report MissingToken otherwise.
    /// @param context Phrase appended to the message, e.g. "after field".
    bool expect(TokenKind kind, std::string_view text, const char *context, ParseTreeNode &into);

    /// @brief Require an identifier, storing it in @p out when given.
    bool expectIdentifier(const char *what, ParseTreeNode &into, Token *out = nullptr);

    /// @brief True when @p tok is a statement, member or class boundary.
    bool isSyncPoint(const Token &tok) const;

    /// @brief Skip tokens after an error until a synchronization point.
    void synchronize();

    /// @brief synchronize(), forcing progress when nothing was consumed since
    ///        @p startPos.
    void recover(std::size_t startPos);

    //=========================================================================
    // Speculative Parsing
    //=========================================================================

    class Speculation
    {
      public:
        explicit Speculation(Parser &parser, ParseTreeNode *node = nullptr);
        ~Speculation();

        Speculation(const Speculation &) = delete;
        Speculation &operator=(const Speculation &) = delete;

        /// @brief True when no diagnostic was produced inside the guard.
        bool clean() const
        {
            return parser_.suppressedErrors_ == savedSuppressed_;
        }

        void commit()
        {
            committed_ = true;
        }

      private:
        Parser &parser_;
        ParseTreeNode *node_;
        std::size_t savedChildren_;
        std::size_t savedPos_;
        std::size_t savedSuppressed_;
        bool savedHasError_;
        bool committed_{false};
    };

    /// @brief Counts one nesting level for its lifetime.
    /// @details Past @p limit the constructor reports NestingTooDeep at the
    ///          current token and ok() is false; the caller returns nullptr.
    class NestingGuard
    {
      public:
        NestingGuard(Parser &parser, unsigned &depth, unsigned limit, const char *what);

        ~NestingGuard()
        {
            --depth_;
        }

        NestingGuard(const NestingGuard &) = delete;
        NestingGuard &operator=(const NestingGuard &) = delete;

        bool ok() const
        {
            return ok_;
        }

      private:
        unsigned &depth_;
        bool ok_;
    };

    //=========================================================================
    // Error Reporting (Parser_Tokens.cpp)
    //=========================================================================

    /// @brief Report at the current token; silent when that token is Unknown,
    ///        since the lexer already diagnosed it.
    void error(ErrorKind kind, const std::string &message, std::string suggestion = {});

    void errorAt(SourceLoc loc,
                 ErrorKind kind,
                 const std::string &message,
                 std::string suggestion = {},
                 uint32_t length = 0);

    /// @brief Report "expected @p what, got ..." at the current token.
    /// @details At end of input the kind becomes UnexpectedEndOfInput.
    void errorExpected(const std::string &what, ErrorKind kind, std::string suggestion = {});

    /// @brief Insert @p name into the current scope, reporting duplicates.
    void declare(const Token &name, const std::string &type);

    //=========================================================================
    // Grammar Table Interpretation (Parser_Tokens.cpp)
    //=========================================================================

    /// @brief Parse the table production or builtin called @p name.
    NodePtr parseRule(std::string_view name);

    bool parseAlternative(const Alternative &alt, ParseTreeNode &node);

    bool parseSymbol(const GrammarSymbol &sym, ParseTreeNode &node);

    /// @brief True when @p sym can begin at the current token.
    bool startsSymbol(const GrammarSymbol &sym);

    bool startsAlternative(const Alternative &alt);

    bool startsRule(std::string_view name);

    NodePtr parseBuiltin(std::string_view name);

    //=========================================================================
    // Expressions (Parser_Expr.cpp)
    //=========================================================================

    NodePtr parseAssignment();

    NodePtr parseTernary();

    /// @brief Binary precedence climbing for levels 5 through 15.
    NodePtr parseBinary(int level);

    NodePtr parseUnary();

    NodePtr parsePostfix();

    NodePtr parsePostfixFrom(NodePtr expr);

    NodePtr parseMemberSuffix(NodePtr object);

    NodePtr parsePrimary();

    NodePtr parseBracketLiteral();

    NodePtr parseArrayLiteral();

    NodePtr parseStringLiteral();

    /// @brief `id -> expr` or `id -> { ... }`.
    /// @details Entered only once `Identifier '->'` has been seen, so the
    ///          lambda is committed and its errors are reported directly.
    NodePtr parseLambda();

    bool parseCallArguments(ParseTreeNode &call);

    bool canStartExpression(std::size_t offset = 0);

    //=========================================================================
    // Statements (Parser_Stmt.cpp)
    //=========================================================================

    /// @brief Statement dispatch; parseStatement() adds the depth guard.
    NodePtr parseStatementImpl();

    /// @brief `{ statement* }`, optionally in a fresh scope.
    NodePtr parseBlock(bool newScope = true);

    /// @brief A block, or a single statement where a block may be omitted.
    NodePtr parseBody();

    NodePtr parseIf();

    NodePtr parseSwitch();

    NodePtr parseCase();

    NodePtr parseWhile();

    NodePtr parseExitWhen(bool requireSemicolon);

    NodePtr parseDo();

    NodePtr parseEnhancedFor(NodePtr node);

    NodePtr parseFor();

    NodePtr parseBreak();

    NodePtr parseDeclaration();

    NodePtr parseExpressionStatement();

    bool isDeclarationStart();

    bool isAliasDeclaration();

    NodePtr parseDataType();

    //=========================================================================
    // Declarations (Parser_Decl.cpp)
    //=========================================================================

    bool isClassStart();

    NodePtr parseClass();

    NodePtr parseMember();

    NodePtr parseMainMethod(NodePtr node);

    NodePtr parseMethodRest(NodePtr node, const Token &name, const std::string &type);

    NodePtr parseFieldRest(NodePtr node, const Token &name, const std::string &type);

    NodePtr parseParameters();

    //=========================================================================
    // Member Variables
    //=========================================================================

    Lexer &lexer_;

    const GrammarTable &grammar_;

    DiagnosticSink &diag_;

    SymbolTable &symbols_;

    ParserOptions options_;

    /// Significant tokens pulled so far; trivia never enters the buffer.
    std::vector<Token> tokens_;

    std::size_t tokenPos_{0};

    bool hasError_{false};

    int suppressionDepth_{0};

    /// Diagnostics swallowed while speculating.
    std::size_t suppressedErrors_{0};

    unsigned exprDepth_{0};

    /// Statement and class nesting; bounds recursion through blocks.
    unsigned stmtDepth_{0};

    bool eofReported_{false};
};

/// @brief Terminal text of @p node concatenated in order (`int[]`, `<Account>`).
std::string flattenText(const ParseTreeNode &node);

} // namespace xpresso::frontends::xp
