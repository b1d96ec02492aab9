//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for X-presso source code.
///
/// The lexer is a pull-based tokenizer: each call to next() returns one
/// token. A single scan may produce several tokens at once (a string yields
/// its delimiters and body segments, an object type `<Name>` yields three
/// tokens); those are queued and handed out one by one.
///
/// ## Totality
///
/// The lexer never throws and never stops early. Every character ends up in
/// the lexeme of exactly one token, so concatenating all token texts
/// reproduces the source. Text that fails to scan becomes an Unknown token
/// and exactly one diagnostic is reported for it.
///
/// ## Context
///
/// Two decisions depend on what came before:
/// - `+`/`-` is unary when the last significant (non-trivia) token is a
///   delimiter, punctuation or any operator, or when there is none;
/// - `|` directly after `[` starts a date/fraction literal, so `[|3]` is
///   diagnosed as a fraction with a missing numerator.
/// Both read the incrementally maintained last-significant-token fields.
///
/// ## Bounded lookahead
///
/// Runs that may exceed the longest valid form (`....`, `<<<`, `>>>>`, a
/// third `|` in a date) emit the valid-length prefix as an Unknown token,
/// report one diagnostic at the first offending character and resume
/// scanning at that character. Type names and literal bodies are capped by
/// LexerOptions.
///
/// @invariant tokenize() returns exactly one Eof token, last.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/common/LexerBase.hpp"
#include "frontends/xp/DiagnosticSink.hpp"
#include "frontends/xp/Options.hpp"
#include "frontends/xp/Token.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpresso::frontends::xp
{

/// @brief Tokenizer for X-presso source text.
class Lexer : public common::lexer_base::LexerCursor<Lexer>
{
  public:
    /// @brief Create a lexer over @p source.
    /// @param fileId Identifier stamped into every token location.
    /// @param diag Sink receiving lexical diagnostics; must outlive the lexer.
    Lexer(std::string source, uint32_t fileId, DiagnosticSink &diag, LexerOptions options = {});

    /// @brief Return the next token, trivia included.
    /// @details After the Eof token has been returned, further calls keep
    ///          returning Eof.
    Token next();

    /// @brief Scan the remaining input into a vector ending with Eof.
    std::vector<Token> tokenize();

    /// @brief Append a copy of every token handed out to @p log, the Eof
    ///        token once. Pass nullptr to stop recording.
    void setTokenLog(std::vector<Token> *log)
    {
        log_ = log;
    }

    /// @brief Source text, as required by LexerCursor.
    [[nodiscard]] std::string_view source() const
    {
        return source_;
    }

  private:
    using Mark = common::lexer_base::LexerCursor<Lexer>::Mark;

    //=========================================================================
    // Token emission
    //=========================================================================

    /// @brief Scan one lexical unit and queue its token(s).
    void scan();

    /// @brief Queue a token spanning from @p start to the cursor.
    void push(TokenKind kind, const Mark &start);

    /// @brief Queue an Unknown token from @p start and report @p kind.
    /// @param at Location of the offending character; defaults to @p start.
    void pushError(const Mark &start,
                   ErrorKind kind,
                   std::string message,
                   std::string suggestion = {},
                   std::optional<SourceLoc> at = std::nullopt);

    [[nodiscard]] SourceLoc locOf(const Mark &m) const;

    [[nodiscard]] SourceLoc here() const;

    /// @brief True when @p word is at offset @p offset and ends at a word boundary.
    [[nodiscard]] bool wordAt(std::size_t offset, std::string_view word) const;

    /// @brief True when the last significant token has @p kind and @p text.
    [[nodiscard]] bool lastIs(TokenKind kind, std::string_view text) const;

    //=========================================================================
    // Scanners (Lexer.cpp)
    //=========================================================================

    void lexWhitespace();
    void lexWord();
    void lexSlash();
    void lexBracket();
    void lexInvalidCharacter();

    //=========================================================================
    // Scanners (Lexer_Literals.cpp)
    //=========================================================================

    void lexNumber();
    void lexDateOrFraction(const Mark &start);
    void lexString(char quote);
    void lexComplex();

    //=========================================================================
    // Scanners (Lexer_Operators.cpp)
    //=========================================================================

    /// @brief True when `+`/`-` at the cursor is in unary position.
    [[nodiscard]] bool isUnaryContext() const;

    void lexPeriods();
    void lexColon();
    void lexAngle();
    bool tryObjectDelimiter();
    void lexOperator();

    std::string source_;
    DiagnosticSink &diag_;
    LexerOptions options_;
    std::deque<Token> pending_;

    bool haveLast_{false};
    TokenKind lastKind_{TokenKind::Eof};
    std::string lastText_;

    /// Open brackets awaiting their closer, innermost last.
    std::vector<char> brackets_;

    std::vector<Token> *log_{nullptr};
    bool eofLogged_{false};
};

} // namespace xpresso::frontends::xp
