//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/LexerBase.hpp
// Purpose: Source cursor shared by lexers: peek/get over a string_view with
//          1-based line and column bookkeeping.
//
// Key Invariants:
//   - Position tracking maintains 1-based line and column numbers
//   - End of input is reported as '\0' by peek operations
//   - Newlines increment line and reset column to 1
//   - A Mark restores position, line and column exactly
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace xpresso::frontends::common::lexer_base
{

/// @brief CRTP base class for lexer cursor management.
/// @details Derived class must provide source() returning std::string_view.
///
/// Usage:
///   class MyLexer : public LexerCursor<MyLexer> {
///       std::string_view source() const { return src_; }
///   };
template <typename Derived>
class LexerCursor
{
  public:
    /// @brief Saved cursor state for bounded backtracking.
    struct Mark
    {
        std::size_t pos;
        uint32_t line;
        uint32_t column;
    };

    explicit LexerCursor(uint32_t fileId) : fileId_(fileId) {}

    /// @brief Current character, or '\0' at end of source.
    [[nodiscard]] char peek() const
    {
        auto src = static_cast<const Derived *>(this)->source();
        return pos_ < src.size() ? src[pos_] : '\0';
    }

    /// @brief Character @p offset positions ahead, or '\0' beyond the end.
    [[nodiscard]] char peek(std::size_t offset) const
    {
        auto src = static_cast<const Derived *>(this)->source();
        std::size_t idx = pos_ + offset;
        return idx < src.size() ? src[idx] : '\0';
    }

    /// @brief Consume and return the current character ('\0' at end).
    char get()
    {
        auto src = static_cast<const Derived *>(this)->source();
        if (pos_ >= src.size())
            return '\0';
        char c = src[pos_++];
        if (c == '\n')
        {
            line_++;
            column_ = 1;
        }
        else
        {
            column_++;
        }
        return c;
    }

    /// @brief True when every character has been consumed.
    [[nodiscard]] bool eof() const
    {
        return pos_ >= static_cast<const Derived *>(this)->source().size();
    }

    /// @brief True when @p offset is past the end of the source.
    [[nodiscard]] bool eofAt(std::size_t offset) const
    {
        return pos_ + offset >= static_cast<const Derived *>(this)->source().size();
    }

    [[nodiscard]] Mark mark() const noexcept
    {
        return Mark{pos_, line_, column_};
    }

    void rewind(const Mark &m) noexcept
    {
        pos_ = m.pos;
        line_ = m.line;
        column_ = m.column;
    }

    /// @brief Source text consumed since @p m.
    [[nodiscard]] std::string_view since(const Mark &m) const
    {
        return static_cast<const Derived *>(this)->source().substr(m.pos, pos_ - m.pos);
    }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] uint32_t line() const noexcept { return line_; }

    [[nodiscard]] uint32_t column() const noexcept { return column_; }

    [[nodiscard]] uint32_t fileId() const noexcept { return fileId_; }

  protected:
    std::size_t pos_{0};   ///< Current position in source.
    uint32_t line_{1};     ///< 1-based line number.
    uint32_t column_{1};   ///< 1-based column number.
    uint32_t fileId_;      ///< File identifier.
};

/// @brief Consume characters while @p pred holds, at most @p limit of them.
/// @return Number of characters consumed.
template <typename Lexer, typename Pred>
inline std::size_t consumeWhile(Lexer &lex, Pred pred, std::size_t limit = static_cast<std::size_t>(-1))
{
    std::size_t n = 0;
    while (n < limit && !lex.eof() && pred(lex.peek()))
    {
        lex.get();
        ++n;
    }
    return n;
}

/// @brief Consume up to, not including, the next newline.
template <typename Lexer>
inline void skipToEndOfLine(Lexer &lex)
{
    while (!lex.eof() && lex.peek() != '\n')
        lex.get();
}

} // namespace xpresso::frontends::common::lexer_base
