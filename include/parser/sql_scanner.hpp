#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate {

/**
 * @brief Two-pass lexical scanner used by the query validator
 *
 * Pass 1 (strip): a single-pass state machine that
 * - replaces each comment (-- to end of line, non-nested block comment)
 *   with one space, so tokens on either side never merge
 * - blanks the contents of single-quoted literals ('it''s' -> '')
 * - copies double-quoted, backtick and [bracket] identifiers verbatim,
 *   but never treats comment markers inside them as comments
 *
 * Pass 2 (words): splits stripped text into words, maximal runs of
 * [A-Za-z0-9_$] plus bytes >= 0x80 (SQLite treats those as identifier
 * characters). Everything else is a separator.
 *
 * Unterminated quotes are copied verbatim to the end of input so their
 * contents stay visible to keyword matching. An unterminated block
 * comment runs to end of input, matching SQLite.
 *
 * Example:
 *   Input:  SELECT name FROM t WHERE a = 'drop' -- tail
 *   Strip:  SELECT name FROM t WHERE a = ''  (plus one trailing space)
 *   Words:  SELECT, name, FROM, t, WHERE, a
 */
class SqlScanner {
public:
    struct Word {
        std::string_view text;   // View into the stripped string
        size_t offset;           // Byte offset in the stripped string
    };

    /**
     * @brief Pass 1: remove comments and blank string literal contents
     */
    [[nodiscard]] static std::string strip(std::string_view sql);

    /**
     * @brief Pass 2: split stripped text into words
     * @param stripped Output of strip(); must outlive the returned views
     */
    [[nodiscard]] static std::vector<Word> words(std::string_view stripped);

    /**
     * @brief True if sql holds no statement: only whitespace, comments and
     *        empty-statement semicolons
     */
    [[nodiscard]] static bool is_blank(std::string_view sql);

    [[nodiscard]] static bool is_word_char(char c) noexcept;

private:
    enum class State {
        NORMAL,              // Normal SQL text
        IN_QUOTED_IDENT,     // Inside "ident", `ident` or [ident]
        IN_BLOCK_COMMENT,    // Inside /* block comment */
        IN_LINE_COMMENT      // Inside -- line comment
    };
};

} // namespace sqlgate
