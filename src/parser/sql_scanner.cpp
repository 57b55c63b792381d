#include "parser/sql_scanner.hpp"

namespace sqlgate {

bool SqlScanner::is_word_char(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return (u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') ||
           (u >= '0' && u <= '9') || u == '_' || u == '$' || u >= 0x80;
}

std::string SqlScanner::strip(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    State state = State::NORMAL;
    char ident_close = '\0';

    const size_t len = sql.size();
    for (size_t i = 0; i < len; ++i) {
        const char c = sql[i];
        const char next_c = (i + 1 < len) ? sql[i + 1] : '\0';

        switch (state) {
            case State::NORMAL: {
                if (c == '-' && next_c == '-') {
                    state = State::IN_LINE_COMMENT;
                    result += ' ';
                    ++i;
                    break;
                }
                if (c == '/' && next_c == '*') {
                    state = State::IN_BLOCK_COMMENT;
                    result += ' ';
                    ++i;
                    break;
                }
                if (c == '\'') {
                    // Consume the whole literal here; '' inside is an escaped quote.
                    // Only a terminated literal is blanked.
                    size_t j = i + 1;
                    bool closed = false;
                    while (j < len) {
                        if (sql[j] == '\'') {
                            if (j + 1 < len && sql[j + 1] == '\'') {
                                j += 2;
                                continue;
                            }
                            closed = true;
                            break;
                        }
                        ++j;
                    }
                    if (!closed) {
                        result.append(sql.substr(i));
                        return result;
                    }
                    result += "''";
                    i = j;
                    break;
                }
                if (c == '"' || c == '`' || c == '[') {
                    state = State::IN_QUOTED_IDENT;
                    ident_close = (c == '[') ? ']' : c;
                    result += c;
                    break;
                }
                result += c;
                break;
            }

            case State::IN_QUOTED_IDENT: {
                result += c;
                if (c == ident_close) {
                    // "" and `` are escaped quotes inside the identifier
                    if (ident_close != ']' && next_c == ident_close) {
                        result += next_c;
                        ++i;
                    } else {
                        state = State::NORMAL;
                    }
                }
                break;
            }

            case State::IN_BLOCK_COMMENT: {
                if (c == '*' && next_c == '/') {
                    state = State::NORMAL;
                    ++i;
                }
                break;
            }

            case State::IN_LINE_COMMENT: {
                if (c == '\n') {
                    state = State::NORMAL;
                    result += c;
                }
                break;
            }
        }
    }

    return result;
}

std::vector<SqlScanner::Word> SqlScanner::words(std::string_view stripped) {
    std::vector<Word> result;

    const size_t len = stripped.size();
    size_t i = 0;
    while (i < len) {
        if (!is_word_char(stripped[i])) {
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < len && is_word_char(stripped[i])) {
            ++i;
        }
        result.push_back({stripped.substr(start, i - start), start});
    }

    return result;
}

bool SqlScanner::is_blank(std::string_view sql) {
    const std::string stripped = strip(sql);
    return stripped.find_first_not_of(" \t\n\r\f\v;") == std::string::npos;
}

} // namespace sqlgate
