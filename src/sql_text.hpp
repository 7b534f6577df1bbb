#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace gleipnir::sql {

    // ============================================================================
    // Lexical helpers over PostgreSQL text
    // ============================================================================

    namespace detail {

        inline bool is_ident_char(char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        // Length of a dollar-quote opening tag ($$ or $tag$) at pos, 0 if none
        inline std::size_t dollar_tag_length(std::string_view sql, std::size_t pos) {
            if (sql[pos] != '$') return 0;
            std::size_t i = pos + 1;
            if (i < sql.size() && std::isdigit(static_cast<unsigned char>(sql[i]))) {
                return 0;  // $1 is a parameter
            }
            while (i < sql.size() && is_ident_char(sql[i])) ++i;
            if (i < sql.size() && sql[i] == '$') {
                return i - pos + 1;
            }
            return 0;
        }

        // Blanks comments, and literal contents too when blank_literals is set
        inline std::string mask_text(std::string_view sql, bool blank_literals) {
            std::string mask(sql);
            std::size_t i = 0;
            const std::size_t n = sql.size();

            auto blank = [&](std::size_t from, std::size_t to) {
                for (std::size_t k = from; k < to && k < n; ++k) {
                    if (mask[k] != '\n') mask[k] = ' ';
                }
            };

            while (i < n) {
                char c = sql[i];

                if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
                    std::size_t end = sql.find('\n', i);
                    end = end == std::string_view::npos ? n : end;
                    blank(i, end);
                    i = end;
                } else if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
                    // Block comments nest in PostgreSQL
                    std::size_t j = i + 2;
                    int depth = 1;
                    while (j < n && depth > 0) {
                        if (sql[j] == '/' && j + 1 < n && sql[j + 1] == '*') {
                            ++depth;
                            j += 2;
                        } else if (sql[j] == '*' && j + 1 < n && sql[j + 1] == '/') {
                            --depth;
                            j += 2;
                        } else {
                            ++j;
                        }
                    }
                    blank(i, j);
                    i = j;
                } else if (c == '\'' || c == '"') {
                    bool backslash_escapes = c == '\'' && i > 0 &&
                        (sql[i - 1] == 'E' || sql[i - 1] == 'e') &&
                        (i < 2 || !detail::is_ident_char(sql[i - 2]));
                    std::size_t j = i + 1;
                    while (j < n) {
                        if (backslash_escapes && sql[j] == '\\') {
                            j += 2;
                        } else if (sql[j] == c) {
                            if (j + 1 < n && sql[j + 1] == c) {
                                j += 2;  // doubled quote
                            } else {
                                ++j;
                                break;
                            }
                        } else {
                            ++j;
                        }
                    }
                    if (blank_literals) blank(i, j);
                    i = j;
                } else if (std::size_t tag_len = detail::dollar_tag_length(sql, i);
                           tag_len > 0 && (i == 0 || !detail::is_ident_char(sql[i - 1]))) {
                    std::string_view tag = sql.substr(i, tag_len);
                    std::size_t close = sql.find(tag, i + tag_len);
                    std::size_t end = close == std::string_view::npos ? n : close + tag_len;
                    if (blank_literals) blank(i, end);
                    i = end;
                } else {
                    ++i;
                }
            }
            return mask;
        }

    } // namespace detail

    /**
     * Copy of `sql` with every character inside string literals, quoted
     * identifiers, dollar-quoted bodies and comments replaced by a space.
     * Offsets are preserved, so positions found in the mask index the original.
     */
    [[nodiscard]] inline std::string code_mask(std::string_view sql) {
        return detail::mask_text(sql, true);
    }

    // First keyword of the statement, upper-cased; skips comments and opening parentheses
    [[nodiscard]] inline std::string leading_keyword(std::string_view sql) {
        std::string mask = code_mask(sql);
        std::size_t i = 0;
        while (i < mask.size() &&
               (std::isspace(static_cast<unsigned char>(mask[i])) || mask[i] == '(')) {
            ++i;
        }
        std::size_t start = i;
        while (i < mask.size() && std::isalpha(static_cast<unsigned char>(mask[i]))) {
            ++i;
        }
        return boost::algorithm::to_upper_copy(mask.substr(start, i - start));
    }

    // Whole-word, case-insensitive keyword search outside literals and comments
    [[nodiscard]] inline bool contains_keyword(std::string_view sql, std::string_view keyword) {
        if (keyword.empty()) return false;
        std::string mask = boost::algorithm::to_upper_copy(code_mask(sql));
        std::string needle = boost::algorithm::to_upper_copy(std::string(keyword));
        std::size_t pos = 0;
        while ((pos = mask.find(needle, pos)) != std::string::npos) {
            bool left_ok = pos == 0 || !detail::is_ident_char(mask[pos - 1]);
            std::size_t after = pos + keyword.size();
            bool right_ok = after >= mask.size() || !detail::is_ident_char(mask[after]);
            if (left_ok && right_ok) return true;
            pos = after;
        }
        return false;
    }

    /**
     * Rewrite JDBC-style `?` placeholders into PostgreSQL `$n` parameters.
     * `??` stands for a literal `?` operator. Returns the rewritten text and
     * the number of placeholders found.
     */
    [[nodiscard]] inline std::pair<std::string, int> rewrite_placeholders(std::string_view sql) {
        std::string mask = code_mask(sql);
        std::string out;
        out.reserve(sql.size() + 8);
        int count = 0;

        for (std::size_t i = 0; i < sql.size(); ++i) {
            if (mask[i] != '?') {
                out += sql[i];
                continue;
            }
            if (i + 1 < sql.size() && mask[i + 1] == '?') {
                out += '?';
                ++i;
                continue;
            }
            out += '$';
            out += std::to_string(++count);
        }
        return {std::move(out), count};
    }

    // Strip trailing whitespace, comments and statement terminators
    [[nodiscard]] inline std::string strip_terminator(std::string_view sql) {
        std::string mask = detail::mask_text(sql, false);
        std::size_t end = mask.size();
        while (end > 0 &&
               (mask[end - 1] == ';' || std::isspace(static_cast<unsigned char>(mask[end - 1])))) {
            --end;
        }
        return std::string(sql.substr(0, end));
    }

    // Main statement keyword: after a leading WITH, the first depth-0 DML keyword
    [[nodiscard]] inline std::string main_keyword(std::string_view sql) {
        std::string keyword = leading_keyword(sql);
        if (keyword != "WITH") return keyword;

        std::string mask = boost::algorithm::to_upper_copy(code_mask(sql));
        int depth = 0;
        std::size_t i = 0;
        while (i < mask.size()) {
            char c = mask[i];
            if (c == '(') {
                ++depth;
                ++i;
            } else if (c == ')') {
                --depth;
                ++i;
            } else if (detail::is_ident_char(c)) {
                std::size_t start = i;
                while (i < mask.size() && detail::is_ident_char(mask[i])) ++i;
                if (depth == 0 && (start == 0 || mask[start - 1] != '.')) {
                    std::string word = mask.substr(start, i - start);
                    if (word == "SELECT" || word == "INSERT" || word == "UPDATE" || word == "DELETE") {
                        return word;
                    }
                }
            } else {
                ++i;
            }
        }
        return keyword;
    }

    // Append a RETURNING clause after the last piece of code, past any trailing comment
    [[nodiscard]] inline std::string with_returning_all(std::string_view sql) {
        return strip_terminator(sql) + " RETURNING *";
    }

    // Split a script on statement-terminating semicolons, dropping blank statements
    [[nodiscard]] inline std::vector<std::string> split_script(std::string_view script) {
        std::string mask = code_mask(script);
        std::vector<std::string> statements;

        auto push = [&](std::size_t from, std::size_t to) {
            std::string stmt = boost::algorithm::trim_copy(std::string(script.substr(from, to - from)));
            // A fragment made only of comments is blank as well
            if (!boost::algorithm::trim_copy(code_mask(stmt)).empty()) {
                statements.push_back(std::move(stmt));
            }
        };

        std::size_t start = 0;
        for (std::size_t i = 0; i < mask.size(); ++i) {
            if (mask[i] == ';') {
                push(start, i);
                start = i + 1;
            }
        }
        push(start, script.size());
        return statements;
    }

} // namespace gleipnir::sql
