#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "database_error.hpp"
#include "database_value.hpp"
#include "sql_text.hpp"

namespace gleipnir {

    // Outcome a statement is expected to produce when it returns no result set
    enum class statement_kind {
        automatic,  // decided from the leading keyword
        select,
        insert,
        update,
        remove,
        other
    };

    [[nodiscard]] constexpr std::string_view to_string(statement_kind kind) noexcept {
        switch (kind) {
            case statement_kind::automatic: return "automatic";
            case statement_kind::select:    return "select";
            case statement_kind::insert:    return "insert";
            case statement_kind::update:    return "update";
            case statement_kind::remove:    return "delete";
            default:                        return "other";
        }
    }

    // Classify SQL text by its main keyword (the DML statement after any WITH clause)
    [[nodiscard]] inline statement_kind classify(std::string_view sql_text) {
        auto keyword = sql::main_keyword(sql_text);
        if (keyword == "SELECT" || keyword == "VALUES" || keyword == "TABLE" || keyword == "SHOW") {
            return statement_kind::select;
        }
        if (keyword == "INSERT") return statement_kind::insert;
        if (keyword == "UPDATE") return statement_kind::update;
        if (keyword == "DELETE") return statement_kind::remove;
        return statement_kind::other;
    }

    /**
     * SQL text plus positional arguments for one logical operation.
     *
     * Immutable once constructed. Placeholders are written as `?` and bound
     * in order starting at index 1.
     */
    class statement_spec {
    public:
        explicit statement_spec(std::string text, sql_values args = {},
                                statement_kind kind = statement_kind::automatic)
            : text_(std::move(text)), args_(std::move(args)), kind_(kind) {
            validate::require_non_empty(text_, "query");
        }

        [[nodiscard]] const std::string& text() const noexcept {
            return text_;
        }

        [[nodiscard]] const sql_values& args() const noexcept {
            return args_;
        }

        [[nodiscard]] bool has_arguments() const noexcept {
            return !args_.empty();
        }

        // Declared kind, or the kind inferred from the SQL when automatic
        [[nodiscard]] statement_kind kind() const {
            return kind_ == statement_kind::automatic ? classify(text_) : kind_;
        }

        [[nodiscard]] statement_kind declared_kind() const noexcept {
            return kind_;
        }

    private:
        std::string text_;
        sql_values args_;
        statement_kind kind_;
    };

    // Fluent construction of a statement_spec
    class statement_builder {
    public:
        statement_builder& query(std::string text) {
            validate::require_non_empty(text, "query");
            text_ = std::move(text);
            return *this;
        }

        template<typename... Args>
        statement_builder& args(Args&&... values) {
            sql_values list;
            list.reserve(sizeof...(Args));
            (list.push_back(make_value(std::forward<Args>(values))), ...);
            validate::require_least_one_argument(list, "args");
            args_ = std::move(list);
            return *this;
        }

        statement_builder& args(sql_values values) {
            validate::require_least_one_argument(values, "args");
            args_ = std::move(values);
            return *this;
        }

        statement_builder& kind(statement_kind k) noexcept {
            kind_ = k;
            return *this;
        }

        [[nodiscard]] statement_spec build() const {
            if (!text_) {
                throw persistence_failure{"The 'query' parameter has not been initialized"};
            }
            return statement_spec(*text_, args_.value_or(sql_values{}), kind_);
        }

    private:
        std::optional<std::string> text_;
        std::optional<sql_values> args_;
        statement_kind kind_{statement_kind::automatic};
    };

} // namespace gleipnir
