#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "database_error.hpp"
#include "database_value.hpp"

namespace gleipnir {

    // One materialized row: column name -> value, in the order the driver declared the columns
    class result_row {
    public:
        using column = std::pair<std::string, sql_value>;

        result_row() = default;

        explicit result_row(std::vector<column> columns)
            : columns_(std::move(columns)) {}

        void add(std::string name, sql_value value) {
            columns_.emplace_back(std::move(name), std::move(value));
        }

        // Last column with that name wins when a select repeats a name
        [[nodiscard]] const sql_value* find(std::string_view name) const noexcept {
            for (auto it = columns_.rbegin(); it != columns_.rend(); ++it) {
                if (it->first == name) return &it->second;
            }
            return nullptr;
        }

        [[nodiscard]] const std::vector<column>& columns() const noexcept {
            return columns_;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return columns_.size();
        }

    private:
        std::vector<column> columns_;
    };

    enum class result_shape {
        empty,
        rows,
        generated_keys,
        rows_affected
    };

    /**
     * Single-pass cursor over the outcome of one statement.
     *
     * Exactly one shape is populated: named-column rows (select), generated keys
     * (insert) or an affected-row count (update/delete). Row and key data can only
     * be read after has_next() moved the cursor onto an element:
     *
     *   while (result.has_next()) {
     *       auto id = result.column<long long>("id");
     *   }
     *
     * A mapped_result is only valid inside the mapper it was handed to.
     */
    class mapped_result {
    public:
        static constexpr long long unset = -1;

        mapped_result() = default;

        // Disable copy, enable move
        mapped_result(const mapped_result&) = delete;
        mapped_result& operator=(const mapped_result&) = delete;
        mapped_result(mapped_result&&) noexcept = default;
        mapped_result& operator=(mapped_result&&) noexcept = default;

        [[nodiscard]] static mapped_result from_rows(std::vector<std::string> column_names,
                                                     std::vector<result_row> rows) {
            mapped_result result;
            result.column_names_ = std::move(column_names);
            result.rows_ = std::move(rows);
            return result;
        }

        [[nodiscard]] static mapped_result from_generated_keys(sql_values keys) {
            mapped_result result;
            result.generated_keys_ = std::move(keys);
            return result;
        }

        [[nodiscard]] static mapped_result from_rows_affected(long long count) {
            mapped_result result;
            result.rows_affected_ = count < 0 ? 0 : count;
            return result;
        }

        // Advance the cursor; true while it points at a row or key
        [[nodiscard]] bool has_next() {
            if (!rows_ && !generated_keys_) {
                throw persistence_failure{
                    "There are no query results (rows or generated keys) to iterate"};
            }
            auto count = static_cast<std::ptrdiff_t>(size());
            if (cursor_ < count) {
                ++cursor_;
            }
            return cursor_ < count;
        }

        [[nodiscard]] const sql_value& column(std::string_view name) const {
            if (!rows_) {
                throw persistence_failure{"There are no results with named columns"};
            }
            if (!in_bounds(rows_->size())) {
                throw persistence_failure{
                    "You need to call has_next() to move forward in mapped_result"};
            }
            const auto* value = (*rows_)[static_cast<std::size_t>(cursor_)].find(name);
            if (!value) {
                throw persistence_failure{"No column named '" + std::string(name) + "' in the result"};
            }
            return *value;
        }

        template<typename T>
        [[nodiscard]] std::optional<T> column(std::string_view name) const {
            return value_as<T>(column(name));
        }

        [[nodiscard]] const result_row& row() const {
            if (!rows_) {
                throw persistence_failure{"There are no results with named columns"};
            }
            if (!in_bounds(rows_->size())) {
                throw persistence_failure{
                    "You need to call has_next() to move forward in mapped_result"};
            }
            return (*rows_)[static_cast<std::size_t>(cursor_)];
        }

        [[nodiscard]] const sql_value& generated_key() const {
            if (!generated_keys_) {
                throw persistence_failure{"There is no key generated per affected row"};
            }
            if (!in_bounds(generated_keys_->size())) {
                throw persistence_failure{
                    "You need to call has_next() to move forward in mapped_result"};
            }
            return (*generated_keys_)[static_cast<std::size_t>(cursor_)];
        }

        template<typename T>
        [[nodiscard]] std::optional<T> generated_key() const {
            return value_as<T>(generated_key());
        }

        [[nodiscard]] long long rows_affected() const {
            if (rows_affected_ == unset) {
                throw persistence_failure{"The statement did not report affected rows"};
            }
            return rows_affected_;
        }

        [[nodiscard]] result_shape shape() const noexcept {
            if (rows_) return result_shape::rows;
            if (generated_keys_) return result_shape::generated_keys;
            if (rows_affected_ != unset) return result_shape::rows_affected;
            return result_shape::empty;
        }

        // Number of rows or keys; 0 for the other shapes
        [[nodiscard]] std::size_t size() const noexcept {
            if (rows_) return rows_->size();
            if (generated_keys_) return generated_keys_->size();
            return 0;
        }

        [[nodiscard]] const std::vector<std::string>& column_names() const noexcept {
            return column_names_;
        }

        [[nodiscard]] std::ptrdiff_t position() const noexcept {
            return cursor_;
        }

    private:
        [[nodiscard]] bool in_bounds(std::size_t count) const noexcept {
            return cursor_ >= 0 && cursor_ < static_cast<std::ptrdiff_t>(count);
        }

        std::optional<std::vector<result_row>> rows_;
        std::optional<sql_values> generated_keys_;
        std::vector<std::string> column_names_;
        long long rows_affected_{unset};
        std::ptrdiff_t cursor_{-1};
    };

} // namespace gleipnir
