#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include "database_error.hpp"
#include "database_value.hpp"

namespace gleipnir {

    // ============================================================================
    // Driver seam
    // ============================================================================
    // A driver turns (url, username, password) into a raw connection. Everything
    // above this seam talks to these interfaces only, so the executor can be
    // exercised with an in-memory driver. Implementations report failures by
    // throwing database_error.

    // Whether prepare() should arrange for generated keys to be retrievable
    enum class key_mode {
        no_generated_keys,
        return_generated_keys
    };

    class driver_result_set {
    public:
        virtual ~driver_result_set() = default;

        [[nodiscard]] virtual int column_count() const = 0;

        // 0-based column index
        [[nodiscard]] virtual std::string column_name(int col) const = 0;

        // Advance to the next row; false once exhausted
        [[nodiscard]] virtual bool next() = 0;

        // Value of the current row, 0-based column index
        [[nodiscard]] virtual sql_value value(int col) const = 0;
    };

    class driver_statement {
    public:
        virtual ~driver_statement() = default;

        // 1-based positional parameter
        virtual void bind(int index, const sql_value& value) = 0;

        // Run the statement. Returns true when the outcome is a result set.
        [[nodiscard]] virtual bool execute() = 0;

        [[nodiscard]] virtual std::unique_ptr<driver_result_set> result_set() = 0;

        // Rows generated by the last insert; the key is the first column
        [[nodiscard]] virtual std::unique_ptr<driver_result_set> generated_keys() = 0;

        // Rows touched by the last DML statement, -1 when not applicable
        [[nodiscard]] virtual long long update_count() const = 0;

        virtual void close() noexcept = 0;
    };

    class driver_connection {
    public:
        virtual ~driver_connection() = default;

        // false opens a transaction which lasts until commit() or rollback()
        virtual void set_autocommit(bool enabled) = 0;

        [[nodiscard]] virtual bool autocommit() const noexcept = 0;

        [[nodiscard]] virtual std::unique_ptr<driver_statement> prepare(
            std::string_view sql, key_mode mode = key_mode::no_generated_keys) = 0;

        // Run a parameterless statement as written (no placeholder handling)
        virtual void execute_direct(std::string_view sql) = 0;

        virtual void commit() = 0;

        virtual void rollback() = 0;

        [[nodiscard]] virtual bool is_open() const noexcept = 0;

        virtual void close() noexcept = 0;
    };

    class database_driver {
    public:
        virtual ~database_driver() = default;

        [[nodiscard]] virtual std::string name() const = 0;

        [[nodiscard]] virtual std::unique_ptr<driver_connection> connect(
            const std::string& url, const std::string& username, const std::string& password) = 0;
    };

    /**
     * Name -> driver factory map.
     *
     * Owned by whoever builds the executor; there is no process-wide instance.
     * Names are matched case-insensitively.
     */
    class driver_registry {
    public:
        using factory = std::function<std::shared_ptr<database_driver>()>;

        driver_registry() = default;

        // Registry with the libpq driver (defined in database_connection.hpp)
        [[nodiscard]] static driver_registry with_defaults();

        driver_registry& register_driver(std::string_view name, factory make) {
            factories_[normalize(name)] = std::move(make);
            return *this;
        }

        // Register an already constructed driver instance
        driver_registry& register_driver(std::string_view name, std::shared_ptr<database_driver> driver) {
            return register_driver(name, [driver = std::move(driver)]() { return driver; });
        }

        [[nodiscard]] bool has_driver(std::string_view name) const {
            return factories_.contains(normalize(name));
        }

        [[nodiscard]] std::shared_ptr<database_driver> resolve(std::string_view name) const {
            auto it = factories_.find(normalize(name));
            if (it == factories_.end()) {
                throw persistence_failure{
                    "No database driver registered under '" + std::string(name) + "'"};
            }
            auto driver = it->second();
            if (!driver) {
                throw persistence_failure{
                    "Database driver '" + std::string(name) + "' could not be loaded"};
            }
            return driver;
        }

        [[nodiscard]] std::vector<std::string> names() const {
            std::vector<std::string> out;
            out.reserve(factories_.size());
            for (const auto& [name, _] : factories_) {
                out.push_back(name);
            }
            return out;
        }

    private:
        static std::string normalize(std::string_view name) {
            return boost::algorithm::to_lower_copy(std::string(name));
        }

        std::map<std::string, factory> factories_;
    };

} // namespace gleipnir
