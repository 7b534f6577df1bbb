#pragma once

#include <libpq-fe.h>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "database_driver.hpp"
#include "database_error.hpp"
#include "database_value.hpp"
#include "sql_text.hpp"

namespace gleipnir {

    // ============================================================================
    // libpq driver
    // ============================================================================

    namespace pq_detail {

        // Built-in type OIDs (server catalog headers are not part of the client API)
        constexpr Oid bool_oid = 16;
        constexpr Oid int8_oid = 20;
        constexpr Oid int2_oid = 21;
        constexpr Oid int4_oid = 23;
        constexpr Oid oid_oid = 26;
        constexpr Oid float4_oid = 700;
        constexpr Oid float8_oid = 701;

        inline std::string error_field(const PGresult* result, int field) {
            const char* value = result ? PQresultErrorField(result, field) : nullptr;
            return value ? std::string(value) : std::string();
        }

        inline std::string trim_message(std::string msg) {
            while (!msg.empty() && (msg.back() == '\n' || msg.back() == ' ')) {
                msg.pop_back();
            }
            return msg;
        }

        using result_ptr = std::unique_ptr<PGresult, decltype(&PQclear)>;

        // Throws database_error unless the result is a success status
        inline result_ptr check(PGconn* conn, PGresult* raw, std::string_view what) {
            result_ptr result(raw, PQclear);
            if (!result) {
                throw database_error{
                    std::string(what) + " failed: " + trim_message(PQerrorMessage(conn))};
            }

            ExecStatusType status = PQresultStatus(result.get());
            if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK &&
                status != PGRES_EMPTY_QUERY) {
                throw database_error{
                    trim_message(PQresultErrorMessage(result.get())),
                    error_field(result.get(), PG_DIAG_SQLSTATE)};
            }
            return result;
        }

        // Convert a text-format cell using the column's type OID
        inline sql_value convert(const PGresult* result, int row, int col) {
            if (PQgetisnull(result, row, col) == 1) {
                return std::monostate{};
            }
            std::string_view text(PQgetvalue(result, row, col),
                                  static_cast<std::size_t>(PQgetlength(result, row, col)));
            std::optional<sql_value> converted;

            switch (PQftype(result, col)) {
                case bool_oid:
                    return text == "t" || text == "true";
                case int2_oid:
                case int4_oid:
                case int8_oid:
                case oid_oid:
                    if (auto v = detail::parse_number<std::int64_t>(text)) converted = *v;
                    break;
                case float4_oid:
                case float8_oid:
                    if (auto v = detail::parse_number<double>(text)) converted = *v;
                    break;
                default:
                    break;
            }
            return converted ? std::move(*converted) : sql_value{std::string(text)};
        }

        // libpq accepts a URI or conninfo; strip the JDBC scheme prefix if present
        inline std::string normalize_url(const std::string& url) {
            constexpr std::string_view jdbc = "jdbc:";
            if (url.compare(0, jdbc.size(), jdbc) == 0) {
                return url.substr(jdbc.size());
            }
            return url;
        }

    } // namespace pq_detail

    // RAII wrapper over a PGresult with a forward cursor
    class pq_result_set : public driver_result_set {
    public:
        explicit pq_result_set(pq_detail::result_ptr result)
            : result_(std::move(result)) {}

        [[nodiscard]] int column_count() const override {
            return result_ ? PQnfields(result_.get()) : 0;
        }

        [[nodiscard]] std::string column_name(int col) const override {
            if (!result_ || col < 0 || col >= column_count()) {
                throw database_error{"Column index out of range: " + std::to_string(col)};
            }
            return PQfname(result_.get(), col);
        }

        [[nodiscard]] int row_count() const noexcept {
            return result_ ? PQntuples(result_.get()) : 0;
        }

        [[nodiscard]] bool next() override {
            if (row_ < row_count()) ++row_;
            return row_ < row_count();
        }

        [[nodiscard]] sql_value value(int col) const override {
            if (row_ < 0 || row_ >= row_count()) {
                throw database_error{"Result set is not positioned on a row"};
            }
            if (col < 0 || col >= column_count()) {
                throw database_error{"Column index out of range: " + std::to_string(col)};
            }
            return pq_detail::convert(result_.get(), row_, col);
        }

        [[nodiscard]] PGresult* native_handle() const noexcept {
            return result_.get();
        }

    private:
        pq_detail::result_ptr result_;
        int row_{-1};
    };

    class pq_connection;

    // Unnamed prepared statement on a pq_connection
    class pq_statement : public driver_statement {
    public:
        pq_statement(pq_connection& conn, std::string sql, int param_count, bool returns_keys)
            : conn_(conn), sql_(std::move(sql)),
              params_(static_cast<std::size_t>(param_count)),
              returns_keys_(returns_keys) {}

        ~pq_statement() override {
            close();
        }

        void bind(int index, const sql_value& value) override {
            if (index < 1 || index > static_cast<int>(params_.size())) {
                throw database_error{
                    "Parameter index " + std::to_string(index) + " is out of range (statement has " +
                    std::to_string(params_.size()) + " parameters)"};
            }
            params_[static_cast<std::size_t>(index - 1)] = to_parameter_text(value);
        }

        [[nodiscard]] bool execute() override;

        [[nodiscard]] std::unique_ptr<driver_result_set> result_set() override {
            if (returns_keys_ || !result_ || PQresultStatus(result_.get()) != PGRES_TUPLES_OK) {
                return nullptr;
            }
            return std::make_unique<pq_result_set>(std::move(result_));
        }

        [[nodiscard]] std::unique_ptr<driver_result_set> generated_keys() override {
            if (!returns_keys_ || !result_) {
                // Empty key set, as for an insert that generated nothing
                return std::make_unique<pq_result_set>(pq_detail::result_ptr(nullptr, PQclear));
            }
            return std::make_unique<pq_result_set>(std::move(result_));
        }

        [[nodiscard]] long long update_count() const override {
            return update_count_;
        }

        void close() noexcept override {
            result_.reset();
        }

        [[nodiscard]] const std::string& sql() const noexcept {
            return sql_;
        }

    private:
        pq_connection& conn_;
        std::string sql_;
        std::vector<std::optional<std::string>> params_;
        bool returns_keys_;
        pq_detail::result_ptr result_{nullptr, PQclear};
        long long update_count_{-1};
    };

    class pq_connection : public driver_connection {
    public:
        pq_connection(const std::string& url, const std::string& username, const std::string& password) {
            connect(pq_detail::normalize_url(url), username, password);
        }

        // Disable copy, enable move
        pq_connection(const pq_connection&) = delete;
        pq_connection& operator=(const pq_connection&) = delete;

        pq_connection(pq_connection&& other) noexcept
            : conn_(std::exchange(other.conn_, nullptr)),
              autocommit_(other.autocommit_),
              in_transaction_(std::exchange(other.in_transaction_, false)) {}

        ~pq_connection() override {
            close();
        }

        [[nodiscard]] bool is_open() const noexcept override {
            return conn_ && PQstatus(conn_) == CONNECTION_OK;
        }

        void set_autocommit(bool enabled) override {
            if (enabled == autocommit_) return;
            if (enabled && in_transaction_) {
                // Same as JDBC: switching autocommit on commits the open transaction
                commit();
            }
            autocommit_ = enabled;
            if (!autocommit_) {
                begin();
            }
        }

        [[nodiscard]] bool autocommit() const noexcept override {
            return autocommit_;
        }

        [[nodiscard]] std::unique_ptr<driver_statement> prepare(
            std::string_view sql, key_mode mode = key_mode::no_generated_keys) override {

            require_open();

            std::string text(sql);
            bool returns_keys = false;
            if (mode == key_mode::return_generated_keys &&
                sql::main_keyword(text) == "INSERT" &&
                !sql::contains_keyword(text, "RETURNING")) {
                text = sql::with_returning_all(text);
                returns_keys = true;
            }

            auto [rewritten, param_count] = sql::rewrite_placeholders(text);

            ensure_transaction();
            (void)pq_detail::check(conn_,
                PQprepare(conn_, "", rewritten.c_str(), param_count, nullptr),
                "Statement preparation");

            return std::make_unique<pq_statement>(*this, std::move(rewritten), param_count, returns_keys);
        }

        void execute_direct(std::string_view sql) override {
            require_open();
            ensure_transaction();
            (void)execute(std::string(sql));
        }

        void commit() override {
            require_open();
            if (autocommit_) {
                throw database_error{"Cannot commit when autocommit is enabled"};
            }
            if (!in_transaction_) return;

            if (PQtransactionStatus(conn_) == PQTRANS_INERROR) {
                (void)execute("ROLLBACK");
                in_transaction_ = false;
                throw database_error{"Current transaction is aborted, commit was rolled back", "25P02"};
            }
            (void)execute("COMMIT");
            in_transaction_ = false;
        }

        void rollback() override {
            require_open();
            if (autocommit_) {
                throw database_error{"Cannot rollback when autocommit is enabled"};
            }
            if (!in_transaction_) return;
            (void)execute("ROLLBACK");
            in_transaction_ = false;
        }

        // Execute a simple query (no parameters)
        [[nodiscard]] pq_detail::result_ptr execute(const std::string& query) {
            require_open();
            return pq_detail::check(conn_, PQexec(conn_, query.c_str()), "Query execution");
        }

        // Get last error message
        [[nodiscard]] std::string last_error() const {
            return conn_ ? pq_detail::trim_message(PQerrorMessage(conn_)) : "No connection";
        }

        [[nodiscard]] std::string database_name() const {
            return conn_ ? PQdb(conn_) : "";
        }

        [[nodiscard]] std::string user_name() const {
            return conn_ ? PQuser(conn_) : "";
        }

        [[nodiscard]] bool in_transaction() const noexcept {
            return in_transaction_;
        }

        // Get raw connection pointer (use with caution)
        [[nodiscard]] PGconn* native_handle() noexcept {
            return conn_;
        }

        void close() noexcept override {
            if (conn_) {
                PQfinish(conn_);
                conn_ = nullptr;
                in_transaction_ = false;
            }
        }

    private:
        friend class pq_statement;

        void connect(const std::string& url, const std::string& username, const std::string& password) {
            std::array<const char*, 4> keywords{"dbname", "user", "password", nullptr};
            std::array<const char*, 4> values{url.c_str(), username.c_str(), password.c_str(), nullptr};

            conn_ = PQconnectdbParams(keywords.data(), values.data(), 1);
            if (!is_open()) {
                std::string error = last_error();
                close();
                throw database_error{"Failed to connect to database: " + error};
            }
        }

        void require_open() const {
            if (!is_open()) {
                throw database_error{"Connection is not valid"};
            }
        }

        void begin() {
            (void)execute("BEGIN");
            in_transaction_ = true;
        }

        // A new transaction starts with the first statement after commit/rollback
        void ensure_transaction() {
            if (!autocommit_ && !in_transaction_) {
                begin();
            }
        }

        PGconn* conn_{nullptr};
        bool autocommit_{true};
        bool in_transaction_{false};
    };

    inline bool pq_statement::execute() {
        conn_.require_open();
        conn_.ensure_transaction();

        std::vector<const char*> values;
        values.reserve(params_.size());
        for (const auto& param : params_) {
            values.push_back(param ? param->c_str() : nullptr);
        }

        result_ = pq_detail::check(conn_.conn_,
            PQexecPrepared(conn_.conn_, "", static_cast<int>(values.size()),
                           values.data(), nullptr, nullptr, 0),
            "Statement execution");

        const char* tuples = PQcmdTuples(result_.get());
        update_count_ = tuples && *tuples ? std::stoll(tuples) : -1;

        if (returns_keys_) {
            return false;
        }
        return PQresultStatus(result_.get()) == PGRES_TUPLES_OK;
    }

    class pq_driver : public database_driver {
    public:
        [[nodiscard]] std::string name() const override {
            return "postgresql";
        }

        [[nodiscard]] std::unique_ptr<driver_connection> connect(
            const std::string& url, const std::string& username, const std::string& password) override {
            return std::make_unique<pq_connection>(url, username, password);
        }
    };

    inline driver_registry driver_registry::with_defaults() {
        driver_registry registry;
        auto make_pq = []() -> std::shared_ptr<database_driver> {
            return std::make_shared<pq_driver>();
        };
        registry.register_driver("postgresql", make_pq);
        registry.register_driver("postgres", make_pq);
        registry.register_driver("libpq", make_pq);
        registry.register_driver("org.postgresql.Driver", make_pq);
        return registry;
    }

} // namespace gleipnir
