#include <iostream>
#include "../src/gleipnir.hpp"

using namespace gleipnir;

// Reads GLEIPNIR_DB_DRIVER, GLEIPNIR_DB_URL, GLEIPNIR_DB_USER and GLEIPNIR_DB_PASSWORD
int main() {
    try {
        auto loader = std::make_shared<environment_connection_loader>();
        query_executor executor(loader);
        persistence_unit unit(executor);

        auto version = executor.execute(statement_spec{"SELECT version() AS version"}, [](mapped_result& r) {
            return r.has_next() ? r.column<std::string>("version") : std::nullopt;
        });
        std::cout << "PostgreSQL version: " << version.value_or("Unknown") << "\n";

        // Each execute() runs on its own connection, so TEMP tables would not survive
        (void)executor.execute(
            statement_spec{"CREATE TABLE IF NOT EXISTS people (id SERIAL PRIMARY KEY, name TEXT, age INT)", {},
                           statement_kind::other},
            [](mapped_result& r) { return r.rows_affected(); });

        auto id = unit.persist([](statement_builder& q) -> statement_builder& {
            return q.query("INSERT INTO people (name, age) VALUES (?, ?)").args("Alice", 30);
        }).execute([](mapped_result& r) {
            return r.has_next() ? r.generated_key<long long>() : std::nullopt;
        });
        std::cout << "Inserted id: " << id.value_or(-1) << "\n";

        auto updated = executor.execute(
            statement_spec{"UPDATE people SET age = age + 1 WHERE name = ?", {make_value("Alice")}},
            [](mapped_result& r) { return r.rows_affected(); });
        std::cout << "Updated rows: " << updated << "\n";

        executor.execute(statement_spec{"SELECT id, name, age FROM people ORDER BY id"}, [](mapped_result& r) {
            while (r.has_next()) {
                std::cout << r.column<long long>("id").value_or(0) << " "
                          << r.column<std::string>("name").value_or("?") << " "
                          << r.column<int>("age").value_or(0) << "\n";
            }
        });

        return 0;
    } catch (const persistence_failure& e) {
        std::cerr << "Error: " << e.what();
        if (e.has_cause()) {
            std::cerr << " (" << e.cause_message() << ")";
        }
        std::cerr << "\n";
        return 1;
    }
}
