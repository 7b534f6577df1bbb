#include <iostream>
#include "../src/gleipnir.hpp"

using namespace gleipnir;

// Usage: migration_example <directory>
// Connection values come from the GLEIPNIR_DB_* environment variables.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <migrations-directory>\n";
        return 2;
    }

    try {
        query_executor executor(std::make_shared<environment_connection_loader>(),
                                driver_registry::with_defaults(),
                                make_stderr_logger(log_level::debug));
        migration_runner runner(executor);

        auto pending = runner.pending_migrations(argv[1]);
        std::cout << "Pending migrations: " << pending.size() << "\n";
        for (const auto& file : pending) {
            std::cout << "  V" << file.version << " " << file.description << "\n";
        }

        runner.apply_migrations(argv[1]);

        std::cout << "Applied versions:";
        for (const auto& version : runner.applied_versions()) {
            std::cout << " " << version;
        }
        std::cout << "\n";
        return 0;
    } catch (const persistence_failure& e) {
        std::cerr << "Migration failed: " << e.what();
        if (e.has_cause()) {
            std::cerr << " (" << e.cause_message() << ")";
        }
        std::cerr << "\n";
        return 1;
    }
}
