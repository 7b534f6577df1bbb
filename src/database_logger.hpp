#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace gleipnir {

    enum class log_level {
        debug,
        info,
        warn,
        error,
        off
    };

    [[nodiscard]] constexpr std::string_view to_string(log_level level) noexcept {
        switch (level) {
            case log_level::debug: return "debug";
            case log_level::info:  return "info";
            case log_level::warn:  return "warn";
            case log_level::error: return "error";
            default:               return "off";
        }
    }

    /**
     * Structured logger handed to the executor and migration runner.
     *
     * Each record is one line: `ts=... level=... event=... key="value" ...`.
     * Writes are serialised, so one instance can be shared between threads.
     */
    class database_logger {
    public:
        using field = std::pair<std::string_view, std::string>;

        explicit database_logger(std::ostream& out = std::cerr, log_level min_level = log_level::info)
            : out_(&out), min_level_(min_level) {}

        database_logger(const database_logger&) = delete;
        database_logger& operator=(const database_logger&) = delete;

        [[nodiscard]] bool enabled(log_level level) const noexcept {
            return level != log_level::off && level >= min_level_.load(std::memory_order_relaxed);
        }

        void set_level(log_level level) noexcept {
            min_level_.store(level, std::memory_order_relaxed);
        }

        [[nodiscard]] log_level level() const noexcept {
            return min_level_.load(std::memory_order_relaxed);
        }

        void log(log_level level, std::string_view event, std::initializer_list<field> fields = {}) {
            if (!enabled(level)) return;

            std::ostringstream line;
            line << "ts=" << timestamp() << " level=" << to_string(level) << " event=" << event;
            for (const auto& [key, value] : fields) {
                line << ' ' << key << '=' << quote(value);
            }
            line << '\n';

            std::lock_guard<std::mutex> lock(mutex_);
            *out_ << line.str();
            out_->flush();
        }

        void debug(std::string_view event, std::initializer_list<field> fields = {}) {
            log(log_level::debug, event, fields);
        }

        void info(std::string_view event, std::initializer_list<field> fields = {}) {
            log(log_level::info, event, fields);
        }

        void warn(std::string_view event, std::initializer_list<field> fields = {}) {
            log(log_level::warn, event, fields);
        }

        void error(std::string_view event, std::initializer_list<field> fields = {}) {
            log(log_level::error, event, fields);
        }

    private:
        static std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            auto secs = std::chrono::system_clock::to_time_t(now);
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;

            std::tm tm{};
            gmtime_r(&secs, &tm);

            std::ostringstream ts;
            ts << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
               << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
            return ts.str();
        }

        // Quote values containing whitespace, quotes or '='
        static std::string quote(std::string_view value) {
            if (!value.empty() && value.find_first_of(" \t\r\n\"=") == std::string_view::npos) {
                return std::string(value);
            }
            std::string quoted = "\"";
            for (char c : value) {
                switch (c) {
                    case '"':  quoted += "\\\""; break;
                    case '\\': quoted += "\\\\"; break;
                    case '\n': quoted += "\\n";  break;
                    case '\r': quoted += "\\r";  break;
                    case '\t': quoted += "\\t";  break;
                    default:   quoted += c;
                }
            }
            quoted += '"';
            return quoted;
        }

        std::ostream* out_;
        std::atomic<log_level> min_level_;
        std::mutex mutex_;
    };

    // Logger writing to std::cerr at info level
    [[nodiscard]] inline std::shared_ptr<database_logger> make_stderr_logger(log_level level = log_level::info) {
        return std::make_shared<database_logger>(std::cerr, level);
    }

} // namespace gleipnir
