#pragma once

#include <charconv>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace gleipnir {

    // Dynamically typed column, key and argument value. std::monostate is SQL NULL.
    using sql_value = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    [[nodiscard]] inline bool is_null(const sql_value& value) noexcept {
        return std::holds_alternative<std::monostate>(value);
    }

    namespace detail {

        template<typename T>
        struct is_optional : std::false_type {};

        template<typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        template<typename T>
        std::optional<T> parse_number(std::string_view str) {
            T out{};
            auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
            if (ec != std::errc{} || ptr != str.data() + str.size()) {
                return std::nullopt;
            }
            return out;
        }

    } // namespace detail

    // Build an sql_value from a native argument
    template<typename T>
    [[nodiscard]] sql_value make_value(T&& value) {
        using DecayedT = std::decay_t<T>;

        if constexpr (std::is_same_v<DecayedT, sql_value>) {
            return std::forward<T>(value);
        } else if constexpr (detail::is_optional<DecayedT>::value) {
            if (!value.has_value()) {
                return std::monostate{};
            }
            return make_value(*value);
        } else if constexpr (std::is_same_v<DecayedT, std::nullptr_t>) {
            return std::monostate{};
        } else if constexpr (std::is_same_v<DecayedT, bool>) {
            return value;
        } else if constexpr (std::is_integral_v<DecayedT>) {
            return static_cast<std::int64_t>(value);
        } else if constexpr (std::is_floating_point_v<DecayedT>) {
            return static_cast<double>(value);
        } else if constexpr (std::is_convertible_v<T, std::string_view>) {
            return std::string(std::string_view(value));
        } else {
            static_assert(std::is_same_v<DecayedT, void>, "Unsupported argument type");
        }
    }

    // Text representation used when binding a positional parameter; nullopt is NULL
    [[nodiscard]] inline std::optional<std::string> to_parameter_text(const sql_value& value) {
        return std::visit([](const auto& v) -> std::optional<std::string> {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<V, bool>) {
                return std::string(v ? "true" : "false");
            } else if constexpr (std::is_same_v<V, std::int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<V, double>) {
                char buf[64];
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
                return std::string(buf, ptr);
            } else {
                return v;
            }
        }, value);
    }

    // Typed extraction; nullopt for NULL or when the value cannot be converted
    template<typename T>
    [[nodiscard]] std::optional<T> value_as(const sql_value& value) {
        return std::visit([](const auto& v) -> std::optional<T> {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return to_parameter_text(sql_value{v});
            } else if constexpr (std::is_same_v<T, bool>) {
                if constexpr (std::is_same_v<V, bool>) {
                    return v;
                } else if constexpr (std::is_same_v<V, std::string>) {
                    return v == "t" || v == "true" || v == "1";
                } else {
                    return v != 0;
                }
            } else if constexpr (std::is_integral_v<T>) {
                if constexpr (std::is_same_v<V, std::string>) {
                    return detail::parse_number<T>(v);
                } else if constexpr (std::is_same_v<V, double>) {
                    // max() + 1 is a power of two, so it converts to double exactly
                    constexpr double lower = static_cast<double>(std::numeric_limits<T>::min());
                    constexpr double upper = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
                    if (!std::isfinite(v) || v < lower || v >= upper) {
                        return std::nullopt;
                    }
                    return static_cast<T>(v);
                } else if constexpr (std::is_same_v<V, bool>) {
                    return static_cast<T>(v);
                } else {
                    if (!std::in_range<T>(v)) {
                        return std::nullopt;
                    }
                    return static_cast<T>(v);
                }
            } else if constexpr (std::is_floating_point_v<T>) {
                if constexpr (std::is_same_v<V, std::string>) {
                    return detail::parse_number<T>(v);
                } else if constexpr (std::is_same_v<V, double>) {
                    if (std::isfinite(v) && std::fabs(v) > static_cast<double>(std::numeric_limits<T>::max())) {
                        return std::nullopt;
                    }
                    return static_cast<T>(v);
                } else {
                    return static_cast<T>(v);
                }
            } else {
                return std::nullopt;
            }
        }, value);
    }

    using sql_values = std::vector<sql_value>;

} // namespace gleipnir
