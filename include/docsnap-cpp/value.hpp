/// @file value.hpp
/// @brief Value types: ScalarValue, Sequence, Value, and tag types.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docsnap_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A millisecond-precision timestamp.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// A byte array value.
using Bytes = std::vector<std::byte>;

/// A closed set of primitive values stored in node properties.
///
/// Alternatives: Null, bool, int64_t, double, Timestamp, string, Bytes.
using ScalarValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    Timestamp,
    std::string,
    Bytes
>;

/// An ordered array of scalars, e.g. the child ids of a container node.
using Sequence = std::vector<ScalarValue>;

/// A property value: a scalar or a sequence of scalars.
using Value = std::variant<ScalarValue, Sequence>;

/// Check if a Value holds a scalar.
constexpr auto is_scalar(const Value& v) -> bool {
    return std::holds_alternative<ScalarValue>(v);
}

/// Check if a Value holds a sequence.
constexpr auto is_sequence(const Value& v) -> bool {
    return std::holds_alternative<Sequence>(v);
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { std::printf("%lld\n", static_cast<long long>(i)); },
///     [](auto&&) { std::printf("other\n"); },
/// }, some_scalar);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed extraction helpers -------------------------------------------------

/// Extract a typed scalar from a Value, or nullopt on type mismatch.
/// @code
/// auto title = get_scalar<std::string>(value);
/// @endcode
template <typename T>
auto get_scalar(const Value& v) -> std::optional<T> {
    if (const auto* sv = std::get_if<ScalarValue>(&v)) {
        if (const auto* t = std::get_if<T>(sv)) {
            return *t;
        }
    }
    return std::nullopt;
}

/// Extract a typed scalar from an optional<Value>.
template <typename T>
auto get_scalar(const std::optional<Value>& v) -> std::optional<T> {
    if (!v) return std::nullopt;
    return get_scalar<T>(*v);
}

/// Extract a Sequence from a Value, or nullopt if it holds a scalar.
inline auto get_sequence(const Value& v) -> std::optional<Sequence> {
    if (const auto* seq = std::get_if<Sequence>(&v)) return *seq;
    return std::nullopt;
}

}  // namespace docsnap_cpp
