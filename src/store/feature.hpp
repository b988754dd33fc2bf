#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

#include "../geometry/geometry.hpp"

namespace geoedit {

using FeatureId = std::int64_t;

/**
 * @brief Typed attribute value. std::monostate is the null value.
 */
using AttributeValue =
    std::variant<std::monostate, bool, std::int64_t, double, std::string>;

using AttributeMap = std::map<std::string, AttributeValue>;

/**
 * @brief A spatial record: stable id, geometry and named attributes.
 */
struct Feature {
    FeatureId id = 0;
    Geometry geometry;
    AttributeMap attributes;
};

/**
 * @brief Exact equality of id, geometry coordinates and attributes.
 */
inline bool operator==(const Feature &a, const Feature &b) noexcept {
    return a.id == b.id && same_geometry(a.geometry, b.geometry) &&
           a.attributes == b.attributes;
}

inline bool operator!=(const Feature &a, const Feature &b) noexcept {
    return !(a == b);
}

inline bool same_state(const std::optional<Feature> &a,
                       const std::optional<Feature> &b) noexcept {
    if (a.has_value() != b.has_value())
        return false;
    return !a || *a == *b;
}

/**
 * @brief Address of a feature in the store.
 */
struct FeatureRef {
    std::string collection;
    FeatureId id = 0;
};

inline bool operator==(const FeatureRef &a, const FeatureRef &b) noexcept {
    return a.id == b.id && a.collection == b.collection;
}

inline bool operator!=(const FeatureRef &a, const FeatureRef &b) noexcept {
    return !(a == b);
}

inline bool operator<(const FeatureRef &a, const FeatureRef &b) noexcept {
    return std::tie(a.collection, a.id) < std::tie(b.collection, b.id);
}

/**
 * @brief Human readable attribute value for logs and the CLI.
 */
inline std::string to_string(const AttributeValue &value) {
    return std::visit(
        [](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

} // namespace geoedit

// Custom formatter for FeatureRef
template <>
struct fmt::formatter<geoedit::FeatureRef> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const geoedit::FeatureRef &ref, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}#{}", ref.collection, ref.id);
    }
};
