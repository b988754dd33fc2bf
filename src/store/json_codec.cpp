#include "json_codec.hpp"

#include <type_traits>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace geoedit::codec {

namespace {

json points_to_json(const std::vector<Point> &points) {
    json arr = json::array();
    for (const Point &p : points)
        arr.push_back(point_to_json(p));
    return arr;
}

template <typename Range> std::vector<Point> to_points(const Range &range) {
    return {range.begin(), range.end()};
}

} // namespace

json point_to_json(const Point &point) { return json::array({point.x, point.y}); }

Point json_to_point(const json &j) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_number() ||
        !j[1].is_number())
        throw IOError(fmt::format("expected [x, y], got {}", j.dump()));
    return {j[0].get<double>(), j[1].get<double>()};
}

std::vector<Point> json_to_points(const json &j) {
    if (!j.is_array())
        throw IOError(fmt::format("expected a point list, got {}", j.dump()));
    std::vector<Point> points;
    points.reserve(j.size());
    for (const auto &item : j)
        points.push_back(json_to_point(item));
    return points;
}

json geometry_to_json(const Geometry &geometry) {
    json j;
    j["type"] = to_string(type_of(geometry));
    std::visit(
        [&j](const auto &g) {
            using T = std::decay_t<decltype(g)>;
            if constexpr (std::is_same_v<T, Point>) {
                j["coordinates"] = point_to_json(g);
            } else if constexpr (std::is_same_v<T, LineString>) {
                j["coordinates"] = points_to_json(to_points(g));
            } else if constexpr (std::is_same_v<T, Polygon>) {
                json rings = json::array();
                rings.push_back(points_to_json(to_points(g.outer())));
                for (const auto &inner : g.inners())
                    rings.push_back(points_to_json(to_points(inner)));
                j["coordinates"] = rings;
            }
        },
        geometry);
    return j;
}

Geometry json_to_geometry(const json &j) {
    if (!j.is_object() || !j.contains("type") || !j.contains("coordinates"))
        throw IOError(
            fmt::format("geometry needs 'type' and 'coordinates': {}", j.dump()));

    GeometryType type;
    try {
        type = geometry_type_from_string(j["type"].get<std::string>());
    } catch (const GeometryError &e) {
        throw IOError(e.what());
    }

    const json &coords = j["coordinates"];
    switch (type) {
    case GeometryType::Point:
        return json_to_point(coords);
    case GeometryType::LineString:
        return make_line(json_to_points(coords));
    case GeometryType::Polygon: {
        if (!coords.is_array() || coords.empty())
            throw IOError("polygon needs at least an outer ring");
        std::vector<std::vector<Point>> holes;
        for (std::size_t i = 1; i < coords.size(); ++i)
            holes.push_back(json_to_points(coords[i]));
        return make_polygon(json_to_points(coords[0]), holes);
    }
    }
    throw IOError("unknown geometry type");
}

json attribute_to_json(const AttributeValue &value) {
    return std::visit(
        [](const auto &v) -> json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else {
                return v;
            }
        },
        value);
}

AttributeValue json_to_attribute(const json &j) {
    if (j.is_null())
        return std::monostate{};
    if (j.is_boolean())
        return j.get<bool>();
    if (j.is_number_integer())
        return j.get<std::int64_t>();
    if (j.is_number_float())
        return j.get<double>();
    if (j.is_string())
        return j.get<std::string>();
    throw IOError(fmt::format("unsupported attribute value {}", j.dump()));
}

json attributes_to_json(const AttributeMap &attributes) {
    json j = json::object();
    for (const auto &[name, value] : attributes)
        j[name] = attribute_to_json(value);
    return j;
}

AttributeMap json_to_attributes(const json &j) {
    if (j.is_null())
        return {};
    if (!j.is_object())
        throw IOError(fmt::format("attributes must be an object: {}", j.dump()));
    AttributeMap attributes;
    for (const auto &[name, value] : j.items())
        attributes[name] = json_to_attribute(value);
    return attributes;
}

json feature_to_json(const Feature &feature) {
    return json{{"id", feature.id},
                {"geometry", geometry_to_json(feature.geometry)},
                {"attributes", attributes_to_json(feature.attributes)}};
}

Feature json_to_feature(const json &j) {
    if (!j.is_object() || !j.contains("id") || !j.contains("geometry"))
        throw IOError(fmt::format("feature needs 'id' and 'geometry': {}",
                                  j.dump()));
    Feature feature;
    feature.id = j["id"].get<FeatureId>();
    feature.geometry = json_to_geometry(j["geometry"]);
    feature.attributes = json_to_attributes(j.value("attributes", json()));
    return feature;
}

} // namespace geoedit::codec
