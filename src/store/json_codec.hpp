#pragma once

#include <nlohmann/json.hpp>

#include "feature.hpp"

namespace geoedit {

using json = nlohmann::json;

/**
 * @brief JSON encoding shared by the store file and edit scripts.
 *
 * Points are `[x, y]`. Geometries are objects with a `type` ("Point",
 * "LineString", "Polygon") and `coordinates`: a point, a point list, or a
 * list of rings with the outer ring first. Attribute values map onto JSON
 * null, boolean, integer, floating point and string.
 *
 * Decoders throw IOError on malformed input.
 */
namespace codec {

json point_to_json(const Point &point);
Point json_to_point(const json &j);

std::vector<Point> json_to_points(const json &j);

json geometry_to_json(const Geometry &geometry);
Geometry json_to_geometry(const json &j);

json attribute_to_json(const AttributeValue &value);
AttributeValue json_to_attribute(const json &j);

json attributes_to_json(const AttributeMap &attributes);
AttributeMap json_to_attributes(const json &j);

json feature_to_json(const Feature &feature);
Feature json_to_feature(const json &j);

} // namespace codec

} // namespace geoedit
