#pragma once

#include <string>

#include "feature_store.hpp"
#include "json_codec.hpp"

namespace geoedit {

/**
 * @brief Saves and loads a whole feature store as one JSON document.
 *
 * Layout:
 * @code
 * {
 *   "collections": [
 *     { "name": "parcels", "geometry_type": "Polygon", "next_id": 4,
 *       "features": [ { "id": 1, "geometry": {...}, "attributes": {...} } ] }
 *   ]
 * }
 * @endcode
 * The id allocator is persisted so ids stay unique across sessions.
 */
class StoreFile {
  public:
    /**
     * @brief Write every collection of the store to `filepath`.
     * @param filepath Destination file, overwritten
     * @param store Store to serialize
     * @throws IOError if the file cannot be written
     */
    static void save(const std::string &filepath, const FeatureStore &store);

    /**
     * @brief Read collections from `filepath` into an empty store.
     * @param filepath File produced by save() or written by hand
     * @param store Store receiving the collections
     * @throws IOError if the file cannot be read or parsed, or a collection
     * already exists in the store
     */
    static void load(const std::string &filepath, FeatureStore &store);

    static json to_json(const FeatureStore &store);
    static void from_json(const json &j, FeatureStore &store);
};

} // namespace geoedit
