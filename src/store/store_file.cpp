#include "store_file.hpp"

#include <fstream>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace geoedit {

json StoreFile::to_json(const FeatureStore &store) {
    json collections = json::array();
    for (const std::string &name : store.collection_names()) {
        json features = json::array();
        for (const Feature &feature : store.features(name))
            features.push_back(codec::feature_to_json(feature));

        collections.push_back({{"name", name},
                               {"geometry_type",
                                to_string(store.geometry_type(name))},
                               {"next_id", store.next_id(name)},
                               {"features", features}});
    }
    return json{{"collections", collections}};
}

void StoreFile::from_json(const json &j, FeatureStore &store) {
    if (!j.is_object() || !j.contains("collections") ||
        !j["collections"].is_array())
        throw IOError("store document needs a 'collections' array");

    for (const auto &entry : j["collections"]) {
        const std::string name = entry.at("name").get<std::string>();
        GeometryType type;
        try {
            type = geometry_type_from_string(
                entry.at("geometry_type").get<std::string>());
        } catch (const GeometryError &e) {
            throw IOError(fmt::format("collection '{}': {}", name, e.what()));
        }

        std::vector<Feature> features;
        if (entry.contains("features")) {
            for (const auto &item : entry["features"]) {
                Feature feature = codec::json_to_feature(item);
                if (feature.id < 1)
                    throw IOError(fmt::format(
                        "collection '{}': feature id {} is not positive", name,
                        feature.id));
                if (type_of(feature.geometry) != type)
                    throw IOError(fmt::format(
                        "collection '{}': feature {} is a {}, expected {}",
                        name, feature.id, to_string(type_of(feature.geometry)),
                        to_string(type)));
                if (is_degenerate(feature.geometry))
                    throw IOError(fmt::format(
                        "collection '{}': feature {} has a degenerate {}",
                        name, feature.id, to_string(type)));
                features.push_back(std::move(feature));
            }
        }

        try {
            store.create_collection(name, type,
                                    entry.value("next_id", FeatureId{1}));
        } catch (const ValidationError &e) {
            throw IOError(e.what());
        }

        auto guard = store.lock_for_write({name});
        for (Feature &feature : features) {
            const FeatureRef ref{name, feature.id};
            if (guard.find(ref))
                throw IOError(fmt::format("duplicate feature {}", ref));
            guard.apply_directive(ref, std::move(feature));
        }

        LOG_DEBUG(fmt::format("Loaded collection '{}' with {} features", name,
                              features.size()));
    }
}

void StoreFile::save(const std::string &filepath, const FeatureStore &store) {
    LOG_INFO("Saving store to: " + filepath);

    try {
        json j = to_json(store);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            throw IOError("Failed to open file for writing: " + filepath);
        }

        file << j.dump(2);
        file.close();

        LOG_INFO("Store saved successfully");
    } catch (const IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON serialization error: " + std::string(e.what()));
        throw IOError("JSON serialization failed: " + std::string(e.what()));
    }
}

void StoreFile::load(const std::string &filepath, FeatureStore &store) {
    LOG_INFO("Loading store from: " + filepath);

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw IOError("Failed to open file for reading: " + filepath);
        }

        json j;
        file >> j;
        file.close();

        from_json(j, store);

        LOG_INFO("Store loaded successfully");
    } catch (const IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: " + std::string(e.what()));
        throw IOError("JSON parsing failed: " + std::string(e.what()));
    }
}

} // namespace geoedit
