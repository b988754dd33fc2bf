#include "edit_script.hpp"

#include <fstream>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace geoedit {

namespace {

const json &require(const json &j, const char *key) {
    if (!j.is_object() || !j.contains(key))
        throw IOError(fmt::format("missing '{}' in {}", key, j.dump()));
    return j[key];
}

FeatureRef parse_ref(const json &j) {
    if (!j.is_array() || j.size() != 2 || !j[0].is_string() ||
        !j[1].is_number_integer())
        throw IOError(
            fmt::format("expected [collection, id], got {}", j.dump()));
    return {j[0].get<std::string>(), j[1].get<FeatureId>()};
}

FeatureScope parse_scope(const json &j, const OperationBuilder &builder,
                         const FeatureStore &store) {
    if (!j.is_object() || j.size() != 1)
        throw IOError(fmt::format("scope must have one key: {}", j.dump()));

    if (j.contains("feature"))
        return parse_ref(j["feature"]);

    if (j.contains("pending"))
        return DirectiveHandle{j["pending"].get<std::uint32_t>()};

    if (j.contains("parent")) {
        const json &p = j["parent"];
        if (!p.is_array() || p.size() != 2)
            throw IOError(
                fmt::format("expected [handle, n], got {}", p.dump()));
        return builder.parent_ref(DirectiveHandle{p[0].get<std::uint32_t>()},
                                  p[1].get<std::size_t>());
    }

    if (j.contains("selection")) {
        SelectionSet selection;
        for (const auto &[collection, ids] : j["selection"].items()) {
            for (const auto &id : ids)
                selection.add(collection, id.get<FeatureId>());
        }
        return selection;
    }

    if (j.contains("all")) {
        const std::string collection = j["all"].get<std::string>();
        if (!store.has_collection(collection))
            throw ValidationError(
                fmt::format("unknown collection '{}'", collection));
        return store.select_all(collection);
    }

    if (j.contains("where")) {
        const json &w = j["where"];
        const std::string collection = require(w, "collection").get<std::string>();
        const std::string attribute = require(w, "attribute").get<std::string>();
        const AttributeValue expected =
            codec::json_to_attribute(require(w, "equals"));
        if (!store.has_collection(collection))
            throw ValidationError(
                fmt::format("unknown collection '{}'", collection));
        return store.select_by_predicate(
            collection, [&attribute, &expected](const Feature &feature) {
                auto it = feature.attributes.find(attribute);
                return it != feature.attributes.end() &&
                       it->second == expected;
            });
    }

    throw IOError(fmt::format("unknown scope {}", j.dump()));
}

SplitMethod parse_split(const json &j) {
    const bool from_start = j.value("from_start", true);
    if (j.contains("points"))
        return SplitAtPoints{codec::json_to_points(j["points"])};
    if (j.contains("line"))
        return SplitByLine{make_line(codec::json_to_points(j["line"]))};
    if (j.contains("equal_parts"))
        return SplitByEqualParts{j["equal_parts"].get<int>()};
    if (j.contains("distance"))
        return SplitByDistance{j["distance"].get<double>(), from_start};
    if (j.contains("percentage"))
        return SplitByPercentage{j["percentage"].get<double>(), from_start};
    if (j.contains("distances"))
        return SplitByVaryingDistance{
            j["distances"].get<std::vector<double>>(), from_start,
            j.value("proportion_remainder", false)};
    throw IOError(fmt::format("unknown split method {}", j.dump()));
}

TransformMethod parse_transform_method(const std::string &name) {
    if (name == "affine")
        return TransformMethod::Affine;
    if (name == "similarity")
        return TransformMethod::Similarity;
    throw IOError(fmt::format("unknown transform method '{}'", name));
}

OffsetSide parse_offset_side(const std::string &name) {
    if (name == "left")
        return OffsetSide::Left;
    if (name == "right")
        return OffsetSide::Right;
    if (name == "both")
        return OffsetSide::Both;
    throw IOError(fmt::format("unknown offset side '{}'", name));
}

directive::GeometricParams parse_geometric(const std::string &type,
                                           const json &j) {
    if (type == "move")
        return directive::MoveParams{j.value("dx", 0.0), j.value("dy", 0.0)};

    if (type == "rotate")
        return directive::RotateParams{codec::json_to_point(require(j, "origin")),
                                       require(j, "degrees").get<double>()};

    if (type == "scale")
        return directive::ScaleParams{codec::json_to_point(require(j, "origin")),
                                      j.value("sx", 1.0), j.value("sy", 1.0)};

    if (type == "transform") {
        directive::TransformParams params;
        if (j.contains("matrix")) {
            const auto m = j["matrix"].get<std::vector<double>>();
            if (m.size() != 6)
                throw IOError("transform matrix needs six values a..f");
            params.matrix = AffineMatrix{m[0], m[1], m[2], m[3], m[4], m[5]};
        }
        if (j.contains("links")) {
            for (const auto &link : j["links"]) {
                if (!link.is_array() || link.size() != 2)
                    throw IOError(fmt::format(
                        "control link needs [from, to], got {}", link.dump()));
                params.links.push_back({codec::json_to_point(link[0]),
                                        codec::json_to_point(link[1])});
            }
        }
        params.method =
            parse_transform_method(j.value("method", std::string("affine")));
        return params;
    }

    if (type == "clip") {
        const json &rings = require(j, "polygon");
        if (!rings.is_array() || rings.empty())
            throw IOError("clip polygon needs an outer ring");
        std::vector<std::vector<Point>> holes;
        for (std::size_t i = 1; i < rings.size(); ++i)
            holes.push_back(codec::json_to_points(rings[i]));
        const std::string mode = j.value("mode", std::string("preserve"));
        if (mode != "preserve" && mode != "discard")
            throw IOError(fmt::format("unknown clip mode '{}'", mode));
        return directive::ClipParams{
            make_polygon(codec::json_to_points(rings[0]), holes),
            mode == "preserve" ? ClipMode::PreserveArea
                               : ClipMode::DiscardArea};
    }

    if (type == "split")
        return directive::SplitParams{parse_split(require(j, "method"))};

    if (type == "merge") {
        directive::MergeParams params;
        if (j.contains("destination"))
            params.destination = j["destination"].get<std::string>();
        if (j.contains("attributes_from"))
            params.attributes_from = parse_ref(j["attributes_from"]);
        params.attributes =
            codec::json_to_attributes(j.value("attributes", json()));
        params.keep_originals = j.value("keep_originals", false);
        return params;
    }

    if (type == "reshape")
        return directive::ReshapeParams{
            make_line(codec::json_to_points(require(j, "path")))};

    if (type == "parallel_offset") {
        directive::ParallelOffsetParams params;
        params.distance = require(j, "distance").get<double>();
        params.side = parse_offset_side(j.value("side", std::string("both")));
        params.iterations = j.value("iterations", 1);
        if (j.contains("destination"))
            params.destination = j["destination"].get<std::string>();
        params.attributes =
            codec::json_to_attributes(j.value("attributes", json()));
        return params;
    }

    if (type == "planarize")
        return directive::PlanarizeParams{};

    throw IOError(fmt::format("unknown directive type '{}'", type));
}

} // namespace

void EditScript::add_directives(OperationBuilder &builder,
                                const FeatureStore &store,
                                const json &directives) {
    if (!directives.is_array())
        throw IOError("'directives' must be an array");

    for (const json &d : directives) {
        const std::string type = require(d, "type").get<std::string>();

        if (type == "create") {
            builder.add_create(
                require(d, "collection").get<std::string>(),
                codec::json_to_geometry(require(d, "geometry")),
                codec::json_to_attributes(d.value("attributes", json())));
        } else if (type == "modify") {
            std::optional<Geometry> geometry;
            if (d.contains("geometry"))
                geometry = codec::json_to_geometry(d["geometry"]);
            builder.add_modify(
                parse_scope(require(d, "target"), builder, store),
                codec::json_to_attributes(d.value("attributes", json())),
                std::move(geometry));
        } else if (type == "delete") {
            builder.add_delete(parse_scope(require(d, "target"), builder, store));
        } else if (type == "transfer_attributes") {
            builder.add_transfer_attributes(
                parse_scope(require(d, "source"), builder, store),
                parse_scope(require(d, "target"), builder, store),
                d.value("mapping", std::map<std::string, std::string>{}));
        } else {
            builder.add_geometric_op(
                parse_scope(require(d, "target"), builder, store),
                parse_geometric(type, d));
        }
    }
}

EditScript EditScript::from_json(const json &j) {
    EditScript script;
    const json &steps = require(j, "steps");
    if (!steps.is_array())
        throw IOError("'steps' must be an array");

    for (const json &step : steps) {
        if (step.contains("operation")) {
            OperationStep op;
            op.name = step["operation"].get<std::string>();
            op.label = step.value("label", op.name);
            if (step.contains("chain"))
                op.chain = step["chain"].get<std::string>();
            op.directives = require(step, "directives");
            script.m_steps.push_back(std::move(op));
        } else if (step.contains("undo") || step.contains("redo")) {
            HistoryStep history;
            history.undo = step.contains("undo");
            const json &target = history.undo ? step["undo"] : step["redo"];
            if (target.is_string())
                history.label = target.get<std::string>();
            script.m_steps.push_back(history);
        } else {
            throw IOError(fmt::format("unknown step {}", step.dump()));
        }
    }
    return script;
}

EditScript EditScript::load(const std::string &filepath) {
    LOG_INFO("Loading edit script from: " + filepath);

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw IOError("Failed to open file for reading: " + filepath);
        }

        json j;
        file >> j;
        return from_json(j);
    } catch (const IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: " + std::string(e.what()));
        throw IOError("JSON parsing failed: " + std::string(e.what()));
    }
}

std::vector<TransactionPtr> EditScript::run(EditEngine &engine) const {
    std::map<std::string, TransactionPtr> labelled;
    std::vector<TransactionPtr> results;

    auto lookup = [&labelled](const std::string &label) {
        auto it = labelled.find(label);
        if (it == labelled.end())
            throw NotFoundError(fmt::format("script label '{}'", label));
        return it->second;
    };

    for (const Step &step : m_steps) {
        if (const auto *op = std::get_if<OperationStep>(&step)) {
            OperationBuilder builder =
                op->chain ? engine.chain_from(lookup(*op->chain), op->name)
                          : engine.create_operation(op->name);
            try {
                add_directives(builder, engine.store(), op->directives);
            } catch (const json::exception &e) {
                throw IOError(fmt::format("operation '{}': {}", op->name,
                                          e.what()));
            }

            TransactionPtr record = engine.submit_async(builder.build()).get();
            labelled[op->label] = record;
            results.push_back(std::move(record));
        } else {
            const auto &history = std::get<HistoryStep>(step);
            TransactionPtr target =
                history.label ? lookup(*history.label) : nullptr;
            SubmitHandle handle = history.undo ? engine.undo_async(target)
                                               : engine.redo_async(target);
            results.push_back(handle.get());
        }
    }
    return results;
}

const char *error_kind(const std::exception &error) noexcept {
    if (dynamic_cast<const EmptyOperationError *>(&error))
        return "EmptyOperationError";
    if (dynamic_cast<const ValidationError *>(&error))
        return "ValidationError";
    if (dynamic_cast<const ConcurrentModificationError *>(&error))
        return "ConcurrentModificationError";
    if (dynamic_cast<const ApplyError *>(&error))
        return "ApplyError";
    if (dynamic_cast<const NoParentTransactionError *>(&error))
        return "NoParentTransactionError";
    if (dynamic_cast<const CancelledError *>(&error))
        return "CancelledError";
    if (dynamic_cast<const WrongContextError *>(&error))
        return "WrongContextError";
    if (dynamic_cast<const NotFoundError *>(&error))
        return "NotFoundError";
    if (dynamic_cast<const GeometryError *>(&error))
        return "GeometryError";
    if (dynamic_cast<const IOError *>(&error))
        return "IOError";
    if (dynamic_cast<const ConfigError *>(&error))
        return "ConfigError";
    return "Error";
}

} // namespace geoedit
