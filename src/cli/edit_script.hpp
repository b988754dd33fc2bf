#pragma once

#include <exception>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../engine/edit_engine.hpp"
#include "../store/json_codec.hpp"

namespace geoedit {

/**
 * @brief A JSON list of edit steps applied to a store in order.
 *
 * @code
 * { "steps": [
 *     { "operation": "add road", "label": "road",
 *       "directives": [ { "type": "create", "collection": "roads",
 *                         "geometry": {...}, "attributes": {...} } ] },
 *     { "operation": "name it", "chain": "road",
 *       "directives": [ { "type": "modify", "target": { "parent": [0, 0] },
 *                         "attributes": { "name": "Main St" } } ] },
 *     { "undo": "road" },
 *     { "redo": true }
 * ] }
 * @endcode
 *
 * Scopes are `{"feature": ["c", 3]}`, `{"pending": 0}` (an earlier create of
 * the same step), `{"parent": [handle, n]}` (a feature the chained parent
 * created), `{"selection": {"c": [1, 2]}}`, `{"all": "c"}` or
 * `{"where": {"collection": "c", "attribute": "k", "equals": v}}`.
 */
class EditScript {
  public:
    struct OperationStep {
        std::string name;
        std::string label;
        std::optional<std::string> chain;
        json directives;
    };

    /** @brief Undo or redo, of the latest transaction or a labelled one */
    struct HistoryStep {
        bool undo = true;
        std::optional<std::string> label;
    };

    using Step = std::variant<OperationStep, HistoryStep>;

    /**
     * @throws IOError if the file cannot be read or is malformed
     */
    static EditScript load(const std::string &filepath);
    static EditScript from_json(const json &j);

    const std::vector<Step> &steps() const noexcept { return m_steps; }

    /**
     * @brief Append the directives of a JSON list to `builder`.
     * @throws IOError for malformed directives
     * @throws ValidationError for references the builder rejects
     */
    static void add_directives(OperationBuilder &builder,
                               const FeatureStore &store,
                               const json &directives);

    /**
     * @brief Run every step through the engine's asynchronous API.
     * @return The record each step produced or reverted, in step order
     * @throws the first error a step raised; earlier steps stay applied
     */
    std::vector<TransactionPtr> run(EditEngine &engine) const;

  private:
    std::vector<Step> m_steps;
};

/**
 * @brief Name of the error class for reports, e.g. "ValidationError".
 */
const char *error_kind(const std::exception &error) noexcept;

} // namespace geoedit
