#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "feature.hpp"

namespace geoedit {

/**
 * @brief Collection name to ordered set of feature ids.
 *
 * Transient: built for one operation from a query or an explicit id list.
 * Iteration order is collection name, then id, which is also the order in
 * which directives scoped to a selection visit features.
 */
class SelectionSet {
  public:
    SelectionSet() = default;

    /**
     * @brief Selection of explicit ids in one collection.
     */
    SelectionSet(const std::string &collection,
                 const std::vector<FeatureId> &ids);

    void add(const std::string &collection, FeatureId id);
    void add(const FeatureRef &ref) { add(ref.collection, ref.id); }
    bool remove(const FeatureRef &ref);

    /**
     * @brief Adds every id of `other`.
     */
    void merge(const SelectionSet &other);

    bool contains(const FeatureRef &ref) const;
    bool empty() const noexcept { return m_ids.empty(); }

    /**
     * @brief Total number of ids across collections.
     */
    std::size_t size() const noexcept;

    std::vector<std::string> collections() const;
    std::vector<FeatureId> ids(const std::string &collection) const;

    /**
     * @brief Every selected feature in iteration order.
     */
    std::vector<FeatureRef> refs() const;

    bool operator==(const SelectionSet &other) const {
        return m_ids == other.m_ids;
    }

  private:
    std::map<std::string, std::set<FeatureId>> m_ids;
};

} // namespace geoedit
