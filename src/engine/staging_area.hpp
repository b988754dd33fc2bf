#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../store/feature_store.hpp"

namespace geoedit {

/**
 * @brief Copy-on-write overlay over a write guard.
 *
 * Directives read and write features through the overlay; the store is not
 * touched until commit(). Dropping the overlay discards every staged write
 * and every id it allocated.
 */
class StagingArea {
  public:
    explicit StagingArea(FeatureStore::WriteGuard &guard) : m_guard(&guard) {}

    /**
     * @brief Staged state of a feature, nullptr if it does not exist.
     */
    const Feature *find(const FeatureRef &ref) const;

    /**
     * @brief Stage the next state of a feature; an empty optional deletes it.
     */
    void put(const FeatureRef &ref, std::optional<Feature> next);

    /**
     * @brief Next free id of the collection, never handed out before.
     */
    FeatureRef allocate(const std::string &collection);

    /**
     * @brief Write the net result to the store.
     * @return One change per feature whose state differs, in first-touch
     * order
     */
    std::vector<FeatureChange> commit();

    bool empty() const noexcept { return m_overlay.empty(); }

  private:
    FeatureStore::WriteGuard *m_guard;
    std::map<FeatureRef, std::optional<Feature>> m_overlay;
    std::vector<FeatureRef> m_order;
    std::map<std::string, FeatureId> m_next_ids;
};

} // namespace geoedit
