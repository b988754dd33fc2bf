#include "staging_area.hpp"

namespace geoedit {

const Feature *StagingArea::find(const FeatureRef &ref) const {
    auto it = m_overlay.find(ref);
    if (it != m_overlay.end())
        return it->second ? &*it->second : nullptr;
    return m_guard->find(ref);
}

void StagingArea::put(const FeatureRef &ref, std::optional<Feature> next) {
    if (next)
        next->id = ref.id;
    auto [it, inserted] = m_overlay.insert_or_assign(ref, std::move(next));
    if (inserted)
        m_order.push_back(ref);
}

FeatureRef StagingArea::allocate(const std::string &collection) {
    auto it = m_next_ids.find(collection);
    if (it == m_next_ids.end())
        it = m_next_ids.emplace(collection, m_guard->next_id(collection)).first;
    return {collection, it->second++};
}

std::vector<FeatureChange> StagingArea::commit() {
    std::vector<FeatureChange> changes;
    for (const FeatureRef &ref : m_order) {
        std::optional<Feature> before;
        if (const Feature *current = m_guard->find(ref))
            before = *current;
        const std::optional<Feature> &after = m_overlay.at(ref);
        if (!same_state(before, after))
            changes.push_back({ref, std::move(before), after});
    }

    // Ids allocated and then dropped again in the same transaction stay used.
    for (const auto &[collection, next_id] : m_next_ids)
        m_guard->reserve_ids(collection, next_id);
    for (const FeatureChange &change : changes)
        m_guard->apply_directive(change.ref, change.after);

    m_overlay.clear();
    m_order.clear();
    m_next_ids.clear();
    return changes;
}

} // namespace geoedit
