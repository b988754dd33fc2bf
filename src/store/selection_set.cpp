#include "selection_set.hpp"

namespace geoedit {

SelectionSet::SelectionSet(const std::string &collection,
                           const std::vector<FeatureId> &ids) {
    for (FeatureId id : ids)
        add(collection, id);
}

void SelectionSet::add(const std::string &collection, FeatureId id) {
    m_ids[collection].insert(id);
}

bool SelectionSet::remove(const FeatureRef &ref) {
    auto it = m_ids.find(ref.collection);
    if (it == m_ids.end())
        return false;
    const bool erased = it->second.erase(ref.id) > 0;
    if (it->second.empty())
        m_ids.erase(it);
    return erased;
}

void SelectionSet::merge(const SelectionSet &other) {
    for (const auto &[collection, ids] : other.m_ids)
        m_ids[collection].insert(ids.begin(), ids.end());
}

bool SelectionSet::contains(const FeatureRef &ref) const {
    auto it = m_ids.find(ref.collection);
    return it != m_ids.end() && it->second.count(ref.id) > 0;
}

std::size_t SelectionSet::size() const noexcept {
    std::size_t total = 0;
    for (const auto &entry : m_ids)
        total += entry.second.size();
    return total;
}

std::vector<std::string> SelectionSet::collections() const {
    std::vector<std::string> out;
    out.reserve(m_ids.size());
    for (const auto &entry : m_ids)
        out.push_back(entry.first);
    return out;
}

std::vector<FeatureId> SelectionSet::ids(const std::string &collection) const {
    auto it = m_ids.find(collection);
    if (it == m_ids.end())
        return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<FeatureRef> SelectionSet::refs() const {
    std::vector<FeatureRef> out;
    out.reserve(size());
    for (const auto &[collection, ids] : m_ids) {
        for (FeatureId id : ids)
            out.push_back({collection, id});
    }
    return out;
}

} // namespace geoedit
