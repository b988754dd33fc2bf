#include "feature_store.hpp"

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace geoedit {

const FeatureStore::Collection &
FeatureStore::ReadGuard::collection(const std::string &name) const {
    auto it = m_collections.find(name);
    if (it == m_collections.end())
        throw NotFoundError(
            fmt::format("collection '{}' is not held by this guard", name));
    return *it->second;
}

const Feature *FeatureStore::ReadGuard::find(const FeatureRef &ref) const {
    const Collection &c = collection(ref.collection);
    auto it = c.features.find(ref.id);
    return it == c.features.end() ? nullptr : &it->second.feature;
}

std::uint64_t FeatureStore::ReadGuard::revision(const FeatureRef &ref) const {
    const Collection &c = collection(ref.collection);
    auto it = c.features.find(ref.id);
    return it == c.features.end() ? 0 : it->second.revision;
}

GeometryType
FeatureStore::ReadGuard::geometry_type(const std::string &name) const {
    return collection(name).type;
}

FeatureId FeatureStore::ReadGuard::next_id(const std::string &name) const {
    return collection(name).next_id;
}

FeatureStore::Collection &
FeatureStore::WriteGuard::writable(const std::string &name) {
    auto it = m_collections.find(name);
    if (it == m_collections.end())
        throw NotFoundError(
            fmt::format("collection '{}' is not held by this guard", name));
    return *it->second;
}

FeatureChange
FeatureStore::WriteGuard::apply_directive(const FeatureRef &ref,
                                          std::optional<Feature> next) {
    Collection &c = writable(ref.collection);

    FeatureChange change;
    change.ref = ref;

    auto it = c.features.find(ref.id);
    if (it != c.features.end())
        change.before = it->second.feature;

    if (next) {
        next->id = ref.id;
        const std::uint64_t revision = ++(*m_clock);
        if (it == c.features.end()) {
            c.features.emplace(ref.id, Slot{*next, revision});
        } else {
            it->second.feature = *next;
            it->second.revision = revision;
        }
        if (ref.id >= c.next_id)
            c.next_id = ref.id + 1;
    } else if (it != c.features.end()) {
        c.features.erase(it);
    }

    change.after = std::move(next);
    return change;
}

void FeatureStore::WriteGuard::reserve_ids(const std::string &name,
                                           FeatureId next_id) {
    Collection &c = writable(name);
    if (next_id > c.next_id)
        c.next_id = next_id;
}

void FeatureStore::create_collection(const std::string &name,
                                     GeometryType type, FeatureId next_id) {
    if (name.empty())
        throw ValidationError("collection name must not be empty");
    if (next_id < 1)
        throw ValidationError(
            fmt::format("collection '{}': next id must be positive", name));

    std::unique_lock lock(m_catalog_mutex);
    if (m_collections.count(name) > 0)
        throw ValidationError(
            fmt::format("collection '{}' already exists", name));

    auto collection = std::make_unique<Collection>();
    collection->name = name;
    collection->type = type;
    collection->next_id = next_id;
    m_collections.emplace(name, std::move(collection));

    LOG_DEBUG(fmt::format("Created collection '{}' ({})", name,
                          to_string(type)));
}

bool FeatureStore::has_collection(const std::string &name) const {
    std::shared_lock lock(m_catalog_mutex);
    return m_collections.count(name) > 0;
}

FeatureStore::Collection *
FeatureStore::find_collection(const std::string &name) const {
    std::shared_lock lock(m_catalog_mutex);
    auto it = m_collections.find(name);
    return it == m_collections.end() ? nullptr : it->second.get();
}

FeatureStore::Collection &
FeatureStore::require_collection(const std::string &name) const {
    Collection *collection = find_collection(name);
    if (!collection)
        throw NotFoundError(fmt::format("collection '{}'", name));
    return *collection;
}

GeometryType FeatureStore::geometry_type(const std::string &name) const {
    // The declared type never changes after creation.
    return require_collection(name).type;
}

std::vector<std::string> FeatureStore::collection_names() const {
    std::shared_lock lock(m_catalog_mutex);
    std::vector<std::string> names;
    names.reserve(m_collections.size());
    for (const auto &entry : m_collections)
        names.push_back(entry.first);
    return names;
}

std::size_t FeatureStore::size(const std::string &name) const {
    const Collection &c = require_collection(name);
    std::shared_lock lock(c.mutex);
    return c.features.size();
}

Feature FeatureStore::get(const std::string &name, FeatureId id) const {
    const Collection &c = require_collection(name);
    std::shared_lock lock(c.mutex);
    auto it = c.features.find(id);
    if (it == c.features.end())
        throw NotFoundError(fmt::format("feature {}#{}", name, id));
    return it->second.feature;
}

bool FeatureStore::contains(const FeatureRef &ref) const {
    const Collection *c = find_collection(ref.collection);
    if (!c)
        return false;
    std::shared_lock lock(c->mutex);
    return c->features.count(ref.id) > 0;
}

SelectionSet FeatureStore::select_by_predicate(const std::string &name,
                                               const Predicate &predicate) const {
    const Collection &c = require_collection(name);
    std::shared_lock lock(c.mutex);
    SelectionSet selection;
    for (const auto &[id, slot] : c.features) {
        if (predicate(slot.feature))
            selection.add(name, id);
    }
    return selection;
}

SelectionSet FeatureStore::select_all(const std::string &name) const {
    return select_by_predicate(name, [](const Feature &) { return true; });
}

std::vector<Feature> FeatureStore::features(const std::string &name) const {
    const Collection &c = require_collection(name);
    std::shared_lock lock(c.mutex);
    std::vector<Feature> out;
    out.reserve(c.features.size());
    for (const auto &entry : c.features)
        out.push_back(entry.second.feature);
    return out;
}

FeatureId FeatureStore::next_id(const std::string &name) const {
    const Collection &c = require_collection(name);
    std::shared_lock lock(c.mutex);
    return c.next_id;
}

FeatureStore::ReadGuard
FeatureStore::lock_for_read(const std::set<std::string> &collections) const {
    ReadGuard guard;
    // Resolve every name first so a missing collection takes no locks.
    for (const std::string &name : collections)
        guard.m_collections[name] = &require_collection(name);
    for (const auto &entry : guard.m_collections)
        guard.m_locks.emplace_back(entry.second->mutex);
    return guard;
}

FeatureStore::WriteGuard
FeatureStore::lock_for_write(const std::set<std::string> &collections) {
    WriteGuard guard(m_revision_clock);
    for (const std::string &name : collections)
        guard.m_collections[name] = &require_collection(name);
    for (const auto &entry : guard.m_collections)
        guard.m_locks.emplace_back(entry.second->mutex);
    return guard;
}

} // namespace geoedit
