#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "feature.hpp"
#include "selection_set.hpp"

namespace geoedit {

/**
 * @brief Before and after state of one feature. An empty optional means the
 * feature does not exist on that side (create / delete).
 */
struct FeatureChange {
    FeatureRef ref;
    std::optional<Feature> before;
    std::optional<Feature> after;
};

/**
 * @brief Keyed, attribute-typed feature collections.
 *
 * Every collection has its own shared mutex. Reads (get, select_by_predicate)
 * take it shared and may run concurrently. Writes are only possible through
 * a WriteGuard, which holds the mutexes of all touched collections
 * exclusively; the edit engine obtains one on its mutation context.
 *
 * Guards lock collections in name order. A thread holding a guard must not
 * call the locking readers (get, select_by_predicate, ...) on a collection the
 * guard covers; use the guard's accessors instead.
 */
class FeatureStore {
  private:
    struct Slot {
        Feature feature;
        std::uint64_t revision = 0;
    };

    struct Collection {
        std::string name;
        GeometryType type = GeometryType::Point;
        mutable std::shared_mutex mutex;
        std::map<FeatureId, Slot> features;
        FeatureId next_id = 1;
    };

  public:
    using Predicate = std::function<bool(const Feature &)>;

    /**
     * @brief Shared access to a fixed set of collections.
     */
    class ReadGuard {
      public:
        /**
         * @brief Feature at `ref`, or nullptr if it does not exist.
         * @throws NotFoundError if the collection is not covered
         */
        const Feature *find(const FeatureRef &ref) const;

        /**
         * @brief Revision of the feature, 0 if it does not exist.
         */
        std::uint64_t revision(const FeatureRef &ref) const;

        GeometryType geometry_type(const std::string &collection) const;

        /**
         * @brief Id the next created feature would receive.
         */
        FeatureId next_id(const std::string &collection) const;

        bool covers(const std::string &collection) const {
            return m_collections.count(collection) > 0;
        }

      protected:
        friend class FeatureStore;
        ReadGuard() = default;

        const Collection &collection(const std::string &name) const;

        std::map<std::string, Collection *> m_collections;

      private:
        std::vector<std::shared_lock<std::shared_mutex>> m_locks;
    };

    /**
     * @brief Exclusive access to a fixed set of collections.
     */
    class WriteGuard : public ReadGuard {
      public:
        /**
         * @brief Writes the next state of one feature.
         *
         * An engaged `next` inserts or replaces, an empty one erases. The
         * allocator is advanced past the id so it is never handed out again.
         * @return The previous and new state of the feature
         * @throws NotFoundError if the collection is not covered
         */
        FeatureChange apply_directive(const FeatureRef &ref,
                                      std::optional<Feature> next);

        /**
         * @brief Moves the id allocator forward to at least `next_id`.
         */
        void reserve_ids(const std::string &collection, FeatureId next_id);

      private:
        friend class FeatureStore;
        explicit WriteGuard(std::atomic<std::uint64_t> &clock)
            : m_clock(&clock) {}

        Collection &writable(const std::string &name);

        std::atomic<std::uint64_t> *m_clock;
        std::vector<std::unique_lock<std::shared_mutex>> m_locks;
    };

  public:
    FeatureStore() = default;
    ~FeatureStore() = default;
    FeatureStore(const FeatureStore &) = delete;
    FeatureStore &operator=(const FeatureStore &) = delete;
    FeatureStore(FeatureStore &&) = delete;
    FeatureStore &operator=(FeatureStore &&) = delete;

    /**
     * @brief Registers an empty collection.
     * @throws ValidationError if the name is empty or already used
     */
    void create_collection(const std::string &name, GeometryType type,
                           FeatureId next_id = 1);

    bool has_collection(const std::string &name) const;

    /**
     * @throws NotFoundError for unknown collections
     */
    GeometryType geometry_type(const std::string &name) const;

    std::vector<std::string> collection_names() const;

    /**
     * @brief Number of features in the collection.
     * @throws NotFoundError for unknown collections
     */
    std::size_t size(const std::string &collection) const;

    /**
     * @throws NotFoundError if the collection or the feature is absent
     */
    Feature get(const std::string &collection, FeatureId id) const;
    Feature get(const FeatureRef &ref) const {
        return get(ref.collection, ref.id);
    }

    bool contains(const FeatureRef &ref) const;

    /**
     * @brief Ids of the features matching the predicate.
     * @throws NotFoundError for unknown collections
     */
    SelectionSet select_by_predicate(const std::string &collection,
                                     const Predicate &predicate) const;

    SelectionSet select_all(const std::string &collection) const;

    /**
     * @brief Copy of every feature of the collection, ordered by id.
     */
    std::vector<Feature> features(const std::string &collection) const;

    FeatureId next_id(const std::string &collection) const;

    /**
     * @throws NotFoundError if any collection is unknown
     */
    ReadGuard lock_for_read(const std::set<std::string> &collections) const;
    WriteGuard lock_for_write(const std::set<std::string> &collections);

  private:
    Collection *find_collection(const std::string &name) const;
    Collection &require_collection(const std::string &name) const;

    mutable std::shared_mutex m_catalog_mutex;
    std::map<std::string, std::unique_ptr<Collection>> m_collections;
    std::atomic<std::uint64_t> m_revision_clock{0};
};

} // namespace geoedit
