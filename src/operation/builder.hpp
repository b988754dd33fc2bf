#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../store/feature_store.hpp"
#include "descriptor.hpp"
#include "transaction.hpp"

namespace geoedit {

/**
 * @brief Accumulates directives into an OperationDescriptor.
 *
 * Every add_* call appends one directive and returns its handle, which later
 * directives of the same builder can target as a pending feature. The builder
 * only checks references (collections exist, pending handles point at an
 * earlier Create); feature existence and geometry are checked by the engine.
 *
 * Not thread-safe. A builder is meant to be filled by one thread and then
 * sealed with build().
 */
class OperationBuilder {
  public:
    /**
     * @param store Store whose collections directives may reference
     * @param name Label of the resulting transaction
     */
    explicit OperationBuilder(const FeatureStore &store, std::string name = {});

    /**
     * @brief Creates a feature.
     * @throws ValidationError if the collection does not exist
     */
    DirectiveHandle add_create(const std::string &collection,
                               Geometry geometry, AttributeMap attributes = {});

    /**
     * @brief Assigns attributes and optionally replaces the geometry of every
     * feature in scope.
     */
    DirectiveHandle add_modify(FeatureScope target, AttributeMap attributes,
                               std::optional<Geometry> geometry = std::nullopt);

    DirectiveHandle add_delete(FeatureScope target);

    /**
     * @brief Geometric operation on every feature in scope. The kind is given
     * by the parameter type.
     */
    DirectiveHandle add_geometric_op(FeatureScope target,
                                     directive::GeometricParams params);

    /**
     * @brief Copies attributes from the single feature `source` onto every
     * feature in `target`.
     * @param mapping destination name to source name, empty to copy all
     */
    DirectiveHandle
    add_transfer_attributes(FeatureScope source, FeatureScope target,
                            std::map<std::string, std::string> mapping = {});

    /**
     * @brief Seals the builder and returns the descriptor. Further add_*
     * calls throw; calling build() again returns the same descriptor.
     */
    DescriptorPtr build();

    bool sealed() const noexcept { return m_built != nullptr; }
    std::size_t size() const noexcept {
        return m_built ? m_built->size() : m_directives.size();
    }
    const std::string &name() const noexcept { return m_name; }

    bool is_chained() const noexcept { return m_parent != nullptr; }

    /**
     * @brief Parent transaction of a chained builder, null otherwise.
     */
    const std::shared_ptr<const TransactionRecord> &parent() const noexcept {
        return m_parent;
    }

    /**
     * @brief The `n`-th feature the parent's directive `handle` created.
     * @throws NotFoundError if this builder is not chained or the parent
     * created no such feature
     */
    FeatureRef parent_ref(DirectiveHandle handle, std::size_t n = 0) const;

  private:
    friend class OperationChain;

    DirectiveHandle push(Directive directive);
    void check_open() const;
    void check_collection(const std::string &name) const;
    void check_scope(const FeatureScope &scope) const;

    const FeatureStore *m_store;
    std::string m_name;
    std::vector<Directive> m_directives;
    std::shared_ptr<const TransactionRecord> m_parent;
    DescriptorPtr m_built;
};

} // namespace geoedit
