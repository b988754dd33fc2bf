#pragma once

#include <memory>
#include <string>

#include "../operation/builder.hpp"

namespace geoedit {

/**
 * @brief Spawns builders linked to a committed parent transaction.
 *
 * A chained builder knows the ids its parent assigned (parent_ref) and its
 * descriptor carries the parent sequence, which the undo history follows
 * when the parent is undone or redone.
 */
class OperationChain {
  public:
    /**
     * @brief Check that `parent` can accept a chained operation.
     * @param parent Record to chain from
     * @param in_history Whether the parent is on the undo side of the history
     * @throws NoParentTransactionError if the parent never committed or its
     * effects are not in the store
     */
    static void require_parent(const TransactionRecord &parent,
                               bool in_history);

    /**
     * @brief A builder whose descriptor will be chained to `parent`.
     * @param name Label; defaults to the parent's name with a " (chained)"
     * suffix
     */
    static OperationBuilder seed(const FeatureStore &store,
                                 std::shared_ptr<const TransactionRecord> parent,
                                 std::string name = {});

    /**
     * @brief Add a Create copying a feature the parent created.
     *
     * The copy is taken from the store as it is now, so edits made after the
     * parent committed are duplicated too.
     * @param destination Target collection, empty for the source collection
     * @return Handle of the new Create directive
     * @throws NotFoundError if the parent created no such feature or it no
     * longer exists
     */
    static DirectiveHandle duplicate(OperationBuilder &builder,
                                     const FeatureStore &store,
                                     DirectiveHandle parent_handle,
                                     std::size_t n = 0,
                                     const std::string &destination = {});
};

} // namespace geoedit
