#include "operation_chain.hpp"

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace geoedit {

void OperationChain::require_parent(const TransactionRecord &parent,
                                    bool in_history) {
    if (!parent.succeeded())
        throw NoParentTransactionError(fmt::format(
            "transaction '{}' never committed (state {})", parent.name(),
            parent.state()));
    if (!parent.is_applied())
        throw NoParentTransactionError(
            fmt::format("transaction '{}' (#{}) is {}", parent.name(),
                        parent.sequence(), parent.state()));
    if (!in_history)
        throw NoParentTransactionError(fmt::format(
            "transaction '{}' (#{}) is no longer in the undo history",
            parent.name(), parent.sequence()));
}

OperationBuilder
OperationChain::seed(const FeatureStore &store,
                     std::shared_ptr<const TransactionRecord> parent,
                     std::string name) {
    if (name.empty())
        name = parent->name() + " (chained)";

    OperationBuilder builder(store, std::move(name));
    builder.m_parent = std::move(parent);

    LOG_DEBUG(fmt::format("Chained '{}' to #{}", builder.name(),
                          builder.m_parent->sequence()));
    return builder;
}

DirectiveHandle OperationChain::duplicate(OperationBuilder &builder,
                                          const FeatureStore &store,
                                          DirectiveHandle parent_handle,
                                          std::size_t n,
                                          const std::string &destination) {
    const FeatureRef source = builder.parent_ref(parent_handle, n);
    Feature copy = store.get(source);
    return builder.add_create(destination.empty() ? source.collection
                                                  : destination,
                              std::move(copy.geometry),
                              std::move(copy.attributes));
}

} // namespace geoedit
