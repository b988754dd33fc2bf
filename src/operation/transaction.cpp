#include "transaction.hpp"

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace geoedit {

const char *to_string(TransactionState state) noexcept {
    switch (state) {
    case TransactionState::Building:
        return "building";
    case TransactionState::Validated:
        return "validated";
    case TransactionState::Applied:
        return "applied";
    case TransactionState::Undone:
        return "undone";
    case TransactionState::Redone:
        return "redone";
    case TransactionState::Rejected:
        return "rejected";
    }
    return "unknown";
}

TransactionRecord::TransactionRecord(DescriptorPtr descriptor)
    : m_descriptor(std::move(descriptor)) {}

std::vector<FeatureId> TransactionRecord::created_ids() const {
    std::vector<FeatureId> ids;
    for (const DirectiveOutcome &outcome : m_outcomes) {
        const Directive &d = m_descriptor->at(outcome.handle);
        if (std::holds_alternative<directive::Create>(d) &&
            !outcome.created.empty())
            ids.push_back(outcome.created.front().id);
    }
    return ids;
}

FeatureRef TransactionRecord::resolve(DirectiveHandle handle,
                                      std::size_t n) const {
    if (handle.index < m_outcomes.size()) {
        const DirectiveOutcome &outcome = m_outcomes[handle.index];
        if (n < outcome.created.size())
            return outcome.created[n];
    }
    throw NotFoundError(fmt::format(
        "transaction '{}' directive {} created no feature #{}", name(),
        handle.index, n));
}

} // namespace geoedit
