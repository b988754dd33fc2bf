#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "../store/feature_store.hpp"
#include "descriptor.hpp"

namespace geoedit {

/**
 * @brief Lifecycle of a transaction record.
 *
 * Building -> Validated -> Applied -> (Undone <-> Redone). Any failure before
 * commit ends in Rejected with the store unchanged.
 */
enum class TransactionState { Building, Validated, Applied, Undone, Redone, Rejected };

const char *to_string(TransactionState state) noexcept;

/**
 * @brief Result of one directive.
 */
struct DirectiveOutcome {
    DirectiveHandle handle;
    std::string name;

    /** @brief Features the directive created, in creation order */
    std::vector<FeatureRef> created;

    /** @brief One entry per feature the directive touched */
    std::vector<FeatureChange> changes;
};

/**
 * @brief Record of a submitted descriptor and, once committed, everything
 * needed to revert it exactly.
 *
 * The engine is the only writer. State is readable from any thread; outcomes
 * and changes are written once on the mutation context before the record is
 * handed out and never change afterwards.
 */
class TransactionRecord {
  public:
    explicit TransactionRecord(DescriptorPtr descriptor);

    TransactionRecord(const TransactionRecord &) = delete;
    TransactionRecord &operator=(const TransactionRecord &) = delete;
    TransactionRecord(TransactionRecord &&) = delete;
    TransactionRecord &operator=(TransactionRecord &&) = delete;

    const std::string &name() const noexcept { return m_descriptor->name(); }
    const DescriptorPtr &descriptor() const noexcept { return m_descriptor; }

    TransactionState state() const noexcept { return m_state.load(); }

    /**
     * @brief True once the transaction committed, regardless of later
     * undo/redo.
     */
    bool succeeded() const noexcept { return m_sequence != 0; }

    /**
     * @brief True while the effects of the transaction are in the store.
     */
    bool is_applied() const noexcept {
        const TransactionState s = state();
        return s == TransactionState::Applied || s == TransactionState::Redone;
    }

    /**
     * @brief Commit order, starting at 1. Zero for rejected records.
     */
    std::uint64_t sequence() const noexcept { return m_sequence; }

    std::optional<std::uint64_t> parent_sequence() const noexcept {
        return m_descriptor->parent_sequence();
    }

    const std::vector<DirectiveOutcome> &outcomes() const noexcept {
        return m_outcomes;
    }

    /**
     * @brief Net change per touched feature, in first-touch order.
     *
     * A feature touched by several directives appears once, with the state
     * before the transaction and the state after it.
     */
    const std::vector<FeatureChange> &changes() const noexcept {
        return m_changes;
    }

    /**
     * @brief Id assigned by every Create directive, in submission order.
     */
    std::vector<FeatureId> created_ids() const;

    /**
     * @brief The `n`-th feature created by the directive at `handle`.
     * @throws NotFoundError if the directive created fewer features
     */
    FeatureRef resolve(DirectiveHandle handle, std::size_t n = 0) const;

  private:
    friend class EditEngine;

    void set_state(TransactionState state) noexcept { m_state.store(state); }

    DescriptorPtr m_descriptor;
    std::atomic<TransactionState> m_state{TransactionState::Building};
    std::uint64_t m_sequence = 0;
    std::vector<DirectiveOutcome> m_outcomes;
    std::vector<FeatureChange> m_changes;
};

using TransactionPtr = std::shared_ptr<TransactionRecord>;

} // namespace geoedit

template <>
struct fmt::formatter<geoedit::TransactionState> : fmt::formatter<const char *> {
    template <typename FormatContext>
    auto format(geoedit::TransactionState state, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::formatter<const char *>::format(geoedit::to_string(state),
                                                   ctx);
    }
};
