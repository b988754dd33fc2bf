#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../operation/transaction.hpp"

namespace geoedit {

/**
 * @brief Linear undo/redo history of committed transactions.
 *
 * The manager only does the bookkeeping. The engine asks it for a batch,
 * reverts or reapplies the batch against the store and then commits the
 * batch back, so a failed revert leaves the history untouched.
 *
 * Chains are followed through parent sequences: the batch for a record
 * contains the record and every chained descendant still on the same side
 * of the history.
 *
 * Not thread-safe; the engine only touches it on the mutation context.
 */
class UndoManager {
  public:
    /**
     * @brief Set the maximum number of transactions to keep in history.
     * @param n Maximum number of transactions (0 means 1).
     */
    void set_max_size(std::size_t n) {
        m_max = (n == 0 ? 1 : n);
        trim();
    }

    std::size_t max_size() const noexcept { return m_max; }

    /**
     * @brief Record a freshly committed transaction. Clears the redo side.
     */
    void push(TransactionPtr record);

    bool can_undo() const { return !m_past.empty(); }
    bool can_redo() const { return !m_future.empty(); }

    /**
     * @brief Transactions to revert, in revert order.
     *
     * Without a root this is the latest transaction alone. With a root it is
     * every undoable descendant of the root, newest first, followed by the
     * root itself.
     * @throws NotFoundError if the root is not on the undo side
     */
    std::vector<TransactionPtr>
    undo_batch(const TransactionRecord *root = nullptr) const;

    /**
     * @brief Move a reverted batch from the undo to the redo side.
     */
    void commit_undo(const std::vector<TransactionPtr> &batch);

    /**
     * @brief Transactions to reapply, in reapply order.
     *
     * Without a root this is the most recently undone transaction alone.
     * With a root it is the root followed by its redoable descendants,
     * oldest first.
     * @throws NotFoundError if the root is not on the redo side
     */
    std::vector<TransactionPtr>
    redo_batch(const TransactionRecord *root = nullptr) const;

    /**
     * @brief Move a reapplied batch from the redo to the undo side.
     */
    void commit_redo(const std::vector<TransactionPtr> &batch);

    /**
     * @brief Whether the transaction with this sequence can still be undone.
     */
    bool in_past(std::uint64_t sequence) const;

    void clear();

    /**
     * @brief Get the current state version number.
     * @return Counter bumped by every push, undo and redo
     */
    unsigned long long get_state_version() const { return m_state_version; }

    std::size_t get_past_size() const { return m_past.size(); }
    std::size_t get_future_size() const { return m_future.size(); }

  private:
    /**
     * @brief Trim the history to the maximum size.
     */
    void trim() {
        if (m_past.size() > m_max)
            m_past.erase(m_past.begin(),
                         m_past.begin() + (m_past.size() - m_max));
    }

    static std::vector<TransactionPtr>
    with_descendants(const std::vector<TransactionPtr> &side,
                     const TransactionRecord &root);

    static void remove(std::vector<TransactionPtr> &side,
                       const std::vector<TransactionPtr> &batch);

  private:
    std::vector<TransactionPtr> m_past;
    std::vector<TransactionPtr> m_future;
    std::size_t m_max = 500;
    unsigned long long m_state_version = 0;
};

} // namespace geoedit
