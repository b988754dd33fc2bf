#include "undo_manager.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace geoedit {

void UndoManager::push(TransactionPtr record) {
    if (!record)
        return;
    m_past.push_back(std::move(record));
    m_future.clear();
    trim();
    ++m_state_version;
}

std::vector<TransactionPtr>
UndoManager::with_descendants(const std::vector<TransactionPtr> &side,
                              const TransactionRecord &root) {
    // Children always commit after their parent, so one pass in sequence
    // order finds every generation.
    std::vector<TransactionPtr> sorted = side;
    std::sort(sorted.begin(), sorted.end(),
              [](const TransactionPtr &a, const TransactionPtr &b) {
                  return a->sequence() < b->sequence();
              });

    std::set<std::uint64_t> family{root.sequence()};
    std::vector<TransactionPtr> out;
    for (const TransactionPtr &record : sorted) {
        if (record.get() == &root) {
            out.push_back(record);
            continue;
        }
        const auto parent = record->parent_sequence();
        if (parent && family.count(*parent) > 0) {
            family.insert(record->sequence());
            out.push_back(record);
        }
    }
    return out;
}

void UndoManager::remove(std::vector<TransactionPtr> &side,
                         const std::vector<TransactionPtr> &batch) {
    side.erase(std::remove_if(side.begin(), side.end(),
                              [&batch](const TransactionPtr &record) {
                                  return std::find(batch.begin(), batch.end(),
                                                   record) != batch.end();
                              }),
               side.end());
}

std::vector<TransactionPtr>
UndoManager::undo_batch(const TransactionRecord *root) const {
    if (!root) {
        if (m_past.empty())
            return {};
        return {m_past.back()};
    }

    if (std::none_of(m_past.begin(), m_past.end(),
                     [root](const TransactionPtr &r) { return r.get() == root; }))
        throw NotFoundError(fmt::format(
            "transaction '{}' (#{}) is not in the undo history", root->name(),
            root->sequence()));

    std::vector<TransactionPtr> batch = with_descendants(m_past, *root);
    std::reverse(batch.begin(), batch.end());
    return batch;
}

void UndoManager::commit_undo(const std::vector<TransactionPtr> &batch) {
    remove(m_past, batch);
    // The last reverted record must be the first one redone.
    for (const TransactionPtr &record : batch)
        m_future.push_back(record);
    ++m_state_version;
}

std::vector<TransactionPtr>
UndoManager::redo_batch(const TransactionRecord *root) const {
    if (!root) {
        if (m_future.empty())
            return {};
        return {m_future.back()};
    }

    if (std::none_of(m_future.begin(), m_future.end(),
                     [root](const TransactionPtr &r) { return r.get() == root; }))
        throw NotFoundError(fmt::format(
            "transaction '{}' (#{}) is not in the redo history", root->name(),
            root->sequence()));

    return with_descendants(m_future, *root);
}

void UndoManager::commit_redo(const std::vector<TransactionPtr> &batch) {
    remove(m_future, batch);
    for (const TransactionPtr &record : batch)
        m_past.push_back(record);
    trim();
    ++m_state_version;
}

bool UndoManager::in_past(std::uint64_t sequence) const {
    return std::any_of(m_past.begin(), m_past.end(),
                       [sequence](const TransactionPtr &r) {
                           return r->sequence() == sequence;
                       });
}

void UndoManager::clear() {
    m_past.clear();
    m_future.clear();
    ++m_state_version;
}

} // namespace geoedit
