#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "../config/engine_config.hpp"
#include "../geometry/kernel.hpp"
#include "../operation/builder.hpp"
#include "../store/feature_store.hpp"
#include "../undo/undo_manager.hpp"
#include "mutation_context.hpp"
#include "staging_area.hpp"
#include "submit_handle.hpp"

namespace geoedit {

/**
 * @brief Validates, applies and reverts operation descriptors against a
 * feature store.
 *
 * The engine owns the mutation context. Every write to the store, and every
 * touch of the undo history, happens on that one thread. Synchronous entry
 * points (submit, undo, redo) must be called from the context and throw
 * WrongContextError otherwise; the *_async variants can be called from any
 * thread and share the same commit path.
 *
 * Submission runs in two phases:
 *  1. validation, under shared collection locks: references are resolved and
 *     the revision of every existing feature read is captured;
 *  2. apply, on the context under exclusive locks: revisions are re-checked,
 *     directives run in order into a staging overlay, and the net result is
 *     written to the store in one step.
 */
class EditEngine {
  public:
    /**
     * @param store Store to edit; must outlive the engine
     * @param kernel Geometry kernel used by geometric directives
     * @param config Engine tunables
     * @throws ConfigError if the configuration is invalid
     */
    EditEngine(FeatureStore &store,
               std::shared_ptr<const IGeometryKernel> kernel,
               EngineConfig config = {});

    /**
     * @brief Stops the mutation context after draining queued submissions.
     */
    ~EditEngine() = default;

    EditEngine(const EditEngine &) = delete;
    EditEngine &operator=(const EditEngine &) = delete;
    EditEngine(EditEngine &&) = delete;
    EditEngine &operator=(EditEngine &&) = delete;

    /**
     * @brief Start a new, unchained operation.
     */
    OperationBuilder create_operation(std::string name = {}) const;

    /**
     * @brief Start an operation chained to `parent`.
     * @throws NoParentTransactionError if `parent` is not currently applied
     */
    OperationBuilder chain_from(const TransactionPtr &parent,
                                std::string name = {});

    /**
     * @brief Validate and apply a descriptor as one transaction.
     * @return The committed record, state Applied
     * @throws WrongContextError if not called on the mutation context
     * @throws EmptyOperationError, ValidationError,
     * ConcurrentModificationError, ApplyError, NoParentTransactionError with
     * the Rejected record attached; the store is unchanged
     */
    TransactionPtr submit(const DescriptorPtr &descriptor);

    /**
     * @brief Validate on the calling thread and apply on the mutation
     * context.
     *
     * Never blocks on the context. Rejections found during caller-side
     * validation are delivered through the handle as well.
     */
    SubmitHandle submit_async(const DescriptorPtr &descriptor);

    /**
     * @brief Revert the latest transaction.
     * @return The reverted record, nullptr if there was nothing to undo
     * @throws WrongContextError if not called on the mutation context
     * @throws ConcurrentModificationError if a touched feature changed since
     */
    TransactionPtr undo();

    /**
     * @brief Revert `record` after reverting its chained descendants, newest
     * first.
     * @throws NotFoundError if `record` cannot be undone
     */
    TransactionPtr undo(const TransactionPtr &record);

    /**
     * @brief Reapply the most recently undone transaction.
     * @return The reapplied record, nullptr if there was nothing to redo
     */
    TransactionPtr redo();

    /**
     * @brief Reapply `record` and then its undone chained descendants,
     * oldest first.
     * @throws NoParentTransactionError if `record` is chained to a parent
     * that is not applied
     */
    TransactionPtr redo(const TransactionPtr &record);

    SubmitHandle undo_async(TransactionPtr record = nullptr);
    SubmitHandle redo_async(TransactionPtr record = nullptr);

    bool can_undo();
    bool can_redo();

    MutationContext &context() noexcept { return *m_context; }
    FeatureStore &store() noexcept { return *m_store; }
    const IGeometryKernel &kernel() const noexcept { return *m_kernel; }
    const EngineConfig &config() const noexcept { return m_config; }

  private:
    /** @brief Revision of every existing feature validation read */
    using ReadSet = std::map<FeatureRef, std::uint64_t>;

    void require_context(const char *operation) const;

    ReadSet validate(const OperationDescriptor &descriptor) const;

    TransactionPtr commit(const TransactionPtr &record, const ReadSet &reads);

    /**
     * @brief Validate and commit, turning a rejection into a Rejected record
     * attached to the exception.
     */
    TransactionPtr run_submission(const TransactionPtr &record,
                                  const ReadSet *reads);

    void apply_directive(const OperationDescriptor &descriptor,
                         DirectiveHandle handle, StagingArea &staging,
                         std::vector<DirectiveOutcome> &outcomes) const;

    std::vector<FeatureRef>
    resolve_targets(const FeatureScope &scope,
                    const std::vector<DirectiveOutcome> &outcomes) const;

    TransactionPtr undo_now(const TransactionRecord *root);
    TransactionPtr redo_now(const TransactionRecord *root);

    SubmitHandle enqueue(std::function<TransactionPtr()> work);

    FeatureStore *m_store;
    std::shared_ptr<const IGeometryKernel> m_kernel;
    EngineConfig m_config;
    UndoManager m_undo;
    std::uint64_t m_last_sequence = 0;

    // Declared last: queued jobs reference the members above, so the
    // context must drain and join before they are destroyed.
    std::unique_ptr<MutationContext> m_context;
};

} // namespace geoedit
