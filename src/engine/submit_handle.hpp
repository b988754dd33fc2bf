#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>

#include "../operation/transaction.hpp"

namespace geoedit {

/**
 * @brief Caller side of an asynchronous submission.
 *
 * Resolves to the committed record or rethrows the typed error the
 * engine raised. A submission can be cancelled only while it waits in the
 * mutation context queue; once accepted it runs to commit or full rollback.
 */
class SubmitHandle {
  public:
    SubmitHandle() = default;

    /**
     * @brief Withdraw the submission if the context has not accepted it yet.
     * @return True if cancelled; get() then throws CancelledError
     */
    bool cancel();

    /**
     * @brief Wait for and return the result.
     * @throws OperationRejected subclasses, WrongContextError, ...
     */
    TransactionPtr get() const;

    template <typename Rep, typename Period>
    std::future_status
    wait_for(const std::chrono::duration<Rep, Period> &timeout) const {
        return m_result.wait_for(timeout);
    }

    void wait() const { m_result.wait(); }

    bool valid() const noexcept { return m_ticket != nullptr; }

    /**
     * @brief True once the mutation context picked the submission up.
     */
    bool accepted() const noexcept;

    bool cancelled() const noexcept;

  private:
    friend class EditEngine;

    enum class Stage { Queued, Accepted, Cancelled };

    struct Ticket {
        std::atomic<Stage> stage{Stage::Queued};
        std::function<TransactionPtr()> work;
        std::promise<TransactionPtr> promise;

        /**
         * @brief Runs on the context: accept the ticket and resolve it.
         */
        void run();
    };

    explicit SubmitHandle(std::shared_ptr<Ticket> ticket)
        : m_ticket(std::move(ticket)),
          m_result(m_ticket->promise.get_future().share()) {}

    /**
     * @brief A handle that already holds an error and cannot be cancelled.
     */
    static SubmitHandle rejected(std::exception_ptr error);

    std::shared_ptr<Ticket> m_ticket;
    std::shared_future<TransactionPtr> m_result;
};

} // namespace geoedit
