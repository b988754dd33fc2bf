#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>

namespace geoedit {

using Job = std::function<void()>;

/**
 * @brief The single dedicated thread every store write runs on.
 *
 * Jobs run one at a time in submission order. The context owns its worker:
 * destruction stops accepting new jobs, runs what is still queued and joins.
 * Jobs posted from then on are refused, never silently dropped.
 */
class MutationContext {
  public:
    /**
     * @param name Label used in log lines
     */
    explicit MutationContext(std::string name = "mutation-context");
    ~MutationContext();

    MutationContext(const MutationContext &) = delete;
    MutationContext(MutationContext &&) = delete;
    MutationContext &operator=(const MutationContext &) = delete;
    MutationContext &operator=(MutationContext &&) = delete;

    /**
     * @brief Queue a job. Exceptions escaping the job are logged and dropped;
     * use run() to observe them.
     * @throws WrongContextError once the context is stopping
     */
    void post(Job job);

    /**
     * @brief Queue a callable and return a future for its result or
     * exception.
     */
    template <typename F>
    auto run(F fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = task->get_future();
        post([task] { (*task)(); });
        return result;
    }

    /**
     * @brief Run a callable on the context and wait for it. Runs inline when
     * already on the context.
     */
    template <typename F> auto call(F fn) -> std::invoke_result_t<F> {
        if (is_current())
            return fn();
        return run(std::move(fn)).get();
    }

    /**
     * @brief True when called from the context's worker thread.
     */
    bool is_current() const noexcept {
        return std::this_thread::get_id() == m_worker_id;
    }

    const std::string &name() const noexcept { return m_name; }

    /**
     * @brief False once destruction has begun.
     */
    bool accepting() const;

    /**
     * @brief Number of jobs waiting to run.
     */
    std::size_t pending() const;

  private:
    void worker_thread();

    std::string m_name;
    mutable std::mutex m_tasks_mutex;
    std::condition_variable m_tasks_signal;
    std::queue<Job> m_tasks;
    bool m_stopping = false;
    std::thread m_worker;
    std::thread::id m_worker_id;
};

} // namespace geoedit
