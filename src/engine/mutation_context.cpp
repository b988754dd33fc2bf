#include "mutation_context.hpp"

#include <exception>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace geoedit {

MutationContext::MutationContext(std::string name) : m_name(std::move(name)) {
    m_worker = std::thread(&MutationContext::worker_thread, this);
    m_worker_id = m_worker.get_id();
    LOG_DEBUG(fmt::format("Mutation context '{}' started", m_name));
}

MutationContext::~MutationContext() {
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        m_stopping = true;
    }

    m_tasks_signal.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }

    LOG_DEBUG(fmt::format("Mutation context '{}' stopped", m_name));
}

void MutationContext::post(Job job) {
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        if (m_stopping)
            throw WrongContextError(
                fmt::format("mutation context '{}' is stopping", m_name));
        m_tasks.push(std::move(job));
    }

    m_tasks_signal.notify_one();
}

bool MutationContext::accepting() const {
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    return !m_stopping;
}

std::size_t MutationContext::pending() const {
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    return m_tasks.size();
}

void MutationContext::worker_thread() {
    Logger::set_thread_name(m_name);

    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_tasks_mutex);

            m_tasks_signal.wait(lock, [this] {
                return m_stopping || !m_tasks.empty();
            });

            if (m_stopping && m_tasks.empty()) {
                return;
            }

            job = std::move(m_tasks.front());
            m_tasks.pop();
        }

        try {
            job();
        } catch (const std::exception &e) {
            LOG_ERROR(fmt::format("Job on '{}' failed: {}", m_name, e.what()));
        }
    }
}

} // namespace geoedit
