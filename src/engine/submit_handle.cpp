#include "submit_handle.hpp"

#include <exception>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace geoedit {

bool SubmitHandle::cancel() {
    if (!m_ticket)
        return false;

    Stage expected = Stage::Queued;
    if (!m_ticket->stage.compare_exchange_strong(expected, Stage::Cancelled))
        return false;

    m_ticket->work = nullptr;
    m_ticket->promise.set_exception(std::make_exception_ptr(
        CancelledError("submission withdrawn before it was accepted")));
    LOG_DEBUG("Submission cancelled before acceptance");
    return true;
}

TransactionPtr SubmitHandle::get() const {
    if (!m_ticket)
        throw std::future_error(std::future_errc::no_state);
    return m_result.get();
}

bool SubmitHandle::accepted() const noexcept {
    return m_ticket && m_ticket->stage.load() == Stage::Accepted;
}

bool SubmitHandle::cancelled() const noexcept {
    return m_ticket && m_ticket->stage.load() == Stage::Cancelled;
}

SubmitHandle SubmitHandle::rejected(std::exception_ptr error) {
    auto ticket = std::make_shared<Ticket>();
    ticket->stage = Stage::Accepted;
    SubmitHandle handle(ticket);
    ticket->promise.set_exception(std::move(error));
    return handle;
}

void SubmitHandle::Ticket::run() {
    Stage expected = Stage::Queued;
    if (!stage.compare_exchange_strong(expected, Stage::Accepted))
        return;

    try {
        promise.set_value(work());
    } catch (const std::exception &) {
        promise.set_exception(std::current_exception());
    }
    work = nullptr;
}

} // namespace geoedit
