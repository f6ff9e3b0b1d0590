//
// Created by cv2 on 10/13/25.
//

#include "libshelf/operation_stream.h"
#include "libshelf/logging.h"

namespace shelf {

    OperationStream::OperationStream(OperationId id) : m_id(id) {}

    OperationStream::~OperationStream() {
        if (m_worker.joinable()) {
            m_worker.request_stop();
            m_worker.join();
        }
    }

    std::optional<OperationEvent> OperationStream::pop_locked() {
        if (m_pending.empty()) {
            return std::nullopt;
        }
        OperationEvent event = std::move(m_pending.front());
        m_pending.pop_front();
        if (std::holds_alternative<OperationResult>(event)) {
            m_closed = true;
        }
        return event;
    }

    std::optional<OperationEvent> OperationStream::next() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return !m_pending.empty() || m_closed; });
        return pop_locked();
    }

    std::optional<OperationEvent> OperationStream::next_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return !m_pending.empty() || m_closed; });
        return pop_locked();
    }

    OperationResult OperationStream::wait() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_result.has_value(); });
        return *m_result;
    }

    std::optional<OperationResult> OperationStream::result() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_result;
    }

    bool OperationStream::finished() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_result.has_value();
    }

    void OperationStream::cancel() {
        std::function<void()> handler;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_result) {
                return;
            }
            handler = m_cancel_handler;
        }
        if (handler) {
            handler();
        } else {
            log::warn("Operation " + std::to_string(m_id) + " cannot be cancelled from its stream.");
        }
    }

    void OperationStream::push(OperationProgress progress) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_result) {
                log::debug("Dropping progress for finished operation " + std::to_string(m_id));
                return;
            }
            progress.operation_id = m_id;
            m_pending.emplace_back(std::move(progress));
        }
        m_cv.notify_all();
    }

    bool OperationStream::finish(OperationResult result) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_result) {
                log::warn("Operation " + std::to_string(m_id) + " already has a result; ignoring a second one.");
                return false;
            }
            result.operation_id = m_id;
            m_result = result;
            m_pending.emplace_back(std::move(result));
        }
        m_cv.notify_all();
        return true;
    }

    void OperationStream::set_cancel_handler(std::function<void()> handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel_handler = std::move(handler);
    }

    void OperationStream::adopt_worker(std::jthread worker) {
        m_worker = std::move(worker);
    }

} // namespace shelf
