//
// Created by cv2 on 10/13/25.
//

#pragma once

#include "libshelf/operation.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>

namespace shelf {

    using OperationEvent = std::variant<OperationProgress, OperationResult>;

    // The event sequence of one operation: any number of progress events, then exactly
    // one result. Events are buffered, so a late consumer loses nothing. Not restartable:
    // once the result has been taken, next() returns nullopt.
    class OperationStream {
    public:
        explicit OperationStream(OperationId id);
        ~OperationStream();

        OperationStream(const OperationStream&) = delete;
        OperationStream& operator=(const OperationStream&) = delete;

        OperationId id() const { return m_id; }

        // Blocks until the next event is available.
        std::optional<OperationEvent> next();
        // Like next(), but gives up after `timeout`.
        std::optional<OperationEvent> next_for(std::chrono::milliseconds timeout);

        // Blocks until the result exists. Does not consume events.
        OperationResult wait();
        std::optional<OperationResult> result() const;
        bool finished() const;

        // Forwards to the cancel handler installed by whoever runs the operation.
        void cancel();

        // --- Producer side ---
        void push(OperationProgress progress);
        // Returns false if a result was already published.
        bool finish(OperationResult result);

        void set_cancel_handler(std::function<void()> handler);
        // The stream joins the worker when destroyed.
        void adopt_worker(std::jthread worker);

    private:
        std::optional<OperationEvent> pop_locked();

        const OperationId m_id;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::deque<OperationEvent> m_pending;
        std::optional<OperationResult> m_result;
        bool m_closed = false;
        std::function<void()> m_cancel_handler;
        std::jthread m_worker; // last member: joined before the rest is torn down
    };

} // namespace shelf
