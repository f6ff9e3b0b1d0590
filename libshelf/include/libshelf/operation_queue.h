//
// Created by cv2 on 10/14/25.
//

#pragma once

#include "libshelf/operation.h"
#include "libshelf/operation_stream.h"

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace shelf {

    class PrivilegeBroker;
    class OperationExecutor;

    enum class QueueError {
        NotFound,
        NotCancellable
    };

    enum class SlotState {
        Queued,       // waiting for the exclusive slot
        Authorizing,
        Running,
        Cancelling,
        Finished
    };

    struct SlotStatus {
        OperationId id = 0;
        SlotState state = SlotState::Queued;
        OperationKind kind = OperationKind::Install;
        std::string description;
        bool exclusive = false;
        std::optional<OperationResult> result;
    };

    struct Submission {
        OperationId id = 0;
        std::shared_ptr<OperationStream> stream;
    };

    // Called from worker threads for every event of every operation, in the order
    // each operation produced them.
    using QueueListener = std::function<void(const OperationEvent&)>;

    // Admits operations in submission order. Operations that change the package
    // state with privileges share one exclusive slot; everything else starts at once.
    class OperationQueue {
    public:
        OperationQueue(PrivilegeBroker& broker, OperationExecutor& executor);
        // Cancels everything still open and joins every worker. Each accepted
        // operation has its result before this returns.
        ~OperationQueue();

        OperationQueue(const OperationQueue&) = delete;
        OperationQueue& operator=(const OperationQueue&) = delete;

        OperationId submit(OperationDescriptor descriptor);
        Submission enqueue(OperationDescriptor descriptor);

        std::expected<void, QueueError> cancel(OperationId id);
        std::expected<SlotStatus, QueueError> status(OperationId id) const;
        std::expected<std::shared_ptr<OperationStream>, QueueError> events(OperationId id) const;
        // Blocks until the operation has its result.
        std::expected<OperationResult, QueueError> wait(OperationId id) const;

        void set_listener(QueueListener listener);

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

    std::string to_string(QueueError error);
    std::string to_string(SlotState state);

} // namespace shelf
