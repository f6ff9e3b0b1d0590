//
// Created by cv2 on 10/13/25.
//

#pragma once

#include "libshelf/config.h"
#include "libshelf/operation.h"
#include "libshelf/operation_stream.h"
#include "libshelf/privilege.h"

#include <functional>
#include <memory>
#include <stop_token>

namespace shelf {

    class ToolProbe;
    class EtaTracker;

    using ProgressSink = std::function<void(OperationProgress)>;

    // Runs the external tools behind one operation and reports what they do.
    class OperationExecutor {
    public:
        // `eta` is optional; without it no estimate is made for tools that print no percentage.
        // `probe` and `eta` must outlive every stream returned by execute(); the executor
        // itself may go first.
        OperationExecutor(const Config& config, ToolProbe& probe, EtaTracker* eta = nullptr);
        virtual ~OperationExecutor();

        // Synchronous. Always returns the operation's one and only result, never throws.
        virtual OperationResult run(OperationId id,
                                    const OperationDescriptor& descriptor,
                                    const AuthorizationHandle& authorization,
                                    const ProgressSink& sink,
                                    std::stop_token stop) const;

        // Starts run() on its own thread. The stream owns that thread; cancel() on the
        // stream requests a stop.
        std::shared_ptr<OperationStream> execute(OperationId id,
                                                 OperationDescriptor descriptor,
                                                 AuthorizationHandle authorization) const;

    private:
        struct Impl;
        std::shared_ptr<Impl> pimpl;
    };

} // namespace shelf
