//
// Created by cv2 on 10/14/25.
//

#include "libshelf/operation_queue.h"
#include "libshelf/executor.h"
#include "libshelf/logging.h"
#include "libshelf/privilege.h"

#include <deque>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace shelf {

    std::string to_string(QueueError error) {
        switch (error) {
            case QueueError::NotFound: return "No operation with this id";
            case QueueError::NotCancellable: return "The operation already finished";
        }
        return "Unknown queue error";
    }

    std::string to_string(SlotState state) {
        switch (state) {
            case SlotState::Queued: return "queued";
            case SlotState::Authorizing: return "authorizing";
            case SlotState::Running: return "running";
            case SlotState::Cancelling: return "cancelling";
            case SlotState::Finished: return "finished";
        }
        return "unknown";
    }

    struct Slot {
        explicit Slot(OperationDescriptor desc) : descriptor(std::move(desc)) {}

        const OperationDescriptor descriptor;
        SlotState state = SlotState::Queued;
        std::shared_ptr<OperationStream> stream;
        std::stop_source stop;
        std::optional<OperationResult> result;
    };

    struct OperationQueue::Impl {
        PrivilegeBroker& broker;
        OperationExecutor& executor;

        mutable std::mutex mutex;
        OperationId next_id = 1;
        std::map<OperationId, Slot> slots;        // never erased, node addresses stay valid
        std::deque<OperationId> pending;          // exclusive operations waiting for the slot
        std::optional<OperationId> active_exclusive;
        std::map<OperationId, std::jthread> workers;
        std::vector<std::jthread> retired;        // finished workers, joined later
        bool shutting_down = false;

        std::mutex listener_mutex;
        QueueListener listener;

        Impl(PrivilegeBroker& b, OperationExecutor& e) : broker(b), executor(e) {}

        void notify(const OperationEvent& event) {
            QueueListener current;
            {
                std::lock_guard<std::mutex> lock(listener_mutex);
                current = listener;
            }
            if (current) {
                current(event);
            }
        }

        void publish(const std::shared_ptr<OperationStream>& stream, const OperationResult& result) {
            if (stream->finish(result)) {
                notify(result);
            }
        }

        void start_locked(OperationId id) {
            Slot& slot = slots.at(id);
            slot.state = SlotState::Authorizing;
            log::debug("Starting operation " + std::to_string(id) + ": " + slot.descriptor.describe());
            workers.emplace(id, std::jthread([this, id] { worker_main(id); }));
        }

        void dispatch_next_locked() {
            if (shutting_down || active_exclusive) {
                return;
            }
            while (!pending.empty()) {
                const OperationId id = pending.front();
                pending.pop_front();
                if (slots.at(id).state != SlotState::Queued) {
                    continue;
                }
                active_exclusive = id;
                start_locked(id);
                return;
            }
        }

        void worker_main(OperationId id) {
            Slot* slot = nullptr;
            std::stop_token token;
            {
                std::lock_guard<std::mutex> lock(mutex);
                slot = &slots.at(id);
                token = slot->stop.get_token();
            }
            const OperationDescriptor& descriptor = slot->descriptor;

            OperationResult result;
            try {
                result = authorize_and_run(id, *slot, descriptor, token);
            } catch (const ShelfException& e) {
                log::error("Operation " + std::to_string(id) + " failed: " + e.what());
                result = e.get_error() == OperationError::Cancelled
                             ? OperationResult::cancelled(id, e.what())
                             : OperationResult::failure(id, e.get_error(), e.what());
            } catch (const std::exception& e) {
                log::error("Operation " + std::to_string(id) + " failed: " + e.what());
                result = OperationResult::failure(id, OperationError::ExecutionFailed, e.what());
            }
            complete(id, *slot, std::move(result));
        }

        OperationResult authorize_and_run(OperationId id, Slot& slot, const OperationDescriptor& descriptor,
                                          std::stop_token token) {
            auto authorization = broker.authorize(descriptor, token);
            if (!authorization) {
                if (authorization.error() == OperationError::Cancelled) {
                    return OperationResult::cancelled(id);
                }
                return OperationResult::failure(id, authorization.error(),
                                                "Authorization failed: " + to_string(authorization.error()));
            }

            std::shared_ptr<OperationStream> stream;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (slot.state == SlotState::Authorizing) {
                    slot.state = SlotState::Running;
                }
                stream = slot.stream;
            }

            const ProgressSink sink = [this, stream](OperationProgress progress) {
                stream->push(progress);
                notify(progress);
            };
            return executor.run(id, descriptor, *authorization, sink, token);
        }

        void complete(OperationId id, Slot& slot, OperationResult result) {
            std::shared_ptr<OperationStream> stream;
            {
                std::lock_guard<std::mutex> lock(mutex);
                result.operation_id = id;
                slot.result = result;
                slot.state = SlotState::Finished;
                stream = slot.stream;
            }

            if (result.succeeded()) {
                log::ok("Operation " + std::to_string(id) + " finished: " + slot.descriptor.describe());
            } else {
                log::warn("Operation " + std::to_string(id) + " ended with " + to_string(result.status) +
                          (result.error_detail ? ": " + *result.error_detail : ""));
            }
            publish(stream, result);

            std::lock_guard<std::mutex> lock(mutex);
            if (active_exclusive == id) {
                active_exclusive.reset();
                dispatch_next_locked();
            }
            auto it = workers.find(id);
            if (it != workers.end()) {
                retired.push_back(std::move(it->second));
                workers.erase(it);
            }
        }

        void reap() {
            std::vector<std::jthread> finished;
            {
                std::lock_guard<std::mutex> lock(mutex);
                finished.swap(retired);
            }
            // jthread destructors join here, outside the lock
        }

        Submission enqueue(OperationDescriptor descriptor) {
            reap();

            std::lock_guard<std::mutex> lock(mutex);
            const OperationId id = next_id++;
            auto stream = std::make_shared<OperationStream>(id);

            if (shutting_down) {
                log::warn("Queue is shutting down, rejecting " + descriptor.describe());
                stream->finish(OperationResult::cancelled(id, "Queue is shutting down"));
                return {id, stream};
            }

            const bool exclusive = descriptor.is_exclusive();
            Slot& slot = slots.try_emplace(id, std::move(descriptor)).first->second;
            slot.stream = stream;
            stream->set_cancel_handler([this, id] {
                auto cancelled = cancel(id);
                if (!cancelled) {
                    log::warn("Could not cancel operation " + std::to_string(id) + ": " + to_string(cancelled.error()));
                }
            });

            if (exclusive) {
                pending.push_back(id);
                if (active_exclusive) {
                    log::info("Operation " + std::to_string(id) + " waits for operation " +
                              std::to_string(*active_exclusive) + " to finish.");
                }
                dispatch_next_locked();
            } else {
                start_locked(id);
            }
            return {id, stream};
        }

        std::expected<void, QueueError> cancel(OperationId id) {
            std::shared_ptr<OperationStream> stream;
            OperationResult result;
            {
                std::lock_guard<std::mutex> lock(mutex);
                auto it = slots.find(id);
                if (it == slots.end()) {
                    return std::unexpected(QueueError::NotFound);
                }
                Slot& slot = it->second;
                switch (slot.state) {
                    case SlotState::Finished:
                        return std::unexpected(QueueError::NotCancellable);
                    case SlotState::Cancelling:
                        return {};
                    case SlotState::Authorizing:
                    case SlotState::Running:
                        log::info("Cancelling operation " + std::to_string(id) + "...");
                        slot.state = SlotState::Cancelling;
                        slot.stop.request_stop();
                        return {};
                    case SlotState::Queued:
                        std::erase(pending, id);
                        result = OperationResult::cancelled(id);
                        slot.state = SlotState::Finished;
                        slot.result = result;
                        stream = slot.stream;
                        break;
                }
            }
            log::info("Removed queued operation " + std::to_string(id) + ".");
            publish(stream, result);
            return {};
        }

        void shutdown() {
            std::vector<std::pair<std::shared_ptr<OperationStream>, OperationResult>> dropped;
            {
                std::lock_guard<std::mutex> lock(mutex);
                shutting_down = true;
                for (const OperationId id : pending) {
                    Slot& slot = slots.at(id);
                    if (slot.state != SlotState::Queued) continue;
                    auto result = OperationResult::cancelled(id, "Queue is shutting down");
                    slot.state = SlotState::Finished;
                    slot.result = result;
                    dropped.emplace_back(slot.stream, std::move(result));
                }
                pending.clear();

                for (auto& [id, slot] : slots) {
                    if (slot.state == SlotState::Authorizing || slot.state == SlotState::Running) {
                        slot.state = SlotState::Cancelling;
                        slot.stop.request_stop();
                    }
                    slot.stream->set_cancel_handler({});
                }
            }

            for (const auto& [stream, result] : dropped) {
                publish(stream, result);
            }

            while (true) {
                std::vector<std::jthread> threads;
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    for (auto& [id, worker] : workers) {
                        threads.push_back(std::move(worker));
                    }
                    workers.clear();
                    for (auto& worker : retired) {
                        threads.push_back(std::move(worker));
                    }
                    retired.clear();
                }
                if (threads.empty()) break;
                threads.clear();
            }
        }
    };

    OperationQueue::OperationQueue(PrivilegeBroker& broker, OperationExecutor& executor)
        : pimpl(std::make_unique<Impl>(broker, executor)) {}

    OperationQueue::~OperationQueue() {
        pimpl->shutdown();
    }

    OperationId OperationQueue::submit(OperationDescriptor descriptor) {
        return pimpl->enqueue(std::move(descriptor)).id;
    }

    Submission OperationQueue::enqueue(OperationDescriptor descriptor) {
        return pimpl->enqueue(std::move(descriptor));
    }

    std::expected<void, QueueError> OperationQueue::cancel(OperationId id) {
        return pimpl->cancel(id);
    }

    std::expected<SlotStatus, QueueError> OperationQueue::status(OperationId id) const {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->slots.find(id);
        if (it == pimpl->slots.end()) {
            return std::unexpected(QueueError::NotFound);
        }
        const Slot& slot = it->second;
        SlotStatus status;
        status.id = id;
        status.state = slot.state;
        status.kind = slot.descriptor.kind();
        status.description = slot.descriptor.describe();
        status.exclusive = slot.descriptor.is_exclusive();
        status.result = slot.result;
        return status;
    }

    std::expected<std::shared_ptr<OperationStream>, QueueError> OperationQueue::events(OperationId id) const {
        std::lock_guard<std::mutex> lock(pimpl->mutex);
        auto it = pimpl->slots.find(id);
        if (it == pimpl->slots.end()) {
            return std::unexpected(QueueError::NotFound);
        }
        return it->second.stream;
    }

    std::expected<OperationResult, QueueError> OperationQueue::wait(OperationId id) const {
        auto stream = events(id);
        if (!stream) {
            return std::unexpected(stream.error());
        }
        return (*stream)->wait();
    }

    void OperationQueue::set_listener(QueueListener listener) {
        std::lock_guard<std::mutex> lock(pimpl->listener_mutex);
        pimpl->listener = std::move(listener);
    }

} // namespace shelf
