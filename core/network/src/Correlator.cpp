#include "Correlator.h"
#include "FrameCodec.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

#include <algorithm>
#include <set>
#include <vector>

namespace ChatStorage {

Correlator::Correlator(Connection& connection)
    : connection_(connection) {
    connection_.setFrameListener(this);
}

Correlator::~Correlator() {
    connection_.setFrameListener(nullptr);
    onConnectionClosed(Error{ErrorCode::ConnectionClosed, "correlator destroyed", "Correlator"});
}

Result<Frame> Correlator::sendAndAwait(const Frame& request,
                                       const FrameTypeSet& expected,
                                       std::chrono::milliseconds timeout) {
    if (expected.empty()) {
        return Error{ErrorCode::InvalidArgument, "no expected response type", "Correlator"};
    }

    auto exchange = std::make_shared<PendingExchange>();
    exchange->types = expected;
    std::future<Result<Frame>> future = exchange->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        exchange->id = nextId_++;
        pending_[exchange->id] = exchange;
        for (FrameType type : expected) {
            pendingByType_[type].push_back(exchange->id);
        }
    }

    // Registered before sending so a fast response cannot be missed
    auto sent = connection_.send(request);
    if (!sent) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (takeExchange(exchange->id)) {
            return sent.error();
        }
        // Teardown resolved it concurrently; fall through to its outcome
    }

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!takeExchange(exchange->id)) {
            // Resolved between the wait expiring and taking the lock
            return future.get();
        }
    }

    MetricsCollector::instance().incrementExchangesTimedOut();
    Logger::instance().log(LogLevel::WARN, std::string("No response to ") + frameTypeName(request.type) +
                           " within " + std::to_string(timeout.count()) + "ms", "Correlator");
    return Error{ErrorCode::Timeout,
                 std::string(frameTypeName(request.type)) + " timed out after " + std::to_string(timeout.count()) + "ms",
                 "Correlator"};
}

std::shared_ptr<Correlator::PendingExchange> Correlator::takeExchange(uint64_t id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return nullptr;
    }
    auto exchange = it->second;
    pending_.erase(it);

    for (FrameType type : exchange->types) {
        auto queueIt = pendingByType_.find(type);
        if (queueIt == pendingByType_.end()) continue;
        auto& queue = queueIt->second;
        queue.erase(std::remove(queue.begin(), queue.end(), id), queue.end());
        if (queue.empty()) {
            pendingByType_.erase(queueIt);
        }
    }
    return exchange;
}

void Correlator::registerStreamSink(const FrameTypeSet& types, std::shared_ptr<StreamSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<SinkSlot> slot;
    for (const auto& entry : sinks_) {
        if (entry.second->sink == sink) {
            slot = entry.second;
            break;
        }
    }
    if (!slot) {
        slot = std::make_shared<SinkSlot>();
        slot->sink = std::move(sink);
    }
    for (FrameType type : types) {
        sinks_[type] = slot;
    }
}

void Correlator::unregisterStreamSink(const std::shared_ptr<StreamSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    removeSinkLocked(sink);
}

void Correlator::removeSinkLocked(const std::shared_ptr<StreamSink>& sink) {
    for (auto it = sinks_.begin(); it != sinks_.end();) {
        if (it->second->sink == sink) {
            it = sinks_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t Correlator::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t Correlator::sinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<SinkSlot*> unique;
    for (const auto& entry : sinks_) {
        unique.insert(entry.second.get());
    }
    return unique.size();
}

void Correlator::onFrame(const Frame& frame) {
    std::shared_ptr<PendingExchange> exchange;
    std::shared_ptr<SinkSlot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto queueIt = pendingByType_.find(frame.type);
        if (queueIt != pendingByType_.end() && !queueIt->second.empty()) {
            exchange = takeExchange(queueIt->second.front());
        } else {
            auto sinkIt = sinks_.find(frame.type);
            if (sinkIt != sinks_.end() && !sinkIt->second->ended) {
                slot = sinkIt->second;
                slot->delivering++;
            }
        }
    }

    if (exchange) {
        LOG_DEBUG_COMP_IF("Exchange " + std::to_string(exchange->id) + " resolved by " + FrameCodec::describe(frame),
                          "Correlator");
        exchange->promise.set_value(frame);
        return;
    }

    if (slot) {
        const SinkAction action = slot->sink->onFrame(frame);

        std::optional<Error> endNow;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slot->delivering--;
            if (slot->ended) {
                // Teardown ran during delivery and left onEnd to this thread
                if (slot->delivering == 0 && slot->endReason) {
                    endNow.swap(slot->endReason);
                }
            } else if (action == SinkAction::Done) {
                removeSinkLocked(slot->sink);
            }
        }
        if (endNow) {
            slot->sink->onEnd(*endNow);
        }
        return;
    }

    MetricsCollector::instance().incrementUnexpectedFrames();
    Logger::instance().log(LogLevel::WARN, "Discarding unexpected frame " + FrameCodec::describe(frame), "Correlator");
}

void Correlator::onConnectionClosed(const Error& reason) {
    Error closed{ErrorCode::ConnectionClosed, reason.message, "Correlator"};

    std::map<uint64_t, std::shared_ptr<PendingExchange>> pending;
    std::vector<std::shared_ptr<SinkSlot>> endNow;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
        pendingByType_.clear();

        // Each slot ends exactly once; a slot mid-delivery is ended by its deliverer
        for (auto& entry : sinks_) {
            auto& slot = entry.second;
            if (slot->ended) continue;
            slot->ended = true;
            if (slot->delivering == 0) {
                endNow.push_back(slot);
            } else {
                slot->endReason = closed;
            }
        }
        sinks_.clear();
    }

    if (!pending.empty()) {
        Logger::instance().log(LogLevel::WARN, "Failing " + std::to_string(pending.size()) +
                               " pending exchange(s): " + reason.toString(), "Correlator");
    }

    for (auto& entry : pending) {
        entry.second->promise.set_value(closed);
    }
    for (auto& slot : endNow) {
        slot->sink->onEnd(closed);
    }
}

} // namespace ChatStorage
