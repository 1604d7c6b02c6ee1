#pragma once

#include "Connection.h"
#include "Frame.h"
#include "Result.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace ChatStorage {

enum class SinkAction {
    Continue,
    Done
};

/**
 * @brief Long-lived consumer of a sequence of frames (e.g. download data).
 *
 * onFrame runs on the receive thread. onEnd is called once if the
 * connection tears down while the sink is still registered; no onFrame
 * follows it, and it never overlaps an onFrame still in progress.
 */
class StreamSink {
public:
    virtual ~StreamSink() = default;
    virtual SinkAction onFrame(const Frame& frame) = 0;
    virtual void onEnd(const Error& reason) = 0;
};

/**
 * @brief Matches outgoing requests with their response frames.
 *
 * A frame goes to the oldest pending exchange expecting its type; only when
 * none waits is it offered to the stream sink registered for that type.
 * Frames matching neither are logged and dropped.
 *
 * The Correlator installs itself as the Connection's frame listener and
 * must be destroyed before the Connection.
 */
class Correlator : public FrameListener {
public:
    explicit Correlator(Connection& connection);
    ~Correlator() override;

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    /**
     * @brief Send a request and wait for the first frame of an expected type.
     *
     * Exactly one outcome: the response frame, Timeout, ConnectionClosed,
     * or the send error (NotConnected / SendFailed).
     */
    Result<Frame> sendAndAwait(const Frame& request,
                               const FrameTypeSet& expected,
                               std::chrono::milliseconds timeout);

    /// Fire-and-forget send on the underlying connection
    VoidResult send(const Frame& frame) { return connection_.send(frame); }

    /// Replaces any sink previously registered for the same types
    void registerStreamSink(const FrameTypeSet& types, std::shared_ptr<StreamSink> sink);
    void unregisterStreamSink(const std::shared_ptr<StreamSink>& sink);

    std::size_t pendingCount() const;
    std::size_t sinkCount() const;

    Connection& connection() { return connection_; }

    void onFrame(const Frame& frame) override;
    void onConnectionClosed(const Error& reason) override;

private:
    struct PendingExchange {
        uint64_t id;
        FrameTypeSet types;
        std::promise<Result<Frame>> promise;
    };

    // One registration; shared by every type it was registered for
    struct SinkSlot {
        std::shared_ptr<StreamSink> sink;
        int delivering{0};
        bool ended{false};
        std::optional<Error> endReason;
    };

    // Caller holds mutex_
    std::shared_ptr<PendingExchange> takeExchange(uint64_t id);
    void removeSinkLocked(const std::shared_ptr<StreamSink>& sink);

    Connection& connection_;

    mutable std::mutex mutex_;
    uint64_t nextId_{1};
    std::map<uint64_t, std::shared_ptr<PendingExchange>> pending_;
    std::map<FrameType, std::deque<uint64_t>> pendingByType_;
    std::map<FrameType, std::shared_ptr<SinkSlot>> sinks_;
};

} // namespace ChatStorage
