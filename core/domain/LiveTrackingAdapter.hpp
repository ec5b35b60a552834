#pragma once

#include "../IClock.hpp"
#include "../Track.hpp"
#include "../ports/ITransport.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace sailtrack::domain {

struct LiveFeedConfig {
    ports::Credentials credentials;
    std::string sessionId;
    std::string topicPrefix = "sailtrack";
    std::size_t channelCapacity = 1024;
    int qos = 0;
};

// Latest known position per boat. Published snapshots are never modified.
struct LivePositionSnapshot {
    std::map<std::string, LivePosition> positions;
    int64_t updatedAt = 0;      // epoch millis of the drain that produced it
    std::uint64_t version = 0;
};

/**
 * @brief Consumer of one live position feed
 *
 * Transport callbacks (possibly on a library thread) only decode and enqueue
 * into a bounded channel; processEvents() drains it on the caller's thread,
 * publishes a new snapshot and notifies observers. snapshot() never waits on
 * the writer.
 *
 * At most one transport is attached. connect() detaches and disconnects the
 * previous one before touching the new one.
 */
class LiveTrackingAdapter {
public:
    using ObserverId = std::uint64_t;
    using Observer = std::function<void(const LivePositionSnapshot&)>;

    explicit LiveTrackingAdapter(std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());
    ~LiveTrackingAdapter();

    LiveTrackingAdapter(const LiveTrackingAdapter&) = delete;
    LiveTrackingAdapter& operator=(const LiveTrackingAdapter&) = delete;

    bool connect(std::shared_ptr<ports::ITransport> transport, const LiveFeedConfig& config);
    void disconnect();
    bool isConnected() const;

    // Pumps the transport and applies queued updates. Returns how many were applied.
    std::size_t processEvents();

    std::shared_ptr<const LivePositionSnapshot> snapshot() const;

    ObserverId addObserver(Observer observer);
    bool removeObserver(ObserverId id);

    std::size_t invalidMessageCount() const { return invalidMessages_; }
    std::size_t droppedMessageCount() const { return droppedMessages_; }
    const std::string& topicFilter() const { return topicFilter_; }

    // "<prefix>/<sessionId>/positions/#"
    static std::string buildTopicFilter(const std::string& topicPrefix, const std::string& sessionId);

private:
    void onMessage(std::uint64_t generation, std::string_view topic, std::string_view payload);
    void onConnectionChange(bool connected, std::string_view reason);
    void detachTransport();
    void publishSnapshot(std::shared_ptr<const LivePositionSnapshot> snapshot);

    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::ITransport> transport_;
    std::string topicFilter_;

    // generation_ and the channel change together under channelMutex_
    std::deque<LivePosition> channel_;
    std::size_t channelCapacity_ = 1024;
    std::uint64_t generation_ = 0;
    std::mutex channelMutex_;

    std::shared_ptr<const LivePositionSnapshot> snapshot_;

    std::map<ObserverId, Observer> observers_;
    ObserverId nextObserverId_ = 1;
    std::mutex observerMutex_;

    std::atomic<std::size_t> invalidMessages_{0};
    std::atomic<std::size_t> droppedMessages_{0};
};

} // namespace sailtrack::domain
