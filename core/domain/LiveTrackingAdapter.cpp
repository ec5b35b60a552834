#include "LiveTrackingAdapter.hpp"
#include "../JsonCodec.hpp"
#include <iostream>
#include <optional>
#include <vector>

namespace sailtrack::domain {

LiveTrackingAdapter::LiveTrackingAdapter(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)),
      snapshot_(std::make_shared<const LivePositionSnapshot>()) {
    if (!clock_) {
        clock_ = std::make_shared<SystemClock>();
    }
}

LiveTrackingAdapter::~LiveTrackingAdapter() {
    disconnect();
}

std::string LiveTrackingAdapter::buildTopicFilter(const std::string& topicPrefix,
                                                  const std::string& sessionId) {
    return topicPrefix + "/" + sessionId + "/positions/#";
}

bool LiveTrackingAdapter::connect(std::shared_ptr<ports::ITransport> transport,
                                  const LiveFeedConfig& config) {
    // Never two connections at once
    disconnect();

    if (!transport) {
        std::cerr << "[LiveTracking] No transport supplied" << std::endl;
        return false;
    }
    if (config.sessionId.empty() || config.topicPrefix.empty()) {
        std::cerr << "[LiveTracking] Session id and topic prefix are required" << std::endl;
        return false;
    }
    if (config.channelCapacity == 0) {
        std::cerr << "[LiveTracking] Channel capacity must be positive" << std::endl;
        return false;
    }

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        channel_.clear();
        channelCapacity_ = config.channelCapacity;
        generation = ++generation_;
    }
    publishSnapshot(std::make_shared<const LivePositionSnapshot>());
    invalidMessages_ = 0;
    droppedMessages_ = 0;

    transport_ = transport;
    topicFilter_ = buildTopicFilter(config.topicPrefix, config.sessionId);

    transport_->setMessageHandler([this, generation](std::string_view topic, std::string_view payload) {
        onMessage(generation, topic, payload);
    });
    transport_->setConnectionHandler([this](bool connected, std::string_view reason) {
        onConnectionChange(connected, reason);
    });

    std::cout << "[LiveTracking] Connecting to " << config.credentials.host << ":"
              << config.credentials.port << " for session " << config.sessionId << std::endl;

    if (!transport_->connect(config.credentials)) {
        std::cerr << "[LiveTracking] Connection to " << config.credentials.host << " failed" << std::endl;
        detachTransport();
        return false;
    }

    if (!transport_->subscribe(topicFilter_, config.qos)) {
        std::cerr << "[LiveTracking] Subscribe to " << topicFilter_ << " failed" << std::endl;
        transport_->disconnect();
        detachTransport();
        return false;
    }

    std::cout << "[LiveTracking] Listening on " << topicFilter_ << std::endl;
    return true;
}

void LiveTrackingAdapter::disconnect() {
    if (!transport_) {
        return;
    }

    {
        // Late callbacks from the old transport are ignored from here on
        std::lock_guard<std::mutex> lock(channelMutex_);
        ++generation_;
        channel_.clear();
    }
    if (!topicFilter_.empty() && transport_->isConnected()) {
        if (!transport_->unsubscribe(topicFilter_)) {
            std::cerr << "[LiveTracking] Unsubscribe from " << topicFilter_ << " failed" << std::endl;
        }
    }
    transport_->disconnect();
    detachTransport();
    std::cout << "[LiveTracking] Disconnected" << std::endl;
}

bool LiveTrackingAdapter::isConnected() const {
    return transport_ && transport_->isConnected();
}

void LiveTrackingAdapter::detachTransport() {
    if (transport_) {
        transport_->setMessageHandler(nullptr);
        transport_->setConnectionHandler(nullptr);
    }
    transport_.reset();
    topicFilter_.clear();
}

void LiveTrackingAdapter::onMessage(std::uint64_t generation, std::string_view topic,
                                    std::string_view payload) {
    std::optional<LivePosition> position;
    std::string error;
    try {
        position = JsonCodec::decodeLivePosition(std::string(payload));
    } catch (const std::exception& e) {
        error = e.what();
    }

    // Checked under the lock: a session torn down after decoding must not
    // reach the channel of the next one
    std::lock_guard<std::mutex> lock(channelMutex_);
    if (generation != generation_) {
        return;
    }
    if (!position) {
        ++invalidMessages_;
        std::cerr << "[LiveTracking] Ignoring invalid message on " << topic << ": " << error << std::endl;
        return;
    }
    if (channel_.size() >= channelCapacity_) {
        channel_.pop_front();
        ++droppedMessages_;
    }
    channel_.push_back(std::move(*position));
}

void LiveTrackingAdapter::onConnectionChange(bool connected, std::string_view reason) {
    if (connected) {
        std::cout << "[LiveTracking] Feed connected: " << reason << std::endl;
    } else {
        std::cerr << "[LiveTracking] Feed disconnected: " << reason << std::endl;
    }
}

std::size_t LiveTrackingAdapter::processEvents() {
    if (transport_) {
        transport_->processEvents();
    }

    std::deque<LivePosition> pending;
    {
        std::lock_guard<std::mutex> lock(channelMutex_);
        pending.swap(channel_);
    }
    if (pending.empty()) {
        return 0;
    }

    auto current = snapshot();
    auto next = std::make_shared<LivePositionSnapshot>(*current);
    std::size_t applied = 0;
    for (auto& position : pending) {
        auto it = next->positions.find(position.boatId);
        // Out-of-order updates never move a boat backwards in time
        if (it != next->positions.end() && it->second.timestamp > position.timestamp) {
            continue;
        }
        next->positions[position.boatId] = std::move(position);
        ++applied;
    }
    if (applied == 0) {
        return 0;
    }

    next->updatedAt = clock_->epochMillis();
    next->version = current->version + 1;
    publishSnapshot(next);

    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(observerMutex_);
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    for (const auto& observer : observers) {
        try {
            observer(*next);
        } catch (const std::exception& e) {
            std::cerr << "[LiveTracking] Observer failed: " << e.what() << std::endl;
        }
    }
    return applied;
}

std::shared_ptr<const LivePositionSnapshot> LiveTrackingAdapter::snapshot() const {
    return std::atomic_load(&snapshot_);
}

void LiveTrackingAdapter::publishSnapshot(std::shared_ptr<const LivePositionSnapshot> snapshot) {
    std::atomic_store(&snapshot_, std::move(snapshot));
}

LiveTrackingAdapter::ObserverId LiveTrackingAdapter::addObserver(Observer observer) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    ObserverId id = nextObserverId_++;
    observers_[id] = std::move(observer);
    return id;
}

bool LiveTrackingAdapter::removeObserver(ObserverId id) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    return observers_.erase(id) > 0;
}

} // namespace sailtrack::domain
