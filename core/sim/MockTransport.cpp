#include "MockTransport.hpp"
#include <algorithm>

namespace sailtrack::sim {

namespace {

std::vector<std::string_view> splitLevels(std::string_view topic) {
    std::vector<std::string_view> levels;
    std::size_t start = 0;
    while (true) {
        std::size_t slash = topic.find('/', start);
        if (slash == std::string_view::npos) {
            levels.push_back(topic.substr(start));
            return levels;
        }
        levels.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
}

} // namespace

MockTransport::MockTransport() = default;

bool MockTransport::topicMatches(std::string_view filter, std::string_view topic) {
    const auto filterLevels = splitLevels(filter);
    const auto topicLevels = splitLevels(topic);

    for (std::size_t i = 0; i < filterLevels.size(); ++i) {
        if (filterLevels[i] == "#") {
            return i + 1 == filterLevels.size();
        }
        if (i >= topicLevels.size()) {
            return false;
        }
        if (filterLevels[i] != "+" && filterLevels[i] != topicLevels[i]) {
            return false;
        }
    }
    return filterLevels.size() == topicLevels.size();
}

bool MockTransport::connect(const ports::Credentials& credentials) {
    lastCredentials_ = credentials;
    ++connectCount_;
    if (failConnect_) {
        if (connectionHandler_) {
            connectionHandler_(false, "Mock connection refused");
        }
        return false;
    }
    changeConnection(true, "Mock connection established");
    return true;
}

void MockTransport::disconnect() {
    if (!connected_) {
        return;
    }
    ++disconnectCount_;
    // A clean disconnect ends the session and its subscriptions
    subscriptions_.clear();
    changeConnection(false, "Disconnected");
}

bool MockTransport::isConnected() const {
    return connected_;
}

bool MockTransport::subscribe(std::string_view topic, int qos) {
    (void)qos;
    if (!connected_ || topic.empty()) {
        return false;
    }

    std::string filter(topic);
    if (std::find(subscriptions_.begin(), subscriptions_.end(), filter) == subscriptions_.end()) {
        subscriptions_.push_back(filter);
    }
    return true;
}

bool MockTransport::unsubscribe(std::string_view topic) {
    auto it = std::find(subscriptions_.begin(), subscriptions_.end(), topic);
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

void MockTransport::setMessageHandler(MessageHandler handler) {
    messageHandler_ = std::move(handler);
}

void MockTransport::setConnectionHandler(ConnectionHandler handler) {
    connectionHandler_ = std::move(handler);
}

void MockTransport::processEvents() {
    while (!incomingMessages_.empty()) {
        MockMessage message = std::move(incomingMessages_.front());
        incomingMessages_.pop();
        route(message.topic, message.payload);
    }
}

void MockTransport::simulateConnectionLoss() {
    changeConnection(false, "Connection lost");
}

void MockTransport::simulateConnectionRestore() {
    changeConnection(true, "Reconnected");
}

void MockTransport::injectMessage(std::string_view topic, std::string_view payload) {
    incomingMessages_.push(MockMessage{std::string(topic), std::string(payload)});
}

void MockTransport::deliverNow(std::string_view topic, std::string_view payload) {
    route(topic, payload);
}

void MockTransport::route(std::string_view topic, std::string_view payload) {
    const bool subscribed = std::any_of(subscriptions_.begin(), subscriptions_.end(),
                                        [&](const std::string& filter) { return topicMatches(filter, topic); });
    if (!connected_ || !subscribed || !messageHandler_) {
        ++unrouted_;
        return;
    }
    ++delivered_;
    messageHandler_(topic, payload);
}

void MockTransport::changeConnection(bool connected, std::string_view reason) {
    const bool changed = connected_ != connected;
    connected_ = connected;
    if (changed && connectionHandler_) {
        connectionHandler_(connected, reason);
    }
}

} // namespace sailtrack::sim
