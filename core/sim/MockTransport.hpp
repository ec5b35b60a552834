#pragma once

#include "../ports/ITransport.hpp"
#include <cstddef>
#include <queue>
#include <string>
#include <vector>

namespace sailtrack::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
};

/**
 * @brief In-memory broker stand-in for live feed tests
 *
 * Behaves like a broker session: messages reach the handler only while
 * connected and only when a subscribed filter matches their topic.
 * injectMessage() queues until the next processEvents(); deliverNow()
 * delivers at once, the way a client library thread would.
 */
class MockTransport : public ports::ITransport {
public:
    MockTransport();
    ~MockTransport() override = default;

    // ITransport interface
    bool connect(const ports::Credentials& credentials) override;
    void disconnect() override;
    bool isConnected() const override;

    bool subscribe(std::string_view topic, int qos = 0) override;
    bool unsubscribe(std::string_view topic) override;

    void setMessageHandler(MessageHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    void processEvents() override;

    // Test controls
    void simulateConnectionLoss();
    void simulateConnectionRestore();
    void injectMessage(std::string_view topic, std::string_view payload);
    void deliverNow(std::string_view topic, std::string_view payload);
    void setFailConnect(bool fail) { failConnect_ = fail; }

    const std::vector<std::string>& getSubscriptions() const { return subscriptions_; }
    const ports::Credentials& getLastCredentials() const { return lastCredentials_; }
    int connectCount() const { return connectCount_; }
    int disconnectCount() const { return disconnectCount_; }
    bool hasMessageHandler() const { return static_cast<bool>(messageHandler_); }

    /// Messages that reached the handler / were not routed to it.
    std::size_t deliveredCount() const { return delivered_; }
    std::size_t unroutedCount() const { return unrouted_; }

    /**
     * @brief MQTT topic filter matching
     *
     * '+' matches exactly one level, a trailing '#' matches the parent level
     * and everything below it: "a/+/c" matches "a/b/c", "a/#" matches "a"
     * and "a/b/c".
     */
    static bool topicMatches(std::string_view filter, std::string_view topic);

private:
    void route(std::string_view topic, std::string_view payload);
    void changeConnection(bool connected, std::string_view reason);

    bool connected_ = false;
    bool failConnect_ = false;
    int connectCount_ = 0;
    int disconnectCount_ = 0;
    std::size_t delivered_ = 0;
    std::size_t unrouted_ = 0;

    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;

    std::queue<MockMessage> incomingMessages_;
    std::vector<std::string> subscriptions_;

    ports::Credentials lastCredentials_;
};

} // namespace sailtrack::sim
