#include <gtest/gtest.h>
#include "../core/domain/LiveTrackingAdapter.hpp"
#include "../core/adapters/MqttTransportAdapter.hpp"
#include "../core/sim/MockTransport.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../core/JsonCodec.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sailtrack;

namespace {

const std::string kTopic = "sailtrack/race-42/positions/HKG-1";

std::string positionMessage(const std::string& boatId, double lat, double lng, int64_t ts) {
    return "{\"boatId\":\"" + boatId + "\",\"lat\":" + std::to_string(lat) + ",\"lng\":" +
           std::to_string(lng) + ",\"ts\":" + std::to_string(ts) + "}";
}

// Records calls instead of talking to a broker.
class FakeMqttClient : public IMqttClient {
public:
    bool connect(const std::string& host, std::uint16_t port, const std::string& clientId,
                 const std::string& username, const std::string& password, bool useTls) override {
        (void)username;
        (void)password;
        lastHost = host;
        lastPort = port;
        lastClientId = clientId;
        lastUseTls = useTls;
        connected = true;
        if (connectionCallback) {
            connectionCallback(true, "fake connected");
        }
        return true;
    }

    void disconnect() override { connected = false; }
    bool isConnected() const override { return connected; }

    bool subscribe(const std::string& topic, int qos) override {
        (void)qos;
        subscriptions.push_back(topic);
        return connected;
    }

    bool unsubscribe(const std::string& topic) override {
        unsubscriptions.push_back(topic);
        return true;
    }

    void setMessageCallback(MessageCallback callback) override { messageCallback = std::move(callback); }
    void setConnectionCallback(ConnectionCallback callback) override {
        connectionCallback = std::move(callback);
    }

    void processEvents() override { ++processCount; }

    void deliver(const std::string& topic, const std::string& payload) {
        if (messageCallback) {
            MqttMessage message;
            message.topic = topic;
            message.payload = payload;
            messageCallback(message);
        }
    }

    std::string lastHost;
    std::uint16_t lastPort = 0;
    std::string lastClientId;
    bool lastUseTls = false;
    bool connected = false;
    int processCount = 0;
    std::vector<std::string> subscriptions;
    std::vector<std::string> unsubscriptions;
    MessageCallback messageCallback;
    ConnectionCallback connectionCallback;
};

// Keeps every handler it was given, the way a client thread can still be
// holding one while the owner replaces it.
class HandlerKeepingTransport : public sim::MockTransport {
public:
    void setMessageHandler(MessageHandler handler) override {
        if (handler) {
            handlers.push_back(handler);
        }
        sim::MockTransport::setMessageHandler(std::move(handler));
    }

    std::vector<MessageHandler> handlers;
};

} // namespace

class LiveTrackingTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>(1700000000000);
        transport_ = std::make_shared<sim::MockTransport>();
        adapter_ = std::make_unique<domain::LiveTrackingAdapter>(clock_);

        config_.credentials.host = "broker.local";
        config_.credentials.clientId = "sailtrack-test";
        config_.sessionId = "race-42";
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockTransport> transport_;
    std::unique_ptr<domain::LiveTrackingAdapter> adapter_;
    domain::LiveFeedConfig config_;
};

TEST_F(LiveTrackingTest, ConnectSubscribesToSessionTopic) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));
    EXPECT_TRUE(adapter_->isConnected());
    EXPECT_EQ(adapter_->topicFilter(), "sailtrack/race-42/positions/#");

    ASSERT_EQ(transport_->getSubscriptions().size(), 1u);
    EXPECT_EQ(transport_->getSubscriptions()[0], "sailtrack/race-42/positions/#");
    EXPECT_EQ(transport_->getLastCredentials().host, "broker.local");
    EXPECT_EQ(transport_->connectCount(), 1);

    EXPECT_EQ(domain::LiveTrackingAdapter::buildTopicFilter("fleet", "cup"), "fleet/cup/positions/#");
}

TEST_F(LiveTrackingTest, ProcessEventsPublishesNewSnapshot) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));
    auto before = adapter_->snapshot();
    EXPECT_TRUE(before->positions.empty());
    EXPECT_EQ(before->version, 0u);

    transport_->injectMessage(kTopic,
        "{\"boatId\":\"HKG-1\",\"lat\":22.3,\"lng\":114.2,\"ts\":5000,\"speed\":6.5,\"heading\":45}");
    clock_->advance(std::chrono::milliseconds(250));

    EXPECT_EQ(adapter_->processEvents(), 1u);
    auto after = adapter_->snapshot();
    EXPECT_EQ(after->version, 1u);
    EXPECT_EQ(after->updatedAt, 1700000000250);
    ASSERT_EQ(after->positions.count("HKG-1"), 1u);

    const LivePosition& position = after->positions.at("HKG-1");
    EXPECT_DOUBLE_EQ(position.lat, 22.3);
    EXPECT_DOUBLE_EQ(position.lng, 114.2);
    EXPECT_EQ(position.timestamp, 5000);
    EXPECT_EQ(position.speed, 6.5);
    EXPECT_EQ(position.heading, 45.0);

    // Earlier snapshots stay as they were
    EXPECT_TRUE(before->positions.empty());
    EXPECT_EQ(adapter_->processEvents(), 0u);
    EXPECT_EQ(adapter_->snapshot(), after);
}

TEST_F(LiveTrackingTest, InvalidMessagesAreCountedAndSkipped) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));

    transport_->injectMessage(kTopic, "not json");
    transport_->injectMessage(kTopic, "{\"lat\":22.3,\"lng\":114.2,\"ts\":1}");
    transport_->injectMessage(kTopic, positionMessage("HKG-1", 95.0, 114.2, 1));
    transport_->injectMessage(kTopic, "[1,2,3]");
    transport_->injectMessage(kTopic, "{\"boatId\":\"a\",\"lat\":1,\"lng\":1,\"ts\":1e30}");

    EXPECT_EQ(adapter_->processEvents(), 0u);
    EXPECT_EQ(adapter_->invalidMessageCount(), 5u);
    EXPECT_EQ(adapter_->snapshot()->version, 0u);
}

TEST_F(LiveTrackingTest, FullChannelDropsOldest) {
    config_.channelCapacity = 2;
    ASSERT_TRUE(adapter_->connect(transport_, config_));

    transport_->deliverNow(kTopic, positionMessage("A", 22.30, 114.20, 1000));
    transport_->deliverNow(kTopic, positionMessage("B", 22.31, 114.20, 1000));
    transport_->deliverNow(kTopic, positionMessage("C", 22.32, 114.20, 1000));
    EXPECT_EQ(adapter_->droppedMessageCount(), 1u);

    EXPECT_EQ(adapter_->processEvents(), 2u);
    auto snapshot = adapter_->snapshot();
    EXPECT_EQ(snapshot->positions.count("A"), 0u);
    EXPECT_EQ(snapshot->positions.count("B"), 1u);
    EXPECT_EQ(snapshot->positions.count("C"), 1u);
}

TEST_F(LiveTrackingTest, OlderPositionsNeverReplaceNewer) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));

    transport_->injectMessage(kTopic, positionMessage("HKG-1", 22.30, 114.20, 2000));
    transport_->injectMessage(kTopic, positionMessage("HKG-1", 22.10, 114.10, 1000));
    EXPECT_EQ(adapter_->processEvents(), 1u);
    EXPECT_EQ(adapter_->snapshot()->positions.at("HKG-1").timestamp, 2000);

    transport_->injectMessage(kTopic, positionMessage("HKG-1", 22.10, 114.10, 1500));
    EXPECT_EQ(adapter_->processEvents(), 0u);
    EXPECT_EQ(adapter_->snapshot()->version, 1u);

    transport_->injectMessage(kTopic, positionMessage("HKG-1", 22.31, 114.21, 3000));
    EXPECT_EQ(adapter_->processEvents(), 1u);
    EXPECT_EQ(adapter_->snapshot()->positions.at("HKG-1").timestamp, 3000);
    EXPECT_EQ(adapter_->snapshot()->version, 2u);
}

TEST_F(LiveTrackingTest, ObserversAreNotifiedUntilRemoved) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));

    std::vector<std::uint64_t> versions;
    auto id = adapter_->addObserver([&](const domain::LivePositionSnapshot& snapshot) {
        versions.push_back(snapshot.version);
    });
    adapter_->addObserver([](const domain::LivePositionSnapshot&) {
        throw std::runtime_error("observer failure");
    });

    transport_->injectMessage(kTopic, positionMessage("A", 22.30, 114.20, 1000));
    adapter_->processEvents();
    ASSERT_EQ(versions.size(), 1u);
    EXPECT_EQ(versions[0], 1u);

    EXPECT_TRUE(adapter_->removeObserver(id));
    EXPECT_FALSE(adapter_->removeObserver(id));

    transport_->injectMessage(kTopic, positionMessage("A", 22.30, 114.20, 2000));
    adapter_->processEvents();
    EXPECT_EQ(versions.size(), 1u);
}

TEST_F(LiveTrackingTest, FailedConnectLeavesAdapterDetached) {
    transport_->setFailConnect(true);
    EXPECT_FALSE(adapter_->connect(transport_, config_));
    EXPECT_FALSE(adapter_->isConnected());
    EXPECT_FALSE(transport_->hasMessageHandler());
    EXPECT_TRUE(adapter_->topicFilter().empty());

    EXPECT_FALSE(adapter_->connect(nullptr, config_));

    domain::LiveFeedConfig noSession = config_;
    noSession.sessionId.clear();
    EXPECT_FALSE(adapter_->connect(std::make_shared<sim::MockTransport>(), noSession));
}

TEST_F(LiveTrackingTest, ConnectingAgainReplacesPreviousTransport) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));
    transport_->injectMessage(kTopic, positionMessage("A", 22.30, 114.20, 1000));
    adapter_->processEvents();
    ASSERT_EQ(adapter_->snapshot()->version, 1u);

    auto second = std::make_shared<sim::MockTransport>();
    config_.sessionId = "race-43";
    ASSERT_TRUE(adapter_->connect(second, config_));

    EXPECT_EQ(transport_->disconnectCount(), 1);
    EXPECT_FALSE(transport_->isConnected());
    EXPECT_FALSE(transport_->hasMessageHandler());
    EXPECT_TRUE(second->isConnected());
    ASSERT_EQ(second->getSubscriptions().size(), 1u);
    EXPECT_EQ(second->getSubscriptions()[0], "sailtrack/race-43/positions/#");

    // Fresh session starts from an empty snapshot
    EXPECT_EQ(adapter_->snapshot()->version, 0u);
    EXPECT_TRUE(adapter_->snapshot()->positions.empty());
}

TEST_F(LiveTrackingTest, LateHandlerFromEndedSessionIsIgnored) {
    auto transport = std::make_shared<HandlerKeepingTransport>();
    ASSERT_TRUE(adapter_->connect(transport, config_));
    ASSERT_EQ(transport->handlers.size(), 1u);
    auto staleHandler = transport->handlers[0];

    adapter_->disconnect();
    staleHandler(kTopic, positionMessage("OLD", 22.3, 114.2, 1000));

    ASSERT_TRUE(adapter_->connect(transport, config_));
    staleHandler(kTopic, positionMessage("OLD", 22.3, 114.2, 2000));
    staleHandler(kTopic, "not json");
    EXPECT_EQ(adapter_->processEvents(), 0u);
    EXPECT_TRUE(adapter_->snapshot()->positions.empty());
    EXPECT_EQ(adapter_->invalidMessageCount(), 0u);

    ASSERT_EQ(transport->handlers.size(), 2u);
    transport->handlers[1](kTopic, positionMessage("NEW", 22.3, 114.2, 3000));
    EXPECT_EQ(adapter_->processEvents(), 1u);
    EXPECT_EQ(adapter_->snapshot()->positions.count("OLD"), 0u);
    EXPECT_EQ(adapter_->snapshot()->positions.count("NEW"), 1u);
}

TEST_F(LiveTrackingTest, StaleDeliveriesRacingReconnectNeverLand) {
    auto transport = std::make_shared<HandlerKeepingTransport>();
    ASSERT_TRUE(adapter_->connect(transport, config_));
    auto staleHandler = transport->handlers[0];

    std::atomic<bool> stop{false};
    std::thread clientThread([&]() {
        int64_t ts = 0;
        while (!stop) {
            staleHandler(kTopic, positionMessage("OLD", 22.3, 114.2, ++ts));
        }
    });

    adapter_->disconnect();
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(adapter_->connect(transport, config_));
        adapter_->processEvents();
    }
    stop = true;
    clientThread.join();

    adapter_->processEvents();
    EXPECT_EQ(adapter_->snapshot()->positions.count("OLD"), 0u);
}

TEST_F(LiveTrackingTest, DisconnectUnsubscribesAndDetaches) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));
    adapter_->disconnect();

    EXPECT_FALSE(adapter_->isConnected());
    EXPECT_TRUE(transport_->getSubscriptions().empty());
    EXPECT_EQ(transport_->disconnectCount(), 1);
    EXPECT_FALSE(transport_->hasMessageHandler());

    adapter_->disconnect();
    EXPECT_EQ(transport_->disconnectCount(), 1);
}

TEST_F(LiveTrackingTest, OtherSessionsAreNotRouted) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));

    transport_->injectMessage("sailtrack/race-43/positions/HKG-1", positionMessage("HKG-1", 22.3, 114.2, 1000));
    transport_->injectMessage("sailtrack/race-42/wind", "{\"twd\":210}");
    EXPECT_EQ(adapter_->processEvents(), 0u);
    EXPECT_EQ(transport_->unroutedCount(), 2u);
    EXPECT_EQ(adapter_->invalidMessageCount(), 0u);

    transport_->injectMessage(kTopic, positionMessage("HKG-1", 22.3, 114.2, 1000));
    EXPECT_EQ(adapter_->processEvents(), 1u);
    EXPECT_EQ(transport_->deliveredCount(), 1u);
}

TEST_F(LiveTrackingTest, ConnectionLossKeepsLastSnapshot) {
    ASSERT_TRUE(adapter_->connect(transport_, config_));
    transport_->injectMessage(kTopic, positionMessage("HKG-1", 22.3, 114.2, 1000));
    adapter_->processEvents();

    transport_->simulateConnectionLoss();
    EXPECT_FALSE(adapter_->isConnected());
    transport_->deliverNow(kTopic, positionMessage("HKG-1", 22.4, 114.2, 2000));
    EXPECT_EQ(adapter_->processEvents(), 0u);
    EXPECT_EQ(adapter_->snapshot()->positions.at("HKG-1").timestamp, 1000);

    transport_->simulateConnectionRestore();
    EXPECT_TRUE(adapter_->isConnected());
    transport_->deliverNow(kTopic, positionMessage("HKG-1", 22.4, 114.2, 2000));
    EXPECT_EQ(adapter_->processEvents(), 1u);
    EXPECT_EQ(adapter_->snapshot()->positions.at("HKG-1").timestamp, 2000);
}

TEST(MockTransportTest, TopicFilterWildcards) {
    EXPECT_TRUE(sim::MockTransport::topicMatches("sailtrack/race-42/positions/#",
                                                 "sailtrack/race-42/positions/HKG-1"));
    EXPECT_TRUE(sim::MockTransport::topicMatches("sailtrack/race-42/positions/#",
                                                 "sailtrack/race-42/positions"));
    EXPECT_TRUE(sim::MockTransport::topicMatches("sailtrack/+/positions/+",
                                                 "sailtrack/race-42/positions/HKG-1"));
    EXPECT_TRUE(sim::MockTransport::topicMatches("#", "anything/at/all"));
    EXPECT_TRUE(sim::MockTransport::topicMatches("a/b", "a/b"));

    EXPECT_FALSE(sim::MockTransport::topicMatches("sailtrack/race-42/positions/#",
                                                  "sailtrack/race-43/positions/HKG-1"));
    EXPECT_FALSE(sim::MockTransport::topicMatches("sailtrack/+/positions", "sailtrack/a/b/positions"));
    EXPECT_FALSE(sim::MockTransport::topicMatches("a/b", "a/b/c"));
    EXPECT_FALSE(sim::MockTransport::topicMatches("a/#/c", "a/b/c"));
}

TEST_F(LiveTrackingTest, MqttClientFeedsAdapterThroughTransportAdapter) {
    auto client = std::make_shared<FakeMqttClient>();
    auto transport = std::make_shared<adapters::MqttTransportAdapter>(client);

    config_.credentials.port = 8883;
    config_.credentials.useTls = true;
    ASSERT_TRUE(adapter_->connect(transport, config_));
    EXPECT_EQ(client->lastHost, "broker.local");
    EXPECT_EQ(client->lastPort, 8883);
    EXPECT_EQ(client->lastClientId, "sailtrack-test");
    EXPECT_TRUE(client->lastUseTls);
    ASSERT_EQ(client->subscriptions.size(), 1u);
    EXPECT_EQ(client->subscriptions[0], "sailtrack/race-42/positions/#");

    client->deliver(kTopic, positionMessage("HKG-1", 22.30, 114.20, 1000));
    EXPECT_EQ(adapter_->processEvents(), 1u);
    EXPECT_EQ(client->processCount, 1);
    EXPECT_EQ(adapter_->snapshot()->positions.count("HKG-1"), 1u);

    adapter_->disconnect();
    ASSERT_EQ(client->unsubscriptions.size(), 1u);
    EXPECT_FALSE(client->isConnected());
}

TEST(MqttTransportAdapterTest, RejectsInvalidPortAndReleasesCallbacks) {
    auto client = std::make_shared<FakeMqttClient>();
    {
        adapters::MqttTransportAdapter transport(client);
        ports::Credentials credentials;
        credentials.host = "broker.local";
        credentials.port = 70000;
        EXPECT_FALSE(transport.connect(credentials));
        EXPECT_TRUE(client->lastHost.empty());
        EXPECT_TRUE(static_cast<bool>(client->messageCallback));
    }
    EXPECT_FALSE(static_cast<bool>(client->messageCallback));
    EXPECT_FALSE(static_cast<bool>(client->connectionCallback));
}

TEST(LivePositionCodecTest, DecodesAndRejectsMessages) {
    LivePosition position = JsonCodec::decodeLivePosition(
        "{\"boatId\":\"HKG-1\",\"lat\":22.3,\"lng\":114.2,\"ts\":1700000000000,\"heading\":270}");
    EXPECT_EQ(position.boatId, "HKG-1");
    EXPECT_EQ(position.timestamp, 1700000000000);
    EXPECT_FALSE(position.speed.has_value());
    EXPECT_EQ(position.heading, 270.0);

    EXPECT_THROW(JsonCodec::decodeLivePosition("[1,2]"), std::runtime_error);
    EXPECT_THROW(JsonCodec::decodeLivePosition("{\"boatId\":\"\",\"lat\":1,\"lng\":1,\"ts\":1}"),
                 std::runtime_error);
    EXPECT_THROW(JsonCodec::decodeLivePosition("{\"boatId\":\"A\",\"lat\":1,\"lng\":1}"),
                 std::runtime_error);
    EXPECT_THROW(JsonCodec::decodeLivePosition(
                     "{\"boatId\":\"A\",\"lat\":1,\"lng\":1,\"ts\":1,\"speed\":\"fast\"}"),
                 std::runtime_error);
    EXPECT_THROW(JsonCodec::decodeLivePosition("{\"boatId\":"), nlohmann::json::exception);

    // Timestamps that do not fit epoch milliseconds
    EXPECT_THROW(JsonCodec::decodeLivePosition("{\"boatId\":\"A\",\"lat\":1,\"lng\":1,\"ts\":1e30}"),
                 std::runtime_error);
    EXPECT_THROW(JsonCodec::decodeLivePosition("{\"boatId\":\"A\",\"lat\":1,\"lng\":1,\"ts\":-1e19}"),
                 std::runtime_error);
    EXPECT_THROW(JsonCodec::decodeLivePosition(
                     "{\"boatId\":\"A\",\"lat\":1,\"lng\":1,\"ts\":18446744073709551615}"),
                 std::runtime_error);
    EXPECT_THROW(JsonCodec::decodeLivePosition("{\"boatId\":\"A\",\"lat\":1,\"lng\":1,\"ts\":\"now\"}"),
                 std::runtime_error);
    EXPECT_EQ(JsonCodec::decodeLivePosition("{\"boatId\":\"A\",\"lat\":1,\"lng\":1,\"ts\":1500.9}").timestamp,
              1500);

    nlohmann::json encoded = JsonCodec::livePositionToJson(position);
    EXPECT_EQ(encoded["boatId"], "HKG-1");
    EXPECT_FALSE(encoded.contains("speed"));
}
