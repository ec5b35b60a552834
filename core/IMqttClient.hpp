/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface for the live position feed
 *
 * Platform-independent subscriber abstraction. The desktop build backs it
 * with the Eclipse Paho asynchronous C client; tests use sim::MockTransport
 * one layer up and never touch a broker.
 *
 * @note Callbacks may fire on the client library's own thread
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace sailtrack {

/**
 * @brief Incoming MQTT message
 */
struct MqttMessage {
    std::string topic;              ///< e.g. "sailtrack/race-42/positions/HKG-1"
    std::string payload;            ///< JSON position message
    int qos = 0;                    ///< Quality of Service level (0, 1, or 2)
    bool retained = false;          ///< Delivered from the broker's retained store
};

/**
 * @brief Subscriber-side MQTT client
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    using MessageCallback = std::function<void(const MqttMessage&)>;
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Connect to an MQTT broker
     * @param host Broker hostname
     * @param port Broker port (1883 plain, 8883 TLS)
     * @param clientId Unique client identifier
     * @param username Optional, empty for anonymous brokers
     * @param password Optional
     * @param useTls Open an ssl:// connection instead of tcp://
     * @return true if the connection attempt was started
     * @note Asynchronous; the connection callback reports the outcome
     */
    virtual bool connect(const std::string& host, std::uint16_t port,
                         const std::string& clientId,
                         const std::string& username,
                         const std::string& password,
                         bool useTls) = 0;

    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /**
     * @brief Subscribe to a topic filter
     * @param topic Topic filter, '+' and '#' wildcards allowed
     * @param qos Maximum QoS for delivered messages
     */
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    virtual bool unsubscribe(const std::string& topic) = 0;

    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

    /// Must be called regularly; never blocks.
    virtual void processEvents() = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace sailtrack
