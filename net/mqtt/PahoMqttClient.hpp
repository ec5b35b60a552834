/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async) implementation of IMqttClient
 *
 * Subscriptions requested before the broker has acknowledged the connection
 * are remembered and sent from the connect callback, and sent again after a
 * reconnect, so callers can subscribe right after connect().
 *
 * @note Paho invokes the callbacks on its own thread. Replacing a callback
 *       waits for a running invocation to return, so once
 *       setMessageCallback(nullptr) returns the old target is never called.
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace sailtrack {

class PahoMqttClient : public IMqttClient {
public:
    /**
     * @brief Construct an unconnected client
     */
    PahoMqttClient();

    /**
     * @brief Disconnects if still connected and releases the Paho handle
     */
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const std::string& host, std::uint16_t port,
                 const std::string& clientId,
                 const std::string& username,
                 const std::string& password,
                 bool useTls) override;

    void disconnect() override;
    bool isConnected() const override;

    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    void processEvents() override;

private:
    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectionTimeoutSeconds = 30;
    static constexpr int kDisconnectTimeoutMs = 1000;

    MQTTAsync client_;
    std::atomic<bool> connected_{false};

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    // Held while a callback runs; recursive so a callback may replace itself
    std::recursive_mutex callbackMutex_;

    std::map<std::string, int> subscriptions_;   ///< topic filter -> qos
    std::mutex subscriptionMutex_;

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onReconnected(void* context, char* cause);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);

    /**
     * @brief Send every remembered subscription to the broker
     * @note Called from the connect callback
     */
    void resubscribeAll();

    void notifyConnection(bool connected, const std::string& reason);

    bool sendSubscribe(const std::string& topic, int qos);
    void destroyClient();
};

} // namespace sailtrack
