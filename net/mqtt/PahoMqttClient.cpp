#include "PahoMqttClient.hpp"
#include <iostream>
#include <utility>

namespace sailtrack {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    destroyClient();
}

bool PahoMqttClient::connect(const std::string& host, std::uint16_t port,
                             const std::string& clientId,
                             const std::string& username,
                             const std::string& password,
                             bool useTls) {
    // One broker connection per client object
    disconnect();
    destroyClient();

    std::string serverURI = (useTls ? "ssl://" : "tcp://") + host + ":" + std::to_string(port);
    std::cout << "[MQTT] Connecting to " << serverURI << " as " << clientId << std::endl;

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }

    rc = MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    if (rc == MQTTASYNC_SUCCESS) {
        rc = MQTTAsync_setConnected(client_, this, onReconnected);
    }
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to install callbacks, error code: " << rc << std::endl;
        destroyClient();
        return false;
    }

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.automaticReconnect = 1;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    if (!username.empty()) {
        conn_opts.username = username.c_str();
        conn_opts.password = password.c_str();
    }
    if (useTls) {
        ssl_opts.enableServerCertAuth = 1;
        ssl_opts.verify = 1;
        conn_opts.ssl = &ssl_opts;
    }

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.timeout = kDisconnectTimeoutMs;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
    }
    connected_ = false;

    std::lock_guard<std::mutex> lock(subscriptionMutex_);
    subscriptions_.clear();
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!client_) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscriptions_[topic] = qos;
    }
    if (!connected_) {
        // Sent from onConnected
        return true;
    }
    return sendSubscribe(topic, qos);
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscriptions_.erase(topic);
    }
    if (!client_ || !connected_) {
        return true;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::notifyConnection(bool connected, const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(callbackMutex_);
    if (connectionCallback_) {
        connectionCallback_(connected, reason);
    }
}

void PahoMqttClient::processEvents() {
    // Paho runs its own network thread
}

bool PahoMqttClient::sendSubscribe(const std::string& topic, int qos) {
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Subscribe to " << topic << " failed, error code: " << rc << std::endl;
        return false;
    }
    std::cout << "[MQTT] Subscribed to " << topic << std::endl;
    return true;
}

void PahoMqttClient::resubscribeAll() {
    std::map<std::string, int> topics;
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        topics = subscriptions_;
    }
    for (const auto& [topic, qos] : topics) {
        sendSubscribe(topic, qos);
    }
}

void PahoMqttClient::destroyClient() {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    MqttMessage msg;
    msg.topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen))
                             : std::string(topicName);
    msg.payload = std::string(static_cast<char*>(message->payload), message->payloadlen);
    msg.qos = message->qos;
    msg.retained = message->retained != 0;

    {
        std::lock_guard<std::recursive_mutex> lock(client->callbackMutex_);
        if (client->messageCallback_) {
            client->messageCallback_(msg);
        }
    }

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    if (client->connected_.exchange(true)) {
        return;
    }

    client->notifyConnection(true, "Connected successfully");

    client->resubscribeAll();
}

void PahoMqttClient::onReconnected(void* context, char* cause) {
    (void)cause;

    auto* client = static_cast<PahoMqttClient*>(context);
    if (client->connected_.exchange(true)) {
        // First connect already handled by onConnected
        return;
    }
    client->notifyConnection(true, "Reconnected");
    client->resubscribeAll();
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = "Connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    client->notifyConnection(false, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    client->notifyConnection(false, cause ? std::string(cause) : "Connection lost");
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

} // namespace sailtrack
