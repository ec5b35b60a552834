#include "MqttTransportAdapter.hpp"
#include <iostream>
#include <utility>

namespace sailtrack::adapters {

MqttTransportAdapter::MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient)
    : mqttClient_(mqttClient) {

    mqttClient_->setMessageCallback([this](const MqttMessage& msg) {
        onMqttMessage(msg);
    });

    mqttClient_->setConnectionCallback([this](bool connected, const std::string& reason) {
        onMqttConnection(connected, reason);
    });
}

MqttTransportAdapter::~MqttTransportAdapter() {
    // The client may outlive us; its callbacks capture this.
    mqttClient_->setMessageCallback(nullptr);
    mqttClient_->setConnectionCallback(nullptr);
}

bool MqttTransportAdapter::connect(const ports::Credentials& credentials) {
    if (credentials.port <= 0 || credentials.port > 65535) {
        std::cerr << "[MQTT] Invalid broker port: " << credentials.port << std::endl;
        return false;
    }
    return mqttClient_->connect(credentials.host, static_cast<std::uint16_t>(credentials.port),
                                credentials.clientId, credentials.username, credentials.password,
                                credentials.useTls);
}

void MqttTransportAdapter::disconnect() {
    mqttClient_->disconnect();
}

bool MqttTransportAdapter::isConnected() const {
    return mqttClient_->isConnected();
}

bool MqttTransportAdapter::subscribe(std::string_view topic, int qos) {
    return mqttClient_->subscribe(std::string(topic), qos);
}

bool MqttTransportAdapter::unsubscribe(std::string_view topic) {
    return mqttClient_->unsubscribe(std::string(topic));
}

void MqttTransportAdapter::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::recursive_mutex> lock(handlerMutex_);
    messageHandler_ = std::move(handler);
}

void MqttTransportAdapter::setConnectionHandler(ConnectionHandler handler) {
    std::lock_guard<std::recursive_mutex> lock(handlerMutex_);
    connectionHandler_ = std::move(handler);
}

void MqttTransportAdapter::processEvents() {
    mqttClient_->processEvents();
}

void MqttTransportAdapter::onMqttMessage(const MqttMessage& message) {
    std::lock_guard<std::recursive_mutex> lock(handlerMutex_);
    if (messageHandler_) {
        messageHandler_(message.topic, message.payload);
    }
}

void MqttTransportAdapter::onMqttConnection(bool connected, const std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(handlerMutex_);
    if (connectionHandler_) {
        connectionHandler_(connected, reason);
    }
}

} // namespace sailtrack::adapters
