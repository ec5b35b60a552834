#pragma once

#include "../ports/ITransport.hpp"
#include "../IMqttClient.hpp"
#include <memory>
#include <mutex>

namespace sailtrack::adapters {

class MqttTransportAdapter : public ports::ITransport {
public:
    explicit MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient);
    ~MqttTransportAdapter() override;

    bool connect(const ports::Credentials& credentials) override;
    void disconnect() override;
    bool isConnected() const override;

    bool subscribe(std::string_view topic, int qos = 0) override;
    bool unsubscribe(std::string_view topic) override;

    void setMessageHandler(MessageHandler handler) override;
    void setConnectionHandler(ConnectionHandler handler) override;

    void processEvents() override;

private:
    void onMqttMessage(const MqttMessage& message);
    void onMqttConnection(bool connected, const std::string& reason);

    std::shared_ptr<IMqttClient> mqttClient_;
    MessageHandler messageHandler_;
    ConnectionHandler connectionHandler_;
    // Client callbacks arrive on the client's thread; held while a handler runs
    std::recursive_mutex handlerMutex_;
};

} // namespace sailtrack::adapters
