/**
 * @file ITransport.hpp
 * @brief Subscriber transport port for the live position feed
 *
 * LiveTrackingAdapter only talks to this interface. The desktop build plugs
 * in adapters::MqttTransportAdapter over Paho; tests use sim::MockTransport.
 */

#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace sailtrack::ports {

/**
 * @brief Broker endpoint and login
 */
struct Credentials {
    std::string host;
    int port = 1883;                ///< 8883 is the usual TLS port
    std::string clientId;           ///< Empty lets the client pick one
    std::string username;
    std::string password;
    bool useTls = false;
};

class ITransport {
public:
    virtual ~ITransport() = default;

    /// Called for every delivered message, possibly on a library thread.
    using MessageHandler = std::function<void(std::string_view topic, std::string_view payload)>;
    using ConnectionHandler = std::function<void(bool connected, std::string_view reason)>;

    virtual bool connect(const Credentials& credentials) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /// @param topic Topic filter, '+' and '#' wildcards allowed
    virtual bool subscribe(std::string_view topic, int qos = 0) = 0;
    virtual bool unsubscribe(std::string_view topic) = 0;

    /// Passing an empty handler detaches the previous one.
    virtual void setMessageHandler(MessageHandler handler) = 0;
    virtual void setConnectionHandler(ConnectionHandler handler) = 0;

    /// Pumps pending work; never blocks.
    virtual void processEvents() = 0;
};

} // namespace sailtrack::ports
