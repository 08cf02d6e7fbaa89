#ifndef HOST_LINK_HPP
#define HOST_LINK_HPP

#include "events/event_sink.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

// UDP link to the host application. Incoming datagrams are transcription
// requests. Events go to the active client, which only changes when the
// request handler accepts a request with setActiveClient().
class HostLink : public EventSink {
public:
    using CallBack = std::function<void(const std::string& msg,
                                        const std::string& senderIp,
                                        uint16_t senderPort)>;

    HostLink(std::string bind_ip, int port, CallBack callback_function);
    ~HostLink() override;

    HostLink(const HostLink&) = delete;
    HostLink& operator=(const HostLink&) = delete;

    // Binds the socket and starts the receive thread. Throws std::runtime_error
    // if the socket cannot be bound.
    void start();
    void stop();

    // Port actually bound; differs from the requested one when that was 0
    uint16_t boundPort() const;

    void setActiveClient(const std::string& ip, uint16_t port);

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);
    bool sendToActive(const std::string& payload);

    bool emit(const EventPayload& payload) override;

private:
    void run();
    void closeSocket();  // caller holds sock_mutex_

    std::string bind_ip_;
    int port_;
    CallBack callback_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    // sock_ is only reassigned under sock_mutex_; the receive thread reads
    // it once and the socket is closed after that thread is joined
    mutable std::mutex sock_mutex_;
    socket_t sock_{kInvalidSocket};

    std::mutex client_mutex_;
    std::string active_ip_{"127.0.0.1"};
    uint16_t active_port_{0};
    bool has_active_client_{false};
};

#endif
