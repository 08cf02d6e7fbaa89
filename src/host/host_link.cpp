#include "host/host_link.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <cerrno>
  #include <arpa/inet.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <unistd.h>
#endif

#ifdef _WIN32
static void closesock(socket_t s) { ::closesocket(s); }
static std::string lastSocketError() { return std::to_string(WSAGetLastError()); }
#else
static void closesock(socket_t s) { ::close(s); }
static std::string lastSocketError() { return std::strerror(errno); }
#endif

// Constructor
HostLink::HostLink(std::string bind_ip, int port, CallBack callback_function)
    : bind_ip_(std::move(bind_ip)), port_(port), callback_(std::move(callback_function)) {}

// Destructor
HostLink::~HostLink() { stop(); }

void HostLink::closeSocket() {
    if (sock_ != kInvalidSocket) {
        closesock(sock_);
        sock_ = kInvalidSocket;
    }
#ifdef _WIN32
    WSACleanup();
#endif
}

// Binds the request socket and starts the receive thread
void HostLink::start() {
    if (running_.exchange(true)) return;

    std::lock_guard<std::mutex> lock(sock_mutex_);

#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) {
        running_ = false;
        throw std::runtime_error("HostLink: WSAStartup failed");
    }
#endif

    sock_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ == kInvalidSocket) {
        const std::string err = lastSocketError();
        running_ = false;
        closeSocket();
        throw std::runtime_error("HostLink socket() failed: " + err);
    }

    int reuse = 1;
#ifdef _WIN32
    ::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));
#else
    ::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        running_ = false;
        closeSocket();
        throw std::runtime_error("HostLink: invalid bind ip: " + bind_ip_);
    }

    if (::bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string err = lastSocketError();
        running_ = false;
        closeSocket();
        throw std::runtime_error("HostLink bind() failed: " + err);
    }

    thread_ = std::thread(&HostLink::run, this);
}

// Stops the receive thread
void HostLink::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        if (sock_ != kInvalidSocket) {
#ifdef _WIN32
            ::shutdown(sock_, SD_BOTH);
#else
            ::shutdown(sock_, SHUT_RDWR);
#endif
        }
    }

    if (thread_.joinable()) thread_.join();

    std::lock_guard<std::mutex> lock(sock_mutex_);
    closeSocket();
}

uint16_t HostLink::boundPort() const {
    std::lock_guard<std::mutex> lock(sock_mutex_);
    if (sock_ == kInvalidSocket) return 0;
    sockaddr_in addr{};
#ifdef _WIN32
    int len = sizeof(addr);
#else
    socklen_t len = sizeof(addr);
#endif
    if (::getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
    return ntohs(addr.sin_port);
}

// Sets current active client the link is reporting to
void HostLink::setActiveClient(const std::string& ip, uint16_t port) {
    std::lock_guard<std::mutex> lock(client_mutex_);
    active_ip_ = ip;
    active_port_ = port;
    has_active_client_ = true;
}

// Sends a payload to an ip and port
bool HostLink::sendTo(const std::string& ip, uint16_t port, const std::string& payload) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

    std::lock_guard<std::mutex> lock(sock_mutex_);
    if (sock_ == kInvalidSocket) return false;

#ifdef _WIN32
    int n = ::sendto(sock_, payload.data(), (int)payload.size(), 0,
                     reinterpret_cast<sockaddr*>(&addr), (int)sizeof(addr));
    return n == (int)payload.size();
#else
    ssize_t n = ::sendto(sock_, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == (ssize_t)payload.size();
#endif
}

// Sends a payload to the client whose request is being served
bool HostLink::sendToActive(const std::string& payload) {
    std::string ip;
    uint16_t port = 0;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        if (!has_active_client_) return false;
        ip = active_ip_;
        port = active_port_;
    }
    return sendTo(ip, port, payload);
}

bool HostLink::emit(const EventPayload& payload) {
    return sendToActive(toJson(payload));
}

// Receive loop; one datagram is one request
void HostLink::run() {
    socket_t sock = kInvalidSocket;
    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        sock = sock_;
    }

    while (running_.load()) {
        char buff[4096];
        sockaddr_in src{};
#ifdef _WIN32
        int slen = sizeof(src);
        const int n = ::recvfrom(sock, buff, (int)sizeof(buff) - 1, 0,
                                reinterpret_cast<sockaddr*>(&src), &slen);
#else
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(sock, buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
#endif

        if (n <= 0) break;
        buff[n] = '\0';

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));
        std::string senderIp = ok ? std::string(ipstr) : std::string("127.0.0.1");
        uint16_t senderPort = ntohs(src.sin_port);

        try {
            if (callback_) callback_(std::string(buff, static_cast<size_t>(n)), senderIp, senderPort);
        } catch (const std::exception& e) {
            std::cerr << "[HostLink] [ERROR] request handler threw: " << e.what() << "\n";
        }
    }
}
