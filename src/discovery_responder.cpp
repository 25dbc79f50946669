#include "roofwatch/discovery_responder.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <thread>

#include "roofwatch/log.hpp"

namespace roofwatch {

namespace {
constexpr char kDiscoveryMessage[] = "alpacadiscovery1";
}

std::string discovery_reply(int alpaca_port) {
    return "{\"AlpacaPort\":" + std::to_string(alpaca_port) + "}";
}

struct DiscoveryResponder::Impl {
    std::atomic<bool> running{false};
    std::thread th;
    int fd{-1};
    int bound_port{0};

    void loop(int alpaca_port) {
        const std::string reply = discovery_reply(alpaca_port);
        char buf[1024];
        while (running.load()) {
            sockaddr_in from{};
            socklen_t from_len = sizeof(from);
            ssize_t n = ::recvfrom(fd, buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &from_len);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                if (running.load()) log_error(std::string("Discovery receive failed: ") + std::strerror(errno));
                break;
            }
            const size_t prefix = sizeof(kDiscoveryMessage) - 1;
            if (static_cast<size_t>(n) < prefix || std::memcmp(buf, kDiscoveryMessage, prefix) != 0) continue;

            char addr[INET_ADDRSTRLEN] = {0};
            ::inet_ntop(AF_INET, &from.sin_addr, addr, sizeof(addr));
            log_debug(std::string("Discovery request from ") + addr);
            if (::sendto(fd, reply.data(), reply.size(), 0, reinterpret_cast<sockaddr*>(&from), from_len) < 0) {
                log_warn(std::string("Discovery reply failed: ") + std::strerror(errno));
            }
        }
    }
};

DiscoveryResponder::DiscoveryResponder() : d_(new Impl) {}

DiscoveryResponder::~DiscoveryResponder() {
    stop();
    delete d_;
}

bool DiscoveryResponder::start(int discovery_port, int alpaca_port) {
    if (d_->running.load()) return true;

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        log_warn(std::string("Could not create discovery socket: ") + std::strerror(errno));
        return false;
    }
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    // Short receive timeout so stop() is noticed.
    timeval tv{};
    tv.tv_usec = 200 * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(discovery_port));
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_warn("Could not bind discovery port " + std::to_string(discovery_port) + ": " + std::strerror(errno));
        ::close(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        d_->bound_port = ntohs(bound.sin_port);
    }

    d_->fd = fd;
    d_->running = true;
    d_->th = std::thread([this, alpaca_port] { d_->loop(alpaca_port); });
    log_info("Alpaca discovery responder on UDP port " + std::to_string(d_->bound_port));
    return true;
}

void DiscoveryResponder::stop() {
    if (!d_->running.exchange(false)) return;
    if (d_->th.joinable()) d_->th.join();
    ::close(d_->fd);
    d_->fd = -1;
    d_->bound_port = 0;
}

int DiscoveryResponder::port() const {
    return d_->bound_port;
}

}  // namespace roofwatch
