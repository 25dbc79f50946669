#pragma once

#include <string>

namespace roofwatch {

// Answers Alpaca discovery broadcasts ("alpacadiscovery1") with the HTTP
// port of this server.
class DiscoveryResponder {
public:
    DiscoveryResponder();
    ~DiscoveryResponder();

    DiscoveryResponder(const DiscoveryResponder&) = delete;
    DiscoveryResponder& operator=(const DiscoveryResponder&) = delete;

    // Port 0 binds an ephemeral port. Returns false if the socket cannot be
    // bound; the HTTP server keeps working without discovery.
    bool start(int discovery_port, int alpaca_port);
    void stop();

    // Actual bound port, 0 when not running.
    int port() const;

private:
    struct Impl;
    Impl* d_;
};

std::string discovery_reply(int alpaca_port);

}  // namespace roofwatch
