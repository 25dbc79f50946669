#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <thread>
#include <vector>

#include "httplib.h"

#include "roofwatch/alpaca_device.hpp"
#include "roofwatch/alpaca_protocol.hpp"
#include "roofwatch/classifier.hpp"

using namespace roofwatch;
using namespace std::chrono_literals;

namespace {

bool contains(const std::string& body, const std::string& part) {
    return body.find(part) != std::string::npos;
}

std::uint64_t server_transaction(const std::string& body) {
    const std::string key = "\"ServerTransactionID\":";
    auto pos = body.find(key);
    if (pos == std::string::npos) return 0;
    return std::stoull(body.substr(pos + key.size()));
}

}  // namespace

class AlpacaDeviceTest : public ::testing::Test {
protected:
    void SetUp() override { start(RoofLabel::OPEN); }

    void TearDown() override { shutdown(); }

    void start(RoofLabel safe_label, std::optional<SunGuard> sun_guard = std::nullopt) {
        DeviceInfo info;
        info.device_number = 0;
        info.unique_id = "4a1e9c3b-0000-4000-8000-000000000001";
        device_ = std::make_unique<SafetyMonitorDevice>(info, store_, safe_label);
        device_->set_sun_guard(sun_guard);
        server_ = std::make_unique<httplib::Server>();
        device_->register_routes(*server_);
        port_ = server_->bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this] { server_->listen_after_bind(); });
        for (int i = 0; i < 500 && !server_->is_running(); ++i) std::this_thread::sleep_for(2ms);
        ASSERT_TRUE(server_->is_running());
    }

    void shutdown() {
        if (server_) server_->stop();
        if (thread_.joinable()) thread_.join();
        server_.reset();
        device_.reset();
    }

    void publish(RoofLabel label) {
        store_.update(make_result(Frame("frame.png", {}), label == RoofLabel::OPEN ? 0.9 : 0.1, 0.5));
    }

    httplib::Result get(const std::string& path) {
        httplib::Client cli("127.0.0.1", port_);
        return cli.Get(path.c_str());
    }

    httplib::Result put(const std::string& path, const httplib::Params& params) {
        httplib::Client cli("127.0.0.1", port_);
        return cli.Put(path.c_str(), params);
    }

    void connect() {
        auto res = put("/api/v1/safetymonitor/0/connected", {{"Connected", "True"}});
        ASSERT_TRUE(res);
        ASSERT_EQ(res->status, 200);
    }

    StatusStore store_;
    std::unique_ptr<SafetyMonitorDevice> device_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    int port_{0};
};

TEST_F(AlpacaDeviceTest, ManagementEndpoints) {
    auto res = get("/management/apiversions?ClientTransactionID=9");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(contains(res->body, "\"Value\":[1]"));
    EXPECT_TRUE(contains(res->body, "\"ClientTransactionID\":9"));

    res = get("/management/v1/configureddevices");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"DeviceType\":\"SafetyMonitor\""));
    EXPECT_TRUE(contains(res->body, "\"UniqueID\":\"4a1e9c3b-0000-4000-8000-000000000001\""));

    res = get("/management/v1/description");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"ServerName\""));
}

TEST_F(AlpacaDeviceTest, NotConnectedIsUnsafe) {
    publish(RoofLabel::OPEN);
    auto res = get("/api/v1/safetymonitor/0/issafe");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(contains(res->body, "\"Value\":false"));
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":0"));
}

TEST_F(AlpacaDeviceTest, UnknownStatusIsUnsafe) {
    connect();
    auto res = get("/api/v1/safetymonitor/0/issafe");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":false"));
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":1279"));
}

TEST_F(AlpacaDeviceTest, IsSafeFollowsRoof) {
    connect();
    publish(RoofLabel::OPEN);
    auto res = get("/api/v1/safetymonitor/0/issafe?ClientTransactionID=77");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":true"));
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":0"));
    EXPECT_TRUE(contains(res->body, "\"ClientTransactionID\":77"));

    publish(RoofLabel::CLOSED);
    res = get("/api/v1/safetymonitor/0/IsSafe");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":false"));
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":0"));
}

TEST_F(AlpacaDeviceTest, SafeWhenClosed) {
    shutdown();
    start(RoofLabel::CLOSED);
    connect();
    publish(RoofLabel::CLOSED);
    auto res = get("/api/v1/safetymonitor/0/issafe");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":true"));
}

TEST_F(AlpacaDeviceTest, ConnectedRoundTrip) {
    auto res = get("/api/v1/safetymonitor/0/connected");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":false"));

    connect();
    EXPECT_TRUE(device_->connected());
    res = get("/api/v1/safetymonitor/0/connected");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":true"));

    res = put("/api/v1/safetymonitor/0/connected", {{"connected", "false"}, {"ClientTransactionID", "5"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_FALSE(contains(res->body, "\"Value\""));
    EXPECT_TRUE(contains(res->body, "\"ClientTransactionID\":5"));
    EXPECT_FALSE(device_->connected());
}

TEST_F(AlpacaDeviceTest, BadConnectedValueIsRejected) {
    auto res = put("/api/v1/safetymonitor/0/connected", {{"Connected", "maybe"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = put("/api/v1/safetymonitor/0/connected", {});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_FALSE(device_->connected());
}

TEST_F(AlpacaDeviceTest, InvalidTransactionIdEchoesZero) {
    auto res = get("/api/v1/safetymonitor/0/name?ClientTransactionID=abc");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(contains(res->body, "\"ClientTransactionID\":0"));
}

TEST_F(AlpacaDeviceTest, ServerTransactionIdIncreases) {
    auto first = get("/api/v1/safetymonitor/0/name");
    auto second = get("/api/v1/safetymonitor/0/driverversion");
    auto third = get("/management/apiversions");
    ASSERT_TRUE(first && second && third);
    EXPECT_LT(server_transaction(first->body), server_transaction(second->body));
    EXPECT_LT(server_transaction(second->body), server_transaction(third->body));
}

TEST_F(AlpacaDeviceTest, CommonProperties) {
    auto res = get("/api/v1/safetymonitor/0/interfaceversion");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":1,"));

    res = get("/api/v1/safetymonitor/0/supportedactions");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":[]"));

    res = get("/api/v1/safetymonitor/0/description");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":0"));
}

TEST_F(AlpacaDeviceTest, UnsupportedActionsAndCommands) {
    auto res = put("/api/v1/safetymonitor/0/action", {{"Action", "OpenRoof"}, {"Parameters", ""}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":1036"));

    res = put("/api/v1/safetymonitor/0/commandblind", {{"Command", "x"}, {"Raw", "false"}});
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":1024"));
}

TEST_F(AlpacaDeviceTest, LastUpdateNeedsAStatus) {
    auto res = get("/api/v1/safetymonitor/0/lastupdate");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":1026"));

    publish(RoofLabel::OPEN);
    res = get("/api/v1/safetymonitor/0/lastupdate");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":0"));
    EXPECT_TRUE(contains(res->body, "Z\""));
}

TEST_F(AlpacaDeviceTest, StatusReport) {
    connect();
    publish(RoofLabel::OPEN);
    publish(RoofLabel::OPEN);
    auto res = get("/api/v1/safetymonitor/0/status");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"RoofStatus\":\"OPEN\""));
    EXPECT_TRUE(contains(res->body, "\"IsSafe\":true"));
    EXPECT_TRUE(contains(res->body, "\"ConsecutivePolls\":2"));
    EXPECT_TRUE(contains(res->body, "\"Trend\":[\"OPEN\",\"OPEN\"]"));
    EXPECT_TRUE(contains(res->body, "\"Confidence\":0.900"));
}

TEST_F(AlpacaDeviceTest, UnknownEndpoints) {
    auto res = get("/api/v1/safetymonitor/3/issafe");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = get("/api/v1/safetymonitor/0/bogus");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = get("/api/v1/camera/0/connected");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = put("/api/v1/safetymonitor/0/issafe", {});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    res = get("/nothing/here");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(AlpacaDeviceTest, SetupPage) {
    auto res = get("/setup/v1/safetymonitor/0/setup");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_TRUE(contains(res->body, "<html>"));
}

TEST_F(AlpacaDeviceTest, StatusReportWithoutSunGuard) {
    connect();
    publish(RoofLabel::OPEN);
    auto res = get("/api/v1/safetymonitor/0/status");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"SunAngle\":null"));
    EXPECT_TRUE(contains(res->body, "\"SunOverride\":false"));
    EXPECT_TRUE(contains(res->body, "\"SecondaryStatus\":\"UNKNOWN\""));
}

TEST_F(AlpacaDeviceTest, SunGuardMakesOpenRoofUnsafe) {
    shutdown();
    start(RoofLabel::OPEN, SunGuard(SunGuardOptions{40.0, -74.0, -90.0}));
    connect();
    publish(RoofLabel::OPEN);

    auto res = get("/api/v1/safetymonitor/0/issafe");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"Value\":false"));
    EXPECT_TRUE(contains(res->body, "\"ErrorNumber\":0"));

    res = get("/api/v1/safetymonitor/0/status");
    ASSERT_TRUE(res);
    EXPECT_TRUE(contains(res->body, "\"RoofStatus\":\"OPEN\""));
    EXPECT_TRUE(contains(res->body, "\"IsSafe\":false"));
    EXPECT_FALSE(contains(res->body, "\"SunAngle\":null"));
}

TEST_F(AlpacaDeviceTest, ConcurrentReadersDuringUpdates) {
    connect();
    publish(RoofLabel::OPEN);
    std::atomic<bool> done{false};
    std::thread writer([&] {
        bool open = false;
        while (!done) {
            // Distinct confidences so a record mixing two updates shows up.
            store_.update(make_result(Frame("frame.png", {}), open ? 0.9 : 0.2, 0.5));
            open = !open;
            std::this_thread::sleep_for(1ms);
        }
    });

    std::atomic<int> bad{0};
    std::atomic<int> seen_open{0};
    std::atomic<int> seen_closed{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            httplib::Client cli("127.0.0.1", port_);
            for (int i = 0; i < 20; ++i) {
                auto res = cli.Get("/api/v1/safetymonitor/0/issafe");
                if (!res || res->status != 200 || !contains(res->body, "\"ErrorNumber\":0")) {
                    bad++;
                } else if (contains(res->body, "\"Value\":true")) {
                    seen_open++;
                } else if (contains(res->body, "\"Value\":false")) {
                    seen_closed++;
                } else {
                    bad++;
                }

                res = cli.Get("/api/v1/safetymonitor/0/status");
                if (!res || res->status != 200) {
                    bad++;
                    continue;
                }
                const bool open_view = contains(res->body, "\"RoofStatus\":\"OPEN\"") &&
                                       contains(res->body, "\"IsSafe\":true") &&
                                       contains(res->body, "\"Confidence\":0.900") &&
                                       contains(res->body, "\"OPEN\"]");
                const bool closed_view = contains(res->body, "\"RoofStatus\":\"CLOSED\"") &&
                                         contains(res->body, "\"IsSafe\":false") &&
                                         contains(res->body, "\"Confidence\":0.800") &&
                                         contains(res->body, "\"CLOSED\"]");
                if (open_view == closed_view) bad++;
            }
        });
    }
    for (auto& t : readers) t.join();
    done = true;
    writer.join();
    EXPECT_EQ(bad, 0);
    EXPECT_EQ(seen_open + seen_closed, 80);
}
