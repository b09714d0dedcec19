#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "httplib.h"
#include "registry/loaders/remote_server_loader.hpp"

namespace scriptbox::test {

using registry::RemoteServerLoader;
using sandbox::ErrorKind;

class RemoteServerLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
            last_request_ = nlohmann::json::parse(req.body, nullptr, false);
            const auto input = last_request_.value("input_data", nlohmann::json::object());
            res.set_content(nlohmann::json({{"sum", input.value("a", 0) + input.value("b", 0)}}).dump(),
                            "application/json");
        });
        server_.Post("/broken", [](const httplib::Request&, httplib::Response& res) {
            res.status = 503;
            res.set_content("maintenance", "text/plain");
        });
        server_.Post("/garbage", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("not json", "text/plain");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    registry::ScriptRegistryEntry Entry(const std::string& path) const {
        return registry::EntryFromJson("remote_sum", {
            {"source_type", "remote_server"},
            {"source_location", "http://127.0.0.1:" + std::to_string(port_) + path},
            {"execution_type", "calculation"}
        });
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    nlohmann::json last_request_;
    RemoteServerLoader loader_{5};
};

TEST_F(RemoteServerLoaderTest, PostsPayloadAndMergesResponse) {
    const auto outcome = loader_.LoadAndRun(Entry("/execute"), {{"a", 2}, {"b", 3}});
    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(outcome.result["sum"], 5);
    EXPECT_EQ(outcome.result["status"], "success");
    EXPECT_EQ(outcome.execution_metadata["remote_server"],
              "http://127.0.0.1:" + std::to_string(port_) + "/execute");

    EXPECT_EQ(last_request_["script_id"], "remote_sum");
    EXPECT_EQ(last_request_["execution_type"], "calculation");
    EXPECT_EQ(last_request_["input_data"]["a"], 2);
}

TEST_F(RemoteServerLoaderTest, NonSuccessStatusIsSourceFetchError) {
    const auto outcome = loader_.LoadAndRun(Entry("/broken"), nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::kSourceFetch);
    EXPECT_EQ(outcome.error, "Remote server error: 503");
    EXPECT_EQ(outcome.result["response_text"], "maintenance");
}

TEST_F(RemoteServerLoaderTest, InvalidJsonIsReported) {
    const auto outcome = loader_.LoadAndRun(Entry("/garbage"), nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, "Remote server returned invalid JSON");
}

TEST_F(RemoteServerLoaderTest, UnreachableServerIsConnectionFailure) {
    auto entry = Entry("/execute");
    entry.source_location = "http://127.0.0.1:1/execute";
    const auto outcome = loader_.LoadAndRun(entry, nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, ErrorKind::kSourceFetch);
    EXPECT_EQ(outcome.error.rfind("Remote server connection failed: ", 0), 0u);
}

TEST_F(RemoteServerLoaderTest, InvalidUrlIsRejectedWithoutRequest) {
    auto entry = Entry("/execute");
    entry.source_location = "http://:0/";
    const auto outcome = loader_.LoadAndRun(entry, nlohmann::json::object());
    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(last_request_.is_null());
}

}  // namespace scriptbox::test
