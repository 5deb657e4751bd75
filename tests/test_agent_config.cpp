#include "hubagent/util/agent_config.hpp"
#include "hubagent/util/proxy.hpp"
#include "testing.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

namespace hubagent {
namespace {

class AgentConfigTest : public ::testing::Test {
  protected:
    std::string Write(const std::string& json) {
        const std::string path = tmp.Path() + "/agent.json";
        testutil::WriteFile(path, json);
        return path;
    }

    testutil::TemporaryDirectory tmp;
};

TEST_F(AgentConfigTest, MinimalConfigUsesDefaults) {
    AgentConfig cfg;
    auto res = AgentConfig::LoadFromFile(Write(R"({"server":"hub.example.com"})"), cfg);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(cfg.server, "hub.example.com");
    EXPECT_EQ(cfg.port, "443");
    EXPECT_FALSE(cfg.auto_update);
    EXPECT_EQ(cfg.run_interval_seconds, 300u);
    EXPECT_EQ(cfg.update_public_key, kDefaultUpdatePublicKey);
    EXPECT_TRUE(cfg.proxy.server.empty());
}

TEST_F(AgentConfigTest, FullConfig) {
    AgentConfig cfg;
    auto res = AgentConfig::LoadFromFile(Write(R"({
        "server": "hub.example.com",
        "port": 8443,
        "ca_cert": "/etc/hub-agent/ca.pem",
        "client_cert": "/etc/hub-agent/cert.pem",
        "client_key": "/etc/hub-agent/key.pem",
        "http_proxy_server": "proxy.lan",
        "http_proxy_port": "3128",
        "http_proxy_user": "alice",
        "http_proxy_pass": "secret",
        "auto_update": true,
        "run_interval_seconds": 60,
        "log_level": "debug"
    })"), cfg);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(cfg.port, "8443");
    EXPECT_EQ(cfg.ca_cert, "/etc/hub-agent/ca.pem");
    EXPECT_EQ(cfg.client_key, "/etc/hub-agent/key.pem");
    EXPECT_EQ(cfg.proxy.user, "alice");
    EXPECT_TRUE(cfg.auto_update);
    EXPECT_EQ(cfg.run_interval_seconds, 60u);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST_F(AgentConfigTest, RunIntervalIsBoundedByOneDay) {
    AgentConfig cfg;
    auto at_cap = AgentConfig::LoadFromFile(Write(R"({"server":"h","run_interval_seconds":86400})"), cfg);
    ASSERT_TRUE(at_cap.is_ok()) << at_cap.msg;
    EXPECT_EQ(cfg.run_interval_seconds, kMaxRunIntervalSeconds);

    auto above = AgentConfig::LoadFromFile(Write(R"({"server":"h","run_interval_seconds":86401})"), cfg);
    ASSERT_FALSE(above.is_ok());
    EXPECT_NE(above.msg.find("run_interval_seconds"), std::string::npos);
}

TEST_F(AgentConfigTest, MissingServerFails) {
    AgentConfig cfg;
    auto res = AgentConfig::LoadFromFile(Write(R"({"port":"443"})"), cfg);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("server"), std::string::npos);
}

TEST_F(AgentConfigTest, RejectsInvalidValues) {
    AgentConfig cfg;
    EXPECT_FALSE(AgentConfig::LoadFromFile(Write(R"({"server":"h","run_interval_seconds":0})"), cfg).is_ok());
    EXPECT_FALSE(AgentConfig::LoadFromFile(Write(R"({"server":"h","run_interval_seconds":-5})"), cfg).is_ok());
    EXPECT_FALSE(AgentConfig::LoadFromFile(Write(R"({"server":"h","run_interval_seconds":10000000000000000})"), cfg).is_ok());
    EXPECT_FALSE(AgentConfig::LoadFromFile(Write(R"({"server":"h","auto_update":"yes"})"), cfg).is_ok());
    EXPECT_FALSE(AgentConfig::LoadFromFile(Write(R"({"server":"h","client_cert":"/c.pem"})"), cfg).is_ok());
    EXPECT_FALSE(AgentConfig::LoadFromFile(Write(R"({"server":"h","log_level":"loud"})"), cfg).is_ok());
    EXPECT_FALSE(AgentConfig::LoadFromFile(Write(R"(["server"])"), cfg).is_ok());
    EXPECT_FALSE(AgentConfig::LoadFromFile(Write("{not json"), cfg).is_ok());
    EXPECT_FALSE(AgentConfig::LoadFromFile(tmp.Path() + "/absent.json", cfg).is_ok());
}

class ProxyTest : public ::testing::Test {
  protected:
    void SetUp() override {
        if (const char* v = std::getenv("HTTP_PROXY")) saved_ = v;
        ::unsetenv("HTTP_PROXY");
    }
    void TearDown() override {
        if (saved_.empty()) ::unsetenv("HTTP_PROXY");
        else ::setenv("HTTP_PROXY", saved_.c_str(), 1);
    }

    std::string saved_;
};

TEST_F(ProxyTest, UrlFormats) {
    EXPECT_EQ(ProxyUrl({.server = "proxy.lan", .port = "3128"}), "http://proxy.lan:3128");
    EXPECT_EQ(ProxyUrl({.server = "proxy.lan", .port = "3128", .user = "u", .password = "p"}),
              "http://u:p@proxy.lan:3128");
}

TEST_F(ProxyTest, SetsHttpProxyWhenUnset) {
    auto res = UseProxy({.server = "proxy.lan", .port = "3128"});
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_NE(std::getenv("HTTP_PROXY"), nullptr);
    EXPECT_STREQ(std::getenv("HTTP_PROXY"), "http://proxy.lan:3128");
}

TEST_F(ProxyTest, NeverOverridesExistingHttpProxy) {
    ::setenv("HTTP_PROXY", "http://operator:8080", 1);
    auto res = UseProxy({.server = "proxy.lan", .port = "3128"});
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_STREQ(std::getenv("HTTP_PROXY"), "http://operator:8080");
}

TEST_F(ProxyTest, NoServerLeavesEnvironmentAlone) {
    auto res = UseProxy({});
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(std::getenv("HTTP_PROXY"), nullptr);
}

} // namespace
} // namespace hubagent
