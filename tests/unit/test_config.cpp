#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"

using namespace Sonar::Core;

TEST(ConfigTest, Defaults) {
    char* argv[] = {(char*)"sonar"};
    auto  config = Config::parse(1, argv);
    EXPECT_EQ(config.bind_ip, "127.0.0.1");
    EXPECT_EQ(config.port, 3000);
    EXPECT_EQ(config.timeout_ms, 3000);
    EXPECT_EQ(config.concurrency, 25);
    EXPECT_EQ(config.max_results, 500u);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_FALSE(config.one_shot());
}

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"sonar",
                    (char*)"https://sub.example.com/list",
                    (char*)"--port",
                    (char*)"8080",
                    (char*)"--timeout",
                    (char*)"1500",
                    (char*)"--concurrency",
                    (char*)"40",
                    (char*)"--io-threads",
                    (char*)"3",
                    (char*)"--pretty"};
    auto  config = Config::parse(11, argv);
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.timeout_ms, 1500);
    EXPECT_EQ(config.concurrency, 40);
    EXPECT_EQ(config.io_threads, 3);
    EXPECT_TRUE(config.pretty);
    ASSERT_EQ(config.sources.size(), 1u);
    EXPECT_EQ(config.sources[0], "https://sub.example.com/list");
    EXPECT_TRUE(config.one_shot());
}

TEST(ConfigTest, ClampsOutOfRangeValues) {
    char* argv[] = {
        (char*)"sonar", (char*)"--timeout", (char*)"999999", (char*)"--concurrency=-5"};
    auto config = Config::parse(4, argv);
    EXPECT_EQ(config.timeout_ms, 10000);
    EXPECT_EQ(config.concurrency, 1);
}

TEST(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        bind_ip: "0.0.0.0"
        port: 9000
        scan_threads: 8
        timeout_ms: 2000
        concurrency: 50
        max_results: 100
        log_level: warn
        sources:
          - "https://a.example/sub"
          - "https://b.example/sub"
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"sonar", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);

    EXPECT_EQ(config.bind_ip, "0.0.0.0");
    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.scan_threads, 8);
    EXPECT_EQ(config.timeout_ms, 2000);
    EXPECT_EQ(config.concurrency, 50);
    EXPECT_EQ(config.max_results, 100u);
    EXPECT_EQ(config.log_level, "warn");
    EXPECT_EQ(config.sources.size(), 2u);

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::string   yaml_content = "port: 9000\nconcurrency: 50";
    std::ofstream ofs("test_ovr.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {
        (char*)"sonar", (char*)"--config", (char*)"test_ovr.yaml", (char*)"--port", (char*)"9100"};
    auto config = Config::parse(5, argv);

    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.concurrency, 50);

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, InvalidYaml) {
    std::ofstream ofs("invalid.yaml");
    ofs << "port: [not an integer]";
    ofs.close();

    const char* argv[] = {"sonar", "--config", "invalid.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
    std::remove("invalid.yaml");
}

TEST(ConfigTest, NonExistentFile) {
    const char* argv[] = {"sonar", "--config", "does_not_exist.yaml"};
    EXPECT_THROW(Config::parse(3, (char**)argv), std::runtime_error);
}

TEST(ConfigTest, EmptyConfig) {
    std::ofstream ofs("empty.yaml");
    ofs << "";
    ofs.close();

    char* argv[] = {(char*)"sonar", (char*)"--config", (char*)"empty.yaml"};
    auto  config = Config::parse(3, argv);
    EXPECT_EQ(config.port, 3000);

    std::remove("empty.yaml");
}
