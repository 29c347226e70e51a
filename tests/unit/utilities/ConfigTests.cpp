#include <gtest/gtest.h>

#include <Config.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace {
std::filesystem::path writeTempConfig(const std::string& content) {
  const auto stamp =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    ("bifrost_config_test_" + std::to_string(stamp) + ".yaml");
  std::ofstream out(path);
  out << content;
  out.close();
  return path;
}
}  // namespace

TEST(ConfigTests, GetRequiredReturnsConfiguredValue) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  Demo:
    value: 42
)yaml");

  utl::Config::instance().setConfigPath(configPath.string());
  EXPECT_EQ(utl::Config::instance().getRequired<int>("Demo", "value"), 42);

  std::filesystem::remove(configPath);
}

TEST(ConfigTests, GetRequiredThrowsOnMissingKey) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  Demo:
    value: 42
)yaml");

  utl::Config::instance().setConfigPath(configPath.string());
  EXPECT_THROW((void)utl::Config::instance().getRequired<int>("Demo", "missing"),
               std::runtime_error);

  std::filesystem::remove(configPath);
}

TEST(ConfigTests, GetOptionalReturnsDefaultWhenMissing) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  Demo:
    value: 42
)yaml");

  utl::Config::instance().setConfigPath(configPath.string());
  EXPECT_EQ(
      utl::Config::instance().getOptional<int>("Demo", "missing_optional", 99),
      99);

  std::filesystem::remove(configPath);
}

TEST(ConfigTests, GetClassConfigThrowsWhenClassesSectionMissing) {
  const auto configPath = writeTempConfig(R"yaml(
foo: bar
)yaml");

  utl::Config::instance().setConfigPath(configPath.string());
  EXPECT_THROW((void)utl::Config::instance().getClassConfig("Demo"),
               std::runtime_error);

  std::filesystem::remove(configPath);
}

TEST(ConfigTests, GetOptionalThrowsOnTypeMismatch) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  Demo:
    value: abc
)yaml");

  utl::Config::instance().setConfigPath(configPath.string());
  EXPECT_THROW((void)utl::Config::instance().getOptional<int>("Demo", "value", 1),
               std::runtime_error);

  std::filesystem::remove(configPath);
}

TEST(ConfigTests, MissingDispatcherSectionThrowsWhenRequested) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  Demo:
    value: 1
)yaml");

  utl::Config::instance().setConfigPath(configPath.string());
  EXPECT_THROW((void)utl::Config::instance().getClassConfig("SerialDispatcher"),
               std::runtime_error);

  std::filesystem::remove(configPath);
}

TEST(ConfigTests, MissingFileThrows) {
  EXPECT_THROW(utl::Config::instance().setConfigPath(
                   "/nonexistent/bifrost_config_missing.yaml"),
               std::runtime_error);
}

TEST(ConfigTests, SerialLinkConfigCanBeRead) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  SerialDispatcher:
    port: /dev/ttyACM0
    baudRate: 250000
    link:
      type: serial
      serial:
        parity: PARITY_NONE
)yaml");

  utl::Config::instance().setConfigPath(configPath.string());
  auto& cfg = utl::Config::instance();
  EXPECT_EQ(cfg.configPath(), configPath.string());
  EXPECT_EQ(cfg.getRequired<std::string>("SerialDispatcher", "port"),
            "/dev/ttyACM0");
  EXPECT_EQ(cfg.getOptional<unsigned int>("SerialDispatcher", "baudRate", 115200),
            250000u);
  const auto link = cfg.getRequired<YAML::Node>("SerialDispatcher", "link");
  EXPECT_EQ(link["type"].as<std::string>(), "serial");
  EXPECT_EQ(link["serial"]["parity"].as<std::string>(), "PARITY_NONE");

  std::filesystem::remove(configPath);
}

TEST(ConfigTests, OptionalSectionDefaultsToEmptyMap) {
  const auto configPath = writeTempConfig(R"yaml(
classes:
  SerialDispatcher:
    port: /dev/ttyACM0
    terminal:
      feedRate: 1500
)yaml");

  utl::Config::instance().setConfigPath(configPath.string());
  const auto missing =
      utl::Config::instance().getOptionalSection("SerialDispatcher", "worker");
  EXPECT_TRUE(missing.IsMap());
  EXPECT_EQ(missing.size(), 0u);

  const auto terminal =
      utl::Config::instance().getOptionalSection("SerialDispatcher", "terminal");
  EXPECT_DOUBLE_EQ(terminal["feedRate"].as<double>(), 1500.0);

  EXPECT_THROW((void)utl::Config::instance().getOptionalSection(
                   "SerialDispatcher", "port"),
               std::runtime_error);

  std::filesystem::remove(configPath);
}
