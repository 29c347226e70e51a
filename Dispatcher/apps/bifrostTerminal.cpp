#include "Config.hpp"
#include "GcodeCommandBuilder.hpp"
#include "Logger.hpp"
#include "ResponseClassifier.hpp"
#include "SerialDispatcher.hpp"
#include "SerialPortLink.hpp"
#include "StopSignals.hpp"
#include "YamlExtensions.hpp"
#include "argparse/argparse.hpp"

#include <atomic>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <magic_enum/magic_enum.hpp>
#include <sstream>
#include <string>

std::atomic<bool> running{true};

using namespace utl;
namespace fs = std::filesystem;

namespace {
struct TerminalSettings {
  EMoveType moveType{EMoveType::Linear};
  std::optional<double> feedRate;
  GcodeCommandBuilder::GripperRange gripper;
};

TerminalSettings readTerminalSettings() {
  TerminalSettings settings;
  const auto section =
      Config::instance().getOptionalSection("SerialDispatcher", "terminal");
  if (const auto moveType = section["moveType"]) {
    settings.moveType = moveType.as<EMoveType>();
  }
  if (const auto feedRate = section["feedRate"]) {
    settings.feedRate = feedRate.as<double>();
  }
  if (const auto gripper = section["gripper"]) {
    if (const auto closed = gripper["pwmClosed"]) {
      settings.gripper.closedPwm = closed.as<double>();
    }
    if (const auto open = gripper["pwmOpen"]) {
      settings.gripper.openPwm = open.as<double>();
    }
  }
  return settings;
}

// "X10 Y-2.5" -> {{'X', 10}, {'Y', -2.5}}
GcodeCommandBuilder::AxisValues parseAxes(const std::string& text) {
  GcodeCommandBuilder::AxisValues axes;
  std::istringstream iss(text);
  std::string token;
  while (iss >> token) {
    double value = 0.0;
    const auto* first = token.data() + 1;
    const auto* last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (token.size() < 2 || ec != std::errc() || ptr != last) {
      throw std::invalid_argument(
          fmt::format("Cannot parse axis target '{}'", token));
    }
    axes.emplace_back(token.front(), value);
  }
  return axes;
}

double parseNumber(const std::string& text) {
  const auto first = text.find_first_not_of(' ');
  const auto last = text.find_last_not_of(' ');
  if (first == std::string::npos) {
    throw std::invalid_argument("Missing numeric argument");
  }
  double value = 0.0;
  const auto* begin = text.data() + first;
  const auto* end = text.data() + last + 1;
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    throw std::invalid_argument(
        fmt::format("Cannot parse number '{}'", std::string(begin, end)));
  }
  return value;
}

void logResponse(const std::string& line) {
  const auto type = ResponseClassifier::classify(line);
  switch (type) {
    case EResponseType::Position: {
      std::string summary;
      const auto positions = ResponseClassifier::parsePosition(line);
      for (const auto& [axis, value] : *positions) {
        summary += fmt::format(" {}={}", axis, value);
      }
      SPDLOG_INFO("[Position]{}", summary);
      break;
    }
    case EResponseType::Endstop: {
      std::string summary;
      const auto endstops = ResponseClassifier::parseEndstops(line);
      for (const auto& [name, triggered] : *endstops) {
        summary += fmt::format(" {}={}", name, triggered ? "TRIGGERED" : "open");
      }
      SPDLOG_INFO("[Endstop]{}", summary);
      break;
    }
    case EResponseType::Error:
      SPDLOG_WARN("[Error] {}", line);
      break;
    default:
      SPDLOG_INFO("[{}] {}", magic_enum::enum_name(type), line);
      break;
  }
}

// Translates one stdin line into a queued command. Returns false on ':quit'.
bool handleInput(SerialDispatcher& dispatcher, const TerminalSettings& settings,
                 std::string line) {
  if (line.empty()) {
    return true;
  }
  if (line == ":quit") {
    return false;
  }

  bool priority = false;
  if (line.front() == '!') {
    priority = true;
    line.erase(0, 1);
  }

  if (line.rfind(":home", 0) == 0) {
    line = GcodeCommandBuilder::home(line.substr(5));
  } else if (line == ":pos") {
    dispatcher.requestStatusUpdate();
    return true;
  } else if (line == ":estop") {
    line = GcodeCommandBuilder::emergencyStop();
    priority = true;
  } else if (line == ":pause") {
    line = GcodeCommandBuilder::quickStop();
    priority = true;
  } else if (line == ":reset") {
    line = GcodeCommandBuilder::resetAlarm();
    priority = true;
  } else if (line == ":zero") {
    line = GcodeCommandBuilder::zeroPosition();
  } else if (line.rfind(":gripper", 0) == 0) {
    line = GcodeCommandBuilder::gripper(parseNumber(line.substr(8)),
                                        settings.gripper);
  } else if (line.rfind(":move", 0) == 0) {
    line = GcodeCommandBuilder::buildAxisCommand(
        settings.moveType, parseAxes(line.substr(5)), settings.feedRate);
  }
  dispatcher.sendCommand(line, priority);
  return true;
}
}  // namespace

int main(int argc, char** argv) {

  configureLogger();
  try {
    installStopSignalHandlers(running);
  } catch (const std::runtime_error& e) {
    SPDLOG_CRITICAL("{}", e.what());
    std::exit(1);
  }

  argparse::ArgumentParser program("bifrostTerminal");
  program.add_argument("-c", "--config")
      .help("Path to the config file")
      .default_value("/etc/bifrostTerminal.yaml");
  program.add_argument("-p", "--port")
      .help("Serial port, overrides the config file");
  program.add_argument("-b", "--baud")
      .help("Baud rate, overrides the config file")
      .scan<'u', unsigned int>();
  program.add_argument("--list-ports")
      .help("Print the detected serial ports and exit")
      .default_value(false)
      .implicit_value(true);

  try {
    program.parse_args(argc, argv);
  }
  catch (const std::exception& err) {
    SPDLOG_CRITICAL("{}", err.what());
    std::exit(1);
  }

  if (program.get<bool>("--list-ports")) {
    const auto recommended = SerialPortLink::recommendedPort();
    for (const auto& port : SerialPortLink::listPorts()) {
      std::cout << port << (recommended == port ? "  (recommended)" : "") << '\n';
    }
    return 0;
  }

  const auto configPath = program.get<std::string>("-c");

  if (!program.is_used("-c")) {
    SPDLOG_WARN("Config path not provided, using default: {}", configPath);
  }

  if (!fs::exists(configPath)) {
    SPDLOG_CRITICAL("Config file '{}' not found! Exiting.", configPath);
    std::exit(1);
  }

  std::unique_ptr<SerialDispatcher> dispatcher;
  std::string port;
  unsigned int baudRate = 0;
  TerminalSettings settings;
  try {
    auto& cfg = Config::instance();
    cfg.setConfigPath(configPath);
    setLogLevel(cfg.getOptional<spdlog::level::level_enum>(
        "SerialDispatcher", "logLevel", spdlog::level::info));
    settings = readTerminalSettings();

    if (auto cliPort = program.present<std::string>("-p")) {
      port = *cliPort;
    } else if (auto cfgPort =
                   cfg.getOptional<std::string>("SerialDispatcher", "port", "");
               !cfgPort.empty()) {
      port = cfgPort;
    } else if (auto recommended = SerialPortLink::recommendedPort()) {
      SPDLOG_WARN("No port configured, using detected {}", *recommended);
      port = *recommended;
    } else {
      SPDLOG_CRITICAL("No serial port configured and none detected! Exiting.");
      std::exit(1);
    }
    baudRate = program.present<unsigned int>("-b").value_or(
        cfg.getOptional<unsigned int>("SerialDispatcher", "baudRate", 115200));

    dispatcher = SerialDispatcher::fromConfig(SerialDispatcher::Callbacks{
        .onDataReceived = [](const std::string& line) { logResponse(line); },
        .onConnected = []() { SPDLOG_INFO("Link up, type commands (:quit to exit)"); },
        .onDisconnected = []() { SPDLOG_INFO("Link down"); },
        .onError =
            [](const std::string& message) {
              SPDLOG_ERROR("Serial error: {}", message);
            }});
  } catch (const std::exception& e) {
    SPDLOG_CRITICAL("Invalid configuration: {}", e.what());
    std::exit(1);
  }

  try {
    dispatcher->connect(port, baudRate);
  } catch (const ConnectError& e) {
    SPDLOG_CRITICAL("Cannot connect ({}): {}",
                    magic_enum::enum_name(e.reason()), e.what());
    std::exit(1);
  }

  std::string line;
  while (running && std::getline(std::cin, line)) {
    try {
      if (!handleInput(*dispatcher, settings, line)) {
        break;
      }
    } catch (const NotConnectedError& e) {
      SPDLOG_ERROR("{}", e.what());
      break;
    } catch (const std::invalid_argument& e) {
      SPDLOG_WARN("{}", e.what());
    }
  }

  dispatcher->disconnect();
}
