#include <gtest/gtest.h>

#include <SerialErrors.hpp>
#include <SerialWorker.hpp>

#include <FakeClock.hpp>
#include <FakeSerialLink.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {
bool waitFor(const std::function<bool()>& predicate, const int timeoutMs = 1000) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

cmd::Command makeCommand(std::string payload, const bool priority = false) {
  return cmd::Command{.payload = std::move(payload), .priority = priority};
}

class SerialWorkerTests : public ::testing::Test {
 protected:
  void SetUp() override { link.open("COM3", 115200); }

  FakeSerialLink link;
  cmd::CommandQueue queue;
  FakeClock clock;
  SerialWorker::Options options;
};
}  // namespace

TEST_F(SerialWorkerTests, WritesQueuedCommandsInLaneOrder) {
  SerialWorker worker(link, queue, clock, options);
  queue.push(makeCommand("G1 X1"));
  queue.push(makeCommand("M114", true));

  EXPECT_TRUE(worker.runOnce());
  EXPECT_TRUE(worker.runOnce());
  EXPECT_FALSE(worker.runOnce());

  EXPECT_EQ(link.writtenLines(), (std::vector<std::string>{"M114", "G1 X1"}));
}

TEST_F(SerialWorkerTests, BlockingCommandHoldsNormalLaneUntilAcknowledged) {
  SerialWorker worker(link, queue, clock, options);
  queue.push(makeCommand("G28"));
  queue.push(makeCommand("G1 X5"));

  worker.runOnce();
  EXPECT_TRUE(worker.awaitingAcknowledgement());
  worker.runOnce();
  EXPECT_EQ(link.writtenLines(), (std::vector<std::string>{"G28"}));

  clock.advanceBy(300ms);
  link.feed("ok\n");
  worker.runOnce();
  EXPECT_FALSE(worker.awaitingAcknowledgement());

  worker.runOnce();
  EXPECT_EQ(link.writtenLines(), (std::vector<std::string>{"G28", "G1 X5"}));
}

TEST_F(SerialWorkerTests, PriorityCommandsPassWhileAwaitingAcknowledgement) {
  SerialWorker worker(link, queue, clock, options);
  queue.push(makeCommand("G28"));
  queue.push(makeCommand("G1 X5"));
  worker.runOnce();

  queue.push(makeCommand("M112", true));
  worker.runOnce();

  EXPECT_EQ(link.writtenLines(), (std::vector<std::string>{"G28", "M112"}));
  EXPECT_TRUE(worker.awaitingAcknowledgement());
  EXPECT_EQ(queue.normal_size(), 1u);
}

TEST_F(SerialWorkerTests, AcknowledgementBeforeMinimumPauseIsIgnored) {
  SerialWorker worker(link, queue, clock, options);
  queue.push(makeCommand("G28"));
  worker.runOnce();

  clock.advanceBy(100ms);
  link.feed("ok\n");
  worker.runOnce();
  EXPECT_TRUE(worker.awaitingAcknowledgement());

  clock.advanceBy(200ms);
  link.feed("ok\n");
  worker.runOnce();
  EXPECT_FALSE(worker.awaitingAcknowledgement());
}

TEST_F(SerialWorkerTests, MaximumPauseReleasesNormalLane) {
  SerialWorker worker(link, queue, clock, options);
  queue.push(makeCommand("G29"));
  worker.runOnce();
  ASSERT_TRUE(worker.awaitingAcknowledgement());

  clock.advanceBy(options.blockingMaxPause + 1ms);
  worker.runOnce();
  EXPECT_FALSE(worker.awaitingAcknowledgement());
}

TEST_F(SerialWorkerTests, BlockingPrefixMatchesWholeCommandWord) {
  SerialWorker worker(link, queue, clock, options);

  queue.push(makeCommand("G280"));
  worker.runOnce();
  EXPECT_FALSE(worker.awaitingAcknowledgement());

  queue.push(makeCommand("g28 x y"));
  worker.runOnce();
  EXPECT_TRUE(worker.awaitingAcknowledgement());
}

TEST_F(SerialWorkerTests, StatusPollingEnqueuesPriorityRequests) {
  options.statusRequestInterval = 1000ms;
  options.endstopRequestInterval = 2000ms;
  SerialWorker worker(link, queue, clock, options);

  worker.runOnce();
  EXPECT_TRUE(queue.empty());

  clock.advanceBy(1000ms);
  worker.runOnce();
  ASSERT_EQ(queue.priority_size(), 1u);
  worker.runOnce();
  EXPECT_EQ(link.writtenLines(), (std::vector<std::string>{"M114"}));

  clock.advanceBy(1000ms);
  worker.runOnce();
  EXPECT_EQ(queue.priority_size(), 2u);
}

TEST_F(SerialWorkerTests, StatusPollingPausesWhileAwaitingAndResumesImmediately) {
  options.statusRequestInterval = 1000ms;
  SerialWorker worker(link, queue, clock, options);
  worker.runOnce();

  queue.push(makeCommand("G28"));
  worker.runOnce();
  ASSERT_TRUE(worker.awaitingAcknowledgement());

  clock.advanceBy(5000ms);
  worker.runOnce();
  EXPECT_TRUE(queue.empty());

  link.feed("ok\n");
  worker.runOnce();
  EXPECT_FALSE(worker.awaitingAcknowledgement());
  ASSERT_EQ(queue.priority_size(), 1u);
  EXPECT_EQ(queue.pop_priority()->payload, "M114");
}

TEST_F(SerialWorkerTests, ReadFailureThrowsIoError) {
  SerialWorker worker(link, queue, clock, options);
  link.unplug();
  EXPECT_THROW(worker.runOnce(), IoError);
}

TEST_F(SerialWorkerTests, ThreadDeliversLinesAndStopsOnRequest) {
  SerialWorker worker(link, queue, clock, options);
  std::atomic<int> started{0};
  std::atomic<int> stopped{0};
  std::atomic<int> failures{0};
  std::atomic<bool> currentMatched{false};
  std::mutex linesMutex;
  std::vector<std::string> lines;

  worker.start(SerialWorker::Listener{
      .onStarted =
          [&]() {
            currentMatched = SerialWorker::current() == &worker;
            ++started;
          },
      .onLine =
          [&](const std::string& line) {
            std::lock_guard<std::mutex> lock(linesMutex);
            lines.push_back(line);
          },
      .onFailure = [&](const std::string&) { ++failures; },
      .onStopped = [&]() { ++stopped; }});

  link.feed("start\nok\n");
  ASSERT_TRUE(waitFor([&]() {
    std::lock_guard<std::mutex> lock(linesMutex);
    return lines.size() == 2;
  }));

  worker.requestStop();
  EXPECT_TRUE(worker.waitForExit(1s));
  worker.join();

  EXPECT_EQ(started.load(), 1);
  EXPECT_TRUE(currentMatched.load());
  EXPECT_EQ(stopped.load(), 1);
  EXPECT_EQ(failures.load(), 0);
  EXPECT_FALSE(link.isOpen());
  EXPECT_EQ(SerialWorker::current(), nullptr);
}

TEST_F(SerialWorkerTests, ThreadReportsLinkFailureExactlyOnce) {
  SerialWorker worker(link, queue, clock, options);
  std::atomic<int> stopped{0};
  std::atomic<int> failures{0};

  worker.start(SerialWorker::Listener{
      .onFailure = [&](const std::string&) { ++failures; },
      .onStopped = [&]() { ++stopped; }});

  link.unplug();
  EXPECT_TRUE(worker.waitForExit(1s));
  worker.join();

  EXPECT_EQ(failures.load(), 1);
  EXPECT_EQ(stopped.load(), 0);
  EXPECT_FALSE(link.isOpen());
}

TEST(SerialWorkerOptionsTests, ReadsWorkerSection) {
  const auto node = YAML::Load(R"yaml(
idleSleepMS: 5
blockingCommands: [g28, M999]
blockingMinPauseMS: 100
blockingMaxPauseMS: 1000
statusRequestIntervalMS: 500
)yaml");

  const auto options = SerialWorker::Options::fromYaml(node);
  EXPECT_EQ(options.idleSleep, 5ms);
  EXPECT_EQ(options.blockingCommands, (std::vector<std::string>{"G28", "M999"}));
  EXPECT_EQ(options.blockingMinPause, 100ms);
  EXPECT_EQ(options.blockingMaxPause, 1000ms);
  EXPECT_EQ(options.statusRequestInterval, 500ms);
  EXPECT_EQ(options.endstopRequestInterval, 0ms);
}

TEST(SerialWorkerOptionsTests, MissingSectionKeepsDefaults) {
  const auto options = SerialWorker::Options::fromYaml(YAML::Node());
  EXPECT_EQ(options.blockingCommands,
            (std::vector<std::string>{"G28", "G29", "M999"}));
  EXPECT_EQ(options.blockingMinPause, 250ms);
  EXPECT_EQ(options.blockingMaxPause, 90000ms);
}

TEST(SerialWorkerOptionsTests, RejectsInvalidSettings) {
  EXPECT_THROW((void)SerialWorker::Options::fromYaml(
                   YAML::Load("blockingMinPauseMS: -1")),
               std::runtime_error);
  EXPECT_THROW((void)SerialWorker::Options::fromYaml(
                   YAML::Load("{blockingMinPauseMS: 500, blockingMaxPauseMS: 100}")),
               std::runtime_error);
  EXPECT_THROW((void)SerialWorker::Options::fromYaml(
                   YAML::Load("blockingCommands: G28")),
               std::runtime_error);
  EXPECT_THROW((void)SerialWorker::Options::fromYaml(
                   YAML::Load("idleSleepMS: fast")),
               std::runtime_error);
  EXPECT_THROW((void)SerialWorker::Options::fromYaml(YAML::Load("[1, 2]")),
               std::runtime_error);
}
