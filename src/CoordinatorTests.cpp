#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "TestDoubles.hpp"
#include "core/Alerts.hpp"
#include "core/Coordinator.hpp"
#include "core/ServerWorker.hpp"
#include "utils/FileSystem.hpp"

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using namespace std::chrono_literals;

class ServerWorkerTest : public ::testing::Test {
protected:
    MockLogger logger;
    ServerConfig config;

    void SetUp() override {
        logger.allowAll();
        config.address = "host";
    }
};

TEST_F(ServerWorkerTest, RunsEnqueuedPull) {
    std::atomic<int> calls{0};
    ServerWorker worker(config, [&calls](const ServerConfig& c) {
        calls++;
        PullReport report;
        report.outcome = PullOutcome::NO_NEW_FILES;
        report.message = c.address;
        return report;
    }, &logger);

    EXPECT_FALSE(worker.enqueue(ScheduleType::SCHEDULED));
    ASSERT_TRUE(worker.start());
    EXPECT_TRUE(worker.enqueue(ScheduleType::STARTUP));
    ASSERT_TRUE(worker.waitIdle(2s));

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(worker.getCompletedRuns(), 1u);
    EXPECT_EQ(worker.getLastReport().outcome, PullOutcome::NO_NEW_FILES);
    EXPECT_EQ(worker.getLastReport().message, "host");
    worker.stop();
    EXPECT_FALSE(worker.isRunning());
}

TEST_F(ServerWorkerTest, CoalescesJobsWhileBusy) {
    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<bool> entered{false};

    ServerWorker worker(config, [&](const ServerConfig&) {
        entered = true;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&release]() { return release; });
        PullReport report;
        report.outcome = PullOutcome::SUCCESS;
        return report;
    }, &logger);
    ASSERT_TRUE(worker.start());

    ASSERT_TRUE(worker.enqueue(ScheduleType::STARTUP));
    for (int i = 0; i < 200 && !entered; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(entered);
    EXPECT_TRUE(worker.isBusy());

    // 运行中可以再排一个，多余的被合并
    EXPECT_TRUE(worker.enqueue(ScheduleType::SCHEDULED));
    EXPECT_FALSE(worker.enqueue(ScheduleType::SCHEDULED));

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    ASSERT_TRUE(worker.waitIdle(2s));
    EXPECT_EQ(worker.getCompletedRuns(), 2u);
}

TEST_F(ServerWorkerTest, ExceptionBecomesFailedReport) {
    ServerWorker worker(config, [](const ServerConfig&) -> PullReport {
        throw std::runtime_error("disk full");
    }, &logger);
    EXPECT_CALL(logger, error(HasSubstr("disk full"))).Times(1);
    ASSERT_TRUE(worker.start());

    ASSERT_TRUE(worker.enqueue(ScheduleType::SCHEDULED));
    ASSERT_TRUE(worker.waitIdle(2s));
    EXPECT_EQ(worker.getLastReport().outcome, PullOutcome::FAILED);
    EXPECT_EQ(worker.getLastReport().message, "disk full");
}

class CoordinatorTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "backupsync_coordinator_test";
    fs::path mountDir = testDir / "media" / "USB";

    MockLogger logger;
    NiceMock<MockNotifier> notifier;
    NiceMock<MockVolumeEnumerator> enumerator;
    MockPrompt prompt;
    std::unique_ptr<Alerts> alerts;
    FakeRemote remote;
    CoordinatorSettings settings;
    std::vector<ServerConfig> servers;
    RemovableVolume usb;

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(mountDir);
        logger.allowAll();
        alerts = std::make_unique<Alerts>(&logger, &notifier);

        settings.tickInterval = 20ms;
        settings.watchVolumes = false;
        settings.runOnStartup = false;
        settings.pull.throttle = 0ms;
        settings.pull.retryDelay = 10ms;

        servers.push_back(makeServer("alpha"));
        servers.push_back(makeServer("beta"));

        usb.id = "/dev/sdb1";
        usb.mountPoint = mountDir.string();
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    ServerConfig makeServer(const std::string& name) {
        ServerConfig config;
        config.name = name;
        config.address = name + ".example.com";
        config.username = "backup";
        config.password = "secret";
        config.sourcePath = "/var/backups";
        config.primaryBackupPath = (testDir / name / "primary").string();
        config.secondaryBackupPaths = {(testDir / name / "mirror").string()};
        config.backupTimes = {BackupTime{3, 0}};
        return config;
    }

    std::unique_ptr<Coordinator> makeCoordinator(const std::atomic<bool>* interrupted = nullptr) {
        return std::make_unique<Coordinator>(servers, remote.factory(), enumerator, alerts.get(), &prompt,
                                             settings, interrupted);
    }

    static std::chrono::system_clock::time_point today(int hour, int minute) {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        localtime_r(&now, &tm);
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = 0;
        tm.tm_isdst = -1;
        return std::chrono::system_clock::from_time_t(std::mktime(&tm));
    }
};

TEST_F(CoordinatorTest, StartupPullsEveryServer) {
    settings.runOnStartup = true;
    remote.addFile("a.tar", "aaa", 1700000100);
    remote.addFile("b.tar", "bbb", 1700000200);

    auto coordinator = makeCoordinator();
    ASSERT_TRUE(coordinator->start());
    ASSERT_TRUE(coordinator->waitForWorkers(5s));

    for (const auto& server : servers) {
        EXPECT_EQ(FileSystem::listFileNames(server.primaryBackupPath), (std::set<std::string>{"a.tar", "b.tar"}));
        EXPECT_EQ(FileSystem::listFileNames(server.secondaryBackupPaths[0]),
                  (std::set<std::string>{"a.tar", "b.tar"}));
    }
    for (const auto& worker : coordinator->getWorkers()) {
        EXPECT_EQ(worker->getLastReport().outcome, PullOutcome::SUCCESS);
    }
    EXPECT_EQ(remote.downloads.load(), 4);
    EXPECT_FALSE(coordinator->getTransferLock().isActive());
    coordinator->shutdown();
}

TEST_F(CoordinatorTest, TickDispatchesDueJobs) {
    remote.addFile("a.tar", "aaa", 1700000100);
    servers[1].backupTimes = {BackupTime{4, 0}};

    auto coordinator = makeCoordinator();
    ASSERT_TRUE(coordinator->start(today(2, 0)));
    EXPECT_EQ(coordinator->getScheduler().getJobs().size(), 2u);

    coordinator->tick(today(3, 0));
    ASSERT_TRUE(coordinator->waitForWorkers(5s));
    EXPECT_EQ(coordinator->getWorkers()[0]->getCompletedRuns(), 1u);
    EXPECT_EQ(coordinator->getWorkers()[1]->getCompletedRuns(), 0u);

    coordinator->tick(today(4, 0));
    ASSERT_TRUE(coordinator->waitForWorkers(5s));
    EXPECT_EQ(coordinator->getWorkers()[1]->getCompletedRuns(), 1u);
    coordinator->shutdown();
}

TEST_F(CoordinatorTest, AuthFailureOnOneServerDoesNotBlockOthers) {
    remote.addFile("a.tar", "aaa", 1700000100);
    remote.acceptedPassword = "secret";
    servers[0].password = "wrong";
    settings.runOnStartup = true;

    auto coordinator = makeCoordinator();
    ASSERT_TRUE(coordinator->start());
    ASSERT_TRUE(coordinator->waitForWorkers(5s));

    EXPECT_EQ(coordinator->getWorkers()[0]->getLastReport().outcome, PullOutcome::FAILED);
    EXPECT_EQ(coordinator->getWorkers()[1]->getLastReport().outcome, PullOutcome::SUCCESS);
    EXPECT_TRUE(FileSystem::listFileNames(servers[0].primaryBackupPath).empty());
    EXPECT_EQ(FileSystem::listFileNames(servers[1].primaryBackupPath), (std::set<std::string>{"a.tar"}));
    coordinator->shutdown();
}

TEST_F(CoordinatorTest, AcceptedVolumeGetsCopyAndEject) {
    fs::create_directories(servers[0].primaryBackupPath);
    std::ofstream(fs::path(servers[0].primaryBackupPath) / "a.tar") << "aaa";
    std::ofstream(fs::path(servers[0].primaryBackupPath) / "b.tar") << "bbb";
    fs::path target = mountDir / "backups";
    fs::create_directories(target);
    ON_CALL(enumerator, enumerate()).WillByDefault(Return(std::vector<RemovableVolume>{usb}));

    EXPECT_CALL(prompt, confirm(HasSubstr("USB drive detected at " + usb.mountPoint))).WillOnce(Return(true));
    EXPECT_CALL(prompt, chooseOrCreateFolder(usb.mountPoint)).WillOnce(Return(target.string()));
    EXPECT_CALL(prompt, confirm(HasSubstr("safely eject"))).WillOnce(Return(true));
    EXPECT_CALL(enumerator, eject(usb, _)).WillOnce(Return(true));

    auto coordinator = makeCoordinator();
    ASSERT_TRUE(coordinator->start());
    // 两个服务器的监视器共享状态，只入队一次
    EXPECT_EQ(coordinator->pollVolumes(), 1u);
    EXPECT_EQ(coordinator->processTransferRequests(), 1u);

    EXPECT_EQ(FileSystem::listFileNames(target.string()), (std::set<std::string>{"a.tar", "b.tar"}));
    EXPECT_FALSE(coordinator->getVolumeState().isPrompted(usb.id));
    EXPECT_FALSE(coordinator->getTransferLock().isActive());
    coordinator->shutdown();
}

TEST_F(CoordinatorTest, DeclinedVolumeIsNotCopied) {
    ON_CALL(enumerator, enumerate()).WillByDefault(Return(std::vector<RemovableVolume>{usb}));
    EXPECT_CALL(prompt, confirm(_)).WillOnce(Return(false));
    EXPECT_CALL(prompt, chooseOrCreateFolder(_)).Times(0);
    EXPECT_CALL(enumerator, eject(_, _)).Times(0);

    auto coordinator = makeCoordinator();
    ASSERT_TRUE(coordinator->start());
    coordinator->pollVolumes();
    EXPECT_EQ(coordinator->processTransferRequests(), 0u);
    EXPECT_TRUE(coordinator->getRequestQueue().empty());

    // 仍然在同一次挂载中，不再提示
    EXPECT_EQ(coordinator->pollVolumes(), 0u);
    coordinator->shutdown();
}

TEST_F(CoordinatorTest, DetachedVolumeRequestIsDropped) {
    EXPECT_CALL(prompt, confirm(_)).Times(0);
    auto coordinator = makeCoordinator();
    ASSERT_TRUE(coordinator->start());

    ON_CALL(enumerator, enumerate()).WillByDefault(Return(std::vector<RemovableVolume>{usb}));
    coordinator->pollVolumes();
    ON_CALL(enumerator, enumerate()).WillByDefault(Return(std::vector<RemovableVolume>{}));
    coordinator->pollVolumes();

    EXPECT_EQ(coordinator->processTransferRequests(), 0u);
    coordinator->shutdown();
}

TEST_F(CoordinatorTest, RunReturnsZeroOnInterrupt) {
    std::atomic<bool> interrupted{false};
    auto coordinator = makeCoordinator(&interrupted);

    std::thread stopper([&interrupted]() {
        std::this_thread::sleep_for(100ms);
        interrupted = true;
    });
    EXPECT_EQ(coordinator->run(), 0);
    stopper.join();
    for (const auto& worker : coordinator->getWorkers()) {
        EXPECT_FALSE(worker->isRunning());
    }
}

TEST_F(CoordinatorTest, RunWithoutServersIsConfigError) {
    servers.clear();
    auto coordinator = makeCoordinator();
    EXPECT_EQ(coordinator->run(), 1);
}
