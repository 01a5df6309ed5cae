#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include "TestDoubles.hpp"
#include "core/Alerts.hpp"
#include "core/BackupEngine.hpp"
#include "core/TransferLock.hpp"
#include "core/tasks/MirrorTask.hpp"
#include "utils/FileSystem.hpp"

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::AnyNumber;

class MirrorTaskTest : public ::testing::Test {
protected:
    fs::path testDir = fs::temp_directory_path() / "backupsync_mirror_test";
    fs::path primaryDir = testDir / "primary";
    fs::path mirrorA = testDir / "mirror_a";
    fs::path mirrorB = testDir / "mirror_b";

    MockLogger logger;
    MockNotifier notifier;
    std::unique_ptr<Alerts> alerts;
    TransferLock lock;

    void SetUp() override {
        fs::remove_all(testDir);
        fs::create_directories(primaryDir);
        logger.allowAll();
        EXPECT_CALL(notifier, notify(_, _)).Times(AnyNumber());
        alerts = std::make_unique<Alerts>(&logger, &notifier);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST_F(MirrorTaskTest, CopiesOnlyIntoRootsMissingTheFile) {
    std::ofstream(primaryDir / "x.bin", std::ios::binary) << "binary content";
    fs::create_directories(mirrorA);
    std::ofstream(mirrorA / "x.bin", std::ios::binary) << "stale";
    auto staleTime = FileSystem::getModificationTime((mirrorA / "x.bin").string());

    MirrorTask task(primaryDir.string(), {mirrorA.string(), mirrorB.string()}, alerts.get());
    MirrorReport report = task.execute();

    EXPECT_EQ(task.getStatus(), TaskStatus::COMPLETED);
    ASSERT_EQ(report.batch.files.size(), 1u);
    EXPECT_EQ(report.batch.files[0].fileName, "x.bin");
    EXPECT_EQ(report.batch.files[0].status, FileResultStatus::COPIED);
    EXPECT_TRUE(fs::exists(mirrorB / "x.bin"));

    // 同名文件不比较内容
    std::ifstream in(mirrorA / "x.bin");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "stale");
    EXPECT_EQ(FileSystem::getModificationTime((mirrorA / "x.bin").string()), staleTime);
}

TEST_F(MirrorTaskTest, ConvergesAllRoots) {
    for (const char* name : {"a.tar", "b.tar", "c.tar"}) {
        std::ofstream(primaryDir / name) << name;
    }
    fs::create_directories(mirrorA);
    std::ofstream(mirrorA / "b.tar") << "b.tar";
    std::ofstream(mirrorA / "extra.tar") << "only in mirror";

    MirrorReport report = BackupEngine::mirror(primaryDir.string(), {mirrorA.string(), mirrorB.string()}, lock,
                                               alerts.get());

    EXPECT_EQ(report.batch.transferred(), 5u);
    std::set<std::string> primaryNames = FileSystem::listFileNames(primaryDir.string());
    for (const auto& root : {mirrorA, mirrorB}) {
        std::set<std::string> names = FileSystem::listFileNames(root.string());
        for (const auto& name : primaryNames) {
            EXPECT_TRUE(names.count(name)) << name << " missing in " << root;
        }
    }
    // 镜像不删除多余文件
    EXPECT_TRUE(fs::exists(mirrorA / "extra.tar"));
    EXPECT_FALSE(lock.isActive());
}

TEST_F(MirrorTaskTest, UnavailableRootDoesNotStopOthers) {
    std::ofstream(primaryDir / "a.tar") << "a";
    std::ofstream(testDir / "not_a_dir") << "file";
    fs::path broken = testDir / "not_a_dir" / "mirror";
    EXPECT_CALL(notifier, notify("Backup Error", ::testing::HasSubstr(broken.string()))).Times(1);

    MirrorTask task(primaryDir.string(), {broken.string(), mirrorB.string()}, alerts.get());
    MirrorReport report = task.execute();

    ASSERT_EQ(report.unavailableRoots.size(), 1u);
    EXPECT_EQ(report.unavailableRoots[0], broken.string());
    EXPECT_TRUE(fs::exists(mirrorB / "a.tar"));
    EXPECT_EQ(task.getStatus(), TaskStatus::FAILED);
}

TEST_F(MirrorTaskTest, InterruptPropagates) {
    std::ofstream(primaryDir / "a.tar") << "a";
    std::atomic<bool> interrupted{true};

    MirrorTask task(primaryDir.string(), {mirrorA.string()}, alerts.get(), nullptr, &interrupted);
    EXPECT_THROW(task.execute(), InterruptedError);
    EXPECT_FALSE(fs::exists(mirrorA / "a.tar"));
}

TEST(MirrorDiffTest, MissingFilesIsSetDifference) {
    std::set<std::string> primary = {"a", "b", "c"};
    std::set<std::string> secondary = {"b", "d"};
    EXPECT_EQ(MirrorTask::missingFiles(primary, secondary), (std::vector<std::string>{"a", "c"}));
    EXPECT_TRUE(MirrorTask::missingFiles(secondary, secondary).empty());
}
