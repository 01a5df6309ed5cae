#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "TestDoubles.hpp"
#include "core/Alerts.hpp"
#include "core/RemovableMediaWatcher.hpp"
#include "core/TransferLock.hpp"
#include "core/VolumeEjector.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgReferee;
using namespace std::chrono_literals;

class RemovableMediaTest : public ::testing::Test {
protected:
    MockLogger logger;
    MockNotifier notifier;
    ::testing::NiceMock<MockVolumeEnumerator> enumerator;
    std::unique_ptr<Alerts> alerts;
    RemovableVolumeState state;
    TransferRequestQueue queue;
    TransferLock lock;
    ServerConfig config;

    RemovableVolume usb{"/dev/sdb1", "/media/backup/USB", "USB"};
    RemovableVolume other{"/dev/sdc1", "/media/backup/OTHER", "OTHER"};

    void SetUp() override {
        logger.allowAll();
        EXPECT_CALL(notifier, notify(_, _)).Times(AnyNumber());
        alerts = std::make_unique<Alerts>(&logger, &notifier);
        config.address = "host";
        config.primaryBackupPath = "/srv/backup";
    }

    std::unique_ptr<RemovableMediaWatcher> makeWatcher(bool forgetOnDetach = false) {
        return std::make_unique<RemovableMediaWatcher>(config, enumerator, state, queue, &logger, 10ms,
                                                       forgetOnDetach);
    }

    void attached(const std::vector<RemovableVolume>& volumes) {
        ON_CALL(enumerator, enumerate()).WillByDefault(Return(volumes));
    }
};

TEST_F(RemovableMediaTest, SameVolumeIsOfferedOnce) {
    auto watcher = makeWatcher();
    attached({usb});

    EXPECT_EQ(watcher->pollOnce(), 1u);
    EXPECT_EQ(watcher->pollOnce(), 0u);
    EXPECT_EQ(watcher->pollOnce(), 0u);
    ASSERT_EQ(queue.size(), 1u);

    TransferRequest request;
    ASSERT_TRUE(queue.tryPop(request));
    EXPECT_EQ(request.volume, usb);
    EXPECT_EQ(request.config.address, "host");
    EXPECT_TRUE(state.isPrompted(usb.id));
}

TEST_F(RemovableMediaTest, ReattachIsOfferedAgainWhenDetachForgets) {
    auto watcher = makeWatcher(true);

    attached({usb});
    EXPECT_EQ(watcher->pollOnce(), 1u);
    attached({});
    EXPECT_EQ(watcher->pollOnce(), 0u);
    EXPECT_FALSE(state.isPrompted(usb.id));
    attached({usb});
    EXPECT_EQ(watcher->pollOnce(), 1u);
    EXPECT_EQ(queue.size(), 2u);
}

TEST_F(RemovableMediaTest, DetachKeepsPromptedRecordByDefault) {
    auto watcher = makeWatcher();

    attached({usb});
    EXPECT_EQ(watcher->pollOnce(), 1u);
    attached({});
    EXPECT_EQ(watcher->pollOnce(), 0u);
    RemovableVolume current;
    EXPECT_FALSE(state.currentVolume(current));
    EXPECT_TRUE(state.isPrompted(usb.id));
    attached({usb});
    EXPECT_EQ(watcher->pollOnce(), 0u);
    EXPECT_EQ(queue.size(), 1u);

    // 只有显式忘记后才会再次提示
    state.forget(usb.id);
    attached({});
    watcher->pollOnce();
    attached({usb});
    EXPECT_EQ(watcher->pollOnce(), 1u);
}

TEST_F(RemovableMediaTest, WatchersShareOneView) {
    auto first = makeWatcher();
    auto second = makeWatcher();
    attached({usb, other});

    EXPECT_EQ(first->pollOnce(), 2u);
    EXPECT_EQ(second->pollOnce(), 0u);
    EXPECT_EQ(queue.size(), 2u);

    RemovableVolume current;
    ASSERT_TRUE(state.currentVolume(current));
    EXPECT_EQ(current, usb);
}

TEST_F(RemovableMediaTest, EnumerationFailureIsLogged) {
    auto watcher = makeWatcher();
    EXPECT_CALL(enumerator, enumerate()).WillOnce(::testing::Throw(std::runtime_error("mounts unreadable")));
    EXPECT_CALL(logger, error(::testing::HasSubstr("mounts unreadable"))).Times(1);

    EXPECT_EQ(watcher->pollOnce(), 0u);
    EXPECT_TRUE(queue.empty());
}

TEST_F(RemovableMediaTest, BackgroundWatcherEnqueues) {
    auto watcher = makeWatcher();
    attached({usb});

    ASSERT_TRUE(watcher->start());
    EXPECT_FALSE(watcher->start());
    for (int i = 0; i < 100 && queue.empty(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    watcher->stop();
    EXPECT_FALSE(watcher->isRunning());
    EXPECT_EQ(queue.size(), 1u);
}

TEST_F(RemovableMediaTest, EjectRejectedWhileTransferActive) {
    VolumeEjector ejector(enumerator, state, lock, alerts.get());
    state.setAttached(usb);
    ASSERT_TRUE(lock.tryBegin());
    EXPECT_CALL(enumerator, eject(_, _)).Times(0);
    EXPECT_CALL(notifier, notify("USB Eject Warning", _)).Times(1);

    EXPECT_EQ(ejector.safeEject(usb), EjectResult::REJECTED_BUSY);
    EXPECT_TRUE(lock.isActive());
    RemovableVolume current;
    EXPECT_TRUE(state.currentVolume(current));
    lock.end();
}

TEST_F(RemovableMediaTest, EjectForgetsVolume) {
    VolumeEjector ejector(enumerator, state, lock, alerts.get());
    state.setAttached(usb);
    state.markPrompted(usb.id);
    state.markPrompted(other.id);
    EXPECT_CALL(enumerator, eject(usb, _)).WillOnce(Return(true));

    EXPECT_EQ(ejector.safeEjectCurrent(), EjectResult::EJECTED);
    EXPECT_FALSE(state.isPrompted(usb.id));
    EXPECT_TRUE(state.isPrompted(other.id));
    EXPECT_FALSE(lock.isActive());
    EXPECT_EQ(ejector.safeEjectCurrent(), EjectResult::NO_VOLUME);
}

TEST_F(RemovableMediaTest, EjectFailureKeepsState) {
    VolumeEjector ejector(enumerator, state, lock, alerts.get());
    state.setAttached(usb);
    state.markPrompted(usb.id);
    EXPECT_CALL(enumerator, eject(usb, _)).WillOnce(DoAll(SetArgReferee<1>(std::string("target is busy")),
                                                           Return(false)));
    EXPECT_CALL(logger, error(::testing::HasSubstr("target is busy"))).Times(1);

    EXPECT_EQ(ejector.safeEject(usb), EjectResult::FAILED);
    EXPECT_TRUE(state.isPrompted(usb.id));
    EXPECT_FALSE(lock.isActive());
}

TEST_F(RemovableMediaTest, EjectCanBeDeclined) {
    MockPrompt prompt;
    VolumeEjector ejector(enumerator, state, lock, alerts.get(), &prompt);
    EXPECT_CALL(prompt, confirm(_)).WillOnce(Return(false));
    EXPECT_CALL(enumerator, eject(_, _)).Times(0);

    EXPECT_EQ(ejector.safeEject(usb), EjectResult::DECLINED);
}

TEST(TransferRequestQueueTest, IsFifo) {
    TransferRequestQueue queue;
    for (const char* id : {"a", "b", "c"}) {
        TransferRequest request;
        request.volume.id = id;
        queue.push(request);
    }
    TransferRequest out;
    std::string order;
    while (queue.tryPop(out)) {
        order += out.volume.id;
    }
    EXPECT_EQ(order, "abc");
    EXPECT_TRUE(queue.empty());
}
