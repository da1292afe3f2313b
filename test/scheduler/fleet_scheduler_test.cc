#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/scheduler/fleet_scheduler.h"
#include "../test_utils.h"

#include <algorithm>
#include <set>
#include <thread>

using namespace Overlook;
using Overlook::test::MakeOffer;
using Overlook::test::MakeStatus;
using Overlook::test::MakeValidOffer;
using Overlook::test::MakeValidOffers;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;

class MockSchedulerDriver : public ISchedulerDriver {
public:
    MOCK_METHOD(void, LaunchTask, (const std::string& offer_id, const orchestrator_protocol::TaskInfo& task), (override));
    MOCK_METHOD(void, DeclineOffer, (const std::string& offer_id), (override));
    MOCK_METHOD(void, KillTask, (const std::string& task_id), (override));
};

class FleetSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler_ = std::make_unique<FleetScheduler>(TaskTemplate{}, &driver_);
        ON_CALL(driver_, LaunchTask(_, _))
            .WillByDefault(Invoke([this](const std::string& offer_id,
                            const orchestrator_protocol::TaskInfo& task) {
                launched_.push_back(task.task_id());
                launched_offers_.push_back(offer_id);
            }));
        ON_CALL(driver_, DeclineOffer(_))
            .WillByDefault(Invoke([this](const std::string& offer_id) {
                declined_.push_back(offer_id);
            }));
        ON_CALL(driver_, KillTask(_))
            .WillByDefault(Invoke([this](const std::string& task_id) {
                killed_.push_back(task_id);
            }));
    }

    void MarkAll(orchestrator_protocol::TaskState state) {
        for (const auto& task_id : launched_) {
            scheduler_->StatusUpdate(MakeStatus(task_id, state));
        }
    }

    NiceMock<MockSchedulerDriver> driver_;
    std::unique_ptr<FleetScheduler> scheduler_;
    std::vector<std::string> launched_;
    std::vector<std::string> launched_offers_;
    std::vector<std::string> declined_;
    std::vector<std::string> killed_;
};

TEST_F(FleetSchedulerTest, LaunchesOneTaskPerOffer) {
    scheduler_->ChangeRequirement("es1", 3);
    scheduler_->ResourceOffers(MakeValidOffers(3));

    ASSERT_EQ(launched_.size(), 3u);
    EXPECT_TRUE(declined_.empty());
    EXPECT_EQ(launched_offers_, (std::vector<std::string>{"offer-0", "offer-1", "offer-2"}));

    std::vector<TaskHandle> running = scheduler_->RunningTasks("es1");
    ASSERT_EQ(running.size(), 3u);
    std::set<uint32_t> ports;
    for (const auto& task : running) {
        EXPECT_EQ(task.phase, TaskPhase::Launching);
        EXPECT_EQ(task.target, "es1");
        ports.insert(task.port);
    }
    EXPECT_EQ(ports.size(), 3u);
}

TEST_F(FleetSchedulerTest, FewerOffersLeavePositiveDelta) {
    scheduler_->ChangeRequirement("es1", 3);
    scheduler_->ResourceOffers(MakeValidOffers(2));

    EXPECT_EQ(launched_.size(), 2u);
    RequirementDeltas deltas = scheduler_->GetRequirementDeltas();
    ASSERT_EQ(deltas.size(), 1u);
    EXPECT_EQ(deltas[0].second, 1);
}

TEST_F(FleetSchedulerTest, SurplusOffersAreDeclined) {
    scheduler_->ChangeRequirement("es1", 1);
    scheduler_->ResourceOffers(MakeValidOffers(3));

    EXPECT_EQ(launched_.size(), 1u);
    EXPECT_EQ(declined_, (std::vector<std::string>{"offer-1", "offer-2"}));
}

TEST_F(FleetSchedulerTest, DeclinesEverythingWithoutRequirement) {
    EXPECT_CALL(driver_, LaunchTask(_, _)).Times(0);
    EXPECT_CALL(driver_, DeclineOffer(_)).Times(2);

    scheduler_->ResourceOffers(MakeValidOffers(2));
}

TEST_F(FleetSchedulerTest, DeclinesInsufficientOfferWithoutStateChange) {
    scheduler_->ChangeRequirement("es1", 1);

    EXPECT_CALL(driver_, LaunchTask(_, _)).Times(0);
    EXPECT_CALL(driver_, DeclineOffer("small")).Times(1);
    scheduler_->ResourceOffers({MakeOffer("small", 0.01, 1024, {{31000, 31100}})});

    EXPECT_TRUE(scheduler_->RunningTasks("es1").empty());
    EXPECT_EQ(scheduler_->RequiredCount("es1"), 1);
}

TEST_F(FleetSchedulerTest, DeclinesWhenNoPortIsFree) {
    scheduler_->ChangeRequirement("es1", 2);
    scheduler_->ResourceOffers({
        MakeOffer("a", 1, 1024, {{31000, 31001}}),
        MakeOffer("b", 1, 1024, {{31000, 31001}})});

    EXPECT_EQ(launched_offers_, std::vector<std::string>{"a"});
    EXPECT_EQ(declined_, std::vector<std::string>{"b"});
    EXPECT_EQ(scheduler_->RunningTasks("es1").size(), 1u);
}

TEST_F(FleetSchedulerTest, ServesTargetsInFirstSeenOrder) {
    scheduler_->ChangeRequirement("es2", 1);
    scheduler_->ChangeRequirement("es1", 1);
    scheduler_->ResourceOffers(MakeValidOffers(1));

    EXPECT_EQ(scheduler_->RunningTasks("es2").size(), 1u);
    EXPECT_TRUE(scheduler_->RunningTasks("es1").empty());

    scheduler_->ResourceOffers({MakeValidOffer("next")});
    EXPECT_EQ(scheduler_->RunningTasks("es1").size(), 1u);
}

TEST_F(FleetSchedulerTest, RunningAndStagingUpdates) {
    scheduler_->ChangeRequirement("es1", 1);
    scheduler_->ResourceOffers(MakeValidOffers(1));
    ASSERT_EQ(launched_.size(), 1u);

    scheduler_->StatusUpdate(MakeStatus(launched_[0], orchestrator_protocol::TASK_STAGING));
    EXPECT_EQ(scheduler_->RunningTasks("es1")[0].phase, TaskPhase::Launching);

    scheduler_->StatusUpdate(MakeStatus(launched_[0], orchestrator_protocol::TASK_RUNNING));
    EXPECT_EQ(scheduler_->RunningTasks("es1")[0].phase, TaskPhase::Running);
}

TEST_F(FleetSchedulerTest, TerminalStatusFreesPort) {
    scheduler_->ChangeRequirement("es1", 1);
    scheduler_->ResourceOffers({MakeOffer("a", 1, 1024, {{31000, 31001}})});
    ASSERT_EQ(launched_.size(), 1u);
    EXPECT_EQ(scheduler_->PortOf(launched_[0]), std::optional<uint32_t>(31000));

    scheduler_->StatusUpdate(MakeStatus(launched_[0], orchestrator_protocol::TASK_FAILED));
    EXPECT_TRUE(scheduler_->RunningTasks("es1").empty());
    EXPECT_FALSE(scheduler_->PortOf(launched_[0]).has_value());
    EXPECT_EQ(scheduler_->GetRequirementDeltas()[0].second, 1);

    // The replacement can take the same port again
    scheduler_->ResourceOffers({MakeOffer("b", 1, 1024, {{31000, 31001}})});
    ASSERT_EQ(launched_.size(), 2u);
    EXPECT_EQ(scheduler_->PortOf(launched_[1]), std::optional<uint32_t>(31000));
}

TEST_F(FleetSchedulerTest, IgnoresUnknownTask) {
    scheduler_->ChangeRequirement("es1", 1);
    scheduler_->ResourceOffers(MakeValidOffers(1));

    scheduler_->StatusUpdate(MakeStatus("nobody", orchestrator_protocol::TASK_KILLED));
    EXPECT_EQ(scheduler_->RunningTasks("es1").size(), 1u);

    // A second terminal update for a reconciled task is ignored too
    scheduler_->StatusUpdate(MakeStatus(launched_[0], orchestrator_protocol::TASK_LOST));
    scheduler_->StatusUpdate(MakeStatus(launched_[0], orchestrator_protocol::TASK_LOST));
    EXPECT_TRUE(scheduler_->RunningTasks("es1").empty());
}

TEST_F(FleetSchedulerTest, ZeroChangeDoesNothing) {
    scheduler_->ChangeRequirement("es1", 2);
    scheduler_->ResourceOffers(MakeValidOffers(2));

    EXPECT_CALL(driver_, KillTask(_)).Times(0);
    EXPECT_EQ(scheduler_->ChangeRequirement("es1", 0), 2);
    EXPECT_EQ(scheduler_->ChangeRequirement("es9", 0), 0);
    EXPECT_EQ(scheduler_->GetRequirementDeltas().size(), 1u);
}

TEST_F(FleetSchedulerTest, ScaleDownKillsYoungestFirst) {
    scheduler_->ChangeRequirement("es1", 3);
    scheduler_->ResourceOffers(MakeValidOffers(3));
    ASSERT_EQ(launched_.size(), 3u);
    MarkAll(orchestrator_protocol::TASK_RUNNING);
    for (const auto& task : scheduler_->RunningTasks("es1")) {
        EXPECT_EQ(task.phase, TaskPhase::Running);
    }

    {
        InSequence seq;
        EXPECT_CALL(driver_, KillTask(launched_[2]));
        EXPECT_CALL(driver_, KillTask(launched_[1]));
    }
    EXPECT_EQ(scheduler_->ChangeRequirement("es1", -2), 1);

    scheduler_->StatusUpdate(MakeStatus(launched_[2], orchestrator_protocol::TASK_KILLED));
    scheduler_->StatusUpdate(MakeStatus(launched_[1], orchestrator_protocol::TASK_KILLED));

    std::vector<TaskHandle> running = scheduler_->RunningTasks("es1");
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].task_id, launched_[0]);
    EXPECT_EQ(scheduler_->RequiredCount("es1"), 1);
}

TEST_F(FleetSchedulerTest, KillIsSentOnlyOnce) {
    scheduler_->ChangeRequirement("es1", 2);
    scheduler_->ResourceOffers(MakeValidOffers(2));
    ASSERT_EQ(launched_.size(), 2u);

    EXPECT_CALL(driver_, KillTask(launched_[1])).Times(1);
    scheduler_->ChangeRequirement("es1", -1);

    // Offer batches rerun the kill pass while the kill is outstanding
    scheduler_->ResourceOffers({MakeValidOffer("later")});
    scheduler_->ResourceOffers({MakeValidOffer("later-again")});

    auto youngest = scheduler_->YoungestTask("es1");
    ASSERT_TRUE(youngest.has_value());
    EXPECT_TRUE(youngest->kill_requested);
}

TEST_F(FleetSchedulerTest, RemovingTargetKillsAllItsTasks) {
    scheduler_->ChangeRequirement("es1", 2);
    scheduler_->ResourceOffers(MakeValidOffers(2));

    scheduler_->ChangeRequirement("es1", -5);
    EXPECT_EQ(killed_, (std::vector<std::string>{launched_[1], launched_[0]}));

    MarkAll(orchestrator_protocol::TASK_KILLED);
    EXPECT_TRUE(scheduler_->GetRequirementDeltas().empty());
    EXPECT_TRUE(scheduler_->Snapshot().empty());
}

TEST_F(FleetSchedulerTest, SnapshotReportsTargetsAndTasks) {
    scheduler_->ChangeRequirement("es1", 2);
    scheduler_->ResourceOffers(MakeValidOffers(1));

    std::vector<TargetSnapshot> snapshot = scheduler_->Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].target, "es1");
    EXPECT_EQ(snapshot[0].required, 2);
    EXPECT_EQ(snapshot[0].delta, 1);
    ASSERT_EQ(snapshot[0].tasks.size(), 1u);
    EXPECT_EQ(snapshot[0].tasks[0].task_id, launched_[0]);
}

TEST(FleetSchedulerNoDriverTest, DoesNotRegisterWithoutDriver) {
    FleetScheduler scheduler(TaskTemplate{});
    scheduler.ChangeRequirement("es1", 1);
    scheduler.ResourceOffers({MakeOffer("a", 1, 1024, {{31000, 31001}})});

    EXPECT_TRUE(scheduler.RunningTasks("es1").empty());
    EXPECT_EQ(scheduler.GetRequirementDeltas()[0].second, 1);

    // The dropped offer held no port, so a driver attached later can use it
    NiceMock<MockSchedulerDriver> driver;
    EXPECT_CALL(driver, LaunchTask("b", _)).Times(1);
    scheduler.SetDriver(&driver);
    scheduler.ResourceOffers({MakeOffer("b", 1, 1024, {{31000, 31001}})});

    std::vector<TaskHandle> running = scheduler.RunningTasks("es1");
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].port, 31000u);
    scheduler.SetDriver(nullptr);
}

namespace {

// Records driver calls from any thread
class RecordingDriver : public ISchedulerDriver {
public:
    void LaunchTask(const std::string& offer_id, const orchestrator_protocol::TaskInfo& task) override {
        absl::MutexLock lock(&mutex_);
        launched_.push_back(task.task_id());
    }
    void DeclineOffer(const std::string& offer_id) override {}
    void KillTask(const std::string& task_id) override {
        absl::MutexLock lock(&mutex_);
        killed_.push_back(task_id);
    }

    std::vector<std::string> Launched() {
        absl::MutexLock lock(&mutex_);
        return launched_;
    }
    std::vector<std::string> Killed() {
        absl::MutexLock lock(&mutex_);
        return killed_;
    }

private:
    absl::Mutex mutex_;
    std::vector<std::string> launched_ ABSL_GUARDED_BY(mutex_);
    std::vector<std::string> killed_ ABSL_GUARDED_BY(mutex_);
};

} // namespace

TEST(FleetSchedulerConcurrencyTest, RequirementChangesRaceOfferBatches) {
    RecordingDriver driver;
    FleetScheduler scheduler(TaskTemplate{}, &driver);
    const std::vector<std::string> targets = {"es1", "es2"};
    const int kRounds = 500;

    std::vector<int> expected(targets.size(), 0);
    std::thread management([&]() {
        for (int i = 0; i < kRounds; i++) {
            size_t t = i % targets.size();
            int delta = (i % 3 == 2) ? -1 : 1;
            scheduler.ChangeRequirement(targets[t], delta);
            expected[t] = std::max(0, expected[t] + delta);
        }
    });

    std::thread orchestrator([&]() {
        size_t acked_kills = 0;
        size_t acked_launches = 0;
        for (int i = 0; i < kRounds; i++) {
            std::vector<orchestrator_protocol::Offer> batch;
            for (int j = 0; j < 3; j++) {
                batch.push_back(MakeValidOffer("o-" + std::to_string(i) + "-" + std::to_string(j),
                            31000, 32000));
            }
            scheduler.ResourceOffers(batch);

            std::vector<std::string> launched = driver.Launched();
            for (; acked_launches < launched.size(); acked_launches++) {
                // Every fifth launch fails, the rest come up
                scheduler.StatusUpdate(MakeStatus(launched[acked_launches],
                            acked_launches % 5 == 4
                            ? orchestrator_protocol::TASK_FAILED
                            : orchestrator_protocol::TASK_RUNNING));
            }
            std::vector<std::string> killed = driver.Killed();
            for (; acked_kills < killed.size(); acked_kills++) {
                scheduler.StatusUpdate(MakeStatus(killed[acked_kills], orchestrator_protocol::TASK_KILLED));
            }
        }
    });

    management.join();
    orchestrator.join();

    std::set<uint32_t> ports;
    size_t live = 0;
    for (size_t t = 0; t < targets.size(); t++) {
        EXPECT_EQ(scheduler.RequiredCount(targets[t]), expected[t]) << targets[t];
        for (const auto& task : scheduler.RunningTasks(targets[t])) {
            live++;
            ports.insert(task.port);
            EXPECT_EQ(scheduler.PortOf(task.task_id), std::optional<uint32_t>(task.port))
                << task.task_id;
        }
    }
    EXPECT_EQ(ports.size(), live);
}
