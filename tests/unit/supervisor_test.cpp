/**
 * supervisor_test.cpp - Supervisor lifecycle against mocked collaborators
 *
 * The PID Store and Log Sink are real (backed by a temp directory); the
 * build step, launcher and liveness prober are mocks, and termination runs
 * through a real Terminator over a mocked signaller with a fake sleeper.
 *
 * Tests:
 * - Singleton: a live record rejects start without building or spawning
 * - Stale and corrupt records do not block start
 * - Build failure: status propagated, nothing spawned, no record
 * - Spawn failure: no record written
 * - Settle check: early exit is reported, live worker is STARTED
 * - stop: idempotent, always clears the record
 * - status/log/clean projections
 */

#include "supervisor/supervisor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>

#include "mocks/mock_build_step.hpp"
#include "mocks/mock_liveness_prober.hpp"
#include "mocks/mock_process_launcher.hpp"
#include "mocks/mock_process_signaller.hpp"
#include "test_support.hpp"

using namespace warden;
using namespace warden::supervisor;
using namespace warden::tests;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::StrictMock;

class SupervisorTest : public ::testing::Test {
protected:
    SupervisorTest()
        : pid_store_(dir_.file("worker.pid"), prober_),
          log_sink_(dir_.file("worker.log"), "worker"),
          terminator_(prober_, signaller_, fast_policy(), [](std::chrono::milliseconds) {}) {
        config_.worker_name = "worker";
        config_.executable = "./worker";
        config_.unset_environment = {"CLAUDECODE"};
        config_.pid_file = dir_.file("worker.pid");
        config_.log_file = dir_.file("worker.log");
        config_.settle_delay_ms = 2000;

        ON_CALL(prober_, is_alive(_)).WillByDefault(Invoke([this](process::ProcessId pid) {
            return alive_.count(pid) != 0;
        }));
        ON_CALL(build_, run()).WillByDefault(Return(0));
    }

    static process::TerminationPolicy fast_policy() {
        process::TerminationPolicy policy;
        policy.graceful_timeout = 1000ms;
        policy.forceful_timeout = 500ms;
        policy.poll_interval = 100ms;
        return policy;
    }

    Supervisor make_supervisor() {
        return Supervisor(config_, pid_store_, log_sink_, build_, launcher_, terminator_, prober_,
                          [this](std::chrono::milliseconds d) { settled_ += d; });
    }

    void seed_record(process::ProcessId pid) {
        std::string error;
        ASSERT_TRUE(pid_store_.write(pid, error)) << error;
    }

    ScopedTempDir dir_;
    SupervisorConfig config_;
    std::set<process::ProcessId> alive_;
    NiceMock<MockLivenessProber> prober_;
    NiceMock<MockBuildStep> build_;
    StrictMock<MockProcessLauncher> launcher_;
    NiceMock<MockProcessSignaller> signaller_;
    state::PidStore pid_store_;
    state::LogSink log_sink_;
    process::Terminator terminator_;
    std::chrono::milliseconds settled_{0};
};

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

TEST_F(SupervisorTest, StartLaunchesRecordsAndSettles) {
    process::LaunchRequest seen;
    EXPECT_CALL(build_, run()).WillOnce(Return(0));
    EXPECT_CALL(launcher_, launch(_, _)).WillOnce(DoAll(SaveArg<0>(&seen), Invoke([this](auto &, auto &) {
                                                            alive_.insert(501);
                                                            return std::optional<process::ProcessId>(501);
                                                        })));

    auto sup = make_supervisor();
    auto result = sup.start("What is 2+2?", {"--verbose"});

    EXPECT_EQ(result.outcome, StartOutcome::STARTED);
    EXPECT_EQ(result.pid, 501);
    EXPECT_EQ(pid_store_.read(), 501);
    EXPECT_EQ(settled_, 2000ms);

    EXPECT_EQ(seen.executable, "./worker");
    EXPECT_EQ(seen.arguments, (std::vector<std::string>{"--verbose", "What is 2+2?"}));
    EXPECT_EQ(seen.unset_environment, (std::vector<std::string>{"CLAUDECODE"}));
    EXPECT_NE(seen.output, process::kInvalidHandle);

    auto log = log_sink_.read();
    ASSERT_TRUE(log.has_value());
    EXPECT_EQ(log->rfind("=== worker started at ", 0), 0u);
}

TEST_F(SupervisorTest, StartWhileRunningIsRejectedWithoutSideEffects) {
    seed_record(777);
    alive_.insert(777);
    EXPECT_CALL(build_, run()).Times(0);
    EXPECT_CALL(launcher_, launch(_, _)).Times(0);

    auto sup = make_supervisor();
    auto result = sup.start("ping");

    EXPECT_EQ(result.outcome, StartOutcome::ALREADY_RUNNING);
    EXPECT_EQ(result.pid, 777);
    EXPECT_EQ(pid_store_.read(), 777);
    EXPECT_FALSE(log_sink_.exists());
}

TEST_F(SupervisorTest, StaleRecordDoesNotBlockStart) {
    seed_record(600);  // not alive
    EXPECT_CALL(launcher_, launch(_, _)).WillOnce(Invoke([this](auto &, auto &) {
        alive_.insert(601);
        return std::optional<process::ProcessId>(601);
    }));

    auto sup = make_supervisor();
    EXPECT_EQ(sup.start("ping").outcome, StartOutcome::STARTED);
    EXPECT_EQ(pid_store_.read(), 601);
}

TEST_F(SupervisorTest, CorruptRecordDoesNotBlockStart) {
    dir_.write_file("worker.pid", "garbage");
    EXPECT_CALL(launcher_, launch(_, _)).WillOnce(Invoke([this](auto &, auto &) {
        alive_.insert(602);
        return std::optional<process::ProcessId>(602);
    }));

    auto sup = make_supervisor();
    EXPECT_EQ(sup.start("ping").outcome, StartOutcome::STARTED);
}

TEST_F(SupervisorTest, BuildFailurePropagatesStatusAndSpawnsNothing) {
    EXPECT_CALL(build_, run()).WillOnce(Return(2));
    EXPECT_CALL(launcher_, launch(_, _)).Times(0);

    auto sup = make_supervisor();
    auto result = sup.start("ping");

    EXPECT_EQ(result.outcome, StartOutcome::BUILD_FAILED);
    EXPECT_EQ(result.build_status, 2);
    EXPECT_FALSE(pid_store_.read_record().has_value());
    EXPECT_FALSE(log_sink_.exists());
}

TEST_F(SupervisorTest, SpawnFailureLeavesNoRecord) {
    EXPECT_CALL(launcher_, launch(_, _)).WillOnce(Invoke([](auto &, std::string &error) {
        error = "Executable not found: ./worker";
        return std::optional<process::ProcessId>();
    }));

    auto sup = make_supervisor();
    auto result = sup.start("ping");

    EXPECT_EQ(result.outcome, StartOutcome::SPAWN_FAILED);
    EXPECT_EQ(result.error, "Executable not found: ./worker");
    EXPECT_FALSE(pid_store_.read_record().has_value());
    EXPECT_EQ(settled_, 0ms);
}

TEST_F(SupervisorTest, UnopenableLogIsASpawnFailure) {
    dir_.write_file("blocker", "x");
    state::LogSink blocked(dir_.file("blocker/worker.log"), "worker");
    EXPECT_CALL(launcher_, launch(_, _)).Times(0);

    Supervisor sup(config_, pid_store_, blocked, build_, launcher_, terminator_, prober_,
                   [](std::chrono::milliseconds) {});
    auto result = sup.start("ping");

    EXPECT_EQ(result.outcome, StartOutcome::SPAWN_FAILED);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(SupervisorTest, UnrecordablePidStopsTheWorker) {
    dir_.write_file("blocker", "x");
    state::PidStore blocked(dir_.file("blocker/worker.pid"), prober_);
    EXPECT_CALL(launcher_, launch(_, _)).WillOnce(Invoke([this](auto &, auto &) {
        alive_.insert(900);
        return std::optional<process::ProcessId>(900);
    }));
    EXPECT_CALL(signaller_, request_stop(900)).WillOnce(Invoke([this](process::ProcessId pid) {
        alive_.erase(pid);
        return process::SignalResult::DELIVERED;
    }));

    Supervisor sup(config_, blocked, log_sink_, build_, launcher_, terminator_, prober_,
                   [](std::chrono::milliseconds) {});
    auto result = sup.start("ping");

    EXPECT_EQ(result.outcome, StartOutcome::SPAWN_FAILED);
    EXPECT_EQ(alive_.count(900), 0u);
}

TEST_F(SupervisorTest, WorkerDeadAfterSettleIsExitedEarly) {
    EXPECT_CALL(launcher_, launch(_, _)).WillOnce(Return(std::optional<process::ProcessId>(502)));

    auto sup = make_supervisor();
    auto result = sup.start("--bad-flag");

    EXPECT_EQ(result.outcome, StartOutcome::EXITED_EARLY);
    EXPECT_EQ(result.pid, 502);
    EXPECT_FALSE(pid_store_.read().has_value());
    EXPECT_FALSE(sup.status().running());
}

TEST_F(SupervisorTest, ZeroSettleDelaySkipsSleep) {
    config_.settle_delay_ms = 0;
    EXPECT_CALL(launcher_, launch(_, _)).WillOnce(Invoke([this](auto &, auto &) {
        alive_.insert(503);
        return std::optional<process::ProcessId>(503);
    }));

    auto sup = make_supervisor();
    EXPECT_EQ(sup.start("ping").outcome, StartOutcome::STARTED);
    EXPECT_EQ(settled_, 0ms);
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------

TEST_F(SupervisorTest, StopWithNothingTrackedIsANoOp) {
    EXPECT_CALL(signaller_, request_stop(_)).Times(0);

    auto sup = make_supervisor();
    auto result = sup.stop();
    EXPECT_EQ(result.outcome, StopOutcome::NOTHING_TO_STOP);
    EXPECT_FALSE(result.pid.has_value());
}

TEST_F(SupervisorTest, StopTerminatesAndClearsRecord) {
    seed_record(700);
    alive_.insert(700);
    EXPECT_CALL(signaller_, request_stop(700)).WillOnce(Invoke([this](process::ProcessId pid) {
        alive_.erase(pid);
        return process::SignalResult::DELIVERED;
    }));

    auto sup = make_supervisor();
    auto result = sup.stop();

    EXPECT_EQ(result.outcome, StopOutcome::STOPPED);
    EXPECT_EQ(result.pid, 700);
    EXPECT_EQ(result.termination, process::TerminationOutcome::STOPPED_GRACEFULLY);
    EXPECT_FALSE(pid_store_.read_record().has_value());

    // Second stop is idempotent
    EXPECT_EQ(sup.stop().outcome, StopOutcome::NOTHING_TO_STOP);
}

TEST_F(SupervisorTest, StopEscalatesToForcedKill) {
    seed_record(701);
    alive_.insert(701);
    EXPECT_CALL(signaller_, request_stop(701)).WillOnce(Return(process::SignalResult::DELIVERED));
    EXPECT_CALL(signaller_, force_kill(701)).WillOnce(Invoke([this](process::ProcessId pid) {
        alive_.erase(pid);
        return process::SignalResult::DELIVERED;
    }));

    auto sup = make_supervisor();
    auto result = sup.stop();
    EXPECT_EQ(result.outcome, StopOutcome::STOPPED);
    EXPECT_EQ(result.termination, process::TerminationOutcome::STOPPED_FORCEFULLY);
}

TEST_F(SupervisorTest, ProcessVanishingDuringStopIsAlreadyGone) {
    seed_record(702);
    alive_.insert(702);
    EXPECT_CALL(signaller_, request_stop(702)).WillOnce(Return(process::SignalResult::NO_SUCH_PROCESS));

    auto sup = make_supervisor();
    EXPECT_EQ(sup.stop().outcome, StopOutcome::ALREADY_GONE);
    EXPECT_FALSE(pid_store_.read_record().has_value());
}

TEST_F(SupervisorTest, SurvivorIsReportedButRecordStillCleared) {
    seed_record(703);
    alive_.insert(703);
    EXPECT_CALL(signaller_, request_stop(703)).WillOnce(Return(process::SignalResult::DELIVERED));
    EXPECT_CALL(signaller_, force_kill(703)).WillOnce(Return(process::SignalResult::FAILED));

    auto sup = make_supervisor();
    EXPECT_EQ(sup.stop().outcome, StopOutcome::STILL_RUNNING);
    EXPECT_FALSE(pid_store_.read_record().has_value());
}

// ---------------------------------------------------------------------------
// status / log / clean
// ---------------------------------------------------------------------------

TEST_F(SupervisorTest, StatusReportsTrackedProcessWithStartTime) {
    std::string error;
    ASSERT_TRUE(log_sink_.begin_session(error).has_value()) << error;
    seed_record(800);
    alive_.insert(800);

    auto sup = make_supervisor();
    auto report = sup.status();

    ASSERT_TRUE(report.running());
    EXPECT_EQ(report.tracked->pid, 800);
    EXPECT_EQ(report.tracked->log_path, dir_.file("worker.log"));
    EXPECT_TRUE(report.tracked->started_at.has_value());
}

TEST_F(SupervisorTest, StatusIsReadOnly) {
    seed_record(801);  // dead

    auto sup = make_supervisor();
    EXPECT_FALSE(sup.status().running());
    // The stale record is not cleaned up by a status query
    EXPECT_EQ(pid_store_.read_record(), 801);
}

TEST_F(SupervisorTest, LogBeforeAnySessionIsAbsent) {
    auto sup = make_supervisor();
    EXPECT_FALSE(sup.log().has_value());
}

TEST_F(SupervisorTest, LogSurvivesStop) {
    EXPECT_CALL(launcher_, launch(_, _)).WillOnce(Invoke([this](auto &, auto &) {
        alive_.insert(804);
        return std::optional<process::ProcessId>(804);
    }));
    EXPECT_CALL(signaller_, request_stop(804)).WillOnce(Invoke([this](process::ProcessId pid) {
        alive_.erase(pid);
        return process::SignalResult::DELIVERED;
    }));

    auto sup = make_supervisor();
    ASSERT_EQ(sup.start("ping").outcome, StartOutcome::STARTED);
    ASSERT_EQ(sup.stop().outcome, StopOutcome::STOPPED);

    auto log = sup.log();
    ASSERT_TRUE(log.has_value());
    EXPECT_NE(log->find("=== worker started at"), std::string::npos);
}

TEST_F(SupervisorTest, CleanRefusesWhileRunning) {
    seed_record(805);
    alive_.insert(805);
    std::string error;
    ASSERT_TRUE(log_sink_.begin_session(error).has_value());

    auto sup = make_supervisor();
    EXPECT_EQ(sup.clean(error), CleanOutcome::REFUSED_RUNNING);
    EXPECT_TRUE(log_sink_.exists());
    EXPECT_EQ(pid_store_.read(), 805);
}

TEST_F(SupervisorTest, CleanRemovesStaleRecordAndLog) {
    seed_record(806);
    std::string error;
    ASSERT_TRUE(log_sink_.begin_session(error).has_value());

    auto sup = make_supervisor();
    EXPECT_EQ(sup.clean(error), CleanOutcome::CLEANED) << error;
    EXPECT_FALSE(log_sink_.exists());
    EXPECT_FALSE(pid_store_.read_record().has_value());

    // Nothing left to clean is still a success
    EXPECT_EQ(sup.clean(error), CleanOutcome::CLEANED);
}

// ---------------------------------------------------------------------------
// run_in_foreground
// ---------------------------------------------------------------------------

TEST_F(SupervisorTest, ForegroundRunStopsOnBuildFailure) {
    EXPECT_CALL(build_, run()).WillOnce(Return(4));

    auto sup = make_supervisor();
    std::string error;
    EXPECT_EQ(sup.run_in_foreground("ping", {}, error), 4);
    EXPECT_FALSE(error.empty());
}

#ifndef _WIN32
TEST_F(SupervisorTest, ForegroundRunReturnsWorkerStatus) {
    config_.executable = dir_.write_script("fg.sh", "[ \"$1\" = --flag ] && [ \"$2\" = ping ] && exit 5\nexit 1\n");

    auto sup = make_supervisor();
    std::string error;
    EXPECT_EQ(sup.run_in_foreground("ping", {"--flag"}, error), 5);
    EXPECT_FALSE(pid_store_.read_record().has_value());
    EXPECT_FALSE(log_sink_.exists());
}
#endif

TEST(SupervisorHelpersTest, WorkerArgumentsPutPromptLast) {
    EXPECT_EQ(build_worker_arguments({}, "p"), (std::vector<std::string>{"p"}));
    EXPECT_EQ(build_worker_arguments({"-a", "-b"}, "p"), (std::vector<std::string>{"-a", "-b", "p"}));
}

TEST(SupervisorHelpersTest, TerminationConfigMapsToPolicy) {
    TerminationConfig config;
    config.graceful_timeout_ms = 1234;
    config.forceful_timeout_ms = 567;
    config.poll_interval_ms = 89;

    auto policy = to_termination_policy(config);
    EXPECT_EQ(policy.graceful_timeout, 1234ms);
    EXPECT_EQ(policy.forceful_timeout, 567ms);
    EXPECT_EQ(policy.poll_interval, 89ms);
}

TEST(SupervisorHelpersTest, OutcomeNames) {
    EXPECT_STREQ(start_outcome_to_string(StartOutcome::EXITED_EARLY), "EXITED_EARLY");
    EXPECT_STREQ(stop_outcome_to_string(StopOutcome::NOTHING_TO_STOP), "NOTHING_TO_STOP");
    EXPECT_STREQ(clean_outcome_to_string(CleanOutcome::REFUSED_RUNNING), "REFUSED_RUNNING");
}
