// ============================================================================
// SERVICE UNIT TESTS
// ============================================================================
// Start/Stop/List/Status, lifecycle updates, admission and shutdown.
// Pipelines are scripted: each test reports transitions by hand.
// ============================================================================

#include <gtest/gtest.h>
#include <egress/core/service/service.hpp>
#include <egress/core/events/local_bus.hpp>
#include <egress/core/codec/egress_codec.hpp>
#include <egress/core/errors.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Egress;
using namespace std::chrono_literals;

// ============================================================================
// TEST DOUBLES
// ============================================================================

class ScriptedPipeline : public Pipeline {
public:
    ScriptedPipeline(std::string id, PipelineListener& listener, bool abort_on_kill,
                     bool throw_on_start = false)
        : id_(std::move(id)), listener_(listener), abort_on_kill_(abort_on_kill),
          throw_on_start_(throw_on_start) {}

    void start() override {
        if (throw_on_start_) {
            throw std::runtime_error("thread creation failed");
        }
        started.store(true);
    }
    void stop() override { stop_calls.fetch_add(1); }
    void kill() override {
        kill_calls.fetch_add(1);
        if (abort_on_kill_) {
            listener_.onPipelineStatus(id_, EgressStatus::ABORTED, "pipeline killed");
        }
    }

    std::atomic<bool> started{false};
    std::atomic<int> stop_calls{0};
    std::atomic<int> kill_calls{0};

private:
    std::string id_;
    PipelineListener& listener_;
    bool abort_on_kill_;
    bool throw_on_start_;
};

class ScriptedFactory : public PipelineFactory {
public:
    PipelinePtr create(const std::string& egress_id,
                       const StartEgressRequest&,
                       PipelineListener& listener) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (fail_next) {
            fail_next = false;
            throw std::runtime_error("encoder unavailable");
        }
        auto p = std::make_shared<ScriptedPipeline>(egress_id, listener, abort_on_kill, throw_on_start);
        pipelines[egress_id] = p;
        return p;
    }

    bool fail_next = false;
    bool abort_on_kill = true;
    bool throw_on_start = false;
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<ScriptedPipeline>> pipelines;
};

// Holds create() until open() so a test can act while a start is in flight
class GatedFactory : public PipelineFactory {
public:
    PipelinePtr create(const std::string& egress_id,
                       const StartEgressRequest&,
                       PipelineListener& listener) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return open_; });
        pipeline = std::make_shared<ScriptedPipeline>(egress_id, listener, true);
        return pipeline;
    }

    void waitEntered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return entered_; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    std::shared_ptr<ScriptedPipeline> pipeline;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool open_ = false;
};

class FakeCpuSampler : public CpuSampler {
public:
    void start(IdleCallback callback) override { callback_ = std::move(callback); }
    void stop() override { stopped = true; }
    void push(double idle) { callback_(idle); }

    bool stopped = false;

private:
    IdleCallback callback_;
};

// ============================================================================
// FIXTURE
// ============================================================================

class ServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.node_id = "test-node";
        options.num_cpus = 4.0;
        options.update_topic = "updates";
        options.shutdown_timeout = 2000ms;
        options.terminal_retention = 100ms;
    }

    void TearDown() override {
        service.reset();
    }

    void startService(CpuSampler* sampler = nullptr) {
        service = std::make_unique<Service>(options, bus, factory, registry);
        service->start(sampler);
    }

    static StartEgressRequest roomComposite() {
        StartEgressRequest req;
        req.room_id = "RM_standup";
        req.ws_url = "wss://media.example.test";
        req.payload = RoomCompositeRequest{"standup", "grid", "/out/standup.mp4"};
        return req;
    }

    static StartEgressRequest track() {
        StartEgressRequest req;
        req.room_id = "RM_standup";
        req.payload = TrackRequest{"TR_audio", "/out/audio.ogg"};
        return req;
    }

    static std::vector<EgressStatus> drain(const SubscriptionPtr& sub) {
        std::vector<EgressStatus> seen;
        while (auto msg = sub->tryNext()) {
            seen.push_back(Codec::decodeEgressInfo(*msg).status);
        }
        return seen;
    }

    static ErrorCode codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const EgressError& e) {
            return e.code();
        }
        return ErrorCode::OK;
    }

    ServiceOptions options;
    MetricRegistry registry;
    LocalBus bus;
    ScriptedFactory factory;
    std::unique_ptr<Service> service;
};

// ============================================================================
// START / STOP / LIST
// ============================================================================

TEST_F(ServiceTest, StartReturnsStartingAndPublishes) {
    startService();
    auto updates = service->publisher().subscribeAll();

    EgressInfo info = service->startEgress(track());
    EXPECT_EQ(info.status, EgressStatus::STARTING);
    EXPECT_EQ(info.egress_id.rfind("EG_", 0), 0u);
    EXPECT_EQ(info.room_id, "RM_standup");
    EXPECT_EQ(info.kind, RequestKind::TRACK);
    EXPECT_TRUE(factory.pipelines.at(info.egress_id)->started.load());

    EXPECT_EQ(drain(updates), std::vector<EgressStatus>{EgressStatus::STARTING});
    EXPECT_EQ(registry.getSnapshot("track")->active_requests, 1);
}

TEST_F(ServiceTest, EgressIdsAreUnique) {
    options.num_cpus = 64.0;
    startService();
    auto a = service->startEgress(track());
    auto b = service->startEgress(track());
    EXPECT_NE(a.egress_id, b.egress_id);
    EXPECT_EQ(service->listEgress().size(), 2u);
}

TEST_F(ServiceTest, FullLifecycleThenEviction) {
    startService();
    auto updates = service->publisher().subscribeAll();

    EgressInfo info = service->startEgress(track());
    const std::string id = info.egress_id;
    auto job_updates = service->publisher().subscribeJob(id);

    service->onPipelineStatus(id, EgressStatus::ACTIVE, "");
    EgressInfo stopping = service->stopEgress(id);
    EXPECT_EQ(stopping.status, EgressStatus::ENDING);
    EXPECT_EQ(factory.pipelines.at(id)->stop_calls.load(), 1);

    service->onPipelineStatus(id, EgressStatus::COMPLETE, "");

    EXPECT_EQ(drain(updates), (std::vector<EgressStatus>{EgressStatus::STARTING, EgressStatus::ACTIVE,
                                                         EgressStatus::ENDING, EgressStatus::COMPLETE}));
    EXPECT_EQ(drain(job_updates), (std::vector<EgressStatus>{EgressStatus::ACTIVE,
                                                             EgressStatus::ENDING, EgressStatus::COMPLETE}));

    auto done = service->getEgress(id);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->status, EgressStatus::COMPLETE);
    EXPECT_GT(done->started_at, 0);
    EXPECT_GE(done->ended_at, done->started_at);
    EXPECT_TRUE(done->error.empty());

    // Retained for terminal_retention, then gone
    std::this_thread::sleep_for(options.terminal_retention + 300ms);
    for (const auto& e : service->listEgress()) {
        EXPECT_NE(e.egress_id, id);
    }
    EXPECT_FALSE(service->getEgress(id).has_value());
}

TEST_F(ServiceTest, StopBeforeActiveGoesToEnding) {
    startService();
    auto info = service->startEgress(track());
    EXPECT_EQ(service->stopEgress(info.egress_id).status, EgressStatus::ENDING);

    // A late ACTIVE report is dropped
    service->onPipelineStatus(info.egress_id, EgressStatus::ACTIVE, "");
    EXPECT_EQ(service->getEgress(info.egress_id)->status, EgressStatus::ENDING);
    EXPECT_EQ(service->getEgress(info.egress_id)->started_at, 0);
}

TEST_F(ServiceTest, StopTwiceIsInvalidStateWithoutNewUpdate) {
    startService();
    auto info = service->startEgress(track());
    service->stopEgress(info.egress_id);

    auto updates = service->publisher().subscribeJob(info.egress_id);
    EXPECT_EQ(codeOf([&]() { service->stopEgress(info.egress_id); }), ErrorCode::INVALID_STATE);
    EXPECT_TRUE(drain(updates).empty());
    EXPECT_EQ(factory.pipelines.at(info.egress_id)->stop_calls.load(), 1);
}

TEST_F(ServiceTest, StopTerminalJobIsInvalidState) {
    options.terminal_retention = 10000ms;
    startService();
    auto info = service->startEgress(track());
    service->onPipelineStatus(info.egress_id, EgressStatus::ABORTED, "encoder crashed");

    EXPECT_EQ(codeOf([&]() { service->stopEgress(info.egress_id); }), ErrorCode::INVALID_STATE);
}

TEST_F(ServiceTest, StopUnknownJobIsNotFound) {
    startService();
    EXPECT_EQ(codeOf([&]() { service->stopEgress("EG_missing"); }), ErrorCode::NOT_FOUND);
}

TEST_F(ServiceTest, OutOfOrderReportIsDropped) {
    startService();
    auto info = service->startEgress(track());
    auto updates = service->publisher().subscribeJob(info.egress_id);

    service->onPipelineStatus(info.egress_id, EgressStatus::COMPLETE, "");
    EXPECT_EQ(service->getEgress(info.egress_id)->status, EgressStatus::STARTING);
    EXPECT_TRUE(drain(updates).empty());

    // Reports for unknown jobs are ignored too
    EXPECT_NO_THROW(service->onPipelineStatus("EG_missing", EgressStatus::ACTIVE, ""));
}

TEST_F(ServiceTest, PipelineFailureAbortsWithError) {
    startService();
    auto info = service->startEgress(track());
    service->onPipelineStatus(info.egress_id, EgressStatus::ACTIVE, "");
    service->onPipelineStatus(info.egress_id, EgressStatus::ABORTED, "encoder crashed");

    auto aborted = service->getEgress(info.egress_id);
    ASSERT_TRUE(aborted.has_value());
    EXPECT_EQ(aborted->status, EgressStatus::ABORTED);
    EXPECT_EQ(aborted->error, "encoder crashed");

    auto snap = registry.getSnapshot("track");
    EXPECT_EQ(snap->active_requests, 0);
    EXPECT_EQ(snap->total_aborted, 1u);
}

TEST_F(ServiceTest, FactoryFailureCreatesNoJob) {
    startService();
    factory.fail_next = true;
    EXPECT_EQ(codeOf([&]() { service->startEgress(track()); }), ErrorCode::PIPELINE_FAILURE);
    EXPECT_TRUE(service->listEgress().empty());
}

TEST_F(ServiceTest, PipelineStartFailureAbortsJob) {
    options.terminal_retention = 10000ms;
    startService();
    auto updates = service->publisher().subscribeAll();

    factory.throw_on_start = true;
    EXPECT_EQ(codeOf([&]() { service->startEgress(track()); }), ErrorCode::PIPELINE_FAILURE);

    auto jobs = service->listEgress();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].status, EgressStatus::ABORTED);
    EXPECT_EQ(jobs[0].error, "thread creation failed");
    EXPECT_EQ(service->jobs().liveCount(), 0u);
    EXPECT_EQ(drain(updates), (std::vector<EgressStatus>{EgressStatus::STARTING, EgressStatus::ABORTED}));

    auto snap = registry.getSnapshot("track");
    EXPECT_EQ(snap->active_requests, 0);
    EXPECT_EQ(snap->total_aborted, 1u);
}

// ============================================================================
// ADMISSION
// ============================================================================

TEST_F(ServiceTest, RoomCompositeBurstOnFourCores) {
    startService();

    auto first = service->startEgress(roomComposite());
    EXPECT_EQ(first.status, EgressStatus::STARTING);
    EXPECT_DOUBLE_EQ(service->admission().pendingReservation(), 3.0);

    EXPECT_EQ(codeOf([&]() { service->startEgress(roomComposite()); }), ErrorCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(service->listEgress().size(), 1u);
    EXPECT_EQ(registry.getSnapshot("room_composite")->total_rejected, 1u);

    std::this_thread::sleep_for(AdmissionController::kReservationHold + 300ms);
    EXPECT_EQ(service->startEgress(roomComposite()).status, EgressStatus::STARTING);
}

TEST_F(ServiceTest, ConcurrentRoomCompositeBurstAdmitsOne) {
    startService();

    constexpr int kThreads = 8;
    std::atomic<bool> go{false};
    std::atomic<int> accepted{0};
    std::atomic<int> exhausted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            ErrorCode code = codeOf([&]() { service->startEgress(roomComposite()); });
            if (code == ErrorCode::OK) {
                accepted.fetch_add(1);
            } else if (code == ErrorCode::RESOURCE_EXHAUSTED) {
                exhausted.fetch_add(1);
            }
        });
    }
    go.store(true);
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(exhausted.load(), kThreads - 1);
    EXPECT_EQ(service->listEgress().size(), 1u);
    EXPECT_EQ(factory.pipelines.size(), 1u);
    EXPECT_EQ(registry.getSnapshot("room_composite")->total_rejected, static_cast<uint64_t>(kThreads - 1));
    EXPECT_DOUBLE_EQ(service->admission().pendingReservation(), 3.0);
}

TEST_F(ServiceTest, SamplerDrivesAdmission) {
    FakeCpuSampler sampler;
    startService(&sampler);
    EXPECT_TRUE(registry.node().available.load());

    sampler.push(0.5);
    EXPECT_FALSE(registry.node().available.load());
    EXPECT_EQ(codeOf([&]() { service->startEgress(track()); }), ErrorCode::RESOURCE_EXHAUSTED);
    EXPECT_DOUBLE_EQ(service->admission().loadPercent(), 87.5);

    sampler.push(3.5);
    EXPECT_EQ(service->startEgress(track()).status, EgressStatus::STARTING);

    // The sampler must outlive the service
    service.reset();
    EXPECT_TRUE(sampler.stopped);
}

TEST_F(ServiceTest, StartFailsWhenCpusCannotServeAnyType) {
    options.num_cpus = 0.5;
    service = std::make_unique<Service>(options, bus, factory, registry);
    EXPECT_EQ(codeOf([&]() { service->start(); }), ErrorCode::CONFIG_ERROR);
    EXPECT_FALSE(service->isAccepting());
}

TEST_F(ServiceTest, StartBeforeServiceStartIsUnavailable) {
    service = std::make_unique<Service>(options, bus, factory, registry);
    EXPECT_EQ(codeOf([&]() { service->startEgress(track()); }), ErrorCode::UNAVAILABLE);
}

// ============================================================================
// STATUS
// ============================================================================

TEST_F(ServiceTest, IdleStatusHasOnlyCpuLoad) {
    startService();
    auto status = service->statusJson();
    ASSERT_TRUE(status.contains("CpuLoad"));
    EXPECT_EQ(status.size(), 1u);
    EXPECT_DOUBLE_EQ(status["CpuLoad"].get<double>(), 0.0);
}

TEST_F(ServiceTest, StatusListsLiveJobs) {
    options.terminal_retention = 10000ms;
    options.num_cpus = 16.0;
    startService();
    auto live = service->startEgress(track());
    auto dead = service->startEgress(track());
    service->onPipelineStatus(live.egress_id, EgressStatus::ACTIVE, "");
    service->onPipelineStatus(dead.egress_id, EgressStatus::ABORTED, "x");

    auto status = service->statusJson();
    ASSERT_TRUE(status.contains(live.egress_id));
    EXPECT_FALSE(status.contains(dead.egress_id));
    EXPECT_EQ(status[live.egress_id]["status"], "EGRESS_ACTIVE");
    EXPECT_EQ(status[live.egress_id]["roomId"], "RM_standup");
    EXPECT_EQ(status[live.egress_id]["type"], "track");

    auto parsed = nlohmann::json::parse(service->status());
    EXPECT_TRUE(parsed.contains("CpuLoad"));
}

// ============================================================================
// SHUTDOWN
// ============================================================================

TEST_F(ServiceTest, GracefulShutdownWaitsForJobsToFinish) {
    startService();
    auto info = service->startEgress(track());
    service->onPipelineStatus(info.egress_id, EgressStatus::ACTIVE, "");

    std::thread finisher([this, id = info.egress_id]() {
        std::this_thread::sleep_for(100ms);
        service->onPipelineStatus(id, EgressStatus::ENDING, "");
        service->onPipelineStatus(id, EgressStatus::COMPLETE, "");
    });
    service->shutdown(true);
    finisher.join();

    EXPECT_FALSE(service->isAccepting());
    EXPECT_EQ(service->getEgress(info.egress_id)->status, EgressStatus::COMPLETE);
    EXPECT_EQ(factory.pipelines.at(info.egress_id)->kill_calls.load(), 0);
}

TEST_F(ServiceTest, GracefulShutdownTimesOutThenKills) {
    options.shutdown_timeout = 100ms;
    startService();
    auto info = service->startEgress(track());

    service->shutdown(true);
    EXPECT_EQ(factory.pipelines.at(info.egress_id)->kill_calls.load(), 1);
    EXPECT_EQ(service->getEgress(info.egress_id)->status, EgressStatus::ABORTED);
}

TEST_F(ServiceTest, ImmediateShutdownKillsPipelines) {
    FakeCpuSampler sampler;
    startService(&sampler);
    auto info = service->startEgress(track());
    service->onPipelineStatus(info.egress_id, EgressStatus::ACTIVE, "");

    service->shutdown(false);
    EXPECT_TRUE(sampler.stopped);
    EXPECT_EQ(factory.pipelines.at(info.egress_id)->kill_calls.load(), 1);

    auto aborted = service->getEgress(info.egress_id);
    EXPECT_EQ(aborted->status, EgressStatus::ABORTED);
    EXPECT_EQ(aborted->error, "pipeline killed");
    EXPECT_FALSE(registry.node().available.load());
    service.reset();
}

TEST_F(ServiceTest, ShutdownForcesAbortWhenPipelineIgnoresKill) {
    factory.abort_on_kill = false;
    startService();
    auto info = service->startEgress(track());

    service->shutdown(false);
    auto aborted = service->getEgress(info.egress_id);
    EXPECT_EQ(aborted->status, EgressStatus::ABORTED);
    EXPECT_EQ(aborted->error, "shutdown");
}

TEST_F(ServiceTest, StartAfterShutdownIsUnavailable) {
    startService();
    service->shutdown(true);
    service->shutdown(false);   // second call is a no-op
    EXPECT_EQ(codeOf([&]() { service->startEgress(track()); }), ErrorCode::UNAVAILABLE);
}

TEST_F(ServiceTest, ShutdownWaitsForStartInProgress) {
    GatedFactory gated;
    service = std::make_unique<Service>(options, bus, gated, registry);
    service->start();

    ErrorCode start_code = ErrorCode::UNAVAILABLE;
    std::thread starter([&]() {
        start_code = codeOf([&]() { service->startEgress(track()); });
    });
    gated.waitEntered();

    std::atomic<bool> shutdown_done{false};
    std::thread stopper([&]() {
        service->shutdown(false);
        shutdown_done.store(true);
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(shutdown_done.load());

    gated.open();
    starter.join();
    stopper.join();

    // The start that was already admitted is seen and killed by shutdown
    EXPECT_EQ(start_code, ErrorCode::OK);
    ASSERT_NE(gated.pipeline, nullptr);
    EXPECT_TRUE(gated.pipeline->started.load());
    EXPECT_EQ(gated.pipeline->kill_calls.load(), 1);
    EXPECT_EQ(service->jobs().liveCount(), 0u);
    for (const auto& info : service->listEgress()) {
        EXPECT_EQ(info.status, EgressStatus::ABORTED);
    }

    EXPECT_EQ(codeOf([&]() { service->startEgress(track()); }), ErrorCode::UNAVAILABLE);

    // The factory must outlive the service
    service.reset();
}
