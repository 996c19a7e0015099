#include "request_coordinator.h"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {
    // Holds compute calls until opened.
    class Gate {
    private:
        std::mutex mutex;
        std::condition_variable cv;
        bool open = false;

    public:
        void Open() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                open = true;
            }
            cv.notify_all();
        }
        void Wait() {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return open; });
        }
    };

    // Records which profiles ran, and with which config, on the worker thread.
    struct ComputeLog {
        std::mutex mutex;
        std::vector<std::string> profiles;
        std::vector<uint32_t> starts;

        std::vector<std::string> Profiles() {
            std::lock_guard<std::mutex> lock(mutex);
            return profiles;
        }
        std::vector<uint32_t> Starts() {
            std::lock_guard<std::mutex> lock(mutex);
            return starts;
        }
    };

    ComputeFunction Recording(std::shared_ptr<ComputeLog> log, std::shared_ptr<Gate> gate) {
        return [log, gate](const ConversionRequest& request, const QuantizationConfig& config, const ProgressCallback& progress) {
            if (gate) gate->Wait();
            {
                std::lock_guard<std::mutex> lock(log->mutex);
                log->profiles.push_back(request.profile);
                log->starts.push_back(config.kmeansStarts);
            }
            progress(100);
            ProcessResult result;
            result.pixels = request.pixels;
            return result;
        };
    }

    CoordinatorRequest Make(const std::string& profile, const std::string& source = "image.png") {
        CoordinatorRequest request;
        request.conversion.pixels = PixelBuffer(2, 2);
        request.conversion.profile = profile;
        request.sourceId = source;
        return request;
    }
}

TEST(RequestCoordinator, KeyCarriesEveryField) {
    CoordinatorRequest request = Make("megadrive", "a.png");
    request.resolution = "320x224";
    request.scalingMode = "fit";
    request.paletteKey = "custom";
    EXPECT_EQ(RequestCoordinator::BuildRequestKey(request, false), "a.png|megadrive|320x224|fit|custom|force=0");
    EXPECT_EQ(RequestCoordinator::BuildRequestKey(request, true), "a.png|megadrive|320x224|fit|custom|force=1");
}

TEST(RequestCoordinator, KeyHashesPixelsWithoutSourceId) {
    CoordinatorRequest a = Make("megadrive", "");
    CoordinatorRequest b = Make("megadrive", "");
    b.conversion.pixels.data[0] = 1;
    const std::string keyA = RequestCoordinator::BuildRequestKey(a, false);
    EXPECT_EQ(keyA.rfind("px:", 0), 0u);
    EXPECT_EQ(keyA, RequestCoordinator::BuildRequestKey(a, false));
    EXPECT_NE(keyA, RequestCoordinator::BuildRequestKey(b, false));
}

TEST(RequestCoordinator, SecondRequestWaitsForTheFirst) {
    auto log = std::make_shared<ComputeLog>();
    auto gate = std::make_shared<Gate>();
    RequestCoordinator coordinator(QuantizationConfig(), Recording(log, gate), 10ms);

    EXPECT_EQ(coordinator.Schedule(Make("megadrive")), ScheduleOutcome::Dispatched);
    EXPECT_TRUE(coordinator.IsInFlight());
    EXPECT_EQ(coordinator.Schedule(Make("gameGear")), ScheduleOutcome::Deferred);
    EXPECT_TRUE(coordinator.HasPending());
    EXPECT_EQ(coordinator.DispatchCount(), 1u);

    gate->Open();
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    EXPECT_EQ(coordinator.DispatchCount(), 2u);
    EXPECT_EQ(log->Profiles(), (std::vector<std::string>{ "megadrive", "gameGear" }));
}

TEST(RequestCoordinator, OnlyTheLatestPendingRequestRuns) {
    auto log = std::make_shared<ComputeLog>();
    auto gate = std::make_shared<Gate>();
    RequestCoordinator coordinator(QuantizationConfig(), Recording(log, gate), 10ms);

    std::vector<uint64_t> completed;
    coordinator.SetCompletionHandler([&completed](const CompletedEvent& e) { completed.push_back(e.jobId); });

    EXPECT_EQ(coordinator.Schedule(Make("megadrive")), ScheduleOutcome::Dispatched);
    EXPECT_EQ(coordinator.Schedule(Make("gameGear")), ScheduleOutcome::Deferred);
    EXPECT_EQ(coordinator.Schedule(Make("masterSystem")), ScheduleOutcome::Deferred);

    gate->Open();
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    EXPECT_EQ(log->Profiles(), (std::vector<std::string>{ "megadrive", "masterSystem" }));
    EXPECT_EQ(completed, (std::vector<uint64_t>{ 1, 2 }));
}

TEST(RequestCoordinator, PendingRequestMatchingTheFinishedOneIsDropped) {
    auto log = std::make_shared<ComputeLog>();
    auto gate = std::make_shared<Gate>();
    RequestCoordinator coordinator(QuantizationConfig(), Recording(log, gate), 10ms);

    EXPECT_EQ(coordinator.Schedule(Make("megadrive")), ScheduleOutcome::Dispatched);
    EXPECT_EQ(coordinator.Schedule(Make("megadrive")), ScheduleOutcome::Deferred);
    gate->Open();
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    EXPECT_EQ(coordinator.DispatchCount(), 1u);
    EXPECT_FALSE(coordinator.HasPending());
}

TEST(RequestCoordinator, RepeatedRequestIsSkippedUnlessForced) {
    auto log = std::make_shared<ComputeLog>();
    RequestCoordinator coordinator(QuantizationConfig(), Recording(log, nullptr), 10ms);

    EXPECT_EQ(coordinator.Schedule(Make("megadrive")), ScheduleOutcome::Dispatched);
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    EXPECT_EQ(coordinator.Schedule(Make("megadrive")), ScheduleOutcome::Skipped);
    EXPECT_EQ(coordinator.Schedule(Make("megadrive"), true), ScheduleOutcome::Dispatched);
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    EXPECT_EQ(coordinator.DispatchCount(), 2u);
    EXPECT_EQ(log->Profiles().size(), 2u);
}

TEST(RequestCoordinator, ConfigUpdatesReachLaterJobs) {
    auto log = std::make_shared<ComputeLog>();
    QuantizationConfig config;
    config.kmeansStarts = 3;
    RequestCoordinator coordinator(config, Recording(log, nullptr), 10ms);

    coordinator.Schedule(Make("megadrive"));
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));

    config.kmeansStarts = 5;
    coordinator.UpdateConfig(config);
    // Same request again: no longer a repeat once the config has changed.
    EXPECT_EQ(coordinator.Schedule(Make("megadrive")), ScheduleOutcome::Dispatched);
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    EXPECT_EQ(log->Starts(), (std::vector<uint32_t>{ 3, 5 }));
}

TEST(RequestCoordinator, FailuresAreReportedAndReleaseTheSlot) {
    ComputeFunction failing = [](const ConversionRequest&, const QuantizationConfig&, const ProgressCallback&) -> ProcessResult {
        throw std::runtime_error("boom");
    };
    RequestCoordinator coordinator(QuantizationConfig(), failing, 10ms);

    std::vector<FailureEvent> failures;
    coordinator.SetFailureHandler([&failures](const FailureEvent& e) { failures.push_back(e); });

    coordinator.Schedule(Make("megadrive"));
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].jobId, 1u);
    EXPECT_EQ(failures[0].message, "boom");
    EXPECT_EQ(failures[0].stage, "convert");
    EXPECT_FALSE(coordinator.IsInFlight());

    EXPECT_EQ(coordinator.Schedule(Make("gameGear")), ScheduleOutcome::Dispatched);
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    EXPECT_EQ(failures.size(), 2u);
}

TEST(RequestCoordinator, NonStandardExceptionsAreReportedToo) {
    ComputeFunction failing = [](const ConversionRequest&, const QuantizationConfig&, const ProgressCallback&) -> ProcessResult {
        throw 42;
    };
    RequestCoordinator coordinator(QuantizationConfig(), failing, 10ms);

    std::vector<FailureEvent> failures;
    coordinator.SetFailureHandler([&failures](const FailureEvent& e) { failures.push_back(e); });

    coordinator.Schedule(Make("megadrive"));
    ASSERT_TRUE(coordinator.WaitUntilIdle(5s));
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].message, "unknown exception");
    EXPECT_EQ(failures[0].stage, "convert");
    EXPECT_FALSE(coordinator.IsInFlight());
}

TEST(RequestCoordinator, DefaultComputeRunsTheConverter) {
    RequestCoordinator coordinator;

    std::vector<int> progress;
    std::vector<ProcessResult> results;
    coordinator.SetProgressHandler([&progress](const ProgressEvent& e) { progress.push_back(e.percent); });
    coordinator.SetCompletionHandler([&results](const CompletedEvent& e) { results.push_back(e.result); });

    CoordinatorRequest request = Make("cga1");
    for (size_t i = 0; i < 4; ++i) request.conversion.pixels.data[i * 4 + 3] = 255;
    coordinator.Schedule(request);
    ASSERT_TRUE(coordinator.WaitUntilIdle(30s));

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].usedFixedPalette);
    EXPECT_EQ(results[0].palette.size(), 4u);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), 100);
}

TEST(RequestCoordinator, ConversionErrorsBecomeFailures) {
    RequestCoordinator coordinator;
    std::vector<FailureEvent> failures;
    coordinator.SetFailureHandler([&failures](const FailureEvent& e) { failures.push_back(e); });

    coordinator.Schedule(Make("not-a-profile"));
    ASSERT_TRUE(coordinator.WaitUntilIdle(30s));
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_NE(failures[0].message.find("not-a-profile"), std::string::npos);
}
