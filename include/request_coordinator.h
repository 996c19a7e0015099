#pragma once

#include "palette_converter.h"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <variant>
#include <chrono>
#include <atomic>

// Everything that identifies one conversion for de-duplication.
struct CoordinatorRequest {
    ConversionRequest conversion;
    std::string sourceId;             // identity of the source image; pixels are hashed if empty
    std::string resolution = "original";
    std::string scalingMode = "none";
    std::string paletteKey;           // any palette setting not captured by the profile name
};

enum class ScheduleOutcome {
    Dispatched, // sent to the worker
    Deferred,   // stored as the single pending request
    Skipped     // same key as the last completed request, nothing in flight
};

struct ProgressEvent {
    uint64_t jobId = 0;
    int percent = 0;
};

struct CompletedEvent {
    uint64_t jobId = 0;
    std::string key;
    ProcessResult result;
};

struct FailureEvent {
    uint64_t jobId = 0;
    std::string key;
    std::string message;
    std::string stage;
};

using CoordinatorEvent = std::variant<ProgressEvent, CompletedEvent, FailureEvent>;

// The work a job performs on the background thread.
using ComputeFunction = std::function<ProcessResult(const ConversionRequest&, const QuantizationConfig&, const ProgressCallback&)>;

// Single-flight, take-latest scheduling of conversions.
//
// All public methods belong to the orchestrating thread. A single background worker
// runs the conversions; the two sides share nothing but the message queues. At most
// one job is in flight; requests arriving meanwhile replace one pending slot, which
// is dispatched after a short debounce once the running job reports back. There is no
// cancellation: a superseded job still runs to completion and its result is delivered.
class RETROPALETTE_API RequestCoordinator {
private:
    struct JobMessage {
        uint64_t jobId;
        std::string key;
        ConversionRequest request;
    };
    struct ConfigMessage {
        QuantizationConfig config;
    };
    struct ShutdownMessage {};
    using WorkerMessage = std::variant<JobMessage, ConfigMessage, ShutdownMessage>;

    struct PendingRequest {
        CoordinatorRequest request;
        bool force = false;
        std::string key;
    };

    // --- Worker side ---
    ComputeFunction compute;
    std::mutex inboxMutex;
    std::condition_variable inboxCv;
    std::deque<WorkerMessage> inbox;
    std::mutex outboxMutex;
    std::condition_variable outboxCv;
    std::deque<CoordinatorEvent> outbox;
    std::thread worker;

    void WorkerLoop(QuantizationConfig config);
    void PostToWorker(WorkerMessage message);
    void PostEvent(CoordinatorEvent event);

    // --- Orchestrator side ---
    bool inFlight = false;
    std::string inFlightKey;
    std::string lastKey;
    uint64_t nextJobId = 1;
    uint64_t dispatchCount = 0;
    std::optional<PendingRequest> pending;
    std::optional<std::chrono::steady_clock::time_point> debounceDeadline;
    std::chrono::milliseconds debounce;

    std::function<void(const ProgressEvent&)> onProgress;
    std::function<void(const CompletedEvent&)> onCompleted;
    std::function<void(const FailureEvent&)> onFailure;

    void Dispatch(const CoordinatorRequest& request, const std::string& key);
    void FinishInFlight(const std::string& key);
    bool FireDebouncedRequest();

public:
    RequestCoordinator(const QuantizationConfig& cfg = QuantizationConfig(), ComputeFunction fn = nullptr,
        std::chrono::milliseconds debounceDelay = std::chrono::milliseconds(100));
    ~RequestCoordinator();

    RequestCoordinator(const RequestCoordinator&) = delete;
    RequestCoordinator& operator=(const RequestCoordinator&) = delete;

    // source|profile|resolution|scaling|paletteKey|force=0/1
    static std::string BuildRequestKey(const CoordinatorRequest& request, bool force);

    ScheduleOutcome Schedule(const CoordinatorRequest& request, bool force = false);

    // Delivers queued worker events to the handlers and dispatches a debounced pending
    // request whose delay has elapsed. Returns the number of events delivered.
    size_t PumpEvents();

    // Pumps until nothing is in flight, pending, or debouncing. False on timeout.
    bool WaitUntilIdle(std::chrono::milliseconds timeout);

    // Applies to jobs dispatched after this call.
    void UpdateConfig(const QuantizationConfig& cfg);

    void SetProgressHandler(std::function<void(const ProgressEvent&)> handler) { onProgress = std::move(handler); }
    void SetCompletionHandler(std::function<void(const CompletedEvent&)> handler) { onCompleted = std::move(handler); }
    void SetFailureHandler(std::function<void(const FailureEvent&)> handler) { onFailure = std::move(handler); }

    bool IsInFlight() const { return inFlight; }
    bool HasPending() const { return pending.has_value(); }
    uint64_t DispatchCount() const { return dispatchCount; }
};
