#include "request_coordinator.h"
#include <iostream>
#include <sstream>
#include <iomanip>

namespace {
    // 64-bit FNV-1a over the dimensions and RGBA bytes.
    uint64_t HashPixels(const PixelBuffer& pixels) {
        uint64_t h = 14695981039346656037ull;
        auto mix = [&h](uint8_t byte) { h ^= byte; h *= 1099511628211ull; };
        for (int shift = 0; shift < 32; shift += 8) mix(static_cast<uint8_t>(pixels.width >> shift));
        for (int shift = 0; shift < 32; shift += 8) mix(static_cast<uint8_t>(pixels.height >> shift));
        for (uint8_t byte : pixels.data) mix(byte);
        return h;
    }

    ProcessResult DefaultCompute(const ConversionRequest& request, const QuantizationConfig& config, const ProgressCallback& progress) {
        RetroPaletteConverter converter(config);
        ConversionRequest job = request;
        job.progress = progress;
        return converter.Process(job);
    }
}

// =================================================================================================
// Lifetime
// =================================================================================================

RequestCoordinator::RequestCoordinator(const QuantizationConfig& cfg, ComputeFunction fn, std::chrono::milliseconds debounceDelay)
    : compute(fn ? std::move(fn) : ComputeFunction(DefaultCompute)), debounce(debounceDelay) {
    QuantizationConfig workerConfig = cfg;
    workerConfig.Sanitize();
    worker = std::thread(&RequestCoordinator::WorkerLoop, this, workerConfig);
}

RequestCoordinator::~RequestCoordinator() {
    PostToWorker(ShutdownMessage{});
    if (worker.joinable()) worker.join();
}

// =================================================================================================
// Worker side
// =================================================================================================

void RequestCoordinator::PostToWorker(WorkerMessage message) {
    {
        std::lock_guard<std::mutex> lock(inboxMutex);
        inbox.push_back(std::move(message));
    }
    inboxCv.notify_one();
}

void RequestCoordinator::PostEvent(CoordinatorEvent event) {
    {
        std::lock_guard<std::mutex> lock(outboxMutex);
        outbox.push_back(std::move(event));
    }
    outboxCv.notify_all();
}

// The worker owns its own copy of the config; updates arrive as messages, in order
// with the jobs they apply to.
void RequestCoordinator::WorkerLoop(QuantizationConfig config) {
    for (;;) {
        WorkerMessage message;
        {
            std::unique_lock<std::mutex> lock(inboxMutex);
            inboxCv.wait(lock, [this] { return !inbox.empty(); });
            message = std::move(inbox.front());
            inbox.pop_front();
        }

        if (std::holds_alternative<ShutdownMessage>(message)) return;

        if (auto* update = std::get_if<ConfigMessage>(&message)) {
            config = update->config;
            continue;
        }

        auto& job = std::get<JobMessage>(message);
        const uint64_t jobId = job.jobId;
        std::string stage = "convert";
        try {
            ProgressCallback progress = [this, jobId](int percent) { PostEvent(ProgressEvent{ jobId, percent }); };
            ProcessResult result = compute(job.request, config, progress);
            PostEvent(CompletedEvent{ jobId, job.key, std::move(result) });
        }
        catch (const std::exception& e) {
            PostEvent(FailureEvent{ jobId, job.key, e.what(), stage });
        }
        catch (...) {
            PostEvent(FailureEvent{ jobId, job.key, "unknown exception", stage });
        }
    }
}

// =================================================================================================
// Orchestrator side
// =================================================================================================

std::string RequestCoordinator::BuildRequestKey(const CoordinatorRequest& request, bool force) {
    std::ostringstream key;
    if (!request.sourceId.empty()) {
        key << request.sourceId;
    }
    else {
        key << "px:" << std::hex << std::setw(16) << std::setfill('0') << HashPixels(request.conversion.pixels) << std::dec;
    }
    key << '|' << request.conversion.profile
        << '|' << request.resolution
        << '|' << request.scalingMode
        << '|' << request.paletteKey
        << "|force=" << (force ? 1 : 0);
    return key.str();
}

void RequestCoordinator::Dispatch(const CoordinatorRequest& request, const std::string& key) {
    inFlight = true;
    inFlightKey = key;
    lastKey = key;
    ++dispatchCount;
    PostToWorker(JobMessage{ nextJobId++, key, request.conversion });
}

ScheduleOutcome RequestCoordinator::Schedule(const CoordinatorRequest& request, bool force) {
    const std::string key = BuildRequestKey(request, force);

    // A newer request supersedes one waiting out its debounce.
    if (debounceDeadline && !inFlight) {
        debounceDeadline.reset();
        pending.reset();
    }

    if (!force && key == lastKey && !inFlight) return ScheduleOutcome::Skipped;

    if (inFlight) {
        pending = PendingRequest{ request, force, key };
        return ScheduleOutcome::Deferred;
    }

    Dispatch(request, key);
    return ScheduleOutcome::Dispatched;
}

void RequestCoordinator::FinishInFlight(const std::string& key) {
    inFlight = false;
    inFlightKey.clear();
    if (pending && pending->key != key) {
        debounceDeadline = std::chrono::steady_clock::now() + debounce;
    }
    else {
        pending.reset();
    }
}

bool RequestCoordinator::FireDebouncedRequest() {
    if (!debounceDeadline || inFlight) return false;
    if (std::chrono::steady_clock::now() < *debounceDeadline) return false;

    debounceDeadline.reset();
    PendingRequest next = std::move(*pending);
    pending.reset();
    Schedule(next.request, next.force);
    return true;
}

size_t RequestCoordinator::PumpEvents() {
    std::deque<CoordinatorEvent> events;
    {
        std::lock_guard<std::mutex> lock(outboxMutex);
        events.swap(outbox);
    }

    for (auto& event : events) {
        if (auto* progress = std::get_if<ProgressEvent>(&event)) {
            if (onProgress) onProgress(*progress);
        }
        else if (auto* done = std::get_if<CompletedEvent>(&event)) {
            FinishInFlight(done->key);
            if (onCompleted) onCompleted(*done);
        }
        else if (auto* failure = std::get_if<FailureEvent>(&event)) {
            std::cerr << "Conversion failed during " << failure->stage << ": " << failure->message << std::endl;
            FinishInFlight(failure->key);
            if (onFailure) onFailure(*failure);
        }
    }

    FireDebouncedRequest();
    return events.size();
}

bool RequestCoordinator::WaitUntilIdle(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        PumpEvents();
        if (!inFlight && !pending && !debounceDeadline) return true;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto wakeAt = deadline;
        if (debounceDeadline && *debounceDeadline < wakeAt) wakeAt = *debounceDeadline;

        std::unique_lock<std::mutex> lock(outboxMutex);
        outboxCv.wait_until(lock, wakeAt, [this] { return !outbox.empty(); });
    }
}

void RequestCoordinator::UpdateConfig(const QuantizationConfig& cfg) {
    QuantizationConfig sanitized = cfg;
    sanitized.Sanitize();
    PostToWorker(ConfigMessage{ sanitized });
    // Results computed under the old config no longer count as current.
    lastKey.clear();
}
