#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "AudioCaptureEngine.hpp"
#include "FrameBuffer.hpp"
#include "LevelMeter.hpp"
#include "RecordingSession.hpp"
#include "../SavingWorkers/DatasetIndexer.hpp"
#include "../SavingWorkers/ISavingWorker.hpp"
#include "../common/Category.hpp"

// Notifications for the presentation layer. All of them run on the
// controller's worker thread or on the thread that issued the command,
// never with the controller locked, and in the order they were raised:
// onStarted always precedes the outcome of its take.
struct RecordingEvents {
    std::function<void(const LevelReading&)> onLevel;
    std::function<void(Category, unsigned int)> onStarted;
    std::function<void(double)> onProgress;
    std::function<void(const std::string&)> onCompleted;
    std::function<void(const std::string&)> onFailed;
    std::function<void(const std::string&)> onTestClipReady;
};

// Idle -> Testing -> Idle and Idle -> Recording -> Idle. The two modes
// exclude each other. A worker thread drains the FrameBuffer, feeds the
// level meter and accumulates the active take; it also writes the WAV
// file when a take reaches its duration.
class RecordingController {
public:
    enum class State {
        Idle,
        Testing,
        Recording
    };

    struct Diagnostics {
        uint64_t bufferOverruns = 0;
        uint64_t driverOverruns = 0;
        uint64_t blocksDelivered = 0;
    };

    static const unsigned int kMinDurationSeconds = 1;
    static const unsigned int kMaxDurationSeconds = 300;
    static const size_t kMaxPrefixLength = 64;

    RecordingController(AudioCaptureEngine& engine, DatasetIndexer& indexer,
                        std::shared_ptr<ISavingWorker> saving_worker);
    ~RecordingController();

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    // Set before the first session starts.
    void SetEvents(RecordingEvents events);

    // Only while Idle (SessionConflictError otherwise).
    void SelectDevice(const AudioDevice& device, const AudioFormat& format = AudioFormat(),
                      unsigned int bufferFrames = AudioCaptureEngine::kDefaultBufferFrames);

    void SetPrefix(const std::string& prefix);
    std::string Prefix() const;
    // std::nullopt continues after the highest file already on disk
    void SetStartingIndex(Category category, std::optional<unsigned int> index);
    std::optional<unsigned int> StartingIndex(Category category) const;
    void SetTestClip(const std::string& directory, unsigned int seconds);
    std::string TestClipPath() const;

    // File name the next take of `category` would be written to
    std::string NextFileName(Category category) const;

    void StartTest();
    void StopTest();
    // Testing that also keeps the first seconds as the test clip
    void StartTestClip();

    void StartRecording(Category category, unsigned int durationSeconds);
    // Finalizes the take with what was captured so far; returns once the
    // file is written or the session discarded.
    void StopRecording();

    State GetState() const { return _state.load(); }
    bool WaitUntilIdle(std::chrono::milliseconds timeout) const;
    Diagnostics GetDiagnostics() const;

    static const char* StateName(State state);
    static void ValidateDuration(unsigned int durationSeconds);
    static void ValidatePrefix(const std::string& prefix);

private:
    using Notifications = std::vector<std::function<void()>>;

    void WorkerThread();
    void BeginStreaming();
    void ReturnToIdle();
    void HandleBlock(const FrameBlock& block, Notifications& notifications);
    void FinishSession(Notifications& notifications);
    void AbortForDeviceLost(Notifications& notifications);
    void ReportOverruns();
    // Enqueue needs _mutex held; DispatchPending must be called without it
    void Enqueue(Notifications& notifications);
    void DispatchPending();

    AudioCaptureEngine& _engine;
    DatasetIndexer& _indexer;
    std::shared_ptr<ISavingWorker> _savingWorker;
    FrameBuffer _frames;
    RecordingEvents _events;

    mutable std::mutex _mutex;
    std::condition_variable _wakeCv;
    mutable std::condition_variable _idleCv;
    std::atomic<State> _state;
    std::deque<std::function<void()>> _pending;
    std::recursive_mutex _dispatchMutex;
    std::unique_ptr<RecordingSession> _session;
    FrameBuffer::ConsumerId _consumer;
    uint64_t _reportedOverruns;

    std::string _prefix;
    std::array<std::optional<unsigned int>, 2> _startingIndex;
    std::string _testDirectory;
    unsigned int _testClipSeconds;

    std::atomic<bool> _shutdown;
    std::unique_ptr<std::thread> _worker;
};
