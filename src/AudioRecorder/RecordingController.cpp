#include "RecordingController.hpp"
#include "../common/RecorderErrors.hpp"
#include "../common/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace {

// How long the worker sleeps when the buffer is drained. Well under one
// block (~21 ms at 1024 frames / 48 kHz).
const std::chrono::milliseconds kPollInterval(2);
const std::chrono::milliseconds kIdleWait(50);
// Ring depth in seconds of audio
const double kBufferSeconds = 2.0;
const double kProgressStepSeconds = 0.1;
const char* const kTestClipName = "test_recording.wav";

} // namespace

RecordingController::RecordingController(AudioCaptureEngine& engine, DatasetIndexer& indexer,
                                         std::shared_ptr<ISavingWorker> saving_worker)
    : _engine(engine)
    , _indexer(indexer)
    , _savingWorker(std::move(saving_worker))
    , _state(State::Idle)
    , _consumer(0)
    , _reportedOverruns(0)
    , _prefix("sample")
    , _testDirectory(".test")
    , _testClipSeconds(3)
    , _shutdown(false) {
    _engine.SetDeviceLostCallback([this](const std::string&) {
        _wakeCv.notify_all();
    });
    _worker = std::make_unique<std::thread>(&RecordingController::WorkerThread, this);
}

RecordingController::~RecordingController() {
    _shutdown = true;
    _wakeCv.notify_all();
    if (_worker && _worker->joinable()) {
        _worker->join();
    }

    std::lock_guard<std::mutex> lock(_mutex);
    if (_session) {
        DEBUG_LOG("Discarding unfinished session on shutdown" << DEBUG_LOG_ENDL);
        _session.reset();
    }
    if (_state.load() != State::Idle) {
        ReturnToIdle();
    }
    _engine.SetDeviceLostCallback(nullptr);
}

const char* RecordingController::StateName(State state) {
    switch (state) {
        case State::Idle: return "Idle";
        case State::Testing: return "Testing";
        case State::Recording: return "Recording";
    }
    return "Idle";
}

void RecordingController::ValidateDuration(unsigned int durationSeconds) {
    if (durationSeconds < kMinDurationSeconds || durationSeconds > kMaxDurationSeconds) {
        throw InvalidParameterError("duration must be between "
                                    + std::to_string(kMinDurationSeconds) + " and "
                                    + std::to_string(kMaxDurationSeconds) + " seconds, got "
                                    + std::to_string(durationSeconds));
    }
}

void RecordingController::ValidatePrefix(const std::string& prefix) {
    if (prefix.empty()) {
        throw InvalidParameterError("filename prefix must not be empty");
    }
    if (prefix.size() > kMaxPrefixLength) {
        throw InvalidParameterError("filename prefix is longer than "
                                    + std::to_string(kMaxPrefixLength) + " characters");
    }
    if (prefix[0] == '.') {
        throw InvalidParameterError("filename prefix must not start with '.'");
    }
    for (char c : prefix) {
        const bool allowed = std::isalnum(static_cast<unsigned char>(c))
                          || c == '_' || c == '-' || c == '.';
        if (!allowed) {
            throw InvalidParameterError(std::string("filename prefix contains unsupported character '")
                                        + c + "'");
        }
    }
}

void RecordingController::SetEvents(RecordingEvents events) {
    std::lock_guard<std::mutex> lock(_mutex);
    _events = std::move(events);
}

void RecordingController::SelectDevice(const AudioDevice& device, const AudioFormat& format,
                                       unsigned int bufferFrames) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state.load() != State::Idle) {
        throw SessionConflictError("cannot change the input device while "
                                   + std::string(StateName(_state.load())));
    }

    _engine.Open(device, format, bufferFrames);

    const unsigned int blockSamples = _engine.BlockFrames() * format.channels;
    _frames.Reset(FrameBuffer::SlotsFor(kBufferSeconds, format.sampleRate, _engine.BlockFrames()),
                  blockSamples);
    _reportedOverruns = _frames.Overruns() + _engine.DriverOverruns();
}

void RecordingController::SetPrefix(const std::string& prefix) {
    ValidatePrefix(prefix);
    std::lock_guard<std::mutex> lock(_mutex);
    _prefix = prefix;
}

std::string RecordingController::Prefix() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _prefix;
}

void RecordingController::SetStartingIndex(Category category, std::optional<unsigned int> index) {
    std::lock_guard<std::mutex> lock(_mutex);
    _startingIndex[CategoryIndex(category)] = index;
}

std::optional<unsigned int> RecordingController::StartingIndex(Category category) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _startingIndex[CategoryIndex(category)];
}

void RecordingController::SetTestClip(const std::string& directory, unsigned int seconds) {
    if (directory.empty()) {
        throw InvalidParameterError("test clip directory must not be empty");
    }
    ValidateDuration(seconds);
    std::lock_guard<std::mutex> lock(_mutex);
    _testDirectory = directory;
    _testClipSeconds = seconds;
}

std::string RecordingController::TestClipPath() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return (std::filesystem::path(_testDirectory) / kTestClipName).string();
}

std::string RecordingController::NextFileName(Category category) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _indexer.NextPath(category, _prefix, _startingIndex[CategoryIndex(category)])
        .filename().string();
}

void RecordingController::BeginStreaming() {
    _consumer = _frames.Subscribe();
    try {
        _engine.Start([this](const int16_t* samples, size_t count, uint64_t sequence,
                             FrameBlock::Clock::time_point captureTime) {
            _frames.Push(samples, count, sequence, captureTime);
        });
    } catch (...) {
        _frames.Unsubscribe(_consumer);
        throw;
    }
}

void RecordingController::ReturnToIdle() {
    _engine.Stop();
    _frames.Unsubscribe(_consumer);
    _state = State::Idle;
    _idleCv.notify_all();
}

void RecordingController::StartTest() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const State state = _state.load();
        if (state == State::Recording) {
            throw SessionConflictError("cannot start test mode while recording");
        }
        if (state == State::Testing) {
            return;
        }
        BeginStreaming();
        _state = State::Testing;
    }
    _wakeCv.notify_all();
    DEBUG_LOG("Test mode started" << DEBUG_LOG_ENDL);
}

void RecordingController::StopTest() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state.load() != State::Testing) {
        return;
    }
    if (_session) {
        DEBUG_LOG("Test clip cancelled" << DEBUG_LOG_ENDL);
        _session.reset();
    }
    ReturnToIdle();
    DEBUG_LOG("Test mode stopped" << DEBUG_LOG_ENDL);
}

void RecordingController::StartTestClip() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        const State state = _state.load();
        if (state == State::Recording) {
            throw SessionConflictError("cannot record a test clip while recording");
        }
        if (_session) {
            return;
        }

        auto session = std::make_unique<RecordingSession>();
        session->kind = RecordingSession::Kind::TestClip;
        session->durationSeconds = _testClipSeconds;
        session->targetSamples = static_cast<size_t>(_testClipSeconds)
                               * _engine.Format().sampleRate * _engine.Format().channels;
        session->samples.reserve(session->targetSamples);
        session->startTime = FrameBlock::Clock::now();

        if (state == State::Idle) {
            BeginStreaming();
            _state = State::Testing;
        }
        _session = std::move(session);
    }
    _wakeCv.notify_all();
    DEBUG_LOG("Recording test clip..." << DEBUG_LOG_ENDL);
}

void RecordingController::StartRecording(Category category, unsigned int durationSeconds) {
    ValidateDuration(durationSeconds);

    {
        std::lock_guard<std::mutex> lock(_mutex);
        const State state = _state.load();
        if (state == State::Testing) {
            throw SessionConflictError("cannot start recording while test mode is active");
        }
        if (state == State::Recording) {
            throw SessionConflictError("a recording is already in progress");
        }
        ValidatePrefix(_prefix);

        auto session = std::make_unique<RecordingSession>();
        session->kind = RecordingSession::Kind::Take;
        session->category = category;
        session->durationSeconds = durationSeconds;
        session->targetSamples = static_cast<size_t>(durationSeconds)
                               * _engine.Format().sampleRate * _engine.Format().channels;
        session->samples.reserve(session->targetSamples);
        session->startTime = FrameBlock::Clock::now();

        BeginStreaming();
        _session = std::move(session);
        _state = State::Recording;
        DEBUG_LOG("=== Recording " << CategoryName(category) << " (" << durationSeconds << "s) ===" << DEBUG_LOG_ENDL);
        if (_events.onStarted) {
            auto onStarted = _events.onStarted;
            _pending.push_back([onStarted, category, durationSeconds]() {
                onStarted(category, durationSeconds);
            });
        }
    }
    _wakeCv.notify_all();
    DispatchPending();
}

void RecordingController::StopRecording() {
    Notifications notifications;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state.load() != State::Recording || !_session) {
            return;
        }

        if (_engine.IsDeviceLost()) {
            AbortForDeviceLost(notifications);
        } else {
            // No block is pushed after Stop(); collect what is still buffered
            _engine.Stop();
            FrameBlock block;
            while (!_session->IsComplete() && _frames.Pop(_consumer, block)) {
                HandleBlock(block, notifications);
            }
            DEBUG_LOG("Recording stopped early" << DEBUG_LOG_ENDL);
            FinishSession(notifications);
        }
        Enqueue(notifications);
    }
    DispatchPending();
}

bool RecordingController::WaitUntilIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(_mutex);
    return _idleCv.wait_for(lock, timeout, [this] { return _state.load() == State::Idle; });
}

RecordingController::Diagnostics RecordingController::GetDiagnostics() const {
    Diagnostics diagnostics;
    diagnostics.bufferOverruns = _frames.Overruns();
    diagnostics.driverOverruns = _engine.DriverOverruns();
    diagnostics.blocksDelivered = _engine.BlocksDelivered();
    return diagnostics;
}

void RecordingController::HandleBlock(const FrameBlock& block, Notifications& notifications) {
    const LevelReading reading = LevelMeter::ComputeLevel(block);
    if (_events.onLevel) {
        auto onLevel = _events.onLevel;
        notifications.push_back([onLevel, reading]() { onLevel(reading); });
    }

    if (!_session) {
        return;
    }

    RecordingSession& session = *_session;
    if (session.haveSequence && block.sequence != session.lastSequence + 1) {
        session.discontinuities += block.sequence - session.lastSequence - 1;
    }
    session.haveSequence = true;
    session.lastSequence = block.sequence;

    const size_t remaining = session.targetSamples - session.samples.size();
    const size_t take = std::min(remaining, block.samples.size());
    session.samples.insert(session.samples.end(), block.samples.begin(), block.samples.begin() + take);

    if (session.kind == RecordingSession::Kind::Take && _events.onProgress) {
        const AudioFormat& format = _engine.Format();
        const double elapsed = static_cast<double>(session.samples.size())
                             / (format.sampleRate * format.channels);
        if (elapsed - session.lastProgressSeconds >= kProgressStepSeconds || session.IsComplete()) {
            session.lastProgressSeconds = elapsed;
            auto onProgress = _events.onProgress;
            notifications.push_back([onProgress, elapsed]() { onProgress(elapsed); });
        }
    }
}

void RecordingController::FinishSession(Notifications& notifications) {
    std::unique_ptr<RecordingSession> session = std::move(_session);
    _engine.Stop();
    _frames.Unsubscribe(_consumer);

    const AudioFormat format = _engine.Format();

    if (session->discontinuities > 0) {
        ERROR_LOG("Warning: " << session->discontinuities
                  << " blocks were lost during capture, the file contains gaps" << ERROR_LOG_ENDL);
    }

    try {
        if (session->kind == RecordingSession::Kind::TestClip) {
            const std::string path = (std::filesystem::path(_testDirectory) / kTestClipName).string();
            _savingWorker->Save(path, session->samples, format);
            DEBUG_LOG("Test clip saved to " << path << DEBUG_LOG_ENDL);
            if (_events.onTestClipReady) {
                auto onTestClipReady = _events.onTestClipReady;
                notifications.push_back([onTestClipReady, path]() { onTestClipReady(path); });
            }
        } else {
            const Category category = session->category;
            const std::string path = _indexer.NextPath(category, _prefix,
                                                       _startingIndex[CategoryIndex(category)]).string();
            _savingWorker->Save(path, session->samples, format);
            _indexer.Advance(category);
            DEBUG_LOG("Saved " << session->samples.size() << " samples to " << path << DEBUG_LOG_ENDL);
            if (_events.onCompleted) {
                auto onCompleted = _events.onCompleted;
                notifications.push_back([onCompleted, path]() { onCompleted(path); });
            }
        }
    } catch (const std::exception& e) {
        // The index is left alone so a retry reuses the same file name
        const std::string reason = e.what();
        ERROR_LOG("Error saving file: " << reason << ERROR_LOG_ENDL);
        if (_events.onFailed) {
            auto onFailed = _events.onFailed;
            notifications.push_back([onFailed, reason]() { onFailed(reason); });
        }
    }

    _state = State::Idle;
    _idleCv.notify_all();
}

void RecordingController::AbortForDeviceLost(Notifications& notifications) {
    const std::string reason = DeviceLostError(_engine.DeviceLostReason()).what();
    ERROR_LOG(reason << ERROR_LOG_ENDL);

    if (_session) {
        DEBUG_LOG("Discarding " << _session->samples.size() << " captured samples" << DEBUG_LOG_ENDL);
        _session.reset();
    }
    ReturnToIdle();

    if (_events.onFailed) {
        auto onFailed = _events.onFailed;
        notifications.push_back([onFailed, reason]() { onFailed(reason); });
    }
}

void RecordingController::ReportOverruns() {
    const uint64_t overruns = _frames.Overruns() + _engine.DriverOverruns();
    if (overruns != _reportedOverruns) {
        ERROR_LOG("Buffer overrun: " << overruns - _reportedOverruns
                  << " block(s) dropped (total " << overruns << ")" << ERROR_LOG_ENDL);
        _reportedOverruns = overruns;
    }
}

void RecordingController::Enqueue(Notifications& notifications) {
    for (auto& notify : notifications) {
        _pending.push_back(std::move(notify));
    }
    notifications.clear();
}

void RecordingController::DispatchPending() {
    // Whoever holds the dispatch lock drains everything queued so far, so
    // notifications raised by different threads still run in order.
    std::lock_guard<std::recursive_mutex> dispatchLock(_dispatchMutex);
    for (;;) {
        std::function<void()> notify;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_pending.empty()) {
                return;
            }
            notify = std::move(_pending.front());
            _pending.pop_front();
        }
        notify();
    }
}

void RecordingController::WorkerThread() {
    FrameBlock block;
    Notifications notifications;

    while (!_shutdown.load()) {
        bool drained = false;
        {
            std::unique_lock<std::mutex> lock(_mutex);
            if (_state.load() == State::Idle) {
                _wakeCv.wait_for(lock, kIdleWait, [this] {
                    return _shutdown.load() || _state.load() != State::Idle;
                });
                continue;
            }

            if (_engine.IsDeviceLost()) {
                AbortForDeviceLost(notifications);
            } else {
                while (_frames.Pop(_consumer, block)) {
                    drained = true;
                    HandleBlock(block, notifications);
                    if (_session && _session->IsComplete()) {
                        break;
                    }
                }
                ReportOverruns();
                if (_session && _session->IsComplete()) {
                    FinishSession(notifications);
                }
            }
            Enqueue(notifications);
        }

        DispatchPending();
        if (!drained) {
            std::this_thread::sleep_for(kPollInterval);
        }
    }
}
