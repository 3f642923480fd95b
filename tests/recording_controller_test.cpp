#include "AudioRecorder/RecordingController.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

using namespace std::chrono_literals;
using test_utils::EventLog;
using test_utils::FailingSavingWorker;
using test_utils::TempDir;
using test_utils::WavSampleCount;
namespace fs = std::filesystem;

namespace {

// Everything a controller needs, wired to the synthetic backend
struct Rig {
    Rig(const fs::path& root, int failingSaves, double realtimeFactor)
        : backend(test_utils::MakeSyntheticBackend(realtimeFactor))
        , engine(backend)
        , indexer(root / "output")
        , worker(std::make_shared<FailingSavingWorker>(failingSaves))
        , controller(engine, indexer, worker) {
        controller.SetEvents(events.Make());
        controller.SetTestClip((root / ".test").string(), 1);
        controller.SelectDevice(SyntheticBackend::DefaultDevice());
    }

    std::shared_ptr<SyntheticBackend> backend;
    AudioCaptureEngine engine;
    DatasetIndexer indexer;
    std::shared_ptr<FailingSavingWorker> worker;
    EventLog events;
    RecordingController controller;
};

// A driver that reports the device gone from inside StartStream and then
// throws, the way RtAudio reports errors through its callback first.
// Only the first start fails.
class DyingStartBackend : public SyntheticBackend {
public:
    DyingStartBackend()
        : SyntheticBackend({SyntheticBackend::DefaultDevice()}, FastOptions())
        , _failuresLeft(1) {}

    void OpenInput(const AudioDevice& device, unsigned int sampleRate,
                   unsigned int channels, unsigned int& bufferFrames,
                   InputCallback onInput, ErrorCallback onError) override {
        _reportError = onError;
        SyntheticBackend::OpenInput(device, sampleRate, channels, bufferFrames,
                                    std::move(onInput), std::move(onError));
    }

    void StartStream() override {
        if (_failuresLeft > 0) {
            --_failuresLeft;
            _reportError("driver start failed", true);
            throw DeviceLostError("driver start failed");
        }
        SyntheticBackend::StartStream();
    }

private:
    static Options FastOptions() {
        Options options;
        options.realtimeFactor = 20.0;
        return options;
    }

    ErrorCallback _reportError;
    int _failuresLeft;
};

class RecordingControllerTest : public ::testing::Test {
protected:
    RecordingControllerTest() : _dir("recording_controller_test") {}

    Rig& MakeRig(int failingSaves = 0, double realtimeFactor = 20.0) {
        _rig = std::make_unique<Rig>(_dir.Path(), failingSaves, realtimeFactor);
        return *_rig;
    }

    fs::path Output(const std::string& category, const std::string& name) const {
        return _dir.Path() / "output" / category / name;
    }

    TempDir _dir;
    std::unique_ptr<Rig> _rig;
};

} // namespace

TEST_F(RecordingControllerTest, RejectsCommandsWithoutDevice) {
    auto backend = test_utils::MakeSyntheticBackend(20.0);
    AudioCaptureEngine engine(backend);
    DatasetIndexer indexer(_dir.Path());
    RecordingController controller(engine, indexer, std::make_shared<test_utils::NullSavingWorker>());

    EXPECT_THROW(controller.StartRecording(Category::OK, 1), InvalidParameterError);
    EXPECT_THROW(controller.StartTest(), InvalidParameterError);
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);
}

TEST_F(RecordingControllerTest, ValidatesDurationAndPrefix) {
    RecordingController& controller = MakeRig().controller;

    EXPECT_THROW(controller.StartRecording(Category::OK, 0), InvalidParameterError);
    EXPECT_THROW(controller.StartRecording(Category::OK, 301), InvalidParameterError);
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);

    EXPECT_THROW(controller.SetPrefix(""), InvalidParameterError);
    EXPECT_THROW(controller.SetPrefix("a/b"), InvalidParameterError);
    EXPECT_THROW(controller.SetPrefix(".hidden"), InvalidParameterError);
    EXPECT_THROW(controller.SetPrefix(std::string(65, 'x')), InvalidParameterError);
    EXPECT_EQ(controller.Prefix(), "sample") << "a rejected prefix must keep the previous one";
    EXPECT_THROW(controller.SetTestClip("", 3), InvalidParameterError);

    controller.SetPrefix("motor_a-1.0");
    EXPECT_EQ(controller.NextFileName(Category::OK), "motor_a-1.0_1.wav");

    EXPECT_FALSE(fs::exists(_dir.Path() / "output")) << "validation must not touch the output directory";
}

TEST_F(RecordingControllerTest, StartingIndexIsPerCategory) {
    RecordingController& controller = MakeRig().controller;

    controller.SetStartingIndex(Category::NG, 10);
    EXPECT_EQ(controller.StartingIndex(Category::NG).value_or(0), 10u);
    EXPECT_EQ(controller.NextFileName(Category::NG), "sample_10.wav");
    EXPECT_EQ(controller.NextFileName(Category::OK), "sample_1.wav");

    controller.SetStartingIndex(Category::NG, std::nullopt);
    EXPECT_FALSE(controller.StartingIndex(Category::NG).has_value());
}

TEST_F(RecordingControllerTest, TestModeReportsLevelsAndWritesNothing) {
    Rig& rig = MakeRig();
    RecordingController& controller = rig.controller;

    controller.StartTest();
    EXPECT_EQ(controller.GetState(), RecordingController::State::Testing);
    controller.StartTest();
    EXPECT_EQ(controller.GetState(), RecordingController::State::Testing);

    ASSERT_TRUE(test_utils::WaitFor([&] { return rig.events.Get(rig.events.levels).size() >= 10; }))
        << "no level readings in test mode";
    for (const LevelReading& reading : rig.events.Get(rig.events.levels)) {
        // Sine at amplitude 0.25 has RMS 0.177
        EXPECT_NEAR(reading.value, 0.177, 0.02);
        EXPECT_EQ(reading.band, LevelBand::Low);
    }

    EXPECT_THROW(controller.StartRecording(Category::OK, 1), SessionConflictError);
    EXPECT_THROW(controller.SelectDevice(SyntheticBackend::DefaultDevice()), SessionConflictError);
    EXPECT_EQ(controller.GetState(), RecordingController::State::Testing);

    controller.StopTest();
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);
    controller.StopTest();
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);

    EXPECT_FALSE(fs::exists(_dir.Path() / "output"));
    EXPECT_TRUE(rig.events.Get(rig.events.started).empty());
}

TEST_F(RecordingControllerTest, CompletedTakeIsIndexedAndExact) {
    Rig& rig = MakeRig();
    RecordingController& controller = rig.controller;

    controller.StartRecording(Category::OK, 1);
    EXPECT_THROW(controller.StartTest(), SessionConflictError);
    EXPECT_THROW(controller.StartRecording(Category::NG, 1), SessionConflictError);
    EXPECT_THROW(controller.StartTestClip(), SessionConflictError);

    ASSERT_TRUE(rig.events.WaitForOutcomes(1)) << "take did not finish";
    ASSERT_TRUE(controller.WaitUntilIdle(2000ms));

    const std::string expected = Output("OK", "sample_1.wav").string();
    const std::vector<std::string> completed = rig.events.Get(rig.events.completed);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0], expected);
    EXPECT_TRUE(rig.events.Get(rig.events.failed).empty());
    EXPECT_EQ(WavSampleCount(expected), 48000u);
    EXPECT_EQ(test_utils::ReadWavHeader(expected).sampleRate, 48000u);

    const auto started = rig.events.Get(rig.events.started);
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].first, Category::OK);
    EXPECT_EQ(started[0].second, 1u);

    const std::vector<double> progress = rig.events.Get(rig.events.progress);
    ASSERT_FALSE(progress.empty());
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GT(progress[i], progress[i - 1]);
    }
    EXPECT_DOUBLE_EQ(progress.back(), 1.0);

    EXPECT_EQ(controller.NextFileName(Category::OK), "sample_2.wav");
    EXPECT_EQ(controller.NextFileName(Category::NG), "sample_1.wav");
    EXPECT_GE(controller.GetDiagnostics().blocksDelivered, 47u);

    controller.StopRecording();
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);
}

TEST_F(RecordingControllerTest, WriteFailureKeepsIndex) {
    Rig& rig = MakeRig(1);
    RecordingController& controller = rig.controller;

    controller.StartRecording(Category::NG, 1);
    ASSERT_TRUE(rig.events.WaitForOutcomes(1));
    const std::vector<std::string> failed = rig.events.Get(rig.events.failed);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_NE(failed[0].find("Write failed"), std::string::npos) << failed[0];
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);
    EXPECT_FALSE(fs::exists(Output("NG", "sample_1.wav")));
    EXPECT_EQ(controller.NextFileName(Category::NG), "sample_1.wav");

    controller.StartRecording(Category::NG, 1);
    ASSERT_TRUE(rig.events.WaitForOutcomes(2));
    const std::vector<std::string> completed = rig.events.Get(rig.events.completed);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(fs::path(completed[0]).filename().string(), "sample_1.wav") << "the retry must reuse the file name";
}

TEST_F(RecordingControllerTest, DeviceLossAbortsTake) {
    Rig& rig = MakeRig(0, 1.0);
    RecordingController& controller = rig.controller;

    controller.StartRecording(Category::OK, 5);
    std::this_thread::sleep_for(100ms);
    rig.backend->SimulateDeviceLoss();

    ASSERT_TRUE(rig.events.WaitForOutcomes(1)) << "device loss did not end the take";
    const std::vector<std::string> failed = rig.events.Get(rig.events.failed);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_NE(failed[0].find("Device lost"), std::string::npos) << failed[0];
    EXPECT_TRUE(rig.events.Get(rig.events.completed).empty());
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);
    EXPECT_FALSE(fs::exists(Output("OK", "sample_1.wav")));
    EXPECT_EQ(controller.NextFileName(Category::OK), "sample_1.wav");

    EXPECT_THROW(controller.StartRecording(Category::OK, 1), DeviceLostError);

    rig.backend->SetRealtimeFactor(20.0);
    controller.SelectDevice(SyntheticBackend::DefaultDevice());
    controller.StartRecording(Category::OK, 1);
    ASSERT_TRUE(rig.events.WaitForOutcomes(2));
    EXPECT_EQ(rig.events.Get(rig.events.completed).size(), 1u);
}

TEST_F(RecordingControllerTest, EarlyStopSavesPartialTake) {
    Rig& rig = MakeRig(0, 1.0);
    RecordingController& controller = rig.controller;

    controller.StartRecording(Category::OK, 5);
    std::this_thread::sleep_for(500ms);
    controller.StopRecording();

    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);
    const std::vector<std::string> completed = rig.events.Get(rig.events.completed);
    ASSERT_EQ(completed.size(), 1u) << "the partial take must be saved before StopRecording returns";

    const size_t samples = WavSampleCount(completed[0]);
    EXPECT_GE(samples, 12000u);
    EXPECT_LE(samples, 36000u);
    EXPECT_TRUE(test_utils::ReadWavHeader(completed[0]).valid);
    EXPECT_EQ(controller.NextFileName(Category::OK), "sample_2.wav");
}

TEST_F(RecordingControllerTest, TestClipIsWrittenOutsideDataset) {
    Rig& rig = MakeRig();
    RecordingController& controller = rig.controller;

    controller.StartTest();
    controller.StartTestClip();
    EXPECT_EQ(controller.GetState(), RecordingController::State::Testing);
    ASSERT_TRUE(rig.events.WaitForOutcomes(1));

    const std::string expected = (_dir.Path() / ".test" / "test_recording.wav").string();
    const std::vector<std::string> clips = rig.events.Get(rig.events.testClips);
    ASSERT_EQ(clips.size(), 1u);
    EXPECT_EQ(clips[0], expected);
    EXPECT_EQ(controller.TestClipPath(), expected);
    EXPECT_EQ(WavSampleCount(expected), 48000u);
    EXPECT_TRUE(controller.WaitUntilIdle(2000ms));
    EXPECT_FALSE(fs::exists(_dir.Path() / "output"));
    EXPECT_EQ(controller.NextFileName(Category::OK), "sample_1.wav");
}

TEST_F(RecordingControllerTest, StopTestCancelsClip) {
    Rig& rig = MakeRig(0, 1.0);
    RecordingController& controller = rig.controller;

    controller.StartTestClip();
    std::this_thread::sleep_for(100ms);
    controller.StopTest();
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);

    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(rig.events.Get(rig.events.testClips).empty());
    EXPECT_FALSE(fs::exists(controller.TestClipPath()));
}

TEST_F(RecordingControllerTest, FailedStreamStartLeavesDeviceLost) {
    auto backend = std::make_shared<DyingStartBackend>();
    AudioCaptureEngine engine(backend);
    DatasetIndexer indexer(_dir.Path() / "output");
    EventLog events;
    RecordingController controller(engine, indexer, std::make_shared<WavWorker>());
    controller.SetEvents(events.Make());
    controller.SelectDevice(SyntheticBackend::DefaultDevice());

    EXPECT_THROW(controller.StartRecording(Category::OK, 1), DeviceLostError);
    EXPECT_EQ(controller.GetState(), RecordingController::State::Idle);
    EXPECT_EQ(engine.GetState(), AudioCaptureEngine::State::Closed)
        << "a start that lost the device must not report the stream as open";
    EXPECT_TRUE(engine.IsDeviceLost());
    EXPECT_THROW(controller.StartRecording(Category::OK, 1), DeviceLostError);
    EXPECT_TRUE(events.Get(events.started).empty());

    controller.SelectDevice(SyntheticBackend::DefaultDevice());
    EXPECT_FALSE(engine.IsDeviceLost());
    controller.StartRecording(Category::OK, 1);
    ASSERT_TRUE(events.WaitForOutcomes(1));

    const std::vector<std::string> failed = events.Get(events.failed);
    EXPECT_TRUE(failed.empty()) << "stale device loss aborted the take: " << failed.front();
    const std::vector<std::string> completed = events.Get(events.completed);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(WavSampleCount(completed[0]), 48000u);
}

TEST_F(RecordingControllerTest, TakeSurvivesBufferOverruns) {
    Rig& rig = MakeRig(0, 50.0);

    // A slow level consumer stalls the worker while capture runs at 50x
    RecordingEvents events = rig.events.Make();
    auto recordLevel = events.onLevel;
    events.onLevel = [recordLevel](const LevelReading& reading) {
        recordLevel(reading);
        std::this_thread::sleep_for(3ms);
    };
    rig.controller.SetEvents(events);

    rig.controller.StartRecording(Category::OK, 2);
    ASSERT_TRUE(rig.events.WaitForOutcomes(1, 30000ms));

    EXPECT_TRUE(rig.events.Get(rig.events.failed).empty());
    const std::vector<std::string> completed = rig.events.Get(rig.events.completed);
    ASSERT_EQ(completed.size(), 1u) << "overruns must not abort the take";
    EXPECT_EQ(WavSampleCount(completed[0]), 96000u);
    EXPECT_GT(rig.controller.GetDiagnostics().bufferOverruns, 0u);
    EXPECT_TRUE(rig.controller.WaitUntilIdle(2000ms));
}

TEST_F(RecordingControllerTest, StartIsReportedBeforeOutcome) {
    Rig& rig = MakeRig();

    for (int attempt = 0; attempt < 5; ++attempt) {
        rig.controller.SelectDevice(SyntheticBackend::DefaultDevice());
        // The device disappears as soon as the stream runs
        rig.backend->SimulateDeviceLoss();
        rig.controller.StartRecording(Category::OK, 5);
        ASSERT_TRUE(rig.events.WaitForOutcomes(attempt + 1));
        ASSERT_TRUE(rig.controller.WaitUntilIdle(2000ms));
    }

    const std::vector<std::string> order = rig.events.Get(rig.events.order);
    ASSERT_EQ(order.size(), 10u);
    for (size_t i = 0; i < order.size(); i += 2) {
        EXPECT_EQ(order[i], "started") << "notification " << i;
        EXPECT_EQ(order[i + 1], "failed") << "notification " << i + 1;
    }
}
