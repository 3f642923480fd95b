#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

#include "AudioDevices/DeviceEnumerator.hpp"
#include "AudioDevices/RtAudioBackend.hpp"
#include "AudioDevices/SyntheticBackend.hpp"
#include "AudioPlayback/TestClipPlayer.hpp"
#include "AudioRecorder/AudioCaptureEngine.hpp"
#include "AudioRecorder/RecordingController.hpp"
#include "Config/RecorderConfig.hpp"
#include "SavingWorkers/DatasetIndexer.hpp"
#include "SavingWorkers/WavWorker.hpp"
#include "common/RecorderErrors.hpp"
#include "common/debug_log.hpp"

class DatasetRecorderApplication {
public:
    DatasetRecorderApplication(const RecorderConfig& config, std::shared_ptr<IAudioBackend> backend)
        : _config(config)
        , _enumerator(backend)
        , _engine(backend)
        , _indexer(config.outputRoot)
        , _controller(_engine, _indexer, std::make_shared<WavWorker>())
        , _running(true)
        , _lastLevelPrint(std::chrono::steady_clock::now())
        , _lastProgressSecond(-1) {
    }

    bool Run() {
        _controller.SetPrefix(_config.prefix);
        _controller.SetStartingIndex(Category::OK, _config.startingIndex);
        _controller.SetStartingIndex(Category::NG, _config.startingIndex);
        _controller.SetTestClip(_config.testDirectory, _config.testClipSeconds);
        _controller.SetEvents(MakeEvents());

        SelectInitialDevice();
        PrintHelp();
        PrintNextFiles();

        std::string line;
        while (_running && std::getline(std::cin, line)) {
            std::istringstream args(line);
            std::string command;
            if (!(args >> command)) {
                continue;
            }
            try {
                if (!ProcessCommand(command, args)) {
                    break;
                }
            } catch (const RecorderError& e) {
                ERROR_LOG(e.what() << ERROR_LOG_ENDL);
            }
        }

        _controller.StopRecording();
        _controller.StopTest();
        _player.Stop();
        return true;
    }

private:
    RecordingEvents MakeEvents() {
        RecordingEvents events;
        events.onLevel = [this](const LevelReading& reading) {
            OnLevel(reading);
        };
        events.onStarted = [this](Category category, unsigned int seconds) {
            _lastProgressSecond = -1;
            Print("[REC] Recording " + std::string(CategoryName(category)) + " ("
                  + std::to_string(seconds) + "s)...");
        };
        events.onProgress = [this](double elapsed) {
            const int second = static_cast<int>(elapsed);
            if (second != _lastProgressSecond.exchange(second) && second > 0) {
                Print("[REC] " + std::to_string(second) + "s");
            }
        };
        events.onCompleted = [this](const std::string& path) {
            Print("Saved to " + path);
            PrintNextFiles();
        };
        events.onFailed = [this](const std::string& reason) {
            Print("Error: " + reason);
        };
        events.onTestClipReady = [this](const std::string& path) {
            Print("Test recorded to " + path + "! Type 'play' to listen.");
        };
        return events;
    }

    void OnLevel(const LevelReading& reading) {
        const auto now = std::chrono::steady_clock::now();
        {
            std::lock_guard<std::mutex> lock(_printMutex);
            if (now - _lastLevelPrint < std::chrono::milliseconds(250)) {
                return;
            }
            _lastLevelPrint = now;
        }

        const int percent = reading.Percent();
        std::string bar(static_cast<size_t>(percent / 5), '#');
        bar.resize(20, '-');
        Print("[level] " + bar + " " + std::to_string(percent) + "% ("
              + LevelMeter::BandName(reading.band) + ")");
    }

    void Print(const std::string& text) {
        std::lock_guard<std::mutex> lock(_printMutex);
        std::cout << text << std::endl;
    }

    void SelectInitialDevice() {
        try {
            AudioDevice device;
            bool found = _config.deviceId
                ? _enumerator.FindById(*_config.deviceId, device)
                : _enumerator.DefaultDevice(device);
            if (!found) {
                Print(DeviceEnumerator::kNoDevicesMessage);
                return;
            }
            SelectDevice(device);
        } catch (const RecorderError& e) {
            ERROR_LOG(e.what() << ERROR_LOG_ENDL);
        }
    }

    void SelectDevice(const AudioDevice& device) {
        AudioFormat format;
        format.sampleRate = _config.sampleRate;
        _controller.SelectDevice(device, format, _config.bufferFrames);
        Print("Microphone: " + DeviceEnumerator::Describe(device));
    }

    void ListDevices() {
        std::vector<AudioDevice> devices = _enumerator.ListDevices();
        if (devices.empty()) {
            Print(DeviceEnumerator::kNoDevicesMessage);
            return;
        }
        for (const AudioDevice& device : devices) {
            Print("  [" + std::to_string(device.id) + "] " + DeviceEnumerator::Describe(device)
                  + (device.isDefaultInput ? " (default)" : ""));
        }
    }

    void PrintNextFiles() {
        Print("Next file: OK/" + _controller.NextFileName(Category::OK)
              + ", NG/" + _controller.NextFileName(Category::NG));
    }

    void PrintStatus() {
        const RecordingController::Diagnostics diagnostics = _controller.GetDiagnostics();
        std::ostringstream status;
        status << "State: " << RecordingController::StateName(_controller.GetState()) << "\n"
               << "Device: " << (_engine.GetState() == AudioCaptureEngine::State::Closed
                                     ? std::string("(none)") : DeviceEnumerator::Describe(_engine.Device()))
               << " [" << AudioCaptureEngine::StateName(_engine.GetState()) << "]\n"
               << "Duration: " << _config.durationSeconds << "s\n"
               << "Prefix: " << _controller.Prefix() << "\n"
               << "Overruns: " << diagnostics.bufferOverruns << " buffer, "
               << diagnostics.driverOverruns << " driver";
        Print(status.str());
        PrintNextFiles();
    }

    static unsigned int ParseUnsigned(const std::string& text, const char* what) {
        if (text.empty() || text[0] == '-') {
            throw InvalidParameterError(std::string(what) + " must be a non-negative integer");
        }
        try {
            size_t consumed = 0;
            unsigned long value = std::stoul(text, &consumed);
            if (consumed != text.size() || value > 0xFFFFFFFFul) {
                throw InvalidParameterError(std::string(what) + " must be a non-negative integer");
            }
            return static_cast<unsigned int>(value);
        } catch (const std::logic_error&) {
            throw InvalidParameterError(std::string(what) + " must be a non-negative integer");
        }
    }

    void SetIndex(std::istringstream& args) {
        std::string value;
        std::string which;
        args >> value >> which;

        std::optional<unsigned int> index;
        if (value != "auto") {
            index = ParseUnsigned(value, "starting index");
        }

        Category category = Category::OK;
        if (which.empty()) {
            _controller.SetStartingIndex(Category::OK, index);
            _controller.SetStartingIndex(Category::NG, index);
            _config.startingIndex = index;
        } else if (ParseCategory(which, category)) {
            _controller.SetStartingIndex(category, index);
        } else {
            throw InvalidParameterError("unknown category '" + which + "'");
        }
        PrintNextFiles();
    }

    bool ProcessCommand(const std::string& command, std::istringstream& args) {
        if (command == "devices") {
            ListDevices();
        }
        else if (command == "select") {
            std::string id;
            args >> id;
            AudioDevice device;
            if (!_enumerator.FindById(ParseUnsigned(id, "device id"), device)) {
                Print("No such input device: " + id);
            } else {
                SelectDevice(device);
            }
        }
        else if (command == "test") {
            _controller.StartTest();
            Print("Testing... type 'stoptest' to finish");
        }
        else if (command == "stoptest") {
            _controller.StopTest();
        }
        else if (command == "clip") {
            _controller.StartTestClip();
            Print("Recording test sample...");
        }
        else if (command == "play") {
            if (!_player.Play(_controller.TestClipPath())) {
                Print("No test recording available!");
            }
        }
        else if (command == "ok") {
            _controller.StartRecording(Category::OK, _config.durationSeconds);
        }
        else if (command == "ng") {
            _controller.StartRecording(Category::NG, _config.durationSeconds);
        }
        else if (command == "stop") {
            _controller.StopRecording();
        }
        else if (command == "duration") {
            std::string value;
            args >> value;
            const unsigned int seconds = ParseUnsigned(value, "duration");
            RecordingController::ValidateDuration(seconds);
            _config.durationSeconds = seconds;
        }
        else if (command == "prefix") {
            std::string prefix;
            args >> prefix;
            _controller.SetPrefix(prefix);
            _config.prefix = prefix;
            PrintNextFiles();
        }
        else if (command == "index") {
            SetIndex(args);
        }
        else if (command == "status") {
            PrintStatus();
        }
        else if (command == "save") {
            std::string path;
            args >> path;
            if (path.empty()) {
                throw InvalidParameterError("save needs a file name");
            }
            _config.Save(path);
            Print("Configuration saved to " + path);
        }
        else if (command == "quit" || command == "exit") {
            _running = false;
            return false;
        }
        else if (command == "help") {
            PrintHelp();
        }
        else {
            Print("Unknown command: " + command);
            PrintHelp();
        }
        return true;
    }

    void PrintHelp() {
        Print("\n=== Audio Dataset Recorder ===\n"
              "Commands:\n"
              "  devices             - List input devices\n"
              "  select <id>         - Use input device <id>\n"
              "  test / stoptest     - Start / stop the level meter\n"
              "  clip                - Record the test clip\n"
              "  play                - Play the test clip\n"
              "  ok / ng             - Record a take into output/OK or output/NG\n"
              "  stop                - Finish the current take early\n"
              "  duration <s>        - Take length in seconds (1-300)\n"
              "  prefix <name>       - File name prefix\n"
              "  index <n>|auto [ok|ng] - Starting index\n"
              "  status              - Show state and next file names\n"
              "  save <file>         - Save the configuration as JSON\n"
              "  help                - Show this help\n"
              "  quit                - Exit application\n"
              "==============================\n");
    }

    RecorderConfig _config;
    DeviceEnumerator _enumerator;
    AudioCaptureEngine _engine;
    DatasetIndexer _indexer;
    RecordingController _controller;
    TestClipPlayer _player;
    std::atomic<bool> _running;

    std::mutex _printMutex;
    std::chrono::steady_clock::time_point _lastLevelPrint;
    std::atomic<int> _lastProgressSecond;
};

int main(int argc, char* argv[]) {
    std::string configPath = "recorder.json";
    bool synthetic = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--synthetic") {
            synthetic = true;
        } else {
            std::cout << "Usage: " << argv[0] << " [--config <file.json>] [--synthetic]" << std::endl;
            return 1;
        }
    }

    try {
        RecorderConfig config = RecorderConfig::Load(configPath);

        std::shared_ptr<IAudioBackend> backend;
        if (synthetic) {
            backend = std::make_shared<SyntheticBackend>();
        } else {
            backend = std::make_shared<RtAudioBackend>();
        }

        DatasetRecorderApplication app(config, backend);
        return app.Run() ? 0 : 1;
    } catch (const std::exception& e) {
        ERROR_LOG("Fatal: " << e.what() << ERROR_LOG_ENDL);
        return 1;
    }
}
