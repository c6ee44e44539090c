// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioCapture.hpp>
#include <core/Log.hpp>
#include <engine/DaemonEngine.hpp>
#include <engine/ElevenLabsEngine.hpp>
#include <engine/EngineSelector.hpp>
#include <engine/WhisperEngine.hpp>
#include <inject/ClipboardInjector.hpp>
#include <inject/XdotoolInjector.hpp>
#include <ipc/DaemonServer.hpp>
#include <notify/DesktopNotifier.hpp>
#include <pipeline/Session.hpp>
#include <session/SessionLock.hpp>
#include <session/StopSignal.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <print>
#include <thread>

namespace voxtype
{

namespace
{

    auto seconds(double value) -> std::chrono::milliseconds
    {
        return std::chrono::milliseconds(static_cast<std::int64_t>(value * 1000.0));
    }

    auto sessionConfigFrom(const AppConfig& config, LanguageMode language) -> SessionConfig
    {
        return SessionConfig {
            .vad = VadConfig {
                .silenceThreshold = config.vad.silenceThreshold,
                .shortPauseSeconds = config.vad.shortPauseSeconds,
                .longPauseSeconds = config.vad.longPauseSeconds,
                .minPhraseSeconds = config.vad.minPhraseSeconds,
                .maxSessionSeconds = config.vad.maxSessionSeconds,
            },
            .dispatcher = DispatcherConfig {
                .maxInFlight = static_cast<std::size_t>(std::max(1, config.pipeline.maxInFlight)),
                .maxQueuedChunks = static_cast<std::size_t>(std::max(1, config.pipeline.maxQueuedChunks)),
            },
            .injection = OrderedInjectorConfig {
                .cleaner = TextCleanerConfig {
                    .removeFillers = config.injection.removeFillers,
                    .trailingSpace = config.injection.trailingSpace,
                },
                .resultTimeout = seconds(config.pipeline.resultTimeoutSeconds),
            },
            .language = language,
            .stopGrace = seconds(config.pipeline.stopGraceSeconds),
            .frameTimeout = std::chrono::milliseconds(100),
        };
    }

    auto fallbackPolicyFrom(const FallbackSection& section) -> FallbackPolicy
    {
        return FallbackPolicy {
            .failureThreshold = std::max(1, section.failureThreshold),
            .rateLimitRetries = std::max(0, section.rateLimitRetries),
            .rateLimitBackoff = seconds(section.rateLimitBackoffSeconds),
        };
    }

    /// @brief The engine the daemon keeps warm: the first configured whisper engine.
    auto daemonEngineConfig(const AppConfig& config) -> EngineConfig
    {
        auto const it = std::ranges::find(config.engines, EngineType::Whisper, &EngineConfig::type);
        if (it != config.engines.end())
            return *it;

        auto whisper = EngineConfig {};
        whisper.name = "whisper";
        whisper.type = EngineType::Whisper;
        whisper.timeoutSeconds = 30.0;
        whisper.modelPath = defaultWhisperModelPath();
        return whisper;
    }

    auto daemonSocketPath(const AppConfig& config) -> std::string
    {
        auto const it = std::ranges::find(config.engines, EngineType::Daemon, &EngineConfig::type);
        return it != config.engines.end() ? it->socketPath : std::string { "/tmp/voxtype.sock" };
    }

} // namespace

auto createEngine(const EngineConfig& config) -> std::shared_ptr<Engine>
{
    switch (config.type)
    {
        case EngineType::ElevenLabs:
            return std::make_shared<ElevenLabsEngine>(ElevenLabsConfig {
                .name = config.name,
                .apiKey = config.resolveApiKey(),
                .baseUrl = config.baseUrl,
                .modelId = config.modelId,
                .timeout = seconds(config.timeoutSeconds),
                .probeTimeout = seconds(config.probeTimeoutSeconds),
            });
        case EngineType::Whisper:
            return std::make_shared<WhisperEngine>(WhisperConfig {
                .name = config.name,
                .modelPath = config.modelPath,
                .threads = config.threads,
                .timeout = seconds(config.timeoutSeconds),
            });
        case EngineType::Daemon:
            return std::make_shared<DaemonEngine>(DaemonEngineConfig {
                .name = config.name,
                .socketPath = config.socketPath,
                .timeout = seconds(config.timeoutSeconds),
                .probeTimeout = std::chrono::milliseconds(2000),
            });
    }
    return nullptr;
}

struct App::Impl
{
    AppConfig config;
    std::string configPath;
    DesktopNotifier notifier;
    bool detachedWork = false;

    Impl(AppConfig config, std::string configPath):
        config(std::move(config)), configPath(std::move(configPath)), notifier(this->config.notificationsEnabled)
    {
    }

    auto engineEntries(std::string_view preferred) -> Result<std::vector<EngineEntry>>
    {
        auto entries = std::vector<EngineEntry> {};
        auto highest = 0;
        for (auto const& engineConfig: config.engines)
        {
            entries.push_back(EngineEntry { .engine = createEngine(engineConfig), .priority = engineConfig.priority });
            highest = std::max(highest, engineConfig.priority);
        }

        if (!preferred.empty())
        {
            auto const it = std::ranges::find_if(
                entries, [preferred](const EngineEntry& entry) { return entry.engine->name() == preferred; });
            if (it == entries.end())
                return makeError(ErrorCode::InvalidArgument, std::format("No engine named '{}' configured", preferred));
            it->priority = highest + 1;
        }
        return entries;
    }

    auto makeInjector() -> std::unique_ptr<TextInjector>
    {
        if (config.injection.method == InjectionMethod::Clipboard)
            return std::make_unique<ClipboardInjector>();
        return std::make_unique<XdotoolInjector>();
    }
};

App::App(AppConfig config, std::string configPath):
    _impl(std::make_unique<Impl>(std::move(config), std::move(configPath)))
{
}

App::~App() = default;

auto App::run(const RunOptions& options) -> ExitCode
{
    auto const& config = _impl->config;
    auto const language = options.language.value_or(config.language);

    auto stopSignal = StopSignal(config.paths.stopFile);
    StopSignal::installSignalHandlers();

    auto lock = SessionLock::acquire(config.paths.lockFile);
    if (!lock)
    {
        log::error("{}", lock.error());
        if (lock.error().code == ErrorCode::SessionAlreadyActive)
            _impl->notifier.notify("Voice transcription already in progress", Urgency::Normal);
        return exitCodeFor(lock.error().code);
    }
    stopSignal.clearStale();

    auto entries = _impl->engineEntries(options.engine);
    if (!entries)
    {
        log::error("{}", entries.error());
        return exitCodeFor(entries.error().code);
    }

    auto selector =
        std::make_shared<EngineSelector>(std::move(*entries), fallbackPolicyFrom(config.fallback), _impl->notifier);
    if (auto selected = selector->selectInitial(); !selected)
    {
        log::error("{}", selected.error());
        _impl->notifier.notify("No transcription engine available", Urgency::Critical);
        return exitCodeFor(selected.error().code);
    }

    auto capture = AudioCapture(AudioCaptureConfig {
        .deviceName = config.audio.deviceName,
        .sampleRate = static_cast<std::uint32_t>(config.audio.sampleRate),
        .framesPerBuffer = static_cast<std::uint32_t>(config.audio.framesPerBuffer),
        .maxBufferedSeconds = 60.0,
    });
    if (auto initialized = capture.initialize(); !initialized)
    {
        log::error("{}", initialized.error());
        return ExitCode::Failure;
    }

    auto injector = _impl->makeInjector();
    auto session = Session(sessionConfigFrom(config, language),
                           capture,
                           selector,
                           *injector,
                           _impl->notifier,
                           [&stopSignal] { return stopSignal.requested(); });

    auto report = session.run();
    stopSignal.clearStale();
    if (report && report->abandonedCalls > 0)
        _impl->detachedWork = true;
    if (!report)
    {
        log::error("Session failed: {}", report.error());
        _impl->notifier.notify("Transcription failed", Urgency::Critical);
        return ExitCode::Failure;
    }

    if (!report->transcript.empty())
        std::println("{}", report->transcript);
    else
        std::println("No speech detected");

    log::info("Session ended ({}), engine '{}', {} fallback(s)",
              terminationReasonToString(report->reason),
              report->engine,
              report->fallbacks);

    if (report->reason == TerminationReason::Error || report->error)
        return ExitCode::Failure;
    return ExitCode::Success;
}

auto App::hasDetachedWork() const -> bool
{
    return _impl->detachedWork;
}

auto App::stop() -> ExitCode
{
    auto const& paths = _impl->config.paths;
    auto const owner = SessionLock::liveOwner(paths.lockFile);
    if (!owner)
    {
        std::println("No active session, nothing to stop");
        return ExitCode::NoSessionRunning;
    }

    if (auto written = StopSignal::requestExternal(paths.stopFile); !written)
    {
        log::error("{}", written.error());
        return ExitCode::Failure;
    }

    std::println("Stopping session (pid {})", *owner);
    return ExitCode::Success;
}

auto App::status() -> ExitCode
{
    auto const& config = _impl->config;

    if (auto const owner = SessionLock::liveOwner(config.paths.lockFile))
        std::println("session: active (pid {})", *owner);
    else
        std::println("session: idle");

    std::println("language: {}", languageModeToString(config.language));

    for (auto const& entry: EngineSelector::orderByPriority(_impl->engineEntries({}).value_or(std::vector<EngineEntry> {})))
    {
        auto const probed = entry.engine->probe();
        if (probed && *probed)
            std::println("{} (priority {}): available", entry.engine->name(), entry.priority);
        else if (probed)
            std::println("{} (priority {}): unavailable", entry.engine->name(), entry.priority);
        else
            std::println("{} (priority {}): unavailable {}", entry.engine->name(), entry.priority, probed.error());
    }
    return ExitCode::Success;
}

auto App::ping() -> ExitCode
{
    auto const& config = _impl->config;

    if (auto const owner = SessionLock::liveOwner(config.paths.lockFile))
    {
        std::println("session active (pid {})", *owner);
        return ExitCode::Success;
    }

    auto daemonEngine = DaemonEngine(DaemonEngineConfig {
        .name = "daemon",
        .socketPath = daemonSocketPath(config),
        .timeout = std::chrono::milliseconds(2000),
        .probeTimeout = std::chrono::milliseconds(2000),
    });
    if (auto const probed = daemonEngine.probe(); probed && *probed)
    {
        std::println("daemon reachable at {}", daemonSocketPath(config));
        return ExitCode::Success;
    }

    std::println("no session running");
    return ExitCode::NoSessionRunning;
}

auto App::lang(const std::optional<std::string>& code) -> ExitCode
{
    auto& config = _impl->config;

    if (!code)
    {
        std::println("Current language: {} ({})",
                     languageModeToString(config.language),
                     languageModeDisplayName(config.language));
        std::println("Supported:");
        for (auto const mode: AllLanguageModes)
            std::println("  {:<5} {}", languageModeToString(mode), languageModeDisplayName(mode));
        return ExitCode::Success;
    }

    auto const mode = parseLanguageMode(*code);
    if (!mode)
    {
        log::error("{}", mode.error().message);
        return exitCodeFor(mode.error().code);
    }

    config.language = *mode;
    if (auto saved = saveConfigToFile(_impl->configPath, config); !saved)
    {
        log::error("{}", saved.error());
        return ExitCode::Failure;
    }

    std::println("Language set to {} ({})", languageModeToString(*mode), languageModeDisplayName(*mode));
    return ExitCode::Success;
}

auto App::daemon() -> ExitCode
{
    auto const& config = _impl->config;
    auto const engineConfig = daemonEngineConfig(config);

    auto engine = std::make_shared<WhisperEngine>(WhisperConfig {
        .name = engineConfig.name,
        .modelPath = engineConfig.modelPath,
        .threads = engineConfig.threads,
        .timeout = seconds(engineConfig.timeoutSeconds),
    });
    if (auto loaded = engine->load(); !loaded)
    {
        log::error("{}", loaded.error());
        return ExitCode::Failure;
    }

    auto server = DaemonServer(DaemonServerConfig { .socketPath = daemonSocketPath(config) }, engine);
    if (auto bound = server.bind(); !bound)
    {
        log::error("{}", bound.error());
        return exitCodeFor(bound.error().code);
    }

    StopSignal::installSignalHandlers();
    auto const stopSignal = StopSignal(std::string {});

    auto serveResult = VoidResult {};
    auto finished = std::atomic<bool> { false };
    auto serving = std::jthread([&](std::stop_token token) {
        serveResult = server.serve(token);
        finished = true;
    });
    while (!stopSignal.requested() && !finished)
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

    serving.request_stop();
    serving.join();

    if (!serveResult)
    {
        log::error("{}", serveResult.error());
        return ExitCode::Failure;
    }
    return ExitCode::Success;
}

} // namespace voxtype
