// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace voxtype
{

namespace
{

    constexpr auto DefaultWhisperModelFilename = std::string_view { "ggml-tiny.bin" };

    // Per-type defaults; a local model gets far more time per phrase than the cloud.
    auto engineDefaults(EngineType type) -> EngineConfig
    {
        auto engine = EngineConfig {};
        engine.type = type;
        engine.name = std::string(engineTypeToString(type));
        switch (type)
        {
            case EngineType::ElevenLabs: engine.timeoutSeconds = 8.0; break;
            case EngineType::Whisper:
                engine.timeoutSeconds = 30.0;
                engine.modelPath = defaultWhisperModelPath();
                break;
            case EngineType::Daemon: engine.timeoutSeconds = 15.0; break;
        }
        return engine;
    }

    auto parseEngine(const nlohmann::json& entry, std::size_t index) -> Result<EngineConfig>
    {
        if (!entry.is_object())
            return makeError(ErrorCode::ConfigError, std::format("engines[{}] is not an object", index));

        auto typeStr = std::string {};
        json::read(entry, "type", typeStr);
        auto const type = engineTypeFromString(typeStr);
        if (!type)
            return makeError(ErrorCode::ConfigError,
                             std::format("engines[{}] has unknown type '{}'", index, typeStr));

        auto engine = engineDefaults(*type);
        json::read(entry, "name", engine.name);
        json::read(entry, "priority", engine.priority);
        json::read(entry, "timeoutSeconds", engine.timeoutSeconds);

        switch (*type)
        {
            case EngineType::ElevenLabs:
                json::read(entry, "apiKeyEnv", engine.apiKeyEnv);
                json::read(entry, "apiKey", engine.apiKey);
                json::read(entry, "baseUrl", engine.baseUrl);
                json::read(entry, "modelId", engine.modelId);
                json::read(entry, "probeTimeoutSeconds", engine.probeTimeoutSeconds);
                break;
            case EngineType::Whisper:
                json::read(entry, "modelPath", engine.modelPath);
                json::read(entry, "threads", engine.threads);
                break;
            case EngineType::Daemon: json::read(entry, "socketPath", engine.socketPath); break;
        }

        return engine;
    }

    auto engineToJson(const EngineConfig& engine) -> nlohmann::json
    {
        auto out = nlohmann::json {
            { "name", engine.name },
            { "type", engineTypeToString(engine.type) },
            { "priority", engine.priority },
            { "timeoutSeconds", engine.timeoutSeconds },
        };

        switch (engine.type)
        {
            case EngineType::ElevenLabs:
                out["apiKeyEnv"] = engine.apiKeyEnv;
                if (!engine.apiKey.empty())
                    out["apiKey"] = engine.apiKey;
                out["baseUrl"] = engine.baseUrl;
                out["modelId"] = engine.modelId;
                out["probeTimeoutSeconds"] = engine.probeTimeoutSeconds;
                break;
            case EngineType::Whisper:
                out["modelPath"] = engine.modelPath;
                out["threads"] = engine.threads;
                break;
            case EngineType::Daemon: out["socketPath"] = engine.socketPath; break;
        }
        return out;
    }

} // namespace

auto engineTypeToString(EngineType type) -> std::string_view
{
    switch (type)
    {
        case EngineType::ElevenLabs: return "elevenlabs";
        case EngineType::Whisper: return "whisper";
        case EngineType::Daemon: return "daemon";
    }
    return "elevenlabs";
}

auto engineTypeFromString(std::string_view str) -> std::optional<EngineType>
{
    if (str == "elevenlabs")
        return EngineType::ElevenLabs;
    if (str == "whisper")
        return EngineType::Whisper;
    if (str == "daemon")
        return EngineType::Daemon;
    return std::nullopt;
}

auto parseLanguageMode(std::string_view code) -> Result<LanguageMode>
{
    if (auto const mode = languageModeFromString(code))
        return *mode;
    return makeError(ErrorCode::InvalidArgument, std::format("Unsupported language '{}' (use auto, en or cs)", code));
}

auto EngineConfig::resolveApiKey() const -> std::string
{
    if (!apiKey.empty())
        return apiKey;
    if (apiKeyEnv.empty())
        return {};
    auto const* const value = std::getenv(apiKeyEnv.c_str());
    return value ? std::string(value) : std::string {};
}

auto AppConfig::defaultEngines() -> std::vector<EngineConfig>
{
    auto elevenlabs = engineDefaults(EngineType::ElevenLabs);
    elevenlabs.priority = 100;

    auto whisper = engineDefaults(EngineType::Whisper);
    whisper.priority = 50;

    return { std::move(elevenlabs), std::move(whisper) };
}

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/voxtype";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/voxtype";
    return ".";
}

auto defaultDataDir() -> std::string
{
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData && *xdgData)
        return std::string(xdgData) + "/voxtype";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/voxtype";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto defaultWhisperModelPath() -> std::string
{
    return defaultDataDir() + "/models/" + std::string(DefaultWhisperModelFilename);
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    auto languageStr = std::string { "auto" };
    json::read(root, "language", languageStr);
    if (auto const language = languageModeFromString(languageStr))
        config.language = *language;
    else
        log::warning("Unsupported language '{}' in config, using auto", languageStr);

    if (auto const* vad = json::section(root, "vad"))
    {
        json::read(*vad, "silenceThreshold", config.vad.silenceThreshold);
        json::read(*vad, "shortPauseSeconds", config.vad.shortPauseSeconds);
        json::read(*vad, "longPauseSeconds", config.vad.longPauseSeconds);
        json::read(*vad, "minPhraseSeconds", config.vad.minPhraseSeconds);
        json::read(*vad, "maxSessionSeconds", config.vad.maxSessionSeconds);
    }

    if (auto const* audio = json::section(root, "audio"))
    {
        json::read(*audio, "deviceName", config.audio.deviceName);
        json::read(*audio, "sampleRate", config.audio.sampleRate);
        json::read(*audio, "framesPerBuffer", config.audio.framesPerBuffer);
    }

    if (auto const* fallback = json::section(root, "fallback"))
    {
        json::read(*fallback, "failureThreshold", config.fallback.failureThreshold);
        json::read(*fallback, "rateLimitRetries", config.fallback.rateLimitRetries);
        json::read(*fallback, "rateLimitBackoffSeconds", config.fallback.rateLimitBackoffSeconds);
    }

    if (auto const* pipeline = json::section(root, "pipeline"))
    {
        json::read(*pipeline, "maxInFlight", config.pipeline.maxInFlight);
        json::read(*pipeline, "maxQueuedChunks", config.pipeline.maxQueuedChunks);
        json::read(*pipeline, "resultTimeoutSeconds", config.pipeline.resultTimeoutSeconds);
        json::read(*pipeline, "stopGraceSeconds", config.pipeline.stopGraceSeconds);
    }

    if (root.contains("engines") && root["engines"].is_array())
    {
        config.engines.clear();
        auto index = std::size_t { 0 };
        for (auto const& entry: root["engines"])
        {
            auto engine = parseEngine(entry, index++);
            if (!engine)
                return std::unexpected(engine.error());
            config.engines.push_back(std::move(*engine));
        }
    }

    if (auto const* injection = json::section(root, "injection"))
    {
        auto method = std::string { "type" };
        json::read(*injection, "method", method);
        config.injection.method = (method == "clipboard") ? InjectionMethod::Clipboard : InjectionMethod::Type;
        json::read(*injection, "removeFillers", config.injection.removeFillers);
        json::read(*injection, "trailingSpace", config.injection.trailingSpace);
    }

    if (auto const* notifications = json::section(root, "notifications"))
        json::read(*notifications, "enabled", config.notificationsEnabled);

    if (auto const* paths = json::section(root, "paths"))
    {
        json::read(*paths, "lockFile", config.paths.lockFile);
        json::read(*paths, "stopFile", config.paths.stopFile);
        json::read(*paths, "logFile", config.paths.logFile);
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str(), ErrorCode::ConfigError);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, parseResult.error().message));

    return configFromJson(*parseResult);
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["language"] = languageModeToString(config.language);

    root["vad"] = nlohmann::json {
        { "silenceThreshold", config.vad.silenceThreshold },
        { "shortPauseSeconds", config.vad.shortPauseSeconds },
        { "longPauseSeconds", config.vad.longPauseSeconds },
        { "minPhraseSeconds", config.vad.minPhraseSeconds },
        { "maxSessionSeconds", config.vad.maxSessionSeconds },
    };

    auto audio = nlohmann::json::object();
    if (!config.audio.deviceName.empty())
        audio["deviceName"] = config.audio.deviceName;
    audio["sampleRate"] = config.audio.sampleRate;
    audio["framesPerBuffer"] = config.audio.framesPerBuffer;
    root["audio"] = std::move(audio);

    root["fallback"] = nlohmann::json {
        { "failureThreshold", config.fallback.failureThreshold },
        { "rateLimitRetries", config.fallback.rateLimitRetries },
        { "rateLimitBackoffSeconds", config.fallback.rateLimitBackoffSeconds },
    };

    root["pipeline"] = nlohmann::json {
        { "maxInFlight", config.pipeline.maxInFlight },
        { "maxQueuedChunks", config.pipeline.maxQueuedChunks },
        { "resultTimeoutSeconds", config.pipeline.resultTimeoutSeconds },
        { "stopGraceSeconds", config.pipeline.stopGraceSeconds },
    };

    auto engines = nlohmann::json::array();
    for (auto const& engine: config.engines)
        engines.push_back(engineToJson(engine));
    root["engines"] = std::move(engines);

    root["injection"] = nlohmann::json {
        { "method", config.injection.method == InjectionMethod::Clipboard ? "clipboard" : "type" },
        { "removeFillers", config.injection.removeFillers },
        { "trailingSpace", config.injection.trailingSpace },
    };

    root["notifications"] = nlohmann::json { { "enabled", config.notificationsEnabled } };

    root["paths"] = nlohmann::json {
        { "lockFile", config.paths.lockFile },
        { "stopFile", config.paths.stopFile },
        { "logFile", config.paths.logFile },
    };

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::ConfigError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace voxtype
