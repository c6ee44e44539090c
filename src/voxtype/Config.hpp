// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxtype
{

/// @brief Kind of transcription backend an engine entry describes.
enum class EngineType : std::uint8_t
{
    ElevenLabs,
    Whisper,
    Daemon,
};

[[nodiscard]] auto engineTypeToString(EngineType type) -> std::string_view;
[[nodiscard]] auto engineTypeFromString(std::string_view str) -> std::optional<EngineType>;

/// @brief Parses a language code given on the command line.
/// @return The mode, or InvalidArgument naming the supported codes.
[[nodiscard]] auto parseLanguageMode(std::string_view code) -> Result<LanguageMode>;

/// @brief One entry of the `engines` array.
struct EngineConfig
{
    std::string name;
    EngineType type = EngineType::ElevenLabs;
    int priority = 0;
    double timeoutSeconds = 8.0;

    // elevenlabs
    std::string apiKeyEnv = "ELEVENLABS_API_KEY";
    std::string apiKey;
    std::string baseUrl = "https://api.elevenlabs.io/v1";
    std::string modelId = "scribe_v1";
    double probeTimeoutSeconds = 5.0;

    // whisper
    std::string modelPath;
    int threads = 4;

    // daemon
    std::string socketPath = "/tmp/voxtype.sock";

    /// @brief Returns the API key: the explicit one, else the environment variable.
    [[nodiscard]] auto resolveApiKey() const -> std::string;
};

/// @brief Voice-activity thresholds section.
struct VadSection
{
    double silenceThreshold = 50.0;
    double shortPauseSeconds = 1.5;
    double longPauseSeconds = 4.0;
    double minPhraseSeconds = 2.0;
    double maxSessionSeconds = 45.0;
};

/// @brief Microphone section.
struct AudioSection
{
    /// @brief Substring of the capture device name; empty selects the first non-monitor device.
    std::string deviceName;
    int sampleRate = 16000;
    int framesPerBuffer = 1024;
};

/// @brief Fallback controller section.
struct FallbackSection
{
    int failureThreshold = 1;
    int rateLimitRetries = 2;
    double rateLimitBackoffSeconds = 1.0;
};

/// @brief Concurrency and teardown section.
struct PipelineSection
{
    int maxInFlight = 3;
    int maxQueuedChunks = 4;
    double resultTimeoutSeconds = 20.0;
    double stopGraceSeconds = 3.0;
};

enum class InjectionMethod : std::uint8_t
{
    Type,
    Clipboard,
};

struct InjectionSection
{
    InjectionMethod method = InjectionMethod::Type;
    bool removeFillers = true;
    bool trailingSpace = true;
};

struct PathsSection
{
    std::string lockFile = "/tmp/voxtype.pid";
    std::string stopFile = "/tmp/voxtype.stop";
    std::string logFile = "/tmp/voxtype.log";
};

/// @brief Top-level application configuration.
struct AppConfig
{
    LanguageMode language = LanguageMode::Auto;
    VadSection vad;
    AudioSection audio;
    FallbackSection fallback;
    PipelineSection pipeline;
    std::vector<EngineConfig> engines = defaultEngines();
    InjectionSection injection;
    bool notificationsEnabled = true;
    PathsSection paths;

    /// @brief ElevenLabs first, local whisper as fallback.
    [[nodiscard]] static auto defaultEngines() -> std::vector<EngineConfig>;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration (defaults if there is no file) or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Builds a configuration from an already parsed JSON document.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file, creating its directory.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns $XDG_CONFIG_HOME/voxtype or ~/.config/voxtype.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns $XDG_DATA_HOME/voxtype or ~/.local/share/voxtype.
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the default whisper model file path.
[[nodiscard]] auto defaultWhisperModelPath() -> std::string;

} // namespace voxtype
