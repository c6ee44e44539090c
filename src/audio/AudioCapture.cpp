// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voxtype
{

struct AudioCapture::Impl
{
    AudioCaptureConfig config;
    ma_context context {};
    ma_device device {};
    bool contextInitialized = false;
    bool initialized = false;
    bool capturing = false;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::int16_t> partial;
    std::deque<AudioFrame> frames;
    std::size_t maxFrames = 0;
    std::size_t droppedFrames = 0;
    std::atomic<bool> stopping = false;
    std::optional<Error> deviceError;

    void push(const std::int16_t* samples, ma_uint32 count)
    {
        auto lock = std::lock_guard(mutex);
        partial.insert(partial.end(), samples, samples + count);

        auto const frameSize = static_cast<std::size_t>(config.framesPerBuffer);
        while (partial.size() >= frameSize)
        {
            auto frame = AudioFrame {
                .timestamp = std::chrono::steady_clock::now(),
                .samples = std::vector<std::int16_t>(partial.begin(), partial.begin() + frameSize),
                .sampleRate = config.sampleRate,
            };
            partial.erase(partial.begin(), partial.begin() + frameSize);

            if (frames.size() >= maxFrames)
            {
                frames.pop_front();
                ++droppedFrames;
            }
            frames.push_back(std::move(frame));
        }
        cv.notify_one();
    }

    void fail(std::string message)
    {
        auto lock = std::lock_guard(mutex);
        if (!deviceError)
            deviceError = Error { ErrorCode::AudioError, std::move(message) };
        cv.notify_all();
    }
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (impl && input)
            impl->push(static_cast<const std::int16_t*>(input), frameCount);
    }

    void deviceNotificationCallback(const ma_device_notification* notification)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(notification->pDevice->pUserData);
        if (!impl)
            return;

        if (notification->type == ma_device_notification_type_stopped && !impl->stopping.load())
            impl->fail("Capture device stopped unexpectedly");
    }

    auto toLower(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

} // namespace

AudioCapture::AudioCapture(AudioCaptureConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
    auto const framesPerSecond =
        static_cast<double>(_impl->config.sampleRate) / static_cast<double>(_impl->config.framesPerBuffer);
    _impl->maxFrames = std::max<std::size_t>(
        1, static_cast<std::size_t>(framesPerSecond * _impl->config.maxBufferedSeconds));
}

AudioCapture::~AudioCapture()
{
    close();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioCapture::initialize() -> VoidResult
{
    // The context must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, nullptr, nullptr, &pCaptureDevices, &captureCount);

    auto matchedDeviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
    {
        log::debug("Available capture devices:");
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("  [{}] {}", i, pCaptureDevices[i].name);

        auto const& deviceName = _impl->config.deviceName;
        if (!deviceName.empty())
        {
            auto const lowerTarget = toLower(deviceName);
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (toLower(pCaptureDevices[i].name).find(lowerTarget) != std::string::npos)
                {
                    log::info(
                        "Matched capture device '{}' for filter '{}'", pCaptureDevices[i].name, deviceName);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }

            if (!matchedDeviceId)
                log::warning("No capture device matching '{}' found, falling back to auto-select",
                             deviceName);
        }

        // Monitors are loopback sources, not microphones
        if (!matchedDeviceId)
        {
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (!toLower(pCaptureDevices[i].name).starts_with("monitor"))
                {
                    log::debug("Auto-selected capture device '{}'", pCaptureDevices[i].name);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }
        }
    }
    else
    {
        log::warning("Failed to enumerate capture devices (code: {}), using default",
                     static_cast<int>(enumResult));
    }

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_s16;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = _impl->config.sampleRate;
    deviceConfig.periodSizeInFrames = _impl->config.framesPerBuffer;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.notificationCallback = deviceNotificationCallback;
    deviceConfig.pUserData = _impl.get();

    if (matchedDeviceId)
        deviceConfig.capture.pDeviceID = &*matchedDeviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio device: {}", static_cast<int>(result)));

    _impl->initialized = true;
    log::info("Audio capture device: {} ({} Hz, mono, int16, {} samples/frame)",
              _impl->device.capture.name,
              _impl->config.sampleRate,
              _impl->config.framesPerBuffer);
    return {};
}

auto AudioCapture::start() -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::AudioError, "Audio device not initialized");

    if (_impl->capturing)
        return {};

    _impl->stopping = false;
    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));

    _impl->capturing = true;
    log::debug("Audio capture started");
    return {};
}

auto AudioCapture::nextFrame(std::chrono::milliseconds timeout) -> Result<std::optional<AudioFrame>>
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->cv.wait_for(lock, timeout, [this] { return !_impl->frames.empty() || _impl->deviceError; });

    if (_impl->droppedFrames > 0)
    {
        log::warning("Audio queue overflow, dropped {} frame(s)", _impl->droppedFrames);
        _impl->droppedFrames = 0;
    }

    if (!_impl->frames.empty())
    {
        auto frame = std::move(_impl->frames.front());
        _impl->frames.pop_front();
        return frame;
    }

    if (_impl->deviceError)
        return std::unexpected(*_impl->deviceError);

    return std::nullopt;
}

void AudioCapture::close()
{
    if (!_impl->capturing)
        return;

    _impl->stopping = true;
    ma_device_stop(&_impl->device);
    _impl->capturing = false;
    log::debug("Audio capture stopped");
}

auto AudioCapture::sampleRate() const -> std::uint32_t
{
    return _impl->config.sampleRate;
}

} // namespace voxtype
