// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <print>
#include <string>

namespace voxtype::log
{

namespace
{
    struct Sinks
    {
        std::mutex mutex;
        std::FILE* file = nullptr;
        std::string role = "voxtype";
    };

    auto currentLevel = std::atomic<Level> { Level::Info };

    auto sinks() -> Sinks&
    {
        static auto instance = Sinks {};
        return instance;
    }

    constexpr auto levelTag(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "E";
            case Level::Warning: return "W";
            case Level::Info: return "I";
            case Level::Debug: return "D";
            case Level::Trace: return "T";
        }
        return "?";
    }
} // namespace

auto levelFromString(std::string_view name) -> std::optional<Level>
{
    if (name == "error")
        return Level::Error;
    if (name == "warning")
        return Level::Warning;
    if (name == "info")
        return Level::Info;
    if (name == "debug")
        return Level::Debug;
    if (name == "trace")
        return Level::Trace;
    return std::nullopt;
}

void setLevel(Level level)
{
    currentLevel.store(level);
}

auto getLevel() -> Level
{
    return currentLevel.load();
}

void setRole(std::string_view role)
{
    auto& s = sinks();
    auto lock = std::lock_guard(s.mutex);
    s.role = std::string(role);
}

void setLogFile(std::string_view path)
{
    auto& s = sinks();
    auto lock = std::lock_guard(s.mutex);

    if (s.file)
    {
        std::fclose(s.file);
        s.file = nullptr;
    }

    if (path.empty())
        return;

    s.file = std::fopen(std::string(path).c_str(), "a");
    if (!s.file)
        std::println(stderr, "voxtype: cannot open log file {}, logging to the console only", path);
}

void write(Level level, std::string_view message)
{
    if (level > getLevel())
        return;

    auto& s = sinks();
    auto lock = std::lock_guard(s.mutex);

    if (s.file)
    {
        auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        std::println(s.file, "{:%F %T} {} {}[{}] {}", now, levelTag(level), s.role, ::getpid(), message);
        std::fflush(s.file);
    }

    std::println(stderr, "{}: {}", s.role, message);
}

} // namespace voxtype::log
