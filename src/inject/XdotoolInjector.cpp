// SPDX-License-Identifier: Apache-2.0
#include "XdotoolInjector.hpp"

#include <core/Log.hpp>
#include <core/Process.hpp>

#include <format>
#include <optional>
#include <string>
#include <vector>

namespace voxtype
{

namespace
{

    auto runXdotool(const std::optional<std::string>& xdotool, std::vector<std::string> args) -> VoidResult
    {
        if (!xdotool)
            return makeError(ErrorCode::InjectorUnavailable, "xdotool not installed");

        auto const exitCode = runProcess(ProcessSpec { .command = *xdotool, .args = std::move(args), .stdinData = {} });
        if (!exitCode)
            return makeError(ErrorCode::InjectorUnavailable, exitCode.error().message);
        if (*exitCode != 0)
            return makeError(ErrorCode::TargetWindowLost, std::format("xdotool exited with status {}", *exitCode));
        return {};
    }

} // namespace

auto sendXdotoolKeys(const std::optional<std::string>& xdotool, std::string_view keys) -> VoidResult
{
    return runXdotool(xdotool, { "key", "--clearmodifiers", std::string(keys) });
}

XdotoolInjector::XdotoolInjector(): _xdotool(findExecutable("xdotool"))
{
    if (!_xdotool)
        log::warning("xdotool not found in PATH; text cannot be typed");
}

auto XdotoolInjector::inject(std::string_view text) -> VoidResult
{
    return runXdotool(_xdotool, { "type", "--delay", "0", "--", std::string(text) });
}

auto XdotoolInjector::pressReturn() -> VoidResult
{
    return sendXdotoolKeys(_xdotool, "Return");
}

} // namespace voxtype
