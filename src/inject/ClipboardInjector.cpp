// SPDX-License-Identifier: Apache-2.0
#include "ClipboardInjector.hpp"

#include <core/Log.hpp>
#include <core/Process.hpp>
#include <inject/XdotoolInjector.hpp>

#include <cstdlib>
#include <format>

namespace voxtype
{

ClipboardInjector::ClipboardInjector(): _xdotool(findExecutable("xdotool"))
{
    auto const* wayland = std::getenv("WAYLAND_DISPLAY");
    if (wayland && *wayland)
    {
        _copyCommand = findExecutable("wl-copy");
    }
    if (!_copyCommand)
    {
        _copyCommand = findExecutable("xclip");
        _copyArgs = { "-selection", "clipboard" };
    }

    if (!_copyCommand)
        log::warning("Neither wl-copy nor xclip found in PATH; clipboard injection unavailable");
}

auto ClipboardInjector::inject(std::string_view text) -> VoidResult
{
    if (!_copyCommand)
        return makeError(ErrorCode::InjectorUnavailable, "No clipboard tool installed");

    auto const copied =
        runProcess(ProcessSpec { .command = *_copyCommand, .args = _copyArgs, .stdinData = std::string(text) });
    if (!copied)
        return makeError(ErrorCode::InjectorUnavailable, copied.error().message);
    if (*copied != 0)
        return makeError(ErrorCode::TargetWindowLost,
                         std::format("{} exited with status {}", *_copyCommand, *copied));

    return sendXdotoolKeys(_xdotool, "ctrl+v");
}

auto ClipboardInjector::pressReturn() -> VoidResult
{
    return sendXdotoolKeys(_xdotool, "Return");
}

} // namespace voxtype
