// SPDX-License-Identifier: Apache-2.0
#include "DesktopNotifier.hpp"

#include <core/Log.hpp>
#include <core/Process.hpp>

#include <format>

namespace voxtype
{

namespace
{

    auto urgencyName(Urgency urgency) -> std::string_view
    {
        switch (urgency)
        {
            case Urgency::Low: return "low";
            case Urgency::Normal: return "normal";
            case Urgency::Critical: return "critical";
        }
        return "normal";
    }

    auto expireTime(Urgency urgency) -> std::string_view
    {
        return urgency == Urgency::Low ? "800" : "1500";
    }

} // namespace

DesktopNotifier::DesktopNotifier(bool enabled): _enabled(enabled)
{
    if (_enabled)
        _notifySend = findExecutable("notify-send");
}

void DesktopNotifier::notify(std::string_view message, Urgency urgency)
{
    log::info("Notice: {}", message);

    if (!_enabled || !_notifySend)
        return;

    auto const spec = ProcessSpec {
        .command = *_notifySend,
        .args = { "--app-name",
                  "voxtype",
                  "--urgency",
                  std::string(urgencyName(urgency)),
                  "--expire-time",
                  std::string(expireTime(urgency)),
                  "--hint",
                  "int:transient:1",
                  "voxtype",
                  std::string(message) },
        .stdinData = {},
    };

    auto const exitCode = runProcess(spec);
    if (!exitCode)
        log::debug("notify-send failed: {}", exitCode.error());
    else if (*exitCode != 0)
        log::debug("notify-send exited with status {}", *exitCode);
}

} // namespace voxtype
