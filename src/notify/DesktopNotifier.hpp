// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <notify/Notifier.hpp>

#include <optional>
#include <string>

namespace voxtype
{

/// @brief Shows transient desktop notifications through notify-send.
class DesktopNotifier: public Notifier
{
  public:
    explicit DesktopNotifier(bool enabled);

    void notify(std::string_view message, Urgency urgency = Urgency::Normal) override;

  private:
    bool _enabled;
    std::optional<std::string> _notifySend;
};

} // namespace voxtype
