// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string_view>

namespace voxtype
{

enum class Urgency
{
    Low,
    Normal,
    Critical,
};

/// @brief Best-effort user notices. Failures are never reported back to the caller.
class Notifier
{
  public:
    virtual ~Notifier() = default;

    virtual void notify(std::string_view message, Urgency urgency = Urgency::Normal) = 0;
};

} // namespace voxtype
