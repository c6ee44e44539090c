// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <inject/TextInjector.hpp>

#include <optional>
#include <string>

namespace voxtype
{

/// @brief Synthesizes keystrokes with `xdotool type`.
class XdotoolInjector: public TextInjector
{
  public:
    XdotoolInjector();

    [[nodiscard]] auto name() const -> std::string_view override { return "xdotool"; }
    [[nodiscard]] auto inject(std::string_view text) -> VoidResult override;
    [[nodiscard]] auto pressReturn() -> VoidResult override;

  private:
    std::optional<std::string> _xdotool;
};

/// @brief Runs `xdotool key <keys>`, mapping failures to the injection error codes.
[[nodiscard]] auto sendXdotoolKeys(const std::optional<std::string>& xdotool, std::string_view keys) -> VoidResult;

} // namespace voxtype
