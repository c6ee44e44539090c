// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <inject/TextInjector.hpp>

#include <optional>
#include <string>
#include <vector>

namespace voxtype
{

/// @brief Puts text on the clipboard and pastes it with Ctrl+V.
///
/// Uses wl-copy under Wayland and `xclip -selection clipboard` otherwise.
class ClipboardInjector: public TextInjector
{
  public:
    ClipboardInjector();

    [[nodiscard]] auto name() const -> std::string_view override { return "clipboard"; }
    [[nodiscard]] auto inject(std::string_view text) -> VoidResult override;
    [[nodiscard]] auto pressReturn() -> VoidResult override;

  private:
    std::optional<std::string> _copyCommand;
    std::vector<std::string> _copyArgs;
    std::optional<std::string> _xdotool;
};

} // namespace voxtype
