// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string_view>

namespace voxtype
{

/// @brief Delivers text to the current input focus.
///
/// Errors: InjectorUnavailable if the helper tool is missing, TargetWindowLost if it ran
/// but could not deliver the text.
class TextInjector
{
  public:
    virtual ~TextInjector() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// @brief Types or pastes @p text at the focus.
    [[nodiscard]] virtual auto inject(std::string_view text) -> VoidResult = 0;

    /// @brief Sends a single Return key press.
    [[nodiscard]] virtual auto pressReturn() -> VoidResult = 0;
};

} // namespace voxtype
