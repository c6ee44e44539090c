// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace voxtype
{

/// @brief How transcribed text is prepared before injection.
struct TextCleanerConfig
{
    bool removeFillers = true;
    bool trailingSpace = true;
};

/// @brief Text ready for the injector plus the voice commands found in it.
struct PreparedText
{
    std::string text;

    /// @brief The phrase ended in "just enter": press Return after typing text.
    bool pressReturn = false;

    /// @brief Returns true if there is nothing to deliver at all.
    [[nodiscard]] auto empty() const -> bool { return text.empty() && !pressReturn; }
};

/// @brief Removes hesitation words ("uh", "um", ...) and tidies the spacing they leave behind.
[[nodiscard]] auto removeFillerWords(std::string_view text) -> std::string;

/// @brief Applies filler removal, voice commands and trailing space to one phrase.
[[nodiscard]] auto prepareForInjection(std::string_view text, const TextCleanerConfig& config) -> PreparedText;

} // namespace voxtype
