// SPDX-License-Identifier: Apache-2.0
#include "TextCleaner.hpp"

#include <regex>

namespace voxtype
{

namespace
{

    auto trim(std::string_view text) -> std::string
    {
        auto const start = text.find_first_not_of(" \t\n\r");
        if (start == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\n\r");
        return std::string(text.substr(start, end - start + 1));
    }

    auto const& fillerPattern()
    {
        static auto const pattern =
            std::regex(R"(\b(uh|um|er|ah|eh|uhm|hmm|hm|mm)\b)", std::regex::ECMAScript | std::regex::icase);
        return pattern;
    }

    auto const& justEnterPattern()
    {
        static auto const pattern =
            std::regex(R"(^(.*?)\s*\bjust\s+enter[.!\s]*$)", std::regex::ECMAScript | std::regex::icase);
        return pattern;
    }

} // namespace

auto removeFillerWords(std::string_view text) -> std::string
{
    static auto const whitespace = std::regex(R"(\s+)");
    static auto const doubleComma = std::regex(R"(\s*,\s*,\s*)");
    static auto const leading = std::regex(R"(^[,\s]+)");
    static auto const trailing = std::regex(R"([,\s]+$)");
    static auto const spaceBeforePunct = std::regex(R"(\s+([,.!?;:]))");

    auto result = std::regex_replace(std::string(text), fillerPattern(), "");
    result = std::regex_replace(result, whitespace, " ");
    result = std::regex_replace(result, doubleComma, ", ");
    result = std::regex_replace(result, leading, "");
    result = std::regex_replace(result, trailing, "");
    result = std::regex_replace(result, spaceBeforePunct, "$1");
    return trim(result);
}

auto prepareForInjection(std::string_view text, const TextCleanerConfig& config) -> PreparedText
{
    auto prepared = PreparedText {};
    auto cleaned = config.removeFillers ? removeFillerWords(text) : trim(text);
    if (cleaned.empty())
        return prepared;

    auto match = std::smatch {};
    if (std::regex_match(cleaned, match, justEnterPattern()))
    {
        prepared.pressReturn = true;
        cleaned = trim(match[1].str());
        if (cleaned.empty())
            return prepared;
    }

    prepared.text = std::move(cleaned);
    if (config.trailingSpace && !prepared.pressReturn)
        prepared.text += ' ';
    return prepared;
}

} // namespace voxtype
