/*
 * Verbatim quote check implementation
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "CitationValidator.hpp"
#include "Logger.hpp"

namespace {

bool is_continuation_byte(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

} // namespace

std::vector<std::string> CitationValidator::extract_quotes(const std::string& text)
{
    std::vector<std::string> quotes;

    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t open = text.find('"', pos);
        if (open == std::string::npos) {
            break;
        }
        const std::size_t close = text.find('"', open + 1);
        if (close == std::string::npos) {
            break;
        }
        // Empty "" pairs are not quotes; the closing mark may open the next one
        if (close == open + 1) {
            pos = close;
            continue;
        }
        quotes.push_back(text.substr(open + 1, close - open - 1));
        pos = close + 1;
    }

    return quotes;
}

std::size_t CitationValidator::utf8_length(const std::string& text)
{
    std::size_t length = 0;
    for (unsigned char c : text) {
        if (!is_continuation_byte(c)) {
            ++length;
        }
    }
    return length;
}

std::string CitationValidator::utf8_prefix(const std::string& text, std::size_t max_chars)
{
    std::size_t chars = 0;
    std::size_t i = 0;
    for (; i < text.size(); ++i) {
        if (!is_continuation_byte(static_cast<unsigned char>(text[i]))) {
            if (chars == max_chars) {
                break;
            }
            ++chars;
        }
    }
    return text.substr(0, i);
}

std::vector<std::string> CitationValidator::validate_citations(const std::string& analysis_text,
                                                               const std::string& source_text)
{
    std::vector<std::string> warnings;

    for (const auto& quote : extract_quotes(analysis_text)) {
        if (utf8_length(quote) <= kMinQuoteLength) {
            continue;
        }
        if (source_text.find(quote) != std::string::npos) {
            continue;
        }
        warnings.push_back("Quote not found in source: \"" +
                           utf8_prefix(quote, kPreviewLength) + "...\"");
    }

    if (!warnings.empty()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Citation check flagged {} quote(s) as possible hallucinations",
                         warnings.size());
        }
    }

    return warnings;
}
