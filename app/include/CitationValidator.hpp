/*
 * Verbatim quote check of analysis output against its source
 * Part of Civic Gateway - provider-resilient LLM and search access for civic analysis
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef CITATION_VALIDATOR_HPP
#define CITATION_VALIDATOR_HPP

#include <cstddef>
#include <string>
#include <vector>

/**
 * Flags double-quoted spans of an analysis that do not occur verbatim in
 * the source text. Quotes of kMinQuoteLength characters or fewer are not
 * checked. Matching is exact, so paraphrases and whitespace changes are
 * reported too. Never throws and never blocks output.
 */
class CitationValidator {
public:
    static constexpr std::size_t kMinQuoteLength = 20;
    static constexpr std::size_t kPreviewLength = 50;

    static std::vector<std::string> validate_citations(const std::string& analysis_text,
                                                       const std::string& source_text);

    /**
     * Spans between pairs of straight double quotes, in order of appearance
     */
    static std::vector<std::string> extract_quotes(const std::string& text);

private:
    static std::size_t utf8_length(const std::string& text);
    static std::string utf8_prefix(const std::string& text, std::size_t max_chars);
};

#endif // CITATION_VALIDATOR_HPP
