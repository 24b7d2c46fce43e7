/**
 * @file refusal_classifier.hpp
 * @brief Phrase-based refusal heuristic for model responses
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Driftwatch {

/**
 * @brief Flags responses that open with or contain a known refusal phrase.
 *
 * Matching is case-insensitive (ASCII) substring search. Used to annotate
 * refusal examples; the refusal_flag recorded by the serving system stays
 * authoritative for rates.
 */
class RefusalClassifier {
public:
    RefusalClassifier();
    explicit RefusalClassifier(std::vector<std::string> phrases);

    static const std::vector<std::string>& default_phrases();

    bool is_refusal(const std::string& response) const;

    /**
     * @return the first phrase (in list order) contained in the response
     */
    std::optional<std::string> matched_phrase(const std::string& response) const;

    const std::vector<std::string>& phrases() const { return phrases_; }

private:
    std::vector<std::string> phrases_;
};

} // namespace Driftwatch
