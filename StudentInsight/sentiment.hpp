#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 sentiment.hpp - Lexicon-boosted sentiment scoring for check-in text
-------------------------------------------------------------------------------
Pipeline for one text:
  1. normalize: lowercase, keep [a-z0-9], whitespace and ".,!?", collapse
     runs of whitespace.
  2. lexicon_score: mean (polarity, subjectivity) of lexicon words, with
     intensifiers ("very good") and negations ("not happy") applied to the
     next sentiment word in the same clause.
  3. stress / positive keywords matched as substrings of the normalized text.
  4. polarity adjusted by 0.15 per keyword, then bucketed at +/-0.1.

Results are cached by normalized text for the life of the scorer. The cache
is unbounded; identical input always yields identical output so concurrent
inserts of the same key are harmless.
-------------------------------------------------------------------------------
*/

struct LexiconScore {
    double polarity{ 0.0 };
    double subjectivity{ 0.0 };
    int hits{ 0 };
};

struct BatchSentimentSummary {
    std::size_t total_analyzed{ 0 };
    std::size_t positive_count{ 0 };
    std::size_t neutral_count{ 0 };
    std::size_t negative_count{ 0 };
    double average_polarity{ 0.0 };
    std::vector<std::string> common_stress_indicators;     // de-duplicated, sorted
    std::vector<std::string> common_positive_indicators;   // de-duplicated, sorted
    std::vector<SentimentResult> individual_results;
};

const std::vector<std::string>& stress_keywords();
const std::vector<std::string>& positive_keywords();

std::string normalize_text(const std::string& text);

/// Base polarity/subjectivity of already-normalized text.
LexiconScore lexicon_score(const std::string& normalized);

class SentimentScorer {
public:
    /// Empty text gives the neutral default (confidence 0.5, no indicators).
    SentimentResult analyze(const std::string& text);
    SentimentResult analyze(const std::optional<std::string>& text);
    SentimentResult analyze(const char* text) { return analyze(std::string(text ? text : "")); }

    BatchSentimentSummary analyze_batch(const std::vector<std::string>& texts);

    std::size_t cache_size() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, SentimentResult> cache_;
};

/// 1..10 wellbeing score from a scored text.
int mental_health_score(const SentimentResult& r);
int mental_health_score(double polarity, std::size_t stress_count, std::size_t positive_count);

/// "Concerning - Seek support", "Fair - Monitor closely", ...
std::string mental_health_label(int score);
