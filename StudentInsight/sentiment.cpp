#include "sentiment.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>
#include "helpers.hpp"

namespace {

struct LexEntry {
    double polarity;
    double subjectivity;
};

// Word-level polarity/subjectivity, in the spirit of the pattern/TextBlob
// adjective lexicon. Tokens are matched whole.
const std::unordered_map<std::string, LexEntry>& lexicon() {
    static const std::unordered_map<std::string, LexEntry> lex = {
        // positive
        { "good", { 0.7, 0.6 } },        { "great", { 0.8, 0.75 } },
        { "excellent", { 1.0, 1.0 } },   { "amazing", { 0.6, 0.9 } },
        { "wonderful", { 1.0, 1.0 } },   { "fantastic", { 0.4, 0.9 } },
        { "awesome", { 1.0, 1.0 } },     { "happy", { 0.8, 1.0 } },
        { "glad", { 0.5, 1.0 } },        { "love", { 0.5, 0.6 } },
        { "loved", { 0.7, 0.8 } },       { "enjoy", { 0.4, 0.5 } },
        { "enjoyed", { 0.4, 0.5 } },     { "nice", { 0.6, 1.0 } },
        { "fine", { 0.4, 0.5 } },        { "better", { 0.5, 0.5 } },
        { "best", { 1.0, 0.3 } },        { "proud", { 0.8, 1.0 } },
        { "confident", { 0.5, 0.8 } },   { "excited", { 0.375, 0.75 } },
        { "exciting", { 0.3, 0.8 } },    { "positive", { 0.227, 0.545 } },
        { "calm", { 0.3, 0.75 } },       { "relaxed", { 0.3, 0.6 } },
        { "interesting", { 0.5, 0.5 } }, { "easy", { 0.433, 0.833 } },
        { "fun", { 0.3, 0.2 } },         { "successful", { 0.75, 0.95 } },
        { "satisfied", { 0.5, 1.0 } },   { "grateful", { 0.5, 0.7 } },
        { "optimistic", { 0.4, 0.6 } },  { "okay", { 0.5, 0.5 } },
        { "ok", { 0.5, 0.5 } },          { "productive", { 0.4, 0.6 } },
        { "focused", { 0.3, 0.5 } },     { "rested", { 0.3, 0.5 } },
        { "helpful", { 0.4, 0.5 } },     { "clear", { 0.1, 0.383 } },
        { "motivated", { 0.4, 0.6 } },   { "cheerful", { 0.6, 0.9 } },
        { "perfect", { 1.0, 1.0 } },     { "well", { 0.2, 0.3 } },
        // negative
        { "bad", { -0.7, 0.667 } },      { "terrible", { -1.0, 1.0 } },
        { "awful", { -1.0, 1.0 } },      { "worst", { -1.0, 1.0 } },
        { "worse", { -0.4, 0.6 } },      { "sad", { -0.5, 1.0 } },
        { "unhappy", { -0.6, 0.9 } },    { "angry", { -0.5, 1.0 } },
        { "hate", { -0.8, 0.9 } },       { "horrible", { -1.0, 1.0 } },
        { "difficult", { -0.5, 1.0 } },  { "hard", { -0.292, 0.542 } },
        { "stressed", { -0.5, 0.8 } },   { "stressful", { -0.5, 0.8 } },
        { "anxious", { -0.25, 0.75 } },  { "worried", { -0.4, 0.7 } },
        { "tired", { -0.4, 0.7 } },      { "exhausted", { -0.4, 0.6 } },
        { "boring", { -1.0, 1.0 } },     { "bored", { -0.5, 1.0 } },
        { "confused", { -0.4, 0.7 } },   { "lonely", { -0.5, 0.9 } },
        { "poor", { -0.4, 0.6 } },       { "sick", { -0.714, 0.857 } },
        { "overwhelmed", { -0.4, 0.7 } },{ "frustrated", { -0.7, 0.8 } },
        { "frustrating", { -0.4, 0.7 } },{ "scared", { -0.4, 0.8 } },
        { "hopeless", { -0.6, 0.8 } },   { "depressed", { -0.6, 0.9 } },
        { "failing", { -0.5, 0.5 } },    { "failed", { -0.5, 0.3 } },
        { "upset", { -0.5, 0.7 } },      { "nervous", { -0.3, 0.7 } },
        { "miserable", { -1.0, 1.0 } },  { "useless", { -0.5, 0.2 } },
        { "struggling", { -0.3, 0.6 } }, { "stupid", { -0.8, 1.0 } },
        { "late", { -0.3, 0.6 } },       { "painful", { -0.7, 0.9 } },
        { "discouraged", { -0.5, 0.7 } },{ "afraid", { -0.6, 0.9 } },
    };
    return lex;
}

const std::unordered_map<std::string, double>& intensifiers() {
    static const std::unordered_map<std::string, double> m = {
        { "very", 1.3 }, { "really", 1.3 }, { "extremely", 1.5 }, { "so", 1.2 },
        { "too", 1.2 }, { "quite", 1.1 }, { "super", 1.4 }, { "incredibly", 1.5 },
        { "totally", 1.3 }, { "slightly", 0.6 }, { "somewhat", 0.8 }, { "kinda", 0.8 },
    };
    return m;
}

bool is_negation(const std::string& w) {
    static const std::set<std::string> neg = {
        "not", "no", "never", "dont", "doesnt", "didnt", "cant", "cannot",
        "wont", "isnt", "arent", "wasnt", "werent", "havent", "hardly",
    };
    return neg.count(w) > 0;
}

std::vector<std::string> find_keywords(const std::string& text, const std::vector<std::string>& keywords) {
    std::vector<std::string> found;
    for (const auto& k : keywords)
        if (text.find(k) != std::string::npos) found.push_back(k);
    return found;
}

SentimentResult neutral_default() {
    return SentimentResult{};
}

SentimentResult score_normalized(const std::string& cleaned) {
    const LexiconScore base = lexicon_score(cleaned);

    SentimentResult r;
    r.stress_indicators = find_keywords(cleaned, stress_keywords());
    r.positive_indicators = find_keywords(cleaned, positive_keywords());

    const double stress_score = 0.15 * static_cast<double>(r.stress_indicators.size());
    const double positive_score = 0.15 * static_cast<double>(r.positive_indicators.size());
    const double adjusted = clamp_to(base.polarity - stress_score + positive_score, -1.0, 1.0);

    double confidence = 0.5;
    if (adjusted > 0.1) {
        r.sentiment = Sentiment::Positive;
        confidence = std::min(0.9, 0.5 + std::fabs(adjusted) * 0.4);
    }
    else if (adjusted < -0.1) {
        r.sentiment = Sentiment::Negative;
        confidence = std::min(0.9, 0.5 + std::fabs(adjusted) * 0.4);
    }
    else {
        r.sentiment = Sentiment::Neutral;
        confidence = 0.5 + (0.1 - std::fabs(adjusted)) * 2;
    }

    // Keyword agreement with the winning side.
    if (r.sentiment == Sentiment::Negative && r.stress_indicators.size() >= 2)
        confidence = std::min(0.95, confidence + 0.1);
    if (r.sentiment == Sentiment::Positive && r.positive_indicators.size() >= 2)
        confidence = std::min(0.95, confidence + 0.1);

    r.polarity = round_to(base.polarity, 3);
    r.subjectivity = round_to(base.subjectivity, 3);
    r.confidence = round_to(confidence, 3);
    return r;
}

} // namespace

const std::vector<std::string>& stress_keywords() {
    static const std::vector<std::string> k = {
        "stressed", "anxious", "worried", "overwhelmed", "struggling",
        "difficult", "hard", "failing", "depressed", "hopeless",
        "scared", "confused", "lost", "behind", "pressure",
        "tired", "exhausted", "burnout", "frustrated", "discouraged",
        "dropout", "quit", "hate", "terrible", "worst",
    };
    return k;
}

const std::vector<std::string>& positive_keywords() {
    static const std::vector<std::string> k = {
        "happy", "excited", "confident", "motivated", "accomplished",
        "great", "excellent", "love", "enjoy", "fantastic",
        "proud", "satisfied", "optimistic", "wonderful", "amazing",
        "successful", "achieved", "grateful", "positive", "engaged",
    };
    return k;
}

std::string normalize_text(const std::string& text) {
    std::string kept;
    kept.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '.' || c == ',' || c == '!' || c == '?')
            kept.push_back(static_cast<char>(std::tolower(c)));
        else if (std::isspace(c))
            kept.push_back(' ');
    }

    std::istringstream in(kept);
    std::string word, out;
    while (in >> word) {
        if (!out.empty()) out.push_back(' ');
        out += word;
    }
    return out;
}

LexiconScore lexicon_score(const std::string& normalized) {
    double pol_sum = 0.0, subj_sum = 0.0;
    int hits = 0;
    double intensity = 1.0;
    bool negated = false;

    std::string word;
    auto flush_word = [&]() {
        if (word.empty()) return;
        auto lx = lexicon().find(word);
        if (lx != lexicon().end()) {
            double p = clamp_to(lx->second.polarity * intensity, -1.0, 1.0);
            if (negated) p *= -0.5;
            pol_sum += p;
            subj_sum += clamp_to(lx->second.subjectivity * intensity, 0.0, 1.0);
            ++hits;
            intensity = 1.0;
            negated = false;
        }
        else if (is_negation(word)) {
            negated = true;
        }
        else {
            auto in = intensifiers().find(word);
            if (in != intensifiers().end()) intensity = in->second;
        }
        word.clear();
    };

    for (char c : normalized) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            word.push_back(c);
            continue;
        }
        flush_word();
        if (c != ' ') {   // clause punctuation ends any pending modifier
            intensity = 1.0;
            negated = false;
        }
    }
    flush_word();

    LexiconScore s;
    s.hits = hits;
    if (hits > 0) {
        s.polarity = clamp_to(pol_sum / hits, -1.0, 1.0);
        s.subjectivity = clamp_to(subj_sum / hits, 0.0, 1.0);
    }
    return s;
}

SentimentResult SentimentScorer::analyze(const std::string& text) {
    if (text.empty()) return neutral_default();

    // Text that cleans down to nothing is scored like any other, but not cached.
    const std::string key = normalize_text(text);
    if (key.empty()) return score_normalized(key);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = cache_.find(key);
        if (it != cache_.end()) return it->second;
    }

    SentimentResult r = score_normalized(key);

    std::lock_guard<std::mutex> lock(mtx_);
    cache_[key] = r;
    return r;
}

SentimentResult SentimentScorer::analyze(const std::optional<std::string>& text) {
    if (!text) return neutral_default();
    return analyze(*text);
}

BatchSentimentSummary SentimentScorer::analyze_batch(const std::vector<std::string>& texts) {
    BatchSentimentSummary out;
    std::set<std::string> stress, positive;
    double pol_sum = 0.0;

    for (const auto& t : texts) {
        SentimentResult r = analyze(t);
        switch (r.sentiment) {
        case Sentiment::Positive: ++out.positive_count; break;
        case Sentiment::Negative: ++out.negative_count; break;
        default:                  ++out.neutral_count; break;
        }
        pol_sum += r.polarity;
        stress.insert(r.stress_indicators.begin(), r.stress_indicators.end());
        positive.insert(r.positive_indicators.begin(), r.positive_indicators.end());
        out.individual_results.push_back(std::move(r));
    }

    out.total_analyzed = out.individual_results.size();
    if (out.total_analyzed > 0)
        out.average_polarity = round_to(pol_sum / static_cast<double>(out.total_analyzed), 3);
    out.common_stress_indicators.assign(stress.begin(), stress.end());
    out.common_positive_indicators.assign(positive.begin(), positive.end());
    return out;
}

std::size_t SentimentScorer::cache_size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cache_.size();
}

int mental_health_score(double polarity, std::size_t stress_count, std::size_t positive_count) {
    double score = 5.5 + polarity * 2.5;
    score -= static_cast<double>(stress_count) * 0.5;
    score += static_cast<double>(positive_count) * 0.3;
    score = clamp_to(score, 1.0, 10.0);
    // halves round down: 1.5 -> 1, 7.5 -> 7
    return static_cast<int>(std::ceil(score - 0.5));
}

int mental_health_score(const SentimentResult& r) {
    return mental_health_score(r.polarity, r.stress_indicators.size(), r.positive_indicators.size());
}

std::string mental_health_label(int score) {
    if (score <= 3) return "Concerning - Seek support";
    if (score <= 5) return "Fair - Monitor closely";
    if (score <= 7) return "Good - Maintain balance";
    return "Excellent - Keep it up";
}
