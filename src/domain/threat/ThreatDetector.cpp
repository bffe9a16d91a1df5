/**
 * @file ThreatDetector.cpp
 * @brief Implementation of ThreatDetector.
 */

#include "domain/threat/ThreatDetector.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <functional>
#include <memory>
#include <regex>
#include <unordered_map>
#include <vector>

namespace mindshield::domain::threat {

namespace {

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool IsBlank(const std::string& input) {
    return std::all_of(input.begin(), input.end(), [](unsigned char c) { return std::isspace(c); });
}

bool IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_';
}

bool IsSentenceEnd(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool IsLineBreak(char c) {
    return c == '\n' || c == '\r';
}

// A short word standing alone between two sentence marks, e.g. ". deeper."
bool HasTonalShift(const std::string& text) {
    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (!IsSentenceEnd(text[i])) {
            ++i;
            continue;
        }
        size_t j = i + 1;
        while (j < n && std::isspace(static_cast<unsigned char>(text[j]))) ++j;
        size_t k = j;
        while (k < n && IsWordChar(static_cast<unsigned char>(text[k]))) ++k;
        if (k == j) {
            i = j;
            continue;
        }
        size_t m = k;
        while (m < n && std::isspace(static_cast<unsigned char>(text[m]))) ++m;
        if (m < n && IsSentenceEnd(text[m])) return true;
        i = m;
    }
    return false;
}

// "*word*"
bool HasAnalogMarking(const std::string& text) {
    const size_t n = text.size();
    size_t i = text.find('*');
    while (i != std::string::npos) {
        size_t j = i + 1;
        while (j < n && IsWordChar(static_cast<unsigned char>(text[j]))) ++j;
        if (j > i + 1 && j < n && text[j] == '*') return true;
        i = text.find('*', j > i + 1 ? j : i + 1);
    }
    return false;
}

// Two occurrences of any of the terms on the same line, the second starting
// after the first ends.
bool HasRepeatedTerm(const std::string& text, const std::vector<std::string>& terms) {
    size_t lineStart = 0;
    while (lineStart <= text.size()) {
        size_t lineEnd = lineStart;
        while (lineEnd < text.size() && !IsLineBreak(text[lineEnd])) ++lineEnd;
        const std::string line = text.substr(lineStart, lineEnd - lineStart);

        size_t firstEnd = std::string::npos;
        for (const auto& term : terms) {
            size_t pos = line.find(term);
            if (pos != std::string::npos) firstEnd = std::min(firstEnd, pos + term.size());
        }
        if (firstEnd != std::string::npos) {
            for (const auto& term : terms) {
                if (line.find(term, firstEnd) != std::string::npos) return true;
            }
        }
        lineStart = lineEnd + 1;
    }
    return false;
}

using IndicatorTest = std::function<bool(const std::string&)>;

IndicatorTest Alternation(const char* pattern) {
    auto re = std::make_shared<const std::regex>(pattern);
    return [re](const std::string& text) { return std::regex_search(text, *re); };
}

// Regexes are kept to plain literal alternations; anything with an
// unbounded repeat is a linear scan.
const std::unordered_map<std::string, IndicatorTest>& IndicatorTests() {
    static const std::unordered_map<std::string, IndicatorTest> tests = {
        {"tonal_shift",        HasTonalShift},
        {"pause_pattern",      [](const std::string& text) { return text.find("...") != std::string::npos; }},
        {"analog_marking",     HasAnalogMarking},
        {"multiple_negations", [](const std::string& text) { return HasRepeatedTerm(text, {"not", "n't"}); }},
        {"paradox",            [](const std::string& text) { return HasRepeatedTerm(text, {"but", "yet", "however"}); }},
        {"pattern_interrupt",  Alternation("suddenly|now|stop|wait")},
        {"storytelling",       Alternation("once upon|imagine|let me tell")},
        {"metaphor",           Alternation("like|as if|just like")},
        {"anchoring",          Alternation("every time|whenever|each time")}
    };
    return tests;
}

} // namespace

bool ThreatDetector::MatchesIndicator(const std::string& indicator, const std::string& normalizedInput) {
    const auto& tests = IndicatorTests();
    auto it = tests.find(indicator);
    if (it == tests.end()) return false;
    return it->second(normalizedInput);
}

int ThreatDetector::Score(const ThreatPattern& pattern, const std::string& normalizedInput) {
    int score = 0;
    for (const auto& keyword : pattern.keywords) {
        if (normalizedInput.find(keyword) != std::string::npos) {
            score += kKeywordWeight;
        }
    }
    for (const auto& indicator : pattern.indicators) {
        if (MatchesIndicator(indicator, normalizedInput)) {
            score += kIndicatorWeight;
        }
    }
    return score;
}

std::vector<DetectedThreat> ThreatDetector::Detect(const std::string& input) {
    std::vector<DetectedThreat> threats;
    if (IsBlank(input)) return threats;

    const std::string normalized = Normalize(input);
    for (const auto& pattern : ThreatPatternCatalog::All()) {
        const int score = Score(pattern, normalized);
        if (score > kReportThreshold) {
            DetectedThreat threat;
            threat.category = pattern.id;
            threat.description = pattern.description;
            threat.score = score;
            threat.confidence = std::min(score / 100.0, 1.0);
            threats.push_back(threat);
        }
    }

    std::stable_sort(threats.begin(), threats.end(),
        [](const DetectedThreat& a, const DetectedThreat& b) { return a.score > b.score; });
    return threats;
}

ThreatLevel ThreatDetector::Classify(const std::vector<DetectedThreat>& detections) {
    if (detections.empty()) return ThreatLevel::None;

    int maxScore = 0;
    for (const auto& d : detections) {
        maxScore = std::max(maxScore, d.score);
    }
    return ThreatLevelFromScore(maxScore);
}

int ThreatDetector::Confidence(const std::vector<DetectedThreat>& detections) {
    if (detections.empty()) return 0;

    double sum = 0.0;
    for (const auto& d : detections) {
        sum += d.confidence;
    }
    return static_cast<int>(std::lround(sum / detections.size() * 100.0));
}

} // namespace mindshield::domain::threat
