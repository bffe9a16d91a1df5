/**
 * @file ThreatPatternCatalog.cpp
 * @brief Fixed attack-category table.
 */

#include "domain/threat/ThreatPattern.hpp"

namespace mindshield::domain::threat {

namespace {

std::vector<ThreatPattern> BuildPatterns() {
    return {
        {
            "embedded_commands",
            {"tonal_shift", "pause_pattern", "analog_marking"},
            {"now", "feel", "imagine", "notice", "realize"},
            "Embedded commands: tonal shifts, pause patterns and command structure recognized"
        },
        {
            "confusion_technique",
            {"multiple_negations", "paradox", "overload"},
            {"but", "yet", "however", "although", "unless"},
            "Confusion pattern: logic loops, paradoxical statements and attempted cognitive overload"
        },
        {
            "rapid_induction",
            {"pattern_interrupt", "shock", "sudden_command"},
            {"sleep", "now", "drop", "fall", "deep"},
            "Rapid induction: pattern interrupt, shock element and command structure identified"
        },
        {
            "covert_hypnosis",
            {"storytelling", "metaphor", "indirect_suggestion"},
            {"like", "as if", "imagine if", "suppose", "what if"},
            "Covert hypnosis: metaphorical language, indirect suggestions and story-based induction"
        },
        {
            "nlp_manipulation",
            {"anchoring", "reframing", "mirroring", "pacing"},
            {"feel", "see", "hear", "understand", "know"},
            "NLP patterns: sensory language, pacing and leading, anchoring attempts"
        }
    };
}

} // namespace

const std::vector<ThreatPattern>& ThreatPatternCatalog::All() {
    static const std::vector<ThreatPattern> patterns = BuildPatterns();
    return patterns;
}

const ThreatPattern* ThreatPatternCatalog::Find(const std::string& id) {
    for (const auto& pattern : All()) {
        if (pattern.id == id) return &pattern;
    }
    return nullptr;
}

} // namespace mindshield::domain::threat
