// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/adaptive_behavior.h>

#include <art_dna/stats.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <algorithm>
#include <cmath>

namespace art_dna {

std::string BehaviorTypeName(BehaviorType type) {
    switch (type) {
        case BehaviorType::WARNING: return "warning";
        case BehaviorType::SUGGESTION: return "suggestion";
        case BehaviorType::ADJUSTMENT: return "adjustment";
        case BehaviorType::INTERVENTION: return "intervention";
    }
    return "suggestion";
}

std::string BehaviorPriorityName(BehaviorPriority priority) {
    switch (priority) {
        case BehaviorPriority::LOW: return "low";
        case BehaviorPriority::MEDIUM: return "medium";
        case BehaviorPriority::HIGH: return "high";
        case BehaviorPriority::CRITICAL: return "critical";
    }
    return "low";
}

FatigueBucket ClassifyFatigue(double fatigue_level) {
    if (fatigue_level < 0.25) return FatigueBucket::FRESH;
    if (fatigue_level < 0.5) return FatigueBucket::FOCUSED;
    if (fatigue_level < 0.75) return FatigueBucket::TIRED;
    return FatigueBucket::EXHAUSTED;
}

std::vector<AdaptiveBehavior> AdaptiveBehaviorManager::analyze_behaviors(const TemporalDNA& temporal,
                                                                         const ArtistContext& context,
                                                                         const DNASession& session,
                                                                         int64_t now_ms) {
    std::vector<AdaptiveBehavior> out;
    auto add = [&](BehaviorType type, const std::string& trigger, const std::string& message,
                   BehaviorPriority priority, int break_minutes = 0) {
        AdaptiveBehavior b;
        b.behavior_id = GenerateDNAId("behavior");
        b.type = type;
        b.trigger = trigger;
        b.message = message;
        b.priority = priority;
        b.suggested_break_minutes = break_minutes;
        b.timestamp = now_ms;
        out.push_back(std::move(b));
    };

    // Fatigue
    FatigueBucket fatigue = ClassifyFatigue(temporal.fatigue_level);
    if (fatigue == FatigueBucket::EXHAUSTED) {
        add(BehaviorType::INTERVENTION, "critical_fatigue",
            "High fatigue detected. Taking a 15-minute break is strongly recommended.",
            BehaviorPriority::CRITICAL, 15);
    } else if (fatigue == FatigueBucket::TIRED) {
        add(BehaviorType::WARNING, "high_fatigue",
            "Fatigue increasing. Consider taking a short break to maintain quality.",
            BehaviorPriority::HIGH, 5);
    }

    double session_hours = context.consecutive_work_minutes / 60.0;
    if (session_hours > 2.0) {
        add(BehaviorType::SUGGESTION, "long_session",
            strprintf("You've been working for %.1f hours. A break might help refresh your creativity.", session_hours),
            BehaviorPriority::MEDIUM);
    }

    // Focus
    if (temporal.focus_score < 0.4) {
        add(BehaviorType::WARNING, "low_focus",
            "Focus level is low. Consider reducing distractions or taking a short break.",
            BehaviorPriority::MEDIUM);
    }
    if (temporal.flow_state_active) {
        add(BehaviorType::SUGGESTION, "flow_state",
            "Flow state detected! You're in the zone, keep this momentum going.",
            BehaviorPriority::LOW);
    }

    // Learning
    switch (temporal.learning_phase) {
        case LearningPhase::EXPLORATION:
            add(BehaviorType::SUGGESTION, "exploration_phase",
                "Exploration phase: Try experimenting with different tools and techniques.",
                BehaviorPriority::LOW);
            break;
        case LearningPhase::REFINEMENT:
            add(BehaviorType::SUGGESTION, "refinement_phase",
                "Refinement phase: Focus on consistency and polishing your technique.",
                BehaviorPriority::LOW);
            break;
        case LearningPhase::MASTERY:
            add(BehaviorType::SUGGESTION, "mastery_phase",
                "Mastery phase: Your skills are advanced. Consider tackling complex challenges.",
                BehaviorPriority::LOW);
            break;
    }
    if (temporal.skill_progression > 0.8) {
        add(BehaviorType::SUGGESTION, "high_skill",
            "Your skill level is high! Consider exploring advanced techniques or sharing your work.",
            BehaviorPriority::LOW);
    }

    // Style drift
    if (temporal.features.get(TemporalFeature::STYLE_DRIFT_RATE) > 0.5f) {
        add(BehaviorType::WARNING, "high_style_drift",
            "Style drift detected. Your current strokes differ significantly from your session style.",
            BehaviorPriority::MEDIUM);
    }
    if (temporal.features.get(TemporalFeature::EXPERIMENTATION_RATE) > 0.7f) {
        add(BehaviorType::SUGGESTION, "high_experimentation",
            "High experimentation detected. Great for exploration, but may affect consistency.",
            BehaviorPriority::LOW);
    }

    LogPrintAnalysis(DEBUG, "%zu advisories for session %s (fatigue %.2f, focus %.2f)",
                     out.size(), session.session_id.c_str(), temporal.fatigue_level, temporal.focus_score);

    behaviors_ = out;
    return out;
}

std::vector<AdaptiveBehavior> AdaptiveBehaviorManager::get_priority_behaviors() const {
    std::vector<AdaptiveBehavior> result;
    for (const AdaptiveBehavior& b : behaviors_) {
        if (b.priority == BehaviorPriority::HIGH || b.priority == BehaviorPriority::CRITICAL) {
            result.push_back(b);
        }
    }
    return result;
}

std::vector<AdaptiveBehavior> AdaptiveBehaviorManager::get_behaviors_by_type(BehaviorType type) const {
    std::vector<AdaptiveBehavior> result;
    for (const AdaptiveBehavior& b : behaviors_) {
        if (b.type == type) result.push_back(b);
    }
    return result;
}

bool AdaptiveBehaviorManager::should_show_warning(int64_t now_ms) {
    if (last_warning_time_ && now_ms - *last_warning_time_ <= WARNING_COOLDOWN_MS) {
        return false;
    }
    last_warning_time_ = now_ms;
    return true;
}

std::string AdaptiveBehaviorManager::get_summary() const {
    size_t counts[4] = {0, 0, 0, 0};
    for (const AdaptiveBehavior& b : behaviors_) {
        counts[static_cast<size_t>(b.type)]++;
    }
    return strprintf("Adaptive Behaviors:\n- Warnings: %zu\n- Suggestions: %zu\n- Adjustments: %zu\n- Interventions: %zu",
                     counts[static_cast<size_t>(BehaviorType::WARNING)],
                     counts[static_cast<size_t>(BehaviorType::SUGGESTION)],
                     counts[static_cast<size_t>(BehaviorType::ADJUSTMENT)],
                     counts[static_cast<size_t>(BehaviorType::INTERVENTION)]);
}

double BrushAdjuster::adjust_brush_size(double base_size, double fatigue_level) {
    return std::round(base_size * (1.0 + fatigue_level * 0.3));
}

double BrushAdjuster::adjust_opacity(double base_opacity, double focus_score) {
    return Clamp01(base_opacity * (0.7 + focus_score * 0.3));
}

double BrushAdjuster::adjust_smoothing(double base_smoothing, double fatigue_level) {
    return Clamp01(base_smoothing * (1.0 + fatigue_level * 0.5));
}

BrushRecommendation BrushAdjuster::get_recommended_settings(const TemporalDNA& temporal, const BrushSettings& current) {
    BrushRecommendation result;
    double fatigue = temporal.fatigue_level;
    double focus = temporal.focus_score;

    if (fatigue < 0.3 && focus > 0.7) {
        result.settings = current;
        result.adjusted = false;
        return result;
    }

    result.settings.size = adjust_brush_size(current.size, fatigue);
    result.settings.opacity = adjust_opacity(current.opacity, focus);
    result.settings.smoothing = adjust_smoothing(current.smoothing, fatigue);
    result.adjusted = true;
    return result;
}

} // namespace art_dna
