// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_ADAPTIVE_BEHAVIOR_H
#define ARTDNA_ADAPTIVE_BEHAVIOR_H

/**
 * Advisories derived from the artist's current state.
 *
 * analyze_behaviors() reads the latest TemporalDNA and ArtistContext and
 * produces an ordered advisory list: fatigue, session length, focus,
 * flow, learning phase, skill, style drift, experimentation. The list is
 * kept as the manager's current set until the next analysis or
 * clear_behaviors().
 *
 * BrushAdjuster eases the brush for a tired or unfocused artist.
 */

#include <art_dna/dna_types.h>

#include <optional>
#include <string>
#include <vector>

namespace art_dna {

enum class BehaviorType : uint8_t {
    WARNING = 0,
    SUGGESTION,
    ADJUSTMENT,
    INTERVENTION
};

enum class BehaviorPriority : uint8_t {
    LOW = 0,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class FatigueBucket : uint8_t {
    FRESH = 0,      // < 0.25
    FOCUSED,        // < 0.5
    TIRED,          // < 0.75
    EXHAUSTED
};

std::string BehaviorTypeName(BehaviorType type);
std::string BehaviorPriorityName(BehaviorPriority priority);
FatigueBucket ClassifyFatigue(double fatigue_level);

struct AdaptiveBehavior {
    std::string behavior_id;
    BehaviorType type = BehaviorType::SUGGESTION;
    std::string trigger;
    std::string message;
    BehaviorPriority priority = BehaviorPriority::LOW;
    int suggested_break_minutes = 0;    // 0: no break suggested
    int64_t timestamp = 0;
};

class AdaptiveBehaviorManager {
public:
    static constexpr int64_t WARNING_COOLDOWN_MS = 60000;

    std::vector<AdaptiveBehavior> analyze_behaviors(const TemporalDNA& temporal, const ArtistContext& context,
                                                    const DNASession& session, int64_t now_ms);

    /** HIGH and CRITICAL advisories from the current set */
    std::vector<AdaptiveBehavior> get_priority_behaviors() const;
    std::vector<AdaptiveBehavior> get_behaviors_by_type(BehaviorType type) const;

    /**
     * True at most once per cooldown window. A true result starts a new
     * window.
     */
    bool should_show_warning(int64_t now_ms);

    void clear_behaviors() { behaviors_.clear(); }
    const std::vector<AdaptiveBehavior>& get_behaviors() const { return behaviors_; }

    std::string get_summary() const;

private:
    std::vector<AdaptiveBehavior> behaviors_;
    std::optional<int64_t> last_warning_time_;
};

struct BrushSettings {
    double size = 5.0;
    double opacity = 1.0;
    double smoothing = 0.5;
};

struct BrushRecommendation {
    BrushSettings settings;
    bool adjusted = false;
};

class BrushAdjuster {
public:
    /** Up to 30% larger at full fatigue, rounded */
    static double adjust_brush_size(double base_size, double fatigue_level);

    /** Scaled by 0.7 - 1.0 with focus, clamped to [0, 1] */
    static double adjust_opacity(double base_opacity, double focus_score);

    /** Up to 50% more at full fatigue, clamped to [0, 1] */
    static double adjust_smoothing(double base_smoothing, double fatigue_level);

    /** Leaves settings alone while fatigue < 0.3 and focus > 0.7 */
    static BrushRecommendation get_recommended_settings(const TemporalDNA& temporal, const BrushSettings& current);
};

} // namespace art_dna

#endif // ARTDNA_ADAPTIVE_BEHAVIOR_H
