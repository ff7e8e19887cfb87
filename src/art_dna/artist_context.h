// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_ARTIST_CONTEXT_H
#define ARTDNA_ARTIST_CONTEXT_H

/**
 * Live artist state fed into temporal encoding.
 *
 * Tracks the current session's counters, the fatigue model (linear over
 * one hour since the last break) and the lifetime skill bucket. Every
 * mutating call takes the wall-clock time explicitly so the model can be
 * driven from recorded input and from tests.
 */

#include <art_dna/dna_types.h>

#include <optional>
#include <string>
#include <vector>

namespace art_dna {

/** Tool state reported with a finished stroke; unset fields keep the previous value */
struct StrokeUpdate {
    std::optional<std::string> tool;
    std::optional<std::string> color;
    std::optional<double> brush_size;
};

struct ContextSnapshot {
    double fatigue_level = 0.0;
    double session_duration_minutes = 0.0;
    uint64_t strokes_in_session = 0;
    SkillLevel skill_level = SkillLevel::BEGINNER;
    bool is_fatigued = false;
};

class ArtistContextManager {
public:
    ArtistContextManager(const std::string& session_id, int64_t now_ms,
                         const std::optional<std::string>& artist_id = std::nullopt);

    const ArtistContext& get_context() const { return context_; }

    void on_stroke_complete(const StrokeUpdate& update, int64_t now_ms);

    /** Resets fatigue and counts the break */
    void on_break(int64_t now_ms);

    /** Archive the current context and start a fresh one, carrying lifetime state */
    void start_new_session(const std::string& session_id, int64_t now_ms);

    void set_session_intent(const std::string& intent,
                            const std::optional<std::string>& target_outcome, int64_t now_ms);

    ContextSnapshot get_snapshot(int64_t now_ms) const;

    /** True once no stroke has landed for longer than the cooldown */
    bool should_start_new_session(int64_t now_ms, double cooldown_minutes) const;

    const std::vector<ArtistContext>& get_history() const { return history_; }
    void clear_history() { history_.clear(); }

    std::vector<uint8_t> serialize() const;

    /** @return nullopt if the record is corrupt or not a context record */
    static std::optional<ArtistContextManager> deserialize(const std::vector<uint8_t>& data);

private:
    ArtistContextManager() = default;

    static ArtistContext make_context(const std::string& session_id,
                                      const std::optional<std::string>& artist_id, int64_t now_ms);

    ArtistContext context_;
    std::vector<ArtistContext> history_;
};

} // namespace art_dna

#endif // ARTDNA_ARTIST_CONTEXT_H
