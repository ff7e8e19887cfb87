// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/artist_context.h>

#include <art_dna/dna_serialization.h>
#include <util/logging.h>

#include <algorithm>

namespace art_dna {

static constexpr double MS_PER_MINUTE = 60000.0;
static constexpr double FATIGUE_WINDOW_MINUTES = 60.0;
static constexpr double FATIGUED_ABOVE = 0.7;

ArtistContext ArtistContextManager::make_context(const std::string& session_id,
                                                 const std::optional<std::string>& artist_id,
                                                 int64_t now_ms) {
    ArtistContext ctx;
    ctx.context_id = GenerateDNAId("context");
    ctx.session_id = session_id;
    ctx.artist_id = artist_id;
    ctx.session_start_time = now_ms;
    ctx.last_stroke_time = now_ms;
    ctx.last_break_time = now_ms;
    ctx.created_at = now_ms;
    ctx.updated_at = now_ms;
    return ctx;
}

ArtistContextManager::ArtistContextManager(const std::string& session_id, int64_t now_ms,
                                           const std::optional<std::string>& artist_id)
    : context_(make_context(session_id, artist_id, now_ms)) {}

void ArtistContextManager::on_stroke_complete(const StrokeUpdate& update, int64_t now_ms) {
    context_.last_stroke_time = now_ms;
    context_.total_strokes_in_session++;
    context_.total_lifetime_strokes++;
    context_.updated_at = now_ms;

    if (update.tool && !update.tool->empty()) context_.current_tool = *update.tool;
    if (update.color && !update.color->empty()) context_.current_color = *update.color;
    if (update.brush_size && *update.brush_size > 0.0) context_.current_brush_size = *update.brush_size;

    context_.consecutive_work_minutes = (now_ms - context_.session_start_time) / MS_PER_MINUTE;

    double minutes_since_break = (now_ms - context_.last_break_time) / MS_PER_MINUTE;
    context_.current_fatigue_level = std::min(1.0, std::max(0.0, minutes_since_break / FATIGUE_WINDOW_MINUTES));

    SkillLevel previous = context_.skill_level;
    context_.skill_level = SkillLevelForStrokes(context_.total_lifetime_strokes);
    if (context_.skill_level != previous) {
        LogPrintContext(INFO, "Skill level %s -> %s after %llu strokes",
                        SkillLevelName(previous).c_str(), SkillLevelName(context_.skill_level).c_str(),
                        static_cast<unsigned long long>(context_.total_lifetime_strokes));
    }
}

void ArtistContextManager::on_break(int64_t now_ms) {
    context_.last_break_time = now_ms;
    context_.current_fatigue_level = 0.0;
    context_.break_count++;
    context_.updated_at = now_ms;
    LogPrintContext(DEBUG, "Break #%u in session %s", context_.break_count, context_.session_id.c_str());
}

void ArtistContextManager::start_new_session(const std::string& session_id, int64_t now_ms) {
    history_.push_back(context_);

    ArtistContext next = make_context(session_id, context_.artist_id, now_ms);
    next.total_sessions = context_.total_sessions + 1;
    next.total_lifetime_strokes = context_.total_lifetime_strokes;
    next.skill_level = context_.skill_level;

    LogPrintContext(INFO, "Session %s started (session %u, %llu lifetime strokes)",
                    session_id.c_str(), next.total_sessions,
                    static_cast<unsigned long long>(next.total_lifetime_strokes));
    context_ = std::move(next);
}

void ArtistContextManager::set_session_intent(const std::string& intent,
                                              const std::optional<std::string>& target_outcome,
                                              int64_t now_ms) {
    context_.session_intent = intent;
    context_.target_outcome = target_outcome;
    context_.updated_at = now_ms;
}

ContextSnapshot ArtistContextManager::get_snapshot(int64_t now_ms) const {
    ContextSnapshot snapshot;
    snapshot.fatigue_level = context_.current_fatigue_level;
    snapshot.session_duration_minutes = (now_ms - context_.session_start_time) / MS_PER_MINUTE;
    snapshot.strokes_in_session = context_.total_strokes_in_session;
    snapshot.skill_level = context_.skill_level;
    snapshot.is_fatigued = context_.current_fatigue_level > FATIGUED_ABOVE;
    return snapshot;
}

bool ArtistContextManager::should_start_new_session(int64_t now_ms, double cooldown_minutes) const {
    return (now_ms - context_.last_stroke_time) / MS_PER_MINUTE > cooldown_minutes;
}

std::vector<uint8_t> ArtistContextManager::serialize() const {
    ContextState state;
    state.current = context_;
    state.history = history_;
    return SerializeContextState(state);
}

std::optional<ArtistContextManager> ArtistContextManager::deserialize(const std::vector<uint8_t>& data) {
    std::optional<ContextState> state = DeserializeContextState(data);
    if (!state) {
        LogPrintContext(WARN, "Rejected corrupt artist context record (%zu bytes)", data.size());
        return std::nullopt;
    }
    ArtistContextManager manager;
    manager.context_ = std::move(state->current);
    manager.history_ = std::move(state->history);
    return manager;
}

} // namespace art_dna
