// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

/**
 * Unit tests for the artist-state layer
 *
 * - AdaptiveBehaviorManager advisory rules, filters and warning cooldown
 * - BrushAdjuster settings
 * - ArtistContextManager fatigue, skill and session lifecycle
 */

// Part of main Boost test suite (no BOOST_TEST_MODULE here)
#include <boost/test/unit_test.hpp>

#include <art_dna/adaptive_behavior.h>
#include <art_dna/artist_context.h>

#include <algorithm>

using namespace art_dna;

namespace {

const int64_t T0 = 1700000000000LL;
const int64_t MINUTE = 60000LL;

bool HasTrigger(const std::vector<AdaptiveBehavior>& behaviors, const std::string& trigger) {
    return std::any_of(behaviors.begin(), behaviors.end(),
                       [&](const AdaptiveBehavior& b) { return b.trigger == trigger; });
}

const AdaptiveBehavior* FindTrigger(const std::vector<AdaptiveBehavior>& behaviors, const std::string& trigger) {
    for (const AdaptiveBehavior& b : behaviors) {
        if (b.trigger == trigger) return &b;
    }
    return nullptr;
}

} // namespace

BOOST_AUTO_TEST_SUITE(adaptive_behavior_tests)

BOOST_AUTO_TEST_CASE(fresh_artist_gets_phase_suggestion_only) {
    AdaptiveBehaviorManager manager;
    TemporalDNA temporal;
    ArtistContext context;
    DNASession session;

    std::vector<AdaptiveBehavior> behaviors = manager.analyze_behaviors(temporal, context, session, T0);
    BOOST_REQUIRE_EQUAL(behaviors.size(), 1u);
    BOOST_CHECK_EQUAL(behaviors[0].trigger, "exploration_phase");
    BOOST_CHECK(behaviors[0].type == BehaviorType::SUGGESTION);
    BOOST_CHECK_EQUAL(behaviors[0].timestamp, T0);
    BOOST_CHECK(manager.get_priority_behaviors().empty());
}

BOOST_AUTO_TEST_CASE(critical_fatigue_intervention) {
    AdaptiveBehaviorManager manager;
    TemporalDNA temporal;
    temporal.fatigue_level = 0.8;
    temporal.learning_phase = LearningPhase::MASTERY;

    std::vector<AdaptiveBehavior> behaviors = manager.analyze_behaviors(temporal, ArtistContext(), DNASession(), T0);
    const AdaptiveBehavior* critical = FindTrigger(behaviors, "critical_fatigue");
    BOOST_REQUIRE(critical);
    BOOST_CHECK(critical->type == BehaviorType::INTERVENTION);
    BOOST_CHECK(critical->priority == BehaviorPriority::CRITICAL);
    BOOST_CHECK_EQUAL(critical->suggested_break_minutes, 15);
    BOOST_CHECK(!HasTrigger(behaviors, "high_fatigue"));
    BOOST_CHECK(HasTrigger(behaviors, "mastery_phase"));

    // Fatigue advisories come first
    BOOST_CHECK_EQUAL(behaviors.front().trigger, "critical_fatigue");
}

BOOST_AUTO_TEST_CASE(high_fatigue_warning) {
    AdaptiveBehaviorManager manager;
    TemporalDNA temporal;
    temporal.fatigue_level = 0.5;

    std::vector<AdaptiveBehavior> behaviors = manager.analyze_behaviors(temporal, ArtistContext(), DNASession(), T0);
    const AdaptiveBehavior* high = FindTrigger(behaviors, "high_fatigue");
    BOOST_REQUIRE(high);
    BOOST_CHECK(high->type == BehaviorType::WARNING);
    BOOST_CHECK(high->priority == BehaviorPriority::HIGH);
    BOOST_CHECK_EQUAL(high->suggested_break_minutes, 5);

    temporal.fatigue_level = 0.49;
    BOOST_CHECK(!HasTrigger(manager.analyze_behaviors(temporal, ArtistContext(), DNASession(), T0), "high_fatigue"));
}

BOOST_AUTO_TEST_CASE(state_driven_advisories) {
    AdaptiveBehaviorManager manager;
    TemporalDNA temporal;
    temporal.focus_score = 0.3;
    temporal.flow_state_active = true;
    temporal.skill_progression = 0.9;
    temporal.learning_phase = LearningPhase::REFINEMENT;
    temporal.features.set(TemporalFeature::STYLE_DRIFT_RATE, 0.6);
    temporal.features.set(TemporalFeature::EXPERIMENTATION_RATE, 0.8);

    ArtistContext context;
    context.consecutive_work_minutes = 150.0;

    std::vector<AdaptiveBehavior> behaviors = manager.analyze_behaviors(temporal, context, DNASession(), T0);
    for (const char* trigger : {"long_session", "low_focus", "flow_state", "refinement_phase", "high_skill",
                                "high_style_drift", "high_experimentation"}) {
        BOOST_CHECK_MESSAGE(HasTrigger(behaviors, trigger), "missing advisory " << trigger);
    }

    const AdaptiveBehavior* long_session = FindTrigger(behaviors, "long_session");
    BOOST_REQUIRE(long_session);
    BOOST_CHECK(long_session->message.find("2.5 hours") != std::string::npos);

    BOOST_CHECK_EQUAL(manager.get_behaviors_by_type(BehaviorType::WARNING).size(), 2u);
    BOOST_CHECK(manager.get_behaviors_by_type(BehaviorType::ADJUSTMENT).empty());
}

BOOST_AUTO_TEST_CASE(analysis_replaces_current_set) {
    AdaptiveBehaviorManager manager;
    TemporalDNA tired;
    tired.fatigue_level = 0.9;
    manager.analyze_behaviors(tired, ArtistContext(), DNASession(), T0);
    BOOST_CHECK_EQUAL(manager.get_priority_behaviors().size(), 1u);

    manager.analyze_behaviors(TemporalDNA(), ArtistContext(), DNASession(), T0 + MINUTE);
    BOOST_CHECK(manager.get_priority_behaviors().empty());
    BOOST_CHECK_EQUAL(manager.get_behaviors().size(), 1u);

    manager.clear_behaviors();
    BOOST_CHECK(manager.get_behaviors().empty());
}

BOOST_AUTO_TEST_CASE(warning_cooldown) {
    AdaptiveBehaviorManager manager;
    BOOST_CHECK(manager.should_show_warning(T0));
    BOOST_CHECK(!manager.should_show_warning(T0 + 30000));
    BOOST_CHECK(!manager.should_show_warning(T0 + AdaptiveBehaviorManager::WARNING_COOLDOWN_MS));
    BOOST_CHECK(manager.should_show_warning(T0 + AdaptiveBehaviorManager::WARNING_COOLDOWN_MS + 1));
    BOOST_CHECK(!manager.should_show_warning(T0 + AdaptiveBehaviorManager::WARNING_COOLDOWN_MS + 2));
}

BOOST_AUTO_TEST_CASE(summary_format) {
    AdaptiveBehaviorManager manager;
    TemporalDNA temporal;
    temporal.fatigue_level = 0.9;
    temporal.focus_score = 0.1;
    manager.analyze_behaviors(temporal, ArtistContext(), DNASession(), T0);

    BOOST_CHECK_EQUAL(manager.get_summary(),
                      "Adaptive Behaviors:\n- Warnings: 1\n- Suggestions: 1\n- Adjustments: 0\n- Interventions: 1");
}

BOOST_AUTO_TEST_CASE(fatigue_buckets) {
    BOOST_CHECK(ClassifyFatigue(0.0) == FatigueBucket::FRESH);
    BOOST_CHECK(ClassifyFatigue(0.25) == FatigueBucket::FOCUSED);
    BOOST_CHECK(ClassifyFatigue(0.6) == FatigueBucket::TIRED);
    BOOST_CHECK(ClassifyFatigue(0.75) == FatigueBucket::EXHAUSTED);
    BOOST_CHECK_EQUAL(BehaviorTypeName(BehaviorType::INTERVENTION), "intervention");
    BOOST_CHECK_EQUAL(BehaviorPriorityName(BehaviorPriority::CRITICAL), "critical");
}

BOOST_AUTO_TEST_CASE(brush_adjuster) {
    BOOST_CHECK_EQUAL(BrushAdjuster::adjust_brush_size(10.0, 1.0), 13.0);
    BOOST_CHECK_EQUAL(BrushAdjuster::adjust_brush_size(10.0, 0.0), 10.0);
    BOOST_CHECK_CLOSE(BrushAdjuster::adjust_opacity(1.0, 0.0), 0.7, 1e-9);
    BOOST_CHECK_CLOSE(BrushAdjuster::adjust_smoothing(0.8, 1.0), 1.0, 1e-9);

    BrushSettings current;
    current.size = 10.0;

    TemporalDNA rested;
    rested.fatigue_level = 0.1;
    rested.focus_score = 0.9;
    BrushRecommendation unchanged = BrushAdjuster::get_recommended_settings(rested, current);
    BOOST_CHECK(!unchanged.adjusted);
    BOOST_CHECK_EQUAL(unchanged.settings.size, 10.0);

    TemporalDNA tired;
    tired.fatigue_level = 0.5;
    tired.focus_score = 0.5;
    BrushRecommendation eased = BrushAdjuster::get_recommended_settings(tired, current);
    BOOST_CHECK(eased.adjusted);
    BOOST_CHECK_EQUAL(eased.settings.size, 12.0);
    BOOST_CHECK_CLOSE(eased.settings.opacity, 0.85, 1e-9);
    BOOST_CHECK_CLOSE(eased.settings.smoothing, 0.625, 1e-9);
}

BOOST_AUTO_TEST_CASE(context_tracks_strokes_and_fatigue) {
    ArtistContextManager manager("session-a", T0, std::string("artist-1"));
    BOOST_CHECK_EQUAL(manager.get_context().session_id, "session-a");
    BOOST_REQUIRE(manager.get_context().artist_id);
    BOOST_CHECK_EQUAL(*manager.get_context().artist_id, "artist-1");

    StrokeUpdate update;
    update.tool = std::string("brush");
    update.brush_size = 12.0;
    manager.on_stroke_complete(update, T0 + 30 * MINUTE);

    const ArtistContext& ctx = manager.get_context();
    BOOST_CHECK_EQUAL(ctx.total_strokes_in_session, 1u);
    BOOST_CHECK_EQUAL(ctx.current_tool, "brush");
    BOOST_CHECK_EQUAL(ctx.current_color, "#000000");
    BOOST_CHECK_EQUAL(ctx.current_brush_size, 12.0);
    BOOST_CHECK_CLOSE(ctx.current_fatigue_level, 0.5, 1e-9);
    BOOST_CHECK_CLOSE(ctx.consecutive_work_minutes, 30.0, 1e-9);

    manager.on_stroke_complete(StrokeUpdate(), T0 + 90 * MINUTE);
    BOOST_CHECK_EQUAL(manager.get_context().current_fatigue_level, 1.0);
    BOOST_CHECK(manager.get_snapshot(T0 + 90 * MINUTE).is_fatigued);

    manager.on_break(T0 + 91 * MINUTE);
    BOOST_CHECK_EQUAL(manager.get_context().current_fatigue_level, 0.0);
    BOOST_CHECK_EQUAL(manager.get_context().break_count, 1u);

    ContextSnapshot snapshot = manager.get_snapshot(T0 + 91 * MINUTE);
    BOOST_CHECK(!snapshot.is_fatigued);
    BOOST_CHECK_CLOSE(snapshot.session_duration_minutes, 91.0, 1e-9);
    BOOST_CHECK_EQUAL(snapshot.strokes_in_session, 2u);
}

BOOST_AUTO_TEST_CASE(skill_levels_follow_lifetime_strokes) {
    ArtistContextManager manager("session-a", T0);
    for (int i = 0; i < 499; i++) manager.on_stroke_complete(StrokeUpdate(), T0 + i);
    BOOST_CHECK(manager.get_context().skill_level == SkillLevel::BEGINNER);
    manager.on_stroke_complete(StrokeUpdate(), T0 + 500);
    BOOST_CHECK(manager.get_context().skill_level == SkillLevel::INTERMEDIATE);
}

BOOST_AUTO_TEST_CASE(new_session_carries_lifetime_state) {
    ArtistContextManager manager("session-a", T0);
    manager.on_stroke_complete(StrokeUpdate(), T0 + MINUTE);
    manager.on_stroke_complete(StrokeUpdate(), T0 + 2 * MINUTE);
    manager.set_session_intent("sketch", std::string("portrait"), T0 + 2 * MINUTE);

    BOOST_CHECK(!manager.should_start_new_session(T0 + 10 * MINUTE, 30.0));
    BOOST_CHECK(manager.should_start_new_session(T0 + 40 * MINUTE, 30.0));

    manager.start_new_session("session-b", T0 + 40 * MINUTE);
    const ArtistContext& ctx = manager.get_context();
    BOOST_CHECK_EQUAL(ctx.session_id, "session-b");
    BOOST_CHECK_EQUAL(ctx.total_sessions, 2u);
    BOOST_CHECK_EQUAL(ctx.total_lifetime_strokes, 2u);
    BOOST_CHECK_EQUAL(ctx.total_strokes_in_session, 0u);
    BOOST_CHECK(!ctx.session_intent);

    BOOST_REQUIRE_EQUAL(manager.get_history().size(), 1u);
    BOOST_CHECK_EQUAL(manager.get_history()[0].session_id, "session-a");
    BOOST_REQUIRE(manager.get_history()[0].session_intent);
    BOOST_CHECK_EQUAL(*manager.get_history()[0].session_intent, "sketch");

    manager.clear_history();
    BOOST_CHECK(manager.get_history().empty());
}

BOOST_AUTO_TEST_CASE(context_state_survives_serialization) {
    ArtistContextManager manager("session-a", T0, std::string("artist-9"));
    manager.on_stroke_complete(StrokeUpdate(), T0 + MINUTE);
    manager.start_new_session("session-b", T0 + 2 * MINUTE);
    manager.on_stroke_complete(StrokeUpdate(), T0 + 3 * MINUTE);

    std::vector<uint8_t> bytes = manager.serialize();
    std::optional<ArtistContextManager> restored = ArtistContextManager::deserialize(bytes);
    BOOST_REQUIRE(restored);
    BOOST_CHECK_EQUAL(restored->get_context().session_id, "session-b");
    BOOST_CHECK_EQUAL(restored->get_context().total_lifetime_strokes, 2u);
    BOOST_REQUIRE(restored->get_context().artist_id);
    BOOST_CHECK_EQUAL(*restored->get_context().artist_id, "artist-9");
    BOOST_REQUIRE_EQUAL(restored->get_history().size(), 1u);
    BOOST_CHECK_EQUAL(restored->get_history()[0].session_id, "session-a");

    bytes[bytes.size() / 2] ^= 0x01;
    BOOST_CHECK(!ArtistContextManager::deserialize(bytes));
    BOOST_CHECK(!ArtistContextManager::deserialize(std::vector<uint8_t>()));
}

BOOST_AUTO_TEST_SUITE_END()
