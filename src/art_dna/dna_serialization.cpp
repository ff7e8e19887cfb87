// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/dna_serialization.h>

#include <openssl/sha.h>

#include <cstring>

namespace art_dna {

// ---- Serialization helpers (little-endian) ----

static void write_u8(std::vector<uint8_t>& out, uint8_t v) {
    out.push_back(v);
}
static void write_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; i++) out.push_back(static_cast<uint8_t>(v >> (i * 8)));
}
static void write_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; i++) out.push_back(static_cast<uint8_t>(v >> (i * 8)));
}
static void write_i64(std::vector<uint8_t>& out, int64_t v) {
    write_u64(out, static_cast<uint64_t>(v));
}
static void write_double(std::vector<uint8_t>& out, double v) {
    uint64_t bits; std::memcpy(&bits, &v, sizeof(double)); write_u64(out, bits);
}
static void write_float(std::vector<uint8_t>& out, float v) {
    uint32_t bits; std::memcpy(&bits, &v, sizeof(float)); write_u32(out, bits);
}
static void write_blob(std::vector<uint8_t>& out, const std::vector<uint8_t>& blob) {
    write_u32(out, static_cast<uint32_t>(blob.size()));
    out.insert(out.end(), blob.begin(), blob.end());
}
static void write_string(std::vector<uint8_t>& out, const std::string& s) {
    write_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}
static void write_opt_string(std::vector<uint8_t>& out, const std::optional<std::string>& s) {
    write_u8(out, s ? 1 : 0);
    if (s) write_string(out, *s);
}
template <typename Vec>
static void write_features(std::vector<uint8_t>& out, const Vec& features) {
    write_u32(out, static_cast<uint32_t>(features.size()));
    for (float v : features) write_float(out, v);
}

static bool read_u8(const std::vector<uint8_t>& data, size_t& off, uint8_t& v) {
    if (off + 1 > data.size()) return false;
    v = data[off++]; return true;
}
static bool read_u32(const std::vector<uint8_t>& data, size_t& off, uint32_t& v) {
    if (off + 4 > data.size()) return false;
    v = 0; for (int i = 0; i < 4; i++) v |= static_cast<uint32_t>(data[off + i]) << (i * 8);
    off += 4; return true;
}
static bool read_u64(const std::vector<uint8_t>& data, size_t& off, uint64_t& v) {
    if (off + 8 > data.size()) return false;
    v = 0; for (int i = 0; i < 8; i++) v |= static_cast<uint64_t>(data[off + i]) << (i * 8);
    off += 8; return true;
}
static bool read_i64(const std::vector<uint8_t>& data, size_t& off, int64_t& v) {
    uint64_t bits; if (!read_u64(data, off, bits)) return false;
    v = static_cast<int64_t>(bits); return true;
}
static bool read_double(const std::vector<uint8_t>& data, size_t& off, double& v) {
    uint64_t bits; if (!read_u64(data, off, bits)) return false;
    std::memcpy(&v, &bits, sizeof(double)); return true;
}
static bool read_float(const std::vector<uint8_t>& data, size_t& off, float& v) {
    uint32_t bits; if (!read_u32(data, off, bits)) return false;
    std::memcpy(&v, &bits, sizeof(float)); return true;
}
static bool read_blob(const std::vector<uint8_t>& data, size_t& off, std::vector<uint8_t>& blob) {
    uint32_t len; if (!read_u32(data, off, len)) return false;
    if (off + len > data.size()) return false;
    blob.assign(data.begin() + off, data.begin() + off + len);
    off += len; return true;
}
static bool read_string(const std::vector<uint8_t>& data, size_t& off, std::string& s) {
    uint32_t len; if (!read_u32(data, off, len)) return false;
    if (off + len > data.size()) return false;
    s.assign(reinterpret_cast<const char*>(data.data() + off), len);
    off += len; return true;
}
static bool read_opt_string(const std::vector<uint8_t>& data, size_t& off, std::optional<std::string>& s) {
    uint8_t present; if (!read_u8(data, off, present)) return false;
    if (!present) { s.reset(); return true; }
    std::string value; if (!read_string(data, off, value)) return false;
    s = std::move(value); return true;
}
template <typename Vec>
static bool read_features(const std::vector<uint8_t>& data, size_t& off, Vec& features) {
    uint32_t count; if (!read_u32(data, off, count)) return false;
    if (count != features.size()) return false;
    for (size_t i = 0; i < count; i++) {
        if (!read_float(data, off, features[i])) return false;
    }
    return true;
}

// Smallest possible encoding of each record: its fixed-width fields alone
static const size_t MIN_STROKE_BYTES = 4 + STROKE_DIMENSIONS * 4;
static const size_t MIN_IMAGE_BYTES = 4 + IMAGE_DIMENSIONS * 4;
static const size_t MIN_TEMPORAL_BYTES = 4 + TEMPORAL_DIMENSIONS * 4;
static const size_t MIN_CONTEXT_BYTES = 8 + 8 + 8 + 4 + 8;

// A record count the remaining bytes cannot hold comes from a corrupt payload
static bool count_fits(uint32_t count, size_t min_record_bytes, const std::vector<uint8_t>& data, size_t off) {
    size_t remaining = off <= data.size() ? data.size() - off : 0;
    return count <= remaining / min_record_bytes;
}

// ---- Record bodies ----

static void write_stroke(std::vector<uint8_t>& out, const StrokeDNA& s) {
    write_string(out, s.dna_id);
    write_string(out, s.stroke_id);
    write_string(out, s.session_id);
    write_features(out, s.features);
    write_u8(out, s.normalized_bounds ? 1 : 0);
    if (s.normalized_bounds) {
        write_double(out, s.normalized_bounds->x);
        write_double(out, s.normalized_bounds->y);
        write_double(out, s.normalized_bounds->width);
        write_double(out, s.normalized_bounds->height);
        write_double(out, s.normalized_bounds->scale_factor);
    }
    write_string(out, s.tool);
    write_string(out, s.color);
    write_i64(out, s.timestamp);
    write_double(out, s.encoding_time_ms);
}

static bool read_stroke(const std::vector<uint8_t>& data, size_t& off, StrokeDNA& s) {
    if (!read_string(data, off, s.dna_id)) return false;
    if (!read_string(data, off, s.stroke_id)) return false;
    if (!read_string(data, off, s.session_id)) return false;
    if (!read_features(data, off, s.features)) return false;
    uint8_t has_bounds; if (!read_u8(data, off, has_bounds)) return false;
    if (has_bounds) {
        StrokeBounds b;
        if (!read_double(data, off, b.x)) return false;
        if (!read_double(data, off, b.y)) return false;
        if (!read_double(data, off, b.width)) return false;
        if (!read_double(data, off, b.height)) return false;
        if (!read_double(data, off, b.scale_factor)) return false;
        s.normalized_bounds = b;
    }
    if (!read_string(data, off, s.tool)) return false;
    if (!read_string(data, off, s.color)) return false;
    if (!read_i64(data, off, s.timestamp)) return false;
    return read_double(data, off, s.encoding_time_ms);
}

static void write_image(std::vector<uint8_t>& out, const ImageDNA& img) {
    write_string(out, img.dna_id);
    write_string(out, img.session_id);
    write_string(out, img.snapshot_id);
    write_features(out, img.features);
    write_u32(out, static_cast<uint32_t>(img.dominant_colors.size()));
    for (const std::string& c : img.dominant_colors) write_string(out, c);
    write_double(out, img.texture.complexity);
    write_double(out, img.texture.contrast);
    write_double(out, img.texture.energy);
    write_u32(out, static_cast<uint32_t>(img.width));
    write_u32(out, static_cast<uint32_t>(img.height));
    write_i64(out, img.timestamp);
    write_double(out, img.encoding_time_ms);
}

static bool read_image(const std::vector<uint8_t>& data, size_t& off, ImageDNA& img) {
    if (!read_string(data, off, img.dna_id)) return false;
    if (!read_string(data, off, img.session_id)) return false;
    if (!read_string(data, off, img.snapshot_id)) return false;
    if (!read_features(data, off, img.features)) return false;
    uint32_t colors; if (!read_u32(data, off, colors)) return false;
    if (colors > 64) return false;
    img.dominant_colors.resize(colors);
    for (uint32_t i = 0; i < colors; i++) {
        if (!read_string(data, off, img.dominant_colors[i])) return false;
    }
    if (!read_double(data, off, img.texture.complexity)) return false;
    if (!read_double(data, off, img.texture.contrast)) return false;
    if (!read_double(data, off, img.texture.energy)) return false;
    uint32_t w, h;
    if (!read_u32(data, off, w) || !read_u32(data, off, h)) return false;
    img.width = static_cast<int>(w);
    img.height = static_cast<int>(h);
    if (!read_i64(data, off, img.timestamp)) return false;
    return read_double(data, off, img.encoding_time_ms);
}

static void write_temporal(std::vector<uint8_t>& out, const TemporalDNA& t) {
    write_string(out, t.dna_id);
    write_string(out, t.session_id);
    write_opt_string(out, t.artist_id);
    write_features(out, t.features);
    write_u8(out, static_cast<uint8_t>(t.learning_phase));
    write_double(out, t.skill_progression);
    write_double(out, t.fatigue_level);
    write_double(out, t.focus_score);
    write_u8(out, t.flow_state_active ? 1 : 0);
    write_u32(out, t.total_sessions);
    write_u64(out, t.total_strokes);
    write_i64(out, t.timestamp);
    write_double(out, t.encoding_time_ms);
}

static bool read_temporal(const std::vector<uint8_t>& data, size_t& off, TemporalDNA& t) {
    if (!read_string(data, off, t.dna_id)) return false;
    if (!read_string(data, off, t.session_id)) return false;
    if (!read_opt_string(data, off, t.artist_id)) return false;
    if (!read_features(data, off, t.features)) return false;
    uint8_t phase; if (!read_u8(data, off, phase)) return false;
    if (phase > static_cast<uint8_t>(LearningPhase::MASTERY)) return false;
    t.learning_phase = static_cast<LearningPhase>(phase);
    if (!read_double(data, off, t.skill_progression)) return false;
    if (!read_double(data, off, t.fatigue_level)) return false;
    if (!read_double(data, off, t.focus_score)) return false;
    uint8_t flow; if (!read_u8(data, off, flow)) return false;
    t.flow_state_active = flow != 0;
    if (!read_u32(data, off, t.total_sessions)) return false;
    if (!read_u64(data, off, t.total_strokes)) return false;
    if (!read_i64(data, off, t.timestamp)) return false;
    return read_double(data, off, t.encoding_time_ms);
}

static void write_context(std::vector<uint8_t>& out, const ArtistContext& c) {
    write_string(out, c.context_id);
    write_string(out, c.session_id);
    write_opt_string(out, c.artist_id);
    write_i64(out, c.session_start_time);
    write_i64(out, c.last_stroke_time);
    write_u64(out, c.total_strokes_in_session);
    write_u32(out, c.total_sessions);
    write_u64(out, c.total_lifetime_strokes);
    write_u8(out, static_cast<uint8_t>(c.skill_level));
    write_double(out, c.current_fatigue_level);
    write_double(out, c.consecutive_work_minutes);
    write_i64(out, c.last_break_time);
    write_u32(out, c.break_count);
    write_string(out, c.current_tool);
    write_string(out, c.current_color);
    write_double(out, c.current_brush_size);
    write_opt_string(out, c.session_intent);
    write_opt_string(out, c.target_outcome);
    write_i64(out, c.created_at);
    write_i64(out, c.updated_at);
}

static bool read_context(const std::vector<uint8_t>& data, size_t& off, ArtistContext& c) {
    if (!read_string(data, off, c.context_id)) return false;
    if (!read_string(data, off, c.session_id)) return false;
    if (!read_opt_string(data, off, c.artist_id)) return false;
    if (!read_i64(data, off, c.session_start_time)) return false;
    if (!read_i64(data, off, c.last_stroke_time)) return false;
    if (!read_u64(data, off, c.total_strokes_in_session)) return false;
    if (!read_u32(data, off, c.total_sessions)) return false;
    if (!read_u64(data, off, c.total_lifetime_strokes)) return false;
    uint8_t skill; if (!read_u8(data, off, skill)) return false;
    if (skill > static_cast<uint8_t>(SkillLevel::EXPERT)) return false;
    c.skill_level = static_cast<SkillLevel>(skill);
    if (!read_double(data, off, c.current_fatigue_level)) return false;
    if (!read_double(data, off, c.consecutive_work_minutes)) return false;
    if (!read_i64(data, off, c.last_break_time)) return false;
    if (!read_u32(data, off, c.break_count)) return false;
    if (!read_string(data, off, c.current_tool)) return false;
    if (!read_string(data, off, c.current_color)) return false;
    if (!read_double(data, off, c.current_brush_size)) return false;
    if (!read_opt_string(data, off, c.session_intent)) return false;
    if (!read_opt_string(data, off, c.target_outcome)) return false;
    if (!read_i64(data, off, c.created_at)) return false;
    return read_i64(data, off, c.updated_at);
}

static void write_pretty_score(std::vector<uint8_t>& out, const PrettyScore& p) {
    write_string(out, p.score_id);
    write_string(out, p.session_id);
    write_double(out, p.overall_score);
    write_double(out, p.color_harmony);
    write_double(out, p.composition_balance);
    write_double(out, p.visual_complexity);
    write_double(out, p.style_consistency);
    write_u8(out, static_cast<uint8_t>(p.mode));
    write_double(out, p.threshold);
    write_u8(out, p.passes_threshold ? 1 : 0);
    write_string(out, p.recommendation);
    write_i64(out, p.computed_at);
}

static bool read_mode(const std::vector<uint8_t>& data, size_t& off, AestheticMode& mode) {
    uint8_t v; if (!read_u8(data, off, v)) return false;
    if (v > static_cast<uint8_t>(AestheticMode::CREATIVE)) return false;
    mode = static_cast<AestheticMode>(v); return true;
}

static bool read_pretty_score(const std::vector<uint8_t>& data, size_t& off, PrettyScore& p) {
    if (!read_string(data, off, p.score_id)) return false;
    if (!read_string(data, off, p.session_id)) return false;
    if (!read_double(data, off, p.overall_score)) return false;
    if (!read_double(data, off, p.color_harmony)) return false;
    if (!read_double(data, off, p.composition_balance)) return false;
    if (!read_double(data, off, p.visual_complexity)) return false;
    if (!read_double(data, off, p.style_consistency)) return false;
    if (!read_mode(data, off, p.mode)) return false;
    if (!read_double(data, off, p.threshold)) return false;
    uint8_t passes; if (!read_u8(data, off, passes)) return false;
    p.passes_threshold = passes != 0;
    if (!read_string(data, off, p.recommendation)) return false;
    return read_i64(data, off, p.computed_at);
}

// ---- Envelope ----

static std::vector<uint8_t> seal(RecordType type, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> data;
    data.insert(data.end(), RECORD_MAGIC, RECORD_MAGIC + 4);
    write_u8(data, RECORD_VERSION);
    write_u8(data, static_cast<uint8_t>(type));
    write_blob(data, payload);

    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), digest);
    data.insert(data.end(), digest, digest + SHA256_DIGEST_LENGTH);
    return data;
}

static std::optional<std::vector<uint8_t>> unseal(RecordType type, const std::vector<uint8_t>& data) {
    if (data.size() < 4 + 2 + 4 + SHA256_DIGEST_LENGTH) return std::nullopt;
    if (std::memcmp(data.data(), RECORD_MAGIC, 4) != 0) return std::nullopt;

    size_t body_len = data.size() - SHA256_DIGEST_LENGTH;
    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), body_len, digest);
    if (std::memcmp(digest, data.data() + body_len, SHA256_DIGEST_LENGTH) != 0) return std::nullopt;

    size_t off = 4;
    uint8_t version, record_type;
    if (!read_u8(data, off, version) || version != RECORD_VERSION) return std::nullopt;
    if (!read_u8(data, off, record_type) || record_type != static_cast<uint8_t>(type)) return std::nullopt;

    std::vector<uint8_t> payload;
    if (!read_blob(data, off, payload)) return std::nullopt;
    if (off != body_len) return std::nullopt;
    return payload;
}

// ---- Public API ----

std::vector<uint8_t> SerializeSession(const DNASession& session) {
    std::vector<uint8_t> out;
    write_string(out, session.session_id);
    write_opt_string(out, session.artist_id);
    write_opt_string(out, session.name);
    write_i64(out, session.started_at);
    write_u8(out, session.ended_at ? 1 : 0);
    if (session.ended_at) write_i64(out, *session.ended_at);

    write_u32(out, static_cast<uint32_t>(session.stroke_dna.size()));
    for (const StrokeDNA& s : session.stroke_dna) write_stroke(out, s);
    write_u32(out, static_cast<uint32_t>(session.image_dna.size()));
    for (const ImageDNA& img : session.image_dna) write_image(out, img);
    write_u32(out, static_cast<uint32_t>(session.temporal_dna.size()));
    for (const TemporalDNA& t : session.temporal_dna) write_temporal(out, t);

    write_u64(out, session.total_strokes);
    write_double(out, session.confidence_score);
    write_context(out, session.context);
    write_u8(out, session.aesthetic_score ? 1 : 0);
    if (session.aesthetic_score) write_pretty_score(out, *session.aesthetic_score);
    write_u8(out, static_cast<uint8_t>(session.aesthetic_mode));

    return seal(RecordType::SESSION, out);
}

std::optional<DNASession> DeserializeSession(const std::vector<uint8_t>& data) {
    auto payload = unseal(RecordType::SESSION, data);
    if (!payload) return std::nullopt;
    const std::vector<uint8_t>& in = *payload;
    size_t off = 0;

    DNASession session;
    if (!read_string(in, off, session.session_id)) return std::nullopt;
    if (!read_opt_string(in, off, session.artist_id)) return std::nullopt;
    if (!read_opt_string(in, off, session.name)) return std::nullopt;
    if (!read_i64(in, off, session.started_at)) return std::nullopt;
    uint8_t has_end; if (!read_u8(in, off, has_end)) return std::nullopt;
    if (has_end) {
        int64_t ended; if (!read_i64(in, off, ended)) return std::nullopt;
        session.ended_at = ended;
    }

    uint32_t count;
    if (!read_u32(in, off, count) || !count_fits(count, MIN_STROKE_BYTES, in, off)) return std::nullopt;
    session.stroke_dna.resize(count);
    for (StrokeDNA& s : session.stroke_dna) {
        if (!read_stroke(in, off, s)) return std::nullopt;
    }
    if (!read_u32(in, off, count) || !count_fits(count, MIN_IMAGE_BYTES, in, off)) return std::nullopt;
    session.image_dna.resize(count);
    for (ImageDNA& img : session.image_dna) {
        if (!read_image(in, off, img)) return std::nullopt;
    }
    if (!read_u32(in, off, count) || !count_fits(count, MIN_TEMPORAL_BYTES, in, off)) return std::nullopt;
    session.temporal_dna.resize(count);
    for (TemporalDNA& t : session.temporal_dna) {
        if (!read_temporal(in, off, t)) return std::nullopt;
    }

    if (!read_u64(in, off, session.total_strokes)) return std::nullopt;
    if (!read_double(in, off, session.confidence_score)) return std::nullopt;
    if (!read_context(in, off, session.context)) return std::nullopt;
    uint8_t has_score; if (!read_u8(in, off, has_score)) return std::nullopt;
    if (has_score) {
        PrettyScore score;
        if (!read_pretty_score(in, off, score)) return std::nullopt;
        session.aesthetic_score = score;
    }
    if (!read_mode(in, off, session.aesthetic_mode)) return std::nullopt;
    if (off != in.size()) return std::nullopt;

    return session;
}

std::vector<uint8_t> SerializeContextState(const ContextState& state) {
    std::vector<uint8_t> out;
    write_context(out, state.current);
    write_u32(out, static_cast<uint32_t>(state.history.size()));
    for (const ArtistContext& c : state.history) write_context(out, c);
    return seal(RecordType::CONTEXT_STATE, out);
}

std::optional<ContextState> DeserializeContextState(const std::vector<uint8_t>& data) {
    auto payload = unseal(RecordType::CONTEXT_STATE, data);
    if (!payload) return std::nullopt;
    const std::vector<uint8_t>& in = *payload;
    size_t off = 0;

    ContextState state;
    if (!read_context(in, off, state.current)) return std::nullopt;
    uint32_t count;
    if (!read_u32(in, off, count) || !count_fits(count, MIN_CONTEXT_BYTES, in, off)) return std::nullopt;
    state.history.resize(count);
    for (ArtistContext& c : state.history) {
        if (!read_context(in, off, c)) return std::nullopt;
    }
    if (off != in.size()) return std::nullopt;
    return state;
}

} // namespace art_dna
