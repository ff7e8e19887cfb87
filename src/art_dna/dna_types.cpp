// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/dna_types.h>

#include <util/strencodings.h>

#include <openssl/rand.h>

#include <stdexcept>

namespace art_dna {

std::string LearningPhaseName(LearningPhase phase) {
    switch (phase) {
        case LearningPhase::EXPLORATION: return "exploration";
        case LearningPhase::REFINEMENT: return "refinement";
        case LearningPhase::MASTERY: return "mastery";
    }
    return "exploration";
}

std::string SkillLevelName(SkillLevel level) {
    switch (level) {
        case SkillLevel::BEGINNER: return "beginner";
        case SkillLevel::INTERMEDIATE: return "intermediate";
        case SkillLevel::ADVANCED: return "advanced";
        case SkillLevel::EXPERT: return "expert";
    }
    return "beginner";
}

SkillLevel SkillLevelForStrokes(uint64_t lifetime_strokes) {
    if (lifetime_strokes < 500) return SkillLevel::BEGINNER;
    if (lifetime_strokes < 2000) return SkillLevel::INTERMEDIATE;
    if (lifetime_strokes < 10000) return SkillLevel::ADVANCED;
    return SkillLevel::EXPERT;
}

std::string AestheticModeName(AestheticMode mode) {
    switch (mode) {
        case AestheticMode::STRICT: return "strict";
        case AestheticMode::BALANCED: return "balanced";
        case AestheticMode::CREATIVE: return "creative";
    }
    return "balanced";
}

std::optional<AestheticMode> ParseAestheticMode(const std::string& name) {
    std::string lower = ToLower(name);
    if (lower == "strict") return AestheticMode::STRICT;
    if (lower == "balanced") return AestheticMode::BALANCED;
    if (lower == "creative") return AestheticMode::CREATIVE;
    return std::nullopt;
}

std::string GenerateDNAId(const std::string& prefix) {
    uint8_t bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating " + prefix + " id");
    }
    return prefix + "_" + HexStr(bytes, sizeof(bytes));
}

} // namespace art_dna
