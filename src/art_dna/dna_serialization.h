// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_DNA_SERIALIZATION_H
#define ARTDNA_DNA_SERIALIZATION_H

/**
 * Binary record format for sessions and artist context state.
 *
 * Envelope (little-endian):
 *   magic "ADN1" | version u8 | record type u8 | payload blob (u32 len + bytes)
 *   | SHA-256 over everything before it (32 bytes)
 *
 * Decoding returns nullopt on a bad magic, unknown version, wrong record
 * type, truncated payload or checksum mismatch.
 */

#include <art_dna/dna_types.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace art_dna {

static constexpr uint8_t RECORD_MAGIC[4] = {0x41, 0x44, 0x4E, 0x31};  // "ADN1"
static constexpr uint8_t RECORD_VERSION = 0x01;

enum class RecordType : uint8_t {
    SESSION = 0x01,
    CONTEXT_STATE = 0x02
};

std::vector<uint8_t> SerializeSession(const DNASession& session);
std::optional<DNASession> DeserializeSession(const std::vector<uint8_t>& data);

/** Current context plus the history of previous session contexts */
struct ContextState {
    ArtistContext current;
    std::vector<ArtistContext> history;
};

std::vector<uint8_t> SerializeContextState(const ContextState& state);
std::optional<ContextState> DeserializeContextState(const std::vector<uint8_t>& data);

} // namespace art_dna

#endif // ARTDNA_DNA_SERIALIZATION_H
