#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sieve::retrieve {

/**
 * @brief Canonical chunk of a clinical note, as produced by the canonicalizer
 */
struct Chunk {
    std::string chunkId;
    std::string sourceNoteId;
    std::string text;
    int64_t offset = 0; // character offset of the chunk inside its source note
};

/**
 * @brief Scout output: both retrieval signals normalized to [0,1] and their fusion
 */
struct Candidate {
    std::string chunkId;
    std::string sourceNoteId;
    double lexicalScore = 0.0;
    double denseScore = 0.0;
    double fusionScore = 0.0;
};

/**
 * @brief One chunk token that contributed to an interaction score
 */
struct EvidenceToken {
    std::string token;
    double weight = 0.0;
    size_t position = 0; // token index within the chunk
};

/**
 * @brief Inspector output
 *
 * fusionScore is carried unchanged from the Scout candidate. Evidence, when present,
 * is ordered by descending weight.
 */
struct RescoredCandidate {
    std::string chunkId;
    std::string sourceNoteId;
    double interactionScore = 0.0;
    double fusionScore = 0.0;
    std::optional<std::vector<EvidenceToken>> evidence;
};

struct ChunkPointer {
    std::string sourceNoteId;
    int64_t offset = 0;
};

/**
 * @brief Judge output
 *
 * patientUid is set only when the link table maps the chunk's source note.
 */
struct FinalResult {
    std::string chunkId;
    double calibratedScore = 0.0;
    double rawScore = 0.0;
    bool calibrated = false;
    std::optional<std::string> patientUid;
    ChunkPointer pointer;
};

} // namespace sieve::retrieve
