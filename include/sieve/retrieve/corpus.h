#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <sieve/core/types.h>
#include <sieve/retrieve/jsonl.h>
#include <sieve/retrieve/records.h>

namespace sieve::retrieve {

/**
 * @brief Read-only snapshot of the canonical chunk corpus
 *
 * Chunks keep their load order. A repeated chunk_id keeps its first occurrence and the
 * repeat is counted as a skipped line.
 */
class ChunkCorpus {
public:
    ChunkCorpus() = default;

    /**
     * @brief Load from a chunks JSONL file, or from every chunks.jsonl found recursively
     * under a directory (visited in path order)
     */
    static Result<ChunkCorpus> load(const std::filesystem::path& path);

    static ChunkCorpus fromChunks(std::vector<Chunk> chunks);

    const Chunk* find(const std::string& chunkId) const;

    const std::vector<Chunk>& chunks() const { return chunks_; }
    size_t size() const { return chunks_.size(); }
    bool empty() const { return chunks_.empty(); }

    const JsonlReadStats& loadStats() const { return stats_; }

private:
    bool add(Chunk chunk);

    std::vector<Chunk> chunks_;
    std::unordered_map<std::string, size_t> byId_;
    JsonlReadStats stats_;
};

/**
 * @brief note_uid -> patient_uid links from identity resolution
 *
 * A note without an entry is an unknown patient, never an error.
 */
class NoteLinkTable {
public:
    NoteLinkTable() = default;

    static Result<NoteLinkTable> load(const std::filesystem::path& path);

    static NoteLinkTable fromPairs(const std::vector<std::pair<std::string, std::string>>& links);

    std::optional<std::string> patientFor(const std::string& noteUid) const;

    size_t size() const { return links_.size(); }
    const JsonlReadStats& loadStats() const { return stats_; }

private:
    std::unordered_map<std::string, std::string> links_;
    JsonlReadStats stats_;
};

} // namespace sieve::retrieve
