#include <spdlog/spdlog.h>
#include <algorithm>
#include <sieve/retrieve/corpus.h>

namespace sieve::retrieve {

namespace fs = std::filesystem;

namespace {

constexpr const char* kChunksFileName = "chunks.jsonl";

Result<std::vector<fs::path>> collectChunkFiles(const fs::path& root) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return Error{ErrorCode::FileNotFound, "Corpus path does not exist: " + root.string()};
    }
    if (!fs::is_directory(root, ec)) {
        return std::vector<fs::path>{root};
    }

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename() == kChunksFileName) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot scan corpus directory " + root.string() + ": " + ec.message()};
    }
    if (files.empty()) {
        return Error{ErrorCode::NotFound,
                     std::string("No ") + kChunksFileName + " found under " + root.string()};
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

Result<ChunkCorpus> ChunkCorpus::load(const fs::path& path) {
    auto files = collectChunkFiles(path);
    if (!files) {
        return files.error();
    }

    ChunkCorpus corpus;
    for (const auto& file : files.value()) {
        auto stats = readJsonl(file, [&corpus](const nlohmann::json& j, size_t) {
            auto chunk = chunkFromJson(j);
            return chunk && corpus.add(std::move(*chunk));
        });
        if (!stats) {
            return stats.error();
        }
        corpus.stats_ += stats.value();
    }

    spdlog::debug("Loaded {} chunks from {} file(s) under {}", corpus.size(),
                  files.value().size(), path.string());
    return corpus;
}

ChunkCorpus ChunkCorpus::fromChunks(std::vector<Chunk> chunks) {
    ChunkCorpus corpus;
    for (auto& chunk : chunks) {
        ++corpus.stats_.linesRead;
        if (corpus.add(std::move(chunk))) {
            ++corpus.stats_.recordsAccepted;
        } else {
            ++corpus.stats_.linesSkipped;
        }
    }
    return corpus;
}

bool ChunkCorpus::add(Chunk chunk) {
    if (byId_.count(chunk.chunkId)) {
        return false;
    }
    byId_.emplace(chunk.chunkId, chunks_.size());
    chunks_.push_back(std::move(chunk));
    return true;
}

const Chunk* ChunkCorpus::find(const std::string& chunkId) const {
    auto it = byId_.find(chunkId);
    return it == byId_.end() ? nullptr : &chunks_[it->second];
}

Result<NoteLinkTable> NoteLinkTable::load(const fs::path& path) {
    NoteLinkTable table;
    auto stats = readJsonl(path, [&table](const nlohmann::json& j, size_t) {
        auto note = j.find("note_uid");
        auto patient = j.find("patient_uid");
        if (note == j.end() || !note->is_string() || patient == j.end() ||
            !patient->is_string()) {
            return false;
        }
        auto noteUid = note->get<std::string>();
        auto patientUid = patient->get<std::string>();
        if (noteUid.empty() || patientUid.empty()) {
            return false;
        }
        // First link for a note wins
        return table.links_.emplace(std::move(noteUid), std::move(patientUid)).second;
    });
    if (!stats) {
        return stats.error();
    }
    table.stats_ = stats.value();
    spdlog::debug("Loaded {} note links from {}", table.size(), path.string());
    return table;
}

NoteLinkTable
NoteLinkTable::fromPairs(const std::vector<std::pair<std::string, std::string>>& links) {
    NoteLinkTable table;
    for (const auto& [note, patient] : links) {
        ++table.stats_.linesRead;
        if (table.links_.emplace(note, patient).second) {
            ++table.stats_.recordsAccepted;
        } else {
            ++table.stats_.linesSkipped;
        }
    }
    return table;
}

std::optional<std::string> NoteLinkTable::patientFor(const std::string& noteUid) const {
    auto it = links_.find(noteUid);
    if (it == links_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace sieve::retrieve
