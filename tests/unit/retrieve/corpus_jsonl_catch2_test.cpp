#include <catch2/catch_test_macros.hpp>

#include <sieve/retrieve/corpus.h>
#include <sieve/retrieve/jsonl.h>

#include "../../support/temp_dir_scope.hpp"

#include <string>
#include <vector>

using sieve::ErrorCode;
using sieve::retrieve::ChunkCorpus;
using sieve::retrieve::NoteLinkTable;
using sieve::test_support::TempDirScope;

TEST_CASE("ChunkCorpus loads chunks and counts malformed lines", "[retrieve][corpus][catch2]") {
    auto tmp = TempDirScope::unique_under("sieve-corpus");
    auto file = tmp.write(
        "chunks.jsonl",
        {R"({"chunk_id":"c1","source_note_id":"n1","text":"chest pain","offset":0})",
         "",
         "not json at all",
         R"({"chunk_id":"c2","source_note_id":"n1","text":"no fever","offset":120})",
         R"({"chunk_id":"c3","source_note_id":"n2","text":"missing offset"})",
         R"({"chunk_id":"c4","source_note_id":"n2","text":"negative","offset":-4})",
         R"({"chunk_id":"c1","source_note_id":"n9","text":"duplicate id","offset":7})"});

    auto corpus = ChunkCorpus::load(file);
    REQUIRE(corpus);
    const auto& c = corpus.value();
    CHECK(c.size() == 2);
    CHECK(c.loadStats().linesRead == 6);
    CHECK(c.loadStats().recordsAccepted == 2);
    CHECK(c.loadStats().linesSkipped == 4);
    REQUIRE(c.loadStats().firstSkip.has_value());
    CHECK(c.loadStats().firstSkip->code == ErrorCode::InputSchemaError);
    CHECK(c.loadStats().firstSkip->message == file.string() + ":3: not a JSON object");

    const auto* first = c.find("c1");
    REQUIRE(first != nullptr);
    CHECK(first->sourceNoteId == "n1");
    CHECK(first->text == "chest pain");
    REQUIRE(c.find("c2") != nullptr);
    CHECK(c.find("c2")->offset == 120);
    CHECK(c.find("c3") == nullptr);
}

TEST_CASE("ChunkCorpus walks a directory of chunks.jsonl files in path order",
          "[retrieve][corpus][catch2]") {
    auto tmp = TempDirScope::unique_under("sieve-corpus-dir");
    tmp.write("b/chunks.jsonl",
              {R"({"chunk_id":"b1","source_note_id":"n2","text":"second","offset":0})",
               R"({"chunk_id":"a1","source_note_id":"nX","text":"late duplicate","offset":0})"});
    tmp.write("a/chunks.jsonl",
              {R"({"chunk_id":"a1","source_note_id":"n1","text":"first","offset":0})"});
    tmp.write("a/other.jsonl",
              {R"({"chunk_id":"z9","source_note_id":"n9","text":"ignored","offset":0})"});

    auto corpus = ChunkCorpus::load(tmp.path());
    REQUIRE(corpus);
    const auto& c = corpus.value();
    REQUIRE(c.size() == 2);
    CHECK(c.chunks()[0].chunkId == "a1");
    CHECK(c.chunks()[1].chunkId == "b1");
    CHECK(c.find("a1")->text == "first");
    CHECK(c.find("z9") == nullptr);
    CHECK(c.loadStats().linesSkipped == 1);
}

TEST_CASE("ChunkCorpus reports missing inputs", "[retrieve][corpus][catch2]") {
    auto tmp = TempDirScope::unique_under("sieve-corpus-missing");

    auto missing = ChunkCorpus::load(tmp.path() / "nope.jsonl");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::FileNotFound);

    auto emptyDir = ChunkCorpus::load(tmp.path());
    REQUIRE_FALSE(emptyDir);
    CHECK(emptyDir.error().code == ErrorCode::NotFound);
}

TEST_CASE("NoteLinkTable maps notes to patients and skips bad lines",
          "[retrieve][corpus][catch2]") {
    auto tmp = TempDirScope::unique_under("sieve-links");
    auto file = tmp.write("note_links.jsonl",
                          {R"({"note_uid":"n1","patient_uid":"p1"})",
                           R"({"note_uid":"n2"})",
                           R"({"note_uid":"n3","patient_uid":42})",
                           R"({"note_uid":"n1","patient_uid":"p-other"})",
                           R"({"note_uid":"n4","patient_uid":"p4"})"});

    auto links = NoteLinkTable::load(file);
    REQUIRE(links);
    CHECK(links.value().size() == 2);
    CHECK(links.value().loadStats().linesSkipped == 3);
    CHECK(links.value().patientFor("n1") == std::optional<std::string>("p1"));
    CHECK(links.value().patientFor("n4") == std::optional<std::string>("p4"));
    CHECK_FALSE(links.value().patientFor("n2").has_value());
}

TEST_CASE("Stage records keep their on-disk field names", "[retrieve][jsonl][catch2]") {
    sieve::retrieve::FinalResult r;
    r.chunkId = "c1";
    r.calibratedScore = 0.75;
    r.rawScore = 0.6;
    r.calibrated = true;
    r.pointer = {"n1", 42};

    auto j = sieve::retrieve::toJson(r);
    CHECK(j.at("chunk_id") == "c1");
    CHECK(j.at("calibrated_score") == 0.75);
    CHECK(j.at("patient_uid").is_null());
    CHECK(j.at("pointer").at("source_note_id") == "n1");
    CHECK(j.at("pointer").at("offset") == 42);

    sieve::retrieve::RescoredCandidate rc;
    rc.chunkId = "c2";
    rc.interactionScore = 0.5;
    rc.fusionScore = 0.25;
    auto noEvidence = sieve::retrieve::toJson(rc);
    CHECK_FALSE(noEvidence.contains("evidence"));

    rc.evidence = std::vector<sieve::retrieve::EvidenceToken>{{"pain", 1.0, 3}};
    auto withEvidence = sieve::retrieve::toJson(rc);
    REQUIRE(withEvidence.at("evidence").size() == 1);
    CHECK(withEvidence.at("evidence")[0].at("position") == 3);

    auto back = sieve::retrieve::rescoredFromJson(withEvidence);
    REQUIRE(back.has_value());
    REQUIRE(back->evidence.has_value());
    CHECK(back->evidence->front().token == "pain");
}

TEST_CASE("Candidate parsing rejects records without a usable fusion score",
          "[retrieve][jsonl][catch2]") {
    using nlohmann::json;
    CHECK(sieve::retrieve::candidateFromJson(json{{"chunk_id", "c1"}, {"fusion_score", 0.4}}));
    CHECK_FALSE(sieve::retrieve::candidateFromJson(json{{"chunk_id", "c1"}}));
    CHECK_FALSE(
        sieve::retrieve::candidateFromJson(json{{"chunk_id", ""}, {"fusion_score", 0.4}}));
    CHECK_FALSE(
        sieve::retrieve::candidateFromJson(json{{"chunk_id", "c1"}, {"fusion_score", "high"}}));
}
