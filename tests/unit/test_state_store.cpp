#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "fakes/fake_operations.hpp"
#include "fakes/temp_workspace.hpp"
#include "session/state_store.hpp"

namespace {

using seoflow::core::errors::ErrorCategory;
using seoflow::core::errors::get_error;
using seoflow::core::errors::get_value;
using seoflow::core::errors::is_error;
using seoflow::protocol::WorkflowState;
using seoflow::session::ResearchPhaseData;
using seoflow::session::StateStore;
using seoflow::session::WorkflowSnapshot;
using seoflow::session::WritingPhaseData;
using seoflow::testing::make_article;
using seoflow::testing::make_research;
using seoflow::testing::read_file;
using seoflow::testing::TempWorkspace;
using seoflow::testing::write_file;
using nlohmann::json;

WorkflowSnapshot make_snapshot() {
    WorkflowSnapshot snapshot;
    snapshot.state = WorkflowState::WritingComplete;
    snapshot.timestamp = "2024-01-01T10:00:00";
    snapshot.data.keyword = "diabetes management";
    snapshot.data.start_time = "2024-01-01T09:59:00";
    snapshot.data.warnings = {"Only found 2 sources"};
    snapshot.data.research =
        ResearchPhaseData{make_research("diabetes management", 2), "2024-01-01T09:59:30", 2};
    snapshot.data.writing =
        WritingPhaseData{make_article("diabetes management"), "2024-01-01T10:00:00", 1500};
    return snapshot;
}

TEST(StateStoreTest, SnapshotPathUsesSessionId) {
    EXPECT_EQ(StateStore::snapshot_path("drafts", "kw_20240101_100000_abcdef12").string(),
              (std::filesystem::path("drafts") / ".workflow_state_kw_20240101_100000_abcdef12.json")
                  .string());
}

TEST(StateStoreTest, SaveWritesDocumentShape) {
    TempWorkspace ws("state_store");
    StateStore store;
    const auto path = StateStore::snapshot_path(ws.root(), "s1");
    WorkflowSnapshot snapshot = make_snapshot();
    snapshot.staging_dir = ws.root() / ".temp_s1";

    auto saved = store.save(path, snapshot);
    ASSERT_FALSE(is_error(saved));
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    const json doc = json::parse(read_file(path));
    EXPECT_EQ(doc["state"], "writing_complete");
    EXPECT_EQ(doc["timestamp"], "2024-01-01T10:00:00");
    EXPECT_EQ(doc["temp_dir"], (ws.root() / ".temp_s1").string());
    EXPECT_EQ(doc["data"]["keyword"], "diabetes management");
    EXPECT_EQ(doc["data"]["sources_found"], 2);
    EXPECT_EQ(doc["data"]["word_count"], 1500);
    EXPECT_TRUE(doc["data"]["research"].is_object());
    EXPECT_TRUE(doc["data"]["article"].is_object());
}

TEST(StateStoreTest, LoadRestoresPhaseData) {
    TempWorkspace ws("state_store");
    StateStore store;
    const auto path = StateStore::snapshot_path(ws.root(), "s2");
    ASSERT_FALSE(is_error(store.save(path, make_snapshot())));

    auto loaded = store.load(path);
    ASSERT_FALSE(is_error(loaded));
    const WorkflowSnapshot& snapshot = get_value(loaded);
    EXPECT_EQ(snapshot.state, WorkflowState::WritingComplete);
    EXPECT_EQ(snapshot.data.keyword, "diabetes management");
    EXPECT_FALSE(snapshot.staging_dir.has_value());
    ASSERT_TRUE(snapshot.data.research.has_value());
    EXPECT_EQ(snapshot.data.research->research.academic_sources.size(), 2u);
    ASSERT_TRUE(snapshot.data.writing.has_value());
    EXPECT_EQ(snapshot.data.writing->article.title, "A Guide to diabetes management");
    ASSERT_EQ(snapshot.data.warnings.size(), 1u);
}

TEST(StateStoreTest, InvalidUtf8IsReplacedOnSave) {
    TempWorkspace ws("state_store");
    StateStore store;
    const auto path = StateStore::snapshot_path(ws.root(), "s3");
    WorkflowSnapshot snapshot = make_snapshot();
    snapshot.data.keyword = "caf\xe9";
    snapshot.data.research->research.research_summary = "Truncated \xc3";

    auto saved = store.save(path, snapshot);
    ASSERT_FALSE(is_error(saved)) << get_error(saved).message;
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto loaded = store.load(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).data.keyword, "caf\xef\xbf\xbd");
    ASSERT_TRUE(get_value(loaded).data.research.has_value());
    EXPECT_EQ(get_value(loaded).data.research->research.research_summary,
              "Truncated \xef\xbf\xbd");
}

TEST(StateStoreTest, UnknownStateIsRejected) {
    TempWorkspace ws("state_store");
    const auto path = ws.root() / ".workflow_state_bogus.json";
    write_file(path, R"({"state": "bogus", "timestamp": "t", "data": {"keyword": "x"}})");

    auto loaded = StateStore().load(path);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(loaded).code, "unknown_state");
    EXPECT_NE(get_error(loaded).message.find("bogus"), std::string::npos);
}

TEST(StateStoreTest, MalformedAndMissingFilesAreDistinguished) {
    TempWorkspace ws("state_store");
    StateStore store;

    auto missing = store.load(ws.root() / "nope.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::Persistence);
    EXPECT_EQ(get_error(missing).code, "snapshot_unreadable");

    const auto garbage = ws.root() / "garbage.json";
    write_file(garbage, "{not json");
    auto malformed = store.load(garbage);
    ASSERT_TRUE(is_error(malformed));
    EXPECT_EQ(get_error(malformed).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(malformed).code, "snapshot_malformed");

    const auto stateless = ws.root() / "stateless.json";
    write_file(stateless, R"({"data": {}})");
    auto no_state = store.load(stateless);
    ASSERT_TRUE(is_error(no_state));
    EXPECT_EQ(get_error(no_state).code, "snapshot_malformed");
}

TEST(StateStoreTest, UnknownDataKeysSurviveRewrite) {
    TempWorkspace ws("state_store");
    StateStore store;
    const auto path = ws.root() / ".workflow_state_extra.json";
    write_file(path, R"({"state": "research_complete", "timestamp": "t",
                        "data": {"keyword": "x", "google_doc_id": "doc-9"}, "temp_dir": null})");

    auto loaded = store.load(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).data.extras["google_doc_id"], "doc-9");

    ASSERT_FALSE(is_error(store.save(path, get_value(loaded))));
    const json doc = json::parse(read_file(path));
    EXPECT_EQ(doc["data"]["google_doc_id"], "doc-9");
}

TEST(StateStoreTest, UndecodableEmbeddedResearchIsDropped) {
    TempWorkspace ws("state_store");
    const auto path = ws.root() / ".workflow_state_broken.json";
    write_file(path, R"({"state": "research_complete", "timestamp": "t",
                        "data": {"keyword": "x", "research": "not an object"}})");

    auto loaded = StateStore().load(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_FALSE(get_value(loaded).data.research.has_value());
}

TEST(StateStoreTest, RemoveReportsWhetherFileExisted) {
    TempWorkspace ws("state_store");
    StateStore store;
    const auto path = StateStore::snapshot_path(ws.root(), "s3");
    ASSERT_FALSE(is_error(store.save(path, make_snapshot())));

    auto first = store.remove(path);
    ASSERT_FALSE(is_error(first));
    EXPECT_TRUE(get_value(first));
    EXPECT_FALSE(std::filesystem::exists(path));

    auto second = store.remove(path);
    ASSERT_FALSE(is_error(second));
    EXPECT_FALSE(get_value(second));
}

TEST(StateStoreTest, SaveIntoMissingDirectoryFails) {
    TempWorkspace ws("state_store");
    auto saved = StateStore().save(ws.root() / "missing" / "snap.json", make_snapshot());
    ASSERT_TRUE(is_error(saved));
    EXPECT_EQ(get_error(saved).category, ErrorCategory::Persistence);
    EXPECT_EQ(get_error(saved).code, "snapshot_write_failed");
}

}  // namespace
