#include "wfsync/events/events.hpp"
#include "wfsync/sync/archive.hpp"
#include "wfsync/sync/watcher.hpp"
#include "wfsync/workflow/hasher.hpp"
#include "wfsync/workflow/normalizer.hpp"
#include "support/fake_remote.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <vector>

namespace fs = std::filesystem;
using wfsync::Error;
using wfsync::ErrorCode;
using wfsync::events::EventBus;
using wfsync::events::SyncErrorEvent;
using wfsync::events::WorkflowArchivedEvent;
using wfsync::events::WorkflowStatusChangedEvent;
using wfsync::sync::ArchiveStore;
using wfsync::sync::Watcher;
using wfsync::sync::WatcherOptions;
using wfsync::workflow::CanonicalHasher;
using wfsync::workflow::Document;
using wfsync::workflow::SyncStatus;
using wfsync::workflow::WorkflowNormalizer;
using namespace wfsync::test_support;

class WatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = create_temp_dir("wfsync_watcher_");
        status_sub_ = bus_.scoped_subscribe<WorkflowStatusChangedEvent>(
            [this](const WorkflowStatusChangedEvent& e) { statuses_[e.filename] = e.status; });
    }

    void TearDown() override {
        watcher_.reset();
        if (!dir_.empty()) {
            fs::remove_all(dir_);
        }
    }

    WatcherOptions options() const {
        WatcherOptions opts;
        opts.directory = dir_;
        opts.poll_interval = std::chrono::milliseconds(0);
        opts.watch_filesystem = false;
        return opts;
    }

    Watcher& make_watcher(WatcherOptions opts) {
        watcher_ = std::make_unique<Watcher>(io_, remote_, bus_, std::move(opts));
        return *watcher_;
    }

    Watcher& start_watcher() {
        auto& watcher = make_watcher(options());
        auto started = watcher.start();
        EXPECT_TRUE(started.is_ok()) << started.error().message;
        return watcher;
    }

    // Local file mirroring a remote record, the way a pull writes it
    void write_local_copy(const std::string& id, const std::string& filename) {
        write_json(dir_ / filename, WorkflowNormalizer::to_local_file(*remote_.record(id), id));
    }

    static std::string hash_of(const Document& doc) {
        return CanonicalHasher::hash(WorkflowNormalizer::clean_for_storage(doc));
    }

    fs::path dir_;
    boost::asio::io_context io_;
    FakeRemote remote_;
    EventBus bus_;
    std::unique_ptr<Watcher> watcher_;
    std::map<std::string, SyncStatus> statuses_;
    wfsync::events::Subscription status_sub_;
};

TEST_F(WatcherTest, StartBroadcastsInitialStatuses) {
    remote_.add(Document{{"name", "Remote Only"}});
    write_json(dir_ / "Local Only.json", Document{{"name", "Local Only"}, {"nodes", Document::array()}});

    auto& watcher = start_watcher();

    EXPECT_TRUE(watcher.running());
    EXPECT_EQ(watcher.calculate_status("Remote Only.json"), SyncStatus::EXIST_ONLY_REMOTELY);
    EXPECT_EQ(watcher.calculate_status("Local Only.json"), SyncStatus::EXIST_ONLY_LOCALLY);
    EXPECT_EQ(statuses_["Remote Only.json"], SyncStatus::EXIST_ONLY_REMOTELY);
    EXPECT_EQ(statuses_["Local Only.json"], SyncStatus::EXIST_ONLY_LOCALLY);
    EXPECT_EQ(watcher.status_matrix().size(), 2u);
}

TEST_F(WatcherTest, IdenticalContentIsInSyncWithoutBase) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    write_local_copy(id, "Flow.json");

    auto& watcher = start_watcher();

    EXPECT_EQ(watcher.calculate_status("Flow.json"), SyncStatus::IN_SYNC);
    EXPECT_EQ(watcher.id_for_filename("Flow.json"), std::optional<std::string>(id));
    EXPECT_FALSE(watcher.last_synced_hash(id).has_value());
}

TEST_F(WatcherTest, StartFailsWhenListingFails) {
    remote_.fail_with(Error(ErrorCode::Transport, "connection refused"));
    int errors = 0;
    auto sub = bus_.scoped_subscribe<SyncErrorEvent>([&](const SyncErrorEvent&) { ++errors; });

    auto& watcher = make_watcher(options());
    auto started = watcher.start();

    ASSERT_TRUE(started.is_error());
    EXPECT_EQ(started.error().code, ErrorCode::Transport);
    EXPECT_FALSE(watcher.running());
    EXPECT_EQ(errors, 1);
}

TEST_F(WatcherTest, FetchesOnlyWhenTimestampMoves) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    auto& watcher = start_watcher();
    EXPECT_EQ(remote_.get_calls(), 1);

    ASSERT_TRUE(watcher.refresh_remote_state().is_ok());
    ASSERT_TRUE(watcher.refresh_remote_state().is_ok());
    EXPECT_EQ(remote_.get_calls(), 1);

    remote_.edit(id, "nodes", Document::array({Document{{"name", "Start"}}}));
    ASSERT_TRUE(watcher.refresh_remote_state().is_ok());
    EXPECT_EQ(remote_.get_calls(), 2);
    EXPECT_EQ(watcher.snapshot("Flow.json").remote_hash, std::optional<std::string>(hash_of(*remote_.record(id))));
}

TEST_F(WatcherTest, SkipsIgnoredAndInactiveWorkflows) {
    remote_.add(Document{{"name", "Kept"}, {"active", true}});
    remote_.add(Document{{"name", "Shelved"}, {"tags", Document::array({Document{{"name", "Archive"}}})}});
    remote_.add(Document{{"name", "Dormant"}, {"active", false}});

    auto opts = options();
    opts.sync_inactive = false;
    auto& watcher = make_watcher(opts);
    ASSERT_TRUE(watcher.start().is_ok());

    const auto matrix = watcher.status_matrix();
    ASSERT_EQ(matrix.size(), 1u);
    EXPECT_EQ(matrix[0].filename, "Kept.json");
}

TEST_F(WatcherTest, ActiveWorkflowClaimsCollidingFilename) {
    remote_.add(Document{{"id", "a-inactive"}, {"name", "Flow"}, {"active", false}});
    remote_.add(Document{{"id", "b-active"}, {"name", "Flow"}, {"active", true}});

    auto& watcher = start_watcher();

    EXPECT_EQ(watcher.id_for_filename("Flow.json"), std::optional<std::string>("b-active"));
    EXPECT_FALSE(watcher.filename_for_id("a-inactive").has_value());
}

TEST_F(WatcherTest, PrunesVanishedRemoteWorkflows) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    write_local_copy(id, "Flow.json");
    auto& watcher = start_watcher();
    ASSERT_TRUE(watcher.finalize_sync(id).is_ok());

    remote_.erase(id);
    ASSERT_TRUE(watcher.refresh_remote_state().is_ok());

    const auto snap = watcher.snapshot("Flow.json");
    EXPECT_FALSE(snap.remote_hash.has_value());
    EXPECT_EQ(snap.status, SyncStatus::DELETED_REMOTELY);
    EXPECT_EQ(statuses_["Flow.json"], SyncStatus::DELETED_REMOTELY);
}

TEST_F(WatcherTest, MalformedFileKeepsPreviousHash) {
    write_json(dir_ / "Flow.json", Document{{"name", "Flow"}});
    write_file(dir_ / "Broken.json", "{ not json");
    auto& watcher = start_watcher();

    const auto before = watcher.snapshot("Flow.json").local_hash;
    ASSERT_TRUE(before.has_value());
    EXPECT_FALSE(watcher.snapshot("Broken.json").local_hash.has_value());

    write_file(dir_ / "Flow.json", "{\"name\": ");
    watcher.on_local_change("Flow.json");

    EXPECT_EQ(watcher.snapshot("Flow.json").local_hash, before);
}

TEST_F(WatcherTest, IgnoresHiddenAndNonJsonFiles) {
    write_json(dir_ / ".hidden.json", Document{{"name", "Hidden"}});
    write_file(dir_ / "notes.txt", "hello");
    auto& watcher = start_watcher();

    EXPECT_TRUE(watcher.status_matrix().empty());
}

TEST_F(WatcherTest, LocalEditIsModifiedLocally) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    write_local_copy(id, "Flow.json");
    auto& watcher = start_watcher();
    ASSERT_TRUE(watcher.finalize_sync(id).is_ok());
    EXPECT_EQ(watcher.calculate_status("Flow.json"), SyncStatus::IN_SYNC);

    auto doc = read_json(dir_ / "Flow.json");
    doc["nodes"] = Document::array({Document{{"name", "Edited"}}});
    write_json(dir_ / "Flow.json", doc);
    watcher.on_local_change("Flow.json");

    EXPECT_EQ(watcher.calculate_status("Flow.json"), SyncStatus::MODIFIED_LOCALLY);
    EXPECT_EQ(statuses_["Flow.json"], SyncStatus::MODIFIED_LOCALLY);
}

TEST_F(WatcherTest, FormattingOnlyEditStaysInSync) {
    const auto id = remote_.add(Document{{"name", "Flow"}, {"settings", Document{{"timezone", "UTC"}}}});
    write_local_copy(id, "Flow.json");
    auto& watcher = start_watcher();
    ASSERT_TRUE(watcher.finalize_sync(id).is_ok());

    auto doc = read_json(dir_ / "Flow.json");
    doc["settings"]["executionOrder"] = "v1";
    write_file(dir_ / "Flow.json", doc.dump(8));
    watcher.on_local_change("Flow.json");

    EXPECT_EQ(watcher.calculate_status("Flow.json"), SyncStatus::IN_SYNC);
}

TEST_F(WatcherTest, LocalDeletionSnapshotsRemoteOnce) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    write_local_copy(id, "Flow.json");
    auto& watcher = start_watcher();
    ASSERT_TRUE(watcher.finalize_sync(id).is_ok());

    std::vector<std::string> reasons;
    auto sub = bus_.scoped_subscribe<WorkflowArchivedEvent>(
        [&](const WorkflowArchivedEvent& e) { reasons.push_back(e.reason); });

    fs::remove(dir_ / "Flow.json");
    watcher.on_local_delete("Flow.json");

    EXPECT_EQ(watcher.calculate_status("Flow.json"), SyncStatus::DELETED_LOCALLY);
    ArchiveStore archive(dir_);
    ASSERT_EQ(archive.entries_for("Flow.json").size(), 1u);
    EXPECT_EQ(reasons, std::vector<std::string>{"local-deletion"});

    // Polls re-broadcast the same status without a second snapshot
    ASSERT_TRUE(watcher.refresh_remote_state().is_ok());
    EXPECT_EQ(archive.entries_for("Flow.json").size(), 1u);
    EXPECT_EQ(remote_.size(), 1u);
}

TEST_F(WatcherTest, GuardedIdIgnoresLocalEventsUntilRelease) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    write_local_copy(id, "Flow.json");
    auto& watcher = start_watcher();
    ASSERT_TRUE(watcher.finalize_sync(id).is_ok());

    ASSERT_TRUE(watcher.try_acquire(id));
    EXPECT_FALSE(watcher.try_acquire(id));
    EXPECT_TRUE(watcher.is_guarded(id));

    auto doc = read_json(dir_ / "Flow.json");
    doc["nodes"] = Document::array({Document{{"name", "Edited"}}});
    write_json(dir_ / "Flow.json", doc);
    watcher.on_local_change("Flow.json");
    EXPECT_EQ(watcher.calculate_status("Flow.json"), SyncStatus::IN_SYNC);

    watcher.release(id);
    EXPECT_FALSE(watcher.is_guarded(id));
    EXPECT_EQ(watcher.calculate_status("Flow.json"), SyncStatus::MODIFIED_LOCALLY);
}

TEST_F(WatcherTest, GuardedIdIsNotPruned) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    auto& watcher = start_watcher();

    ASSERT_TRUE(watcher.try_acquire(id));
    remote_.erase(id);
    ASSERT_TRUE(watcher.refresh_remote_state().is_ok());
    EXPECT_TRUE(watcher.snapshot("Flow.json").remote_hash.has_value());

    watcher.release(id);
    ASSERT_TRUE(watcher.refresh_remote_state().is_ok());
    EXPECT_FALSE(watcher.snapshot("Flow.json").remote_hash.has_value());
}

TEST_F(WatcherTest, FinalizeFindsUnmappedFileById) {
    write_json(dir_ / "Renamed.json", Document{{"id", "wf-x"}, {"name", "Something"}});
    auto& watcher = start_watcher();

    ASSERT_TRUE(watcher.finalize_sync("wf-x").is_ok());

    EXPECT_EQ(watcher.filename_for_id("wf-x"), std::optional<std::string>("Renamed.json"));
    EXPECT_EQ(watcher.last_synced_hash("wf-x"), watcher.snapshot("Renamed.json").local_hash);
    EXPECT_TRUE(watcher.finalize_sync("wf-unknown").is_error());
}

TEST_F(WatcherTest, BaseSurvivesRestart) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    write_local_copy(id, "Flow.json");
    {
        auto& watcher = start_watcher();
        ASSERT_TRUE(watcher.finalize_sync(id).is_ok());
        watcher.stop();
    }

    auto& restarted = start_watcher();
    EXPECT_TRUE(restarted.last_synced_hash(id).has_value());
    EXPECT_EQ(restarted.tracked_workflow_ids(), std::vector<std::string>{id});
    EXPECT_EQ(restarted.calculate_status("Flow.json"), SyncStatus::IN_SYNC);
}

TEST_F(WatcherTest, MigrateMovesIdentity) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    write_local_copy(id, "Flow.json");
    auto& watcher = start_watcher();
    ASSERT_TRUE(watcher.finalize_sync(id).is_ok());
    const auto base = watcher.last_synced_hash(id);

    ASSERT_TRUE(watcher.migrate_workflow_id(id, "wf-new").is_ok());

    EXPECT_FALSE(watcher.last_synced_hash(id).has_value());
    EXPECT_EQ(watcher.last_synced_hash("wf-new"), base);
    EXPECT_EQ(watcher.filename_for_id("wf-new"), std::optional<std::string>("Flow.json"));
    EXPECT_EQ(watcher.id_for_filename("Flow.json"), std::optional<std::string>("wf-new"));
}

TEST_F(WatcherTest, RemoveStateForgetsWorkflow) {
    const auto id = remote_.add(Document{{"name", "Flow"}});
    write_local_copy(id, "Flow.json");
    auto& watcher = start_watcher();
    ASSERT_TRUE(watcher.finalize_sync(id).is_ok());

    fs::remove(dir_ / "Flow.json");
    ASSERT_TRUE(watcher.remove_workflow_state(id).is_ok());

    EXPECT_FALSE(watcher.last_synced_hash(id).has_value());
    EXPECT_TRUE(watcher.tracked_workflow_ids().empty());
    EXPECT_FALSE(watcher.filename_for_id(id).has_value());
    EXPECT_FALSE(watcher.snapshot("Flow.json").local_hash.has_value());
}
