#include "wfsync/sync/status.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using wfsync::sync::compute_status;
using wfsync::workflow::SyncStatus;
using wfsync::workflow::SyncStatusUtils;

namespace {

using Hash = std::optional<std::string>;

const Hash kNone = std::nullopt;
const Hash h0 = std::string("h0");
const Hash h1 = std::string("h1");
const Hash h2 = std::string("h2");

} // namespace

TEST(ComputeStatusTest, SingleSidedWithoutBase) {
    EXPECT_EQ(compute_status(h0, kNone, kNone), SyncStatus::EXIST_ONLY_LOCALLY);
    EXPECT_EQ(compute_status(kNone, h0, kNone), SyncStatus::EXIST_ONLY_REMOTELY);
}

TEST(ComputeStatusTest, EqualHashesAreInSyncWhateverTheBase) {
    EXPECT_EQ(compute_status(h1, h1, kNone), SyncStatus::IN_SYNC);
    EXPECT_EQ(compute_status(h1, h1, h0), SyncStatus::IN_SYNC);
    EXPECT_EQ(compute_status(h1, h1, h1), SyncStatus::IN_SYNC);
}

TEST(ComputeStatusTest, OneSidedChanges) {
    EXPECT_EQ(compute_status(h1, h0, h0), SyncStatus::MODIFIED_LOCALLY);
    EXPECT_EQ(compute_status(h0, h1, h0), SyncStatus::MODIFIED_REMOTELY);
}

TEST(ComputeStatusTest, Deletions) {
    EXPECT_EQ(compute_status(kNone, h0, h0), SyncStatus::DELETED_LOCALLY);
    EXPECT_EQ(compute_status(h0, kNone, h0), SyncStatus::DELETED_REMOTELY);
}

TEST(ComputeStatusTest, DivergenceIsConflict) {
    EXPECT_EQ(compute_status(h1, h2, h0), SyncStatus::CONFLICT);
    // Never synced but both sides exist with different content
    EXPECT_EQ(compute_status(h1, h2, kNone), SyncStatus::CONFLICT);
    // Deleted on one side, modified on the other
    EXPECT_EQ(compute_status(kNone, h1, h0), SyncStatus::CONFLICT);
    EXPECT_EQ(compute_status(h1, kNone, h0), SyncStatus::CONFLICT);
    // Gone on both sides but still remembered
    EXPECT_EQ(compute_status(kNone, kNone, h0), SyncStatus::CONFLICT);
}

TEST(ComputeStatusTest, EveryCombinationYieldsExactlyTheDocumentedStatus) {
    const std::vector<Hash> values{kNone, h0, h1, h2};

    for (const auto& local : values) {
        for (const auto& remote : values) {
            for (const auto& base : values) {
                const auto status = compute_status(local, remote, base);
                const std::string context = "L=" + local.value_or("-") + " R=" + remote.value_or("-") +
                                            " B=" + base.value_or("-") + " -> " +
                                            SyncStatusUtils::to_string(status);

                if (local && remote && *local == *remote) {
                    EXPECT_EQ(status, SyncStatus::IN_SYNC) << context;
                }
                if (status == SyncStatus::IN_SYNC) {
                    EXPECT_TRUE(local && local == remote) << context;
                }
                if (status == SyncStatus::MODIFIED_LOCALLY) {
                    EXPECT_TRUE(base && local && local != base && remote == base) << context;
                }
                if (status == SyncStatus::MODIFIED_REMOTELY) {
                    EXPECT_TRUE(base && remote && remote != base && local == base) << context;
                }
                if (status == SyncStatus::DELETED_LOCALLY) {
                    EXPECT_TRUE(base && !local && remote == base) << context;
                }
                if (status == SyncStatus::DELETED_REMOTELY) {
                    EXPECT_TRUE(base && !remote && local == base) << context;
                }
                if (status == SyncStatus::EXIST_ONLY_LOCALLY) {
                    EXPECT_TRUE(local && !remote && !base) << context;
                }
                if (status == SyncStatus::EXIST_ONLY_REMOTELY) {
                    EXPECT_TRUE(remote && !local && !base) << context;
                }
            }
        }
    }
}

TEST(ComputeStatusTest, SwappingSidesMirrorsTheStatus) {
    EXPECT_EQ(compute_status(h1, h0, h0), SyncStatus::MODIFIED_LOCALLY);
    EXPECT_EQ(compute_status(h0, h1, h0), SyncStatus::MODIFIED_REMOTELY);
    EXPECT_EQ(compute_status(kNone, h0, h0), SyncStatus::DELETED_LOCALLY);
    EXPECT_EQ(compute_status(h0, kNone, h0), SyncStatus::DELETED_REMOTELY);
    EXPECT_EQ(compute_status(h1, h2, h0), compute_status(h2, h1, h0));
}
