#include "wfsync/workflow/workflow_file.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using wfsync::ErrorCode;
using wfsync::workflow::Document;
using wfsync::workflow::is_hidden_name;
using wfsync::workflow::is_workflow_filename;
using wfsync::workflow::read_document;
using wfsync::workflow::write_document;
using namespace wfsync::test_support;

class WorkflowFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
};

TEST_F(WorkflowFileTest, WriteThenReadBack) {
    auto doc = Document::parse(R"({"name":"Flow","nodes":[],"id":"1"})");

    auto written = write_document(root_ / "Flow.json", doc);
    ASSERT_TRUE(written.is_ok()) << written.error().message;

    auto read = read_document(root_ / "Flow.json");
    ASSERT_TRUE(read.is_ok());
    EXPECT_EQ(read.value(), doc);
}

TEST_F(WorkflowFileTest, WriteLeavesNoTemporaryFiles) {
    ASSERT_TRUE(write_document(root_ / "Flow.json", Document::object()).is_ok());
    ASSERT_TRUE(write_document(root_ / "Flow.json", Document::parse(R"({"v":2})")).is_ok());

    int entries = 0;
    for (const auto& entry : fs::directory_iterator(root_)) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1);
    EXPECT_EQ(read_json(root_ / "Flow.json")["v"], 2);
}

TEST_F(WorkflowFileTest, WriteCreatesParentDirectories) {
    auto path = root_ / "nested" / "deeper" / "Flow.json";

    ASSERT_TRUE(write_document(path, Document::object()).is_ok());
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(WorkflowFileTest, MissingFileIsNotFound) {
    auto read = read_document(root_ / "missing.json");

    ASSERT_TRUE(read.is_error());
    EXPECT_EQ(read.error().code, ErrorCode::NotFound);
}

TEST_F(WorkflowFileTest, MalformedJsonIsInvalidData) {
    write_file(root_ / "broken.json", "{ not json");

    auto read = read_document(root_ / "broken.json");

    ASSERT_TRUE(read.is_error());
    EXPECT_EQ(read.error().code, ErrorCode::InvalidData);
}

TEST(WorkflowFilenameTest, Classification) {
    EXPECT_TRUE(is_workflow_filename("Flow.json"));
    EXPECT_TRUE(is_workflow_filename("a b c.json"));
    EXPECT_FALSE(is_workflow_filename(".json"));
    EXPECT_FALSE(is_workflow_filename(".n8n-state.json"));
    EXPECT_FALSE(is_workflow_filename("notes.txt"));
    EXPECT_FALSE(is_workflow_filename("Flow.json.tmp"));

    EXPECT_TRUE(is_hidden_name(".archive"));
    EXPECT_FALSE(is_hidden_name("Flow.json"));
    EXPECT_FALSE(is_hidden_name(""));
}
