/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "clipforge/artifacts.hpp"
#include "clipforge/process.hpp"
#include "clipforge/workspace.hpp"
#include "support/fake_tools.hpp"

namespace clipforge {
namespace {

// -----------------------------------------------------------------------------
// runProcess
// -----------------------------------------------------------------------------
TEST(ProcessTest, CapturesCombinedOutput) {
    ProcessResult result = runProcess({"/bin/sh", "-c", "echo out; echo err >&2"});
    ASSERT_TRUE(result.succeeded()) << result.error;
    EXPECT_NE(result.output.find("out\n"), std::string::npos);
    EXPECT_NE(result.output.find("err\n"), std::string::npos);
}

TEST(ProcessTest, StdoutOnlyDropsStderr) {
    ProcessResult result = runProcess({"/bin/sh", "-c", "echo 2.5; echo noise >&2"}, OutputCapture::StdoutOnly);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "2.5\n");
}

TEST(ProcessTest, ReportsExitCode) {
    ProcessResult result = runProcess({"/bin/sh", "-c", "exit 3"}, OutputCapture::Discard);
    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exitCode, 3);
}

TEST(ProcessTest, ArgumentsAreNotShellInterpreted) {
    ProcessResult result = runProcess({"/bin/echo", "$HOME; rm -rf x"}, OutputCapture::StdoutOnly);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "$HOME; rm -rf x\n");
}

TEST(ProcessTest, MissingBinaryIsNotStarted) {
    ProcessResult result = runProcess({"/nonexistent/clipforge-tool", "--version"});
    EXPECT_FALSE(result.started);
    EXPECT_EQ(result.exitCode, 127);
    EXPECT_NE(result.error.find("cannot execute"), std::string::npos);
}

TEST(ProcessTest, EmptyCommandIsRejected) {
    ProcessResult result = runProcess({});
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.error.empty());
}

TEST(ProcessTest, FormatCommandQuotesSpaces) {
    EXPECT_EQ(formatCommand({"ffmpeg", "-i", "a b.mp4"}), "ffmpeg -i 'a b.mp4'");
}

// -----------------------------------------------------------------------------
// ScopedWorkspace
// -----------------------------------------------------------------------------
TEST(WorkspaceTest, RemovedOnScopeExit) {
    std::filesystem::path kept;
    {
        ScopedWorkspace workspace("clipforge_test_scene/../x_");
        ASSERT_TRUE(workspace.valid()) << workspace.error();
        kept = workspace.path();
        EXPECT_TRUE(std::filesystem::is_directory(kept));
        EXPECT_TRUE(std::filesystem::equivalent(kept.parent_path(), std::filesystem::temp_directory_path()));
        test::writeFile(kept / "media" / "deep" / "file.mp4", "data");
    }
    EXPECT_FALSE(std::filesystem::exists(kept));
}

TEST(WorkspaceTest, ConcurrentWorkspacesAreDistinct) {
    ScopedWorkspace a("clipforge_same_");
    ScopedWorkspace b("clipforge_same_");
    ASSERT_TRUE(a.valid() && b.valid());
    EXPECT_NE(a.path().string(), b.path().string());
}

// -----------------------------------------------------------------------------
// ArtifactStore
// -----------------------------------------------------------------------------
class ArtifactStoreTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = test::makeTempDir("clipforge_artifacts_"); }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
};

TEST_F(ArtifactStoreTest, LocatorsResolveByBasename) {
    ArtifactStore store(root_ / "outputs", root_ / "uploads");
    ASSERT_TRUE(store.ensureDirectories());
    test::writeFile(store.outputPath("s1.mp4"), "video");

    EXPECT_EQ(store.outputLocator("s1.mp4"), "/outputs/s1.mp4");
    auto resolved = store.resolveOutput("/outputs/s1.mp4");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved->string(), (store.outputDir() / "s1.mp4").string());

    // Directory components are ignored, so nothing outside the store is reachable
    auto escaped = store.resolveOutput("/outputs/../../etc/s1.mp4");
    ASSERT_TRUE(escaped);
    EXPECT_EQ(escaped->string(), resolved->string());
    EXPECT_FALSE(store.resolveOutput("/outputs/missing.mp4"));
    EXPECT_FALSE(store.resolveOutput("/outputs/"));
    EXPECT_FALSE(store.resolveUpload("/uploads/s1.mp4"));
}

TEST_F(ArtifactStoreTest, ImportUploadCopiesIntoUploadStore) {
    ArtifactStore store(root_ / "outputs", root_ / "uploads");
    test::writeFile(root_ / "voice.wav", "pcm");

    auto locator = store.importUpload(root_ / "voice.wav");
    ASSERT_TRUE(locator);
    EXPECT_EQ(locator->rfind("/uploads/audio_", 0), 0u);
    EXPECT_EQ(std::filesystem::path(*locator).extension().string(), ".wav");

    auto resolved = store.resolveUpload(*locator);
    ASSERT_TRUE(resolved);
    EXPECT_EQ(test::readFile(*resolved), "pcm");

    EXPECT_FALSE(store.importUpload(root_ / "absent.mp3"));
}

}
}
