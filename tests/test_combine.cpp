/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "clipforge/combine.hpp"
#include "support/fake_tools.hpp"

namespace clipforge {
namespace {

Scene renderedScene(const std::string& id, int index, const ArtifactStore& artifacts, bool writeFile = true) {
    Scene scene;
    scene.id = id;
    scene.orderIndex = index;
    scene.status = SceneStatus::Completed;
    scene.videoLocator = artifacts.outputLocator(id + ".mp4");
    if (writeFile) {
        test::writeFile(artifacts.outputPath(id + ".mp4"), id + "\n");
    }
    return scene;
}

std::size_t countCombineWorkspaces(const std::string& projectId) {
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(std::filesystem::temp_directory_path())) {
        if (entry.path().filename().string().rfind("clipforge_combine_" + projectId + "_", 0) == 0) {
            ++count;
        }
    }
    return count;
}

// Workspace directory named in a logged concat call ("... -i <ws>/files.txt ...").
std::filesystem::path manifestWorkspace(const std::string& concatCall) {
    const std::string flag = "-i ";
    auto begin = concatCall.find(flag);
    if (begin == std::string::npos) return {};
    begin += flag.size();
    auto end = concatCall.find(' ', begin);
    return std::filesystem::path(concatCall.substr(begin, end - begin)).parent_path();
}

class MediaCombinerTest : public ::testing::Test {
protected:
    MediaCombinerTest(const test::FakeToolOptions& options = {})
        : tools_(options), config_(tools_.config()), artifacts_(config_.outputDir, config_.uploadDir),
          combiner_(config_, artifacts_) {
        EXPECT_TRUE(artifacts_.ensureDirectories());
    }

    test::FakeTools tools_;
    Config config_;
    ArtifactStore artifacts_;
    MediaCombiner combiner_;
};

TEST_F(MediaCombinerTest, ConcatenatesInGivenOrder) {
    std::vector<Scene> scenes = {renderedScene("s_one", 0, artifacts_), renderedScene("s_two", 1, artifacts_),
                                 renderedScene("s_three", 2, artifacts_)};

    CombineResult result = combiner_.combine(scenes, "proj_order", std::nullopt);
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(result.videoLocator, "/outputs/proj_order_final.mp4");
    EXPECT_EQ(test::readFile(artifacts_.outputPath("proj_order_final.mp4")), "s_one\ns_two\ns_three\n");

    auto calls = tools_.calls("ffmpeg");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].rfind("-f concat -safe 0 -i ", 0), 0u) << calls[0];
    EXPECT_NE(calls[0].find("/files.txt -c copy -y "), std::string::npos);
}

TEST_F(MediaCombinerTest, WorkspaceRemovedAfterSuccess) {
    std::vector<Scene> scenes = {renderedScene("s_one", 0, artifacts_)};

    ASSERT_TRUE(combiner_.combine(scenes, "proj_ws_done", std::nullopt));

    auto calls = tools_.calls("ffmpeg");
    ASSERT_EQ(calls.size(), 1u);
    auto workspace = manifestWorkspace(calls[0]);
    EXPECT_NE(workspace.filename().string().find("clipforge_combine_proj_ws_done_"), std::string::npos)
        << calls[0];
    EXPECT_FALSE(std::filesystem::exists(workspace));
    EXPECT_EQ(countCombineWorkspaces("proj_ws_done"), 0u);
}

TEST_F(MediaCombinerTest, EmptyInputIsNoScenes) {
    CombineResult result = combiner_.combine({}, "proj_1", std::nullopt);
    EXPECT_EQ(result.error, CombineError::NoScenes);
    EXPECT_TRUE(tools_.calls("ffmpeg").empty());
}

TEST_F(MediaCombinerTest, NoExistingArtifactsIsNoArtifacts) {
    Scene missing = renderedScene("s_gone", 0, artifacts_, false);
    Scene unrendered;
    unrendered.id = "s_pending";
    unrendered.orderIndex = 1;

    CombineResult result = combiner_.combine({missing, unrendered}, "proj_none", std::nullopt);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, CombineError::NoArtifacts);
    EXPECT_TRUE(tools_.calls("ffmpeg").empty());
    EXPECT_FALSE(std::filesystem::exists(artifacts_.outputPath("proj_none_final.mp4")));
    EXPECT_EQ(countCombineWorkspaces("proj_none"), 0u);
}

TEST_F(MediaCombinerTest, MissingArtifactIsSkipped) {
    std::vector<Scene> scenes = {renderedScene("s_here", 0, artifacts_), renderedScene("s_gone", 1, artifacts_, false)};

    CombineResult result = combiner_.combine(scenes, "proj_2", std::nullopt);
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(test::readFile(artifacts_.outputPath("proj_2_final.mp4")), "s_here\n");
}

TEST_F(MediaCombinerTest, MuxesExistingAudio) {
    test::writeFile(config_.uploadDir / "voice.mp3", "mp3");
    std::vector<Scene> scenes = {renderedScene("s_one", 0, artifacts_)};

    CombineResult result = combiner_.combine(scenes, "proj_3", artifacts_.uploadLocator("voice.mp3"));
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(test::readFile(artifacts_.outputPath("proj_3_final.mp4")), "s_one\naudio\n");

    auto calls = tools_.calls("ffmpeg");
    ASSERT_EQ(calls.size(), 2u);
    const std::string mux = calls[1];
    EXPECT_NE(mux.find("-i " + (artifacts_.uploadDir() / "voice.mp3").string() + " -c:v copy -c:a aac -shortest -y " +
                       artifacts_.outputPath("proj_3_final.mp4").string()),
              std::string::npos)
        << mux;
}

TEST_F(MediaCombinerTest, MissingAudioFallsBackToVideoOnly) {
    std::vector<Scene> scenes = {renderedScene("s_one", 0, artifacts_)};

    CombineResult result = combiner_.combine(scenes, "proj_4", std::string("/uploads/absent.mp3"));
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(test::readFile(artifacts_.outputPath("proj_4_final.mp4")), "s_one\n");
    EXPECT_EQ(tools_.calls("ffmpeg").size(), 1u);
}

TEST(MediaCombinerManifestTest, EscapesSingleQuotes) {
    EXPECT_EQ(MediaCombiner::manifestEntry("/out/a.mp4"), "file '/out/a.mp4'");
    EXPECT_EQ(MediaCombiner::manifestEntry("/out/it's.mp4"), "file '/out/it'\\''s.mp4'");
}

class FailingConcatTest : public MediaCombinerTest {
protected:
    static test::FakeToolOptions options() {
        test::FakeToolOptions o;
        o.failConcat = true;
        return o;
    }
    FailingConcatTest() : MediaCombinerTest(options()) {}
};

TEST_F(FailingConcatTest, ConcatFailureCarriesOutput) {
    std::vector<Scene> scenes = {renderedScene("s_one", 0, artifacts_)};
    CombineResult result = combiner_.combine(scenes, "proj_5", std::nullopt);
    EXPECT_EQ(result.error, CombineError::ConcatFailed);
    EXPECT_NE(result.message.find("Invalid data found"), std::string::npos) << result.message;
    EXPECT_FALSE(std::filesystem::exists(artifacts_.outputPath("proj_5_final.mp4")));

    auto calls = tools_.calls("ffmpeg");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(manifestWorkspace(calls[0])));
    EXPECT_EQ(countCombineWorkspaces("proj_5"), 0u);
}

class FailingMuxTest : public MediaCombinerTest {
protected:
    static test::FakeToolOptions options() {
        test::FakeToolOptions o;
        o.failMux = true;
        return o;
    }
    FailingMuxTest() : MediaCombinerTest(options()) {}
};

TEST_F(FailingMuxTest, MuxFailureKeepsVideoOnly) {
    test::writeFile(config_.uploadDir / "voice.mp3", "mp3");
    std::vector<Scene> scenes = {renderedScene("s_one", 0, artifacts_)};

    CombineResult result = combiner_.combine(scenes, "proj_6", artifacts_.uploadLocator("voice.mp3"));
    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(test::readFile(artifacts_.outputPath("proj_6_final.mp4")), "s_one\n");
    EXPECT_EQ(countCombineWorkspaces("proj_6"), 0u);
}

}
}
