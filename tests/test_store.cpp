/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

#include "clipforge/store.hpp"

namespace clipforge {
namespace {

TEST(StoreTest, ScenesAreAppendedInOrder) {
    Store store;
    Project project = store.createProject("demo");
    auto a = store.addScene(project.id, "first", std::string("code a"));
    auto b = store.addScene(project.id, "second", std::nullopt, SceneStatus::Generating);
    ASSERT_TRUE(a && b);

    EXPECT_EQ(a->orderIndex, 0);
    EXPECT_EQ(b->orderIndex, 1);
    EXPECT_EQ(b->status, SceneStatus::Generating);
    EXPECT_FALSE(b->hasCode());

    auto scenes = store.scenesOf(project.id);
    ASSERT_EQ(scenes.size(), 2u);
    EXPECT_EQ(scenes[0].id, a->id);
    EXPECT_EQ(scenes[1].id, b->id);
    EXPECT_EQ(store.project(project.id)->sceneIds.size(), 2u);
}

TEST(StoreTest, AddSceneToUnknownProjectFails) {
    Store store;
    EXPECT_FALSE(store.addScene("proj_missing", "prompt", std::string("code")));
}

TEST(StoreTest, OrderIndexStaysUniqueAfterRemoval) {
    Store store;
    Project project = store.createProject("demo");
    auto a = store.addScene(project.id, "a", std::string("x"));
    auto b = store.addScene(project.id, "b", std::string("x"));
    ASSERT_TRUE(store.removeScene(a->id));
    auto c = store.addScene(project.id, "c", std::string("x"));
    EXPECT_EQ(c->orderIndex, b->orderIndex + 1);
}

TEST(StoreTest, MoveSceneSwapsWithCurrentHolder) {
    Store store;
    Project project = store.createProject("demo");
    auto a = store.addScene(project.id, "a", std::string("x"));
    auto b = store.addScene(project.id, "b", std::string("x"));
    auto c = store.addScene(project.id, "c", std::string("x"));

    ASSERT_TRUE(store.moveScene(c->id, 0));
    auto scenes = store.scenesOf(project.id);
    ASSERT_EQ(scenes.size(), 3u);
    EXPECT_EQ(scenes[0].id, c->id);
    EXPECT_EQ(scenes[1].id, b->id);
    EXPECT_EQ(scenes[2].id, a->id);
    EXPECT_EQ(scenes[2].orderIndex, 2);
}

TEST(StoreTest, CompletedSceneRequiresVideoLocator) {
    Store store;
    Project project = store.createProject("demo");
    auto scene = store.addScene(project.id, "a", std::string("x"));

    EXPECT_FALSE(store.updateScene(scene->id, [](Scene& s) { s.status = SceneStatus::Completed; }));
    EXPECT_EQ(store.scene(scene->id)->status, SceneStatus::Pending);

    EXPECT_TRUE(store.updateScene(scene->id, [](Scene& s) {
        s.status = SceneStatus::Completed;
        s.videoLocator = "/outputs/a.mp4";
    }));
    EXPECT_TRUE(store.scene(scene->id)->hasArtifact());
}

TEST(StoreTest, SceneUpdateCannotChangeIdentity) {
    Store store;
    Project project = store.createProject("demo");
    auto scene = store.addScene(project.id, "a", std::string("x"));
    ASSERT_TRUE(store.updateScene(scene->id, [](Scene& s) {
        s.id = "other";
        s.projectId = "elsewhere";
        s.orderIndex = 42;
        s.prompt = "changed";
    }));
    auto current = store.scene(scene->id);
    ASSERT_TRUE(current);
    EXPECT_EQ(current->projectId, project.id);
    EXPECT_EQ(current->orderIndex, 0);
    EXPECT_EQ(current->prompt, "changed");
    EXPECT_FALSE(store.scene("other"));
}

TEST(StoreTest, RemoveProjectDropsItsScenes) {
    Store store;
    Project project = store.createProject("demo");
    auto scene = store.addScene(project.id, "a", std::string("x"));
    ASSERT_TRUE(store.removeProject(project.id));
    EXPECT_FALSE(store.project(project.id));
    EXPECT_FALSE(store.scene(scene->id));
    EXPECT_TRUE(store.scenesOf(project.id).empty());
}

TEST(StoreTest, DanglingSceneReferencesAreSkipped) {
    Store store;
    Project project = store.createProject("demo");
    auto a = store.addScene(project.id, "a", std::string("x"));
    auto b = store.addScene(project.id, "b", std::string("x"));
    ASSERT_TRUE(store.removeScene(a->id));
    auto scenes = store.scenesOf(project.id);
    ASSERT_EQ(scenes.size(), 1u);
    EXPECT_EQ(scenes[0].id, b->id);
}

TEST(StoreTest, NewJobIsPending) {
    Store store;
    Job job = store.createJob(JobKind::ExportCombine, std::nullopt, std::string("proj_x"));
    EXPECT_EQ(job.status, JobStatus::Pending);
    EXPECT_EQ(job.progress, 0);
    EXPECT_EQ(job.phaseLabel, "pending");
    EXPECT_EQ(job.targetProjectId.value_or(""), "proj_x");
    EXPECT_FALSE(job.targetSceneId);
    EXPECT_EQ(job.id.rfind("job_", 0), 0u);
}

TEST(StoreTest, JobProgressNeverDecreases) {
    Store store;
    Job job = store.createJob(JobKind::RenderAllAndCombine, std::nullopt, std::string("p"));
    ASSERT_TRUE(store.updateJob(job.id, [](Job& j) { j.progress = 40; }));
    ASSERT_TRUE(store.updateJob(job.id, [](Job& j) { j.progress = 10; }));
    EXPECT_EQ(store.job(job.id)->progress, 40);
    ASSERT_TRUE(store.updateJob(job.id, [](Job& j) { j.progress = 250; }));
    EXPECT_EQ(store.job(job.id)->progress, 100);
}

TEST(StoreTest, TerminalJobIsFrozen) {
    Store store;
    Job job = store.createJob(JobKind::SceneRender, std::string("s"), std::nullopt);
    ASSERT_TRUE(store.updateJob(job.id, [](Job& j) {
        j.status = JobStatus::Failed;
        j.error = "boom";
    }));
    EXPECT_FALSE(store.updateJob(job.id, [](Job& j) {
        j.status = JobStatus::Completed;
        j.error.reset();
    }));
    auto frozen = store.job(job.id);
    EXPECT_EQ(frozen->status, JobStatus::Failed);
    EXPECT_EQ(frozen->error.value_or(""), "boom");
}

TEST(StoreTest, IdsAreUniqueUnderConcurrency) {
    Store store;
    Project project = store.createProject("demo");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, &project] {
            for (int i = 0; i < 50; ++i) {
                (void)store.addScene(project.id, "p", std::string("x"));
                (void)store.createJob(JobKind::SceneRender, std::nullopt, std::nullopt);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    auto scenes = store.scenesOf(project.id);
    EXPECT_EQ(scenes.size(), 200u);
    EXPECT_EQ(store.jobs().size(), 200u);
    for (std::size_t i = 0; i < scenes.size(); ++i) {
        EXPECT_EQ(scenes[i].orderIndex, static_cast<int>(i));
    }
}

}
}
