#include <gtest/gtest.h>
#include <managers/project_registry.hpp>
#include <core/uuid.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <thread>
#include <chrono>
#include <vector>

namespace fs = std::filesystem;

class ProjectRegistryTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path config_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("pm_registry_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        test_dir = fs::canonical(test_dir);
        config_path = test_dir / "config" / "config.yml";
        ASSERT_TRUE(ConfigStore(config_path).create_default("octocat", test_dir.string()).is_ok());
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path make_project(const std::string& rel) {
        fs::path dir = test_dir / rel;
        fs::create_directories(dir);
        return dir;
    }

    ProjectRegistry registry() {
        return ProjectRegistry(ConfigStore(config_path));
    }
};

TEST_F(ProjectRegistryTest, AddThenList) {
    auto reg = registry();
    auto added = reg.add(make_project("alpha").string(), {"cpp", "cli", "cpp"});
    ASSERT_TRUE(added.is_ok()) << added.error;

    EXPECT_TRUE(is_valid_uuid(added.value.id));
    EXPECT_EQ(added.value.name, "alpha");
    EXPECT_EQ(added.value.path, (test_dir / "alpha").string());
    EXPECT_EQ(added.value.tags, (std::vector<std::string>{"cpp", "cli"}));
    EXPECT_EQ(added.value.created_at, added.value.updated_at);

    auto listed = reg.list();
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value.size(), 1u);
    EXPECT_EQ(listed.value[0].id, added.value.id);
}

TEST_F(ProjectRegistryTest, AddNormalizesPath) {
    make_project("alpha/sub");
    auto reg = registry();
    auto added = reg.add((test_dir / "alpha" / "sub" / "..").string() + "/");
    ASSERT_TRUE(added.is_ok()) << added.error;
    EXPECT_EQ(added.value.path, (test_dir / "alpha").string());
    EXPECT_EQ(added.value.name, "alpha");
}

TEST_F(ProjectRegistryTest, AddExplicitName) {
    auto reg = registry();
    auto added = reg.add(make_project("alpha").string(), {}, "My Alpha");
    ASSERT_TRUE(added.is_ok());
    EXPECT_EQ(added.value.name, "My Alpha");
}

TEST_F(ProjectRegistryTest, DuplicatePathRejected) {
    auto reg = registry();
    std::string path = make_project("alpha").string();
    ASSERT_TRUE(reg.add(path).is_ok());

    auto again = reg.add(path, {}, "other-name");
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::AlreadyExists);
    EXPECT_EQ(reg.list().value.size(), 1u);
}

TEST_F(ProjectRegistryTest, InvalidPaths) {
    auto reg = registry();
    EXPECT_EQ(reg.add("").kind, ErrorKind::InvalidPath);
    EXPECT_EQ(reg.add((test_dir / "missing").string()).kind, ErrorKind::InvalidPath);
    EXPECT_EQ(reg.add(config_path.string()).kind, ErrorKind::InvalidPath);   // a file
}

TEST_F(ProjectRegistryTest, InvalidTagsRejected) {
    auto reg = registry();
    auto added = reg.add(make_project("alpha").string(), {"no spaces allowed"});
    ASSERT_TRUE(added.is_err());
    EXPECT_EQ(added.kind, ErrorKind::Validation);
    EXPECT_TRUE(reg.list().value.empty());
}

TEST_F(ProjectRegistryTest, RemoveMissingIsNotFound) {
    auto reg = registry();
    EXPECT_EQ(reg.remove("3f2b8c1e-9d4a-4b7e-8f21-0c6d5e4a3b2f").kind, ErrorKind::NotFound);
}

TEST_F(ProjectRegistryTest, TouchCountsAccesses) {
    auto reg = registry();
    auto added = reg.add(make_project("alpha").string());
    ASSERT_TRUE(added.is_ok());
    const std::string& id = added.value.id;

    ASSERT_TRUE(reg.touch(id, "laptop").is_ok());
    auto first = reg.access_info(id, "laptop");
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(first.value.last_accessed.has_value());
    EXPECT_GE(iso_millis(*first.value.last_accessed), iso_millis(added.value.created_at));

    for (int i = 0; i < 3; ++i) ASSERT_TRUE(reg.touch(id, "laptop").is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::string before_last = now_iso();
    ASSERT_TRUE(reg.touch(id, "laptop").is_ok());
    ASSERT_TRUE(reg.touch(id, "desktop").is_ok());

    auto laptop = reg.access_info(id, "laptop");
    ASSERT_TRUE(laptop.is_ok());
    EXPECT_EQ(laptop.value.count, 5);
    ASSERT_TRUE(laptop.value.last_accessed.has_value());
    EXPECT_GE(iso_millis(*laptop.value.last_accessed), iso_millis(before_last));
    EXPECT_GT(iso_millis(*laptop.value.last_accessed), iso_millis(*first.value.last_accessed));

    EXPECT_EQ(reg.access_info(id, "desktop").value.count, 1);
    EXPECT_EQ(reg.access_info(id, "server").value.count, 0);
    EXPECT_FALSE(reg.access_info(id, "server").value.last_accessed.has_value());

    // Access bookkeeping is not an edit
    EXPECT_EQ(reg.get(id).value.updated_at, added.value.updated_at);
}

TEST_F(ProjectRegistryTest, TouchUnknownProject) {
    auto reg = registry();
    EXPECT_EQ(reg.touch("3f2b8c1e-9d4a-4b7e-8f21-0c6d5e4a3b2f", "laptop").kind, ErrorKind::NotFound);
}

TEST_F(ProjectRegistryTest, RemoveLeavesOrphanedStats) {
    auto reg = registry();
    auto keep = reg.add(make_project("keep").string());
    auto gone = reg.add(make_project("gone").string());
    ASSERT_TRUE(keep.is_ok() && gone.is_ok());
    ASSERT_TRUE(reg.touch(keep.value.id, "laptop").is_ok());
    ASSERT_TRUE(reg.touch(gone.value.id, "laptop").is_ok());
    ASSERT_TRUE(reg.touch(gone.value.id, "desktop").is_ok());

    ASSERT_TRUE(reg.remove(gone.value.id).is_ok());
    EXPECT_EQ(reg.get(gone.value.id).kind, ErrorKind::NotFound);

    auto orphans = reg.orphaned_stats();
    ASSERT_TRUE(orphans.is_ok());
    EXPECT_EQ(orphans.value.size(), 2u);

    auto pruned = reg.prune_orphaned_stats();
    ASSERT_TRUE(pruned.is_ok());
    EXPECT_EQ(pruned.value, 2u);
    EXPECT_TRUE(reg.orphaned_stats().value.empty());
    EXPECT_EQ(reg.access_info(keep.value.id, "laptop").value.count, 1);

    auto config = ConfigStore(config_path).load();
    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value.machine_metadata.count("desktop"), 0u);
}

TEST_F(ProjectRegistryTest, TagUpdatesBumpUpdatedAt) {
    auto reg = registry();
    auto added = reg.add(make_project("alpha").string(), {"a"});
    ASSERT_TRUE(added.is_ok());

    auto more = reg.add_tags(added.value.id, {"b", "a"});
    ASSERT_TRUE(more.is_ok());
    EXPECT_EQ(more.value.tags, (std::vector<std::string>{"a", "b"}));
    EXPECT_GE(more.value.updated_at, added.value.updated_at);

    auto fewer = reg.remove_tags(added.value.id, {"a"});
    ASSERT_TRUE(fewer.is_ok());
    EXPECT_EQ(fewer.value.tags, (std::vector<std::string>{"b"}));

    auto replaced = reg.update_tags(added.value.id, {"x", "y"});
    ASSERT_TRUE(replaced.is_ok());
    EXPECT_EQ(replaced.value.tags, (std::vector<std::string>{"x", "y"}));

    EXPECT_EQ(reg.update_tags(added.value.id, {"bad,tag"}).kind, ErrorKind::Validation);
    EXPECT_EQ(reg.get(added.value.id).value.tags, (std::vector<std::string>{"x", "y"}));
}

TEST_F(ProjectRegistryTest, ListFiltersByTag) {
    auto reg = registry();
    ASSERT_TRUE(reg.add(make_project("a").string(), {"work"}).is_ok());
    ASSERT_TRUE(reg.add(make_project("b").string(), {"home"}).is_ok());
    ASSERT_TRUE(reg.add(make_project("c").string(), {"work", "cpp"}).is_ok());

    ProjectFilter filter;
    filter.tag = "work";
    filter.order = ProjectOrder::Name;
    auto listed = reg.list(filter);
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value.size(), 2u);
    EXPECT_EQ(listed.value[0].name, "a");
    EXPECT_EQ(listed.value[1].name, "c");
}

TEST_F(ProjectRegistryTest, ListOrders) {
    auto reg = registry();
    auto a = reg.add(make_project("a").string());
    auto b = reg.add(make_project("b").string());
    auto c = reg.add(make_project("c").string());
    ASSERT_TRUE(a.is_ok() && b.is_ok() && c.is_ok());

    for (int i = 0; i < 3; ++i) ASSERT_TRUE(reg.touch(b.value.id, "laptop").is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(reg.touch(c.value.id, "laptop").is_ok());

    ProjectFilter filter;
    filter.machine_id = "laptop";
    filter.order = ProjectOrder::AccessCount;
    auto by_count = reg.list(filter).value;
    ASSERT_EQ(by_count.size(), 3u);
    EXPECT_EQ(by_count[0].name, "b");
    EXPECT_EQ(by_count[1].name, "c");
    EXPECT_EQ(by_count[2].name, "a");

    filter.order = ProjectOrder::LastAccessed;
    auto by_access = reg.list(filter).value;
    EXPECT_EQ(by_access[0].name, "c");
    EXPECT_EQ(by_access[2].name, "a");

    filter.limit = 2;
    EXPECT_EQ(reg.list(filter).value.size(), 2u);
}

TEST_F(ProjectRegistryTest, OrdersByTimeNotTimestampText) {
    auto reg = registry();
    auto a = reg.add(make_project("a").string());
    auto b = reg.add(make_project("b").string());
    ASSERT_TRUE(a.is_ok() && b.is_ok());

    // "...00.500Z" sorts before "...00Z" as text but is the later instant
    ConfigStore store(config_path);
    auto doc = store.load();
    ASSERT_TRUE(doc.is_ok()) << doc.error;
    for (auto* p : {&doc.value.projects[a.value.id], &doc.value.projects[b.value.id]}) {
        p->created_at = "2024-05-01T09:00:00Z";
    }
    doc.value.projects[a.value.id].updated_at = "2024-05-01T10:00:00.500Z";
    doc.value.projects[b.value.id].updated_at = "2024-05-01T10:00:00Z";
    MachineStats& stats = doc.value.machine_metadata["laptop"];
    stats.last_accessed[a.value.id] = "2024-05-01T11:00:00.250Z";
    stats.access_counts[a.value.id] = 1;
    stats.last_accessed[b.value.id] = "2024-05-01T11:00:00Z";
    stats.access_counts[b.value.id] = 1;
    auto saved = store.save(doc.value);
    ASSERT_TRUE(saved.is_ok()) << saved.error;

    ProjectFilter filter;
    filter.machine_id = "laptop";
    auto by_update = reg.list(filter).value;
    ASSERT_EQ(by_update.size(), 2u);
    EXPECT_EQ(by_update[0].name, "a");

    filter.order = ProjectOrder::LastAccessed;
    auto by_access = reg.list(filter).value;
    ASSERT_EQ(by_access.size(), 2u);
    EXPECT_EQ(by_access[0].name, "a");

    // Equal counts fall back to the most recent access
    auto matches = reg.find_by_path_prefix(test_dir.string(), "laptop").value;
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].name, "a");
}

TEST_F(ProjectRegistryTest, AccessInfoFromLoadedDocument) {
    auto reg = registry();
    auto added = reg.add(make_project("alpha").string());
    ASSERT_TRUE(added.is_ok());
    ASSERT_TRUE(reg.touch(added.value.id, "laptop").is_ok());
    ASSERT_TRUE(reg.touch(added.value.id, "laptop").is_ok());

    auto doc = ConfigStore(config_path).load();
    ASSERT_TRUE(doc.is_ok());
    AccessInfo info = access_info_in(doc.value, added.value.id, "laptop");
    EXPECT_EQ(info.count, 2);
    EXPECT_EQ(info.last_accessed, reg.access_info(added.value.id, "laptop").value.last_accessed);

    AccessInfo none = access_info_in(doc.value, added.value.id, "server");
    EXPECT_EQ(none.count, 0);
    EXPECT_FALSE(none.last_accessed.has_value());
}

TEST_F(ProjectRegistryTest, ResolveByIdNameAndPrefix) {
    auto reg = registry();
    auto added = reg.add(make_project("alpha").string());
    ASSERT_TRUE(added.is_ok());

    EXPECT_EQ(reg.resolve(added.value.id).value.id, added.value.id);
    EXPECT_EQ(reg.resolve("alpha").value.id, added.value.id);
    EXPECT_EQ(reg.resolve(added.value.id.substr(0, 8)).value.id, added.value.id);
    EXPECT_EQ(reg.resolve("nothing").kind, ErrorKind::NotFound);
    EXPECT_EQ(reg.find_by_name("alpha").value.id, added.value.id);
}

TEST_F(ProjectRegistryTest, ResolveAmbiguousName) {
    auto reg = registry();
    ASSERT_TRUE(reg.add(make_project("one/app").string()).is_ok());
    ASSERT_TRUE(reg.add(make_project("two/app").string()).is_ok());

    auto resolved = reg.resolve("app");
    ASSERT_TRUE(resolved.is_err());
    EXPECT_EQ(resolved.kind, ErrorKind::Validation);
}

TEST_F(ProjectRegistryTest, FindContainingPicksDeepest) {
    auto reg = registry();
    auto outer = reg.add(make_project("mono").string());
    auto inner = reg.add(make_project("mono/packages/core").string());
    ASSERT_TRUE(outer.is_ok() && inner.is_ok());
    make_project("mono/packages/core/src");
    make_project("mono-other");

    auto deep = reg.find_containing((test_dir / "mono/packages/core/src").string());
    ASSERT_TRUE(deep.is_ok());
    ASSERT_TRUE(deep.value.has_value());
    EXPECT_EQ(deep.value->id, inner.value.id);

    auto shallow = reg.find_containing((test_dir / "mono/packages").string());
    ASSERT_TRUE(shallow.value.has_value());
    EXPECT_EQ(shallow.value->id, outer.value.id);

    // Component-wise: "mono-other" is not inside "mono"
    auto sibling = reg.find_containing((test_dir / "mono-other").string());
    ASSERT_TRUE(sibling.is_ok());
    EXPECT_FALSE(sibling.value.has_value());
}

TEST_F(ProjectRegistryTest, FindByPathPrefixPrefersMostUsed) {
    auto reg = registry();
    auto web = reg.add(make_project("web").string());
    auto webapp = reg.add(make_project("webapp").string());
    ASSERT_TRUE(web.is_ok() && webapp.is_ok());
    ASSERT_TRUE(reg.add(make_project("api").string()).is_ok());

    ASSERT_TRUE(reg.touch(webapp.value.id, "laptop").is_ok());
    ASSERT_TRUE(reg.touch(webapp.value.id, "laptop").is_ok());

    auto by_name = reg.find_by_path_prefix("web", "laptop");
    ASSERT_TRUE(by_name.is_ok());
    ASSERT_EQ(by_name.value.size(), 2u);
    EXPECT_EQ(by_name.value[0].id, webapp.value.id);

    auto by_path = reg.find_by_path_prefix((test_dir / "we").string(), "laptop");
    ASSERT_TRUE(by_path.is_ok());
    EXPECT_EQ(by_path.value.size(), 2u);
}

TEST_F(ProjectRegistryTest, ConcurrentTouchesAreNotLost) {
    auto added = registry().add(make_project("alpha").string());
    ASSERT_TRUE(added.is_ok());

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            auto reg = registry();
            for (int i = 0; i < 5; ++i) EXPECT_TRUE(reg.touch(added.value.id, "laptop").is_ok());
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(registry().access_info(added.value.id, "laptop").value.count, 20);
}

TEST_F(ProjectRegistryTest, DedupeTagsKeepsFirst) {
    EXPECT_EQ(dedupe_tags({"b", "a", "b", "c", "a"}), (std::vector<std::string>{"b", "a", "c"}));
}
