#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <thread>

namespace fs = std::filesystem;

class ConfigStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path config_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("pm_config_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        config_path = test_dir / "config.yml";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_config(const std::string& content) {
        std::ofstream(config_path) << content;
    }

    std::string read_config() {
        std::ifstream in(config_path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static ConfigDocument sample_config() {
        ConfigDocument config = make_default_config("octocat", "/srv/work");
        ProjectEntry p;
        p.id = "3f2b8c1e-9d4a-4b7e-8f21-0c6d5e4a3b2f";
        p.name = "demo";
        p.path = "/srv/work/demo";
        p.tags = {"cpp", "cli"};
        p.language = "C++";
        p.git_current_branch = "main";
        p.created_at = "2025-01-15T10:00:00.000Z";
        p.updated_at = "2025-01-16T10:00:00.000Z";
        config.projects[p.id] = p;
        config.machine_metadata["laptop"].last_accessed[p.id] = "2025-01-17T08:00:00.000Z";
        config.machine_metadata["laptop"].access_counts[p.id] = 12;
        return config;
    }
};

TEST_F(ConfigStoreTest, LoadMissingIsNotFound) {
    ConfigStore store(config_path);
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::NotFound);
    EXPECT_FALSE(fs::exists(config_path));
}

TEST_F(ConfigStoreTest, CreateDefault) {
    ConfigStore store(config_path);
    auto created = store.create_default("octocat", "/srv/work");
    ASSERT_TRUE(created.is_ok()) << created.error;

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.version, CONFIG_VERSION);
    EXPECT_EQ(loaded.value.github_username, "octocat");
    EXPECT_EQ(loaded.value.projects_root_dir, "/srv/work");
    EXPECT_EQ(loaded.value.editor, default_editor());
    EXPECT_TRUE(loaded.value.settings.auto_open_editor);
    EXPECT_TRUE(loaded.value.settings.show_git_status);
    EXPECT_EQ(loaded.value.settings.recent_projects_limit, DEFAULT_RECENT_PROJECTS);
    EXPECT_TRUE(loaded.value.projects.empty());
    EXPECT_TRUE(loaded.value.machine_metadata.empty());
}

TEST_F(ConfigStoreTest, CreateDefaultNeverOverwrites) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.create_default("octocat").is_ok());
    std::string before = read_config();

    auto again = store.create_default("someone-else");
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::AlreadyExists);
    EXPECT_EQ(read_config(), before);
}

TEST_F(ConfigStoreTest, CreateDefaultRejectsBadUsername) {
    ConfigStore store(config_path);
    auto created = store.create_default("bad--name");
    ASSERT_TRUE(created.is_err());
    EXPECT_EQ(created.kind, ErrorKind::Validation);
    EXPECT_FALSE(fs::exists(config_path));
}

TEST_F(ConfigStoreTest, EmptyUsernameRoundTrips) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.create_default("").is_ok());
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.github_username, "");
}

TEST_F(ConfigStoreTest, SaveLoadRoundTrip) {
    ConfigStore store(config_path);
    ConfigDocument original = sample_config();
    ASSERT_TRUE(store.save(original).is_ok());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(emit_config(loaded.value), emit_config(original));

    const auto& p = loaded.value.projects.at("3f2b8c1e-9d4a-4b7e-8f21-0c6d5e4a3b2f");
    EXPECT_EQ(p.tags, (std::vector<std::string>{"cpp", "cli"}));
    EXPECT_EQ(p.language, std::optional<std::string>("C++"));
    EXPECT_FALSE(p.git_remote_url.has_value());
    EXPECT_EQ(loaded.value.machine_metadata.at("laptop").access_counts.at(p.id), 12);
}

TEST_F(ConfigStoreTest, SaveWritesHeaderAndNoTempFiles) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.save(sample_config()).is_ok());

    std::string text = read_config();
    EXPECT_EQ(text.rfind("# pm configuration", 0), 0u);

    for (const auto& entry : fs::directory_iterator(test_dir)) {
        std::string name = entry.path().filename().string();
        EXPECT_TRUE(name == "config.yml" || name == "config.yml.lock") << name;
    }
}

TEST_F(ConfigStoreTest, SaveRejectsInvalidDocument) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.save(sample_config()).is_ok());
    std::string before = read_config();

    ConfigDocument bad = sample_config();
    bad.projects.begin()->second.path = "relative/path";
    auto saved = store.save(bad);
    ASSERT_TRUE(saved.is_err());
    EXPECT_EQ(saved.kind, ErrorKind::Schema);
    EXPECT_EQ(read_config(), before);
}

TEST_F(ConfigStoreTest, ParseErrorIsReported) {
    write_config("version: \"1.2\"\nprojects: [unclosed\n");
    auto loaded = ConfigStore(config_path).load();
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::Parse);
}

TEST_F(ConfigStoreTest, SchemaErrorNamesField) {
    write_config(R"(version: "1.2"
github_username: "octocat"
projects_root_dir: /srv
editor: vim
settings:
  auto_open_editor: true
  show_git_status: true
  recent_projects_limit: 500
projects: {}
machine_metadata: {}
)");
    auto loaded = ConfigStore(config_path).load();
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::Schema);
    EXPECT_NE(loaded.error.find("settings.recent_projects_limit"), std::string::npos);
}

TEST_F(ConfigStoreTest, MigratesVersion10) {
    write_config(R"(version: "1.0"
github_username: "octocat"
projects_root_dir: /srv
projects: {}
)");
    auto loaded = ConfigStore(config_path).load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.version, CONFIG_VERSION);
    EXPECT_EQ(loaded.value.editor, default_editor());
    EXPECT_TRUE(loaded.value.settings.show_git_status);
    EXPECT_TRUE(loaded.value.settings.auto_open_editor);
    EXPECT_EQ(loaded.value.settings.recent_projects_limit, DEFAULT_RECENT_PROJECTS);
}

TEST_F(ConfigStoreTest, MigrationKeepsExistingValues) {
    YAML::Node doc = YAML::Load(R"(version: "1.1"
github_username: "octocat"
projects_root_dir: /srv
editor: nano
settings:
  show_git_status: false
  recent_projects_limit: 25
projects: {}
)");
    auto migrated = ConfigStore::migrate(doc);
    ASSERT_TRUE(migrated.is_ok()) << migrated.error;
    EXPECT_EQ(migrated.value["version"].as<std::string>(), "1.2");
    EXPECT_EQ(migrated.value["editor"].as<std::string>(), "nano");
    EXPECT_FALSE(migrated.value["settings"]["show_git_status"].as<bool>());
    EXPECT_EQ(migrated.value["settings"]["recent_projects_limit"].as<int>(), 25);
    EXPECT_TRUE(migrated.value["settings"]["auto_open_editor"].as<bool>());

    // Input document is untouched
    EXPECT_EQ(doc["version"].as<std::string>(), "1.1");
}

TEST_F(ConfigStoreTest, NewerVersionRefused) {
    write_config("version: \"1.9\"\ngithub_username: \"\"\n");
    std::string before = read_config();
    auto loaded = ConfigStore(config_path).load();
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.kind, ErrorKind::UnsupportedVersion);
    EXPECT_EQ(read_config(), before);
}

TEST_F(ConfigStoreTest, UnknownOldVersionRefused) {
    auto migrated = ConfigStore::migrate(YAML::Load("version: \"0.9\"\n"));
    ASSERT_TRUE(migrated.is_err());
    EXPECT_EQ(migrated.kind, ErrorKind::UnsupportedVersion);
}

TEST_F(ConfigStoreTest, MissingVersionIsSchemaError) {
    auto migrated = ConfigStore::migrate(YAML::Load("editor: vim\n"));
    ASSERT_TRUE(migrated.is_err());
    EXPECT_EQ(migrated.kind, ErrorKind::Schema);
}

TEST_F(ConfigStoreTest, ConfigDirOverride) {
    setenv("PM_CONFIG_DIR", test_dir.c_str(), 1);
    EXPECT_EQ(get_config_path(), test_dir / "config.yml");
    EXPECT_EQ(get_extensions_dir(), test_dir / "extensions");
    unsetenv("PM_CONFIG_DIR");
}

// ── get / set / validate / reset ──────────────────────────────

TEST_F(ConfigStoreTest, GetReadsDottedKeys) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.save(sample_config()).is_ok());

    EXPECT_EQ(store.get("github_username").value, "octocat");
    EXPECT_EQ(store.get("projects_root_dir").value, "/srv/work");
    EXPECT_EQ(store.get("settings.recent_projects_limit").value, "10");
    EXPECT_EQ(store.get("settings.show_git_status").value, "true");
    EXPECT_EQ(store.get("version").value, CONFIG_VERSION);

    auto missing = store.get("settings.color");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.kind, ErrorKind::NotFound);
}

TEST_F(ConfigStoreTest, SetPersistsAndKeepsProjects) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.save(sample_config()).is_ok());

    auto previous = store.set("settings.recent_projects_limit", "25");
    ASSERT_TRUE(previous.is_ok()) << previous.error;
    EXPECT_EQ(previous.value, "10");

    previous = store.set("editor", "code -w");
    ASSERT_TRUE(previous.is_ok()) << previous.error;

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.settings.recent_projects_limit, 25);
    EXPECT_EQ(loaded.value.editor, "code -w");
    EXPECT_EQ(loaded.value.projects.size(), 1u);
    EXPECT_EQ(loaded.value.machine_metadata["laptop"].access_counts.begin()->second, 12);

    // No temp files left beside the config
    for (const auto& entry : fs::directory_iterator(test_dir)) {
        EXPECT_EQ(entry.path().string().find(".tmp"), std::string::npos) << entry.path();
    }
}

TEST_F(ConfigStoreTest, SetAcceptsBooleanSpellings) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.save(sample_config()).is_ok());

    ASSERT_TRUE(store.set("settings.auto_open_editor", "off").is_ok());
    EXPECT_FALSE(store.load().value.settings.auto_open_editor);
    ASSERT_TRUE(store.set("settings.auto_open_editor", "YES").is_ok());
    EXPECT_TRUE(store.load().value.settings.auto_open_editor);
    ASSERT_TRUE(store.set("settings.show_git_status", "0").is_ok());
    EXPECT_FALSE(store.load().value.settings.show_git_status);
}

TEST_F(ConfigStoreTest, SetRejectsBadValuesWithoutWriting) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.save(sample_config()).is_ok());
    std::string before = read_config();

    const std::vector<std::pair<std::string, std::string>> bad = {
        {"settings.recent_projects_limit", "0"},
        {"settings.recent_projects_limit", "101"},
        {"settings.recent_projects_limit", "ten"},
        {"settings.show_git_status", "maybe"},
        {"github_username", "-octocat"},
        {"github_username", ""},
        {"editor", ""},
        {"version", "2.0"},
    };
    for (const auto& [key, value] : bad) {
        auto r = store.set(key, value);
        ASSERT_TRUE(r.is_err()) << key << "=" << value;
        EXPECT_EQ(r.kind, ErrorKind::Validation) << key << "=" << value;
    }

    auto unknown = store.set("colour", "blue");
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.kind, ErrorKind::NotFound);

    EXPECT_EQ(read_config(), before);
}

TEST_F(ConfigStoreTest, ConcurrentSetsBothLand) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.save(sample_config()).is_ok());

    std::thread a([&] {
        for (int i = 1; i <= 20; ++i) {
            EXPECT_TRUE(ConfigStore(config_path).set("settings.recent_projects_limit",
                                                     std::to_string(i)).is_ok());
        }
    });
    std::thread b([&] {
        for (int i = 1; i <= 20; ++i) {
            EXPECT_TRUE(ConfigStore(config_path).set("editor", "ed" + std::to_string(i)).is_ok());
        }
    });
    a.join();
    b.join();

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.settings.recent_projects_limit, 20);
    EXPECT_EQ(loaded.value.editor, "ed20");
}

TEST_F(ConfigStoreTest, ValidateReportsWarnings) {
    ConfigStore store(config_path);
    ConfigDocument config = make_default_config("", (test_dir / "missing").string());
    config.editor = "pm-no-such-editor";
    ASSERT_TRUE(store.save(config).is_ok());

    auto checked = store.validate();
    ASSERT_TRUE(checked.is_ok()) << checked.error;
    EXPECT_EQ(checked.value.size(), 3u);

    config = make_default_config("octocat", test_dir.string());
    config.editor = "/bin/sh -c";
    ASSERT_TRUE(store.save(config).is_ok());
    checked = store.validate();
    ASSERT_TRUE(checked.is_ok()) << checked.error;
    EXPECT_TRUE(checked.value.empty());
}

TEST_F(ConfigStoreTest, ValidatePassesLoadErrorsThrough) {
    ConfigStore store(config_path);
    EXPECT_EQ(store.validate().kind, ErrorKind::NotFound);

    write_config("version: \"1.2\"\nbogus: 1\n");
    EXPECT_EQ(store.validate().kind, ErrorKind::Schema);
}

TEST_F(ConfigStoreTest, ResetKeepsBackup) {
    ConfigStore store(config_path);
    ASSERT_TRUE(store.save(sample_config()).is_ok());
    std::string before = read_config();

    auto reset = store.reset();
    ASSERT_TRUE(reset.is_ok()) << reset.error;
    EXPECT_EQ(reset.value, store.backup_path());

    std::ifstream in(store.backup_path());
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), before);

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.version, CONFIG_VERSION);
    EXPECT_TRUE(loaded.value.github_username.empty());
    EXPECT_TRUE(loaded.value.projects.empty());
    EXPECT_EQ(loaded.value.settings.recent_projects_limit, DEFAULT_RECENT_PROJECTS);
}

TEST_F(ConfigStoreTest, ResetWithoutFileWritesDefaults) {
    ConfigStore store(config_path);
    auto reset = store.reset();
    ASSERT_TRUE(reset.is_ok()) << reset.error;
    EXPECT_TRUE(reset.value.empty());
    EXPECT_FALSE(fs::exists(store.backup_path()));
    EXPECT_TRUE(store.load().is_ok());
}
