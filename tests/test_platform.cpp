#include <gtest/gtest.h>
#include <platform/target.hpp>
#include <platform/platform.hpp>
#include <platform/archive.hpp>
#include <platform/file_lock.hpp>
#include <platform/process.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <set>

namespace fs = std::filesystem;

// ── Targets ─────────────────────────────────────────────────

TEST(PlatformTarget, ResolvesEverySupportedPair) {
    EXPECT_EQ(platform::resolve_target("linux", "x64").value, "x86_64-unknown-linux-gnu");
    EXPECT_EQ(platform::resolve_target("linux", "arm64").value, "aarch64-unknown-linux-gnu");
    EXPECT_EQ(platform::resolve_target("darwin", "x64").value, "x86_64-apple-darwin");
    EXPECT_EQ(platform::resolve_target("darwin", "arm64").value, "aarch64-apple-darwin");
    EXPECT_EQ(platform::resolve_target("win32", "x64").value, "x86_64-pc-windows-msvc");
    EXPECT_EQ(platform::resolve_target("win32", "arm64").value, "aarch64-pc-windows-msvc");
    EXPECT_EQ(platform::supported_targets().size(), 6u);
}

TEST(PlatformTarget, UnknownPairHasNoFallback) {
    auto r = platform::resolve_target("freebsd", "x64");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::UnsupportedPlatform);
    EXPECT_EQ(platform::resolve_target("linux", "ia32").kind, ErrorKind::UnsupportedPlatform);
}

TEST(PlatformTarget, CurrentTargetIsSupported) {
    auto current = platform::current_target();
    ASSERT_TRUE(current.is_ok()) << current.error;
    EXPECT_EQ(current.value, platform::resolve_target(platform::current_os(),
                                                      platform::current_arch()).value);
}

TEST(PlatformTarget, ExecutableSuffix) {
    EXPECT_EQ(platform::executable_suffix("x86_64-pc-windows-msvc"), ".exe");
    EXPECT_EQ(platform::executable_suffix("aarch64-apple-darwin"), "");
}

// ── Files ───────────────────────────────────────────────────

class PlatformFilesTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("pm_platform_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string read(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(PlatformFilesTest, WriteFileAtomicReplaces) {
    fs::path target = test_dir / "data.txt";
    ASSERT_TRUE(platform::write_file_atomic(target, "first").is_ok());
    ASSERT_TRUE(platform::write_file_atomic(target, "second").is_ok());
    EXPECT_EQ(read(target), "second");

    int entries = 0;
    for (const auto& e : fs::directory_iterator(test_dir)) { (void)e; ++entries; }
    EXPECT_EQ(entries, 1);
}

TEST_F(PlatformFilesTest, WriteFileAtomicMissingDirectory) {
    auto r = platform::write_file_atomic(test_dir / "no" / "such" / "file", "x");
    EXPECT_TRUE(r.is_err());
}

TEST_F(PlatformFilesTest, MakeExecutable) {
    fs::path f = test_dir / "tool";
    std::ofstream(f) << "#!/bin/sh\n";
    EXPECT_FALSE(platform::is_executable(f));
    ASSERT_TRUE(platform::make_executable(f).is_ok());
    EXPECT_TRUE(platform::is_executable(f));
    EXPECT_FALSE(platform::is_executable(test_dir));
    EXPECT_FALSE(platform::is_executable(test_dir / "missing"));
}

TEST_F(PlatformFilesTest, UniqueNamesDiffer) {
    std::set<std::string> names;
    for (int i = 0; i < 50; ++i) names.insert(platform::unique_name("x"));
    EXPECT_EQ(names.size(), 50u);
    EXPECT_EQ(names.begin()->rfind("x-", 0), 0u);
}

TEST_F(PlatformFilesTest, ArchiveRoundTrip) {
    fs::path src = test_dir / "src";
    fs::create_directories(src / "bin");
    std::ofstream(src / "extension.yml") << "name: demo\n";
    std::ofstream(src / "bin" / "tool") << "#!/bin/sh\necho hi\n";
    ASSERT_TRUE(platform::make_executable(src / "bin" / "tool").is_ok());

    fs::path tar = test_dir / "demo.tar.gz";
    auto created = platform::create_tar_gz(tar, src, {"extension.yml", "bin/tool"});
    ASSERT_TRUE(created.is_ok()) << created.error;
    EXPECT_TRUE(platform::is_archive_name(tar.filename().string()));

    fs::path out = test_dir / "out";
    auto extracted = platform::extract_archive(tar, out);
    ASSERT_TRUE(extracted.is_ok()) << extracted.error;
    EXPECT_EQ(read(out / "extension.yml"), "name: demo\n");
    EXPECT_TRUE(platform::is_executable(out / "bin" / "tool"));
}

TEST_F(PlatformFilesTest, ExtractRejectsGarbage) {
    fs::path bogus = test_dir / "bogus.tar.gz";
    std::ofstream(bogus) << "this is not an archive";
    auto r = platform::extract_archive(bogus, test_dir / "out");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Extract);
}

// Tarball holding a single symlink entry, written with libarchive directly
static void write_symlink_tarball(const fs::path& tar, const std::string& name, const std::string& target) {
    struct archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    ASSERT_EQ(archive_write_open_filename(a, tar.string().c_str()), ARCHIVE_OK);
    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_filetype(entry, AE_IFLNK);
    archive_entry_set_perm(entry, 0777);
    archive_entry_set_symlink(entry, target.c_str());
    EXPECT_EQ(archive_write_header(a, entry), ARCHIVE_OK);
    archive_entry_free(entry);
    archive_write_close(a);
    archive_write_free(a);
}

TEST_F(PlatformFilesTest, ExtractRejectsEscapingSymlinks) {
    fs::path absolute = test_dir / "absolute.tar.gz";
    write_symlink_tarball(absolute, "binary", "/etc/passwd");
    auto r = platform::extract_archive(absolute, test_dir / "out1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Extract);
    EXPECT_FALSE(fs::exists(fs::symlink_status(test_dir / "out1" / "binary")));

    fs::path dotdot = test_dir / "dotdot.tar.gz";
    write_symlink_tarball(dotdot, "binary", "../../outside");
    r = platform::extract_archive(dotdot, test_dir / "out2");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Extract);

    fs::path inside = test_dir / "inside.tar.gz";
    write_symlink_tarball(inside, "binary", "bin/tool");
    r = platform::extract_archive(inside, test_dir / "out3");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(fs::read_symlink(test_dir / "out3" / "binary"), fs::path("bin/tool"));
}

TEST_F(PlatformFilesTest, ArchiveNames) {
    EXPECT_TRUE(platform::is_archive_name("a.tgz"));
    EXPECT_TRUE(platform::is_archive_name("a.zip"));
    EXPECT_TRUE(platform::is_archive_name("a.tar"));
    EXPECT_FALSE(platform::is_archive_name("pm-ext-a-x86_64-unknown-linux-gnu"));
    EXPECT_FALSE(platform::is_archive_name("a.exe"));
}

TEST_F(PlatformFilesTest, FileLockIsExclusive) {
    std::string path = (test_dir / "locks" / "x.lock").string();
    {
        FileLock held(path);
        ASSERT_TRUE(held.held());
        FileLock contender(path, false);
        EXPECT_FALSE(contender.held());
    }
    FileLock after(path, false);
    EXPECT_TRUE(after.held());
}

// ── Processes ───────────────────────────────────────────────

TEST(PlatformProcess, ExitStatusReported) {
    auto child = platform::spawn("/bin/sh", {"-c", "exit 4"});
    ASSERT_TRUE(child.is_ok()) << child.error;
    auto status = child.value.wait_status();
    EXPECT_TRUE(status.exited);
    EXPECT_EQ(status.code, 4);
}

TEST(PlatformProcess, MissingProgramIsSpawnError) {
    auto child = platform::spawn("/nonexistent/pm-test-binary", {});
    ASSERT_TRUE(child.is_err());
    EXPECT_EQ(child.kind, ErrorKind::Spawn);
}
