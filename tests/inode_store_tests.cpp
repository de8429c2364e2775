#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "vfs/inode_store.h"
#include "vfs/virtual_filesystem.h"

using vsh_filesystem::ErrorKind;

namespace {

class JsonStoreTest : public ::testing::Test {
   protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               ("vsh_store_" + std::to_string(::getpid()) + "_" + info->name());
        std::filesystem::remove_all(dir_);
        path_ = (dir_ / "nested" / "vfs.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void write_raw(const std::string& text) {
        std::filesystem::create_directories(std::filesystem::path(path_).parent_path());
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out << text;
    }

    std::filesystem::path dir_;
    std::string path_;
};

vfs::Inode file(const std::string& path, const std::string& content) {
    return vfs::make_file_inode(path, content, 0644, 1000, 1000, 42);
}

}  // namespace

TEST(ApplyBatch, ErasesRunBeforePuts) {
    std::map<std::string, vfs::Inode> records;
    records["/a"] = file("/a", "old");
    records["/b"] = file("/b", "gone");

    vfs::StoreBatch batch;
    batch.erases = {"/a", "/b"};
    batch.puts.push_back(file("/a", "new"));
    vfs::apply_batch(records, batch);

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records.at("/a").content.value(), "new");
}

TEST(MemoryInodeStore, CommitThenLoad) {
    vfs::MemoryInodeStore store;
    vfs::StoreBatch batch;
    batch.puts.push_back(file("/x", "1"));
    batch.puts.push_back(file("/y", "2"));
    ASSERT_TRUE(store.commit(batch).is_ok());

    auto loaded = store.load_all();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().size(), 2u);
    EXPECT_EQ(store.describe(), "memory");
}

TEST(InodeJson, DirectoryDropsContent) {
    nlohmann::json j = {{"path", "/d"}, {"type", "dir"}, {"content", "ignored"}};
    vfs::Inode inode = j.get<vfs::Inode>();
    EXPECT_TRUE(inode.is_directory());
    EXPECT_FALSE(inode.content.has_value());
    EXPECT_EQ(inode.mode, 0755u);
    EXPECT_EQ(inode.size, 0u);
}

TEST(InodeJson, SizeFollowsContent) {
    nlohmann::json j = {{"path", "/f"}, {"type", "file"}, {"size", 999}, {"content", "abc"}};
    vfs::Inode inode = j.get<vfs::Inode>();
    EXPECT_EQ(inode.size, 3u);
    EXPECT_EQ(inode.mode, 0644u);
}

TEST(InodeJson, Utf8ContentStaysPlainText) {
    nlohmann::json j = file("/f", "caf\xc3\xa9");
    EXPECT_EQ(j.at("content").get<std::string>(), "caf\xc3\xa9");
    EXPECT_FALSE(j.contains("encoding"));
}

TEST(InodeJson, BinaryContentIsBase64) {
    nlohmann::json j = file("/f", std::string("\xff\xfe\0x", 4));
    EXPECT_EQ(j.at("encoding").get<std::string>(), "base64");
    EXPECT_EQ(j.at("content").get<std::string>(), "//4AeA==");

    vfs::Inode back = j.get<vfs::Inode>();
    EXPECT_EQ(back.content.value(), std::string("\xff\xfe\0x", 4));
    EXPECT_EQ(back.size, 4u);
}

TEST(InodeJson, MalformedBase64Throws) {
    nlohmann::json j = {{"path", "/f"}, {"type", "file"}, {"content", "@@"}, {"encoding", "base64"}};
    EXPECT_THROW(j.get<vfs::Inode>(), std::invalid_argument);
}

TEST(InodeJson, UnknownTypeThrows) {
    nlohmann::json j = {{"path", "/f"}, {"type", "socket"}};
    EXPECT_THROW(j.get<vfs::Inode>(), std::invalid_argument);
}

TEST_F(JsonStoreTest, MissingFileLoadsEmpty) {
    vfs::JsonFileInodeStore store(path_);
    auto loaded = store.load_all();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_TRUE(loaded.value().empty());
    EXPECT_FALSE(std::filesystem::exists(path_));
}

TEST_F(JsonStoreTest, CommitCreatesParentAndPersists) {
    {
        vfs::JsonFileInodeStore store(path_);
        ASSERT_TRUE(store.load_all().is_ok());
        vfs::StoreBatch batch;
        batch.puts.push_back(vfs::make_directory_inode("/", 0755, 0, 0, 1));
        batch.puts.push_back(file("/note", "hello\nworld"));
        ASSERT_TRUE(store.commit(batch).is_ok());
    }
    ASSERT_TRUE(std::filesystem::exists(path_));

    vfs::JsonFileInodeStore reopened(path_);
    auto loaded = reopened.load_all();
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 2u);

    std::map<std::string, vfs::Inode> by_path;
    for (const auto& inode : loaded.value()) {
        by_path[inode.path] = inode;
    }
    const vfs::Inode& note = by_path.at("/note");
    EXPECT_EQ(note.content.value(), "hello\nworld");
    EXPECT_EQ(note.uid, 1000u);
    EXPECT_EQ(note.mtime, 42);
    EXPECT_TRUE(by_path.at("/").is_directory());
}

TEST_F(JsonStoreTest, DocumentCarriesVersion) {
    vfs::JsonFileInodeStore store(path_);
    ASSERT_TRUE(store.load_all().is_ok());
    vfs::StoreBatch batch;
    batch.puts.push_back(file("/a", "x"));
    ASSERT_TRUE(store.commit(batch).is_ok());

    std::ifstream in(path_);
    nlohmann::json document = nlohmann::json::parse(in);
    EXPECT_EQ(document.at("version").get<int>(), vfs::JsonFileInodeStore::kFormatVersion);
    EXPECT_EQ(document.at("inodes").size(), 1u);
}

TEST_F(JsonStoreTest, NonUtf8ContentRoundTrips) {
    const std::string bytes = "\xff\xfe bin";
    {
        vfs::JsonFileInodeStore store(path_);
        ASSERT_TRUE(store.load_all().is_ok());
        vfs::StoreBatch batch;
        batch.puts.push_back(file("/blob", bytes));
        ASSERT_TRUE(store.commit(batch).is_ok());
    }

    std::ifstream in(path_);
    nlohmann::json document = nlohmann::json::parse(in);
    EXPECT_EQ(document.at("inodes").at(0).at("encoding").get<std::string>(), "base64");

    vfs::JsonFileInodeStore reopened(path_);
    auto loaded = reopened.load_all();
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].content.value(), bytes);
    EXPECT_EQ(loaded.value()[0].size, bytes.size());
}

TEST_F(JsonStoreTest, UnencodablePathIsIoErrorAndKeepsState) {
    vfs::JsonFileInodeStore store(path_);
    ASSERT_TRUE(store.load_all().is_ok());
    vfs::StoreBatch good;
    good.puts.push_back(file("/ok", "1"));
    ASSERT_TRUE(store.commit(good).is_ok());

    vfs::StoreBatch bad;
    bad.puts.push_back(file("/bad\xff", "2"));
    auto result = store.commit(bad);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.kind(), ErrorKind::IoError);

    vfs::JsonFileInodeStore reopened(path_);
    auto loaded = reopened.load_all();
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].path, "/ok");
}

TEST_F(JsonStoreTest, EraseIsPersisted) {
    vfs::JsonFileInodeStore store(path_);
    ASSERT_TRUE(store.load_all().is_ok());
    vfs::StoreBatch first;
    first.puts.push_back(file("/a", "1"));
    first.puts.push_back(file("/b", "2"));
    ASSERT_TRUE(store.commit(first).is_ok());

    vfs::StoreBatch second;
    second.erases.push_back("/a");
    ASSERT_TRUE(store.commit(second).is_ok());

    vfs::JsonFileInodeStore reopened(path_);
    auto loaded = reopened.load_all();
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].path, "/b");
}

TEST_F(JsonStoreTest, UnsupportedVersionIsIoError) {
    write_raw(R"({"version": 7, "inodes": []})");
    vfs::JsonFileInodeStore store(path_);
    auto loaded = store.load_all();
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.kind(), ErrorKind::IoError);
    EXPECT_NE(loaded.error().find("unsupported store version 7"), std::string::npos);
}

TEST_F(JsonStoreTest, CorruptDocumentIsIoError) {
    write_raw("{ not json");
    vfs::JsonFileInodeStore store(path_);
    auto loaded = store.load_all();
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.kind(), ErrorKind::IoError);
}

TEST_F(JsonStoreTest, BadRecordIsIoError) {
    write_raw(R"({"version": 1, "inodes": [{"path": "/x", "type": "fifo"}]})");
    vfs::JsonFileInodeStore store(path_);
    auto loaded = store.load_all();
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.kind(), ErrorKind::IoError);
}

TEST_F(JsonStoreTest, FilesystemSurvivesReopen) {
    {
        vfs::VirtualFilesystem fs(std::make_unique<vfs::JsonFileInodeStore>(path_));
        ASSERT_TRUE(fs.initialize().is_ok());
        ASSERT_TRUE(fs.mkdir("/home/user/projects").is_ok());
        ASSERT_TRUE(fs.write_file("/home/user/projects/todo", "ship it\n").is_ok());
        ASSERT_TRUE(fs.symlink("/home/user/projects", "/tmp/p").is_ok());
    }

    vfs::VirtualFilesystem fs(std::make_unique<vfs::JsonFileInodeStore>(path_));
    ASSERT_TRUE(fs.initialize().is_ok());
    EXPECT_EQ(fs.read_file("/tmp/p/todo").value(), "ship it\n");
    EXPECT_EQ(fs.read_file("/etc/hostname").value(), "vsh\n");
}

TEST_F(JsonStoreTest, OrphanedRecordsAreDroppedOnLoad) {
    nlohmann::json document = {
        {"version", 1},
        {"inodes",
         {{{"path", "/"}, {"type", "dir"}},
          {{"path", "/kept"}, {"type", "file"}, {"content", "k"}},
          {{"path", "/missing/child"}, {"type", "file"}, {"content", "x"}},
          {{"path", "/kept/under_file"}, {"type", "file"}, {"content", "y"}}}}};
    write_raw(document.dump());

    vfs::VirtualFilesystem fs(std::make_unique<vfs::JsonFileInodeStore>(path_));
    ASSERT_TRUE(fs.initialize().is_ok());
    EXPECT_EQ(fs.inode_count(), 2u);
    EXPECT_TRUE(fs.exists("/kept"));
    EXPECT_FALSE(fs.exists("/missing/child"));
    // "/" existed, so the default tree is not reseeded
    EXPECT_FALSE(fs.exists("/home"));
}
