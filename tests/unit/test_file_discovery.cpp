#include <gtest/gtest.h>

#include "FileDiscovery.h"
#include "TestHarness.h"

#include <set>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

using namespace TermXfer;
using namespace TermXfer::test;

class FileDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("termxfer_discovery_" + std::to_string(::getpid()));
        fs::remove_all(root_);
        home_ = root_ / "home";
        work_ = root_ / "work";
        fs::create_directories(home_);
        fs::create_directories(work_);

        writeFile(work_ / "dir" / "a.txt", "alpha");
        writeFile(work_ / "dir" / "sub" / "b.txt", patternedContent(10000));
        fs::create_hard_link(work_ / "dir" / "a.txt", work_ / "dir" / "hard");
        fs::create_symlink("a.txt", work_ / "dir" / "link");
        fs::create_symlink(work_ / "dir" / "sub" / "b.txt", work_ / "dir" / "abslink");
        fs::create_symlink("nowhere", work_ / "dir" / "dangling");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    PathContext paths() const { return PathContext(home_.string(), work_.string()); }

    static const SendFile* byRemote(const SendFileList& files, const std::string& remote) {
        for (const auto& f : files) {
            if (f->remotePath == remote) {
                return f.get();
            }
        }
        return nullptr;
    }

    fs::path root_;
    fs::path home_;
    fs::path work_;
};

TEST_F(FileDiscoveryTest, DirectoryIntoDestinationDirectory) {
    FileDiscovery discovery(paths());
    SendFileList files = discovery.filesForSend(SendMode::Normal, {"dir", "dest/"});

    std::vector<std::string> remotes;
    for (const auto& f : files) {
        remotes.push_back(f->remotePath);
    }
    std::vector<std::string> expected = {
        "dest/dir", "dest/dir/a.txt", "dest/dir/abslink", "dest/dir/dangling",
        "dest/dir/hard", "dest/dir/link", "dest/dir/sub", "dest/dir/sub/b.txt"};
    EXPECT_EQ(remotes, expected);

    // Directories precede their contents and ids are unique
    EXPECT_EQ(files[0]->fileType, FileType::Directory);
    std::set<std::string> ids;
    for (const auto& f : files) {
        EXPECT_TRUE(ids.insert(f->fileId).second) << f->fileId;
    }
}

TEST_F(FileDiscoveryTest, HardLinksCollapseOntoFirstEntry) {
    FileDiscovery discovery(paths());
    SendFileList files = discovery.filesForSend(SendMode::Normal, {"dir", "dest/"});

    const SendFile* original = byRemote(files, "dest/dir/a.txt");
    const SendFile* hard = byRemote(files, "dest/dir/hard");
    ASSERT_NE(original, nullptr);
    ASSERT_NE(hard, nullptr);
    EXPECT_EQ(original->fileType, FileType::Regular);
    EXPECT_EQ(hard->fileType, FileType::Hardlink);
    EXPECT_EQ(hard->hardLinkTarget, "fid:" + original->fileId);
}

TEST_F(FileDiscoveryTest, SymlinksReferenceTransferredTargets) {
    FileDiscovery discovery(paths());
    SendFileList files = discovery.filesForSend(SendMode::Normal, {"dir", "dest/"});

    const SendFile* a = byRemote(files, "dest/dir/a.txt");
    const SendFile* b = byRemote(files, "dest/dir/sub/b.txt");
    const SendFile* link = byRemote(files, "dest/dir/link");
    const SendFile* abslink = byRemote(files, "dest/dir/abslink");
    const SendFile* dangling = byRemote(files, "dest/dir/dangling");
    ASSERT_TRUE(a && b && link && abslink && dangling);

    EXPECT_EQ(link->symbolicLinkTarget, "fid:" + a->fileId);
    EXPECT_EQ(abslink->symbolicLinkTarget, "fid_abs:" + b->fileId);
    EXPECT_EQ(dangling->symbolicLinkTarget, "path:nowhere");
}

TEST_F(FileDiscoveryTest, SeveralSourcesGoIntoDestinationDirectory) {
    writeFile(work_ / "one.txt", "1");
    writeFile(work_ / "two.txt", "2");
    FileDiscovery discovery(paths());
    SendFileList files = discovery.filesForSend(SendMode::Normal, {"one.txt", "two.txt", "~/inbox"});
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0]->remotePath, "~/inbox/one.txt");
    EXPECT_EQ(files[1]->remotePath, "~/inbox/two.txt");
}

TEST_F(FileDiscoveryTest, SingleFileKeepsDestinationName) {
    FileDiscovery discovery(paths());
    SendFileList files = discovery.filesForSend(SendMode::Normal, {"dir/a.txt", "renamed.txt"});
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0]->remotePath, "renamed.txt");

    Message meta = files[0]->metadataMessage(true);
    EXPECT_EQ(meta.action, Action::File);
    EXPECT_EQ(meta.size, 5);
    // Too small for deltas or compression
    EXPECT_EQ(meta.transmissionType, TransmissionType::Simple);
    EXPECT_EQ(meta.compression, CompressionType::None);
}

TEST_F(FileDiscoveryTest, LargeFileNegotiatesRsyncAndCompression) {
    FileDiscovery discovery(paths());
    SendFileList files = discovery.filesForSend(SendMode::Normal, {"dir/sub/b.txt", "b.txt"});
    ASSERT_EQ(files.size(), 1u);
    Message meta = files[0]->metadataMessage(true);
    EXPECT_EQ(meta.transmissionType, TransmissionType::Rsync);
    EXPECT_EQ(meta.compression, CompressionType::Zlib);
    EXPECT_EQ(files[0]->metadataMessage(false).transmissionType, TransmissionType::Simple);
}

TEST_F(FileDiscoveryTest, MirrorModeUsesHomeRelativePaths) {
    writeFile(home_ / "docs" / "x.txt", "x");
    FileDiscovery discovery(paths());
    SendFileList files = discovery.filesForSend(SendMode::Mirror, {"~/docs"});
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0]->remotePath, "~/docs");
    EXPECT_EQ(files[1]->remotePath, "~/docs/x.txt");
}

TEST_F(FileDiscoveryTest, BadArgumentsThrow) {
    FileDiscovery discovery(paths());
    EXPECT_THROW(discovery.filesForSend(SendMode::Normal, {"dir"}), std::invalid_argument);
    EXPECT_THROW(discovery.filesForSend(SendMode::Normal, {"missing", "dest"}), std::system_error);
}
