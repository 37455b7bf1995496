#include <gtest/gtest.h>

#include "SendManager.h"
#include "TransferErrors.h"
#include "WireCodec.h"
#include "TestHarness.h"

#include <cstring>
#include <unistd.h>

using namespace TermXfer;
using namespace TermXfer::test;

class SendManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("termxfer_sendmgr_" + std::to_string(::getpid()));
        fs::remove_all(root_);
        writeFile(root_ / "d" / "a.txt", "hello");
        writeFile(root_ / "d" / "b.bin", patternedContent(10000));
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    std::unique_ptr<SendManager> makeManager(const std::string& secret = "") {
        FileDiscovery discovery(PathContext(root_.string(), root_.string()));
        SendFileList files = discovery.filesForSend(SendMode::Normal, {"d", "dest/"});
        return std::make_unique<SendManager>("t1", std::move(files), secret, false, 4096);
    }

    static Message status(const std::string& code, const std::string& fid = "", int64_t size = -1) {
        Message msg(Action::Status, "t1", fid);
        msg.status = code;
        msg.size = size;
        return msg;
    }

    fs::path root_;
};

TEST_F(SendManagerTest, StartMessageCarriesBypassToken) {
    auto plain = makeManager();
    EXPECT_TRUE(plain->startTransferMessage().bypass.empty());

    auto bypassed = makeManager("s3cret");
    Message start = bypassed->startTransferMessage();
    EXPECT_EQ(start.action, Action::Send);
    EXPECT_EQ(start.transferId, "t1");
    EXPECT_TRUE(WireCodec::checkBypass("s3cret", "t1", start.bypass));
}

TEST_F(SendManagerTest, PermissionReplies) {
    auto granted = makeManager();
    granted->onFileTransferResponse(status(StatusCode::OK));
    EXPECT_EQ(granted->state(), SendState::PermissionGranted);

    auto denied = makeManager();
    denied->onFileTransferResponse(status("EPERM:User refused the transfer"));
    EXPECT_EQ(denied->state(), SendState::PermissionDenied);
}

TEST_F(SendManagerTest, MetadataOnePerEntry) {
    auto mgr = makeManager();
    auto meta = mgr->fileMetadata();
    ASSERT_EQ(meta.size(), 3u);
    EXPECT_EQ(meta[0].fileType, FileType::Directory);
    EXPECT_EQ(meta[0].name, "dest/d");
    EXPECT_EQ(meta[1].name, "dest/d/a.txt");
    EXPECT_EQ(meta[1].size, 5);
    for (const auto& m : meta) {
        EXPECT_EQ(m.transferId, "t1");
        EXPECT_FALSE(m.fileId.empty());
    }
}

TEST_F(SendManagerTest, FullLifecycleReachesComplete) {
    auto mgr = makeManager();
    std::vector<std::string> done;
    mgr->setFileDoneCallback([&](SendFile& f) { done.push_back(f.remotePath); });

    mgr->onFileTransferResponse(status(StatusCode::OK));
    auto meta = mgr->fileMetadata();
    const std::string dirId = meta[0].fileId;
    const std::string aId = meta[1].fileId;
    const std::string bId = meta[2].fileId;

    mgr->onFileTransferResponse(status(StatusCode::OK, dirId));
    mgr->onFileTransferResponse(status(StatusCode::STARTED, aId, 0));
    mgr->onFileTransferResponse(status(StatusCode::STARTED, bId, 0));
    EXPECT_TRUE(mgr->allStarted());
    EXPECT_FALSE(mgr->allAcknowledged());

    auto first = mgr->nextChunks();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].action, Action::EndData);
    EXPECT_EQ(first[0].fileId, aId);
    EXPECT_EQ(first[0].dataAsString(), "hello");
    EXPECT_EQ(mgr->takeCurrentChunkSize(), std::optional<int64_t>(5));
    EXPECT_FALSE(mgr->takeCurrentChunkSize().has_value());

    std::vector<uint8_t> payload;
    bool sawEnd = false;
    while (!sawEnd) {
        auto msgs = mgr->nextChunks();
        ASSERT_FALSE(msgs.empty());
        for (const auto& m : msgs) {
            EXPECT_EQ(m.fileId, bId);
            payload.insert(payload.end(), m.data.begin(), m.data.end());
            sawEnd = m.action == Action::EndData;
        }
    }
    EXPECT_FALSE(payload.empty());
    EXPECT_TRUE(mgr->nextChunks().empty());

    mgr->onFileTransferResponse(status(StatusCode::OK, aId, 5));
    mgr->onFileTransferResponse(status(StatusCode::OK, bId, 10000));
    EXPECT_TRUE(mgr->allAcknowledged());
    EXPECT_EQ(mgr->state(), SendState::Complete);
    EXPECT_EQ(mgr->progress().totalReportedProgress(), 10005);
    EXPECT_TRUE(mgr->failedFiles().empty());
    EXPECT_EQ(done.size(), 3u);
}

TEST_F(SendManagerTest, ProgressAndErrorStatuses) {
    auto mgr = makeManager();
    std::vector<int64_t> changes;
    mgr->setFileProgressCallback([&](SendFile&, int64_t change) { changes.push_back(change); });
    mgr->onFileTransferResponse(status(StatusCode::OK));
    auto meta = mgr->fileMetadata();
    const std::string bId = meta[2].fileId;

    mgr->onFileTransferResponse(status(StatusCode::STARTED, bId, 0));
    mgr->onFileTransferResponse(status(StatusCode::PROGRESS, bId, 4000));
    mgr->onFileTransferResponse(status(StatusCode::PROGRESS, bId, 6000));
    EXPECT_EQ(changes, (std::vector<int64_t>{4000, 2000}));

    mgr->onFileTransferResponse(status("ENOSPC:No space left on device", bId));
    auto failed = mgr->failedFiles();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0]->errorMessage, "ENOSPC:No space left on device");
    EXPECT_EQ(failed[0]->state, FileState::Acknowledged);

    // Unknown file ids are ignored
    mgr->onFileTransferResponse(status(StatusCode::OK, "nope"));
    EXPECT_EQ(mgr->failedFiles().size(), 1u);
}

TEST_F(SendManagerTest, UnreadableFileFailsOnlyThatFile) {
    auto mgr = makeManager();
    mgr->onFileTransferResponse(status(StatusCode::OK));
    auto meta = mgr->fileMetadata();
    const std::string aId = meta[1].fileId;
    const std::string bId = meta[2].fileId;

    fs::remove(root_ / "d" / "a.txt");
    mgr->onFileTransferResponse(status(StatusCode::STARTED, aId, 0));
    mgr->onFileTransferResponse(status(StatusCode::STARTED, bId, 0));

    EXPECT_TRUE(mgr->nextChunks().empty());
    auto failed = mgr->failedFiles();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0]->fileId, aId);
    EXPECT_EQ(failed[0]->errorMessage.rfind("EIO:", 0), 0u);

    auto next = mgr->nextChunks();
    ASSERT_FALSE(next.empty());
    EXPECT_EQ(next[0].fileId, bId);
}

TEST(ProgressTrackerTest, RateAndEtaOverWindow) {
    struct stat st;
    std::memset(&st, 0, sizeof(st));
    SendFile file("a", "/a", 1, st, "", FileType::Regular);

    ProgressTracker tracker(1000);
    auto t0 = ProgressTracker::Clock::now();
    tracker.setNowForTesting(t0);
    tracker.startTransfer();
    tracker.changeActiveFile(file);
    EXPECT_EQ(tracker.bytesPerSecond(), 0.0);
    EXPECT_LT(tracker.etaSeconds(), 0.0);

    tracker.setNowForTesting(t0 + std::chrono::seconds(1));
    tracker.onTransmit(100);
    tracker.setNowForTesting(t0 + std::chrono::seconds(2));
    tracker.onTransmit(100);
    EXPECT_DOUBLE_EQ(tracker.bytesPerSecond(), 100.0);
    EXPECT_EQ(file.transmittedBytes, 200);
    EXPECT_EQ(tracker.totalTransferred(), 200);

    tracker.onFileProgress(file, 400);
    EXPECT_DOUBLE_EQ(tracker.etaSeconds(), 6.0);

    // Old samples fall out of the window but two are always kept
    tracker.setNowForTesting(t0 + std::chrono::seconds(100));
    tracker.onTransmit(50);
    EXPECT_DOUBLE_EQ(tracker.bytesPerSecond(), 150.0 / 98.0);
}
