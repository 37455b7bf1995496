#include <gtest/gtest.h>

#include "TerminalBroker.h"
#include "DeltaCodec.h"
#include "TransferErrors.h"
#include "WireCodec.h"
#include "TestHarness.h"

#include <cstring>
#include <map>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

using namespace TermXfer;
using namespace TermXfer::test;

class TerminalBrokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("termxfer_broker_" + std::to_string(::getpid()));
        fs::remove_all(root_);
        home_ = root_ / "home";
        fs::create_directories(home_);
        base_ = TerminalBroker::Clock::now();
    }

    void TearDown() override {
        broker_.reset();
        fs::remove_all(root_);
    }

    TerminalBroker& broker() {
        if (!broker_) {
            broker_ = std::make_unique<TerminalBroker>(channel_, prompt_, timers_, settings_,
                                                       PathContext(home_.string(), home_.string()));
            broker_->setClock([this]() { return base_ + timers_.now(); });
        }
        return *broker_;
    }

    void send(const Message& msg) {
        broker().handleSerializedCommand(WireCodec::serialize(msg));
    }

    void startPush(const std::string& id, int64_t quiet = 0) {
        Message msg(Action::Send, id);
        msg.quiet = quiet;
        send(msg);
    }

    Message fileCmd(const std::string& id, const std::string& fid, const std::string& name,
                    FileType type = FileType::Regular) {
        Message msg(Action::File, id, fid);
        msg.name = name;
        msg.fileType = type;
        return msg;
    }

    Message dataCmd(const std::string& id, const std::string& fid, const std::string& payload, bool last) {
        Message msg(last ? Action::EndData : Action::Data, id, fid);
        msg.setData(payload);
        return msg;
    }

    static std::string statusOf(const Message& msg) {
        EXPECT_EQ(msg.action, Action::Status);
        return msg.status;
    }

    fs::path root_;
    fs::path home_;
    TerminalBroker::Clock::time_point base_;
    TransferSettings settings_;
    RecordingChannel channel_;
    ManualTimers timers_;
    ScriptedPrompt prompt_;
    std::unique_ptr<TerminalBroker> broker_;
};

TEST_F(TerminalBrokerTest, AcceptedPushWritesFile) {
    startPush("t1");
    EXPECT_EQ(prompt_.asked, 1);
    EXPECT_NE(prompt_.lastMessage.find("send some files"), std::string::npos);
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "OK");
    EXPECT_TRUE(replies[0].fileId.empty());

    const int64_t mtime = 1600000000LL * 1000000000LL + 500;
    Message file = fileCmd("t1", "f1", "~/in/a.txt");
    file.size = 5;
    file.permissions = 0640;
    file.mtime = mtime;
    send(file);
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "STARTED");
    EXPECT_EQ(replies[0].fileId, "f1");
    EXPECT_EQ(replies[0].name, (home_ / "in" / "a.txt").string());
    EXPECT_EQ(replies[0].size, -1);
    EXPECT_EQ(replies[0].transmissionType, TransmissionType::Simple);

    send(dataCmd("t1", "f1", "hel", false));
    send(dataCmd("t1", "f1", "lo", true));
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[0]), "PROGRESS");
    EXPECT_EQ(replies[0].size, 3);
    EXPECT_EQ(statusOf(replies[1]), "OK");
    EXPECT_EQ(replies[1].size, 5);
    EXPECT_EQ(replies[1].name, (home_ / "in" / "a.txt").string());

    fs::path written = home_ / "in" / "a.txt";
    EXPECT_EQ(readFile(written), "hello");
    struct stat st;
    ASSERT_EQ(::stat(written.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0640u);
    EXPECT_EQ(st.st_mtim.tv_sec, 1600000000);
    EXPECT_EQ(st.st_mtim.tv_nsec, 500);

    send(Message(Action::Finish, "t1"));
    EXPECT_EQ(broker().activeReceiveCount(), 0u);
    EXPECT_TRUE(channel_.take().empty());
}

TEST_F(TerminalBrokerTest, DirectoriesGetMetadataDeepestFirst) {
    startPush("t1");
    channel_.take();

    const int64_t outer = 1500000000LL * 1000000000LL;
    const int64_t inner = 1400000000LL * 1000000000LL;
    Message d1 = fileCmd("t1", "d1", "~/d", FileType::Directory);
    d1.mtime = outer;
    Message d2 = fileCmd("t1", "d2", "~/d/e", FileType::Directory);
    d2.mtime = inner;
    send(d1);
    send(d2);
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[0]), "OK");
    EXPECT_EQ(replies[0].name, (home_ / "d").string());
    EXPECT_TRUE(fs::is_directory(home_ / "d" / "e"));

    send(fileCmd("t1", "f1", "~/d/e/x"));
    send(dataCmd("t1", "f1", "x", true));
    send(dataCmd("t1", "d1", "nope", true));
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 3u);
    EXPECT_EQ(statusOf(replies[2]), "EISDIR:Cannot write data to a directory entry");
    EXPECT_EQ(replies[2].fileId, "d1");

    send(Message(Action::Finish, "t1"));
    struct stat st;
    ASSERT_EQ(::stat((home_ / "d").c_str(), &st), 0);
    EXPECT_EQ(st.st_mtim.tv_sec, 1500000000);
    ASSERT_EQ(::stat((home_ / "d" / "e").c_str(), &st), 0);
    EXPECT_EQ(st.st_mtim.tv_sec, 1400000000);
}

TEST_F(TerminalBrokerTest, RefusedPushReportsEperm) {
    prompt_.mode = ScriptedPrompt::Mode::Deny;
    startPush("t1");
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "EPERM:User refused the transfer");
    EXPECT_EQ(broker().activeReceiveCount(), 0u);

    send(fileCmd("t1", "f1", "~/a"));
    EXPECT_TRUE(channel_.take().empty());
    EXPECT_FALSE(fs::exists(home_ / "a"));
}

TEST_F(TerminalBrokerTest, BypassTokenSkipsPrompt) {
    settings_.bypassSecret = "s3cret";
    Message good(Action::Send, "t1");
    good.bypass = WireCodec::encodeBypass("t1", "s3cret");
    send(good);
    EXPECT_EQ(prompt_.asked, 0);
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "OK");

    Message bad(Action::Send, "t2");
    bad.bypass = WireCodec::encodeBypass("t2", "guess");
    send(bad);
    EXPECT_EQ(prompt_.asked, 0);
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "EPERM:User refused the transfer");
    EXPECT_EQ(broker().activeReceiveCount(), 1u);
}

TEST_F(TerminalBrokerTest, QuietLevelsSuppressReplies) {
    startPush("t1", 1);
    send(fileCmd("t1", "f1", "~/q1"));
    send(dataCmd("t1", "f1", "data", true));
    EXPECT_TRUE(channel_.take().empty());
    EXPECT_EQ(readFile(home_ / "q1"), "data");

    send(dataCmd("t1", "zz", "x", true));
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "EINVAL:Cannot write to a file without first starting it");

    startPush("t2", 2);
    send(dataCmd("t2", "zz", "x", true));
    EXPECT_TRUE(channel_.take().empty());
}

TEST_F(TerminalBrokerTest, RejectsOutOfSequenceCommands) {
    startPush("t1");
    channel_.take();
    send(fileCmd("t1", "f1", "~/a"));
    send(fileCmd("t1", "f1", "~/b"));
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[1]), "EINVAL:The file_id f1 already exists");

    // Commands before the user answered abort the transfer
    prompt_.mode = ScriptedPrompt::Mode::Defer;
    startPush("t2");
    EXPECT_EQ(broker().activeReceiveCount(), 2u);
    send(fileCmd("t2", "f1", "~/c"));
    EXPECT_EQ(broker().activeReceiveCount(), 1u);
    prompt_.answer(true);
    EXPECT_TRUE(channel_.take().empty());

    // Unparseable payloads and commands without an id are ignored
    broker().handleSerializedCommand("ac=bogus;id=t1");
    send(Message(Action::Finish, ""));
    EXPECT_EQ(broker().activeReceiveCount(), 1u);
}

TEST_F(TerminalBrokerTest, EnforcesDeclaredSize) {
    startPush("t1");
    channel_.take();
    Message file = fileCmd("t1", "f1", "~/small");
    file.size = 3;
    send(file);
    send(dataCmd("t1", "f1", "too long", false));
    send(dataCmd("t1", "f1", "more", true));
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[1]), "EFBIG:Received more data than the declared size");
    EXPECT_TRUE(broker().findReceive("t1")->files.at("f1")->failed);
}

TEST_F(TerminalBrokerTest, RejectsDataAfterEndData) {
    startPush("t1");
    channel_.take();
    send(fileCmd("t1", "f1", "~/done.txt"));
    send(dataCmd("t1", "f1", "abc", true));
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[1]), "OK");

    send(dataCmd("t1", "f1", "late", false));
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].fileId, "f1");
    EXPECT_EQ(statusOf(replies[0]), "EINVAL:Cannot write to a closed file");
    EXPECT_EQ(readFile(home_ / "done.txt"), "abc");
}

TEST_F(TerminalBrokerTest, CreatesLinks) {
    startPush("t1");
    send(fileCmd("t1", "f1", "~/t/a.txt"));
    send(fileCmd("t1", "f2", "~/t/s", FileType::Symlink));
    send(fileCmd("t1", "f3", "~/t/h", FileType::Hardlink));
    send(fileCmd("t1", "f4", "~/t/p", FileType::Symlink));
    send(fileCmd("t1", "f5", "~/t/bad", FileType::Symlink));
    send(fileCmd("t1", "f6", "~/t/missing", FileType::Hardlink));
    channel_.take();

    send(dataCmd("t1", "f1", "hi", true));
    send(dataCmd("t1", "f2", "fid:f1", true));
    send(dataCmd("t1", "f3", "fid:", false));
    send(dataCmd("t1", "f3", "f1", true));
    send(dataCmd("t1", "f4", "path:/etc/hostname", true));
    send(dataCmd("t1", "f5", "bogus", true));
    send(dataCmd("t1", "f6", "fid:nope", true));

    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 6u);
    EXPECT_EQ(statusOf(replies[1]), "OK");
    EXPECT_EQ(statusOf(replies[2]), "OK");
    EXPECT_EQ(statusOf(replies[3]), "OK");
    EXPECT_EQ(statusOf(replies[4]), "EINVAL:Unknown link target type");
    EXPECT_EQ(statusOf(replies[5]), "EINVAL:Link target nope is not part of this transfer");

    fs::path dir = home_ / "t";
    EXPECT_EQ(fs::read_symlink(dir / "s").string(), "a.txt");
    EXPECT_TRUE(fs::equivalent(dir / "a.txt", dir / "h"));
    EXPECT_EQ(fs::read_symlink(dir / "p").string(), "/etc/hostname");
}

TEST_F(TerminalBrokerTest, RsyncReceivePatchesExistingFile) {
    std::string oldContent = patternedContent(64 * 1024, 5);
    std::string newContent = oldContent;
    newContent.replace(20000, 10, "CHANGED!!!");
    newContent += "appended tail";
    writeFile(home_ / "r.bin", oldContent);
    ::chmod((home_ / "r.bin").c_str(), 0600);

    startPush("t1");
    channel_.take();
    Message file = fileCmd("t1", "f1", "~/r.bin");
    file.transmissionType = TransmissionType::Rsync;
    send(file);
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "STARTED");
    EXPECT_EQ(replies[0].size, static_cast<int64_t>(oldContent.size()));
    EXPECT_EQ(replies[0].transmissionType, TransmissionType::Rsync);

    timers_.runDue();
    std::vector<uint8_t> signature;
    bool ended = false;
    for (const auto& msg : channel_.take()) {
        ASSERT_EQ(msg.fileId, "f1");
        ASSERT_FALSE(ended);
        signature.insert(signature.end(), msg.data.begin(), msg.data.end());
        ended = msg.action == Action::EndData;
    }
    ASSERT_TRUE(ended);

    auto loader = DeltaCodec::makeSignatureLoader();
    DriveResult loaded = DeltaCodec::drive(*loader, signature, true);
    ASSERT_TRUE(loaded.finished);
    std::vector<uint8_t> target = bytesOf(newContent);
    size_t pos = 0;
    DeltaStream deltaStream(DeltaCodec::makeDelta(loader->release()), [&](uint8_t* buf, size_t len) {
        size_t n = std::min(len, target.size() - pos);
        std::memcpy(buf, target.data() + pos, n);
        pos += n;
        return n;
    });
    std::vector<uint8_t> delta;
    std::vector<uint8_t> piece;
    while (deltaStream.next(piece)) {
        delta.insert(delta.end(), piece.begin(), piece.end());
    }
    EXPECT_LT(delta.size(), target.size() / 4);

    for (const auto& msg : WireCodec::splitForTransfer(delta, "t1", "f1", true)) {
        send(msg);
    }
    replies = channel_.take();
    ASSERT_FALSE(replies.empty());
    EXPECT_EQ(statusOf(replies.back()), "OK");
    EXPECT_EQ(replies.back().size, static_cast<int64_t>(newContent.size()));
    EXPECT_EQ(readFile(home_ / "r.bin"), newContent);

    struct stat st;
    ASSERT_EQ(::stat((home_ / "r.bin").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(home_)) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(TerminalBrokerTest, RsyncFallsBackToSimpleForNewFiles) {
    startPush("t1");
    channel_.take();
    Message file = fileCmd("t1", "f1", "~/new.bin");
    file.transmissionType = TransmissionType::Rsync;
    send(file);
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].transmissionType, TransmissionType::Simple);
    timers_.runDue();
    EXPECT_TRUE(channel_.take().empty());
}

TEST_F(TerminalBrokerTest, RefusedRepliesAreRetriedInOrder) {
    channel_.accepting = false;
    startPush("t1");
    send(fileCmd("t1", "f1", "~/a"));
    EXPECT_EQ(broker().pendingReplyCount(), 2u);
    EXPECT_TRUE(channel_.payloads.empty());

    timers_.advance(settings_.retryDelay);
    EXPECT_EQ(broker().pendingReplyCount(), 2u);

    channel_.accepting = true;
    timers_.advance(settings_.retryDelay);
    EXPECT_EQ(broker().pendingReplyCount(), 0u);
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[0]), "OK");
    EXPECT_EQ(statusOf(replies[1]), "STARTED");
}

TEST_F(TerminalBrokerTest, RefusalVerdictSurvivesDroppedTransfer) {
    channel_.accepting = false;
    prompt_.mode = ScriptedPrompt::Mode::Deny;
    startPush("t1");
    EXPECT_EQ(broker().activeReceiveCount(), 0u);
    EXPECT_EQ(broker().pendingReplyCount(), 1u);

    channel_.accepting = true;
    timers_.advance(settings_.retryDelay);
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "EPERM:User refused the transfer");
}

TEST_F(TerminalBrokerTest, CancelClosesFilesOnce) {
    std::map<std::string, int> closedCount;
    broker().setFileClosedObserver([&](const std::string& id, const DestFile& f) {
        EXPECT_EQ(id, "t1");
        closedCount[f.fileId]++;
    });
    startPush("t1");
    send(fileCmd("t1", "f1", "~/done"));
    send(fileCmd("t1", "f2", "~/partial"));
    send(dataCmd("t1", "f1", "complete", true));
    send(dataCmd("t1", "f2", "half", false));
    channel_.take();
    EXPECT_EQ(closedCount["f1"], 1);
    EXPECT_EQ(closedCount.count("f2"), 0u);

    send(Message(Action::Cancel, "t1"));
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "CANCELED");
    EXPECT_EQ(broker().activeReceiveCount(), 0u);
    EXPECT_EQ(closedCount["f1"], 1);
    EXPECT_EQ(closedCount["f2"], 1);
}

TEST_F(TerminalBrokerTest, IdleTransfersExpire) {
    std::map<std::string, int> closedCount;
    broker().setFileClosedObserver([&](const std::string&, const DestFile& f) { closedCount[f.fileId]++; });
    startPush("t1");
    send(fileCmd("t1", "f1", "~/slow"));
    send(dataCmd("t1", "f1", "abc", false));

    for (int minute = 1; minute <= 10; ++minute) {
        timers_.advance(std::chrono::minutes(1));
        ASSERT_EQ(broker().activeReceiveCount(), 1u) << "minute " << minute;
    }
    timers_.advance(std::chrono::minutes(1));
    EXPECT_EQ(broker().activeReceiveCount(), 0u);
    EXPECT_EQ(closedCount["f1"], 1);

    // Nothing left to sweep
    timers_.advance(std::chrono::minutes(5));
    EXPECT_EQ(timers_.pending(), 0u);
}

TEST_F(TerminalBrokerTest, CommitHookRunsBeforeAcknowledgement) {
    std::vector<std::string> committed;
    std::vector<size_t> repliesSoFar;
    broker().setCommitHook([&](const std::string& id, const DestFile& f) {
        repliesSoFar.push_back(channel_.payloads.size());
        committed.push_back(id + ":" + f.fileId);
        if (f.fileId == "f2") {
            throw std::runtime_error("extraction failed");
        }
    });
    startPush("t1");
    send(fileCmd("t1", "f1", "~/one"));
    send(fileCmd("t1", "f2", "~/two"));
    channel_.take();

    send(dataCmd("t1", "f1", "1", true));
    send(dataCmd("t1", "f2", "2", true));
    EXPECT_EQ(committed, (std::vector<std::string>{"t1:f1", "t1:f2"}));
    EXPECT_EQ(repliesSoFar, (std::vector<size_t>{0, 1}));
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[0]), "OK");
    EXPECT_EQ(statusOf(replies[1]), "EINVAL:extraction failed");
}

class TerminalBrokerPullTest : public TerminalBrokerTest {
protected:
    void SetUp() override {
        TerminalBrokerTest::SetUp();
        writeFile(home_ / "pull" / "a.txt", "abc");
        writeFile(home_ / "pull" / "sub" / "b.txt", patternedContent(3000));
        fs::create_hard_link(home_ / "pull" / "a.txt", home_ / "pull" / "h");
        fs::create_symlink("a.txt", home_ / "pull" / "s");
    }

    void startPull(const std::string& id, int64_t specs) {
        Message msg(Action::Receive, id);
        msg.size = specs;
        send(msg);
    }
};

TEST_F(TerminalBrokerPullTest, ListsMatchesAndServesData) {
    startPull("p1", 1);
    EXPECT_NE(prompt_.lastMessage.find("read some files"), std::string::npos);
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "OK");

    send(fileCmd("p1", "0", "~/pull"));
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 7u);

    std::map<std::string, Message> byName;
    for (size_t i = 0; i + 1 < replies.size(); ++i) {
        EXPECT_EQ(replies[i].action, Action::File);
        EXPECT_EQ(replies[i].fileId, "0");
        byName[fs::path(replies[i].name).filename().string()] = replies[i];
    }
    EXPECT_EQ(statusOf(replies.back()), "OK");
    EXPECT_EQ(replies.back().name, home_.string());

    const Message& dir = byName.at("pull");
    const Message& a = byName.at("a.txt");
    EXPECT_EQ(dir.fileType, FileType::Directory);
    EXPECT_EQ(dir.status, "0");
    EXPECT_EQ(replies[0].status, "0");
    EXPECT_EQ(a.parent, dir.status);
    EXPECT_EQ(a.size, 3);
    EXPECT_EQ(byName.at("h").fileType, FileType::Hardlink);
    EXPECT_EQ(byName.at("h").dataAsString(), a.status);
    EXPECT_EQ(byName.at("s").fileType, FileType::Symlink);
    EXPECT_EQ(byName.at("s").dataAsString(), a.status);
    EXPECT_EQ(byName.at("b.txt").parent, byName.at("sub").status);

    send(fileCmd("p1", "r1", a.name));
    send(fileCmd("p1", "r2", byName.at("s").name));
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].action, Action::EndData);
    EXPECT_EQ(replies[0].fileId, "r1");
    EXPECT_EQ(replies[0].dataAsString(), "abc");
    EXPECT_EQ(replies[1].fileId, "r2");
    EXPECT_EQ(replies[1].dataAsString(), "a.txt");

    send(fileCmd("p1", "r3", dir.name));
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(statusOf(replies[0]), "EINVAL:Cannot send a directory");
    EXPECT_EQ(broker().activeSendCount(), 0u);
}

TEST_F(TerminalBrokerPullTest, MissingSpecAndEmptyRequest) {
    startPull("p1", 1);
    channel_.take();
    send(fileCmd("p1", "0", "~/does-not-exist"));
    auto replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[0]), "ENOENT:Failed to read spec");
    EXPECT_EQ(replies[0].fileId, "0");
    EXPECT_EQ(statusOf(replies[1]), "OK");

    startPull("p2", 0);
    replies = channel_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(statusOf(replies[0]), "OK");
    EXPECT_EQ(statusOf(replies[1]), "ENOENT:No files found");
    EXPECT_EQ(broker().findSend("p2"), nullptr);
}

TEST_F(TerminalBrokerPullTest, BackpressurePausesSendPump) {
    settings_.chunkSize = 4096;
    writeFile(home_ / "big.bin", patternedContent(40000, 9));
    startPull("p1", 1);
    send(fileCmd("p1", "0", "~/big.bin"));
    channel_.take();

    channel_.accepting = false;
    send(fileCmd("p1", "r1", (home_ / "big.bin").string()));
    EXPECT_TRUE(channel_.payloads.empty());

    channel_.accepting = true;
    std::string received;
    bool ended = false;
    for (int i = 0; i < 1000 && !ended; ++i) {
        timers_.advance(settings_.sendPumpDelay);
        for (const auto& msg : channel_.take()) {
            EXPECT_EQ(msg.fileId, "r1");
            received += msg.dataAsString();
            ended = msg.action == Action::EndData;
        }
    }
    ASSERT_TRUE(ended);
    EXPECT_EQ(received, patternedContent(40000, 9));

    send(Message(Action::Finish, "p1"));
    EXPECT_EQ(broker().activeSendCount(), 0u);
}
