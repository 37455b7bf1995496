#include <gtest/gtest.h>

#include "WireCodec.h"
#include "TransferErrors.h"
#include "Encoding.h"

using namespace TermXfer;

TEST(WireCodecTest, OmitsFieldsAtTheirDefaults) {
    Message msg(Action::Send, "abc");
    EXPECT_EQ(WireCodec::serialize(msg), "ac=send;id=abc");
}

TEST(WireCodecTest, RoundTripsEveryField) {
    Message msg(Action::File, "t1", "f:2");
    msg.compression = CompressionType::Zlib;
    msg.fileType = FileType::Hardlink;
    msg.transmissionType = TransmissionType::Rsync;
    msg.bypass = "sha256:00ff";
    msg.quiet = 1;
    msg.mtime = 1700000000123456789LL;
    msg.permissions = 0644;
    msg.size = 12345;
    msg.name = "dir;with;semicolons/ünïcode.txt";
    msg.status = "OK";
    msg.parent = "7";
    msg.data = {0, 1, 2, ';', 255};

    std::string wire = WireCodec::serialize(msg);
    EXPECT_NE(wire.find("ft=link"), std::string::npos);
    EXPECT_NE(wire.find("tt=rsync"), std::string::npos);

    Message back = WireCodec::deserialize(wire);
    EXPECT_EQ(back, msg);
}

TEST(WireCodecTest, DoubledSemicolonIsPartOfValue) {
    // st is base64 of "OK"; the unknown key carries an escaped separator
    Message msg = WireCodec::deserialize("ac=status;id=x;zz=a;;b;st=T0s");
    EXPECT_EQ(msg.action, Action::Status);
    EXPECT_EQ(msg.status, "OK");
}

TEST(WireCodecTest, IdentifiersAreRestrictedToSafeCharacters) {
    Message msg = WireCodec::deserialize("ac=data;id=ab c$d;fid=x\x1b[1");
    EXPECT_EQ(msg.transferId, "abcd");
    EXPECT_EQ(msg.fileId, "x1");
}

TEST(WireCodecTest, RejectsMalformedInput) {
    EXPECT_THROW(WireCodec::deserialize("id=abc"), ProtocolError);
    EXPECT_THROW(WireCodec::deserialize("ac=bogus;id=abc"), ProtocolError);
    EXPECT_THROW(WireCodec::deserialize("ac=send;sz=12x"), ProtocolError);
    EXPECT_THROW(WireCodec::deserialize("ac=send;n=!!!"), ProtocolError);
    EXPECT_THROW(WireCodec::deserialize("ac"), ProtocolError);
}

TEST(WireCodecTest, IgnoresUnknownKeysAndEmptyPairs) {
    Message msg = WireCodec::deserialize(";ac=cancel;;future=1;id=q");
    EXPECT_EQ(msg.action, Action::Cancel);
    EXPECT_EQ(msg.transferId, "q");
}

TEST(WireCodecTest, EscapeCodeEnvelope) {
    std::string env = WireCodec::wrapEscapeCode("ac=send;id=1");
    EXPECT_EQ(env, "\x1b]5113;ac=send;id=1\x1b\\");
    EXPECT_EQ(WireCodec::unwrapEscapeCode(env), "ac=send;id=1");
    EXPECT_EQ(WireCodec::unwrapEscapeCode("\x1b]5113;ac=send\a"), "ac=send");
    EXPECT_THROW(WireCodec::unwrapEscapeCode("\x1b]52;abc\x1b\\"), ProtocolError);
    EXPECT_THROW(WireCodec::unwrapEscapeCode("\x1b]5113;ac=send"), ProtocolError);
}

TEST(WireCodecTest, BypassTokenVerification) {
    std::string token = WireCodec::encodeBypass("id1", "secret");
    EXPECT_EQ(token.rfind("sha256:", 0), 0u);
    EXPECT_EQ(token, "sha256:" + Encoding::sha256Hex("id1;secret"));

    EXPECT_TRUE(WireCodec::checkBypass("secret", "id1", token));
    EXPECT_FALSE(WireCodec::checkBypass("other", "id1", token));
    EXPECT_FALSE(WireCodec::checkBypass("secret", "id2", token));
    EXPECT_FALSE(WireCodec::checkBypass("", "id1", WireCodec::encodeBypass("id1", "")));
    EXPECT_FALSE(WireCodec::checkBypass("secret", "id1", "md5:abcdef"));
}

TEST(WireCodecTest, SplitForTransferMarksOnlyTheLastChunk) {
    std::vector<uint8_t> payload(10000, 'x');
    auto parts = WireCodec::splitForTransfer(payload, "t", "f", true);
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0].action, Action::Data);
    EXPECT_EQ(parts[1].action, Action::Data);
    EXPECT_EQ(parts[2].action, Action::EndData);
    EXPECT_EQ(parts[0].data.size(), WIRE_CHUNK_SIZE);
    EXPECT_EQ(parts[2].data.size(), 10000 - 2 * WIRE_CHUNK_SIZE);
    EXPECT_EQ(parts[2].transferId, "t");
    EXPECT_EQ(parts[2].fileId, "f");

    auto unmarked = WireCodec::splitForTransfer(payload, "t", "f", false);
    EXPECT_EQ(unmarked.back().action, Action::Data);

    EXPECT_TRUE(WireCodec::splitForTransfer({}, "t", "f", true).empty());
}

TEST(WireCodecTest, TransmissionErrorRendering) {
    TransmissionError err(StatusCode::EINVAL_CODE, "bad thing", "f1");
    EXPECT_EQ(err.statusText(), "EINVAL:bad thing");
    Message msg = err.asMessage("t1");
    EXPECT_EQ(msg.action, Action::Status);
    EXPECT_EQ(msg.transferId, "t1");
    EXPECT_EQ(msg.fileId, "f1");
    EXPECT_EQ(msg.status, "EINVAL:bad thing");

    TransmissionError ok(StatusCode::OK, "");
    EXPECT_EQ(ok.statusText(), "OK");

    EXPECT_EQ(errnoName(ENOENT), "ENOENT");
    EXPECT_EQ(errnoName(EACCES), "EACCES");

    std::string code, text;
    splitStatus("EPERM:User refused the transfer", code, text);
    EXPECT_EQ(code, "EPERM");
    EXPECT_EQ(text, "User refused the transfer");
    splitStatus("OK", code, text);
    EXPECT_EQ(code, "OK");
    EXPECT_TRUE(text.empty());
}

TEST(WireCodecTest, RandomTransferIdIsSafe) {
    std::string id = WireCodec::randomTransferId();
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(Encoding::safeString(id), id);
}
