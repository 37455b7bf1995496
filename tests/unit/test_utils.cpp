#include <gtest/gtest.h>
#include "Encoding.h"
#include "PathUtils.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

using namespace TermXfer;
namespace fs = std::filesystem;

TEST(EncodingTest, Base64IsUnpadded) {
    EXPECT_EQ(Encoding::base64Encode(std::string("f")), "Zg");
    EXPECT_EQ(Encoding::base64Encode(std::string("fo")), "Zm8");
    EXPECT_EQ(Encoding::base64Encode(std::string("foo")), "Zm9v");
    EXPECT_EQ(Encoding::base64Encode(std::string()), "");
}

TEST(EncodingTest, Base64DecodeAcceptsPaddedAndUnpadded) {
    std::vector<uint8_t> expected{'f', 'o'};
    EXPECT_EQ(Encoding::base64Decode("Zm8"), expected);
    EXPECT_EQ(Encoding::base64Decode("Zm8="), expected);
    EXPECT_TRUE(Encoding::base64Decode("").empty());
    EXPECT_THROW(Encoding::base64Decode("Zm9vY"), std::invalid_argument);
    EXPECT_THROW(Encoding::base64Decode("Zm*v"), std::invalid_argument);
}

TEST(EncodingTest, Sha256OfKnownText) {
    EXPECT_EQ(Encoding::sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(EncodingTest, RandomBytesHaveRequestedLength) {
    EXPECT_EQ(Encoding::randomBytes(16).size(), 16u);
    EXPECT_TRUE(Encoding::randomBytes(0).empty());
}

TEST(EncodingTest, SafeStringAndSanitize) {
    EXPECT_EQ(Encoding::safeString("ab c;1:2/x@y-z.\x1b"), "abc1:2/x@y-z.");
    EXPECT_EQ(Encoding::sanitizeControlCodes("a\x1b[31mb\n"), "a?[31mb?");
    EXPECT_EQ(Encoding::sanitizeControlCodes("x\xc2\x9by"), "x?y");
    EXPECT_EQ(Encoding::sanitizeControlCodes("caf\xc3\xa9"), "caf\xc3\xa9");
}

TEST(PathContextTest, ExpandsHomeAndResolvesNames) {
    PathContext ctx("/home/user", "/work");
    EXPECT_EQ(ctx.expandHome("~"), "/home/user");
    EXPECT_EQ(ctx.expandHome("~/a/b"), "/home/user/a/b");
    EXPECT_EQ(ctx.expandHome("~other/x"), "~other/x");

    EXPECT_EQ(ctx.absPath("a/../b/"), "/work/b");
    EXPECT_EQ(ctx.absPath("x", true), "/home/user/x");
    EXPECT_EQ(ctx.resolveRemoteName("docs/f"), "/home/user/docs/f");
    EXPECT_EQ(ctx.resolveRemoteName("/etc/./hosts"), "/etc/hosts");
}

TEST(PathContextTest, HomeRelative) {
    PathContext ctx("/home/user/", "/");
    EXPECT_EQ(ctx.homeRelative("/home/user"), "~");
    EXPECT_EQ(ctx.homeRelative("/home/user/a/b"), "~/a/b");
    EXPECT_EQ(ctx.homeRelative("/home/username"), "/home/username");
    EXPECT_EQ(PathContext("/", "/").homeRelative("/a"), "/a");
}

TEST(PathUtilsTest, RelativeTo) {
    EXPECT_EQ(PathUtils::relativeTo("/a/b/c", "/a/b"), "c");
    EXPECT_EQ(PathUtils::relativeTo("/a/x", "/a/b"), "../x");
}

TEST(PathUtilsTest, ApplyMetadata) {
    fs::path dir = fs::temp_directory_path() / ("termxfer_utils_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir / "nested");

    fs::path file = dir / "nested" / "f";
    std::ofstream(file) << "x";
    const int64_t mtime = 1700000000123456789LL;
    PathUtils::applyMetadata(file.string(), 0640, mtime);

    struct stat st {};
    ASSERT_EQ(stat(file.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0640u);
    EXPECT_EQ(static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec, mtime);

    EXPECT_THROW(PathUtils::applyMetadata((dir / "missing").string(), 0600, -1), std::system_error);
    fs::remove_all(dir);
}
