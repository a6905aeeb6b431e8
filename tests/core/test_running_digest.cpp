#include <gtest/gtest.h>
#include "cloudannex/Transfer/RunningDigest.h"
#include "cloudannex/Errors.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace CloudAnnex;

TEST(RunningDigestTest, KnownVectors) {
    RunningDigest empty;
    EXPECT_EQ(empty.hexDigest(), "d41d8cd98f00b204e9800998ecf8427e");

    RunningDigest abc;
    abc.update("abc");
    EXPECT_EQ(abc.hexDigest(), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(abc.bytesHashed(), 3);
}

TEST(RunningDigestTest, HexDigestDoesNotFinalize) {
    RunningDigest digest;
    digest.update("ab");
    auto partial = digest.hexDigest();
    digest.update("c");

    EXPECT_NE(partial, digest.hexDigest());
    EXPECT_EQ(digest.hexDigest(), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(RunningDigestTest, CopyIsIndependent) {
    RunningDigest base;
    base.update("ab");

    RunningDigest candidate(base);
    candidate.update("c");

    EXPECT_EQ(candidate.hexDigest(), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(base.bytesHashed(), 2);

    base = candidate;
    EXPECT_EQ(base.hexDigest(), candidate.hexDigest());
}

TEST(RunningDigestTest, ResetStartsOver) {
    RunningDigest digest;
    digest.update("garbage");
    digest.reset();
    digest.update("abc");
    EXPECT_EQ(digest.hexDigest(), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(RunningDigestTest, FilePrefix) {
    auto path = (fs::temp_directory_path() / "ca_digest_prefix.bin").string();
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "abcdef";
    }

    EXPECT_EQ(RunningDigest::ofFilePrefix(path, 3).hexDigest(), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(RunningDigest::ofFilePrefix(path, 0).bytesHashed(), 0);
    EXPECT_THROW(RunningDigest::ofFilePrefix(path, 10), LocalIoError);
    EXPECT_THROW(RunningDigest::ofFilePrefix(path + ".missing", 1), LocalIoError);

    fs::remove(path);
}
