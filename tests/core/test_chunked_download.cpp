// test_chunked_download.cpp — тесты резюмируемого скачивания

#include <gtest/gtest.h>
#include "FakeDriveServer.h"
#include "cloudannex/Transfer/ChunkedDownload.h"
#include "cloudannex/Errors.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;
using namespace CloudAnnex;
using namespace CloudAnnexTest;

namespace {

std::string makeContent(size_t size) {
    std::string content(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        content[i] = static_cast<char>('a' + (i * 7) % 26);
    }
    return content;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeFile(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
}

} // namespace

class ChunkedDownloadTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDriveServer> server;
    std::shared_ptr<DriveApi> drive;
    std::string destination;

    void SetUp() override {
        server = std::make_shared<FakeDriveServer>();
        drive = std::make_shared<DriveApi>(server, FakeDriveServer::endpoints());
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        destination = (fs::temp_directory_path() / ("ca_download_" + std::to_string(now) + ".bin")).string();
    }

    void TearDown() override {
        fs::remove(destination);
    }
};

TEST_F(ChunkedDownloadTest, DownloadsWholeFileInChunks) {
    auto content = makeContent(25);
    auto id = server->addFile("root", "data.bin", content);

    std::vector<int64_t> progress;
    ChunkedDownload download(drive);
    int64_t size = download.receive(id, destination, 10, [&](int64_t bytes) { progress.push_back(bytes); });

    EXPECT_EQ(size, 25);
    EXPECT_EQ(readFile(destination), content);
    EXPECT_EQ(server->rangeRequests, 3);
    ASSERT_EQ(server->rangeHeaders.size(), 3u);
    EXPECT_EQ(server->rangeHeaders[0], "bytes=0-9");
    EXPECT_EQ(server->rangeHeaders[1], "bytes=10-19");
    EXPECT_EQ(server->rangeHeaders[2], "bytes=20-24");
    EXPECT_EQ(progress, (std::vector<int64_t>{10, 20, 25}));
}

TEST_F(ChunkedDownloadTest, SecondReceiveIsNoOp) {
    auto content = makeContent(30);
    auto id = server->addFile("root", "data.bin", content);

    ChunkedDownload download(drive);
    download.receive(id, destination, 16);
    int rangesAfterFirst = server->rangeRequests;

    int64_t size = download.receive(id, destination, 16);

    EXPECT_EQ(size, 30);
    EXPECT_EQ(server->rangeRequests, rangesAfterFirst);
    EXPECT_EQ(readFile(destination), content);
}

TEST_F(ChunkedDownloadTest, ResumesFromExistingPrefix) {
    auto content = makeContent(40);
    auto id = server->addFile("root", "data.bin", content);
    writeFile(destination, content.substr(0, 15));

    ChunkedDownload download(drive);
    int64_t size = download.receive(id, destination, 10);

    EXPECT_EQ(size, 40);
    EXPECT_EQ(readFile(destination), content);
    ASSERT_FALSE(server->rangeHeaders.empty());
    EXPECT_EQ(server->rangeHeaders.front(), "bytes=15-24");
}

TEST_F(ChunkedDownloadTest, InterruptedDownloadKeepsBytesAndResumes) {
    auto content = makeContent(50);
    auto id = server->addFile("root", "data.bin", content);
    server->failMediaAfter = 2;

    ChunkedDownload download(drive);
    try {
        download.receive(id, destination, 10);
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.status(), 500);
    }
    EXPECT_EQ(fs::file_size(destination), 20u);

    server->failMediaAfter.reset();
    int64_t size = download.receive(id, destination, 10);

    EXPECT_EQ(size, 50);
    EXPECT_EQ(readFile(destination), content);
}

TEST_F(ChunkedDownloadTest, LargerLocalFileIsLeftAlone) {
    auto id = server->addFile("root", "data.bin", makeContent(5));
    writeFile(destination, "0123456789");

    ChunkedDownload download(drive);
    int64_t size = download.receive(id, destination, 4);

    EXPECT_EQ(size, 10);
    EXPECT_EQ(readFile(destination), "0123456789");
    EXPECT_EQ(server->rangeRequests, 0);
}

TEST_F(ChunkedDownloadTest, EmptyRemoteCreatesEmptyLocalFile) {
    auto id = server->addFile("root", "empty.bin", "");

    ChunkedDownload download(drive);
    EXPECT_EQ(download.receive(id, destination, 10), 0);
    EXPECT_EQ(server->rangeRequests, 0);
    ASSERT_TRUE(fs::exists(destination));
    EXPECT_EQ(fs::file_size(destination), 0u);
}

TEST_F(ChunkedDownloadTest, HugeChunkSizeFetchesRemainderInOneRequest) {
    auto content = makeContent(30);
    auto id = server->addFile("root", "data.bin", content);
    writeFile(destination, content.substr(0, 7));

    ChunkedDownload download(drive);
    EXPECT_EQ(download.receive(id, destination, std::numeric_limits<int64_t>::max()), 30);
    EXPECT_EQ(readFile(destination), content);
    EXPECT_EQ(server->rangeRequests, 1);
    ASSERT_EQ(server->rangeHeaders.size(), 1u);
    EXPECT_EQ(server->rangeHeaders.front(), "bytes=7-29");
}

TEST_F(ChunkedDownloadTest, NumericSizeIsAccepted) {
    server->sizeAsString = false;
    auto content = makeContent(12);
    auto id = server->addFile("root", "data.bin", content);

    ChunkedDownload download(drive);
    EXPECT_EQ(download.receive(id, destination, 100), 12);
    EXPECT_EQ(readFile(destination), content);
}

TEST_F(ChunkedDownloadTest, MissingRemoteRaisesTransportError) {
    ChunkedDownload download(drive);
    EXPECT_THROW(download.receive("nope", destination, 10), TransportError);
    EXPECT_FALSE(fs::exists(destination));
}

TEST_F(ChunkedDownloadTest, RejectsNonPositiveChunkSize) {
    auto id = server->addFile("root", "data.bin", makeContent(3));
    ChunkedDownload download(drive);
    EXPECT_THROW(download.receive(id, destination, 0), std::invalid_argument);
}
