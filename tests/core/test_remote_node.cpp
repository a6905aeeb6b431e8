// test_remote_node.cpp — дерево папок и файлов поверх фейкового Drive

#include <gtest/gtest.h>
#include "FakeDriveServer.h"
#include "cloudannex/Tree/RemoteNode.h"
#include "cloudannex/Errors.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace CloudAnnex;
using namespace CloudAnnexTest;

class RemoteNodeTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDriveServer> server;
    std::shared_ptr<DriveApi> drive;
    std::shared_ptr<RemoteRoot> root;
    std::string localPath;

    void SetUp() override {
        server = std::make_shared<FakeDriveServer>();
        drive = std::make_shared<DriveApi>(server, FakeDriveServer::endpoints());
        root = RemoteRoot::create(drive, nullptr);

        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        localPath = (fs::temp_directory_path() / ("ca_node_" + std::to_string(now) + ".bin")).string();
    }

    void TearDown() override {
        fs::remove(localPath);
    }

    void writeLocal(const std::string& data) {
        std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
        out << data;
    }

    std::string readLocal() const {
        std::ifstream in(localPath, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

// ═══════════════════════════════════════════════════════════
// child
// ═══════════════════════════════════════════════════════════

TEST_F(RemoteNodeTest, ChildReturnsVariantByKind) {
    server->addFolder("root", "Docs");
    server->addFile("root", "notes.txt", "hello");

    auto folder = root->child("Docs");
    ASSERT_NE(folder, nullptr);
    EXPECT_TRUE(folder->isFolder());
    EXPECT_EQ(folder->name(), "Docs");
    EXPECT_EQ(folder->parent(), root);

    auto leaf = root->child("notes.txt");
    ASSERT_NE(leaf, nullptr);
    EXPECT_TRUE(leaf->isLeaf());
    EXPECT_NO_THROW(leaf->asLeaf());
    EXPECT_THROW(leaf->asFolder(), TypeConflictError);
}

TEST_F(RemoteNodeTest, MissingChildIsNull) {
    EXPECT_EQ(root->child("nothing"), nullptr);
}

TEST_F(RemoteNodeTest, DuplicateNamesAreAmbiguous) {
    server->addFile("root", "dup.txt", "1");
    server->addFile("root", "dup.txt", "2");

    EXPECT_THROW(root->child("dup.txt"), AmbiguousNameError);
}

TEST_F(RemoteNodeTest, NamesWithQuotesAreLookedUpExactly) {
    server->addFile("root", "it's.txt", "x");
    ASSERT_NE(root->child("it's.txt"), nullptr);
    EXPECT_EQ(root->child("its.txt"), nullptr);
}

// ═══════════════════════════════════════════════════════════
// mkdir
// ═══════════════════════════════════════════════════════════

TEST_F(RemoteNodeTest, MkdirCreatesFolder) {
    auto folder = root->mkdir("Backups");

    ASSERT_NE(folder, nullptr);
    ASSERT_TRUE(folder->id().has_value());
    EXPECT_EQ(server->item(*folder->id()).mimeType, FOLDER_MIME_TYPE);
    EXPECT_EQ(server->item(*folder->id()).parentId, "root");
    EXPECT_EQ(server->createFolderRequests, 1);
}

TEST_F(RemoteNodeTest, MkdirIsIdempotent) {
    auto first = root->mkdir("Backups");
    auto second = root->mkdir("Backups");

    EXPECT_EQ(first->id(), second->id());
    EXPECT_EQ(server->createFolderRequests, 1);
    EXPECT_EQ(server->childrenOf("root").size(), 1u);
}

TEST_F(RemoteNodeTest, MkdirOverLeafIsTypeConflict) {
    server->addFile("root", "Backups", "not a folder");

    EXPECT_THROW(root->mkdir("Backups"), TypeConflictError);
    EXPECT_EQ(server->createFolderRequests, 0);
}

TEST_F(RemoteNodeTest, NestedMkdirKeepsParentChain) {
    auto a = root->mkdir("a");
    auto b = a->mkdir("b");

    ASSERT_TRUE(b->id().has_value());
    EXPECT_EQ(server->item(*b->id()).parentId, *a->id());
    EXPECT_EQ(b->parent(), a);
}

// ═══════════════════════════════════════════════════════════
// resolvePath
// ═══════════════════════════════════════════════════════════

TEST_F(RemoteNodeTest, ResolvePathFindsLeaf) {
    auto a = server->addFolder("root", "a");
    auto b = server->addFolder(a, "b");
    auto c = server->addFile(b, "c", "content");

    auto node = root->resolvePath("a/b/c");

    ASSERT_NE(node, nullptr);
    EXPECT_TRUE(node->isLeaf());
    EXPECT_EQ(node->name(), "c");
    EXPECT_EQ(node->id(), std::optional<std::string>(c));
}

TEST_F(RemoteNodeTest, ResolvePathMissingSegmentIsNull) {
    server->addFolder("root", "a");
    EXPECT_EQ(root->resolvePath("a/zzz"), nullptr);
    EXPECT_EQ(root->resolvePath("zzz/a"), nullptr);
}

TEST_F(RemoteNodeTest, ResolvePathThroughLeafIsUnsupported) {
    server->addFile("root", "file.txt", "x");
    EXPECT_THROW(root->resolvePath("file.txt/inner"), UnsupportedOperationError);
}

TEST_F(RemoteNodeTest, EmptyPathResolvesToSelf) {
    EXPECT_EQ(root->resolvePath(""), root);
    EXPECT_EQ(root->resolvePath("/"), root);
}

TEST_F(RemoteNodeTest, ResolvedDeepNodeKeepsWorkingAfterAncestorsAreGone) {
    auto a = server->addFolder("root", "a");
    auto b = server->addFolder(a, "b");
    server->addFile(b, "c.txt", "payload");

    auto leaf = root->resolvePath("/a//b/c.txt/");
    ASSERT_NE(leaf, nullptr);
    EXPECT_TRUE(leaf->hasBoundContext());
    EXPECT_EQ(leaf->parent(), nullptr);

    EXPECT_EQ(leaf->asLeaf()->receive(localPath), 7);
    EXPECT_EQ(readLocal(), "payload");
}

TEST_F(RemoteNodeTest, KeptMkdirResultOutlivesItsParent) {
    auto inner = root->mkdir("a")->mkdir("b");
    EXPECT_EQ(inner->parent(), nullptr);

    auto grandchild = inner->mkdir("c");
    ASSERT_NE(grandchild, nullptr);
    EXPECT_TRUE(server->hasItem(*grandchild->id()));
    EXPECT_EQ(server->item(*grandchild->id()).parentId, *inner->id());
    EXPECT_EQ(inner->session(), root->session());
}

TEST_F(RemoteNodeTest, KeptChildAndUploadedLeafOutliveTheirParent) {
    writeLocal("payload");
    std::shared_ptr<RemoteNode> found;
    std::shared_ptr<RemoteLeaf> uploaded;
    {
        auto folder = root->mkdir("tmp");
        folder->mkdir("inner");
        found = folder->child("inner");
        uploaded = folder->uploadLeaf("data.bin", localPath, 4);
    }

    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->asFolder()->child("x"), nullptr);

    auto destination = localPath + ".copy";
    EXPECT_EQ(uploaded->receive(destination, 3), 7);
    fs::remove(destination);
}

TEST_F(RemoteNodeTest, EmptyPathOnRemovedFolderIsUnsupported) {
    auto folder = root->mkdir("gone");
    folder->remove();
    EXPECT_THROW(folder->resolvePath(""), UnsupportedOperationError);
    EXPECT_THROW(folder->resolvePath("a/b"), UnsupportedOperationError);
}

// ═══════════════════════════════════════════════════════════
// uploadLeaf / receive
// ═══════════════════════════════════════════════════════════

TEST_F(RemoteNodeTest, UploadLeafThenDownload) {
    writeLocal("some file content");
    auto folder = root->mkdir("up");

    auto leaf = folder->uploadLeaf("data.bin", localPath, 5);

    ASSERT_NE(leaf, nullptr);
    ASSERT_TRUE(leaf->id().has_value());
    EXPECT_EQ(server->item(*leaf->id()).content, "some file content");
    EXPECT_EQ(server->item(*leaf->id()).parentId, *folder->id());
    EXPECT_EQ(server->chunkRequests, 4);

    fs::remove(localPath);
    EXPECT_EQ(leaf->receive(localPath, 4), 17);
    EXPECT_EQ(readLocal(), "some file content");
}

TEST_F(RemoteNodeTest, UploadLeafOverExistingNameFails) {
    writeLocal("x");
    server->addFile("root", "taken.bin", "y");

    EXPECT_THROW(root->uploadLeaf("taken.bin", localPath), AlreadyExistsError);
    EXPECT_EQ(server->initiateRequests, 0);
}

TEST_F(RemoteNodeTest, TransferStateOnlyDuringReceive) {
    server->addFile("root", "big.bin", std::string(30, 'z'));
    auto leaf = root->child("big.bin")->asLeaf();

    EXPECT_FALSE(leaf->transferState().has_value());

    std::vector<double> observed;
    leaf->receive(localPath, 10, [&](int64_t) {
        ASSERT_TRUE(leaf->transferState().has_value());
        EXPECT_EQ(leaf->transferState()->direction, TransferDirection::Download);
        EXPECT_EQ(leaf->transferState()->totalSize, 30);
        observed.push_back(leaf->transferState()->progress());
    });

    EXPECT_FALSE(leaf->transferState().has_value());
    ASSERT_EQ(observed.size(), 3u);
    EXPECT_DOUBLE_EQ(observed.back(), 1.0);
}

TEST_F(RemoteNodeTest, TransferStateClearedOnFailure) {
    server->addFile("root", "big.bin", std::string(30, 'z'));
    auto leaf = root->child("big.bin")->asLeaf();
    server->failMediaAfter = 1;

    EXPECT_THROW(leaf->receive(localPath, 10), TransportError);
    EXPECT_FALSE(leaf->transferState().has_value());
}

// ═══════════════════════════════════════════════════════════
// remove / root
// ═══════════════════════════════════════════════════════════

TEST_F(RemoteNodeTest, RemoveMakesTombstone) {
    server->addFile("root", "old.txt", "x");
    auto leaf = root->child("old.txt");
    auto id = *leaf->id();

    leaf->remove();

    EXPECT_TRUE(leaf->isRemoved());
    EXPECT_FALSE(server->hasItem(id));
    EXPECT_THROW(leaf->remove(), UnsupportedOperationError);
    EXPECT_THROW(leaf->asLeaf()->receive(localPath), UnsupportedOperationError);
    EXPECT_EQ(server->deleteRequests, 1);
}

TEST_F(RemoteNodeTest, RemovedFolderCannotCreateChildren) {
    auto folder = root->mkdir("gone");
    folder->remove();

    EXPECT_THROW(folder->mkdir("x"), UnsupportedOperationError);
    EXPECT_THROW(folder->child("x"), UnsupportedOperationError);
}

TEST_F(RemoteNodeTest, RootCannotBeRemoved) {
    EXPECT_THROW(root->remove(), UnsupportedOperationError);
    EXPECT_FALSE(root->isRemoved());
    EXPECT_EQ(server->deleteRequests, 0);
}

TEST_F(RemoteNodeTest, SetRootRetargetsLookups) {
    auto vault = root->mkdir("Vault");
    server->addFile(*vault->id(), "inside.txt", "x");

    root->setRoot(*vault);

    EXPECT_EQ(root->id(), vault->id());
    EXPECT_EQ(root->name(), "Vault");
    EXPECT_NE(root->child("inside.txt"), nullptr);
    EXPECT_EQ(root->child("Vault"), nullptr);
}

TEST_F(RemoteNodeTest, CustomRootId) {
    auto folderId = server->addFolder("root", "AppData");
    server->addFile(folderId, "cfg.json", "{}");

    auto appRoot = RemoteRoot::create(drive, nullptr, folderId);
    EXPECT_NE(appRoot->child("cfg.json"), nullptr);
}
