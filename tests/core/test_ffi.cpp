// test_ffi.cpp — C API: открытие хранилища, журнал, коды ошибок

#include <gtest/gtest.h>
#include "cloudannex/cloudannex_c.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

class FfiDriveTest : public ::testing::Test {
protected:
    std::string journalPath;

    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        journalPath = (fs::temp_directory_path() / ("ca_ffi_" + std::to_string(now) + ".db")).string();
        ca_clear_error();
    }

    void TearDown() override {
        fs::remove(journalPath);
    }

    // Порт 1 на loopback закрыт: любой запрос завершается ошибкой соединения
    std::string offlineConfig(bool withJournal) const {
        json j;
        j["apiBaseUrl"] = "http://127.0.0.1:1/drive/v3";
        j["uploadBaseUrl"] = "http://127.0.0.1:1/upload/drive/v3";
        j["accessToken"] = "test-token";
        j["timeoutSec"] = 5;
        j["logLevel"] = "warn";
        if (withJournal) {
            j["journalPath"] = journalPath;
        }
        return j.dump();
    }
};

TEST_F(FfiDriveTest, OpenRejectsNullConfig) {
    CAError error = CA_OK;
    EXPECT_EQ(ca_drive_open(nullptr, &error), nullptr);
    EXPECT_EQ(error, CA_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ca_last_error(), CA_ERROR_INVALID_ARGUMENT);
}

TEST_F(FfiDriveTest, OpenRejectsMalformedConfig) {
    CAError error = CA_OK;
    EXPECT_EQ(ca_drive_open("{oops", &error), nullptr);
    EXPECT_EQ(error, CA_ERROR_INVALID_ARGUMENT);
    EXPECT_STRNE(ca_last_error_message(), "");

    ca_clear_error();
    EXPECT_EQ(ca_last_error(), CA_OK);
    EXPECT_STREQ(ca_last_error_message(), "");
}

TEST_F(FfiDriveTest, PendingUploadsWithJournal) {
    CAError error = CA_ERROR_INTERNAL;
    CADrive drive = ca_drive_open(offlineConfig(true).c_str(), &error);
    ASSERT_NE(drive, nullptr);
    EXPECT_EQ(error, CA_OK);
    EXPECT_TRUE(fs::exists(journalPath));

    char* pending = ca_drive_pending_uploads(drive);
    ASSERT_NE(pending, nullptr);
    EXPECT_STREQ(pending, "[]");
    ca_free_string(pending);

    EXPECT_EQ(ca_drive_abandon_upload(drive, 42), CA_ERROR_NOT_FOUND);

    ca_drive_close(drive);
}

TEST_F(FfiDriveTest, AbandonWithoutJournalIsUnsupported) {
    CADrive drive = ca_drive_open(offlineConfig(false).c_str(), nullptr);
    ASSERT_NE(drive, nullptr);

    char* pending = ca_drive_pending_uploads(drive);
    ASSERT_NE(pending, nullptr);
    EXPECT_STREQ(pending, "[]");
    ca_free_string(pending);

    EXPECT_EQ(ca_drive_abandon_upload(drive, 1), CA_ERROR_UNSUPPORTED);

    ca_drive_close(drive);
}

TEST_F(FfiDriveTest, ConnectionFailureMapsToNetworkError) {
    CADrive drive = ca_drive_open(offlineConfig(false).c_str(), nullptr);
    ASSERT_NE(drive, nullptr);

    EXPECT_EQ(ca_drive_stat(drive, "a/b"), nullptr);
    EXPECT_EQ(ca_last_error(), CA_ERROR_NETWORK);

    EXPECT_EQ(ca_drive_download(drive, "a/b", "/tmp/never", nullptr, nullptr), -1);
    EXPECT_EQ(ca_last_error(), CA_ERROR_NETWORK);

    ca_drive_close(drive);
}

TEST_F(FfiDriveTest, NullHandlesAreInvalidArguments) {
    EXPECT_EQ(ca_drive_stat(nullptr, "a"), nullptr);
    EXPECT_EQ(ca_last_error(), CA_ERROR_INVALID_ARGUMENT);

    EXPECT_EQ(ca_drive_remove(nullptr, "a"), CA_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ca_drive_mkdir(nullptr, "a"), nullptr);
    EXPECT_EQ(ca_drive_upload(nullptr, "x", "y", "z", nullptr, nullptr), nullptr);
    EXPECT_EQ(ca_drive_pending_uploads(nullptr), nullptr);

    // Закрытие nullptr безопасно
    ca_drive_close(nullptr);
}

TEST(FfiLogLevelTest, SetLogLevel) {
    EXPECT_EQ(ca_set_log_level(nullptr), CA_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(ca_set_log_level("info"), CA_OK);
    EXPECT_EQ(ca_last_error(), CA_OK);
}
