#include <gtest/gtest.h>
#include "lanbeam/transfer/transfer_session.hpp"

using namespace lanbeam::transfer;
using lanbeam::core::ErrorCode;

class TransferSessionTest : public ::testing::Test {
protected:
    static FileTransfer make_file(const std::string& name, std::uint64_t size) {
        FileTransfer file;
        file.name = name;
        file.size = size;
        return file;
    }

    TransferSession make_session() {
        return TransferSession("offer-1", TransferRole::SENDER,
                               {make_file("a.txt", 100), make_file("empty", 0), make_file("c.bin", 10)});
    }
};

TEST_F(TransferSessionTest, FilesRunInOfferOrder) {
    auto session = make_session();

    auto* first = session.begin_next();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->name, "a.txt");
    EXPECT_EQ(first->status, FileTransferStatus::IN_PROGRESS);
    EXPECT_EQ(session.current_index(), std::optional<std::size_t>(0));

    // The current file must finish before the next one starts.
    EXPECT_EQ(session.begin_next(), nullptr);

    ASSERT_TRUE(session.record_progress(60));
    ASSERT_TRUE(session.record_progress(40));
    ASSERT_TRUE(session.complete_current());

    auto* second = session.begin_next();
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->name, "empty");
    ASSERT_TRUE(session.complete_current());

    auto* third = session.begin_next();
    ASSERT_NE(third, nullptr);
    ASSERT_TRUE(session.record_progress(10));
    ASSERT_TRUE(session.complete_current());

    EXPECT_FALSE(session.has_next());
    EXPECT_EQ(session.begin_next(), nullptr);
    EXPECT_TRUE(session.is_finished());
    EXPECT_TRUE(session.succeeded());
    EXPECT_EQ(session.completed_count(), 3u);
    EXPECT_EQ(session.total_bytes(), 110u);
    EXPECT_EQ(session.bytes_transferred(), 110u);
}

TEST_F(TransferSessionTest, ProgressBeyondDeclaredSizeIsRejected) {
    auto session = make_session();
    session.begin_next();

    ASSERT_TRUE(session.record_progress(90));
    auto result = session.record_progress(11);
    EXPECT_EQ(result.error, ErrorCode::PROTOCOL_VIOLATION);
    EXPECT_EQ(session.current()->bytes_transferred, 90u);
}

TEST_F(TransferSessionTest, ShortFileCannotComplete) {
    auto session = make_session();
    session.begin_next();
    session.record_progress(99);

    EXPECT_EQ(session.complete_current().error, ErrorCode::INTEGRITY_MISMATCH);
}

TEST_F(TransferSessionTest, ProgressWithoutCurrentFile) {
    auto session = make_session();
    EXPECT_EQ(session.record_progress(1).error, ErrorCode::INVALID_STATE);
    EXPECT_EQ(session.complete_current().error, ErrorCode::INVALID_STATE);
}

TEST_F(TransferSessionTest, FailRemainingMarksEverythingLeft) {
    auto session = make_session();
    session.begin_next();
    session.record_progress(100);
    session.complete_current();
    session.begin_next();

    session.fail_remaining(ErrorCode::PEER_DISCONNECTED);

    const auto& files = session.files();
    EXPECT_EQ(files[0].status, FileTransferStatus::COMPLETED);
    EXPECT_EQ(files[1].status, FileTransferStatus::FAILED);
    EXPECT_EQ(files[1].error, ErrorCode::PEER_DISCONNECTED);
    EXPECT_EQ(files[2].status, FileTransferStatus::FAILED);
    EXPECT_TRUE(session.is_finished());
    EXPECT_FALSE(session.succeeded());
    EXPECT_EQ(session.completed_count(), 1u);
}

TEST_F(TransferSessionTest, Percentage) {
    auto file = make_file("a", 3);
    EXPECT_EQ(file.percentage(), 0u);
    file.bytes_transferred = 1;
    EXPECT_EQ(file.percentage(), 33u);
    file.bytes_transferred = 2;
    EXPECT_EQ(file.percentage(), 66u);
    file.bytes_transferred = 3;
    EXPECT_EQ(file.percentage(), 100u);

    EXPECT_EQ(make_file("empty", 0).percentage(), 100u);

    auto huge = make_file("huge", UINT64_MAX);
    huge.bytes_transferred = UINT64_MAX / 3;
    EXPECT_EQ(huge.percentage(), 33u);
}

TEST_F(TransferSessionTest, Names) {
    EXPECT_STREQ(to_string(TransferRole::RECEIVER), "receiver");
    EXPECT_STREQ(to_string(FileTransferStatus::IN_PROGRESS), "in_progress");
}
