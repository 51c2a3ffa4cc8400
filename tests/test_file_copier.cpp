#include <gtest/gtest.h>

#include "core/file_copier/file_copier.hpp"
#include "infra/interrupt.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using lazycp::core::ConflictDecision;
using lazycp::core::ConflictResolver;
using lazycp::core::CopyOptions;
using lazycp::core::CopyOutcome;
using lazycp::core::FileCopier;
using lazycp::infra::ErrorCode;
using namespace lazycp::testing;

class FileCopierTest : public ::testing::Test {
protected:
    auto copier(std::initializer_list<ConflictDecision> decisions = {ConflictDecision::Overwrite})
        -> FileCopier&
    {
        decisions_ = std::make_unique<ScriptedDecisions>(decisions);
        resolver_ = std::make_unique<ConflictResolver>(*decisions_);
        copier_ = std::make_unique<FileCopier>(options_, *resolver_, progress_, log_.logger());
        return *copier_;
    }

    void TearDown() override {
        lazycp::infra::reset_interrupted();
    }

    ScratchDir dir_;
    CopyOptions options_{};
    RecordingProgress progress_;
    CapturingLogger log_;
    std::unique_ptr<ScriptedDecisions> decisions_;
    std::unique_ptr<ConflictResolver> resolver_;
    std::unique_ptr<FileCopier> copier_;
};

TEST_F(FileCopierTest, CopiesInFixedChunks)
{
    options_.chunk_size = 4;
    write_file(dir_ / "digits.txt", "0123456789");

    auto res = copier().copy(dir_ / "digits.txt", dir_ / "out.txt");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Copied);
    EXPECT_EQ(res->chunks, 3u);
    EXPECT_EQ(res->bytes, 10u);

    EXPECT_EQ(progress_.advances, (std::vector<std::uint64_t>{4, 4, 2}));
    EXPECT_EQ(progress_.transferred, 10u);
    EXPECT_EQ(progress_.total, 10u);
    ASSERT_EQ(progress_.labels.size(), 1u);
    EXPECT_EQ(progress_.labels.front(), "digits.txt");
    for (double latency : progress_.latencies) {
        EXPECT_GE(latency, 0.0);
    }
    EXPECT_EQ(progress_.ends, 1);
    EXPECT_FALSE(progress_.active);

    EXPECT_EQ(read_file(dir_ / "out.txt"), "0123456789");
    EXPECT_TRUE(log_.contains("Success copying"));
    EXPECT_TRUE(decisions_->asked.empty());
}

TEST_F(FileCopierTest, CopiesBinaryContentExactly)
{
    const auto data = all_bytes() + all_bytes();
    write_file(dir_ / "src.bin", data);

    auto res = copier().copy(dir_ / "src.bin", dir_ / "dest.bin");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Copied);
    EXPECT_EQ(read_file(dir_ / "dest.bin"), data);
}

TEST_F(FileCopierTest, TextWithMultibyteAcrossChunksIsCopied)
{
    options_.chunk_size = 3;
    const std::string text = "h\xc3\xa9llo w\xe2\x82\xac rld\r\nline two\n";
    write_file(dir_ / "t.txt", text);

    auto res = copier().copy(dir_ / "t.txt", dir_ / "u.txt");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Copied);
    EXPECT_EQ(read_file(dir_ / "u.txt"), text);
}

TEST_F(FileCopierTest, EmptyFileCreatesDestination)
{
    write_file(dir_ / "empty", "");

    auto res = copier().copy(dir_ / "empty", dir_ / "empty.copy");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Copied);
    EXPECT_EQ(res->chunks, 0u);
    EXPECT_TRUE(progress_.advances.empty());
    EXPECT_EQ(progress_.ends, 1);

    ASSERT_TRUE(fs::exists(dir_ / "empty.copy"));
    EXPECT_EQ(fs::file_size(dir_ / "empty.copy"), 0u);
    EXPECT_TRUE(log_.contains("Success copying"));
}

TEST_F(FileCopierTest, OverwriteReplacesExistingDestination)
{
    write_file(dir_ / "src.bin", all_bytes());
    write_file(dir_ / "dest.bin", "old content that is longer than nothing");

    auto res = copier({ConflictDecision::Overwrite}).copy(dir_ / "src.bin", dir_ / "dest.bin");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Copied);
    ASSERT_EQ(decisions_->asked.size(), 1u);
    EXPECT_EQ(decisions_->asked.front(), dir_ / "dest.bin");
    EXPECT_EQ(read_file(dir_ / "dest.bin"), all_bytes());
}

TEST_F(FileCopierTest, SkipLeavesDestinationUntouched)
{
    write_file(dir_ / "src.bin", all_bytes());
    write_file(dir_ / "dest.bin", "keep me");

    auto res = copier({ConflictDecision::Skip}).copy(dir_ / "src.bin", dir_ / "dest.bin");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Skipped);
    EXPECT_EQ(read_file(dir_ / "dest.bin"), "keep me");
    EXPECT_EQ(progress_.begins, 0);
}

TEST_F(FileCopierTest, AbortIsReturnedAsError)
{
    write_file(dir_ / "src.bin", all_bytes());
    write_file(dir_ / "dest.bin", "keep me");

    auto res = copier({ConflictDecision::Abort}).copy(dir_ / "src.bin", dir_ / "dest.bin");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::Aborted);
    EXPECT_NE(res.error().to_exit_code(), 0);
    EXPECT_EQ(read_file(dir_ / "dest.bin"), "keep me");
}

TEST_F(FileCopierTest, MissingParentDirectoryIsContained)
{
    write_file(dir_ / "a.txt", "hello");

    auto res = copier().copy(dir_ / "a.txt", dir_ / "no" / "such" / "a.txt");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Failed);
    EXPECT_TRUE(log_.contains("Error copying"));
    EXPECT_EQ(progress_.ends, 1);
    EXPECT_FALSE(progress_.active);
}

TEST_F(FileCopierTest, MissingSourceIsContained)
{
    auto res = copier().copy(dir_ / "ghost.txt", dir_ / "out.txt");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Failed);
    EXPECT_TRUE(log_.contains("Error copying"));
    EXPECT_FALSE(fs::exists(dir_ / "out.txt"));
}

TEST_F(FileCopierTest, MisclassifiedBinaryFailsInTextMode)
{
    options_.chunk_size = 8;
    // Первые 16 байт корректны как UTF-8, дальше мусор
    write_file(dir_ / "tricky.dat", std::string(16, 'A') + "\xff\xfe\xfd");

    auto res = copier().copy(dir_ / "tricky.dat", dir_ / "tricky.copy");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Failed);
    EXPECT_TRUE(log_.contains("not valid UTF-8"));
    EXPECT_EQ(progress_.ends, 1);
    // Уже записанные чанки остаются
    EXPECT_EQ(read_file(dir_ / "tricky.copy"), std::string(16, 'A'));
}

TEST_F(FileCopierTest, InterruptStopsCopy)
{
    write_file(dir_ / "a.txt", "hello");
    lazycp::infra::g_interrupted.store(true);

    auto res = copier().copy(dir_ / "a.txt", dir_ / "b.txt");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::Interrupted);
    EXPECT_EQ(res.error().to_exit_code(), 0);
    EXPECT_FALSE(progress_.active);
}

TEST_F(FileCopierTest, OverwriteReplacesLinkInsteadOfWritingThrough)
{
    write_file(dir_ / "src.txt", "new");
    write_file(dir_ / "outside.txt", "precious");
    fs::create_directory(dir_ / "dest");
    fs::create_symlink(dir_ / "outside.txt", dir_ / "dest" / "f.txt");

    auto res = copier({ConflictDecision::Overwrite}).copy(dir_ / "src.txt", dir_ / "dest" / "f.txt");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Copied);

    EXPECT_FALSE(fs::is_symlink(dir_ / "dest" / "f.txt"));
    EXPECT_EQ(read_file(dir_ / "dest" / "f.txt"), "new");
    EXPECT_EQ(read_file(dir_ / "outside.txt"), "precious");
}

TEST_F(FileCopierTest, OverwriteOfDanglingLinkDoesNotCreateTarget)
{
    write_file(dir_ / "src.txt", "new");
    fs::create_directory(dir_ / "dest");
    fs::create_symlink(dir_ / "ghost.txt", dir_ / "dest" / "g.txt");

    auto res = copier({ConflictDecision::Overwrite}).copy(dir_ / "src.txt", dir_ / "dest" / "g.txt");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Copied);
    ASSERT_EQ(decisions_->asked.size(), 1u);

    EXPECT_FALSE(fs::is_symlink(dir_ / "dest" / "g.txt"));
    EXPECT_EQ(read_file(dir_ / "dest" / "g.txt"), "new");
    EXPECT_FALSE(fs::exists(dir_ / "ghost.txt"));
}

TEST_F(FileCopierTest, SkipKeepsDestinationLink)
{
    write_file(dir_ / "src.txt", "new");
    write_file(dir_ / "outside.txt", "precious");
    fs::create_symlink(dir_ / "outside.txt", dir_ / "f.txt");

    auto res = copier({ConflictDecision::Skip}).copy(dir_ / "src.txt", dir_ / "f.txt");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->outcome, CopyOutcome::Skipped);
    EXPECT_TRUE(fs::is_symlink(dir_ / "f.txt"));
    EXPECT_EQ(read_file(dir_ / "outside.txt"), "precious");
}
