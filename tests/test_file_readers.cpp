#include <gtest/gtest.h>
#include <sftp/file_readers.hpp>
#include "fake_channel.hpp"

// Deterministic non-repeating-ish payload
static std::string make_payload(std::size_t n) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) {
        s[i] = static_cast<char>((i * 31 + i / 7) & 0xff);
    }
    return s;
}

class FileReadersTest : public ::testing::Test {
protected:
    FakeChannelFactory factory;
    std::shared_ptr<FakeServer> server;
    std::shared_ptr<ConnectionSession> session;

    void SetUp() override {
        server = factory.server("example.com");
        server->add_file("/big.bin", make_payload(100000));
        server->add_file("/exact.bin", make_payload(2 * SFTP_CHUNK_SIZE));
        server->add_file("/empty.bin", "");

        session = std::make_shared<ConnectionSession>(make_endpoint("hm_sftp", "example.com"), factory);
        ASSERT_TRUE(session->start().is_ok());
    }

    int open_handles() {
        return server->with_lock([&] { return server->open_handles; });
    }
};

TEST_F(FileReadersTest, WholeFileEqualsStreamConcatenation) {
    for (const std::string path : {"/big.bin", "/exact.bin", "/empty.bin"}) {
        auto whole = get_whole_file(*session, path);
        ASSERT_TRUE(whole.is_ok()) << path << ": " << whole.error;

        std::string streamed;
        FileStream stream(session, path);
        while (auto chunk = stream.next()) {
            streamed += *chunk;
        }
        EXPECT_EQ(stream.state(), FileStream::State::Closed) << path;
        EXPECT_EQ(whole.value, streamed) << path;
    }
    EXPECT_EQ(open_handles(), 0);
}

TEST_F(FileReadersTest, WholeFileMatchesRemoteContents) {
    auto whole = get_whole_file(*session, "/big.bin");
    ASSERT_TRUE(whole.is_ok());
    EXPECT_EQ(whole.value, make_payload(100000));
}

TEST_F(FileReadersTest, StreamChunksAreFullExceptLast) {
    FileStream stream(session, "/big.bin");
    std::vector<std::size_t> sizes;
    std::size_t total = 0;
    while (auto chunk = stream.next()) {
        sizes.push_back(chunk->size());
        total += chunk->size();
    }

    ASSERT_EQ(sizes.size(), 4u);
    for (std::size_t i = 0; i + 1 < sizes.size(); ++i) {
        EXPECT_EQ(sizes[i], SFTP_CHUNK_SIZE);
    }
    EXPECT_LE(sizes.back(), SFTP_CHUNK_SIZE);
    EXPECT_EQ(total, 100000u);
}

TEST_F(FileReadersTest, StreamIsLazy) {
    {
        FileStream stream(session, "/big.bin");
        EXPECT_EQ(stream.state(), FileStream::State::Unopened);
        EXPECT_EQ(server->with_lock([&] { return server->open_calls; }), 0);
    }
    // Never pulled, never opened
    EXPECT_EQ(server->with_lock([&] { return server->open_calls; }), 0);
}

TEST_F(FileReadersTest, AbandonedStreamClosesHandle) {
    {
        FileStream stream(session, "/big.bin");
        auto first = stream.next();
        ASSERT_TRUE(first.has_value());
        EXPECT_EQ(stream.state(), FileStream::State::Open);
        EXPECT_EQ(open_handles(), 1);
    }
    EXPECT_EQ(open_handles(), 0);
}

TEST_F(FileReadersTest, StreamEndsAfterExhaustion) {
    FileStream stream(session, "/empty.bin");
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(stream.state(), FileStream::State::Closed);
    EXPECT_FALSE(stream.failed());

    // Not restartable
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(server->with_lock([&] { return server->open_calls; }), 1);
}

TEST_F(FileReadersTest, ReadErrorEndsStreamAsFailed) {
    server->with_lock([&] { server->reads_before_error = 1; });

    FileStream stream(session, "/big.bin");
    std::size_t chunks = 0;
    while (stream.next()) chunks++;

    EXPECT_EQ(chunks, 1u);
    EXPECT_TRUE(stream.failed());
    EXPECT_EQ(stream.error_code(), SftpErrc::Remote);
    EXPECT_FALSE(stream.error().empty());
    EXPECT_EQ(open_handles(), 0);
}

TEST_F(FileReadersTest, OpenErrorEndsStreamAsFailed) {
    FileStream stream(session, "/missing.bin");
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(stream.state(), FileStream::State::Failed);
    EXPECT_EQ(stream.error_code(), SftpErrc::Remote);
}

TEST_F(FileReadersTest, TimedOutOpenReleasesLateHandle) {
    auto slow = std::make_shared<ConnectionSession>(make_endpoint("slow", "example.com"), factory,
                                                    std::chrono::seconds(1));
    ASSERT_TRUE(slow->start().is_ok());
    server->with_lock([&] { server->delay_ms = 1500; });

    {
        FileStream stream(slow, "/big.bin");
        EXPECT_FALSE(stream.next().has_value());
        EXPECT_EQ(stream.state(), FileStream::State::Failed);
        EXPECT_EQ(stream.error_code(), SftpErrc::Timeout);
    }

    // The open lands on the server after the caller gave up; the session
    // closes it on its own.
    ASSERT_TRUE(wait_until([&] { return server->with_lock([&] { return server->close_calls; }) == 1; }));
    EXPECT_EQ(server->with_lock([&] { return server->open_calls; }), 1);
    EXPECT_EQ(open_handles(), 0);

    server->with_lock([&] { server->delay_ms = 0; });
}

TEST_F(FileReadersTest, TimedOutWholeFileLeavesNoHandle) {
    ConnectionSession slow(make_endpoint("slow", "example.com"), factory, std::chrono::seconds(1));
    ASSERT_TRUE(slow.start().is_ok());
    server->with_lock([&] { server->delay_ms = 1500; });

    auto whole = get_whole_file(slow, "/big.bin");
    EXPECT_EQ(whole.code, SftpErrc::Timeout);

    ASSERT_TRUE(wait_until([&] { return server->with_lock([&] { return server->close_calls; }) == 1; }));
    EXPECT_EQ(open_handles(), 0);

    server->with_lock([&] { server->delay_ms = 0; });
}

TEST(FileStreamState, Names) {
    EXPECT_STREQ(stream_state_name(FileStream::State::Unopened), "unopened");
    EXPECT_STREQ(stream_state_name(FileStream::State::Open), "open");
    EXPECT_STREQ(stream_state_name(FileStream::State::Closed), "closed");
    EXPECT_STREQ(stream_state_name(FileStream::State::Failed), "failed");
}

TEST_F(FileReadersTest, StreamWithoutSessionFails) {
    FileStream stream(nullptr, "/big.bin");
    EXPECT_FALSE(stream.next().has_value());
    EXPECT_EQ(stream.error_code(), SftpErrc::SessionUnavailable);
}

TEST_F(FileReadersTest, MovedStreamKeepsOwnership) {
    FileStream a(session, "/big.bin");
    ASSERT_TRUE(a.next().has_value());

    FileStream b(std::move(a));
    EXPECT_EQ(open_handles(), 1);
    EXPECT_EQ(b.state(), FileStream::State::Open);

    std::size_t rest = 0;
    while (auto chunk = b.next()) rest += chunk->size();
    EXPECT_EQ(rest, 100000u - SFTP_CHUNK_SIZE);
    EXPECT_EQ(open_handles(), 0);
}

TEST_F(FileReadersTest, WholeFileReportsMissingPath) {
    auto whole = get_whole_file(*session, "/missing.bin");
    EXPECT_EQ(whole.code, SftpErrc::Remote);
}

TEST_F(FileReadersTest, WholeFileClosesHandleOnReadError) {
    server->with_lock([&] { server->reads_before_error = 2; });

    auto whole = get_whole_file(*session, "/big.bin");
    EXPECT_EQ(whole.code, SftpErrc::Remote);
    EXPECT_EQ(open_handles(), 0);
}
