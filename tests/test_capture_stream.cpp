#include <gtest/gtest.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include "../src/CaptureStream.hpp"

// fails on the second read
class BrokenStream : public BodyStream {
public:
    size_t read(char * buffer, size_t size) override {
        if (reads++ > 0) {
            throw std::runtime_error("connection reset");
        }
        size_t n = std::min(size, (size_t)3);
        std::memcpy(buffer, "abc", n);
        return n;
    }
    void close() override { closed = true; }
    bool isClosed() const override { return closed; }
    bool isComplete() const override { return false; }

private:
    int reads = 0;
    bool closed = false;
};

class CaptureStreamTest : public ::testing::Test {
protected:
    int commits = 0;
    std::string committed;

    std::unique_ptr<CaptureStream> capture(std::unique_ptr<BodyStream> inner) {
        return std::make_unique<CaptureStream>(std::move(inner), [this](const std::string & body) {
            commits++;
            committed = body;
        });
    }
};

TEST_F(CaptureStreamTest, FullReadCommitsOnce) {
    auto stream = capture(std::make_unique<StringBodyStream>("hello world"));
    std::string seen;
    char buffer[4];
    size_t n;
    while ((n = stream->read(buffer, sizeof(buffer))) > 0) {
        seen.append(buffer, n);
    }
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 0u);
    EXPECT_EQ(seen, "hello world");
    EXPECT_EQ(commits, 1);
    EXPECT_EQ(committed, "hello world");
    EXPECT_TRUE(stream->isCommitted());
}

TEST_F(CaptureStreamTest, EarlyCloseDiscards) {
    auto stream = capture(std::make_unique<StringBodyStream>("hello world"));
    char buffer[4];
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 4u);
    stream->close();
    EXPECT_EQ(stream->bufferedSize(), 0u);
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 0u);
    EXPECT_EQ(commits, 0);
    EXPECT_TRUE(stream->isClosed());
}

TEST_F(CaptureStreamTest, DestroyedUnreadNeverCommits) {
    {
        auto stream = capture(std::make_unique<StringBodyStream>("unread"));
    }
    EXPECT_EQ(commits, 0);
}

TEST_F(CaptureStreamTest, EmptyBodyCommitsEmpty) {
    auto stream = capture(std::make_unique<StringBodyStream>(""));
    char buffer[8];
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 0u);
    EXPECT_EQ(commits, 1);
    EXPECT_EQ(committed, "");
}

TEST_F(CaptureStreamTest, ChunkedCommitsWithoutTrailingRead) {
    auto stream = capture(std::make_unique<StringBodyStream>("0123456789", true));
    EXPECT_TRUE(stream->isChunked());
    char buffer[10];
    EXPECT_EQ(stream->read(buffer, 5), 5u);
    EXPECT_EQ(commits, 0);
    EXPECT_EQ(stream->read(buffer, 5), 5u);
    EXPECT_EQ(commits, 1);
    EXPECT_EQ(committed, "0123456789");
    stream->close();
    EXPECT_EQ(commits, 1);
}

TEST_F(CaptureStreamTest, InnerClosedMidBodyDiscards) {
    // the connection goes away under the stream, as on Response::release()
    auto inner = std::make_unique<StringBodyStream>("0123456789", true);
    StringBodyStream * raw = inner.get();
    auto stream = capture(std::move(inner));
    char buffer[4];
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 4u);
    raw->close();
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 0u);
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 0u);
    EXPECT_EQ(commits, 0);
    EXPECT_FALSE(stream->isCommitted());
    EXPECT_EQ(stream->bufferedSize(), 0u);
}

TEST_F(CaptureStreamTest, ZeroSizeReadDoesNotCommit) {
    auto stream = capture(std::make_unique<StringBodyStream>("abc"));
    char buffer[1];
    EXPECT_EQ(stream->read(buffer, 0), 0u);
    EXPECT_EQ(commits, 0);
}

TEST_F(CaptureStreamTest, InnerErrorsPropagate) {
    auto stream = capture(std::make_unique<BrokenStream>());
    char buffer[8];
    EXPECT_EQ(stream->read(buffer, sizeof(buffer)), 3u);
    EXPECT_THROW(stream->read(buffer, sizeof(buffer)), std::runtime_error);
    stream->close();
    EXPECT_EQ(commits, 0);
}

TEST_F(CaptureStreamTest, CommitFailureIsSwallowed) {
    CaptureStream stream(std::make_unique<StringBodyStream>("data"), [](const std::string &) {
        throw std::runtime_error("disk full");
    });
    std::string body;
    EXPECT_NO_THROW(body = readAll(stream));
    EXPECT_EQ(body, "data");
    EXPECT_TRUE(stream.isCommitted());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
