#include <gtest/gtest.h>

#include "input.hpp"

#include <string>

#include <unistd.h>

class LineReaderTest : public ::testing::Test {
protected:
    int read_fd = -1;
    int write_fd = -1;

    void SetUp() override {
        int fds[2];
        ASSERT_EQ(pipe(fds), 0);
        read_fd = fds[0];
        write_fd = fds[1];
    }

    void TearDown() override {
        if (read_fd != -1) close(read_fd);
        close_writer();
    }

    void write_text(const std::string &text) {
        ASSERT_EQ(write(write_fd, text.data(), text.size()), (ssize_t) text.size());
    }

    void close_writer() {
        if (write_fd != -1) close(write_fd);
        write_fd = -1;
    }
};

TEST_F(LineReaderTest, NothingAvailable) {
    LineReader reader(read_fd);

    EXPECT_FALSE(reader.poll());
    EXPECT_FALSE(reader.next_line().has_value());
    EXPECT_FALSE(reader.eof());
}

TEST_F(LineReaderTest, PartialLineIsHeldBack) {
    LineReader reader(read_fd);

    write_text("^lhal");
    EXPECT_FALSE(reader.poll());

    write_text("f^rdone\n");
    ASSERT_TRUE(reader.poll());
    EXPECT_EQ(reader.next_line(), "^lhalf^rdone");
}

TEST_F(LineReaderTest, LinesComeOutInOrder) {
    LineReader reader(read_fd);

    write_text("first\nsecond\n");
    ASSERT_TRUE(reader.poll());

    EXPECT_EQ(reader.next_line(), "first");
    EXPECT_EQ(reader.next_line(), "second");
    EXPECT_FALSE(reader.next_line().has_value());
}

TEST_F(LineReaderTest, SettleKeepsTheNewestLine) {
    LineReader reader(read_fd);

    write_text("^lone\n^ltwo\n");
    ASSERT_TRUE(reader.poll());
    write_text("^lthree\n^lfour");

    EXPECT_EQ(reader.settle(std::chrono::milliseconds(1)), "^lthree");

    write_text("\n");
    ASSERT_TRUE(reader.poll());
    EXPECT_EQ(reader.settle(std::chrono::milliseconds(1)), "^lfour");
}

TEST_F(LineReaderTest, SettleSkipsTrailingEmptyLines) {
    LineReader reader(read_fd);

    write_text("^lvalue\n\n\n");
    ASSERT_TRUE(reader.poll());

    EXPECT_EQ(reader.settle(std::chrono::milliseconds(1)), "^lvalue");
}

TEST_F(LineReaderTest, OnlyEmptyLinesSettleToEmpty) {
    LineReader reader(read_fd);

    write_text("\n\n");
    ASSERT_TRUE(reader.poll());

    EXPECT_EQ(reader.settle(std::chrono::milliseconds(1)), "");
}

TEST_F(LineReaderTest, EndOfInput) {
    LineReader reader(read_fd);

    write_text("last line without newline");
    close_writer();

    ASSERT_TRUE(reader.poll());
    EXPECT_TRUE(reader.eof());
    EXPECT_EQ(reader.next_line(), "last line without newline");

    EXPECT_FALSE(reader.poll());
    EXPECT_FALSE(reader.next_line().has_value());
}

TEST_F(LineReaderTest, ClosedWithoutData) {
    LineReader reader(read_fd);

    close_writer();

    EXPECT_FALSE(reader.poll());
    EXPECT_TRUE(reader.eof());
}
