// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "stream.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <system_error>

class FileStreamTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        path = std::filesystem::temp_directory_path() /
            ("heifio_stream_" + std::to_string(getpid()));
    }

    void TearDown() override { std::filesystem::remove(path); }

    std::filesystem::path path;
};

TEST_F(FileStreamTest, WriteRead)
{
    const std::vector<uint8_t> data = { 1, 2, 3, 4, 5, 6, 7, 8 };

    {
        FileStream out(path, FileStream::Mode::Write);
        EXPECT_TRUE(out.writable());
        EXPECT_FALSE(out.readable());
        out.write(data.data(), data.size());
        EXPECT_EQ(out.position(), data.size());
    }

    FileStream in(path, FileStream::Mode::Read);
    EXPECT_TRUE(in.readable());
    EXPECT_TRUE(in.seekable());
    EXPECT_FALSE(in.writable());
    EXPECT_EQ(in.length(), data.size());

    uint8_t buf[16] = {};
    EXPECT_EQ(in.read(buf, 3), static_cast<size_t>(3));
    EXPECT_EQ(buf[0], 1);
    EXPECT_EQ(buf[2], 3);
    EXPECT_EQ(in.position(), 3u);

    in.seek(6);
    EXPECT_EQ(in.read(buf, sizeof(buf)), static_cast<size_t>(2));
    EXPECT_EQ(buf[0], 7);
    EXPECT_EQ(buf[1], 8);
    EXPECT_EQ(in.read(buf, sizeof(buf)), static_cast<size_t>(0));
}

TEST_F(FileStreamTest, Truncate)
{
    const uint8_t data[] = { 1, 2, 3, 4 };
    {
        FileStream out(path, FileStream::Mode::Write);
        out.write(data, sizeof(data));
    }
    {
        FileStream out(path, FileStream::Mode::Write);
        out.write(data, 1);
    }
    FileStream in(path, FileStream::Mode::Read);
    EXPECT_EQ(in.length(), 1u);
}

TEST_F(FileStreamTest, NotFound)
{
    try {
        FileStream in(path / "not_exist", FileStream::Mode::Read);
        FAIL() << "exception expected";
    } catch (const std::system_error& ex) {
        EXPECT_EQ(ex.code().value(), ENOENT);
    }
}

TEST(MemoryStreamTest, Read)
{
    MemoryStream stream({ 10, 20, 30 });
    EXPECT_TRUE(stream.readable());
    EXPECT_TRUE(stream.seekable());
    EXPECT_FALSE(stream.writable());
    EXPECT_EQ(stream.length(), 3u);

    uint8_t buf[4] = {};
    EXPECT_EQ(stream.read(buf, sizeof(buf)), static_cast<size_t>(3));
    EXPECT_EQ(buf[2], 30);
    EXPECT_EQ(stream.read(buf, sizeof(buf)), static_cast<size_t>(0));

    // position beyond the end is allowed, reading returns nothing
    stream.seek(100);
    EXPECT_EQ(stream.position(), 100u);
    EXPECT_EQ(stream.read(buf, sizeof(buf)), static_cast<size_t>(0));
}

TEST(MemoryStreamTest, ReadOnly)
{
    MemoryStream stream({ 1, 2, 3 });
    const uint8_t val = 0;
    EXPECT_THROW(stream.write(&val, 1), std::system_error);
    EXPECT_EQ(stream.length(), 3u);
}

TEST(MemoryStreamTest, Write)
{
    MemoryStream stream;
    EXPECT_TRUE(stream.writable());

    const uint8_t data[] = { 1, 2, 3, 4 };
    stream.write(data, sizeof(data));
    EXPECT_EQ(stream.length(), 4u);

    // overwrite and grow
    stream.seek(2);
    stream.write(data, sizeof(data));
    EXPECT_EQ(stream.buffer(),
              std::vector<uint8_t>({ 1, 2, 1, 2, 3, 4 }));
    EXPECT_EQ(stream.position(), 6u);
}
