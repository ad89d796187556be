// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "heifwriter.hpp"
#include "test_streams.hpp"

#include <gtest/gtest.h>

#include <cstring>

class WriterTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        stream = std::make_unique<FailingStream>(std::vector<uint8_t>(), true);
        writer = std::make_unique<StreamWriter>(*stream);
    }

    heif_error Write(const void* data, size_t size)
    {
        return writer->handle()->write(nullptr, data, size,
                                       writer->user_data());
    }

    std::unique_ptr<FailingStream> stream;
    std::unique_ptr<StreamWriter> writer;
};

TEST_F(WriterTest, Registration)
{
    heif_writer* table = writer->handle();
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->writer_api_version, 1);
    EXPECT_NE(table->write, nullptr);
    EXPECT_EQ(writer->handle(), table);
}

TEST_F(WriterTest, Chunks)
{
    const size_t size = STREAM_CHUNK_SIZE * 2 + 100;
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i ^ (i >> 9));
    }

    const heif_error err = Write(data.data(), data.size());
    EXPECT_EQ(err.code, heif_error_Ok);
    EXPECT_EQ(stream->buffer(), data);
    EXPECT_EQ(stream->sizes,
              std::vector<size_t>(
                  { STREAM_CHUNK_SIZE, STREAM_CHUNK_SIZE, 100 }));
}

TEST_F(WriterTest, Sequential)
{
    const uint8_t first[] = { 1, 2, 3 };
    const uint8_t second[] = { 4, 5 };
    EXPECT_EQ(Write(first, sizeof(first)).code, heif_error_Ok);
    EXPECT_EQ(Write(second, sizeof(second)).code, heif_error_Ok);
    EXPECT_EQ(stream->buffer(), std::vector<uint8_t>({ 1, 2, 3, 4, 5 }));
}

TEST_F(WriterTest, ZeroSize)
{
    const heif_error err = Write(nullptr, 0);
    EXPECT_EQ(err.code, heif_error_Ok);
    EXPECT_EQ(stream->writes, static_cast<size_t>(0));
}

TEST_F(WriterTest, NullData)
{
    const heif_error err = Write(nullptr, 10);
    EXPECT_EQ(err.code, heif_error_Encoding_error);
    EXPECT_EQ(err.subcode, heif_suberror_Cannot_write_output_data);
    EXPECT_FALSE(writer->callback_error().has_error());
}

TEST_F(WriterTest, ExceptionCaptured)
{
    stream->fail_write = 2;

    const std::vector<uint8_t> data(STREAM_CHUNK_SIZE * 3);
    const heif_error err = Write(data.data(), data.size());
    EXPECT_EQ(err.code, heif_error_Encoding_error);
    EXPECT_EQ(err.subcode, heif_suberror_Cannot_write_output_data);
    ASSERT_NE(err.message, nullptr);
    EXPECT_STREQ(err.message, "Write error");

    // the first chunk was written before the failure
    EXPECT_EQ(stream->length(), STREAM_CHUNK_SIZE);

    ASSERT_TRUE(writer->callback_error().has_error());
    EXPECT_THROW(writer->callback_error().rethrow(), std::overflow_error);
}

TEST(StreamWriterTest, ReadOnlyStream)
{
    MemoryStream stream({ 1, 2, 3 });
    EXPECT_THROW(StreamWriter { stream }, std::invalid_argument);
    EXPECT_THROW(StreamWriter { StreamPtr() }, std::invalid_argument);
}

TEST(StreamWriterTest, OwnedStream)
{
    StreamWriter writer(std::make_unique<MemoryStream>());
    const char msg[] = "hello";
    const heif_error err = writer.handle()->write(
        nullptr, msg, std::strlen(msg), writer.user_data());
    EXPECT_EQ(err.code, heif_error_Ok);
}
