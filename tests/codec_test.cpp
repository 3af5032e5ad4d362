#include <gtest/gtest.h>
#include "protocol/codec.hpp"
#include "common/error.hpp"
#include "fake_connection.hpp"
#include "test_utils.hpp"

using namespace fdfs::protocol;
using fdfs::test::FakeConnection;

class CodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logging();
    }
};

// Length is big-endian, followed by command and status
TEST_F(CodecTest, EncodeHeaderLayout) {
    ProtocolHeader header;
    header.pkg_len = 0x0102030405060708ULL;
    header.cmd = 101;
    header.status = 0;

    Codec::HeaderBytes bytes = Codec::encode_header(header);

    ASSERT_EQ(bytes.size(), 10u);
    for (std::size_t i = 0; i < 8; ++i) {
        EXPECT_EQ(bytes[i], i + 1) << "byte " << i;
    }
    EXPECT_EQ(bytes[8], 101);
    EXPECT_EQ(bytes[9], 0);
}

TEST_F(CodecTest, DecodeHeaderReadsAllFields) {
    Codec::HeaderBytes bytes{0, 0, 0, 0, 0, 0, 0x01, 0x2c, 100, 22};

    ProtocolHeader header = Codec::decode_header(bytes);

    EXPECT_EQ(header.pkg_len, 300u);
    EXPECT_EQ(header.cmd, 100);
    EXPECT_EQ(header.status, 22);
}

TEST_F(CodecTest, WriteHeaderUsesZeroStatus) {
    FakeConnection connection;

    Codec::write_header(connection, 42, Command::STORAGE_UPLOAD_FILE);

    EXPECT_EQ(connection.written(), make_header(42, 11, 0));
}

TEST_F(CodecTest, ReadResponseHeaderAcceptsSuccess) {
    FakeConnection connection("127.0.0.1:22122", make_header(40, 100, 0));

    ProtocolHeader header = Codec::read_response_header(connection);

    EXPECT_EQ(header.pkg_len, 40u);
    EXPECT_EQ(connection.remaining(), 0u);
}

TEST_F(CodecTest, ReadResponseHeaderSurfacesStatus) {
    FakeConnection connection("127.0.0.1:22122", make_header(0, 100, 28));

    try {
        Codec::read_response_header(connection);
        FAIL() << "Expected RemoteStatusError";
    } catch (const fdfs::RemoteStatusError& e) {
        EXPECT_EQ(e.status(), 28);
    }
}

TEST_F(CodecTest, ReadResponseHeaderRejectsUnexpectedCommand) {
    FakeConnection connection("127.0.0.1:22122", make_header(0, 101, 0));

    EXPECT_THROW(Codec::read_response_header(connection), fdfs::MalformedResponse);
}

TEST_F(CodecTest, ReadResponseHeaderRejectsOversizedLength) {
    FakeConnection connection("127.0.0.1:22122", make_header(0x8000000000000000ULL, 100, 0));

    EXPECT_THROW(Codec::read_response_header(connection), fdfs::MalformedResponse);
}

TEST_F(CodecTest, ReadResponseHeaderShortReadIsIOError) {
    FakeConnection connection("127.0.0.1:22122", std::string(5, '\0'));

    EXPECT_THROW(Codec::read_response_header(connection), fdfs::IOError);
}

TEST_F(CodecTest, FixedStringIsZeroPadded) {
    std::vector<uint8_t> out;
    Codec::append_fixed_string(out, "group1", 16);

    ASSERT_EQ(out.size(), 16u);
    EXPECT_EQ(std::string(out.begin(), out.begin() + 6), "group1");
    for (std::size_t i = 6; i < out.size(); ++i) {
        EXPECT_EQ(out[i], 0);
    }
    EXPECT_EQ(Codec::parse_fixed_string(out.data(), out.size()), "group1");
}

TEST_F(CodecTest, FixedStringIsTruncatedToWidth) {
    std::vector<uint8_t> out;
    Codec::append_fixed_string(out, "targzarchive", 6);

    EXPECT_EQ(std::string(out.begin(), out.end()), "targza");
    EXPECT_EQ(Codec::parse_fixed_string(out.data(), out.size()), "targza");
}

TEST_F(CodecTest, Int64IsBigEndian) {
    std::vector<uint8_t> out;
    Codec::append_int64(out, 23000);

    ASSERT_EQ(out.size(), 8u);
    EXPECT_EQ(out[6], 0x59);
    EXPECT_EQ(out[7], 0xd8);
    EXPECT_EQ(Codec::parse_int64(out.data()), 23000u);
}
