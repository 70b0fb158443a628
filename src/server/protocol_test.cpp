#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "protocol.hpp"

using namespace server;

TEST(RespProtocolTest, MakeStatusReply)
{
    ASSERT_EQ(toBytes(makeOkReply()), "+OK\r\n");
    ASSERT_EQ(toBytes(makeStatusReply(PONG)), "+PONG\r\n");
}

TEST(RespProtocolTest, MakeErrReply)
{
    auto reply = makeErrReply(UNKNOWN_COMMAND);
    ASSERT_TRUE(isErrorReply(reply));
    ASSERT_EQ(toBytes(reply), "-ERR unknown command\r\n");
    ASSERT_FALSE(isErrorReply(makeOkReply()));
}

TEST(RespProtocolTest, MakeIntReply)
{
    ASSERT_EQ(toBytes(makeIntReply(1)), ":1\r\n");
    ASSERT_EQ(toBytes(makeIntReply(-1)), ":-1\r\n");
    ASSERT_EQ(toBytes(makeIntReply(INT64_MIN)), ":-9223372036854775808\r\n");
}

TEST(RespProtocolTest, MakeBulkReply)
{
    ASSERT_EQ(toBytes(makeBulkReply("hello")), "$5\r\nhello\r\n");
    ASSERT_EQ(toBytes(makeBulkReply("")), "$0\r\n\r\n");
}

TEST(RespProtocolTest, BulkReplyIsBinarySafe)
{
    std::string body("A\r\nB\0C", 6);
    std::string expected = "$6\r\n" + body + "\r\n";
    ASSERT_EQ(toBytes(makeBulkReply(body)), expected);
}

TEST(RespProtocolTest, MakeNullBulkReply)
{
    ASSERT_EQ(toBytes(makeNullBulkReply()), "$-1\r\n");
}

TEST(RespProtocolTest, MakeMultiBulkReply)
{
    auto reply = makeMultiBulkReply({"SET", "key", "value"});
    ASSERT_EQ(toBytes(reply), "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n");
}

TEST(RespProtocolTest, EmptyMultiBulkReply)
{
    ASSERT_EQ(toBytes(makeEmptyMultiBulkReply()), "*0\r\n");
    auto reply = makeMultiBulkReply({});
    ASSERT_TRUE(std::holds_alternative<EmptyMultiBulkReply>(reply));
    ASSERT_EQ(toBytes(reply), "*0\r\n");
}

TEST(RespProtocolTest, AppendBytesConcatenates)
{
    std::string out;
    appendBytes(out, makeOkReply());
    appendBytes(out, makeIntReply(42));
    appendBytes(out, makeNullBulkReply());
    ASSERT_EQ(out, "+OK\r\n:42\r\n$-1\r\n");
}

TEST(RespProtocolTest, Describe)
{
    ASSERT_EQ(describe(makeOkReply()), "status(OK)");
    ASSERT_EQ(describe(makeIntReply(7)), "int(7)");
    ASSERT_EQ(describe(makeNullBulkReply()), "null");
    ASSERT_EQ(describe(makeMultiBulkReply({"GET", "k"})), "array[GET k]");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
