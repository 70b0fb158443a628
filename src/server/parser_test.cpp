#include <gtest/gtest.h>
#include <cerrno>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include "parser.hpp"
#include "protocol.hpp"

using namespace server;

namespace {
    /// Yields data, then fails every read with ECONNRESET
    class FailingSource : public ByteSource {
        private:
            StringSource inner;
            bool drained = false;
        public:
            explicit FailingSource(std::string data) : inner(std::move(data)) {}
            ssize_t read(char* buffer, size_t size) override {
                if (!drained) {
                    auto n = inner.read(buffer, size);
                    if (n > 0) {
                        return n;
                    }
                    drained = true;
                }
                errno = ECONNRESET;
                return -1;
            }
    };

    std::vector<Payload> collect(ByteSource& source) {
        std::vector<Payload> payloads;
        auto stream = parseStream(source);
        while (auto payload = stream.next_value()) {
            payloads.push_back(std::move(*payload));
        }
        return payloads;
    }
}

TEST(ParserTest, DecodeSetCommand)
{
    auto reply = parseOne("*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nvalue\r\n");
    ASSERT_EQ(reply, Reply(MultiBulkReply{{"SET", "key", "value"}}));
}

TEST(ParserTest, DecodeStatus)
{
    ASSERT_EQ(parseOne("+OK\r\n"), Reply(StatusReply{"OK"}));
}

TEST(ParserTest, DecodeError)
{
    ASSERT_EQ(parseOne("-ERR boom\r\n"), Reply(ErrorReply{"ERR boom"}));
}

TEST(ParserTest, DecodeInteger)
{
    ASSERT_EQ(parseOne(":1\r\n"), Reply(IntReply{1}));
    ASSERT_EQ(parseOne(":-42\r\n"), Reply(IntReply{-42}));
    ASSERT_EQ(parseOne(":+7\r\n"), Reply(IntReply{7}));
}

TEST(ParserTest, BulkStringWithEmbeddedCrlf)
{
    auto reply = parseOne("$4\r\nA\r\nB\r\n");
    ASSERT_EQ(reply, Reply(BulkReply{std::string("A\r\nB", 4)}));
}

TEST(ParserTest, NullAndEmptyFrames)
{
    ASSERT_EQ(parseOne("$-1\r\n"), Reply(NullBulkReply{}));
    ASSERT_EQ(parseOne("$0\r\n\r\n"), Reply(BulkReply{""}));
    ASSERT_EQ(parseOne("*0\r\n"), Reply(EmptyMultiBulkReply{}));
    ASSERT_THROW(parseOne("*-1\r\n"), ProtocolError);
}

TEST(ParserTest, RoundTripEveryVariant)
{
    const std::vector<Reply> replies = {
        StatusReply{"OK"},
        ErrorReply{"ERR unknown command 'FOO'"},
        IntReply{std::numeric_limits<int64_t>::min()},
        BulkReply{std::string("a\r\n\0b", 5)},
        NullBulkReply{},
        MultiBulkReply{{"SET", "", "\r\n"}},
        EmptyMultiBulkReply{},
    };
    for (const auto& reply : replies) {
        EXPECT_EQ(parseOne(toBytes(reply)), reply) << toBytes(reply);
    }
}

TEST(ParserTest, NullElementInArrayBecomesEmptyString)
{
    auto reply = parseOne("*3\r\n$3\r\nGET\r\n$-1\r\n$1\r\nx\r\n");
    ASSERT_EQ(reply, Reply(MultiBulkReply{{"GET", "", "x"}}));
}

TEST(ParserTest, ProtocolErrorKeepsStreamUsable)
{
    StringSource source(":abc\r\n+OK\r\n");
    auto payloads = collect(source);
    ASSERT_EQ(payloads.size(), 3u);
    ASSERT_TRUE(payloads[0].isProtocolError());
    ASSERT_FALSE(payloads[0].isTransportError());
    ASSERT_NE(payloads[0].errorMessage().find("abc"), std::string::npos);
    ASSERT_TRUE(payloads[1].ok());
    ASSERT_EQ(payloads[1].reply(), Reply(StatusReply{"OK"}));
    ASSERT_TRUE(payloads[2].isEndOfStream());
    ASSERT_TRUE(payloads[2].isTransportError());
}

TEST(ParserTest, MalformedArrayElementDropsArray)
{
    StringSource source("*2\r\n$3\r\nGET\r\n:5\r\n+OK\r\n");
    auto payloads = collect(source);
    ASSERT_EQ(payloads.size(), 3u);
    ASSERT_TRUE(payloads[0].isProtocolError());
    ASSERT_EQ(payloads[1].reply(), Reply(StatusReply{"OK"}));
    ASSERT_TRUE(payloads[2].isEndOfStream());
}

TEST(ParserTest, IllegalHeaders)
{
    ASSERT_THROW(parseOne("$abc\r\n"), ProtocolError);
    ASSERT_THROW(parseOne("$-2\r\n"), ProtocolError);
    ASSERT_THROW(parseOne("*x\r\n"), ProtocolError);
    ASSERT_THROW(parseOne("*1\r\n$q\r\n"), ProtocolError);
}

TEST(ParserTest, LinesWithoutFrameAreSkipped)
{
    auto replies = parseBytes("\r\n\n+A\n:1\r\n?junk\r\n+OK\r\n");
    ASSERT_EQ(replies.size(), 2u);
    ASSERT_EQ(replies[0], Reply(IntReply{1}));
    ASSERT_EQ(replies[1], Reply(StatusReply{"OK"}));
}

TEST(ParserTest, PartialReadsAssembleFrames)
{
    std::string data = "*2\r\n$3\r\nGET\r\n$3\r\nkey\r\n$11\r\nhello\r\nworld\r\n:12\r\n";
    for (size_t chunk : {1u, 2u, 3u, 7u}) {
        StringSource source(data, chunk);
        auto payloads = collect(source);
        ASSERT_EQ(payloads.size(), 4u) << "chunk " << chunk;
        ASSERT_EQ(payloads[0].reply(), Reply(MultiBulkReply{{"GET", "key"}}));
        ASSERT_EQ(payloads[1].reply(), Reply(BulkReply{"hello\r\nworld"}));
        ASSERT_EQ(payloads[2].reply(), Reply(IntReply{12}));
        ASSERT_TRUE(payloads[3].isEndOfStream());
    }
}

TEST(ParserTest, LargeBulkBypassesBuffer)
{
    std::string body(100000, 'v');
    std::string data = "$" + std::to_string(body.size()) + "\r\n" + body + "\r\n+OK\r\n";
    auto replies = parseBytes(data);
    ASSERT_EQ(replies.size(), 2u);
    ASSERT_EQ(replies[0], Reply(BulkReply{body}));
    ASSERT_EQ(replies[1], Reply(StatusReply{"OK"}));
}

TEST(ParserTest, TruncatedBodyEndsStream)
{
    StringSource source("+OK\r\n$10\r\nabc");
    auto payloads = collect(source);
    ASSERT_EQ(payloads.size(), 2u);
    ASSERT_TRUE(payloads[0].ok());
    ASSERT_TRUE(payloads[1].isEndOfStream());
}

TEST(ParserTest, ReadFailureIsYieldedOnce)
{
    FailingSource source("+OK\r\n");
    auto payloads = collect(source);
    ASSERT_EQ(payloads.size(), 2u);
    ASSERT_TRUE(payloads[0].ok());
    ASSERT_TRUE(payloads[1].isTransportError());
    ASSERT_FALSE(payloads[1].isEndOfStream());
    ASSERT_EQ(payloads[1].getError(), std::error_code(ECONNRESET, std::system_category()));
}

TEST(ParserTest, StreamIsLazy)
{
    StringSource source("+A\r\n+B\r\n");
    auto stream = parseStream(source);
    auto first = stream.next_value();
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->reply(), Reply(StatusReply{"A"}));
    ASSERT_FALSE(stream.done());
    auto second = stream.next_value();
    ASSERT_EQ(second->reply(), Reply(StatusReply{"B"}));
    auto end = stream.next_value();
    ASSERT_TRUE(end->isEndOfStream());
    ASSERT_FALSE(stream.next_value().has_value());
    ASSERT_TRUE(stream.done());
}

TEST(ParserTest, ParseOneWithoutFrameThrows)
{
    ASSERT_THROW(parseOne(""), ProtocolError);
    ASSERT_THROW(parseOne("\r\n"), ProtocolError);
}

TEST(ParserTest, PayloadAccessors)
{
    auto error = Payload::protocolError("bad");
    ASSERT_THROW(error.reply(), std::logic_error);
    ASSERT_EQ(error.getError(), make_error_code(ParseErrc::ProtocolError));
    ASSERT_STREQ(error.getError().category().name(), "resp");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
