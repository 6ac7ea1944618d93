#include <gtest/gtest.h>
#include "mcp/MessageFramer.h"
#include <string>
#include <vector>

namespace {
std::vector<std::string> Drain(MessageFramer& framer) {
    std::vector<std::string> out;
    std::string msg;
    while (framer.next(msg)) out.push_back(msg);
    return out;
}

void Feed(MessageFramer& framer, const std::string& data) {
    framer.feed(data.data(), data.size());
}
} // namespace

TEST(MessageFramerTest, LineFramingAppendsNewline) {
    MessageFramer framer(Framing::Line);
    EXPECT_EQ(framer.frame("{\"id\":1}"), "{\"id\":1}\n");
}

TEST(MessageFramerTest, LineFramingReassemblesSplitReads) {
    MessageFramer framer(Framing::Line);
    Feed(framer, "{\"id\":1,\"res");
    EXPECT_TRUE(Drain(framer).empty());
    EXPECT_GT(framer.buffered(), 0u);

    Feed(framer, "ult\":{}}\n{\"id\":2}\n{\"id\"");
    auto msgs = Drain(framer);
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0], "{\"id\":1,\"result\":{}}");
    EXPECT_EQ(msgs[1], "{\"id\":2}");

    Feed(framer, ":3}\n");
    msgs = Drain(framer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "{\"id\":3}");
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST(MessageFramerTest, LineFramingStripsCarriageReturnAndSkipsBlankLines) {
    MessageFramer framer(Framing::Line);
    Feed(framer, "\n\r\n  \n{\"a\":1}\r\n\n");
    auto msgs = Drain(framer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "{\"a\":1}");
}

TEST(MessageFramerTest, ContentLengthFramingRoundTrip) {
    MessageFramer framer(Framing::ContentLength);
    std::string body = "{\"jsonrpc\":\"2.0\",\"id\":7}";
    std::string framed = framer.frame(body);
    EXPECT_EQ(framed, "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);

    Feed(framer, framed.substr(0, 10));
    EXPECT_TRUE(Drain(framer).empty());
    Feed(framer, framed.substr(10, framed.size() - 12));
    EXPECT_TRUE(Drain(framer).empty());
    Feed(framer, framed.substr(framed.size() - 2) + framed);

    auto msgs = Drain(framer);
    ASSERT_EQ(msgs.size(), 2u);
    EXPECT_EQ(msgs[0], body);
    EXPECT_EQ(msgs[1], body);
}

TEST(MessageFramerTest, ContentLengthHeaderIsCaseInsensitiveAndExtraHeadersAreIgnored) {
    MessageFramer framer(Framing::ContentLength);
    Feed(framer, "content-type: application/json\r\ncontent-length: 2\r\n\r\n{}");
    auto msgs = Drain(framer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "{}");
}

TEST(MessageFramerTest, ContentLengthSkipsHeaderBlocksWithoutUsableLength) {
    MessageFramer framer(Framing::ContentLength);
    Feed(framer, "X-Junk: 1\r\n\r\nContent-Length: abc\r\n\r\nContent-Length: 4\r\n\r\ntrue");
    auto msgs = Drain(framer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "true");
}

TEST(MessageFramerTest, ContentLengthRejectsNegativeAndOversizedLengths) {
    MessageFramer framer(Framing::ContentLength);
    Feed(framer, "Content-Length: -1\r\n\r\n");
    Feed(framer, "Content-Length: 18446744073709551616\r\n\r\n");
    Feed(framer, "Content-Length: 999999999\r\n\r\n");
    Feed(framer, "Content-Length: 12abc\r\n\r\n");
    Feed(framer, "Content-Length: 2\r\n\r\n{}");
    auto msgs = Drain(framer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "{}");
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST(MessageFramerTest, ResetDropsPartialInput) {
    MessageFramer framer(Framing::Line);
    Feed(framer, "{\"partial\":");
    framer.reset();
    Feed(framer, "{}\n");
    auto msgs = Drain(framer);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "{}");
}

TEST(MessageFramerTest, ParseFramingNames) {
    Framing f = Framing::ContentLength;
    EXPECT_TRUE(MessageFramer::parseFraming("ndjson", f));
    EXPECT_EQ(f, Framing::Line);
    EXPECT_TRUE(MessageFramer::parseFraming("Content-Length", f));
    EXPECT_EQ(f, Framing::ContentLength);
    EXPECT_TRUE(MessageFramer::parseFraming("line", f));
    EXPECT_EQ(f, Framing::Line);
    EXPECT_FALSE(MessageFramer::parseFraming("xml", f));
    EXPECT_EQ(f, Framing::Line);
}
