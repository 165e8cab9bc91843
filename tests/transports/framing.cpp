// Inbound framing: NDJSON line buffering, poll bodies and SSE events
#include "mcpcompose/transport/sse_transport.hpp"
#include "mcpcompose/transport/stream_transport.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcpcompose;
using namespace mcpcompose::transport;

int main()
{
    // Two messages in one read, in order
    {
        LineBuffer buf;
        auto lines = buf.feed(std::string("{\"a\":1}\n{\"b\":2}\n"));
        assert(lines.size() == 2);
        assert(lines[0] == "{\"a\":1}");
        assert(lines[1] == "{\"b\":2}");
        assert(buf.pending().empty());
        std::cout << "[PASS] two lines in one read" << std::endl;
    }

    // A partial message waits for its remainder
    {
        LineBuffer buf;
        assert(buf.feed(std::string("{\"a\":1}")).empty());
        assert(buf.pending() == "{\"a\":1}");
        assert(buf.feed(std::string("\n{\"b\"")).size() == 1);
        auto rest = buf.feed(std::string(":2}\r\n\n  \n"));
        assert(rest.size() == 1 && rest[0] == "{\"b\":2}");
        assert(buf.pending().empty());
        std::cout << "[PASS] partial lines, CRLF and blanks" << std::endl;
    }

    // Byte-at-a-time delivery
    {
        LineBuffer buf;
        const std::string data = "{\"x\":[1,2]}\n{\"y\":\"z\"}\n";
        std::vector<std::string> all;
        for (char c : data)
            for (auto& l : buf.feed(&c, 1))
                all.push_back(l);
        assert(all.size() == 2 && all[1] == "{\"y\":\"z\"}");
        std::cout << "[PASS] byte-wise feed" << std::endl;
    }

    // Poll bodies
    {
        auto arr = parse_poll_body("[{\"id\":1},{\"id\":2}]");
        assert(arr.size() == 2 && arr[1]["id"] == 2);
        auto single = parse_poll_body("{\"id\":3}");
        assert(single.size() == 1 && single[0]["id"] == 3);
        auto nd = parse_poll_body("{\"id\":4}\nnot json\n{\"id\":5}");
        assert(nd.size() == 2 && nd[0]["id"] == 4 && nd[1]["id"] == 5);
        assert(parse_poll_body("").empty());
        assert(parse_poll_body(" \n ").empty());
        assert(parse_poll_body("[]").empty());
        std::cout << "[PASS] poll bodies" << std::endl;
    }

    // SSE events
    {
        SseParser parser;
        std::string stream = "event: endpoint\ndata: /messages?session_id=abc\n\n"
                             ": keep-alive comment\n\n"
                             "data: {\"id\":1,\r\ndata: \"result\":{}}\r\n\r\n"
                             "event: message\ndata: {\"id\"";
        auto events = parser.feed(stream.data(), stream.size());
        assert(events.size() == 2);
        assert(events[0].type == "endpoint");
        assert(events[0].data == "/messages?session_id=abc");
        assert(events[1].type.empty());
        assert(events[1].data == "{\"id\":1,\n\"result\":{}}");

        std::string tail = ":2}\n\n";
        auto more = parser.feed(tail.data(), tail.size());
        assert(more.size() == 1 && more[0].type == "message" && more[0].data == "{\"id\":2}");
        std::cout << "[PASS] sse events" << std::endl;
    }

    return 0;
}
