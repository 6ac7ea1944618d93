#pragma once
#include <string>
#include <cstddef>

enum class Framing {
    Line,          // newline-delimited JSON (MCP stdio)
    ContentLength  // "Content-Length: N\r\n\r\n<body>" (LSP style)
};

/**
 * @brief Framing codec for the server's stdio streams.
 *
 * frame() encodes one outgoing payload. feed() accumulates raw bytes read
 * from the child's stdout and next() pops complete messages in arrival order.
 * Not thread-safe; the receive loop owns its decoder.
 */
class MessageFramer {
public:
    explicit MessageFramer(Framing framing = Framing::Line) : framing(framing) {}

    std::string frame(const std::string& payload) const;

    void feed(const char* data, std::size_t size);
    bool next(std::string& message);

    // Bytes received but not yet part of a complete message.
    std::size_t buffered() const { return buffer.size(); }
    void reset() { buffer.clear(); }

    static bool parseFraming(const std::string& name, Framing& out);

private:
    Framing framing;
    std::string buffer;

    bool nextLine(std::string& message);
    bool nextContentLength(std::string& message);
};
