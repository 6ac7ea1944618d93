#include "mcp/MessageFramer.h"
#include <cctype>

namespace {
// Larger declared bodies are treated as corrupt headers.
constexpr std::size_t kMaxContentLength = 64 * 1024 * 1024;

// Digits only, optionally padded with spaces or tabs, capped at kMaxContentLength.
bool parseLength(const std::string& text, std::size_t& out) {
    std::size_t i = 0;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
    std::size_t value = 0;
    std::size_t digits = 0;
    for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); ++i, ++digits) {
        value = value * 10 + static_cast<std::size_t>(text[i] - '0');
        if (value > kMaxContentLength) return false;
    }
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
    if (digits == 0 || i != text.size()) return false;
    out = value;
    return true;
}

std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}
} // namespace

std::string MessageFramer::frame(const std::string& payload) const {
    if (framing == Framing::ContentLength) {
        return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
    }
    return payload + "\n";
}

void MessageFramer::feed(const char* data, std::size_t size) {
    buffer.append(data, size);
}

bool MessageFramer::next(std::string& message) {
    if (framing == Framing::ContentLength) {
        return nextContentLength(message);
    }
    return nextLine(message);
}

bool MessageFramer::nextLine(std::string& message) {
    while (true) {
        auto newline = buffer.find('\n');
        if (newline == std::string::npos) return false;

        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (isBlank(line)) continue;

        message = std::move(line);
        return true;
    }
}

bool MessageFramer::nextContentLength(std::string& message) {
    while (true) {
        auto headerEnd = buffer.find("\r\n\r\n");
        if (headerEnd == std::string::npos) return false;

        std::string header = buffer.substr(0, headerEnd);
        std::string headerLower = toLower(header);
        std::size_t pos = headerLower.find("content-length:");
        if (pos == std::string::npos) {
            // Header block without a length cannot be framed; skip it.
            buffer.erase(0, headerEnd + 4);
            continue;
        }

        std::size_t lineEnd = headerLower.find("\r\n", pos);
        std::string lenStr = header.substr(pos + 15, lineEnd == std::string::npos ? std::string::npos : lineEnd - (pos + 15));
        std::size_t length = 0;
        if (!parseLength(lenStr, length)) {
            buffer.erase(0, headerEnd + 4);
            continue;
        }

        std::size_t bodyStart = headerEnd + 4;
        if (buffer.size() < bodyStart + length) return false;

        message = buffer.substr(bodyStart, length);
        buffer.erase(0, bodyStart + length);
        return true;
    }
}

bool MessageFramer::parseFraming(const std::string& name, Framing& out) {
    std::string lower = toLower(name);
    if (lower == "line" || lower == "newline" || lower == "ndjson") {
        out = Framing::Line;
        return true;
    }
    if (lower == "content-length" || lower == "content_length" || lower == "lsp") {
        out = Framing::ContentLength;
        return true;
    }
    return false;
}
