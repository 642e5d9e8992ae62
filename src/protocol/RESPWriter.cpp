#include "RESPWriter.hpp"

std::string RESPWriter::simpleString(const std::string& s) {
    return "+" + s + "\r\n";
}

std::string RESPWriter::error(const std::string& message) {
    return "-ERR " + message + "\r\n";
}

std::string RESPWriter::integer(long long n) {
    return ":" + std::to_string(n) + "\r\n";
}

std::string RESPWriter::nullBulk() {
    return "$-1\r\n";
}

/**
 * Builds $<len>\r\n<value>\r\n.
 * reserve() avoids reallocations for large payloads.
 */
std::string RESPWriter::bulk(const std::string& value) {
    size_t size = value.size();
    std::string len = std::to_string(size);

    std::string reply;
    reply.reserve(1 + len.size() + 2 + size + 2);

    reply += '$';
    reply += len;
    reply += "\r\n";
    reply += value;
    reply += "\r\n";

    return reply;
}

std::string RESPWriter::array(const std::vector<std::string>& values) {
    std::string out;
    out += "*" + std::to_string(values.size()) + "\r\n";

    for (const auto& v : values) {
        out += bulk(v);
    }

    return out;
}
