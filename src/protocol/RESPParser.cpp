#include "RESPParser.hpp"

RESPParser::Status RESPParser::parseInteger(const std::string& s, size_t& pos, int& out) {
    size_t start = pos;

    while (true) {
        if (pos >= s.size()) return Status::INCOMPLETE;
        if (s[pos] == '\r') break;
        if (s[pos] < '0' || s[pos] > '9') return Status::MALFORMED;
        pos++;
        if (pos - start > 9) return Status::MALFORMED;
    }

    if (pos == start) return Status::MALFORMED;

    if (pos + 1 >= s.size()) return Status::INCOMPLETE;
    if (s[pos + 1] != '\n') return Status::MALFORMED;

    int num = 0;
    for (size_t i = start; i < pos; i++)
        num = num * 10 + (s[i] - '0');

    pos += 2;
    out = num;
    return Status::COMPLETE;
}

void RESPParser::skipCRLF(const std::string& s, size_t& pos) {
    if (pos + 1 < s.size() &&
        s[pos] == '\r' && s[pos + 1] == '\n')
        pos += 2;
}

RESPParser::Status RESPParser::parseArray(const std::string& data, size_t offset,
                                          std::vector<std::string_view>& out,
                                          size_t& consumed)
{
    out.clear();
    consumed = 0;

    size_t pos = offset;

    if (pos >= data.size()) return Status::INCOMPLETE;
    if (data[pos] != '*') return Status::MALFORMED;
    pos++;

    int count = 0;
    Status st = parseInteger(data, pos, count);
    if (st != Status::COMPLETE) return st;

    // The count is untrusted: grow with the data actually present,
    // never reserve for what the header claims.
    for (int i = 0; i < count; i++) {
        if (pos >= data.size()) return Status::INCOMPLETE;
        if (data[pos] != '$') return Status::MALFORMED;

        pos++;

        int len = 0;
        st = parseInteger(data, pos, len);
        if (st != Status::COMPLETE) return st;

        // Payload plus its CRLF terminator.
        if (pos + len + 2 > data.size()) {
            // Whatever already arrived after the payload must be the terminator.
            size_t tail = pos + len;
            if (tail < data.size() && data[tail] != '\r') return Status::MALFORMED;
            return Status::INCOMPLETE;
        }
        if (data[pos + len] != '\r' || data[pos + len + 1] != '\n')
            return Status::MALFORMED;

        out.emplace_back(data.data() + pos, len);

        pos += len;
        skipCRLF(data, pos);
    }

    consumed = pos - offset;
    return Status::COMPLETE;
}

std::vector<std::string_view> RESPParser::parse(const std::string& data) {
    std::vector<std::string_view> values;
    size_t consumed = 0;

    if (parseArray(data, 0, values, consumed) != Status::COMPLETE)
        return {};

    return values;
}
