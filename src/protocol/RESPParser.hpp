#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Parser for RESP arrays of bulk strings (client commands and snapshot files).
// Returned views point into the input buffer.
class RESPParser {
public: 
    enum class Status {COMPLETE, INCOMPLETE, MALFORMED};

    // Reads "<digits>\r\n" at pos into out. Lengths above 9 digits are MALFORMED.
    static Status parseInteger(const std::string& s, size_t& pos, int& out);
    static void skipCRLF(const std::string& s, size_t& pos);

    /**
     * Parses one array starting at "offset".
     * @param out       Bulk string views, cleared first.
     * @param consumed  Bytes used by the array, including trailing CRLF.
     * @return          COMPLETE, INCOMPLETE (a prefix of a valid array,
     *                  more bytes may finish it) or MALFORMED.
     */
    static Status parseArray(const std::string& data, size_t offset,
                             std::vector<std::string_view>& out, size_t& consumed);

    // Whole-buffer convenience wrapper; empty unless COMPLETE.
    static std::vector<std::string_view> parse(const std::string& data);
};
