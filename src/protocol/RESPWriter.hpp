#pragma once

#include <string>
#include <vector>

// RESP reply encoders shared by the command handler and the snapshot writer.
class RESPWriter {
public:
    /** RESP Simple String: +OK\r\n */
    static std::string simpleString(const std::string& s);

    /** RESP Error: -ERR message\r\n */
    static std::string error(const std::string& message);

    /** RESP Integer: :123\r\n */
    static std::string integer(long long n);

    /** RESP Null Bulk String: $-1\r\n */
    static std::string nullBulk();

    /** RESP Bulk String: $len\r\nvalue\r\n */
    static std::string bulk(const std::string& value);

    /** RESP Array of bulk strings: *N\r\n ... */
    static std::string array(const std::vector<std::string>& values);
};
