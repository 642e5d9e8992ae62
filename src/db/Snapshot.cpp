#include "Snapshot.hpp"

#include <charconv>
#include <system_error>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include "../protocol/RESPParser.hpp"
#include "../protocol/RESPWriter.hpp"

namespace {

const char* kMagic = "turnstile-snapshot";
const char* kVersion = "1";

template <typename T>
bool parseNumber(std::string_view text, T& out) {
    if (text.empty())
        return false;

    auto res = std::from_chars(text.data(), text.data() + text.size(), out);
    return res.ec == std::errc() && res.ptr == text.data() + text.size();
}

// Makes the rename itself durable. Best effort: not every filesystem
// allows fsync on a directory.
void syncParentDir(const std::string& path) {
    size_t slash = path.rfind('/');
    std::string dir = slash == std::string::npos ? "." : path.substr(0, slash + 1);

    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0)
        return;
    if (::fsync(fd) != 0 && errno != EINVAL)
        std::cerr << "fsync of " << dir << " failed\n";
    if (::close(fd) != 0)
        std::cerr << "close of " << dir << " failed\n";
}

}

// ----------------------------------------------------
// Encoding
// ----------------------------------------------------
std::string Snapshot::encode(const QueueStore& store) {
    std::vector<std::string> fields;
    fields.reserve(5 + store.queues.size() * 3 + store.totalEntries() * 4);

    fields.push_back(kMagic);
    fields.push_back(kVersion);
    fields.push_back(store.last_mode ? queueModeName(*store.last_mode) : "none");
    fields.push_back(std::to_string(store.next_id));
    fields.push_back(std::to_string(store.queues.size()));

    for (const auto& pair : store.queues) {
        const KeyQueueState& queue = pair.second;

        fields.push_back(pair.first);
        fields.push_back(queue.IsLocked() ? "1" : "0");
        fields.push_back(std::to_string(queue.Len()));

        for (const auto& entry : queue.Entries()) {
            fields.push_back(std::to_string(entry.id));
            fields.push_back(entry.key);
            fields.push_back(entry.payload);
            fields.push_back(std::to_string(entry.enqueued_at));
        }
    }

    return RESPWriter::array(fields);
}

// ----------------------------------------------------
// Decoding
// ----------------------------------------------------
bool Snapshot::decode(const std::string& data, QueueStore& out, std::string& err) {
    std::vector<std::string_view> fields;
    size_t consumed = 0;

    if (RESPParser::parseArray(data, 0, fields, consumed) != RESPParser::Status::COMPLETE) {
        err = "snapshot is not a valid RESP array";
        return false;
    }
    if (consumed != data.size()) {
        err = "trailing bytes after snapshot";
        return false;
    }
    if (fields.size() < 5 || fields[0] != kMagic) {
        err = "missing snapshot header";
        return false;
    }
    if (fields[1] != kVersion) {
        err = "unsupported snapshot version " + std::string(fields[1]);
        return false;
    }

    QueueStore loaded;

    if (fields[2] != "none") {
        QueueMode mode;
        if (!parseQueueMode(std::string(fields[2]), mode)) {
            err = "unknown mode '" + std::string(fields[2]) + "'";
            return false;
        }
        loaded.last_mode = mode;
    }

    size_t key_count = 0;
    if (!parseNumber(fields[3], loaded.next_id) || !parseNumber(fields[4], key_count)) {
        err = "malformed snapshot header";
        return false;
    }

    size_t pos = 5;
    for (size_t k = 0; k < key_count; ++k) {
        if (pos + 3 > fields.size()) {
            err = "truncated snapshot";
            return false;
        }

        std::string key(fields[pos]);
        std::string_view locked = fields[pos + 1];
        size_t entry_count = 0;

        if ((locked != "0" && locked != "1") || !parseNumber(fields[pos + 2], entry_count)) {
            err = "malformed queue header for key '" + key + "'";
            return false;
        }
        pos += 3;

        if (loaded.queues.count(key)) {
            err = "duplicate key '" + key + "'";
            return false;
        }

        KeyQueueState& queue = loaded.getOrCreateQueue(key);

        for (size_t e = 0; e < entry_count; ++e) {
            if (pos + 4 > fields.size()) {
                err = "truncated snapshot";
                return false;
            }

            QueueEntry entry;
            if (!parseNumber(fields[pos], entry.id) ||
                !parseNumber(fields[pos + 3], entry.enqueued_at)) {
                err = "malformed entry in queue '" + key + "'";
                return false;
            }
            if (entry.id >= loaded.next_id) {
                err = "entry id " + std::to_string(entry.id) + " not below next_id";
                return false;
            }
            entry.key = std::string(fields[pos + 1]);
            entry.payload = std::string(fields[pos + 2]);
            pos += 4;

            queue.PushBack(std::move(entry));
        }

        if (locked == "1") {
            if (queue.Empty()) {
                err = "queue '" + key + "' locked but empty";
                return false;
            }
            queue.Lock();
        }
    }

    if (pos != fields.size()) {
        err = "unexpected fields after last queue";
        return false;
    }

    out = std::move(loaded);
    return true;
}

// ----------------------------------------------------
// File I/O
// ----------------------------------------------------
bool Snapshot::save(const QueueStore& store, const std::string& path, std::string& err) {
    std::string tmp_path = path + ".tmp";
    std::string data = encode(store);

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        err = "cannot open " + tmp_path + " for writing";
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        written += n;
    }

    // Contents must be on disk before the rename makes them the snapshot.
    bool ok = written == data.size() && ::fsync(fd) == 0;
    if (::close(fd) != 0)
        ok = false;

    if (!ok) {
        err = "write to " + tmp_path + " failed";
        std::remove(tmp_path.c_str());
        return false;
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        err = "cannot rename " + tmp_path + " to " + path;
        std::remove(tmp_path.c_str());
        return false;
    }

    syncParentDir(path);
    return true;
}

bool Snapshot::load(const std::string& path, QueueStore& out, std::string& err) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        // First start: nothing persisted yet.
        out.clear();
        return true;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        err = "read from " + path + " failed";
        return false;
    }

    return decode(buffer.str(), out, err);
}
