#pragma once

#include <string>

#include "QueueStore.hpp"

/**
 * Snapshot
 * --------
 * Durable form of a QueueStore: one flat RESP array of bulk strings.
 *
 *   "turnstile-snapshot" "1" <mode|none> <next_id> <key_count>
 *   per key:   <key> <locked 0|1> <entry_count>
 *   per entry: <id> <key> <payload> <enqueued_at>
 *
 * Decoding is all-or-nothing: on error the target store is untouched.
 */
class Snapshot {
public:
    static std::string encode(const QueueStore& store);

    static bool decode(const std::string& data, QueueStore& out, std::string& err);

    // Writes <path>.tmp then renames it over <path>.
    static bool save(const QueueStore& store, const std::string& path, std::string& err);

    // A missing file is not an error: "out" is reset to an empty store.
    static bool load(const std::string& path, QueueStore& out, std::string& err);
};
