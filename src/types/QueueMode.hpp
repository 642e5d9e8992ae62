#pragma once

#include <string>

enum class QueueMode {SINGLE, MULTI};

// "single" / "multi", used in the snapshot header and in --mode.
inline const char* queueModeName(QueueMode mode) {
    return mode == QueueMode::SINGLE ? "single" : "multi";
}

// Returns false for anything other than "single" or "multi".
inline bool parseQueueMode(const std::string& name, QueueMode& out) {
    if (name == "single") {
        out = QueueMode::SINGLE;
        return true;
    }
    if (name == "multi") {
        out = QueueMode::MULTI;
        return true;
    }
    return false;
}
