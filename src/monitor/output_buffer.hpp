#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace runguard::monitor {

// Reader position into an OutputBuffer. Only ever moves forward.
class OutputCursor {
public:
    std::size_t position() const { return position_; }

private:
    friend class OutputBuffer;
    std::size_t position_ = 0;
};

// Append-only list of output lines. One thread appends, another reads through
// a cursor; lines are never changed or removed once appended.
class OutputBuffer {
public:
    // Appends lines from one read in a single step so a reader sees all or none.
    void append_batch(std::vector<std::string> lines);

    // Lines appended since the cursor's position; advances the cursor past them.
    std::vector<std::string> read_since(OutputCursor& cursor) const;

    std::size_t size() const;
    std::vector<std::string> snapshot() const;

    // All lines joined with '\n'.
    std::string joined() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

}  // namespace runguard::monitor
