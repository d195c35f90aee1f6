#include "monitor/output_buffer.hpp"

#include <iterator>
#include <utility>

namespace runguard::monitor {

void OutputBuffer::append_batch(std::vector<std::string> lines) {
    if (lines.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.insert(lines_.end(), std::make_move_iterator(lines.begin()),
                  std::make_move_iterator(lines.end()));
}

std::vector<std::string> OutputBuffer::read_since(OutputCursor& cursor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cursor.position_ >= lines_.size()) {
        return {};
    }
    std::vector<std::string> fresh(lines_.begin() + static_cast<std::ptrdiff_t>(cursor.position_),
                                   lines_.end());
    cursor.position_ = lines_.size();
    return fresh;
}

std::size_t OutputBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

std::vector<std::string> OutputBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

std::string OutputBuffer::joined() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string text;
    for (std::size_t i = 0; i < lines_.size(); ++i) {
        if (i > 0) {
            text.push_back('\n');
        }
        text += lines_[i];
    }
    return text;
}

}  // namespace runguard::monitor
