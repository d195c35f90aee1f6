#include "monitor/output_monitor.hpp"

#include <cerrno>
#include <poll.h>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace runguard::monitor {

namespace {

constexpr int kIdlePollMs = 100;

std::string rstrip(std::string line) {
    while (!line.empty() &&
           (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    return line;
}

}  // namespace

OutputMonitor::OutputMonitor(const int fd, std::shared_ptr<OutputBuffer> buffer,
                             std::function<bool()> process_exited, std::ostream& echo)
    : fd_(fd),
      buffer_(std::move(buffer)),
      process_exited_(std::move(process_exited)),
      echo_(echo) {}

OutputMonitor::~OutputMonitor() {
    stop_requested_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void OutputMonitor::start() {
    thread_ = std::thread(&OutputMonitor::run, this);
}

bool OutputMonitor::wait_finished(const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_cv_.wait_for(lock, timeout, [this] { return finished_; });
}

void OutputMonitor::finish(const std::chrono::milliseconds grace) {
    if (!thread_.joinable()) {
        return;
    }
    if (!wait_finished(grace)) {
        LOG_WARN("OutputMonitor: output pipe still open after grace period, stopping reader");
    }
    stop_requested_.store(true);
    thread_.join();
}

void OutputMonitor::publish(std::string& pending, const bool flush_partial) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const auto newline = pending.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }
        lines.push_back(rstrip(pending.substr(start, newline - start)));
        start = newline + 1;
    }
    pending.erase(0, start);
    if (flush_partial && !pending.empty()) {
        lines.push_back(rstrip(std::move(pending)));
        pending.clear();
    }
    if (lines.empty()) {
        return;
    }

    for (const auto& line : lines) {
        echo_ << line << std::endl;
    }
    buffer_->append_batch(std::move(lines));
}

void OutputMonitor::mark_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
}

void OutputMonitor::run() {
    std::string pending;
    char chunk[4096];
    bool end_of_stream = false;

    while (!end_of_stream) {
        // A writer that never pauses keeps poll from ever timing out.
        if (stop_requested_.load()) {
            break;
        }
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kIdlePollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("OutputMonitor: poll failed, errno " + std::to_string(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        const ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            pending.append(chunk, static_cast<std::size_t>(n));
            publish(pending, false);
            continue;
        }
        if (n == 0) {
            end_of_stream = true;
            break;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            continue;
        }
        LOG_WARN("OutputMonitor: read failed, errno " + std::to_string(errno));
        break;
    }
    publish(pending, true);

    // The pipe can close a moment before the exit status is available.
    while (end_of_stream && !stop_requested_.load() && !process_exited_()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    mark_finished();
}

}  // namespace runguard::monitor
