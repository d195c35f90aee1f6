#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include "monitor/output_buffer.hpp"

namespace runguard::monitor {

// Background reader for a service's merged stdout/stderr pipe. Every complete
// line is appended to the buffer and echoed. The reader finishes once the pipe
// reports end-of-stream and process_exited() returns true afterwards.
class OutputMonitor {
public:
    OutputMonitor(int fd, std::shared_ptr<OutputBuffer> buffer,
                  std::function<bool()> process_exited, std::ostream& echo = std::cout);
    ~OutputMonitor();

    OutputMonitor(const OutputMonitor&) = delete;
    OutputMonitor& operator=(const OutputMonitor&) = delete;

    void start();

    // True once the reader has finished on its own.
    bool wait_finished(std::chrono::milliseconds timeout);

    // Waits up to grace for a natural finish, then makes the reader give up
    // at its next idle poll and joins it. A descendant that escaped the tree
    // can otherwise hold the pipe open forever.
    void finish(std::chrono::milliseconds grace);

private:
    void run();
    void publish(std::string& pending, bool flush_partial);
    void mark_finished();

    int fd_;
    std::shared_ptr<OutputBuffer> buffer_;
    std::function<bool()> process_exited_;
    std::ostream& echo_;

    std::thread thread_;
    std::atomic_bool stop_requested_{false};
    std::mutex mutex_;
    std::condition_variable finished_cv_;
    bool finished_ = false;
};

}  // namespace runguard::monitor
