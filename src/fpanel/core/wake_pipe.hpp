#pragma once

namespace fpanel {

/**
 * @brief Non-blocking self-pipe that wakes a poll() loop from other threads.
 *
 * notify() may be called from any thread; drain() and the read end belong to
 * the polling thread.
 */
class WakePipe
{
public:
    WakePipe();
    ~WakePipe();

    WakePipe(WakePipe const&) = delete;
    WakePipe& operator=(WakePipe const&) = delete;

    int file_descriptor() const { return read_fd_; }

    void notify();

    /// Consumes every pending wake-up so the read end stops polling readable.
    void drain();

private:
    int read_fd_ = -1;
    int write_fd_ = -1;
};

} // namespace fpanel
