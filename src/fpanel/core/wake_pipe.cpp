#include "wake_pipe.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace fpanel {

namespace {

void set_flags(int fd)
{
    int status = fcntl(fd, F_GETFL);
    int descriptor = fcntl(fd, F_GETFD);
    if (status < 0 || descriptor < 0 || fcntl(fd, F_SETFL, status | O_NONBLOCK) < 0
        || fcntl(fd, F_SETFD, descriptor | FD_CLOEXEC) < 0)
    {
        throw std::runtime_error(std::string("Failed to configure wake pipe: ") + std::strerror(errno));
    }
}

} // namespace

WakePipe::WakePipe()
{
    int fds[2];
    if (pipe(fds) != 0)
    {
        throw std::runtime_error(std::string("Failed to create wake pipe: ") + std::strerror(errno));
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];

    try
    {
        set_flags(read_fd_);
        set_flags(write_fd_);
    }
    catch (...)
    {
        close(read_fd_);
        close(write_fd_);
        throw;
    }
}

WakePipe::~WakePipe()
{
    close(read_fd_);
    close(write_fd_);
}

void WakePipe::notify()
{
    char const byte = 1;
    while (write(write_fd_, &byte, 1) < 0)
    {
        if (errno == EINTR)
            continue;
        // A full pipe already guarantees a wake-up
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            LOG_ERROR("Failed to wake the event loop: {}", std::strerror(errno));
        return;
    }
}

void WakePipe::drain()
{
    char buffer[64];
    while (true)
    {
        ssize_t n = read(read_fd_, buffer, sizeof(buffer));
        if (n > 0)
            continue;
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
            LOG_ERROR("Failed to drain the wake pipe: {}", std::strerror(errno));
        return;
    }
}

} // namespace fpanel
