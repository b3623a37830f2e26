#include <Util/Pipe.hpp>
#include <cerrno>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace InkWell {

void UniqueFd::reset(int fd)
{
    if (m_fd >= 0)
        ::close(m_fd);
    m_fd = fd;
}

Pipe makePipe()
{
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0)
        throw std::system_error(errno, std::generic_category(), "pipe2");
    Pipe p;
    p.readEnd.reset(fds[0]);
    p.writeEnd.reset(fds[1]);
    return p;
}

void setNonBlocking(int fd)
{
    int flags = ::fcntl(fd, F_GETFL);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0)
        throw std::system_error(errno, std::generic_category(), "fcntl(O_NONBLOCK)");
}

} // namespace InkWell
