/**
 * ByteStream.cpp
 *
 * POSIX file descriptor readers and writers.
 */

#include "ByteStream.hpp"

#include <cerrno>
#include <system_error>

#include <unistd.h>

namespace stevedore::core::stream {

FdReader::FdReader(int fd, bool owned)
    : m_fd(fd)
    , m_owned(owned) {
}

FdReader::~FdReader() {
    if (m_owned && m_fd >= 0) {
        ::close(m_fd);
    }
}

size_t FdReader::read(char* buffer, size_t size) {
    while (true) {
        ssize_t n = ::read(m_fd, buffer, size);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }

        if (errno == EINTR) {
            continue;
        }

        // A pty whose other side went away reports EIO instead of EOF
        if (errno == EIO) {
            return 0;
        }

        throw std::system_error(errno, std::generic_category(), "read");
    }
}

FdWriter::FdWriter(int fd, bool owned)
    : m_fd(fd)
    , m_owned(owned) {
}

FdWriter::~FdWriter() {
    close();
}

size_t FdWriter::write(const char* data, size_t size) {
    size_t written = 0;

    while (written < size && m_fd >= 0) {
        ssize_t n = ::write(m_fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        written += static_cast<size_t>(n);
    }

    return written;
}

void FdWriter::close() {
    if (m_owned && m_fd >= 0) {
        ::close(m_fd);
    }
    m_fd = -1;
}

} // namespace stevedore::core::stream
