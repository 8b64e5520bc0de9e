#pragma once

/**
 * ByteStream.hpp
 *
 * Blocking byte sources and sinks attached to stream channels
 * (pipes and ptys of a running command, the terminal of a client).
 */

#include <cstddef>
#include <memory>

namespace stevedore::core::stream {

class Reader {
public:
    virtual ~Reader() = default;

    /**
     * Read up to size bytes, blocking
     * @return Number of bytes read, 0 at end of stream
     * @throws std::system_error on read failure
     */
    virtual size_t read(char* buffer, size_t size) = 0;
};

class Writer {
public:
    virtual ~Writer() = default;

    /**
     * Write a buffer, blocking
     * @return Number of bytes written; less than size on failure
     */
    virtual size_t write(const char* data, size_t size) = 0;

    virtual void close() = 0;
};

using ReaderPtr = std::shared_ptr<Reader>;
using WriterPtr = std::shared_ptr<Writer>;

/**
 * Reader over a POSIX file descriptor
 */
class FdReader : public Reader {
public:
    /**
     * @param fd File descriptor
     * @param owned Close the descriptor on destruction
     */
    explicit FdReader(int fd, bool owned = true);
    ~FdReader() override;

    FdReader(const FdReader&) = delete;
    FdReader& operator=(const FdReader&) = delete;

    size_t read(char* buffer, size_t size) override;

    int fd() const { return m_fd; }

private:
    int m_fd;
    bool m_owned;
};

/**
 * Writer over a POSIX file descriptor
 */
class FdWriter : public Writer {
public:
    explicit FdWriter(int fd, bool owned = true);
    ~FdWriter() override;

    FdWriter(const FdWriter&) = delete;
    FdWriter& operator=(const FdWriter&) = delete;

    size_t write(const char* data, size_t size) override;
    void close() override;

    int fd() const { return m_fd; }

private:
    int m_fd;
    bool m_owned;
};

} // namespace stevedore::core::stream
