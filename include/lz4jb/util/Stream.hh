/**
 * @file Stream.hh
 *
 * Licensed under the MIT License <https://opensource.org/licenses/MIT>.
 * SPDX-License-Identifier: MIT
 * Copyright (c) 2022 Zachary Parker
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef __LZ4JB_UTIL_STREAM_HH__
#define __LZ4JB_UTIL_STREAM_HH__

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "ScopedFd.hh"

namespace lz4jb::util {

/**
 * Blocking byte sink.
 */
class ByteSink
{
public:
    virtual ~ByteSink() = default;

    /**
     * Write up to `len` bytes.
     *
     * @return The number of bytes accepted; 0 only if `len` is 0 or the sink
     * cannot make progress.
     */
    virtual size_t write(const void *data, size_t len) = 0;

    virtual void flush() = 0;
};

/**
 * Blocking byte source.
 */
class ByteSource
{
public:
    virtual ~ByteSource() = default;

    /**
     * Read up to `len` bytes.
     *
     * @return The number of bytes read, 0 at end of input.
     */
    virtual size_t read(void *data, size_t len) = 0;
};

/**
 * Write all of `len` bytes, throwing std::system_error (EIO) if the sink
 * stops accepting data.
 */
void writeAll(ByteSink &sink, const void *data, size_t len);

/**
 * Read until `len` bytes have been read or the source is exhausted.
 *
 * @return The number of bytes read, less than `len` only at end of input.
 */
size_t readFully(ByteSource &source, void *data, size_t len);

/**
 * Pump `source` into `sink` until end of input. The sink is not flushed.
 *
 * @return The number of bytes copied.
 */
size_t copyStream(ByteSource &source, ByteSink &sink, size_t chunkSize = size_t{1} << 16);

class FdSink : public ByteSink
{
public:
    /**
     * Non-owning; the caller keeps the descriptor open.
     */
    explicit FdSink(int fd) noexcept;
    explicit FdSink(ScopedFd fd) noexcept;

    size_t write(const void *data, size_t len) override;
    void flush() override;

    int fd() const noexcept { return fd_; }

private:
    ScopedFd owned_;
    int fd_{-1};
};

class FdSource : public ByteSource
{
public:
    explicit FdSource(int fd) noexcept;
    explicit FdSource(ScopedFd fd) noexcept;

    size_t read(void *data, size_t len) override;

    int fd() const noexcept { return fd_; }

private:
    ScopedFd owned_;
    int fd_{-1};
};

/**
 * Appends everything written to an in-memory byte vector.
 */
class MemorySink : public ByteSink
{
public:
    size_t write(const void *data, size_t len) override;

    void flush() override
    {
        ++flushCount_;
    }

    const std::vector<uint8_t> &bytes() const noexcept { return bytes_; }
    std::vector<uint8_t> &bytes() noexcept { return bytes_; }

    size_t flushCount() const noexcept { return flushCount_; }

private:
    std::vector<uint8_t> bytes_;
    size_t flushCount_{ };
};

/**
 * Reads from caller-owned memory; the bytes must outlive the source.
 */
class MemorySource : public ByteSource
{
public:
    MemorySource() = default;
    explicit MemorySource(std::span<const uint8_t> bytes) noexcept;
    MemorySource(const void *data, size_t len) noexcept;

    size_t read(void *data, size_t len) override;

    size_t position() const noexcept { return pos_; }
    size_t remaining() const noexcept { return bytes_.size() - pos_; }

private:
    std::span<const uint8_t> bytes_;
    size_t pos_{ };
};

/**
 * Counts the bytes pulled through it from another source.
 */
class CountingSource : public ByteSource
{
public:
    explicit CountingSource(ByteSource &source) noexcept:
        source_(&source)
    {
    }

    size_t read(void *data, size_t len) override;

    uint64_t count() const noexcept { return count_; }

private:
    ByteSource *source_{ };
    uint64_t count_{ };
};

/**
 * Discards everything written, keeping a byte count.
 */
class NullSink : public ByteSink
{
public:
    size_t write(const void *, size_t len) override
    {
        count_ += len;
        return len;
    }

    void flush() override { }

    uint64_t count() const noexcept { return count_; }

private:
    uint64_t count_{ };
};

}

#endif
