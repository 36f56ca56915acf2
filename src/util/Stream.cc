/**
 * @file Stream.cc
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

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include <lz4jb/util/Buffer.hh>
#include <lz4jb/util/Stream.hh>

namespace lz4jb::util {

void writeAll(ByteSink &sink, const void *data, size_t len)
{
    auto buf = reinterpret_cast<const uint8_t *>(data);

    for (size_t offset = 0; offset < len; )
    {
        const auto written = sink.write(buf + offset, len - offset);

        if (!written)
        {
            throw std::system_error(EIO, std::system_category(),
                fmt::format("writeAll: sink accepted no data ({}/{} bytes written)"
                    , offset
                    , len));
        }

        offset += written;
    }
}

size_t readFully(ByteSource &source, void *data, size_t len)
{
    auto buf = reinterpret_cast<uint8_t *>(data);

    for (size_t offset = 0; offset < len; )
    {
        const auto count = source.read(buf + offset, len - offset);

        if (!count)
            return offset;

        offset += count;
    }

    return len;
}

size_t copyStream(ByteSource &source, ByteSink &sink, size_t chunkSize)
{
    auto buf = Buffer{std::max(chunkSize, size_t{1})};
    auto total = size_t{ };

    while (auto len = source.read(buf.data(), buf.size()))
    {
        writeAll(sink, buf.data(), len);
        total += len;
    }

    return total;
}

////////////////////////////////////////////////////////////////////////////////
// FdSink

FdSink::FdSink(int fd) noexcept:
    fd_(fd)
{
}

FdSink::FdSink(ScopedFd fd) noexcept:
    owned_(std::move(fd)),
    fd_(owned_.get())
{
}

size_t FdSink::write(const void *data, size_t len)
{
    for (;;)
    {
        const auto count = ::write(fd_, data, len);

        if (count >= 0)
            return static_cast<size_t>(count);

        if (errno != EINTR)
            throw std::system_error(errno, std::system_category(), "FdSink: write");
    }
}

void FdSink::flush()
{
    // write(2) has no user space buffering to push out.
}

////////////////////////////////////////////////////////////////////////////////
// FdSource

FdSource::FdSource(int fd) noexcept:
    fd_(fd)
{
}

FdSource::FdSource(ScopedFd fd) noexcept:
    owned_(std::move(fd)),
    fd_(owned_.get())
{
}

size_t FdSource::read(void *data, size_t len)
{
    for (;;)
    {
        const auto count = ::read(fd_, data, len);

        if (count >= 0)
            return static_cast<size_t>(count);

        if (errno != EINTR)
            throw std::system_error(errno, std::system_category(), "FdSource: read");
    }
}

////////////////////////////////////////////////////////////////////////////////
// MemorySink

size_t MemorySink::write(const void *data, size_t len)
{
    auto p = reinterpret_cast<const uint8_t *>(data);

    bytes_.insert(end(bytes_), p, p + len);

    return len;
}

////////////////////////////////////////////////////////////////////////////////
// MemorySource

MemorySource::MemorySource(std::span<const uint8_t> bytes) noexcept:
    bytes_(bytes)
{
}

MemorySource::MemorySource(const void *data, size_t len) noexcept:
    bytes_(reinterpret_cast<const uint8_t *>(data), len)
{
}

size_t MemorySource::read(void *data, size_t len)
{
    const auto count = std::min(len, remaining());

    if (count)
        std::memcpy(data, bytes_.data() + pos_, count);

    pos_ += count;

    return count;
}

////////////////////////////////////////////////////////////////////////////////
// CountingSource

size_t CountingSource::read(void *data, size_t len)
{
    const auto count = source_->read(data, len);

    count_ += count;

    return count;
}

}
