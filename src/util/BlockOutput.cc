/**
 * @file BlockOutput.cc
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
#include <cstring>

#include <spdlog/spdlog.h>

#include <lz4jb/util/BlockOutput.hh>
#include <lz4jb/util/Error.hh>

namespace lz4jb::util {

BlockOutput::BlockOutput(ByteSink &sink, size_t blockSize):
    BlockOutput(sink, blockSize, Options{ })
{
}

BlockOutput::BlockOutput(ByteSink &sink, size_t blockSize, Options opts):
    sink_(&sink),
    compressor_(opts.compressor ? std::move(opts.compressor) : defaultCompressor()),
    checksum_(opts.checksum ? std::move(opts.checksum) : defaultChecksum()),
    blockSize_(blockSize),
    sizeClass_(sizeClassForBlockSize(blockSize))
{
    block_.resize(blockSize_);
    compressed_.resize(compressor_->maxCompressedSize(blockSize_));

    spdlog::debug("block output: block size {} (class {}), compressor {}"
        , blockSize_
        , sizeClass_
        , compressor_->name());
}

BlockOutput::~BlockOutput() noexcept
{
    if (state_ == State::Open && pending_)
    {
        spdlog::warn("block output: destroyed with {} unflushed bytes, the stream is incomplete"
            , pending_);
    }
}

size_t BlockOutput::write(const void *data, size_t len)
{
    checkOpen("write");

    auto src = reinterpret_cast<const uint8_t *>(data);

    try
    {
        for (size_t offset = 0; offset < len; )
        {
            const auto count = std::min(len - offset, blockSize_ - pending_);

            std::memcpy(block_.uint8Data() + pending_, src + offset, count);

            pending_ += count;
            offset += count;

            if (pending_ == blockSize_)
                emitBlock();
        }
    }
    catch (...)
    {
        state_ = State::Failed;
        throw;
    }

    return len;
}

void BlockOutput::flush()
{
    checkOpen("flush");

    try
    {
        if (pending_)
            emitBlock();

        sink_->flush();
    }
    catch (...)
    {
        state_ = State::Failed;
        throw;
    }
}

ByteSink &BlockOutput::finish()
{
    checkOpen("finish");

    try
    {
        if (pending_)
            emitBlock();

        auto marker = BlockHeader::endMarker();
        marker.sizeClass = static_cast<uint8_t>(sizeClass_);

        writeFramedHeader(marker);

        sink_->flush();
    }
    catch (...)
    {
        state_ = State::Failed;
        throw;
    }

    state_ = State::Finished;

    spdlog::debug("block output: finished after {} blocks", blockCount_);

    return *sink_;
}

void BlockOutput::checkOpen(const char *op) const
{
    switch (state_)
    {
        case State::Open:
            return;
        case State::Finished:
            throw StateError(fmt::format("block output: {} after finish", op));
        case State::Failed:
            throw StateError(fmt::format("block output: {} after a failed block write", op));
    }
}

void BlockOutput::emitBlock()
{
    const auto raw = block_.uint8Data();

    const auto compressedLen = compressor_->compress(
        raw, pending_, compressed_.uint8Data(), compressed_.size());

    auto header = BlockHeader{
            .method = Method::Raw,
            .sizeClass = static_cast<uint8_t>(sizeClass_),
            .compressedLength = static_cast<uint32_t>(pending_),
            .originalLength = static_cast<uint32_t>(pending_),
            .checksum = checksum_(raw, pending_)
        };

    auto payload = raw;

    if (compressedLen < pending_)
    {
        header.method = Method::Lz4;
        header.compressedLength = static_cast<uint32_t>(compressedLen);
        payload = compressed_.uint8Data();
    }

    writeFramedHeader(header);
    writeAll(*sink_, payload, header.compressedLength);

    spdlog::trace("block output: block {} {} {} -> {} checksum {:#010x}"
        , blockCount_
        , toString(header.method)
        , header.originalLength
        , header.compressedLength
        , header.checksum);

    pending_ = 0;
    ++blockCount_;
}

void BlockOutput::writeFramedHeader(const BlockHeader &header)
{
    uint8_t buf[wire::FramedHeaderSize];

    std::copy(begin(wire::Magic), end(wire::Magic), buf);
    header.encode(buf + wire::MagicSize);

    writeAll(*sink_, buf, sizeof(buf));
}

}
