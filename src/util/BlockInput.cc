/**
 * @file BlockInput.cc
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
// include after spdlog.
#include <spdlog/fmt/bin_to_hex.h>

#include <lz4jb/util/BlockInput.hh>
#include <lz4jb/util/Error.hh>

namespace lz4jb::util {

BlockInput::BlockInput(ByteSource &source):
    BlockInput(source, Options{ })
{
}

BlockInput::BlockInput(ByteSource &source, Options opts):
    source_(&source),
    compressor_(opts.compressor ? std::move(opts.compressor) : defaultCompressor()),
    checksum_(opts.checksum ? std::move(opts.checksum) : defaultChecksum()),
    blockCallback_(std::move(opts.blockCallback)),
    stopOnEndMarker_(opts.stopOnEndMarker)
{
}

size_t BlockInput::read(void *data, size_t len)
{
    switch (state_)
    {
        case State::Terminated:
            return 0;
        case State::Failed:
            std::rethrow_exception(error_);
        default:
            break;
    }

    if (!len)
        return 0;

    try
    {
        while (readPos_ == decodedLen_)
        {
            if (!loadBlock())
            {
                state_ = State::Terminated;
                decodedLen_ = readPos_ = 0;

                spdlog::debug("block input: end of stream after {} blocks", blockCount_);

                return 0;
            }
        }
    }
    catch (...)
    {
        error_ = std::current_exception();
        state_ = State::Failed;
        throw;
    }

    const auto count = std::min(len, decodedLen_ - readPos_);

    std::memcpy(data, decoded_.uint8Data() + readPos_, count);
    readPos_ += count;

    return count;
}

bool BlockInput::loadBlock()
{
    uint8_t framed[wire::FramedHeaderSize];

    for (;;)
    {
        const auto magicLen = readFully(*source_, framed, wire::MagicSize);

        if (magicLen < wire::MagicSize)
        {
            if (state_ == State::Uninitialized)
            {
                throw FormatError(fmt::format(
                    "block input: stream ended after {} bytes, before the {} byte magic"
                    , magicLen
                    , wire::MagicSize));
            }

            // a clean end between blocks: lz4-java streams which were never
            // finished stop here.
            if (!magicLen)
                return false;

            throw TruncationError(fmt::format(
                "block input: stream ended {} bytes into the magic of block {}"
                , magicLen
                , blockCount_));
        }

        if (!std::equal(framed, framed + wire::MagicSize, begin(wire::Magic)))
        {
            throw FormatError(fmt::format(
                "block input: invalid magic: {:spn}"
                , spdlog::to_hex(framed, framed + wire::MagicSize)));
        }

        state_ = State::Idle;

        const auto headerLen = readFully(*source_, framed + wire::MagicSize, wire::HeaderSize);

        if (headerLen < wire::HeaderSize)
        {
            throw TruncationError(fmt::format(
                "block input: stream ended {} bytes into the {} byte header of block {}"
                , headerLen
                , wire::HeaderSize
                , blockCount_));
        }

        const auto header = BlockHeader::decode(framed + wire::MagicSize);

        if (header.isEndMarker())
        {
            if (stopOnEndMarker_)
                return false;

            spdlog::trace("block input: skipping end marker");
            continue;
        }

        decoded_.reserve(header.originalLength);

        switch (header.method)
        {
            case Method::Raw:
                readPayload(decoded_.uint8Data(), header.compressedLength);
                break;
            case Method::Lz4:
                compressed_.reserve(header.compressedLength);
                readPayload(compressed_.uint8Data(), header.compressedLength);

                compressor_->decompress(
                    compressed_.uint8Data(), header.compressedLength,
                    decoded_.uint8Data(), header.originalLength);
                break;
        }

        const auto checksum = checksum_(decoded_.uint8Data(), header.originalLength);

        if (checksum != header.checksum)
        {
            throw CorruptionError(fmt::format(
                "block input: checksum mismatch in block {}: computed {:#010x}, expected {:#010x}"
                , blockCount_
                , checksum
                , header.checksum));
        }

        spdlog::trace("block input: block {} {} {} -> {} checksum {:#010x}"
            , blockCount_
            , toString(header.method)
            , header.compressedLength
            , header.originalLength
            , header.checksum);

        decodedLen_ = header.originalLength;
        readPos_ = 0;
        ++blockCount_;

        if (blockCallback_)
            blockCallback_(header);

        return true;
    }
}

void BlockInput::readPayload(uint8_t *data, size_t len)
{
    if (const auto count = readFully(*source_, data, len); count != len)
    {
        throw TruncationError(fmt::format(
            "block input: stream ended {} bytes into the {} byte payload of block {}"
            , count
            , len
            , blockCount_));
    }
}

const char *toString(BlockInput::State state) noexcept
{
    switch (state)
    {
        case BlockInput::State::Uninitialized:
            return "uninitialized";
        case BlockInput::State::Idle:
            return "idle";
        case BlockInput::State::Terminated:
            return "terminated";
        case BlockInput::State::Failed:
            return "failed";
    }

    return "unknown";
}

}
