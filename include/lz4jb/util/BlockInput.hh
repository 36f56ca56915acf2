/**
 * @file BlockInput.hh
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

#ifndef __LZ4JB_UTIL_BLOCK_INPUT_HH__
#define __LZ4JB_UTIL_BLOCK_INPUT_HH__

#include <cstdint>
#include <exception>
#include <functional>

#include "BlockHeader.hh"
#include "Buffer.hh"
#include "Compressor.hh"
#include "Stream.hh"

namespace lz4jb::util {

/**
 * Block stream decoder.
 *
 * Presents the blocks read from the source as one continuous byte stream.
 * Blocks are decoded lazily, one at a time, as reads drain the previous one.
 * The source is borrowed and never read past the end-of-stream marker.
 */
class BlockInput : public ByteSource
{
public:
    enum class State
    {
        Uninitialized,
        Idle,
        Terminated,
        Failed
    };

    using BlockCallback = std::function<void(const BlockHeader &)>;

    struct Options
    {
        // null selects defaultCompressor().
        CompressorPtr compressor;

        // empty selects defaultChecksum().
        Checksum checksum;

        // called with the header of every decoded data block.
        BlockCallback blockCallback;

        // false skips end markers, decoding concatenated streams until the
        // source is exhausted.
        bool stopOnEndMarker{true};
    };

    explicit BlockInput(ByteSource &source);
    BlockInput(ByteSource &source, Options opts);

    BlockInput(const BlockInput &) = delete;
    BlockInput &operator=(const BlockInput &) = delete;

    /**
     * Read up to `len` decoded bytes.
     *
     * @return The number of bytes read; 0 at the end of the stream.
     * @throws FormatError, TruncationError, CorruptionError, BackendError, or
     * whatever the source throws. The decoder is unusable afterwards: every
     * later read rethrows the same error.
     */
    size_t read(void *data, size_t len) override;

    State state() const noexcept { return state_; }

    uint64_t blockCount() const noexcept { return blockCount_; }

    // Decoded bytes not yet returned to the caller.
    size_t buffered() const noexcept { return decodedLen_ - readPos_; }

private:
    bool loadBlock();
    void readPayload(uint8_t *data, size_t len);

    ByteSource *source_{ };
    CompressorPtr compressor_;
    Checksum checksum_;
    BlockCallback blockCallback_;
    bool stopOnEndMarker_{true};

    Buffer decoded_;
    Buffer compressed_;
    size_t decodedLen_{ };
    size_t readPos_{ };

    uint64_t blockCount_{ };
    State state_{State::Uninitialized};
    std::exception_ptr error_;
};

const char *toString(BlockInput::State state) noexcept;

}

#endif
