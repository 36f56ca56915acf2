/**
 * @file BlockOutput.hh
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

#ifndef __LZ4JB_UTIL_BLOCK_OUTPUT_HH__
#define __LZ4JB_UTIL_BLOCK_OUTPUT_HH__

#include <cstdint>

#include "BlockHeader.hh"
#include "Buffer.hh"
#include "Compressor.hh"
#include "Protocol.hh"
#include "Stream.hh"

namespace lz4jb::util {

/**
 * Block stream encoder.
 *
 * Bytes written are gathered into blocks of `blockSize` bytes; each full
 * block is compressed (or stored raw if compression does not shrink it) and
 * written to the sink with its header. The sink is borrowed, never owned:
 * finish() terminates the stream and hands the sink back, still open.
 */
class BlockOutput : public ByteSink
{
public:
    struct Options
    {
        // null selects defaultCompressor().
        CompressorPtr compressor;

        // empty selects defaultChecksum().
        Checksum checksum;
    };

    /**
     * @param sink The sink to write blocks to; must outlive the encoder.
     * @param blockSize Maximum number of bytes per block, [64, 33554432].
     * @throws ConfigError if `blockSize` is out of range.
     */
    explicit BlockOutput(ByteSink &sink, size_t blockSize = wire::DefaultBlockSize);
    BlockOutput(ByteSink &sink, size_t blockSize, Options opts);

    /**
     * Performs no I/O. Pending bytes which were not flushed are lost.
     */
    ~BlockOutput() noexcept override;

    BlockOutput(const BlockOutput &) = delete;
    BlockOutput &operator=(const BlockOutput &) = delete;

    /**
     * Buffer `len` bytes, emitting every block that fills up.
     *
     * @return `len`.
     * @throws StateError after finish() or a failed emit.
     */
    size_t write(const void *data, size_t len) override;

    /**
     * Emit the partially filled block, if any, then flush the sink.
     */
    void flush() override;

    /**
     * Emit the partially filled block, write the end-of-stream marker and
     * flush the sink.
     *
     * @return The sink passed at construction.
     */
    ByteSink &finish();

    size_t blockSize() const noexcept { return blockSize_; }
    unsigned sizeClass() const noexcept { return sizeClass_; }

    // Bytes buffered for the next block.
    size_t pending() const noexcept { return pending_; }

    // Data blocks emitted so far; the end marker is not counted.
    uint64_t blockCount() const noexcept { return blockCount_; }

    bool finished() const noexcept { return state_ == State::Finished; }

private:
    enum class State
    {
        Open,
        Finished,
        Failed
    };

    void checkOpen(const char *op) const;

    void emitBlock();
    void writeFramedHeader(const BlockHeader &header);

    ByteSink *sink_{ };
    CompressorPtr compressor_;
    Checksum checksum_;
    size_t blockSize_{ };
    unsigned sizeClass_{ };
    Buffer block_;
    Buffer compressed_;
    size_t pending_{ };
    uint64_t blockCount_{ };
    State state_{State::Open};
};

}

#endif
