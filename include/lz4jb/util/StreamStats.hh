/**
 * @file StreamStats.hh
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

#ifndef __LZ4JB_UTIL_STREAM_STATS_HH__
#define __LZ4JB_UTIL_STREAM_STATS_HH__

#include <cstdint>
#include <string>

#include "BlockHeader.hh"
#include "BlockInput.hh"
#include "Stream.hh"

namespace lz4jb::util {

struct StreamStats
{
    std::string name;

    uint64_t compressedSize{ };
    uint64_t decompressedSize{ };

    uint64_t rawBlocks{ };
    uint64_t lz4Blocks{ };

    uint64_t blockCount() const noexcept
    {
        return rawBlocks + lz4Blocks;
    }

    // compressed size as a percentage of the decompressed size.
    double ratio() const noexcept
    {
        if (!decompressedSize)
            return 0.0;

        return 100.0 * static_cast<double>(compressedSize) / static_cast<double>(decompressedSize);
    }

    void addBlock(const BlockHeader &header) noexcept;
};

/**
 * Decode all of `source`, discarding the output.
 *
 * `compressedSize` counts every byte pulled from the source, framing
 * included. Any decoding error propagates.
 */
StreamStats scanStream(ByteSource &source, std::string name, BlockInput::Options opts = { });

}

#endif
