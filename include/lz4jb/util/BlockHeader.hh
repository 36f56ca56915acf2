/**
 * @file BlockHeader.hh
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

#ifndef __LZ4JB_UTIL_BLOCK_HEADER_HH__
#define __LZ4JB_UTIL_BLOCK_HEADER_HH__

#include <cstddef>
#include <cstdint>

#include "Protocol.hh"

namespace lz4jb::util {

enum class Method : uint8_t
{
    Raw = 1,
    Lz4 = 2
};

constexpr uint8_t methodToken(Method method) noexcept
{
    return static_cast<uint8_t>(static_cast<uint8_t>(method) << 4);
}

/**
 * Parse the method nibble of a block token.
 *
 * @throws FormatError for anything other than RAW (0x1_) or LZ4 (0x2_).
 */
Method methodFromToken(uint8_t token);

/**
 * Size class of a block size: ceil(log2(blockSize)) - 10, floored at 0.
 *
 * @throws ConfigError if `blockSize` is outside [64, 33554432].
 */
unsigned sizeClassForBlockSize(size_t blockSize);

constexpr size_t maxLengthForSizeClass(unsigned sizeClass) noexcept
{
    return size_t{1} << (sizeClass + wire::SizeClassBase);
}

const char *toString(Method method) noexcept;

struct BlockHeader
{
    Method method{Method::Raw};
    uint8_t sizeClass{ };
    uint32_t compressedLength{ };
    uint32_t originalLength{ };
    uint32_t checksum{ };

    static constexpr BlockHeader endMarker() noexcept
    {
        return { };
    }

    bool isEndMarker() const noexcept
    {
        return !compressedLength && !originalLength;
    }

    uint8_t token() const noexcept
    {
        return methodToken(method) | (sizeClass & wire::MaxSizeClass);
    }

    /**
     * Serialize into `wire::HeaderSize` bytes (no magic).
     */
    void encode(uint8_t *out) const noexcept;

    /**
     * Parse and validate `wire::HeaderSize` bytes (no magic).
     *
     * @throws FormatError if the method is unknown, the lengths disagree
     * with the method or the size class, or a marker carries a checksum.
     */
    static BlockHeader decode(const uint8_t *in);
};

}

#endif
