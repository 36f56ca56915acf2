/**
 * @file Protocol.hh
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

#ifndef __LZ4JB_PROTOCOL_HH__
#define __LZ4JB_PROTOCOL_HH__

#include <array>
#include <cstddef>
#include <cstdint>

namespace lz4jb::wire {

/**
 * Block stream framing, as written by lz4-java's LZ4BlockOutputStream.
 *
 * Every block on the wire is laid out as:
 *
 *   magic[8] | token[1] | compressedLength[4] | originalLength[4] | checksum[4] | payload
 *
 * All integers are little-endian. The token's high nibble is the method, the
 * low nibble the block size class (log2(blockSize) - 10).
 */
constexpr std::array<uint8_t, 8> Magic = {'L', 'Z', '4', 'B', 'l', 'o', 'c', 'k'};

constexpr size_t MagicSize = Magic.size();

constexpr size_t TokenOffset = 0;
constexpr size_t CompressedLengthOffset = 1;
constexpr size_t OriginalLengthOffset = 5;
constexpr size_t ChecksumOffset = 9;

constexpr size_t HeaderSize = 13;
constexpr size_t FramedHeaderSize = MagicSize + HeaderSize;

constexpr unsigned SizeClassBase = 10;
constexpr unsigned MaxSizeClass = 0x0f;

constexpr size_t MinBlockSize = 64;
constexpr size_t MaxBlockSize = size_t{1} << (SizeClassBase + MaxSizeClass);
constexpr size_t DefaultBlockSize = size_t{1} << 16;

constexpr uint32_t DefaultSeed = 0x9747b28c;
constexpr uint32_t ChecksumMask = 0x0fffffff;

// lz4-java stores lengths in signed ints.
constexpr uint32_t MaxCompressedLength = 0x7fffffff;

static_assert(MaxBlockSize == 33554432);
static_assert(FramedHeaderSize == 21);

}

#endif
