/**
 * @file BlockHeader.cc
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

#include <bit>
#include <cstring>

#include <endian.h>

#include <spdlog/spdlog.h>

#include <lz4jb/util/BlockHeader.hh>
#include <lz4jb/util/Error.hh>

namespace lz4jb::util {
namespace {

uint32_t loadLe32(const uint8_t *p) noexcept
{
    uint32_t v{ };
    std::memcpy(&v, p, sizeof(v));
    return le32toh(v);
}

void storeLe32(uint8_t *p, uint32_t v) noexcept
{
    v = htole32(v);
    std::memcpy(p, &v, sizeof(v));
}

} // namespace

Method methodFromToken(uint8_t token)
{
    switch (token >> 4)
    {
        case static_cast<uint8_t>(Method::Raw):
            return Method::Raw;
        case static_cast<uint8_t>(Method::Lz4):
            return Method::Lz4;
        default:
            throw FormatError(fmt::format(
                "block header: unknown compression method in token {:#04x}"
                , token));
    }
}

unsigned sizeClassForBlockSize(size_t blockSize)
{
    if (blockSize < wire::MinBlockSize || blockSize > wire::MaxBlockSize)
    {
        throw ConfigError(fmt::format(
            "wrong block size {}, it should be between {} and {}"
            , blockSize
            , wire::MinBlockSize
            , wire::MaxBlockSize));
    }

    const auto log2 = static_cast<unsigned>(std::bit_width(blockSize - 1));

    return log2 > wire::SizeClassBase ? log2 - wire::SizeClassBase : 0u;
}

const char *toString(Method method) noexcept
{
    switch (method)
    {
        case Method::Raw:
            return "raw";
        case Method::Lz4:
            return "lz4";
    }

    return "unknown";
}

void BlockHeader::encode(uint8_t *out) const noexcept
{
    out[wire::TokenOffset] = token();
    storeLe32(out + wire::CompressedLengthOffset, compressedLength);
    storeLe32(out + wire::OriginalLengthOffset, originalLength);
    storeLe32(out + wire::ChecksumOffset, checksum);
}

BlockHeader BlockHeader::decode(const uint8_t *in)
{
    const auto token = in[wire::TokenOffset];

    auto header = BlockHeader{
            .method = methodFromToken(token),
            .sizeClass = static_cast<uint8_t>(token & wire::MaxSizeClass),
            .compressedLength = loadLe32(in + wire::CompressedLengthOffset),
            .originalLength = loadLe32(in + wire::OriginalLengthOffset),
            .checksum = loadLe32(in + wire::ChecksumOffset)
        };

    if (header.originalLength > maxLengthForSizeClass(header.sizeClass))
    {
        throw FormatError(fmt::format(
            "block header: original length {} exceeds {} allowed by size class {}"
            , header.originalLength
            , maxLengthForSizeClass(header.sizeClass)
            , header.sizeClass));
    }

    if (header.compressedLength > wire::MaxCompressedLength)
    {
        throw FormatError(fmt::format(
            "block header: compressed length {} is out of range"
            , header.compressedLength));
    }

    if (!header.compressedLength != !header.originalLength)
    {
        throw FormatError(fmt::format(
            "block header: compressed length {} and original length {} must both be zero or non-zero"
            , header.compressedLength
            , header.originalLength));
    }

    switch (header.method)
    {
        case Method::Raw:
            if (header.compressedLength != header.originalLength)
            {
                throw FormatError(fmt::format(
                    "block header: raw block compressed length {} differs from original length {}"
                    , header.compressedLength
                    , header.originalLength));
            }
            break;
        case Method::Lz4:
            if (header.compressedLength > header.originalLength)
            {
                throw FormatError(fmt::format(
                    "block header: lz4 block compressed length {} exceeds original length {}"
                    , header.compressedLength
                    , header.originalLength));
            }
            break;
    }

    if (header.isEndMarker() && header.checksum)
    {
        throw FormatError(fmt::format(
            "block header: end marker carries a non-zero checksum {:#010x}"
            , header.checksum));
    }

    return header;
}

}
