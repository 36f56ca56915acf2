/**
 * @file Compressor.cc
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

#include <stdexcept>

#include <xxhash.h>

#include <spdlog/spdlog.h>

#include <lz4jb/util/Compressor.hh>
#include <lz4jb/util/Protocol.hh>

namespace lz4jb::util {

// provided by the liblz4 translation unit.
CompressorPtr makeLz4Compressor();
CompressorPtr makeLz4HCCompressor(int level);

CompressorPtr makeCompressor(Algo algo, int level)
{
    switch (algo)
    {
        case Algo::Lz4:
            return makeLz4Compressor();
        case Algo::Lz4HC:
            return makeLz4HCCompressor(level);
    }

    throw std::invalid_argument(fmt::format(
        "unknown compression algorithm {}"
        , static_cast<unsigned>(algo)));
}

CompressorPtr defaultCompressor()
{
    static const auto compressor = makeCompressor(Algo::Lz4);

    return compressor;
}

Algo parseAlgo(const std::string &name)
{
    if (name == "lz4")
        return Algo::Lz4;

    if (name == "lz4hc")
        return Algo::Lz4HC;

    throw std::invalid_argument(fmt::format("unknown compression algorithm '{}'", name));
}

const char *toString(Algo algo) noexcept
{
    switch (algo)
    {
        case Algo::Lz4:
            return "lz4";
        case Algo::Lz4HC:
            return "lz4hc";
    }

    return "unknown";
}

uint32_t lz4JavaChecksum(const uint8_t *data, size_t len) noexcept
{
    // lz4-java's StreamingXXHash32.asChecksum() drops the top nibble.
    return XXH32(data, len, wire::DefaultSeed) & wire::ChecksumMask;
}

Checksum defaultChecksum()
{
    return lz4JavaChecksum;
}

}
