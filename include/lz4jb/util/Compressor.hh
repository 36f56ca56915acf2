/**
 * @file Compressor.hh
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

#ifndef __LZ4JB_UTIL_COMPRESSOR_HH__
#define __LZ4JB_UTIL_COMPRESSOR_HH__

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace lz4jb::util {

enum class Algo : uint8_t
{
    Lz4 = 0,
    Lz4HC = 1
};

/**
 * Block-level LZ4 backend.
 *
 * Implementations hold no mutable state, so one instance may be shared by
 * any number of encoders and decoders, on any number of threads.
 */
class Compressor
{
public:
    virtual ~Compressor() = default;

    virtual const char *name() const noexcept = 0;

    // Upper bound of the compressed size of an input of length n.
    virtual size_t maxCompressedSize(size_t n) const = 0;

    /**
     * Compress `n` bytes of `src` into `dst`.
     *
     * @return The compressed size; it may be larger than `n`.
     * @throws CompressionError if the backend fails.
     */
    virtual size_t compress(const uint8_t *src, size_t n, uint8_t *dst, size_t dstCapacity) const = 0;

    /**
     * Decompress `n` bytes of `src` into exactly `originalLength` bytes of
     * `dst`.
     *
     * @throws DecompressionError if the input is malformed or does not expand
     * to exactly `originalLength` bytes.
     */
    virtual void decompress(const uint8_t *src, size_t n, uint8_t *dst, size_t originalLength) const = 0;
};

using CompressorPtr = std::shared_ptr<const Compressor>;

/**
 * @param level Compression level for Algo::Lz4HC; 0 selects the library
 * default. Ignored by Algo::Lz4.
 */
CompressorPtr makeCompressor(Algo algo, int level = 0);

CompressorPtr defaultCompressor();

/**
 * @throws std::invalid_argument for names other than "lz4" and "lz4hc".
 */
Algo parseAlgo(const std::string &name);

const char *toString(Algo algo) noexcept;

/**
 * Block checksum over decompressed bytes.
 */
using Checksum = std::function<uint32_t(const uint8_t *data, size_t len)>;

/**
 * XXH32 seeded with 0x9747b28c, top nibble cleared, as lz4-java computes it.
 */
uint32_t lz4JavaChecksum(const uint8_t *data, size_t len) noexcept;

Checksum defaultChecksum();

}

#endif
