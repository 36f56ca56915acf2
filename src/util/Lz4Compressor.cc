/**
 * @file Lz4Compressor.cc
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
#include <limits>
#include <stdexcept>

#include <lz4.h>
#include <lz4hc.h>

#include <spdlog/spdlog.h>

#include <lz4jb/util/Compressor.hh>
#include <lz4jb/util/Error.hh>

namespace lz4jb::util {
namespace {

int checkedIntSize(size_t n, const char *what)
{
    if (n > static_cast<size_t>(LZ4_MAX_INPUT_SIZE))
    {
        throw std::invalid_argument(fmt::format(
            "lz4: {} size {} exceeds the lz4 maximum input size {}"
            , what
            , n
            , LZ4_MAX_INPUT_SIZE));
    }

    return static_cast<int>(n);
}

int checkedCapacity(size_t n)
{
    return static_cast<int>(std::min(n, static_cast<size_t>(std::numeric_limits<int>::max())));
}

class Lz4Base : public Compressor
{
public:
    size_t maxCompressedSize(size_t n) const override
    {
        return static_cast<size_t>(LZ4_compressBound(checkedIntSize(n, "input")));
    }

    void decompress(const uint8_t *src, size_t n, uint8_t *dst, size_t originalLength) const override
    {
        const auto len = LZ4_decompress_safe(
            reinterpret_cast<const char *>(src),
            reinterpret_cast<char *>(dst),
            checkedIntSize(n, "compressed"),
            checkedIntSize(originalLength, "original"));

        if (len < 0)
        {
            throw DecompressionError(fmt::format(
                "{}: malformed compressed block ({} bytes, error {})"
                , name()
                , n
                , len));
        }

        if (static_cast<size_t>(len) != originalLength)
        {
            throw DecompressionError(fmt::format(
                "{}: block decompressed to {} bytes, expected {}"
                , name()
                , len
                , originalLength));
        }
    }
};

class Lz4Fast final : public Lz4Base
{
public:
    const char *name() const noexcept override
    {
        return "lz4";
    }

    size_t compress(const uint8_t *src, size_t n, uint8_t *dst, size_t dstCapacity) const override
    {
        const auto len = LZ4_compress_default(
            reinterpret_cast<const char *>(src),
            reinterpret_cast<char *>(dst),
            checkedIntSize(n, "input"),
            checkedCapacity(dstCapacity));

        // 0 means the output did not fit; callers size dst with maxCompressedSize().
        if (len <= 0 && n)
        {
            throw CompressionError(fmt::format(
                "lz4: compression of {} bytes into {} bytes failed"
                , n
                , dstCapacity));
        }

        return static_cast<size_t>(len);
    }
};

class Lz4HC final : public Lz4Base
{
public:
    explicit Lz4HC(int level) noexcept:
        level_(level ? level : LZ4HC_CLEVEL_DEFAULT)
    {
    }

    const char *name() const noexcept override
    {
        return "lz4hc";
    }

    size_t compress(const uint8_t *src, size_t n, uint8_t *dst, size_t dstCapacity) const override
    {
        const auto len = LZ4_compress_HC(
            reinterpret_cast<const char *>(src),
            reinterpret_cast<char *>(dst),
            checkedIntSize(n, "input"),
            checkedCapacity(dstCapacity),
            level_);

        if (len <= 0 && n)
        {
            throw CompressionError(fmt::format(
                "lz4hc: compression of {} bytes into {} bytes failed (level {})"
                , n
                , dstCapacity
                , level_));
        }

        return static_cast<size_t>(len);
    }

private:
    const int level_;
};

} // namespace

CompressorPtr makeLz4Compressor()
{
    return std::make_shared<Lz4Fast>();
}

CompressorPtr makeLz4HCCompressor(int level)
{
    if (level < 0 || level > LZ4HC_CLEVEL_MAX)
    {
        throw ConfigError(fmt::format(
            "lz4hc: compression level {} is out of range [0, {}]"
            , level
            , LZ4HC_CLEVEL_MAX));
    }

    return std::make_shared<Lz4HC>(level);
}

}
