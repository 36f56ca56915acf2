/* @file gtest_lz4jb.cc
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

#include <gtest/gtest.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

#include <strings.h>
#include <sys/eventfd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <lz4jb/util/BlockHeader.hh>
#include <lz4jb/util/Buffer.hh>
#include <lz4jb/util/Compressor.hh>
#include <lz4jb/util/Error.hh>
#include <lz4jb/util/ScopedFd.hh>
#include <lz4jb/util/ScopedTimer.hh>
#include <lz4jb/util/Stream.hh>
#include <lz4jb/util/StreamStats.hh>
#include <lz4jb/util/Util.hh>
#include <lz4jb/util/UtilJson.hh>

////////////////////////////////////////////////////////////////////////////////
// Util

using namespace lz4jb::util;
namespace wire = lz4jb::wire;

////////////////////////////////////////////////////////////////////////////////
// Buffer

TEST(buffer, default_ctor)
{
    auto b = Buffer{ };

    EXPECT_EQ(b.size(), 0u);
    EXPECT_EQ(b.data(), nullptr);
    EXPECT_EQ(b.uint8Data(), nullptr);
}

TEST(buffer, size_ctor)
{
    const auto size = 16u;
    auto b = Buffer{size};

    EXPECT_EQ(b.size(), size);
    EXPECT_NE(b.data(), nullptr);
}

TEST(buffer, size_ctor_invalid)
{
    const auto size = std::numeric_limits<size_t>::max();
    EXPECT_THROW(Buffer{size}, std::bad_alloc);
}

TEST(buffer, raw_ctor)
{
    const auto src = std::string{"0123456789abcdef"};

    auto b = Buffer(src.data(), src.size());

    ASSERT_NE(b.data(), nullptr);
    ASSERT_EQ(b.size(), src.size());
    EXPECT_EQ(0, bcmp(src.data(), b.data(), b.size()));

    EXPECT_EQ(Buffer(nullptr, 0).data(), nullptr);
    EXPECT_EQ(Buffer(src.data(), 0).size(), 0u);
}

TEST(buffer, copy_ctor)
{
    const auto size = 16u;

    auto b1 = Buffer{size};
    std::memset(b1.data(), 0x55, b1.size());

    auto b2 = b1;
    EXPECT_NE(b1.data(), b2.data());
    EXPECT_EQ(b1.size(), b2.size());
    EXPECT_EQ(0, bcmp(b1.data(), b2.data(), b2.size()));
}

TEST(buffer, move_ctor)
{
    const auto size = 16u;

    auto b1 = Buffer{size};
    std::memset(b1.data(), 0x55, b1.size());

    const auto *p = b1.data();

    auto b2 = std::move(b1);
    EXPECT_EQ(b2.data(), p);
    EXPECT_EQ(b2.size(), size);
    EXPECT_EQ(b1.data(), nullptr);
    EXPECT_EQ(b1.size(), 0u);
    EXPECT_EQ(*(b2.uint8Data() + size - 1), 0x55);
}

TEST(buffer, resize)
{
    auto b = Buffer{16};
    std::memset(b.data(), 0x55, b.size());

    b.resize(32);
    ASSERT_EQ(b.size(), 32u);
    EXPECT_EQ(*b.uint8Data(), 0x55);

    b.resize(0);
    EXPECT_EQ(b.size(), 0u);
    EXPECT_EQ(b.data(), nullptr);
}

TEST(buffer, reserve)
{
    auto b = Buffer{ };

    b.reserve(64);
    EXPECT_EQ(b.size(), 64u);

    b.reserve(16);
    EXPECT_EQ(b.size(), 64u);
}

////////////////////////////////////////////////////////////////////////////////
// ScopedFd

namespace {

bool fdOpened(int fd)
{
    return std::filesystem::exists(
        fmt::format("/proc/self/fd/{}", fd));
}

}

TEST(scoped_fd, dtor)
{
    int rawFd{-1};

    {
        auto fd = ScopedFd{::eventfd(0, EFD_CLOEXEC)};
        ASSERT_TRUE(fd.valid());

        rawFd = fd.get();
        EXPECT_TRUE(fdOpened(rawFd));
    }

    EXPECT_FALSE(fdOpened(rawFd));
}

TEST(scoped_fd, move)
{
    auto fd1 = ScopedFd{::eventfd(0, EFD_CLOEXEC)};
    ASSERT_TRUE(fd1.valid());

    const auto rawFd = fd1.get();

    auto fd2 = std::move(fd1);
    EXPECT_FALSE(fd1.valid());
    EXPECT_EQ(fd2.get(), rawFd);
    EXPECT_TRUE(fdOpened(rawFd));

    fd2.reset();
    EXPECT_FALSE(fdOpened(rawFd));
}

TEST(scoped_fd, release)
{
    int rawFd{-1};

    {
        auto fd = ScopedFd{::eventfd(0, EFD_CLOEXEC)};
        ASSERT_TRUE(fd.valid());

        rawFd = fd.release();
    }

    EXPECT_TRUE(fdOpened(rawFd));
    ASSERT_EQ(::close(rawFd), 0);
}

////////////////////////////////////////////////////////////////////////////////
// ScopedTimer

TEST(scoped_timer, callback)
{
    auto reported = -1.0;

    {
        auto timer = ScopedTimer{[&reported](double sec) { reported = sec; }};
    }

    EXPECT_GE(reported, 0.0);
}

TEST(scoped_timer, cancel)
{
    auto called = false;

    {
        auto timer = ScopedTimer{[&called](double) { called = true; }};
        timer.cancel();
    }

    EXPECT_FALSE(called);
}

////////////////////////////////////////////////////////////////////////////////
// Stream

namespace {

/**
 * Returns at most one byte per read.
 */
class TrickleSource : public ByteSource
{
public:
    explicit TrickleSource(ByteSource &source):
        source_(&source)
    {
    }

    size_t read(void *data, size_t len) override
    {
        return source_->read(data, len ? 1 : 0);
    }

private:
    ByteSource *source_{ };
};

class StuckSink : public ByteSink
{
public:
    size_t write(const void *, size_t) override { return 0; }
    void flush() override { }
};

}

TEST(stream, memory_source)
{
    const auto src = std::string{"abcdef"};
    auto source = MemorySource{src.data(), src.size()};

    char buf[4]{ };

    EXPECT_EQ(source.read(buf, 4), 4u);
    EXPECT_EQ(source.position(), 4u);
    EXPECT_EQ(source.remaining(), 2u);

    EXPECT_EQ(source.read(buf, 4), 2u);
    EXPECT_EQ(std::string(buf, 2), "ef");
    EXPECT_EQ(source.read(buf, 4), 0u);
}

TEST(stream, read_fully)
{
    const auto src = std::string{"abcdef"};
    auto memory = MemorySource{src.data(), src.size()};
    auto source = TrickleSource{memory};

    char buf[8]{ };

    EXPECT_EQ(readFully(source, buf, 4), 4u);
    EXPECT_EQ(std::string(buf, 4), "abcd");

    EXPECT_EQ(readFully(source, buf, 8), 2u);
}

TEST(stream, write_all_stuck)
{
    auto sink = StuckSink{ };
    const char data[] = "x";

    EXPECT_THROW(writeAll(sink, data, 1), std::system_error);
    EXPECT_NO_THROW(writeAll(sink, data, 0));
}

TEST(stream, copy_counting)
{
    auto src = std::vector<uint8_t>(100000, 0x5a);

    auto memory = MemorySource{src};
    auto counter = CountingSource{memory};
    auto sink = MemorySink{ };

    EXPECT_EQ(copyStream(counter, sink, 4096), src.size());
    EXPECT_EQ(counter.count(), src.size());
    EXPECT_EQ(sink.bytes(), src);
    EXPECT_EQ(sink.flushCount(), 0u);
}

TEST(stream, null_sink)
{
    auto sink = NullSink{ };

    EXPECT_EQ(sink.write("abc", 3), 3u);
    EXPECT_EQ(sink.write(nullptr, 0), 0u);
    EXPECT_EQ(sink.count(), 3u);
}

TEST(stream, fd_endpoints)
{
    int fds[2]{-1, -1};
    ASSERT_EQ(::pipe(fds), 0);

    auto sink = FdSink{ScopedFd{fds[1]}};
    auto source = FdSource{ScopedFd{fds[0]}};

    writeAll(sink, "hello", 5);
    sink.flush();

    char buf[5]{ };
    ASSERT_EQ(readFully(source, buf, 5), 5u);
    EXPECT_EQ(std::string(buf, 5), "hello");
}

TEST(stream, fd_source_error)
{
    auto source = FdSource{-1};
    char buf[1];

    EXPECT_THROW(source.read(buf, 1), std::system_error);
}

////////////////////////////////////////////////////////////////////////////////
// BlockHeader

TEST(block_header, size_class)
{
    EXPECT_EQ(sizeClassForBlockSize(64), 0u);
    EXPECT_EQ(sizeClassForBlockSize(128), 0u);
    EXPECT_EQ(sizeClassForBlockSize(1024), 0u);
    EXPECT_EQ(sizeClassForBlockSize(1025), 1u);
    EXPECT_EQ(sizeClassForBlockSize(65536), 6u);
    EXPECT_EQ(sizeClassForBlockSize(65537), 7u);
    EXPECT_EQ(sizeClassForBlockSize(33554432), 15u);

    for (unsigned bits = 6; bits <= 25; ++bits)
    {
        const auto size = size_t{1} << bits;
        const auto expected = bits > 10 ? bits - 10 : 0u;

        EXPECT_EQ(sizeClassForBlockSize(size), expected) << size;
        EXPECT_LE(size, maxLengthForSizeClass(expected));

        if (bits < 25)
        {
            EXPECT_EQ(sizeClassForBlockSize(size + 1), bits >= 10 ? bits - 9 : 0u) << size + 1;
        }
    }

    EXPECT_THROW(sizeClassForBlockSize(63), ConfigError);
    EXPECT_THROW(sizeClassForBlockSize(33554433), ConfigError);
    EXPECT_THROW(sizeClassForBlockSize(0), std::invalid_argument);
}

TEST(block_header, token)
{
    EXPECT_EQ(methodToken(Method::Raw), 0x10);
    EXPECT_EQ(methodToken(Method::Lz4), 0x20);

    EXPECT_EQ(methodFromToken(0x16), Method::Raw);
    EXPECT_EQ(methodFromToken(0x2f), Method::Lz4);

    for (unsigned token = 0; token < 256; ++token)
    {
        const auto byte = static_cast<uint8_t>(token);

        switch (token >> 4)
        {
            case 1:
                EXPECT_EQ(methodFromToken(byte), Method::Raw) << token;
                break;
            case 2:
                EXPECT_EQ(methodFromToken(byte), Method::Lz4) << token;
                break;
            default:
                EXPECT_THROW(methodFromToken(byte), FormatError) << token;
                break;
        }
    }

    EXPECT_THROW(methodFromToken(0x00), FormatError);
    EXPECT_THROW(methodFromToken(0x30), FormatError);
    EXPECT_THROW(methodFromToken(0xf0), FormatError);
}

TEST(block_header, encode)
{
    const auto header = BlockHeader{
            .method = Method::Lz4,
            .sizeClass = 8,
            .compressedLength = 0x0102,
            .originalLength = 0x030405,
            .checksum = 0x0a0b0c0d
        };

    uint8_t buf[wire::HeaderSize]{ };
    header.encode(buf);

    const uint8_t expected[] = {
        0x28,
        0x02, 0x01, 0x00, 0x00,
        0x05, 0x04, 0x03, 0x00,
        0x0d, 0x0c, 0x0b, 0x0a
    };

    ASSERT_EQ(sizeof(expected), wire::HeaderSize);
    EXPECT_EQ(0, std::memcmp(buf, expected, sizeof(buf)));

    const auto decoded = BlockHeader::decode(buf);
    EXPECT_EQ(decoded.method, header.method);
    EXPECT_EQ(decoded.sizeClass, header.sizeClass);
    EXPECT_EQ(decoded.compressedLength, header.compressedLength);
    EXPECT_EQ(decoded.originalLength, header.originalLength);
    EXPECT_EQ(decoded.checksum, header.checksum);
}

TEST(block_header, end_marker)
{
    uint8_t buf[wire::HeaderSize]{ };
    BlockHeader::endMarker().encode(buf);

    EXPECT_EQ(buf[0], 0x10);

    for (size_t i = 1; i < sizeof(buf); ++i)
        EXPECT_EQ(buf[i], 0u) << i;

    EXPECT_TRUE(BlockHeader::decode(buf).isEndMarker());
}

namespace {

BlockHeader decodeFields(uint8_t token, uint32_t compressedLength, uint32_t originalLength, uint32_t checksum = 0)
{
    auto header = BlockHeader{
            .method = methodFromToken(token),
            .sizeClass = static_cast<uint8_t>(token & 0x0f),
            .compressedLength = compressedLength,
            .originalLength = originalLength,
            .checksum = checksum
        };

    uint8_t buf[wire::HeaderSize]{ };
    header.encode(buf);

    return BlockHeader::decode(buf);
}

}

TEST(block_header, decode_bounds)
{
    // the size class caps the original length
    EXPECT_NO_THROW(decodeFields(0x10, 1024, 1024));
    EXPECT_THROW(decodeFields(0x10, 1025, 1025), FormatError);
    EXPECT_NO_THROW(decodeFields(0x11, 1025, 1025));
    EXPECT_NO_THROW(decodeFields(0x2f, 1000, 33554432));
    EXPECT_THROW(decodeFields(0x2f, 1000, 33554433), FormatError);

    // small blocks are legal; a flushed stream ends with one
    EXPECT_NO_THROW(decodeFields(0x10, 3, 3));
}

TEST(block_header, decode_inconsistent)
{
    EXPECT_THROW(decodeFields(0x10, 10, 11), FormatError);
    EXPECT_THROW(decodeFields(0x20, 12, 11), FormatError);
    EXPECT_NO_THROW(decodeFields(0x20, 11, 11));
    EXPECT_THROW(decodeFields(0x20, 0, 11), FormatError);
    EXPECT_THROW(decodeFields(0x20, 11, 0), FormatError);
    EXPECT_THROW(decodeFields(0x10, 0, 0, 1), FormatError);
    EXPECT_THROW(decodeFields(0x2f, 0x80000000, 1000), FormatError);
}

////////////////////////////////////////////////////////////////////////////////
// Compressor

TEST(compressor, checksum)
{
    EXPECT_EQ(lz4JavaChecksum(reinterpret_cast<const uint8_t *>("..."), 3), 0x0677e452u);
    EXPECT_EQ(defaultChecksum()(reinterpret_cast<const uint8_t *>("..."), 3), 0x0677e452u);

    auto data = std::vector<uint8_t>(4096);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<uint8_t>(i * 7);

    EXPECT_EQ(lz4JavaChecksum(data.data(), data.size()) & ~wire::ChecksumMask, 0u);
}

TEST(compressor, parse_algo)
{
    EXPECT_EQ(parseAlgo("lz4"), Algo::Lz4);
    EXPECT_EQ(parseAlgo("lz4hc"), Algo::Lz4HC);
    EXPECT_THROW(parseAlgo("zstd"), std::invalid_argument);

    EXPECT_STREQ(toString(Algo::Lz4HC), "lz4hc");
}

TEST(compressor, hc_level)
{
    EXPECT_NO_THROW(makeCompressor(Algo::Lz4HC));
    EXPECT_NO_THROW(makeCompressor(Algo::Lz4HC, 12));
    EXPECT_THROW(makeCompressor(Algo::Lz4HC, 13), ConfigError);
    EXPECT_THROW(makeCompressor(Algo::Lz4HC, -1), ConfigError);
}

TEST(compressor, compress_decompress)
{
    const auto text = std::string(10000, 'a') + "the quick brown fox" + std::string(1000, 'b');
    const auto src = reinterpret_cast<const uint8_t *>(text.data());

    for (auto algo : {Algo::Lz4, Algo::Lz4HC})
    {
        const auto compressor = makeCompressor(algo);

        auto compressed = Buffer{compressor->maxCompressedSize(text.size())};
        const auto len = compressor->compress(src, text.size(), compressed.uint8Data(), compressed.size());

        ASSERT_GT(len, 0u);
        ASSERT_LT(len, text.size());

        auto out = Buffer{text.size()};
        compressor->decompress(compressed.uint8Data(), len, out.uint8Data(), out.size());
        EXPECT_EQ(0, std::memcmp(out.data(), text.data(), text.size())) << compressor->name();

        // the exact original length is required
        auto shortOut = Buffer{text.size() - 1};
        EXPECT_THROW(compressor->decompress(compressed.uint8Data(), len, shortOut.uint8Data(), shortOut.size()),
            DecompressionError);
    }
}

TEST(compressor, decompress_garbage)
{
    const uint8_t garbage[] = {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff};
    uint8_t out[64];

    EXPECT_THROW(defaultCompressor()->decompress(garbage, sizeof(garbage), out, sizeof(out)), BackendError);
}

////////////////////////////////////////////////////////////////////////////////
// Util

TEST(util, parse_size)
{
    EXPECT_EQ(parseSize("64"), 64u);
    EXPECT_EQ(parseSize("64k"), 65536u);
    EXPECT_EQ(parseSize("32M"), 33554432u);
    EXPECT_EQ(parseSize("1g"), size_t{1} << 30);

    EXPECT_THROW(parseSize(""), std::invalid_argument);
    EXPECT_THROW(parseSize("k"), std::invalid_argument);
    EXPECT_THROW(parseSize("12x"), std::invalid_argument);
    EXPECT_THROW(parseSize("12kb"), std::invalid_argument);
}

TEST(util, paths)
{
    EXPECT_EQ(compressedPath("data.bin", ".lz4"), "data.bin.lz4");

    EXPECT_EQ(decompressedPath("data.bin.lz4", ".lz4").value_or(""), "data.bin");
    EXPECT_EQ(decompressedPath("dir/x.z", ".z").value_or(""), "dir/x");
    EXPECT_FALSE(decompressedPath("data.bin", ".lz4").has_value());
    EXPECT_FALSE(decompressedPath(".lz4", ".lz4").has_value());
}

TEST(util, create_output_exclusive)
{
    auto path = std::string{"lz4jb_gtest.XXXXXX"};
    auto fd = ScopedFd{::mkstemp(path.data())};
    ASSERT_TRUE(fd.valid());

    EXPECT_THROW(createOutput(path, false), std::system_error);
    EXPECT_NO_THROW(createOutput(path, true));
    EXPECT_NO_THROW(openInput(path));

    ASSERT_EQ(::unlink(path.c_str()), 0);

    EXPECT_THROW(openInput(path), std::system_error);
}

////////////////////////////////////////////////////////////////////////////////
// UtilJson

TEST(util_json, block_header)
{
    const auto header = BlockHeader{
            .method = Method::Lz4,
            .sizeClass = 6,
            .compressedLength = 100,
            .originalLength = 200,
            .checksum = 0x1234
        };

    const auto j = nlohmann::json(header);

    EXPECT_EQ(j.at("method"), "lz4");
    EXPECT_EQ(j.at("size_class"), 6);
    EXPECT_EQ(j.at("compressed_length"), 100);
    EXPECT_EQ(j.at("original_length"), 200);
    EXPECT_EQ(j.at("checksum"), 0x1234);
}

TEST(util_json, stream_stats)
{
    auto stats = StreamStats{
            .name = "x.lz4",
            .compressedSize = 50,
            .decompressedSize = 200,
            .rawBlocks = 1,
            .lz4Blocks = 3
        };

    const auto j = nlohmann::json(stats);

    EXPECT_DOUBLE_EQ(j.at("ratio").get<double>(), 25.0);

    const auto parsed = j.get<StreamStats>();

    EXPECT_EQ(parsed.name, stats.name);
    EXPECT_EQ(parsed.compressedSize, stats.compressedSize);
    EXPECT_EQ(parsed.decompressedSize, stats.decompressedSize);
    EXPECT_EQ(parsed.blockCount(), 4u);
}
