/**
 * @file StreamStats.cc
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

#include <spdlog/spdlog.h>

#include <lz4jb/util/StreamStats.hh>

namespace lz4jb::util {

void StreamStats::addBlock(const BlockHeader &header) noexcept
{
    switch (header.method)
    {
        case Method::Raw:
            ++rawBlocks;
            break;
        case Method::Lz4:
            ++lz4Blocks;
            break;
    }
}

StreamStats scanStream(ByteSource &source, std::string name, BlockInput::Options opts)
{
    auto stats = StreamStats{.name = std::move(name)};

    auto counter = CountingSource{source};

    opts.blockCallback = [&stats, cb = std::move(opts.blockCallback)](const BlockHeader &header) {
            stats.addBlock(header);

            if (cb)
                cb(header);
        };

    auto input = BlockInput{counter, std::move(opts)};
    auto sink = NullSink{ };

    stats.decompressedSize = copyStream(input, sink);
    stats.compressedSize = counter.count();

    spdlog::debug("scan {}: {} blocks ({} raw, {} lz4), {} -> {} bytes"
        , stats.name
        , stats.blockCount()
        , stats.rawBlocks
        , stats.lz4Blocks
        , stats.compressedSize
        , stats.decompressedSize);

    return stats;
}

}
