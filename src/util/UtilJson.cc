/**
 * @file UtilJson.cc
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

#include <lz4jb/util/UtilJson.hh>

namespace lz4jb::util {

void to_json(nlohmann::json &j, const BlockHeader &header)
{
    j = {
        {"method", toString(header.method)},
        {"size_class", header.sizeClass},
        {"compressed_length", header.compressedLength},
        {"original_length", header.originalLength},
        {"checksum", header.checksum}
    };
}

void to_json(nlohmann::json &j, const StreamStats &stats)
{
    j = {
        {"name", stats.name},
        {"compressed", stats.compressedSize},
        {"decompressed", stats.decompressedSize},
        {"raw_blocks", stats.rawBlocks},
        {"lz4_blocks", stats.lz4Blocks},
        {"ratio", stats.ratio()}
    };
}

void from_json(const nlohmann::json &j, StreamStats &stats)
{
    j.at("name").get_to(stats.name);
    j.at("compressed").get_to(stats.compressedSize);
    j.at("decompressed").get_to(stats.decompressedSize);
    j.at("raw_blocks").get_to(stats.rawBlocks);
    j.at("lz4_blocks").get_to(stats.lz4Blocks);
}

}
