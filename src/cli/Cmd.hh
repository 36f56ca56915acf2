/**
 * @file Cmd.hh
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

#ifndef __LZ4JB_CMD_HH__
#define __LZ4JB_CMD_HH__

#include <string>
#include <vector>

#include <lz4jb/util/Compressor.hh>
#include <lz4jb/util/Protocol.hh>

namespace lz4jb::cmd {

enum class Mode
{
    Compress,
    Decompress,
    List,
    Test
};

enum class OutputFormat
{
    Standard,
    CSV,
    Json
};

enum ExitCode
{
    Ok = 0,
    CommandError = 1,
    ParseError = 2
};

struct Options
{
    // empty means stdin to stdout.
    std::vector<std::string> files{ };
    Mode mode{Mode::Compress};
    OutputFormat format{OutputFormat::Standard};
    std::string suffix{".lz4"};
    size_t blockSize{wire::DefaultBlockSize};
    util::Algo algo{util::Algo::Lz4};
    int level{ };
    bool toStdout{ };
    bool keepInput{ };
    bool force{ };
    bool listBlocks{ };
};

const char *toString(Mode mode) noexcept;

Options parseOptions(int argc, char **argv);

int run(const Options &opts);

}

#endif
