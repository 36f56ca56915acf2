/**
 * @file Command.cc
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

#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <lz4jb/util/BlockInput.hh>
#include <lz4jb/util/BlockOutput.hh>
#include <lz4jb/util/ScopedTimer.hh>
#include <lz4jb/util/StreamStats.hh>
#include <lz4jb/util/Util.hh>
#include <lz4jb/util/UtilJson.hh>

#include "Cmd.hh"

namespace lz4jb::cmd {
namespace {

using util::ByteSink;
using util::ByteSource;
using util::ScopedFd;

/**
 * Removes a partially written output file unless released.
 */
class OutputJanitor
{
public:
    OutputJanitor() = default;

    explicit OutputJanitor(std::string path):
        path_(std::move(path))
    {
    }

    ~OutputJanitor() noexcept
    {
        if (!path_.empty() && ::unlink(path_.c_str()))
            spdlog::warn("unable to remove partial output '{}': {}", path_, std::strerror(errno));
    }

    OutputJanitor(const OutputJanitor &) = delete;
    OutputJanitor &operator=(const OutputJanitor &) = delete;

    void release() noexcept
    {
        path_.clear();
    }

private:
    std::string path_;
};

struct FileTask
{
    // empty means stdin.
    std::string input;

    std::string displayName() const
    {
        return input.empty() ? "<stdin>" : input;
    }
};

void printListHeader(const Options &opts)
{
    switch (opts.format)
    {
        case OutputFormat::Standard:
            std::cout << "         compressed        decompressed  ratio filename\n";
            break;
        case OutputFormat::CSV:
            std::cout << "compressed, decompressed, ratio, raw_blocks, lz4_blocks, filename\n";
            break;
        case OutputFormat::Json:
            break;
    }
}

void printStats(const util::StreamStats &stats, const Options &opts)
{
    switch (opts.format)
    {
        case OutputFormat::Standard:
            std::cout << fmt::format("{:>19} {:>19} {:>5.1f}% {}\n"
                , stats.compressedSize
                , stats.decompressedSize
                , stats.ratio()
                , stats.name);
            break;
        case OutputFormat::CSV:
            std::cout << fmt::format("{}, {}, {:.3f}, {}, {}, {}\n"
                , stats.compressedSize
                , stats.decompressedSize
                , stats.ratio()
                , stats.rawBlocks
                , stats.lz4Blocks
                , stats.name);
            break;
        case OutputFormat::Json:
            break;
    }
}

void printBlock(const util::BlockHeader &header, uint64_t idx, const Options &opts)
{
    switch (opts.format)
    {
        case OutputFormat::Standard:
            std::cout << fmt::format("  block {:>8} {:<4} class {:>2} {:>10} -> {:>10} checksum {:#010x}\n"
                , idx
                , util::toString(header.method)
                , header.sizeClass
                , header.compressedLength
                , header.originalLength
                , header.checksum);
            break;
        case OutputFormat::CSV:
            std::cout << fmt::format("# block, {}, {}, {}, {}, {}, {:#010x}\n"
                , idx
                , util::toString(header.method)
                , header.sizeClass
                , header.compressedLength
                , header.originalLength
                , header.checksum);
            break;
        case OutputFormat::Json:
            break;
    }
}

void compress(ByteSource &in, ByteSink &out, const Options &opts)
{
    auto encoder = util::BlockOutput{
            out,
            opts.blockSize,
            util::BlockOutput::Options{
                .compressor = util::makeCompressor(opts.algo, opts.level)
            }
        };

    util::copyStream(in, encoder);
    encoder.finish();
}

void decompress(ByteSource &in, ByteSink &out)
{
    auto decoder = util::BlockInput{in};

    util::copyStream(decoder, out);
    out.flush();
}

/**
 * Compress or decompress a single input.
 */
void transform(const FileTask &task, const Options &opts)
{
    const auto toStdout = opts.toStdout || task.input.empty();

    auto inFd = task.input.empty() ? ScopedFd{ } : util::openInput(task.input);
    auto in = util::FdSource{inFd.valid() ? inFd.get() : STDIN_FILENO};

    auto outPath = std::string{ };

    if (!toStdout)
    {
        if (opts.mode == Mode::Compress)
        {
            outPath = util::compressedPath(task.input, opts.suffix);
        }
        else if (auto path = util::decompressedPath(task.input, opts.suffix))
        {
            outPath = std::move(*path);
        }
        else
        {
            throw std::runtime_error(fmt::format(
                "could not guess the output filename (no '{}' suffix)"
                , opts.suffix));
        }
    }

    if (toStdout && opts.mode == Mode::Compress && !opts.force && util::isTerminal(STDOUT_FILENO))
        throw std::runtime_error("stdout is a terminal, use -f to force compression");

    auto outFd = toStdout ? ScopedFd{ } : util::createOutput(outPath, opts.force);
    auto janitor = toStdout ? OutputJanitor{ } : OutputJanitor{outPath};
    auto out = util::FdSink{outFd.valid() ? outFd.get() : STDOUT_FILENO};

    if (opts.mode == Mode::Compress)
        compress(in, out, opts);
    else
        decompress(in, out);

    if (toStdout)
        return;

    struct stat st{ };

    if (::fstat(inFd.get(), &st) < 0)
        throw std::system_error(errno, std::system_category(), fmt::format("stat '{}'", task.input));

    if (::fchmod(outFd.get(), st.st_mode & 07777) < 0)
        throw std::system_error(errno, std::system_category(), fmt::format("chmod '{}'", outPath));

    if (outFd.close() < 0)
        throw std::system_error(errno, std::system_category(), fmt::format("close '{}'", outPath));

    janitor.release();

    spdlog::info("{} -> {}", task.input, outPath);

    if (!opts.keepInput && ::unlink(task.input.c_str()) < 0)
        throw std::system_error(errno, std::system_category(), fmt::format("remove '{}'", task.input));
}

util::StreamStats scan(const FileTask &task, const Options &opts, nlohmann::json *blocks)
{
    auto inFd = task.input.empty() ? ScopedFd{ } : util::openInput(task.input);
    auto in = util::FdSource{inFd.valid() ? inFd.get() : STDIN_FILENO};

    auto decoderOpts = util::BlockInput::Options{ };

    if (opts.mode == Mode::List && opts.listBlocks)
    {
        decoderOpts.blockCallback = [&opts, blocks, idx = uint64_t{ }](const util::BlockHeader &header) mutable {
                if (blocks)
                    blocks->push_back(header);
                else
                    printBlock(header, idx, opts);

                ++idx;
            };
    }

    return util::scanStream(in, task.displayName(), std::move(decoderOpts));
}

} // namespace

int run(const Options &opts)
{
    auto tasks = std::vector<FileTask>{ };

    for (const auto &file : opts.files)
        tasks.push_back({file});

    if (tasks.empty())
        tasks.push_back({ });

    if (opts.mode == Mode::List)
        printListHeader(opts);

    auto listing = nlohmann::json::array();
    auto rc = int{ExitCode::Ok};

    for (const auto &task : tasks)
    {
        auto timer = util::ScopedTimer{[&task, &opts](double sec) {
                spdlog::debug("{} {}: {:.06f} sec"
                    , toString(opts.mode)
                    , task.displayName()
                    , sec);
            }};

        try
        {
            switch (opts.mode)
            {
                case Mode::Compress:
                case Mode::Decompress:
                    transform(task, opts);
                    break;
                case Mode::Test:
                    scan(task, opts, nullptr);
                    break;
                case Mode::List:
                {
                    auto blocks = nlohmann::json::array();
                    const auto json = opts.format == OutputFormat::Json;

                    const auto stats = scan(task, opts, json ? &blocks : nullptr);

                    if (json)
                    {
                        auto entry = nlohmann::json(stats);

                        if (opts.listBlocks)
                            entry["blocks"] = std::move(blocks);

                        listing.push_back(std::move(entry));
                    }
                    else
                    {
                        printStats(stats, opts);
                    }
                    break;
                }
            }
        }
        catch (const std::exception &e)
        {
            timer.cancel();

            std::cerr << fmt::format("ERROR: could not {} from {}: {}\n"
                , toString(opts.mode)
                , task.displayName()
                , e.what());

            rc = ExitCode::CommandError;
        }
    }

    if (opts.mode == Mode::List && opts.format == OutputFormat::Json)
        std::cout << listing.dump(4) << "\n";

    return rc;
}

}
