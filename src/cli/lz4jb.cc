/**
 * @file lz4jb.cc
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

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <getopt.h>
#include <libgen.h>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <lz4jb/util/BlockHeader.hh>
#include <lz4jb/util/Util.hh>

#include "Cmd.hh"

namespace lz4jb::cmd {
namespace {

[[noreturn]] void parseFailure(const std::string &msg)
{
    std::cerr << "ERROR: while parsing arguments: " << msg << "\n";
    std::exit(ExitCode::ParseError);
}

void setMode(Options &opts, Mode mode, bool &modeSet)
{
    if (modeSet && opts.mode != mode)
        parseFailure("at most one of --compress, --decompress, --list, --test");

    opts.mode = mode;
    modeSet = true;
}

} // namespace

const char *toString(Mode mode) noexcept
{
    switch (mode)
    {
        case Mode::Compress:
            return "compress";
        case Mode::Decompress:
            return "decompress";
        case Mode::List:
            return "list";
        case Mode::Test:
            return "test";
    }

    return "unknown";
}

Options parseOptions(int argc, char **argv)
{
    using namespace std::string_literals;

    static constexpr const char *shortOpts = "a:b:BcdfF:hklL:S:tz";
    static constexpr struct option longOpts[] = {
        {"algo", required_argument, nullptr, 'a'},
        {"blocksize", required_argument, nullptr, 'b'},
        {"blocks", no_argument, nullptr, 'B'},
        {"stdout", no_argument, nullptr, 'c'},
        {"decompress", no_argument, nullptr, 'd'},
        {"uncompress", no_argument, nullptr, 'd'},
        {"force", no_argument, nullptr, 'f'},
        {"format", required_argument, nullptr, 'F'},
        {"help", no_argument, nullptr, 'h'},
        {"keep", no_argument, nullptr, 'k'},
        {"list", no_argument, nullptr, 'l'},
        {"level", required_argument, nullptr, 'L'},
        {"suffix", required_argument, nullptr, 'S'},
        {"test", no_argument, nullptr, 't'},
        {"compress", no_argument, nullptr, 'z'},
        {nullptr, 0, nullptr, 0}
    };

    const auto usage = [argv] {
            std::cout << fmt::format(
                "usage: {} [OPTIONS] [FILE...]\n"
                "  Compress or decompress lz4-java block streams (LZ4BlockOutputStream).\n"
                "  With no FILE, read standard input and write standard output.\n"
                "  OPTIONS:\n"
                "   -z | --compress\n"
                "       compress (default).\n"
                "   -d | --decompress | --uncompress\n"
                "       decompress.\n"
                "   -l | --list\n"
                "       list compressed size, decompressed size and ratio of each file.\n"
                "   -t | --test\n"
                "       test the integrity of compressed files.\n"
                "   -c | --stdout\n"
                "       write on standard output, keep input files.\n"
                "   -k | --keep\n"
                "       keep (don't delete) input files.\n"
                "   -f | --force\n"
                "       overwrite output files, allow compressed output on a terminal.\n"
                "   -S | --suffix <suffix>\n"
                "       use <suffix> instead of .lz4.\n"
                "   -b | --blocksize <size>\n"
                "       block size for compression, {} to {} (k and m suffixes accepted).\n"
                "   -a | --algo <algo>\n"
                "       algos: lz4 (default), lz4hc\n"
                "   -L | --level <level>\n"
                "       lz4hc compression level, 0 selects the library default.\n"
                "   -F | --format <format>\n"
                "       list formats: standard (default), csv, json\n"
                "   -B | --blocks\n"
                "       list every block of each file.\n"
                "   -h | --help\n"
                "       show this help\n"
                , ::basename(argv[0])
                , wire::MinBlockSize
                , wire::MaxBlockSize);
        };

    auto opts = Options{ };
    auto modeSet = false;

    for (int c = 0; (c = getopt_long(argc, argv, shortOpts, longOpts, 0)) >= 0; )
    {
        switch (c)
        {
            case 'a':
                try
                {
                    opts.algo = util::parseAlgo(optarg);
                }
                catch (const std::invalid_argument &e)
                {
                    parseFailure(e.what());
                }
                break;
            case 'b':
                try
                {
                    opts.blockSize = util::parseSize(optarg);
                    util::sizeClassForBlockSize(opts.blockSize);
                }
                catch (const std::exception &e)
                {
                    parseFailure(fmt::format("invalid block size '{}': {}", optarg, e.what()));
                }
                break;
            case 'B':
                opts.listBlocks = true;
                break;
            case 'c':
                opts.toStdout = true;
                break;
            case 'd':
                setMode(opts, Mode::Decompress, modeSet);
                break;
            case 'f':
                opts.force = true;
                break;
            case 'F':
                if (optarg == "standard"s)
                    opts.format = OutputFormat::Standard;
                else if (optarg == "csv"s)
                    opts.format = OutputFormat::CSV;
                else if (optarg == "json"s)
                    opts.format = OutputFormat::Json;
                else
                    parseFailure(fmt::format("cannot output in '{}' format", optarg));
                break;
            case 'h':
                usage();
                std::exit(ExitCode::Ok);
            case 'k':
                opts.keepInput = true;
                break;
            case 'l':
                setMode(opts, Mode::List, modeSet);
                break;
            case 'L':
                try
                {
                    opts.level = std::stoi(optarg);
                }
                catch (const std::exception &)
                {
                    parseFailure(fmt::format("invalid compression level '{}'", optarg));
                }
                break;
            case 'S':
                opts.suffix = optarg;
                if (opts.suffix.empty())
                    parseFailure("the suffix must not be empty");
                break;
            case 't':
                setMode(opts, Mode::Test, modeSet);
                break;
            case 'z':
                setMode(opts, Mode::Compress, modeSet);
                break;
            case '?':
                std::exit(ExitCode::ParseError);
            default:
                break;
        }
    }

    if ((opts.mode == Mode::List || opts.mode == Mode::Test) &&
        (opts.toStdout || opts.keepInput || opts.force))
    {
        parseFailure("--stdout, --keep and --force do not apply to --list and --test");
    }

    opts.files.insert(end(opts.files), argv + optind, argv + argc);

    spdlog::debug("{}: {} files, block size {}, algo {}"
        , toString(opts.mode)
        , opts.files.size()
        , opts.blockSize
        , util::toString(opts.algo));

    return opts;
}

}

int main(int argc, char **argv)
{
    // stdout may carry stream data; keep the log on stderr.
    spdlog::set_default_logger(spdlog::stderr_color_st("lz4jb"));
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    const auto opts = lz4jb::cmd::parseOptions(argc, argv);

    return lz4jb::cmd::run(opts);
}
