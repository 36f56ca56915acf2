/**
 * @file Util.cc
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
#include <limits>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <lz4jb/util/Util.hh>

namespace lz4jb::util {

size_t parseSize(const std::string &str)
{
    size_t pos{ };
    auto sz = std::stoul(str, &pos);

    auto shift = 0u;

    if (pos + 1 == str.size())
    {
        switch (str[pos])
        {
            case 'k': case 'K': shift = 10; break;
            case 'm': case 'M': shift = 20; break;
            case 'g': case 'G': shift = 30; break;
            default:
                throw std::invalid_argument(fmt::format("size option: {}", str));
        }

        ++pos;
    }

    if (pos != str.size())
        throw std::invalid_argument(fmt::format("size option: {}", str));

    if (sz > (std::numeric_limits<size_t>::max() >> shift))
        throw std::invalid_argument(fmt::format("size option is out of range: {}", str));

    return sz << shift;
}

std::string compressedPath(const std::string &path, const std::string &suffix)
{
    return path + suffix;
}

std::optional<std::string> decompressedPath(const std::string &path, const std::string &suffix)
{
    if (suffix.empty() || path.size() <= suffix.size() || !path.ends_with(suffix))
        return std::nullopt;

    return path.substr(0, path.size() - suffix.size());
}

ScopedFd openInput(const std::string &path)
{
    auto fd = ScopedFd{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};

    if (!fd.valid())
    {
        throw std::system_error(errno, std::system_category(),
            fmt::format("unable to open input file '{}'", path));
    }

    return fd;
}

ScopedFd createOutput(const std::string &path, bool overwrite, mode_t mode)
{
    const auto flags = O_WRONLY | O_CREAT | O_CLOEXEC | (overwrite ? O_TRUNC : O_EXCL);

    auto fd = ScopedFd{::open(path.c_str(), flags, mode)};

    if (!fd.valid())
    {
        throw std::system_error(errno, std::system_category(),
            fmt::format("unable to create output file '{}'", path));
    }

    return fd;
}

bool isTerminal(int fd) noexcept
{
    return ::isatty(fd) == 1;
}

}
