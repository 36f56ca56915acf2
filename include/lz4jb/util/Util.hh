/**
 * @file Util.hh
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

#ifndef __LZ4JB_UTIL_HH__
#define __LZ4JB_UTIL_HH__

#include <cstdint>
#include <optional>
#include <string>

#include <sys/stat.h>

#include "ScopedFd.hh"

namespace lz4jb::util {

/**
 * Parse a byte count, with an optional binary unit suffix (k, m, g).
 *
 * @throws std::invalid_argument on trailing characters or overflow.
 */
size_t parseSize(const std::string &str);

/**
 * Output path for compressing `path`.
 */
std::string compressedPath(const std::string &path, const std::string &suffix);

/**
 * Output path for decompressing `path`, or nullopt if `path` does not end
 * with `suffix`.
 */
std::optional<std::string> decompressedPath(const std::string &path, const std::string &suffix);

ScopedFd openInput(const std::string &path);

/**
 * Create `path` for writing. Fails if the file exists, unless `overwrite`.
 */
ScopedFd createOutput(const std::string &path, bool overwrite, mode_t mode = 0644);

bool isTerminal(int fd) noexcept;

}

#endif
