/**
 * @file Error.hh
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

#ifndef __LZ4JB_UTIL_ERROR_HH__
#define __LZ4JB_UTIL_ERROR_HH__

#include <stdexcept>
#include <string>

namespace lz4jb::util {

/**
 * Invalid construction parameters, reported before any I/O is performed.
 */
class ConfigError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * Base of all block stream errors.
 *
 * I/O errors raised by the underlying sink or source are not wrapped; they
 * reach the caller as whatever the endpoint threw (usually std::system_error).
 */
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Bad magic, or a header field outside of its accepted bounds.
 */
class FormatError : public Error
{
public:
    using Error::Error;
};

/**
 * Encoder used after finish(), or after a failed block emit.
 */
class StateError : public FormatError
{
public:
    using FormatError::FormatError;
};

/**
 * Block checksum mismatch.
 */
class CorruptionError : public Error
{
public:
    using Error::Error;
};

/**
 * Source ended in the middle of a block.
 */
class TruncationError : public Error
{
public:
    using Error::Error;
};

class BackendError : public Error
{
public:
    using Error::Error;
};

class CompressionError : public BackendError
{
public:
    using BackendError::BackendError;
};

class DecompressionError : public BackendError
{
public:
    using BackendError::BackendError;
};

}

#endif
