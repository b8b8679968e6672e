// hexString.hh
//
// Copyright © 2022 Jens Alfke. All rights reserved.
//
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>


/// Lowercase hex of a buffer, optionally with a space between each 4-byte group.
static inline std::string hexString(const void *buf, size_t size, bool spaces =false) {
    std::string hex;
    hex.resize(size * 2 + size / 4 + 1);
    char *dst = hex.data();
    for (size_t i = 0; i < size; i++) {
        if (spaces && i > 0 && (i % 4) == 0)
            *dst++ = ' ';
        dst += snprintf(dst, 3, "%02x", ((const uint8_t*)buf)[i]);
    }
    hex.resize(dst - hex.data());
    return hex;
}


template <size_t Size>
static std::string hexString(const std::array<uint8_t,Size> &a, bool spaces =false) {
    return hexString(a.data(), Size, spaces);
}


static inline std::string hexString(const std::vector<uint8_t> &v, bool spaces =false) {
    return hexString(v.data(), v.size(), spaces);
}


/// Parses a hex string (spaces allowed) into bytes, as written in test vectors.
static inline std::vector<uint8_t> hexBytes(const char *hex) {
    std::vector<uint8_t> bytes;
    int hi = -1;
    for (const char *c = hex; *c; ++c) {
        int digit;
        if (*c >= '0' && *c <= '9')         digit = *c - '0';
        else if (*c >= 'a' && *c <= 'f')    digit = *c - 'a' + 10;
        else if (*c >= 'A' && *c <= 'F')    digit = *c - 'A' + 10;
        else if (*c == ' ')                 continue;
        else throw std::invalid_argument("invalid hex digit");
        if (hi < 0) {
            hi = digit;
        } else {
            bytes.push_back(uint8_t(hi << 4 | digit));
            hi = -1;
        }
    }
    if (hi >= 0)
        throw std::invalid_argument("odd number of hex digits");
    return bytes;
}


/// Parses a hex string into a fixed-size array; the sizes must match.
template <size_t Size>
static std::array<uint8_t,Size> hexArray(const char *hex) {
    auto bytes = hexBytes(hex);
    if (bytes.size() != Size)
        throw std::invalid_argument("wrong number of hex digits");
    std::array<uint8_t,Size> a;
    ::memcpy(a.data(), bytes.data(), Size);
    return a;
}
