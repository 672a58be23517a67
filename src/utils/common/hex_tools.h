/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef __HEX_TOOLS_H
#define __HEX_TOOLS_H

#include <cstddef>
#include <cstdint>

namespace kuid::hex {

constexpr char lower_digits[] = "0123456789abcdef";
constexpr char upper_digits[] = "0123456789ABCDEF";

// Value of a single hex digit in any case, false if c is not a hex digit
inline bool
fromChar(char c, uint8_t &out) {
    if (c >= '0' && c <= '9') {
        out = static_cast<uint8_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
        out = static_cast<uint8_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
        out = static_cast<uint8_t>(c - 'A' + 10);
    } else {
        return false;
    }
    return true;
}

// Decodes the two digits at src[0] and src[1]
inline bool
decodePair(const char *src, uint8_t &out) {
    uint8_t hi, lo;
    if (!fromChar(src[0], hi) || !fromChar(src[1], lo)) {
        return false;
    }
    out = static_cast<uint8_t>((hi << 4) | lo);
    return true;
}

// Writes 2 * len digits to dst, no terminator
inline void
encode(char *dst, const uint8_t *src, size_t len, bool upper = false) {
    const char *digits = upper ? upper_digits : lower_digits;
    for (size_t i = 0; i < len; ++i) {
        dst[2 * i] = digits[src[i] >> 4];
        dst[2 * i + 1] = digits[src[i] & 0x0f];
    }
}

} // namespace kuid::hex

#endif
