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
#ifndef _KUID_LAYOUT_H
#define _KUID_LAYOUT_H

#include <cstddef>
#include <cstdint>

#include "kuid.h"
#include "common/hex_tools.h"

/*** Field offsets and masks inside the 16 octets ***/

namespace kuid::layout {

// time_hi_and_version: version in the high nibble of this byte
constexpr size_t version_byte = 6;
constexpr uint8_t version_mask = 0xf0;
constexpr unsigned version_shift = 4;

// The 12 timestamp bits sharing bytes 6-7 with the version
constexpr uint16_t version_time_mask = 0x0fff;

// clock_seq_hi_and_reserved: variant in the top 1-3 bits of this byte
constexpr size_t variant_byte = 8;

// Bits kept and discriminator written per variant
constexpr uint8_t ncs_keep = 0x7f;        // 0xx
constexpr uint8_t ncs_bits = 0x00;
constexpr uint8_t rfc4122_keep = 0x3f;    // 10x
constexpr uint8_t rfc4122_bits = 0x80;
constexpr uint8_t microsoft_keep = 0x1f;  // 110
constexpr uint8_t microsoft_bits = 0xc0;
constexpr uint8_t future_keep = 0x1f;     // 111
constexpr uint8_t future_bits = 0xe0;

// Canonical text: hyphen positions and the offset of each byte's hex pair
constexpr size_t hyphen_pos[] = {8, 13, 18, 23};
constexpr size_t canonical_pair_pos[kuid_size] = {
    0, 2, 4, 6,
    9, 11,
    14, 16,
    19, 21,
    24, 26, 28, 30, 32, 34,
};

// Writes 36 characters to dst, no terminator
inline void
encodeCanonical(char *dst, const Uuid &uuid, bool upper = false) {
    const uint8_t *src = uuid.data();
    hex::encode(dst, src, 4, upper);
    dst[8] = '-';
    hex::encode(dst + 9, src + 4, 2, upper);
    dst[13] = '-';
    hex::encode(dst + 14, src + 6, 2, upper);
    dst[18] = '-';
    hex::encode(dst + 19, src + 8, 2, upper);
    dst[23] = '-';
    hex::encode(dst + 24, src + 10, 6, upper);
}

inline uint32_t
loadBe32(const uint8_t *p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline uint16_t
loadBe16(const uint8_t *p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

} // namespace kuid::layout

#endif
