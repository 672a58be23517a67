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
#ifndef _KUID_TYPES_H
#define _KUID_TYPES_H
#include <cstdint>
#include <cstddef>
#include <string>


/*** Forward declarations ***/
namespace kuid {
class Uuid;
class Timestamp;
}


/*** KUID version, variant and format enums ***/

/**
 * @enum   kuid_version_t
 * @brief  Algorithm versions stored in the high nibble of byte 6.
 *         Version 2 (DCE security) is reserved and not supported, 0 and 8 are reserved.
 */
enum kuid_version_t : uint8_t {
    KUID_V1 = 1, // date-time and MAC address
    KUID_V3 = 3, // namespace name-based, MD5
    KUID_V4 = 4, // random
    KUID_V5 = 5, // namespace name-based, SHA-1
    KUID_V6 = 6, // k-sortable timestamp and random data
    KUID_V7 = 7  // k-sortable Unix timestamp and random data
};

/**
 * @enum   kuid_variant_t
 * @brief  Layout variants, discriminated by the leading bits of byte 8
 */
enum class kuid_variant_t : uint8_t {
    NCS = 0,       // 0xx, NCS backward compatibility
    RFC4122 = 1,   // 10x, the layout described by RFC-4122
    MICROSOFT = 2, // 110, reserved, Microsoft backward compatibility
    FUTURE = 3     // 111, reserved for future definition
};

/**
 * @enum   kuid_format_t
 * @brief  Closed set of textual output kinds understood by kuid::format().
 *         UNSUPPORTED must be last.
 */
enum class kuid_format_t {
    HEX_LOWER,       // 32 lowercase hex digits
    HEX_UPPER,       // 32 uppercase hex digits
    CANONICAL,       // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    CANONICAL_UPPER, // canonical form with uppercase hex digits
    QUOTED,          // canonical form between double quotes
    DEBUG_LITERAL,   // std::array<uint8_t, 16>{0x.., ...}
    UNSUPPORTED
};

/**
 * @namespace kuidEnumStrings
 * @brief     This namespace to get string representation
 *            of different enums
 */
namespace kuidEnumStrings {
    std::string variantStr(const kuid_variant_t &variant);
    std::string formatStr (const kuid_format_t &format);
}


/*** KUID typedefs and defines used in the API ***/

/**
 * @brief A typedef for a std::string as kuid blob
 *        std::string supports \0 natively, so it can be looked as a void* of data,
 *        with specified length. Giving it a new name to be clear in the API and
 *        preventing users to think it's a string and call c_str().
 */
using kuid_blob_t = std::string;

/**
 * @brief Size of a UUID in bytes.
 */
constexpr size_t kuid_size = 16;

/**
 * @brief Length of the canonical 8-4-4-4-12 text form.
 */
constexpr size_t kuid_canonical_len = 36;

/**
 * @brief Length of the hash-like text form (hex digits only).
 */
constexpr size_t kuid_hash_len = 32;

#endif
