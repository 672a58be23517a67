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
/** KUID: RFC-4122 and k-sortable UUID values */
#ifndef _KUID_H
#define _KUID_H

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"

#include "kuid_types.h"

namespace kuid {

/**
 * @class Uuid
 * @brief A 128-bit identifier stored as 16 octets in RFC-4122 (big-endian) field order:
 *
 * ```
 *  0                   1                   2                   3
 *  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                          time_low                             |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |       time_mid                |         time_hi_and_version   |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |clk_seq_hi_res |  clk_seq_low  |         node (0-1)            |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                         node (2-5)                            |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * ```
 *
 * The stored layout is the wire layout. Equality is byte-for-byte.
 */
class Uuid {
public:
    using array_type = std::array<uint8_t, kuid_size>;

    /**
     * @brief Creates the nil UUID with all 128 bits set to zero
     */
    constexpr Uuid() noexcept : data_{} {}

    explicit constexpr Uuid(const array_type &bytes) noexcept : data_(bytes) {}

    /*** Version and variant control bits ***/

    // High nibble of byte 6, returned as stored (0..15)
    uint8_t
    version() const noexcept;

    // Decoded from the leading bits of byte 8
    kuid_variant_t
    variant() const noexcept;

    // Only the high nibble of byte 6 is modified, v is truncated to 4 bits
    void
    setVersion(uint8_t v) noexcept;

    // Unrecognized variants are written as FUTURE
    void
    setVariant(kuid_variant_t v) noexcept;

    /*** Raw access ***/

    const array_type &
    bytes() const noexcept {
        return data_;
    }

    const uint8_t *
    data() const noexcept {
        return data_.data();
    }

    static constexpr size_t
    size() noexcept {
        return kuid_size;
    }

    bool
    isNil() const noexcept;

    /*** Text ***/

    /**
     * @brief  Canonical RFC-4122 representation, lowercase:
     *         xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    std::string
    toString() const;

    // Appends the canonical representation to dst
    void
    appendTo(std::string &dst) const;

    bool
    operator==(const Uuid &other) const noexcept {
        return data_ == other.data_;
    }

    bool
    operator!=(const Uuid &other) const noexcept {
        return !(*this == other);
    }

private:
    array_type data_;
};

/**
 * @brief The nil UUID, all 128 bits set to zero.
 */
inline constexpr Uuid nil_uuid{};

/**
 * @brief Namespace UUIDs from RFC-4122 Appendix C, used by name-based generators.
 */
extern const Uuid namespace_dns;
extern const Uuid namespace_url;
extern const Uuid namespace_oid;
extern const Uuid namespace_x500;

/**
 * @brief  Returns the UUID held by result or terminates the process with the
 *         error message. Intended for initializing constants, e.g.
 *
 *         const kuid::Uuid id = kuid::must(kuid::fromString("123e4567-e89b-12d3-a456-426655440000"));
 */
Uuid
must(absl::StatusOr<Uuid> result);

std::string
toString(const Uuid &uuid);

std::ostream &
operator<<(std::ostream &os, const Uuid &uuid);

/**
 * @brief  absl::StrFormat support. "%s" prints the canonical form,
 *         "%x" and "%X" print the 32 hex digits only.
 */
absl::FormatConvertResult<absl::FormatConversionCharSet::kString |
                          absl::FormatConversionCharSet::x |
                          absl::FormatConversionCharSet::X>
AbslFormatConvert(const Uuid &uuid,
                  const absl::FormatConversionSpec &spec,
                  absl::FormatSink *sink);

} // namespace kuid

#endif
