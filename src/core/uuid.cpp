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
#include "kuid.h"
#include "kuid_codec.h"

#include <algorithm>

#include "common/kuid_log.h"
#include "uuid_layout.h"

namespace kuid {

const Uuid namespace_dns = must(fromString("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));
const Uuid namespace_url = must(fromString("6ba7b811-9dad-11d1-80b4-00c04fd430c8"));
const Uuid namespace_oid = must(fromString("6ba7b812-9dad-11d1-80b4-00c04fd430c8"));
const Uuid namespace_x500 = must(fromString("6ba7b814-9dad-11d1-80b4-00c04fd430c8"));

uint8_t
Uuid::version() const noexcept {
    return data_[layout::version_byte] >> layout::version_shift;
}

kuid_variant_t
Uuid::variant() const noexcept {
    const uint8_t b = data_[layout::variant_byte];

    // The patterns overlap, test order matters
    if ((b >> 7) == 0x00) {
        return kuid_variant_t::NCS;
    }
    if ((b >> 6) == 0x02) {
        return kuid_variant_t::RFC4122;
    }
    if ((b >> 5) == 0x06) {
        return kuid_variant_t::MICROSOFT;
    }
    return kuid_variant_t::FUTURE;
}

void
Uuid::setVersion(uint8_t v) noexcept {
    uint8_t &b = data_[layout::version_byte];
    b = static_cast<uint8_t>((b & ~layout::version_mask) |
                             ((v << layout::version_shift) & layout::version_mask));
}

void
Uuid::setVariant(kuid_variant_t v) noexcept {
    uint8_t &b = data_[layout::variant_byte];
    switch (v) {
        case kuid_variant_t::NCS:
            b = (b & layout::ncs_keep) | layout::ncs_bits;
            break;
        case kuid_variant_t::RFC4122:
            b = (b & layout::rfc4122_keep) | layout::rfc4122_bits;
            break;
        case kuid_variant_t::MICROSOFT:
            b = (b & layout::microsoft_keep) | layout::microsoft_bits;
            break;
        case kuid_variant_t::FUTURE:
        default:
            b = (b & layout::future_keep) | layout::future_bits;
            break;
    }
}

bool
Uuid::isNil() const noexcept {
    return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
}

std::string
Uuid::toString() const {
    std::string ret(kuid_canonical_len, '\0');
    layout::encodeCanonical(ret.data(), *this);
    return ret;
}

void
Uuid::appendTo(std::string &dst) const {
    const size_t offset = dst.size();
    dst.resize(offset + kuid_canonical_len);
    layout::encodeCanonical(dst.data() + offset, *this);
}

std::string
toString(const Uuid &uuid) {
    return uuid.toString();
}

std::ostream &
operator<<(std::ostream &os, const Uuid &uuid) {
    char buf[kuid_canonical_len];
    layout::encodeCanonical(buf, uuid);
    return os.write(buf, sizeof(buf));
}

Uuid
must(absl::StatusOr<Uuid> result) {
    if (!result.ok()) {
        KUID_FATAL << result.status().message();
    }
    return *result;
}

} // namespace kuid

namespace kuidEnumStrings {

std::string variantStr(const kuid_variant_t &variant)
{
    switch (variant) {
        case kuid_variant_t::NCS:       return "NCS";
        case kuid_variant_t::RFC4122:   return "RFC4122";
        case kuid_variant_t::MICROSOFT: return "MICROSOFT";
        case kuid_variant_t::FUTURE:    return "FUTURE";
        default:                        return "BAD_VARIANT";
    }
}

std::string formatStr(const kuid_format_t &format)
{
    switch (format) {
        case kuid_format_t::HEX_LOWER:       return "HEX_LOWER";
        case kuid_format_t::HEX_UPPER:       return "HEX_UPPER";
        case kuid_format_t::CANONICAL:       return "CANONICAL";
        case kuid_format_t::CANONICAL_UPPER: return "CANONICAL_UPPER";
        case kuid_format_t::QUOTED:          return "QUOTED";
        case kuid_format_t::DEBUG_LITERAL:   return "DEBUG_LITERAL";
        case kuid_format_t::UNSUPPORTED:     return "UNSUPPORTED";
        default:                             return "BAD_FORMAT";
    }
}

} // namespace kuidEnumStrings
