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
#include "kuid_codec.h"

#include "absl/strings/str_format.h"

#include "common/kuid_log.h"
#include "core/uuid_layout.h"

namespace kuid {

namespace {

std::string
encodeHexOnly(const Uuid &uuid, bool upper) {
    std::string ret(kuid_hash_len, '\0');
    hex::encode(ret.data(), uuid.data(), uuid.size(), upper);
    return ret;
}

std::string
encodeCanonical(const Uuid &uuid, bool upper) {
    std::string ret(kuid_canonical_len, '\0');
    layout::encodeCanonical(ret.data(), uuid, upper);
    return ret;
}

std::string
encodeQuoted(const Uuid &uuid) {
    std::string ret(kuid_canonical_len + 2, '"');
    layout::encodeCanonical(ret.data() + 1, uuid);
    return ret;
}

// std::array<uint8_t, 16>{0x6b, 0xa7, ..., 0xc8}
std::string
encodeDebugLiteral(const Uuid &uuid) {
    std::string ret = absl::StrFormat("std::array<uint8_t, %d>{", kuid_size);
    for (size_t i = 0; i < kuid_size; ++i) {
        if (i != 0) {
            ret.append(", ");
        }
        absl::StrAppendFormat(&ret, "0x%02x", uuid.bytes()[i]);
    }
    ret.push_back('}');
    return ret;
}

} // anonymous namespace

kuid_format_t
formatFromVerb(char verb, bool alt) {
    switch (verb) {
        case 'x':
            return kuid_format_t::HEX_LOWER;
        case 'X':
            return kuid_format_t::HEX_UPPER;
        case 'v':
            return alt ? kuid_format_t::DEBUG_LITERAL : kuid_format_t::CANONICAL;
        case 's':
            return kuid_format_t::CANONICAL;
        case 'S':
            return kuid_format_t::CANONICAL_UPPER;
        case 'q':
            return kuid_format_t::QUOTED;
        default:
            return kuid_format_t::UNSUPPORTED;
    }
}

absl::StatusOr<std::string>
format(const Uuid &uuid, kuid_format_t kind) {
    switch (kind) {
        case kuid_format_t::HEX_LOWER:
            return encodeHexOnly(uuid, false);
        case kuid_format_t::HEX_UPPER:
            return encodeHexOnly(uuid, true);
        case kuid_format_t::CANONICAL:
            return encodeCanonical(uuid, false);
        case kuid_format_t::CANONICAL_UPPER:
            return encodeCanonical(uuid, true);
        case kuid_format_t::QUOTED:
            return encodeQuoted(uuid);
        case kuid_format_t::DEBUG_LITERAL:
            return encodeDebugLiteral(uuid);
        case kuid_format_t::UNSUPPORTED:
        default:
            break;
    }
    return absl::InvalidArgumentError(
        absl::StrFormat("uuid: unsupported output format %s for %s",
                        kuidEnumStrings::formatStr(kind), uuid.toString()));
}

absl::StatusOr<std::string>
formatVerb(const Uuid &uuid, char verb, bool alt) {
    const kuid_format_t kind = formatFromVerb(verb, alt);
    if (kind == kuid_format_t::UNSUPPORTED) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "uuid: unsupported format verb '%%%c' for %s", verb, uuid.toString()));
    }
    KUID_TRACE << "Formatting " << uuid << " as " << kuidEnumStrings::formatStr(kind);
    return format(uuid, kind);
}

absl::FormatConvertResult<absl::FormatConversionCharSet::kString |
                          absl::FormatConversionCharSet::x |
                          absl::FormatConversionCharSet::X>
AbslFormatConvert(const Uuid &uuid,
                  const absl::FormatConversionSpec &spec,
                  absl::FormatSink *sink) {
    switch (spec.conversion_char()) {
        case absl::FormatConversionChar::x:
            sink->Append(encodeHexOnly(uuid, false));
            break;
        case absl::FormatConversionChar::X:
            sink->Append(encodeHexOnly(uuid, true));
            break;
        default:
            sink->Append(encodeCanonical(uuid, false));
            break;
    }
    return {true};
}

} // namespace kuid
