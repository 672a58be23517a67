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

#include "absl/strings/match.h"
#include "absl/strings/str_format.h"

#include "common/kuid_log.h"
#include "common/status.h"
#include "core/uuid_layout.h"

namespace kuid {

namespace {

constexpr std::string_view urn_prefix = "urn:uuid:";

constexpr size_t braced_hash_len = kuid_hash_len + 2;
constexpr size_t braced_canonical_len = kuid_canonical_len + 2;
constexpr size_t urn_hash_len = kuid_hash_len + 9;
constexpr size_t urn_canonical_len = kuid_canonical_len + 9;

absl::Status
formatError(std::string_view fragment) {
    return absl::InvalidArgumentError(
        absl::StrFormat("uuid: incorrect UUID format in string \"%s\"", fragment));
}

absl::Status
invalidFormatError() {
    return absl::InvalidArgumentError("uuid: invalid UUID format");
}

// "6ba7b810-9dad-11d1-80b4-00c04fd430c8"
absl::Status
decodeCanonical(std::string_view t, Uuid::array_type &out) {
    for (size_t pos : layout::hyphen_pos) {
        if (t[pos] != '-') {
            return formatError(t);
        }
    }

    for (size_t i = 0; i < kuid_size; ++i) {
        if (!hex::decodePair(t.data() + layout::canonical_pair_pos[i], out[i])) {
            return invalidFormatError();
        }
    }
    return absl::OkStatus();
}

// "6ba7b8109dad11d180b400c04fd430c8"
absl::Status
decodeHashLike(std::string_view t, Uuid::array_type &out) {
    for (size_t i = 0; i < kuid_size; ++i) {
        if (!hex::decodePair(t.data() + 2 * i, out[i])) {
            return invalidFormatError();
        }
    }
    return absl::OkStatus();
}

} // anonymous namespace

absl::Status
parse(std::string_view text, Uuid &dest) {
    std::string_view body = text;

    switch (text.size()) {
        case kuid_hash_len:
        case kuid_canonical_len:
            break;
        case braced_hash_len:
        case braced_canonical_len:
            if (text.front() != '{' || text.back() != '}') {
                return formatError(text);
            }
            body = text.substr(1, text.size() - 2);
            break;
        case urn_hash_len:
        case urn_canonical_len:
            if (!absl::StartsWith(text, urn_prefix)) {
                return formatError(text.substr(0, urn_prefix.size()));
            }
            body = text.substr(urn_prefix.size());
            break;
        default:
            return absl::InvalidArgumentError(absl::StrFormat(
                "uuid: incorrect UUID length %d in string \"%s\"", text.size(), text));
    }

    // Decode into scratch storage, dest is only assigned on success
    Uuid::array_type scratch{};
    if (body.size() == kuid_canonical_len) {
        KUID_LOG_AND_RETURN_IF_ERROR(decodeCanonical(body, scratch), "canonical decode");
    } else {
        KUID_LOG_AND_RETURN_IF_ERROR(decodeHashLike(body, scratch), "hash-like decode");
    }

    dest = Uuid(scratch);
    return absl::OkStatus();
}

absl::StatusOr<Uuid>
fromString(std::string_view text) {
    Uuid uuid;
    KUID_RETURN_IF_ERROR(parse(text, uuid));
    return uuid;
}

Uuid
fromStringOrNil(std::string_view text) {
    Uuid uuid;
    const absl::Status status = parse(text, uuid);
    if (!status.ok()) {
        KUID_DEBUG << "Returning nil UUID: " << status.message();
        return nil_uuid;
    }
    return uuid;
}

} // namespace kuid
