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
#ifndef _KUID_CODEC_H
#define _KUID_CODEC_H

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "kuid.h"

namespace kuid {

/*** Text decoding ***/

/**
 * @brief  Parses text into dest. The following spellings are accepted,
 *         hex digits in any case:
 *
 *           "6ba7b810-9dad-11d1-80b4-00c04fd430c8"
 *           "{6ba7b810-9dad-11d1-80b4-00c04fd430c8}"
 *           "urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8"
 *           "6ba7b8109dad11d180b400c04fd430c8"
 *           "{6ba7b8109dad11d180b400c04fd430c8}"
 *           "urn:uuid:6ba7b8109dad11d180b400c04fd430c8"
 *
 *         dest is only written when the whole input is valid.
 *
 * @param  text  Input string
 * @param  dest  [out] Parsed value
 * @return InvalidArgument on a length, structure or hex digit error
 */
absl::Status
parse(std::string_view text, Uuid &dest);

absl::StatusOr<Uuid>
fromString(std::string_view text);

// Same as fromString(), but returns nil_uuid instead of an error
Uuid
fromStringOrNil(std::string_view text);

/*** Binary decoding and encoding ***/

/**
 * @brief  Copies exactly 16 bytes from buf into dest, without any byte-order transformation.
 *
 * @param  buf   Input buffer
 * @param  len   Length of buf, must be 16
 * @param  dest  [out] Decoded value, untouched on error
 * @return InvalidArgument if len is not 16
 */
absl::Status
parseBinary(const void *buf, size_t len, Uuid &dest);

absl::StatusOr<Uuid>
fromBytes(const void *buf, size_t len);

absl::StatusOr<Uuid>
fromBytes(const kuid_blob_t &blob);

// Same as fromBytes(), but returns nil_uuid instead of an error
Uuid
fromBytesOrNil(const void *buf, size_t len);

Uuid
fromBytesOrNil(const kuid_blob_t &blob);

// The 16 stored bytes, verbatim
kuid_blob_t
toBytes(const Uuid &uuid);

/*** Formatting facade ***/

/**
 * @brief  Maps a printf-style verb onto an output kind:
 *         'x' hex digits, 'X' uppercase hex digits, 'v' and 's' canonical,
 *         'S' uppercase canonical, 'q' quoted canonical, 'v' with alt flag ('#')
 *         debug literal. Anything else maps to UNSUPPORTED.
 */
kuid_format_t
formatFromVerb(char verb, bool alt = false);

// InvalidArgument for UNSUPPORTED or values outside kuid_format_t
absl::StatusOr<std::string>
format(const Uuid &uuid, kuid_format_t kind);

// InvalidArgument naming the verb and the canonical value when verb is unsupported
absl::StatusOr<std::string>
formatVerb(const Uuid &uuid, char verb, bool alt = false);

} // namespace kuid

#endif
