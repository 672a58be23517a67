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
#include "kuid_timestamp.h"

#include "absl/strings/str_format.h"

#include "core/uuid_layout.h"

namespace kuid {

namespace {

absl::Status
versionError(const Uuid &uuid, uint8_t expected) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "uuid: %s is version %d, not version %d", uuid.toString(), uuid.version(), expected));
}

} // anonymous namespace

absl::Time
Timestamp::toTime() const {
    const uint64_t secs = ticks_ / ticks_per_second;
    const uint64_t nsecs = 100 * (ticks_ % ticks_per_second);
    const int64_t unix_secs =
        static_cast<int64_t>(secs) - static_cast<int64_t>(unix_epoch_ticks / ticks_per_second);

    return absl::FromUnixSeconds(unix_secs) + absl::Nanoseconds(static_cast<int64_t>(nsecs));
}

absl::StatusOr<std::chrono::system_clock::time_point>
Timestamp::toChrono() const {
    using time_point = std::chrono::system_clock::time_point;

    const absl::Time t = toTime();
    if (t < absl::FromChrono(time_point::min()) || t > absl::FromChrono(time_point::max())) {
        return absl::OutOfRangeError(absl::StrFormat(
            "uuid: timestamp %s is outside the system_clock range",
            absl::FormatTime(absl::RFC3339_full, t, absl::UTCTimeZone())));
    }
    return absl::ToChronoTime(t);
}

absl::StatusOr<Timestamp>
timestampFromV1(const Uuid &uuid) {
    if (uuid.version() != KUID_V1) {
        return versionError(uuid, KUID_V1);
    }

    const uint8_t *b = uuid.data();
    const uint64_t low = layout::loadBe32(b);
    const uint64_t mid = layout::loadBe16(b + 4);
    const uint64_t hi = layout::loadBe16(b + 6) & layout::version_time_mask;

    return Timestamp(low + (mid << 32) + (hi << 48));
}

absl::StatusOr<Timestamp>
timestampFromV6(const Uuid &uuid) {
    if (uuid.version() != KUID_V6) {
        return versionError(uuid, KUID_V6);
    }

    const uint8_t *b = uuid.data();
    const uint64_t hi = layout::loadBe32(b);
    const uint64_t mid = layout::loadBe16(b + 4);
    const uint64_t low = layout::loadBe16(b + 6) & layout::version_time_mask;

    return Timestamp(low + (mid << 12) + (hi << 28));
}

} // namespace kuid
