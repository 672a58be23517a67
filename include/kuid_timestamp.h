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
#ifndef _KUID_TIMESTAMP_H
#define _KUID_TIMESTAMP_H

#include <chrono>
#include <cstdint>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "kuid.h"

namespace kuid {

/**
 * @class Timestamp
 * @brief The count of 100-nanosecond intervals since 00:00:00.00, 15 October 1582 (UTC)
 *        embedded in V1 and V6 UUIDs. It has no meaning for other versions.
 */
class Timestamp {
public:
    // 100ns ticks per second
    static constexpr uint64_t ticks_per_second = 10000000;

    // Ticks between 1582-10-15T00:00:00Z and 1970-01-01T00:00:00Z
    static constexpr uint64_t unix_epoch_ticks = 122192928000000000ULL;

    constexpr Timestamp() noexcept : ticks_(0) {}
    explicit constexpr Timestamp(uint64_t ticks) noexcept : ticks_(ticks) {}

    constexpr uint64_t
    ticks() const noexcept {
        return ticks_;
    }

    /**
     * @brief  UTC time represented by this timestamp. Never fails for 60-bit values.
     */
    absl::Time
    toTime() const;

    /**
     * @brief  Same instant as a system_clock time point. The clock's range is
     *         narrower than the 60-bit timestamp range (about 1677 to 2262 with
     *         nanosecond ticks).
     *
     * @return OutOfRange if the instant cannot be represented by system_clock
     */
    absl::StatusOr<std::chrono::system_clock::time_point>
    toChrono() const;

    bool operator==(const Timestamp &other) const noexcept { return ticks_ == other.ticks_; }
    bool operator!=(const Timestamp &other) const noexcept { return ticks_ != other.ticks_; }
    bool operator<(const Timestamp &other) const noexcept { return ticks_ < other.ticks_; }

private:
    uint64_t ticks_;
};

/**
 * @brief  Reassembles the timestamp of a V1 UUID from time_low, time_mid and time_hi.
 *
 * @return FailedPrecondition if uuid is not version 1
 */
absl::StatusOr<Timestamp>
timestampFromV1(const Uuid &uuid);

/**
 * @brief  Reassembles the timestamp of a V6 UUID, where the fields are stored
 *         most significant first (time_high, time_mid, time_low).
 *
 * @return FailedPrecondition if uuid is not version 6
 */
absl::StatusOr<Timestamp>
timestampFromV6(const Uuid &uuid);

} // namespace kuid

#endif
