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

#include <cstring>

#include "absl/strings/str_format.h"

#include "common/kuid_log.h"

namespace kuid {

absl::Status
parseBinary(const void *buf, size_t len, Uuid &dest) {
    if (len != kuid_size) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "uuid: UUID must be exactly %d bytes long, got %d bytes", kuid_size, len));
    }

    Uuid::array_type bytes;
    std::memcpy(bytes.data(), buf, kuid_size);
    dest = Uuid(bytes);
    return absl::OkStatus();
}

absl::StatusOr<Uuid>
fromBytes(const void *buf, size_t len) {
    Uuid uuid;
    const absl::Status status = parseBinary(buf, len, uuid);
    if (!status.ok()) {
        return status;
    }
    return uuid;
}

absl::StatusOr<Uuid>
fromBytes(const kuid_blob_t &blob) {
    return fromBytes(blob.data(), blob.size());
}

Uuid
fromBytesOrNil(const void *buf, size_t len) {
    absl::StatusOr<Uuid> uuid = fromBytes(buf, len);
    if (!uuid.ok()) {
        KUID_DEBUG << "Returning nil UUID: " << uuid.status().message();
        return nil_uuid;
    }
    return *uuid;
}

Uuid
fromBytesOrNil(const kuid_blob_t &blob) {
    return fromBytesOrNil(blob.data(), blob.size());
}

kuid_blob_t
toBytes(const Uuid &uuid) {
    return kuid_blob_t(reinterpret_cast<const char *>(uuid.data()), uuid.size());
}

} // namespace kuid
