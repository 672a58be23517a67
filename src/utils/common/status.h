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

#ifndef KUID_STATUS_H
#define KUID_STATUS_H

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "kuid_log.h"

// Propagates a non-OK absl::Status to the caller
#define KUID_RETURN_IF_ERROR(expr) \
    do { \
        const absl::Status _kuid_status = (expr); \
        if (!_kuid_status.ok()) { \
            return _kuid_status; \
        } \
    } while (0)

// Same, but leaves a trace of the failing step first
#define KUID_LOG_AND_RETURN_IF_ERROR(expr, msg) \
    do { \
        const absl::Status _kuid_status = (expr); \
        if (!_kuid_status.ok()) { \
            KUID_TRACE << absl::StrFormat("%s: %s", (msg), _kuid_status.message()); \
            return _kuid_status; \
        } \
    } while (0)

#endif /* KUID_STATUS_H */
