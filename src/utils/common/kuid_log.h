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
#ifndef __KUID_LOG_H
#define __KUID_LOG_H

#include "absl/log/log.h"

/*-----------------------------------------------------------------------------*
 * Logging Macros (Abseil Stream-style)
 *-----------------------------------------------------------------------------*
 * Ordered by severity (highest to lowest)
 * Usage: KUID_DEBUG << "Returning nil UUID: " << status.message();
 *
 * Minimum level is taken from the KUID_LOG_LEVEL environment variable
 * (TRACE, DEBUG, INFO, WARN, ERROR, FATAL, any case), WARN if unset or invalid.
 *
 * The level is applied when libkuid is loaded, and that step also calls
 * absl::InitializeLog(). Abseil allows a single call per process, so a host
 * program linking libkuid must not call absl::InitializeLog() itself.
 */

/*
 * Logs a message and terminates the program unconditionally.
 * Maps to Abseil LOG(FATAL). Used by kuid::must().
 */
#define KUID_FATAL LOG(FATAL)

/* Maps to Abseil WARNING level */
#define KUID_WARN LOG(WARNING)

/* Maps to Abseil verbosity level 1 */
#define KUID_DEBUG VLOG(1)

/*
 * Maps to Abseil verbosity level 2.
 * Stripped from release builds.
 */
#define KUID_TRACE DVLOG(2)

#endif /* __KUID_LOG_H */
