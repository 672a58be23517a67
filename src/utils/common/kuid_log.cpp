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

#include "kuid_log.h"
#include "absl/log/initialize.h"
#include "absl/log/globals.h"
#include "absl/strings/ascii.h"
#include "absl/container/flat_hash_map.h"
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace {

// Abseil severity floor plus the VLOG level enabling KUID_DEBUG / KUID_TRACE
struct kuidLogLevel {
    absl::LogSeverityAtLeast minSeverity;
    int verbosity;
};

constexpr std::string_view default_level_name = "WARN";
constexpr char log_level_env[] = "KUID_LOG_LEVEL";

const absl::flat_hash_map<std::string_view, kuidLogLevel> &
logLevels() {
    static const absl::flat_hash_map<std::string_view, kuidLogLevel> levels = {
        {"TRACE", {absl::LogSeverityAtLeast::kInfo, 2}},
        {"DEBUG", {absl::LogSeverityAtLeast::kInfo, 1}},
        {"INFO",  {absl::LogSeverityAtLeast::kInfo, 0}},
        {"WARN",  {absl::LogSeverityAtLeast::kWarning, 0}},
        {"ERROR", {absl::LogSeverityAtLeast::kError, 0}},
        {"FATAL", {absl::LogSeverityAtLeast::kFatal, 0}},
    };
    return levels;
}

// Level named by value, matched case-insensitively; nullopt if unknown
std::optional<kuidLogLevel>
lookupLevel(std::string_view value) {
    const std::string upper = absl::AsciiStrToUpper(value);
    const auto it = logLevels().find(upper);
    if (it == logLevels().end()) {
        return std::nullopt;
    }
    return it->second;
}

void
applyLevel(const kuidLogLevel &level) {
    absl::SetMinLogLevel(level.minSeverity);
    absl::SetVLogLevel("*", level.verbosity);
    absl::SetStderrThreshold(level.minSeverity);
}

void initKuidLogging() __attribute__((constructor));

// Runs when libkuid is loaded. Must be the only absl::InitializeLog() caller.
void
initKuidLogging() {
    const char *env_value = std::getenv(log_level_env);

    std::optional<kuidLogLevel> level;
    if (env_value != nullptr) {
        level = lookupLevel(env_value);
    }

    applyLevel(level ? *level : logLevels().at(default_level_name));
    absl::InitializeLog();

    if (env_value != nullptr && !level) {
        KUID_WARN << "Invalid " << log_level_env << " environment variable '" << env_value
                  << "', using default log level: " << default_level_name;
    }
}

} // anonymous namespace
