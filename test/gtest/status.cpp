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
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "common/status.h"

namespace {

absl::Status
step(bool ok, std::vector<std::string> &trail, const std::string &name) {
    trail.push_back(name);
    return ok ? absl::OkStatus() : absl::InvalidArgumentError(name + " failed");
}

absl::Status
runSteps(bool first_ok, bool second_ok, std::vector<std::string> &trail) {
    KUID_RETURN_IF_ERROR(step(first_ok, trail, "first"));
    KUID_LOG_AND_RETURN_IF_ERROR(step(second_ok, trail, "second"), "second step");
    trail.push_back("done");
    return absl::OkStatus();
}

} // namespace

TEST(statusMacrosTest, PassThroughOnSuccess) {
    std::vector<std::string> trail;
    EXPECT_TRUE(runSteps(true, true, trail).ok());
    EXPECT_EQ(trail, (std::vector<std::string>{"first", "second", "done"}));
}

TEST(statusMacrosTest, ReturnIfErrorStopsEarly) {
    std::vector<std::string> trail;
    const absl::Status status = runSteps(false, true, trail);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "first failed");
    EXPECT_EQ(trail, (std::vector<std::string>{"first"}));
}

TEST(statusMacrosTest, LogAndReturnKeepsOriginalStatus) {
    std::vector<std::string> trail;
    const absl::Status status = runSteps(true, false, trail);
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "second failed");
    EXPECT_EQ(trail, (std::vector<std::string>{"first", "second"}));
}
