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
#ifndef TEST_GTEST_COMMON_H
#define TEST_GTEST_COMMON_H

#include <iostream>
#include <iomanip>
#include <cstdint>
#include <optional>
#include <random>
#include <stack>
#include <string>

#include "kuid.h"

namespace gtest {

class Logger {
public:
    Logger(const std::string &title = "INFO");
    ~Logger();

    template<typename T> Logger &operator<<(const T &value)
    {
        std::cout << value;
        return *this;
    }
};

// Sets environment variables, restoring the previous values on destruction
class ScopedEnv {
public:
    void addVar(const std::string &name, const std::string &value);

private:
    class Variable {
    public:
        Variable(const std::string &name, const std::string &value);
        Variable(Variable &&other);
        ~Variable();

        Variable(const Variable &other) = delete;
        Variable &operator=(const Variable &other) = delete;

    private:
        std::optional<std::string> m_prev_value;
        std::string m_name;
    };

    std::stack<Variable> m_vars;
};

// Process-wide seed for the randomized tests, set with --seed=N
class RandomSource {
public:
    static constexpr uint64_t DEFAULT_SEED = 0x6ba7b8109dad11d1ULL;

private:
    RandomSource() = default;
    ~RandomSource() = default;
    RandomSource(const RandomSource &other) = delete;
    void
    operator=(const RandomSource &) = delete;

public:
    static RandomSource &
    instance();

    void
    set_seed(uint64_t seed);
    uint64_t
    seed() const;

    // Generator seeded from the current seed, one per test
    std::mt19937_64
    engine() const;

private:
    uint64_t _seed = DEFAULT_SEED;
};

// Parses the value of --seed=N (decimal, 0x hex or 0 octal). False if malformed.
bool
parseSeed(const std::string &value, uint64_t &seed);

// 16 arbitrary bytes, no version or variant applied
kuid::Uuid::array_type
randomBytes(std::mt19937_64 &rng);

kuid::Uuid
randomUuid(std::mt19937_64 &rng);

// Space separated hex bytes, for assertion messages
std::string
hexDump(const void *buf, size_t len);

} // namespace gtest

#endif /* TEST_GTEST_COMMON_H */
