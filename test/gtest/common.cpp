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
#include "common.h"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <cstdlib>
#include <cctype>

namespace gtest {

Logger::Logger(const std::string &title)
{
    std::cout << "[ " << std::setw(8) << title << " ] ";
}

Logger::~Logger()
{
    std::cout << std::endl;
}

void ScopedEnv::addVar(const std::string &name, const std::string &value)
{
    m_vars.emplace(name, value);
}

ScopedEnv::Variable::Variable(const std::string &name, const std::string &value)
    : m_name(name)
{
    const char *prev = getenv(name.c_str());

    if (prev != nullptr) {
        m_prev_value = prev;
    }

    setenv(name.c_str(), value.c_str(), 1);
}

ScopedEnv::Variable::Variable(Variable &&other)
    : m_prev_value(std::move(other.m_prev_value)),
      m_name(std::move(other.m_name))
{
    other.m_name.clear();
}

ScopedEnv::Variable::~Variable()
{
    if (m_name.empty()) {
        return;
    }

    if (m_prev_value) {
        setenv(m_name.c_str(), m_prev_value->c_str(), 1);
    } else {
        unsetenv(m_name.c_str());
    }
}

RandomSource &
RandomSource::instance() {
    static RandomSource _instance;
    return _instance;
}

void
RandomSource::set_seed(uint64_t seed) {
    _seed = seed;
}

uint64_t
RandomSource::seed() const {
    return _seed;
}

std::mt19937_64
RandomSource::engine() const {
    return std::mt19937_64(_seed);
}

bool
parseSeed(const std::string &value, uint64_t &seed) {
    // stoull would accept leading blanks and signs
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        return false;
    }

    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &consumed, 0);
    } catch (const std::invalid_argument &) {
        return false;
    } catch (const std::out_of_range &) {
        return false;
    }
    if (consumed != value.size()) {
        return false;
    }
    seed = parsed;
    return true;
}

kuid::Uuid::array_type
randomBytes(std::mt19937_64 &rng) {
    std::uniform_int_distribution<unsigned> dist(0, 255);
    kuid::Uuid::array_type bytes;
    for (auto &b : bytes) {
        b = static_cast<uint8_t>(dist(rng));
    }
    return bytes;
}

kuid::Uuid
randomUuid(std::mt19937_64 &rng) {
    return kuid::Uuid(randomBytes(rng));
}

std::string
hexDump(const void *buf, size_t len) {
    const auto *p = static_cast<const uint8_t *>(buf);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        if (i != 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<int>(p[i]);
    }
    return oss.str();
}

} // namespace gtest
