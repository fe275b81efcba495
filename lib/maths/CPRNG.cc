/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */

#include <maths/CPRNG.h>

#include <algorithm>
#include <sstream>

namespace xp {
namespace maths {
namespace {

//! Discard a sequence of \p n random numbers.
template<typename PRNG>
inline void discard(std::uint64_t n, PRNG& rng) {
    for (/**/; n > 0; --n) {
        rng();
    }
}

//! Rotate about the \p k'th bit.
std::uint64_t rotl(const std::uint64_t x, int k) {
    return (x << k) | (x >> (64 - k));
}
}

CPRNG::CSplitMix64::CSplitMix64() : m_X{0} {
    this->seed();
}

CPRNG::CSplitMix64::CSplitMix64(std::uint64_t seed) : m_X{0} {
    this->seed(seed);
}

bool CPRNG::CSplitMix64::operator==(CSplitMix64 other) const {
    return m_X == other.m_X;
}

void CPRNG::CSplitMix64::seed() {
    m_X = 0;
}

void CPRNG::CSplitMix64::seed(std::uint64_t seed) {
    m_X = seed;
}

std::uint64_t CPRNG::CSplitMix64::operator()() {
    std::uint64_t x{m_X += A};
    x = (x ^ (x >> 30)) * B;
    x = (x ^ (x >> 27)) * C;
    return x ^ (x >> 31);
}

void CPRNG::CSplitMix64::discard(std::uint64_t n) {
    maths::discard(n, *this);
}

std::string CPRNG::CSplitMix64::print() const {
    return std::to_string(m_X);
}

const std::uint64_t CPRNG::CSplitMix64::A(0x9E3779B97F4A7C15);
const std::uint64_t CPRNG::CSplitMix64::B(0xBF58476D1CE4E5B9);
const std::uint64_t CPRNG::CSplitMix64::C(0x94D049BB133111EB);

CPRNG::CXorOShiro128Plus::CXorOShiro128Plus() {
    this->seed();
}

CPRNG::CXorOShiro128Plus::CXorOShiro128Plus(std::uint64_t seed) {
    this->seed(seed);
}

bool CPRNG::CXorOShiro128Plus::operator==(const CXorOShiro128Plus& other) const {
    return std::equal(&m_X[0], &m_X[2], &other.m_X[0]);
}

void CPRNG::CXorOShiro128Plus::seed() {
    this->seed(0);
}

void CPRNG::CXorOShiro128Plus::seed(std::uint64_t seed) {
    CSplitMix64 seeds{seed};
    seeds.generate(&m_X[0], &m_X[2]);
}

std::uint64_t CPRNG::CXorOShiro128Plus::operator()() {
    std::uint64_t x0{m_X[0]};
    std::uint64_t x1{m_X[1]};
    std::uint64_t result{x0 + x1};
    x1 ^= x0;
    m_X[0] = rotl(x0, 55) ^ x1 ^ (x1 << 14);
    m_X[1] = rotl(x1, 36);
    return result;
}

void CPRNG::CXorOShiro128Plus::discard(std::uint64_t n) {
    maths::discard(n, *this);
}

void CPRNG::CXorOShiro128Plus::jump() {
    std::uint64_t x[2]{0, 0};
    for (std::size_t i = 0; i < 2; ++i) {
        for (unsigned int b = 0; b < 64; ++b) {
            if (JUMP[i] & 1ULL << b) {
                x[0] ^= m_X[0];
                x[1] ^= m_X[1];
            }
            this->operator()();
        }
    }
    m_X[0] = x[0];
    m_X[1] = x[1];
}

std::string CPRNG::CXorOShiro128Plus::print() const {
    std::ostringstream result;
    result << m_X[0] << ':' << m_X[1];
    return result.str();
}

const std::uint64_t CPRNG::CXorOShiro128Plus::JUMP[2]{0xbeac0467eba5facb, 0xd86b048b86aa9922};
}
}
