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
#ifndef INCLUDED_xp_maths_CPRNG_h
#define INCLUDED_xp_maths_CPRNG_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <cstdint>
#include <string>

namespace xp {
namespace maths {

//! \brief Fast pseudo random number generators.
//!
//! DESCRIPTION:\n
//! These satisfy the UniformRandomBitGenerator concept so they can be used
//! with the Boost.Random distributions. They are much cheaper to copy and
//! seed than a Mersenne twister which matters because every digest sampler
//! carries its own generator.
//!
//! See http://xoroshiro.di.unimi.it/ for details of the generators.
class MATHS_EXPORT CPRNG : private core::CNonInstantiatable {
public:
    //! \brief The split mix 64 generator.
    //!
    //! DESCRIPTION:\n
    //! This is only used to seed the other generators from a single 64 bit
    //! seed.
    class MATHS_EXPORT CSplitMix64 {
    public:
        using result_type = std::uint64_t;

    public:
        CSplitMix64();
        explicit CSplitMix64(std::uint64_t seed);

        bool operator==(CSplitMix64 other) const;
        bool operator!=(CSplitMix64 other) const { return !(*this == other); }

        void seed();
        void seed(std::uint64_t seed);

        static constexpr std::uint64_t min() { return 0; }
        static constexpr std::uint64_t max() { return ~std::uint64_t{0}; }

        std::uint64_t operator()();

        //! Fill the sequence [\p begin, \p end) with the next random numbers.
        template<typename ITR>
        void generate(ITR begin, ITR end) {
            for (/**/; begin != end; ++begin) {
                *begin = this->operator()();
            }
        }

        //! Discard the next \p n random numbers.
        void discard(std::uint64_t n);

        std::string print() const;

    private:
        static const std::uint64_t A;
        static const std::uint64_t B;
        static const std::uint64_t C;

    private:
        std::uint64_t m_X;
    };

    //! \brief The xoroshiro128+ generator.
    //!
    //! DESCRIPTION:\n
    //! It has period 2^128 - 1 and passes BigCrush. The lowest bit is an
    //! LFSR so we don't use it to generate booleans.
    class MATHS_EXPORT CXorOShiro128Plus {
    public:
        using result_type = std::uint64_t;

    public:
        CXorOShiro128Plus();
        explicit CXorOShiro128Plus(std::uint64_t seed);

        bool operator==(const CXorOShiro128Plus& other) const;
        bool operator!=(const CXorOShiro128Plus& other) const {
            return !(*this == other);
        }

        //! Set to the default seeded generator.
        void seed();
        //! Seed with \p seed expanded by CSplitMix64.
        void seed(std::uint64_t seed);

        static constexpr std::uint64_t min() { return 0; }
        static constexpr std::uint64_t max() { return ~std::uint64_t{0}; }

        std::uint64_t operator()();

        //! Discard the next \p n random numbers.
        void discard(std::uint64_t n);

        //! Equivalent to 2^64 calls to next(). This can be used to generate
        //! 2^64 non-overlapping sequences for independent samplers.
        void jump();

        std::string print() const;

    private:
        static const std::uint64_t JUMP[2];

    private:
        std::uint64_t m_X[2];
    };
};
}
}

#endif // INCLUDED_xp_maths_CPRNG_h
