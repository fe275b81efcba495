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

#include <core/CLogger.h>

#include <maths/CPRNG.h>

#include <test/BoostTestCloseAbsolute.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

BOOST_AUTO_TEST_SUITE(CPRNGTest)

using namespace xp;

BOOST_AUTO_TEST_CASE(testSplitMix64) {
    maths::CPRNG::CSplitMix64 rng1;
    maths::CPRNG::CSplitMix64 rng2{0};
    BOOST_TEST_REQUIRE((rng1 == rng2));

    std::vector<std::uint64_t> samples1(20);
    rng1.generate(samples1.begin(), samples1.end());
    for (const auto& sample : samples1) {
        BOOST_REQUIRE_EQUAL(sample, rng2());
    }

    // Discard is equivalent to sampling.
    maths::CPRNG::CSplitMix64 rng3{42};
    maths::CPRNG::CSplitMix64 rng4{42};
    rng3.discard(10);
    for (std::size_t i = 0; i < 10; ++i) {
        rng4();
    }
    BOOST_TEST_REQUIRE((rng3 == rng4));
    BOOST_REQUIRE_EQUAL(rng3.print(), rng4.print());
}

BOOST_AUTO_TEST_CASE(testXorOShiro128Plus) {
    maths::CPRNG::CXorOShiro128Plus rng1;
    maths::CPRNG::CXorOShiro128Plus rng2{0};
    BOOST_TEST_REQUIRE((rng1 == rng2));

    // Copies reproduce the same sequence.
    maths::CPRNG::CXorOShiro128Plus copy{rng1};
    for (std::size_t i = 0; i < 100; ++i) {
        BOOST_REQUIRE_EQUAL(rng1(), copy());
    }

    // Different seeds give different sequences.
    maths::CPRNG::CXorOShiro128Plus rng3{1};
    maths::CPRNG::CXorOShiro128Plus rng4{2};
    std::size_t same{0};
    for (std::size_t i = 0; i < 100; ++i) {
        same += rng3() == rng4() ? 1 : 0;
    }
    BOOST_REQUIRE_EQUAL(0, same);

    // Reseeding restarts the sequence.
    maths::CPRNG::CXorOShiro128Plus rng5{7};
    std::uint64_t first{rng5()};
    rng5();
    rng5.seed(7);
    BOOST_REQUIRE_EQUAL(first, rng5());

    maths::CPRNG::CXorOShiro128Plus rng6{3};
    maths::CPRNG::CXorOShiro128Plus rng7{3};
    rng6.discard(25);
    for (std::size_t i = 0; i < 25; ++i) {
        rng7();
    }
    BOOST_TEST_REQUIRE((rng6 == rng7));
    LOG_DEBUG(<< "state = " << rng6.print());
}

BOOST_AUTO_TEST_CASE(testJump) {
    maths::CPRNG::CXorOShiro128Plus rng1{5};
    maths::CPRNG::CXorOShiro128Plus rng2{rng1};
    rng2.jump();
    BOOST_TEST_REQUIRE((rng1 != rng2));

    // Jumping is deterministic.
    maths::CPRNG::CXorOShiro128Plus rng3{5};
    rng3.jump();
    BOOST_TEST_REQUIRE((rng2 == rng3));

    // The jumped sequence doesn't overlap the start of the original.
    std::vector<std::uint64_t> samples1;
    std::vector<std::uint64_t> samples2;
    for (std::size_t i = 0; i < 1000; ++i) {
        samples1.push_back(rng1());
        samples2.push_back(rng2());
    }
    std::sort(samples1.begin(), samples1.end());
    std::sort(samples2.begin(), samples2.end());
    std::vector<std::uint64_t> common;
    std::set_intersection(samples1.begin(), samples1.end(), samples2.begin(),
                          samples2.end(), std::back_inserter(common));
    BOOST_TEST_REQUIRE(common.empty());
}

BOOST_AUTO_TEST_CASE(testUniformity) {
    // The mean of the top bits should be close to one half.
    maths::CPRNG::CXorOShiro128Plus rng{17};
    double mean{0.0};
    std::size_t n{100000};
    for (std::size_t i = 0; i < n; ++i) {
        mean += static_cast<double>(rng() >> 11) / static_cast<double>(std::uint64_t{1} << 53);
    }
    mean /= static_cast<double>(n);
    LOG_DEBUG(<< "mean = " << mean);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.5, mean, 0.01);
}

BOOST_AUTO_TEST_SUITE_END()
