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

#include <maths/CTools.h>

#include <test/BoostTestCloseAbsolute.h>

#include <boost/test/unit_test.hpp>

#include <cmath>

BOOST_AUTO_TEST_SUITE(CToolsTest)

using namespace xp;

BOOST_AUTO_TEST_CASE(testMidpoints) {
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.5, maths::CTools::linearMidpoint(0.0, 1.0), 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, maths::CTools::linearMidpoint(-2.0, 2.0), 1e-12);

    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, maths::CTools::log10Midpoint(0.01, 100.0), 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.001, maths::CTools::log10Midpoint(1e-4, 1e-2), 1e-12);

    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.5, maths::CTools::logitMidpoint(0.1, 0.9), 1e-12);
    // The logit midpoint is pulled towards the nearer boundary.
    BOOST_TEST_REQUIRE(maths::CTools::logitMidpoint(0.01, 0.5) < 0.255);
}

BOOST_AUTO_TEST_CASE(testLogitLogistic) {
    for (double p : {1e-6, 0.01, 0.3, 0.5, 0.75, 0.999}) {
        BOOST_REQUIRE_CLOSE_ABSOLUTE(p, maths::CTools::logistic(maths::CTools::logit(p)), 1e-12);
    }
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, maths::CTools::logit(0.5), 1e-15);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(std::log(3.0), maths::CTools::logit(0.75), 1e-12);
    BOOST_TEST_REQUIRE(std::isfinite(maths::CTools::logistic(-1000.0)));
    BOOST_TEST_REQUIRE(std::isfinite(maths::CTools::logistic(1000.0)));
}

BOOST_AUTO_TEST_CASE(testPow2) {
    BOOST_REQUIRE_EQUAL(6.25, maths::CTools::pow2(-2.5));
}

BOOST_AUTO_TEST_SUITE_END()
