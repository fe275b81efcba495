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

#include <space/CParameterDistribution.h>
#include <space/CSearchSpaceErrors.h>

#include <test/BoostTestCloseAbsolute.h>

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(CParameterDistributionTest)

using namespace xp;

BOOST_AUTO_TEST_CASE(testUniform) {
    space::CParameterDistribution distribution{{"x", "y"}, space::SUniformDistribution{-1.0, 1.0}};
    LOG_DEBUG(<< distribution.print());
    BOOST_REQUIRE_EQUAL("ParameterDistribution(parameters=[x, y], "
                        "distribution=uniform(a=-1.0, b=1.0), multiplicative=False)",
                        distribution.print());

    maths::CPRNG::CXorOShiro128Plus rng;
    auto samples = distribution.sample(rng, 500);
    BOOST_REQUIRE_EQUAL(500, samples.rows());
    BOOST_REQUIRE_EQUAL(2, samples.cols());
    BOOST_TEST_REQUIRE(samples.minCoeff() >= -1.0);
    BOOST_TEST_REQUIRE(samples.maxCoeff() < 1.0);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, samples.col(0).mean(), 0.1);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, samples.col(1).mean(), 0.1);
    // The columns are independent.
    BOOST_TEST_REQUIRE((samples.col(0) != samples.col(1)));
}

BOOST_AUTO_TEST_CASE(testNormal) {
    space::CParameterDistribution distribution{
        {"T"}, space::SNormalDistribution{20.0, 2.0}, false};
    BOOST_REQUIRE_EQUAL("ParameterDistribution(parameters=[T], "
                        "distribution=norm(loc=20.0, scale=2.0), multiplicative=False)",
                        distribution.print());

    maths::CPRNG::CXorOShiro128Plus rng{7};
    auto samples = distribution.sample(rng, 2000);
    BOOST_REQUIRE_EQUAL(2000, samples.rows());
    BOOST_REQUIRE_EQUAL(1, samples.cols());
    double mean{samples.mean()};
    double variance{(samples.array() - mean).square().sum() / 1999.0};
    LOG_DEBUG(<< "mean = " << mean << ", variance = " << variance);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(20.0, mean, 0.2);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(4.0, variance, 0.5);

    // Zero scale is a point mass.
    space::CParameterDistribution point{{"T"}, space::SNormalDistribution{3.0, 0.0}};
    auto constant = point.sample(rng, 3);
    BOOST_REQUIRE_EQUAL(3.0, constant.minCoeff());
    BOOST_REQUIRE_EQUAL(3.0, constant.maxCoeff());
}

BOOST_AUTO_TEST_CASE(testInvalid) {
    BOOST_REQUIRE_THROW(space::CParameterDistribution({}, space::SNormalDistribution{}),
                        space::CDefinitionError);
    BOOST_REQUIRE_THROW(space::CParameterDistribution({"x", "x"}, space::SNormalDistribution{}),
                        space::CDefinitionError);
    BOOST_REQUIRE_THROW(space::CParameterDistribution({"x"}, space::SNormalDistribution{0.0, -1.0}),
                        space::CDefinitionError);
    BOOST_REQUIRE_THROW(space::CParameterDistribution({"x"}, space::SUniformDistribution{1.0, 0.0}),
                        space::CDefinitionError);
}

BOOST_AUTO_TEST_CASE(testEquality) {
    space::CParameterDistribution lhs{{"x"}, space::SNormalDistribution{0.0, 1.0}, true};
    space::CParameterDistribution rhs{{"x"}, space::SNormalDistribution{0.0, 1.0}, true};
    space::CParameterDistribution additive{{"x"}, space::SNormalDistribution{0.0, 1.0}, false};
    space::CParameterDistribution uniform{{"x"}, space::SUniformDistribution{0.0, 1.0}, true};
    BOOST_TEST_REQUIRE((lhs == rhs));
    BOOST_TEST_REQUIRE((lhs == additive) == false);
    BOOST_TEST_REQUIRE((lhs == uniform) == false);
    BOOST_TEST_REQUIRE(lhs.multiplicative());
}

BOOST_AUTO_TEST_SUITE_END()
