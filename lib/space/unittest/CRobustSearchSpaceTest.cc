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

#include <space/CParameter.h>
#include <space/CParameterConstraint.h>
#include <space/CParameterDistribution.h>
#include <space/CRobustSearchSpace.h>
#include <space/CSearchSpaceDigest.h>
#include <space/CSearchSpaceErrors.h>

#include <boost/test/unit_test.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(CRobustSearchSpaceTest)

using namespace xp;
using TValue = space::CParameterValue;
using TValueVec = space::TParameterValueVec;
using TParameterVec = space::CSearchSpace::TParameterVec;
using TDistributionVec = space::TParameterDistributionVec;
using TParameterization = space::TParameterization;

namespace {
space::CParameter range(const std::string& name, double upper) {
    return space::CParameter::createRange(name, space::E_Float, 0.0, upper);
}

TParameterVec parameters() {
    return {range("x", 10.0), range("y", 10.0)};
}

TParameterVec environmental() {
    return {range("T", 100.0)};
}

space::CParameterDistribution temperature() {
    return {{"T"}, space::SNormalDistribution{50.0, 5.0}};
}

space::CParameterDistribution perturbation(bool multiplicative) {
    return {{"x", "y"}, space::SUniformDistribution{-1.0, 1.0}, multiplicative};
}
}

BOOST_AUTO_TEST_CASE(testConstruction) {
    space::CRobustSearchSpace searchSpace{
        parameters(), {perturbation(false), temperature()}, 4, environmental()};
    LOG_DEBUG(<< searchSpace.print());

    BOOST_TEST_REQUIRE(searchSpace.isRobust());
    BOOST_TEST_REQUIRE(searchSpace.isHierarchical() == false);
    BOOST_REQUIRE_EQUAL(4, searchSpace.numSamples());
    BOOST_TEST_REQUIRE(searchSpace.parameterNames() ==
                       (space::CSearchSpace::TStrVec{"x", "y", "T"}));
    BOOST_TEST_REQUIRE(searchSpace.environmentalVariables() == (space::CSearchSpace::TStrVec{"T"}));
    BOOST_TEST_REQUIRE(searchSpace.isEnvironmentalVariable("T"));
    BOOST_TEST_REQUIRE(searchSpace.isEnvironmentalVariable("x") == false);
    BOOST_REQUIRE_EQUAL(2, searchSpace.parameterDistributions().size());
    BOOST_REQUIRE_EQUAL(1, searchSpace.environmentalDistributions().size());
    BOOST_REQUIRE_EQUAL(1, searchSpace.perturbationDistributions().size());
    BOOST_TEST_REQUIRE((searchSpace.environmentalDistributions()[0] == temperature()));
    BOOST_TEST_REQUIRE((searchSpace.perturbationDistributions()[0] == perturbation(false)));

    // Environmental variables are part of every parameterization.
    BOOST_TEST_REQUIRE(searchSpace.checkMembership(
        {{"x", TValue{1.0}}, {"y", TValue{2.0}}, {"T", TValue{45.0}}}));
    BOOST_TEST_REQUIRE(searchSpace.checkMembership({{"x", TValue{1.0}}, {"y", TValue{2.0}}}) == false);

    // Without environmental variables every distribution is a perturbation.
    space::CRobustSearchSpace perturbed{parameters(), {perturbation(true)}, 10};
    BOOST_TEST_REQUIRE(perturbed.environmentalVariables().empty());
    BOOST_REQUIRE_EQUAL(1, perturbed.perturbationDistributions().size());
    BOOST_TEST_REQUIRE(perturbed.environmentalDistributions().empty());
}

BOOST_AUTO_TEST_CASE(testPolarity) {
    space::CRobustSearchSpace additive{parameters(), {perturbation(false)}, 1};
    BOOST_TEST_REQUIRE(additive.multiplicative() == false);

    space::CRobustSearchSpace multiplicative{parameters(), {perturbation(true)}, 1};
    BOOST_TEST_REQUIRE(multiplicative.multiplicative());

    space::CRobustSearchSpace separate{
        parameters(),
        {{{"x"}, space::SNormalDistribution{0.0, 0.1}, true},
         {{"y"}, space::SUniformDistribution{0.9, 1.1}, true}},
        1};
    BOOST_TEST_REQUIRE(separate.multiplicative());

    space::CRobustSearchSpace environmentalOnly{parameters(), {temperature()}, 1, environmental()};
    BOOST_TEST_REQUIRE(environmentalOnly.multiplicative() == false);
    BOOST_TEST_REQUIRE(environmentalOnly.perturbationDistributions().empty());

    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(
                            parameters(),
                            {{{"x"}, space::SNormalDistribution{0.0, 0.1}, true},
                             {{"y"}, space::SNormalDistribution{0.0, 0.1}, false}},
                            1),
                        space::CUnsupportedError);
}

BOOST_AUTO_TEST_CASE(testInvalidArguments) {
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(parameters(), TDistributionVec{}, 1),
                        space::CDefinitionError);
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(parameters(), {perturbation(false)}, 0),
                        space::CDefinitionError);
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(parameters(), {perturbation(false)}, -3),
                        space::CDefinitionError);

    // Environmental variables must be distinct from each other and the parameters.
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(parameters(), {perturbation(false)}, 1,
                                                  {range("x", 10.0)}),
                        space::CDefinitionError);
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(parameters(), {temperature()}, 1,
                                                  {range("T", 100.0), range("T", 100.0)}),
                        space::CDefinitionError);

    // Unknown parameter.
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(
                            parameters(), {{{"z"}, space::SNormalDistribution{0.0, 1.0}}}, 1),
                        space::CDefinitionError);

    // Two distributions for one parameter.
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(
                            parameters(),
                            {perturbation(false), {{"x"}, space::SNormalDistribution{0.0, 1.0}}}, 1),
                        space::CDefinitionError);

    // An environmental variable without a distribution.
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(parameters(), {perturbation(false)}, 1, environmental()),
                        space::CDefinitionError);

    // A distribution over both kinds of parameter.
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(
                            parameters(),
                            {{{"x", "T"}, space::SNormalDistribution{0.0, 1.0}}}, 1, environmental()),
                        space::CUnsupportedError);

    // Multiplicative environmental distribution.
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(
                            parameters(),
                            {{{"T"}, space::SNormalDistribution{1.0, 0.1}, true}}, 1, environmental()),
                        space::CDefinitionError);

    // A distribution over a choice parameter.
    TParameterVec withChoice{parameters()};
    withChoice.push_back(space::CParameter::createChoice(
        "c", space::E_Float, TValueVec{TValue{0.5}, TValue{1.5}}, true));
    BOOST_REQUIRE_THROW(space::CRobustSearchSpace(
                            withChoice, {{{"c"}, space::SNormalDistribution{0.0, 1.0}}}, 1),
                        space::CDefinitionError);
}

BOOST_AUTO_TEST_CASE(testUpdateParameter) {
    space::CRobustSearchSpace searchSpace{parameters(), {perturbation(false)}, 1};
    BOOST_REQUIRE_THROW(searchSpace.updateParameter(range("x", 5.0)), space::CUnsupportedError);
    BOOST_REQUIRE_EQUAL(10.0, searchSpace.parameter("x").range().s_Upper);
}

BOOST_AUTO_TEST_CASE(testAddParameter) {
    space::CRobustSearchSpace searchSpace{
        TParameterVec{range("x", 10.0)}, {temperature()}, 4, environmental()};

    searchSpace.addParameter(range("y", 10.0));
    searchSpace.addParameter(space::CParameter::createRange("n", space::E_Int, 0, 3));
    BOOST_TEST_REQUIRE(searchSpace.parameterNames() ==
                       (space::CSearchSpace::TStrVec{"x", "y", "n", "T"}));
    BOOST_REQUIRE_EQUAL(0.0, searchSpace.parameter("n").range().s_Lower);
    BOOST_REQUIRE_EQUAL(100.0, searchSpace.parameter("T").range().s_Upper);
    BOOST_TEST_REQUIRE(searchSpace.environmentalVariables() == (space::CSearchSpace::TStrVec{"T"}));
    BOOST_REQUIRE_THROW(searchSpace.addParameter(range("T", 1.0)), space::CDefinitionError);

    space::SSearchSpaceDigest digest{space::CSearchSpaceDigestExtractor::extract(searchSpace)};
    BOOST_TEST_REQUIRE(digest.s_FeatureNames ==
                       (space::CSearchSpace::TStrVec{"x", "y", "n", "T"}));
    BOOST_TEST_REQUIRE(digest.s_RobustDigest.has_value());
    BOOST_TEST_REQUIRE(digest.s_RobustDigest->s_EnvironmentalVariables ==
                       (space::CSearchSpace::TStrVec{"T"}));

    auto clone = searchSpace.clone();
    BOOST_TEST_REQUIRE(clone->parameterNames() == searchSpace.parameterNames());
}

BOOST_AUTO_TEST_CASE(testCloneAndPrint) {
    auto x = range("x", 10.0);
    auto y = range("y", 10.0);
    space::CRobustSearchSpace searchSpace{
        {x, y}, {perturbation(false), temperature()}, 4, environmental(),
        {space::CParameterConstraint::order(x, y)}};

    BOOST_REQUIRE_EQUAL(
        "RobustSearchSpace(parameters=[Range(name='x', type=FLOAT, range=[0.0, 10.0]), "
        "Range(name='y', type=FLOAT, range=[0.0, 10.0])], "
        "parameter_distributions=[ParameterDistribution(parameters=[x, y], "
        "distribution=uniform(a=-1.0, b=1.0), multiplicative=False), "
        "ParameterDistribution(parameters=[T], distribution=norm(loc=50.0, scale=5.0), "
        "multiplicative=False)], num_samples=4, "
        "environmental_variables=[Range(name='T', type=FLOAT, range=[0.0, 100.0])], "
        "parameter_constraints=[OrderConstraint(x <= y)])",
        searchSpace.print());

    auto clone = searchSpace.clone();
    BOOST_TEST_REQUIRE(clone->isRobust());
    BOOST_REQUIRE_EQUAL(searchSpace.print(), clone->print());
    const auto& robust = dynamic_cast<const space::CRobustSearchSpace&>(*clone);
    BOOST_TEST_REQUIRE(robust.environmentalVariables() == (space::CSearchSpace::TStrVec{"T"}));
    BOOST_REQUIRE_EQUAL(4, robust.numSamples());
}

BOOST_AUTO_TEST_SUITE_END()
