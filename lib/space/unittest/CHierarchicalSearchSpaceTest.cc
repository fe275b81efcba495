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

#include <space/CArm.h>
#include <space/CHierarchicalSearchSpace.h>
#include <space/CObservationFeatures.h>
#include <space/CParameter.h>
#include <space/CSearchSpaceErrors.h>

#include <boost/test/unit_test.hpp>

#include <string>

BOOST_AUTO_TEST_SUITE(CHierarchicalSearchSpaceTest)

using namespace xp;
using TValue = space::CParameterValue;
using TValueVec = space::TParameterValueVec;
using TParameterVec = space::CSearchSpace::TParameterVec;
using TParameterization = space::TParameterization;

namespace {
space::CParameter
choice(const std::string& name, TValueVec values, space::CParameter::TValueStrVecPrVec dependents) {
    return space::CParameter::createChoice(name, space::E_String, std::move(values), false,
                                           false, false, TValue{}, std::move(dependents));
}

space::CParameter
intChoice(const std::string& name, space::CParameter::TValueStrVecPrVec dependents) {
    return space::CParameter::createChoice(name, space::E_Int, TValueVec{TValue{1}, TValue{2}},
                                           true, false, false, TValue{}, std::move(dependents));
}

space::CParameter leaf(const std::string& name) {
    return space::CParameter::createRange(name, space::E_Float, 0.0, 1.0);
}

//! model: A -> [lr, optimizer: adam -> [beta]], B -> [depth].
TParameterVec modelParameters() {
    return {choice("model", TValueVec{TValue{"A"}, TValue{"B"}},
                   {{TValue{"A"}, {"lr", "optimizer"}}, {TValue{"B"}, {"depth"}}}),
            space::CParameter::createRange("lr", space::E_Float, 0.01, 0.1),
            choice("optimizer", TValueVec{TValue{"sgd"}, TValue{"adam"}},
                   {{TValue{"adam"}, {"beta"}}}),
            space::CParameter::createRange("depth", space::E_Int, 1, 8),
            space::CParameter::createRange("beta", space::E_Float, 0.8, 0.99)};
}

TParameterization fullParameterization() {
    return {{"model", TValue{"A"}},
            {"lr", TValue{0.05}},
            {"optimizer", TValue{"sgd"}},
            {"depth", TValue{3}},
            {"beta", TValue{0.9}}};
}

TParameterization sgdParameterization() {
    return {{"model", TValue{"A"}}, {"lr", TValue{0.05}}, {"optimizer", TValue{"sgd"}}};
}
}

BOOST_AUTO_TEST_CASE(testStructure) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};
    LOG_DEBUG(<< searchSpace.hierarchicalStructureStr());

    BOOST_TEST_REQUIRE(searchSpace.isHierarchical());
    BOOST_REQUIRE_EQUAL("model", searchSpace.root().name());
    BOOST_REQUIRE_EQUAL(3, searchSpace.height());
    BOOST_REQUIRE_EQUAL("model\n"
                        "\t(A)\n"
                        "\t\tlr\n"
                        "\t\toptimizer\n"
                        "\t\t\t(adam)\n"
                        "\t\t\t\tbeta\n"
                        "\t(B)\n"
                        "\t\tdepth\n",
                        searchSpace.hierarchicalStructureStr(true));

    std::string structure{searchSpace.hierarchicalStructureStr()};
    BOOST_REQUIRE_EQUAL(0, structure.find("Choice(name='model', type=STRING"));
    BOOST_TEST_REQUIRE(structure.find("\t\t\t\tRange(name='beta', type=FLOAT, range=[0.8, 0.99])\n") !=
                       std::string::npos);

    space::CHierarchicalSearchSpace single{TParameterVec{leaf("x")}};
    BOOST_REQUIRE_EQUAL("x", single.root().name());
    BOOST_REQUIRE_EQUAL(1, single.height());
}

BOOST_AUTO_TEST_CASE(testInvalidStructure) {
    // Two roots.
    TParameterVec parameters{modelParameters()};
    parameters.push_back(leaf("extra"));
    BOOST_REQUIRE_THROW(space::CHierarchicalSearchSpace{parameters}, space::CStructureError);

    // A dependent which isn't a parameter.
    BOOST_REQUIRE_THROW(
        space::CHierarchicalSearchSpace({choice("model", TValueVec{TValue{"A"}},
                                                {{TValue{"A"}, {"lr", "missing"}}}),
                                         leaf("lr")}),
        space::CStructureError);

    // Two branches share a subtree.
    BOOST_REQUIRE_THROW(
        space::CHierarchicalSearchSpace(
            {choice("model", TValueVec{TValue{"A"}, TValue{"B"}},
                    {{TValue{"A"}, {"lr"}}, {TValue{"B"}, {"lr"}}}),
             leaf("lr")}),
        space::CStructureError);

    // A cycle below the root.
    BOOST_REQUIRE_THROW(space::CHierarchicalSearchSpace(
                            {choice("model", TValueVec{TValue{"A"}}, {{TValue{"A"}, {"p"}}}),
                             intChoice("p", {{TValue{1}, {"q"}}}),
                             intChoice("q", {{TValue{1}, {"p"}}})}),
                        space::CStructureError);

    // A cycle which isn't reachable from the root.
    BOOST_REQUIRE_THROW(space::CHierarchicalSearchSpace({leaf("model"),
                                                         intChoice("p", {{TValue{1}, {"q"}}}),
                                                         intChoice("q", {{TValue{1}, {"p"}}})}),
                        space::CStructureError);

    // A cycle and no root.
    BOOST_REQUIRE_THROW(space::CHierarchicalSearchSpace({intChoice("p", {{TValue{1}, {"q"}}}),
                                                         intChoice("q", {{TValue{1}, {"p"}}})}),
                        space::CStructureError);
}

BOOST_AUTO_TEST_CASE(testCastParameterization) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};

    TParameterization cast{searchSpace.castParameterization(fullParameterization())};
    BOOST_REQUIRE_EQUAL(space::print(sgdParameterization()), space::print(cast));
    BOOST_REQUIRE_EQUAL(space::print(cast),
                        space::print(searchSpace.castParameterization(cast)));

    TParameterization adam{fullParameterization()};
    adam["optimizer"] = TValue{"adam"};
    BOOST_REQUIRE_EQUAL("{'beta': 0.9, 'lr': 0.05, 'model': 'A', 'optimizer': 'adam'}",
                        space::print(searchSpace.castParameterization(adam)));

    TParameterization b{fullParameterization()};
    b["model"] = TValue{"B"};
    BOOST_REQUIRE_EQUAL("{'depth': 3, 'model': 'B'}",
                        space::print(searchSpace.castParameterization(b)));

    TParameterization missing{{"model", TValue{"A"}}, {"optimizer", TValue{"adam"}}};
    BOOST_REQUIRE_THROW(searchSpace.castParameterization(missing), space::CMembershipError);
    BOOST_REQUIRE_EQUAL("{'model': 'A', 'optimizer': 'adam'}",
                        space::print(searchSpace.castParameterization(missing, false)));
}

BOOST_AUTO_TEST_CASE(testMembership) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};

    BOOST_TEST_REQUIRE(searchSpace.checkMembership(sgdParameterization()));
    BOOST_TEST_REQUIRE(searchSpace.checkMembership({{"model", TValue{"B"}}, {"depth", TValue{8}}}));

    // Inapplicable parameters.
    BOOST_TEST_REQUIRE(searchSpace.checkMembership(fullParameterization()) == false);
    BOOST_REQUIRE_THROW(searchSpace.checkMembership(fullParameterization(), true),
                        space::CMembershipError);

    // Missing applicable parameters.
    TParameterization missing{{"model", TValue{"A"}}, {"optimizer", TValue{"adam"}}};
    BOOST_TEST_REQUIRE(searchSpace.checkMembership(missing) == false);
    BOOST_REQUIRE_THROW(searchSpace.checkMembership(missing, true), space::CMembershipError);
    BOOST_TEST_REQUIRE(searchSpace.checkMembership(missing, false, false));

    // Out of domain values and unknown names are rejected first.
    TParameterization outOfDomain{sgdParameterization()};
    outOfDomain["lr"] = TValue{0.5};
    BOOST_TEST_REQUIRE(searchSpace.checkMembership(outOfDomain) == false);
    TParameterization unknown{sgdParameterization()};
    unknown["momentum"] = TValue{0.5};
    BOOST_TEST_REQUIRE(searchSpace.checkMembership(unknown) == false);
    BOOST_REQUIRE_THROW(searchSpace.checkMembership(unknown, true), space::CMembershipError);
}

BOOST_AUTO_TEST_CASE(testValidateMembership) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};

    searchSpace.validateMembership(sgdParameterization());
    searchSpace.validateMembership({{"model", TValue{"B"}}, {"depth", TValue{2}}});

    BOOST_REQUIRE_THROW(searchSpace.validateMembership({{"model", TValue{"B"}}, {"depth", TValue{2.0}}}),
                        space::CTypeMismatchError);
    BOOST_REQUIRE_THROW(searchSpace.validateMembership(fullParameterization()),
                        space::CMembershipError);
}

BOOST_AUTO_TEST_CASE(testCastArm) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};

    space::CArm arm{{{"model", TValue{"B"}}, {"depth", TValue{2.6}}, {"lr", TValue{0.05}}},
                    std::string{"1_0"}};
    space::CArm cast{searchSpace.castArm(arm)};
    LOG_DEBUG(<< cast.print());
    BOOST_REQUIRE_EQUAL("Arm(name='1_0', parameters={'depth': 3, 'model': 'B'})", cast.print());
    BOOST_TEST_REQUIRE(searchSpace.checkMembership(cast.parameters()));
}

BOOST_AUTO_TEST_CASE(testCastAndFlattenObservationFeatures) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};

    space::CObservationFeatures features{fullParameterization(), 7};
    space::CObservationFeatures cast{searchSpace.castObservationFeatures(features)};
    LOG_DEBUG(<< cast.print());

    BOOST_REQUIRE_EQUAL(space::print(sgdParameterization()), space::print(cast.parameters()));
    BOOST_TEST_REQUIRE(cast.fullParameterization().has_value());
    BOOST_REQUIRE_EQUAL(space::print(fullParameterization()),
                        space::print(*cast.fullParameterization()));
    BOOST_REQUIRE_EQUAL(7, *cast.trialIndex());

    space::CObservationFeatures flattened{searchSpace.flattenObservationFeatures(cast)};
    BOOST_REQUIRE_EQUAL(space::print(fullParameterization()),
                        space::print(flattened.parameters()));
    BOOST_REQUIRE_EQUAL(7, *flattened.trialIndex());

    // Current values take precedence over the recorded ones.
    TParameterization changed{cast.parameters()};
    changed["lr"] = TValue{0.02};
    cast.parameters(changed);
    flattened = searchSpace.flattenObservationFeatures(cast);
    BOOST_REQUIRE_EQUAL(TValue{0.02}, flattened.parameters().at("lr"));
    BOOST_REQUIRE_EQUAL(TValue{3}, flattened.parameters().at("depth"));

    space::CObservationFeatures empty;
    BOOST_TEST_REQUIRE((searchSpace.flattenObservationFeatures(empty, true) == empty));
}

BOOST_AUTO_TEST_CASE(testInjectDummyValues) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};

    space::CObservationFeatures features{TParameterization{{"model", TValue{"B"}}, {"depth", TValue{2}}}};

    // Without injection nothing can be restored.
    BOOST_REQUIRE_EQUAL("{'depth': 2, 'model': 'B'}",
                        space::print(searchSpace.flattenObservationFeatures(features).parameters()));

    space::CObservationFeatures midpoints{searchSpace.flattenObservationFeatures(features, true)};
    BOOST_REQUIRE_EQUAL(5, midpoints.parameters().size());
    BOOST_REQUIRE_EQUAL(TValue{"B"}, midpoints.parameters().at("model"));
    BOOST_REQUIRE_EQUAL(TValue{2}, midpoints.parameters().at("depth"));
    BOOST_REQUIRE_EQUAL(TValue{"adam"}, midpoints.parameters().at("optimizer"));
    BOOST_REQUIRE_CLOSE_FRACTION(0.055, midpoints.parameters().at("lr").asDouble(), 1e-12);
    BOOST_REQUIRE_CLOSE_FRACTION(0.895, midpoints.parameters().at("beta").asDouble(), 1e-12);

    searchSpace.seed(42);
    for (std::size_t i = 0; i < 20; ++i) {
        space::CObservationFeatures random{searchSpace.flattenObservationFeatures(features, true, true)};
        BOOST_REQUIRE_EQUAL(5, random.parameters().size());
        BOOST_REQUIRE_EQUAL(TValue{2}, random.parameters().at("depth"));
        for (const auto& value : random.parameters()) {
            BOOST_TEST_REQUIRE(searchSpace.parameter(value.first).validate(value.second));
        }
    }
}

BOOST_AUTO_TEST_CASE(testUnsupportedMutation) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};

    BOOST_REQUIRE_THROW(searchSpace.addParameter(leaf("extra")), space::CUnsupportedError);
    BOOST_REQUIRE_EQUAL(5, searchSpace.numberParameters());

    searchSpace.updateParameter(space::CParameter::createRange("lr", space::E_Float, 0.01, 0.2));
    BOOST_REQUIRE_EQUAL(0.2, searchSpace.parameter("lr").range().s_Upper);

    BOOST_REQUIRE_THROW(searchSpace.updateParameter(choice(
                            "optimizer", TValueVec{TValue{"sgd"}, TValue{"adam"}}, {})),
                        space::CUnsupportedError);
    BOOST_REQUIRE_THROW(searchSpace.updateParameter(leaf("extra")), space::CDefinitionError);
}

BOOST_AUTO_TEST_CASE(testFlattenAndClone) {
    space::CHierarchicalSearchSpace searchSpace{modelParameters()};

    auto flat = searchSpace.flatten();
    BOOST_TEST_REQUIRE(flat->isHierarchical() == false);
    BOOST_REQUIRE_EQUAL(5, flat->numberParameters());
    BOOST_TEST_REQUIRE(flat->checkMembership(fullParameterization()));
    BOOST_TEST_REQUIRE(flat->checkMembership(sgdParameterization()) == false);

    auto clone = searchSpace.clone();
    BOOST_TEST_REQUIRE(clone->isHierarchical());
    BOOST_REQUIRE_EQUAL(searchSpace.print(), clone->print());

    std::string print{searchSpace.print()};
    LOG_DEBUG(<< print);
    BOOST_REQUIRE_EQUAL(0, print.find("HierarchicalSearchSpace(parameters=[Choice(name='model'"));
    BOOST_REQUIRE_EQUAL(print.size() - 13, print.find(", root=model)"));
}

BOOST_AUTO_TEST_SUITE_END()
