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

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>

#include <boost/test/unit_test.hpp>

#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

BOOST_AUTO_TEST_SUITE(CContainerPrinterTest)

using namespace xp;

namespace {
class CPrintable {
public:
    std::string print() const { return "printable"; }
};
}

BOOST_AUTO_TEST_CASE(testContainerPrinter) {

    std::vector<double> vec;
    BOOST_REQUIRE_EQUAL("[]", core::CContainerPrinter::print(vec));
    vec.push_back(1.1);
    vec.push_back(3.2);
    LOG_DEBUG(<< "vec = " << core::CContainerPrinter::print(vec));
    BOOST_REQUIRE_EQUAL("[1.1, 3.2]", core::CContainerPrinter::print(vec));

    std::list<std::pair<int, int>> list{{1, 2}, {2, 2}, {3, 2}};
    LOG_DEBUG(<< "list = " << core::CContainerPrinter::print(list));
    BOOST_REQUIRE_EQUAL("[(1, 2), (2, 2), (3, 2)]", core::CContainerPrinter::print(list));

    std::set<std::string> names{"momentum", "lr"};
    BOOST_REQUIRE_EQUAL("[lr, momentum]", core::CContainerPrinter::print(names));

    std::list<std::shared_ptr<double>> plist;
    plist.push_back(std::shared_ptr<double>());
    plist.push_back(std::make_shared<double>(3.0));
    plist.push_back(std::make_shared<double>(1.1));
    LOG_DEBUG(<< "plist = " << core::CContainerPrinter::print(plist));
    BOOST_REQUIRE_EQUAL("[\"null\", 3, 1.1]", core::CContainerPrinter::print(plist));

    double three = 3.0;
    double fivePointOne = 5.1;
    std::map<double, double*> map;
    map.emplace(1.1, &three);
    map.emplace(3.3, &fivePointOne);
    map.emplace(1.0, static_cast<double*>(nullptr));
    LOG_DEBUG(<< "map = " << core::CContainerPrinter::print(map));
    BOOST_REQUIRE_EQUAL("[(1, \"null\"), (1.1, 3), (3.3, 5.1)]",
                        core::CContainerPrinter::print(map));

    std::vector<std::unique_ptr<int>> pints;
    pints.push_back(std::make_unique<int>(2));
    pints.push_back(nullptr);
    BOOST_REQUIRE_EQUAL("[2, \"null\"]", core::CContainerPrinter::print(pints));

    std::vector<std::optional<double>> ovec{std::nullopt, 0.5};
    LOG_DEBUG(<< "ovec = " << core::CContainerPrinter::print(ovec));
    BOOST_REQUIRE_EQUAL("[\"null\", 0.5]", core::CContainerPrinter::print(ovec));

    std::vector<std::pair<std::list<std::pair<int, int>>, double>> aggregate;
    aggregate.emplace_back(list, 1.3);
    aggregate.emplace_back(std::list<std::pair<int, int>>(), 0.0);
    LOG_DEBUG(<< "aggregate = " << core::CContainerPrinter::print(aggregate));
    BOOST_REQUIRE_EQUAL("[([(1, 2), (2, 2), (3, 2)], 1.3), ([], 0)]",
                        core::CContainerPrinter::print(aggregate));

    std::vector<CPrintable> printables(3);
    BOOST_REQUIRE_EQUAL("[printable, printable, printable]",
                        core::CContainerPrinter::print(printables));
    const CPrintable* printable{&printables[0]};
    std::vector<const CPrintable*> pointers{printable, nullptr};
    BOOST_REQUIRE_EQUAL("[printable, \"null\"]", core::CContainerPrinter::print(pointers));
}

BOOST_AUTO_TEST_CASE(testPrintRange) {
    std::vector<std::string> names{"x1", "x2", "x3"};
    BOOST_REQUIRE_EQUAL("[x2, x3]",
                        core::CContainerPrinter::print(names.begin() + 1, names.end()));
    BOOST_REQUIRE_EQUAL("[]", core::CContainerPrinter::print(names.end(), names.end()));
}

BOOST_AUTO_TEST_SUITE_END()
