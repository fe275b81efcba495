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

#include <space/CParameterDistribution.h>

#include <core/CContainerPrinter.h>

#include <maths/CSampling.h>
#include <maths/CTools.h>

#include <space/CParameterValue.h>
#include <space/CSearchSpaceErrors.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace xp {
namespace space {
namespace {
using TDoubleVec = std::vector<double>;

std::string printNumber(double x) {
    return CParameterValue{x}.print();
}

//! Fills one column of samples per visit.
class CSampleVisitor : public boost::static_visitor<void> {
public:
    CSampleVisitor(maths::CPRNG::CXorOShiro128Plus& rng, std::size_t n, TDoubleVec& samples)
        : m_Rng{rng}, m_N{n}, m_Samples{samples} {}

    void operator()(const SNormalDistribution& normal) const {
        maths::CSampling::normalSample(m_Rng, normal.s_Mean,
                                       maths::CTools::pow2(normal.s_StandardDeviation),
                                       m_N, m_Samples);
    }
    void operator()(const SUniformDistribution& uniform) const {
        maths::CSampling::uniformSample(m_Rng, uniform.s_A, uniform.s_B, m_N, m_Samples);
    }

private:
    maths::CPRNG::CXorOShiro128Plus& m_Rng;
    std::size_t m_N;
    TDoubleVec& m_Samples;
};

class CPrintVisitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(const SNormalDistribution& normal) const {
        return "norm(loc=" + printNumber(normal.s_Mean) +
               ", scale=" + printNumber(normal.s_StandardDeviation) + ")";
    }
    std::string operator()(const SUniformDistribution& uniform) const {
        return "uniform(a=" + printNumber(uniform.s_A) + ", b=" + printNumber(uniform.s_B) + ")";
    }
};

class CCheckVisitor : public boost::static_visitor<void> {
public:
    void operator()(const SNormalDistribution& normal) const {
        if (std::isfinite(normal.s_Mean) == false ||
            std::isfinite(normal.s_StandardDeviation) == false ||
            normal.s_StandardDeviation < 0.0) {
            throw CDefinitionError{"Invalid normal distribution mean " +
                                   printNumber(normal.s_Mean) + " and standard deviation " +
                                   printNumber(normal.s_StandardDeviation)};
        }
    }
    void operator()(const SUniformDistribution& uniform) const {
        if (std::isfinite(uniform.s_A) == false || std::isfinite(uniform.s_B) == false ||
            uniform.s_A > uniform.s_B) {
            throw CDefinitionError{"Invalid uniform distribution support [" +
                                   printNumber(uniform.s_A) + ", " +
                                   printNumber(uniform.s_B) + "]"};
        }
    }
};
}

CParameterDistribution::CParameterDistribution(TStrVec parameters,
                                               TDistribution distribution,
                                               bool multiplicative)
    : m_Parameters{std::move(parameters)}, m_Distribution{std::move(distribution)},
      m_Multiplicative{multiplicative} {
    if (m_Parameters.empty()) {
        throw CDefinitionError{"A parameter distribution must have at least one parameter"};
    }
    TStrVec names{m_Parameters};
    std::sort(names.begin(), names.end());
    if (std::adjacent_find(names.begin(), names.end()) != names.end()) {
        throw CDefinitionError{"Parameter distribution " + this->print() +
                               " lists a parameter more than once"};
    }
    boost::apply_visitor(CCheckVisitor{}, m_Distribution);
}

CParameterDistribution::TDenseMatrix
CParameterDistribution::sample(maths::CPRNG::CXorOShiro128Plus& rng, std::size_t n) const {
    TDenseMatrix result(static_cast<Eigen::Index>(n),
                        static_cast<Eigen::Index>(m_Parameters.size()));
    TDoubleVec samples;
    for (std::size_t j = 0; j < m_Parameters.size(); ++j) {
        boost::apply_visitor(CSampleVisitor{rng, n, samples}, m_Distribution);
        for (std::size_t i = 0; i < n; ++i) {
            result(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = samples[i];
        }
    }
    return result;
}

bool CParameterDistribution::operator==(const CParameterDistribution& rhs) const {
    return m_Parameters == rhs.m_Parameters && m_Distribution == rhs.m_Distribution &&
           m_Multiplicative == rhs.m_Multiplicative;
}

std::string CParameterDistribution::print() const {
    return "ParameterDistribution(parameters=" + core::CContainerPrinter::print(m_Parameters) +
           ", distribution=" + boost::apply_visitor(CPrintVisitor{}, m_Distribution) +
           ", multiplicative=" + (m_Multiplicative ? "True" : "False") + ")";
}
}
}
