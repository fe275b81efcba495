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

#include <space/CSearchSpaceDigest.h>

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>

#include <space/CParameterDistribution.h>
#include <space/CRobustSearchSpace.h>
#include <space/CSearchSpace.h>
#include <space/CSearchSpaceErrors.h>

#include <algorithm>
#include <cstdint>

namespace xp {
namespace space {
namespace {
using TSizeVec = std::vector<std::size_t>;
using TDenseMatrix = SRobustSearchSpaceDigest::TDenseMatrix;

//! A distribution and the columns its samples are written to.
struct SColumnDistribution {
    CParameterDistribution s_Distribution;
    TSizeVec s_Columns;
};
using TColumnDistributionVec = std::vector<SColumnDistribution>;

//! Draw \p numSamples samples from every distribution into a matrix with
//! \p numColumns columns whose other entries are \p fill.
TDenseMatrix sample(maths::CPRNG::CXorOShiro128Plus& rng,
                    const TColumnDistributionVec& distributions,
                    std::size_t numSamples,
                    std::size_t numColumns,
                    double fill) {
    TDenseMatrix result{TDenseMatrix::TBase::Constant(static_cast<Eigen::Index>(numSamples),
                                                      static_cast<Eigen::Index>(numColumns), fill)};
    for (const auto& distribution : distributions) {
        TDenseMatrix samples{distribution.s_Distribution.sample(rng, numSamples)};
        for (std::size_t j = 0; j < distribution.s_Columns.size(); ++j) {
            result.col(static_cast<Eigen::Index>(distribution.s_Columns[j])) =
                samples.col(static_cast<Eigen::Index>(j));
        }
    }
    return result;
}
}

SRobustSearchSpaceDigest::SRobustSearchSpaceDigest(TSampler sampleParameterPerturbations,
                                                   TSampler sampleEnvironmental,
                                                   TStrVec environmentalVariables,
                                                   bool multiplicative)
    : s_SampleParameterPerturbations{std::move(sampleParameterPerturbations)},
      s_SampleEnvironmental{std::move(sampleEnvironmental)},
      s_EnvironmentalVariables{std::move(environmentalVariables)}, s_Multiplicative{multiplicative} {
    if (s_SampleParameterPerturbations == nullptr && s_SampleEnvironmental == nullptr) {
        throw CDefinitionError{"A robust search space digest must be initialized with at "
                               "least one of a perturbation and an environmental sampler"};
    }
}

SSearchSpaceDigest
CSearchSpaceDigestExtractor::extract(const CSearchSpace& space,
                                     const maths::CPRNG::CXorOShiro128Plus& rng) {
    return extract(space, space.parameterNames(), rng);
}

SSearchSpaceDigest
CSearchSpaceDigestExtractor::extract(const CSearchSpace& space,
                                     const TStrVec& names,
                                     const maths::CPRNG::CXorOShiro128Plus& rng) {
    SSearchSpaceDigest result;
    result.s_FeatureNames = names;
    result.s_Bounds.reserve(names.size());

    for (std::size_t i = 0; i < names.size(); ++i) {
        const CParameter& parameter{space.parameter(names[i])};
        switch (parameter.kind()) {
        case CParameter::E_Choice: {
            const SChoiceDomain& choice{parameter.choice()};
            if (choice.s_IsTask) {
                result.s_TaskFeatures.push_back(i);
                if (parameter.targetValue().isNumeric()) {
                    result.s_TargetValues[i] = parameter.targetValue().asDouble();
                }
            } else if (choice.s_IsOrdered) {
                result.s_OrdinalFeatures.push_back(i);
            } else {
                result.s_CategoricalFeatures.push_back(i);
            }
            SSearchSpaceDigest::TDoubleVec values;
            values.reserve(choice.s_Values.size());
            for (const auto& value : choice.s_Values) {
                if (value.isNumeric() == false) {
                    throw CUnsupportedError{"Choice parameter '" + parameter.name() +
                                            "' has non-numeric value " + value.print()};
                }
                values.push_back(value.asDouble());
            }
            result.s_Bounds.emplace_back(*std::min_element(values.begin(), values.end()),
                                         *std::max_element(values.begin(), values.end()));
            result.s_DiscreteChoices[i] = std::move(values);
            break;
        }
        case CParameter::E_Range: {
            const SRangeDomain& range{parameter.range()};
            if (range.s_LogScale) {
                throw CUnsupportedError{parameter.print() + " is log scale"};
            }
            if (parameter.parameterType() == E_Int) {
                result.s_OrdinalFeatures.push_back(i);
                SSearchSpaceDigest::TDoubleVec values;
                // Integer bounds are checked to fit in an int64 on creation.
                auto lower = static_cast<std::int64_t>(range.s_Lower);
                auto upper = static_cast<std::int64_t>(range.s_Upper);
                for (auto x = lower; x <= upper; ++x) {
                    values.push_back(static_cast<double>(x));
                }
                result.s_DiscreteChoices[i] = std::move(values);
            }
            result.s_Bounds.emplace_back(range.s_Lower, range.s_Upper);
            break;
        }
        case CParameter::E_Fixed:
            throw CUnsupportedError{"Fixed parameter '" + parameter.name() +
                                    "' can't be part of a search space digest"};
        }

        if (parameter.isFidelity()) {
            if (parameter.targetValue().isNumeric() == false) {
                throw CUnsupportedError{"Only numerical target values are supported, '" +
                                        parameter.name() + "' has target " +
                                        parameter.targetValue().print()};
            }
            result.s_TargetValues[i] = parameter.targetValue().asDouble();
            result.s_FidelityFeatures.push_back(i);
        }
    }

    result.s_RobustDigest = extractRobust(space, names, rng);
    LOG_TRACE(<< "Extracted digest for " << core::CContainerPrinter::print(names));
    return result;
}

CSearchSpaceDigestExtractor::TOptionalRobustDigest
CSearchSpaceDigestExtractor::extractRobust(const CSearchSpace& space,
                                           const TStrVec& names,
                                           const maths::CPRNG::CXorOShiro128Plus& rng) {
    const auto* robust = dynamic_cast<const CRobustSearchSpace*>(&space);
    if (robust == nullptr) {
        return {};
    }

    auto indexOf = [&names](const std::string& name) {
        auto i = std::find(names.begin(), names.end(), name);
        if (i == names.end()) {
            throw CDefinitionError{"All distributional parameters must be included in "
                                   "the feature names, '" +
                                   name + "' is missing"};
        }
        return static_cast<std::size_t>(i - names.begin());
    };

    const TStrVec& environmentalVariables{robust->environmentalVariables()};
    std::size_t numberEnvironmental{environmentalVariables.size()};
    if (numberEnvironmental > names.size()) {
        throw CDefinitionError{"There are more environmental variables than feature names"};
    }
    std::size_t numberOrdinary{names.size() - numberEnvironmental};
    for (std::size_t i = 0; i < numberEnvironmental; ++i) {
        if (names[numberOrdinary + i] != environmentalVariables[i]) {
            throw CDefinitionError{"Environmental variables " +
                                   core::CContainerPrinter::print(environmentalVariables) +
                                   " must be the last feature names in order, got " +
                                   core::CContainerPrinter::print(names)};
        }
    }

    TColumnDistributionVec environmental;
    for (const auto& distribution : robust->environmentalDistributions()) {
        SColumnDistribution columns{distribution, {}};
        for (const auto& name : distribution.parameters()) {
            columns.s_Columns.push_back(indexOf(name) - numberOrdinary);
        }
        environmental.push_back(std::move(columns));
    }
    TColumnDistributionVec perturbations;
    for (const auto& distribution : robust->perturbationDistributions()) {
        SColumnDistribution columns{distribution, {}};
        for (const auto& name : distribution.parameters()) {
            columns.s_Columns.push_back(indexOf(name));
        }
        perturbations.push_back(std::move(columns));
    }

    std::size_t numSamples{robust->numSamples()};
    bool multiplicative{robust->multiplicative()};

    SRobustSearchSpaceDigest::TSampler sampleEnvironmental;
    if (environmental.empty() == false) {
        maths::CPRNG::CXorOShiro128Plus environmentalRng{rng};
        sampleEnvironmental = [environmental, numSamples, numberEnvironmental,
                               environmentalRng]() mutable {
            return sample(environmentalRng, environmental, numSamples, numberEnvironmental, 0.0);
        };
    }
    SRobustSearchSpaceDigest::TSampler samplePerturbations;
    if (perturbations.empty() == false) {
        maths::CPRNG::CXorOShiro128Plus perturbationRng{rng};
        perturbationRng.jump();
        double fill{multiplicative ? 1.0 : 0.0};
        samplePerturbations = [perturbations, numSamples, numberOrdinary, fill,
                               perturbationRng]() mutable {
            return sample(perturbationRng, perturbations, numSamples, numberOrdinary, fill);
        };
    }

    return SRobustSearchSpaceDigest{std::move(samplePerturbations), std::move(sampleEnvironmental),
                                    environmentalVariables, multiplicative};
}
}
}
