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
#ifndef INCLUDED_xp_space_CParameterConstraint_h
#define INCLUDED_xp_space_CParameterConstraint_h

#include <space/ImportExport.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace xp {
namespace space {
class CParameter;

//! \brief A linear inequality over numeric parameters.
//!
//! DESCRIPTION:\n
//! Represents \f$\sum_i w_i x_i \leq b\f$. There are three kinds:
//!   -# Linear: arbitrary weights keyed by parameter name.
//!   -# Order: \f$x_{lower} \leq x_{upper}\f$.
//!   -# Sum: \f$\sum_i x_i \leq b\f$ or \f$\sum_i x_i \geq b\f$.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Order and sum constraints refer to parameter definitions which they don't
//! own. A search space rebinds them to its own parameters when the constraint
//! is added so there is a single definition of each parameter. The referenced
//! parameters must outlive the constraint until then.
class SPACE_EXPORT CParameterConstraint {
public:
    using TStrVec = std::vector<std::string>;
    using TStrDoublePr = std::pair<std::string, double>;
    using TStrDoublePrVec = std::vector<TStrDoublePr>;
    using TStrDoubleMap = std::map<std::string, double>;
    using TParameterCPtrVec = std::vector<const CParameter*>;

    enum EKind { E_Linear, E_Order, E_Sum };

    //! Slack allowed when checking the inequality.
    static const double TOLERANCE;

public:
    //! Create a linear constraint \f$\sum_i w_i x_i \leq bound\f$.
    CParameterConstraint(TStrDoublePrVec weights, double bound);

    //! Create the constraint \p lower \f$\leq\f$ \p upper.
    static CParameterConstraint order(const CParameter& lower, const CParameter& upper);

    //! Create the constraint that the sum of \p parameters is at most \p bound
    //! if \p isUpperBound is true or at least \p bound otherwise.
    static CParameterConstraint
    sum(const TParameterCPtrVec& parameters, bool isUpperBound, double bound);

    EKind kind() const { return m_Kind; }

    //! Get the weights in declaration order.
    const TStrDoublePrVec& weights() const { return m_Weights; }

    //! Get the right hand side of the inequality.
    double bound() const { return m_Bound; }

    //! Check if a sum constraint bounds the sum from above.
    bool isUpperBound() const { return m_IsUpperBound; }

    //! Get the names of the constrained parameters.
    TStrVec parameterNames() const;

    //! Get the constrained parameter definitions.
    //!
    //! \note This is empty for linear constraints.
    const TParameterCPtrVec& parameters() const { return m_Parameters; }

    //! Point an order or sum constraint at \p parameters.
    //!
    //! \p parameters must have the same names in the same order as the current
    //! parameters. Throws CDefinitionError otherwise.
    void rebind(const TParameterCPtrVec& parameters);

    //! Check if \p values satisfy the constraint.
    //!
    //! The constraint doesn't apply, and so is satisfied, if any constrained
    //! parameter is missing from \p values.
    bool check(const TStrDoubleMap& values) const;

    bool operator==(const CParameterConstraint& rhs) const;
    bool operator!=(const CParameterConstraint& rhs) const {
        return (*this == rhs) == false;
    }

    std::string print() const;

private:
    CParameterConstraint(EKind kind,
                         TStrDoublePrVec weights,
                         double bound,
                         bool isUpperBound,
                         TParameterCPtrVec parameters);

private:
    EKind m_Kind;
    TStrDoublePrVec m_Weights;
    double m_Bound;
    bool m_IsUpperBound;
    TParameterCPtrVec m_Parameters;
};

using TParameterConstraintVec = std::vector<CParameterConstraint>;
}
}

#endif // INCLUDED_xp_space_CParameterConstraint_h
