// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcGomoryCuts_H
#define SbcGomoryCuts_H

#include <vector>

#include "CglCutGenerator.hpp"

class CoinMessageHandler;
class CoinMessages;
class CoinWarmStartBasis;

/** Gomory mixed integer cuts with right hand side strengthening.

  Works on an optimal relaxation whose rows are Ax >= b and whose variables
  are non-negative. For every row of the tableau with an integer basic
  variable at a fractional value a cut pi x >= pi0 is derived:

  - the tableau row is read with getBInvARow and rescaled so that its
    logical part refers to the surplus s = Ax - b whatever sign convention
    the solver uses for logicals;
  - nonbasic structurals are shifted to the bound they sit at, and
    complemented when at upper bound;
  - the mixed integer rounding formula is applied, surplus variables
    being treated as continuous;
  - bounds are shifted back and surpluses substituted out.

  If the cut optimization node limit is positive the right hand side is
  then raised to the bound proved by a small branch and bound on
  min pi x over the relaxation with integrality. A cut that the
  sub-search shows to cut off an integer point is dropped.
*/
class SbcGomoryCuts : public CglCutGenerator {

public:
  /**@name Generate Cuts */
  //@{
  /** Generate cuts for the model data contained in si.
      The generated cuts are inserted into and returned in the
      collection of cuts cs. */
  virtual void generateCuts(const OsiSolverInterface &si, OsiCuts &cs,
    const CglTreeInfo info = CglTreeInfo()) const;

  /** Raw cut from one tableau row. Returns false if the row gives no cut
      (basic not integer or not fractional, nonbasic not at bound, bad
      numbers). Factorization must be enabled. */
  bool deriveCut(const OsiSolverInterface &si, const CoinWarmStartBasis &basis,
    int iRow, const int *basics, std::vector< double > &pi, double &pi0) const;

  /** Strengthen pi0 by a nested search over the relaxation in \p si.
      Returns false if the nested search finds an integer point violating
      the cut. */
  bool strengthenCut(const OsiSolverInterface &si, const std::vector< double > &pi,
    double &pi0) const;
  //@}

  /**@name Get and set */
  //@{
  /// Nodes for the strengthening search (0 switches off)
  inline int cutOptimizationNodeLimit() const
  {
    return cutOptimizationNodeLimit_;
  }
  inline void setCutOptimizationNodeLimit(int value)
  {
    cutOptimizationNodeLimit_ = value;
  }
  /// Only rows whose basic is at least this far from integer
  inline double getAway() const
  {
    return away_;
  }
  void setAway(double value);
  /// Integer tolerance of the nested search
  inline void setIntegerTolerance(double value)
  {
    integerTolerance_ = value;
  }
  /// Message handler for warnings (not owned, may be NULL)
  void passInMessageHandler(CoinMessageHandler *handler, const CoinMessages *messages);
  /// Cuts dropped as invalid
  inline int numberInvalid() const
  {
    return numberInvalid_;
  }
  /// Cuts whose right hand side was raised
  inline int numberStrengthened() const
  {
    return numberStrengthened_;
  }
  //@}

  /**@name Constructors and destructors */
  //@{
  /// Default constructor
  SbcGomoryCuts();

  /// Copy constructor
  SbcGomoryCuts(const SbcGomoryCuts &);

  /// Clone
  virtual CglCutGenerator *clone() const;

  /// Assignment operator
  SbcGomoryCuts &operator=(const SbcGomoryCuts &rhs);

  /// Destructor
  virtual ~SbcGomoryCuts();
  //@}

  virtual bool needsOptimalBasis() const
  {
    return true;
  }

private:
  /// Minimum fractionality of basic
  double away_;
  /// Integer tolerance for nested search
  double integerTolerance_;
  /// Node limit for nested search
  int cutOptimizationNodeLimit_;
  /// Message handler (not owned)
  CoinMessageHandler *handler_;
  /// Messages (not owned)
  const CoinMessages *messages_;
  /// Counts
  mutable int numberInvalid_;
  mutable int numberStrengthened_;
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
