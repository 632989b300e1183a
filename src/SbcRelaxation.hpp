// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcRelaxation_H
#define SbcRelaxation_H

#include <string>

#include "CoinError.hpp"

class OsiSolverInterface;
class CoinWarmStart;

/** Numerical breakdown in the relaxation solver.

  Thrown when the solver abandons (singular basis, loss of feasibility in
  the factorization) or itself throws. Kept separate from CoinError so that
  a search can abandon just the affected node.
*/
class SbcNumericalError : public CoinError {
public:
  SbcNumericalError(const std::string &message, const std::string &methodName,
    const std::string &className)
    : CoinError(message, methodName, className)
  {
  }
  virtual ~SbcNumericalError() {}
};

/** Linear relaxation of one node.

  Owns a clone of an OsiSolverInterface. All solves go through solve() so
  that warm starting, iteration caps and status mapping are done in one
  place.
*/
class SbcRelaxation {

public:
  /// Outcome of a solve
  enum Status {
    optimal = 0,
    infeasible,
    unbounded,
    iterationLimit
  };

  /// Constructor - clones solver
  SbcRelaxation(const OsiSolverInterface &solver);
  /// Copy constructor - clones solver
  SbcRelaxation(const SbcRelaxation &rhs);
  /// Assignment operator
  SbcRelaxation &operator=(const SbcRelaxation &rhs);
  /// Destructor
  ~SbcRelaxation();

  /** Solve the relaxation.

    If \p warmStart is given it is loaded first and the problem is
    resolved, otherwise the first solve is an initialSolve and later ones
    resolve from the solver's current basis. A positive
    \p maximumIterations caps the simplex for this call only; reaching the
    cap is then reported as #iterationLimit. Throws SbcNumericalError if the
    solver abandons.
  */
  Status solve(const CoinWarmStart *warmStart = NULL, int maximumIterations = -1);

  /// The solver (owned)
  inline OsiSolverInterface *solver() const
  {
    return solver_;
  }
  /// Simplex iterations taken by the last solve
  inline int numberIterations() const
  {
    return numberIterations_;
  }
  /// Basis of the last solve (caller owns)
  CoinWarmStart *getWarmStart() const;

  /// Name of a status for messages
  static const char *statusName(Status status);

private:
  /// Map solver status after a solve
  Status checkStatus(bool capped) const;

  /// Solver
  OsiSolverInterface *solver_;
  /// Iterations in last solve
  int numberIterations_;
  /// True once solver has a basis to resolve from
  bool solved_;
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
