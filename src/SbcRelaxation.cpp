// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include "OsiSolverInterface.hpp"
#include "CoinWarmStart.hpp"
#include "SbcRelaxation.hpp"

SbcRelaxation::SbcRelaxation(const OsiSolverInterface &solver)
  : solver_(solver.clone())
  , numberIterations_(0)
  , solved_(false)
{
}

SbcRelaxation::SbcRelaxation(const SbcRelaxation &rhs)
  : solver_(rhs.solver_->clone())
  , numberIterations_(0)
  , solved_(rhs.solved_)
{
}

SbcRelaxation &
SbcRelaxation::operator=(const SbcRelaxation &rhs)
{
  if (this != &rhs) {
    delete solver_;
    solver_ = rhs.solver_->clone();
    numberIterations_ = rhs.numberIterations_;
    solved_ = rhs.solved_;
  }
  return *this;
}

SbcRelaxation::~SbcRelaxation()
{
  delete solver_;
}

SbcRelaxation::Status
SbcRelaxation::solve(const CoinWarmStart *warmStart, int maximumIterations)
{
  bool capped = maximumIterations > 0;
  int saveMaximumIterations = 0;
  if (capped) {
    solver_->getIntParam(OsiMaxNumIteration, saveMaximumIterations);
    solver_->setIntParam(OsiMaxNumIteration, maximumIterations);
  }
  try {
    if (warmStart) {
      if (!solver_->setWarmStart(warmStart))
        throw SbcNumericalError("warm start rejected by solver", "solve", "SbcRelaxation");
      solver_->resolve();
    } else if (solved_) {
      solver_->resolve();
    } else {
      solver_->initialSolve();
    }
  } catch (SbcNumericalError &) {
    if (capped)
      solver_->setIntParam(OsiMaxNumIteration, saveMaximumIterations);
    throw;
  } catch (CoinError &e) {
    if (capped)
      solver_->setIntParam(OsiMaxNumIteration, saveMaximumIterations);
    throw SbcNumericalError(e.className() + "::" + e.methodName() + " - " + e.message(),
      "solve", "SbcRelaxation");
  }
  if (capped)
    solver_->setIntParam(OsiMaxNumIteration, saveMaximumIterations);
  solved_ = true;
  numberIterations_ = solver_->getIterationCount();
  return checkStatus(capped);
}

SbcRelaxation::Status
SbcRelaxation::checkStatus(bool capped) const
{
  if (solver_->isAbandoned())
    throw SbcNumericalError("solver abandoned", "solve", "SbcRelaxation");
  if (solver_->isProvenOptimal())
    return optimal;
  if (solver_->isProvenPrimalInfeasible())
    return infeasible;
  if (solver_->isProvenDualInfeasible())
    return unbounded;
  if (solver_->isIterationLimitReached()) {
    if (capped)
      return iterationLimit;
    throw SbcNumericalError("iteration limit reached without a cap", "solve", "SbcRelaxation");
  }
  throw SbcNumericalError("solver returned no usable status", "solve", "SbcRelaxation");
}

CoinWarmStart *
SbcRelaxation::getWarmStart() const
{
  return solver_->getWarmStart();
}

const char *
SbcRelaxation::statusName(Status status)
{
  switch (status) {
  case optimal:
    return "optimal";
  case infeasible:
    return "infeasible";
  case unbounded:
    return "unbounded";
  case iterationLimit:
    return "iteration limit";
  }
  return "unknown";
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
