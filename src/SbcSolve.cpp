// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include "CoinFinite.hpp"
#include "OsiSolverInterface.hpp"
#include "SbcSolve.hpp"

SbcResult::SbcResult()
  : status(SbcModel::notStarted)
  , objective(COIN_DBL_MAX)
  , lowerBound(-COIN_DBL_MAX)
  , upperBound(COIN_DBL_MAX)
  , nodes(0)
  , abandoned(0)
{
}

namespace {

SbcResult solveModel(SbcModel &model, const SbcSettings &settings,
  CoinMessageHandler *handler)
{
  model.setSettings(settings);
  if (handler)
    model.passInMessageHandler(handler);
  model.branchAndBound();
  SbcResult result;
  result.status = model.status();
  result.objective = model.getObjValue();
  result.upperBound = model.getObjValue();
  result.lowerBound = model.getBestPossibleObjective();
  if (model.bestSolution()) {
    int numberColumns = model.solver()->getNumCols();
    result.solution.assign(model.bestSolution(), model.bestSolution() + numberColumns);
  }
  result.nodes = model.getNodeCount();
  result.abandoned = model.numberAbandoned();
  return result;
}

} // end file-local namespace

SbcResult sbcSolve(const OsiSolverInterface &model, const std::vector< int > &integers,
  const SbcSettings &settings, CoinMessageHandler *handler)
{
  SbcModel sbcModel(model, integers);
  return solveModel(sbcModel, settings, handler);
}

SbcResult sbcSolve(const OsiSolverInterface &model, const SbcSettings &settings,
  CoinMessageHandler *handler)
{
  SbcModel sbcModel(model);
  return solveModel(sbcModel, settings, handler);
}

const char *sbcStatusName(SbcModel::Status status)
{
  switch (status) {
  case SbcModel::notStarted:
    return "not started";
  case SbcModel::optimal:
    return "optimal";
  case SbcModel::infeasible:
    return "infeasible";
  case SbcModel::unbounded:
    return "unbounded";
  case SbcModel::nodeLimitReached:
    return "node limit reached";
  case SbcModel::timeLimitReached:
    return "time limit reached";
  }
  return "unknown";
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
