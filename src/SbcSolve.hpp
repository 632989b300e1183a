// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcSolve_H
#define SbcSolve_H

#include <vector>

#include "SbcModel.hpp"

/** Result of sbcSolve.

  lowerBound is the best possible objective and upperBound the objective
  of solution (COIN_DBL_MAX if no solution was found). If abandoned is
  not zero status optimal only means the search finished with a solution;
  lowerBound then includes the bounds of the abandoned nodes.
*/
struct SbcResult {
  SbcModel::Status status;
  double objective;
  std::vector< double > solution;
  double lowerBound;
  double upperBound;
  int nodes;
  int abandoned;
  SbcResult();
};

/** Solve min cx, Ax >= b, x >= 0, x_j integer for j in \p integers.

  \p model is cloned. If \p handler is given messages go there, otherwise
  to a default handler at the settings' log level. Throws CoinError if the
  problem is not of the required form.
*/
SbcResult sbcSolve(const OsiSolverInterface &model, const std::vector< int > &integers,
  const SbcSettings &settings, CoinMessageHandler *handler = NULL);

/// As above, integer variables taken from model
SbcResult sbcSolve(const OsiSolverInterface &model, const SbcSettings &settings,
  CoinMessageHandler *handler = NULL);

/// Name of status for printing
const char *sbcStatusName(SbcModel::Status status);

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
