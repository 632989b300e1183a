// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include <cmath>

#include "CoinHelperFunctions.hpp"
#include "CoinError.hpp"
#include "OsiSolverInterface.hpp"
#include "SbcPseudoCosts.hpp"

SbcPseudoCosts::SbcPseudoCosts()
{
}

void SbcPseudoCosts::initialize(const OsiSolverInterface &solver)
{
  int numberColumns = solver.getNumCols();
  const double *objective = solver.getObjCoefficients();
  initialCost_.resize(numberColumns);
  for (int iColumn = 0; iColumn < numberColumns; iColumn++)
    initialCost_[iColumn] = CoinMax(1.0e-5, fabs(objective[iColumn]));
  sumDownCost_.assign(numberColumns, 0.0);
  sumUpCost_.assign(numberColumns, 0.0);
  numberTimesDown_.assign(numberColumns, 0);
  numberTimesUp_.assign(numberColumns, 0);
}

double
SbcPseudoCosts::downPseudoCost(int iColumn) const
{
  if (numberTimesDown_[iColumn])
    return sumDownCost_[iColumn] / static_cast< double >(numberTimesDown_[iColumn]);
  else
    return initialCost_[iColumn];
}

double
SbcPseudoCosts::upPseudoCost(int iColumn) const
{
  if (numberTimesUp_[iColumn])
    return sumUpCost_[iColumn] / static_cast< double >(numberTimesUp_[iColumn]);
  else
    return initialCost_[iColumn];
}

void SbcPseudoCosts::setPseudoCosts(int iColumn, double downCost, double upCost)
{
  if (iColumn < 0 || iColumn >= numberColumns())
    throw CoinError("column out of range", "setPseudoCosts", "SbcPseudoCosts");
  sumDownCost_[iColumn] = downCost;
  numberTimesDown_[iColumn] = 1;
  sumUpCost_[iColumn] = upCost;
  numberTimesUp_[iColumn] = 1;
}

void SbcPseudoCosts::update(int iColumn, int way, double change, double degradation)
{
  if (iColumn < 0 || iColumn >= numberColumns())
    throw CoinError("column out of range", "update", "SbcPseudoCosts");
  if (change < 1.0e-12)
    return;
  // degradation can be slightly negative from round off
  double perUnit = CoinMax(0.0, degradation) / change;
  if (way < 0) {
    sumDownCost_[iColumn] += perUnit;
    numberTimesDown_[iColumn]++;
  } else {
    sumUpCost_[iColumn] += perUnit;
    numberTimesUp_[iColumn]++;
  }
}

double
SbcPseudoCosts::score(int iColumn, double value) const
{
  double below = value - floor(value);
  double above = 1.0 - below;
  return CoinMin(downPseudoCost(iColumn) * below, upPseudoCost(iColumn) * above);
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
