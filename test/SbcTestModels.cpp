// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include "CoinPragma.hpp"
#include "CoinFinite.hpp"
#include "CoinPackedMatrix.hpp"
#include "OsiClpSolverInterface.hpp"
#include "SbcTestModels.hpp"

namespace {

/*
  Rows are given as ordered triples. All rows are >= with no upper bound and
  all columns are in [0,infinity).
*/
void loadModel(OsiClpSolverInterface &solver, int numberRows, int numberColumns,
  const double *objective, int numberElements, const int *rowIndices,
  const int *colIndices, const double *elements, const double *rowLower)
{
  CoinPackedMatrix matrix(true, rowIndices, colIndices, elements, numberElements);
  // columns without elements
  matrix.setDimensions(numberRows, numberColumns);
  std::vector< double > columnLower(numberColumns, 0.0);
  std::vector< double > columnUpper(numberColumns, COIN_DBL_MAX);
  std::vector< double > rowUpper(numberRows, COIN_DBL_MAX);
  solver.loadProblem(matrix, &columnLower[0], &columnUpper[0], objective,
    rowLower, &rowUpper[0]);
  solver.messageHandler()->setLogLevel(0);
}

} // end file-local namespace

void loadNoBranch(OsiClpSolverInterface &solver, std::vector< int > &integers)
{
  double objective[3] = { -1.0, -1.0, 1.0 };
  int rowIndices[2] = { 0, 1 };
  int colIndices[2] = { 0, 1 };
  double elements[2] = { -1.0, -1.0 };
  double rowLower[2] = { -1.0, -1.0 };
  loadModel(solver, 2, 3, objective, 2, rowIndices, colIndices, elements, rowLower);
  integers.clear();
  integers.push_back(0);
  integers.push_back(1);
  integers.push_back(2);
}

void loadSmallBranch(OsiClpSolverInterface &solver, std::vector< int > &integers)
{
  double objective[3] = { 1.0, -1.0, -1.0 };
  int rowIndices[5] = { 0, 1, 2, 2, 2 };
  int colIndices[5] = { 1, 2, 0, 1, 2 };
  double elements[5] = { -4.0, -2.0, 1.0, 1.0, 1.0 };
  double rowLower[3] = { -5.0, -3.0, 1.0 };
  loadModel(solver, 3, 3, objective, 5, rowIndices, colIndices, elements, rowLower);
  integers.clear();
  integers.push_back(1);
  integers.push_back(2);
}

void loadInfeasible(OsiClpSolverInterface &solver, std::vector< int > &integers)
{
  double objective[1] = { 1.0 };
  int rowIndices[2] = { 0, 1 };
  int colIndices[2] = { 0, 0 };
  double elements[2] = { 1.0, -1.0 };
  double rowLower[2] = { 2.0, -1.0 };
  loadModel(solver, 2, 1, objective, 2, rowIndices, colIndices, elements, rowLower);
  integers.clear();
  integers.push_back(0);
}

void loadUnbounded(OsiClpSolverInterface &solver, std::vector< int > &integers)
{
  double objective[1] = { -1.0 };
  int rowIndices[1] = { 0 };
  int colIndices[1] = { 0 };
  double elements[1] = { 1.0 };
  double rowLower[1] = { 0.0 };
  loadModel(solver, 1, 1, objective, 1, rowIndices, colIndices, elements, rowLower);
  integers.clear();
  integers.push_back(0);
}

void loadWolsey(OsiClpSolverInterface &solver, std::vector< int > &integers)
{
  double objective[2] = { -4.0, 1.0 };
  int rowIndices[5] = { 0, 2, 0, 1, 2 };
  int colIndices[5] = { 0, 0, 1, 1, 1 };
  double elements[5] = { -7.0, -2.0, 2.0, -1.0, 2.0 };
  double rowLower[3] = { -14.0, -3.0, -3.0 };
  loadModel(solver, 3, 2, objective, 5, rowIndices, colIndices, elements, rowLower);
  integers.clear();
  integers.push_back(0);
  integers.push_back(1);
}

void loadKnapsack(OsiClpSolverInterface &solver, std::vector< int > &integers)
{
  double objective[2] = { -8.0, -5.0 };
  int rowIndices[4] = { 0, 1, 0, 1 };
  int colIndices[4] = { 0, 0, 1, 1 };
  double elements[4] = { -1.0, -9.0, -1.0, -5.0 };
  double rowLower[2] = { -6.0, -45.0 };
  loadModel(solver, 2, 2, objective, 4, rowIndices, colIndices, elements, rowLower);
  integers.clear();
  integers.push_back(0);
  integers.push_back(1);
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
