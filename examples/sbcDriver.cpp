// $Id$
// Copyright (C) 2005, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include <cstdio>
#include <cmath>
#include <string>
#include <vector>

#include "CoinPragma.hpp"
#include "CoinError.hpp"
#include "CoinPackedMatrix.hpp"
#include "CoinPackedVector.hpp"
#include "OsiClpSolverInterface.hpp"
#include "SbcSolve.hpp"

//#############################################################################

/************************************************************************

This main program reads in an integer model from an mps file, restates
it as

   minimize cx subject to Ax >= b, x >= 0

(<= rows are negated, equality and ranged rows become two rows, a
maximization has its objective negated) and solves it with Sbc.

Arguments after the file name are keyword=value settings, e.g.

   sbcDriver p0033.mps strategy=strong cuts=on maxNodes=1000

************************************************************************/

static void addRow(CoinPackedMatrix &matrix, std::vector< double > &rowLower,
  const CoinShallowPackedVector &row, double lower, double sign)
{
  int n = row.getNumElements();
  std::vector< double > elements(row.getElements(), row.getElements() + n);
  for (int j = 0; j < n; j++)
    elements[j] *= sign;
  matrix.appendRow(n, row.getIndices(), n ? &elements[0] : NULL);
  rowLower.push_back(lower);
}

// Returns number of columns with negative lower bound (0 if model usable)
static int greaterEqualForm(const OsiSolverInterface &original, OsiClpSolverInterface &model)
{
  int numberColumns = original.getNumCols();
  int numberRows = original.getNumRows();
  const double *columnLower = original.getColLower();
  const double *rowLower = original.getRowLower();
  const double *rowUpper = original.getRowUpper();
  double infinity = original.getInfinity();
  int numberBad = 0;
  for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
    if (columnLower[iColumn] < 0.0)
      numberBad++;
  }
  if (numberBad)
    return numberBad;
  const CoinPackedMatrix *rowCopy = original.getMatrixByRow();
  CoinPackedMatrix matrix(false, 0.0, 0.0);
  matrix.setDimensions(0, numberColumns);
  std::vector< double > lower;
  for (int iRow = 0; iRow < numberRows; iRow++) {
    const CoinShallowPackedVector row = rowCopy->getVector(iRow);
    if (rowLower[iRow] > -infinity)
      addRow(matrix, lower, row, rowLower[iRow], 1.0);
    if (rowUpper[iRow] < infinity)
      addRow(matrix, lower, row, -rowUpper[iRow], -1.0);
  }
  int numberNewRows = static_cast< int >(lower.size());
  std::vector< double > upper(numberNewRows, infinity);
  double sense = original.getObjSense();
  std::vector< double > objective(original.getObjCoefficients(),
    original.getObjCoefficients() + numberColumns);
  for (int iColumn = 0; iColumn < numberColumns; iColumn++)
    objective[iColumn] *= sense;
  model.loadProblem(matrix, columnLower, original.getColUpper(), &objective[0],
    numberNewRows ? &lower[0] : NULL, numberNewRows ? &upper[0] : NULL);
  for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
    if (original.isInteger(iColumn))
      model.setInteger(iColumn);
  }
  return 0;
}

int main(int argc, const char *argv[])
{
  if (argc < 2) {
    fprintf(stderr, "usage: %s file.mps [keyword=value ...]\n", argv[0]);
    return 1;
  }
  OsiClpSolverInterface solver1;
  int numMpsReadErrors = solver1.readMps(argv[1], "");
  if (numMpsReadErrors != 0) {
    printf("%d errors reading MPS file\n", numMpsReadErrors);
    return numMpsReadErrors;
  }
  SbcSettings settings;
  try {
    for (int i = 2; i < argc; i++) {
      if (!settings.setParameter(argv[i])) {
        fprintf(stderr, "expected keyword=value, got %s\n", argv[i]);
        return 1;
      }
    }
  } catch (CoinError &e) {
    e.print();
    return 1;
  }
  OsiClpSolverInterface model;
  int numberBad = greaterEqualForm(solver1, model);
  if (numberBad) {
    fprintf(stderr, "%d variables may be negative - not supported\n", numberBad);
    return 1;
  }
  // keep Clp quiet
  model.messageHandler()->setLogLevel(0);
  SbcResult result;
  try {
    result = sbcSolve(model, settings);
  } catch (CoinError &e) {
    e.print();
    return 1;
  }
  double sense = solver1.getObjSense();
  printf("Status %s after %d nodes (%d abandoned)\n", sbcStatusName(result.status),
    result.nodes, result.abandoned);
  if (result.solution.size()) {
    printf("Objective %g, best possible %g\n", sense * result.objective,
      sense * result.lowerBound);
    int numberColumns = model.getNumCols();
    for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
      double value = result.solution[iColumn];
      if (fabs(value) > 1.0e-7)
        printf("%d %s has value %g\n", iColumn, solver1.getColName(iColumn).c_str(), value);
    }
  }
  return 0;
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
