// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#if defined(_MSC_VER)
// Turn off compiler warning about long names
#pragma warning(disable : 4786)
#endif

#include <cmath>

#include "CoinFinite.hpp"
#include "CoinHelperFunctions.hpp"
#include "CoinPackedMatrix.hpp"
#include "CoinPackedVector.hpp"
#include "CoinWarmStartBasis.hpp"
#include "CoinMessageHandler.hpp"
#include "OsiSolverInterface.hpp"
#include "OsiRowCut.hpp"
#include "SbcMessage.hpp"
#include "SbcSettings.hpp"
#include "SbcSolve.hpp"
#include "SbcGomoryCuts.hpp"

//-------------------------------------------------------------------
// Default Constructor
//-------------------------------------------------------------------
SbcGomoryCuts::SbcGomoryCuts()
  : CglCutGenerator()
  , away_(1.0e-4)
  , integerTolerance_(1.0e-7)
  , cutOptimizationNodeLimit_(10)
  , handler_(NULL)
  , messages_(NULL)
  , numberInvalid_(0)
  , numberStrengthened_(0)
{
}

//-------------------------------------------------------------------
// Copy constructor
//-------------------------------------------------------------------
SbcGomoryCuts::SbcGomoryCuts(const SbcGomoryCuts &rhs)
  : CglCutGenerator(rhs)
  , away_(rhs.away_)
  , integerTolerance_(rhs.integerTolerance_)
  , cutOptimizationNodeLimit_(rhs.cutOptimizationNodeLimit_)
  , handler_(rhs.handler_)
  , messages_(rhs.messages_)
  , numberInvalid_(0)
  , numberStrengthened_(0)
{
}

//-------------------------------------------------------------------
// Clone
//-------------------------------------------------------------------
CglCutGenerator *
SbcGomoryCuts::clone() const
{
  return new SbcGomoryCuts(*this);
}

//----------------------------------------------------------------
// Assignment operator
//-------------------------------------------------------------------
SbcGomoryCuts &
SbcGomoryCuts::operator=(const SbcGomoryCuts &rhs)
{
  if (this != &rhs) {
    CglCutGenerator::operator=(rhs);
    away_ = rhs.away_;
    integerTolerance_ = rhs.integerTolerance_;
    cutOptimizationNodeLimit_ = rhs.cutOptimizationNodeLimit_;
    handler_ = rhs.handler_;
    messages_ = rhs.messages_;
    numberInvalid_ = 0;
    numberStrengthened_ = 0;
  }
  return *this;
}

//-------------------------------------------------------------------
// Destructor
//-------------------------------------------------------------------
SbcGomoryCuts::~SbcGomoryCuts()
{
}

void SbcGomoryCuts::setAway(double value)
{
  if (value > 0.0 && value <= 0.5)
    away_ = value;
}

void SbcGomoryCuts::passInMessageHandler(CoinMessageHandler *handler,
  const CoinMessages *messages)
{
  handler_ = handler;
  messages_ = messages;
}

//-------------------------------------------------------------------
// Generate cuts
//-------------------------------------------------------------------
void SbcGomoryCuts::generateCuts(const OsiSolverInterface &si, OsiCuts &cs,
  const CglTreeInfo) const
{
  if (!si.isProvenOptimal())
    return;
  CoinWarmStart *warmStart = si.getWarmStart();
  CoinWarmStartBasis *basis = dynamic_cast< CoinWarmStartBasis * >(warmStart);
  if (!basis) {
    delete warmStart;
    return;
  }
  int numberRows = si.getNumRows();
  std::vector< int > basics(numberRows);
  std::vector< std::vector< double > > cutElements;
  std::vector< double > cutRhs;
  std::vector< double > pi;
  double pi0;
  si.enableFactorization();
  si.getBasics(&basics[0]);
  for (int iRow = 0; iRow < numberRows; iRow++) {
    if (deriveCut(si, *basis, iRow, &basics[0], pi, pi0)) {
      cutElements.push_back(pi);
      cutRhs.push_back(pi0);
    }
  }
  si.disableFactorization();
  delete warmStart;
  double infinity = si.getInfinity();
  for (size_t iCut = 0; iCut < cutRhs.size(); iCut++) {
    const std::vector< double > &element = cutElements[iCut];
    double rhs = cutRhs[iCut];
    if (cutOptimizationNodeLimit_ > 0 && !strengthenCut(si, element, rhs))
      continue;
    CoinPackedVector row;
    for (size_t j = 0; j < element.size(); j++) {
      if (element[j])
        row.insert(static_cast< int >(j), element[j]);
    }
    OsiRowCut rc;
    rc.setRow(row);
    rc.setLb(rhs);
    rc.setUb(infinity);
    cs.insert(rc);
  }
}

/*
  The tableau row is  x_k + sum z_j x_j + (logical part) = beta.
  With w the row of B inverse, z = wA and the solver's slack array is
  w times some factor depending on how it defines logicals. The factor is
  found from the basic column itself, as (slack A)_k = factor * z_k and
  z_k = 1. In terms of surpluses s = Ax - b >= 0 the row is then
  x_k + sum z_j x_j - sum w_i s_i = w b.
*/
bool SbcGomoryCuts::deriveCut(const OsiSolverInterface &si, const CoinWarmStartBasis &basis,
  int iRow, const int *basics, std::vector< double > &pi, double &pi0) const
{
  int numberColumns = si.getNumCols();
  int numberRows = si.getNumRows();
  int kColumn = basics[iRow];
  if (kColumn < 0 || kColumn >= numberColumns || !si.isInteger(kColumn))
    return false;
  const double *solution = si.getColSolution();
  double value = solution[kColumn];
  double f0 = value - floor(value);
  if (f0 < away_ || f0 > 1.0 - away_)
    return false;
  double oneMinusF0 = 1.0 - f0;
  const double *columnLower = si.getColLower();
  const double *columnUpper = si.getColUpper();
  const double *rowLower = si.getRowLower();
  double infinity = si.getInfinity();

  std::vector< double > z(numberColumns);
  std::vector< double > slack(numberRows);
  si.getBInvARow(iRow, &z[0], &slack[0]);

  const CoinPackedMatrix *columnCopy = si.getMatrixByCol();
  const CoinBigIndex *columnStart = columnCopy->getVectorStarts();
  const int *columnLength = columnCopy->getVectorLengths();
  const int *row = columnCopy->getIndices();
  const double *elementByColumn = columnCopy->getElements();
  double scale = 0.0;
  for (CoinBigIndex j = columnStart[kColumn];
       j < columnStart[kColumn] + columnLength[kColumn]; j++)
    scale += slack[row[j]] * elementByColumn[j];
  if (fabs(scale) < 1.0e-9)
    return false;

  pi.assign(numberColumns, 0.0);
  std::vector< double > surplus(numberRows, 0.0);
  double rhs = 1.0;
  // structurals - shift to bound, complement at upper
  for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
    if (iColumn == kColumn)
      continue;
    CoinWarmStartBasis::Status status = basis.getStructStatus(iColumn);
    if (status == CoinWarmStartBasis::basic)
      continue;
    double a = z[iColumn];
    if (fabs(a) < 1.0e-12)
      continue;
    double bound;
    bool atUpper;
    if (status == CoinWarmStartBasis::atLowerBound) {
      bound = columnLower[iColumn];
      atUpper = false;
    } else if (status == CoinWarmStartBasis::atUpperBound) {
      bound = columnUpper[iColumn];
      atUpper = true;
      a = -a;
    } else {
      // free or superbasic
      return false;
    }
    if (fabs(bound) >= infinity
      || fabs(solution[iColumn] - bound) > 1.0e-7 * CoinMax(1.0, fabs(bound)))
      return false;
    double coefficient;
    if (si.isInteger(iColumn) && bound == floor(bound)) {
      double f = a - floor(a);
      if (f <= f0)
        coefficient = f / f0;
      else
        coefficient = (1.0 - f) / oneMinusF0;
    } else if (a > 0.0) {
      coefficient = a / f0;
    } else {
      coefficient = -a / oneMinusF0;
    }
    if (atUpper) {
      pi[iColumn] = -coefficient;
      rhs -= coefficient * bound;
    } else {
      pi[iColumn] = coefficient;
      rhs += coefficient * bound;
    }
  }
  // surpluses - continuous, at zero
  for (int i = 0; i < numberRows; i++) {
    if (basis.getArtifStatus(i) == CoinWarmStartBasis::basic)
      continue;
    double a = -slack[i] / scale;
    if (fabs(a) < 1.0e-12)
      continue;
    if (rowLower[i] <= -infinity)
      return false;
    if (a > 0.0)
      surplus[i] = a / f0;
    else
      surplus[i] = -a / oneMinusF0;
  }
  // substitute s = Ax - b
  const CoinPackedMatrix *rowCopy = si.getMatrixByRow();
  const CoinBigIndex *rowStart = rowCopy->getVectorStarts();
  const int *rowLength = rowCopy->getVectorLengths();
  const int *column = rowCopy->getIndices();
  const double *elementByRow = rowCopy->getElements();
  for (int i = 0; i < numberRows; i++) {
    double h = surplus[i];
    if (!h)
      continue;
    for (CoinBigIndex j = rowStart[i]; j < rowStart[i] + rowLength[i]; j++)
      pi[column[j]] += h * elementByRow[j];
    rhs += h * rowLower[i];
  }
  double largest = 0.0;
  for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
    if (fabs(pi[iColumn]) < 1.0e-12)
      pi[iColumn] = 0.0;
    largest = CoinMax(largest, fabs(pi[iColumn]));
  }
  if (!largest || largest > 1.0e12 || fabs(rhs) > 1.0e12 || !CoinFinite(rhs))
    return false;
  pi0 = rhs;
  return true;
}

bool SbcGomoryCuts::strengthenCut(const OsiSolverInterface &si, const std::vector< double > &pi,
  double &pi0) const
{
  int numberColumns = si.getNumCols();
  std::vector< int > integers;
  for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
    if (si.isInteger(iColumn))
      integers.push_back(iColumn);
  }
  SbcSettings settings;
  settings.setIntParam(SbcSettings::SbcMaxNumNode, cutOptimizationNodeLimit_);
  settings.setIntParam(SbcSettings::SbcLogLevel, 0);
  settings.setDblParam(SbcSettings::SbcIntegerTolerance, integerTolerance_);
  OsiSolverInterface *nested = si.clone();
  nested->setObjSense(1.0);
  nested->setObjective(&pi[0]);
  if (handler_)
    handler_->message(SBC_START_SUB, *messages_)
      << "Gomory cut" << cutOptimizationNodeLimit_ << CoinMessageEol;
  SbcResult result;
  try {
    result = sbcSolve(*nested, integers, settings);
  } catch (CoinError &) {
    delete nested;
    throw;
  }
  delete nested;
  if (handler_)
    handler_->message(SBC_END_SUB, *messages_)
      << "Gomory cut" << result.lowerBound << CoinMessageEol;
  double tolerance = 1.0e-6 * CoinMax(1.0, fabs(pi0));
  if (!result.solution.empty() && result.upperBound < pi0 - tolerance) {
    // integer point on wrong side
    numberInvalid_++;
    if (handler_)
      handler_->message(SBC_CUT_INVALID, *messages_)
        << "Gomory" << result.upperBound << pi0 << CoinMessageEol;
    return false;
  }
  if (result.status == SbcModel::unbounded) {
    // pi x has no lower bound over the integer points
    numberInvalid_++;
    if (handler_)
      handler_->message(SBC_CUT_INVALID, *messages_)
        << "Gomory" << -COIN_DBL_MAX << pi0 << CoinMessageEol;
    return false;
  }
  if (result.status == SbcModel::infeasible)
    return true;
  if (result.lowerBound > -COIN_DBL_MAX && result.lowerBound < COIN_DBL_MAX) {
    if (result.lowerBound > pi0 + tolerance)
      numberStrengthened_++;
    pi0 = CoinMax(pi0, result.lowerBound);
  }
  return true;
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
