// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#if defined(_MSC_VER)
// Turn off compiler warning about long names
#pragma warning(disable : 4786)
#endif

#include <cmath>
#include <cstring>
#include <cstdlib>
#include <vector>

#include "CoinHelperFunctions.hpp"
#include "CoinPackedVector.hpp"
#include "CoinMessageHandler.hpp"
#include "CoinTime.hpp"
#include "OsiSolverInterface.hpp"
#include "OsiCuts.hpp"
#include "OsiRowCut.hpp"
#include "CglCutGenerator.hpp"
#include "SbcMessage.hpp"
#include "SbcSettings.hpp"
#include "SbcNode.hpp"
#include "SbcCutGenerator.hpp"

// Normal constructor
SbcCutGenerator::SbcCutGenerator(const CglCutGenerator &generator, const char *name)
  : generator_(generator.clone())
  , handler_(NULL)
  , messages_(NULL)
  , timeInCutGenerator_(0.0)
  , numberTimes_(0)
  , numberCuts_(0)
  , numberRejected_(0)
  , numberInvalid_(0)
{
  if (name)
    generatorName_ = CoinStrdup(name);
  else
    generatorName_ = CoinStrdup("Unknown");
}

// Copy constructor
SbcCutGenerator::SbcCutGenerator(const SbcCutGenerator &rhs)
  : SbcBoundExtension(rhs)
  , generator_(rhs.generator_->clone())
  , generatorName_(CoinStrdup(rhs.generatorName_))
  , handler_(rhs.handler_)
  , messages_(rhs.messages_)
  , timeInCutGenerator_(rhs.timeInCutGenerator_)
  , numberTimes_(rhs.numberTimes_)
  , numberCuts_(rhs.numberCuts_)
  , numberRejected_(rhs.numberRejected_)
  , numberInvalid_(rhs.numberInvalid_)
{
}

// Assignment operator
SbcCutGenerator &
SbcCutGenerator::operator=(const SbcCutGenerator &rhs)
{
  if (this != &rhs) {
    delete generator_;
    free(generatorName_);
    generator_ = rhs.generator_->clone();
    generatorName_ = CoinStrdup(rhs.generatorName_);
    handler_ = rhs.handler_;
    messages_ = rhs.messages_;
    timeInCutGenerator_ = rhs.timeInCutGenerator_;
    numberTimes_ = rhs.numberTimes_;
    numberCuts_ = rhs.numberCuts_;
    numberRejected_ = rhs.numberRejected_;
    numberInvalid_ = rhs.numberInvalid_;
  }
  return *this;
}

// Destructor
SbcCutGenerator::~SbcCutGenerator()
{
  free(generatorName_);
  delete generator_;
}

void SbcCutGenerator::passInMessageHandler(CoinMessageHandler *handler,
  const CoinMessages *messages)
{
  handler_ = handler;
  messages_ = messages;
}

bool SbcCutGenerator::inBox(const OsiSolverInterface &solver, const double *incumbent)
{
  int numberColumns = solver.getNumCols();
  const double *columnLower = solver.getColLower();
  const double *columnUpper = solver.getColUpper();
  for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
    double value = incumbent[iColumn];
    if (value < columnLower[iColumn] - 1.0e-7 || value > columnUpper[iColumn] + 1.0e-7)
      return false;
  }
  return true;
}

int SbcCutGenerator::checkCut(const OsiRowCut &cut, const double *solution,
  const double *incumbent, double tolerance) const
{
  if (cut.violated(solution) < tolerance)
    return 1;
  if (incumbent && cut.violated(incumbent) > 1.0e-6 * CoinMax(1.0, fabs(cut.lb())))
    return 2;
  return 0;
}

int SbcCutGenerator::extend(SbcNode &node, const SbcSettings &settings,
  const double *incumbent, int pass)
{
  OsiSolverInterface *solver = node.solver();
  double time1 = CoinCpuTime();
  OsiCuts cuts;
  CglTreeInfo info;
  info.level = node.depth();
  info.pass = pass;
  info.formulation_rows = solver->getNumRows() - node.numberCutsAdded();
  info.inTree = node.depth() > 0;
  generator_->generateCuts(*solver, cuts, info);
  numberTimes_++;

  double infinity = solver->getInfinity();
  double tolerance = settings.getDblParam(SbcSettings::SbcCutViolationTolerance);
  const double *solution = &node.solution()[0];
  const double *checkPoint = (incumbent && inBox(*solver, incumbent)) ? incumbent : NULL;
  OsiCuts accepted;
  int numberCuts = cuts.sizeRowCuts();
  for (int i = 0; i < numberCuts; i++) {
    OsiRowCut cut = cuts.rowCut(i);
    if (cut.ub() < infinity) {
      if (cut.lb() > -infinity) {
        numberRejected_++;
        continue;
      }
      // a x <= u becomes -a x >= -u
      const CoinPackedVector &row = cut.row();
      int n = row.getNumElements();
      if (!n) {
        numberRejected_++;
        continue;
      }
      std::vector< int > indices(row.getIndices(), row.getIndices() + n);
      std::vector< double > elements(row.getElements(), row.getElements() + n);
      for (int j = 0; j < n; j++)
        elements[j] = -elements[j];
      cut.setRow(n, &indices[0], &elements[0]);
      cut.setLb(-cut.ub());
      cut.setUb(infinity);
    }
    int returnCode = checkCut(cut, solution, checkPoint, tolerance);
    if (returnCode == 1) {
      numberRejected_++;
      if (handler_)
        handler_->message(SBC_CUT_REJECTED, *messages_)
          << generatorName_ << cut.violated(solution) << CoinMessageEol;
    } else if (returnCode == 2) {
      numberRejected_++;
      numberInvalid_++;
      if (handler_)
        handler_->message(SBC_CUT_INVALID, *messages_)
          << generatorName_ << cut.row().dotProduct(checkPoint) << cut.lb()
          << CoinMessageEol;
    } else {
      accepted.insert(cut);
    }
  }
  int numberAdded = accepted.sizeRowCuts();
  if (numberAdded) {
    std::vector< const OsiRowCut * > addCuts(numberAdded);
    for (int i = 0; i < numberAdded; i++)
      addCuts[i] = accepted.rowCutPtr(i);
    solver->applyRowCuts(numberAdded, &addCuts[0]);
  }
  numberCuts_ += numberAdded;
  timeInCutGenerator_ += CoinCpuTime() - time1;
  if (handler_)
    handler_->message(SBC_CUTS, *messages_)
      << node.nodeNumber() << pass << generatorName_ << numberAdded
      << node.objectiveValue() << CoinMessageEol;
  return numberAdded;
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
