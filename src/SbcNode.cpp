// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#if defined(_MSC_VER)
// Turn off compiler warning about long names
#pragma warning(disable : 4786)
#endif

#include <cmath>
#include <algorithm>

#include "OsiSolverInterface.hpp"
#include "CoinWarmStart.hpp"
#include "CoinError.hpp"
#include "SbcSettings.hpp"
#include "SbcBoundExtension.hpp"
#include "SbcBranchDecision.hpp"
#include "SbcNode.hpp"

SbcNode::SbcNode(const OsiSolverInterface &solver, const std::vector< int > &integers,
  double lowerBound, int branchVariable, int branchWay,
  double branchValue, int depth)
  : relaxation_(solver)
  , integers_(integers)
  , lowerBound_(lowerBound)
  , objectiveValue_(-COIN_DBL_MAX)
  , parentObjective_(-COIN_DBL_MAX)
  , objectiveBeforeCuts_(-COIN_DBL_MAX)
  , warmStart_(NULL)
  , integerTolerance_(1.0e-7)
  , branchVariable_(branchVariable)
  , branchWay_(branchWay)
  , branchValue_(branchValue)
  , depth_(depth)
  , nodeNumber_(-1)
  , numberIterations_(0)
  , numberCutsAdded_(0)
  , lpFeasible_(false)
  , mipFeasible_(false)
  , unbounded_(false)
  , bounded_(false)
{
  OsiSolverInterface *clone = relaxation_.solver();
  int numberColumns = clone->getNumCols();
  int n = static_cast< int >(integers_.size());
  for (int i = 0; i < n; i++) {
    if (integers_[i] < 0 || integers_[i] >= numberColumns)
      throw CoinError("integer indices must match variables", "SbcNode", "SbcNode");
  }
  std::sort(integers_.begin(), integers_.end());
  if (std::adjacent_find(integers_.begin(), integers_.end()) != integers_.end())
    throw CoinError("integer indices must be distinct", "SbcNode", "SbcNode");
  checkConsistency();
  // integrality as seen by cut generators is exactly the list
  for (int iColumn = 0; iColumn < numberColumns; iColumn++)
    clone->setContinuous(iColumn);
  for (int i = 0; i < n; i++)
    clone->setInteger(integers_[i]);
}

// Child - relaxation is copied so siblings never share bound arrays
SbcNode::SbcNode(const SbcNode &parent, int branchVariable, int branchWay)
  : relaxation_(parent.relaxation_)
  , integers_(parent.integers_)
  , lowerBound_(parent.lowerBound_)
  , objectiveValue_(-COIN_DBL_MAX)
  , parentObjective_(parent.objectiveValue_)
  , objectiveBeforeCuts_(-COIN_DBL_MAX)
  , warmStart_(parent.warmStart_ ? parent.warmStart_->clone() : NULL)
  , extensions_(parent.extensions_)
  , integerTolerance_(parent.integerTolerance_)
  , branchVariable_(branchVariable)
  , branchWay_(branchWay)
  , branchValue_(parent.solution_[branchVariable])
  , depth_(parent.depth_ + 1)
  , nodeNumber_(-1)
  , numberIterations_(0)
  , numberCutsAdded_(0)
  , lpFeasible_(false)
  , mipFeasible_(false)
  , unbounded_(false)
  , bounded_(false)
{
  OsiSolverInterface *solver = relaxation_.solver();
  if (branchWay_ < 0)
    solver->setColUpper(branchVariable_, floor(branchValue_));
  else
    solver->setColLower(branchVariable_, ceil(branchValue_));
  checkConsistency();
}

SbcNode::~SbcNode()
{
  delete warmStart_;
}

void SbcNode::checkConsistency() const
{
  const OsiSolverInterface *solver = relaxation_.solver();
  if ((branchVariable_ >= 0) != (branchWay_ != 0))
    throw CoinError("branch variable and way must be set together", "SbcNode", "SbcNode");
  if (branchWay_ < -1 || branchWay_ > 1)
    throw CoinError("can only branch a variable up or down", "SbcNode", "SbcNode");
  if (branchVariable_ >= 0) {
    if (!std::binary_search(integers_.begin(), integers_.end(), branchVariable_))
      throw CoinError("branch variable must be integer", "SbcNode", "SbcNode");
    // tightened bound must lie strictly within one unit of value
    if (branchWay_ < 0) {
      double upper = solver->getColUpper()[branchVariable_];
      if (!(branchValue_ > upper && branchValue_ < upper + 1.0))
        throw CoinError("branch value must be within one unit of bounds", "SbcNode", "SbcNode");
    } else {
      double lower = solver->getColLower()[branchVariable_];
      if (!(branchValue_ < lower && branchValue_ > lower - 1.0))
        throw CoinError("branch value must be within one unit of bounds", "SbcNode", "SbcNode");
    }
  }
  if (depth_ < 0)
    throw CoinError("depth must not be negative", "SbcNode", "SbcNode");
  int numberRows = solver->getNumRows();
  const double *rowUpper = solver->getRowUpper();
  double infinity = solver->getInfinity();
  for (int iRow = 0; iRow < numberRows; iRow++) {
    if (rowUpper[iRow] < infinity)
      throw CoinError("rows must be of form Ax >= b", "SbcNode", "SbcNode");
  }
  int numberColumns = solver->getNumCols();
  const double *columnLower = solver->getColLower();
  for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
    if (columnLower[iColumn] < 0.0)
      throw CoinError("variables must be non-negative", "SbcNode", "SbcNode");
  }
}

void SbcNode::setWarmStart(const CoinWarmStart *warmStart)
{
  delete warmStart_;
  warmStart_ = warmStart ? warmStart->clone() : NULL;
}

bool SbcNode::isFractional(double value, double tolerance)
{
  return CoinMin(value - floor(value), ceil(value) - value) > tolerance;
}

int SbcNode::mostFractionalIndex() const
{
  int best = -1;
  double bestDistance = COIN_DBL_MAX;
  if (solution_.empty())
    return best;
  int n = static_cast< int >(integers_.size());
  for (int i = 0; i < n; i++) {
    int iColumn = integers_[i];
    double value = solution_[iColumn];
    if (!isFractional(value, integerTolerance_))
      continue;
    double distance = fabs(value - floor(value) - 0.5);
    // integers_ is sorted so strict test keeps lowest index
    if (distance < bestDistance) {
      bestDistance = distance;
      best = iColumn;
    }
  }
  return best;
}

void SbcNode::takeResults(SbcRelaxation::Status status)
{
  const OsiSolverInterface *solver = relaxation_.solver();
  numberIterations_ += relaxation_.numberIterations();
  switch (status) {
  case SbcRelaxation::optimal: {
    objectiveValue_ = solver->getObjValue();
    lowerBound_ = CoinMax(lowerBound_, objectiveValue_);
    const double *solution = solver->getColSolution();
    solution_.assign(solution, solution + solver->getNumCols());
    lpFeasible_ = true;
    unbounded_ = false;
    mipFeasible_ = mostFractionalIndex() < 0;
    CoinWarmStart *basis = relaxation_.getWarmStart();
    delete warmStart_;
    warmStart_ = basis;
  } break;
  case SbcRelaxation::infeasible:
    objectiveValue_ = COIN_DBL_MAX;
    lowerBound_ = COIN_DBL_MAX;
    solution_.clear();
    lpFeasible_ = false;
    mipFeasible_ = false;
    break;
  case SbcRelaxation::unbounded:
    objectiveValue_ = -COIN_DBL_MAX;
    solution_.clear();
    lpFeasible_ = true;
    mipFeasible_ = false;
    unbounded_ = true;
    break;
  case SbcRelaxation::iterationLimit:
    throw SbcNumericalError("iteration limit in full solve", "bound", "SbcNode");
  }
}

SbcRelaxation::Status
SbcNode::bound(const SbcSettings &settings, const double *incumbent)
{
  integerTolerance_ = settings.integerTolerance();
  bounded_ = false;
  numberIterations_ = 0;
  SbcRelaxation::Status status = relaxation_.solve(warmStart_);
  takeResults(status);
  objectiveBeforeCuts_ = objectiveValue_;
  if (extensions_.size()) {
    int maximumPasses = settings.getIntParam(SbcSettings::SbcMaxCutPasses);
    for (int pass = 0; pass < maximumPasses; pass++) {
      if (status != SbcRelaxation::optimal || mipFeasible_)
        break;
      int numberAdded = 0;
      for (size_t i = 0; i < extensions_.size(); i++)
        numberAdded += extensions_[i]->extend(*this, settings, incumbent, pass);
      if (!numberAdded)
        break;
      numberCutsAdded_ += numberAdded;
      // resolve from current basis - new rows come in basic
      status = relaxation_.solve();
      takeResults(status);
    }
  }
  bounded_ = true;
  return status;
}

SbcNodeChildren
SbcNode::baseBranch(int variable) const
{
  if (!bounded_ || solution_.empty())
    throw CoinError("must solve before branching", "baseBranch", "SbcNode");
  if (!std::binary_search(integers_.begin(), integers_.end(), variable))
    throw CoinError("must branch on integer index", "baseBranch", "SbcNode");
  if (!isFractional(solution_[variable], integerTolerance_))
    throw CoinError("index branched on must be fractional", "baseBranch", "SbcNode");
  SbcNodeChildren children;
  children.down = new SbcNode(*this, variable, -1);
  children.up = new SbcNode(*this, variable, 1);
  return children;
}

SbcNodeChildren
SbcNode::strongBranch(int variable, int maximumIterations) const
{
  if (maximumIterations <= 0)
    throw CoinError("iterations must be positive", "strongBranch", "SbcNode");
  SbcNodeChildren children = baseBranch(variable);
  SbcNode *child[2] = { children.down, children.up };
  double tolerance = 1.0e-6 * CoinMax(1.0, fabs(objectiveValue_));
  for (int i = 0; i < 2; i++) {
    SbcNode *node = child[i];
    SbcRelaxation::Status status;
    try {
      status = node->relaxation_.solve(node->warmStart_, maximumIterations);
    } catch (CoinError &) {
      delete children.down;
      delete children.up;
      throw;
    }
    node->numberIterations_ = node->relaxation_.numberIterations();
    const OsiSolverInterface *solver = node->relaxation_.solver();
    if (status == SbcRelaxation::infeasible) {
      node->lowerBound_ = COIN_DBL_MAX;
      continue;
    }
    if (status == SbcRelaxation::optimal && solver->getObjValue() < objectiveValue_ - tolerance) {
      delete children.down;
      delete children.up;
      throw CoinError("child relaxation is weaker than parent", "strongBranch", "SbcNode");
    }
    if (status != SbcRelaxation::unbounded)
      node->lowerBound_ = CoinMax(lowerBound_, solver->getObjValue());
    // carry on from where strong branching stopped
    CoinWarmStart *basis = node->relaxation_.getWarmStart();
    delete node->warmStart_;
    node->warmStart_ = basis;
  }
  return children;
}

SbcNodeChildren
SbcNode::branch(const SbcSettings &settings, SbcBranchDecision *decision,
  SbcPseudoCosts *pseudoCosts)
{
  if (!bounded_)
    throw CoinError("must solve before branching", "branch", "SbcNode");
  if (!lpFeasible_ || unbounded_)
    throw CoinError("can only branch on a feasible bounded relaxation", "branch", "SbcNode");
  if (mipFeasible_)
    throw CoinError("node is already integer feasible", "branch", "SbcNode");
  if (decision)
    return decision->createBranch(*this, settings, pseudoCosts);
  return baseBranch(mostFractionalIndex());
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
