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
#include <utility>

#include "CoinError.hpp"
#include "CoinMessageHandler.hpp"
#include "SbcSettings.hpp"
#include "SbcMessage.hpp"
#include "SbcPseudoCosts.hpp"
#include "SbcBranchActual.hpp"

//##############################################################################

SbcBranchMostFractional::SbcBranchMostFractional()
  : SbcBranchDecision()
{
}

SbcBranchMostFractional::SbcBranchMostFractional(const SbcBranchMostFractional &rhs)
  : SbcBranchDecision(rhs)
{
}

SbcBranchMostFractional::~SbcBranchMostFractional()
{
}

SbcBranchDecision *
SbcBranchMostFractional::clone() const
{
  return new SbcBranchMostFractional(*this);
}

SbcNodeChildren
SbcBranchMostFractional::createBranch(SbcNode &node, const SbcSettings &,
  SbcPseudoCosts *)
{
  return node.baseBranch(node.mostFractionalIndex());
}

//##############################################################################

SbcBranchStrong::SbcBranchStrong()
  : SbcBranchDecision()
{
}

SbcBranchStrong::SbcBranchStrong(const SbcBranchStrong &rhs)
  : SbcBranchDecision(rhs)
{
}

SbcBranchStrong::~SbcBranchStrong()
{
}

SbcBranchDecision *
SbcBranchStrong::clone() const
{
  return new SbcBranchStrong(*this);
}

std::vector< int >
SbcBranchStrong::candidates(const SbcNode &node, int number)
{
  const std::vector< int > &integers = node.integers();
  const std::vector< double > &solution = node.solution();
  std::vector< std::pair< double, int > > sorted;
  for (size_t i = 0; i < integers.size(); i++) {
    int iColumn = integers[i];
    double value = solution[iColumn];
    if (SbcNode::isFractional(value, node.integerTolerance()))
      sorted.push_back(std::make_pair(fabs(value - floor(value) - 0.5), iColumn));
  }
  std::sort(sorted.begin(), sorted.end());
  std::vector< int > which;
  for (size_t i = 0; i < sorted.size() && static_cast< int >(i) < number; i++)
    which.push_back(sorted[i].second);
  return which;
}

SbcNodeChildren
SbcBranchStrong::createBranch(SbcNode &node, const SbcSettings &settings,
  SbcPseudoCosts *)
{
  std::vector< int > which = candidates(node,
    settings.getIntParam(SbcSettings::SbcNumberStrong));
  if (which.empty())
    throw CoinError("no fractional variable", "createBranch", "SbcBranchStrong");
  int maximumIterations = settings.getIntParam(SbcSettings::SbcStrongIterations);
  double objective = node.lowerBound();
  SbcNodeChildren best;
  best.down = NULL;
  best.up = NULL;
  double bestCriterion = -1.0;
  for (size_t i = 0; i < which.size(); i++) {
    int iColumn = which[i];
    SbcNodeChildren children;
    try {
      children = node.strongBranch(iColumn, maximumIterations);
    } catch (CoinError &) {
      delete best.down;
      delete best.up;
      throw;
    }
    double changeDown = CoinMax(children.down->lowerBound() - objective, 0.0);
    double changeUp = CoinMax(children.up->lowerBound() - objective, 0.0);
    if (handler_) {
      handler_->message(SBC_STRONG, *messages_)
        << iColumn
        << changeDown << children.down->numberIterations()
        << changeUp << children.up->numberIterations()
        << node.solution()[iColumn]
        << CoinMessageEol;
    }
    double criterion = CoinMin(changeDown, changeUp);
    if (criterion > bestCriterion) {
      bestCriterion = criterion;
      delete best.down;
      delete best.up;
      best = children;
    } else {
      delete children.down;
      delete children.up;
    }
  }
  return best;
}

//##############################################################################

SbcBranchPseudoCost::SbcBranchPseudoCost()
  : SbcBranchDecision()
{
}

SbcBranchPseudoCost::SbcBranchPseudoCost(const SbcBranchPseudoCost &rhs)
  : SbcBranchDecision(rhs)
{
}

SbcBranchPseudoCost::~SbcBranchPseudoCost()
{
}

SbcBranchDecision *
SbcBranchPseudoCost::clone() const
{
  return new SbcBranchPseudoCost(*this);
}

int SbcBranchPseudoCost::bestIndex(const SbcNode &node, const SbcPseudoCosts &pseudoCosts)
{
  const std::vector< int > &integers = node.integers();
  const std::vector< double > &solution = node.solution();
  int best = -1;
  double bestScore = -1.0;
  for (size_t i = 0; i < integers.size(); i++) {
    int iColumn = integers[i];
    double value = solution[iColumn];
    if (!SbcNode::isFractional(value, node.integerTolerance()))
      continue;
    double score = pseudoCosts.score(iColumn, value);
    if (score > bestScore) {
      bestScore = score;
      best = iColumn;
    }
  }
  return best;
}

SbcNodeChildren
SbcBranchPseudoCost::createBranch(SbcNode &node, const SbcSettings &,
  SbcPseudoCosts *pseudoCosts)
{
  if (!pseudoCosts)
    throw CoinError("pseudo costs needed", "createBranch", "SbcBranchPseudoCost");
  return node.baseBranch(bestIndex(node, *pseudoCosts));
}

void SbcBranchPseudoCost::updateInformation(const SbcNode &child, SbcPseudoCosts *pseudoCosts)
{
  int iColumn = child.branchVariable();
  if (!pseudoCosts || iColumn < 0)
    return;
  // infeasible children say nothing about cost per unit
  if (!child.bounded() || !child.lpFeasible() || child.unbounded())
    return;
  if (child.parentObjective() == -COIN_DBL_MAX)
    return;
  double value = child.branchValue();
  double change;
  if (child.branchWay() < 0)
    change = value - floor(value);
  else
    change = ceil(value) - value;
  pseudoCosts->update(iColumn, child.branchWay(), change,
    child.objectiveValue() - child.parentObjective());
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
