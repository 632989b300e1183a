// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include "CoinPragma.hpp"

#include <cmath>
#include <iostream>
#include <vector>

#include "CoinError.hpp"
#include "CoinFinite.hpp"
#include "CoinWarmStartBasis.hpp"
#include "OsiClpSolverInterface.hpp"
#include "OsiUnitTests.hpp"
#include "SbcSettings.hpp"
#include "SbcBoundExtension.hpp"
#include "SbcNode.hpp"
#include "SbcTestModels.hpp"
#include "SbcUnitTests.hpp"

namespace {

bool eq(double x, double y)
{
  return fabs(x - y) <= 1.0e-7 * CoinMax(1.0, fabs(y));
}

/*
  Counts calls, adds nothing.
*/
class SbcCountingExtension : public SbcBoundExtension {
public:
  SbcCountingExtension()
    : numberCalls_(0)
  {
  }
  virtual int extend(SbcNode &, const SbcSettings &, const double *, int)
  {
    numberCalls_++;
    return 0;
  }
  virtual const char *name() const
  {
    return "counting";
  }
  int numberCalls_;
};

/*
  Expect the node constructor to refuse.
*/
void expectBadNode(const OsiSolverInterface &solver, const std::vector< int > &integers,
  int branchVariable, int branchWay, double branchValue, int depth, const char *testname)
{
  try {
    SbcNode node(solver, integers, -COIN_DBL_MAX, branchVariable, branchWay, branchValue, depth);
    OSIUNITTEST_ADD_OUTCOME("sbc", testname, "should throw exception", OsiUnitTest::TestOutcome::ERROR, false);
  } catch (CoinError &e) {
    if (OsiUnitTest::verbosity >= 1)
      std::cout << "Correct throw for " << testname << ": " << e.message() << std::endl;
  }
}

bool sameBasis(const CoinWarmStart *a, const CoinWarmStart *b)
{
  const CoinWarmStartBasis *basisA = dynamic_cast< const CoinWarmStartBasis * >(a);
  const CoinWarmStartBasis *basisB = dynamic_cast< const CoinWarmStartBasis * >(b);
  if (!basisA || !basisB)
    return false;
  if (basisA->getNumStructural() != basisB->getNumStructural()
    || basisA->getNumArtificial() != basisB->getNumArtificial())
    return false;
  for (int i = 0; i < basisA->getNumStructural(); i++) {
    if (basisA->getStructStatus(i) != basisB->getStructStatus(i))
      return false;
  }
  for (int i = 0; i < basisA->getNumArtificial(); i++) {
    if (basisA->getArtifStatus(i) != basisB->getArtifStatus(i))
      return false;
  }
  return true;
}

} // end file-local namespace

void SbcNodeUnitTest()
{
  SbcSettings settings;

  // Freshly made node
  {
    OsiClpSolverInterface solver;
    std::vector< int > integers;
    loadSmallBranch(solver, integers);
    SbcNode node(solver, integers);
    OSIUNITTEST_ASSERT_ERROR(node.lowerBound() == -COIN_DBL_MAX, {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(node.solution().empty(), {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(!node.lpFeasible(), {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(!node.mipFeasible(), {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(!node.bounded(), {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(node.branchVariable() == -1, {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(node.branchWay() == 0, {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(node.depth() == 0, {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(node.integers().size() == 2, {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(node.mostFractionalIndex() == -1, {}, "sbc", "new node");
    // integrality on the relaxation is exactly the list
    OSIUNITTEST_ASSERT_ERROR(!node.solver()->isInteger(0), {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(node.solver()->isInteger(1), {}, "sbc", "new node");
    OSIUNITTEST_ASSERT_ERROR(node.solver()->isInteger(2), {}, "sbc", "new node");
    // the node works on its own copy
    OSIUNITTEST_ASSERT_ERROR(node.solver() != &solver, {}, "sbc", "new node");
  }

  // Malformed problems and branch descriptions
  {
    OsiClpSolverInterface solver;
    std::vector< int > integers;
    loadSmallBranch(solver, integers);
    std::vector< int > outOfRange(1, 4);
    expectBadNode(solver, outOfRange, -1, 0, 0.0, 0, "integer index out of range");
    std::vector< int > repeated;
    repeated.push_back(0);
    repeated.push_back(1);
    repeated.push_back(1);
    expectBadNode(solver, repeated, -1, 0, 0.0, 0, "integer indices repeated");
    expectBadNode(solver, integers, -1, 1, 0.5, 0, "way without variable");
    expectBadNode(solver, integers, 1, 0, 0.5, 0, "variable without way");
    expectBadNode(solver, integers, 1, 2, 0.5, 0, "way out of range");
    expectBadNode(solver, integers, 0, -1, 0.5, 0, "branch on continuous");
    // lower bound of column 1 is 0 so an up branch value must lie in (-1,0)
    expectBadNode(solver, integers, 1, 1, 0.5, 0, "branch value off bound");
    expectBadNode(solver, integers, -1, 0, 0.0, -1, "negative depth");
    // solver already carrying a down branch x2 <= 1 from value 1.5
    OsiClpSolverInterface tightened(solver);
    tightened.setColUpper(2, 1.0);
    OSIUNITTEST_CATCH_ERROR(SbcNode child(tightened, integers, -2.75, 2, -1, 1.5, 1), {}, "sbc", "branch value within bound");
    expectBadNode(tightened, integers, 2, -1, 2.5, 1, "branch value above bound");

    OsiClpSolverInterface ranged(solver);
    ranged.setRowUpper(0, 10.0);
    expectBadNode(ranged, integers, -1, 0, 0.0, 0, "row with upper bound");
    OsiClpSolverInterface negative(solver);
    negative.setColLower(0, -1.0);
    expectBadNode(negative, integers, -1, 0, 0.0, 0, "negative lower bound");
  }

  // Integral relaxation
  {
    OsiClpSolverInterface solver;
    std::vector< int > integers;
    loadNoBranch(solver, integers);
    SbcNode node(solver, integers);
    SbcRelaxation::Status status = node.bound(settings);
    OSIUNITTEST_ASSERT_ERROR(status == SbcRelaxation::optimal, return, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(node.bounded(), {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.objectiveValue(), -2.0), {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.lowerBound(), -2.0), {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(node.lpFeasible(), {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(node.mipFeasible(), {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(node.solution().size() == 3, return, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.solution()[0], 1.0), {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.solution()[1], 1.0), {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.solution()[2], 0.0), {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(node.mostFractionalIndex() == -1, {}, "sbc", "bound no branch");
    OSIUNITTEST_ASSERT_ERROR(node.warmStart() != NULL, {}, "sbc", "bound no branch");

    try {
      SbcNodeChildren children = node.branch(settings);
      delete children.down;
      delete children.up;
      OSIUNITTEST_ADD_OUTCOME("sbc", "branch integral node", "should throw exception", OsiUnitTest::TestOutcome::ERROR, false);
    } catch (CoinError &e) {
      if (OsiUnitTest::verbosity >= 1)
        std::cout << "Correct throw from branch on integral node" << std::endl;
    }
    try {
      SbcNodeChildren children = node.baseBranch(-1);
      delete children.down;
      delete children.up;
      OSIUNITTEST_ADD_OUTCOME("sbc", "baseBranch on -1", "should throw exception", OsiUnitTest::TestOutcome::ERROR, false);
    } catch (CoinError &e) {
      if (OsiUnitTest::verbosity >= 1)
        std::cout << "Correct throw from baseBranch on non integer" << std::endl;
    }
    try {
      SbcNodeChildren children = node.baseBranch(1);
      delete children.down;
      delete children.up;
      OSIUNITTEST_ADD_OUTCOME("sbc", "baseBranch on integral value", "should throw exception", OsiUnitTest::TestOutcome::ERROR, false);
    } catch (CoinError &e) {
      if (OsiUnitTest::verbosity >= 1)
        std::cout << "Correct throw from baseBranch on integral value" << std::endl;
    }
  }

  // Infeasible and unbounded relaxations
  {
    OsiClpSolverInterface solver;
    std::vector< int > integers;
    loadInfeasible(solver, integers);
    SbcNode node(solver, integers);
    SbcRelaxation::Status status = node.bound(settings);
    OSIUNITTEST_ASSERT_ERROR(status == SbcRelaxation::infeasible, {}, "sbc", "bound infeasible");
    OSIUNITTEST_ASSERT_ERROR(!node.lpFeasible(), {}, "sbc", "bound infeasible");
    OSIUNITTEST_ASSERT_ERROR(!node.mipFeasible(), {}, "sbc", "bound infeasible");
    OSIUNITTEST_ASSERT_ERROR(node.lowerBound() == COIN_DBL_MAX, {}, "sbc", "bound infeasible");
    try {
      SbcNodeChildren children = node.branch(settings);
      delete children.down;
      delete children.up;
      OSIUNITTEST_ADD_OUTCOME("sbc", "branch infeasible node", "should throw exception", OsiUnitTest::TestOutcome::ERROR, false);
    } catch (CoinError &e) {
      if (OsiUnitTest::verbosity >= 1)
        std::cout << "Correct throw from branch on infeasible node" << std::endl;
    }
  }
  {
    OsiClpSolverInterface solver;
    std::vector< int > integers;
    loadUnbounded(solver, integers);
    SbcNode node(solver, integers);
    SbcRelaxation::Status status = node.bound(settings);
    OSIUNITTEST_ASSERT_ERROR(status == SbcRelaxation::unbounded, {}, "sbc", "bound unbounded");
    OSIUNITTEST_ASSERT_ERROR(node.unbounded(), {}, "sbc", "bound unbounded");
    OSIUNITTEST_ASSERT_ERROR(!node.mipFeasible(), {}, "sbc", "bound unbounded");
  }

  // Fractional relaxation and its children
  {
    OsiClpSolverInterface solver;
    std::vector< int > integers;
    loadSmallBranch(solver, integers);
    SbcNode node(solver, integers);
    try {
      SbcNodeChildren children = node.baseBranch(2);
      delete children.down;
      delete children.up;
      OSIUNITTEST_ADD_OUTCOME("sbc", "baseBranch before bound", "should throw exception", OsiUnitTest::TestOutcome::ERROR, false);
    } catch (CoinError &e) {
      if (OsiUnitTest::verbosity >= 1)
        std::cout << "Correct throw from baseBranch before bound" << std::endl;
    }
    node.bound(settings);
    OSIUNITTEST_ASSERT_ERROR(node.lpFeasible(), return, "sbc", "bound small branch");
    OSIUNITTEST_ASSERT_ERROR(!node.mipFeasible(), {}, "sbc", "bound small branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.lowerBound(), -2.75), {}, "sbc", "bound small branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.solution()[0], 0.0), {}, "sbc", "bound small branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.solution()[1], 1.25), {}, "sbc", "bound small branch");
    OSIUNITTEST_ASSERT_ERROR(eq(node.solution()[2], 1.5), {}, "sbc", "bound small branch");
    OSIUNITTEST_ASSERT_ERROR(node.mostFractionalIndex() == 2, {}, "sbc", "most fractional");
    // column 0 is continuous
    try {
      SbcNodeChildren children = node.baseBranch(0);
      delete children.down;
      delete children.up;
      OSIUNITTEST_ADD_OUTCOME("sbc", "baseBranch on continuous", "should throw exception", OsiUnitTest::TestOutcome::ERROR, false);
    } catch (CoinError &e) {
      if (OsiUnitTest::verbosity >= 1)
        std::cout << "Correct throw from baseBranch on continuous" << std::endl;
    }

    SbcNodeChildren children = node.baseBranch(2);
    OSIUNITTEST_ASSERT_ERROR(children.down != NULL && children.up != NULL, return, "sbc", "baseBranch");
    const OsiSolverInterface *parent = node.solver();
    const OsiSolverInterface *down = children.down->solver();
    const OsiSolverInterface *up = children.up->solver();
    OSIUNITTEST_ASSERT_ERROR(down->getColUpper()[2] == 1.0, {}, "sbc", "baseBranch down bound");
    OSIUNITTEST_ASSERT_ERROR(down->getColLower()[2] == parent->getColLower()[2], {}, "sbc", "baseBranch down bound");
    OSIUNITTEST_ASSERT_ERROR(up->getColLower()[2] == 2.0, {}, "sbc", "baseBranch up bound");
    OSIUNITTEST_ASSERT_ERROR(up->getColUpper()[2] == parent->getColUpper()[2], {}, "sbc", "baseBranch up bound");
    for (int iColumn = 0; iColumn < 2; iColumn++) {
      OSIUNITTEST_ASSERT_ERROR(down->getColLower()[iColumn] == parent->getColLower()[iColumn], {}, "sbc", "baseBranch other bounds");
      OSIUNITTEST_ASSERT_ERROR(down->getColUpper()[iColumn] == parent->getColUpper()[iColumn], {}, "sbc", "baseBranch other bounds");
      OSIUNITTEST_ASSERT_ERROR(up->getColLower()[iColumn] == parent->getColLower()[iColumn], {}, "sbc", "baseBranch other bounds");
      OSIUNITTEST_ASSERT_ERROR(up->getColUpper()[iColumn] == parent->getColUpper()[iColumn], {}, "sbc", "baseBranch other bounds");
    }
    OSIUNITTEST_ASSERT_ERROR(down->getNumRows() == parent->getNumRows(), {}, "sbc", "baseBranch rows");
    for (int iRow = 0; iRow < parent->getNumRows(); iRow++)
      OSIUNITTEST_ASSERT_ERROR(down->getRowLower()[iRow] == parent->getRowLower()[iRow], {}, "sbc", "baseBranch rows");
    OSIUNITTEST_ASSERT_ERROR(children.down->branchVariable() == 2, {}, "sbc", "baseBranch triple");
    OSIUNITTEST_ASSERT_ERROR(children.down->branchWay() == -1, {}, "sbc", "baseBranch triple");
    OSIUNITTEST_ASSERT_ERROR(eq(children.down->branchValue(), 1.5), {}, "sbc", "baseBranch triple");
    OSIUNITTEST_ASSERT_ERROR(children.up->branchVariable() == 2, {}, "sbc", "baseBranch triple");
    OSIUNITTEST_ASSERT_ERROR(children.up->branchWay() == 1, {}, "sbc", "baseBranch triple");
    OSIUNITTEST_ASSERT_ERROR(children.down->depth() == 1, {}, "sbc", "baseBranch depth");
    OSIUNITTEST_ASSERT_ERROR(children.up->depth() == 1, {}, "sbc", "baseBranch depth");
    OSIUNITTEST_ASSERT_ERROR(eq(children.down->lowerBound(), -2.75), {}, "sbc", "baseBranch inherits bound");
    OSIUNITTEST_ASSERT_ERROR(eq(children.up->lowerBound(), -2.75), {}, "sbc", "baseBranch inherits bound");
    // basis copied not shared
    OSIUNITTEST_ASSERT_ERROR(children.down->warmStart() != node.warmStart(), {}, "sbc", "baseBranch basis");
    OSIUNITTEST_ASSERT_ERROR(sameBasis(children.down->warmStart(), node.warmStart()), {}, "sbc", "baseBranch basis");
    OSIUNITTEST_ASSERT_ERROR(sameBasis(children.up->warmStart(), node.warmStart()), {}, "sbc", "baseBranch basis");

    // children never have a weaker bound
    children.down->bound(settings);
    children.up->bound(settings);
    OSIUNITTEST_ASSERT_ERROR(children.down->lowerBound() >= node.lowerBound(), {}, "sbc", "child bound");
    OSIUNITTEST_ASSERT_ERROR(eq(children.down->objectiveValue(), -2.25), {}, "sbc", "child bound");
    OSIUNITTEST_ASSERT_ERROR(eq(children.down->parentObjective(), -2.75), {}, "sbc", "child bound");
    OSIUNITTEST_ASSERT_ERROR(!children.up->lpFeasible(), {}, "sbc", "child bound");
    OSIUNITTEST_ASSERT_ERROR(children.up->lowerBound() == COIN_DBL_MAX, {}, "sbc", "child bound");
    // branching on a child gives a grandchild with both bounds
    SbcNodeChildren grandChildren = children.down->branch(settings);
    OSIUNITTEST_ASSERT_ERROR(grandChildren.down->branchVariable() == 1, {}, "sbc", "grandchild");
    OSIUNITTEST_ASSERT_ERROR(grandChildren.down->depth() == 2, {}, "sbc", "grandchild");
    OSIUNITTEST_ASSERT_ERROR(grandChildren.down->solver()->getColUpper()[2] == 1.0, {}, "sbc", "grandchild");
    OSIUNITTEST_ASSERT_ERROR(grandChildren.down->solver()->getColUpper()[1] == 1.0, {}, "sbc", "grandchild");
    grandChildren.down->bound(settings);
    OSIUNITTEST_ASSERT_ERROR(grandChildren.down->mipFeasible(), {}, "sbc", "grandchild");
    OSIUNITTEST_ASSERT_ERROR(eq(grandChildren.down->objectiveValue(), -2.0), {}, "sbc", "grandchild");
    delete grandChildren.down;
    delete grandChildren.up;
    delete children.down;
    delete children.up;

    // default branch is most fractional
    SbcNodeChildren defaults = node.branch(settings);
    OSIUNITTEST_ASSERT_ERROR(defaults.down != NULL && defaults.up != NULL, return, "sbc", "branch");
    OSIUNITTEST_ASSERT_ERROR(defaults.down->branchVariable() == 2, {}, "sbc", "branch");
    OSIUNITTEST_ASSERT_ERROR(defaults.up->branchVariable() == 2, {}, "sbc", "branch");
    delete defaults.down;
    delete defaults.up;
  }

  // Strong branching
  {
    OsiClpSolverInterface solver;
    std::vector< int > integers;
    loadSmallBranch(solver, integers);
    SbcNode node(solver, integers);
    node.bound(settings);
    SbcNodeChildren children = node.strongBranch(2, 20);
    OSIUNITTEST_ASSERT_ERROR(children.down != NULL && children.up != NULL, return, "sbc", "strongBranch");
    OSIUNITTEST_ASSERT_ERROR(children.down->numberIterations() <= 20, {}, "sbc", "strongBranch iterations");
    OSIUNITTEST_ASSERT_ERROR(children.up->numberIterations() <= 20, {}, "sbc", "strongBranch iterations");
    OSIUNITTEST_ASSERT_ERROR(children.down->lowerBound() >= node.lowerBound(), {}, "sbc", "strongBranch bounds");
    OSIUNITTEST_ASSERT_ERROR(children.up->lowerBound() >= node.lowerBound(), {}, "sbc", "strongBranch bounds");
    OSIUNITTEST_ASSERT_ERROR(eq(children.down->lowerBound(), -2.25), {}, "sbc", "strongBranch bounds");
    OSIUNITTEST_ASSERT_ERROR(children.up->lowerBound() == COIN_DBL_MAX, {}, "sbc", "strongBranch bounds");
    // children still to be bounded
    OSIUNITTEST_ASSERT_ERROR(!children.down->bounded(), {}, "sbc", "strongBranch");
    delete children.down;
    delete children.up;
    try {
      SbcNodeChildren none = node.strongBranch(2, 0);
      delete none.down;
      delete none.up;
      OSIUNITTEST_ADD_OUTCOME("sbc", "strongBranch no iterations", "should throw exception", OsiUnitTest::TestOutcome::ERROR, false);
    } catch (CoinError &e) {
      if (OsiUnitTest::verbosity >= 1)
        std::cout << "Correct throw from strongBranch with no iterations" << std::endl;
    }
  }

  // Fractionality
  {
    OSIUNITTEST_ASSERT_ERROR(!SbcNode::isFractional(5.0, 1.0e-5), {}, "sbc", "isFractional");
    OSIUNITTEST_ASSERT_ERROR(SbcNode::isFractional(5.5, 1.0e-5), {}, "sbc", "isFractional");
    OSIUNITTEST_ASSERT_ERROR(!SbcNode::isFractional(5.999999, 1.0e-5), {}, "sbc", "isFractional");
    OSIUNITTEST_ASSERT_ERROR(!SbcNode::isFractional(5.000001, 1.0e-5), {}, "sbc", "isFractional");
    OSIUNITTEST_ASSERT_ERROR(SbcNode::isFractional(5.001, 1.0e-5), {}, "sbc", "isFractional");
    OSIUNITTEST_ASSERT_ERROR(SbcNode::isFractional(5.000001, 1.0e-7), {}, "sbc", "isFractional");
  }

  // Bounding extensions only run on fractional optimal relaxations
  {
    SbcCountingExtension counter;
    OsiClpSolverInterface solver;
    std::vector< int > integers;
    loadSmallBranch(solver, integers);
    SbcNode node(solver, integers);
    node.addExtension(&counter);
    node.bound(settings);
    OSIUNITTEST_ASSERT_ERROR(counter.numberCalls_ == 1, {}, "sbc", "extension called");
    OSIUNITTEST_ASSERT_ERROR(node.numberCutsAdded() == 0, {}, "sbc", "extension called");
    SbcNodeChildren children = node.baseBranch(2);
    OSIUNITTEST_ASSERT_ERROR(children.down->extensions().size() == 1, {}, "sbc", "extension inherited");
    // infeasible child
    children.up->bound(settings);
    OSIUNITTEST_ASSERT_ERROR(counter.numberCalls_ == 1, {}, "sbc", "extension on infeasible");
    delete children.down;
    delete children.up;

    OsiClpSolverInterface integral;
    loadNoBranch(integral, integers);
    SbcNode integralNode(integral, integers);
    integralNode.addExtension(&counter);
    integralNode.bound(settings);
    OSIUNITTEST_ASSERT_ERROR(counter.numberCalls_ == 1, {}, "sbc", "extension on integral");
  }
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
