// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcNode_H
#define SbcNode_H

#include <vector>

#include "CoinFinite.hpp"
#include "CoinHelperFunctions.hpp"
#include "SbcRelaxation.hpp"

class OsiSolverInterface;
class CoinWarmStart;
class SbcNode;
class SbcSettings;
class SbcBoundExtension;
class SbcBranchDecision;
class SbcPseudoCosts;

/// The two children created by branching. Caller owns both.
struct SbcNodeChildren {
  SbcNode *down;
  SbcNode *up;
};

/** Node of the search tree.

  A node owns its relaxation, a clone of the root solver with bounds
  tightened by the branches on the path from the root. Rows must be of the
  form Ax >= b and variables non-negative; this is checked on construction.

  The branch triple (variable, way, value) records how the node was created:
  way -1 means the upper bound of variable was set to floor(value), way +1
  that its lower bound was set to ceil(value). A root has variable -1 and
  way 0.

  Results (lower bound, solution, feasibility) are only meaningful once
  bound() has been called.
*/
class SbcNode {

public:
  /** Constructor.

    \p solver is cloned and must already carry any tightened bound of the
    branch described by \p branchVariable, \p branchWay and \p branchValue.
    Throws CoinError if the problem or the branch description is malformed.
  */
  SbcNode(const OsiSolverInterface &solver, const std::vector< int > &integers,
    double lowerBound = -COIN_DBL_MAX, int branchVariable = -1, int branchWay = 0,
    double branchValue = 0.0, int depth = 0);

  /// Destructor
  ~SbcNode();

  /** Solve the relaxation, warm started from the inherited basis.

    If the relaxation is optimal and fractional the bounding extensions are
    run, and the relaxation re-solved, for up to SbcMaxCutPasses rounds.
    Infeasibility is a normal outcome. Throws SbcNumericalError if the
    solver breaks down.
  */
  SbcRelaxation::Status bound(const SbcSettings &settings, const double *incumbent = NULL);

  /** Create two children. \p decision chooses the variable, most
      fractional if NULL. Throws CoinError unless the node has been bounded
      and is lp feasible and fractional. */
  SbcNodeChildren branch(const SbcSettings &settings, SbcBranchDecision *decision = NULL,
    SbcPseudoCosts *pseudoCosts = NULL);

  /** Create the down and up child for \p variable, which must be integer
      and fractional at the current solution. Children get copies of the
      relaxation, the basis and the extension list. */
  SbcNodeChildren baseBranch(int variable) const;

  /** baseBranch(), then solve each child with at most \p maximumIterations
      simplex iterations and raise its lower bound to what was proved.
      Throws CoinError if a child solved to optimality has a smaller
      objective than this node. */
  SbcNodeChildren strongBranch(int variable, int maximumIterations) const;

  /// True if min(value-floor(value),ceil(value)-value) exceeds tolerance
  static bool isFractional(double value, double tolerance);

  /** Integer variable whose fractional part is nearest 0.5, lowest index on
      ties. -1 if none is fractional. */
  int mostFractionalIndex() const;

  /**@name Results */
  //@{
  /// Lower bound (-COIN_DBL_MAX before bounding, COIN_DBL_MAX if infeasible)
  inline double lowerBound() const
  {
    return lowerBound_;
  }
  /// Raise lower bound (never lowers it)
  inline void setLowerBound(double value)
  {
    lowerBound_ = CoinMax(lowerBound_, value);
  }
  /// Objective of last relaxation solve
  inline double objectiveValue() const
  {
    return objectiveValue_;
  }
  /// Objective of first solve in bound(), before any rows were added
  inline double objectiveBeforeCuts() const
  {
    return objectiveBeforeCuts_;
  }
  /// Primal solution of last optimal solve (empty otherwise)
  inline const std::vector< double > &solution() const
  {
    return solution_;
  }
  inline bool lpFeasible() const
  {
    return lpFeasible_;
  }
  inline bool mipFeasible() const
  {
    return mipFeasible_;
  }
  inline bool unbounded() const
  {
    return unbounded_;
  }
  inline bool bounded() const
  {
    return bounded_;
  }
  /// Simplex iterations spent on this node
  inline int numberIterations() const
  {
    return numberIterations_;
  }
  /// Rows added by extensions at this node
  inline int numberCutsAdded() const
  {
    return numberCutsAdded_;
  }
  //@}

  /**@name Identity */
  //@{
  inline int depth() const
  {
    return depth_;
  }
  inline int branchVariable() const
  {
    return branchVariable_;
  }
  inline int branchWay() const
  {
    return branchWay_;
  }
  inline double branchValue() const
  {
    return branchValue_;
  }
  /// Objective of the parent relaxation (-COIN_DBL_MAX at root)
  inline double parentObjective() const
  {
    return parentObjective_;
  }
  inline int nodeNumber() const
  {
    return nodeNumber_;
  }
  inline void setNodeNumber(int value)
  {
    nodeNumber_ = value;
  }
  /// Sorted integer variables
  inline const std::vector< int > &integers() const
  {
    return integers_;
  }
  /// Tolerance used for integrality (set by bound)
  inline double integerTolerance() const
  {
    return integerTolerance_;
  }
  //@}

  /**@name Relaxation */
  //@{
  inline OsiSolverInterface *solver() const
  {
    return relaxation_.solver();
  }
  inline SbcRelaxation &relaxation()
  {
    return relaxation_;
  }
  /// Basis to start from (after bounding, the final basis)
  inline const CoinWarmStart *warmStart() const
  {
    return warmStart_;
  }
  /// Replace basis (cloned)
  void setWarmStart(const CoinWarmStart *warmStart);
  //@}

  /**@name Bounding extensions (not owned) */
  //@{
  inline void addExtension(SbcBoundExtension *extension)
  {
    extensions_.push_back(extension);
  }
  inline const std::vector< SbcBoundExtension * > &extensions() const
  {
    return extensions_;
  }
  //@}

private:
  /// Child of parent - copies relaxation and tightens one bound
  SbcNode(const SbcNode &parent, int branchVariable, int branchWay);
  /// Illegal
  SbcNode(const SbcNode &);
  SbcNode &operator=(const SbcNode &);

  /// Check problem form and branch description
  void checkConsistency() const;
  /// Copy results of solve into node
  void takeResults(SbcRelaxation::Status status);

  /// Relaxation (owns solver)
  SbcRelaxation relaxation_;
  /// Integer variables (sorted)
  std::vector< int > integers_;
  /// Lower bound
  double lowerBound_;
  /// Objective of last solve
  double objectiveValue_;
  /// Objective of parent
  double parentObjective_;
  /// Objective before extensions
  double objectiveBeforeCuts_;
  /// Solution
  std::vector< double > solution_;
  /// Basis to warm start from (owned)
  CoinWarmStart *warmStart_;
  /// Extensions (not owned)
  std::vector< SbcBoundExtension * > extensions_;
  /// Integer tolerance
  double integerTolerance_;
  /// Branch variable or -1
  int branchVariable_;
  /// -1 down, +1 up, 0 root
  int branchWay_;
  /// Value branched on
  double branchValue_;
  /// Depth
  int depth_;
  /// Node number
  int nodeNumber_;
  /// Iterations
  int numberIterations_;
  /// Rows added
  int numberCutsAdded_;
  bool lpFeasible_;
  bool mipFeasible_;
  bool unbounded_;
  bool bounded_;
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
