// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcBranchActual_H
#define SbcBranchActual_H

#include "SbcBranchDecision.hpp"

/** Branch on the integer variable whose fractional part is nearest 0.5 */
class SbcBranchMostFractional : public SbcBranchDecision {
public:
  SbcBranchMostFractional();
  SbcBranchMostFractional(const SbcBranchMostFractional &);
  virtual ~SbcBranchMostFractional();
  virtual SbcBranchDecision *clone() const;
  virtual const char *name() const
  {
    return "most fractional";
  }
  virtual SbcNodeChildren createBranch(SbcNode &node, const SbcSettings &settings,
    SbcPseudoCosts *pseudoCosts);
};

/** Strong branching

  Takes the SbcNumberStrong most fractional variables, solves both children
  of each with at most SbcStrongIterations simplex iterations and keeps the
  variable whose worse child improves the bound most. The children of the
  chosen variable are returned with the bounds found.
*/
class SbcBranchStrong : public SbcBranchDecision {
public:
  SbcBranchStrong();
  SbcBranchStrong(const SbcBranchStrong &);
  virtual ~SbcBranchStrong();
  virtual SbcBranchDecision *clone() const;
  virtual const char *name() const
  {
    return "strong";
  }
  virtual SbcNodeChildren createBranch(SbcNode &node, const SbcSettings &settings,
    SbcPseudoCosts *pseudoCosts);
  /// Candidates in order of fractionality (at most \p number)
  static std::vector< int > candidates(const SbcNode &node, int number);
};

/** Pseudo cost branching

  Scores each fractional variable as min(down*f,up*(1-f)) using the history
  in SbcPseudoCosts and branches on the best. The history is updated from
  every bounded child.
*/
class SbcBranchPseudoCost : public SbcBranchDecision {
public:
  SbcBranchPseudoCost();
  SbcBranchPseudoCost(const SbcBranchPseudoCost &);
  virtual ~SbcBranchPseudoCost();
  virtual SbcBranchDecision *clone() const;
  virtual const char *name() const
  {
    return "pseudo cost";
  }
  virtual SbcNodeChildren createBranch(SbcNode &node, const SbcSettings &settings,
    SbcPseudoCosts *pseudoCosts);
  virtual void updateInformation(const SbcNode &child, SbcPseudoCosts *pseudoCosts);
  /// Variable with best score, -1 if none fractional
  static int bestIndex(const SbcNode &node, const SbcPseudoCosts &pseudoCosts);
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
