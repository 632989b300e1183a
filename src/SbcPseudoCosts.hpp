// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcPseudoCosts_H
#define SbcPseudoCosts_H

#include <vector>

class OsiSolverInterface;

/** Pseudo cost history of one search.

  For each variable and direction keeps the sum of observed objective
  degradation per unit change and the number of observations. Until a
  direction has been observed its cost is max(1.0e-5,|c_j|). Owned by
  SbcModel and handed to branching decisions.
*/
class SbcPseudoCosts {

public:
  /// Default Constructor
  SbcPseudoCosts();

  /// Size for solver and set initial costs from objective
  void initialize(const OsiSolverInterface &solver);

  /// Number of variables
  inline int numberColumns() const
  {
    return static_cast< int >(initialCost_.size());
  }
  /// Down pseudo cost (average or initial)
  double downPseudoCost(int iColumn) const;
  /// Up pseudo cost (average or initial)
  double upPseudoCost(int iColumn) const;
  /// Number of down observations
  inline int numberTimesDown(int iColumn) const
  {
    return numberTimesDown_[iColumn];
  }
  /// Number of up observations
  inline int numberTimesUp(int iColumn) const
  {
    return numberTimesUp_[iColumn];
  }
  /// Overwrite history with given costs (counted as one observation each)
  void setPseudoCosts(int iColumn, double downCost, double upCost);

  /** Record a branch. \p way is -1 or +1, \p change the distance the
      variable moved to reach its new bound, \p degradation the increase in
      objective. */
  void update(int iColumn, int way, double change, double degradation);

  /// Estimated bound degradation min(down*f,up*(1-f)) at value
  double score(int iColumn, double value) const;

private:
  std::vector< double > initialCost_;
  std::vector< double > sumDownCost_;
  std::vector< double > sumUpCost_;
  std::vector< int > numberTimesDown_;
  std::vector< int > numberTimesUp_;
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
