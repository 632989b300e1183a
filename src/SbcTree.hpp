// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcTree_H
#define SbcTree_H

#include <vector>

#include "SbcCompareBase.hpp"

/*! \brief Using MS heap implementation

  Open nodes are kept in a heap ordered by the comparison object. Nodes on
  the tree are owned by the tree; a node taken off with bestNode() is owned
  by the caller.
*/
class SbcTree {

public:
  // Default Constructor
  SbcTree();

  virtual ~SbcTree();

  /// Set comparison function (not owned) and rebuild heap
  void setComparison(SbcCompareBase &compare);

  /// Return the top node of the heap
  SbcNode *top() const;

  /// Add a node to the heap (takes ownership and gives it a node number)
  void push(SbcNode *x);

  /// Remove the top node from the heap (ownership passes to caller)
  void pop();

  /// Take the best node off the heap - NULL if empty
  SbcNode *bestNode();

  /// Test if empty
  inline bool empty() const
  {
    return nodes_.empty();
  }

  /// Return size
  inline int size() const
  {
    return static_cast< int >(nodes_.size());
  }

  /// Return a node pointer
  inline SbcNode *nodePointer(int i) const
  {
    return nodes_[i];
  }

  /// Number given to next node pushed
  inline int maximumNodeNumber() const
  {
    return maximumNodeNumber_;
  }

  /** Delete every node whose lower bound is at least \p cutoff.
      Returns number deleted. */
  int cleanTree(double cutoff);

  /// Smallest lower bound on tree - COIN_DBL_MAX if empty
  double getBestPossibleObjective() const;

  /// Delete all nodes
  void clear();

protected:
  std::vector< SbcNode * > nodes_;
  /// Sort function for heap ordering.
  SbcCompare comparison_;
  /// Maximum "node" number so far to split ties
  int maximumNodeNumber_;

private:
  /// Illegal
  SbcTree(const SbcTree &);
  SbcTree &operator=(const SbcTree &);
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
