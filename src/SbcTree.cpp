// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include <algorithm>

#include "CoinError.hpp"
#include "SbcTree.hpp"

SbcTree::SbcTree()
  : maximumNodeNumber_(0)
{
}

SbcTree::~SbcTree()
{
  clear();
}

void SbcTree::setComparison(SbcCompareBase &compare)
{
  comparison_.test_ = &compare;
  std::make_heap(nodes_.begin(), nodes_.end(), comparison_);
}

// Return the top node of the heap
SbcNode *
SbcTree::top() const
{
  if (nodes_.empty())
    throw CoinError("tree is empty", "top", "SbcTree");
  return nodes_.front();
}

// Add a node to the heap
void SbcTree::push(SbcNode *x)
{
  if (!comparison_.test_)
    throw CoinError("no comparison set", "push", "SbcTree");
  x->setNodeNumber(maximumNodeNumber_);
  maximumNodeNumber_++;
  nodes_.push_back(x);
  std::push_heap(nodes_.begin(), nodes_.end(), comparison_);
}

// Remove the top node from the heap
void SbcTree::pop()
{
  if (nodes_.empty())
    throw CoinError("tree is empty", "pop", "SbcTree");
  std::pop_heap(nodes_.begin(), nodes_.end(), comparison_);
  nodes_.pop_back();
}

SbcNode *
SbcTree::bestNode()
{
  if (nodes_.empty())
    return NULL;
  SbcNode *best = nodes_.front();
  pop();
  return best;
}

int SbcTree::cleanTree(double cutoff)
{
  int numberDeleted = 0;
  size_t k = 0;
  for (size_t j = 0; j < nodes_.size(); j++) {
    SbcNode *node = nodes_[j];
    if (node->lowerBound() >= cutoff) {
      delete node;
      numberDeleted++;
    } else {
      nodes_[k++] = node;
    }
  }
  nodes_.resize(k);
  // node numbers are kept so ties still go to earlier nodes
  std::make_heap(nodes_.begin(), nodes_.end(), comparison_);
  return numberDeleted;
}

double
SbcTree::getBestPossibleObjective() const
{
  double bestPossibleObjective = COIN_DBL_MAX;
  for (size_t j = 0; j < nodes_.size(); j++)
    bestPossibleObjective = CoinMin(bestPossibleObjective, nodes_[j]->lowerBound());
  return bestPossibleObjective;
}

void SbcTree::clear()
{
  for (size_t j = 0; j < nodes_.size(); j++)
    delete nodes_[j];
  nodes_.clear();
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
