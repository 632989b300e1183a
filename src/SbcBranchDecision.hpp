// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcBranchDecision_H
#define SbcBranchDecision_H

#include "SbcNode.hpp"

class CoinMessageHandler;
class CoinMessages;

/** Abstract branching decision base class

  A decision picks the variable to branch on at a bounded, fractional node
  and creates the two children. After a child has been bounded the search
  calls #updateInformation so that history based decisions can learn from
  the observed change in objective.

  Any state kept across nodes (pseudo costs) is owned by the caller and
  passed in, so one decision object can serve nested searches.
*/
class SbcBranchDecision {
public:
  /// Default Constructor
  SbcBranchDecision();

  /// Copy constructor
  SbcBranchDecision(const SbcBranchDecision &);

  /// Destructor
  virtual ~SbcBranchDecision();

  /// Clone
  virtual SbcBranchDecision *clone() const = 0;

  /// Name for messages
  virtual const char *name() const = 0;

  /** Choose a variable at \p node and create children (caller owns).
      Children may already carry an improved lower bound. */
  virtual SbcNodeChildren createBranch(SbcNode &node, const SbcSettings &settings,
    SbcPseudoCosts *pseudoCosts)
    = 0;

  /** Pass in information on a child just bounded. */
  virtual void updateInformation(const SbcNode &, SbcPseudoCosts *) {}

  /// Pass in message handler (not owned, may be NULL)
  void passInMessageHandler(CoinMessageHandler *handler, const CoinMessages *messages);

protected:
  /// Message handler (not owned)
  CoinMessageHandler *handler_;
  /// Messages (not owned)
  const CoinMessages *messages_;

private:
  /// Assignment is illegal
  SbcBranchDecision &operator=(const SbcBranchDecision &rhs);
};
#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
