// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcBoundExtension_H
#define SbcBoundExtension_H

class SbcNode;
class SbcSettings;

/** Abstract hook run by SbcNode::bound after a relaxation solve.

  A node holds an ordered list of (non owning) pointers to extensions. An
  extension may modify the node's relaxation, typically by adding rows; the
  node re-solves whenever rows were added. Children inherit the list.
*/
class SbcBoundExtension {
public:
  /// Destructor
  virtual ~SbcBoundExtension() {}

  /** Called with the node's relaxation solved to optimality and fractional.
      \p incumbent is the best known integer solution or NULL, \p pass counts
      from 0 within the node. Returns number of rows added to the node's
      relaxation.
  */
  virtual int extend(SbcNode &node, const SbcSettings &settings,
    const double *incumbent, int pass)
    = 0;

  /// Name for messages
  virtual const char *name() const = 0;
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
