// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcCutGenerator_H
#define SbcCutGenerator_H

#include "SbcBoundExtension.hpp"

class CglCutGenerator;
class CoinMessageHandler;
class CoinMessages;
class OsiRowCut;
class OsiSolverInterface;

/** Interface between Sbc and Cut Generation Library.

  \c SbcCutGenerator is intended to provide an intelligent interface between
  Sbc and the cutting plane algorithms in the CGL. A \c SbcCutGenerator is
  bound to a \c CglCutGenerator and is run as a bounding extension of each
  node.

  Every cut is checked before it is added: it must be violated at the
  relaxation point by at least SbcCutViolationTolerance and, when the
  incumbent lies in the node's box, must not cut the incumbent off. Cuts
  stated as <= rows are turned round so that the relaxation keeps the form
  Ax >= b; ranged cuts are rejected.
*/
class SbcCutGenerator : public SbcBoundExtension {

public:
  /**@name Constructors and destructors */
  //@{
  /// Normal constructor - clones generator
  SbcCutGenerator(const CglCutGenerator &generator, const char *name = NULL);

  /// Copy constructor
  SbcCutGenerator(const SbcCutGenerator &);

  /// Assignment operator
  SbcCutGenerator &operator=(const SbcCutGenerator &rhs);

  /// Destructor
  virtual ~SbcCutGenerator();
  //@}

  /// Generate, check and add cuts at node
  virtual int extend(SbcNode &node, const SbcSettings &settings,
    const double *incumbent, int pass);

  /// return name of generator
  virtual const char *name() const
  {
    return generatorName_;
  }

  /** Check one cut. Returns 0 if it may be added, 1 if it is not violated
      enough, 2 if it cuts off the incumbent. */
  int checkCut(const OsiRowCut &cut, const double *solution, const double *incumbent,
    double tolerance) const;

  /// Pass in message handler (not owned, may be NULL)
  void passInMessageHandler(CoinMessageHandler *handler, const CoinMessages *messages);

  /**@name Gets and sets */
  //@{
  /// Get the \c CglCutGenerator corresponding to this \c SbcCutGenerator.
  inline CglCutGenerator *generator() const
  {
    return generator_;
  }
  /// Number times cut generator entered
  inline int numberTimesEntered() const
  {
    return numberTimes_;
  }
  /// Total number of cuts added
  inline int numberCutsInTotal() const
  {
    return numberCuts_;
  }
  /// Total number of cuts rejected
  inline int numberCutsRejected() const
  {
    return numberRejected_;
  }
  /// Cuts rejected because they cut off the incumbent
  inline int numberCutsInvalid() const
  {
    return numberInvalid_;
  }
  /// Return time taken in cut generator
  inline double timeInCutGenerator() const
  {
    return timeInCutGenerator_;
  }
  //@}

private:
  /// True if incumbent is within bounds of solver
  static bool inBox(const OsiSolverInterface &solver, const double *incumbent);

  /// The CglCutGenerator object (owned)
  CglCutGenerator *generator_;
  /// Name of generator
  char *generatorName_;
  /// Message handler (not owned)
  CoinMessageHandler *handler_;
  /// Messages (not owned)
  const CoinMessages *messages_;
  /// Time in cut generator
  double timeInCutGenerator_;
  /// Number times cut generator entered
  int numberTimes_;
  /// Total number of cuts added
  int numberCuts_;
  /// Total number of cuts rejected
  int numberRejected_;
  /// Total number of cuts cutting off incumbent
  int numberInvalid_;
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
