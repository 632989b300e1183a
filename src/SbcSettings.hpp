// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcSettings_H
#define SbcSettings_H

#include <string>

/** Parameters controlling one branch and bound search.

  Values are held in two arrays indexed by #SbcIntParam and #SbcDblParam,
  the same way CbcModel keeps its parameters. A copy of the settings is
  taken by every SbcModel, so a nested search can be given a modified copy
  without touching the caller's.
*/
class SbcSettings {

public:
  enum SbcIntParam {
    /** The maximum number of nodes before terminating */
    SbcMaxNumNode = 0,
    /** Branching variable selection - see #SbcBranchStrategyType */
    SbcBranchStrategy,
    /** Non zero switches on Gomory cut generation at fractional nodes */
    SbcCutGeneration,
    /** Node limit of the nested search which tightens a cut's right hand
        side. Zero switches strengthening off. */
    SbcCutOptimizationNodeLimit,
    /** Simplex iteration cap for each strong branching child */
    SbcStrongIterations,
    /** Number of fractional candidates evaluated by strong branching */
    SbcNumberStrong,
    /** Number of cut and re-solve rounds at a node */
    SbcMaxCutPasses,
    /** Log level passed to the message handler */
    SbcLogLevel,
    /** Just a marker, so that a static sized array can store parameters. */
    SbcLastIntParam
  };

  enum SbcDblParam {
    /** The maximum amount the value of an integer variable can vary from
        integer and still be considered feasible. */
    SbcIntegerTolerance = 0,
    /** \brief The maximum number of wall clock seconds before terminating. */
    SbcMaximumSeconds,
    /** A node is pruned when its bound is within this amount of the
        incumbent objective. */
    SbcCutoffIncrement,
    /** A cut must be violated by at least this much at the relaxation
        point to be accepted. */
    SbcCutViolationTolerance,
    /** Just a marker, so that a static sized array can store parameters. */
    SbcLastDblParam
  };

  enum SbcBranchStrategyType {
    MostFractional = 0,
    StrongBranching,
    PseudoCostBranching
  };

  /// Default Constructor
  SbcSettings();

  /// Set an integer parameter (throws CoinError if out of range)
  void setIntParam(SbcIntParam key, int value);
  /// Set a double parameter (throws CoinError if out of range)
  void setDblParam(SbcDblParam key, double value);
  /// Get an integer parameter
  inline int getIntParam(SbcIntParam key) const
  {
    return intParam_[key];
  }
  /// Get a double parameter
  inline double getDblParam(SbcDblParam key) const
  {
    return dblParam_[key];
  }

  /** Set a parameter from keyword and value text, e.g. ("strategy","strong").

    Keywords are maxNodes, strategy, cuts, cutNodes, strongIterations,
    numberStrong, cutPasses, logLevel, integerTolerance, seconds,
    cutoffIncrement and violation. Throws CoinError on an unknown keyword or
    a malformed value.
  */
  void setParameter(const std::string &keyword, const std::string &value);
  /** Parse "keyword=value". Returns false if there is no '='. */
  bool setParameter(const std::string &assignment);

  /**@name Convenience access */
  //@{
  inline int maximumNodes() const
  {
    return intParam_[SbcMaxNumNode];
  }
  inline double maximumSeconds() const
  {
    return dblParam_[SbcMaximumSeconds];
  }
  inline double integerTolerance() const
  {
    return dblParam_[SbcIntegerTolerance];
  }
  inline SbcBranchStrategyType branchStrategy() const
  {
    return static_cast< SbcBranchStrategyType >(intParam_[SbcBranchStrategy]);
  }
  inline bool cutGeneration() const
  {
    return intParam_[SbcCutGeneration] != 0;
  }
  //@}

private:
  /// Array for integer parameters
  int intParam_[SbcLastIntParam];
  /// Array for double parameters
  double dblParam_[SbcLastDblParam];
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
