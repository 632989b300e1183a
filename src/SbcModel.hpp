// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcModel_H
#define SbcModel_H

#include <vector>

#include "CoinMessageHandler.hpp"
#include "SbcMessage.hpp"
#include "SbcSettings.hpp"
#include "SbcPseudoCosts.hpp"
#include "SbcCompareBound.hpp"
#include "SbcTree.hpp"

class OsiSolverInterface;
class CglCutGenerator;
class SbcCutGenerator;
class SbcBranchDecision;

/** Simple Branch and Cut Model class

  The model owns a clone of the problem (rows Ax >= b, variables >= 0,
  minimization), the settings, the tree of open nodes, the incumbent and
  the pseudo cost history. branchAndBound() runs a best first search:

  - take the node with smallest lower bound off the tree
    (stop first if the node or time limit has been reached);
  - bound it; a node whose relaxation breaks down numerically is
    abandoned but its bound is kept in the reported best possible;
  - prune it if infeasible or not better than the incumbent;
  - if integer feasible make it the incumbent and clean the tree;
  - else branch and push both children.

  The best possible objective reported at the end is the minimum of the
  bounds left on the tree, the incumbent and abandoned nodes.
*/
class SbcModel {

public:
  /// Search result
  enum Status {
    notStarted = -1,
    optimal = 0,
    infeasible,
    unbounded,
    nodeLimitReached,
    timeLimitReached
  };

  /**@name Constructors and destructors */
  //@{
  /** Constructor from solver (cloned). Integer variables are those the
      solver says are integer. */
  SbcModel(const OsiSolverInterface &solver);
  /// Constructor with explicit integer variables
  SbcModel(const OsiSolverInterface &solver, const std::vector< int > &integers);
  /// Destructor
  ~SbcModel();
  //@}

  /**@name Solve */
  //@{
  /// Run the search
  void branchAndBound();
  //@}

  /**@name Settings */
  //@{
  inline SbcSettings &settings()
  {
    return settings_;
  }
  inline const SbcSettings &settings() const
  {
    return settings_;
  }
  void setSettings(const SbcSettings &settings);
  /// Set an integer parameter
  inline void setIntParam(SbcSettings::SbcIntParam key, int value)
  {
    settings_.setIntParam(key, value);
  }
  /// Set a double parameter
  inline void setDblParam(SbcSettings::SbcDblParam key, double value)
  {
    settings_.setDblParam(key, value);
  }
  /// Set the maximum number of nodes
  inline void setMaximumNodes(int value)
  {
    settings_.setIntParam(SbcSettings::SbcMaxNumNode, value);
  }
  /// Set the maximum number of seconds
  inline void setMaximumSeconds(double value)
  {
    settings_.setDblParam(SbcSettings::SbcMaximumSeconds, value);
  }
  /** Branching method (cloned). If none is set one is created from
      SbcBranchStrategy. */
  void setBranchingMethod(const SbcBranchDecision &method);
  inline SbcBranchDecision *branchingMethod() const
  {
    return branchingMethod_;
  }
  /** Add a cut generator (cloned). Cut generators added are always used;
      with SbcCutGeneration set and none added a Gomory generator is
      created. */
  void addCutGenerator(const CglCutGenerator &generator, const char *name = NULL);
  inline int numberCutGenerators() const
  {
    return static_cast< int >(generators_.size());
  }
  inline SbcCutGenerator *cutGenerator(int i) const
  {
    return generators_[i];
  }
  //@}

  /**@name Results */
  //@{
  inline Status status() const
  {
    return status_;
  }
  /// Search completed with an incumbent and no node abandoned
  inline bool isProvenOptimal() const
  {
    return status_ == optimal && !numberAbandoned_;
  }
  inline bool isProvenInfeasible() const
  {
    return status_ == infeasible;
  }
  inline bool isContinuousUnbounded() const
  {
    return status_ == unbounded;
  }
  inline bool isNodeLimitReached() const
  {
    return status_ == nodeLimitReached;
  }
  inline bool isSecondsLimitReached() const
  {
    return status_ == timeLimitReached;
  }
  /// Objective of incumbent (COIN_DBL_MAX if none)
  inline double getObjValue() const
  {
    return bestObjective_;
  }
  /// Incumbent (NULL if none)
  inline const double *bestSolution() const
  {
    return bestSolution_.empty() ? NULL : &bestSolution_[0];
  }
  /// Best possible objective
  inline double getBestPossibleObjective() const
  {
    return bestPossibleObjective_;
  }
  /// Nodes bounded
  inline int getNodeCount() const
  {
    return numberNodes_;
  }
  /// Simplex iterations
  inline int getIterationCount() const
  {
    return numberIterations_;
  }
  /// Nodes abandoned after numerical trouble
  inline int numberAbandoned() const
  {
    return numberAbandoned_;
  }
  /// Solutions found
  inline int getSolutionCount() const
  {
    return numberSolutions_;
  }
  /// Wall clock seconds since search started
  double getCurrentSeconds() const;
  //@}

  /**@name Problem */
  //@{
  inline const OsiSolverInterface *solver() const
  {
    return solver_;
  }
  inline const std::vector< int > &integers() const
  {
    return integers_;
  }
  inline SbcPseudoCosts &pseudoCosts()
  {
    return pseudoCosts_;
  }
  inline SbcTree &tree()
  {
    return tree_;
  }
  //@}

  /**@name Message handling */
  //@{
  /// Pass in Message handler (not deleted at end)
  void passInMessageHandler(CoinMessageHandler *handler);
  /// Set language
  void newLanguage(CoinMessages::Language language);
  /// Return handler
  inline CoinMessageHandler *messageHandler() const
  {
    return handler_;
  }
  /// Return messages
  inline CoinMessages &messages()
  {
    return messages_;
  }
  /// Set log level
  void setLogLevel(int value);
  /// Get log level
  inline int logLevel() const
  {
    return handler_->logLevel();
  }
  //@}

private:
  /// Illegal
  SbcModel(const SbcModel &);
  SbcModel &operator=(const SbcModel &);

  /// Shared part of constructors
  void gutsOfConstructor();
  /// Create default branching and cut generators for current settings
  void setupForSearch();

  /// Problem (owned)
  OsiSolverInterface *solver_;
  /// Integer variables
  std::vector< int > integers_;
  /// Settings
  SbcSettings settings_;
  /// Tree
  SbcTree tree_;
  /// Node comparison
  SbcCompareBound compare_;
  /// Pseudo costs
  SbcPseudoCosts pseudoCosts_;
  /// Branching method (owned)
  SbcBranchDecision *branchingMethod_;
  /// True if branching method was created from settings
  bool defaultBranching_;
  /// Cut generators (owned)
  std::vector< SbcCutGenerator * > generators_;
  /// Number of generators added by user
  int numberUserGenerators_;
  /// Message handler
  CoinMessageHandler *handler_;
  /// Flag to say if handler_ is the default handler.
  bool defaultHandler_;
  /// Messages
  SbcMessage messages_;
  /// Incumbent
  std::vector< double > bestSolution_;
  double bestObjective_;
  double bestPossibleObjective_;
  /// Smallest bound of abandoned node
  double abandonedBound_;
  double startTime_;
  Status status_;
  int numberNodes_;
  int numberIterations_;
  int numberAbandoned_;
  int numberSolutions_;
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
