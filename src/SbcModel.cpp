// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#if defined(_MSC_VER)
// Turn off compiler warning about long names
#pragma warning(disable : 4786)
#endif

#include <cmath>

#include "CoinHelperFunctions.hpp"
#include "CoinTime.hpp"
#include "CoinError.hpp"
#include "OsiSolverInterface.hpp"
#include "CglCutGenerator.hpp"
#include "SbcNode.hpp"
#include "SbcBranchActual.hpp"
#include "SbcCutGenerator.hpp"
#include "SbcGomoryCuts.hpp"
#include "SbcModel.hpp"

SbcModel::SbcModel(const OsiSolverInterface &solver)
  : solver_(solver.clone())
{
  int numberColumns = solver_->getNumCols();
  for (int iColumn = 0; iColumn < numberColumns; iColumn++) {
    if (solver_->isInteger(iColumn))
      integers_.push_back(iColumn);
  }
  gutsOfConstructor();
}

SbcModel::SbcModel(const OsiSolverInterface &solver, const std::vector< int > &integers)
  : solver_(solver.clone())
  , integers_(integers)
{
  gutsOfConstructor();
}

void SbcModel::gutsOfConstructor()
{
  branchingMethod_ = NULL;
  defaultBranching_ = true;
  numberUserGenerators_ = 0;
  handler_ = new CoinMessageHandler();
  handler_->setLogLevel(settings_.getIntParam(SbcSettings::SbcLogLevel));
  defaultHandler_ = true;
  bestObjective_ = COIN_DBL_MAX;
  bestPossibleObjective_ = -COIN_DBL_MAX;
  abandonedBound_ = COIN_DBL_MAX;
  startTime_ = CoinGetTimeOfDay();
  status_ = notStarted;
  numberNodes_ = 0;
  numberIterations_ = 0;
  numberAbandoned_ = 0;
  numberSolutions_ = 0;
  tree_.setComparison(compare_);
}

SbcModel::~SbcModel()
{
  tree_.clear();
  for (size_t i = 0; i < generators_.size(); i++)
    delete generators_[i];
  delete branchingMethod_;
  if (defaultHandler_)
    delete handler_;
  delete solver_;
}

void SbcModel::setSettings(const SbcSettings &settings)
{
  settings_ = settings;
  handler_->setLogLevel(settings_.getIntParam(SbcSettings::SbcLogLevel));
}

void SbcModel::setBranchingMethod(const SbcBranchDecision &method)
{
  delete branchingMethod_;
  branchingMethod_ = method.clone();
  defaultBranching_ = false;
}

void SbcModel::addCutGenerator(const CglCutGenerator &generator, const char *name)
{
  // keep user generators in front of any created from settings
  generators_.insert(generators_.begin() + numberUserGenerators_,
    new SbcCutGenerator(generator, name));
  numberUserGenerators_++;
}

void SbcModel::passInMessageHandler(CoinMessageHandler *handler)
{
  if (defaultHandler_) {
    delete handler_;
    handler_ = NULL;
  }
  defaultHandler_ = false;
  handler_ = handler;
}

void SbcModel::newLanguage(CoinMessages::Language language)
{
  messages_ = SbcMessage(language);
}

void SbcModel::setLogLevel(int value)
{
  settings_.setIntParam(SbcSettings::SbcLogLevel, value);
  handler_->setLogLevel(value);
}

double
SbcModel::getCurrentSeconds() const
{
  return CoinGetTimeOfDay() - startTime_;
}

void SbcModel::setupForSearch()
{
  if (defaultBranching_) {
    delete branchingMethod_;
    switch (settings_.branchStrategy()) {
    case SbcSettings::StrongBranching:
      branchingMethod_ = new SbcBranchStrong();
      break;
    case SbcSettings::PseudoCostBranching:
      branchingMethod_ = new SbcBranchPseudoCost();
      break;
    default:
      branchingMethod_ = new SbcBranchMostFractional();
      break;
    }
  }
  branchingMethod_->passInMessageHandler(handler_, &messages_);
  // generators created from settings are remade every time
  for (size_t i = numberUserGenerators_; i < generators_.size(); i++)
    delete generators_[i];
  generators_.resize(numberUserGenerators_);
  if (settings_.cutGeneration()) {
    handler_->message(SBC_CUTS_EXPERIMENTAL, messages_) << CoinMessageEol;
    if (!numberUserGenerators_) {
      SbcGomoryCuts gomory;
      gomory.setCutOptimizationNodeLimit(
        settings_.getIntParam(SbcSettings::SbcCutOptimizationNodeLimit));
      gomory.setIntegerTolerance(settings_.integerTolerance());
      gomory.passInMessageHandler(handler_, &messages_);
      generators_.push_back(new SbcCutGenerator(gomory, "Gomory"));
    }
  }
  for (size_t i = 0; i < generators_.size(); i++)
    generators_[i]->passInMessageHandler(handler_, &messages_);
}

void SbcModel::branchAndBound()
{
  startTime_ = CoinGetTimeOfDay();
  handler_->setLogLevel(settings_.getIntParam(SbcSettings::SbcLogLevel));
  tree_.clear();
  bestSolution_.clear();
  bestObjective_ = COIN_DBL_MAX;
  bestPossibleObjective_ = -COIN_DBL_MAX;
  abandonedBound_ = COIN_DBL_MAX;
  status_ = notStarted;
  numberNodes_ = 0;
  numberIterations_ = 0;
  numberAbandoned_ = 0;
  numberSolutions_ = 0;
  pseudoCosts_.initialize(*solver_);
  setupForSearch();
  if (integers_.empty())
    handler_->message(SBC_NOINT, messages_) << CoinMessageEol;

  // contract errors in problem come out of here
  SbcNode *root = new SbcNode(*solver_, integers_);
  for (size_t i = 0; i < generators_.size(); i++)
    root->addExtension(generators_[i]);
  tree_.push(root);

  int maximumNodes = settings_.maximumNodes();
  double maximumSeconds = settings_.maximumSeconds();
  double increment = settings_.getDblParam(SbcSettings::SbcCutoffIncrement);
  Status stoppedOn = optimal;
  while (!tree_.empty()) {
    if (numberNodes_ >= maximumNodes) {
      stoppedOn = nodeLimitReached;
      break;
    }
    if (getCurrentSeconds() > maximumSeconds) {
      stoppedOn = timeLimitReached;
      break;
    }
    SbcNode *node = tree_.bestNode();
    if (node->lowerBound() >= bestObjective_ - increment) {
      delete node;
      continue;
    }
    numberNodes_++;
    try {
      node->bound(settings_, bestSolution());
    } catch (SbcNumericalError &error) {
      numberAbandoned_++;
      abandonedBound_ = CoinMin(abandonedBound_, node->lowerBound());
      handler_->message(SBC_ABANDONED, messages_)
        << node->nodeNumber() << error.message() << CoinMessageEol;
      delete node;
      continue;
    } catch (CoinError &) {
      delete node;
      throw;
    }
    numberIterations_ += node->numberIterations();
    if (!node->depth() && node->numberCutsAdded()) {
      handler_->message(SBC_ROOT, messages_)
        << node->numberCutsAdded() << node->objectiveBeforeCuts()
        << node->objectiveValue() << CoinMessageEol;
    }
    if (node->branchVariable() >= 0)
      branchingMethod_->updateInformation(*node, &pseudoCosts_);
    if (node->unbounded()) {
      handler_->message(SBC_UNBOUNDED, messages_)
        << node->nodeNumber() << CoinMessageEol;
      stoppedOn = unbounded;
      delete node;
      break;
    }
    if (!node->lpFeasible() || node->lowerBound() >= bestObjective_ - increment) {
      delete node;
    } else if (node->mipFeasible()) {
      if (node->objectiveValue() < bestObjective_) {
        bestObjective_ = node->objectiveValue();
        bestSolution_ = node->solution();
        numberSolutions_++;
        handler_->message(SBC_SOLUTION, messages_)
          << bestObjective_ << numberIterations_ << numberNodes_
          << getCurrentSeconds() << CoinMessageEol;
        tree_.cleanTree(bestObjective_ - increment);
      }
      delete node;
    } else {
      SbcNodeChildren children;
      try {
        children = node->branch(settings_, branchingMethod_, &pseudoCosts_);
      } catch (CoinError &) {
        delete node;
        throw;
      }
      handler_->message(SBC_BRANCH, messages_)
        << node->nodeNumber() << node->objectiveValue() << node->depth()
        << children.down->branchVariable() << children.down->branchValue()
        << CoinMessageEol;
      delete node;
      tree_.push(children.down);
      tree_.push(children.up);
    }
    if (numberNodes_ % 100 == 0) {
      handler_->message(SBC_STATUS, messages_)
        << numberNodes_ << tree_.size() << bestObjective_
        << CoinMin(tree_.getBestPossibleObjective(), bestObjective_)
        << getCurrentSeconds() << CoinMessageEol;
    }
  }

  bestPossibleObjective_ = CoinMin(tree_.getBestPossibleObjective(), bestObjective_);
  bestPossibleObjective_ = CoinMin(bestPossibleObjective_, abandonedBound_);
  if (stoppedOn == unbounded) {
    status_ = unbounded;
    bestPossibleObjective_ = -COIN_DBL_MAX;
  } else if (stoppedOn == nodeLimitReached) {
    handler_->message(SBC_MAXNODES, messages_) << CoinMessageEol;
    status_ = nodeLimitReached;
  } else if (stoppedOn == timeLimitReached) {
    handler_->message(SBC_MAXTIME, messages_) << CoinMessageEol;
    status_ = timeLimitReached;
  } else if (bestSolution_.size()) {
    status_ = optimal;
  } else {
    handler_->message(SBC_INFEAS, messages_) << numberNodes_ << CoinMessageEol;
    status_ = infeasible;
  }
  if (numberAbandoned_)
    handler_->message(SBC_ABANDONED_SUMMARY, messages_) << numberAbandoned_ << CoinMessageEol;
  if (status_ == optimal && !numberAbandoned_) {
    handler_->message(SBC_END_GOOD, messages_)
      << bestObjective_ << numberIterations_ << numberNodes_ << getCurrentSeconds()
      << CoinMessageEol;
  } else if (status_ != unbounded) {
    handler_->message(SBC_END, messages_)
      << bestObjective_ << bestPossibleObjective_
      << numberIterations_ << numberNodes_ << getCurrentSeconds()
      << CoinMessageEol;
  }
  for (size_t i = 0; i < generators_.size(); i++) {
    SbcCutGenerator *generator = generators_[i];
    handler_->message(SBC_GENERATOR, messages_)
      << static_cast< int >(i) << generator->name()
      << generator->numberCutsInTotal() << generator->numberCutsRejected()
      << generator->timeInCutGenerator() << CoinMessageEol;
  }
  tree_.clear();
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
