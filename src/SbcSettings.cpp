// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include <climits>
#include <cstdlib>
#include <cerrno>

#include "CoinFinite.hpp"
#include "CoinError.hpp"
#include "SbcSettings.hpp"

namespace {

int intValue(const std::string &keyword, const std::string &value)
{
  char *end = NULL;
  errno = 0;
  long result = strtol(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || errno || result > INT_MAX || result < INT_MIN)
    throw CoinError("bad integer value \"" + value + "\" for " + keyword,
      "setParameter", "SbcSettings");
  return static_cast< int >(result);
}

double dblValue(const std::string &keyword, const std::string &value)
{
  char *end = NULL;
  errno = 0;
  double result = strtod(value.c_str(), &end);
  if (value.empty() || *end != '\0' || errno)
    throw CoinError("bad double value \"" + value + "\" for " + keyword,
      "setParameter", "SbcSettings");
  return result;
}

bool onOff(const std::string &keyword, const std::string &value)
{
  if (value == "on" || value == "1")
    return true;
  if (value == "off" || value == "0")
    return false;
  throw CoinError("expected on or off for " + keyword + ", got \"" + value + "\"",
    "setParameter", "SbcSettings");
}

} // end file-local namespace

SbcSettings::SbcSettings()
{
  intParam_[SbcMaxNumNode] = INT_MAX;
  intParam_[SbcBranchStrategy] = MostFractional;
  intParam_[SbcCutGeneration] = 0;
  intParam_[SbcCutOptimizationNodeLimit] = 10;
  intParam_[SbcStrongIterations] = 20;
  intParam_[SbcNumberStrong] = 5;
  intParam_[SbcMaxCutPasses] = 1;
  intParam_[SbcLogLevel] = 1;
  dblParam_[SbcIntegerTolerance] = 1.0e-7;
  dblParam_[SbcMaximumSeconds] = COIN_DBL_MAX;
  dblParam_[SbcCutoffIncrement] = 1.0e-6;
  dblParam_[SbcCutViolationTolerance] = 1.0e-6;
}

void SbcSettings::setIntParam(SbcIntParam key, int value)
{
  switch (key) {
  case SbcBranchStrategy:
    if (value < MostFractional || value > PseudoCostBranching)
      throw CoinError("unknown branching strategy", "setIntParam", "SbcSettings");
    break;
  case SbcStrongIterations:
  case SbcNumberStrong:
    if (value <= 0)
      throw CoinError("strong branching limits must be positive", "setIntParam", "SbcSettings");
    break;
  case SbcLastIntParam:
    throw CoinError("not a parameter", "setIntParam", "SbcSettings");
  default:
    if (value < 0)
      throw CoinError("limits must not be negative", "setIntParam", "SbcSettings");
    break;
  }
  intParam_[key] = value;
}

void SbcSettings::setDblParam(SbcDblParam key, double value)
{
  if (key == SbcLastDblParam)
    throw CoinError("not a parameter", "setDblParam", "SbcSettings");
  if (key == SbcIntegerTolerance) {
    if (!(value > 0.0 && value < 0.5))
      throw CoinError("integer tolerance must lie in (0,0.5)", "setDblParam", "SbcSettings");
  } else if (!(value >= 0.0)) {
    throw CoinError("value must not be negative", "setDblParam", "SbcSettings");
  }
  dblParam_[key] = value;
}

void SbcSettings::setParameter(const std::string &keyword, const std::string &value)
{
  if (keyword == "maxNodes") {
    setIntParam(SbcMaxNumNode, intValue(keyword, value));
  } else if (keyword == "strategy") {
    if (value == "fractional")
      setIntParam(SbcBranchStrategy, MostFractional);
    else if (value == "strong")
      setIntParam(SbcBranchStrategy, StrongBranching);
    else if (value == "pseudo")
      setIntParam(SbcBranchStrategy, PseudoCostBranching);
    else
      throw CoinError("unknown strategy \"" + value + "\"", "setParameter", "SbcSettings");
  } else if (keyword == "cuts") {
    setIntParam(SbcCutGeneration, onOff(keyword, value) ? 1 : 0);
  } else if (keyword == "cutNodes") {
    setIntParam(SbcCutOptimizationNodeLimit, intValue(keyword, value));
  } else if (keyword == "strongIterations") {
    setIntParam(SbcStrongIterations, intValue(keyword, value));
  } else if (keyword == "numberStrong") {
    setIntParam(SbcNumberStrong, intValue(keyword, value));
  } else if (keyword == "cutPasses") {
    setIntParam(SbcMaxCutPasses, intValue(keyword, value));
  } else if (keyword == "logLevel") {
    setIntParam(SbcLogLevel, intValue(keyword, value));
  } else if (keyword == "integerTolerance") {
    setDblParam(SbcIntegerTolerance, dblValue(keyword, value));
  } else if (keyword == "seconds") {
    setDblParam(SbcMaximumSeconds, dblValue(keyword, value));
  } else if (keyword == "cutoffIncrement") {
    setDblParam(SbcCutoffIncrement, dblValue(keyword, value));
  } else if (keyword == "violation") {
    setDblParam(SbcCutViolationTolerance, dblValue(keyword, value));
  } else {
    throw CoinError("unknown parameter \"" + keyword + "\"", "setParameter", "SbcSettings");
  }
}

bool SbcSettings::setParameter(const std::string &assignment)
{
  std::string::size_type eqPos = assignment.find('=');
  if (eqPos == std::string::npos)
    return false;
  setParameter(assignment.substr(0, eqPos), assignment.substr(eqPos + 1));
  return true;
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
