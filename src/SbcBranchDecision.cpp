// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include "CoinMessageHandler.hpp"
#include "SbcBranchDecision.hpp"

SbcBranchDecision::SbcBranchDecision()
  : handler_(NULL)
  , messages_(NULL)
{
}

SbcBranchDecision::SbcBranchDecision(const SbcBranchDecision &rhs)
  : handler_(rhs.handler_)
  , messages_(rhs.messages_)
{
}

SbcBranchDecision::~SbcBranchDecision()
{
}

void SbcBranchDecision::passInMessageHandler(CoinMessageHandler *handler,
  const CoinMessages *messages)
{
  handler_ = handler;
  messages_ = messages;
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
