// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#ifndef SbcMessage_H
#define SbcMessage_H

#if defined(_MSC_VER)
// Turn off compiler warning about long names
#pragma warning(disable : 4786)
#endif

/** This deals with Sbc messages (as against Clp messages etc).
    CoinMessageHandler.hpp is the general part of message handling.
    All it has are enum's for the various messages.
    SbcMessage.cpp has text in various languages.
 */

#include "CoinMessageHandler.hpp"
enum SBC_Message {
  SBC_END_GOOD,
  SBC_END,
  SBC_MAXNODES,
  SBC_MAXTIME,
  SBC_INFEAS,
  SBC_UNBOUNDED,
  SBC_SOLUTION,
  SBC_STATUS,
  SBC_ROOT,
  SBC_BRANCH,
  SBC_STRONG,
  SBC_CUTS,
  SBC_CUT_REJECTED,
  SBC_CUT_INVALID,
  SBC_CUTS_EXPERIMENTAL,
  SBC_ABANDONED,
  SBC_ABANDONED_SUMMARY,
  SBC_START_SUB,
  SBC_END_SUB,
  SBC_GENERATOR,
  SBC_NOINT,
  SBC_DUMMY_END
};

class SbcMessage : public CoinMessages {

public:
  /**@name Constructors etc */
  //@{
  /** Constructor */
  SbcMessage(Language language = us_en);
  //@}
};

#endif

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
