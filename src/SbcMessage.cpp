// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#if defined(_MSC_VER)
// Turn off compiler warning about long names
#pragma warning(disable : 4786)
#endif

#include <cstring>

#include "SbcMessage.hpp"

typedef struct {
  SBC_Message internalNumber;
  int externalNumber; // or continuation
  char detail;
  const char *message;
} Sbc_message;
static Sbc_message us_english[] = {
  { SBC_END_GOOD, 1, 1, "Search completed - best objective %g, took %d iterations and %d nodes (%.2f seconds)" },
  { SBC_END, 5, 1, "Partial search - best objective %g (best possible %g), took %d iterations and %d nodes (%.2f seconds)" },
  { SBC_MAXNODES, 3, 1, "Exiting on maximum nodes" },
  { SBC_MAXTIME, 20, 1, "Exiting on maximum time" },
  { SBC_INFEAS, 6, 1, "Problem is infeasible - %d nodes explored" },
  { SBC_UNBOUNDED, 7, 1, "The LP relaxation is unbounded at node %d" },
  { SBC_SOLUTION, 4, 1, "Integer solution of %g found after %d iterations and %d nodes (%.2f seconds)" },
  { SBC_STATUS, 10, 1, "After %d nodes, %d on tree, %g best solution, best possible %g (%.2f seconds)" },
  { SBC_ROOT, 13, 1, "At root node, %d cuts changed objective from %g to %g" },
  { SBC_BRANCH, 15, 2, "Node %d Obj %g depth %d branching on %d value %g" },
  { SBC_STRONG, 16, 3, "Strong branching on %d, down %g (%d) up %g (%d) value %g" },
  { SBC_CUTS, 17, 2, "Node %d pass %d - %s added %d cuts, objective %g" },
  { SBC_CUT_REJECTED, 18, 3, "%s cut rejected - violation %g at relaxation point" },
  { SBC_CUT_INVALID, 3001, 1, "%s cut is invalid - integer point gives %g against right hand side %g" },
  { SBC_CUTS_EXPERIMENTAL, 3002, 1, "Gomory cut generation is experimental - every cut is checked against known integer points" },
  { SBC_ABANDONED, 3003, 1, "Node %d abandoned after numerical trouble in relaxation (%s)" },
  { SBC_ABANDONED_SUMMARY, 3004, 1, "%d nodes were abandoned - bound is reported with degraded confidence" },
  { SBC_START_SUB, 28, 2, "Starting sub-tree for %s - maximum nodes %d" },
  { SBC_END_SUB, 29, 2, "Ending sub-tree for %s - best possible %g" },
  { SBC_GENERATOR, 14, 1, "Cut generator %d (%s) - %d row cuts added, %d rejected in %g seconds" },
  { SBC_NOINT, 3007, 1, "No integer variables - nothing to do" },
  { SBC_DUMMY_END, 999999, 0, "" }
};
/* Constructor */
SbcMessage::SbcMessage(Language language)
  : CoinMessages(sizeof(us_english) / sizeof(Sbc_message))
{
  language_ = language;
  strcpy(source_, "Sbc");
  class_ = 0; // branch and bound
  Sbc_message *message = us_english;

  while (message->internalNumber != SBC_DUMMY_END) {
    CoinOneMessage oneMessage(message->externalNumber, message->detail,
      message->message);
    addMessage(message->internalNumber, oneMessage);
    message++;
  }
  // Put into compact form
  toCompact();

  // now override any language ones

  switch (language) {

  default:
    message = NULL;
    break;
  }

  // replace if any found
  if (message) {
    while (message->internalNumber != SBC_DUMMY_END) {
      replaceMessage(message->internalNumber, message->message);
      message++;
    }
  }
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
