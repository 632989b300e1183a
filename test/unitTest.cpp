// $Id$
// Copyright (C) 2002, International Business Machines
// Corporation and others.  All Rights Reserved.
// This code is licensed under the terms of the Eclipse Public License (EPL).

#include "CoinPragma.hpp"

#include <cstdio>
#include <iostream>

#include "CoinError.hpp"
#include "OsiUnitTests.hpp"
#include "SbcUnitTests.hpp"

using namespace OsiUnitTest;

namespace {

// Display message on stdout and stderr. Flush cout buffer before printing the
// message, so that output comes out in order in spite of buffered cout.
void testingMessage(const char *const msg)
{
  std::cout.flush();
  std::cerr << msg;
}

} // end file-local namespace

//----------------------------------------------------------------
// unitTest [-verbosity=V]
//
// where:
//   -verbosity: 0 prints failures only, 1 adds a note per test and
//               2 prints every passed check
//----------------------------------------------------------------

int main(int argc, const char *argv[])
{
  /*
    Synchronise C and C++ stream i/o. Make sure the test messages come out
    in order.
  */
  std::ios::sync_with_stdio();

  for (int i = 1; i < argc; i++) {
    unsigned int value;
    if (sscanf(argv[i], "-verbosity=%u", &value) == 1)
      verbosity = value;
  }

  try {
    testingMessage("Testing SbcSettings\n");
    SbcSettingsUnitTest();

    testingMessage("Testing SbcNode\n");
    SbcNodeUnitTest();

    testingMessage("Testing branching methods\n");
    SbcBranchUnitTest();

    testingMessage("Testing SbcTree\n");
    SbcTreeUnitTest();

    testingMessage("Testing cut generation\n");
    SbcCutsUnitTest();

    testingMessage("Testing SbcModel\n");
    SbcModelUnitTest();
  } catch (CoinError &error) {
    std::cout.flush();
    std::cerr << "Caught CoinError exception: ";
    error.print(true);
    OSIUNITTEST_ADD_OUTCOME("sbc", "unit test", "unexpected CoinError",
      TestOutcome::ERROR, false);
  }
  /*
    We're done. Report on the results.
  */
  std::cout.flush();
  outcomes.print();

  int nerrors;
  int nerrors_expected;
  outcomes.getCountBySeverity(TestOutcome::ERROR, nerrors, nerrors_expected);

  if (nerrors > nerrors_expected)
    std::cerr << "Tests completed with " << nerrors - nerrors_expected << " unexpected errors." << std::endl;
  else
    std::cerr << "All tests completed successfully\n";

  return nerrors - nerrors_expected;
}

/* vi: softtabstop=2 shiftwidth=2 expandtab tabstop=2
*/
