//  DO-NOT-REMOVE begin-copyright-block
// QFlex consists of several software components that are governed by various
// licensing terms, in addition to software that was developed internally.
// Anyone interested in using QFlex needs to fully understand and abide by the
// licenses governing all the software components.
//
// ### Software developed externally (not by the QFlex group)
//
//     * [NS-3] (https://www.gnu.org/copyleft/gpl.html)
//     * [QEMU] (http://wiki.qemu.org/License)
//     * [SimFlex] (http://parsa.epfl.ch/simflex/)
//     * [GNU PTH] (https://www.gnu.org/software/pth/)
//
// ### Software developed internally (by the QFlex group)
// **QFlex License**
//
// QFlex
// Copyright (c) 2020, Parallel Systems Architecture Lab, EPFL
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without modification,
// are permitted provided that the following conditions are met:
//
//     * Redistributions of source code must retain the above copyright notice,
//       this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above copyright notice,
//       this list of conditions and the following disclaimer in the documentation
//       and/or other materials provided with the distribution.
//     * Neither the name of the Parallel Systems Architecture Laboratory, EPFL,
//       nor the names of its contributors may be used to endorse or promote
//       products derived from this software without specific prior written
//       permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
// ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE PARALLEL SYSTEMS ARCHITECTURE LABORATORY,
// EPFL BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE
// GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
// HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
// LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//  DO-NOT-REMOVE end-copyright-block
#include <core/debug/debugger.hpp>
#include <core/exception.hpp>
#include <iostream>
#include <sstream>

namespace Safecracker {
namespace Dbg {

Debugger::Debugger()
  : theCount(0)
  , theOutput(&std::cerr)
  , theMinimumSeverity(SevDev)
{
}

void
Debugger::process(Entry const& anEntry)
{
    (*theOutput) << anEntry << std::endl;
}

void
Debugger::reset()
{
    theCount           = 0;
    theOutput          = &std::cerr;
    theMinimumSeverity = SevDev;
}

Debugger* Debugger::theDebugger((Debugger*)0);

void
Debugger::constructDebugger()
{
    if (theDebugger == 0) { theDebugger = new Debugger(); }
}

void
assertionFailed(char const* aCondition,
                char const* aFile,
                int64_t aLine,
                char const* aFunction,
                std::string const& aMessage)
{
    std::stringstream explanation;
    explanation << "Assertion failed: (" << aCondition << ")";
    if (!aMessage.empty()) { explanation << " : " << aMessage; }

    Debugger::constructDebugger();
    Debugger::theDebugger->process(
      Entry(SevCrit, aFile, aLine, aFunction, Debugger::theDebugger->count(), explanation.str()));
    throw Core::AssertionFailure(aFile, aLine, explanation.str());
}

namespace {
struct SeverityName
{
    char const* theShort;
    char const* theLong;
};

SeverityName const theSeverityNames[] = { { "Inv", "Invocations" }, { "VVerb", "VeryVerbose" },
                                          { "Verb", "Verbose" },    { "Iface", "Interface" },
                                          { "Trace", "Trace" },     { "Dev", "Development" },
                                          { "Crit", "Critical" },   { "Tmp", "Temp" } };
} // namespace

std::string const&
toString(Severity aSeverity)
{
    static std::string theStaticSeverities[] = { "Invocations", "VeryVerbose", "Verbose",  "Interface",
                                                 "Trace",       "Development", "Critical", "Temp" };
    return theStaticSeverities[aSeverity];
}

bool
fromString(std::string const& aName, Severity& aSeverity)
{
    for (int32_t i = 0; i < NumSev; ++i) {
        if (aName == theSeverityNames[i].theShort || aName == theSeverityNames[i].theLong) {
            aSeverity = Severity(i);
            return true;
        }
    }
    return false;
}

} // namespace Dbg
} // namespace Safecracker
