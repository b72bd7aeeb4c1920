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
#ifndef SAFECRACKER_ATTACKER_ATTACKRESULT_HPP_INCLUDED
#define SAFECRACKER_ATTACKER_ATTACKRESULT_HPP_INCLUDED

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace nAttacker {

enum ePhase
{
    kPriming,
    kProbing,
    kResolving,
    kDisambiguating,
    kVerifying,
    kDone
};

std::string const& toString(ePhase aPhase);

// Outcome and cost of one attack
struct AttackResult
{
    bool theSuccess;
    uint32_t theGuessesUsed;
    uint64_t theBytesWritten;  // victim bytes actually changed
    uint64_t theBytesRead;     // victim read() calls
    uint64_t theLinesReloaded; // reads of the attacker's own lines
    uint64_t theSetEvictions;  // flushes of the whole set
    uint64_t theProbes;
    std::vector<uint8_t> theSecret; // the accepted guess, empty on failure

    AttackResult()
      : theSuccess(false)
      , theGuessesUsed(0)
      , theBytesWritten(0)
      , theBytesRead(0)
      , theLinesReloaded(0)
      , theSetEvictions(0)
      , theProbes(0)
    {
    }

    friend std::ostream& operator<<(std::ostream& anOstream, AttackResult const& aResult)
    {
        anOstream << (aResult.theSuccess ? "success" : "failure") << " guesses=" << aResult.theGuessesUsed
                  << " written=" << aResult.theBytesWritten << " read=" << aResult.theBytesRead
                  << " reloaded=" << aResult.theLinesReloaded << " evictions=" << aResult.theSetEvictions
                  << " probes=" << aResult.theProbes;
        if (!aResult.theSecret.empty()) {
            anOstream << " secret=";
            for (uint8_t byte : aResult.theSecret) {
                anOstream << std::hex << std::setw(2) << std::setfill('0') << static_cast<int32_t>(byte);
            }
            anOstream << std::dec << std::setfill(' ');
        }
        return anOstream;
    }
};

} // namespace nAttacker

#endif // SAFECRACKER_ATTACKER_ATTACKRESULT_HPP_INCLUDED
