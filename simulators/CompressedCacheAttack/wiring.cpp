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
#include <core/debug/debug.hpp>
#include <simulators/CompressedCacheAttack/wiring.hpp>
#include <sstream>

namespace Safecracker {
namespace Wiring {

Trial::Trial(Core::Parameters const& aParameters, std::vector<uint8_t> const& aSecret)
  : theParameters(aParameters)
{
    theMemory.reset(new nMainMemory::MainMemory());
    theCache.reset(new nCompressedCache::CompressedSet(theParameters.associativity,
                                                       theParameters.superblock_budget,
                                                       *theMemory));
    theVictim.reset(
      new nVictim::VictimBuffer(*theCache, SharedTypes::PhysicalMemoryAddress(theParameters.victim_base), aSecret));
    theAttacker.reset(new nAttacker::AttackerController(
      *theVictim, *theCache, SharedTypes::PhysicalMemoryAddress(theParameters.attacker_base)));
}

static void
initializeParameters(Core::Parameters const& aParameters)
{
    Core::validate(aParameters);

    Dbg::Severity severity;
    if (Dbg::fromString(aParameters.debug_severity, severity)) {
        Dbg::Debugger::constructDebugger();
        Dbg::Debugger::theDebugger->setMinSev(severity);
    }

    DBG_(Dev,
         (<< "initializing trial: " << aParameters.secret_length << "-byte secret, " << aParameters.associativity
          << " ways, budget " << aParameters.superblock_budget));
}

std::unique_ptr<Trial>
initialize(int32_t aSecretLength, nVictim::SecretGenerator& aGenerator)
{
    Core::Parameters parameters;
    parameters.secret_length = aSecretLength;
    return initialize(parameters, aGenerator);
}

std::unique_ptr<Trial>
initialize(Core::Parameters const& aParameters, nVictim::SecretGenerator& aGenerator)
{
    initializeParameters(aParameters);
    std::vector<uint8_t> secret(
      nVictim::generateSecret(aGenerator, aParameters.secret_length, aParameters.secret_retries));
    return std::unique_ptr<Trial>(new Trial(aParameters, secret));
}

std::unique_ptr<Trial>
initialize(Core::Parameters const& aParameters)
{
    nVictim::RandomSecretGenerator generator(aParameters.seed);
    return initialize(aParameters, generator);
}

std::unique_ptr<Trial>
initialize(Core::Parameters const& aParameters, std::vector<uint8_t> const& aSecret)
{
    initializeParameters(aParameters);
    if (static_cast<int32_t>(aSecret.size()) != aParameters.secret_length) {
        std::stringstream msg;
        msg << "Secret has " << aSecret.size() << " bytes, secret_length is " << aParameters.secret_length;
        throw INVALID_CONFIGURATION(msg.str());
    }
    return std::unique_ptr<Trial>(new Trial(aParameters, aSecret));
}

} // namespace Wiring
} // namespace Safecracker
