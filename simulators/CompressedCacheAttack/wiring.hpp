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
#ifndef SAFECRACKER_WIRING_HPP_INCLUDED
#define SAFECRACKER_WIRING_HPP_INCLUDED

#include <components/Attacker/AttackerController.hpp>
#include <components/CompressedCache/CompressedSet.hpp>
#include <components/MainMemory/MainMemory.hpp>
#include <components/Victim/SecretGenerator.hpp>
#include <components/Victim/VictimBuffer.hpp>
#include <core/configuration.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace Safecracker {
namespace Wiring {

// Everything one attack runs against.  The trial owns main memory and the
// compressed set and lends them to the victim and the attacker.
class Trial
{
    Core::Parameters theParameters;
    std::unique_ptr<nMainMemory::MainMemory> theMemory;
    std::unique_ptr<nCompressedCache::CompressedSet> theCache;
    std::unique_ptr<nVictim::VictimBuffer> theVictim;
    std::unique_ptr<nAttacker::AttackerController> theAttacker;

  public:
    Trial(Core::Parameters const& aParameters, std::vector<uint8_t> const& aSecret);

    // Non-copyable
    Trial(const Trial&)            = delete;
    Trial& operator=(const Trial&) = delete;

    nVictim::VictimBuffer& victim() { return *theVictim; }
    nAttacker::AttackerController& attacker() { return *theAttacker; }
    nCompressedCache::CompressedSet& cache() { return *theCache; }
    nMainMemory::MainMemory& memory() { return *theMemory; }
    Core::Parameters const& parameters() const { return theParameters; }
};

// Builds a trial with the default parameters.  Throws InvalidConfiguration
// unless aSecretLength is 4 or 8, and SecretGenerationFailure when
// aGenerator cannot produce a valid secret.
std::unique_ptr<Trial>
initialize(int32_t aSecretLength, nVictim::SecretGenerator& aGenerator);

std::unique_ptr<Trial>
initialize(Core::Parameters const& aParameters, nVictim::SecretGenerator& aGenerator);

// Draws the secret from a RandomSecretGenerator seeded with the seed parameter
std::unique_ptr<Trial>
initialize(Core::Parameters const& aParameters);

// Uses aSecret as given
std::unique_ptr<Trial>
initialize(Core::Parameters const& aParameters, std::vector<uint8_t> const& aSecret);

} // namespace Wiring
} // namespace Safecracker

#endif // SAFECRACKER_WIRING_HPP_INCLUDED
