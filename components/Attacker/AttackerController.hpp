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
#ifndef SAFECRACKER_ATTACKER_ATTACKERCONTROLLER_HPP_INCLUDED
#define SAFECRACKER_ATTACKER_ATTACKERCONTROLLER_HPP_INCLUDED

#include <components/Attacker/AttackResult.hpp>
#include <components/Attacker/AttackStrings.hpp>
#include <components/CompressedCache/CompressedSet.hpp>
#include <components/Victim/VictimBuffer.hpp>
#include <core/types.hpp>
#include <cstdint>
#include <vector>

namespace nAttacker {

using Safecracker::SharedTypes::PhysicalMemoryAddress;

// Recovers the victim's secret one 4-byte word at a time using only the
// victim's public accessors and the hit/miss outcome of reads of its own
// lines.
//
// Every observation is a prime-and-probe round:
//   1. write filler into victim lines 0-2 and an attack string into the
//      writable words of the secret line;
//   2. read one attacker line per way, each in its own superblock, so the set
//      holds only attacker lines;
//   3. have the victim read lines 0-2, which evicts the three oldest attacker
//      lines, and then the secret line.  The filler is sized so that the
//      secret line fits its superblock budget exactly when the hypothesis
//      under test holds; then the fourth attacker line is evicted,
//      otherwise victim line 0 is;
//   4. read the fourth attacker line: MISS means the hypothesis holds.
//
// The top two bytes of each secret word are found by group testing candidate
// top halves (a top-2 match makes the secret word 12 bits smaller), the
// bottom two bytes by testing whole candidate words (an exact match is 16
// bits smaller again).
class AttackerController
{
    nVictim::VictimBuffer& theVictim;
    nCompressedCache::CompressedSet& theCache;
    PhysicalMemoryAddress theAttackerBase;
    int32_t theAttackerLines;
    uint32_t theBudget;

    AttackStrings theStrings;
    ePhase thePhase;
    AttackResult theResult;

    // Last values written to the victim buffer
    std::vector<uint8_t> theShadow;
    std::vector<bool> theShadowValid;

    int32_t theSecretWords;
    int32_t theWritableWords;

    std::vector<uint16_t> theTops;    // in discovery order
    std::vector<uint16_t> theBottoms; // theBottoms[i] belongs to theTops[i]

    // Word orders to submit, first guess first
    std::vector<std::vector<int32_t>> theGuessOrders;

  public:
    // The attacker owns associativity() lines starting at anAttackerBase,
    // one per superblock.
    AttackerController(nVictim::VictimBuffer& aVictim,
                       nCompressedCache::CompressedSet& aCache,
                       PhysicalMemoryAddress anAttackerBase);

    AttackResult run();

    ePhase phase() const { return thePhase; }
    AttackResult const& result() const { return theResult; }

  private:
    void setPhase(ePhase aPhase);

    PhysicalMemoryAddress attackerLine(int32_t anIndex) const;

    // One prime-and-probe round; true when the secret line fit its budget
    bool probe(LineData const& aSecretLine, FillerLines const& aFillers);
    void writeVictimLine(int32_t aLine, LineData const& aData, int32_t aWords);
    void flushSet();

    // Top halves
    uint32_t topFillerBytes(LineData const& aProbe);
    bool probeTops(std::vector<uint16_t> const& aCandidates);
    void locateTops(std::vector<uint16_t> const& aCandidates, bool isKnownPositive);
    void findTops();

    // Bottom halves
    bool probeBottom(uint16_t aTop, uint16_t aBottom);
    bool findBottom(uint16_t aTop);

    std::vector<uint8_t> guessFor(std::vector<int32_t> const& anOrder) const;
    void disambiguate();
    void verify();
};

} // namespace nAttacker

#endif // SAFECRACKER_ATTACKER_ATTACKERCONTROLLER_HPP_INCLUDED
