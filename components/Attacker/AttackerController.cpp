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
#include <algorithm>
#include <bitset>
#include <components/Attacker/AttackerController.hpp>
#include <core/configuration.hpp>
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <sstream>

namespace nAttacker {

using Safecracker::Core::kLineBytes;
using Safecracker::Core::kMaximumBudget;
using Safecracker::Core::kMinimumBudget;
using Safecracker::Core::kSuperblockBytes;
using Safecracker::Core::kSuperblockLines;
using Safecracker::Core::kWordBytes;
using Safecracker::Core::kWordsPerLine;
using Safecracker::SharedTypes::makeWord;
using nCompression::CPackCompressor;

// The victim line holding the secret, and the attacker line it competes with
static const int32_t kSecretLine  = kSuperblockLines - 1;
static const int32_t kWitnessLine = kSuperblockLines - 1;

std::string const&
toString(ePhase aPhase)
{
    static std::string thePhaseNames[] = { "Priming", "Probing", "Resolving", "Disambiguating", "Verifying", "Done" };
    return thePhaseNames[aPhase];
}

AttackerController::AttackerController(nVictim::VictimBuffer& aVictim,
                                       nCompressedCache::CompressedSet& aCache,
                                       PhysicalMemoryAddress anAttackerBase)
  : theVictim(aVictim)
  , theCache(aCache)
  , theAttackerBase(anAttackerBase)
  , theAttackerLines(aCache.associativity())
  , theBudget(aCache.budget())
  , thePhase(kPriming)
  , theShadow(aVictim.size(), 0)
  , theShadowValid(aVictim.size(), false)
  , theSecretWords(aVictim.secretLength() / kWordBytes)
  , theWritableWords((aVictim.secretOffset() - kSecretLine * kLineBytes) / kWordBytes)
{
    if (theAttackerLines < kSuperblockLines) {
        std::stringstream msg;
        msg << "An attack needs at least " << kSuperblockLines << " ways, the set has " << theAttackerLines;
        throw INVALID_CONFIGURATION(msg.str());
    }
    if (static_cast<uint64_t>(theAttackerBase) % kSuperblockBytes != 0) {
        std::stringstream msg;
        msg << "Attacker lines at " << theAttackerBase << " are not superblock aligned";
        throw INVALID_CONFIGURATION(msg.str());
    }
    if (theBudget < static_cast<uint32_t>(kMinimumBudget) || theBudget > static_cast<uint32_t>(kMaximumBudget)) {
        std::stringstream msg;
        msg << "No filler lines fit a superblock budget of " << theBudget << " bytes";
        throw INVALID_CONFIGURATION(msg.str());
    }
}

void
AttackerController::setPhase(ePhase aPhase)
{
    DBG_(Trace, (<< "attacker phase " << toString(thePhase) << " -> " << toString(aPhase)));
    thePhase = aPhase;
}

PhysicalMemoryAddress
AttackerController::attackerLine(int32_t anIndex) const
{
    return PhysicalMemoryAddress(static_cast<uint64_t>(theAttackerBase) +
                                 static_cast<uint64_t>(anIndex) * kSuperblockBytes);
}

AttackResult
AttackerController::run()
{
    if (thePhase == kDone) { return theResult; }

    // Priming: fix the filler lines and put the first attack string in place
    std::vector<uint16_t> none;
    LineData first(theStrings.topShortProbe(none, theWritableWords));
    FillerLines const& fillers(theStrings.fillerLines(topFillerBytes(first)));
    for (int32_t line = 0; line < kSecretLine; ++line) {
        writeVictimLine(line, fillers[line], kWordsPerLine);
    }
    writeVictimLine(kSecretLine, first, theWritableWords);

    setPhase(kProbing);
    findTops();
    if (static_cast<int32_t>(theTops.size()) < theSecretWords) {
        DBG_(Crit, (<< "found " << theTops.size() << " of " << theSecretWords << " secret words; giving up"));
        setPhase(kDone);
        return theResult;
    }

    setPhase(kResolving);
    for (uint32_t i = 0; i < theTops.size(); ++i) {
        DBG_(Trace, (<< "resolving word " << i << " with top 0x" << std::hex << theTops[i]));
        if (!findBottom(theTops[i])) {
            DBG_(Crit, (<< "no bottom half matches top 0x" << std::hex << theTops[i] << "; giving up"));
            setPhase(kDone);
            return theResult;
        }
    }

    // Discovery order is always the first guess
    theGuessOrders.clear();
    std::vector<int32_t> discovered;
    for (uint32_t i = 0; i < theTops.size(); ++i) {
        discovered.push_back(i);
    }
    theGuessOrders.push_back(discovered);
    if (theSecretWords > 1) {
        setPhase(kDisambiguating);
        disambiguate();
    }

    setPhase(kVerifying);
    verify();
    setPhase(kDone);

    DBG_(Dev, (<< "attack finished: " << theResult));
    return theResult;
}

void
AttackerController::writeVictimLine(int32_t aLine, LineData const& aData, int32_t aWords)
{
    for (int32_t i = 0; i < aWords * kWordBytes; ++i) {
        int32_t offset = aLine * kLineBytes + i;
        if (theShadowValid[offset] && theShadow[offset] == aData[i]) { continue; }
        nVictim::AccessStatus status = theVictim.write(offset, aData[i]);
        DBG_Assert(status == nVictim::kOk, (<< "victim refused a write to offset " << offset));
        theShadow[offset]      = aData[i];
        theShadowValid[offset] = true;
        ++theResult.theBytesWritten;
    }
}

void
AttackerController::flushSet()
{
    for (int32_t i = 0; i < theAttackerLines; ++i) {
        theCache.read(attackerLine(i));
        ++theResult.theLinesReloaded;
    }
    ++theResult.theSetEvictions;
}

bool
AttackerController::probe(LineData const& aSecretLine, FillerLines const& aFillers)
{
    ++theResult.theProbes;
    for (int32_t line = 0; line < kSecretLine; ++line) {
        writeVictimLine(line, aFillers[line], kWordsPerLine);
    }
    writeVictimLine(kSecretLine, aSecretLine, theWritableWords);

    flushSet();

    for (int32_t line = 0; line <= kSecretLine; ++line) {
        boost::optional<uint8_t> byte = theVictim.read(line * kLineBytes);
        DBG_Assert(byte, (<< "victim refused a read of line " << line));
        ++theResult.theBytesRead;
    }

    nCompressedCache::AccessResult witness = theCache.read(attackerLine(kWitnessLine));
    ++theResult.theLinesReloaded;
    DBG_(VVerb, (<< "probe " << theResult.theProbes << ": witness " << witness.theSpeed));
    return witness.miss();
}

uint32_t
AttackerController::topFillerBytes(LineData const& aProbe)
{
    uint32_t prefix = theStrings.prefixBits(aProbe, theWritableWords);
    // A top-2 match turns one secret word from new into partial
    uint32_t match   = CPackCompressor::bitsToBytes(prefix + CPackCompressor::kPartialBits +
                                                  (theSecretWords - 1) * CPackCompressor::kNewBits);
    uint32_t noMatch = CPackCompressor::bitsToBytes(prefix + theSecretWords * CPackCompressor::kNewBits);
    DBG_Assert(match < noMatch && match < theBudget,
               (<< "top probe cannot separate " << match << " from " << noMatch << " bytes"));
    return theBudget - match;
}

bool
AttackerController::probeTops(std::vector<uint16_t> const& aCandidates)
{
    LineData line(theStrings.topShortProbe(aCandidates, theWritableWords));
    return probe(line, theStrings.fillerLines(topFillerBytes(line)));
}

void
AttackerController::locateTops(std::vector<uint16_t> const& aCandidates, bool isKnownPositive)
{
    if (static_cast<int32_t>(theTops.size()) >= theSecretWords) { return; }
    if (!isKnownPositive && !probeTops(aCandidates)) { return; }
    if (aCandidates.size() == 1) {
        DBG_(Dev, (<< "top half 0x" << std::hex << aCandidates[0]));
        theTops.push_back(aCandidates[0]);
        return;
    }

    std::vector<uint16_t>::const_iterator middle = aCandidates.begin() + aCandidates.size() / 2;
    std::vector<uint16_t> left(aCandidates.begin(), middle);
    std::vector<uint16_t> right(middle, aCandidates.end());
    if (probeTops(left)) {
        locateTops(left, true);
        locateTops(right, false);
    } else {
        locateTops(right, true);
    }
}

void
AttackerController::findTops()
{
    std::vector<uint16_t> group;
    for (int32_t high = 1; high < 256; ++high) {
        for (int32_t low = 1; low < 256; ++low) {
            if (high == low) { continue; }
            group.push_back(static_cast<uint16_t>((high << 8) | low));
            if (static_cast<int32_t>(group.size()) == theWritableWords) {
                locateTops(group, false);
                group.clear();
                if (static_cast<int32_t>(theTops.size()) >= theSecretWords) { return; }
            }
        }
    }
    if (!group.empty()) { locateTops(group, false); }
}

bool
AttackerController::probeBottom(uint16_t aTop, uint16_t aBottom)
{
    LineData line(theStrings.bottomShortProbe(aTop, aBottom, theWritableWords));
    uint32_t prefix = theStrings.prefixBits(line, theWritableWords);
    // An exact match turns the secret word from partial into match
    uint32_t others  = (theSecretWords - 1) * CPackCompressor::kNewBits;
    uint32_t match   = CPackCompressor::bitsToBytes(prefix + CPackCompressor::kMatchBits + others);
    uint32_t noMatch = CPackCompressor::bitsToBytes(prefix + CPackCompressor::kPartialBits + others);
    DBG_Assert(match < noMatch && match < theBudget,
               (<< "bottom probe cannot separate " << match << " from " << noMatch << " bytes"));
    return probe(line, theStrings.fillerLines(theBudget - match));
}

bool
AttackerController::findBottom(uint16_t aTop)
{
    // Secret bytes are distinct, so every byte recovered so far is excluded
    std::bitset<256> known;
    for (uint32_t i = 0; i < theTops.size(); ++i) {
        known.set(theTops[i] >> 8);
        known.set(theTops[i] & 0xFF);
    }
    for (uint32_t i = 0; i < theBottoms.size(); ++i) {
        known.set(theBottoms[i] >> 8);
        known.set(theBottoms[i] & 0xFF);
    }

    for (int32_t high = 1; high < 256; ++high) {
        if (known.test(high)) { continue; }
        for (int32_t low = 1; low < 256; ++low) {
            if (high == low || known.test(low)) { continue; }
            uint16_t bottom = static_cast<uint16_t>((high << 8) | low);
            if (probeBottom(aTop, bottom)) {
                DBG_(Dev, (<< "bottom half 0x" << std::hex << bottom << " for top 0x" << aTop));
                theBottoms.push_back(bottom);
                return true;
            }
        }
    }
    return false;
}

std::vector<uint8_t>
AttackerController::guessFor(std::vector<int32_t> const& anOrder) const
{
    std::vector<uint8_t> guess;
    for (int32_t index : anOrder) {
        Word32Bit word = makeWord(theTops[index], theBottoms[index]);
        for (int32_t i = 0; i < kWordBytes; ++i) {
            guess.push_back(static_cast<uint8_t>(word >> (8 * i)));
        }
    }
    return guess;
}

void
AttackerController::disambiguate()
{
    // Compression tells which words the secret holds but not where, so the
    // second guess swaps the two words
    std::vector<int32_t> swapped(theGuessOrders.front());
    std::swap(swapped[0], swapped[1]);
    theGuessOrders.push_back(swapped);
    DBG_(Dev,
         (<< "word order unknown; " << theGuessOrders.size() << " candidate orders for tops 0x" << std::hex
          << theTops[0] << " and 0x" << theTops[1]));
}

void
AttackerController::verify()
{
    for (std::vector<int32_t> const& order : theGuessOrders) {
        std::vector<uint8_t> guess(guessFor(order));
        ++theResult.theGuessesUsed;
        if (theVictim.verifyGuess(guess)) {
            theResult.theSuccess = true;
            theResult.theSecret  = guess;
            return;
        }
    }
    DBG_(Crit, (<< "all " << theGuessOrders.size() << " guesses rejected"));
}

} // namespace nAttacker
