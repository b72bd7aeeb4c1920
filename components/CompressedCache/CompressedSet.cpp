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
#include <components/CompressedCache/CompressedSet.hpp>
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <map>
#include <set>
#include <sstream>

namespace nCompressedCache {

using Safecracker::SharedTypes::lineNumber;
using Safecracker::SharedTypes::lineOffset;

std::ostream&
operator<<(std::ostream& anOstream, eSpeed aSpeed)
{
    return anOstream << (aSpeed == kHit ? "HIT" : "MISS");
}

CompressedSet::CompressedSet(int32_t anAssociativity,
                             uint32_t aBudget,
                             nMainMemory::MainMemory& aMemory,
                             uint32_t aDictionaryEntries)
  : theAssociativity(anAssociativity)
  , theBudget(aBudget)
  , theMemory(aMemory)
  , theCompressor(aDictionaryEntries)
  , theWays(anAssociativity, Way(aDictionaryEntries))
{
    DBG_Assert(theAssociativity > 0);
    for (int32_t i = 0; i < theAssociativity; i++) {
        theMRUOrder.push_back(i);
    }
}

AccessResult
CompressedSet::access(PhysicalMemoryAddress anAddress, bool isWrite, uint8_t aData)
{
    LineNumber line    = lineNumber(anAddress);
    int32_t offset     = lineOffset(anAddress);
    uint64_t superblock = superblockOf(line);

    int32_t way = findWay(line);
    if (way >= 0) {
        ++theStats.theHits;
        Way& hit      = theWays[way];
        LineData data = theCompressor.decompress(hit.theData);
        moveToHead(way);

        if (!isWrite) {
            DBG_(VVerb, (<< anAddress << " read HIT way " << way));
            checkInvariants();
            return AccessResult(kHit, data[offset]);
        }

        data[offset] = aData;
        hit.theData  = theCompressor.compress(data, hit.theDictionary);
        hit.theSize  = hit.theData.bytes();
        hit.theDirty = true;
        DBG_(VVerb, (<< anAddress << " write HIT way " << way << " size " << hit.theSize));

        // The line may have grown past what its superblock can hold
        while (occupancy(superblock) > theBudget) {
            int32_t victim = superblockLRU(superblock, way);
            if (victim < 0) { break; }
            evict(victim, true);
        }
        checkInvariants();
        return AccessResult(kHit, aData);
    }

    ++theStats.theMisses;
    LineData data = theMemory.readLine(line);
    if (isWrite) { data[offset] = aData; }

    nCompression::Dictionary dictionary(theWays[0].theDictionary.capacity());
    nCompression::CompressedLine compressed(theCompressor.compress(data, dictionary));
    uint32_t size = compressed.bytes();

    for (;;) {
        if (occupancy(superblock) + size > theBudget) {
            int32_t victim = superblockLRU(superblock, -1);
            if (victim < 0) { break; }
            evict(victim, true);
        } else if (freeWay() < 0) {
            evict(theMRUOrder.back(), false);
        } else {
            break;
        }
    }

    way = freeWay();
    DBG_Assert(way >= 0, (<< "No way available for line 0x" << std::hex << line));
    Way& fill         = theWays[way];
    fill.theValid      = true;
    fill.theLine       = line;
    fill.theDirty      = isWrite;
    fill.theSize       = size;
    fill.theData       = compressed;
    fill.theDictionary = dictionary;
    moveToHead(way);

    DBG_(VVerb,
         (<< anAddress << (isWrite ? " write" : " read") << " MISS way " << way << " size " << size
          << " superblock occupancy " << occupancy(superblock)));

    checkInvariants();
    return AccessResult(kMiss, data[offset]);
}

void
CompressedSet::evict(int32_t aWay, bool isBudgetEviction)
{
    Way& victim = theWays[aWay];
    DBG_Assert(victim.theValid, (<< "Evicting empty way " << aWay));

    DBG_(Verb,
         (<< "evict line 0x" << std::hex << victim.theLine << std::dec << " from way " << aWay << " size "
          << victim.theSize << (victim.theDirty ? " dirty" : " clean")
          << (isBudgetEviction ? " (superblock budget)" : " (no free way)")));

    if (victim.theDirty) {
        theMemory.writeLine(victim.theLine, theCompressor.decompress(victim.theData));
        ++theStats.theWritebacks;
    }
    ++theStats.theEvictions;
    if (isBudgetEviction) { ++theStats.theBudgetEvictions; }

    victim.theValid = false;
    victim.theDirty = false;
    victim.theSize  = 0;
    victim.theDictionary.clear();
    moveToTail(aWay);
}

void
CompressedSet::checkInvariants() const
{
    std::map<uint64_t, uint32_t> sizes;
    std::set<LineNumber> lines;
    std::stringstream problem;

    for (int32_t i = 0; i < theAssociativity && problem.str().empty(); ++i) {
        Way const& way = theWays[i];
        if (!way.theValid) { continue; }
        if (!lines.insert(way.theLine).second) {
            problem << "line 0x" << std::hex << way.theLine << " occupies more than one way";
        }
        sizes[superblockOf(way.theLine)] += way.theSize;
    }
    for (std::map<uint64_t, uint32_t>::const_iterator iter = sizes.begin();
         iter != sizes.end() && problem.str().empty();
         ++iter) {
        if (iter->second > theBudget) {
            problem << "superblock 0x" << std::hex << iter->first << std::dec << " holds " << iter->second
                    << " bytes, budget is " << theBudget;
        }
    }

    if (!problem.str().empty()) {
        std::stringstream state;
        printState(state);
        DBG_(Crit, (<< "Capacity invariant violated: " << problem.str() << std::endl << state.str()));
        throw CAPACITY_INVARIANT_VIOLATION(problem.str());
    }
}

int32_t
CompressedSet::findWay(LineNumber aLine) const
{
    for (int32_t i = 0; i < theAssociativity; i++) {
        if (theWays[i].theValid && theWays[i].theLine == aLine) { return i; }
    }
    return -1;
}

int32_t
CompressedSet::freeWay() const
{
    for (int32_t i = theAssociativity - 1; i >= 0; i--) {
        if (!theWays[theMRUOrder[i]].theValid) { return theMRUOrder[i]; }
    }
    return -1;
}

int32_t
CompressedSet::superblockLRU(uint64_t aSuperblock, int32_t anExcludedWay) const
{
    for (int32_t i = theAssociativity - 1; i >= 0; i--) {
        int32_t index  = theMRUOrder[i];
        Way const& way = theWays[index];
        if (index != anExcludedWay && way.theValid && superblockOf(way.theLine) == aSuperblock) { return index; }
    }
    return -1;
}

uint32_t
CompressedSet::occupancy(uint64_t aSuperblock) const
{
    uint32_t total = 0;
    for (int32_t i = 0; i < theAssociativity; i++) {
        if (theWays[i].theValid && superblockOf(theWays[i].theLine) == aSuperblock) { total += theWays[i].theSize; }
    }
    return total;
}

uint32_t
CompressedSet::compressedSize(LineNumber aLine) const
{
    int32_t way = findWay(aLine);
    return way < 0 ? 0 : theWays[way].theSize;
}

uint32_t
CompressedSet::dictionarySize(LineNumber aLine) const
{
    int32_t way = findWay(aLine);
    return way < 0 ? 0 : theWays[way].theDictionary.size();
}

bool
CompressedSet::isDirty(LineNumber aLine) const
{
    int32_t way = findWay(aLine);
    return way >= 0 && theWays[way].theDirty;
}

std::vector<LineNumber>
CompressedSet::residentLines() const
{
    std::vector<LineNumber> lines;
    for (int32_t i = 0; i < theAssociativity; i++) {
        Way const& way = theWays[theMRUOrder[i]];
        if (way.theValid) { lines.push_back(way.theLine); }
    }
    return lines;
}

LineData
CompressedSet::peekLine(LineNumber aLine)
{
    int32_t way = findWay(aLine);
    if (way < 0) { return theMemory.readLine(aLine); }
    return theCompressor.decompress(theWays[way].theData);
}

void
CompressedSet::printState(std::ostream& anOstream) const
{
    for (int32_t i = 0; i < theAssociativity; i++) {
        int32_t index  = theMRUOrder[i];
        Way const& way = theWays[index];
        anOstream << "  [" << index << "] ";
        if (way.theValid) {
            anOstream << "line 0x" << std::hex << way.theLine << std::dec << " sb " << superblockOf(way.theLine)
                      << " " << way.theSize << "B" << (way.theDirty ? " D" : "");
        } else {
            anOstream << "empty";
        }
        anOstream << std::endl;
    }
}

void
CompressedSet::moveToHead(int32_t aWay)
{
    int32_t i = 0;
    while (theMRUOrder[i] != aWay)
        i++;
    while (i > 0) {
        theMRUOrder[i] = theMRUOrder[i - 1];
        i--;
    }
    theMRUOrder[0] = aWay;
}

void
CompressedSet::moveToTail(int32_t aWay)
{
    int32_t i = 0;
    while (theMRUOrder[i] != aWay)
        i++;
    while (i < (theAssociativity - 1)) {
        theMRUOrder[i] = theMRUOrder[i + 1];
        i++;
    }
    theMRUOrder[theAssociativity - 1] = aWay;
}

} // namespace nCompressedCache
