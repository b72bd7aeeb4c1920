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
#ifndef SAFECRACKER_COMPRESSEDCACHE_COMPRESSEDSET_HPP_INCLUDED
#define SAFECRACKER_COMPRESSEDCACHE_COMPRESSEDSET_HPP_INCLUDED

#include <components/Compression/CPackCompressor.hpp>
#include <components/MainMemory/MainMemory.hpp>
#include <core/configuration.hpp>
#include <core/types.hpp>
#include <cstdint>
#include <iostream>
#include <vector>

namespace nCompressedCache {

using Safecracker::SharedTypes::LineData;
using Safecracker::SharedTypes::LineNumber;
using Safecracker::SharedTypes::PhysicalMemoryAddress;

enum eSpeed
{
    kHit,
    kMiss
};

std::ostream& operator<<(std::ostream& anOstream, eSpeed aSpeed);

// The only thing an observer of the set learns from an access
struct AccessResult
{
    eSpeed theSpeed;
    uint8_t theData;

    AccessResult(eSpeed aSpeed, uint8_t aData)
      : theSpeed(aSpeed)
      , theData(aData)
    {
    }

    bool hit() const { return theSpeed == kHit; }
    bool miss() const { return theSpeed == kMiss; }
};

struct CompressedSetStats
{
    uint64_t theHits;
    uint64_t theMisses;
    uint64_t theEvictions;
    uint64_t theBudgetEvictions;
    uint64_t theWritebacks;

    CompressedSetStats()
      : theHits(0)
      , theMisses(0)
      , theEvictions(0)
      , theBudgetEvictions(0)
      , theWritebacks(0)
    {
    }
};

inline uint64_t
superblockOf(LineNumber aLine)
{
    return aLine / Safecracker::Core::kSuperblockLines;
}

// One set of a decoupled compressed cache.  Each way holds one compressed
// line; the resident members of a superblock share a budget of compressed
// bytes.  Recency is kept set-wide; the LRU member of a superblock is the
// member that appears last in the set-wide order.
class CompressedSet
{
    struct Way
    {
        bool theValid;
        LineNumber theLine;
        bool theDirty;
        uint32_t theSize;
        nCompression::CompressedLine theData;
        nCompression::Dictionary theDictionary;

        explicit Way(uint32_t aDictionaryEntries)
          : theValid(false)
          , theLine(0)
          , theDirty(false)
          , theSize(0)
          , theDictionary(aDictionaryEntries)
        {
        }
    };

    int32_t theAssociativity;
    uint32_t theBudget;
    nMainMemory::MainMemory& theMemory;
    nCompression::CPackCompressor theCompressor;

    std::vector<Way> theWays;
    std::vector<int32_t> theMRUOrder; // way indices, most recently used first

    CompressedSetStats theStats;

  public:
    CompressedSet(int32_t anAssociativity,
                  uint32_t aBudget,
                  nMainMemory::MainMemory& aMemory,
                  uint32_t aDictionaryEntries = nCompression::Dictionary::kDefaultEntries);

    // Reads or writes one byte.  Misses fill from main memory and evict
    // until the line fits; both the superblock budget and way uniqueness
    // are checked before returning (CapacityInvariantViolation).
    AccessResult access(PhysicalMemoryAddress anAddress, bool isWrite, uint8_t aData = 0);

    AccessResult read(PhysicalMemoryAddress anAddress) { return access(anAddress, false); }
    AccessResult write(PhysicalMemoryAddress anAddress, uint8_t aData) { return access(anAddress, true, aData); }

    // Introspection, used by tests and the harness
    bool isResident(LineNumber aLine) const { return findWay(aLine) >= 0; }
    uint32_t compressedSize(LineNumber aLine) const;
    uint32_t dictionarySize(LineNumber aLine) const;
    bool isDirty(LineNumber aLine) const;
    uint32_t occupancy(uint64_t aSuperblock) const;
    std::vector<LineNumber> residentLines() const;

    // Current contents of aLine without touching recency or residency
    LineData peekLine(LineNumber aLine);

    int32_t associativity() const { return theAssociativity; }
    uint32_t budget() const { return theBudget; }
    CompressedSetStats const& stats() const { return theStats; }

    // One line per way in recency order: way index, line, superblock, size
    // and a D for dirty lines
    void printState(std::ostream& anOstream) const;

  private:
    int32_t findWay(LineNumber aLine) const;
    int32_t freeWay() const;
    int32_t superblockLRU(uint64_t aSuperblock, int32_t anExcludedWay) const;

    void evict(int32_t aWay, bool isBudgetEviction);
    void checkInvariants() const;

    void moveToHead(int32_t aWay);
    void moveToTail(int32_t aWay);
};

} // namespace nCompressedCache

#endif // SAFECRACKER_COMPRESSEDCACHE_COMPRESSEDSET_HPP_INCLUDED
