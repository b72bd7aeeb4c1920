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
#ifndef SAFECRACKER_COMPRESSION_COMPRESSEDLINE_HPP_INCLUDED
#define SAFECRACKER_COMPRESSION_COMPRESSEDLINE_HPP_INCLUDED

#include <array>
#include <core/types.hpp>
#include <cstdint>
#include <iostream>
#include <string>

namespace nCompression {

using Safecracker::Core::Word32Bit;
using Safecracker::Core::kWordsPerLine;

enum ePattern
{
    kZero,    // all four bytes zero
    kMatch,   // equal to a dictionary entry
    kByte,    // only the least significant byte is non-zero
    kPartial, // top two bytes equal a dictionary entry's
    kNew      // stored verbatim and inserted into the dictionary
};

std::string const& toString(ePattern aPattern);

struct Symbol
{
    ePattern thePattern;
    uint8_t theIndex;     // dictionary index for kMatch and kPartial
    Word32Bit thePayload; // literal bits: byte, bottom short or whole word

    Symbol()
      : thePattern(kZero)
      , theIndex(0)
      , thePayload(0)
    {
    }
    Symbol(ePattern aPattern, uint8_t anIndex, Word32Bit aPayload)
      : thePattern(aPattern)
      , theIndex(anIndex)
      , thePayload(aPayload)
    {
    }
};

class CompressedLine
{
    std::array<Symbol, kWordsPerLine> theSymbols;
    uint32_t theBits;
    uint32_t theDictionaryEntries;

  public:
    CompressedLine()
      : theBits(0)
      , theDictionaryEntries(0)
    {
    }

    Symbol const& symbol(int32_t aWord) const { return theSymbols[aWord]; }
    void setSymbol(int32_t aWord, Symbol const& aSymbol) { theSymbols[aWord] = aSymbol; }

    uint32_t bits() const { return theBits; }
    void setBits(uint32_t aBits) { theBits = aBits; }
    uint32_t bytes() const { return (theBits + 7) / 8; }

    // Capacity of the dictionary the line was encoded with
    uint32_t dictionaryEntries() const { return theDictionaryEntries; }
    void setDictionaryEntries(uint32_t anEntries) { theDictionaryEntries = anEntries; }

    friend std::ostream& operator<<(std::ostream& anOstream, CompressedLine const& aLine)
    {
        anOstream << aLine.theBits << " bits [";
        for (int32_t i = 0; i < kWordsPerLine; ++i) {
            if (i != 0) { anOstream << ' '; }
            anOstream << toString(aLine.theSymbols[i].thePattern);
        }
        anOstream << ']';
        return anOstream;
    }
};

} // namespace nCompression

#endif // SAFECRACKER_COMPRESSION_COMPRESSEDLINE_HPP_INCLUDED
