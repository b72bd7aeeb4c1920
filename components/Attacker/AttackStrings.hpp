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
#ifndef SAFECRACKER_ATTACKER_ATTACKSTRINGS_HPP_INCLUDED
#define SAFECRACKER_ATTACKER_ATTACKSTRINGS_HPP_INCLUDED

#include <array>
#include <components/Compression/CPackCompressor.hpp>
#include <core/types.hpp>
#include <cstdint>
#include <map>
#include <vector>

namespace nAttacker {

using Safecracker::Core::Word32Bit;
using Safecracker::SharedTypes::LineData;

// Filler words.  None of them can share its top two bytes with a secret
// word, whose bytes are all non-zero.
//   new word i:     bytes 5a a5 (i+1) 00, 34 bits, top short 00(i+1)
//   partial word m: bytes (m+1) 3c 01 00, 22 bits after new word 0
//   byte word:      bytes ff 00 00 00, 10 bits
Word32Bit fillerNewWord(int32_t anIndex);
Word32Bit fillerPartialWord(int32_t anIndex);
static const Word32Bit kFillerByteWord = 0xFF;

// Bottom short given to every top-short candidate word
static const uint16_t kCandidateBottom = 0xA55A;

typedef std::array<LineData, 3> FillerLines;

// Builds the contents the attacker writes into the victim buffer.
class AttackStrings
{
    nCompression::CPackCompressor theCompressor;
    std::map<uint32_t, LineData> theFillers;     // compressed bytes -> line
    std::map<uint32_t, FillerLines> theSplits;   // total bytes -> lines

  public:
    AttackStrings();

    // Whether a single filler line can compress to aBytes
    bool isReachable(uint32_t aBytes) const { return theFillers.count(aBytes) != 0; }
    LineData const& fillerLine(uint32_t aBytes) const;

    // Three filler lines whose compressed sizes add up to aTotalBytes.
    // Throws InvalidConfiguration when no such split exists.
    FillerLines const& fillerLines(uint32_t aTotalBytes);

    // The first aWritableWords words hold aCandidates as new words, the rest
    // are filler new words.
    LineData topShortProbe(std::vector<uint16_t> const& aCandidates, int32_t aWritableWords) const;

    // Word 0 is aTop:aBottom, the rest of the writable words are filler new
    // words.
    LineData bottomShortProbe(uint16_t aTop, uint16_t aBottom, int32_t aWritableWords) const;

    // Bits spent on the first aWritableWords words of aLine
    uint32_t prefixBits(LineData const& aLine, int32_t aWritableWords) const;

    nCompression::CPackCompressor const& compressor() const { return theCompressor; }
};

} // namespace nAttacker

#endif // SAFECRACKER_ATTACKER_ATTACKSTRINGS_HPP_INCLUDED
