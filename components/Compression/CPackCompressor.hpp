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
#ifndef SAFECRACKER_COMPRESSION_CPACKCOMPRESSOR_HPP_INCLUDED
#define SAFECRACKER_COMPRESSION_CPACKCOMPRESSOR_HPP_INCLUDED

#include <components/Compression/CompressedLine.hpp>
#include <components/Compression/Dictionary.hpp>
#include <core/types.hpp>
#include <cstdint>

namespace nCompression {

using Safecracker::SharedTypes::LineData;

// C-Pack style word compaction.  Each 4-byte word of a line is encoded with
// the first pattern that applies, in the order of ePattern, at the cost below
// (a 2-bit code followed by an optional dictionary index and literal bits).
class CPackCompressor
{
    uint32_t theDictionaryEntries;

  public:
    static const uint32_t kZeroBits    = 2;
    static const uint32_t kMatchBits   = 2 + 4;
    static const uint32_t kByteBits    = 2 + 8;
    static const uint32_t kPartialBits = 2 + 4 + 16;
    static const uint32_t kNewBits     = 2 + 32;

    explicit CPackCompressor(uint32_t aDictionaryEntries = Dictionary::kDefaultEntries)
      : theDictionaryEntries(aDictionaryEntries)
    {
    }

    static uint32_t wordCost(ePattern aPattern);
    static uint32_t bitsToBytes(uint32_t aBits) { return (aBits + 7) / 8; }

    // Size of aLine compressed from an empty dictionary
    uint32_t compressedBits(LineData const& aLine) const;
    uint32_t compressedBytes(LineData const& aLine) const { return bitsToBytes(compressedBits(aLine)); }

    // aDictionary is reset first and holds the encoder's final state on return
    CompressedLine compress(LineData const& aLine, Dictionary& aDictionary) const;
    CompressedLine compress(LineData const& aLine) const;

    LineData decompress(CompressedLine const& aLine) const;

  private:
    Symbol encodeWord(Word32Bit aWord, Dictionary& aDictionary) const;
};

} // namespace nCompression

#endif // SAFECRACKER_COMPRESSION_CPACKCOMPRESSOR_HPP_INCLUDED
