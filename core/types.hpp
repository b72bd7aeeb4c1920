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
#ifndef SAFECRACKER_TYPES_HPP_INCLUDED
#define SAFECRACKER_TYPES_HPP_INCLUDED

#include <array>
#include <boost/operators.hpp>
#include <cstdint>
#include <iomanip>
#include <iostream>

namespace Safecracker {
namespace Core {

template<class underlying_type, bool isVirtual = false>
class MemoryAddress_
  : boost::totally_ordered<MemoryAddress_<underlying_type, isVirtual>,
                           boost::addable<MemoryAddress_<underlying_type, isVirtual>, int>>
{
  public:
    MemoryAddress_()
      : address(0)
    {
    }
    explicit MemoryAddress_(underlying_type newAddress)
      : address(newAddress)
    {
    }
    bool operator<(MemoryAddress_ const& other) const { return (address < other.address); }
    bool operator==(MemoryAddress_ const& other) const { return (address == other.address); }
    MemoryAddress_& operator=(underlying_type const& other)
    {
        address = other;
        return *this;
    }
    MemoryAddress_& operator+=(int addend)
    {
        address += addend;
        return *this;
    }
    operator underlying_type() const { return address; }
    friend std::ostream& operator<<(std::ostream& s, MemoryAddress_ const& mem)
    {
        s << (isVirtual ? "v(" : "p(");
        s << "0x" << std::hex << std::setw(9) << std::right << std::setfill('0');
        s << mem.address;
        s << std::dec << std::setfill(' ');
        s << ")";

        return s;
    }

  private:
    underlying_type address;
};

typedef uint32_t Word32Bit;
typedef uint64_t Word64Bit;

static const int32_t kLineBytes       = 64;
static const int32_t kWordBytes       = 4;
static const int32_t kWordsPerLine    = kLineBytes / kWordBytes;
static const int32_t kLineOffsetBits  = 6;

} // end namespace Core

namespace SharedTypes {

typedef Core::MemoryAddress_<Core::Word64Bit, false> PhysicalMemoryAddress;

// The uncompressed contents of one cache line.
typedef std::array<uint8_t, Core::kLineBytes> LineData;

typedef uint64_t LineNumber;

inline LineNumber
lineNumber(PhysicalMemoryAddress anAddress)
{
    return static_cast<uint64_t>(anAddress) >> Core::kLineOffsetBits;
}

inline int32_t
lineOffset(PhysicalMemoryAddress anAddress)
{
    return static_cast<int32_t>(static_cast<uint64_t>(anAddress) & (Core::kLineBytes - 1));
}

// Words are little-endian: byte 0 of a word is its least significant byte.
inline Core::Word32Bit
wordAt(LineData const& aLine, int32_t aWord)
{
    int32_t base = aWord * Core::kWordBytes;
    return static_cast<Core::Word32Bit>(aLine[base]) | (static_cast<Core::Word32Bit>(aLine[base + 1]) << 8) |
           (static_cast<Core::Word32Bit>(aLine[base + 2]) << 16) |
           (static_cast<Core::Word32Bit>(aLine[base + 3]) << 24);
}

inline void
setWord(LineData& aLine, int32_t aWord, Core::Word32Bit aValue)
{
    int32_t base      = aWord * Core::kWordBytes;
    aLine[base]     = static_cast<uint8_t>(aValue);
    aLine[base + 1] = static_cast<uint8_t>(aValue >> 8);
    aLine[base + 2] = static_cast<uint8_t>(aValue >> 16);
    aLine[base + 3] = static_cast<uint8_t>(aValue >> 24);
}

// The two most significant bytes of a word.
inline uint16_t
topShort(Core::Word32Bit aWord)
{
    return static_cast<uint16_t>(aWord >> 16);
}

inline uint16_t
bottomShort(Core::Word32Bit aWord)
{
    return static_cast<uint16_t>(aWord & 0xFFFF);
}

inline Core::Word32Bit
makeWord(uint16_t aTop, uint16_t aBottom)
{
    return (static_cast<Core::Word32Bit>(aTop) << 16) | aBottom;
}

} // end namespace SharedTypes
} // end namespace Safecracker

#endif // SAFECRACKER_TYPES_HPP_INCLUDED
