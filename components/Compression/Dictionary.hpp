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
#ifndef SAFECRACKER_COMPRESSION_DICTIONARY_HPP_INCLUDED
#define SAFECRACKER_COMPRESSION_DICTIONARY_HPP_INCLUDED

#include <core/debug/debug.hpp>
#include <core/types.hpp>
#include <cstdint>
#include <deque>

namespace nCompression {

using Safecracker::Core::Word32Bit;
using Safecracker::SharedTypes::topShort;

// Words seen so far while compressing one line.  Entries are kept oldest
// first; inserting into a full dictionary drops the oldest entry.
class Dictionary
{
    std::deque<Word32Bit> theEntries;
    uint32_t theCapacity;

  public:
    static const uint32_t kDefaultEntries = 16;

    explicit Dictionary(uint32_t aCapacity = kDefaultEntries)
      : theCapacity(aCapacity)
    {
        DBG_Assert(theCapacity > 0);
    }

    // Index of the entry equal to aWord, or -1
    int32_t findWord(Word32Bit aWord) const
    {
        for (uint32_t i = 0; i < theEntries.size(); ++i) {
            if (theEntries[i] == aWord) { return i; }
        }
        return -1;
    }

    // Index of the first entry whose two most significant bytes equal
    // those of aWord, or -1
    int32_t findTop(Word32Bit aWord) const
    {
        for (uint32_t i = 0; i < theEntries.size(); ++i) {
            if (topShort(theEntries[i]) == topShort(aWord)) { return i; }
        }
        return -1;
    }

    Word32Bit entry(int32_t anIndex) const
    {
        DBG_Assert(anIndex >= 0 && static_cast<uint32_t>(anIndex) < theEntries.size(),
                   (<< "Dictionary index " << anIndex << " out of " << theEntries.size()));
        return theEntries[anIndex];
    }

    void insert(Word32Bit aWord)
    {
        if (theEntries.size() == theCapacity) { theEntries.pop_front(); }
        theEntries.push_back(aWord);
    }

    void clear() { theEntries.clear(); }
    bool empty() const { return theEntries.empty(); }
    uint32_t size() const { return theEntries.size(); }
    uint32_t capacity() const { return theCapacity; }
};

} // namespace nCompression

#endif // SAFECRACKER_COMPRESSION_DICTIONARY_HPP_INCLUDED
