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
#include <components/Attacker/AttackStrings.hpp>
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <sstream>

namespace nAttacker {

using Safecracker::Core::kWordsPerLine;
using Safecracker::SharedTypes::makeWord;
using Safecracker::SharedTypes::setWord;

Word32Bit
fillerNewWord(int32_t anIndex)
{
    return 0x0000A55A | (static_cast<Word32Bit>(anIndex + 1) << 16);
}

Word32Bit
fillerPartialWord(int32_t anIndex)
{
    return 0x00013C00 | static_cast<Word32Bit>(anIndex + 1);
}

AttackStrings::AttackStrings()
{
    // Enumerate every mix of new, partial, byte and zero words.  Partial
    // words need new word 0 in front of them.
    for (int32_t news = kWordsPerLine; news >= 0; --news) {
        for (int32_t partials = 0; news + partials <= kWordsPerLine; ++partials) {
            if (partials > 0 && news == 0) { continue; }
            for (int32_t bytes = 0; news + partials + bytes <= kWordsPerLine; ++bytes) {
                LineData line;
                line.fill(0);
                int32_t word = 0;
                for (int32_t i = 0; i < news; ++i) {
                    setWord(line, word++, fillerNewWord(i));
                }
                for (int32_t i = 0; i < partials; ++i) {
                    setWord(line, word++, fillerPartialWord(i));
                }
                for (int32_t i = 0; i < bytes; ++i) {
                    setWord(line, word++, kFillerByteWord);
                }
                uint32_t size = theCompressor.compressedBytes(line);
                if (theFillers.count(size) == 0) { theFillers[size] = line; }
            }
        }
    }
}

LineData const&
AttackStrings::fillerLine(uint32_t aBytes) const
{
    std::map<uint32_t, LineData>::const_iterator iter = theFillers.find(aBytes);
    if (iter == theFillers.end()) {
        std::stringstream msg;
        msg << "No filler line compresses to " << aBytes << " bytes";
        throw INVALID_CONFIGURATION(msg.str());
    }
    return iter->second;
}

FillerLines const&
AttackStrings::fillerLines(uint32_t aTotalBytes)
{
    std::map<uint32_t, FillerLines>::const_iterator cached = theSplits.find(aTotalBytes);
    if (cached != theSplits.end()) { return cached->second; }

    // Largest first so that the split is deterministic
    std::map<uint32_t, LineData>::const_reverse_iterator first, second;
    for (first = theFillers.rbegin(); first != theFillers.rend(); ++first) {
        if (first->first > aTotalBytes) { continue; }
        for (second = first; second != theFillers.rend(); ++second) {
            if (first->first + second->first > aTotalBytes) { continue; }
            uint32_t third = aTotalBytes - first->first - second->first;
            if (third > second->first || !isReachable(third)) { continue; }

            FillerLines& lines = theSplits[aTotalBytes];
            lines[0]           = first->second;
            lines[1]           = second->second;
            lines[2]           = fillerLine(third);
            DBG_(Dev,
                 (<< "filler split for " << aTotalBytes << " bytes: " << first->first << " + " << second->first
                  << " + " << third));
            return lines;
        }
    }

    std::stringstream msg;
    msg << "Cannot build three filler lines totalling " << aTotalBytes << " compressed bytes";
    DBG_(Crit, (<< msg.str()));
    throw INVALID_CONFIGURATION(msg.str());
}

LineData
AttackStrings::topShortProbe(std::vector<uint16_t> const& aCandidates, int32_t aWritableWords) const
{
    DBG_Assert(static_cast<int32_t>(aCandidates.size()) <= aWritableWords,
               (<< aCandidates.size() << " candidates do not fit in " << aWritableWords << " words"));
    LineData line;
    line.fill(0);
    int32_t word = 0;
    for (uint16_t candidate : aCandidates) {
        setWord(line, word++, makeWord(candidate, kCandidateBottom));
    }
    for (int32_t filler = 0; word < aWritableWords; ++filler) {
        setWord(line, word++, fillerNewWord(filler));
    }
    return line;
}

LineData
AttackStrings::bottomShortProbe(uint16_t aTop, uint16_t aBottom, int32_t aWritableWords) const
{
    LineData line;
    line.fill(0);
    setWord(line, 0, makeWord(aTop, aBottom));
    for (int32_t word = 1; word < aWritableWords; ++word) {
        setWord(line, word, fillerNewWord(word - 1));
    }
    return line;
}

uint32_t
AttackStrings::prefixBits(LineData const& aLine, int32_t aWritableWords) const
{
    // Encoding is sequential, so the words after the prefix cannot change
    // what the prefix costs
    nCompression::CompressedLine compressed(theCompressor.compress(aLine));
    uint32_t bits = 0;
    for (int32_t i = 0; i < aWritableWords; ++i) {
        bits += nCompression::CPackCompressor::wordCost(compressed.symbol(i).thePattern);
    }
    return bits;
}

} // namespace nAttacker
