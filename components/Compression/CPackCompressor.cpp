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
#include <components/Compression/CPackCompressor.hpp>
#include <core/debug/debug.hpp>

namespace nCompression {

using Safecracker::SharedTypes::bottomShort;
using Safecracker::SharedTypes::makeWord;
using Safecracker::SharedTypes::setWord;
using Safecracker::SharedTypes::topShort;
using Safecracker::SharedTypes::wordAt;

const uint32_t Dictionary::kDefaultEntries;
const uint32_t CPackCompressor::kZeroBits;
const uint32_t CPackCompressor::kMatchBits;
const uint32_t CPackCompressor::kByteBits;
const uint32_t CPackCompressor::kPartialBits;
const uint32_t CPackCompressor::kNewBits;

std::string const&
toString(ePattern aPattern)
{
    static std::string thePatternNames[] = { "zero", "match", "byte", "partial", "new" };
    return thePatternNames[aPattern];
}

uint32_t
CPackCompressor::wordCost(ePattern aPattern)
{
    switch (aPattern) {
        case kZero: return kZeroBits;
        case kMatch: return kMatchBits;
        case kByte: return kByteBits;
        case kPartial: return kPartialBits;
        case kNew: return kNewBits;
    }
    DBG_Assert(false, (<< "Unknown pattern " << static_cast<int32_t>(aPattern)));
    return 0;
}

Symbol
CPackCompressor::encodeWord(Word32Bit aWord, Dictionary& aDictionary) const
{
    if (aWord == 0) { return Symbol(kZero, 0, 0); }

    int32_t index = aDictionary.findWord(aWord);
    if (index >= 0) { return Symbol(kMatch, index, 0); }

    if ((aWord & 0xFFFFFF00) == 0) { return Symbol(kByte, 0, aWord); }

    index = aDictionary.findTop(aWord);
    if (index >= 0) { return Symbol(kPartial, index, bottomShort(aWord)); }

    aDictionary.insert(aWord);
    return Symbol(kNew, 0, aWord);
}

CompressedLine
CPackCompressor::compress(LineData const& aLine, Dictionary& aDictionary) const
{
    aDictionary.clear();

    CompressedLine compressed;
    compressed.setDictionaryEntries(aDictionary.capacity());
    uint32_t bits = 0;
    for (int32_t i = 0; i < kWordsPerLine; ++i) {
        Symbol symbol(encodeWord(wordAt(aLine, i), aDictionary));
        bits += wordCost(symbol.thePattern);
        compressed.setSymbol(i, symbol);
    }
    compressed.setBits(bits);

    DBG_(Inv, (<< "compressed " << compressed));
    return compressed;
}

CompressedLine
CPackCompressor::compress(LineData const& aLine) const
{
    Dictionary dictionary(theDictionaryEntries);
    return compress(aLine, dictionary);
}

uint32_t
CPackCompressor::compressedBits(LineData const& aLine) const
{
    return compress(aLine).bits();
}

LineData
CPackCompressor::decompress(CompressedLine const& aLine) const
{
    // The decoder rebuilds the dictionary in the same order as the encoder
    Dictionary dictionary(aLine.dictionaryEntries() ? aLine.dictionaryEntries() : theDictionaryEntries);
    LineData line;
    line.fill(0);
    for (int32_t i = 0; i < kWordsPerLine; ++i) {
        Symbol const& symbol(aLine.symbol(i));
        Word32Bit word = 0;
        switch (symbol.thePattern) {
            case kZero: break;
            case kMatch: word = dictionary.entry(symbol.theIndex); break;
            case kByte: word = symbol.thePayload & 0xFF; break;
            case kPartial:
                word = makeWord(topShort(dictionary.entry(symbol.theIndex)), bottomShort(symbol.thePayload));
                break;
            case kNew:
                word = symbol.thePayload;
                dictionary.insert(word);
                break;
        }
        setWord(line, i, word);
    }
    return line;
}

} // namespace nCompression
