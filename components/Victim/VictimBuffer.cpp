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
#include <components/Victim/SecretGenerator.hpp>
#include <components/Victim/VictimBuffer.hpp>
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <sstream>

namespace nVictim {

const int32_t VictimBuffer::kBufferBytes;

VictimBuffer::VictimBuffer(nCompressedCache::CompressedSet& aCache,
                           PhysicalMemoryAddress aBase,
                           std::vector<uint8_t> const& aSecret)
  : theCache(aCache)
  , theBase(aBase)
  , theSecret(aSecret)
  , theSecretOffset(kBufferBytes - static_cast<int32_t>(aSecret.size()))
  , theGuessCount(0)
{
    if (static_cast<uint64_t>(theBase) % kBufferBytes != 0) {
        std::stringstream msg;
        msg << "Victim buffer " << theBase << " is not superblock aligned";
        throw INVALID_CONFIGURATION(msg.str());
    }
    if (theSecret.size() != 4 && theSecret.size() != 8) {
        std::stringstream msg;
        msg << "Unsupported secret length " << theSecret.size();
        throw INVALID_CONFIGURATION(msg.str());
    }
    if (!isValidSecret(theSecret)) {
        throw INVALID_CONFIGURATION("Secret bytes must be distinct and non-zero");
    }

    for (uint32_t i = 0; i < theSecret.size(); ++i) {
        theCache.write(address(theSecretOffset + i), theSecret[i]);
    }
    DBG_(Iface, (<< "victim buffer at " << theBase << " holds a " << theSecret.size() << "-byte secret"));
}

bool
VictimBuffer::isAccessible(int32_t anOffset) const
{
    return anOffset >= 0 && anOffset < theSecretOffset;
}

boost::optional<uint8_t>
VictimBuffer::read(int32_t anOffset)
{
    if (!isAccessible(anOffset)) {
        DBG_(Iface, (<< "read of offset " << anOffset << " denied"));
        return boost::none;
    }
    return theCache.read(address(anOffset)).theData;
}

AccessStatus
VictimBuffer::write(int32_t anOffset, uint8_t aByte)
{
    if (!isAccessible(anOffset)) {
        DBG_(Iface, (<< "write of offset " << anOffset << " denied"));
        return kAccessDenied;
    }
    theCache.write(address(anOffset), aByte);
    return kOk;
}

bool
VictimBuffer::verifyGuess(std::vector<uint8_t> const& aCandidate)
{
    ++theGuessCount;
    bool correct = (aCandidate == theSecret);
    DBG_(Trace, (<< "guess " << theGuessCount << (correct ? " accepted" : " rejected")));
    return correct;
}

} // namespace nVictim
