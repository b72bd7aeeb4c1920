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
#ifndef SAFECRACKER_VICTIM_VICTIMBUFFER_HPP_INCLUDED
#define SAFECRACKER_VICTIM_VICTIMBUFFER_HPP_INCLUDED

#include <boost/optional.hpp>
#include <components/CompressedCache/CompressedSet.hpp>
#include <core/configuration.hpp>
#include <core/types.hpp>
#include <cstdint>
#include <vector>

namespace nVictim {

using Safecracker::SharedTypes::PhysicalMemoryAddress;

enum AccessStatus
{
    kOk,
    kAccessDenied
};

// One superblock of victim data whose last secretLength() bytes hold a
// secret.  Every access goes through the shared compressed set; the secret
// region can never be read or written from outside.
class VictimBuffer
{
    nCompressedCache::CompressedSet& theCache;
    PhysicalMemoryAddress theBase;
    std::vector<uint8_t> theSecret;
    int32_t theSecretOffset;
    uint32_t theGuessCount;

    friend class VictimBufferInspector;

  public:
    static const int32_t kBufferBytes = Safecracker::Core::kSuperblockBytes;

    // Stores aSecret at the end of the buffer through aCache.  Throws
    // InvalidConfiguration for a misaligned base or a secret that is not 4
    // or 8 distinct non-zero bytes.
    VictimBuffer(nCompressedCache::CompressedSet& aCache,
                 PhysicalMemoryAddress aBase,
                 std::vector<uint8_t> const& aSecret);

    // boost::none when anOffset is inside the secret or outside the buffer
    boost::optional<uint8_t> read(int32_t anOffset);
    AccessStatus write(int32_t anOffset, uint8_t aByte);

    // Compares aCandidate with the secret.  Every call is counted.
    bool verifyGuess(std::vector<uint8_t> const& aCandidate);
    uint32_t guessCount() const { return theGuessCount; }

    int32_t size() const { return kBufferBytes; }
    int32_t secretLength() const { return theSecret.size(); }
    int32_t secretOffset() const { return theSecretOffset; }

  private:
    bool isAccessible(int32_t anOffset) const;
    PhysicalMemoryAddress address(int32_t anOffset) const
    {
        return PhysicalMemoryAddress(static_cast<uint64_t>(theBase) + anOffset);
    }
};

} // namespace nVictim

#endif // SAFECRACKER_VICTIM_VICTIMBUFFER_HPP_INCLUDED
