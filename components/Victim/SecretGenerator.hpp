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
#ifndef SAFECRACKER_VICTIM_SECRETGENERATOR_HPP_INCLUDED
#define SAFECRACKER_VICTIM_SECRETGENERATOR_HPP_INCLUDED

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <cstdint>
#include <vector>

namespace nVictim {

// Source of candidate secret bytes.  Bytes are filtered by generateSecret(),
// so a generator may return zero or repeated values.
class SecretGenerator
{
  public:
    virtual ~SecretGenerator() {}
    virtual uint8_t nextByte() = 0;
};

class RandomSecretGenerator : public SecretGenerator
{
    boost::random::mt19937 theEngine;
    boost::random::uniform_int_distribution<int32_t> theDistribution;

  public:
    explicit RandomSecretGenerator(uint32_t aSeed)
      : theEngine(aSeed)
      , theDistribution(0, 255)
    {
    }

    uint8_t nextByte() { return static_cast<uint8_t>(theDistribution(theEngine)); }
};

// Replays a fixed list of bytes; throws SecretGenerationFailure once the list
// is exhausted.
class SequenceSecretGenerator : public SecretGenerator
{
    std::vector<uint8_t> theBytes;
    uint32_t theNext;

  public:
    explicit SequenceSecretGenerator(std::vector<uint8_t> const& aBytes)
      : theBytes(aBytes)
      , theNext(0)
    {
    }

    uint8_t nextByte();
    uint32_t consumed() const { return theNext; }
};

// Draws aLength pairwise distinct, non-zero bytes.  Zero and repeated draws
// are rejected; more than aMaxRetries rejections raise
// SecretGenerationFailure.
std::vector<uint8_t>
generateSecret(SecretGenerator& aGenerator, int32_t aLength, uint32_t aMaxRetries);

// True when aSecret is non-empty and its bytes are distinct and non-zero
bool
isValidSecret(std::vector<uint8_t> const& aSecret);

} // namespace nVictim

#endif // SAFECRACKER_VICTIM_SECRETGENERATOR_HPP_INCLUDED
