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
#ifndef SAFECRACKER_VICTIM_VICTIMBUFFERINSPECTOR_HPP_INCLUDED
#define SAFECRACKER_VICTIM_VICTIMBUFFERINSPECTOR_HPP_INCLUDED

#include <components/Compression/CPackCompressor.hpp>
#include <components/Victim/VictimBuffer.hpp>
#include <iomanip>
#include <iostream>
#include <vector>

namespace nVictim {

// Debug view of a VictimBuffer for tests and the trial harness.  Never handed
// to the attacker.
class VictimBufferInspector
{
    VictimBuffer& theVictim;

  public:
    explicit VictimBufferInspector(VictimBuffer& aVictim)
      : theVictim(aVictim)
    {
    }

    std::vector<uint8_t> const& secret() const { return theVictim.theSecret; }

    void printSecret(std::ostream& anOstream) const
    {
        anOstream << "secret:";
        for (uint8_t byte : theVictim.theSecret) {
            anOstream << ' ' << std::hex << std::setw(2) << std::setfill('0') << static_cast<int32_t>(byte);
        }
        anOstream << std::dec << std::setfill(' ') << std::endl;
    }

    // The line holding the secret as it currently stands, compressed from
    // an empty dictionary
    nCompression::CompressedLine secretLine() const
    {
        Safecracker::SharedTypes::LineNumber line =
          Safecracker::SharedTypes::lineNumber(theVictim.address(theVictim.theSecretOffset));
        nCompression::CPackCompressor compressor;
        return compressor.compress(theVictim.theCache.peekLine(line));
    }

    uint32_t secretLineCompressedBits() const { return secretLine().bits(); }
};

} // namespace nVictim

#endif // SAFECRACKER_VICTIM_VICTIMBUFFERINSPECTOR_HPP_INCLUDED
