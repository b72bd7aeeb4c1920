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
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <algorithm>
#include <bitset>
#include <sstream>

namespace nVictim {

uint8_t
SequenceSecretGenerator::nextByte()
{
    if (theNext >= theBytes.size()) {
        throw SECRET_GENERATION_FAILURE("Secret byte sequence exhausted");
    }
    return theBytes[theNext++];
}

std::vector<uint8_t>
generateSecret(SecretGenerator& aGenerator, int32_t aLength, uint32_t aMaxRetries)
{
    DBG_Assert(aLength > 0 && aLength < 256, (<< "Cannot draw " << aLength << " distinct non-zero bytes"));

    std::vector<uint8_t> secret;
    std::bitset<256> used;
    used.set(0);
    uint32_t rejected = 0;
    while (static_cast<int32_t>(secret.size()) < aLength) {
        uint8_t candidate = aGenerator.nextByte();
        if (used.test(candidate)) {
            ++rejected;
            DBG_(Verb, (<< "rejected secret byte " << static_cast<int32_t>(candidate)));
            if (rejected > aMaxRetries) {
                std::stringstream msg;
                msg << "No unique non-zero secret after " << rejected << " rejected draws";
                DBG_(Crit, (<< msg.str()));
                throw SECRET_GENERATION_FAILURE(msg.str());
            }
            continue;
        }
        used.set(candidate);
        secret.push_back(candidate);
    }
    return secret;
}

bool
isValidSecret(std::vector<uint8_t> const& aSecret)
{
    if (aSecret.empty()) { return false; }
    std::bitset<256> used;
    used.set(0);
    for (uint8_t byte : aSecret) {
        if (used.test(byte)) { return false; }
        used.set(byte);
    }
    return true;
}

} // namespace nVictim
