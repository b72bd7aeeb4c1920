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
#include <boost/algorithm/string.hpp>
#include <core/configuration.hpp>
#include <core/debug/debug.hpp>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace Safecracker {
namespace Core {

namespace aux_ {

void
parseValue(string const& aValue, int32_t& aResult)
{
    aResult = boost::lexical_cast<int32_t>(aValue);
}

static uint64_t
parseUnsigned(string const& aValue, uint64_t aMax)
{
    if (aValue.empty() || aValue[0] == '-') { throw bad_lexical_cast(); }
    char* end = nullptr;
    errno     = 0;
    uint64_t result(std::strtoull(aValue.c_str(), &end, 0));
    if (errno != 0 || *end != 0 || result > aMax) { throw bad_lexical_cast(); }
    return result;
}

void
parseValue(string const& aValue, uint32_t& aResult)
{
    aResult = static_cast<uint32_t>(parseUnsigned(aValue, 0xFFFFFFFFULL));
}

void
parseValue(string const& aValue, uint64_t& aResult)
{
    aResult = parseUnsigned(aValue, ~0ULL);
}

void
parseValue(string const& aValue, string& aResult)
{
    aResult = aValue;
}

} // namespace aux_

ConfigurationManager::ConfigurationManager(Parameters& aParameters)
{
    registerParameter("secret_length", "Secret size in bytes (4 or 8)", aParameters.secret_length);
    registerParameter("associativity", "Ways in the compressed set", aParameters.associativity);
    registerParameter("superblock_budget",
                      "Compressed bytes shared by the 4 lines of a superblock",
                      aParameters.superblock_budget);
    registerParameter("victim_base", "Superblock-aligned address of the victim buffer", aParameters.victim_base);
    registerParameter("attacker_base", "Superblock-aligned address of the attacker lines", aParameters.attacker_base);
    registerParameter("secret_retries", "Rejected draws tolerated while generating a secret", aParameters.secret_retries);
    registerParameter("seed", "Seed of the random secret generator", aParameters.seed);
    registerParameter("debug_severity", "Minimum severity printed by DBG_", aParameters.debug_severity);
}

void
ConfigurationManager::set(std::string const& aName, std::string const& aValue)
{
    parameter_map::iterator iter = theParameters.find(aName);
    if (iter == theParameters.end()) {
        DBG_(Crit, (<< "There is no parameter named \"" << aName << "\""));
        throw INVALID_CONFIGURATION("There is no parameter named \"" + aName + "\"");
    }
    iter->second->setValue(aValue);
}

void
ConfigurationManager::parseConfiguration(std::istream& anIstream)
{
    std::string line;
    std::vector<std::string> strs;
    while (std::getline(anIstream, line)) {
        boost::trim(line);
        if (line.empty() || line[0] == '#') continue;

        boost::split(strs, line, boost::is_any_of(" \t=\""), boost::token_compress_on);
        if (strs.size() < 2 || strs[1].empty()) {
            throw INVALID_CONFIGURATION("Malformed configuration line \"" + line + "\"");
        }
        std::string param_name(strs[0]), value(strs[1]);

        DBG_(Iface, (<< "Dynamic param:" << param_name << ", value:" << value));
        set(param_name, value);
    }
}

void
ConfigurationManager::printConfiguration(std::ostream& anOstream)
{
    parameter_map::iterator iter = theParameters.begin();
    parameter_map::iterator end  = theParameters.end();
    while (iter != end) {
        anOstream << std::setw(20) << std::setiosflags(std::ios::left) << iter->first << " " << std::setw(12)
                  << std::setiosflags(std::ios::left) << iter->second->lexicalValue();
        anOstream << " # " << iter->second->theDescription;
        anOstream << std::endl;
        ++iter;
    }
}

std::string
ConfigurationManager::getParameterValue(std::string const& aName)
{
    parameter_map::iterator iter = theParameters.find(aName);
    if (iter == theParameters.end()) { return "not_found"; }
    return iter->second->lexicalValue();
}

bool
ConfigurationManager::isOverridden(std::string const& aName)
{
    parameter_map::iterator iter = theParameters.find(aName);
    return iter != theParameters.end() && iter->second->isOverridden();
}

void
validate(Parameters const& aParameters)
{
    std::stringstream problem;
    if (aParameters.secret_length != 4 && aParameters.secret_length != 8) {
        problem << "secret_length must be 4 or 8, not " << aParameters.secret_length;
    } else if (aParameters.associativity < kSuperblockLines) {
        problem << "associativity " << aParameters.associativity << " cannot hold one superblock";
    } else if (aParameters.superblock_budget < kMinimumBudget || aParameters.superblock_budget > kMaximumBudget) {
        problem << "superblock_budget " << aParameters.superblock_budget << " is outside [" << kMinimumBudget << ", "
                << kMaximumBudget << "]";
    } else if (aParameters.victim_base % kSuperblockBytes != 0) {
        problem << "victim_base 0x" << std::hex << aParameters.victim_base << " is not superblock aligned";
    } else if (aParameters.attacker_base % kSuperblockBytes != 0) {
        problem << "attacker_base 0x" << std::hex << aParameters.attacker_base << " is not superblock aligned";
    } else if (aParameters.victim_base >= aParameters.attacker_base &&
               aParameters.victim_base <
                 aParameters.attacker_base + static_cast<uint64_t>(aParameters.associativity) * kSuperblockBytes) {
        problem << "victim_base 0x" << std::hex << aParameters.victim_base << " overlaps the attacker lines";
    } else {
        Dbg::Severity ignored;
        if (!Dbg::fromString(aParameters.debug_severity, ignored)) {
            problem << "unknown debug_severity \"" << aParameters.debug_severity << "\"";
        }
    }

    if (!problem.str().empty()) {
        DBG_(Crit, (<< "Invalid configuration: " << problem.str()));
        throw INVALID_CONFIGURATION(problem.str());
    }
}

} // namespace Core
} // namespace Safecracker
