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
#ifndef SAFECRACKER_CONFIGURATION_HPP_INCLUDED
#define SAFECRACKER_CONFIGURATION_HPP_INCLUDED

#include <boost/lexical_cast.hpp>
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <core/types.hpp>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <sstream>
#include <string>

namespace Safecracker {
namespace Core {

using std::string;

using boost::bad_lexical_cast;
using boost::lexical_cast;

// Everything a trial can be configured with.  Defaults describe the
// published attack setup: an 8-way set, 4-line superblocks sharing the
// uncompressed size of 4 lines.
struct Parameters
{
    int32_t secret_length;
    int32_t associativity;
    int32_t superblock_budget;
    uint64_t victim_base;
    uint64_t attacker_base;
    uint32_t secret_retries;
    uint32_t seed;
    string debug_severity;

    Parameters()
      : secret_length(4)
      , associativity(8)
      , superblock_budget(256)
      , victim_base(0x10000)
      , attacker_base(0x20000)
      , secret_retries(1024)
      , seed(1)
      , debug_severity("Crit")
    {
    }
};

static const int32_t kSuperblockLines = 4;
static const int32_t kSuperblockBytes = kSuperblockLines * kLineBytes;

// The attacker spreads budget - 67 bytes (top-half tests) and budget - 65
// bytes (bottom-half tests) over three filler lines of 4 to 68 bytes each
static const int32_t kMinimumBudget = 67 + 3 * 4;
static const int32_t kMaximumBudget = 65 + 3 * 68;

// Throws InvalidConfiguration when aParameters cannot describe a trial.
void
validate(Parameters const& aParameters);

namespace aux_ {

// Conversions from the textual form of a parameter.  Unsigned values accept
// any base understood by strtoull ("0x10000", "65536").
void
parseValue(string const& aValue, int32_t& aResult);
void
parseValue(string const& aValue, uint32_t& aResult);
void
parseValue(string const& aValue, uint64_t& aResult);
void
parseValue(string const& aValue, string& aResult);

struct ParameterBase
{
    std::string theName;
    std::string theDescription;

    // Non-copyable
    ParameterBase(const ParameterBase&)            = delete;
    ParameterBase& operator=(const ParameterBase&) = delete;

    ParameterBase(const std::string& aName, const std::string& aDescr)
      : theName(aName)
      , theDescription(aDescr)
    {
    }

    virtual void setValue(std::string aValue) = 0;
    virtual bool isOverridden()               = 0;
    virtual std::string lexicalValue()        = 0;

    virtual ~ParameterBase() {}
};

// Binds a name to one member of a Parameters struct
template<class T>
struct Parameter : public ParameterBase
{
    T& theValue;
    bool theOverridden;

    Parameter(const std::string& aName, const std::string& aDescr, T& aValue)
      : ParameterBase(aName, aDescr)
      , theValue(aValue)
      , theOverridden(false)
    {
    }

    virtual void setValue(std::string aValue)
    {
        try {
            parseValue(aValue, theValue);
            theOverridden = true;
        } catch (bad_lexical_cast& e) {
            DBG_(Crit, (<< "Bad Lexical Cast attempting to set parameter " << theName << " to " << aValue));
            throw INVALID_CONFIGURATION("Unable to set parameter " + theName + " to \"" + aValue + "\"");
        }
    }

    bool isOverridden() { return theOverridden; }

    std::string lexicalValue()
    {
        std::stringstream lex;
        lex << theValue;
        return lex.str();
    }
};

} // namespace aux_

class ConfigurationManager
{
    typedef std::map<const string, std::unique_ptr<aux_::ParameterBase>> parameter_map;
    parameter_map theParameters;

    template<class T>
    void registerParameter(std::string const& aName, std::string const& aDescription, T& aMember)
    {
        theParameters[aName].reset(new aux_::Parameter<T>(aName, aDescription, aMember));
    }

  public:
    // aParameters must outlive the manager
    explicit ConfigurationManager(Parameters& aParameters);

    // Non-copyable
    ConfigurationManager(const ConfigurationManager&)            = delete;
    ConfigurationManager& operator=(const ConfigurationManager&) = delete;

    void set(std::string const& aName, std::string const& aValue);
    void parseConfiguration(std::istream& anIstream);
    void printConfiguration(std::ostream& anOstream);
    std::string getParameterValue(std::string const& aName);
    bool isOverridden(std::string const& aName);
};

} // namespace Core
} // namespace Safecracker

#endif // SAFECRACKER_CONFIGURATION_HPP_INCLUDED
