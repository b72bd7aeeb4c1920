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
#ifndef SAFECRACKER_EXCEPTION_HPP_INCLUDED
#define SAFECRACKER_EXCEPTION_HPP_INCLUDED

#include <boost/lexical_cast.hpp>
#include <cstdint>
#include <exception>
#include <string>

namespace Safecracker {
namespace Core {

using std::exception;
using std::string;

#define INVALID_CONFIGURATION(anExplanation) \
    Safecracker::Core::InvalidConfiguration(__FILE__, __LINE__, anExplanation)
#define SECRET_GENERATION_FAILURE(anExplanation) \
    Safecracker::Core::SecretGenerationFailure(__FILE__, __LINE__, anExplanation)
#define CAPACITY_INVARIANT_VIOLATION(anExplanation) \
    Safecracker::Core::CapacityInvariantViolation(__FILE__, __LINE__, anExplanation)

class SafecrackerException : public exception
{
  protected:
    string theExplanation;
    char const* theFile;
    int64_t theLine;
    string theMessage;

    void buildMessage()
    {
        theMessage.clear();
        if (theFile) {
            theMessage += '[';
            theMessage += theFile;
            theMessage += ':';
            theMessage += boost::lexical_cast<string>(theLine);
            theMessage += "] ";
        }
        if (!theExplanation.empty()) {
            theMessage += theExplanation;
        } else {
            theMessage += no_explanation_str();
        }
    }

  public:
    SafecrackerException()
      : theFile(nullptr)
      , theLine(0)
    {
    }
    explicit SafecrackerException(string anExplanation)
      : theExplanation(anExplanation)
      , theFile(nullptr)
      , theLine(0)
    {
    }
    SafecrackerException(char const* aFile, int64_t aLine, string anExplanation)
      : theExplanation(anExplanation)
      , theFile(aFile)
      , theLine(aLine)
    {
    }

    virtual ~SafecrackerException() throw() {}

    string const& explanation() const { return theExplanation; }

    virtual char const* no_explanation_str() const { return "Unknown Safecracker exception"; }
    virtual char const* what() const throw()
    {
        // The message is built lazily so that derived classes contribute their
        // own no_explanation_str().
        if (theMessage.empty()) { const_cast<SafecrackerException*>(this)->buildMessage(); }
        return theMessage.c_str();
    }
};

// The trial cannot start with the requested parameters.
class InvalidConfiguration : public SafecrackerException
{
    typedef SafecrackerException base;

  public:
    explicit InvalidConfiguration(string anExplanation)
      : base(anExplanation)
    {
    }
    InvalidConfiguration(char const* aFile, int64_t aLine, string anExplanation)
      : base(aFile, aLine, anExplanation)
    {
    }
    virtual ~InvalidConfiguration() throw() {}
    virtual char const* no_explanation_str() const { return "Invalid configuration"; }
};

// The secret generator kept producing zero or repeated bytes.
class SecretGenerationFailure : public SafecrackerException
{
    typedef SafecrackerException base;

  public:
    explicit SecretGenerationFailure(string anExplanation)
      : base(anExplanation)
    {
    }
    SecretGenerationFailure(char const* aFile, int64_t aLine, string anExplanation)
      : base(aFile, aLine, anExplanation)
    {
    }
    virtual ~SecretGenerationFailure() throw() {}
    virtual char const* no_explanation_str() const { return "Secret generation failed"; }
};

// A superblock exceeded its budget or a line occupied two ways.  This is a
// defect in the cache model and aborts the trial.
class CapacityInvariantViolation : public SafecrackerException
{
    typedef SafecrackerException base;

  public:
    explicit CapacityInvariantViolation(string anExplanation)
      : base(anExplanation)
    {
    }
    CapacityInvariantViolation(char const* aFile, int64_t aLine, string anExplanation)
      : base(aFile, aLine, anExplanation)
    {
    }
    virtual ~CapacityInvariantViolation() throw() {}
    virtual char const* no_explanation_str() const { return "Cache capacity invariant violated"; }
};

// Raised by DBG_Assert.
class AssertionFailure : public SafecrackerException
{
    typedef SafecrackerException base;

  public:
    explicit AssertionFailure(string anExplanation)
      : base(anExplanation)
    {
    }
    AssertionFailure(char const* aFile, int64_t aLine, string anExplanation)
      : base(aFile, aLine, anExplanation)
    {
    }
    virtual ~AssertionFailure() throw() {}
    virtual char const* no_explanation_str() const { return "Assertion failed"; }
};

} // namespace Core
} // namespace Safecracker

#endif // SAFECRACKER_EXCEPTION_HPP_INCLUDED
