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
#ifndef SAFECRACKER_CORE_DEBUG_DEBUG_HPP_INCLUDED
#define SAFECRACKER_CORE_DEBUG_DEBUG_HPP_INCLUDED

#include <sstream>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/facilities/overload.hpp>
#include <boost/preprocessor/stringize.hpp>

#include <core/debug/debugger.hpp>

// DBG_(Severity, (<< stream operations))
#define DBG_(Sev, operations) \
  BOOST_PP_CAT(DBG__Undefined_Severity_Level__,Sev) ( DBG__internal_Log ) ( DBG_internal_Sev_to_enum(Sev) , operations)   /**/

// DBG_Assert(condition) or DBG_Assert(condition, (<< stream operations))
#define DBG_Assert(...) \
  BOOST_PP_OVERLOAD(DBG__internal_Assert_, __VA_ARGS__)(__VA_ARGS__)   /**/

#define DBG__Undefined_Severity_Level__Tmp(Macro) Macro
#define DBG__Undefined_Severity_Level__Crit(Macro) Macro
#define DBG__Undefined_Severity_Level__Dev(Macro) Macro
#define DBG__Undefined_Severity_Level__Trace(Macro) Macro
#define DBG__Undefined_Severity_Level__Iface(Macro) Macro
#define DBG__Undefined_Severity_Level__Verb(Macro) Macro
#define DBG__Undefined_Severity_Level__VVerb(Macro) Macro
#define DBG__Undefined_Severity_Level__Inv(Macro) Macro

#define DBG_internal_Sev_to_enum(aSev)          \
    Safecracker::Dbg::BOOST_PP_CAT(Sev,aSev)  /**/

#define DBG__internal_Strip(...) __VA_ARGS__

#define DBG__internal_Log(aSeverity, operations)                                                    \
  do {                                                                                              \
    Safecracker::Dbg::Debugger::constructDebugger();                                                \
    if (Safecracker::Dbg::Debugger::theDebugger->enabled(aSeverity)) {                              \
      std::stringstream DBG__internal_message;                                                      \
      DBG__internal_message DBG__internal_Strip operations;                                         \
      Safecracker::Dbg::Debugger::theDebugger->process(                                             \
        Safecracker::Dbg::Entry(aSeverity, __FILE__, __LINE__, __FUNCTION__,                        \
                                Safecracker::Dbg::Debugger::theDebugger->count(),                   \
                                DBG__internal_message.str()));                                      \
    }                                                                                               \
  } while (0)   /**/

#define DBG__internal_Assert_1(condition) \
  DBG__internal_Assert_2(condition, (<< ""))   /**/

#define DBG__internal_Assert_2(condition, operations)                                               \
  do {                                                                                              \
    if (!(condition)) {                                                                             \
      std::stringstream DBG__internal_message;                                                      \
      DBG__internal_message DBG__internal_Strip operations;                                         \
      Safecracker::Dbg::assertionFailed(BOOST_PP_STRINGIZE(condition), __FILE__, __LINE__,          \
                                        __FUNCTION__, DBG__internal_message.str());                 \
    }                                                                                               \
  } while (0)   /**/

#endif //SAFECRACKER_CORE_DEBUG_DEBUG_HPP_INCLUDED
