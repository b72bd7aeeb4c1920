#include <algorithm>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <components/CompressedCache/CompressedSet.hpp>
#include <components/MainMemory/MainMemory.hpp>
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <gtest/gtest.h>
#include <map>
#include <sstream>

using namespace nCompressedCache;
using Safecracker::SharedTypes::LineData;
using Safecracker::SharedTypes::LineNumber;
using Safecracker::SharedTypes::PhysicalMemoryAddress;
using Safecracker::SharedTypes::lineNumber;
using Safecracker::SharedTypes::makeWord;
using Safecracker::SharedTypes::setWord;

// Create fixture for testing the compressed set
class CompressedSetTestFixture : public testing::Test
{
protected:
	static void SetUpTestCase()
	{
		Safecracker::Dbg::Debugger::constructDebugger();
		Safecracker::Dbg::Debugger::theDebugger->setMinSev(Safecracker::Dbg::SevCrit);
	}

	// Line anIndex of the superblock at 0x10000
	static PhysicalMemoryAddress victimLine(int32_t anIndex)
	{
		return PhysicalMemoryAddress(0x10000 + anIndex * 64);
	}

	// First line of superblock anIndex above 0x20000
	static PhysicalMemoryAddress otherLine(int32_t anIndex)
	{
		return PhysicalMemoryAddress(0x20000 + anIndex * 256);
	}

	// Stores a line that compresses to 68 bytes
	void storeIncompressible(PhysicalMemoryAddress anAddress)
	{
		LineData line;
		for (int32_t i = 0; i < Safecracker::Core::kWordsPerLine; ++i)
			setWord(line, i, makeWord(0x1100 + i, 0x2233));
		theMemory.writeLine(lineNumber(anAddress), line);
	}

	nMainMemory::MainMemory theMemory;
};

#include "hitMissTest.h"
#include "replacementTest.h"
#include "budgetTest.h"
#include "randomAccessTest.h"
