#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <components/Compression/CPackCompressor.hpp>
#include <core/debug/debug.hpp>
#include <core/exception.hpp>
#include <deque>
#include <gtest/gtest.h>
#include <vector>

using namespace nCompression;
using Safecracker::SharedTypes::LineData;
using Safecracker::SharedTypes::setWord;
using Safecracker::SharedTypes::wordAt;
using Safecracker::SharedTypes::makeWord;

// Create fixture for testing the compressor
class CompressionTestFixture : public testing::Test
{
protected:
	static void SetUpTestCase()
	{
		Safecracker::Dbg::Debugger::constructDebugger();
		Safecracker::Dbg::Debugger::theDebugger->setMinSev(Safecracker::Dbg::SevCrit);
	}

	void SetUp()
	{
		theLine.fill(0);
	}

	// 16 words with pairwise distinct top shorts
	static LineData incompressibleLine()
	{
		LineData line;
		for (int32_t i = 0; i < Safecracker::Core::kWordsPerLine; ++i)
			setWord(line, i, makeWord(0x1100 + i, 0x2233));
		return line;
	}

	CPackCompressor theCompressor;
	LineData theLine;
};

#include "patternCostTest.h"
#include "dictionaryTest.h"
#include "roundTripTest.h"
#include "randomTest.h"
