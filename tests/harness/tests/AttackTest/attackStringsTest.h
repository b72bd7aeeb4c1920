#include <gtest/gtest.h>

TEST_F(AttackTestFixture, FillerLineSizes)
{
	nAttacker::AttackStrings strings;

	for (uint32_t size = 4; size <= 65; ++size)
		ASSERT_TRUE( strings.isReachable(size) ) << "No filler line of " << size << " bytes. Failed!";
	ASSERT_FALSE( strings.isReachable(66) ) << "No 16-word line compresses to 66 bytes. Failed!";
	ASSERT_TRUE( strings.isReachable(67) );
	ASSERT_TRUE( strings.isReachable(68) );
	ASSERT_FALSE( strings.isReachable(3) );
	ASSERT_FALSE( strings.isReachable(69) );

	ASSERT_EQ( strings.compressor().compressedBytes(strings.fillerLine(37)), 37u );
	ASSERT_THROW( strings.fillerLine(66), Core::InvalidConfiguration );
}

TEST_F(AttackTestFixture, FillerLinesAddUp)
{
	nAttacker::AttackStrings strings;

	uint32_t totals[] = { 189, 191, 12, 204 };
	for (uint32_t total : totals) {
		nAttacker::FillerLines const& lines = strings.fillerLines(total);
		uint32_t sum = 0;
		for (SharedTypes::LineData const& line : lines)
			sum += strings.compressor().compressedBytes(line);
		ASSERT_EQ( sum, total ) << "Filler lines for " << total << " bytes do not add up. Failed!";
	}

	ASSERT_THROW( strings.fillerLines(205), Core::InvalidConfiguration );
	ASSERT_THROW( strings.fillerLines(11), Core::InvalidConfiguration );
}

TEST_F(AttackTestFixture, ProbeLinesHoldTheCandidates)
{
	nAttacker::AttackStrings strings;

	std::vector<uint16_t> candidates = { 0x0102, 0x0103 };
	SharedTypes::LineData line = strings.topShortProbe(candidates, 15);
	ASSERT_EQ( SharedTypes::wordAt(line, 0), 0x0102A55Au );
	ASSERT_EQ( SharedTypes::wordAt(line, 1), 0x0103A55Au );
	ASSERT_EQ( SharedTypes::wordAt(line, 2), nAttacker::fillerNewWord(0) );
	ASSERT_EQ( SharedTypes::wordAt(line, 15), 0u ) << "Word past the writable region was touched. Failed!";
	ASSERT_EQ( strings.prefixBits(line, 15), 15u * 34u );

	line = strings.bottomShortProbe(0x4433, 0x2211, 14);
	ASSERT_EQ( SharedTypes::wordAt(line, 0), 0x44332211u );
	ASSERT_EQ( SharedTypes::wordAt(line, 13), nAttacker::fillerNewWord(12) );
	ASSERT_EQ( SharedTypes::wordAt(line, 14), 0u );
}
