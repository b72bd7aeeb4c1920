#include <gtest/gtest.h>

TEST_F(CompressedSetTestFixture, LeastRecentlyUsedLineIsEvicted)
{
	CompressedSet set(4, 256, theMemory);
	for (int32_t i = 0; i < 4; ++i)
		set.read(otherLine(i));
	set.read(otherLine(0));
	set.read(otherLine(4));

	ASSERT_TRUE( set.isResident(lineNumber(otherLine(0))) ) << "Recently used line was evicted. Failed!";
	ASSERT_FALSE( set.isResident(lineNumber(otherLine(1))) ) << "LRU line was not evicted. Failed!";

	std::vector<LineNumber> lines(set.residentLines());
	ASSERT_EQ( lines.size(), 4u );
	ASSERT_EQ( lines[0], lineNumber(otherLine(4)) ) << "Newest line should be most recently used. Failed!";
	ASSERT_EQ( lines[1], lineNumber(otherLine(0)) );
	ASSERT_EQ( set.stats().theEvictions, 1u );
	ASSERT_EQ( set.stats().theBudgetEvictions, 0u );
}

TEST_F(CompressedSetTestFixture, PeekDoesNotTouchRecency)
{
	CompressedSet set(4, 256, theMemory);
	for (int32_t i = 0; i < 4; ++i)
		set.read(otherLine(i));

	set.peekLine(lineNumber(otherLine(0)));
	set.read(otherLine(4));
	ASSERT_FALSE( set.isResident(lineNumber(otherLine(0))) ) << "peekLine changed the LRU order. Failed!";
	ASSERT_EQ( set.stats().theHits, 0u );
}

TEST_F(CompressedSetTestFixture, DirtyLinesAreWrittenBack)
{
	CompressedSet set(4, 256, theMemory);
	set.write(victimLine(0), 7);
	for (int32_t i = 0; i < 4; ++i)
		set.read(otherLine(i));

	ASSERT_FALSE( set.isResident(lineNumber(victimLine(0))) );
	ASSERT_EQ( set.stats().theWritebacks, 1u );
	ASSERT_EQ( theMemory.readLine(lineNumber(victimLine(0)))[0], 7 ) << "Dirty data was lost. Failed!";

	AccessResult reload = set.read(victimLine(0));
	ASSERT_TRUE( reload.miss() );
	ASSERT_EQ( reload.theData, 7 );
	ASSERT_FALSE( set.isDirty(lineNumber(victimLine(0))) ) << "Reloaded line should be clean. Failed!";
}

TEST_F(CompressedSetTestFixture, EveryLineOccupiesOneWay)
{
	CompressedSet set(8, 256, theMemory);
	for (int32_t round = 0; round < 3; ++round) {
		for (int32_t i = 0; i < 4; ++i) {
			set.write(victimLine(i) + round, round + 1);
			set.read(otherLine(i + round));
		}
	}

	std::vector<LineNumber> lines(set.residentLines());
	std::sort(lines.begin(), lines.end());
	ASSERT_TRUE( std::adjacent_find(lines.begin(), lines.end()) == lines.end() ) << "Duplicate line. Failed!";
	ASSERT_LE( lines.size(), 8u );
}
