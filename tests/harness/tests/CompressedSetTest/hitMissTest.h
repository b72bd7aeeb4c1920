#include <gtest/gtest.h>

TEST_F(CompressedSetTestFixture, MissThenHit)
{
	CompressedSet set(8, 256, theMemory);

	AccessResult first = set.read(victimLine(0));
	ASSERT_TRUE( first.miss() ) << "Cold read should miss. Failed!";
	ASSERT_EQ( first.theData, 0 );

	AccessResult second = set.read(victimLine(0) + 5);
	ASSERT_TRUE( second.hit() ) << "Second read of the line should hit. Failed!";

	ASSERT_TRUE( set.isResident(lineNumber(victimLine(0))) );
	ASSERT_EQ( set.compressedSize(lineNumber(victimLine(0))), 4u ) << "A zero line compresses to 4 bytes. Failed!";
	ASSERT_EQ( set.stats().theHits, 1u );
	ASSERT_EQ( set.stats().theMisses, 1u );
}

TEST_F(CompressedSetTestFixture, WritesAreVisibleAndDirty)
{
	CompressedSet set(8, 256, theMemory);
	LineNumber line = lineNumber(victimLine(1));

	ASSERT_TRUE( set.write(victimLine(1) + 7, 0x42).miss() );
	ASSERT_TRUE( set.isDirty(line) );
	ASSERT_EQ( set.read(victimLine(1) + 7).theData, 0x42 );
	ASSERT_EQ( set.read(victimLine(1) + 6).theData, 0 );
	ASSERT_EQ( theMemory.writes(), 0u ) << "Write should stay in the cache. Failed!";

	ASSERT_TRUE( set.write(victimLine(1) + 7, 0x43).hit() );
	ASSERT_EQ( set.peekLine(line)[7], 0x43 );
}

TEST_F(CompressedSetTestFixture, ResidentLineKeepsItsDictionary)
{
	CompressedSet set(8, 256, theMemory);
	storeIncompressible(victimLine(0));

	set.read(victimLine(0));
	ASSERT_EQ( set.compressedSize(lineNumber(victimLine(0))), 68u );
	ASSERT_EQ( set.dictionarySize(lineNumber(victimLine(0))), 16u );
	ASSERT_EQ( set.dictionarySize(lineNumber(victimLine(1))), 0u ) << "Absent line has no dictionary. Failed!";
}

TEST_F(CompressedSetTestFixture, StateDumpFollowsRecency)
{
	CompressedSet set(2, 256, theMemory);
	set.write(victimLine(1) + 4, 0x42);

	std::stringstream dump;
	set.printState(dump);
	ASSERT_EQ( dump.str(), "  [1] line 0x401 sb 256 5B D\n  [0] empty\n" ) << "Got: " << dump.str();

	set.read(otherLine(0));
	dump.str("");
	set.printState(dump);
	ASSERT_EQ( dump.str(), "  [0] line 0x800 sb 512 4B\n  [1] line 0x401 sb 256 5B D\n" ) << "Got: " << dump.str();
}
