#include <gtest/gtest.h>

TEST_F(CompressedSetTestFixture, SuperblockBudgetEvictsItsOwnLRU)
{
	CompressedSet set(8, 256, theMemory);
	for (int32_t i = 0; i < 4; ++i)
		storeIncompressible(victimLine(i));
	set.read(otherLine(0));

	for (int32_t i = 0; i < 4; ++i)
		set.read(victimLine(i));

	ASSERT_FALSE( set.isResident(lineNumber(victimLine(0))) ) << "Superblock LRU should make room. Failed!";
	for (int32_t i = 1; i < 4; ++i)
		ASSERT_TRUE( set.isResident(lineNumber(victimLine(i))) ) << "Line " << i << " missing. Failed!";
	ASSERT_TRUE( set.isResident(lineNumber(otherLine(0))) ) << "Another superblock paid for the budget. Failed!";

	ASSERT_EQ( set.occupancy(superblockOf(lineNumber(victimLine(0)))), 3u * 68u );
	ASSERT_EQ( set.stats().theBudgetEvictions, 1u );
}

TEST_F(CompressedSetTestFixture, GrowingWriteEvictsOtherMembers)
{
	CompressedSet set(8, 270, theMemory);
	for (int32_t i = 0; i < 3; ++i)
		storeIncompressible(victimLine(i));

	// 15 new words and a zero word: 64 bytes
	LineData line;
	line.fill(0);
	for (int32_t i = 0; i < 15; ++i)
		setWord(line, i, makeWord(0x2100 + i, 0x3344));
	theMemory.writeLine(lineNumber(victimLine(3)), line);

	for (int32_t i = 0; i < 4; ++i)
		set.read(victimLine(i));
	uint64_t superblock = superblockOf(lineNumber(victimLine(0)));
	ASSERT_EQ( set.occupancy(superblock), 3u * 68u + 64u );

	// The zero word becomes 0x77000000, a new word
	ASSERT_TRUE( set.write(victimLine(3) + 63, 0x77).hit() );
	ASSERT_EQ( set.compressedSize(lineNumber(victimLine(3))), 68u );
	ASSERT_FALSE( set.isResident(lineNumber(victimLine(0))) ) << "Oldest member should be evicted. Failed!";
	ASSERT_TRUE( set.isResident(lineNumber(victimLine(3))) ) << "Written line was evicted. Failed!";
	ASSERT_LE( set.occupancy(superblock), 270u );
}

TEST_F(CompressedSetTestFixture, LineLargerThanBudgetIsReported)
{
	CompressedSet set(8, 40, theMemory);
	storeIncompressible(victimLine(0));

	ASSERT_THROW( set.read(victimLine(0)), Safecracker::Core::CapacityInvariantViolation );
}
