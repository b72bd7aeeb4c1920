#include <gtest/gtest.h>

TEST_F(CompressedSetTestFixture, RandomAccessesKeepBudgetAndData)
{
	static const int32_t kLines = 16;
	static const uint32_t kBudget = 200;
	CompressedSet set(8, kBudget, theMemory);

	// Four superblocks of four lines; one incompressible line in each
	std::map<LineNumber, LineData> shadow;
	for (int32_t i = 0; i < kLines; ++i) {
		if (i % 5 == 0)
			storeIncompressible(victimLine(i));
		shadow[lineNumber(victimLine(i))] = theMemory.readLine(lineNumber(victimLine(i)));
	}

	boost::random::mt19937 generator(2024);
	boost::random::uniform_int_distribution<int32_t> pickLine(0, kLines - 1);
	boost::random::uniform_int_distribution<int32_t> pickOffset(0, Safecracker::Core::kLineBytes - 1);
	boost::random::uniform_int_distribution<int32_t> pickByte(0, 255);

	for (int32_t step = 0; step < 2000; ++step) {
		PhysicalMemoryAddress address = victimLine(pickLine(generator)) + pickOffset(generator);
		LineNumber line = lineNumber(address);
		int32_t offset = Safecracker::SharedTypes::lineOffset(address);

		if (pickByte(generator) < 128) {
			uint8_t data = static_cast<uint8_t>(pickByte(generator));
			set.write(address, data);
			shadow[line][offset] = data;
		} else {
			ASSERT_EQ( set.read(address).theData, shadow[line][offset] ) << "Step " << step << " read stale data. Failed!";
		}

		for (int32_t i = 0; i < kLines; i += Safecracker::Core::kSuperblockLines) {
			uint64_t superblock = superblockOf(lineNumber(victimLine(i)));
			ASSERT_LE( set.occupancy(superblock), kBudget ) << "Step " << step << " superblock " << superblock << ". Failed!";
		}

		std::vector<LineNumber> resident(set.residentLines());
		std::sort(resident.begin(), resident.end());
		ASSERT_TRUE( std::adjacent_find(resident.begin(), resident.end()) == resident.end() )
			<< "Step " << step << " holds a line twice. Failed!";

		for (std::map<LineNumber, LineData>::iterator iter = shadow.begin(); iter != shadow.end(); ++iter) {
			if (set.isResident(iter->first)) {
				ASSERT_TRUE( set.peekLine(iter->first) == iter->second ) << "Step " << step << " cached copy differs. Failed!";
			} else {
				ASSERT_TRUE( theMemory.readLine(iter->first) == iter->second )
					<< "Step " << step << " lost a write-back for line 0x" << std::hex << iter->first << ". Failed!";
			}
		}
	}

	ASSERT_GT( set.stats().theBudgetEvictions, 0u ) << "The budget never bound. Failed!";
	ASSERT_GT( set.stats().theWritebacks, 0u );
}
