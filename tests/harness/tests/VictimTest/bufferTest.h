#include <gtest/gtest.h>

TEST_F(VictimTestFixture, SecretIsNeverExposed)
{
	VictimBuffer victim(*theCache, PhysicalMemoryAddress(0x10000), theSecret);
	ASSERT_EQ( victim.secretOffset(), 252 );

	for (int32_t offset = 252; offset < 256; ++offset) {
		ASSERT_FALSE( victim.read(offset).is_initialized() ) << "Secret offset " << offset << " was readable. Failed!";
		ASSERT_EQ( victim.write(offset, 0), kAccessDenied ) << "Secret offset " << offset << " was writable. Failed!";
	}
	ASSERT_FALSE( victim.read(-1).is_initialized() );
	ASSERT_FALSE( victim.read(256).is_initialized() );
	ASSERT_EQ( victim.write(256, 1), kAccessDenied );

	VictimBufferInspector inspector(victim);
	ASSERT_TRUE( inspector.secret() == theSecret ) << "Denied write changed the secret. Failed!";
}

TEST_F(VictimTestFixture, PublicBytesReadBackWhatWasWritten)
{
	VictimBuffer victim(*theCache, PhysicalMemoryAddress(0x10000), theSecret);

	ASSERT_EQ( victim.read(251).get(), 0 );
	ASSERT_EQ( victim.write(0, 5), kOk );
	ASSERT_EQ( victim.write(251, 9), kOk );
	ASSERT_EQ( victim.read(0).get(), 5 );
	ASSERT_EQ( victim.read(251).get(), 9 );
}

TEST_F(VictimTestFixture, SecretLivesInTheCache)
{
	VictimBuffer victim(*theCache, PhysicalMemoryAddress(0x10000), theSecret);

	Safecracker::SharedTypes::LineData line = theCache->peekLine(0x403);
	for (int32_t i = 0; i < 4; ++i)
		ASSERT_EQ( line[60 + i], theSecret[i] ) << "Secret byte " << i << " not stored. Failed!";

	// 15 zero words and the new word 0x44332211
	VictimBufferInspector inspector(victim);
	ASSERT_EQ( inspector.secretLineCompressedBits(), 15u * 2u + 34u );

	std::stringstream out;
	inspector.printSecret(out);
	ASSERT_EQ( out.str(), "secret: 11 22 33 44\n" );
}

TEST_F(VictimTestFixture, EveryGuessIsCounted)
{
	VictimBuffer victim(*theCache, PhysicalMemoryAddress(0x10000), theSecret);

	std::vector<uint8_t> wrong = { 0x44, 0x33, 0x22, 0x11 };
	ASSERT_FALSE( victim.verifyGuess(wrong) );
	ASSERT_FALSE( victim.verifyGuess(std::vector<uint8_t>()) );
	ASSERT_TRUE( victim.verifyGuess(theSecret) );
	ASSERT_EQ( victim.guessCount(), 3u );
}

TEST_F(VictimTestFixture, BadBuffersAreRejected)
{
	ASSERT_THROW( VictimBuffer(*theCache, PhysicalMemoryAddress(0x10040), theSecret), InvalidConfiguration );

	std::vector<uint8_t> five = { 1, 2, 3, 4, 5 };
	ASSERT_THROW( VictimBuffer(*theCache, PhysicalMemoryAddress(0x10000), five), InvalidConfiguration );

	std::vector<uint8_t> repeated = { 1, 2, 3, 1 };
	ASSERT_THROW( VictimBuffer(*theCache, PhysicalMemoryAddress(0x10000), repeated), InvalidConfiguration );

	std::vector<uint8_t> zero = { 1, 2, 0, 4 };
	ASSERT_THROW( VictimBuffer(*theCache, PhysicalMemoryAddress(0x10000), zero), InvalidConfiguration );
}

TEST_F(VictimTestFixture, EightByteSecret)
{
	std::vector<uint8_t> secret = { 1, 2, 3, 4, 5, 6, 7, 8 };
	VictimBuffer victim(*theCache, PhysicalMemoryAddress(0x10000), secret);

	ASSERT_EQ( victim.secretLength(), 8 );
	ASSERT_EQ( victim.secretOffset(), 248 );
	ASSERT_FALSE( victim.read(248).is_initialized() );
	ASSERT_TRUE( victim.read(247).is_initialized() );
}
