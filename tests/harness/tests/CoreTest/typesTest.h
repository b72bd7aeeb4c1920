#include <gtest/gtest.h>

TEST_F(CoreTestFixture, WordsAreLittleEndian)
{
	SharedTypes::LineData line;
	line.fill(0);
	line[4] = 0x11; line[5] = 0x22; line[6] = 0x33; line[7] = 0x44;
	ASSERT_EQ( SharedTypes::wordAt(line, 1), 0x44332211u ) << "Byte 0 of a word is not its low byte. Failed!";
	ASSERT_EQ( SharedTypes::wordAt(line, 0), 0u );

	SharedTypes::setWord(line, 15, 0xA1B2C3D4u);
	ASSERT_EQ( line[60], 0xD4 );
	ASSERT_EQ( line[63], 0xA1 );
	ASSERT_EQ( SharedTypes::wordAt(line, 15), 0xA1B2C3D4u );
}

TEST_F(CoreTestFixture, ShortsSplitAndRejoinAWord)
{
	Core::Word32Bit word = 0x44332211u;
	ASSERT_EQ( SharedTypes::topShort(word), 0x4433 ) << "Top short is not the two high bytes. Failed!";
	ASSERT_EQ( SharedTypes::bottomShort(word), 0x2211 ) << "Bottom short is not the two low bytes. Failed!";
	ASSERT_EQ( SharedTypes::makeWord(SharedTypes::topShort(word), SharedTypes::bottomShort(word)), word );
	ASSERT_EQ( SharedTypes::makeWord(0xFFFF, 0), 0xFFFF0000u );
}

TEST_F(CoreTestFixture, AddressesLocateTheirLine)
{
	SharedTypes::PhysicalMemoryAddress base(0x10000);
	SharedTypes::PhysicalMemoryAddress inside = base + 0x47;
	ASSERT_TRUE( base < inside );
	ASSERT_EQ( SharedTypes::lineNumber(inside), 0x401u );
	ASSERT_EQ( SharedTypes::lineOffset(inside), 7 );
	ASSERT_EQ( SharedTypes::lineOffset(base), 0 );

	std::stringstream printed;
	printed << inside;
	ASSERT_EQ( printed.str(), "p(0x000010047)" );
}
