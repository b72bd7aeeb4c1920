#include <gtest/gtest.h>

TEST_F(CoreTestFixture, DefaultParameters)
{
	Core::Parameters parameters;
	Core::ConfigurationManager manager(parameters);

	ASSERT_EQ( manager.getParameterValue("secret_length"), "4" );
	ASSERT_EQ( manager.getParameterValue("associativity"), "8" );
	ASSERT_EQ( manager.getParameterValue("superblock_budget"), "256" );
	ASSERT_EQ( manager.getParameterValue("debug_severity"), "Crit" );
	ASSERT_EQ( manager.getParameterValue("no_such_parameter"), "not_found" );
	ASSERT_FALSE( manager.isOverridden("associativity") );
}

TEST_F(CoreTestFixture, SetOverridesParameter)
{
	Core::Parameters parameters;
	Core::ConfigurationManager manager(parameters);

	manager.set("associativity", "16");
	manager.set("victim_base", "0x40000");
	manager.set("seed", "42");

	ASSERT_EQ( parameters.associativity, 16 ) << "Parameter struct not updated. Failed!";
	ASSERT_EQ( parameters.victim_base, 0x40000u );
	ASSERT_EQ( parameters.seed, 42u );
	ASSERT_TRUE( manager.isOverridden("associativity") );
	ASSERT_FALSE( manager.isOverridden("attacker_base") );
}

TEST_F(CoreTestFixture, BadValuesAreRejected)
{
	Core::Parameters parameters;
	Core::ConfigurationManager manager(parameters);

	ASSERT_THROW( manager.set("no_such_parameter", "1"), Core::InvalidConfiguration );
	ASSERT_THROW( manager.set("associativity", "eight"), Core::InvalidConfiguration );
	ASSERT_THROW( manager.set("seed", "-1"), Core::InvalidConfiguration );
	ASSERT_THROW( manager.set("seed", "0x100000000"), Core::InvalidConfiguration );
	ASSERT_THROW( manager.set("victim_base", "64k"), Core::InvalidConfiguration );
	ASSERT_EQ( parameters.associativity, 8 ) << "A rejected value changed the parameter. Failed!";
}

TEST_F(CoreTestFixture, ParseConfigurationStream)
{
	Core::Parameters parameters;
	Core::ConfigurationManager manager(parameters);

	std::stringstream config;
	config << "# attack setup\n"
	       << "\n"
	       << "secret_length = 8\n"
	       << "  attacker_base=0x80000\n"
	       << "debug_severity \"Dev\"\n";
	manager.parseConfiguration(config);

	ASSERT_EQ( parameters.secret_length, 8 );
	ASSERT_EQ( parameters.attacker_base, 0x80000u );
	ASSERT_EQ( parameters.debug_severity, "Dev" );

	std::stringstream malformed("secret_length\n");
	ASSERT_THROW( manager.parseConfiguration(malformed), Core::InvalidConfiguration );
}

TEST_F(CoreTestFixture, PrintConfiguration)
{
	Core::Parameters parameters;
	Core::ConfigurationManager manager(parameters);
	manager.set("superblock_budget", "200");

	std::stringstream out;
	manager.printConfiguration(out);
	std::string printed(out.str());

	ASSERT_NE( printed.find("superblock_budget"), std::string::npos );
	ASSERT_NE( printed.find("200"), std::string::npos ) << "Overridden value not printed. Failed!";
	ASSERT_NE( printed.find("# Ways in the compressed set"), std::string::npos ) << "Description missing. Failed!";
}
