#include "gtest/gtest.h"
#include "config.hpp"
#include "yaml.hpp"
#include "log.hpp"

#include <sstream>

TEST(ConfigTest, DecodeFull) {
    auto node = YAML::Load(
        "dictionaries:\n"
        "  - /usr/share/raddict/dictionary\n"
        "  - /etc/raddict/dictionary.local\n"
        "include_relative_to_file: true\n"
        "max_include_depth: 8\n"
        "log_level: debug\n" );
    auto conf = node.as<DictConf>();

    ASSERT_EQ(conf.dictionaries.size(), 2u);
    EXPECT_EQ(conf.dictionaries[ 1 ], "/etc/raddict/dictionary.local");
    EXPECT_TRUE(conf.include_relative_to_file);
    EXPECT_EQ(conf.max_include_depth, 8u);
    EXPECT_EQ(conf.log_level, LOGL::DEBUG);
}

TEST(ConfigTest, DecodeDefaults) {
    auto conf = YAML::Load( "dictionaries: [ a.dict ]\n" ).as<DictConf>();
    EXPECT_EQ(conf.dictionaries, std::vector<std::string>{ "a.dict" });
    EXPECT_FALSE(conf.include_relative_to_file);
    EXPECT_EQ(conf.max_include_depth, 32u);
    EXPECT_EQ(conf.log_level, LOGL::INFO);
}

TEST(ConfigTest, RejectsBadInput) {
    EXPECT_THROW(YAML::Load( "log_level: INFO\n" ).as<DictConf>(), YAML::Exception);
    EXPECT_THROW(YAML::Load( "dictionaries: []\nlog_level: LOUD\n" ).as<DictConf>(), YAML::Exception);
    EXPECT_THROW(YAML::Load( "- a\n- b\n" ).as<DictConf>(), YAML::Exception);
}

TEST(ConfigTest, EncodeDecode) {
    DictConf conf;
    conf.dictionaries = { "dictionary" };
    conf.include_relative_to_file = true;
    conf.max_include_depth = 4;
    conf.log_level = LOGL::WARN;

    YAML::Node node;
    node = conf;
    EXPECT_EQ(node[ "log_level" ].as<std::string>(), "WARN");

    auto back = YAML::Load( YAML::Dump( node ) ).as<DictConf>();
    EXPECT_EQ(back.dictionaries, conf.dictionaries);
    EXPECT_TRUE(back.include_relative_to_file);
    EXPECT_EQ(back.max_include_depth, 4u);
    EXPECT_EQ(back.log_level, LOGL::WARN);
}

TEST(LoggerTest, LevelFiltering) {
    std::ostringstream out;
    Logger logger { out };
    logger.setLevel( LOGL::WARN );

    logger.logDebug() << LOGS::DICT << "hidden" << std::endl;
    logger.logError() << LOGS::DICT << "shown" << std::endl;
    logger.logInfo() << LOGS::MAIN << "also hidden" << std::endl;

    auto text = out.str();
    EXPECT_EQ(text.find( "hidden" ), std::string::npos);
    EXPECT_NE(text.find( "[ERROR] [DICT] shown" ), std::string::npos);
}

TEST(LoggerTest, ParseLevel) {
    LOGL level = LOGL::INFO;
    EXPECT_TRUE(parseLogLevel( "trace", level ));
    EXPECT_EQ(level, LOGL::TRACE);
    EXPECT_TRUE(parseLogLevel( "Alert", level ));
    EXPECT_EQ(level, LOGL::ALERT);
    EXPECT_FALSE(parseLogLevel( "verbose", level ));
    EXPECT_EQ(level, LOGL::ALERT);
}
