#include <memory>
#include <string>
#include <fstream>
#include <iostream>
#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>
#include "yaml.hpp"

#include "config.hpp"
#include "log.hpp"
#include "radius_dict.hpp"
#include "dict_parser.hpp"
#include "string_helpers.hpp"

static void conf_init( const std::string &path ) {
    DictConf conf;

    conf.dictionaries = {
        "/usr/share/raddict/dictionary"
    };
    conf.include_relative_to_file = true;
    conf.max_include_depth = 32;
    conf.log_level = LOGL::INFO;

    YAML::Node config;
    config = conf;

    std::ofstream fout( path );
    fout << config << std::endl;
}

static void printAttribute( const RadiusDict &dict, const radius_attribute_t &attr, const boost::program_options::variables_map &vm ) {
    std::cout << attr << std::endl;
    if( attr.vendor.has_value() ) {
        if( auto const &vname = dict.getVendorName( *attr.vendor ); vname ) {
            std::cout << "Vendor: " << *vname << std::endl;
        }
    }
    if( vm.count( "value" ) ) {
        auto value = vm[ "value" ].as<int64_t>();
        auto text = attr.getValueString( value );
        std::cout << "Value " << value << ": " << ( text.empty() ? "<unknown>" : text ) << std::endl;
    }
}

int main( int argc, char *argv[] ) {
    std::string path_config { "raddict.yaml" };
    std::string log_level;
    std::vector<std::string> dicts;
    std::string attr_name;
    uint32_t attr_code;
    uint32_t vendor;

    boost::program_options::options_description desc {
        "RADIUS dictionary loader.\n"
        "Loads dictionaries listed in the config file or given on the command line and looks up attributes in them.\n"
        "\n"
        "Arguments"
    };
    desc.add_options()
    ( "path,p", boost::program_options::value( &path_config ), "Path to config: default is \"raddict.yaml\"" )
    ( "dict,d", boost::program_options::value( &dicts ), "Dictionary file, may be repeated; overrides the config list" )
    ( "genconf,g", "Generate a sample configuration" )
    ( "name,n", boost::program_options::value( &attr_name ), "Look up attribute by name" )
    ( "code,c", boost::program_options::value( &attr_code ), "Look up attribute by code" )
    ( "vendor,v", boost::program_options::value( &vendor ), "Vendor id for lookup by code" )
    ( "value", boost::program_options::value<int64_t>(), "Translate an enumeration value of the found attribute" )
    ( "dump", "Print the whole dictionary" )
    ( "log-level,l", boost::program_options::value( &log_level ), "TRACE, DEBUG, INFO, WARN, ERROR or ALERT" )
    ( "help,h", "Print this message" )
    ;

    auto logger = std::make_shared<Logger>( std::cerr );

    boost::program_options::variables_map vm;
    try {
        boost::program_options::store( boost::program_options::parse_command_line( argc, argv, desc ), vm );
        boost::program_options::notify( vm );
    } catch( std::exception &e ) {
        logger->logError() << LOGS::MAIN << e.what() << std::endl;
        std::cerr << desc << "\n";
        return 1;
    }

    if( vm.count( "help" ) ) {
        std::cout << desc << "\n";
        return 0;
    }

    if( vm.count( "genconf" ) ) {
        conf_init( path_config );
        return 0;
    }

    try {
        DictConf conf;
        if( dicts.empty() || vm.count( "path" ) ) {
            YAML::Node config = YAML::LoadFile( path_config );
            conf = config.as<DictConf>();
            logger->setLevel( conf.log_level );
            logger->logDebug() << LOGS::CONFIG << "Loaded config " << path_config << std::endl;
        }
        if( !dicts.empty() ) {
            conf.dictionaries = dicts;
        }
        if( !log_level.empty() ) {
            LOGL level;
            if( !parseLogLevel( log_level, level ) ) {
                throw std::runtime_error( "Unknown log level: " + log_level );
            }
            logger->setLevel( level );
        }

        DictParserOptions options;
        options.include_relative_to_file = conf.include_relative_to_file;
        options.max_include_depth = conf.max_include_depth;
        options.logger = logger;

        RadiusDict dict { conf.dictionaries, options };
        logger->logInfo() << LOGS::DICT << "Loaded " << dict.attributeCount() << " attributes and "
            << dict.vendorCount() << " vendors from " << conf.dictionaries.size() << " files" << std::endl;

        if( vm.count( "name" ) ) {
            if( auto const &attr = dict.getAttributeTypeByName( attr_name ); attr != nullptr ) {
                printAttribute( dict, *attr, vm );
            } else if( auto const &id = dict.getIdByName( attr_name ); id ) {
                auto const &vendid = std::get<1>( *id );
                printAttribute( dict, *dict.getVendorAttributeTypeByName( vendid, attr_name ), vm );
            } else {
                logger->logError() << LOGS::DICT << "No attribute named " << attr_name << std::endl;
                return 1;
            }
        }

        if( vm.count( "code" ) ) {
            auto const attr = vm.count( "vendor" ) ?
                dict.getAttributeTypeByCode( attr_code, vendor ) :
                dict.getAttributeTypeByCode( attr_code );
            if( attr == nullptr ) {
                logger->logError() << LOGS::DICT << "No attribute with code " << attr_code << std::endl;
                return 1;
            }
            printAttribute( dict, *attr, vm );
        }

        if( vm.count( "dump" ) ) {
            std::cout << dict;
        }
    } catch( std::exception &e ) {
        logger->logError() << LOGS::MAIN << e.what() << std::endl;
        return 1;
    }

    return 0;
}
