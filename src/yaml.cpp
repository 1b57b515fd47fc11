#include "yaml.hpp"
#include "config.hpp"
#include "log.hpp"

YAML::Node YAML::convert<LOGL>::encode( const LOGL &rhs ) {
    Node node;
    switch( rhs ) {
    case LOGL::TRACE:
        node = "TRACE"; break;
    case LOGL::DEBUG:
        node = "DEBUG"; break;
    case LOGL::INFO:
        node = "INFO"; break;
    case LOGL::WARN:
        node = "WARN"; break;
    case LOGL::ERROR:
        node = "ERROR"; break;
    case LOGL::ALERT:
        node = "ALERT"; break;
    }
    return node;
}

bool YAML::convert<LOGL>::decode( const YAML::Node &node, LOGL &rhs ) {
    if( !node.IsScalar() ) {
        return false;
    }
    return parseLogLevel( node.as<std::string>(), rhs );
}

YAML::Node YAML::convert<DictConf>::encode( const DictConf &rhs ) {
    Node node;
    node["dictionaries"] = rhs.dictionaries;
    node["include_relative_to_file"] = rhs.include_relative_to_file;
    node["max_include_depth"] = rhs.max_include_depth;
    node["log_level"] = rhs.log_level;
    return node;
}

bool YAML::convert<DictConf>::decode( const YAML::Node &node, DictConf &rhs ) {
    if( !node.IsMap() ) {
        return false;
    }
    rhs.dictionaries = node[ "dictionaries" ].as<std::vector<std::string>>();
    if( auto const &n = node[ "include_relative_to_file" ]; n ) {
        rhs.include_relative_to_file = n.as<bool>();
    }
    if( auto const &n = node[ "max_include_depth" ]; n ) {
        rhs.max_include_depth = n.as<uint32_t>();
    }
    if( auto const &n = node[ "log_level" ]; n ) {
        rhs.log_level = n.as<LOGL>();
    }
    return true;
}
