#include <boost/algorithm/string/predicate.hpp>

#include "log.hpp"

std::ostream& operator<<( std::ostream &os, const LOGL &l ) {
    switch( l ) {
    case LOGL::TRACE: return os << "[TRACE] ";
    case LOGL::DEBUG: return os << "[DEBUG] ";
    case LOGL::INFO: return os << "[INFO] ";
    case LOGL::WARN: return os << "[WARN] ";
    case LOGL::ERROR: return os << "[ERROR] ";
    case LOGL::ALERT: return os << "[ALERT] ";
    }
    return os;
}

std::ostream& operator<<( std::ostream &os, const LOGS &l ) {
    switch( l ) {
    case LOGS::MAIN: return os << "[MAIN] ";
    case LOGS::DICT: return os << "[DICT] ";
    case LOGS::PARSER: return os << "[PARSER] ";
    case LOGS::CONFIG: return os << "[CONFIG] ";
    }
    return os;
}

bool parseLogLevel( const std::string &text, LOGL &level ) {
    static const std::pair<const char*,LOGL> names[] = {
        { "TRACE", LOGL::TRACE },
        { "DEBUG", LOGL::DEBUG },
        { "INFO", LOGL::INFO },
        { "WARN", LOGL::WARN },
        { "ERROR", LOGL::ERROR },
        { "ALERT", LOGL::ALERT }
    };
    for( auto const &[ name, l ]: names ) {
        if( boost::iequals( text, name ) ) {
            level = l;
            return true;
        }
    }
    return false;
}
