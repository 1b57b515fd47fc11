#include "dict_error.hpp"

static std::string formatError( const std::string &source, uint32_t line, const std::string &msg ) {
    if( line == 0 ) {
        return source + ": " + msg;
    }
    return source + ":" + std::to_string( line ) + ": " + msg;
}

DictError::DictError( const std::string &source, uint32_t line, const std::string &msg ):
    std::runtime_error( formatError( source, line, msg ) ),
    src( source ),
    line_num( line )
{}
