#include <algorithm>
#include <fstream>
#include <limits>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

#include "dict_parser.hpp"
#include "dict_error.hpp"
#include "log.hpp"

static const std::string STREAM_SOURCE { "<stream>" };

RADIUS_TYPE_T parseRadiusType( const std::string &type ) {
    if( boost::iequals( type, "string" ) ) {
        return RADIUS_TYPE_T::STRING;
    } else if( boost::iequals( type, "octets" ) ) {
        return RADIUS_TYPE_T::OCTETS;
    } else if( boost::iequals( type, "integer" ) || boost::iequals( type, "date" ) ) {
        return RADIUS_TYPE_T::INTEGER;
    } else if( boost::iequals( type, "ipaddr" ) ) {
        return RADIUS_TYPE_T::IPADDR;
    }
    return RADIUS_TYPE_T::OCTETS;
}

template<typename T>
static T parseNumber( const std::string &token, const std::string &field, const std::string &source, uint32_t line,
        int64_t min = std::numeric_limits<T>::min(), int64_t max = std::numeric_limits<T>::max() ) {
    int64_t value;
    try {
        value = boost::lexical_cast<int64_t>( token );
    } catch( boost::bad_lexical_cast & ) {
        throw SyntaxError( source, line, "invalid " + field + " '" + token + "'" );
    }
    if( value < min || value > max ) {
        throw SyntaxError( source, line, field + " out of range '" + token + "'" );
    }
    return static_cast<T>( value );
}

static void checkArity( const std::vector<std::string> &tok, size_t args, const std::string &source, uint32_t line ) {
    if( tok.size() != args + 1 ) {
        throw SyntaxError( source, line, tok.front() + " expects " + std::to_string( args ) +
            " fields, got " + std::to_string( tok.size() - 1 ) );
    }
}

DictParser::DictParser( DictParserOptions o ):
    options( std::move( o ) )
{}

RadiusDict DictParser::parse( std::istream &in ) const {
    RadiusDict dict;
    parse( in, dict );
    return dict;
}

void DictParser::parse( std::istream &in, RadiusDict &dict ) const {
    parse_state_t state { dict };
    parseStream( in, STREAM_SOURCE, {}, state );
}

RadiusDict DictParser::parseFile( const std::string &path ) const {
    RadiusDict dict;
    parseFile( path, dict );
    return dict;
}

void DictParser::parseFile( const std::string &path, RadiusDict &dict ) const {
    auto in = open( path );
    if( !in ) {
        throw FileNotFoundError( path, 0, path );
    }
    std::filesystem::path p { path };
    parse_state_t state { dict };
    state.open_files.push_back( std::filesystem::absolute( p ).lexically_normal().string() );
    parseStream( *in, path, p.parent_path(), state );
}

void DictParser::parseStream( std::istream &in, const std::string &source, const std::filesystem::path &base_dir, parse_state_t &state ) const {
    std::string line;
    uint32_t line_num = 0;
    std::vector<std::string> tok;

    while( std::getline( in, line ) ) {
        line_num++;
        boost::trim( line );
        if( line.empty() || line.front() == '#' ) {
            continue;
        }

        tok.clear();
        boost::split( tok, line, boost::is_space(), boost::token_compress_on );

        line_ctx_t ctx { source, base_dir, line_num };
        auto const &type = tok.front();
        if( boost::iequals( type, "ATTRIBUTE" ) ) {
            parseAttributeLine( tok, ctx, state );
        } else if( boost::iequals( type, "VALUE" ) ) {
            parseValueLine( tok, ctx, state );
        } else if( boost::iequals( type, "$INCLUDE" ) ) {
            includeDictionaryFile( tok, ctx, state );
        } else if( boost::iequals( type, "VENDORATTR" ) ) {
            parseVendorAttributeLine( tok, ctx, state );
        } else if( boost::iequals( type, "VENDOR" ) ) {
            parseVendorLine( tok, ctx, state );
        } else {
            throw SyntaxError( source, line_num, "unknown line type: " + type );
        }
    }

    if( in.bad() ) {
        throw DictError( source, line_num, "read error" );
    }

    if( options.logger ) {
        options.logger->logDebug() << LOGS::PARSER << "Parsed " << line_num << " lines from " << source << std::endl;
    }
}

void DictParser::parseAttributeLine( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const {
    checkArity( tok, 3, ctx.source, ctx.line );

    auto code = parseNumber<uint32_t>( tok[ 2 ], "attribute code", ctx.source, ctx.line );
    auto type = code == RADIUS_VSA ? RADIUS_TYPE_T::VSA : parseRadiusType( tok[ 3 ] );

    state.dict.addAttributeType( { code, tok[ 1 ], type } );
}

void DictParser::parseValueLine( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const {
    checkArity( tok, 3, ctx.source, ctx.line );

    auto attr = state.dict.getAttributeTypeByName( tok[ 1 ] );
    if( attr == nullptr ) {
        throw UnresolvedReferenceError( ctx.source, ctx.line, tok[ 1 ] );
    }
    auto value = parseNumber<int64_t>( tok[ 3 ], "value", ctx.source, ctx.line,
        std::numeric_limits<int32_t>::min(), std::numeric_limits<uint32_t>::max() );
    attr->addValue( value, tok[ 2 ] );
}

void DictParser::parseVendorAttributeLine( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const {
    checkArity( tok, 4, ctx.source, ctx.line );

    auto vendor = parseNumber<uint32_t>( tok[ 1 ], "vendor id", ctx.source, ctx.line );
    auto code = parseNumber<uint32_t>( tok[ 3 ], "attribute code", ctx.source, ctx.line );

    state.dict.addAttributeType( { vendor, code, tok[ 2 ], parseRadiusType( tok[ 4 ] ) } );
}

void DictParser::parseVendorLine( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const {
    checkArity( tok, 2, ctx.source, ctx.line );

    auto vendor = parseNumber<uint32_t>( tok[ 1 ], "vendor id", ctx.source, ctx.line );
    state.dict.addVendor( vendor, tok[ 2 ] );
}

void DictParser::includeDictionaryFile( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const {
    checkArity( tok, 1, ctx.source, ctx.line );

    std::filesystem::path path { tok[ 1 ] };
    if( options.include_relative_to_file && path.is_relative() && !ctx.base_dir.empty() ) {
        path = ctx.base_dir / path;
    }
    auto const resolved = path.string();
    auto const id = std::filesystem::absolute( path ).lexically_normal().string();

    if( std::find( state.open_files.begin(), state.open_files.end(), id ) != state.open_files.end() ) {
        throw CycleDetectedError( ctx.source, ctx.line, resolved );
    }
    if( state.depth >= options.max_include_depth ) {
        throw IncludeDepthError( ctx.source, ctx.line, options.max_include_depth );
    }

    auto in = open( resolved );
    if( !in ) {
        throw IncludeNotFoundError( ctx.source, ctx.line, tok[ 1 ] );
    }

    if( options.logger ) {
        options.logger->logDebug() << LOGS::PARSER << "Including " << resolved << " from " << ctx.source << ":" << ctx.line << std::endl;
    }

    state.open_files.push_back( id );
    state.depth++;
    parseStream( *in, resolved, path.parent_path(), state );
    state.depth--;
    state.open_files.pop_back();
}

std::unique_ptr<std::istream> DictParser::open( const std::string &path ) const {
    if( options.opener ) {
        return options.opener( path );
    }
    std::error_code ec;
    if( std::filesystem::is_directory( path, ec ) ) {
        return nullptr;
    }
    auto file = std::make_unique<std::ifstream>( path );
    if( !file->is_open() ) {
        return nullptr;
    }
    return file;
}
