#ifndef DICT_PARSER_HPP
#define DICT_PARSER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "radius_dict.hpp"

class Logger;

// Opens an included dictionary by its resolved path, nullptr when it can't be opened
using dict_opener_t = std::function<std::unique_ptr<std::istream>( const std::string &path )>;

struct DictParserOptions {
    // Resolve relative $INCLUDE paths against the including file's directory
    // instead of the working directory
    bool include_relative_to_file { false };
    uint32_t max_include_depth { 32 };
    // Empty means open from the filesystem
    dict_opener_t opener;
    std::shared_ptr<Logger> logger;
};

RADIUS_TYPE_T parseRadiusType( const std::string &type );

/*
 * Reads dictionaries in the format:
 *   ATTRIBUTE   <name> <code> <type>
 *   VALUE       <attribute> <name> <value>
 *   VENDOR      <vendor id> <vendor name>
 *   VENDORATTR  <vendor id> <name> <code> <type>
 *   $INCLUDE    <path>
 * Every failure throws one of the errors from dict_error.hpp and stops the load.
 */
class DictParser {
public:
    DictParser() = default;
    explicit DictParser( DictParserOptions o );

    RadiusDict parse( std::istream &in ) const;
    void parse( std::istream &in, RadiusDict &dict ) const;

    RadiusDict parseFile( const std::string &path ) const;
    void parseFile( const std::string &path, RadiusDict &dict ) const;

private:
    struct parse_state_t {
        RadiusDict &dict;
        std::vector<std::string> open_files;
        uint32_t depth { 0 };
    };

    struct line_ctx_t {
        const std::string &source;
        const std::filesystem::path &base_dir;
        uint32_t line;
    };

    void parseStream( std::istream &in, const std::string &source, const std::filesystem::path &base_dir, parse_state_t &state ) const;

    void parseAttributeLine( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const;
    void parseValueLine( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const;
    void parseVendorAttributeLine( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const;
    void parseVendorLine( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const;
    void includeDictionaryFile( const std::vector<std::string> &tok, const line_ctx_t &ctx, parse_state_t &state ) const;

    std::unique_ptr<std::istream> open( const std::string &path ) const;

    DictParserOptions options;
};

#endif
