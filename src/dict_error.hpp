#ifndef DICT_ERROR_HPP
#define DICT_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

// Base of every dictionary loading failure. line() is the 1-based line in the
// file being parsed when the error occurred, 0 when no line was read yet.
class DictError: public std::runtime_error {
public:
    DictError( const std::string &source, uint32_t line, const std::string &msg );

    uint32_t line() const { return line_num; }
    const std::string& source() const { return src; }

private:
    std::string src;
    uint32_t line_num;
};

class SyntaxError: public DictError {
public:
    SyntaxError( const std::string &source, uint32_t line, const std::string &msg ):
        DictError( source, line, "syntax error: " + msg )
    {}
};

class UnresolvedReferenceError: public DictError {
public:
    UnresolvedReferenceError( const std::string &source, uint32_t line, const std::string &attr ):
        DictError( source, line, "unknown attribute type: " + attr ),
        attr_name( attr )
    {}

    const std::string& name() const { return attr_name; }

private:
    std::string attr_name;
};

class FileNotFoundError: public DictError {
public:
    FileNotFoundError( const std::string &source, uint32_t line, const std::string &path ):
        FileNotFoundError( source, line, path, "dictionary file '" + path + "' not found" )
    {}

    const std::string& path() const { return file_path; }

protected:
    FileNotFoundError( const std::string &source, uint32_t line, const std::string &path, const std::string &msg ):
        DictError( source, line, msg ),
        file_path( path )
    {}

private:
    std::string file_path;
};

class IncludeNotFoundError: public FileNotFoundError {
public:
    IncludeNotFoundError( const std::string &source, uint32_t line, const std::string &path ):
        FileNotFoundError( source, line, path, "included file '" + path + "' not found" )
    {}
};

class CycleDetectedError: public DictError {
public:
    CycleDetectedError( const std::string &source, uint32_t line, const std::string &path ):
        DictError( source, line, "include cycle: '" + path + "' is already being parsed" ),
        file_path( path )
    {}

    const std::string& path() const { return file_path; }

private:
    std::string file_path;
};

class IncludeDepthError: public DictError {
public:
    IncludeDepthError( const std::string &source, uint32_t line, uint32_t depth ):
        DictError( source, line, "include depth exceeds " + std::to_string( depth ) )
    {}
};

#endif
