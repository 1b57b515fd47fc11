#ifndef LOG_HPP
#define LOG_HPP

#include <cstdint>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <string>

enum class LOGL: uint8_t {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    ALERT
};

enum class LOGS: uint8_t {
    MAIN,
    DICT,
    PARSER,
    CONFIG
};

std::ostream& operator<<( std::ostream &os, const LOGL &l );
std::ostream& operator<<( std::ostream &os, const LOGS &l );

bool parseLogLevel( const std::string &text, LOGL &level );

class Logger {
private:
    std::ostream &os;
    LOGL minimum;
    bool noop;

    Logger& printTime() {
        auto in_time_t = std::chrono::system_clock::to_time_t( std::chrono::system_clock::now() );
        *this << std::put_time( std::localtime( &in_time_t ), "%Y-%m-%d %X: ");
        return *this;
    }

    Logger& start( LOGL level ) {
        noop = minimum > level;
        printTime();
        return *this << level;
    }

public:
    Logger( std::ostream &o = std::cout ):
        os( o ),
        minimum( LOGL::INFO ),
        noop( false )
    {}

    void setLevel( const LOGL &level ) {
        minimum = level;
    }

    LOGL getLevel() const {
        return minimum;
    }

    Logger& operator<<( std::ostream& (*fun)( std::ostream& ) ) {
        if( !noop ) {
            os << fun;
        }
        noop = false;
        return *this;
    }

    template<typename T>
    Logger& operator<<( const T& data ) {
        if( !noop ) {
            os << data;
        }
        return *this;
    }

    Logger& logTrace() {
        return start( LOGL::TRACE );
    }

    Logger& logDebug() {
        return start( LOGL::DEBUG );
    }

    Logger& logInfo() {
        return start( LOGL::INFO );
    }

    Logger& logWarn() {
        return start( LOGL::WARN );
    }

    Logger& logError() {
        return start( LOGL::ERROR );
    }

    Logger& logAlert() {
        return start( LOGL::ALERT );
    }
};

#endif
