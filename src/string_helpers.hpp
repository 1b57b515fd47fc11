#ifndef STRING_HELPERS_HPP_
#define STRING_HELPERS_HPP_

#include <cstdint>
#include <iosfwd>

enum class RADIUS_TYPE_T : uint8_t;
struct radius_attribute_t;
class RadiusDict;

std::ostream& operator<<( std::ostream &stream, const RADIUS_TYPE_T &type );
std::ostream& operator<<( std::ostream &stream, const radius_attribute_t &attr );

// Writes the registry back in dictionary format
std::ostream& operator<<( std::ostream &stream, const RadiusDict &dict );

#endif
