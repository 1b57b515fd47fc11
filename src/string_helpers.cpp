#include <iostream>
#include <iomanip>

#include "string_helpers.hpp"
#include "radius_dict.hpp"

std::ostream& operator<<( std::ostream &stream, const RADIUS_TYPE_T &type ) {
    switch( type ) {
    case RADIUS_TYPE_T::OCTETS:     stream << "octets"; break;
    case RADIUS_TYPE_T::STRING:     stream << "string"; break;
    case RADIUS_TYPE_T::INTEGER:    stream << "integer"; break;
    case RADIUS_TYPE_T::IPADDR:     stream << "ipaddr"; break;
    case RADIUS_TYPE_T::VSA:        stream << "vsa"; break;
    }
    return stream;
}

std::ostream& operator<<( std::ostream &stream, const radius_attribute_t &attr ) {
    stream << attr.name << " code: " << attr.code << " type: " << attr.type;
    if( attr.vendor.has_value() ) {
        stream << " vendor: " << *attr.vendor;
    }
    if( !attr.values.empty() ) {
        stream << " values:";
        for( auto const &[ value, text ]: attr.values ) {
            stream << " " << text << "=" << value;
        }
    }
    return stream;
}

static void printScope( std::ostream &os, const AttributeScope &scope ) {
    for( auto const &[ name, attr ]: scope.attributes() ) {
        if( attr.vendor.has_value() ) {
            os << std::setw( 11 ) << "VENDORATTR" << ' ' << std::setw( 7 ) << *attr.vendor << ' ';
        } else {
            os << std::setw( 11 ) << "ATTRIBUTE" << ' ';
        }
        os << std::setw( 31 ) << name << ' ' << std::setw( 7 ) << attr.code << ' ' << attr.type << std::endl;
        for( auto const &[ value, text ]: attr.values ) {
            os << std::setw( 11 ) << "VALUE" << ' ' << std::setw( 31 ) << name << ' ' << std::setw( 31 ) << text << ' ' << value << std::endl;
        }
    }
}

std::ostream& operator<<( std::ostream &os, const RadiusDict &dict ) {
    auto flags = os.flags();
    os << std::left;

    for( auto const &[ id, name ]: dict.getVendors() ) {
        os << std::setw( 11 ) << "VENDOR" << ' ' << std::setw( 7 ) << id << ' ' << name << std::endl;
    }
    printScope( os, dict.globalScope() );
    for( auto const &[ id, scope ]: dict.getVendorScopes() ) {
        printScope( os, scope );
    }

    os.flags( flags );
    return os;
}
