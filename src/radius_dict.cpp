#include "radius_dict.hpp"
#include "dict_parser.hpp"

void radius_attribute_t::addValue( int64_t value, const std::string &text ) {
    values.insert_or_assign( value, text );
}

std::string radius_attribute_t::getValueString( int64_t value ) const {
    if( auto const &valIt = values.find( value ); valIt != values.end() ) {
        return valIt->second;
    }
    return {};
}

std::optional<int64_t> radius_attribute_t::getValueByName( const std::string &text ) const {
    for( auto const &[ index, value ]: values ) {
        if( value == text ) {
            return index;
        }
    }
    return std::nullopt;
}

bool radius_attribute_t::operator==( const radius_attribute_t &r ) const {
    return code == r.code &&
        name == r.name &&
        type == r.type &&
        vendor == r.vendor &&
        values == r.values;
}

void AttributeScope::add( radius_attribute_t attr ) {
    // Drop the code binding of a previous registration under the same name
    if( auto const &it = by_name.find( attr.name ); it != by_name.end() && it->second.code != attr.code ) {
        if( auto const &cit = by_code.find( it->second.code ); cit != by_code.end() && cit->second == attr.name ) {
            by_code.erase( cit );
        }
    }
    by_code.insert_or_assign( attr.code, attr.name );
    auto name = attr.name;
    by_name.insert_or_assign( std::move( name ), std::move( attr ) );
}

radius_attribute_t* AttributeScope::findByName( const std::string &name ) {
    if( auto it = by_name.find( name ); it != by_name.end() ) {
        return &it->second;
    }
    return nullptr;
}

const radius_attribute_t* AttributeScope::findByName( const std::string &name ) const {
    if( auto const &it = by_name.find( name ); it != by_name.end() ) {
        return &it->second;
    }
    return nullptr;
}

const radius_attribute_t* AttributeScope::findByCode( uint32_t code ) const {
    if( auto const &it = by_code.find( code ); it != by_code.end() ) {
        return findByName( it->second );
    }
    return nullptr;
}

bool AttributeScope::operator==( const AttributeScope &r ) const {
    return by_name == r.by_name && by_code == r.by_code;
}

RadiusDict::RadiusDict( const std::vector<std::string> &files ):
    RadiusDict( files, DictParserOptions{} )
{}

RadiusDict::RadiusDict( const std::vector<std::string> &files, const DictParserOptions &options ) {
    DictParser parser { options };
    for( auto const &f: files ) {
        parser.parseFile( f, *this );
    }
}

void RadiusDict::addAttributeType( radius_attribute_t attr ) {
    if( attr.vendor.has_value() ) {
        vsa[ *attr.vendor ].add( std::move( attr ) );
    } else {
        attrs.add( std::move( attr ) );
    }
}

void RadiusDict::addVendor( uint32_t vendor, const std::string &name ) {
    vendors.insert_or_assign( vendor, name );
    vsa.try_emplace( vendor );
}

radius_attribute_t* RadiusDict::getAttributeTypeByName( const std::string &name ) {
    return attrs.findByName( name );
}

const radius_attribute_t* RadiusDict::getAttributeTypeByName( const std::string &name ) const {
    return attrs.findByName( name );
}

const radius_attribute_t* RadiusDict::getAttributeTypeByCode( uint32_t code ) const {
    return attrs.findByCode( code );
}

const radius_attribute_t* RadiusDict::getAttributeTypeByCode( uint32_t code, uint32_t vendor ) const {
    if( auto const &scope = vendorScope( vendor ); scope != nullptr ) {
        return scope->findByCode( code );
    }
    return nullptr;
}

const radius_attribute_t* RadiusDict::getVendorAttributeTypeByName( uint32_t vendor, const std::string &name ) const {
    if( auto const &scope = vendorScope( vendor ); scope != nullptr ) {
        return scope->findByName( name );
    }
    return nullptr;
}

const AttributeScope* RadiusDict::vendorScope( uint32_t vendor ) const {
    if( auto const &it = vsa.find( vendor ); it != vsa.end() ) {
        return &it->second;
    }
    return nullptr;
}

std::optional<std::string> RadiusDict::getVendorName( uint32_t vendor ) const {
    if( auto const &it = vendors.find( vendor ); it != vendors.end() ) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<uint32_t> RadiusDict::getVendorId( const std::string &name ) const {
    for( auto const &[ id, vname ]: vendors ) {
        if( vname == name ) {
            return id;
        }
    }
    return std::nullopt;
}

std::optional<std::tuple<uint32_t,uint32_t>> RadiusDict::getIdByName( const std::string &attr ) const {
    if( auto const &a = attrs.findByName( attr ); a != nullptr ) {
        return std::make_tuple( a->code, 0u );
    }
    for( auto const &[ vendid, vendattr ]: vsa ) {
        if( auto const &a = vendattr.findByName( attr ); a != nullptr ) {
            return std::make_tuple( a->code, vendid );
        }
    }
    return std::nullopt;
}

std::optional<int64_t> RadiusDict::getValueByName( const std::string &attr, const std::string &text ) const {
    if( auto const &a = attrs.findByName( attr ); a != nullptr ) {
        return a->getValueByName( text );
    }
    return std::nullopt;
}

size_t RadiusDict::attributeCount() const {
    auto count = attrs.size();
    for( auto const &[ vendid, vendattr ]: vsa ) {
        count += vendattr.size();
    }
    return count;
}

bool RadiusDict::operator==( const RadiusDict &r ) const {
    return attrs == r.attrs && vendors == r.vendors && vsa == r.vsa;
}
