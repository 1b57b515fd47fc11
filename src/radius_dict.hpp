#ifndef RADIUS_DICT_HPP
#define RADIUS_DICT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Attribute code of the Vendor-Specific container in the global namespace
#define RADIUS_VSA 26

enum class RADIUS_TYPE_T : uint8_t {
    OCTETS,
    STRING,
    INTEGER,
    IPADDR,
    VSA
};

struct radius_attribute_t {
    uint32_t code;
    std::string name;
    RADIUS_TYPE_T type;
    std::optional<uint32_t> vendor;
    std::map<int64_t,std::string> values;

    radius_attribute_t( uint32_t c, std::string n, RADIUS_TYPE_T t ):
        code( c ),
        name( std::move( n ) ),
        type( t )
    {}

    radius_attribute_t( uint32_t v, uint32_t c, std::string n, RADIUS_TYPE_T t ):
        code( c ),
        name( std::move( n ) ),
        type( t ),
        vendor( v )
    {}

    void addValue( int64_t value, const std::string &text );
    std::string getValueString( int64_t value ) const;
    std::optional<int64_t> getValueByName( const std::string &text ) const;

    bool operator==( const radius_attribute_t &r ) const;
    bool operator!=( const radius_attribute_t &r ) const { return !( *this == r ); }
};

// One attribute namespace: the global one or a single vendor's.
// Entries are found both by name and by code, last registration wins for each key.
class AttributeScope {
public:
    void add( radius_attribute_t attr );

    radius_attribute_t* findByName( const std::string &name );
    const radius_attribute_t* findByName( const std::string &name ) const;
    const radius_attribute_t* findByCode( uint32_t code ) const;

    size_t size() const { return by_name.size(); }
    bool empty() const { return by_name.empty(); }
    const std::map<std::string,radius_attribute_t>& attributes() const { return by_name; }

    bool operator==( const AttributeScope &r ) const;
    bool operator!=( const AttributeScope &r ) const { return !( *this == r ); }

private:
    std::map<std::string,radius_attribute_t> by_name;
    std::map<uint32_t,std::string> by_code;
};

struct DictParserOptions;

class RadiusDict {
public:
    RadiusDict() = default;
    explicit RadiusDict( const std::vector<std::string> &files );
    RadiusDict( const std::vector<std::string> &files, const DictParserOptions &options );

    void addAttributeType( radius_attribute_t attr );
    void addVendor( uint32_t vendor, const std::string &name );

    radius_attribute_t* getAttributeTypeByName( const std::string &name );
    const radius_attribute_t* getAttributeTypeByName( const std::string &name ) const;
    const radius_attribute_t* getAttributeTypeByCode( uint32_t code ) const;
    const radius_attribute_t* getAttributeTypeByCode( uint32_t code, uint32_t vendor ) const;
    const radius_attribute_t* getVendorAttributeTypeByName( uint32_t vendor, const std::string &name ) const;

    std::optional<std::string> getVendorName( uint32_t vendor ) const;
    std::optional<uint32_t> getVendorId( const std::string &name ) const;

    std::optional<std::tuple<uint32_t,uint32_t>> getIdByName( const std::string &attr ) const;
    std::optional<int64_t> getValueByName( const std::string &attr, const std::string &text ) const;

    size_t attributeCount() const;
    size_t vendorCount() const { return vendors.size(); }

    const AttributeScope& globalScope() const { return attrs; }
    const AttributeScope* vendorScope( uint32_t vendor ) const;
    const std::map<uint32_t,std::string>& getVendors() const { return vendors; }
    const std::map<uint32_t,AttributeScope>& getVendorScopes() const { return vsa; }

    bool operator==( const RadiusDict &r ) const;
    bool operator!=( const RadiusDict &r ) const { return !( *this == r ); }

private:
    AttributeScope attrs;
    std::map<uint32_t,std::string> vendors;
    std::map<uint32_t,AttributeScope> vsa;
};

#endif
