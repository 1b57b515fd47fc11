#include "gtest/gtest.h"
#include "radius_dict.hpp"
#include "string_helpers.hpp"

#include <sstream>
#include <string>

class RadiusDictTest : public ::testing::Test {
protected:
    void SetUp() override {
        dict.addAttributeType( { 1, "User-Name", RADIUS_TYPE_T::STRING } );
        dict.addAttributeType( { 6, "Service-Type", RADIUS_TYPE_T::INTEGER } );
        dict.addVendor( 2352, "Redback" );
        dict.addAttributeType( { 2352, 1, "Client-DNS-Pri", RADIUS_TYPE_T::IPADDR } );
    }

    RadiusDict dict;
};

TEST_F(RadiusDictTest, LookupGlobal) {
    auto by_name = dict.getAttributeTypeByName( "User-Name" );
    auto by_code = dict.getAttributeTypeByCode( 1 );
    ASSERT_NE(by_name, nullptr);
    EXPECT_EQ(by_name, by_code);
    EXPECT_EQ(by_name->type, RADIUS_TYPE_T::STRING);
    EXPECT_EQ(dict.getAttributeTypeByName( "Unknown" ), nullptr);
    EXPECT_EQ(dict.getAttributeTypeByCode( 200 ), nullptr);
}

TEST_F(RadiusDictTest, VendorScopesAreDisjoint) {
    auto vendor_attr = dict.getAttributeTypeByCode( 1, 2352 );
    ASSERT_NE(vendor_attr, nullptr);
    EXPECT_EQ(vendor_attr->name, "Client-DNS-Pri");
    EXPECT_EQ(dict.getAttributeTypeByCode( 1 )->name, "User-Name");
    EXPECT_EQ(dict.getAttributeTypeByName( "Client-DNS-Pri" ), nullptr);
    EXPECT_EQ(dict.getAttributeTypeByCode( 1, 9 ), nullptr);
    EXPECT_NE(dict.getVendorAttributeTypeByName( 2352, "Client-DNS-Pri" ), nullptr);
    EXPECT_EQ(dict.getVendorAttributeTypeByName( 2352, "User-Name" ), nullptr);
}

TEST_F(RadiusDictTest, VendorScopeCreatedLazily) {
    dict.addAttributeType( { 311, 7, "MS-MPPE-Encryption-Policy", RADIUS_TYPE_T::INTEGER } );
    EXPECT_NE(dict.vendorScope( 311 ), nullptr);
    EXPECT_FALSE(dict.getVendorName( 311 ).has_value());
    EXPECT_EQ(dict.vendorCount(), 1u);
    EXPECT_EQ(dict.attributeCount(), 4u);
}

TEST_F(RadiusDictTest, AddVendorCreatesEmptyScope) {
    dict.addVendor( 9, "Cisco" );
    ASSERT_NE(dict.vendorScope( 9 ), nullptr);
    EXPECT_TRUE(dict.vendorScope( 9 )->empty());
}

TEST_F(RadiusDictTest, VendorNames) {
    dict.addVendor( 9, "Cisco" );
    dict.addVendor( 9, "ciscoSystems" );
    dict.addVendor( 10, "Redback" );
    EXPECT_EQ(dict.getVendorName( 9 ), "ciscoSystems");
    EXPECT_EQ(dict.getVendorId( "Redback" ), 10u);
    EXPECT_FALSE(dict.getVendorId( "Juniper" ).has_value());
}

TEST_F(RadiusDictTest, EnumerationValues) {
    auto attr = dict.getAttributeTypeByName( "Service-Type" );
    attr->addValue( 2, "Framed-User" );
    attr->addValue( 1, "Login-User" );
    attr->addValue( 2, "Framed" );

    EXPECT_EQ(attr->getValueString( 2 ), "Framed");
    EXPECT_EQ(attr->getValueString( 3 ), "");
    EXPECT_EQ(dict.getValueByName( "Service-Type", "Login-User" ), 1);
    EXPECT_FALSE(dict.getValueByName( "Service-Type", "Framed-User" ).has_value());
    EXPECT_FALSE(dict.getValueByName( "Nope", "Login-User" ).has_value());
}

TEST_F(RadiusDictTest, CodeReassignedKeepsOldName) {
    dict.addAttributeType( { 1, "Login-Name", RADIUS_TYPE_T::OCTETS } );
    EXPECT_EQ(dict.getAttributeTypeByCode( 1 )->name, "Login-Name");
    ASSERT_NE(dict.getAttributeTypeByName( "User-Name" ), nullptr);
    EXPECT_EQ(dict.getAttributeTypeByName( "User-Name" )->code, 1u);
}

TEST_F(RadiusDictTest, NameReassignedDropsOldCode) {
    dict.addAttributeType( { 60, "Service-Type", RADIUS_TYPE_T::INTEGER } );
    EXPECT_EQ(dict.getAttributeTypeByCode( 6 ), nullptr);
    EXPECT_EQ(dict.getAttributeTypeByCode( 60 )->name, "Service-Type");
    EXPECT_EQ(dict.globalScope().size(), 2u);
}

TEST_F(RadiusDictTest, IdByName) {
    auto global = dict.getIdByName( "Service-Type" );
    ASSERT_TRUE(global.has_value());
    EXPECT_EQ(std::get<0>( *global ), 6u);
    EXPECT_EQ(std::get<1>( *global ), 0u);

    auto vendor = dict.getIdByName( "Client-DNS-Pri" );
    ASSERT_TRUE(vendor.has_value());
    EXPECT_EQ(std::get<0>( *vendor ), 1u);
    EXPECT_EQ(std::get<1>( *vendor ), 2352u);

    EXPECT_FALSE(dict.getIdByName( "Nope" ).has_value());
}

TEST_F(RadiusDictTest, Equality) {
    RadiusDict other;
    other.addAttributeType( { 1, "User-Name", RADIUS_TYPE_T::STRING } );
    other.addAttributeType( { 6, "Service-Type", RADIUS_TYPE_T::INTEGER } );
    other.addVendor( 2352, "Redback" );
    EXPECT_NE(dict, other);

    other.addAttributeType( { 2352, 1, "Client-DNS-Pri", RADIUS_TYPE_T::IPADDR } );
    EXPECT_EQ(dict, other);

    other.getAttributeTypeByName( "Service-Type" )->addValue( 1, "Login-User" );
    EXPECT_NE(dict, other);
}

TEST_F(RadiusDictTest, PrintAttribute) {
    auto attr = dict.getAttributeTypeByName( "Service-Type" );
    attr->addValue( 2, "Framed-User" );

    std::ostringstream ss;
    ss << *attr;
    EXPECT_EQ(ss.str(), "Service-Type code: 6 type: integer values: Framed-User=2");

    std::ostringstream vs;
    vs << *dict.getAttributeTypeByCode( 1, 2352 );
    EXPECT_EQ(vs.str(), "Client-DNS-Pri code: 1 type: ipaddr vendor: 2352");
}
