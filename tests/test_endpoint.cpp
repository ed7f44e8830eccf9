/**
 * @file test_endpoint.cpp
 * @brief Tests for endpoint validation and data point id parsing.
 *
 * Validates:
 *  - opc.tcp URLs split into host and port, IPv6 literals included
 *  - Malformed endpoints and unknown security modes fail as fatal ConnectError
 *  - "ns=N;s=..." / "i=N" ids parse and print back in canonical form
 */

#include <gtest/gtest.h>

#include "opcua_client/endpoint.hpp"
#include "opcua_client/errors.hpp"

using opcualogger::ConnectError;
using opcualogger::DataPointId;
using opcualogger::Endpoint;
using opcualogger::ErrorSeverity;
using opcualogger::IdentifierType;

// ------------------------------ Endpoint -----------------------------------

/**
 * @test Endpoint_Parse_HostAndPort
 * @brief A plain opc.tcp URL yields host and port.
 */
TEST(Endpoint, Endpoint_Parse_HostAndPort) {
    Endpoint ep = Endpoint::parse("opc.tcp://10.0.5.76:4840");

    EXPECT_EQ(ep.url, "opc.tcp://10.0.5.76:4840");
    EXPECT_EQ(ep.host, "10.0.5.76");
    EXPECT_EQ(ep.port, 4840);
    EXPECT_EQ(ep.security_mode, "None");
    EXPECT_TRUE(ep.username.empty());
}

/**
 * @test Endpoint_Parse_DefaultPortAndPath
 * @brief Port defaults to 4840 and a resource path is ignored for host parsing.
 */
TEST(Endpoint, Endpoint_Parse_DefaultPortAndPath) {
    Endpoint ep = Endpoint::parse("opc.tcp://plc.local/freeopcua/server", "Sign", "operator", "secret");

    EXPECT_EQ(ep.host, "plc.local");
    EXPECT_EQ(ep.port, 4840);
    EXPECT_EQ(ep.security_mode, "Sign");
    EXPECT_EQ(ep.username, "operator");
    EXPECT_EQ(ep.password, "secret");
}

/**
 * @test Endpoint_Parse_Ipv6
 * @brief Bracketed IPv6 literal with port.
 */
TEST(Endpoint, Endpoint_Parse_Ipv6) {
    Endpoint ep = Endpoint::parse("opc.tcp://[::1]:48010");

    EXPECT_EQ(ep.host, "::1");
    EXPECT_EQ(ep.port, 48010);
}

/**
 * @test Endpoint_Parse_Malformed_IsFatal
 * @brief Wrong scheme, missing host and bad ports are fatal connect errors.
 */
TEST(Endpoint, Endpoint_Parse_Malformed_IsFatal) {
    const char* bad[] = {
        "http://10.0.5.76:4840",
        "10.0.5.76:4840",
        "opc.tcp://",
        "opc.tcp://:4840",
        "opc.tcp://host:notaport",
        "opc.tcp://host:70000",
        "opc.tcp://host:0",
        "opc.tcp://[::1",
    };

    for (const char* url : bad) {
        try {
            Endpoint::parse(url);
            ADD_FAILURE() << "expected ConnectError for " << url;
        } catch (const ConnectError& e) {
            EXPECT_EQ(e.severity(), ErrorSeverity::Fatal) << url;
            EXPECT_TRUE(e.isFatal());
        }
    }
}

/**
 * @test Endpoint_Parse_UnknownSecurityMode
 * @brief Only None, Sign and SignAndEncrypt are accepted.
 */
TEST(Endpoint, Endpoint_Parse_UnknownSecurityMode) {
    EXPECT_THROW(Endpoint::parse("opc.tcp://host:4840", "Encrypt"), ConnectError);
    EXPECT_NO_THROW(Endpoint::parse("opc.tcp://host:4840", "SignAndEncrypt"));
}

// ------------------------------ DataPointId --------------------------------

/**
 * @test DataPointId_Parse_StringWithNamespace
 */
TEST(DataPointId, DataPointId_Parse_StringWithNamespace) {
    auto id = DataPointId::parse("ns=1;s=G1_pressure");

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->namespace_index, 1);
    EXPECT_EQ(id->type, IdentifierType::String);
    EXPECT_EQ(id->identifier, "G1_pressure");
    EXPECT_EQ(id->toString(), "ns=1;s=G1_pressure");
    EXPECT_EQ(*id, DataPointId(1, std::string("G1_pressure")));
}

/**
 * @test DataPointId_Parse_NumericDefaultNamespace
 * @brief Namespace 0 is implied and omitted when printing.
 */
TEST(DataPointId, DataPointId_Parse_NumericDefaultNamespace) {
    auto id = DataPointId::parse("i=85");

    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(id->namespace_index, 0);
    EXPECT_EQ(id->type, IdentifierType::Numeric);
    EXPECT_EQ(id->numericValue(), 85u);
    EXPECT_EQ(*id, DataPointId::objectsFolder());
    EXPECT_EQ(DataPointId::parse("ns=0;i=85")->toString(), "i=85");
}

/**
 * @test DataPointId_Parse_Rejects
 */
TEST(DataPointId, DataPointId_Parse_Rejects) {
    EXPECT_FALSE(DataPointId::parse("").has_value());
    EXPECT_FALSE(DataPointId::parse("G1_pressure").has_value());
    EXPECT_FALSE(DataPointId::parse("ns=1").has_value());
    EXPECT_FALSE(DataPointId::parse("ns=x;i=1").has_value());
    EXPECT_FALSE(DataPointId::parse("ns=70000;i=1").has_value());
    EXPECT_FALSE(DataPointId::parse("i=abc").has_value());
    EXPECT_FALSE(DataPointId::parse("ns=2;s=").has_value());
}

/**
 * @test DataPointId_Equality_ConsidersTypeAndNamespace
 */
TEST(DataPointId, DataPointId_Equality_ConsidersTypeAndNamespace) {
    EXPECT_NE(DataPointId(1, static_cast<uint32_t>(5)), DataPointId(1, std::string("5")));
    EXPECT_NE(DataPointId(1, static_cast<uint32_t>(5)), DataPointId(2, static_cast<uint32_t>(5)));
    EXPECT_EQ(DataPointId(3, static_cast<uint32_t>(5)), DataPointId(3, static_cast<uint32_t>(5)));
}

// ------------------------------ Errors --------------------------------------

/**
 * @test Errors_WriteError_AlwaysFatal
 */
TEST(Errors, Errors_WriteError_AlwaysFatal) {
    opcualogger::WriteError error("disk full");

    EXPECT_TRUE(error.isFatal());
    EXPECT_STREQ(error.what(), "disk full");
    EXPECT_STREQ(opcualogger::severityName(ErrorSeverity::Transient), "Transient");
    EXPECT_STREQ(opcualogger::severityName(ErrorSeverity::DepthExceeded), "DepthExceeded");
}
