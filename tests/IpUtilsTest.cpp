#include <gtest/gtest.h>
#include "../common/IpUtils.hpp"
#include "../common/Types.hpp"

using namespace net_discovery::common;

TEST(IpUtilsTest, ParsesAndFormatsDottedQuad)
{
    auto address = ParseIpv4("192.168.1.10");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, 0xC0A8010Au);
    EXPECT_EQ(FormatIpv4(*address), "192.168.1.10");
}

TEST(IpUtilsTest, RejectsMalformedAddresses)
{
    EXPECT_FALSE(IsValidIpv4(""));
    EXPECT_FALSE(IsValidIpv4("256.1.1.1"));
    EXPECT_FALSE(IsValidIpv4("1.2.3"));
    EXPECT_FALSE(IsValidIpv4("router.lan"));
    EXPECT_FALSE(IsValidIpv4("192.168.1.1/24"));
}

TEST(IpUtilsTest, NetmaskPrefixConversion)
{
    EXPECT_EQ(PrefixToNetmask(24), 0xFFFFFF00u);
    EXPECT_EQ(PrefixToNetmask(0), 0u);
    EXPECT_EQ(NetmaskToPrefix(0xFFFFFF00u), 24);
    EXPECT_EQ(NetmaskToPrefix(0xFFFFFFFCu), 30);
    EXPECT_FALSE(NetmaskToPrefix(0xFF00FF00u).has_value());
}

TEST(IpUtilsTest, AddressRangeForms)
{
    auto single = ParseAddressRange("10.0.0.7");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->first, single->last);

    auto block = ParseAddressRange("192.168.1.9/30");
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(FormatIpv4(block->first), "192.168.1.8");
    EXPECT_EQ(FormatIpv4(block->last), "192.168.1.11");

    auto span = ParseAddressRange("10.0.0.5-10.0.0.9");
    ASSERT_TRUE(span.has_value());
    EXPECT_TRUE(span->Contains(*ParseIpv4("10.0.0.9")));
    EXPECT_FALSE(span->Contains(*ParseIpv4("10.0.0.10")));

    EXPECT_FALSE(ParseAddressRange("10.0.0.9-10.0.0.5").has_value());
    EXPECT_FALSE(ParseAddressRange("10.0.0.0/33").has_value());
    EXPECT_FALSE(ParseAddressRange("10.0.0.0/").has_value());
}

TEST(IpUtilsTest, OidSyntax)
{
    EXPECT_TRUE(IsValidOid("1.3.6.1.2.1.1.1.0"));
    EXPECT_FALSE(IsValidOid("1"));
    EXPECT_FALSE(IsValidOid(".1.3.6"));
    EXPECT_FALSE(IsValidOid("1.3..6"));
    EXPECT_FALSE(IsValidOid("1.3.6."));
    EXPECT_FALSE(IsValidOid("1.3.x"));
}

TEST(IpUtilsTest, MacNormalization)
{
    EXPECT_TRUE(IsValidMac("AA-bb-CC-dd-EE-ff"));
    EXPECT_FALSE(IsValidMac("aa:bb:cc:dd:ee"));
    EXPECT_FALSE(IsValidMac("aa:bb:cc:dd:ee:gg"));
    EXPECT_EQ(NormalizeMac("AA-bb-CC-dd-EE-ff"), "aa:bb:cc:dd:ee:ff");
}

TEST(IpUtilsTest, SortsNumerically)
{
    auto sorted = SortByAddress({"192.168.1.100", "192.168.1.9", "10.0.0.1", "192.168.1.10"});
    std::vector<std::string> expected = {"10.0.0.1", "192.168.1.9", "192.168.1.10", "192.168.1.100"};
    EXPECT_EQ(sorted, expected);
}

TEST(IpUtilsTest, UnparseableKeysSortLast)
{
    IpLess less;
    EXPECT_TRUE(less("255.255.255.255", "not-an-ip"));
    EXPECT_FALSE(less("not-an-ip", "1.1.1.1"));
}
