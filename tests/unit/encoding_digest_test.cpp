#include "wipecert/crypto/Digest.hpp"
#include "wipecert/crypto/Encoding.hpp"
#include <array>
#include <cstdint>
#include <gtest/gtest.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace
{

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

std::span<const std::uint8_t> asU8(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

} // namespace

TEST(Digest, Sha256KnownAnswers)
{
    EXPECT_EQ(wipecert::crypto::sha256Hex(asBytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(wipecert::crypto::sha256Hex(asBytes("")),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    const auto raw{ wipecert::crypto::sha256(asBytes("abc")) };
    EXPECT_EQ(raw[0], 0xBAU);
    EXPECT_EQ(raw[31], 0xADU);
}

TEST(Encoding, HexIsLowercaseAndParsesBothCases)
{
    const std::array<std::uint8_t, 4> bytes{ 0x00U, 0x0FU, 0xA5U, 0xFFU };
    EXPECT_EQ(wipecert::crypto::toHex(bytes), "000fa5ff");

    const auto upper{ wipecert::crypto::fromHex("000FA5FF") };
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*upper, (std::vector<std::uint8_t>{ 0x00U, 0x0FU, 0xA5U, 0xFFU }));

    EXPECT_FALSE(wipecert::crypto::fromHex("abc").has_value());
    EXPECT_FALSE(wipecert::crypto::fromHex("zz").has_value());
    ASSERT_TRUE(wipecert::crypto::fromHex("").has_value());
    EXPECT_TRUE(wipecert::crypto::fromHex("")->empty());
}

TEST(Encoding, Base64StandardAlphabetPadded)
{
    EXPECT_EQ(wipecert::crypto::base64Encode(asU8("")), "");
    EXPECT_EQ(wipecert::crypto::base64Encode(asU8("f")), "Zg==");
    EXPECT_EQ(wipecert::crypto::base64Encode(asU8("fo")), "Zm8=");
    EXPECT_EQ(wipecert::crypto::base64Encode(asU8("foobar")), "Zm9vYmFy");

    const auto decoded{ wipecert::crypto::base64Decode("Zm8=") };
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "fo");
}

TEST(Encoding, Base64RejectsMalformedInput)
{
    EXPECT_FALSE(wipecert::crypto::base64Decode("Zm8").has_value());
    EXPECT_FALSE(wipecert::crypto::base64Decode("Zm$=").has_value());
}
