#include "normalizer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using inventory::normalize_name;

TEST(NormalizeName, IgnoresSurroundingWhitespaceAndCase) {
    EXPECT_EQ(normalize_name("  PC01 "), normalize_name("pc01"));
    EXPECT_EQ(normalize_name("\tLab-01\r\n"), normalize_name("LAB-01"));
    EXPECT_EQ(normalize_name("PC01"), "pc01");
}

TEST(NormalizeName, KeepsInnerWhitespace) {
    EXPECT_NE(normalize_name("PC 01"), normalize_name("PC01"));
}

TEST(NormalizeName, StripsNoBreakSpace) {
    EXPECT_EQ(normalize_name("\xC2\xA0" "PC01" "\xC2\xA0"), "pc01");
}

TEST(NormalizeName, ComposedAndDecomposedFormsAreEqual) {
    const std::string composed = "CAF\xC3\x89";        // CAFÉ
    const std::string decomposed = "cafe\xCC\x81";      // cafe + U+0301
    EXPECT_EQ(normalize_name(composed), normalize_name(decomposed));
    EXPECT_EQ(normalize_name(decomposed), "caf\xC3\xA9");
}

TEST(NormalizeName, UsesFullCaseFolding) {
    EXPECT_EQ(normalize_name("STRASSE"), normalize_name("stra\xC3\x9F" "e"));
}

TEST(NormalizeName, BlankInputIsEmpty) {
    EXPECT_EQ(normalize_name(""), "");
    EXPECT_EQ(normalize_name("   \t "), "");
}

TEST(NormalizeName, IsIdempotent) {
    const std::vector<std::string> samples = {
        "", "   ", "PC01", "  pc01  ", "Lab-01", "cafe\xCC\x81", "CAF\xC3\x89",
        "stra\xC3\x9F" "e", "\xC2\xA0WS-\xC3\x85" "B\xC2\xA0", "A\xCC\x8A", "\xEF\xBC\xB0\xEF\xBC\xA3"};
    for (const auto &s : samples) {
        const std::string once = normalize_name(s);
        EXPECT_EQ(normalize_name(once), once) << "input: " << s;
    }
}

TEST(NormalizeName, InvalidUtf8DoesNotThrow) {
    std::string out;
    EXPECT_NO_THROW(out = normalize_name("PC\xFF" "01"));
    EXPECT_EQ(normalize_name(out), out);
}

TEST(IsBlankName, AgreesWithNormalizeName) {
    const std::vector<std::string> samples = {"", " \t", "\xC2\xA0", "\xE2\x80\x83", " \xE2\x80\x83\xC2\xA0 ",
                                              "PC01", "\xC2\xA0" "PC01"};
    for (const auto &s : samples)
        EXPECT_EQ(inventory::is_blank_name(s), normalize_name(s).empty()) << "input: " << s;
    EXPECT_TRUE(inventory::is_blank_name("\xE2\x80\x83"));
    EXPECT_FALSE(inventory::is_blank_name("\xC2\xA0" "PC01"));
}
