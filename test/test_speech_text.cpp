/*
 * Unit tests for announcement text cleaning
 * Tests: Pictographic, Clean
 */

#include <gtest/gtest.h>
#include <string>
#include "RunSessionCore/speech_text.hpp"

// ============================================================================
// Test Suite: SpeechText_Pictographic
// ============================================================================

TEST(SpeechText_Pictographic, LettersAndDigitsAreNotPictographic) {
    EXPECT_FALSE(is_pictographic('A'));
    EXPECT_FALSE(is_pictographic('7'));
    EXPECT_FALSE(is_pictographic(0x00E9));  // e acute
    EXPECT_FALSE(is_pictographic(0x4E2D));  // CJK ideograph
}

TEST(SpeechText_Pictographic, EmojiBlocks) {
    EXPECT_TRUE(is_pictographic(0x1F600));  // grinning face
    EXPECT_TRUE(is_pictographic(0x1F3C3));  // runner
    EXPECT_TRUE(is_pictographic(0x2764));   // heavy black heart
    EXPECT_TRUE(is_pictographic(0x1F3FD));  // skin tone modifier
    EXPECT_TRUE(is_pictographic(0x200D));   // zero width joiner
    EXPECT_TRUE(is_pictographic(0xFE0F));   // variation selector 16
}

// ============================================================================
// Test Suite: SpeechText_Clean
// ============================================================================

TEST(SpeechText_Clean, PlainTextUnchanged) {
    EXPECT_EQ(clean_speech_text("Turn left onto Market Street"), "Turn left onto Market Street");
}

TEST(SpeechText_Clean, StripsEmoji) {
    EXPECT_EQ(clean_speech_text("Great job! \xF0\x9F\x8E\x89"), "Great job!");
    EXPECT_EQ(clean_speech_text("\xF0\x9F\x8F\x83 Keep going"), "Keep going");
}

TEST(SpeechText_Clean, StripsJoinedSequences) {
    // Family: man ZWJ woman ZWJ girl
    std::string family = "\xF0\x9F\x91\xA8\xE2\x80\x8D\xF0\x9F\x91\xA9\xE2\x80\x8D\xF0\x9F\x91\xA7";
    EXPECT_EQ(clean_speech_text("Run " + family + " together"), "Run together");

    // Red heart with emoji presentation selector
    EXPECT_EQ(clean_speech_text("Love it \xE2\x9D\xA4\xEF\xB8\x8F"), "Love it");
}

TEST(SpeechText_Clean, CollapsesWhitespace) {
    EXPECT_EQ(clean_speech_text("  In   200\tmeters \n turn left  "), "In 200 meters turn left");
}

TEST(SpeechText_Clean, CollapsesUnicodeSpaces) {
    // No-break space and ideographic space
    EXPECT_EQ(clean_speech_text("Pace\xC2\xA0\xC2\xA0is\xE3\x80\x80good"), "Pace is good");
}

TEST(SpeechText_Clean, EmojiOnlyBecomesEmpty) {
    EXPECT_EQ(clean_speech_text("\xF0\x9F\x8E\x89 \xF0\x9F\x94\xA5"), "");
    EXPECT_EQ(clean_speech_text("   "), "");
    EXPECT_EQ(clean_speech_text(""), "");
}

TEST(SpeechText_Clean, KeepsAccentedLetters) {
    EXPECT_EQ(clean_speech_text("Caf\xC3\xA9 ahead"), "Caf\xC3\xA9 ahead");
}

TEST(SpeechText_Clean, DropsMalformedBytes) {
    EXPECT_EQ(clean_speech_text("\xFF" "abc"), "abc");
    EXPECT_EQ(clean_speech_text("ok \xE2\x82"), "ok");
}
