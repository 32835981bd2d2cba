#ifndef SPEECH_TEXT_HPP_
#define SPEECH_TEXT_HPP_

#include <cstdint>
#include <string>

/**
 * True for code points rendered as pictographs (emoji, symbols,
 * flags, skin-tone modifiers, joiners and variation selectors).
 */
bool is_pictographic(uint32_t code_point);

/**
 * Prepare UTF-8 text for speech: drop pictographic code points and
 * malformed bytes, collapse whitespace runs to one space, trim.
 */
std::string clean_speech_text(const std::string& text);

#endif // SPEECH_TEXT_HPP_
