#ifndef SYNTHESIS_CACHE_HPP_
#define SYNTHESIS_CACHE_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "RunSessionCore/capabilities.hpp"

/**
 * Bounded cache of synthesized speech keyed by the leading characters of
 * the text. A lookup only hits when the full text matches the stored one;
 * texts sharing a key replace each other. The oldest entry is evicted when
 * full.
 */
class SynthesisCache
{
public:
    SynthesisCache(size_t capacity = 20, size_t key_length = 100);

    std::optional<AudioBytes> find(const std::string& text) const;
    bool contains(const std::string& text) const;
    void store(const std::string& text, const AudioBytes& audio, int64_t now_ms);

    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

private:
    struct Entry
    {
        std::string text;      // Full text the audio was synthesized from
        AudioBytes audio;
        int64_t stored_at_ms;
    };

    std::string key_for(const std::string& text) const;
    const Entry* lookup(const std::string& text) const;

    size_t capacity_;
    size_t key_length_;
    std::map<std::string, Entry> entries_;
};

#endif // SYNTHESIS_CACHE_HPP_
