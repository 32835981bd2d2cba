#include "RunSessionCore/synthesis_cache.hpp"
#include <algorithm>

SynthesisCache::SynthesisCache(size_t capacity, size_t key_length)
    : capacity_(capacity),
      key_length_(key_length)
{
}

std::string SynthesisCache::key_for(const std::string& text) const
{
    return text.substr(0, key_length_);
}

// Entry stored for exactly this text, or null
const SynthesisCache::Entry* SynthesisCache::lookup(const std::string& text) const
{
    auto it = entries_.find(key_for(text));
    if (it == entries_.end() || it->second.text != text) return nullptr;
    return &it->second;
}

std::optional<AudioBytes> SynthesisCache::find(const std::string& text) const
{
    const Entry* entry = lookup(text);
    if (!entry) return std::nullopt;
    return entry->audio;
}

bool SynthesisCache::contains(const std::string& text) const
{
    return lookup(text) != nullptr;
}

void SynthesisCache::store(const std::string& text, const AudioBytes& audio, int64_t now_ms)
{
    if (capacity_ == 0) return;

    std::string key = key_for(text);
    if (entries_.count(key) == 0 && entries_.size() >= capacity_) {
        auto oldest = std::min_element(entries_.begin(), entries_.end(),
            [](const auto& a, const auto& b) {
                return a.second.stored_at_ms < b.second.stored_at_ms;
            });
        entries_.erase(oldest);
    }

    entries_[key] = Entry{text, audio, now_ms};
}
