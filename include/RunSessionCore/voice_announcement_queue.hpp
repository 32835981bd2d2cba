#ifndef VOICE_ANNOUNCEMENT_QUEUE_HPP_
#define VOICE_ANNOUNCEMENT_QUEUE_HPP_

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include "RunSessionCore/types.hpp"
#include "RunSessionCore/capabilities.hpp"
#include "RunSessionCore/scheduler.hpp"
#include "RunSessionCore/synthesis_cache.hpp"

/**
 * One pending or playing announcement.
 */
struct SpeechItem
{
    uint64_t id = 0;
    std::string text;                    // Cleaned text
    SpeechDomain domain = SpeechDomain::COACH;
    int priority = 1;                    // Derived from domain
    int64_t enqueued_at_ms = 0;
    bool use_synthesis = false;          // Try the remote synthesized voice first
    std::function<void()> on_complete;
};

// system=3 > navigation=2 > coach=1
int domain_priority(SpeechDomain domain);
const char* domain_name(SpeechDomain domain);

/**
 * Single-channel announcement queue.
 * Orders items by (priority desc, enqueue order), enforces a minimum gap
 * between consecutive announcements and a watchdog on every playback so a
 * stuck engine can never block the channel. At most one item plays at a
 * time. Items requesting synthesis fall back to device speech on any
 * synthesis or playback failure.
 */
class VoiceAnnouncementQueue
{
public:
    struct VoiceQueueParams
    {
        int64_t throttle_ms;              // Minimum gap after a completed announcement
        int64_t watchdog_timeout_ms;      // Playback is force-stopped after this
        size_t synthesis_cache_size;      // Prefetched/synthesized texts kept in memory
        bool synthesize_coach;            // Domains that use the synthesized voice
        bool synthesize_navigation;
        bool synthesize_system;
        std::string temp_directory;       // Empty uses the system temp directory

        VoiceQueueParams()
            : throttle_ms(3000),
              watchdog_timeout_ms(45000),
              synthesis_cache_size(20),
              synthesize_coach(true),
              synthesize_navigation(false),
              synthesize_system(false)
        {}
    };

    /**
     * @param scheduler Timer source for throttle and watchdog
     * @param device_speech Built-in speech engine, always available
     * @param synthesizer Remote synthesizer (may be null: device speech only)
     * @param player Plays synthesized audio files (may be null: device speech only)
     */
    VoiceAnnouncementQueue(Scheduler& scheduler,
                           DeviceSpeech& device_speech,
                           SpeechSynthesizer* synthesizer = nullptr,
                           AudioPlayer* player = nullptr,
                           const VoiceQueueParams& params = VoiceQueueParams());
    ~VoiceAnnouncementQueue();

    VoiceAnnouncementQueue(const VoiceAnnouncementQueue&) = delete;
    VoiceAnnouncementQueue& operator=(const VoiceAnnouncementQueue&) = delete;

    /**
     * Queue an announcement.
     *
     * @return Item id, or 0 when disabled or the cleaned text is empty
     */
    uint64_t enqueue(const std::string& text, SpeechDomain domain,
                     std::function<void()> on_complete = nullptr);
    uint64_t enqueue_navigation(const std::string& text, std::function<void()> on_complete = nullptr);
    uint64_t enqueue_coach(const std::string& text, std::function<void()> on_complete = nullptr);
    uint64_t enqueue_system(const std::string& text, std::function<void()> on_complete = nullptr);

    /**
     * Stop the current playback without its completion callback and queue text.
     */
    uint64_t interrupt(const std::string& text, SpeechDomain domain = SpeechDomain::SYSTEM);

    void clear();
    void clear_domain(SpeechDomain domain);
    void set_enabled(bool enabled);
    bool is_enabled() const { return enabled_; }

    void set_coach_voice_settings(const CoachVoiceSettings& settings) { coach_voice_ = settings; }
    const CoachVoiceSettings& coach_voice_settings() const { return coach_voice_; }
    VoiceOptions voice_options(SpeechDomain domain) const;

    // Synthesize text ahead of time so its later playback skips the round trip
    void prefetch(const std::string& text);
    const SynthesisCache& synthesis_cache() const { return cache_; }

    size_t queue_length() const { return queue_.size(); }
    bool is_currently_playing() const { return playing_; }
    std::optional<SpeechDomain> current_domain() const;

private:
    void process_queue();
    void start_playback(SpeechItem item);
    void handle_synthesis_result(uint64_t playback_id, const std::optional<AudioBytes>& audio);
    void play_synthesized(uint64_t playback_id, const AudioBytes& audio);
    void play_device_speech(uint64_t playback_id);
    void finish_playback(uint64_t playback_id);
    void handle_watchdog(uint64_t playback_id);
    void halt_playback();
    void complete_current(bool run_callback);

    std::optional<std::string> write_temp_audio(uint64_t item_id, const AudioBytes& audio);
    void remove_temp_audio();

    Scheduler& scheduler_;
    DeviceSpeech& device_speech_;
    SpeechSynthesizer* synthesizer_;
    AudioPlayer* player_;
    VoiceQueueParams params_;
    CoachVoiceSettings coach_voice_;
    SynthesisCache cache_;

    std::deque<SpeechItem> queue_;
    std::optional<SpeechItem> current_item_;
    bool playing_;
    bool enabled_;
    std::optional<int64_t> last_play_end_ms_;
    uint64_t next_item_id_;
    uint64_t playback_generation_;     // Completions from older playbacks are ignored
    std::string current_audio_path_;

    TaskHandle throttle_task_;
    TaskHandle watchdog_task_;
};

#endif // VOICE_ANNOUNCEMENT_QUEUE_HPP_
