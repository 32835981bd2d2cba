#include "RunSessionCore/voice_announcement_queue.hpp"
#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>
#include "RunSessionCore/speech_text.hpp"
#include "rclcpp/rclcpp.hpp"

namespace
{
const rclcpp::Logger LOGGER = rclcpp::get_logger("voice_queue");
}  // namespace

int domain_priority(SpeechDomain domain)
{
    switch (domain) {
        case SpeechDomain::SYSTEM:     return 3;
        case SpeechDomain::NAVIGATION: return 2;
        case SpeechDomain::COACH:      return 1;
    }
    return 1;
}

const char* domain_name(SpeechDomain domain)
{
    switch (domain) {
        case SpeechDomain::SYSTEM:     return "system";
        case SpeechDomain::NAVIGATION: return "navigation";
        case SpeechDomain::COACH:      return "coach";
    }
    return "unknown";
}

VoiceAnnouncementQueue::VoiceAnnouncementQueue(Scheduler& scheduler,
                                               DeviceSpeech& device_speech,
                                               SpeechSynthesizer* synthesizer,
                                               AudioPlayer* player,
                                               const VoiceQueueParams& params)
    : scheduler_(scheduler),
      device_speech_(device_speech),
      synthesizer_(synthesizer),
      player_(player),
      params_(params),
      cache_(params.synthesis_cache_size),
      playing_(false),
      enabled_(true),
      next_item_id_(1),
      playback_generation_(0)
{
}

VoiceAnnouncementQueue::~VoiceAnnouncementQueue()
{
    throttle_task_.cancel();
    if (playing_) {
        halt_playback();
    }
}

uint64_t VoiceAnnouncementQueue::enqueue(const std::string& text, SpeechDomain domain,
                                         std::function<void()> on_complete)
{
    if (!enabled_) return 0;

    std::string cleaned = clean_speech_text(text);
    if (cleaned.empty()) return 0;

    SpeechItem item;
    item.id = next_item_id_++;
    item.text = cleaned;
    item.domain = domain;
    item.priority = domain_priority(domain);
    item.enqueued_at_ms = scheduler_.now_ms();
    item.on_complete = std::move(on_complete);

    switch (domain) {
        case SpeechDomain::SYSTEM:     item.use_synthesis = params_.synthesize_system; break;
        case SpeechDomain::NAVIGATION: item.use_synthesis = params_.synthesize_navigation; break;
        case SpeechDomain::COACH:      item.use_synthesis = params_.synthesize_coach; break;
    }

    // Ahead of the first strictly lower priority keeps FIFO order within a priority
    auto position = std::find_if(queue_.begin(), queue_.end(),
        [&item](const SpeechItem& queued) { return queued.priority < item.priority; });
    uint64_t id = item.id;
    queue_.insert(position, std::move(item));

    RCLCPP_DEBUG(LOGGER, "Queued %s item %llu, queue length %zu",
        domain_name(domain), static_cast<unsigned long long>(id), queue_.size());

    process_queue();
    return id;
}

uint64_t VoiceAnnouncementQueue::enqueue_navigation(const std::string& text,
                                                    std::function<void()> on_complete)
{
    return enqueue(text, SpeechDomain::NAVIGATION, std::move(on_complete));
}

uint64_t VoiceAnnouncementQueue::enqueue_coach(const std::string& text,
                                               std::function<void()> on_complete)
{
    return enqueue(text, SpeechDomain::COACH, std::move(on_complete));
}

uint64_t VoiceAnnouncementQueue::enqueue_system(const std::string& text,
                                                std::function<void()> on_complete)
{
    return enqueue(text, SpeechDomain::SYSTEM, std::move(on_complete));
}

uint64_t VoiceAnnouncementQueue::interrupt(const std::string& text, SpeechDomain domain)
{
    if (playing_) {
        RCLCPP_INFO(LOGGER, "Interrupting %s announcement",
            domain_name(current_item_->domain));
        halt_playback();
        current_item_.reset();
        playing_ = false;
    }
    return enqueue(text, domain);
}

void VoiceAnnouncementQueue::clear()
{
    queue_.clear();
    throttle_task_.cancel();

    if (playing_) {
        halt_playback();
        complete_current(false);
    }
}

void VoiceAnnouncementQueue::clear_domain(SpeechDomain domain)
{
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
        [domain](const SpeechItem& item) { return item.domain == domain; }), queue_.end());

    // A stopped announcement still counts as completed
    if (playing_ && current_item_->domain == domain) {
        halt_playback();
        complete_current(true);
    }
}

void VoiceAnnouncementQueue::set_enabled(bool enabled)
{
    enabled_ = enabled;
    if (!enabled_) {
        clear();
    }
    RCLCPP_INFO(LOGGER, "Voice announcements %s", enabled_ ? "enabled" : "disabled");
}

VoiceOptions VoiceAnnouncementQueue::voice_options(SpeechDomain domain) const
{
    VoiceOptions options;
    switch (domain) {
        case SpeechDomain::NAVIGATION:
            options.rate = 1.0;
            options.pitch = 1.1;
            break;
        case SpeechDomain::SYSTEM:
            options.rate = 0.95;
            options.pitch = 1.0;
            break;
        case SpeechDomain::COACH:
            options.rate = coach_voice_.rate;
            options.pitch = coach_voice_.pitch;
            break;
    }
    return options;
}

void VoiceAnnouncementQueue::prefetch(const std::string& text)
{
    if (!synthesizer_) return;

    std::string cleaned = clean_speech_text(text);
    if (cleaned.empty() || cache_.contains(cleaned)) return;

    try {
        synthesizer_->synthesize(cleaned, coach_voice_,
            [this, cleaned](std::optional<AudioBytes> audio) {
                if (audio && !audio->empty()) {
                    cache_.store(cleaned, *audio, scheduler_.now_ms());
                }
            });
    } catch (const std::exception& e) {
        RCLCPP_WARN(LOGGER, "Prefetch failed: %s", e.what());
    }
}

std::optional<SpeechDomain> VoiceAnnouncementQueue::current_domain() const
{
    if (!current_item_) return std::nullopt;
    return current_item_->domain;
}

void VoiceAnnouncementQueue::process_queue()
{
    if (playing_ || queue_.empty() || !enabled_) return;
    if (throttle_task_.is_pending()) return;

    if (last_play_end_ms_) {
        int64_t elapsed = scheduler_.now_ms() - *last_play_end_ms_;
        if (elapsed < params_.throttle_ms) {
            throttle_task_ = scheduler_.schedule_once(
                std::chrono::milliseconds(params_.throttle_ms - elapsed),
                [this]() { this->process_queue(); });
            return;
        }
    }

    SpeechItem item = std::move(queue_.front());
    queue_.pop_front();
    start_playback(std::move(item));
}

void VoiceAnnouncementQueue::start_playback(SpeechItem item)
{
    current_item_ = std::move(item);
    playing_ = true;
    uint64_t playback_id = ++playback_generation_;

    watchdog_task_ = scheduler_.schedule_once(
        std::chrono::milliseconds(params_.watchdog_timeout_ms),
        [this, playback_id]() { this->handle_watchdog(playback_id); });

    RCLCPP_INFO(LOGGER, "Speaking %s: \"%s\"",
        domain_name(current_item_->domain), current_item_->text.c_str());

    if (!current_item_->use_synthesis || !synthesizer_ || !player_) {
        play_device_speech(playback_id);
        return;
    }

    std::optional<AudioBytes> cached = cache_.find(current_item_->text);
    if (cached) {
        play_synthesized(playback_id, *cached);
        return;
    }

    try {
        synthesizer_->synthesize(current_item_->text, coach_voice_,
            [this, playback_id](std::optional<AudioBytes> audio) {
                this->handle_synthesis_result(playback_id, audio);
            });
    } catch (const std::exception& e) {
        RCLCPP_WARN(LOGGER, "Synthesis request failed, using device speech: %s", e.what());
        play_device_speech(playback_id);
    }
}

void VoiceAnnouncementQueue::handle_synthesis_result(uint64_t playback_id,
                                                     const std::optional<AudioBytes>& audio)
{
    if (playback_id != playback_generation_ || !playing_) return;

    if (!audio || audio->empty()) {
        RCLCPP_WARN(LOGGER, "Synthesis returned no audio, using device speech");
        play_device_speech(playback_id);
        return;
    }

    cache_.store(current_item_->text, *audio, scheduler_.now_ms());
    play_synthesized(playback_id, *audio);
}

void VoiceAnnouncementQueue::play_synthesized(uint64_t playback_id, const AudioBytes& audio)
{
    std::optional<std::string> path = write_temp_audio(current_item_->id, audio);
    if (!path) {
        play_device_speech(playback_id);
        return;
    }
    current_audio_path_ = *path;

    try {
        player_->play(*path, [this, playback_id](bool ok) {
            if (playback_id != playback_generation_ || !playing_) return;
            if (ok) {
                this->finish_playback(playback_id);
                return;
            }
            RCLCPP_WARN(LOGGER, "Audio playback failed, using device speech");
            this->remove_temp_audio();
            this->play_device_speech(playback_id);
        });
    } catch (const std::exception& e) {
        RCLCPP_WARN(LOGGER, "Audio playback failed, using device speech: %s", e.what());
        remove_temp_audio();
        play_device_speech(playback_id);
    }
}

void VoiceAnnouncementQueue::play_device_speech(uint64_t playback_id)
{
    auto on_finished = [this, playback_id]() { this->finish_playback(playback_id); };
    auto on_error = [this, playback_id](const std::string& error) {
        RCLCPP_WARN(LOGGER, "Device speech error: %s", error.c_str());
        this->finish_playback(playback_id);
    };

    try {
        device_speech_.speak(current_item_->text, voice_options(current_item_->domain),
                             on_finished, on_error, on_finished);
    } catch (const std::exception& e) {
        RCLCPP_ERROR(LOGGER, "Device speech failed: %s", e.what());
        finish_playback(playback_id);
    }
}

// Normal end of playback: done, error or stopped
void VoiceAnnouncementQueue::finish_playback(uint64_t playback_id)
{
    if (playback_id != playback_generation_ || !playing_) return;

    ++playback_generation_;
    watchdog_task_.cancel();
    remove_temp_audio();
    complete_current(true);
}

void VoiceAnnouncementQueue::handle_watchdog(uint64_t playback_id)
{
    if (playback_id != playback_generation_ || !playing_) return;

    RCLCPP_WARN(LOGGER, "Playback watchdog fired after %lldms, forcing stop",
        static_cast<long long>(params_.watchdog_timeout_ms));
    halt_playback();
    complete_current(true);
}

// Stop the engines; every signal from the halted playback is ignored afterwards
void VoiceAnnouncementQueue::halt_playback()
{
    ++playback_generation_;
    watchdog_task_.cancel();
    device_speech_.stop();
    if (player_) {
        player_->stop();
    }
    remove_temp_audio();
}

void VoiceAnnouncementQueue::complete_current(bool run_callback)
{
    last_play_end_ms_ = scheduler_.now_ms();

    std::function<void()> callback;
    if (run_callback && current_item_) {
        callback = std::move(current_item_->on_complete);
    }
    current_item_.reset();
    playing_ = false;

    if (callback) {
        callback();
    }
    process_queue();
}

std::optional<std::string> VoiceAnnouncementQueue::write_temp_audio(uint64_t item_id,
                                                                    const AudioBytes& audio)
{
    std::error_code ec;
    std::filesystem::path directory = params_.temp_directory.empty()
        ? std::filesystem::temp_directory_path(ec)
        : std::filesystem::path(params_.temp_directory);
    if (ec) {
        RCLCPP_WARN(LOGGER, "No temporary directory: %s", ec.message().c_str());
        return std::nullopt;
    }

    std::filesystem::path path =
        directory / ("run-session-speech-" + std::to_string(item_id) + ".mp3");

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        RCLCPP_WARN(LOGGER, "Failed to open %s", path.string().c_str());
        return std::nullopt;
    }
    file.write(reinterpret_cast<const char*>(audio.data()),
               static_cast<std::streamsize>(audio.size()));
    file.close();
    if (!file) {
        RCLCPP_WARN(LOGGER, "Failed to write %s", path.string().c_str());
        std::filesystem::remove(path, ec);
        return std::nullopt;
    }

    return path.string();
}

void VoiceAnnouncementQueue::remove_temp_audio()
{
    if (current_audio_path_.empty()) return;

    std::error_code ec;
    std::filesystem::remove(current_audio_path_, ec);
    if (ec) {
        RCLCPP_WARN(LOGGER, "Failed to remove %s: %s",
            current_audio_path_.c_str(), ec.message().c_str());
    }
    current_audio_path_.clear();
}
