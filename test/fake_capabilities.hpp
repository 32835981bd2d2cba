/*
 * Scriptable fakes for the platform capabilities.
 * Each fake records what the component asked of it and lets the test
 * drive the answers.
 */

#ifndef TEST_FAKE_CAPABILITIES_HPP_
#define TEST_FAKE_CAPABILITIES_HPP_

#include <fstream>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "RunSessionCore/capabilities.hpp"

// ============================================================================
// Positioning
// ============================================================================

class FakePositionSource : public PositionSource
{
public:
    PermissionStatus permission = PermissionStatus::GRANTED;
    bool throw_on_subscribe = false;
    int subscribe_count = 0;
    int unsubscribe_count = 0;
    PositionSubscriptionOptions last_options;
    std::vector<PositionFetchCallback> pending_fetches;

    PermissionStatus request_permission() override { return permission; }

    SubscriptionHandle subscribe(const PositionSubscriptionOptions& options,
                                 PositionCallback on_sample) override
    {
        if (throw_on_subscribe) throw std::runtime_error("location services off");

        ++subscribe_count;
        last_options = options;
        callback_ = std::move(on_sample);
        return SubscriptionHandle([this]() {
            ++unsubscribe_count;
            callback_ = nullptr;
        });
    }

    void fetch_once(LocationAccuracy /*accuracy*/, PositionFetchCallback on_result) override
    {
        pending_fetches.push_back(std::move(on_result));
    }

    bool is_subscribed() const { return static_cast<bool>(callback_); }

    void emit(const PositionSample& sample)
    {
        if (callback_) callback_(sample);
    }

    // Answer the oldest outstanding fetch
    void answer_fetch(const std::optional<PositionSample>& result)
    {
        if (pending_fetches.empty()) return;
        PositionFetchCallback callback = pending_fetches.front();
        pending_fetches.erase(pending_fetches.begin());
        callback(result);
    }

private:
    PositionCallback callback_;
};

// ============================================================================
// Motion
// ============================================================================

class FakeMotionSource : public MotionSource
{
public:
    bool available = true;
    int64_t last_interval_ms = 0;
    int unsubscribe_count = 0;

    bool is_available() override { return available; }

    SubscriptionHandle subscribe(int64_t interval_ms, MotionCallback on_sample) override
    {
        last_interval_ms = interval_ms;
        callback_ = std::move(on_sample);
        return SubscriptionHandle([this]() {
            ++unsubscribe_count;
            callback_ = nullptr;
        });
    }

    bool is_subscribed() const { return static_cast<bool>(callback_); }

    void emit(double x, double y, double z)
    {
        geometry_msgs::msg::Vector3 acceleration;
        acceleration.x = x;
        acceleration.y = y;
        acceleration.z = z;
        if (callback_) callback_(acceleration);
    }

private:
    MotionCallback callback_;
};

// ============================================================================
// Lifecycle
// ============================================================================

class FakeLifecycleSource : public LifecycleSource
{
public:
    SubscriptionHandle subscribe(std::function<void(AppState)> on_change) override
    {
        callback_ = std::move(on_change);
        return SubscriptionHandle([this]() { callback_ = nullptr; });
    }

    bool is_subscribed() const { return static_cast<bool>(callback_); }

    void emit(AppState state)
    {
        if (callback_) callback_(state);
    }

private:
    std::function<void(AppState)> callback_;
};

// ============================================================================
// Speech
// ============================================================================

class FakeDeviceSpeech : public DeviceSpeech
{
public:
    struct Utterance
    {
        std::string text;
        VoiceOptions options;
    };

    std::vector<Utterance> spoken;
    int stop_count = 0;

    void speak(const std::string& text, const VoiceOptions& options,
               std::function<void()> on_done,
               std::function<void(const std::string&)> on_error,
               std::function<void()> on_stopped) override
    {
        spoken.push_back(Utterance{text, options});
        on_done_ = std::move(on_done);
        on_error_ = std::move(on_error);
        on_stopped_ = std::move(on_stopped);
    }

    // Stopping reports on_stopped like a real engine
    void stop() override
    {
        ++stop_count;
        auto callback = std::move(on_stopped_);
        clear();
        if (callback) callback();
    }

    bool is_speaking() const { return static_cast<bool>(on_done_); }

    void finish()
    {
        auto callback = std::move(on_done_);
        clear();
        if (callback) callback();
    }

    void fail(const std::string& error)
    {
        auto callback = std::move(on_error_);
        clear();
        if (callback) callback(error);
    }

private:
    void clear()
    {
        on_done_ = nullptr;
        on_error_ = nullptr;
        on_stopped_ = nullptr;
    }

    std::function<void()> on_done_;
    std::function<void(const std::string&)> on_error_;
    std::function<void()> on_stopped_;
};

class FakeSynthesizer : public SpeechSynthesizer
{
public:
    struct Request
    {
        std::string text;
        CoachVoiceSettings voice;
        SynthesisCallback callback;
    };

    std::vector<Request> requests;
    bool throw_on_request = false;

    void synthesize(const std::string& text, const CoachVoiceSettings& voice,
                    SynthesisCallback on_result) override
    {
        if (throw_on_request) throw std::runtime_error("network unreachable");
        requests.push_back(Request{text, voice, std::move(on_result)});
    }

    void respond(size_t index, const std::optional<AudioBytes>& audio)
    {
        SynthesisCallback callback = requests.at(index).callback;
        callback(audio);
    }
};

class FakeAudioPlayer : public AudioPlayer
{
public:
    std::vector<std::string> played;
    std::vector<AudioBytes> file_contents;   // Read back at play time
    int stop_count = 0;

    void play(const std::string& path, std::function<void(bool ok)> on_finished) override
    {
        played.push_back(path);

        std::ifstream file(path, std::ios::binary);
        file_contents.push_back(AudioBytes((std::istreambuf_iterator<char>(file)),
                                           std::istreambuf_iterator<char>()));
        on_finished_ = std::move(on_finished);
    }

    void stop() override
    {
        ++stop_count;
        on_finished_ = nullptr;
    }

    bool is_playing() const { return static_cast<bool>(on_finished_); }

    void finish(bool ok)
    {
        auto callback = std::move(on_finished_);
        on_finished_ = nullptr;
        if (callback) callback(ok);
    }

private:
    std::function<void(bool ok)> on_finished_;
};

#endif // TEST_FAKE_CAPABILITIES_HPP_
