#ifndef RUN_SESSION_CAPABILITIES_HPP_
#define RUN_SESSION_CAPABILITIES_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "RunSessionCore/types.hpp"
#include "geometry_msgs/msg/vector3.hpp"

/**
 * Owning handle for a collaborator subscription.
 * Unsubscribes on destruction; move-only.
 */
class SubscriptionHandle
{
public:
    SubscriptionHandle() = default;
    explicit SubscriptionHandle(std::function<void()> unsubscribe);
    ~SubscriptionHandle();

    SubscriptionHandle(SubscriptionHandle&& other) noexcept;
    SubscriptionHandle& operator=(SubscriptionHandle&& other) noexcept;
    SubscriptionHandle(const SubscriptionHandle&) = delete;
    SubscriptionHandle& operator=(const SubscriptionHandle&) = delete;

    // Release the subscription now; safe to call repeatedly
    void unsubscribe();
    bool is_active() const { return static_cast<bool>(unsubscribe_); }

private:
    std::function<void()> unsubscribe_;
};

// ---------------------------------------------------------------------------
// Positioning
// ---------------------------------------------------------------------------

enum class PermissionStatus { GRANTED, DENIED, UNAVAILABLE };

enum class LocationAccuracy { BALANCED, HIGH, BEST_FOR_NAVIGATION };

struct PositionSubscriptionOptions
{
    LocationAccuracy accuracy = LocationAccuracy::BEST_FOR_NAVIGATION;
    int64_t min_interval_ms = 1000;
    double min_distance_m = 5.0;
};

/**
 * Delivery policy for a position subscription: after the first sample,
 * a fix is delivered only once both min_interval_ms and min_distance_m
 * have been covered since the last delivered one.
 *
 * @param last_delivered Last sample handed to the subscriber, if any
 * @return true if next should be delivered
 */
bool should_deliver_position(const PositionSubscriptionOptions& options,
                             const std::optional<PositionSample>& last_delivered,
                             const PositionSample& next);

using PositionCallback = std::function<void(const PositionSample&)>;
using PositionFetchCallback = std::function<void(std::optional<PositionSample>)>;

/**
 * Platform positioning capability.
 * Implementations may throw std::exception from subscribe/fetch_once on
 * platform failure; callers treat that as a failed request.
 */
class PositionSource
{
public:
    virtual ~PositionSource() = default;

    virtual PermissionStatus request_permission() = 0;

    virtual SubscriptionHandle subscribe(const PositionSubscriptionOptions& options,
                                         PositionCallback on_sample) = 0;

    /**
     * Request one fix. on_result receives std::nullopt on failure and may
     * be invoked synchronously or later from the executor.
     */
    virtual void fetch_once(LocationAccuracy accuracy, PositionFetchCallback on_result) = 0;
};

// ---------------------------------------------------------------------------
// Motion
// ---------------------------------------------------------------------------

// Acceleration in units of g
using MotionCallback = std::function<void(const geometry_msgs::msg::Vector3&)>;

class MotionSource
{
public:
    virtual ~MotionSource() = default;

    virtual bool is_available() = 0;
    virtual SubscriptionHandle subscribe(int64_t interval_ms, MotionCallback on_sample) = 0;
};

// ---------------------------------------------------------------------------
// Application lifecycle
// ---------------------------------------------------------------------------

enum class AppState { ACTIVE, BACKGROUND };

class LifecycleSource
{
public:
    virtual ~LifecycleSource() = default;

    virtual SubscriptionHandle subscribe(std::function<void(AppState)> on_change) = 0;
};

// ---------------------------------------------------------------------------
// Speech output
// ---------------------------------------------------------------------------

/**
 * Voice parameters for on-device speech.
 */
struct VoiceOptions
{
    std::string language = "en-US";
    double pitch = 1.0;
    double rate = 0.9;
};

/**
 * Caller-configurable coach voice, also forwarded to the synthesizer.
 */
struct CoachVoiceSettings
{
    std::string gender = "female";
    std::string accent = "american";
    double rate = 0.9;
    double pitch = 1.0;
};

using AudioBytes = std::vector<uint8_t>;
using SynthesisCallback = std::function<void(std::optional<AudioBytes>)>;

/**
 * Remote neural speech synthesis. May fail or never answer.
 */
class SpeechSynthesizer
{
public:
    virtual ~SpeechSynthesizer() = default;

    virtual void synthesize(const std::string& text, const CoachVoiceSettings& voice,
                            SynthesisCallback on_result) = 0;
};

/**
 * Built-in device speech engine. Exactly one of the three callbacks
 * fires per speak() unless the engine is stuck.
 */
class DeviceSpeech
{
public:
    virtual ~DeviceSpeech() = default;

    virtual void speak(const std::string& text, const VoiceOptions& options,
                       std::function<void()> on_done,
                       std::function<void(const std::string&)> on_error,
                       std::function<void()> on_stopped) = 0;
    virtual void stop() = 0;
};

/**
 * Audio file playback for synthesized speech.
 */
class AudioPlayer
{
public:
    virtual ~AudioPlayer() = default;

    virtual void play(const std::string& path, std::function<void(bool ok)> on_finished) = 0;
    virtual void stop() = 0;
};

#endif // RUN_SESSION_CAPABILITIES_HPP_
