#pragma once
// AudioPlayer.hpp - SDL_mixer playback with a post-mix PCM tap
// Provides the playback clock and mirrors mixed output to the analysis graph

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "PcmTap.hpp"
#include "PlaybackClock.hpp"
#include "util/Result.hpp"
#include "util/Signal.hpp"

// Forward declare SDL types
struct _Mix_Music;
typedef struct _Mix_Music Mix_Music;

namespace lg::audio {

class AudioPlayer : public PlaybackClock, public PcmTapHost {
public:
    AudioPlayer();
    ~AudioPlayer() override;

    AudioPlayer(const AudioPlayer&) = delete;
    AudioPlayer& operator=(const AudioPlayer&) = delete;

    Result<void> init(u32 sampleRate = 44100, u32 bufferSize = 2048);
    void shutdown();

    Result<void> load(const std::filesystem::path& path);
    void play();
    void pause();
    void togglePlayPause();
    void stop();
    void seek(f64 seconds);
    void setVolume(f32 volume); // 0.0 - 1.0

    bool isInitialized() const {
        return initialized_;
    }
    bool hasMedia() const {
        return music_ != nullptr;
    }

    // PlaybackClock
    f64 currentTime() const override;
    std::optional<f64> duration() const override;
    bool isPlaying() const override;

    // PcmTapHost
    void setPcmTap(PcmTap tap) override;
    void clearPcmTap() override;

    // Called by the SDL post-mix callback on the audio thread
    void processAudio(u8* stream, int len);

    Signal<> played;

private:
    Mix_Music* music_{nullptr};
    bool initialized_{false};
    bool started_{false};
    int sampleRate_{44100};
    int channels_{2};
    mutable f64 lastPosition_{0.0};

    std::mutex tapMutex_;
    PcmTap tap_;
    std::vector<f32> floatBuffer_;
};

} // namespace lg::audio
