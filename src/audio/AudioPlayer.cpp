#include "AudioPlayer.hpp"
#include "core/Logger.hpp"
#include <SDL2/SDL_mixer.h>
#include <algorithm>

namespace lg::audio {

// Global callback that mirrors the mixed stream to the tap
static void sdlPostMixCallback(void* userdata, Uint8* stream, int len) {
    auto* player = static_cast<AudioPlayer*>(userdata);
    if (player) {
        player->processAudio(stream, len);
    }
}

AudioPlayer::AudioPlayer() = default;

AudioPlayer::~AudioPlayer() {
    shutdown();
}

Result<void> AudioPlayer::init(u32 sampleRate, u32 bufferSize) {
    if (initialized_)
        return Result<void>::ok();

    int flags = MIX_INIT_MP3 | MIX_INIT_OGG | MIX_INIT_FLAC;
    int loaded = Mix_Init(flags);
    if ((loaded & flags) != flags) {
        LOG_WARN("SDL_mixer: some decoders unavailable: {}", Mix_GetError());
    }

    if (Mix_OpenAudio(static_cast<int>(sampleRate),
                      MIX_DEFAULT_FORMAT,
                      2,
                      static_cast<int>(bufferSize)) < 0) {
        return Result<void>::err(std::string("SDL_mixer init failed: ") +
                                 Mix_GetError());
    }

    Uint16 format = 0;
    if (Mix_QuerySpec(&sampleRate_, &format, &channels_) == 0) {
        Mix_CloseAudio();
        return Result<void>::err(std::string("SDL_mixer query failed: ") +
                                 Mix_GetError());
    }

    Mix_SetPostMix(sdlPostMixCallback, this);
    initialized_ = true;

    LOG_INFO("AudioPlayer initialized: {} Hz, {} channels",
             sampleRate_,
             channels_);
    return Result<void>::ok();
}

void AudioPlayer::shutdown() {
    if (!initialized_)
        return;

    Mix_SetPostMix(nullptr, nullptr);
    Mix_HaltMusic();
    if (music_) {
        Mix_FreeMusic(music_);
        music_ = nullptr;
    }
    Mix_CloseAudio();
    Mix_Quit();
    initialized_ = false;
    LOG_DEBUG("AudioPlayer shut down");
}

Result<void> AudioPlayer::load(const std::filesystem::path& path) {
    if (!initialized_)
        return Result<void>::err("Audio output is not initialized");

    if (music_) {
        Mix_HaltMusic();
        Mix_FreeMusic(music_);
        music_ = nullptr;
    }
    started_ = false;
    lastPosition_ = 0.0;

    music_ = Mix_LoadMUS(path.string().c_str());
    if (!music_) {
        return Result<void>::err("Failed to load " + path.string() + ": " +
                                 Mix_GetError());
    }

    LOG_INFO("Loaded audio file: {} ({})",
             path.string(),
             duration() ? fmt::format("{:.1f}s", *duration())
                        : std::string("unknown length"));
    return Result<void>::ok();
}

void AudioPlayer::play() {
    if (!music_) {
        LOG_WARN("AudioPlayer: no music loaded");
        return;
    }
    if (isPlaying())
        return;

    if (started_ && Mix_PlayingMusic() && Mix_PausedMusic()) {
        Mix_ResumeMusic();
        LOG_INFO("Playback resumed");
    } else {
        // Not started yet, or finished: begin from the stored position
        if (started_)
            lastPosition_ = 0.0;
        if (Mix_PlayMusic(music_, 0) == -1) {
            LOG_ERROR("Failed to play music: {}", Mix_GetError());
            return;
        }
        if (lastPosition_ > 0.0 && Mix_SetMusicPosition(lastPosition_) < 0) {
            LOG_WARN("Cannot start at {:.2f}s: {}", lastPosition_, Mix_GetError());
        }
        started_ = true;
        LOG_INFO("Playback started");
    }
    played();
}

void AudioPlayer::pause() {
    if (!isPlaying())
        return;
    lastPosition_ = currentTime();
    Mix_PauseMusic();
    LOG_INFO("Playback paused at {:.2f}s", lastPosition_);
}

void AudioPlayer::togglePlayPause() {
    if (isPlaying())
        pause();
    else
        play();
}

void AudioPlayer::stop() {
    if (!music_)
        return;
    Mix_HaltMusic();
    started_ = false;
    lastPosition_ = 0.0;
    LOG_INFO("Playback stopped");
}

void AudioPlayer::seek(f64 seconds) {
    if (!music_)
        return;

    seconds = std::max(0.0, seconds);
    if (auto total = duration())
        seconds = std::min(seconds, *total);

    if (started_ && Mix_PlayingMusic()) {
        if (Mix_SetMusicPosition(seconds) < 0) {
            LOG_WARN("Seek to {:.2f}s failed: {}", seconds, Mix_GetError());
            return;
        }
    } else {
        // Applied on the next play()
        started_ = false;
    }
    lastPosition_ = seconds;
    LOG_DEBUG("Seeked to {:.2f}s", seconds);
}

void AudioPlayer::setVolume(f32 volume) {
    Mix_VolumeMusic(static_cast<int>(std::clamp(volume, 0.0f, 1.0f) *
                                     MIX_MAX_VOLUME));
}

f64 AudioPlayer::currentTime() const {
    if (!music_)
        return 0.0;
    if (started_ && Mix_PlayingMusic()) {
        f64 pos = Mix_GetMusicPosition(music_);
        if (pos >= 0.0)
            lastPosition_ = pos;
    }
    return lastPosition_;
}

std::optional<f64> AudioPlayer::duration() const {
    if (!music_)
        return std::nullopt;
    f64 total = Mix_MusicDuration(music_);
    if (total <= 0.0)
        return std::nullopt;
    return total;
}

bool AudioPlayer::isPlaying() const {
    return music_ && Mix_PlayingMusic() && !Mix_PausedMusic();
}

void AudioPlayer::setPcmTap(PcmTap tap) {
    std::lock_guard lock(tapMutex_);
    tap_ = std::move(tap);
}

void AudioPlayer::clearPcmTap() {
    std::lock_guard lock(tapMutex_);
    tap_ = nullptr;
}

void AudioPlayer::processAudio(u8* stream, int len) {
    std::lock_guard lock(tapMutex_);
    if (!tap_ || len <= 0)
        return;

    // MIX_DEFAULT_FORMAT is signed 16-bit
    const usize count = static_cast<usize>(len) / sizeof(i16);
    const auto* pcm = reinterpret_cast<const i16*>(stream);

    floatBuffer_.resize(count);
    for (usize i = 0; i < count; ++i) {
        floatBuffer_[i] = static_cast<f32>(pcm[i]) / 32768.0f;
    }

    tap_(floatBuffer_, static_cast<u32>(channels_));
}

} // namespace lg::audio
