#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace engine::animation
{
/// One clip playing on a model. Weight fades toward targetWeight over fadeTime.
struct AnimationTrack
{
    std::string clip;
    unsigned char layer = 0;
    float time = 0.0F;
    float weight = 0.0F;
    float targetWeight = 1.0F;
    float fadeTime = 0.0F;
    float speed = 1.0F;
    bool looped = true;
};

/// Named-clip playback with per-layer exclusivity and fades.
class AnimationController
{
public:
    bool Play(const std::string& clip, unsigned char layer, bool looped, float fadeTime = 0.0F);
    bool PlayExclusive(const std::string& clip, unsigned char layer, bool looped, float fadeTime = 0.0F);
    bool Stop(const std::string& clip, float fadeTime = 0.0F);
    void StopLayer(unsigned char layer, float fadeTime = 0.0F);
    void StopAll(float fadeTime = 0.0F);

    bool SetSpeed(const std::string& clip, float speed);
    bool SetTime(const std::string& clip, float time);

    void Update(float dt);

    [[nodiscard]] bool IsPlaying(const std::string& clip) const;
    [[nodiscard]] bool IsFadingOut(const std::string& clip) const;
    [[nodiscard]] float Weight(const std::string& clip) const;
    [[nodiscard]] float Speed(const std::string& clip) const;
    [[nodiscard]] float Time(const std::string& clip) const;
    /// Normalized position in [0, 1) within the clip.
    [[nodiscard]] float Phase(const std::string& clip) const;

    void SetClipLength(const std::string& clip, float seconds);
    [[nodiscard]] float ClipLength(const std::string& clip) const;
    [[nodiscard]] const std::unordered_map<std::string, float>& ClipLengths() const { return m_clipLengths; }

    [[nodiscard]] const std::vector<AnimationTrack>& Tracks() const { return m_tracks; }
    void SetTracks(std::vector<AnimationTrack> tracks) { m_tracks = std::move(tracks); }

private:
    AnimationTrack* Find(const std::string& clip);
    [[nodiscard]] const AnimationTrack* Find(const std::string& clip) const;

    std::vector<AnimationTrack> m_tracks;
    std::unordered_map<std::string, float> m_clipLengths;
};
} // namespace engine::animation
