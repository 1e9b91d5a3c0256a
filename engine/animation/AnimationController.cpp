#include "engine/animation/AnimationController.hpp"

#include <algorithm>
#include <cmath>

namespace engine::animation
{
namespace
{
constexpr float kDefaultClipLength = 1.0F;
}

AnimationTrack* AnimationController::Find(const std::string& clip)
{
    const auto it = std::find_if(m_tracks.begin(), m_tracks.end(), [&clip](const AnimationTrack& t) { return t.clip == clip; });
    return it != m_tracks.end() ? &(*it) : nullptr;
}

const AnimationTrack* AnimationController::Find(const std::string& clip) const
{
    const auto it = std::find_if(m_tracks.begin(), m_tracks.end(), [&clip](const AnimationTrack& t) { return t.clip == clip; });
    return it != m_tracks.end() ? &(*it) : nullptr;
}

bool AnimationController::Play(const std::string& clip, unsigned char layer, bool looped, float fadeTime)
{
    if (clip.empty())
    {
        return false;
    }

    AnimationTrack* track = Find(clip);
    if (track == nullptr)
    {
        AnimationTrack created;
        created.clip = clip;
        // A fresh track starts silent so the fade-in is visible.
        created.weight = fadeTime > 0.0F ? 0.0F : 1.0F;
        m_tracks.push_back(created);
        track = &m_tracks.back();
    }

    track->layer = layer;
    track->looped = looped;
    track->targetWeight = 1.0F;
    track->fadeTime = std::max(0.0F, fadeTime);
    if (track->fadeTime <= 0.0F)
    {
        track->weight = 1.0F;
    }
    return true;
}

bool AnimationController::PlayExclusive(const std::string& clip, unsigned char layer, bool looped, float fadeTime)
{
    if (!Play(clip, layer, looped, fadeTime))
    {
        return false;
    }

    for (AnimationTrack& track : m_tracks)
    {
        if (track.layer == layer && track.clip != clip)
        {
            track.targetWeight = 0.0F;
            track.fadeTime = std::max(0.0F, fadeTime);
        }
    }
    return true;
}

bool AnimationController::Stop(const std::string& clip, float fadeTime)
{
    AnimationTrack* track = Find(clip);
    if (track == nullptr)
    {
        return false;
    }

    track->targetWeight = 0.0F;
    track->fadeTime = std::max(0.0F, fadeTime);
    if (track->fadeTime <= 0.0F)
    {
        m_tracks.erase(m_tracks.begin() + (track - m_tracks.data()));
    }
    return true;
}

void AnimationController::StopLayer(unsigned char layer, float fadeTime)
{
    std::vector<std::string> clips;
    for (const AnimationTrack& track : m_tracks)
    {
        if (track.layer == layer)
        {
            clips.push_back(track.clip);
        }
    }
    for (const std::string& clip : clips)
    {
        Stop(clip, fadeTime);
    }
}

void AnimationController::StopAll(float fadeTime)
{
    if (fadeTime <= 0.0F)
    {
        m_tracks.clear();
        return;
    }
    for (AnimationTrack& track : m_tracks)
    {
        track.targetWeight = 0.0F;
        track.fadeTime = fadeTime;
    }
}

bool AnimationController::SetSpeed(const std::string& clip, float speed)
{
    AnimationTrack* track = Find(clip);
    if (track == nullptr)
    {
        return false;
    }
    track->speed = speed;
    return true;
}

bool AnimationController::SetTime(const std::string& clip, float time)
{
    AnimationTrack* track = Find(clip);
    if (track == nullptr)
    {
        return false;
    }
    track->time = std::clamp(time, 0.0F, ClipLength(clip));
    return true;
}

void AnimationController::Update(float dt)
{
    for (AnimationTrack& track : m_tracks)
    {
        const float length = ClipLength(track.clip);
        track.time += dt * track.speed;
        if (track.looped)
        {
            track.time = std::fmod(track.time, length);
            if (track.time < 0.0F)
            {
                track.time += length;
            }
        }
        else
        {
            track.time = std::clamp(track.time, 0.0F, length);
        }

        if (track.weight != track.targetWeight)
        {
            if (track.fadeTime <= 0.0F)
            {
                track.weight = track.targetWeight;
            }
            else
            {
                const float step = dt / track.fadeTime;
                track.weight = track.weight < track.targetWeight ? std::min(track.targetWeight, track.weight + step)
                                                                 : std::max(track.targetWeight, track.weight - step);
            }
        }
    }

    m_tracks.erase(
        std::remove_if(m_tracks.begin(), m_tracks.end(), [](const AnimationTrack& t) {
            return t.targetWeight <= 0.0F && t.weight <= 0.0F;
        }),
        m_tracks.end()
    );
}

bool AnimationController::IsPlaying(const std::string& clip) const
{
    return Find(clip) != nullptr;
}

bool AnimationController::IsFadingOut(const std::string& clip) const
{
    const AnimationTrack* track = Find(clip);
    return track != nullptr && track->targetWeight <= 0.0F;
}

float AnimationController::Weight(const std::string& clip) const
{
    const AnimationTrack* track = Find(clip);
    return track != nullptr ? track->weight : 0.0F;
}

float AnimationController::Speed(const std::string& clip) const
{
    const AnimationTrack* track = Find(clip);
    return track != nullptr ? track->speed : 0.0F;
}

float AnimationController::Time(const std::string& clip) const
{
    const AnimationTrack* track = Find(clip);
    return track != nullptr ? track->time : 0.0F;
}

float AnimationController::Phase(const std::string& clip) const
{
    const float length = ClipLength(clip);
    return length > 0.0F ? Time(clip) / length : 0.0F;
}

void AnimationController::SetClipLength(const std::string& clip, float seconds)
{
    m_clipLengths[clip] = std::max(0.01F, seconds);
}

float AnimationController::ClipLength(const std::string& clip) const
{
    const auto it = m_clipLengths.find(clip);
    return it != m_clipLengths.end() ? it->second : kDefaultClipLength;
}
} // namespace engine::animation
