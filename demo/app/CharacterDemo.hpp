#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "demo/app/DemoSettings.hpp"
#include "demo/app/SampleHost.hpp"
#include "demo/camera/CameraRig.hpp"
#include "demo/character/Character.hpp"
#include "demo/input/InputAggregator.hpp"
#include "demo/input/ScreenJoystick.hpp"
#include "demo/pages/SurfaceApplication.hpp"
#include "demo/scene/SceneBootstrap.hpp"
#include "engine/core/FrameClock.hpp"
#include "engine/core/Random.hpp"
#include "engine/physics/PhysicsWorld.hpp"
#include "engine/render/RenderQuality.hpp"
#include "engine/scene/World.hpp"

namespace engine::core
{
class ErrorChannel;
}

namespace demo::app
{
struct CharacterDemoOptions
{
    DemoConfig config{};
    ControlsSettings controls{};
    engine::render::RenderQuality quality{};
    engine::core::ErrorChannel* errors = nullptr;
};

/// Jack walking among mushrooms and falling boxes.
class CharacterDemo final : public pages::SurfaceApplication
{
public:
    static constexpr const char* kSampleName = "CharacterDemo";
    static constexpr const char* kSceneFile = "Scenes/CharacterDemo.json";

    CharacterDemo(const engine::platform::ActionBindings& bindings, CharacterDemoOptions options);
    ~CharacterDemo() override;

    [[nodiscard]] bool Start(const pages::SurfaceOptions& options, std::string* outError) override;
    void Stop() override;

    void Update(const pages::SurfaceFrame& frame) override;
    void Render(engine::render::Renderer& renderer, const engine::ui::UiRect& viewport) override;
    void BuildOverlay(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport) override;
    void FillConsoleContext(ui::ConsoleContext& context) override;

    [[nodiscard]] bool ExitRequested() const override { return m_exitRequested; }

    bool SaveScene(std::string* outError = nullptr);
    /// Replaces the world with the saved one and rebinds the character to "Jack".
    bool LoadScene(std::string* outError = nullptr);
    /// Captured after the next rendered frame.
    std::string RequestScreenshot();

    [[nodiscard]] std::filesystem::path ScenePath() const;
    [[nodiscard]] const std::string& DataPath() const { return m_dataPath; }

    [[nodiscard]] engine::scene::World& World() { return m_world; }
    [[nodiscard]] engine::physics::PhysicsWorld& Physics() { return m_physics; }
    [[nodiscard]] character::Character* GetCharacter() { return m_character.get(); }
    [[nodiscard]] camera::CameraRig& Rig() { return m_rig; }
    [[nodiscard]] input::InputAggregator& Aggregator() { return m_aggregator; }
    [[nodiscard]] SampleHost& Host() { return m_host; }
    [[nodiscard]] const engine::render::RenderQuality& Quality() const { return m_quality; }
    [[nodiscard]] const scene::SceneHandles& Handles() const { return m_handles; }
    [[nodiscard]] const std::string& PendingScreenshot() const { return m_pendingScreenshot; }
    [[nodiscard]] std::uint32_t Seed() const { return m_random.SeedValue(); }

private:
    void ReportError(const std::string& message) const;
    void DrawWorld(engine::render::Renderer& renderer) const;
    void ApplyEnvironment(engine::render::Renderer& renderer) const;
    [[nodiscard]] DebugHudInfo CollectHudInfo() const;

    CharacterDemoOptions m_options;
    engine::scene::World m_world;
    engine::physics::PhysicsWorld m_physics;
    engine::core::Random m_random;
    engine::core::FrameClock m_clock;

    scene::SceneHandles m_handles{};
    std::unique_ptr<character::Character> m_character;
    camera::CameraRig m_rig;
    input::InputAggregator m_aggregator;
    input::ScreenJoystick m_joystick;
    SampleHost m_host;
    engine::render::RenderQuality m_quality{};

    std::string m_dataPath;
    std::filesystem::path m_programDir;
    std::string m_pendingScreenshot;
    bool m_started = false;
    bool m_exitRequested = false;
};
} // namespace demo::app
