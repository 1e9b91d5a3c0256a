#include "demo/app/CharacterDemo.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <utility>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/vec2.hpp>

#include "demo/pages/PlatformPaths.hpp"
#include "engine/core/ErrorChannel.hpp"
#include "engine/core/Profiler.hpp"
#include "engine/platform/Input.hpp"
#include "engine/render/Renderer.hpp"
#include "engine/scene/SceneSerializer.hpp"
#include "ui/DeveloperConsole.hpp"

namespace demo::app
{
namespace
{
constexpr float kShadowHeight = 0.02F;
constexpr float kCharacterShadowRadius = 0.45F;
const glm::vec3 kVisorColor{0.1F, 0.1F, 0.12F};

[[nodiscard]] bool IsBoxModel(const std::string& model)
{
    return model == scene::kBoxModel || model == scene::kFloorModel;
}
} // namespace

CharacterDemo::CharacterDemo(const engine::platform::ActionBindings& bindings, CharacterDemoOptions options)
    : m_options(std::move(options))
    , m_physics(m_world)
    , m_random(m_options.config.randomSeed)
    , m_aggregator(bindings, input::AggregatorSettings{m_options.controls.yawSensitivity, m_options.controls.touchSensitivity})
    , m_host(kSampleName)
    , m_quality(m_options.quality)
{
}

CharacterDemo::~CharacterDemo()
{
    Stop();
}

bool CharacterDemo::Start(const pages::SurfaceOptions& options, std::string* outError)
{
    if (m_started)
    {
        Stop();
    }

    if (m_options.config.mushroomCount < 0 || m_options.config.boxCount < 0)
    {
        if (outError != nullptr)
        {
            *outError = "Scene object counts must not be negative.";
        }
        return false;
    }

    const std::string platform = m_options.config.platform.empty() ? pages::CurrentPlatform() : m_options.config.platform;
    m_dataPath = options.resourcePath.empty() ? std::string{"Data"} : options.resourcePath;
    m_programDir = options.programDir;

    m_world.Clear();
    m_random.Seed(m_options.config.randomSeed);
    m_clock = engine::core::FrameClock{};
    m_clock.SetFixedHz(m_options.config.fixedHz);

    scene::RegisterCollisionParts(m_physics);
    m_handles = scene::BuildScene(
        m_world,
        m_physics,
        m_random,
        scene::SceneBootstrapSettings{m_options.config.mushroomCount, m_options.config.boxCount}
    );

    m_character = std::make_unique<character::Character>(m_world, m_physics, m_handles.character);
    m_character->Attach();

    m_rig = camera::CameraRig{};
    m_rig.SetFarClip(scene::kCameraFarClip);

    const bool touchEnabled = pages::IsMobilePlatform(platform) || m_options.config.touchEmulation;
    m_aggregator.SetTouchEnabled(touchEnabled);
    (void)m_aggregator.SetUseGyroscope(false);

    m_exitRequested = false;
    m_pendingScreenshot.clear();
    m_started = true;

    std::cout << "CharacterDemo started (seed " << m_random.SeedValue() << ", touch " << (touchEnabled ? "on" : "off") << ")\n";
    return true;
}

void CharacterDemo::Stop()
{
    if (!m_started)
    {
        return;
    }
    m_character.reset();
    m_world.Clear();
    m_physics.MarkStaticsDirty();
    m_handles = scene::SceneHandles{};
    m_started = false;
}

void CharacterDemo::Update(const pages::SurfaceFrame& frame)
{
    if (!m_started || frame.input == nullptr || frame.bindings == nullptr)
    {
        return;
    }
    CHARSURF_PROFILE_SCOPE("CharacterDemo::Update");

    engine::platform::Input& input = *frame.input;
    const bool consoleOpen = frame.console != nullptr && frame.console->IsOpen();
    const HostActions actions = m_host.HandleKeys(input, *frame.bindings, m_quality, consoleOpen, frame.uiHasFocus);
    if (actions.toggleConsole && frame.console != nullptr)
    {
        frame.console->Toggle();
    }
    if (actions.exitRequested)
    {
        m_exitRequested = true;
    }
    if (actions.screenshotRequested)
    {
        (void)RequestScreenshot();
    }
    if (actions.qualityChanged)
    {
        std::cout << engine::render::DescribeQuality(m_quality) << "\n";
    }

    if (m_character == nullptr)
    {
        return;
    }

    std::optional<input::ScreenJoystickState> joystick;
    if (m_aggregator.TouchEnabled())
    {
        const float uiScale = glm::clamp(frame.viewport.h / 720.0F, 0.6F, 2.0F);
        m_joystick.Layout(frame.viewport, uiScale);
        const glm::vec2 windowToUi = frame.ui != nullptr ? frame.ui->WindowToUi(glm::vec2{1.0F}) : glm::vec2{1.0F};
        joystick = m_joystick.Update(input, windowToUi);
    }

    input::AggregatorFrame aggregatorFrame;
    aggregatorFrame.fovDegrees = m_rig.FovDegrees();
    aggregatorFrame.viewportHeight = frame.viewport.h;
    aggregatorFrame.uiHasFocus = frame.uiHasFocus;
    aggregatorFrame.screenJoystick = joystick.has_value() ? &*joystick : nullptr;

    const input::AggregatorRequests requests = m_aggregator.Update(input, m_character->GetControls(), m_rig, aggregatorFrame);
    m_character->ApplyControlsRotation();

    std::string error;
    if (requests.saveScene && !SaveScene(&error))
    {
        ReportError("Failed to save scene: " + error);
    }
    if (requests.loadScene && !LoadScene(&error))
    {
        ReportError("Failed to load scene: " + error);
    }
    if (m_character == nullptr)
    {
        return;
    }

    m_clock.Advance(frame.deltaSeconds);
    const float fixedStep = static_cast<float>(m_clock.FixedDeltaSeconds());
    while (m_clock.ShouldRunFixedStep())
    {
        m_physics.Step(fixedStep);
        engine::core::Profiler::Instance().RecordPhysicsStep();
        m_clock.ConsumeFixedStep();
    }

    for (auto& [entity, animation] : m_world.Animations())
    {
        (void)entity;
        animation.Update(frame.deltaSeconds);
    }

    m_rig.Update(m_world, m_physics, m_character->GetEntity(), m_character->GetControls());
}

void CharacterDemo::Render(engine::render::Renderer& renderer, const engine::ui::UiRect& viewport)
{
    if (!m_started || viewport.w < 1.0F || viewport.h < 1.0F)
    {
        return;
    }
    CHARSURF_PROFILE_SCOPE("CharacterDemo::Render");

    renderer.SetViewport(
        static_cast<int>(viewport.x),
        static_cast<int>(viewport.y),
        static_cast<int>(viewport.w),
        static_cast<int>(viewport.h)
    );
    renderer.SetQuality(m_quality);
    ApplyEnvironment(renderer);

    const camera::CameraPose& pose = m_rig.Pose();
    renderer.SetCameraWorldPosition(pose.position);
    renderer.BeginFrame(renderer.GetEnvironmentSettings().fogColor);
    DrawWorld(renderer);

    const glm::mat4 viewProjection = m_rig.ProjectionMatrix(viewport.w / viewport.h) * pose.ViewMatrix();
    renderer.EndFrame(viewProjection);

    if (!m_pendingScreenshot.empty())
    {
        const std::filesystem::path path(m_pendingScreenshot);
        m_pendingScreenshot.clear();

        std::error_code ec;
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        std::string error;
        if (ec)
        {
            ReportError("Failed to create screenshot directory: " + ec.message());
        }
        else if (!renderer.CaptureScreenshot(path.string(), &error))
        {
            ReportError("Failed to take screenshot: " + error);
        }
        else
        {
            std::cout << "Screenshot saved to " << path.string() << "\n";
        }
    }
}

void CharacterDemo::BuildOverlay(engine::ui::UiSystem& ui, const engine::ui::UiRect& viewport)
{
    if (!m_started)
    {
        return;
    }
    m_host.DrawInstructions(ui, viewport);
    if (m_aggregator.TouchEnabled())
    {
        m_joystick.Draw(ui);
    }
    m_host.DrawDebugHud(ui, viewport, CollectHudInfo());
}

void CharacterDemo::FillConsoleContext(ui::ConsoleContext& context)
{
    context.saveScene = [this](std::string* outError) { return SaveScene(outError); };
    context.loadScene = [this](std::string* outError) { return LoadScene(outError); };
    context.setFirstPerson = [this](bool firstPerson) { m_rig.SetFirstPerson(firstPerson); };
    context.firstPerson = [this]() { return m_rig.IsFirstPerson(); };
    context.setGyroscope = [this](bool enabled) { return m_aggregator.SetUseGyroscope(enabled); };
    context.setCameraDistance = [this](float distance) { m_rig.SetDistance(distance); };
    context.cameraDistance = [this]() { return m_rig.Distance(); };
    context.qualityDump = [this]() { return engine::render::DescribeQuality(m_quality); };
    context.takeScreenshot = [this](std::string* outPath, std::string* outError) {
        (void)outError;
        const std::string path = RequestScreenshot();
        if (outPath != nullptr)
        {
            *outPath = path;
        }
        return true;
    };
}

std::filesystem::path CharacterDemo::ScenePath() const
{
    return m_programDir / m_dataPath / kSceneFile;
}

bool CharacterDemo::SaveScene(std::string* outError)
{
    if (!m_started)
    {
        if (outError != nullptr)
        {
            *outError = "Sample is not running.";
        }
        return false;
    }

    const std::filesystem::path path = ScenePath();
    if (!engine::scene::SceneSerializer::SaveToFile(m_world, path, outError))
    {
        return false;
    }
    std::cout << "Scene saved to " << path.string() << "\n";
    return true;
}

bool CharacterDemo::LoadScene(std::string* outError)
{
    if (!m_started)
    {
        if (outError != nullptr)
        {
            *outError = "Sample is not running.";
        }
        return false;
    }

    const std::filesystem::path path = ScenePath();
    engine::scene::World loaded;
    if (!engine::scene::SceneSerializer::LoadFromFile(path, &loaded, outError))
    {
        return false;
    }

    // Resolve Jack before the running world is replaced.
    const std::optional<engine::scene::Entity> jack = loaded.FindByName(scene::kCharacterName);
    const engine::scene::Transform* loadedTransform = jack.has_value() ? loaded.FindTransform(*jack) : nullptr;
    if (loadedTransform == nullptr || loaded.FindBody(*jack) == nullptr)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Loaded scene has no node named "} + scene::kCharacterName;
        }
        return false;
    }
    const float loadedYaw = character::YawFromRotation(loadedTransform->rotation);

    character::Controls previous;
    if (m_character != nullptr)
    {
        previous = m_character->GetControls();
    }
    m_character.reset();
    m_world = std::move(loaded);
    m_physics.MarkStaticsDirty();

    m_handles.character = *jack;
    m_character = std::make_unique<character::Character>(m_world, m_physics, *jack);
    character::Controls& controls = m_character->GetControls();
    controls.pitch = previous.pitch;
    controls.yaw = loadedYaw;
    m_character->Attach();

    std::cout << "Scene loaded from " << path.string() << "\n";
    return true;
}

std::string CharacterDemo::RequestScreenshot()
{
    const std::filesystem::path dataDir = m_programDir / m_dataPath;
    m_pendingScreenshot = m_host.ScreenshotPath(dataDir.string(), std::chrono::system_clock::now());
    return m_pendingScreenshot;
}

void CharacterDemo::ReportError(const std::string& message) const
{
    if (m_options.errors != nullptr)
    {
        m_options.errors->Report(kSampleName, message);
    }
    else
    {
        std::cerr << message << "\n";
    }
}

void CharacterDemo::ApplyEnvironment(engine::render::Renderer& renderer) const
{
    engine::render::EnvironmentSettings environment = renderer.GetEnvironmentSettings();
    if (!m_world.Zones().empty())
    {
        const engine::scene::Zone& zone = m_world.Zones().begin()->second;
        environment.ambientColor = zone.ambientColor;
        environment.fogColor = zone.fogColor;
        environment.fogStart = zone.fogStart;
        environment.fogEnd = zone.fogEnd;
    }
    if (!m_world.Lights().empty())
    {
        const engine::scene::DirectionalLight& light = m_world.Lights().begin()->second;
        environment.directionalLightDirection = light.direction;
        environment.directionalLightColor = light.color;
        environment.directionalLightIntensity = light.brightness;
    }
    renderer.SetEnvironmentSettings(environment);
}

void CharacterDemo::DrawWorld(engine::render::Renderer& renderer) const
{
    const bool hideCharacter = m_rig.IsFirstPerson();
    const engine::scene::Entity characterEntity = m_character != nullptr ? m_character->GetEntity() : engine::scene::kInvalidEntity;

    for (const engine::scene::Entity entity : m_world.Entities())
    {
        const auto renderable = m_world.Renderables().find(entity);
        const engine::scene::Transform* transform = m_world.FindTransform(entity);
        if (renderable == m_world.Renderables().end() || transform == nullptr)
        {
            continue;
        }

        const engine::scene::Renderable& model = renderable->second;
        const glm::vec3 ground{transform->position.x, kShadowHeight, transform->position.z};

        if (entity == characterEntity)
        {
            if (hideCharacter)
            {
                continue;
            }
            const auto shape = m_world.Shapes().find(entity);
            const glm::vec3 size = shape != m_world.Shapes().end() ? shape->second.size : glm::vec3{0.7F, 1.8F, 0.7F};
            const glm::vec3 offset = shape != m_world.Shapes().end() ? shape->second.offset : glm::vec3{0.0F, 0.9F, 0.0F};
            renderer.DrawCapsule(transform->position + transform->rotation * offset, size.y, size.x * 0.5F, model.color);

            const auto animated = m_world.AnimatedModels().find(entity);
            if (animated != m_world.AnimatedModels().end())
            {
                const engine::scene::Bone* head = animated->second.FindBone(character::Character::kHeadBone);
                if (head != nullptr)
                {
                    const glm::quat headRotation = transform->rotation * head->localRotation;
                    const glm::vec3 headPosition = transform->position + transform->rotation * head->localPosition;
                    renderer.DrawOrientedBox(
                        headPosition + headRotation * glm::vec3{0.0F, 0.0F, -0.32F},
                        glm::vec3{0.16F, 0.05F, 0.05F},
                        headRotation,
                        kVisorColor
                    );
                }
            }
            if (model.castShadows)
            {
                renderer.DrawBlobShadow(ground, kCharacterShadowRadius);
            }
            continue;
        }

        if (model.model == scene::kMushroomModel)
        {
            renderer.DrawMushroom(transform->position, transform->rotation, transform->scale.x, model.color);
            if (model.castShadows)
            {
                renderer.DrawBlobShadow(ground, transform->scale.x * 0.4F);
            }
            continue;
        }

        if (IsBoxModel(model.model))
        {
            const glm::vec3 halfExtents = transform->scale * 0.5F;
            const engine::scene::RigidBody* body = m_world.FindBody(entity);
            if (body == nullptr || !body->IsDynamic())
            {
                engine::render::MaterialParams floor;
                floor.checker = true;
                floor.specular = 0.1F;
                renderer.DrawOrientedBox(transform->position, halfExtents, transform->rotation, model.color, floor);
            }
            else
            {
                renderer.DrawOrientedBox(transform->position, halfExtents, transform->rotation, model.color);
            }
            if (model.castShadows)
            {
                renderer.DrawBlobShadow(ground, glm::length(glm::vec2{halfExtents.x, halfExtents.z}));
            }
        }
    }
}

DebugHudInfo CharacterDemo::CollectHudInfo() const
{
    DebugHudInfo info;
    info.stats = engine::core::Profiler::Instance().Stats();
    info.dynamicBodies = m_physics.DynamicBodyCount();
    info.staticSolids = m_physics.StaticSolidCount();
    if (m_character != nullptr)
    {
        info.characterState = m_character->State();
        info.inAirTime = m_character->InAirTime();
    }
    info.cameraDistance = m_rig.IsFirstPerson() ? 0.0F : m_rig.EffectiveDistance();
    info.firstPerson = m_rig.IsFirstPerson();
    info.touchEnabled = m_aggregator.TouchEnabled();
    info.gyroscope = m_aggregator.Touch().UseGyroscope();
    info.quality = m_quality;
    return info;
}
} // namespace demo::app
