#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <glm/ext/vector_int4.hpp>

#include "engine/render/RenderQuality.hpp"

namespace engine::render
{
struct EnvironmentSettings
{
    glm::vec3 directionalLightDirection{0.3F, -0.5F, 0.425F};
    glm::vec3 directionalLightColor{1.0F, 1.0F, 1.0F};
    float directionalLightIntensity = 1.0F;

    glm::vec3 ambientColor{0.15F, 0.15F, 0.15F};
    glm::vec3 fogColor{0.5F, 0.5F, 0.7F};
    float fogStart = 100.0F;
    float fogEnd = 300.0F;
};

struct MaterialParams
{
    float specular = 0.3F;
    // Floor-style procedural checker, detail picked from texture quality.
    bool checker = false;
    bool unlit = false;
};

/// Immediate-mode scene renderer. Draw calls collect vertices between
/// BeginFrame and EndFrame; EndFrame uploads and draws them.
class Renderer
{
public:
    bool Initialize(int framebufferWidth, int framebufferHeight);
    void Shutdown();

    /// Bottom-left origin, framebuffer pixels.
    void SetViewport(int x, int y, int width, int height);
    [[nodiscard]] const glm::ivec4& Viewport() const { return m_viewport; }

    void SetEnvironmentSettings(const EnvironmentSettings& settings) { m_environment = settings; }
    [[nodiscard]] const EnvironmentSettings& GetEnvironmentSettings() const { return m_environment; }
    void SetQuality(const RenderQuality& quality) { m_quality = quality; }
    [[nodiscard]] const RenderQuality& Quality() const { return m_quality; }
    void SetCameraWorldPosition(const glm::vec3& position) { m_cameraWorldPosition = position; }

    void BeginFrame(const glm::vec3& clearColor);
    void EndFrame(const glm::mat4& viewProjection);

    void DrawLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color);
    void DrawBox(const glm::vec3& center, const glm::vec3& halfExtents, const glm::vec3& color, const MaterialParams& material = {});
    void DrawOrientedBox(
        const glm::vec3& center,
        const glm::vec3& halfExtents,
        const glm::quat& rotation,
        const glm::vec3& color,
        const MaterialParams& material = {}
    );
    void DrawCapsule(const glm::vec3& center, float height, float radius, const glm::vec3& color, const MaterialParams& material = {});
    /// Stem plus cap, unit height before scale.
    void DrawMushroom(const glm::vec3& position, const glm::quat& rotation, float scale, const glm::vec3& color);
    /// Flat dark disc on the ground. Skipped when shadows are off.
    void DrawBlobShadow(const glm::vec3& groundPoint, float radius);

    /// Objects beyond fog end are culled while occlusion is enabled.
    [[nodiscard]] bool IsCulled(const glm::vec3& center, float radius) const;
    [[nodiscard]] int BlobShadowSegments() const;

    [[nodiscard]] std::uint32_t DrawCallsLastFrame() const { return m_drawCallsLastFrame; }
    [[nodiscard]] std::uint32_t CulledLastFrame() const { return m_culledLastFrame; }

    /// Reads the current viewport from the back buffer and writes it as PNG.
    [[nodiscard]] bool CaptureScreenshot(const std::string& path, std::string* outError = nullptr) const;

    /// Compiles and links a GLSL 330 program. Returns 0 and logs on failure.
    static unsigned int CreateProgram(const char* vertexSource, const char* fragmentSource);

private:
    struct LineVertex
    {
        glm::vec3 position{0.0F};
        glm::vec3 color{1.0F};
    };

    struct SolidVertex
    {
        glm::vec3 position{0.0F};
        glm::vec3 normal{0.0F, 1.0F, 0.0F};
        glm::vec3 color{1.0F};
        // specular, checker, unused, unlit
        glm::vec4 material{0.3F, 0.0F, 0.0F, 0.0F};
    };

    // Contiguous vertex range of one drawable, drawn separately without instancing.
    struct ObjectRange
    {
        std::size_t firstVertex = 0;
        std::size_t vertexCount = 0;
    };

    static unsigned int CompileShader(unsigned int type, const char* source);
    [[nodiscard]] static glm::vec4 PackMaterial(const MaterialParams& material);

    void BeginObject();
    void EndObject();
    void AddSolidBox(const glm::vec3& center, const glm::vec3& halfExtents, const glm::quat& rotation, const glm::vec3& color, const glm::vec4& material);
    void AddSolidCylinder(const glm::vec3& base, float height, float radiusBottom, float radiusTop, int segments, const glm::vec3& color, const glm::vec4& material);
    void AddSolidCapsule(const glm::vec3& center, float height, float radius, int segments, int hemiRings, const glm::vec3& color, const glm::vec4& material);

    EnvironmentSettings m_environment{};
    RenderQuality m_quality{};
    glm::vec3 m_cameraWorldPosition{0.0F};
    glm::ivec4 m_viewport{0, 0, 1, 1};

    unsigned int m_lineProgram = 0;
    unsigned int m_solidProgram = 0;
    unsigned int m_lineVao = 0;
    unsigned int m_lineVbo = 0;
    unsigned int m_solidVao = 0;
    unsigned int m_solidVbo = 0;
    std::size_t m_lineVboCapacityBytes = 0;
    std::size_t m_solidVboCapacityBytes = 0;

    int m_lineViewProjLocation = -1;
    int m_solidViewProjLocation = -1;
    int m_solidCameraPosLocation = -1;
    int m_solidLightDirLocation = -1;
    int m_solidLightColorLocation = -1;
    int m_solidLightIntensityLocation = -1;
    int m_solidAmbientLocation = -1;
    int m_solidFogColorLocation = -1;
    int m_solidFogStartLocation = -1;
    int m_solidFogEndLocation = -1;
    int m_solidSpecularEnabledLocation = -1;
    int m_solidMaterialQualityLocation = -1;
    int m_solidCheckerScaleLocation = -1;

    std::vector<LineVertex> m_lineVertices;
    std::vector<SolidVertex> m_solidVertices;
    std::vector<ObjectRange> m_objects;
    std::size_t m_objectStart = 0;

    std::uint32_t m_drawCallsLastFrame = 0;
    std::uint32_t m_culledThisFrame = 0;
    std::uint32_t m_culledLastFrame = 0;
};
} // namespace engine::render
