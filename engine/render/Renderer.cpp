#include "engine/render/Renderer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>

#include <glad/glad.h>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/type_ptr.hpp>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "engine/core/Profiler.hpp"

namespace engine::render
{
namespace
{
constexpr float kTwoPi = 6.2831853F;
constexpr float kHalfPi = 1.5707963F;

constexpr const char* kLineVertexShader = R"(
#version 330 core
layout (location = 0) in vec3 aPosition;
layout (location = 1) in vec3 aColor;

uniform mat4 uViewProjection;

out vec3 vColor;

void main()
{
    vColor = aColor;
    gl_Position = uViewProjection * vec4(aPosition, 1.0);
}
)";

constexpr const char* kLineFragmentShader = R"(
#version 330 core
in vec3 vColor;
out vec4 FragColor;

void main()
{
    FragColor = vec4(vColor, 1.0);
}
)";

constexpr const char* kSolidVertexShader = R"(
#version 330 core
layout (location = 0) in vec3 aPosition;
layout (location = 1) in vec3 aNormal;
layout (location = 2) in vec3 aColor;
layout (location = 3) in vec4 aMaterial;

uniform mat4 uViewProjection;

out vec3 vNormal;
out vec3 vColor;
out vec3 vWorldPos;
out vec4 vMaterial;

void main()
{
    vWorldPos = aPosition;
    vNormal = aNormal;
    vColor = aColor;
    vMaterial = aMaterial;
    gl_Position = uViewProjection * vec4(aPosition, 1.0);
}
)";

constexpr const char* kSolidFragmentShader = R"(
#version 330 core
in vec3 vNormal;
in vec3 vColor;
in vec3 vWorldPos;
in vec4 vMaterial;
out vec4 FragColor;

uniform vec3 uCameraPos;
uniform vec3 uLightDir;
uniform vec3 uLightColor;
uniform float uLightIntensity;
uniform vec3 uAmbient;
uniform vec3 uFogColor;
uniform float uFogStart;
uniform float uFogEnd;
uniform int uSpecularEnabled;
uniform int uMaterialQuality;
uniform float uCheckerScale;

void main()
{
    vec3 baseColor = max(vColor, vec3(0.0));
    if (vMaterial.y > 0.5 && uCheckerScale > 0.0)
    {
        vec2 cell = floor(vWorldPos.xz * uCheckerScale);
        float parity = mod(cell.x + cell.y, 2.0);
        baseColor *= mix(0.82, 1.0, parity);
    }

    vec3 color = baseColor;
    if (vMaterial.w < 0.5 && uMaterialQuality > 0)
    {
        vec3 n = normalize(vNormal);
        vec3 toLight = normalize(-uLightDir);
        float lambert = max(dot(n, toLight), 0.0);
        color = baseColor * (uAmbient + uLightColor * lambert * uLightIntensity);

        if (uSpecularEnabled != 0 && uMaterialQuality > 1)
        {
            vec3 viewDir = normalize(uCameraPos - vWorldPos);
            vec3 halfVec = normalize(toLight + viewDir);
            float spec = pow(max(dot(n, halfVec), 0.0), 32.0);
            color += uLightColor * spec * vMaterial.x * uLightIntensity;
        }
    }

    float distance = length(uCameraPos - vWorldPos);
    float fog = clamp((distance - uFogStart) / max(uFogEnd - uFogStart, 0.001), 0.0, 1.0);
    color = mix(color, uFogColor, fog);
    FragColor = vec4(color, 1.0);
}
)";

void EnsureBufferCapacity(std::size_t* ioCapacityBytes, std::size_t requiredBytes)
{
    if (requiredBytes <= *ioCapacityBytes)
    {
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(*ioCapacityBytes), nullptr, GL_STREAM_DRAW);
        return;
    }

    std::size_t newCapacity = std::max<std::size_t>(*ioCapacityBytes, 1024U * 1024U);
    while (newCapacity < requiredBytes)
    {
        newCapacity *= 2U;
    }
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(newCapacity), nullptr, GL_STREAM_DRAW);
    *ioCapacityBytes = newCapacity;
}
} // namespace

bool Renderer::Initialize(int framebufferWidth, int framebufferHeight)
{
    glEnable(GL_DEPTH_TEST);
    glEnable(GL_MULTISAMPLE);

    m_lineVertices.reserve(4096);
    m_solidVertices.reserve(65536);
    m_objects.reserve(512);

    m_lineProgram = CreateProgram(kLineVertexShader, kLineFragmentShader);
    m_solidProgram = CreateProgram(kSolidVertexShader, kSolidFragmentShader);
    if (m_lineProgram == 0 || m_solidProgram == 0)
    {
        return false;
    }

    glGenVertexArrays(1, &m_lineVao);
    glGenBuffers(1, &m_lineVbo);

    glBindVertexArray(m_lineVao);
    glBindBuffer(GL_ARRAY_BUFFER, m_lineVbo);
    m_lineVboCapacityBytes = 1024U * 1024U;
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_lineVboCapacityBytes), nullptr, GL_STREAM_DRAW);

    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(LineVertex), reinterpret_cast<void*>(offsetof(LineVertex, position)));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(LineVertex), reinterpret_cast<void*>(offsetof(LineVertex, color)));
    glEnableVertexAttribArray(1);

    glGenVertexArrays(1, &m_solidVao);
    glGenBuffers(1, &m_solidVbo);

    glBindVertexArray(m_solidVao);
    glBindBuffer(GL_ARRAY_BUFFER, m_solidVbo);
    m_solidVboCapacityBytes = 4U * 1024U * 1024U;
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_solidVboCapacityBytes), nullptr, GL_STREAM_DRAW);

    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(SolidVertex), reinterpret_cast<void*>(offsetof(SolidVertex, position)));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(SolidVertex), reinterpret_cast<void*>(offsetof(SolidVertex, normal)));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(2, 3, GL_FLOAT, GL_FALSE, sizeof(SolidVertex), reinterpret_cast<void*>(offsetof(SolidVertex, color)));
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(3, 4, GL_FLOAT, GL_FALSE, sizeof(SolidVertex), reinterpret_cast<void*>(offsetof(SolidVertex, material)));
    glEnableVertexAttribArray(3);

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    m_lineViewProjLocation = glGetUniformLocation(m_lineProgram, "uViewProjection");
    m_solidViewProjLocation = glGetUniformLocation(m_solidProgram, "uViewProjection");
    m_solidCameraPosLocation = glGetUniformLocation(m_solidProgram, "uCameraPos");
    m_solidLightDirLocation = glGetUniformLocation(m_solidProgram, "uLightDir");
    m_solidLightColorLocation = glGetUniformLocation(m_solidProgram, "uLightColor");
    m_solidLightIntensityLocation = glGetUniformLocation(m_solidProgram, "uLightIntensity");
    m_solidAmbientLocation = glGetUniformLocation(m_solidProgram, "uAmbient");
    m_solidFogColorLocation = glGetUniformLocation(m_solidProgram, "uFogColor");
    m_solidFogStartLocation = glGetUniformLocation(m_solidProgram, "uFogStart");
    m_solidFogEndLocation = glGetUniformLocation(m_solidProgram, "uFogEnd");
    m_solidSpecularEnabledLocation = glGetUniformLocation(m_solidProgram, "uSpecularEnabled");
    m_solidMaterialQualityLocation = glGetUniformLocation(m_solidProgram, "uMaterialQuality");
    m_solidCheckerScaleLocation = glGetUniformLocation(m_solidProgram, "uCheckerScale");

    SetViewport(0, 0, framebufferWidth, framebufferHeight);
    return true;
}

void Renderer::Shutdown()
{
    if (m_lineVbo != 0)
    {
        glDeleteBuffers(1, &m_lineVbo);
        m_lineVbo = 0;
    }
    if (m_solidVbo != 0)
    {
        glDeleteBuffers(1, &m_solidVbo);
        m_solidVbo = 0;
    }
    if (m_lineVao != 0)
    {
        glDeleteVertexArrays(1, &m_lineVao);
        m_lineVao = 0;
    }
    if (m_solidVao != 0)
    {
        glDeleteVertexArrays(1, &m_solidVao);
        m_solidVao = 0;
    }
    if (m_lineProgram != 0)
    {
        glDeleteProgram(m_lineProgram);
        m_lineProgram = 0;
    }
    if (m_solidProgram != 0)
    {
        glDeleteProgram(m_solidProgram);
        m_solidProgram = 0;
    }
}

void Renderer::SetViewport(int x, int y, int width, int height)
{
    m_viewport = glm::ivec4{x, y, std::max(1, width), std::max(1, height)};
    glViewport(m_viewport.x, m_viewport.y, m_viewport.z, m_viewport.w);
}

void Renderer::BeginFrame(const glm::vec3& clearColor)
{
    m_lineVertices.clear();
    m_solidVertices.clear();
    m_objects.clear();
    m_objectStart = 0;
    m_culledThisFrame = 0;

    // Only the current viewport is cleared, the page around it keeps its pixels.
    glEnable(GL_SCISSOR_TEST);
    glScissor(m_viewport.x, m_viewport.y, m_viewport.z, m_viewport.w);
    glEnable(GL_DEPTH_TEST);
    glClearColor(clearColor.r, clearColor.g, clearColor.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    glDisable(GL_SCISSOR_TEST);
}

void Renderer::EndFrame(const glm::mat4& viewProjection)
{
    CHARSURF_PROFILE_SCOPE("Renderer::EndFrame");
    auto& profiler = engine::core::Profiler::Instance();
    std::uint32_t drawCalls = 0;

    if (!m_solidVertices.empty())
    {
        glUseProgram(m_solidProgram);
        glUniformMatrix4fv(m_solidViewProjLocation, 1, GL_FALSE, glm::value_ptr(viewProjection));
        glUniform3fv(m_solidCameraPosLocation, 1, glm::value_ptr(m_cameraWorldPosition));

        const glm::vec3 lightDir = glm::normalize(m_environment.directionalLightDirection);
        glUniform3fv(m_solidLightDirLocation, 1, glm::value_ptr(lightDir));
        glUniform3fv(m_solidLightColorLocation, 1, glm::value_ptr(m_environment.directionalLightColor));
        glUniform1f(m_solidLightIntensityLocation, m_environment.directionalLightIntensity);
        glUniform3fv(m_solidAmbientLocation, 1, glm::value_ptr(m_environment.ambientColor));
        glUniform3fv(m_solidFogColorLocation, 1, glm::value_ptr(m_environment.fogColor));
        glUniform1f(m_solidFogStartLocation, m_environment.fogStart);
        glUniform1f(m_solidFogEndLocation, m_environment.fogEnd);
        glUniform1i(m_solidSpecularEnabledLocation, m_quality.specularLighting ? 1 : 0);
        glUniform1i(m_solidMaterialQualityLocation, m_quality.materialQuality);

        // Texture quality picks checker detail: none, 4 m tiles, 1 m tiles.
        const float checkerScale = m_quality.textureQuality <= 0 ? 0.0F : (m_quality.textureQuality == 1 ? 0.25F : 1.0F);
        glUniform1f(m_solidCheckerScaleLocation, checkerScale);

        glBindVertexArray(m_solidVao);
        glBindBuffer(GL_ARRAY_BUFFER, m_solidVbo);
        const std::size_t solidBytes = m_solidVertices.size() * sizeof(SolidVertex);
        EnsureBufferCapacity(&m_solidVboCapacityBytes, solidBytes);
        glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(solidBytes), m_solidVertices.data());

        if (m_quality.dynamicInstancing || m_objects.empty())
        {
            glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(m_solidVertices.size()));
            profiler.RecordDrawCall(static_cast<std::uint32_t>(m_solidVertices.size() / 3));
            ++drawCalls;
        }
        else
        {
            for (const ObjectRange& object : m_objects)
            {
                glDrawArrays(GL_TRIANGLES, static_cast<GLint>(object.firstVertex), static_cast<GLsizei>(object.vertexCount));
                profiler.RecordDrawCall(static_cast<std::uint32_t>(object.vertexCount / 3));
                ++drawCalls;
            }
        }
    }

    if (!m_lineVertices.empty())
    {
        glUseProgram(m_lineProgram);
        glUniformMatrix4fv(m_lineViewProjLocation, 1, GL_FALSE, glm::value_ptr(viewProjection));
        glBindVertexArray(m_lineVao);
        glBindBuffer(GL_ARRAY_BUFFER, m_lineVbo);

        const std::size_t lineBytes = m_lineVertices.size() * sizeof(LineVertex);
        EnsureBufferCapacity(&m_lineVboCapacityBytes, lineBytes);
        glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(lineBytes), m_lineVertices.data());
        glDrawArrays(GL_LINES, 0, static_cast<GLsizei>(m_lineVertices.size()));
        profiler.RecordDrawCall(0);
        ++drawCalls;
    }

    glBindVertexArray(0);
    glUseProgram(0);

    m_drawCallsLastFrame = drawCalls;
    m_culledLastFrame = m_culledThisFrame;
}

void Renderer::DrawLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color)
{
    m_lineVertices.push_back(LineVertex{from, color});
    m_lineVertices.push_back(LineVertex{to, color});
}

void Renderer::DrawBox(const glm::vec3& center, const glm::vec3& halfExtents, const glm::vec3& color, const MaterialParams& material)
{
    DrawOrientedBox(center, halfExtents, glm::quat{1.0F, 0.0F, 0.0F, 0.0F}, color, material);
}

void Renderer::DrawOrientedBox(
    const glm::vec3& center,
    const glm::vec3& halfExtents,
    const glm::quat& rotation,
    const glm::vec3& color,
    const MaterialParams& material
)
{
    if (IsCulled(center, glm::length(halfExtents)))
    {
        ++m_culledThisFrame;
        return;
    }

    BeginObject();
    AddSolidBox(center, halfExtents, rotation, color, PackMaterial(material));
    EndObject();
}

void Renderer::DrawCapsule(const glm::vec3& center, float height, float radius, const glm::vec3& color, const MaterialParams& material)
{
    if (IsCulled(center, height * 0.5F))
    {
        ++m_culledThisFrame;
        return;
    }

    // Distance-based tessellation.
    const float distSq = glm::dot(center - m_cameraWorldPosition, center - m_cameraWorldPosition);
    int segments = 16;
    int hemiRings = 6;
    if (distSq > 900.0F)
    {
        segments = 6;
        hemiRings = 2;
    }
    else if (distSq > 225.0F)
    {
        segments = 10;
        hemiRings = 3;
    }

    BeginObject();
    AddSolidCapsule(center, height, radius, segments, hemiRings, color, PackMaterial(material));
    EndObject();
}

void Renderer::DrawMushroom(const glm::vec3& position, const glm::quat& rotation, float scale, const glm::vec3& color)
{
    if (IsCulled(position + glm::vec3{0.0F, scale * 0.5F, 0.0F}, scale))
    {
        ++m_culledThisFrame;
        return;
    }

    const glm::vec4 stemMaterial = PackMaterial(MaterialParams{0.1F, false, false});
    const glm::vec4 capMaterial = PackMaterial(MaterialParams{0.6F, false, false});
    const int segments = glm::dot(position - m_cameraWorldPosition, position - m_cameraWorldPosition) > 900.0F ? 8 : 14;

    BeginObject();
    const std::size_t first = m_solidVertices.size();
    AddSolidCylinder(glm::vec3{0.0F}, 0.55F * scale, 0.12F * scale, 0.1F * scale, segments, glm::vec3{0.92F, 0.88F, 0.78F}, stemMaterial);
    AddSolidCylinder(glm::vec3{0.0F, 0.5F * scale, 0.0F}, 0.35F * scale, 0.5F * scale, 0.05F * scale, segments, color, capMaterial);

    // Built around the origin, then moved into place.
    for (std::size_t i = first; i < m_solidVertices.size(); ++i)
    {
        SolidVertex& vertex = m_solidVertices[i];
        vertex.position = position + rotation * vertex.position;
        vertex.normal = rotation * vertex.normal;
    }
    EndObject();
}

void Renderer::DrawBlobShadow(const glm::vec3& groundPoint, float radius)
{
    if (!m_quality.drawShadows || IsCulled(groundPoint, radius))
    {
        return;
    }

    const int segments = BlobShadowSegments();
    const glm::vec3 shadowColor = m_environment.ambientColor * 0.6F;
    const glm::vec4 material = PackMaterial(MaterialParams{0.0F, false, true});
    const glm::vec3 up{0.0F, 1.0F, 0.0F};
    const glm::vec3 center = groundPoint + glm::vec3{0.0F, 0.01F, 0.0F};

    BeginObject();
    for (int i = 0; i < segments; ++i)
    {
        const float a0 = static_cast<float>(i) / static_cast<float>(segments) * kTwoPi;
        const float a1 = static_cast<float>(i + 1) / static_cast<float>(segments) * kTwoPi;
        const glm::vec3 p0 = center + glm::vec3{std::cos(a0) * radius, 0.0F, std::sin(a0) * radius};
        const glm::vec3 p1 = center + glm::vec3{std::cos(a1) * radius, 0.0F, std::sin(a1) * radius};
        m_solidVertices.push_back(SolidVertex{center, up, shadowColor, material});
        m_solidVertices.push_back(SolidVertex{p1, up, shadowColor, material});
        m_solidVertices.push_back(SolidVertex{p0, up, shadowColor, material});
    }
    EndObject();
}

bool Renderer::IsCulled(const glm::vec3& center, float radius) const
{
    if (!OcclusionEnabled(m_quality))
    {
        return false;
    }
    return glm::length(center - m_cameraWorldPosition) - radius > m_environment.fogEnd;
}

int Renderer::BlobShadowSegments() const
{
    // 512 -> 8, 1024 -> 16, 2048 -> 32, plus 4 per quality step.
    return std::max(6, m_quality.shadowMapSize / 64) + m_quality.shadowQuality * 4;
}

bool Renderer::CaptureScreenshot(const std::string& path, std::string* outError) const
{
    const int width = m_viewport.z;
    const int height = m_viewport.w;
    if (width <= 0 || height <= 0)
    {
        if (outError != nullptr)
        {
            *outError = "Invalid screenshot size.";
        }
        return false;
    }

    std::vector<unsigned char> pixels(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4U);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(m_viewport.x, m_viewport.y, width, height, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());

    // GL rows start at the bottom.
    stbi_flip_vertically_on_write(1);
    const int ok = stbi_write_png(path.c_str(), width, height, 4, pixels.data(), width * 4);
    stbi_flip_vertically_on_write(0);
    if (ok == 0)
    {
        if (outError != nullptr)
        {
            *outError = "Failed to write screenshot: " + path;
        }
        return false;
    }
    return true;
}

unsigned int Renderer::CompileShader(unsigned int type, const char* source)
{
    const unsigned int shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    int success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<size_t>(std::max(1, logLength)), '\0');
        glGetShaderInfoLog(shader, logLength, nullptr, log.data());
        std::cerr << "Shader compile error: " << log << "\n";
        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

unsigned int Renderer::CreateProgram(const char* vertexSource, const char* fragmentSource)
{
    const unsigned int vertexShader = CompileShader(GL_VERTEX_SHADER, vertexSource);
    const unsigned int fragmentShader = CompileShader(GL_FRAGMENT_SHADER, fragmentSource);
    if (vertexShader == 0 || fragmentShader == 0)
    {
        if (vertexShader != 0)
        {
            glDeleteShader(vertexShader);
        }
        if (fragmentShader != 0)
        {
            glDeleteShader(fragmentShader);
        }
        return 0;
    }

    const unsigned int program = glCreateProgram();
    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    int success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<size_t>(std::max(1, logLength)), '\0');
        glGetProgramInfoLog(program, logLength, nullptr, log.data());
        std::cerr << "Program link error: " << log << "\n";
        glDeleteProgram(program);
        return 0;
    }

    return program;
}

glm::vec4 Renderer::PackMaterial(const MaterialParams& material)
{
    return glm::vec4{
        glm::max(0.0F, material.specular),
        material.checker ? 1.0F : 0.0F,
        0.0F,
        material.unlit ? 1.0F : 0.0F,
    };
}

void Renderer::BeginObject()
{
    m_objectStart = m_solidVertices.size();
}

void Renderer::EndObject()
{
    if (m_solidVertices.size() > m_objectStart)
    {
        m_objects.push_back(ObjectRange{m_objectStart, m_solidVertices.size() - m_objectStart});
    }
    m_objectStart = m_solidVertices.size();
}

void Renderer::AddSolidBox(
    const glm::vec3& center,
    const glm::vec3& halfExtents,
    const glm::quat& rotation,
    const glm::vec3& color,
    const glm::vec4& material
)
{
    const auto corner = [&](float sx, float sy, float sz) {
        return center + rotation * glm::vec3{sx * halfExtents.x, sy * halfExtents.y, sz * halfExtents.z};
    };

    const std::array<glm::vec3, 8> c = {
        corner(-1.0F, -1.0F, -1.0F),
        corner(+1.0F, -1.0F, -1.0F),
        corner(+1.0F, -1.0F, +1.0F),
        corner(-1.0F, -1.0F, +1.0F),
        corner(-1.0F, +1.0F, -1.0F),
        corner(+1.0F, +1.0F, -1.0F),
        corner(+1.0F, +1.0F, +1.0F),
        corner(-1.0F, +1.0F, +1.0F),
    };

    auto& v = m_solidVertices;
    const auto face = [&](int a, int b, int d, int e, const glm::vec3& localNormal) {
        const glm::vec3 n = rotation * localNormal;
        v.push_back({c[a], n, color, material}); v.push_back({c[b], n, color, material}); v.push_back({c[d], n, color, material});
        v.push_back({c[a], n, color, material}); v.push_back({c[d], n, color, material}); v.push_back({c[e], n, color, material});
    };

    face(0, 1, 2, 3, glm::vec3{0.0F, -1.0F, 0.0F});
    face(4, 5, 6, 7, glm::vec3{0.0F, 1.0F, 0.0F});
    face(0, 1, 5, 4, glm::vec3{0.0F, 0.0F, -1.0F});
    face(3, 7, 6, 2, glm::vec3{0.0F, 0.0F, 1.0F});
    face(0, 4, 7, 3, glm::vec3{-1.0F, 0.0F, 0.0F});
    face(1, 2, 6, 5, glm::vec3{1.0F, 0.0F, 0.0F});
}

void Renderer::AddSolidCylinder(
    const glm::vec3& base,
    float height,
    float radiusBottom,
    float radiusTop,
    int segments,
    const glm::vec3& color,
    const glm::vec4& material
)
{
    auto& v = m_solidVertices;
    const glm::vec3 top = base + glm::vec3{0.0F, height, 0.0F};
    const float slope = (radiusBottom - radiusTop) / std::max(height, 0.001F);

    for (int i = 0; i < segments; ++i)
    {
        const float a0 = static_cast<float>(i) / static_cast<float>(segments) * kTwoPi;
        const float a1 = static_cast<float>(i + 1) / static_cast<float>(segments) * kTwoPi;
        const glm::vec3 d0{std::cos(a0), 0.0F, std::sin(a0)};
        const glm::vec3 d1{std::cos(a1), 0.0F, std::sin(a1)};
        const glm::vec3 n0 = glm::normalize(d0 + glm::vec3{0.0F, slope, 0.0F});
        const glm::vec3 n1 = glm::normalize(d1 + glm::vec3{0.0F, slope, 0.0F});

        const glm::vec3 b0 = base + d0 * radiusBottom;
        const glm::vec3 b1 = base + d1 * radiusBottom;
        const glm::vec3 t0 = top + d0 * radiusTop;
        const glm::vec3 t1 = top + d1 * radiusTop;

        v.push_back({b0, n0, color, material}); v.push_back({t0, n0, color, material}); v.push_back({t1, n1, color, material});
        v.push_back({b0, n0, color, material}); v.push_back({t1, n1, color, material}); v.push_back({b1, n1, color, material});

        const glm::vec3 up{0.0F, 1.0F, 0.0F};
        v.push_back({top, up, color, material}); v.push_back({t1, up, color, material}); v.push_back({t0, up, color, material});
        const glm::vec3 down{0.0F, -1.0F, 0.0F};
        v.push_back({base, down, color, material}); v.push_back({b0, down, color, material}); v.push_back({b1, down, color, material});
    }
}

void Renderer::AddSolidCapsule(
    const glm::vec3& center,
    float height,
    float radius,
    int segments,
    int hemiRings,
    const glm::vec3& color,
    const glm::vec4& material
)
{
    const float halfCylinder = std::max(0.0F, height * 0.5F - radius);
    const glm::vec3 topCenter = center + glm::vec3{0.0F, halfCylinder, 0.0F};
    const glm::vec3 bottomCenter = center - glm::vec3{0.0F, halfCylinder, 0.0F};

    auto& v = m_solidVertices;
    for (int i = 0; i < segments; ++i)
    {
        const float a0 = static_cast<float>(i) / static_cast<float>(segments) * kTwoPi;
        const float a1 = static_cast<float>(i + 1) / static_cast<float>(segments) * kTwoPi;
        const glm::vec3 n0{std::cos(a0), 0.0F, std::sin(a0)};
        const glm::vec3 n1{std::cos(a1), 0.0F, std::sin(a1)};

        const glm::vec3 b0 = bottomCenter + n0 * radius;
        const glm::vec3 b1 = bottomCenter + n1 * radius;
        const glm::vec3 t0 = topCenter + n0 * radius;
        const glm::vec3 t1 = topCenter + n1 * radius;

        v.push_back({b0, n0, color, material}); v.push_back({t0, n0, color, material}); v.push_back({t1, n1, color, material});
        v.push_back({b0, n0, color, material}); v.push_back({t1, n1, color, material}); v.push_back({b1, n1, color, material});
    }

    const auto addHemisphere = [&](const glm::vec3& hemiCenter, float ySign) {
        for (int ring = 0; ring < hemiRings; ++ring)
        {
            const float phi0 = static_cast<float>(ring) / static_cast<float>(hemiRings) * kHalfPi;
            const float phi1 = static_cast<float>(ring + 1) / static_cast<float>(hemiRings) * kHalfPi;

            for (int i = 0; i < segments; ++i)
            {
                const float a0 = static_cast<float>(i) / static_cast<float>(segments) * kTwoPi;
                const float a1 = static_cast<float>(i + 1) / static_cast<float>(segments) * kTwoPi;

                const auto normalAt = [ySign](float phi, float angle) {
                    return glm::vec3{std::cos(angle) * std::cos(phi), std::sin(phi) * ySign, std::sin(angle) * std::cos(phi)};
                };
                const glm::vec3 n00 = normalAt(phi0, a0);
                const glm::vec3 n01 = normalAt(phi0, a1);
                const glm::vec3 n10 = normalAt(phi1, a0);
                const glm::vec3 n11 = normalAt(phi1, a1);

                v.push_back({hemiCenter + n00 * radius, n00, color, material});
                v.push_back({hemiCenter + n10 * radius, n10, color, material});
                v.push_back({hemiCenter + n11 * radius, n11, color, material});
                v.push_back({hemiCenter + n00 * radius, n00, color, material});
                v.push_back({hemiCenter + n11 * radius, n11, color, material});
                v.push_back({hemiCenter + n01 * radius, n01, color, material});
            }
        }
    };

    addHemisphere(topCenter, 1.0F);
    addHemisphere(bottomCenter, -1.0F);
}
} // namespace engine::render
