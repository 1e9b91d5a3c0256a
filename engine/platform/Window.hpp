#pragma once

#include <functional>
#include <string>
#include <utility>

struct GLFWwindow;

namespace engine::platform
{
struct WindowSettings
{
    int width = 1280;
    int height = 720;
    bool fullscreen = false;
    bool vsync = true;
    int fpsLimit = 0;
    std::string title = "Character Surface Demo";
};

/// Event sinks for input GLFW only delivers through callbacks.
struct WindowEvents
{
    std::function<void(unsigned int)> text;
    std::function<void(float)> scroll;
};

/// Owns the GLFW window and its GL 3.3 core context. Window and framebuffer
/// sizes differ on high-DPI displays and are tracked separately.
class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Initialize(const WindowSettings& settings);
    void Shutdown();

    void SetEvents(WindowEvents events) { m_events = std::move(events); }

    void PollEvents() const;
    void SwapBuffers() const;
    [[nodiscard]] bool ShouldClose() const;
    [[nodiscard]] double TimeSeconds() const;

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }
    [[nodiscard]] int WindowWidth() const { return m_windowWidth; }
    [[nodiscard]] int WindowHeight() const { return m_windowHeight; }
    [[nodiscard]] int FramebufferWidth() const { return m_fbWidth; }
    [[nodiscard]] int FramebufferHeight() const { return m_fbHeight; }

private:
    static Window* FromHandle(GLFWwindow* window);
    static void OnFramebufferSize(GLFWwindow* window, int width, int height);
    static void OnWindowSize(GLFWwindow* window, int width, int height);
    static void OnText(GLFWwindow* window, unsigned int codepoint);
    static void OnScroll(GLFWwindow* window, double xOffset, double yOffset);

    GLFWwindow* m_window = nullptr;
    WindowEvents m_events;
    int m_windowWidth = 0;
    int m_windowHeight = 0;
    int m_fbWidth = 0;
    int m_fbHeight = 0;
};
} // namespace engine::platform
