#include "engine/platform/Window.hpp"

#include <iostream>

#include <GLFW/glfw3.h>

namespace engine::platform
{
Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const WindowSettings& settings)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "Failed to initialize GLFW.\n";
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_SAMPLES, 4);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    int width = settings.width;
    int height = settings.height;
    GLFWmonitor* monitor = nullptr;
    if (settings.fullscreen)
    {
        monitor = glfwGetPrimaryMonitor();
        const GLFWvidmode* mode = monitor != nullptr ? glfwGetVideoMode(monitor) : nullptr;
        if (mode != nullptr)
        {
            width = mode->width;
            height = mode->height;
        }
        else
        {
            std::cerr << "Warning: no primary monitor mode, opening windowed.\n";
            monitor = nullptr;
        }
    }

    m_window = glfwCreateWindow(width, height, settings.title.c_str(), monitor, nullptr);
    if (m_window == nullptr)
    {
        std::cerr << "Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSwapInterval(settings.vsync ? 1 : 0);

    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, OnFramebufferSize);
    glfwSetWindowSizeCallback(m_window, OnWindowSize);
    glfwSetCharCallback(m_window, OnText);
    glfwSetScrollCallback(m_window, OnScroll);
    glfwGetWindowSize(m_window, &m_windowWidth, &m_windowHeight);
    glfwGetFramebufferSize(m_window, &m_fbWidth, &m_fbHeight);
    return true;
}

void Window::Shutdown()
{
    if (m_window == nullptr)
    {
        return;
    }
    glfwDestroyWindow(m_window);
    m_window = nullptr;
    glfwTerminate();
}

void Window::PollEvents() const
{
    glfwPollEvents();
}

void Window::SwapBuffers() const
{
    if (m_window != nullptr)
    {
        glfwSwapBuffers(m_window);
    }
}

bool Window::ShouldClose() const
{
    return m_window == nullptr || glfwWindowShouldClose(m_window) == GLFW_TRUE;
}

double Window::TimeSeconds() const
{
    return glfwGetTime();
}

Window* Window::FromHandle(GLFWwindow* window)
{
    return static_cast<Window*>(glfwGetWindowUserPointer(window));
}

void Window::OnFramebufferSize(GLFWwindow* window, int width, int height)
{
    if (Window* self = FromHandle(window))
    {
        self->m_fbWidth = width;
        self->m_fbHeight = height;
    }
}

void Window::OnWindowSize(GLFWwindow* window, int width, int height)
{
    if (Window* self = FromHandle(window))
    {
        self->m_windowWidth = width;
        self->m_windowHeight = height;
    }
}

void Window::OnText(GLFWwindow* window, unsigned int codepoint)
{
    Window* self = FromHandle(window);
    if (self != nullptr && self->m_events.text)
    {
        self->m_events.text(codepoint);
    }
}

void Window::OnScroll(GLFWwindow* window, double /*xOffset*/, double yOffset)
{
    Window* self = FromHandle(window);
    if (self != nullptr && self->m_events.scroll)
    {
        self->m_events.scroll(static_cast<float>(yOffset));
    }
}
} // namespace engine::platform
