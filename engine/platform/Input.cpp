#include "engine/platform/Input.hpp"

#include <GLFW/glfw3.h>

namespace engine::platform
{
namespace
{
void AppendUtf8(std::string& out, unsigned int codepoint)
{
    if (codepoint < 0x80U)
    {
        out.push_back(static_cast<char>(codepoint));
    }
    else if (codepoint < 0x800U)
    {
        out.push_back(static_cast<char>(0xC0U | (codepoint >> 6U)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    }
    else if (codepoint < 0x10000U)
    {
        out.push_back(static_cast<char>(0xE0U | (codepoint >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0U | (codepoint >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
    }
}
} // namespace

void Input::BeginSnapshot()
{
    m_previousKeys = m_currentKeys;
    m_previousMouse = m_currentMouse;
    m_mouseDelta = glm::vec2{0.0F};
    m_scrollDelta = m_pendingScroll;
    m_pendingScroll = 0.0F;
    m_textInput.swap(m_pendingText);
    m_pendingText.clear();
    for (TouchState& touch : m_touches)
    {
        touch.lastPosition = touch.position;
        touch.delta = glm::vec2{0.0F};
        touch.overUiElement = false;
    }
}

void Input::Update(GLFWwindow* window)
{
    BeginSnapshot();

    for (int key = GLFW_KEY_SPACE; key < kMaxKeys; ++key)
    {
        m_currentKeys[static_cast<size_t>(key)] = static_cast<unsigned char>(glfwGetKey(window, key) == GLFW_PRESS);
    }

    for (int button = 0; button < kMaxMouseButtons; ++button)
    {
        m_currentMouse[static_cast<size_t>(button)] = static_cast<unsigned char>(glfwGetMouseButton(window, button) == GLFW_PRESS);
    }

    double mouseX = 0.0;
    double mouseY = 0.0;
    glfwGetCursorPos(window, &mouseX, &mouseY);

    const glm::vec2 newPosition{static_cast<float>(mouseX), static_cast<float>(mouseY)};
    if (m_firstMouseSample)
    {
        m_mousePosition = newPosition;
        m_firstMouseSample = false;
    }
    else
    {
        m_mouseDelta = newPosition - m_mousePosition;
        m_mousePosition = newPosition;
    }

    SampleJoysticks();
    if (m_touchEmulation)
    {
        EmulateTouchFromMouse();
    }
}

void Input::SampleJoysticks()
{
    for (std::size_t index = 0; index < kMaxJoysticks; ++index)
    {
        JoystickState& state = m_joysticks[index];
        const int jid = GLFW_JOYSTICK_1 + static_cast<int>(index);
        state.connected = glfwJoystickPresent(jid) == GLFW_TRUE;
        state.axes.clear();
        state.buttons.clear();
        if (!state.connected)
        {
            continue;
        }

        int axisCount = 0;
        const float* axes = glfwGetJoystickAxes(jid, &axisCount);
        if (axes != nullptr)
        {
            state.axes.assign(axes, axes + axisCount);
        }
        int buttonCount = 0;
        const unsigned char* buttons = glfwGetJoystickButtons(jid, &buttonCount);
        if (buttons != nullptr)
        {
            state.buttons.assign(buttons, buttons + buttonCount);
        }
    }
}

void Input::EmulateTouchFromMouse()
{
    if (!IsMouseDown(GLFW_MOUSE_BUTTON_LEFT))
    {
        m_touches.clear();
        return;
    }

    if (m_touches.empty() || IsMousePressed(GLFW_MOUSE_BUTTON_LEFT))
    {
        m_touches.assign(1, TouchState{});
        m_touches[0].position = m_mousePosition;
        m_touches[0].lastPosition = m_mousePosition;
        return;
    }

    TouchState& touch = m_touches[0];
    touch.position = m_mousePosition;
    touch.delta = touch.position - touch.lastPosition;
}

bool Input::IsKeyDown(int key) const
{
    if (key < 0 || key >= kMaxKeys)
    {
        return false;
    }
    return m_currentKeys[static_cast<size_t>(key)] != 0;
}

bool Input::IsKeyPressed(int key) const
{
    if (key < 0 || key >= kMaxKeys)
    {
        return false;
    }
    const size_t index = static_cast<size_t>(key);
    return m_currentKeys[index] != 0 && m_previousKeys[index] == 0;
}

bool Input::IsKeyReleased(int key) const
{
    if (key < 0 || key >= kMaxKeys)
    {
        return false;
    }
    const size_t index = static_cast<size_t>(key);
    return m_currentKeys[index] == 0 && m_previousKeys[index] != 0;
}

bool Input::IsMouseDown(int button) const
{
    if (button < 0 || button >= kMaxMouseButtons)
    {
        return false;
    }
    return m_currentMouse[static_cast<size_t>(button)] != 0;
}

bool Input::IsMousePressed(int button) const
{
    if (button < 0 || button >= kMaxMouseButtons)
    {
        return false;
    }
    const size_t index = static_cast<size_t>(button);
    return m_currentMouse[index] != 0 && m_previousMouse[index] == 0;
}

bool Input::IsMouseReleased(int button) const
{
    if (button < 0 || button >= kMaxMouseButtons)
    {
        return false;
    }
    const size_t index = static_cast<size_t>(button);
    return m_currentMouse[index] == 0 && m_previousMouse[index] != 0;
}

void Input::MarkTouchOverUi(std::size_t index, bool overUi)
{
    if (index < m_touches.size())
    {
        m_touches[index].overUiElement = m_touches[index].overUiElement || overUi;
    }
}

std::size_t Input::NumJoysticks() const
{
    std::size_t count = 0;
    for (const JoystickState& state : m_joysticks)
    {
        if (state.connected)
        {
            ++count;
        }
    }
    return count;
}

const JoystickState* Input::Joystick(std::size_t index) const
{
    if (index >= kMaxJoysticks || !m_joysticks[index].connected)
    {
        return nullptr;
    }
    return &m_joysticks[index];
}

void Input::SetTouchEmulation(bool enabled)
{
    m_touchEmulation = enabled;
    if (!enabled)
    {
        m_touches.clear();
    }
}

void Input::PushTextInput(unsigned int codepoint)
{
    AppendUtf8(m_pendingText, codepoint);
}

void Input::SetKey(int key, bool down)
{
    if (key >= 0 && key < kMaxKeys)
    {
        m_currentKeys[static_cast<size_t>(key)] = static_cast<unsigned char>(down);
    }
}

void Input::SetMouseButton(int button, bool down)
{
    if (button >= 0 && button < kMaxMouseButtons)
    {
        m_currentMouse[static_cast<size_t>(button)] = static_cast<unsigned char>(down);
    }
}

void Input::SetMouseDelta(const glm::vec2& delta)
{
    m_mouseDelta = delta;
    m_mousePosition += delta;
}

void Input::SetMousePosition(const glm::vec2& position)
{
    m_mousePosition = position;
}

void Input::SetTouches(std::vector<TouchState> touches)
{
    m_touches = std::move(touches);
}

void Input::SetJoystick(std::size_t index, JoystickState state)
{
    if (index < kMaxJoysticks)
    {
        m_joysticks[index] = std::move(state);
    }
}
} // namespace engine::platform
