#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

struct GLFWwindow;

namespace engine::platform
{
struct TouchState
{
    int id = 0;
    glm::vec2 position{0.0F, 0.0F};
    glm::vec2 lastPosition{0.0F, 0.0F};
    glm::vec2 delta{0.0F, 0.0F};
    // Set by whichever UI layer claims the touch this frame.
    bool overUiElement = false;
};

struct JoystickState
{
    bool connected = false;
    std::vector<float> axes;
    std::vector<unsigned char> buttons;

    [[nodiscard]] float AxisPosition(std::size_t axis) const { return axis < axes.size() ? axes[axis] : 0.0F; }
};

class Input
{
public:
    void Update(GLFWwindow* window);

    /// Rolls current state into previous and clears per-frame deltas. Update()
    /// calls it; headless callers use it with the Set* hooks below.
    void BeginSnapshot();

    [[nodiscard]] bool IsKeyDown(int key) const;
    [[nodiscard]] bool IsKeyPressed(int key) const;
    [[nodiscard]] bool IsKeyReleased(int key) const;
    [[nodiscard]] bool IsMouseDown(int button) const;
    [[nodiscard]] bool IsMousePressed(int button) const;
    [[nodiscard]] bool IsMouseReleased(int button) const;

    [[nodiscard]] glm::vec2 MousePosition() const { return m_mousePosition; }
    [[nodiscard]] glm::vec2 MouseDelta() const { return m_mouseDelta; }
    [[nodiscard]] float ScrollDelta() const { return m_scrollDelta; }

    [[nodiscard]] std::size_t NumTouches() const { return m_touches.size(); }
    [[nodiscard]] const TouchState& Touch(std::size_t index) const { return m_touches[index]; }
    [[nodiscard]] const std::vector<TouchState>& Touches() const { return m_touches; }
    void MarkTouchOverUi(std::size_t index, bool overUi);

    [[nodiscard]] std::size_t NumJoysticks() const;
    [[nodiscard]] const JoystickState* Joystick(std::size_t index) const;

    void SetTouchEmulation(bool enabled);
    [[nodiscard]] bool TouchEmulation() const { return m_touchEmulation; }

    void PushTextInput(unsigned int codepoint);
    void PushScroll(float delta) { m_pendingScroll += delta; }
    [[nodiscard]] const std::string& TextInput() const { return m_textInput; }

    void SetKey(int key, bool down);
    void SetMouseButton(int button, bool down);
    void SetMouseDelta(const glm::vec2& delta);
    void SetMousePosition(const glm::vec2& position);
    void SetTouches(std::vector<TouchState> touches);
    void SetJoystick(std::size_t index, JoystickState state);

private:
    void SampleJoysticks();
    void EmulateTouchFromMouse();

    static constexpr int kMaxKeys = 512;
    static constexpr int kMaxMouseButtons = 8;
    static constexpr std::size_t kMaxJoysticks = 4;

    std::array<unsigned char, kMaxKeys> m_currentKeys{};
    std::array<unsigned char, kMaxKeys> m_previousKeys{};

    std::array<unsigned char, kMaxMouseButtons> m_currentMouse{};
    std::array<unsigned char, kMaxMouseButtons> m_previousMouse{};

    std::array<JoystickState, kMaxJoysticks> m_joysticks{};
    std::vector<TouchState> m_touches;

    glm::vec2 m_mousePosition{0.0F, 0.0F};
    glm::vec2 m_mouseDelta{0.0F, 0.0F};
    float m_scrollDelta = 0.0F;
    float m_pendingScroll = 0.0F;
    std::string m_textInput;
    std::string m_pendingText;
    bool m_firstMouseSample = true;
    bool m_touchEmulation = false;
};
} // namespace engine::platform
