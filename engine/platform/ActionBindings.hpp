#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace engine::platform
{
class Input;

enum class InputAction : std::size_t
{
    MoveForward = 0,
    MoveBack,
    MoveLeft,
    MoveRight,
    Jump,
    ToggleFirstPerson,
    ToggleGyroscope,
    SaveScene,
    LoadScene,
    ToggleConsole,
    ToggleDebugHud,
    Exit,
    CycleTextureQuality,
    CycleMaterialQuality,
    ToggleSpecular,
    ToggleShadows,
    CycleShadowMapSize,
    CycleShadowQuality,
    ToggleOcclusion,
    ToggleInstancing,
    Screenshot,
    Count
};

struct ActionBinding
{
    int primary = -1;
    int secondary = -1;
};

class ActionBindings
{
public:
    static constexpr int kUnbound = -1;
    static constexpr int kMouseOffset = 10000;

    ActionBindings();

    void ResetDefaults();

    [[nodiscard]] const ActionBinding& Get(InputAction action) const;
    void Set(InputAction action, const ActionBinding& binding);
    void SetCode(InputAction action, int slot, int code);
    [[nodiscard]] int GetCode(InputAction action, int slot) const;

    [[nodiscard]] bool IsDown(const Input& input, InputAction action) const;
    [[nodiscard]] bool IsPressed(const Input& input, InputAction action) const;
    [[nodiscard]] bool IsReleased(const Input& input, InputAction action) const;

    [[nodiscard]] std::optional<std::pair<InputAction, int>> FindConflict(int code, InputAction ignoredAction, int ignoredSlot) const;

    /// Reads the "bindings" object of a controls document. Codes may be
    /// integers or key labels ("W", "F5", "MouseLeft").
    [[nodiscard]] bool LoadFromJsonFile(const std::string& path, std::string* outError = nullptr);
    [[nodiscard]] bool SaveToJsonFile(const std::string& path, std::string* outError = nullptr) const;

    [[nodiscard]] static std::vector<InputAction> AllActions();
    [[nodiscard]] static const char* ActionName(InputAction action);
    [[nodiscard]] static const char* ActionLabel(InputAction action);
    [[nodiscard]] static std::optional<InputAction> ActionFromName(const std::string& name);
    [[nodiscard]] static bool IsRebindable(InputAction action);
    [[nodiscard]] static std::string CodeToLabel(int code);
    [[nodiscard]] static std::optional<int> LabelToCode(const std::string& label);

    [[nodiscard]] static int EncodeMouseButton(int button) { return kMouseOffset + button; }
    [[nodiscard]] static bool IsMouseCode(int code) { return code >= kMouseOffset; }
    [[nodiscard]] static int DecodeMouseButton(int code) { return code - kMouseOffset; }

private:
    enum class Edge
    {
        Held,
        Pressed,
        Released
    };

    [[nodiscard]] static bool Matches(const Input& input, int code, Edge edge);

    std::array<ActionBinding, static_cast<std::size_t>(InputAction::Count)> m_bindings{};
};
} // namespace engine::platform
