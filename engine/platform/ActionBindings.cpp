#include "engine/platform/ActionBindings.hpp"

#include <filesystem>
#include <fstream>
#include <unordered_map>

#include <GLFW/glfw3.h>
#include <nlohmann/json.hpp>

#include "engine/platform/Input.hpp"

namespace engine::platform
{
namespace
{
using json = nlohmann::json;

struct ActionInfo
{
    InputAction action;
    const char* name;
    const char* label;
    int defaultPrimary;
    int defaultSecondary;
    bool rebindable;
};

// Order matches InputAction.
const std::array<ActionInfo, static_cast<std::size_t>(InputAction::Count)> kActions{{
    {InputAction::MoveForward, "MoveForward", "Move Forward", GLFW_KEY_W, GLFW_KEY_UP, true},
    {InputAction::MoveBack, "MoveBack", "Move Back", GLFW_KEY_S, GLFW_KEY_DOWN, true},
    {InputAction::MoveLeft, "MoveLeft", "Move Left", GLFW_KEY_A, GLFW_KEY_LEFT, true},
    {InputAction::MoveRight, "MoveRight", "Move Right", GLFW_KEY_D, GLFW_KEY_RIGHT, true},
    {InputAction::Jump, "Jump", "Jump", GLFW_KEY_SPACE, ActionBindings::kUnbound, true},
    {InputAction::ToggleFirstPerson, "ToggleFirstPerson", "1st/3rd Person", GLFW_KEY_F, ActionBindings::kUnbound, true},
    {InputAction::ToggleGyroscope, "ToggleGyroscope", "Gyroscope", GLFW_KEY_G, ActionBindings::kUnbound, true},
    {InputAction::SaveScene, "SaveScene", "Save Scene", GLFW_KEY_F5, ActionBindings::kUnbound, true},
    {InputAction::LoadScene, "LoadScene", "Load Scene", GLFW_KEY_F7, ActionBindings::kUnbound, true},
    {InputAction::ToggleConsole, "ToggleConsole", "Toggle Console", GLFW_KEY_F1, ActionBindings::kUnbound, true},
    {InputAction::ToggleDebugHud, "ToggleDebugHUD", "Toggle Debug HUD", GLFW_KEY_F2, ActionBindings::kUnbound, true},
    {InputAction::Exit, "Exit", "Exit", GLFW_KEY_ESCAPE, ActionBindings::kUnbound, false},
    {InputAction::CycleTextureQuality, "CycleTextureQuality", "Texture Quality", GLFW_KEY_1, GLFW_KEY_KP_1, true},
    {InputAction::CycleMaterialQuality, "CycleMaterialQuality", "Material Quality", GLFW_KEY_2, GLFW_KEY_KP_2, true},
    {InputAction::ToggleSpecular, "ToggleSpecular", "Specular Lighting", GLFW_KEY_3, GLFW_KEY_KP_3, true},
    {InputAction::ToggleShadows, "ToggleShadows", "Shadows", GLFW_KEY_4, GLFW_KEY_KP_4, true},
    {InputAction::CycleShadowMapSize, "CycleShadowMapSize", "Shadow Map Size", GLFW_KEY_5, GLFW_KEY_KP_5, true},
    {InputAction::CycleShadowQuality, "CycleShadowQuality", "Shadow Quality", GLFW_KEY_6, GLFW_KEY_KP_6, true},
    {InputAction::ToggleOcclusion, "ToggleOcclusion", "Occlusion Culling", GLFW_KEY_7, GLFW_KEY_KP_7, true},
    {InputAction::ToggleInstancing, "ToggleInstancing", "Instancing", GLFW_KEY_8, GLFW_KEY_KP_8, true},
    {InputAction::Screenshot, "Screenshot", "Screenshot", GLFW_KEY_9, GLFW_KEY_KP_9, true},
}};

const std::unordered_map<int, std::string> kCodeToText{
    {GLFW_KEY_W, "W"},
    {GLFW_KEY_A, "A"},
    {GLFW_KEY_S, "S"},
    {GLFW_KEY_D, "D"},
    {GLFW_KEY_F, "F"},
    {GLFW_KEY_G, "G"},
    {GLFW_KEY_SPACE, "Space"},
    {GLFW_KEY_UP, "Up"},
    {GLFW_KEY_DOWN, "Down"},
    {GLFW_KEY_LEFT, "Left"},
    {GLFW_KEY_RIGHT, "Right"},
    {GLFW_KEY_LEFT_SHIFT, "LShift"},
    {GLFW_KEY_LEFT_CONTROL, "LCtrl"},
    {GLFW_KEY_F1, "F1"},
    {GLFW_KEY_F2, "F2"},
    {GLFW_KEY_F5, "F5"},
    {GLFW_KEY_F7, "F7"},
    {GLFW_KEY_ESCAPE, "Esc"},
    {GLFW_KEY_1, "1"},
    {GLFW_KEY_2, "2"},
    {GLFW_KEY_3, "3"},
    {GLFW_KEY_4, "4"},
    {GLFW_KEY_5, "5"},
    {GLFW_KEY_6, "6"},
    {GLFW_KEY_7, "7"},
    {GLFW_KEY_8, "8"},
    {GLFW_KEY_9, "9"},
    {GLFW_KEY_KP_1, "Num1"},
    {GLFW_KEY_KP_2, "Num2"},
    {GLFW_KEY_KP_3, "Num3"},
    {GLFW_KEY_KP_4, "Num4"},
    {GLFW_KEY_KP_5, "Num5"},
    {GLFW_KEY_KP_6, "Num6"},
    {GLFW_KEY_KP_7, "Num7"},
    {GLFW_KEY_KP_8, "Num8"},
    {GLFW_KEY_KP_9, "Num9"},
    {ActionBindings::EncodeMouseButton(GLFW_MOUSE_BUTTON_LEFT), "MouseLeft"},
    {ActionBindings::EncodeMouseButton(GLFW_MOUSE_BUTTON_RIGHT), "MouseRight"},
    {ActionBindings::EncodeMouseButton(GLFW_MOUSE_BUTTON_MIDDLE), "MouseMiddle"},
};

const ActionInfo& Info(InputAction action)
{
    return kActions[static_cast<std::size_t>(action)];
}

std::optional<int> ReadCode(const json& node)
{
    if (node.is_number_integer())
    {
        return node.get<int>();
    }
    if (node.is_string())
    {
        return ActionBindings::LabelToCode(node.get<std::string>());
    }
    return std::nullopt;
}
} // namespace

ActionBindings::ActionBindings()
{
    ResetDefaults();
}

void ActionBindings::ResetDefaults()
{
    for (const ActionInfo& info : kActions)
    {
        m_bindings[static_cast<std::size_t>(info.action)] = ActionBinding{info.defaultPrimary, info.defaultSecondary};
    }
}

const ActionBinding& ActionBindings::Get(InputAction action) const
{
    return m_bindings[static_cast<std::size_t>(action)];
}

void ActionBindings::Set(InputAction action, const ActionBinding& binding)
{
    m_bindings[static_cast<std::size_t>(action)] = binding;
}

void ActionBindings::SetCode(InputAction action, int slot, int code)
{
    ActionBinding& binding = m_bindings[static_cast<std::size_t>(action)];
    (slot <= 0 ? binding.primary : binding.secondary) = code;
}

int ActionBindings::GetCode(InputAction action, int slot) const
{
    const ActionBinding& binding = m_bindings[static_cast<std::size_t>(action)];
    return slot <= 0 ? binding.primary : binding.secondary;
}

bool ActionBindings::Matches(const Input& input, int code, Edge edge)
{
    if (code == kUnbound)
    {
        return false;
    }

    if (IsMouseCode(code))
    {
        const int button = DecodeMouseButton(code);
        switch (edge)
        {
            case Edge::Pressed: return input.IsMousePressed(button);
            case Edge::Released: return input.IsMouseReleased(button);
            default: return input.IsMouseDown(button);
        }
    }

    switch (edge)
    {
        case Edge::Pressed: return input.IsKeyPressed(code);
        case Edge::Released: return input.IsKeyReleased(code);
        default: return input.IsKeyDown(code);
    }
}

bool ActionBindings::IsDown(const Input& input, InputAction action) const
{
    const ActionBinding& binding = Get(action);
    return Matches(input, binding.primary, Edge::Held) || Matches(input, binding.secondary, Edge::Held);
}

bool ActionBindings::IsPressed(const Input& input, InputAction action) const
{
    const ActionBinding& binding = Get(action);
    return Matches(input, binding.primary, Edge::Pressed) || Matches(input, binding.secondary, Edge::Pressed);
}

bool ActionBindings::IsReleased(const Input& input, InputAction action) const
{
    const ActionBinding& binding = Get(action);
    return Matches(input, binding.primary, Edge::Released) || Matches(input, binding.secondary, Edge::Released);
}

std::optional<std::pair<InputAction, int>> ActionBindings::FindConflict(int code, InputAction ignoredAction, int ignoredSlot) const
{
    if (code == kUnbound)
    {
        return std::nullopt;
    }

    for (const ActionInfo& info : kActions)
    {
        const ActionBinding& binding = Get(info.action);
        for (int slot = 0; slot < 2; ++slot)
        {
            if (info.action == ignoredAction && slot == ignoredSlot)
            {
                continue;
            }
            if ((slot == 0 ? binding.primary : binding.secondary) == code)
            {
                return std::pair<InputAction, int>{info.action, slot};
            }
        }
    }

    return std::nullopt;
}

bool ActionBindings::LoadFromJsonFile(const std::string& path, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot open controls file: " + path;
        }
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& ex)
    {
        if (outError != nullptr)
        {
            *outError = std::string{"Invalid controls JSON: "} + ex.what();
        }
        return false;
    }

    if (!root.contains("bindings") || !root["bindings"].is_object())
    {
        if (outError != nullptr)
        {
            *outError = "Missing controls.bindings object";
        }
        return false;
    }

    for (const auto& [name, node] : root["bindings"].items())
    {
        const std::optional<InputAction> action = ActionFromName(name);
        if (!action.has_value() || !IsRebindable(*action))
        {
            continue;
        }

        ActionBinding binding = Get(*action);
        if (node.is_array())
        {
            if (!node.empty())
            {
                binding.primary = ReadCode(node[0]).value_or(binding.primary);
            }
            if (node.size() > 1)
            {
                binding.secondary = ReadCode(node[1]).value_or(binding.secondary);
            }
        }
        else if (node.is_object())
        {
            if (node.contains("primary"))
            {
                binding.primary = ReadCode(node["primary"]).value_or(binding.primary);
            }
            if (node.contains("secondary"))
            {
                binding.secondary = ReadCode(node["secondary"]).value_or(binding.secondary);
            }
        }
        Set(*action, binding);
    }

    return true;
}

bool ActionBindings::SaveToJsonFile(const std::string& path, std::string* outError) const
{
    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    // Merge into an existing document so sensitivities written by the demo survive.
    json root = json::object();
    {
        std::ifstream existing(path);
        if (existing.is_open())
        {
            try
            {
                existing >> root;
            }
            catch (const std::exception&)
            {
                root = json::object();
            }
        }
    }

    root["asset_version"] = 1;
    json bindings = json::object();
    for (const ActionInfo& info : kActions)
    {
        const ActionBinding& binding = Get(info.action);
        bindings[info.name] = json::array({CodeToLabel(binding.primary), CodeToLabel(binding.secondary)});
    }
    root["bindings"] = std::move(bindings);

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        if (outError != nullptr)
        {
            *outError = "Cannot write controls file: " + path;
        }
        return false;
    }

    stream << root.dump(2) << "\n";
    return true;
}

std::vector<InputAction> ActionBindings::AllActions()
{
    std::vector<InputAction> actions;
    actions.reserve(kActions.size());
    for (const ActionInfo& info : kActions)
    {
        actions.push_back(info.action);
    }
    return actions;
}

const char* ActionBindings::ActionName(InputAction action)
{
    return action < InputAction::Count ? Info(action).name : "Unknown";
}

const char* ActionBindings::ActionLabel(InputAction action)
{
    return action < InputAction::Count ? Info(action).label : "Unknown";
}

std::optional<InputAction> ActionBindings::ActionFromName(const std::string& name)
{
    for (const ActionInfo& info : kActions)
    {
        if (name == info.name)
        {
            return info.action;
        }
    }
    return std::nullopt;
}

bool ActionBindings::IsRebindable(InputAction action)
{
    return action < InputAction::Count && Info(action).rebindable;
}

std::string ActionBindings::CodeToLabel(int code)
{
    if (code == kUnbound)
    {
        return "Unbound";
    }

    if (const auto it = kCodeToText.find(code); it != kCodeToText.end())
    {
        return it->second;
    }

    if (IsMouseCode(code))
    {
        return "Mouse" + std::to_string(DecodeMouseButton(code));
    }

    if (code >= GLFW_KEY_A && code <= GLFW_KEY_Z)
    {
        return std::string(1, static_cast<char>(code));
    }

    return "Key(" + std::to_string(code) + ")";
}

std::optional<int> ActionBindings::LabelToCode(const std::string& label)
{
    if (label == "Unbound")
    {
        return kUnbound;
    }

    for (const auto& [code, text] : kCodeToText)
    {
        if (text == label)
        {
            return code;
        }
    }

    if (label.size() == 1 && label[0] >= 'A' && label[0] <= 'Z')
    {
        return static_cast<int>(label[0]);
    }

    if (label.rfind("Mouse", 0) == 0 && label.size() > 5)
    {
        try
        {
            return EncodeMouseButton(std::stoi(label.substr(5)));
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }

    if (label.rfind("Key(", 0) == 0 && label.back() == ')')
    {
        try
        {
            return std::stoi(label.substr(4, label.size() - 5));
        }
        catch (const std::exception&)
        {
            return std::nullopt;
        }
    }

    return std::nullopt;
}
} // namespace engine::platform
