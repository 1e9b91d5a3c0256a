#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace engine::platform
{
class Input;
class Window;
}

namespace engine::ui
{
class UiSystem;
}

namespace ui
{
/// Hooks into the running demo. Unset callbacks make their command report
/// that it is unavailable.
struct ConsoleContext
{
    std::function<bool(std::string*)> saveScene;
    std::function<bool(std::string*)> loadScene;
    std::function<void(bool)> setFirstPerson;
    std::function<bool()> firstPerson;
    // Returns false when touch input is disabled.
    std::function<bool(bool)> setGyroscope;
    std::function<void(float)> setCameraDistance;
    std::function<float()> cameraDistance;
    std::function<std::string()> qualityDump;
    std::function<bool(std::string*, std::string*)> takeScreenshot;
    std::function<void(std::uint32_t)> setSeed;
    std::function<void()> restart;
    std::function<void()> quit;
};

/// Command registry and log. Has no UI of its own, the console window and
/// tests drive it through Execute().
class ConsoleCommands
{
public:
    struct CommandInfo
    {
        std::string usage;
        std::string description;
        std::string category;
    };

    using CommandHandler = std::function<void(const std::vector<std::string>&, const ConsoleContext&)>;

    ConsoleCommands();
    ConsoleCommands(const ConsoleCommands&) = delete;
    ConsoleCommands& operator=(const ConsoleCommands&) = delete;

    void RegisterCommand(const std::string& usage, const std::string& description, const std::string& category, CommandHandler handler);
    void Execute(const std::string& commandLine, const ConsoleContext& context);

    void AddLog(const std::string& text);
    void ClearLog() { m_items.clear(); }
    void PrintHelp();

    [[nodiscard]] bool HasCommand(const std::string& name) const;
    [[nodiscard]] std::vector<CommandInfo> BuildHints(const std::string& inputText) const;
    /// Completes the first word of |inputText| when exactly one command matches.
    [[nodiscard]] std::string Complete(const std::string& inputText);

    /// Steps through history; -1 goes back, +1 forward. Empty past the newest entry.
    [[nodiscard]] std::string HistoryStep(int direction);

    [[nodiscard]] const std::vector<std::string>& Items() const { return m_items; }
    [[nodiscard]] const std::vector<std::string>& History() const { return m_history; }
    [[nodiscard]] bool ConsumeScrollToBottom();

    static std::vector<std::string> Tokenize(const std::string& text);
    static bool ParseBoolToken(const std::string& token, bool& outValue);

private:
    void RegisterDefaultCommands();

    std::vector<std::string> m_items;
    std::vector<std::string> m_history;
    int m_historyPos = -1;
    bool m_scrollToBottom = false;

    std::unordered_map<std::string, CommandHandler> m_commandRegistry;
    std::vector<CommandInfo> m_commandInfos;
};

class DeveloperConsole
{
public:
    bool Initialize(engine::platform::Window& window);
    void Shutdown();

    void BeginFrame();
    /// ImGui window when built with it, otherwise a panel drawn with |ui|.
    void Render(const ConsoleContext& context, engine::ui::UiSystem& ui, const engine::platform::Input& input);

    void Toggle();
    [[nodiscard]] bool IsOpen() const { return m_open; }
    [[nodiscard]] bool WantsKeyboardCapture() const;

    [[nodiscard]] ConsoleCommands& Commands() { return m_commands; }
    [[nodiscard]] const ConsoleCommands& Commands() const { return m_commands; }

private:
    void RenderFallback(const ConsoleContext& context, engine::ui::UiSystem& ui, const engine::platform::Input& input);

    ConsoleCommands m_commands;
    bool m_open = false;
    bool m_firstOpenAnnouncementDone = false;
    bool m_reclaimFocus = false;
    std::string m_fallbackInput;

#if CHARSURF_WITH_IMGUI
    struct Impl;
    Impl* m_impl = nullptr;
#endif
};
} // namespace ui
