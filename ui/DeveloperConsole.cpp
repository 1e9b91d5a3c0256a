#include "ui/DeveloperConsole.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <GLFW/glfw3.h>
#include <glm/vec4.hpp>

#include "engine/platform/Input.hpp"
#include "engine/platform/Window.hpp"
#include "engine/ui/UiSystem.hpp"

#if CHARSURF_WITH_IMGUI
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#endif

namespace ui
{
namespace
{
struct ConsoleColors
{
    static constexpr glm::vec4 Command{0.0F, 0.75F, 1.0F, 1.0F};
    static constexpr glm::vec4 Error{1.0F, 0.3F, 0.3F, 1.0F};
    static constexpr glm::vec4 Category{0.6F, 0.9F, 0.95F, 1.0F};
    static constexpr glm::vec4 Default{0.9F, 0.9F, 0.9F, 1.0F};
};

bool ParseFloat(const std::string& token, float& outValue)
{
    try
    {
        std::size_t consumed = 0;
        outValue = std::stof(token, &consumed);
        return consumed == token.size();
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool ParseUnsigned(const std::string& token, std::uint32_t& outValue)
{
    try
    {
        std::size_t consumed = 0;
        const unsigned long value = std::stoul(token, &consumed);
        if (consumed != token.size() || token.front() == '-')
        {
            return false;
        }
        outValue = static_cast<std::uint32_t>(value);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

glm::vec4 ColorForLine(const std::string& line)
{
    if (line.rfind("# ", 0) == 0)
    {
        return ConsoleColors::Command;
    }
    if (line.rfind("Failed", 0) == 0 || line.rfind("Unknown", 0) == 0 || line.rfind("Usage", 0) == 0)
    {
        return ConsoleColors::Error;
    }
    if (line.rfind("[", 0) == 0)
    {
        return ConsoleColors::Category;
    }
    return ConsoleColors::Default;
}
} // namespace

ConsoleCommands::ConsoleCommands()
{
    RegisterDefaultCommands();
}

std::vector<std::string> ConsoleCommands::Tokenize(const std::string& text)
{
    std::istringstream stream(text);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

bool ConsoleCommands::ParseBoolToken(const std::string& token, bool& outValue)
{
    if (token == "on" || token == "true" || token == "1")
    {
        outValue = true;
        return true;
    }
    if (token == "off" || token == "false" || token == "0")
    {
        outValue = false;
        return true;
    }
    return false;
}

void ConsoleCommands::AddLog(const std::string& text)
{
    m_items.push_back(text);
    m_scrollToBottom = true;
}

bool ConsoleCommands::ConsumeScrollToBottom()
{
    const bool scroll = m_scrollToBottom;
    m_scrollToBottom = false;
    return scroll;
}

void ConsoleCommands::PrintHelp()
{
    AddLog("Available commands by category:");
    std::map<std::string, std::vector<CommandInfo>> grouped;
    for (const CommandInfo& info : m_commandInfos)
    {
        grouped[info.category].push_back(info);
    }

    for (auto& [category, commands] : grouped)
    {
        std::sort(commands.begin(), commands.end(), [](const CommandInfo& a, const CommandInfo& b) {
            return a.usage < b.usage;
        });
        AddLog("[" + category + "]");
        for (const CommandInfo& info : commands)
        {
            AddLog("  " + info.usage + " - " + info.description);
        }
    }
}

void ConsoleCommands::RegisterCommand(
    const std::string& usage,
    const std::string& description,
    const std::string& category,
    CommandHandler handler
)
{
    const std::vector<std::string> tokens = Tokenize(usage);
    if (tokens.empty())
    {
        return;
    }

    m_commandInfos.push_back(CommandInfo{usage, description, category});
    m_commandRegistry[tokens.front()] = std::move(handler);
}

bool ConsoleCommands::HasCommand(const std::string& name) const
{
    return m_commandRegistry.find(name) != m_commandRegistry.end();
}

std::vector<ConsoleCommands::CommandInfo> ConsoleCommands::BuildHints(const std::string& inputText) const
{
    std::vector<CommandInfo> hints;
    const std::vector<std::string> inputTokens = Tokenize(inputText);
    const std::string prefix = inputTokens.empty() ? std::string{} : inputTokens.front();

    for (const CommandInfo& info : m_commandInfos)
    {
        if (prefix.empty() || info.usage.rfind(prefix, 0) == 0)
        {
            hints.push_back(info);
        }
    }
    std::sort(hints.begin(), hints.end(), [](const CommandInfo& a, const CommandInfo& b) {
        if (a.category == b.category)
        {
            return a.usage < b.usage;
        }
        return a.category < b.category;
    });
    return hints;
}

std::string ConsoleCommands::Complete(const std::string& inputText)
{
    const std::vector<std::string> tokens = Tokenize(inputText);
    if (tokens.size() != 1)
    {
        return inputText;
    }

    std::vector<std::string> candidates;
    for (const CommandInfo& info : m_commandInfos)
    {
        const std::string name = Tokenize(info.usage).front();
        if (name.rfind(tokens.front(), 0) == 0)
        {
            candidates.push_back(name);
        }
    }

    if (candidates.size() == 1)
    {
        return candidates.front() + " ";
    }
    if (candidates.size() > 1)
    {
        AddLog("Possible matches:");
        for (const std::string& candidate : candidates)
        {
            AddLog("  " + candidate);
        }
    }
    return inputText;
}

std::string ConsoleCommands::HistoryStep(int direction)
{
    if (m_history.empty())
    {
        return {};
    }

    if (direction < 0)
    {
        if (m_historyPos == -1)
        {
            m_historyPos = static_cast<int>(m_history.size()) - 1;
        }
        else if (m_historyPos > 0)
        {
            --m_historyPos;
        }
    }
    else if (m_historyPos != -1)
    {
        if (++m_historyPos >= static_cast<int>(m_history.size()))
        {
            m_historyPos = -1;
        }
    }

    return m_historyPos >= 0 ? m_history[static_cast<std::size_t>(m_historyPos)] : std::string{};
}

void ConsoleCommands::Execute(const std::string& commandLine, const ConsoleContext& context)
{
    AddLog("# " + commandLine);

    const std::vector<std::string> tokens = Tokenize(commandLine);
    if (tokens.empty())
    {
        return;
    }

    m_history.erase(std::remove(m_history.begin(), m_history.end(), commandLine), m_history.end());
    m_history.push_back(commandLine);
    m_historyPos = -1;

    const auto it = m_commandRegistry.find(tokens[0]);
    if (it == m_commandRegistry.end())
    {
        AddLog("Unknown command. Type `help`.");
        return;
    }

    it->second(tokens, context);
}

void ConsoleCommands::RegisterDefaultCommands()
{
    RegisterCommand("help", "List available commands", "General", [this](const std::vector<std::string>&, const ConsoleContext&) {
        PrintHelp();
    });

    RegisterCommand("quit", "Exit the application", "General", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (!context.quit)
        {
            AddLog("quit is unavailable.");
            return;
        }
        context.quit();
    });

    RegisterCommand("restart", "Restart the embedded sample", "General", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (!context.restart)
        {
            AddLog("restart is unavailable.");
            return;
        }
        context.restart();
        AddLog("Sample restarted.");
    });

    RegisterCommand("save", "Save the scene snapshot", "Scene", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (!context.saveScene)
        {
            AddLog("save is unavailable.");
            return;
        }
        std::string error;
        if (context.saveScene(&error))
        {
            AddLog("Scene saved.");
        }
        else
        {
            AddLog("Failed to save scene: " + error);
        }
    });

    RegisterCommand("load", "Load the scene snapshot", "Scene", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (!context.loadScene)
        {
            AddLog("load is unavailable.");
            return;
        }
        std::string error;
        if (context.loadScene(&error))
        {
            AddLog("Scene loaded.");
        }
        else
        {
            AddLog("Failed to load scene: " + error);
        }
    });

    RegisterCommand("seed <n>", "Reseed the scene generator, applied on restart", "Scene", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        std::uint32_t seed = 0;
        if (tokens.size() != 2 || !ParseUnsigned(tokens[1], seed))
        {
            AddLog("Usage: seed <n>");
            return;
        }
        if (!context.setSeed)
        {
            AddLog("seed is unavailable.");
            return;
        }
        context.setSeed(seed);
        AddLog("Seed set to " + std::to_string(seed) + ".");
    });

    RegisterCommand("first_person on|off", "Switch between first and third person", "Camera", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        bool enabled = false;
        if (tokens.size() == 1 && context.firstPerson)
        {
            enabled = !context.firstPerson();
        }
        else if (tokens.size() != 2 || !ParseBoolToken(tokens[1], enabled))
        {
            AddLog("Usage: first_person on|off");
            return;
        }
        if (!context.setFirstPerson)
        {
            AddLog("first_person is unavailable.");
            return;
        }
        context.setFirstPerson(enabled);
        AddLog(std::string("First person ") + (enabled ? "on." : "off."));
    });

    RegisterCommand("camera_distance <v>", "Set the third person camera distance", "Camera", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        float distance = 0.0F;
        if (tokens.size() != 2 || !ParseFloat(tokens[1], distance))
        {
            AddLog("Usage: camera_distance <v>");
            return;
        }
        if (!context.setCameraDistance)
        {
            AddLog("camera_distance is unavailable.");
            return;
        }
        context.setCameraDistance(distance);
        if (context.cameraDistance)
        {
            std::ostringstream out;
            out << "Camera distance " << context.cameraDistance() << ".";
            AddLog(out.str());
        }
    });

    RegisterCommand("gyro on|off", "Steer with the gyroscope (touch mode only)", "Input", [this](const std::vector<std::string>& tokens, const ConsoleContext& context) {
        bool enabled = false;
        if (tokens.size() != 2 || !ParseBoolToken(tokens[1], enabled))
        {
            AddLog("Usage: gyro on|off");
            return;
        }
        if (!context.setGyroscope)
        {
            AddLog("gyro is unavailable.");
            return;
        }
        if (!context.setGyroscope(enabled))
        {
            AddLog("Failed to change gyroscope: touch input is disabled.");
            return;
        }
        AddLog(std::string("Gyroscope ") + (enabled ? "on." : "off."));
    });

    RegisterCommand("quality", "Print renderer quality settings", "Render", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (!context.qualityDump)
        {
            AddLog("quality is unavailable.");
            return;
        }
        AddLog(context.qualityDump());
    });

    RegisterCommand("screenshot", "Save the next frame as PNG", "Render", [this](const std::vector<std::string>&, const ConsoleContext& context) {
        if (!context.takeScreenshot)
        {
            AddLog("screenshot is unavailable.");
            return;
        }
        std::string path;
        std::string error;
        if (context.takeScreenshot(&path, &error))
        {
            AddLog("Screenshot: " + path);
        }
        else
        {
            AddLog("Failed to take screenshot: " + error);
        }
    });
}

#if CHARSURF_WITH_IMGUI
struct DeveloperConsole::Impl
{
    std::array<char, 512> inputBuffer{};
    ConsoleCommands* commands = nullptr;

    static int TextEditCallbackStub(ImGuiInputTextCallbackData* data)
    {
        Impl* impl = static_cast<Impl*>(data->UserData);
        return impl->TextEditCallback(data);
    }

    int TextEditCallback(ImGuiInputTextCallbackData* data)
    {
        std::string replacement;
        switch (data->EventFlag)
        {
            case ImGuiInputTextFlags_CallbackCompletion:
                replacement = commands->Complete(std::string(data->Buf, static_cast<std::size_t>(data->BufTextLen)));
                break;
            case ImGuiInputTextFlags_CallbackHistory:
                replacement = commands->HistoryStep(data->EventKey == ImGuiKey_UpArrow ? -1 : 1);
                break;
            default:
                return 0;
        }

        data->DeleteChars(0, data->BufTextLen);
        data->InsertChars(0, replacement.c_str());
        return 0;
    }
};
#endif

bool DeveloperConsole::Initialize(engine::platform::Window& window)
{
#if CHARSURF_WITH_IMGUI
    if (m_impl != nullptr)
    {
        return true;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window.NativeHandle(), true);
    ImGui_ImplOpenGL3_Init("#version 330");

    m_impl = new Impl();
    m_impl->commands = &m_commands;
#else
    (void)window;
#endif
    return true;
}

void DeveloperConsole::Shutdown()
{
#if CHARSURF_WITH_IMGUI
    if (m_impl != nullptr)
    {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        delete m_impl;
        m_impl = nullptr;
    }
#endif
}

void DeveloperConsole::BeginFrame()
{
#if CHARSURF_WITH_IMGUI
    if (m_impl != nullptr)
    {
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();
    }
#endif
}

void DeveloperConsole::Render(const ConsoleContext& context, engine::ui::UiSystem& ui, const engine::platform::Input& input)
{
    if (m_open && !m_firstOpenAnnouncementDone)
    {
        m_commands.AddLog("Type `help` to list commands.");
        m_firstOpenAnnouncementDone = true;
    }

#if CHARSURF_WITH_IMGUI
    if (m_impl == nullptr)
    {
        RenderFallback(context, ui, input);
        return;
    }
    (void)ui;
    (void)input;

    if (m_open)
    {
        ImGui::SetNextWindowSize(ImVec2(720.0F, 340.0F), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("Developer Console", &m_open))
        {
            if (ImGui::Button("Clear"))
            {
                m_commands.ClearLog();
            }
            ImGui::SameLine();
            ImGui::TextUnformatted("Examples: first_person on | camera_distance 8 | seed 42");

            ImGui::Separator();
            ImGui::BeginChild("ScrollingRegion", ImVec2(0, -ImGui::GetFrameHeightWithSpacing() * 2.0F), false, ImGuiWindowFlags_HorizontalScrollbar);
            for (const std::string& item : m_commands.Items())
            {
                const glm::vec4 color = ColorForLine(item);
                ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(color.r, color.g, color.b, color.a));
                ImGui::TextUnformatted(item.c_str());
                ImGui::PopStyleColor();
            }
            if (m_commands.ConsumeScrollToBottom())
            {
                ImGui::SetScrollHereY(1.0F);
            }
            ImGui::EndChild();

            const ImGuiInputTextFlags inputFlags = ImGuiInputTextFlags_EnterReturnsTrue |
                                                   ImGuiInputTextFlags_CallbackCompletion |
                                                   ImGuiInputTextFlags_CallbackHistory;
            if (ImGui::InputText(
                    "Input",
                    m_impl->inputBuffer.data(),
                    m_impl->inputBuffer.size(),
                    inputFlags,
                    &Impl::TextEditCallbackStub,
                    m_impl))
            {
                const std::string command = m_impl->inputBuffer.data();
                if (!command.empty())
                {
                    m_commands.Execute(command, context);
                }
                m_impl->inputBuffer.fill('\0');
                m_reclaimFocus = true;
            }

            if (m_reclaimFocus)
            {
                ImGui::SetKeyboardFocusHere(-1);
                m_reclaimFocus = false;
            }

            const std::string currentInput = m_impl->inputBuffer.data();
            if (!currentInput.empty())
            {
                const std::vector<ConsoleCommands::CommandInfo> hints = m_commands.BuildHints(currentInput);
                if (!hints.empty())
                {
                    ImGui::Text("[%s] %s - %s", hints.front().category.c_str(), hints.front().usage.c_str(), hints.front().description.c_str());
                }
            }
            else
            {
                ImGui::TextUnformatted("TAB autocompletes, ENTER executes.");
            }
        }
        ImGui::End();
    }

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
#else
    RenderFallback(context, ui, input);
#endif
}

void DeveloperConsole::RenderFallback(const ConsoleContext& context, engine::ui::UiSystem& ui, const engine::platform::Input& input)
{
    if (!m_open)
    {
        return;
    }

    m_fallbackInput += input.TextInput();
    if (input.IsKeyPressed(GLFW_KEY_BACKSPACE) && !m_fallbackInput.empty())
    {
        m_fallbackInput.pop_back();
    }
    if (input.IsKeyPressed(GLFW_KEY_TAB))
    {
        m_fallbackInput = m_commands.Complete(m_fallbackInput);
    }
    if (input.IsKeyPressed(GLFW_KEY_UP))
    {
        m_fallbackInput = m_commands.HistoryStep(-1);
    }
    if (input.IsKeyPressed(GLFW_KEY_DOWN))
    {
        m_fallbackInput = m_commands.HistoryStep(1);
    }
    if (input.IsKeyPressed(GLFW_KEY_ENTER) || input.IsKeyPressed(GLFW_KEY_KP_ENTER))
    {
        if (!m_fallbackInput.empty())
        {
            m_commands.Execute(m_fallbackInput, context);
        }
        m_fallbackInput.clear();
    }

    const float width = static_cast<float>(ui.ScreenWidth());
    const float height = std::min(360.0F, static_cast<float>(ui.ScreenHeight()) * 0.5F);
    ui.BeginPanel(engine::ui::UiRect{0.0F, 0.0F, width, height}, engine::ui::UiPadding{10.0F, 8.0F, 10.0F, 8.0F});

    const float lineHeight = ui.LineHeight(0.8F);
    const engine::ui::UiRect content = ui.CurrentContentRect();
    const int visibleLines = std::max(1, static_cast<int>((content.h - lineHeight * 1.5F) / lineHeight));
    const std::vector<std::string>& items = m_commands.Items();
    const std::size_t first = items.size() > static_cast<std::size_t>(visibleLines) ? items.size() - static_cast<std::size_t>(visibleLines) : 0;

    float y = content.y;
    for (std::size_t i = first; i < items.size(); ++i)
    {
        ui.DrawTextLabel(content.x, y, items[i], ColorForLine(items[i]), 0.8F);
        y += lineHeight;
    }
    (void)m_commands.ConsumeScrollToBottom();

    ui.DrawTextLabel(content.x, content.y + content.h - lineHeight, "> " + m_fallbackInput + "_", ConsoleColors::Command, 0.8F);
    ui.EndPanel();
}

void DeveloperConsole::Toggle()
{
    const bool wasOpen = m_open;
    m_open = !m_open;
    if (!wasOpen && m_open)
    {
        m_reclaimFocus = true;
        m_fallbackInput.clear();
    }
}

bool DeveloperConsole::WantsKeyboardCapture() const
{
#if CHARSURF_WITH_IMGUI
    if (m_impl != nullptr)
    {
        return m_open && ImGui::GetIO().WantCaptureKeyboard;
    }
#endif
    return m_open;
}
} // namespace ui
