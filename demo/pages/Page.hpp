#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "engine/ui/UiSystem.hpp"

namespace engine::platform
{
class ActionBindings;
class Input;
}

namespace engine::render
{
class Renderer;
}

namespace ui
{
class DeveloperConsole;
}

namespace demo::pages
{
class EmbeddedSurface;
class NavigationStack;

struct PageContext
{
    engine::ui::UiSystem& ui;
    engine::platform::Input& input;
    const engine::platform::ActionBindings& bindings;
    NavigationStack& navigation;
    ui::DeveloperConsole* console = nullptr;
    // Area below the navigation bar, UI pixels.
    engine::ui::UiRect contentRect{};
    float deltaSeconds = 0.0F;
    bool consoleHasFocus = false;
};

class Page
{
public:
    virtual ~Page() = default;

    [[nodiscard]] virtual std::string Title() const = 0;

    virtual void OnAppearing() {}
    virtual void OnDisappearing() {}

    virtual void Build(PageContext& context) = 0;
    virtual void Render(engine::render::Renderer& renderer, int framebufferWidth, int framebufferHeight)
    {
        (void)renderer;
        (void)framebufferWidth;
        (void)framebufferHeight;
    }

    /// Surface hosted by this page, if any.
    [[nodiscard]] virtual EmbeddedSurface* Surface() { return nullptr; }
};

/// Page history. Only the top page is visible; it receives OnAppearing when
/// it becomes the top and OnDisappearing when it stops being it.
class NavigationStack
{
public:
    ~NavigationStack();

    void Push(std::unique_ptr<Page> page);
    /// Keeps the root page. Returns false when nothing was popped.
    bool Pop();
    void Clear();

    /// Deferred variants for use while a page is being built.
    void RequestPush(std::unique_ptr<Page> page);
    void RequestPop() { m_popRequested = true; }
    void ApplyPending();

    [[nodiscard]] Page* Current() const { return m_pages.empty() ? nullptr : m_pages.back().get(); }
    [[nodiscard]] std::size_t Depth() const { return m_pages.size(); }

private:
    std::vector<std::unique_ptr<Page>> m_pages;
    std::vector<std::unique_ptr<Page>> m_pendingPush;
    bool m_popRequested = false;
};
} // namespace demo::pages
