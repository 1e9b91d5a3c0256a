#include "demo/pages/StartPage.hpp"

#include <algorithm>
#include <utility>

namespace demo::pages
{
StartPage::StartPage(PageFactory launchPage)
    : m_launchPage(std::move(launchPage))
{
}

void StartPage::Launch(NavigationStack& navigation)
{
    if (m_launchPage)
    {
        navigation.RequestPush(m_launchPage());
    }
}

void StartPage::Build(PageContext& context)
{
    engine::ui::UiSystem& ui = context.ui;
    const engine::ui::UiRect& area = context.contentRect;

    // Vertically centered stack.
    const float width = std::min(area.w - 48.0F, 360.0F);
    const float height = engine::ui::UiSystem::kButtonHeight * 2.0F;
    const engine::ui::UiRect panel{area.x + (area.w - width) * 0.5F, area.y + (area.h - height) * 0.5F, width, height};

    ui.BeginPanel(panel, engine::ui::UiPadding{}, false);
    if (ui.Button("launch_sample", kLaunchLabel))
    {
        Launch(context.navigation);
    }
    ui.EndPanel();
}
} // namespace demo::pages
