#pragma once

#include <functional>
#include <memory>
#include <string>

#include "demo/pages/Page.hpp"

namespace demo::pages
{
/// Landing page with a single button that opens the sample.
class StartPage final : public Page
{
public:
    using PageFactory = std::function<std::unique_ptr<Page>()>;

    static constexpr const char* kLaunchLabel = "Launch sample";

    explicit StartPage(PageFactory launchPage);

    [[nodiscard]] std::string Title() const override { return "Start"; }
    void Build(PageContext& context) override;

    /// Same as clicking the launch button.
    void Launch(NavigationStack& navigation);

private:
    PageFactory m_launchPage;
};
} // namespace demo::pages
