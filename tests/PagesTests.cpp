#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "demo/pages/EmbeddedSurface.hpp"
#include "demo/pages/Page.hpp"
#include "demo/pages/StartPage.hpp"
#include "demo/pages/ViewportPage.hpp"
#include "engine/core/ErrorChannel.hpp"

using demo::pages::EmbeddedSurface;
using demo::pages::NavigationStack;
using demo::pages::SurfaceOptions;

namespace
{
struct AppCounters
{
    int started = 0;
    int stopped = 0;
    int updates = 0;
};

class FakeApplication final : public demo::pages::SurfaceApplication
{
public:
    enum class Failure
    {
        None,
        StartFails,
        StartThrows,
        UpdateThrows
    };

    FakeApplication(AppCounters& counters, Failure failure)
        : m_counters(counters)
        , m_failure(failure)
    {
    }

    bool Start(const SurfaceOptions& options, std::string* outError) override
    {
        if (m_failure == Failure::StartThrows)
        {
            throw std::runtime_error("missing resources");
        }
        if (m_failure == Failure::StartFails)
        {
            *outError = "no scene in " + options.resourcePath;
            return false;
        }
        ++m_counters.started;
        return true;
    }

    void Stop() override { ++m_counters.stopped; }

    void Update(const demo::pages::SurfaceFrame&) override
    {
        ++m_counters.updates;
        if (m_failure == Failure::UpdateThrows)
        {
            throw std::runtime_error("boom");
        }
    }

    void Render(engine::render::Renderer&, const engine::ui::UiRect&) override {}

    [[nodiscard]] bool ExitRequested() const override { return false; }

private:
    AppCounters& m_counters;
    Failure m_failure;
};

EmbeddedSurface::ApplicationFactory MakeFactory(AppCounters& counters, FakeApplication::Failure failure = FakeApplication::Failure::None)
{
    return [&counters, failure]() -> std::unique_ptr<demo::pages::SurfaceApplication> {
        return std::make_unique<FakeApplication>(counters, failure);
    };
}

class RecordingPage final : public demo::pages::Page
{
public:
    RecordingPage(std::string name, std::vector<std::string>& events)
        : m_name(std::move(name))
        , m_events(events)
    {
    }

    [[nodiscard]] std::string Title() const override { return m_name; }
    void OnAppearing() override { m_events.push_back(m_name + " appearing"); }
    void OnDisappearing() override { m_events.push_back(m_name + " disappearing"); }
    void Build(demo::pages::PageContext&) override {}

private:
    std::string m_name;
    std::vector<std::string>& m_events;
};

std::vector<std::string> ReportedMessages(engine::core::ErrorChannel& errors)
{
    std::vector<std::string> messages;
    const std::size_t token = errors.Subscribe([&messages](const engine::core::ErrorReport& report) {
        messages.push_back(report.message);
    });
    (void)errors.Dispatch();
    errors.Unsubscribe(token);
    return messages;
}
} // namespace

TEST(NavigationStackTest, LifecycleFollowsTopPage)
{
    std::vector<std::string> events;
    NavigationStack navigation;
    navigation.Push(std::make_unique<RecordingPage>("Start", events));
    navigation.Push(std::make_unique<RecordingPage>("Viewport", events));
    EXPECT_EQ(navigation.Depth(), 2U);

    EXPECT_TRUE(navigation.Pop());
    EXPECT_FALSE(navigation.Pop());
    EXPECT_EQ(navigation.Current()->Title(), "Start");

    const std::vector<std::string> expected{
        "Start appearing",
        "Start disappearing",
        "Viewport appearing",
        "Viewport disappearing",
        "Start appearing",
    };
    EXPECT_EQ(events, expected);
}

TEST(NavigationStackTest, RequestsApplyLater)
{
    std::vector<std::string> events;
    NavigationStack navigation;
    navigation.Push(std::make_unique<RecordingPage>("Start", events));

    navigation.RequestPush(std::make_unique<RecordingPage>("Viewport", events));
    EXPECT_EQ(navigation.Depth(), 1U);
    navigation.ApplyPending();
    EXPECT_EQ(navigation.Depth(), 2U);

    navigation.RequestPop();
    EXPECT_EQ(navigation.Depth(), 2U);
    navigation.ApplyPending();
    EXPECT_EQ(navigation.Depth(), 1U);
}

TEST(EmbeddedSurfaceTest, ShowStartsAndDestroyStops)
{
    AppCounters counters;
    engine::core::ErrorChannel errors;
    EmbeddedSurface surface(MakeFactory(counters), &errors);

    ASSERT_NE(surface.Show(SurfaceOptions{}), nullptr);
    EXPECT_TRUE(surface.IsRunning());
    EXPECT_EQ(counters.started, 1);

    ASSERT_NE(surface.Show(SurfaceOptions{}), nullptr);
    EXPECT_EQ(counters.started, 2);
    EXPECT_EQ(counters.stopped, 1);
    EXPECT_EQ(surface.StartCount(), 2U);

    surface.OnDestroy();
    EXPECT_FALSE(surface.IsRunning());
    EXPECT_EQ(counters.stopped, 2);
}

TEST(EmbeddedSurfaceTest, ThrownUpdateIsReportedAndContained)
{
    AppCounters counters;
    engine::core::ErrorChannel errors;
    EmbeddedSurface surface(MakeFactory(counters, FakeApplication::Failure::UpdateThrows), &errors);
    ASSERT_NE(surface.Show(SurfaceOptions{}), nullptr);

    EXPECT_NO_THROW(surface.Update(demo::pages::SurfaceFrame{}));
    EXPECT_TRUE(surface.IsRunning());
    EXPECT_EQ(counters.updates, 1);

    const std::vector<std::string> messages = ReportedMessages(errors);
    ASSERT_EQ(messages.size(), 1U);
    EXPECT_EQ(messages.front(), "update: boom");
}

TEST(EmbeddedSurfaceTest, FailedStartLeavesSurfaceEmpty)
{
    AppCounters counters;
    engine::core::ErrorChannel errors;
    SurfaceOptions options;
    options.resourcePath = "Data";

    EmbeddedSurface failing(MakeFactory(counters, FakeApplication::Failure::StartFails), &errors);
    EXPECT_EQ(failing.Show(options), nullptr);
    EXPECT_FALSE(failing.IsRunning());

    EmbeddedSurface throwing(MakeFactory(counters, FakeApplication::Failure::StartThrows), &errors);
    EXPECT_EQ(throwing.Show(options), nullptr);
    EXPECT_FALSE(throwing.IsRunning());

    const std::vector<std::string> messages = ReportedMessages(errors);
    ASSERT_EQ(messages.size(), 2U);
    EXPECT_EQ(messages[0], "Failed to start application: no scene in Data");
    EXPECT_EQ(messages[1], "start: missing resources");
    EXPECT_EQ(counters.stopped, 0);
}

TEST(ViewportPageTest, AppearingStartsSurfaceAndLeavingStopsIt)
{
    AppCounters counters;
    engine::core::ErrorChannel errors;
    NavigationStack navigation;
    navigation.Push(std::make_unique<demo::pages::StartPage>([&]() -> std::unique_ptr<demo::pages::Page> {
        return std::make_unique<demo::pages::ViewportPage>(MakeFactory(counters), SurfaceOptions{}, &errors);
    }));

    auto* start = dynamic_cast<demo::pages::StartPage*>(navigation.Current());
    ASSERT_NE(start, nullptr);
    start->Launch(navigation);
    navigation.ApplyPending();

    ASSERT_EQ(navigation.Depth(), 2U);
    ASSERT_NE(navigation.Current()->Surface(), nullptr);
    EXPECT_TRUE(navigation.Current()->Surface()->IsRunning());
    EXPECT_EQ(counters.started, 1);

    auto* viewport = dynamic_cast<demo::pages::ViewportPage*>(navigation.Current());
    ASSERT_NE(viewport, nullptr);
    viewport->RestartApplication();
    EXPECT_EQ(counters.started, 2);
    EXPECT_EQ(counters.stopped, 1);

    EXPECT_TRUE(navigation.Pop());
    EXPECT_EQ(counters.stopped, 2);
}

TEST(ViewportPageTest, SelectBarValueSkipsHandler)
{
    AppCounters counters;
    demo::pages::ViewportPage page(MakeFactory(counters), SurfaceOptions{}, nullptr);

    std::vector<float> notified;
    page.SetSelectedValueChangedHandler([&notified](float value) { notified.push_back(value); });

    page.SelectBarValue(4.0F);
    EXPECT_FLOAT_EQ(page.SelectedValue(), 4.0F);
    EXPECT_TRUE(notified.empty());

    page.SetSelectedValue(9.0F);
    EXPECT_FLOAT_EQ(page.SelectedValue(), demo::pages::ViewportPage::kSelectedMax);
    ASSERT_EQ(notified.size(), 1U);
    EXPECT_FLOAT_EQ(notified.front(), demo::pages::ViewportPage::kSelectedMax);

    page.SelectBarValue(1.0F);
    page.SetSelectedValue(2.0F);
    EXPECT_EQ(notified.size(), 2U);
}

TEST(ViewportPageTest, DefaultsMatchLayout)
{
    AppCounters counters;
    const demo::pages::ViewportPage page(MakeFactory(counters), SurfaceOptions{}, nullptr);
    EXPECT_FLOAT_EQ(page.RotationValue(), 250.0F);
    EXPECT_FLOAT_EQ(page.SelectedValue(), 2.5F);
    EXPECT_EQ(page.Title(), " Character Surface Demo");
}
