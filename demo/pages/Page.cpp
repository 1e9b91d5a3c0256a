#include "demo/pages/Page.hpp"

#include <utility>

namespace demo::pages
{
NavigationStack::~NavigationStack()
{
    Clear();
}

void NavigationStack::Push(std::unique_ptr<Page> page)
{
    if (page == nullptr)
    {
        return;
    }

    if (Page* previous = Current())
    {
        previous->OnDisappearing();
    }
    m_pages.push_back(std::move(page));
    m_pages.back()->OnAppearing();
}

bool NavigationStack::Pop()
{
    if (m_pages.size() <= 1)
    {
        return false;
    }

    std::unique_ptr<Page> top = std::move(m_pages.back());
    m_pages.pop_back();
    top->OnDisappearing();
    top.reset();

    m_pages.back()->OnAppearing();
    return true;
}

void NavigationStack::Clear()
{
    if (Page* top = Current())
    {
        top->OnDisappearing();
    }
    while (!m_pages.empty())
    {
        m_pages.pop_back();
    }
    m_pendingPush.clear();
    m_popRequested = false;
}

void NavigationStack::RequestPush(std::unique_ptr<Page> page)
{
    m_pendingPush.push_back(std::move(page));
}

void NavigationStack::ApplyPending()
{
    if (m_popRequested)
    {
        m_popRequested = false;
        (void)Pop();
    }

    std::vector<std::unique_ptr<Page>> pending = std::move(m_pendingPush);
    m_pendingPush.clear();
    for (std::unique_ptr<Page>& page : pending)
    {
        Push(std::move(page));
    }
}
} // namespace demo::pages
