#include "engine/scene/World.hpp"

#include <algorithm>
#include <unordered_set>

namespace engine::scene
{
Entity World::CreateEntity()
{
    const Entity entity = m_nextEntity++;
    m_transforms.emplace(entity, Transform{});
    return entity;
}

Entity World::CreateEntity(const std::string& name)
{
    const Entity entity = CreateEntity();
    m_names[entity] = NameComponent{name};
    return entity;
}

void World::DestroyEntity(Entity entity)
{
    m_transforms.erase(entity);
    m_names.erase(entity);
    m_shapes.erase(entity);
    m_bodies.erase(entity);
    m_renderables.erase(entity);
    m_animatedModels.erase(entity);
    m_animations.erase(entity);
    m_lights.erase(entity);
    m_zones.erase(entity);
}

void World::Clear()
{
    m_nextEntity = 1;
    m_transforms.clear();
    m_names.clear();
    m_shapes.clear();
    m_bodies.clear();
    m_renderables.clear();
    m_animatedModels.clear();
    m_animations.clear();
    m_lights.clear();
    m_zones.clear();
}

bool World::HasEntity(Entity entity) const
{
    return m_transforms.contains(entity) || m_names.contains(entity) || m_shapes.contains(entity) ||
           m_bodies.contains(entity) || m_renderables.contains(entity) || m_animatedModels.contains(entity) ||
           m_animations.contains(entity) || m_lights.contains(entity) || m_zones.contains(entity);
}

std::optional<Entity> World::FindByName(const std::string& name) const
{
    // Lowest id wins when names collide.
    std::optional<Entity> found;
    for (const auto& [entity, component] : m_names)
    {
        if (component.name == name && (!found.has_value() || entity < *found))
        {
            found = entity;
        }
    }
    return found;
}

std::string World::NameOf(Entity entity) const
{
    const auto it = m_names.find(entity);
    return it != m_names.end() ? it->second.name : std::string{};
}

void World::ReserveEntity(Entity entity)
{
    m_nextEntity = std::max(m_nextEntity, entity + 1);
}

Transform* World::FindTransform(Entity entity)
{
    const auto it = m_transforms.find(entity);
    return it != m_transforms.end() ? &it->second : nullptr;
}

const Transform* World::FindTransform(Entity entity) const
{
    const auto it = m_transforms.find(entity);
    return it != m_transforms.end() ? &it->second : nullptr;
}

RigidBody* World::FindBody(Entity entity)
{
    const auto it = m_bodies.find(entity);
    return it != m_bodies.end() ? &it->second : nullptr;
}

const RigidBody* World::FindBody(Entity entity) const
{
    const auto it = m_bodies.find(entity);
    return it != m_bodies.end() ? &it->second : nullptr;
}

std::vector<Entity> World::Entities() const
{
    std::unordered_set<Entity> dedup;
    dedup.reserve(m_transforms.size() + m_names.size());

    auto collect = [&dedup](const auto& map) {
        for (const auto& [entity, _] : map)
        {
            dedup.insert(entity);
        }
    };

    collect(m_transforms);
    collect(m_names);
    collect(m_shapes);
    collect(m_bodies);
    collect(m_renderables);
    collect(m_animatedModels);
    collect(m_animations);
    collect(m_lights);
    collect(m_zones);

    std::vector<Entity> entities(dedup.begin(), dedup.end());
    std::sort(entities.begin(), entities.end());
    return entities;
}
} // namespace engine::scene
