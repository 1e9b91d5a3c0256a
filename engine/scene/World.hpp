#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "engine/animation/AnimationController.hpp"
#include "engine/scene/Components.hpp"

namespace engine::scene
{
class World
{
public:
    Entity CreateEntity();
    Entity CreateEntity(const std::string& name);
    void DestroyEntity(Entity entity);
    void Clear();

    [[nodiscard]] bool HasEntity(Entity entity) const;
    [[nodiscard]] std::optional<Entity> FindByName(const std::string& name) const;
    [[nodiscard]] std::string NameOf(Entity entity) const;

    /// Used when restoring a snapshot so ids survive a save/load cycle.
    void ReserveEntity(Entity entity);
    [[nodiscard]] Entity NextEntity() const { return m_nextEntity; }

    std::unordered_map<Entity, Transform>& Transforms() { return m_transforms; }
    std::unordered_map<Entity, NameComponent>& Names() { return m_names; }
    std::unordered_map<Entity, CollisionShape>& Shapes() { return m_shapes; }
    std::unordered_map<Entity, RigidBody>& Bodies() { return m_bodies; }
    std::unordered_map<Entity, Renderable>& Renderables() { return m_renderables; }
    std::unordered_map<Entity, AnimatedModel>& AnimatedModels() { return m_animatedModels; }
    std::unordered_map<Entity, animation::AnimationController>& Animations() { return m_animations; }
    std::unordered_map<Entity, DirectionalLight>& Lights() { return m_lights; }
    std::unordered_map<Entity, Zone>& Zones() { return m_zones; }

    [[nodiscard]] const std::unordered_map<Entity, Transform>& Transforms() const { return m_transforms; }
    [[nodiscard]] const std::unordered_map<Entity, NameComponent>& Names() const { return m_names; }
    [[nodiscard]] const std::unordered_map<Entity, CollisionShape>& Shapes() const { return m_shapes; }
    [[nodiscard]] const std::unordered_map<Entity, RigidBody>& Bodies() const { return m_bodies; }
    [[nodiscard]] const std::unordered_map<Entity, Renderable>& Renderables() const { return m_renderables; }
    [[nodiscard]] const std::unordered_map<Entity, AnimatedModel>& AnimatedModels() const { return m_animatedModels; }
    [[nodiscard]] const std::unordered_map<Entity, animation::AnimationController>& Animations() const { return m_animations; }
    [[nodiscard]] const std::unordered_map<Entity, DirectionalLight>& Lights() const { return m_lights; }
    [[nodiscard]] const std::unordered_map<Entity, Zone>& Zones() const { return m_zones; }

    [[nodiscard]] Transform* FindTransform(Entity entity);
    [[nodiscard]] const Transform* FindTransform(Entity entity) const;
    [[nodiscard]] RigidBody* FindBody(Entity entity);
    [[nodiscard]] const RigidBody* FindBody(Entity entity) const;

    /// Sorted ascending so iteration order is stable across runs.
    [[nodiscard]] std::vector<Entity> Entities() const;

private:
    Entity m_nextEntity = 1;
    std::unordered_map<Entity, Transform> m_transforms;
    std::unordered_map<Entity, NameComponent> m_names;
    std::unordered_map<Entity, CollisionShape> m_shapes;
    std::unordered_map<Entity, RigidBody> m_bodies;
    std::unordered_map<Entity, Renderable> m_renderables;
    std::unordered_map<Entity, AnimatedModel> m_animatedModels;
    std::unordered_map<Entity, animation::AnimationController> m_animations;
    std::unordered_map<Entity, DirectionalLight> m_lights;
    std::unordered_map<Entity, Zone> m_zones;
};
} // namespace engine::scene
