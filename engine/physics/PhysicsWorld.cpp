#include "engine/physics/PhysicsWorld.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <glm/common.hpp>
#include <glm/geometric.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/mat3x3.hpp>

#include "engine/scene/World.hpp"

namespace engine::physics
{
namespace
{
constexpr float kResolveEpsilon = 0.0005F;
constexpr int kStaticIterations = 4;

glm::vec3 ClosestPointOnAabb(const glm::vec3& point, const glm::vec3& minBounds, const glm::vec3& maxBounds)
{
    return glm::clamp(point, minBounds, maxBounds);
}

/// Half extents of the world AABB enclosing a rotated box.
glm::vec3 RotatedHalfExtents(const glm::quat& rotation, const glm::vec3& halfExtents)
{
    const glm::mat3 m = glm::mat3_cast(rotation);
    glm::vec3 result{0.0F};
    for (int row = 0; row < 3; ++row)
    {
        for (int col = 0; col < 3; ++col)
        {
            result[row] += std::abs(m[col][row]) * halfExtents[col];
        }
    }
    return result;
}

int CellCoord(float value, float cellSize)
{
    return static_cast<int>(std::floor(value / std::max(0.001F, cellSize)));
}

bool LayersInteract(std::uint32_t layerA, std::uint32_t maskA, std::uint32_t layerB, std::uint32_t maskB)
{
    return (layerA & maskB) != 0U && (layerB & maskA) != 0U;
}

void ApplyStaticResponse(engine::scene::RigidBody& body, const glm::vec3& normal, float friction, float* outImpulse)
{
    const float vn = glm::dot(body.linearVelocity, normal);
    if (vn >= 0.0F)
    {
        *outImpulse = 0.0F;
        return;
    }

    glm::vec3 tangential = body.linearVelocity - normal * vn;
    const float drop = friction * -vn;
    const float tangentialSpeed = glm::length(tangential);
    if (tangentialSpeed > drop)
    {
        tangential -= tangential / tangentialSpeed * drop;
    }
    else
    {
        tangential = glm::vec3{0.0F};
    }

    body.linearVelocity = tangential;
    *outImpulse = -vn * body.mass;
}
} // namespace

PhysicsWorld::PhysicsWorld(engine::scene::World& world)
    : m_world(world)
{
}

void PhysicsWorld::RegisterMeshParts(const std::string& model, std::vector<CollisionPart> parts)
{
    m_meshParts[model] = std::move(parts);
    m_staticsDirty = true;
}

std::size_t PhysicsWorld::SubscribePreStep(PreStepHandler handler)
{
    const std::size_t token = m_nextToken++;
    m_preStepSubscribers.push_back(PreStepSubscriber{token, std::move(handler)});
    return token;
}

void PhysicsWorld::UnsubscribePreStep(std::size_t token)
{
    m_preStepSubscribers.erase(
        std::remove_if(m_preStepSubscribers.begin(), m_preStepSubscribers.end(), [token](const PreStepSubscriber& s) {
            return s.token == token;
        }),
        m_preStepSubscribers.end()
    );
}

std::size_t PhysicsWorld::SubscribeCollision(engine::scene::Entity entity, CollisionHandler handler)
{
    const std::size_t token = m_nextToken++;
    m_collisionSubscribers.push_back(CollisionSubscriber{token, entity, std::move(handler)});
    return token;
}

void PhysicsWorld::UnsubscribeCollision(std::size_t token)
{
    m_collisionSubscribers.erase(
        std::remove_if(m_collisionSubscribers.begin(), m_collisionSubscribers.end(), [token](const CollisionSubscriber& s) {
            return s.token == token;
        }),
        m_collisionSubscribers.end()
    );
}

void PhysicsWorld::Step(float timeStep)
{
    if (timeStep <= 0.0F)
    {
        return;
    }
    ++m_stepCount;

    // Handlers may unsubscribe themselves.
    const std::vector<PreStepSubscriber> preStep = m_preStepSubscribers;
    for (const PreStepSubscriber& subscriber : preStep)
    {
        subscriber.handler(timeStep);
    }

    RebuildStatics();

    std::vector<engine::scene::Entity> dynamics;
    for (const auto& [entity, body] : m_world.Bodies())
    {
        if (body.IsDynamic() && m_world.Shapes().contains(entity) && m_world.Transforms().contains(entity))
        {
            dynamics.push_back(entity);
        }
    }
    std::sort(dynamics.begin(), dynamics.end());

    std::vector<DynamicProxy> proxies;
    proxies.reserve(dynamics.size());
    for (const engine::scene::Entity entity : dynamics)
    {
        engine::scene::RigidBody& body = m_world.Bodies().at(entity);
        body.linearVelocity += m_gravity * timeStep;
        m_world.Transforms().at(entity).position += body.linearVelocity * timeStep;
        proxies.push_back(BuildProxy(entity));
    }

    for (std::size_t i = 0; i < proxies.size(); ++i)
    {
        for (std::size_t j = i + 1; j < proxies.size(); ++j)
        {
            ResolveDynamicPair(proxies[i], proxies[j]);
        }
    }

    // Static pass runs last so resting bodies never end a step inside the floor.
    for (DynamicProxy& proxy : proxies)
    {
        engine::scene::RigidBody& body = m_world.Bodies().at(proxy.entity);
        for (int iteration = 0; iteration < kStaticIterations; ++iteration)
        {
            const glm::vec3 queryHalf = proxy.capsule
                ? glm::vec3{proxy.radius, proxy.radius + proxy.halfSegment, proxy.radius}
                : proxy.halfExtents;
            AppendStaticCandidates(proxy.center - queryHalf, proxy.center + queryHalf, m_scratch);

            bool resolved = false;
            for (const std::size_t index : m_scratch)
            {
                const StaticSolid& solid = m_statics[index];
                if (solid.entity == proxy.entity ||
                    !LayersInteract(body.collisionLayer, body.collisionMask, solid.layer, solid.mask))
                {
                    continue;
                }

                ContactPoint contact;
                if (!ResolveAgainstStatic(proxy, solid, &contact))
                {
                    continue;
                }

                resolved = true;
                ApplyStaticResponse(body, contact.normal, body.friction * solid.friction, &contact.impulse);
                RecordContact(proxy.entity, solid.entity, contact);

                ContactPoint mirrored = contact;
                mirrored.normal = -contact.normal;
                RecordContact(solid.entity, proxy.entity, mirrored);
            }

            if (!resolved)
            {
                break;
            }
        }
    }

    for (const DynamicProxy& proxy : proxies)
    {
        engine::scene::Transform& transform = m_world.Transforms().at(proxy.entity);
        const engine::scene::CollisionShape& shape = m_world.Shapes().at(proxy.entity);
        transform.position = proxy.center - transform.rotation * (shape.offset * transform.scale);
    }

    DispatchCollisions();
}

void PhysicsWorld::ApplyImpulse(engine::scene::Entity entity, const glm::vec3& impulse)
{
    engine::scene::RigidBody* body = m_world.FindBody(entity);
    if (body == nullptr || !body->IsDynamic())
    {
        return;
    }
    body->linearVelocity += impulse / body->mass;
}

glm::vec3 PhysicsWorld::LinearVelocity(engine::scene::Entity entity) const
{
    const engine::scene::RigidBody* body = m_world.FindBody(entity);
    return body != nullptr ? body->linearVelocity : glm::vec3{0.0F};
}

void PhysicsWorld::SetLinearVelocity(engine::scene::Entity entity, const glm::vec3& velocity)
{
    engine::scene::RigidBody* body = m_world.FindBody(entity);
    if (body != nullptr && body->IsDynamic())
    {
        body->linearVelocity = velocity;
    }
}

std::optional<RaycastHit> PhysicsWorld::RaycastSingle(const Ray& ray, float maxDistance, std::uint32_t layerMask) const
{
    const float directionLength = glm::length(ray.direction);
    if (directionLength < 1.0e-6F || maxDistance <= 0.0F)
    {
        return std::nullopt;
    }

    RebuildStatics();

    const glm::vec3 direction = ray.direction / directionLength;
    const glm::vec3 from = ray.origin;
    const glm::vec3 to = ray.origin + direction * maxDistance;

    std::optional<RaycastHit> best;
    const auto consider = [&](engine::scene::Entity entity, const glm::vec3& minBounds, const glm::vec3& maxBounds) {
        float hitT = 1.0F;
        glm::vec3 hitNormal{0.0F, 1.0F, 0.0F};
        if (!SegmentIntersectsAabb(from, to, minBounds, maxBounds, &hitT, &hitNormal))
        {
            return;
        }
        const float distance = hitT * maxDistance;
        if (!best.has_value() || distance < best->distance)
        {
            best = RaycastHit{entity, distance, from + direction * distance, hitNormal};
        }
    };

    AppendStaticCandidates(glm::min(from, to), glm::max(from, to), m_scratch);
    for (const std::size_t index : m_scratch)
    {
        const StaticSolid& solid = m_statics[index];
        if ((solid.layer & layerMask) != 0U)
        {
            consider(solid.entity, solid.minBounds, solid.maxBounds);
        }
    }

    for (const auto& [entity, body] : m_world.Bodies())
    {
        if (!body.IsDynamic() || (body.collisionLayer & layerMask) == 0U || !m_world.Shapes().contains(entity))
        {
            continue;
        }
        const DynamicProxy proxy = BuildProxy(entity);
        const glm::vec3 half = proxy.capsule
            ? glm::vec3{proxy.radius, proxy.radius + proxy.halfSegment, proxy.radius}
            : proxy.halfExtents;
        consider(entity, proxy.center - half, proxy.center + half);
    }

    return best;
}

std::size_t PhysicsWorld::StaticSolidCount() const
{
    RebuildStatics();
    return m_statics.size();
}

std::size_t PhysicsWorld::DynamicBodyCount() const
{
    return static_cast<std::size_t>(std::count_if(m_world.Bodies().begin(), m_world.Bodies().end(), [](const auto& entry) {
        return entry.second.IsDynamic();
    }));
}

void PhysicsWorld::RebuildStatics() const
{
    if (!m_staticsDirty)
    {
        return;
    }

    m_statics.clear();
    m_cells.clear();

    for (const auto& [entity, body] : m_world.Bodies())
    {
        if (body.IsDynamic())
        {
            continue;
        }

        const auto shapeIt = m_world.Shapes().find(entity);
        const engine::scene::Transform* transform = m_world.FindTransform(entity);
        if (shapeIt == m_world.Shapes().end() || transform == nullptr)
        {
            continue;
        }
        const engine::scene::CollisionShape& shape = shapeIt->second;

        const auto addPart = [&](const glm::vec3& localCenter, const glm::vec3& localHalf) {
            const glm::vec3 center = transform->position + transform->rotation * (localCenter * transform->scale);
            const glm::vec3 half = RotatedHalfExtents(transform->rotation, localHalf * transform->scale);
            m_statics.push_back(StaticSolid{entity, center - half, center + half, body.collisionLayer, body.collisionMask, body.friction});
        };

        if (shape.type == engine::scene::ShapeType::StaticMesh)
        {
            const auto partsIt = m_meshParts.find(shape.model);
            if (partsIt != m_meshParts.end() && !partsIt->second.empty())
            {
                for (const CollisionPart& part : partsIt->second)
                {
                    addPart(shape.offset + part.center, part.halfExtents);
                }
                continue;
            }
            std::cerr << "Warning: no collision parts for model '" << shape.model << "', using its bounds.\n";
        }

        if (shape.type == engine::scene::ShapeType::Capsule)
        {
            const float radius = shape.size.x * 0.5F;
            addPart(shape.offset, glm::vec3{radius, std::max(radius, shape.size.y * 0.5F), radius});
        }
        else
        {
            addPart(shape.offset, shape.size * 0.5F);
        }
    }

    for (std::size_t index = 0; index < m_statics.size(); ++index)
    {
        const StaticSolid& solid = m_statics[index];
        const int minX = CellCoord(solid.minBounds.x, m_cellSize);
        const int minY = CellCoord(solid.minBounds.y, m_cellSize);
        const int minZ = CellCoord(solid.minBounds.z, m_cellSize);
        const int maxX = CellCoord(solid.maxBounds.x, m_cellSize);
        const int maxY = CellCoord(solid.maxBounds.y, m_cellSize);
        const int maxZ = CellCoord(solid.maxBounds.z, m_cellSize);

        for (int z = minZ; z <= maxZ; ++z)
        {
            for (int y = minY; y <= maxY; ++y)
            {
                for (int x = minX; x <= maxX; ++x)
                {
                    m_cells[CellKey{x, y, z}].push_back(index);
                }
            }
        }
    }

    m_visitStamp.assign(m_statics.size(), 0U);
    m_currentStamp = 1;
    m_staticsDirty = false;
}

void PhysicsWorld::AppendStaticCandidates(
    const glm::vec3& minBounds,
    const glm::vec3& maxBounds,
    std::vector<std::size_t>& outIndices
) const
{
    outIndices.clear();
    if (m_statics.empty())
    {
        return;
    }

    ++m_currentStamp;
    if (m_currentStamp == 0)
    {
        std::fill(m_visitStamp.begin(), m_visitStamp.end(), 0U);
        m_currentStamp = 1;
    }

    const int minX = CellCoord(minBounds.x, m_cellSize);
    const int minY = CellCoord(minBounds.y, m_cellSize);
    const int minZ = CellCoord(minBounds.z, m_cellSize);
    const int maxX = CellCoord(maxBounds.x, m_cellSize);
    const int maxY = CellCoord(maxBounds.y, m_cellSize);
    const int maxZ = CellCoord(maxBounds.z, m_cellSize);

    for (int z = minZ; z <= maxZ; ++z)
    {
        for (int y = minY; y <= maxY; ++y)
        {
            for (int x = minX; x <= maxX; ++x)
            {
                const auto cellIt = m_cells.find(CellKey{x, y, z});
                if (cellIt == m_cells.end())
                {
                    continue;
                }

                for (const std::size_t index : cellIt->second)
                {
                    if (m_visitStamp[index] == m_currentStamp)
                    {
                        continue;
                    }
                    m_visitStamp[index] = m_currentStamp;
                    outIndices.push_back(index);
                }
            }
        }
    }
}

PhysicsWorld::DynamicProxy PhysicsWorld::BuildProxy(engine::scene::Entity entity) const
{
    const engine::scene::Transform& transform = m_world.Transforms().at(entity);
    const engine::scene::CollisionShape& shape = m_world.Shapes().at(entity);

    DynamicProxy proxy;
    proxy.entity = entity;
    proxy.center = transform.position + transform.rotation * (shape.offset * transform.scale);

    if (shape.type == engine::scene::ShapeType::Capsule)
    {
        proxy.capsule = true;
        proxy.radius = shape.size.x * 0.5F * std::max(transform.scale.x, transform.scale.z);
        const float height = shape.size.y * transform.scale.y;
        proxy.halfSegment = std::max(0.0F, height * 0.5F - proxy.radius);
        proxy.halfExtents = glm::vec3{proxy.radius, proxy.radius + proxy.halfSegment, proxy.radius};
        return proxy;
    }

    glm::vec3 localHalf = shape.size * 0.5F;
    if (shape.type == engine::scene::ShapeType::StaticMesh)
    {
        const auto partsIt = m_meshParts.find(shape.model);
        if (partsIt != m_meshParts.end() && !partsIt->second.empty())
        {
            glm::vec3 minBounds{1.0e9F};
            glm::vec3 maxBounds{-1.0e9F};
            for (const CollisionPart& part : partsIt->second)
            {
                minBounds = glm::min(minBounds, part.center - part.halfExtents);
                maxBounds = glm::max(maxBounds, part.center + part.halfExtents);
            }
            localHalf = (maxBounds - minBounds) * 0.5F;
            proxy.center = transform.position +
                           transform.rotation * ((shape.offset + (maxBounds + minBounds) * 0.5F) * transform.scale);
        }
    }
    proxy.halfExtents = RotatedHalfExtents(transform.rotation, localHalf * transform.scale);
    return proxy;
}

bool PhysicsWorld::ResolveAgainstStatic(DynamicProxy& proxy, const StaticSolid& solid, ContactPoint* outContact) const
{
    glm::vec3 normal{0.0F, 1.0F, 0.0F};
    float penetration = 0.0F;

    if (proxy.capsule)
    {
        if (!SphereIntersectsExpandedAabb(
                proxy.center, proxy.radius, solid.minBounds, solid.maxBounds, proxy.halfSegment, &normal, &penetration))
        {
            return false;
        }

        // Contact sits on the solid, next to the capsule sphere nearest to it.
        const float boxY = std::clamp(proxy.center.y, solid.minBounds.y, solid.maxBounds.y);
        const float sphereY = std::clamp(boxY, proxy.center.y - proxy.halfSegment, proxy.center.y + proxy.halfSegment);
        outContact->position = ClosestPointOnAabb(glm::vec3{proxy.center.x, sphereY, proxy.center.z}, solid.minBounds, solid.maxBounds);
    }
    else
    {
        const glm::vec3 solidCenter = (solid.minBounds + solid.maxBounds) * 0.5F;
        const glm::vec3 solidHalf = (solid.maxBounds - solid.minBounds) * 0.5F;
        if (!AabbOverlap(proxy.center, proxy.halfExtents, solidCenter, solidHalf, &normal, &penetration))
        {
            return false;
        }
        outContact->position = ClosestPointOnAabb(proxy.center - normal * glm::dot(proxy.halfExtents, glm::abs(normal)),
                                                  solid.minBounds, solid.maxBounds);
    }

    proxy.center += normal * (penetration + kResolveEpsilon);
    outContact->normal = normal;
    outContact->distance = -penetration;
    return true;
}

void PhysicsWorld::ResolveDynamicPair(DynamicProxy& a, DynamicProxy& b)
{
    engine::scene::RigidBody& bodyA = m_world.Bodies().at(a.entity);
    engine::scene::RigidBody& bodyB = m_world.Bodies().at(b.entity);
    if (!LayersInteract(bodyA.collisionLayer, bodyA.collisionMask, bodyB.collisionLayer, bodyB.collisionMask))
    {
        return;
    }

    glm::vec3 normal{0.0F, 1.0F, 0.0F};
    float penetration = 0.0F;
    if (!AabbOverlap(a.center, a.halfExtents, b.center, b.halfExtents, &normal, &penetration))
    {
        return;
    }

    const float invA = 1.0F / bodyA.mass;
    const float invB = 1.0F / bodyB.mass;
    const float invTotal = invA + invB;

    a.center += normal * (penetration * invA / invTotal);
    b.center -= normal * (penetration * invB / invTotal);

    float impulse = 0.0F;
    const float relative = glm::dot(bodyA.linearVelocity - bodyB.linearVelocity, normal);
    if (relative < 0.0F)
    {
        impulse = -relative / invTotal;
        bodyA.linearVelocity += normal * (impulse * invA);
        bodyB.linearVelocity -= normal * (impulse * invB);
    }

    const glm::vec3 overlapMin = glm::max(a.center - a.halfExtents, b.center - b.halfExtents);
    const glm::vec3 overlapMax = glm::min(a.center + a.halfExtents, b.center + b.halfExtents);

    ContactPoint contact;
    contact.position = (overlapMin + overlapMax) * 0.5F;
    contact.normal = normal;
    contact.distance = -penetration;
    contact.impulse = impulse;
    RecordContact(a.entity, b.entity, contact);

    contact.normal = -normal;
    RecordContact(b.entity, a.entity, contact);
}

void PhysicsWorld::RecordContact(engine::scene::Entity body, engine::scene::Entity other, const ContactPoint& contact)
{
    const engine::scene::RigidBody* rigidBody = m_world.FindBody(body);
    if (rigidBody == nullptr || rigidBody->collisionEvents == engine::scene::CollisionEventMode::Never)
    {
        return;
    }
    if (rigidBody->collisionEvents == engine::scene::CollisionEventMode::WhenActive && !rigidBody->IsDynamic())
    {
        return;
    }

    const bool subscribed = std::any_of(m_collisionSubscribers.begin(), m_collisionSubscribers.end(), [body](const CollisionSubscriber& s) {
        return s.entity == body;
    });
    if (!subscribed)
    {
        return;
    }

    for (CollisionEvent& event : m_pendingEvents)
    {
        if (event.body == body && event.other == other)
        {
            event.contacts.push_back(contact);
            return;
        }
    }
    m_pendingEvents.push_back(CollisionEvent{body, other, {contact}});
}

void PhysicsWorld::DispatchCollisions()
{
    std::vector<CollisionEvent> events;
    events.swap(m_pendingEvents);
    const std::vector<CollisionSubscriber> subscribers = m_collisionSubscribers;

    for (const CollisionEvent& event : events)
    {
        for (const CollisionSubscriber& subscriber : subscribers)
        {
            if (subscriber.entity == event.body)
            {
                subscriber.handler(event);
            }
        }
    }
}

bool PhysicsWorld::SphereIntersectsExpandedAabb(
    const glm::vec3& center,
    float radius,
    const glm::vec3& boxMin,
    const glm::vec3& boxMax,
    float halfSegment,
    glm::vec3* outNormal,
    float* outPenetration
)
{
    const glm::vec3 minBounds = boxMin - glm::vec3{0.0F, halfSegment, 0.0F};
    const glm::vec3 maxBounds = boxMax + glm::vec3{0.0F, halfSegment, 0.0F};

    const glm::vec3 closestPoint = ClosestPointOnAabb(center, minBounds, maxBounds);
    const glm::vec3 delta = center - closestPoint;

    const float distSq = glm::dot(delta, delta);
    if (distSq >= radius * radius)
    {
        return false;
    }

    glm::vec3 normal{0.0F, 1.0F, 0.0F};
    float penetration = 0.0F;

    if (distSq > 1.0e-8F)
    {
        const float distance = std::sqrt(distSq);
        normal = delta / distance;
        penetration = radius - distance;
    }
    else
    {
        // Center inside: push out through the nearest face.
        const float distances[6] = {
            center.x - minBounds.x,
            maxBounds.x - center.x,
            center.y - minBounds.y,
            maxBounds.y - center.y,
            center.z - minBounds.z,
            maxBounds.z - center.z,
        };
        const glm::vec3 normals[6] = {
            {-1.0F, 0.0F, 0.0F},
            {1.0F, 0.0F, 0.0F},
            {0.0F, -1.0F, 0.0F},
            {0.0F, 1.0F, 0.0F},
            {0.0F, 0.0F, -1.0F},
            {0.0F, 0.0F, 1.0F},
        };

        int bestIndex = 0;
        for (int i = 1; i < 6; ++i)
        {
            if (distances[i] < distances[bestIndex])
            {
                bestIndex = i;
            }
        }
        normal = normals[bestIndex];
        penetration = radius + distances[bestIndex];
    }

    *outNormal = normal;
    *outPenetration = penetration;
    return true;
}

bool PhysicsWorld::SegmentIntersectsAabb(
    const glm::vec3& from,
    const glm::vec3& to,
    const glm::vec3& minBounds,
    const glm::vec3& maxBounds,
    float* outT,
    glm::vec3* outNormal
)
{
    if (glm::all(glm::greaterThanEqual(from, minBounds)) && glm::all(glm::lessThanEqual(from, maxBounds)))
    {
        return false;
    }

    const glm::vec3 direction = to - from;

    float tMin = 0.0F;
    float tMax = 1.0F;
    glm::vec3 bestNormal{0.0F, 1.0F, 0.0F};

    for (int axis = 0; axis < 3; ++axis)
    {
        const float start = from[axis];
        const float dir = direction[axis];

        if (std::abs(dir) < 1.0e-7F)
        {
            if (start < minBounds[axis] || start > maxBounds[axis])
            {
                return false;
            }
            continue;
        }

        const float invDir = 1.0F / dir;
        float t1 = (minBounds[axis] - start) * invDir;
        float t2 = (maxBounds[axis] - start) * invDir;

        glm::vec3 nearNormal{0.0F};
        nearNormal[axis] = invDir >= 0.0F ? -1.0F : 1.0F;
        if (t1 > t2)
        {
            std::swap(t1, t2);
        }

        if (t1 > tMin)
        {
            tMin = t1;
            bestNormal = nearNormal;
        }

        tMax = std::min(tMax, t2);
        if (tMin > tMax)
        {
            return false;
        }
    }

    if (tMin < 0.0F || tMin > 1.0F)
    {
        return false;
    }

    *outT = tMin;
    *outNormal = bestNormal;
    return true;
}

bool PhysicsWorld::AabbOverlap(
    const glm::vec3& centerA,
    const glm::vec3& halfA,
    const glm::vec3& centerB,
    const glm::vec3& halfB,
    glm::vec3* outNormal,
    float* outPenetration
)
{
    const glm::vec3 delta = centerA - centerB;
    const glm::vec3 overlap = halfA + halfB - glm::abs(delta);
    if (overlap.x <= 0.0F || overlap.y <= 0.0F || overlap.z <= 0.0F)
    {
        return false;
    }

    // Separate along the axis of least penetration, pointing from B to A.
    int axis = 0;
    if (overlap.y < overlap[axis])
    {
        axis = 1;
    }
    if (overlap.z < overlap[axis])
    {
        axis = 2;
    }

    glm::vec3 normal{0.0F};
    normal[axis] = delta[axis] >= 0.0F ? 1.0F : -1.0F;
    *outNormal = normal;
    *outPenetration = overlap[axis];
    return true;
}
} // namespace engine::physics
