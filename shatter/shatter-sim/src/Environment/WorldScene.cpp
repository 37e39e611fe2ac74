// Ticket: 0005_scene_collaborator

#include "shatter-sim/src/Environment/WorldScene.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "shatter-sim/src/Geometry/GeometryKernel.hpp"

namespace shatter_sim
{

WorldScene::WorldScene(double linearDamping) : linearDamping_{linearDamping}
{
  if (linearDamping < 0.0)
  {
    throw std::invalid_argument{"WorldScene damping must be non-negative"};
  }
}

std::optional<std::reference_wrapper<const SolidObject>> WorldScene::find(
  SolidObjectId id) const
{
  auto it = objects_.find(id);
  if (it == objects_.end())
  {
    return std::nullopt;
  }
  return std::cref(it->second.object);
}

bool WorldScene::isAttached(SolidObjectId id) const
{
  auto it = objects_.find(id);
  return it != objects_.end() && it->second.attached;
}

std::vector<SolidObjectId> WorldScene::queryRegion(
  const Aabb& region,
  const std::vector<std::string>& tagFilter) const
{
  std::vector<SolidObjectId> result;
  for (const auto& [id, entry] : objects_)
  {
    if (!entry.attached)
    {
      continue;
    }
    if (!tagFilter.empty() &&
        std::none_of(tagFilter.begin(),
                     tagFilter.end(),
                     [&entry](const std::string& tag)
                     { return entry.object.hasTag(tag); }))
    {
      continue;
    }
    if (GeometryKernel::computeAabb(entry.object.shape).intersects(region))
    {
      result.push_back(id);
    }
  }
  return result;
}

bool WorldScene::detach(SolidObjectId id)
{
  auto it = objects_.find(id);
  if (it == objects_.end())
  {
    return false;
  }
  it->second.attached = false;
  return true;
}

bool WorldScene::attach(SolidObjectId id)
{
  auto it = objects_.find(id);
  if (it == objects_.end())
  {
    return false;
  }
  it->second.attached = true;
  return true;
}

SolidObjectId WorldScene::createObject(const SolidObject& spec, bool attached)
{
  const SolidObjectId id = nextId_++;
  Entry entry{.object = spec, .attached = attached};
  entry.object.id = id;
  objects_.emplace(id, std::move(entry));
  return id;
}

bool WorldScene::removeObject(SolidObjectId id)
{
  return objects_.erase(id) > 0;
}

bool WorldScene::setAnchored(SolidObjectId id, bool anchored)
{
  auto it = objects_.find(id);
  if (it == objects_.end())
  {
    return false;
  }
  it->second.object.anchored = anchored;
  if (anchored)
  {
    it->second.linearVelocity = Velocity{0.0, 0.0, 0.0};
    it->second.angularVelocity = Vector3D{0.0, 0.0, 0.0};
  }
  return true;
}

bool WorldScene::setVelocity(SolidObjectId id,
                             const Velocity& linear,
                             const Vector3D& angular)
{
  auto it = objects_.find(id);
  if (it == objects_.end())
  {
    return false;
  }
  it->second.linearVelocity = linear;
  it->second.angularVelocity = angular;
  return true;
}

std::optional<BodyState> WorldScene::getBodyState(SolidObjectId id) const
{
  auto it = objects_.find(id);
  if (it == objects_.end())
  {
    return std::nullopt;
  }
  return BodyState{.frame = it->second.object.shape.frame,
                   .linearVelocity = it->second.linearVelocity,
                   .angularVelocity = it->second.angularVelocity};
}

void WorldScene::advance(double dt)
{
  const double decay = std::exp(-linearDamping_ * dt);
  for (auto& [id, entry] : objects_)
  {
    if (!entry.attached || entry.object.anchored)
    {
      continue;
    }
    ReferenceFrame& frame = entry.object.shape.frame;
    frame.setOrigin(Coordinate{frame.getOrigin() + entry.linearVelocity * dt});

    const double spin = entry.angularVelocity.norm();
    if (spin > 0.0)
    {
      const QuaternionD delta =
        QuaternionD::fromAxisAngle(entry.angularVelocity, spin * dt);
      frame.setOrientation(delta * frame.getOrientation());
    }

    entry.linearVelocity = Velocity{entry.linearVelocity * decay};
    entry.angularVelocity = Vector3D{entry.angularVelocity * decay};
  }
}

SolidObjectId WorldScene::addBox(const Coordinate& position,
                                 const Vector3D& extent,
                                 std::set<std::string, std::less<>> tags)
{
  SolidObject spec;
  spec.shape = OrientedShape{ShapeKind::Box, ReferenceFrame{position}, extent};
  spec.tags = std::move(tags);
  return createObject(spec, true);
}

size_t WorldScene::attachedCount() const
{
  return static_cast<size_t>(
    std::count_if(objects_.begin(),
                  objects_.end(),
                  [](const auto& item) { return item.second.attached; }));
}

std::vector<SolidObjectId> WorldScene::attachedIds() const
{
  std::vector<SolidObjectId> ids;
  for (const auto& [id, entry] : objects_)
  {
    if (entry.attached)
    {
      ids.push_back(id);
    }
  }
  return ids;
}

}  // namespace shatter_sim
