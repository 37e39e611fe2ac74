// Ticket: 0013_hitbox

#include "shatter-sim/src/Hitbox/Hitbox.hpp"

#include <chrono>
#include <format>
#include <stdexcept>
#include <utility>

#include "shatter-sim/src/DestructionWorld.hpp"
#include "shatter-sim/src/Utils/Logging.hpp"

namespace shatter_sim
{

Hitbox::Hitbox(HitboxId id, DestructionWorld& world, const OrientedShape& shape)
  : id_{id}, world_{world}, shape_{shape}
{
  shape_.validate();
}

void Hitbox::setShape(const OrientedShape& shape)
{
  shape.validate();
  shape_ = shape;
}

JobId Hitbox::destroy()
{
  requireAlive();
  return world_.destroy(jobParams());
}

std::future<ImaginaryResult> Hitbox::imaginaryVoxels()
{
  requireAlive();
  return world_.imaginaryVoxels(jobParams());
}

DestructionParams Hitbox::jobParams() const
{
  DestructionParams params = config_.params;
  params.cuttingShape = shape_;
  return params;
}

void Hitbox::weldTo(SolidObjectId objectId)
{
  requireAlive();
  auto target = world_.scene().find(objectId);
  if (!target)
  {
    throw std::invalid_argument{
      std::format("Hitbox {} cannot weld to unknown object {}", id_, objectId)};
  }
  weldOffset_ = target->get().frame().relativeTo(shape_.frame);
  weldTarget_ = objectId;
}

void Hitbox::unweld()
{
  weldTarget_.reset();
}

void Hitbox::start()
{
  requireAlive();
  jobParams().validate();
  running_ = true;
  lastFire_.reset();
}

void Hitbox::stop()
{
  running_ = false;
}

void Hitbox::update(double simTime)
{
  if (destroyed_)
  {
    return;
  }
  const double dt = lastUpdate_ ? simTime - *lastUpdate_ : 0.0;
  lastUpdate_ = simTime;

  if (weldTarget_)
  {
    followTarget(dt);
  }

  if (running_ && (!lastFire_ || simTime - *lastFire_ >= config_.destructDelay))
  {
    lastFire_ = simTime;
    try
    {
      fire();
    }
    catch (const std::invalid_argument& e)
    {
      logger()->error("Hitbox {} stopped: {}", id_, e.what());
      running_ = false;
    }
  }
}

void Hitbox::followTarget(double dt)
{
  auto state = world_.scene().getBodyState(*weldTarget_);
  if (!state)
  {
    logger()->debug("Hitbox {}: weld target {} is gone, unwelding",
                    id_,
                    *weldTarget_);
    weldTarget_.reset();
    return;
  }

  ReferenceFrame frame = state->frame.compose(weldOffset_);
  if (config_.velocityPrediction)
  {
    frame.setOrigin(Coordinate{frame.getOrigin() + state->linearVelocity *
                                                     (dt * config_.velocityBias)});
  }
  shape_.frame = frame;
}

void Hitbox::fire()
{
  switch (config_.type)
  {
    case HitboxType::Default:
      world_.destroy(jobParams());
      return;
    case HitboxType::Imaginary:
      pending_.push_back(world_.imaginaryVoxels(jobParams()));
      return;
  }
}

void Hitbox::collectResults()
{
  // Detach ready results first; a callback may destroy this hitbox or
  // submit new work
  std::vector<std::future<ImaginaryResult>> ready;
  auto it = pending_.begin();
  while (it != pending_.end())
  {
    if (it->wait_for(std::chrono::seconds{0}) == std::future_status::ready)
    {
      ready.push_back(std::move(*it));
      it = pending_.erase(it);
    }
    else
    {
      ++it;
    }
  }

  for (auto& future : ready)
  {
    if (destroyed_)
    {
      return;
    }
    try
    {
      const ImaginaryResult result = future.get();
      if (config_.imaginaryCallback)
      {
        config_.imaginaryCallback(result);
      }
    }
    catch (const JobCancelledError& error)
    {
      logger()->debug("Hitbox {}: {}", id_, error.what());
    }
  }
}

void Hitbox::markDestroyed()
{
  running_ = false;
  destroyed_ = true;
  weldTarget_.reset();
  pending_.clear();
}

void Hitbox::requireAlive() const
{
  if (destroyed_)
  {
    throw std::runtime_error{
      std::format("Hitbox {} has been destroyed", id_)};
  }
}

}  // namespace shatter_sim
