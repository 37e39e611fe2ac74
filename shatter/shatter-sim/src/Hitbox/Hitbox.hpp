// Ticket: 0013_hitbox

#ifndef SHATTER_SIM_HITBOX_HITBOX_HPP
#define SHATTER_SIM_HITBOX_HITBOX_HPP

#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <vector>

#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Geometry/OrientedShape.hpp"
#include "shatter-sim/src/Scheduler/DestructionParams.hpp"

namespace shatter_sim
{

class DestructionWorld;

using HitboxId = uint32_t;

enum class HitboxType : uint8_t
{
  Default = 0,   // Incremental destruction
  Imaginary = 1  // Imaginary jobs; results go to the imaginary callback
};

using ImaginaryCallback = std::function<void(const ImaginaryResult&)>;

/**
 * @brief Persistent cutting volume driven by the world tick
 *
 * While started the hitbox submits a job every destructDelay seconds (every
 * tick for a zero delay). A welded hitbox follows its target object,
 * keeping the offset it had when welded; with velocityPrediction the cut is
 * pushed ahead along the target's velocity by velocityBias times the time
 * since the previous tick.
 *
 * The cutting shape is owned by the hitbox and validated whenever it is set;
 * it replaces params.cuttingShape in every submitted job. A continuous job
 * whose other parameters fail validation stops the hitbox instead of
 * failing the world tick.
 *
 * Owned by DestructionWorld; references stay valid until destroyHitbox().
 * destroyHitbox() may be called from a hitbox callback.
 *
 * @ticket 0013_hitbox
 */
class Hitbox
{
public:
  struct Config
  {
    DestructionParams params;  // Job parameters; the cut comes from shape()
    double destructDelay{0.0};  // Seconds between continuous jobs
    HitboxType type{HitboxType::Default};
    ImaginaryCallback imaginaryCallback;
    bool velocityPrediction{false};
    double velocityBias{1.0};
  };

  /**
   * @throws std::invalid_argument if shape fails validation
   */
  Hitbox(HitboxId id, DestructionWorld& world, const OrientedShape& shape);

  [[nodiscard]] HitboxId id() const
  {
    return id_;
  }

  [[nodiscard]] Config& config()
  {
    return config_;
  }

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

  [[nodiscard]] const OrientedShape& shape() const
  {
    return shape_;
  }

  /**
   * @brief Replace the cutting shape
   * @throws std::invalid_argument if shape fails validation; the previous
   *         shape is kept
   */
  void setShape(const OrientedShape& shape);

  /**
   * @brief Submit one incremental job with the current cut
   * @throws std::runtime_error if the hitbox was destroyed
   * @throws std::invalid_argument if the parameters fail validation
   */
  JobId destroy();

  /**
   * @brief Submit one imaginary job with the current cut
   * @throws std::runtime_error if the hitbox was destroyed
   * @throws std::invalid_argument if the parameters fail validation
   */
  std::future<ImaginaryResult> imaginaryVoxels();

  /**
   * @brief Follow a scene object, keeping the current relative placement
   * @throws std::invalid_argument if the object is unknown
   */
  void weldTo(SolidObjectId objectId);

  void unweld();

  [[nodiscard]] std::optional<SolidObjectId> weldTarget() const
  {
    return weldTarget_;
  }

  /**
   * @throws std::runtime_error if the hitbox was destroyed
   * @throws std::invalid_argument if the parameters fail validation
   */
  void start();

  void stop();

  [[nodiscard]] bool isRunning() const
  {
    return running_;
  }

  [[nodiscard]] bool isDestroyed() const
  {
    return destroyed_;
  }

  /// Called by the world before the scheduler runs
  void update(double simTime);

  /// Called by the world after the scheduler ran; delivers imaginary results
  void collectResults();

  /// Called by the world from destroyHitbox()
  void markDestroyed();

  [[nodiscard]] size_t pendingResultCount() const
  {
    return pending_.size();
  }

private:
  void requireAlive() const;

  void followTarget(double dt);

  [[nodiscard]] DestructionParams jobParams() const;

  void fire();

  HitboxId id_;
  DestructionWorld& world_;
  Config config_;
  OrientedShape shape_;

  std::optional<SolidObjectId> weldTarget_;
  ReferenceFrame weldOffset_;  // Hitbox frame in the target's local frame
  bool running_{false};
  bool destroyed_{false};
  std::optional<double> lastFire_;
  std::optional<double> lastUpdate_;
  std::vector<std::future<ImaginaryResult>> pending_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_HITBOX_HITBOX_HPP
