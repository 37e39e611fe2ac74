// Ticket: 0009_settings

#ifndef SHATTER_SIM_SETTINGS_SETTINGS_HPP
#define SHATTER_SIM_SETTINGS_SETTINGS_HPP

#include <cstdint>
#include <functional>
#include <string_view>

#include "shatter-sim/src/Environment/SolidObject.hpp"

namespace shatter_sim
{

/**
 * @brief What happens to a non-divisible object touched by a cutting shape
 */
enum class NonDivisibleInteraction : uint8_t
{
  None = 0,    // Left untouched
  Fall = 1,    // Unanchored so physics drops it
  Remove = 2   // Removed from the scene
};

[[nodiscard]] constexpr std::string_view toString(NonDivisibleInteraction value)
{
  switch (value)
  {
    case NonDivisibleInteraction::None:
      return "None";
    case NonDivisibleInteraction::Fall:
      return "Fall";
    case NonDivisibleInteraction::Remove:
      return "Remove";
  }
  return "Unknown";
}

/**
 * @brief Runtime configuration of a DestructionWorld
 *
 * Changes take effect on the next tick. Jobs keep the copy captured when
 * they were submitted.
 */
struct Settings
{
  bool useClientServer{false};              // Replicate puppets through a transport
  double defaultGridSize{1.0};              // Cell side when a job names none [units]
  double defaultSmoothCleanupDelay{0.0};    // Debris lifetime with smooth cleanup [s]
  bool useSmoothCleanup{false};

  bool useGreedyMeshing{true};
  uint32_t gmWorkerCount{4};
  uint32_t gmTraversalsPerFrame{64};
  uint32_t gmPartCreationsPerFrame{16};

  uint32_t maxDivisionsPerFrame{8};         // Objects voxelized per tick
  uint32_t maxOpsPerFrame{512};             // Classifications + registry inserts per tick
  bool usePriorityQueue{true};
  uint32_t prioritizeRecentN{4};

  uint32_t puppetMaxCount{128};
  double puppetReplicationFrequency{20.0};  // [Hz]
  double puppetSleepVelocity{0.1};          // [units/s]
  double puppetAnchorTimeout{2.0};          // [s]
  bool clientTweenPuppets{true};
  double clientTweenDistanceLimit{20.0};    // [units]

  NonDivisibleInteraction nonDivisibleInteraction{NonDivisibleInteraction::None};

  /// Objects for which this returns true are never destroyed
  std::function<bool(const SolidObject&)> skipInstanceCheck;

  /**
   * @brief Reject settings the core cannot run with
   * @throws std::invalid_argument naming the first offending field
   */
  void validate() const;

  /// Seconds between two puppet snapshot batches
  [[nodiscard]] double replicationInterval() const
  {
    return 1.0 / puppetReplicationFrequency;
  }
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_SETTINGS_SETTINGS_HPP
