// Ticket: 0014_destruction_data_recorder

#ifndef SHATTER_SIM_DATA_RECORDER_HPP
#define SHATTER_SIM_DATA_RECORDER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "shatter-sim/src/Replication/SnapshotCodec.hpp"
#include "shatter-sim/src/Scheduler/DestructionJob.hpp"
#include "shatter-sim/src/Scheduler/DestructionScheduler.hpp"
#include "shatter-transfer/src/DestructionJobRecord.hpp"

namespace shatter_transfer
{
struct DestructionFrameRecord;
}

namespace shatter_sim
{

/**
 * @brief Background recording of destruction activity to a SQLite database
 *
 * The simulation thread buffers one DestructionFrameRecord per tick plus the
 * job and puppet snapshot records that reference it. A dedicated thread
 * wakes every flushInterval and writes all buffers in one transaction.
 * Buffering is thread-safe through cpp_sqlite's double-buffered DAOs.
 *
 * The destructor performs a final flush before the thread joins, so no
 * buffered record is lost on shutdown.
 *
 * @ticket 0014_destruction_data_recorder
 */
class DataRecorder
{
public:
  struct Config
  {
    std::chrono::milliseconds flushInterval{100};
    std::string databasePath;
  };

  /**
   * @brief Open the database, create every DAO and start the flush thread
   * @throws std::runtime_error if the database cannot be opened
   */
  explicit DataRecorder(const Config& config);

  ~DataRecorder();

  DataRecorder(const DataRecorder&) = delete;
  DataRecorder& operator=(const DataRecorder&) = delete;
  DataRecorder(DataRecorder&&) = delete;
  DataRecorder& operator=(DataRecorder&&) = delete;

  /**
   * @brief Buffer a frame record and return its pre-assigned id
   *
   * Thread-safe: the id comes from an atomic counter.
   *
   * @param simulationTime Current simulation time [seconds]
   * @param stats Scheduler statistics of the tick
   * @param activePuppets Puppets alive after the tick
   */
  uint32_t recordFrame(double simulationTime,
                       const FrameStats& stats,
                       uint32_t activePuppets);

  /// Snapshot of a finished job, ready to be attached to a frame
  static shatter_transfer::DestructionJobRecord makeJobRecord(
    const DestructionJob& job);

  void recordJob(uint32_t frameId, shatter_transfer::DestructionJobRecord record);

  void recordPuppetSnapshot(uint32_t frameId, const PuppetSnapshot& snapshot);

  template <typename T>
  cpp_sqlite::DataAccessObject<T>& getDAO();

  /**
   * @brief Write every buffered record now
   *
   * Thread-safe: serialized with the flush thread through flushMutex_.
   */
  void flush();

  const cpp_sqlite::Database& getDatabase() const;

private:
  void recorderThreadMain(std::stop_token stopToken);

  std::unique_ptr<cpp_sqlite::Database> database_;
  std::chrono::milliseconds flushInterval_;
  std::mutex flushMutex_;
  std::atomic<uint32_t> nextFrameId_{1};
  // Declared last: the thread starts after and joins before everything else
  std::jthread recorderThread_;
};

}  // namespace shatter_sim

#endif  // SHATTER_SIM_DATA_RECORDER_HPP
