// Ticket: 0014_destruction_data_recorder

#include "shatter-sim/src/DataRecorder/DataRecorder.hpp"

#include <algorithm>
#include <chrono>

#include "shatter-transfer/src/CoordinateRecord.hpp"
#include "shatter-transfer/src/DestructionFrameRecord.hpp"
#include "shatter-transfer/src/DestructionJobRecord.hpp"
#include "shatter-transfer/src/PuppetSnapshotRecord.hpp"
#include "shatter-transfer/src/QuaternionDRecord.hpp"
#include "shatter-transfer/src/Vector3DRecord.hpp"
#include "shatter-transfer/src/VelocityRecord.hpp"

namespace shatter_sim
{

DataRecorder::DataRecorder(const Config& config)
  : flushInterval_{config.flushInterval}
{
  database_ = std::make_unique<cpp_sqlite::Database>(config.databasePath, true);

  // Every DAO exists before the flush thread starts: inserting a record with
  // nested transfer objects would otherwise create DAOs lazily while
  // flushAllDAOs() iterates them.

  // Frame record first for FK integrity
  database_->getDAO<shatter_transfer::DestructionFrameRecord>();

  // Nested sub-records
  database_->getDAO<shatter_transfer::CoordinateRecord>();
  database_->getDAO<shatter_transfer::Vector3DRecord>();
  database_->getDAO<shatter_transfer::QuaternionDRecord>();
  database_->getDAO<shatter_transfer::VelocityRecord>();

  // Top-level records referencing a frame
  database_->getDAO<shatter_transfer::DestructionJobRecord>();
  database_->getDAO<shatter_transfer::PuppetSnapshotRecord>();

  recorderThread_ = std::jthread{[this](std::stop_token st)
                                 { recorderThreadMain(std::move(st)); }};
}

DataRecorder::~DataRecorder()
{
  // recorderThreadMain flushes once more before returning
  recorderThread_.request_stop();
}

uint32_t DataRecorder::recordFrame(double simulationTime,
                                   const FrameStats& stats,
                                   uint32_t activePuppets)
{
  const uint32_t frameId = nextFrameId_.fetch_add(1);

  shatter_transfer::DestructionFrameRecord record{};
  record.id = frameId;
  record.simulation_time = simulationTime;
  record.wall_clock_time =
    std::chrono::duration_cast<std::chrono::duration<double>>(
      std::chrono::system_clock::now().time_since_epoch())
      .count();
  record.divisions = stats.divisions;
  record.operations = stats.operations;
  record.active_jobs = stats.activeJobs;
  record.active_puppets = activePuppets;

  database_->getDAO<shatter_transfer::DestructionFrameRecord>().addToBuffer(
    record);
  return frameId;
}

shatter_transfer::DestructionJobRecord DataRecorder::makeJobRecord(
  const DestructionJob& job)
{
  shatter_transfer::DestructionJobRecord record{};
  record.job_id = static_cast<uint32_t>(job.id);
  record.submission_order = static_cast<uint32_t>(job.submissionOrder);
  record.shape_kind = static_cast<uint32_t>(job.params.cuttingShape.kind);
  record.state = static_cast<uint32_t>(job.state);
  record.destroyed_voxels = static_cast<uint32_t>(job.destroyedCount);
  record.affected_groups = static_cast<uint32_t>(job.affectedGroups.size());
  record.imaginary = job.isInstant() ? 1 : 0;
  record.grid_size = job.gridSize();
  record.cutting_origin = job.params.cuttingShape.frame.getOrigin().toRecord();
  record.cutting_extent = job.params.cuttingShape.extent.toRecord();
  return record;
}

void DataRecorder::recordJob(uint32_t frameId,
                             shatter_transfer::DestructionJobRecord record)
{
  record.frame.id = frameId;
  database_->getDAO<shatter_transfer::DestructionJobRecord>().addToBuffer(
    record);
}

void DataRecorder::recordPuppetSnapshot(uint32_t frameId,
                                        const PuppetSnapshot& snapshot)
{
  shatter_transfer::PuppetSnapshotRecord record{};
  record.puppet_id = snapshot.puppetId;
  record.timestamp = snapshot.timestamp;
  record.sleeping = snapshot.sleeping ? 1 : 0;
  record.position = snapshot.position.toRecord();
  record.orientation = snapshot.orientation.toRecord();
  record.velocity = snapshot.linearVelocity.toRecord();
  record.frame.id = frameId;
  database_->getDAO<shatter_transfer::PuppetSnapshotRecord>().addToBuffer(
    record);
}

void DataRecorder::flush()
{
  std::scoped_lock lock{flushMutex_};
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
}

void DataRecorder::recorderThreadMain(std::stop_token stopToken)
{
  // Short sleeps keep shutdown responsive
  constexpr auto kSleepChunk = std::chrono::milliseconds{10};

  while (!stopToken.stop_requested())
  {
    auto remaining = flushInterval_;
    while (remaining > std::chrono::milliseconds{0} &&
           !stopToken.stop_requested())
    {
      const auto sleepTime = std::min(remaining, kSleepChunk);
      std::this_thread::sleep_for(sleepTime);
      remaining -= sleepTime;
    }

    if (stopToken.stop_requested())
    {
      break;
    }

    std::scoped_lock lock{flushMutex_};
    database_->withTransaction([this]() { database_->flushAllDAOs(); });
  }

  // Final flush
  std::scoped_lock lock{flushMutex_};
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
}

const cpp_sqlite::Database& DataRecorder::getDatabase() const
{
  return *database_;
}

template <typename T>
cpp_sqlite::DataAccessObject<T>& DataRecorder::getDAO()
{
  return database_->getDAO<T>();
}

template cpp_sqlite::DataAccessObject<shatter_transfer::DestructionFrameRecord>&
DataRecorder::getDAO<shatter_transfer::DestructionFrameRecord>();

template cpp_sqlite::DataAccessObject<shatter_transfer::DestructionJobRecord>&
DataRecorder::getDAO<shatter_transfer::DestructionJobRecord>();

template cpp_sqlite::DataAccessObject<shatter_transfer::PuppetSnapshotRecord>&
DataRecorder::getDAO<shatter_transfer::PuppetSnapshotRecord>();

}  // namespace shatter_sim
