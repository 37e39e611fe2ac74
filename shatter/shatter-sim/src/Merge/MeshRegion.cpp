// Ticket: 0010_greedy_mesh_merger

#include "shatter-sim/src/Merge/MeshRegion.hpp"

#include <format>
#include <stdexcept>

#include "shatter-sim/src/Utils/utils.hpp"

namespace shatter_sim
{

MeshRegion::MeshRegion(DirtyGroupId groupId,
                       SolidObject blockTemplate,
                       const Eigen::Vector3i& dimensions)
  : groupId_{groupId},
    blockTemplate_{std::move(blockTemplate)},
    dimensions_{dimensions}
{
  if ((dimensions.array() <= 0).any())
  {
    throw std::invalid_argument{std::format(
      "MeshRegion dimensions must be positive, got ({}, {}, {})",
      dimensions.x(),
      dimensions.y(),
      dimensions.z())};
  }
}

void MeshRegion::addCell(const Eigen::Vector3i& cell, const MeshCell& data)
{
  if (started_)
  {
    throw std::runtime_error{"MeshRegion: cannot add cells after traversal"};
  }
  if (!inRange(cell))
  {
    throw std::invalid_argument{std::format(
      "MeshRegion: cell ({}, {}, {}) out of range", cell.x(), cell.y(), cell.z())};
  }
  if (!cells_.emplace(linearIndex(cell), data).second)
  {
    throw std::invalid_argument{std::format(
      "MeshRegion: cell ({}, {}, {}) already filled", cell.x(), cell.y(), cell.z())};
  }
}

bool MeshRegion::step()
{
  started_ = true;
  auto cursor = cells_.lower_bound(scanFrom_);
  if (cursor == cells_.end())
  {
    return false;
  }

  const auto [index, seed] = *cursor;
  scanFrom_ = index + 1;
  if (visited_.contains(index))
  {
    return false;
  }

  const int nx = dimensions_.x();
  const int ny = dimensions_.y();
  const Eigen::Vector3i seedCell{static_cast<int>(index % nx),
                                 static_cast<int>((index / nx) % ny),
                                 static_cast<int>(index / (int64_t{nx} * ny))};
  boxes_.push_back(growFrom(seedCell, seed));
  return true;
}

void MeshRegion::runToCompletion()
{
  while (!isTraversalComplete())
  {
    step();
  }
}

bool MeshRegion::isTraversalComplete() const
{
  return cells_.lower_bound(scanFrom_) == cells_.end();
}

std::vector<SolidObjectId> MeshRegion::blockIds() const
{
  std::vector<SolidObjectId> ids;
  ids.reserve(cells_.size());
  for (const auto& [index, cell] : cells_)
  {
    ids.push_back(cell.blockId);
  }
  return ids;
}

int64_t MeshRegion::linearIndex(const Eigen::Vector3i& cell) const
{
  return int64_t{cell.x()} +
         int64_t{dimensions_.x()} *
           (int64_t{cell.y()} + int64_t{dimensions_.y()} * cell.z());
}

bool MeshRegion::inRange(const Eigen::Vector3i& cell) const
{
  return (cell.array() >= 0).all() && (cell.array() < dimensions_.array()).all();
}

bool MeshRegion::canJoin(const Eigen::Vector3i& cell, const MeshCell& seed) const
{
  if (!inRange(cell))
  {
    return false;
  }
  const int64_t index = linearIndex(cell);
  auto it = cells_.find(index);
  return it != cells_.end() && !visited_.contains(index) &&
         it->second.voxelClass == seed.voxelClass &&
         almostEqual(it->second.shade, seed.shade);
}

MergedBox MeshRegion::growFrom(const Eigen::Vector3i& seedCell,
                               const MeshCell& seed)
{
  Eigen::Vector3i hi = seedCell;

  // Along X
  while (canJoin(Eigen::Vector3i{hi.x() + 1, seedCell.y(), seedCell.z()}, seed))
  {
    ++hi.x();
  }

  // The row along Y
  auto rowJoins = [&](int y)
  {
    for (int x = seedCell.x(); x <= hi.x(); ++x)
    {
      if (!canJoin(Eigen::Vector3i{x, y, seedCell.z()}, seed))
      {
        return false;
      }
    }
    return true;
  };
  while (rowJoins(hi.y() + 1))
  {
    ++hi.y();
  }

  // The rectangle along Z
  auto sliceJoins = [&](int z)
  {
    for (int y = seedCell.y(); y <= hi.y(); ++y)
    {
      for (int x = seedCell.x(); x <= hi.x(); ++x)
      {
        if (!canJoin(Eigen::Vector3i{x, y, z}, seed))
        {
          return false;
        }
      }
    }
    return true;
  };
  while (sliceJoins(hi.z() + 1))
  {
    ++hi.z();
  }

  MergedBox box;
  box.minCell = seedCell;
  box.maxCell = hi;
  box.voxelClass = seed.voxelClass;
  box.shade = seed.shade;
  for (int z = seedCell.z(); z <= hi.z(); ++z)
  {
    for (int y = seedCell.y(); y <= hi.y(); ++y)
    {
      for (int x = seedCell.x(); x <= hi.x(); ++x)
      {
        const int64_t index = linearIndex(Eigen::Vector3i{x, y, z});
        visited_.insert(index);
        box.constituents.push_back(cells_.at(index).blockId);
      }
    }
  }

  const Eigen::Vector3d localMin = cells_.at(linearIndex(seedCell)).localMin;
  const Eigen::Vector3d localMax = cells_.at(linearIndex(hi)).localMax;
  const ReferenceFrame& source = blockTemplate_.shape.frame;
  box.frame = ReferenceFrame{
    source.localToGlobal(Coordinate{0.5 * (localMin + localMax)}),
    source.getOrientation()};
  box.extent = Vector3D{localMax - localMin};
  return box;
}

}  // namespace shatter_sim
