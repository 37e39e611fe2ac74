// Ticket: 0004_geometry_kernel

#include "shatter-sim/src/Geometry/GeometryKernel.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

#include "shatter-sim/src/Utils/utils.hpp"

namespace shatter_sim::GeometryKernel
{

namespace
{

// Cross products shorter than this are parallel edges and carry no axis
constexpr double kMinAxisLength = 1e-8;

double ballRadius(const Vector3D& extent)
{
  return 0.5 * extent.minCoeff();
}

double cylinderRadius(const Vector3D& extent)
{
  return 0.5 * std::min(extent.y(), extent.z());
}

/// Half extents of the box used to stand in for a shape in SAT and AABBs
Eigen::Vector3d proxyHalfExtent(ShapeKind kind, const Vector3D& extent)
{
  switch (kind)
  {
    case ShapeKind::Box:
    case ShapeKind::Wedge:
    case ShapeKind::CornerWedge:
      return 0.5 * extent;
    case ShapeKind::Ball:
      return Eigen::Vector3d::Constant(ballRadius(extent));
    case ShapeKind::Cylinder:
    {
      const double r = cylinderRadius(extent);
      return Eigen::Vector3d{0.5 * extent.x(), r, r};
    }
  }
  return 0.5 * extent;
}

std::vector<Eigen::Vector3d> localBoxCorners(const Eigen::Vector3d& h)
{
  return {{-h.x(), -h.y(), -h.z()},
          {h.x(), -h.y(), -h.z()},
          {-h.x(), h.y(), -h.z()},
          {h.x(), h.y(), -h.z()},
          {-h.x(), -h.y(), h.z()},
          {h.x(), -h.y(), h.z()},
          {-h.x(), h.y(), h.z()},
          {h.x(), h.y(), h.z()}};
}

std::vector<Eigen::Vector3d> localVertices(ShapeKind kind,
                                           const Vector3D& extent)
{
  const Eigen::Vector3d h = proxyHalfExtent(kind, extent);
  switch (kind)
  {
    case ShapeKind::Box:
    case ShapeKind::Ball:
    case ShapeKind::Cylinder:
      return localBoxCorners(h);
    case ShapeKind::Wedge:
      return {{-h.x(), -h.y(), -h.z()},
              {h.x(), -h.y(), -h.z()},
              {-h.x(), -h.y(), h.z()},
              {h.x(), -h.y(), h.z()},
              {-h.x(), h.y(), h.z()},
              {h.x(), h.y(), h.z()}};
    case ShapeKind::CornerWedge:
      return {{-h.x(), -h.y(), -h.z()},
              {h.x(), -h.y(), -h.z()},
              {-h.x(), -h.y(), h.z()},
              {h.x(), -h.y(), h.z()},
              {h.x(), h.y(), -h.z()}};
  }
  return localBoxCorners(h);
}

std::vector<Eigen::Vector3d> localEdgeDirections(ShapeKind kind,
                                                 const Vector3D& extent)
{
  const Eigen::Vector3d h = proxyHalfExtent(kind, extent);
  std::vector<Eigen::Vector3d> edges{
    Eigen::Vector3d::UnitX(), Eigen::Vector3d::UnitY(), Eigen::Vector3d::UnitZ()};
  switch (kind)
  {
    case ShapeKind::Box:
    case ShapeKind::Ball:
    case ShapeKind::Cylinder:
      break;
    case ShapeKind::Wedge:
      edges.emplace_back(Eigen::Vector3d{0.0, h.y(), h.z()}.normalized());
      break;
    case ShapeKind::CornerWedge:
      // Apex edges toward the three far bottom corners
      edges.emplace_back(Eigen::Vector3d{h.x(), h.y(), 0.0}.normalized());
      edges.emplace_back(Eigen::Vector3d{h.x(), h.y(), -h.z()}.normalized());
      edges.emplace_back(Eigen::Vector3d{0.0, h.y(), -h.z()}.normalized());
      break;
  }
  return edges;
}

std::vector<Coordinate> toWorld(const std::vector<Eigen::Vector3d>& local,
                                const ReferenceFrame& frame)
{
  std::vector<Coordinate> world;
  world.reserve(local.size());
  for (const auto& p : local)
  {
    world.emplace_back(frame.localToGlobal(Coordinate{p}));
  }
  return world;
}

std::vector<Vector3D> rotateToWorld(const std::vector<Eigen::Vector3d>& local,
                                    const ReferenceFrame& frame)
{
  std::vector<Vector3D> world;
  world.reserve(local.size());
  for (const auto& v : local)
  {
    world.emplace_back(frame.localToGlobalRelative(Vector3D{v}));
  }
  return world;
}

/// Closest distance between segments [p0, p1] and [q0, q1]
double segmentSegmentDistance(const Eigen::Vector3d& p0,
                              const Eigen::Vector3d& p1,
                              const Eigen::Vector3d& q0,
                              const Eigen::Vector3d& q1)
{
  const Eigen::Vector3d d1 = p1 - p0;
  const Eigen::Vector3d d2 = q1 - q0;
  const Eigen::Vector3d r = p0 - q0;
  const double a = d1.squaredNorm();
  const double e = d2.squaredNorm();
  const double f = d2.dot(r);

  double s = 0.0;
  double t = 0.0;
  if (a <= TOLERANCE && e <= TOLERANCE)
  {
    return r.norm();
  }
  if (a <= TOLERANCE)
  {
    t = std::clamp(f / e, 0.0, 1.0);
  }
  else
  {
    const double c = d1.dot(r);
    if (e <= TOLERANCE)
    {
      s = std::clamp(-c / a, 0.0, 1.0);
    }
    else
    {
      const double b = d1.dot(d2);
      const double denom = a * e - b * b;
      // Parallel segments: any s works, start from p0
      s = denom > TOLERANCE ? std::clamp((b * f - c * e) / denom, 0.0, 1.0)
                            : 0.0;
      t = (b * s + f) / e;
      if (t < 0.0)
      {
        t = 0.0;
        s = std::clamp(-c / a, 0.0, 1.0);
      }
      else if (t > 1.0)
      {
        t = 1.0;
        s = std::clamp((b - c) / a, 0.0, 1.0);
      }
    }
  }
  const Eigen::Vector3d closestP = p0 + d1 * s;
  const Eigen::Vector3d closestQ = q0 + d2 * t;
  return (closestP - closestQ).norm();
}

bool insideLocalBox(const Eigen::Vector3d& p,
                    const Eigen::Vector3d& h,
                    double margin)
{
  return (p.cwiseAbs().array() <= (h.array() + margin)).all();
}

bool polyhedronIntersectsBox(const OrientedShape& shape,
                             const ReferenceFrame& boxFrame,
                             const Vector3D& boxExtent)
{
  return polyhedraIntersect(shape,
                            OrientedShape{ShapeKind::Box, boxFrame, boxExtent});
}

bool ballDispatch(const OrientedShape& shape,
                  const ReferenceFrame& boxFrame,
                  const Vector3D& boxExtent)
{
  return ballIntersectsBox(shape.frame, shape.extent, boxFrame, boxExtent);
}

bool cylinderDispatch(const OrientedShape& shape,
                      const ReferenceFrame& boxFrame,
                      const Vector3D& boxExtent)
{
  return cylinderIntersectsBox(shape.frame, shape.extent, boxFrame, boxExtent);
}

using IntersectsBoxFn = bool (*)(const OrientedShape&,
                                 const ReferenceFrame&,
                                 const Vector3D&);

// Indexed by ShapeKind
constexpr std::array<IntersectsBoxFn, 5> kIntersectsBoxTable{
  &polyhedronIntersectsBox,  // Box
  &ballDispatch,             // Ball
  &cylinderDispatch,         // Cylinder
  &polyhedronIntersectsBox,  // Wedge
  &polyhedronIntersectsBox   // CornerWedge
};

bool containsLocalPoint(ShapeKind kind,
                        const Vector3D& extent,
                        const Eigen::Vector3d& p)
{
  switch (kind)
  {
    case ShapeKind::Box:
      return insideLocalBox(p, 0.5 * extent, kGeometryEpsilon);
    case ShapeKind::Ball:
      return p.norm() <= ballRadius(extent) + kGeometryEpsilon;
    case ShapeKind::Cylinder:
      return std::abs(p.x()) <= 0.5 * extent.x() + kGeometryEpsilon &&
             std::hypot(p.y(), p.z()) <=
               cylinderRadius(extent) + kGeometryEpsilon;
    case ShapeKind::Wedge:
    case ShapeKind::CornerWedge:
    {
      const auto planes = getLocalFacePlanes(kind, extent);
      return std::all_of(planes.begin(),
                         planes.end(),
                         [&p](const FacePlane& plane) {
                           return plane.normal.dot(p) <=
                                  plane.offset + kGeometryEpsilon;
                         });
    }
  }
  return false;
}

}  // namespace

std::vector<Coordinate> getVertices(ShapeKind kind,
                                    const ReferenceFrame& frame,
                                    const Vector3D& extent)
{
  return toWorld(localVertices(kind, extent), frame);
}

std::vector<FacePlane> getLocalFacePlanes(ShapeKind kind,
                                          const Vector3D& extent)
{
  const Eigen::Vector3d h = proxyHalfExtent(kind, extent);
  switch (kind)
  {
    case ShapeKind::Box:
    case ShapeKind::Ball:
    case ShapeKind::Cylinder:
      return {{Vector3D{1.0, 0.0, 0.0}, h.x()},
              {Vector3D{-1.0, 0.0, 0.0}, h.x()},
              {Vector3D{0.0, 1.0, 0.0}, h.y()},
              {Vector3D{0.0, -1.0, 0.0}, h.y()},
              {Vector3D{0.0, 0.0, 1.0}, h.z()},
              {Vector3D{0.0, 0.0, -1.0}, h.z()}};
    case ShapeKind::Wedge:
      // Slope: y / hy <= z / hz
      return {{Vector3D{1.0, 0.0, 0.0}, h.x()},
              {Vector3D{-1.0, 0.0, 0.0}, h.x()},
              {Vector3D{0.0, -1.0, 0.0}, h.y()},
              {Vector3D{0.0, 0.0, 1.0}, h.z()},
              {Vector3D{Eigen::Vector3d{0.0, 1.0 / h.y(), -1.0 / h.z()}
                          .normalized()},
               0.0}};
    case ShapeKind::CornerWedge:
      // Slopes: y / hy <= x / hx and y / hy <= -z / hz
      return {{Vector3D{1.0, 0.0, 0.0}, h.x()},
              {Vector3D{0.0, -1.0, 0.0}, h.y()},
              {Vector3D{0.0, 0.0, -1.0}, h.z()},
              {Vector3D{Eigen::Vector3d{-1.0 / h.x(), 1.0 / h.y(), 0.0}
                          .normalized()},
               0.0},
              {Vector3D{Eigen::Vector3d{0.0, 1.0 / h.y(), 1.0 / h.z()}
                          .normalized()},
               0.0}};
  }
  return {};
}

std::vector<Vector3D> getFaceNormals(ShapeKind kind,
                                     const ReferenceFrame& frame,
                                     const Vector3D& extent)
{
  std::vector<Vector3D> normals;
  for (const auto& plane : getLocalFacePlanes(kind, extent))
  {
    normals.emplace_back(frame.localToGlobalRelative(plane.normal));
  }
  return normals;
}

std::vector<Vector3D> getEdgeDirections(ShapeKind kind,
                                        const ReferenceFrame& frame,
                                        const Vector3D& extent)
{
  return rotateToWorld(localEdgeDirections(kind, extent), frame);
}

bool sat(const std::vector<Coordinate>& vertsA,
         const std::vector<Vector3D>& normalsA,
         const std::vector<Vector3D>& edgesA,
         const std::vector<Coordinate>& vertsB,
         const std::vector<Vector3D>& normalsB,
         const std::vector<Vector3D>& edgesB)
{
  if (vertsA.empty() || vertsB.empty())
  {
    return false;
  }

  auto separatesOn = [&vertsA, &vertsB](const Eigen::Vector3d& axis)
  {
    double minA = std::numeric_limits<double>::max();
    double maxA = std::numeric_limits<double>::lowest();
    for (const auto& v : vertsA)
    {
      const double d = axis.dot(v);
      minA = std::min(minA, d);
      maxA = std::max(maxA, d);
    }
    double minB = std::numeric_limits<double>::max();
    double maxB = std::numeric_limits<double>::lowest();
    for (const auto& v : vertsB)
    {
      const double d = axis.dot(v);
      minB = std::min(minB, d);
      maxB = std::max(maxB, d);
    }
    const double overlap = std::min(maxA, maxB) - std::max(minA, minB);
    return overlap < kGeometryEpsilon;
  };

  for (const auto& n : normalsA)
  {
    if (separatesOn(n.normalized()))
    {
      return false;
    }
  }
  for (const auto& n : normalsB)
  {
    if (separatesOn(n.normalized()))
    {
      return false;
    }
  }
  for (const auto& ea : edgesA)
  {
    for (const auto& eb : edgesB)
    {
      const Eigen::Vector3d axis = ea.cross(eb);
      const double length = axis.norm();
      if (length < kMinAxisLength)
      {
        continue;
      }
      if (separatesOn(axis / length))
      {
        return false;
      }
    }
  }
  return true;
}

bool polyhedraIntersect(const OrientedShape& a, const OrientedShape& b)
{
  return sat(getVertices(a.kind, a.frame, a.extent),
             getFaceNormals(a.kind, a.frame, a.extent),
             getEdgeDirections(a.kind, a.frame, a.extent),
             getVertices(b.kind, b.frame, b.extent),
             getFaceNormals(b.kind, b.frame, b.extent),
             getEdgeDirections(b.kind, b.frame, b.extent));
}

bool ballIntersectsBox(const ReferenceFrame& sphereFrame,
                       const Vector3D& sphereExtent,
                       const ReferenceFrame& boxFrame,
                       const Vector3D& boxExtent)
{
  const double radius = ballRadius(sphereExtent) - kGeometryEpsilon;
  if (radius <= 0.0)
  {
    return false;
  }

  const Eigen::Vector3d centre = boxFrame.globalToLocal(sphereFrame.getOrigin());
  const Eigen::Vector3d h = 0.5 * boxExtent;
  const Eigen::Vector3d closest = centre.cwiseMax(-h).cwiseMin(h);
  return (centre - closest).squaredNorm() < radius * radius;
}

bool cylinderIntersectsBox(const ReferenceFrame& cylinderFrame,
                           const Vector3D& cylinderExtent,
                           const ReferenceFrame& boxFrame,
                           const Vector3D& boxExtent)
{
  // (1) Bounding box rejection
  if (!sat(getVertices(ShapeKind::Cylinder, cylinderFrame, cylinderExtent),
           getFaceNormals(ShapeKind::Cylinder, cylinderFrame, cylinderExtent),
           getEdgeDirections(ShapeKind::Cylinder, cylinderFrame, cylinderExtent),
           getVertices(ShapeKind::Box, boxFrame, boxExtent),
           getFaceNormals(ShapeKind::Box, boxFrame, boxExtent),
           getEdgeDirections(ShapeKind::Box, boxFrame, boxExtent)))
  {
    return false;
  }

  const double radius = cylinderRadius(cylinderExtent) - kGeometryEpsilon;
  if (radius <= 0.0)
  {
    return false;
  }

  // Work in box-local space with the cylinder reduced to its axis segment
  const Eigen::Vector3d h = 0.5 * boxExtent;
  const double halfLength = 0.5 * cylinderExtent.x();
  const Eigen::Vector3d centre =
    boxFrame.globalToLocal(cylinderFrame.getOrigin());
  const Eigen::Vector3d axis =
    boxFrame.globalToLocalRelative(cylinderFrame.axis(0));
  const Eigen::Vector3d p0 = centre - axis * halfLength;
  const Eigen::Vector3d p1 = centre + axis * halfLength;

  // (2) Centre inside the box
  if (insideLocalBox(centre, h, 0.0))
  {
    return true;
  }

  // (3) Box edges against the axis segment
  const auto corners = localBoxCorners(h);
  for (size_t i = 0; i < corners.size(); ++i)
  {
    for (size_t j = i + 1; j < corners.size(); ++j)
    {
      // Corner indices differing in exactly one bit share an edge
      const size_t diff = i ^ j;
      if ((diff & (diff - 1)) != 0)
      {
        continue;
      }
      if (segmentSegmentDistance(p0, p1, corners[i], corners[j]) < radius)
      {
        return true;
      }
    }
  }

  // (4) Box faces against the axis segment
  for (Eigen::Index k = 0; k < 3; ++k)
  {
    const Eigen::Index u = (k + 1) % 3;
    const Eigen::Index v = (k + 2) % 3;
    auto withinFace = [&h, u, v](const Eigen::Vector3d& p)
    { return std::abs(p[u]) <= h[u] && std::abs(p[v]) <= h[v]; };

    for (const double sign : {-1.0, 1.0})
    {
      const double plane = sign * h[k];
      const double d0 = p0[k] - plane;
      const double d1 = p1[k] - plane;

      if ((withinFace(p0) && std::abs(d0) < radius) ||
          (withinFace(p1) && std::abs(d1) < radius))
      {
        return true;
      }

      if (d0 * d1 <= 0.0 && std::abs(d0 - d1) > TOLERANCE)
      {
        const double t = d0 / (d0 - d1);
        if (withinFace(p0 + t * (p1 - p0)))
        {
          return true;
        }
      }
    }
  }

  return false;
}

bool shapeIntersectsBox(const OrientedShape& shape,
                        const ReferenceFrame& boxFrame,
                        const Vector3D& boxExtent)
{
  return kIntersectsBoxTable[static_cast<size_t>(shape.kind)](
    shape, boxFrame, boxExtent);
}

bool containsPoint(const OrientedShape& shape, const Coordinate& point)
{
  return containsLocalPoint(
    shape.kind, shape.extent, shape.frame.globalToLocal(point));
}

bool partContainsAllVerts(const OrientedShape& shape,
                          const std::vector<Coordinate>& points)
{
  return std::all_of(points.begin(),
                     points.end(),
                     [&shape](const Coordinate& p)
                     { return containsPoint(shape, p); });
}

std::optional<size_t> partContainsAVert(const OrientedShape& shape,
                                        const std::vector<Coordinate>& points)
{
  for (size_t i = 0; i < points.size(); ++i)
  {
    if (containsPoint(shape, points[i]))
    {
      return i;
    }
  }
  return std::nullopt;
}

bool partEncapsulatesBox(const OrientedShape& shape,
                         const ReferenceFrame& boxFrame,
                         const Vector3D& boxExtent)
{
  return partContainsAllVerts(shape,
                              getVertices(ShapeKind::Box, boxFrame, boxExtent));
}

std::optional<RayHit> raycast(const OrientedShape& shape,
                              const Coordinate& origin,
                              const Vector3D& direction)
{
  const Eigen::Vector3d p = shape.frame.globalToLocal(origin);
  const Eigen::Vector3d d = shape.frame.globalToLocalRelative(direction);
  const auto planes = getLocalFacePlanes(shape.kind, shape.extent);

  double tEnter = 0.0;
  double tExit = 1.0;
  std::optional<size_t> entered;
  for (size_t i = 0; i < planes.size(); ++i)
  {
    const double denom = planes[i].normal.dot(d);
    const double inside = planes[i].offset - planes[i].normal.dot(p);
    if (std::abs(denom) < kGeometryEpsilon)
    {
      if (inside < 0.0)
      {
        return std::nullopt;
      }
      continue;
    }

    const double t = inside / denom;
    if (denom < 0.0)
    {
      if (t > tEnter)
      {
        tEnter = t;
        entered = i;
      }
    }
    else
    {
      tExit = std::min(tExit, t);
    }
    if (tEnter > tExit)
    {
      return std::nullopt;
    }
  }

  if (!entered)
  {
    return std::nullopt;
  }
  return RayHit{tEnter,
                Vector3D{shape.frame.localToGlobalRelative(planes[*entered].normal)}};
}

Aabb computeAabb(ShapeKind kind,
                 const ReferenceFrame& frame,
                 const Vector3D& extent)
{
  const Eigen::Vector3d h = proxyHalfExtent(kind, extent);
  const Eigen::Vector3d reach =
    kind == ShapeKind::Ball ? h
                            : Eigen::Vector3d{frame.getRotation().cwiseAbs() * h};
  const Coordinate& origin = frame.getOrigin();
  return Aabb{Coordinate{origin - reach}, Coordinate{origin + reach}};
}

}  // namespace shatter_sim::GeometryKernel
