// Ticket: 0004_geometry_kernel

#ifndef SHATTER_SIM_GEOMETRY_GEOMETRY_KERNEL_HPP
#define SHATTER_SIM_GEOMETRY_GEOMETRY_KERNEL_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "shatter-sim/src/DataTypes/Coordinate.hpp"
#include "shatter-sim/src/DataTypes/Vector3D.hpp"
#include "shatter-sim/src/Environment/ReferenceFrame.hpp"
#include "shatter-sim/src/Geometry/OrientedShape.hpp"
#include "shatter-sim/src/Geometry/ShapeKind.hpp"

namespace shatter_sim
{

/**
 * @brief Half-space of a convex polyhedron in shape-local coordinates
 *
 * A local point p is inside when normal.dot(p) <= offset.
 */
struct FacePlane
{
  Vector3D normal;  // Outward unit normal (local frame)
  double offset;
};

/**
 * @brief Where a segment first enters a part
 */
struct RayHit
{
  double fraction;  // Along the segment, in [0, 1]
  Vector3D normal;  // World-space outward normal of the entered face
};

/**
 * @brief Stateless intersection and containment tests for the primitive
 * shapes
 *
 * Box, Wedge and CornerWedge are handled exactly as convex polyhedra through
 * the Separating Axis Theorem. Ball and Cylinder use analytic tests; where
 * a vertex set is required they are represented by their tight bounding box.
 *
 * All tests treat configurations closer than kGeometryEpsilon to tangency as
 * non-intersecting, and containment as inclusive within kGeometryEpsilon, so
 * voxels sharing a face with the cutting volume do not flicker between
 * classifications.
 *
 * @ticket 0004_geometry_kernel
 */
namespace GeometryKernel
{

/**
 * @brief World-space corners of a shape
 *
 * Box 8, Wedge 6, CornerWedge 5. Ball and Cylinder return the 8 corners of
 * their tight bounding box (radius-based), usable only as a SAT proxy.
 */
std::vector<Coordinate> getVertices(ShapeKind kind,
                                    const ReferenceFrame& frame,
                                    const Vector3D& extent);

/**
 * @brief World-space outward unit normals, one per face
 *
 * Box 6, Wedge 5, CornerWedge 5. Ball and Cylinder return the 6 normals of
 * their bounding box proxy.
 */
std::vector<Vector3D> getFaceNormals(ShapeKind kind,
                                     const ReferenceFrame& frame,
                                     const Vector3D& extent);

/**
 * @brief World-space unique edge directions (unit length)
 *
 * Box 3, Wedge 4, CornerWedge 6. Sloped edge directions depend on the
 * extent, which is why it is required here.
 */
std::vector<Vector3D> getEdgeDirections(ShapeKind kind,
                                        const ReferenceFrame& frame,
                                        const Vector3D& extent);

/**
 * @brief Local half-space description of a polyhedral shape
 *
 * Ball and Cylinder return the planes of their bounding box proxy.
 */
std::vector<FacePlane> getLocalFacePlanes(ShapeKind kind,
                                          const Vector3D& extent);

/**
 * @brief Separating Axis Theorem test between two convex vertex sets
 *
 * Candidate axes are normalsA, normalsB and every cross product
 * edgesA[i] x edgesB[j] whose length is not negligible. Projections that
 * overlap by less than kGeometryEpsilon count as separated.
 *
 * @return true if no candidate axis separates the sets (intersecting).
 *         Symmetric in (A, B).
 */
bool sat(const std::vector<Coordinate>& vertsA,
         const std::vector<Vector3D>& normalsA,
         const std::vector<Vector3D>& edgesA,
         const std::vector<Coordinate>& vertsB,
         const std::vector<Vector3D>& normalsB,
         const std::vector<Vector3D>& edgesB);

/**
 * @brief SAT between two shapes using their vertex/normal/edge sets
 */
bool polyhedraIntersect(const OrientedShape& a, const OrientedShape& b);

/**
 * @brief Ball versus oriented box
 *
 * Clamps the sphere centre into box-local space and compares the squared
 * distance with the squared radius. Radius is half the minimum sphere extent
 * component.
 */
bool ballIntersectsBox(const ReferenceFrame& sphereFrame,
                       const Vector3D& sphereExtent,
                       const ReferenceFrame& boxFrame,
                       const Vector3D& boxExtent);

/**
 * @brief Cylinder versus oriented box
 *
 * Composite test:
 * 1. SAT against the cylinder's bounding box (fast rejection)
 * 2. Cylinder centre inside the box
 * 3. Each box edge as a segment against the axis segment (radius distance)
 * 4. Each box face against the axis segment (crossing, or endpoint within
 *    radius of the face)
 *
 * Steps 3 and 4 measure distance to the axis segment, i.e. they test the
 * capsule around it. Near the end caps this reports intersections slightly
 * outside the true cylinder (only where step 1 still overlaps). This
 * tolerance is relied upon by destruction visuals and must not be tightened.
 */
bool cylinderIntersectsBox(const ReferenceFrame& cylinderFrame,
                           const Vector3D& cylinderExtent,
                           const ReferenceFrame& boxFrame,
                           const Vector3D& boxExtent);

/**
 * @brief Dispatch to the intersection test for shape.kind against a box
 */
bool shapeIntersectsBox(const OrientedShape& shape,
                        const ReferenceFrame& boxFrame,
                        const Vector3D& boxExtent);

/**
 * @brief Inclusive point containment (within kGeometryEpsilon)
 */
bool containsPoint(const OrientedShape& shape, const Coordinate& point);

/**
 * @brief Test whether shape contains every point
 * @return true for an empty point set
 */
bool partContainsAllVerts(const OrientedShape& shape,
                          const std::vector<Coordinate>& points);

/**
 * @brief Index of the first point contained by shape, if any
 */
std::optional<size_t> partContainsAVert(const OrientedShape& shape,
                                        const std::vector<Coordinate>& points);

/**
 * @brief Test whether shape contains all 8 corners of an oriented box
 */
bool partEncapsulatesBox(const OrientedShape& shape,
                         const ReferenceFrame& boxFrame,
                         const Vector3D& boxExtent);

/**
 * @brief First face of shape crossed by the segment origin + t * direction,
 * t in [0, 1]
 *
 * Clips the segment against the face planes. Ball and Cylinder use their
 * bounding box proxy. A segment starting inside the shape enters no face
 * and reports no hit.
 */
std::optional<RayHit> raycast(const OrientedShape& shape,
                              const Coordinate& origin,
                              const Vector3D& direction);

/**
 * @brief World-space axis-aligned bounds of a shape
 */
Aabb computeAabb(ShapeKind kind,
                 const ReferenceFrame& frame,
                 const Vector3D& extent);

inline Aabb computeAabb(const OrientedShape& shape)
{
  return computeAabb(shape.kind, shape.frame, shape.extent);
}

}  // namespace GeometryKernel

}  // namespace shatter_sim

#endif  // SHATTER_SIM_GEOMETRY_GEOMETRY_KERNEL_HPP
