#ifndef HULLFORGE_PICKING_H_
#define HULLFORGE_PICKING_H_

#include "manifold/manifold.h"

namespace hullforge_picking {

struct Ray {
    manifold::vec3 origin = {0.0, 0.0, 0.0};
    manifold::vec3 direction = {0.0, 0.0, -1.0};
};

struct CameraBasis {
    manifold::vec3 forward = {0.0, 0.0, -1.0};
    manifold::vec3 right = {1.0, 0.0, 0.0};
    manifold::vec3 up = {0.0, 1.0, 0.0};
};

enum class CameraMode {
    Perspective,
    Orthographic,
};

// Either camera a viewer can hold. Perspective reads fov_degrees; orthographic
// reads ortho_half_height (world units visible above the view centre).
struct CameraModel {
    CameraMode mode = CameraMode::Perspective;
    int viewport_width = 1;
    int viewport_height = 1;
    manifold::vec3 eye = {0.0, 0.0, 10.0};
    CameraBasis basis = {};
    double fov_degrees = 65.0;
    double ortho_half_height = 10.0;
};

// World ray through a window pixel (origin top-left).
Ray PointerRay(int mouse_x, int mouse_y, const CameraModel &camera);

struct MeshHit {
    int triangle = -1;
    double t = 0.0;
    manifold::vec3 point = {0.0, 0.0, 0.0};
};

// Nearest two-sided triangle hit in the mesh's own coordinates.
bool RayMeshHit(const manifold::MeshGL &mesh, const Ray &ray, MeshHit *hit);

manifold::mat3x4 IdentityTransform();
manifold::mat3x4 TranslationTransform(const manifold::vec3 &offset);
manifold::vec3 TransformPoint(const manifold::mat3x4 &m, const manifold::vec3 &p);
manifold::vec3 TransformDirection(const manifold::mat3x4 &m, const manifold::vec3 &d);
manifold::mat3x4 InverseTransform(const manifold::mat3x4 &m);
Ray TransformRay(const manifold::mat3x4 &m, const Ray &ray);

}  // namespace hullforge_picking

#endif  // HULLFORGE_PICKING_H_
