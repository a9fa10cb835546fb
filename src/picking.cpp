#include "picking.h"

#include <algorithm>
#include <cmath>

namespace hullforge_picking {

using manifold::vec3;
using manifold::mat3x4;
namespace la = manifold::la;

Ray PointerRay(int mouse_x, int mouse_y, const CameraModel &camera) {
    const double w = (double)(camera.viewport_width > 0 ? camera.viewport_width : 1);
    const double h = (double)(camera.viewport_height > 0 ? camera.viewport_height : 1);
    const double nx = ((double)mouse_x / w) * 2.0 - 1.0;
    const double ny = 1.0 - ((double)mouse_y / h) * 2.0;
    const CameraBasis &b = camera.basis;

    Ray ray;
    if (camera.mode == CameraMode::Orthographic) {
        const double half_h = camera.ortho_half_height;
        const double half_w = half_h * (w / h);
        ray.origin = camera.eye + b.right * (nx * half_w) + b.up * (ny * half_h);
        ray.direction = la::normalize(b.forward);
        return ray;
    }

    const double tan_half = std::tan((camera.fov_degrees * 3.14159265358979323846 / 180.0) * 0.5);
    const double x_cam = nx * tan_half * (w / h);
    const double y_cam = ny * tan_half;
    ray.origin = camera.eye;
    ray.direction = la::normalize(b.forward + b.right * x_cam + b.up * y_cam);
    return ray;
}

static bool ray_intersect_triangle(const vec3 &orig, const vec3 &dir,
                                   const vec3 &v0, const vec3 &v1, const vec3 &v2,
                                   double *t_out) {
    const double eps = 1e-9;
    const vec3 e1 = v1 - v0;
    const vec3 e2 = v2 - v0;
    const vec3 pvec = la::cross(dir, e2);
    const double det = la::dot(e1, pvec);
    if (det > -eps && det < eps) return false;
    const double inv_det = 1.0 / det;
    const vec3 tvec = orig - v0;
    const double u = la::dot(tvec, pvec) * inv_det;
    if (u < 0.0 || u > 1.0) return false;
    const vec3 qvec = la::cross(tvec, e1);
    const double v = la::dot(dir, qvec) * inv_det;
    if (v < 0.0 || u + v > 1.0) return false;
    const double t = la::dot(e2, qvec) * inv_det;
    if (t <= eps) return false;
    if (t_out) *t_out = t;
    return true;
}

static bool ray_aabb_hit(const vec3 &ray_origin, const vec3 &ray_dir,
                         const vec3 &bmin, const vec3 &bmax) {
    const double inf = 1e300;
    double tmin = -inf;
    double tmax = inf;
    for (int i = 0; i < 3; ++i) {
        if (std::fabs(ray_dir[i]) < 1e-12) {
            if (ray_origin[i] < bmin[i] || ray_origin[i] > bmax[i]) return false;
            continue;
        }
        const double inv = 1.0 / ray_dir[i];
        double t1 = (bmin[i] - ray_origin[i]) * inv;
        double t2 = (bmax[i] - ray_origin[i]) * inv;
        if (t1 > t2) std::swap(t1, t2);
        if (t1 > tmin) tmin = t1;
        if (t2 < tmax) tmax = t2;
        if (tmin > tmax) return false;
    }
    return tmax >= 0.0;
}

static vec3 mesh_pos(const manifold::MeshGL &mesh, size_t idx) {
    return vec3(mesh.vertProperties[idx * mesh.numProp + 0],
                mesh.vertProperties[idx * mesh.numProp + 1],
                mesh.vertProperties[idx * mesh.numProp + 2]);
}

bool RayMeshHit(const manifold::MeshGL &mesh, const Ray &ray, MeshHit *hit) {
    if (mesh.NumTri() == 0 || mesh.numProp < 3) return false;
    const size_t vert_count = mesh.NumVert();

    vec3 bmin = mesh_pos(mesh, 0);
    vec3 bmax = bmin;
    for (size_t i = 1; i < vert_count; ++i) {
        const vec3 p = mesh_pos(mesh, i);
        bmin = la::min(bmin, p);
        bmax = la::max(bmax, p);
    }
    const vec3 pad(1e-6, 1e-6, 1e-6);
    if (!ray_aabb_hit(ray.origin, ray.direction, bmin - pad, bmax + pad)) return false;

    double best_t = 1e300;
    int best_tri = -1;
    for (size_t tri = 0; tri < mesh.NumTri(); ++tri) {
        const size_t i0 = mesh.triVerts[tri * 3 + 0];
        const size_t i1 = mesh.triVerts[tri * 3 + 1];
        const size_t i2 = mesh.triVerts[tri * 3 + 2];
        if (i0 >= vert_count || i1 >= vert_count || i2 >= vert_count) continue;
        double t = 0.0;
        if (ray_intersect_triangle(ray.origin, ray.direction,
                                   mesh_pos(mesh, i0), mesh_pos(mesh, i1), mesh_pos(mesh, i2), &t) &&
            t < best_t) {
            best_t = t;
            best_tri = (int)tri;
        }
    }
    if (best_tri < 0) return false;
    if (hit) {
        hit->triangle = best_tri;
        hit->t = best_t;
        hit->point = ray.origin + ray.direction * best_t;
    }
    return true;
}

mat3x4 IdentityTransform() {
    return mat3x4(vec3(1.0, 0.0, 0.0), vec3(0.0, 1.0, 0.0), vec3(0.0, 0.0, 1.0), vec3(0.0, 0.0, 0.0));
}

mat3x4 TranslationTransform(const vec3 &offset) {
    mat3x4 m = IdentityTransform();
    m[3] = offset;
    return m;
}

vec3 TransformPoint(const mat3x4 &m, const vec3 &p) {
    return m[0] * p.x + m[1] * p.y + m[2] * p.z + m[3];
}

vec3 TransformDirection(const mat3x4 &m, const vec3 &d) {
    return m[0] * d.x + m[1] * d.y + m[2] * d.z;
}

mat3x4 InverseTransform(const mat3x4 &m) {
    const manifold::mat3 linear(m[0], m[1], m[2]);
    const manifold::mat3 inv = la::inverse(linear);
    const vec3 t = -(inv[0] * m[3].x + inv[1] * m[3].y + inv[2] * m[3].z);
    return mat3x4(inv[0], inv[1], inv[2], t);
}

Ray TransformRay(const mat3x4 &m, const Ray &ray) {
    Ray out;
    out.origin = TransformPoint(m, ray.origin);
    out.direction = TransformDirection(m, ray.direction);
    return out;
}

}  // namespace hullforge_picking
