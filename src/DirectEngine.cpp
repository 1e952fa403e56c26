#include "DirectEngine.h"

#ifdef _OPENMP
#include <omp.h>
#endif

DirectEngine::DirectEngine(const Config& config) : config_(config) {}

void DirectEngine::compute_deltas(const BodySnapshot& snap, double dt, std::vector<Vector2d>& dv) const {
    const size_t N = snap.size();
    dv.assign(N, Vector2d::Zero());

    const double G = config_.gravitational_constant;
    const Vector2d* const positions = snap.positions.data();
    const double* const masses = snap.masses.data();

    #ifdef _OPENMP
    #pragma omp parallel for schedule(static) if(config_.enable_threading && N > 256)
    #endif
    for (long long ii = 0; ii < (long long)N; ++ii) {
        const size_t i = (size_t)ii;
        Vector2d acc = Vector2d::Zero();
        for (size_t j = 0; j < N; ++j) {
            if (j == i) continue;
            acc += gravity_kick(positions[i], positions[j], masses[j], G, dt);
        }
        dv[i] = acc;
    }
}

std::chrono::nanoseconds DirectEngine::apply(BodyStore& bodies, double dt) {
    auto start = std::chrono::high_resolution_clock::now();

    const BodySnapshot snap = bodies.snapshot();
    compute_deltas(snap, dt, deltas_);
    bodies.apply_velocity_deltas(snap.ids, deltas_);

    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now() - start);
}
