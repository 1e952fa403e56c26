#include <gtest/gtest.h>
#include "BodyStore.h"
#include "BodyFactory.h"
#include "Simulation.h"
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

TEST(BodyStore, IdsAreUniqueAndIncreasing) {
  BodyStore bodies;
  std::vector<BodyId> ids;
  for (int i = 0; i < 20; ++i) {
    ids.push_back(bodies.add_body({i * 5.0, 0.0}, {0, 0}, 1.0));
  }
  for (size_t i = 1; i < ids.size(); ++i) {
    EXPECT_GT(ids[i], ids[i - 1]);
  }

  // a second store never reuses an id
  BodyStore other;
  EXPECT_GT(other.add_body({0, 0}, {0, 0}, 1.0), ids.back());
}

TEST(BodyStore, IterationFollowsIdOrder) {
  BodyStore bodies;
  const BodyId a = bodies.add_body({3, 0}, {0, 0}, 1.0);
  const BodyId b = bodies.add_body({1, 0}, {0, 0}, 1.0);
  const BodyId c = bodies.add_body({2, 0}, {0, 0}, 1.0);
  bodies.remove(b);
  const BodyId d = bodies.add_body({0, 0}, {0, 0}, 1.0);

  const auto snap = bodies.snapshot();
  ASSERT_EQ(snap.size(), 3u);
  EXPECT_EQ(snap.ids, (std::vector<BodyId>{a, c, d}));
  EXPECT_EQ(snap.positions[0], Vector2d(3, 0));
  EXPECT_EQ(snap.positions[2], Vector2d(0, 0));
}

TEST(BodyStore, RadiusIsCubeRootOfMass) {
  BodyStore bodies;
  const BodyId id = bodies.add_body({0, 0}, {0, 0}, 27.0);
  EXPECT_DOUBLE_EQ(bodies.at(id).radius, 3.0);
  EXPECT_DOUBLE_EQ(Body::radius_for_mass(8.0), 2.0);
}

TEST(BodyStore, RejectsBadMass) {
  BodyStore bodies;
  EXPECT_THROW(bodies.add_body({0, 0}, {0, 0}, 0.0), std::invalid_argument);
  EXPECT_THROW(bodies.add_body({0, 0}, {0, 0}, -1.0), std::invalid_argument);
  EXPECT_THROW(bodies.add_body({0, 0}, {0, 0}, std::numeric_limits<double>::quiet_NaN()),
               std::invalid_argument);
  EXPECT_THROW(bodies.add_body({0, 0}, {0, 0}, std::numeric_limits<double>::infinity()),
               std::invalid_argument);
  EXPECT_TRUE(bodies.empty());
}

TEST(BodyStore, UnknownIdsFailLoudly) {
  BodyStore bodies;
  const BodyId id = bodies.add_body({0, 0}, {0, 0}, 1.0);

  EXPECT_THROW(bodies.remove(id + 1000), std::out_of_range);
  EXPECT_THROW(bodies.at(id + 1000), std::out_of_range);
  EXPECT_FALSE(bodies.erase(id + 1000));

  EXPECT_TRUE(bodies.erase(id));
  EXPECT_FALSE(bodies.contains(id));
  EXPECT_THROW(bodies.remove(id), std::out_of_range);

  bodies.add_body({0, 0}, {0, 0}, 1.0);
  bodies.add_body({5, 0}, {0, 0}, 1.0);
  bodies.clear();
  EXPECT_TRUE(bodies.empty());
  EXPECT_EQ(bodies.size(), 0u);
}

TEST(BodyStore, StaleVelocityWriteBackThrows) {
  BodyStore bodies;
  const BodyId a = bodies.add_body({0, 0}, {0, 0}, 1.0);
  const BodyId b = bodies.add_body({10, 0}, {0, 0}, 1.0);
  const auto snap = bodies.snapshot();

  bodies.merge(a, b);
  const std::vector<Vector2d> dv(snap.size(), Vector2d(1, 1));
  EXPECT_THROW(bodies.apply_velocity_deltas(snap.ids, dv), std::out_of_range);

  const std::vector<Vector2d> short_dv(1, Vector2d::Zero());
  EXPECT_THROW(bodies.apply_velocity_deltas(snap.ids, short_dv), std::invalid_argument);
}

TEST(BodyStore, MergeConservesMassAndMomentum) {
  BodyStore bodies;
  const BodyId a = bodies.add_body({0, 0}, {2, 0}, 1.0);
  const BodyId b = bodies.add_body({4, 2}, {0, -1}, 3.0);
  const Vector2d p_before = bodies.total_momentum();
  const Vector2d com_before = bodies.center_of_mass();

  const BodyId product = bodies.merge(a, b);

  ASSERT_EQ(bodies.size(), 1u);
  const Body& body = bodies.at(product);
  EXPECT_DOUBLE_EQ(body.mass, 4.0);
  EXPECT_DOUBLE_EQ(body.radius, std::cbrt(4.0));
  EXPECT_NEAR((body.momentum() - p_before).norm(), 0.0, 1e-12);
  EXPECT_NEAR((body.pos - com_before).norm(), 0.0, 1e-12);
  EXPECT_EQ(body.vel, Vector2d(0.5, -0.75));
}

TEST(BodyStore, NormalizeMomentumZeroesNetMomentum) {
  BodyStore bodies;
  bodies.add_body({0, 0}, {1, 2}, 1.0);
  bodies.add_body({5, 0}, {-3, 4}, 2.0);
  bodies.add_body({0, 5}, {0.5, 0}, 4.0);

  const std::vector<Vector2d> before = [&] {
    std::vector<Vector2d> v;
    for (const auto& [id, body] : bodies) v.push_back(body.vel);
    return v;
  }();

  EventBus bus;
  Simulation sim(bus);
  sim.normalize_momentum(bodies);

  EXPECT_NEAR(bodies.total_momentum().norm(), 0.0, 1e-12);

  // every body moved by the same offset
  std::vector<Vector2d> offsets;
  size_t i = 0;
  for (const auto& [id, body] : bodies) offsets.push_back(body.vel - before[i++]);
  for (const auto& o : offsets) {
    EXPECT_NEAR((o - offsets[0]).norm(), 0.0, 1e-12);
  }
}

TEST(BodyStore, NormalizeOnEmptyStoreIsNoOp) {
  BodyStore bodies;
  EXPECT_NO_THROW(bodies.normalize_momentum());
  EXPECT_EQ(bodies.total_momentum(), Vector2d::Zero());
  EXPECT_EQ(bodies.center_of_mass(), Vector2d::Zero());
}

TEST(BodyStore, BoundingRectCoversDiscs) {
  BodyStore bodies;
  bodies.add_body({0, 0}, {0, 0}, 1.0);
  bodies.add_body({10, -4}, {0, 0}, 8.0);

  const auto r = bodies.bounding_rect();
  ASSERT_TRUE(r.valid());
  EXPECT_DOUBLE_EQ(r.min_x, -1.0);
  EXPECT_DOUBLE_EQ(r.max_x, 12.0);
  EXPECT_DOUBLE_EQ(r.min_y, -6.0);
  EXPECT_DOUBLE_EQ(r.max_y, 1.0);

  EXPECT_FALSE(BodyStore().bounding_rect().valid());
}

TEST(BodyStore, OnlyVelocityIsWritableFromOutside) {
  static_assert(std::is_same_v<decltype(std::declval<BodyStore&>().at(BodyId{})), const Body&>);
  static_assert(std::is_same_v<decltype(*std::declval<BodyStore&>().begin()),
                               const std::pair<const BodyId, Body>&>);

  BodyStore bodies;
  const BodyId id = bodies.add_body({1, 2}, {0, 0}, 8.0);
  bodies.set_velocity(id, Vector2d(3, -4));

  const Body& body = bodies.at(id);
  EXPECT_EQ(body.vel, Vector2d(3, -4));
  EXPECT_EQ(body.pos, Vector2d(1, 2));
  EXPECT_DOUBLE_EQ(body.mass, 8.0);
  EXPECT_DOUBLE_EQ(body.radius, 2.0);

  EXPECT_THROW(bodies.set_velocity(id + 1000, Vector2d::Zero()), std::out_of_range);
}

TEST(BodyStore, CopiesAreIndependent) {
  BodyStore bodies;
  const BodyId id = bodies.add_body({0, 0}, {1, 0}, 1.0);
  BodyStore copy = bodies;

  copy.drift(2.0);
  EXPECT_EQ(copy.at(id).pos, Vector2d(2, 0));
  EXPECT_EQ(bodies.at(id).pos, Vector2d(0, 0));
}

//===========================================================================================
//==                                    FACTORY                                            ==
//===========================================================================================

TEST(BodyFactory, RandomDiscHasNoNetMomentum) {
  BodyStore bodies;
  BodyFactory factory(bodies);
  factory.create_random_disc(DEFAULT_BODY_COUNT, Vector2d(100, 50), 300.0, 200.0);

  ASSERT_EQ(bodies.size(), DEFAULT_BODY_COUNT);
  EXPECT_NEAR(bodies.total_momentum().norm(), 0.0, 1e-9);
  EXPECT_DOUBLE_EQ(bodies.total_mass(), double(DEFAULT_BODY_COUNT) * INITIAL_MASS);

  for (const auto& [id, body] : bodies) {
    const Vector2d rel = body.pos - Vector2d(100, 50);
    const double e = (rel.x() / 300.0) * (rel.x() / 300.0) + (rel.y() / 200.0) * (rel.y() / 200.0);
    EXPECT_LE(e, 1.0 + 1e-12);
  }
}

TEST(BodyFactory, RandomDiscIsReproducible) {
  BodyStore a, b;
  BodyFactory(a).create_random_disc(100, Vector2d::Zero(), 50.0, 50.0, 1.0, 0.05, 9);
  BodyFactory(b).create_random_disc(100, Vector2d::Zero(), 50.0, 50.0, 1.0, 0.05, 9);

  auto ia = a.begin();
  auto ib = b.begin();
  for (; ia != a.end(); ++ia, ++ib) {
    EXPECT_EQ(ia->second.pos, ib->second.pos);
    EXPECT_EQ(ia->second.vel, ib->second.vel);
  }
}

TEST(BodyFactory, RingMovesTangentially) {
  BodyStore bodies;
  BodyFactory factory(bodies);
  factory.create_ring(12, Vector2d(5, 5), 20.0, 1.0, 0.3);

  ASSERT_EQ(bodies.size(), 12u);
  for (const auto& [id, body] : bodies) {
    const Vector2d rel = body.pos - Vector2d(5, 5);
    EXPECT_NEAR(rel.norm(), 20.0, 1e-9);
    EXPECT_NEAR(rel.dot(body.vel), 0.0, 1e-9);
    EXPECT_NEAR(body.vel.norm(), 0.3, 1e-12);
  }
}

TEST(BodyFactory, BinaryOrbitsBarycenter) {
  BodyStore bodies;
  BodyFactory factory(bodies);
  factory.create_binary(Vector2d(0, 0), 30.0, 1.0, 3.0);

  ASSERT_EQ(bodies.size(), 2u);
  EXPECT_NEAR(bodies.center_of_mass().norm(), 0.0, 1e-12);
  EXPECT_NEAR(bodies.total_momentum().norm(), 0.0, 1e-12);

  // circular speed: relative velocity^2 == G M / d
  auto it = bodies.begin();
  const Body& a = it->second;
  const Body& b = (++it)->second;
  EXPECT_NEAR((a.vel - b.vel).squaredNorm(), G_DEFAULT * 4.0 / 30.0, 1e-12);
}

TEST(BodyFactory, RandomBodiesDoNotOverlap) {
  BodyStore bodies;
  BodyFactory factory(bodies);
  factory.add_random_bodies(80, 50.0, 1.0);

  EXPECT_EQ(bodies.size(), 80u);
  for (auto it = bodies.begin(); it != bodies.end(); ++it) {
    for (auto jt = std::next(it); jt != bodies.end(); ++jt) {
      EXPECT_GE((it->second.pos - jt->second.pos).norm(), it->second.radius + jt->second.radius);
    }
  }
}
