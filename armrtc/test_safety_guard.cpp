// test_safety_guard.cpp

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "safety_guard.h"
#include <Eigen/Dense>
#include <cmath>
#include <limits>

// ---------- helpers ----------
static inline Eigen::VectorXd V(std::initializer_list<double> xs) {
    Eigen::VectorXd v(xs.size());
    int i = 0; for (double x : xs) v[i++] = x;
    return v;
}

static inline void approx_vec(const Eigen::VectorXd& a, const Eigen::VectorXd& b, double eps=1e-9) {
    REQUIRE(a.size() == b.size());
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        INFO("i=" << i << " a=" << a[i] << " b=" << b[i]);
        REQUIRE(std::abs(a[i] - b[i]) <= eps);
    }
}

// Wide position limits so only the stage under test bites.
static SafetyLimits wide_limits() {
    SafetyLimits l;
    l.max_delta_rad = 0.05;
    l.max_joint_vel = 1.0;
    l.max_drift_rad = 0.5;
    l.joint_lower = Eigen::VectorXd::Constant(6, -6.0);
    l.joint_upper = Eigen::VectorXd::Constant(6,  6.0);
    return l;
}

TEST_CASE("Delta clamp limits every joint to max_delta_rad", "[safety]") {
    SafetyGuard guard(wide_limits());
    const Eigen::VectorXd current = Eigen::VectorXd::Zero(6);
    const Eigen::VectorXd target  = Eigen::VectorXd::Ones(6);

    // dt=0 skips the velocity stage
    Eigen::VectorXd out = guard.clamp(target, current, 0.0);
    approx_vec(out, Eigen::VectorXd::Constant(6, 0.05));
    REQUIRE(guard.get_violation_count() == 1);
    REQUIRE_FALSE(guard.is_frozen());
}

TEST_CASE("Delta clamp is symmetric and per joint", "[safety]") {
    SafetyGuard guard(wide_limits());
    Eigen::VectorXd current = V({0.1, 0.2, 0.3, 0.4, 0.5, 0.6});
    Eigen::VectorXd target  = current + V({-1.0, 0.01, 0.0, 2.0, -0.05, 0.049});

    Eigen::VectorXd out = guard.clamp(target, current, 0.0);
    approx_vec(out - current, V({-0.05, 0.01, 0.0, 0.05, -0.05, 0.049}));
}

TEST_CASE("Unclamped target passes through without a violation", "[safety]") {
    SafetyGuard guard(wide_limits());
    Eigen::VectorXd current = V({0.0, -1.0, 1.0, 0.0, 0.0, 0.0});
    Eigen::VectorXd target  = current + Eigen::VectorXd::Constant(6, 0.02);

    Eigen::VectorXd out = guard.clamp(target, current, 0.1);
    approx_vec(out, target, 0.0);
    REQUIRE(guard.get_violation_count() == 0);
}

TEST_CASE("Position clamp keeps the target within joint limits", "[safety]") {
    SafetyLimits l = wide_limits();
    l.joint_lower = V({-1, -1, -1, -1, -1, -1});
    l.joint_upper = V({ 1,  0.5, 1, 1, 1, 1});
    SafetyGuard guard(l);

    Eigen::VectorXd current = V({0.99, 0.48, 0.0, -0.99, 0.0, 0.0});
    Eigen::VectorXd target  = V({1.04, 0.53, 0.0, -1.04, 0.0, 0.0});

    Eigen::VectorXd out = guard.clamp(target, current, 0.0);
    approx_vec(out, V({1.0, 0.5, 0.0, -1.0, 0.0, 0.0}));
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        REQUIRE(out(i) >= l.joint_lower(i));
        REQUIRE(out(i) <= l.joint_upper(i));
    }
    REQUIRE(guard.get_violation_count() == 1);
}

TEST_CASE("Bounds are inclusive", "[safety]") {
    SafetyLimits l = wide_limits();
    l.joint_upper = Eigen::VectorXd::Constant(6, 0.5);
    SafetyGuard guard(l);

    Eigen::VectorXd current = Eigen::VectorXd::Constant(6, 0.45);
    Eigen::VectorXd target  = Eigen::VectorXd::Constant(6, 0.5);
    Eigen::VectorXd out = guard.clamp(target, current, 0.0);
    approx_vec(out, target);
    REQUIRE(guard.get_violation_count() == 0);
}

TEST_CASE("Velocity stage scales the whole displacement uniformly", "[safety]") {
    SafetyGuard guard(wide_limits());
    Eigen::VectorXd current = Eigen::VectorXd::Zero(6);
    Eigen::VectorXd target  = V({0.04, 0.02, -0.01, 0.0, 0.0, 0.0});

    // dt=0.02 -> implied 2.0 rad/s on joint 0 -> scale 0.5
    Eigen::VectorXd out = guard.clamp(target, current, 0.02);
    approx_vec(out, V({0.02, 0.01, -0.005, 0.0, 0.0, 0.0}));
    REQUIRE((out - current).cwiseAbs().maxCoeff() / 0.02 <= 1.0 + 1e-9);
    REQUIRE(guard.get_violation_count() == 1);
}

TEST_CASE("Several stages in one call count as one violation", "[safety]") {
    SafetyLimits l = wide_limits();
    l.joint_upper = Eigen::VectorXd::Constant(6, 0.03);
    SafetyGuard guard(l);

    Eigen::VectorXd current = Eigen::VectorXd::Zero(6);
    Eigen::VectorXd target  = Eigen::VectorXd::Ones(6);
    // delta -> 0.05, position -> 0.03, velocity 0.03/0.015 = 2 -> scale 0.5
    Eigen::VectorXd out = guard.clamp(target, current, 0.015);
    approx_vec(out, Eigen::VectorXd::Constant(6, 0.015));
    REQUIRE(guard.get_violation_count() == 1);
}

TEST_CASE("Drift watchdog freezes after 0.55 rad of accumulated motion", "[safety][drift]") {
    SafetyGuard guard(wide_limits());
    Eigen::VectorXd current = Eigen::VectorXd::Zero(6);
    guard.set_initial_reference(current);

    Eigen::VectorXd step = Eigen::VectorXd::Zero(6);
    step(0) = 0.05;

    for (int i = 1; i <= 10; ++i) {
        INFO("application " << i);
        Eigen::VectorXd target = current + step;
        Eigen::VectorXd out = guard.clamp(target, current, 0.1);
        approx_vec(out, target, 1e-12);
        REQUIRE_FALSE(guard.is_frozen());
        current = out;
    }
    REQUIRE(guard.get_violation_count() == 0);

    // 11th: 0.55 > 0.5
    Eigen::VectorXd out = guard.clamp(current + step, current, 0.1);
    approx_vec(out, current, 0.0);
    REQUIRE(guard.is_frozen());
    REQUIRE(guard.get_violation_count() == 1);

    // Frozen until reset, whatever the input
    Eigen::VectorXd back = current - step;
    approx_vec(guard.clamp(back, current, 0.1), current, 0.0);
    approx_vec(guard.clamp(current, current, 0.0), current, 0.0);
    REQUIRE(guard.is_frozen());
}

TEST_CASE("Drift watchdog can be disabled", "[safety][drift]") {
    SafetyGuard guard(wide_limits());
    guard.set_drift_watchdog_enabled(false);
    Eigen::VectorXd current = Eigen::VectorXd::Constant(6, 0.49);
    guard.set_initial_reference(Eigen::VectorXd::Zero(6));

    Eigen::VectorXd target = current + Eigen::VectorXd::Constant(6, 0.05);
    Eigen::VectorXd out = guard.clamp(target, current, 0.0);
    approx_vec(out, target);
    REQUIRE_FALSE(guard.is_frozen());
}

TEST_CASE("Reference is set once per episode and cleared by reset", "[safety][drift]") {
    SafetyGuard guard(wide_limits());
    REQUIRE_FALSE(guard.get_state().reference_q.has_value());
    approx_vec(guard.get_drift(Eigen::VectorXd::Ones(6)), Eigen::VectorXd::Zero(6));

    guard.set_initial_reference(Eigen::VectorXd::Zero(6));
    guard.set_initial_reference(Eigen::VectorXd::Ones(6)); // ignored
    approx_vec(*guard.get_state().reference_q, Eigen::VectorXd::Zero(6));
    approx_vec(guard.get_drift(V({0.1, -0.2, 0, 0, 0, 0})), V({0.1, 0.2, 0, 0, 0, 0}));

    // freeze, then reset
    Eigen::VectorXd current = Eigen::VectorXd::Constant(6, 0.49);
    guard.clamp(current + Eigen::VectorXd::Constant(6, 0.05), current, 0.0);
    REQUIRE(guard.is_frozen());

    guard.reset();
    REQUIRE_FALSE(guard.is_frozen());
    REQUIRE(guard.get_violation_count() == 0);
    REQUIRE_FALSE(guard.get_state().reference_q.has_value());

    guard.set_initial_reference(Eigen::VectorXd::Ones(6));
    approx_vec(*guard.get_state().reference_q, Eigen::VectorXd::Ones(6));
}

TEST_CASE("Delta invariant holds for arbitrary targets", "[safety]") {
    SafetyGuard guard(wide_limits());
    Eigen::VectorXd current = V({0.3, -0.7, 1.1, -2.0, 0.0, 2.5});
    for (int k = 0; k < 50; ++k) {
        Eigen::VectorXd target = current + Eigen::VectorXd::Random(6) * 3.0;
        Eigen::VectorXd out = guard.clamp(target, current, 1.0 / 30.0);
        REQUIRE((out - current).cwiseAbs().maxCoeff() <= 0.05 + 1e-12);
    }
}

TEST_CASE("Invalid limits and wrong sizes are rejected", "[safety]") {
    SafetyLimits l = wide_limits();
    l.max_delta_rad = 0.0;
    REQUIRE_THROWS_AS(SafetyGuard{l}, std::runtime_error);

    l = wide_limits();
    l.joint_lower(2) = 7.0;
    REQUIRE_THROWS_AS(SafetyGuard{l}, std::runtime_error);

    SafetyGuard guard(wide_limits());
    REQUIRE_THROWS_AS(guard.clamp(Eigen::VectorXd::Zero(5), Eigen::VectorXd::Zero(6), 0.0),
                      std::invalid_argument);
}

TEST_CASE("Non-finite targets are held at current and stay within limits", "[safety]") {
    SafetyLimits l = wide_limits();
    l.joint_lower = Eigen::VectorXd::Constant(6, -1.0);
    l.joint_upper = Eigen::VectorXd::Constant(6,  1.0);
    SafetyGuard guard(l);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    const Eigen::VectorXd current = Eigen::VectorXd::Zero(6);
    Eigen::VectorXd target = Eigen::VectorXd::Constant(6, 0.01);
    target(0) = nan;
    Eigen::VectorXd out = guard.clamp(target, current, 1.0 / 30.0);
    REQUIRE(out.allFinite());
    approx_vec(out, current);
    REQUIRE(guard.get_violation_count() == 1);
    REQUIRE_FALSE(guard.is_frozen());

    target(0) = -inf;
    out = guard.clamp(target, current, 1.0 / 30.0);
    approx_vec(out, current);
    REQUIRE(guard.get_violation_count() == 2);

    // current beyond a limit: the hold is still pulled back inside
    Eigen::VectorXd outside = Eigen::VectorXd::Zero(6);
    outside(3) = 1.02;
    out = guard.clamp(target, outside, 1.0 / 30.0);
    REQUIRE(out(3) == Approx(1.0));
    REQUIRE((out.array() >= -1.0).all());
    REQUIRE((out.array() <= 1.0).all());

    Eigen::VectorXd bad_current = Eigen::VectorXd::Zero(6);
    bad_current(5) = nan;
    REQUIRE_THROWS_AS(guard.clamp(current, bad_current, 1.0 / 30.0), std::invalid_argument);
}
