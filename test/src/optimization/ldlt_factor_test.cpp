// Copyright (c) BoxMin contributors

#include <cmath>

#include <catch2/catch_test_macros.hpp>
#include <Eigen/Core>

#include "optimization/ldlt_factor.hpp"

namespace {

Eigen::MatrixXd test_L() {
  Eigen::MatrixXd L{4, 4};
  // clang-format off
  L <<  1.0,  0.0, 0.0, 0.0,
        0.5,  1.0, 0.0, 0.0,
       -0.3,  0.2, 1.0, 0.0,
        0.1, -0.4, 0.6, 1.0;
  // clang-format on
  return L;
}

Eigen::VectorXd test_D() { return Eigen::Vector4d{2.0, 1.5, 3.0, 0.8}; }

Eigen::VectorXd test_v() { return Eigen::Vector4d{0.3, -1.0, 0.5, 0.7}; }

boxmin::LDLTFactor make_factor() {
  boxmin::LDLTFactor factor{4};
  factor.set_factors(test_L(), test_D());
  return factor;
}

const Eigen::ArrayX<bool> none_fixed = Eigen::ArrayX<bool>::Constant(4, false);

}  // namespace

TEST_CASE("LDLTFactor - Starts as identity", "[LDLTFactor]") {
  boxmin::LDLTFactor factor{3};

  CHECK(factor.L() == Eigen::MatrixXd::Identity(3, 3));
  CHECK(factor.D() == Eigen::VectorXd::Ones(3));
  CHECK(factor.info() == Eigen::Success);
}

TEST_CASE("LDLTFactor - Rank-one increase", "[LDLTFactor]") {
  auto factor = make_factor();
  Eigen::MatrixXd expected =
      factor.matrix() + 0.7 * test_v() * test_v().transpose();

  factor.rank_one_update(test_v(), 0.7, none_fixed);

  REQUIRE(factor.info() == Eigen::Success);
  CHECK(factor.matrix().isApprox(expected, 1e-12));
  CHECK((factor.D().array() > 0.0).all());
  CHECK(factor.L().diagonal() == Eigen::VectorXd::Ones(4));
  CHECK(factor.L().isLowerTriangular());
}

TEST_CASE("LDLTFactor - Rank-one decrease", "[LDLTFactor]") {
  auto factor = make_factor();
  Eigen::MatrixXd expected =
      factor.matrix() - 0.1 * test_v() * test_v().transpose();

  factor.rank_one_update(test_v(), -0.1, none_fixed);

  REQUIRE(factor.info() == Eigen::Success);
  CHECK(factor.matrix().isApprox(expected, 1e-12));
  CHECK((factor.D().array() > 0.0).all());
  CHECK(factor.L().diagonal() == Eigen::VectorXd::Ones(4));
  CHECK(factor.L().isLowerTriangular());
}

TEST_CASE("LDLTFactor - Zero coefficient leaves factors unchanged",
          "[LDLTFactor]") {
  auto factor = make_factor();

  factor.rank_one_update(test_v(), 0.0, none_fixed);

  CHECK(factor.info() == Eigen::Success);
  CHECK(factor.L() == test_L());
  CHECK(factor.D() == test_D());
}

TEST_CASE("LDLTFactor - Update skips fixed variables", "[LDLTFactor]") {
  Eigen::ArrayX<bool> is_fixed = none_fixed;
  is_fixed[1] = true;

  auto factor = make_factor();
  factor.remove(1);

  Eigen::VectorXd w = test_v();
  w[1] = 0.0;

  SECTION("Increase") {
    Eigen::MatrixXd expected = factor.matrix() + 0.7 * w * w.transpose();
    factor.rank_one_update(test_v(), 0.7, is_fixed);

    REQUIRE(factor.info() == Eigen::Success);
    CHECK(factor.matrix().isApprox(expected, 1e-12));
  }

  SECTION("Decrease") {
    Eigen::MatrixXd expected = factor.matrix() - 0.1 * w * w.transpose();
    factor.rank_one_update(test_v(), -0.1, is_fixed);

    REQUIRE(factor.info() == Eigen::Success);
    CHECK(factor.matrix().isApprox(expected, 1e-12));
  }

  CHECK(factor.L().row(1).isZero());
  CHECK(factor.L().col(1).isZero());
  CHECK(factor.D()[1] == 0.0);
}

TEST_CASE("LDLTFactor - Restore resets row and column to identity",
          "[LDLTFactor]") {
  auto factor = make_factor();
  factor.restore(2);

  CHECK(factor.L().row(2).transpose() == Eigen::Vector4d{0.0, 0.0, 1.0, 0.0});
  CHECK(factor.L().col(2) == Eigen::Vector4d{0.0, 0.0, 1.0, 0.0});
  CHECK(factor.D()[2] == 1.0);
  CHECK(factor.L()(1, 0) == 0.5);
}

TEST_CASE("LDLTFactor - Solve", "[LDLTFactor]") {
  auto factor = make_factor();
  Eigen::VectorXd b = Eigen::Vector4d{1.0, -2.0, 0.5, 3.0};

  SECTION("No fixed variables") {
    Eigen::VectorXd x = factor.solve(b, none_fixed);

    REQUIRE(factor.info() == Eigen::Success);
    CHECK((factor.matrix() * x).isApprox(b, 1e-12));
  }

  SECTION("Fixed variable") {
    Eigen::ArrayX<bool> is_fixed = none_fixed;
    is_fixed[2] = true;
    factor.remove(2);

    Eigen::VectorXd x = factor.solve(b, is_fixed);

    REQUIRE(factor.info() == Eigen::Success);
    CHECK(x[2] == 0.0);

    // The free rows of LDLᵀx reproduce b
    Eigen::VectorXd Bx = factor.matrix() * x;
    for (int i : {0, 1, 3}) {
      CHECK(std::abs(Bx[i] - b[i]) < 1e-12);
    }
  }
}

TEST_CASE("LDLTFactor - Singular factor reports non-finite solution",
          "[LDLTFactor]") {
  auto factor = make_factor();
  factor.remove(1);

  // Row 1 is zeroed but still treated as free
  factor.solve(Eigen::Vector4d{1.0, 1.0, 1.0, 1.0}, none_fixed);

  CHECK(factor.info() == Eigen::NumericalIssue);
  CHECK_FALSE(factor.error_message().empty());
}

TEST_CASE("LDLTFactor - Overflowing increase reports non-finite D",
          "[LDLTFactor]") {
  const Eigen::ArrayX<bool> one_free = Eigen::ArrayX<bool>::Constant(1, false);
  boxmin::LDLTFactor factor{1};

  factor.rank_one_update(Eigen::VectorXd::Constant(1, 1e200), 1.0, one_free);

  CHECK(factor.info() == Eigen::NumericalIssue);
  CHECK(std::isinf(factor.D()[0]));
  CHECK_FALSE(factor.error_message().empty());
}

TEST_CASE("LDLTFactor - Decrease of a singular factor reports NaN D",
          "[LDLTFactor]") {
  const Eigen::ArrayX<bool> one_free = Eigen::ArrayX<bool>::Constant(1, false);
  boxmin::LDLTFactor factor{1};
  factor.set_factors(Eigen::MatrixXd::Identity(1, 1), Eigen::VectorXd::Zero(1));

  factor.rank_one_update(Eigen::VectorXd::Constant(1, 1.0), -1.0, one_free);

  CHECK(factor.info() == Eigen::NumericalIssue);
  CHECK(std::isnan(factor.D()[0]));
  CHECK_FALSE(factor.error_message().empty());
}
