// Copyright (c) BoxMin contributors

#include "boxmin/optimization/bounded_problem.hpp"

#include <span>

#include <Eigen/Core>

#include "boxmin/optimization/solver/active_set.hpp"
#include "boxmin/util/assert.hpp"

namespace boxmin {

BoundedProblem::BoundedProblem(int num_decision_variables)
    : m_num_decision_variables{num_decision_variables},
      m_bounds{Bounds::unbounded(num_decision_variables)} {
  boxmin_assert(num_decision_variables > 0);
}

ExitStatus BoundedProblem::solve(const Eigen::VectorXd& x0,
                                 const Options& options) {
  boxmin_assert(x0.rows() == m_num_decision_variables);
  boxmin_assert(m_callbacks.f && m_callbacks.g);

  m_x = x0;
  return resume(options);
}

ExitStatus BoundedProblem::resume(const Options& options) {
  // resume() needs an iterate from a previous solve()
  boxmin_assert(m_x.rows() == m_num_decision_variables);

  return active_set(m_callbacks,
                    std::span{m_iteration_callbacks.data(),
                              m_iteration_callbacks.size()},
                    options, m_bounds, m_x, &m_status);
}

}  // namespace boxmin
