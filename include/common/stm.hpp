#pragma once

#include <Eigen/Dense>

namespace common {

/// Number of position/velocity components in a state
constexpr int STATE_SIZE = 6;
/// Number of state-transition-matrix entries carried in an augmented state
constexpr int STM_SIZE = STATE_SIZE * STATE_SIZE;
/// Length of a state augmented with its flattened STM
constexpr int AUGMENTED_STATE_SIZE = STATE_SIZE + STM_SIZE;

using Matrix6d = Eigen::Matrix<double, 6, 6>;
using Vector6d = Eigen::Matrix<double, 6, 1>;

/// @brief Flattens a 6x6 STM into 36 values, column-major
///
/// @details Element Φ(i, j) is stored at flat index 6*j + i, which places it at
///          offset 6 + 6*j + i of an augmented state vector. unpack_stm() is the
///          exact inverse; every producer and consumer of augmented states must go
///          through this pair.
auto pack_stm(const Matrix6d& stm) -> Eigen::Matrix<double, STM_SIZE, 1>;

/// @brief Rebuilds the 6x6 STM from 36 column-major values
/// @throws common::ConfigurationError if flat does not hold exactly 36 values
auto unpack_stm(const Eigen::Ref<const Eigen::VectorXd>& flat) -> Matrix6d;

/// @brief Builds [x; pack_stm(I)] from a 6-element state
/// @throws common::ConfigurationError if state does not hold exactly 6 values
auto augment_with_identity(const Eigen::VectorXd& state) -> Eigen::VectorXd;

/// @brief Extracts the STM from a 42-element augmented state
/// @throws common::ConfigurationError if the state is not 42 elements
auto stm_of(const Eigen::VectorXd& augmented_state) -> Matrix6d;

} // namespace common
