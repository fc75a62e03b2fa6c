#include "common/stm.hpp"
#include "common/errors.hpp"

#include <string>

namespace common {

auto pack_stm(const Matrix6d& stm) -> Eigen::Matrix<double, STM_SIZE, 1> {
    Eigen::Matrix<double, STM_SIZE, 1> flat;
    for (int j = 0; j < STATE_SIZE; ++j) {
        for (int i = 0; i < STATE_SIZE; ++i) {
            flat(STATE_SIZE * j + i) = stm(i, j);
        }
    }
    return flat;
}

auto unpack_stm(const Eigen::Ref<const Eigen::VectorXd>& flat) -> Matrix6d {
    if (flat.size() != STM_SIZE) {
        throw ConfigurationError("Flattened STM must have 36 elements, got " + std::to_string(flat.size()));
    }
    Matrix6d stm;
    for (int j = 0; j < STATE_SIZE; ++j) {
        for (int i = 0; i < STATE_SIZE; ++i) {
            stm(i, j) = flat(STATE_SIZE * j + i);
        }
    }
    return stm;
}

auto augment_with_identity(const Eigen::VectorXd& state) -> Eigen::VectorXd {
    if (state.size() != STATE_SIZE) {
        throw ConfigurationError("State vector must have 6 elements to augment, got " + std::to_string(state.size()));
    }
    Eigen::VectorXd augmented(AUGMENTED_STATE_SIZE);
    augmented.head<STATE_SIZE>() = state;
    augmented.tail<STM_SIZE>() = pack_stm(Matrix6d::Identity());
    return augmented;
}

auto stm_of(const Eigen::VectorXd& augmented_state) -> Matrix6d {
    if (augmented_state.size() != AUGMENTED_STATE_SIZE) {
        throw ConfigurationError("Augmented state must have 42 elements, got " + std::to_string(augmented_state.size()));
    }
    return unpack_stm(augmented_state.tail<STM_SIZE>());
}

} // namespace common
