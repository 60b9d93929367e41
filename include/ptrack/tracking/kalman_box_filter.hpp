#pragma once

#include <Eigen/Dense>

namespace ptrack {

/**
 * @brief Noise parameters of the box filter
 *
 * The filter starts confident in place and unsure of motion, and trusts
 * fresh detections more than long-run prediction drift.
 */
struct KalmanNoise {
    double measurement_noise = 10.0;        // R = measurement_noise * I
    double velocity_uncertainty = 1000.0;   // Initial P on velocity terms
    double velocity_process_noise = 0.01;   // Q on velocity terms
};

/**
 * @brief Constant-velocity Kalman filter over a bounding box
 *
 * State:       [cx cy w h vcx vcy vw vh]
 * Measurement: [cx cy w h]
 */
class KalmanBoxFilter {
public:
    static constexpr int kStateDim = 8;
    static constexpr int kMeasDim = 4;

    using StateVector = Eigen::Matrix<double, kStateDim, 1>;
    using StateMatrix = Eigen::Matrix<double, kStateDim, kStateDim>;
    using MeasVector = Eigen::Matrix<double, kMeasDim, 1>;
    using MeasMatrix = Eigen::Matrix<double, kMeasDim, kMeasDim>;

    explicit KalmanBoxFilter(const KalmanNoise& noise = KalmanNoise{});

    // Initialize from first observation, velocities zero
    void initialize(const MeasVector& z);

    // One constant-velocity step
    void predict();

    /**
     * @brief Correct with a measurement
     *
     * @return false if the innovation covariance is singular or the
     *         corrected state is not finite; the state is left untouched
     *         in the first case
     */
    bool update(const MeasVector& z);

    bool is_finite() const;

    const StateVector& x() const { return x_; }
    const StateMatrix& P() const { return P_; }

    StateVector& x() { return x_; }

private:
    void buildMotionModel();
    void buildMeasurementModel();

    KalmanNoise noise_;

    StateVector x_;
    StateMatrix P_;

    StateMatrix F_;
    StateMatrix Q_;
    Eigen::Matrix<double, kMeasDim, kStateDim> H_;
    MeasMatrix R_;
};

}  // namespace ptrack
