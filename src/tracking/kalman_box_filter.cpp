#include "ptrack/tracking/kalman_box_filter.hpp"

namespace ptrack {

KalmanBoxFilter::KalmanBoxFilter(const KalmanNoise& noise)
    : noise_(noise)
{
    x_.setZero();
    P_.setIdentity();

    buildMotionModel();
    buildMeasurementModel();
}

void KalmanBoxFilter::initialize(const MeasVector& z) {
    x_.setZero();
    x_.head<kMeasDim>() = z;

    P_.setIdentity();
    P_.bottomRightCorner<4, 4>() *= noise_.velocity_uncertainty;
}

void KalmanBoxFilter::buildMotionModel() {
    F_.setIdentity();

    // Position/size integrate their velocity, one frame per step
    F_.topRightCorner<4, 4>().setIdentity();

    Q_.setIdentity();
    Q_.bottomRightCorner<4, 4>() *= noise_.velocity_process_noise;
}

void KalmanBoxFilter::buildMeasurementModel() {
    H_.setZero();
    H_.leftCols<kMeasDim>().setIdentity();

    R_ = MeasMatrix::Identity() * noise_.measurement_noise;
}

void KalmanBoxFilter::predict() {
    x_ = F_ * x_;
    P_ = F_ * P_ * F_.transpose() + Q_;
}

bool KalmanBoxFilter::update(const MeasVector& z) {
    const MeasVector y = z - H_ * x_;
    const MeasMatrix S = H_ * P_ * H_.transpose() + R_;

    Eigen::FullPivLU<MeasMatrix> lu(S);
    if (!lu.isInvertible()) {
        return false;
    }

    const Eigen::Matrix<double, kStateDim, kMeasDim> K =
        P_ * H_.transpose() * lu.inverse();

    x_ = x_ + K * y;
    P_ = (StateMatrix::Identity() - K * H_) * P_;

    return is_finite();
}

bool KalmanBoxFilter::is_finite() const {
    return x_.allFinite() && P_.allFinite();
}

}  // namespace ptrack
