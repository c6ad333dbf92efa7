/**
 * @file nighttime_models.hpp
 * @brief The four nighttime ProxyVis regressions.
 * @author Watosn
 */
#pragma once

#include <array>

#include "geoproxyvis/pvis/proxy_vis_model.hpp"

namespace geoproxyvis::pvis {

/**
 * @brief Brightness temperature (K) of the 3.9 um channel separating low and high clouds.
 */
inline constexpr double kLowCloudThresholdK = 273.0;

/**
 * @brief Floor for |c11 - c07| before taking the log.
 */
inline constexpr double kMinLogValue = 3e-05;

/**
 * @brief Operational multi-channel two-regression model used by NWS.
 *
 * Separate coefficient sets for low (c07 >= 273 K) and high clouds:
 * `p3 + p2 * c07^5 + p1 * ln(max(|c11 - c07|, 3e-5)) + p0 * |c13 - c15|^0.4`.
 */
class MainTwoEqModel final : public IProxyVisModel {
 public:
  static constexpr std::array<double, 4> kLowCloudParams{-2.26927370e-02, -2.78297171e-02, -3.62361624e-13,
                                                         1.01373644e00};
  static constexpr std::array<double, 4> kHighCloudParams{-6.59761768e-02, -1.43734340e-02, -2.73490168e-13,
                                                          8.64012688e-01};

  [[nodiscard]] std::string_view name() const override { return kMainTwoEq; }
  [[nodiscard]] const std::vector<std::string>& required_args() const override;
  [[nodiscard]] ProxyVisResult evaluate(const core::ChannelArgs& args) const override;
};

/**
 * @brief Multi-channel single-regression model; same terms as the operational one.
 */
class MainOneEqModel final : public IProxyVisModel {
 public:
  static constexpr std::array<double, 4> kParams{-3.44571376e-02, -2.50124844e-02, -2.95821592e-13, 8.82291378e-01};

  [[nodiscard]] std::string_view name() const override { return kMainOneEq; }
  [[nodiscard]] const std::vector<std::string>& required_args() const override;
  [[nodiscard]] ProxyVisResult evaluate(const core::ChannelArgs& args) const override;
};

/**
 * @brief Single-channel two-regression model: `p1 + p0 * c07^5` per cloud class.
 */
class SimpleTwoEqModel final : public IProxyVisModel {
 public:
  static constexpr std::array<double, 2> kLowCloudParams{-3.87681489e-13, 9.92978382e-01};
  static constexpr std::array<double, 2> kHighCloudParams{-2.99123569e-13, 7.98853747e-01};

  [[nodiscard]] std::string_view name() const override { return kSimpleTwoEq; }
  [[nodiscard]] const std::vector<std::string>& required_args() const override;
  [[nodiscard]] ProxyVisResult evaluate(const core::ChannelArgs& args) const override;
};

/**
 * @brief Single-channel single-regression model.
 */
class SimpleOneEqModel final : public IProxyVisModel {
 public:
  static constexpr std::array<double, 2> kParams{-3.04491517e-13, 8.16054268e-01};

  [[nodiscard]] std::string_view name() const override { return kSimpleOneEq; }
  [[nodiscard]] const std::vector<std::string>& required_args() const override;
  [[nodiscard]] ProxyVisResult evaluate(const core::ChannelArgs& args) const override;
};

}  // namespace geoproxyvis::pvis
