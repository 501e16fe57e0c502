/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

namespace meshmap {

/**
 * Great-circle helpers for node coordinates (degrees latitude/longitude).
 *
 * Inputs outside the valid latitude/longitude ranges are not rejected; the
 * result is simply whatever the formulas produce.
 */
class GeoUtils {
 public:
  /** Mean radius of the Earth in kilometers. */
  static constexpr double kEarthRadiusKm{6371.0};

  /**
   * Distance in kilometers between two points using the haversine formula,
   * rounded to 3 decimal places.
   */
  static double distance(double lat1, double lon1, double lat2, double lon2);

  /**
   * Initial bearing in degrees from the first point towards the second,
   * rounded to 1 decimal place. The result lies in [-180, 180].
   */
  static double bearing(double lat1, double lon1, double lat2, double lon2);

 private:
  /** Haversine of an angle (in radians). */
  static double hav(double theta);

  /** Round to the given number of decimal places. */
  static double round(double value, int places);
};

} // namespace meshmap
