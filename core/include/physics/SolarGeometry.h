#ifndef HELIOSTRATEGY_SOLAR_GEOMETRY_H
#define HELIOSTRATEGY_SOLAR_GEOMETRY_H

#include <cstdint>

namespace helio {
namespace physics {

/**
 * @brief Calendar date (proleptic Gregorian).
 */
struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;
};

/**
 * @brief Days since 1970-01-01 for a civil date.
 */
std::int64_t days_from_civil(int year, int month, int day);

/**
 * @brief Civil date for a count of days since 1970-01-01.
 */
CivilDate civil_from_days(std::int64_t days);

/**
 * @brief Day of the year, 1 for January 1st.
 */
int day_of_year(int year, int month, int day);

/**
 * @brief Local sunrise and sunset, in hours since local midnight.
 */
struct SunriseSunset {
    double sunrise_hours = 0.0;
    double sunset_hours = 0.0;
};

/**
 * @brief Clear-sky solar geometry and irradiance model.
 *
 * Angles are in degrees, times in hours since local midnight and time zone
 * offsets in hours east of UTC. The irradiance model is the Meinel
 * air-mass model with an altitude correction.
 */
class SolarGeometry {
public:
    static constexpr double SOLAR_CONSTANT = 1353.0;        ///< W/m^2
    static constexpr double ALTITUDE_COEFFICIENT = 0.14;    ///< Per km of elevation
    static constexpr double DIFFUSE_FRACTION = 0.1;         ///< DHI as a fraction of DNI

    /**
     * @brief Equation of time in minutes.
     */
    static double equation_of_time(int doy);

    /**
     * @brief Solar declination in degrees.
     */
    static double declination(int doy);

    /**
     * @brief Local solar time in hours.
     */
    static double local_solar_time(double local_time_hours, double longitude_deg,
                                   double time_zone_hours, int doy);

    /**
     * @brief Hour angle in degrees, 0 at solar noon.
     */
    static double hour_angle(double local_solar_time_hours);

    /**
     * @brief Sun elevation above the horizon in degrees.
     */
    static double elevation(double latitude_deg, double longitude_deg,
                            double time_zone_hours, int doy, double local_time_hours);

    /**
     * @brief Zenith angle in degrees (90 - elevation).
     */
    static double zenith(double latitude_deg, double longitude_deg,
                         double time_zone_hours, int doy, double local_time_hours);

    /**
     * @brief Solar azimuth in degrees.
     */
    static double azimuth(double latitude_deg, double longitude_deg,
                          double time_zone_hours, int doy, double local_time_hours);

    static SunriseSunset sunrise_sunset(double latitude_deg, double longitude_deg,
                                        double time_zone_hours, int doy);

    /**
     * @brief Direct normal irradiance for a zenith angle and site elevation.
     * @return DNI in W/m^2, 0 when the sun is below the horizon.
     */
    static double direct_normal_irradiance(double zenith_deg, double site_elevation_m);

    /**
     * @brief Global horizontal irradiance under a clear sky (W/m^2).
     */
    static double global_horizontal_irradiance(double latitude_deg, double longitude_deg,
                                               double time_zone_hours, int doy,
                                               double local_time_hours,
                                               double site_elevation_m);

    /**
     * @brief Attenuate clear-sky irradiance for cloud cover.
     * @param cloud_cover_percent Cloud cover, 0-100.
     *
     * Kasten-Czeplak: GHI_cloudy = GHI_clear * (1 - 0.75 * c^3.4).
     */
    static double apply_cloud_cover(double ghi, double cloud_cover_percent);
};

} // namespace physics
} // namespace helio

#endif // HELIOSTRATEGY_SOLAR_GEOMETRY_H
