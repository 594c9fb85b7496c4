#include "physics/SolarGeometry.h"
#include "physics/PhysicsMath.h"

#include <algorithm>
#include <cmath>

namespace helio {
namespace physics {

std::int64_t days_from_civil(int year, int month, int day) {
    // Howard Hinnant's days_from_civil
    std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(std::int64_t days) {
    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const std::int64_t doe = days - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;

    CivilDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

int day_of_year(int year, int month, int day) {
    return static_cast<int>(days_from_civil(year, month, day) - days_from_civil(year, 1, 1)) + 1;
}

double SolarGeometry::equation_of_time(int doy) {
    double b = deg_to_rad((360.0 / 364.0) * (doy - 81));
    return 9.87 * std::sin(2.0 * b) - 7.83 * std::cos(b) - 1.5 * std::sin(b);
}

double SolarGeometry::declination(int doy) {
    return -23.45 * std::cos(deg_to_rad((360.0 / 365.0) * (doy + 10)));
}

double SolarGeometry::local_solar_time(double local_time_hours, double longitude_deg,
                                       double time_zone_hours, int doy) {
    double lstm = 15.0 * time_zone_hours;
    double time_correction = 4.0 * (longitude_deg - lstm) + equation_of_time(doy);
    return local_time_hours + time_correction / 60.0;
}

double SolarGeometry::hour_angle(double local_solar_time_hours) {
    return 15.0 * (local_solar_time_hours - 12.0);
}

double SolarGeometry::elevation(double latitude_deg, double longitude_deg,
                                double time_zone_hours, int doy, double local_time_hours) {
    double delta = deg_to_rad(declination(doy));
    double phi = deg_to_rad(latitude_deg);
    double h = deg_to_rad(hour_angle(
        local_solar_time(local_time_hours, longitude_deg, time_zone_hours, doy)));

    double s = std::sin(delta) * std::sin(phi) + std::cos(delta) * std::cos(phi) * std::cos(h);
    return rad_to_deg(std::asin(std::clamp(s, -1.0, 1.0)));
}

double SolarGeometry::zenith(double latitude_deg, double longitude_deg,
                             double time_zone_hours, int doy, double local_time_hours) {
    return 90.0 - elevation(latitude_deg, longitude_deg, time_zone_hours, doy, local_time_hours);
}

double SolarGeometry::azimuth(double latitude_deg, double longitude_deg,
                              double time_zone_hours, int doy, double local_time_hours) {
    double delta = deg_to_rad(declination(doy));
    double phi = deg_to_rad(latitude_deg);
    double h = deg_to_rad(hour_angle(
        local_solar_time(local_time_hours, longitude_deg, time_zone_hours, doy)));
    double elev = deg_to_rad(elevation(latitude_deg, longitude_deg, time_zone_hours, doy,
                                       local_time_hours));

    double cos_elev = std::cos(elev);
    if (cos_elev < 1e-12) {
        return 0.0;
    }

    double term = (std::sin(delta) * std::cos(phi) -
                   std::cos(delta) * std::sin(phi) * std::cos(h)) / cos_elev;
    double az = rad_to_deg(std::acos(std::clamp(term, -1.0, 1.0)));

    // Afternoon sun is in the western half
    return (h > 0.0) ? 360.0 - az : az;
}

SunriseSunset SolarGeometry::sunrise_sunset(double latitude_deg, double longitude_deg,
                                            double time_zone_hours, int doy) {
    double delta = deg_to_rad(declination(doy));
    double phi = deg_to_rad(latitude_deg);

    double cos_h0 = -(std::sin(phi) * std::sin(delta)) / (std::cos(phi) * std::cos(delta));
    double half_day = rad_to_deg(std::acos(std::clamp(cos_h0, -1.0, 1.0))) / 15.0;

    double lstm = 15.0 * time_zone_hours;
    double time_correction = (4.0 * (longitude_deg - lstm) + equation_of_time(doy)) / 60.0;

    SunriseSunset result;
    result.sunrise_hours = 12.0 - half_day - time_correction;
    result.sunset_hours = 12.0 + half_day - time_correction;
    return result;
}

double SolarGeometry::direct_normal_irradiance(double zenith_deg, double site_elevation_m) {
    if (zenith_deg >= 90.0) {
        return 0.0;
    }

    double air_mass = 1.0 / std::cos(deg_to_rad(zenith_deg));
    double altitude_km = site_elevation_m * 0.001;
    double altitude_gain = ALTITUDE_COEFFICIENT * altitude_km;

    double dni = SOLAR_CONSTANT *
                 ((1.0 - altitude_gain) * std::pow(0.7, std::pow(air_mass, 0.678)) + altitude_gain);
    return std::max(dni, 0.0);
}

double SolarGeometry::global_horizontal_irradiance(double latitude_deg, double longitude_deg,
                                                   double time_zone_hours, int doy,
                                                   double local_time_hours,
                                                   double site_elevation_m) {
    double z = zenith(latitude_deg, longitude_deg, time_zone_hours, doy, local_time_hours);
    double dni = direct_normal_irradiance(z, site_elevation_m);
    if (dni <= 0.0) {
        return 0.0;
    }
    double dhi = DIFFUSE_FRACTION * dni;
    return dni * std::cos(deg_to_rad(z)) + dhi;
}

double SolarGeometry::apply_cloud_cover(double ghi, double cloud_cover_percent) {
    double c = std::clamp(cloud_cover_percent / 100.0, 0.0, 1.0);
    return ghi * (1.0 - 0.75 * std::pow(c, 3.4));
}

} // namespace physics
} // namespace helio
