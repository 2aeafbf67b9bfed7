/// @file geodesic.cpp
/// @brief Vincenty direct/inverse solutions and haversine distance.

#include "geodesy/geodesic.hpp"

#include "core/logger.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>

namespace
{

using namespace slantcol;

constexpr f64 kA = earth_constants::kWgs84A;
constexpr f64 kB = earth_constants::kWgs84B;
constexpr f64 kF = earth_constants::kWgs84F;

constexpr f64 kSigmaTolerance  = 1e-12;
constexpr i32 kMaxIterations   = 200;

/// Vincenty's A and B series coefficients for u² = cos²α (a² − b²) / b².
void series_coefficients(f64 cos_sq_alpha, f64& big_a, f64& big_b)
{
    const f64 u_sq = cos_sq_alpha * (kA * kA - kB * kB) / (kB * kB);
    big_a = 1.0 + u_sq / 16384.0 * (4096.0 + u_sq * (-768.0 + u_sq * (320.0 - 175.0 * u_sq)));
    big_b = u_sq / 1024.0 * (256.0 + u_sq * (-128.0 + u_sq * (74.0 - 47.0 * u_sq)));
}

f64 delta_sigma(f64 big_b, f64 sin_sigma, f64 cos_sigma, f64 cos_2sigma_m)
{
    const f64 c2 = cos_2sigma_m * cos_2sigma_m;
    return big_b * sin_sigma * (cos_2sigma_m + big_b / 4.0 * (
        cos_sigma * (-1.0 + 2.0 * c2)
        - big_b / 6.0 * cos_2sigma_m * (-3.0 + 4.0 * sin_sigma * sin_sigma) * (-3.0 + 4.0 * c2)));
}

} // anonymous namespace

namespace slantcol::geodesy
{

// -----------------------------------------------------------------
// Direct problem (Vincenty 1975)
//
// tan U1 = (1 − f) tan φ1
// σ1     = atan2(tan U1, cos α1)
// sin α  = cos U1 sin α1
// σ      = s / (b A) + Δσ, iterated until stable
// -----------------------------------------------------------------

DirectSolution Geodesic::direct(const GeoPoint& origin, f64 azimuth_deg, f64 distance_m)
{
    if (distance_m == 0.0)
    {
        return DirectSolution{
            .destination       = origin,
            .final_azimuth_deg = normalize_azimuth(azimuth_deg),
        };
    }

    const f64 alpha1 = glm::radians(azimuth_deg);
    const f64 sin_alpha1 = std::sin(alpha1);
    const f64 cos_alpha1 = std::cos(alpha1);

    const f64 tan_u1 = (1.0 - kF) * std::tan(glm::radians(origin.latitude));
    const f64 cos_u1 = 1.0 / std::sqrt(1.0 + tan_u1 * tan_u1);
    const f64 sin_u1 = tan_u1 * cos_u1;

    const f64 sigma1 = std::atan2(tan_u1, cos_alpha1);
    const f64 sin_alpha = cos_u1 * sin_alpha1;
    const f64 cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;

    f64 big_a = 0.0;
    f64 big_b = 0.0;
    series_coefficients(cos_sq_alpha, big_a, big_b);

    const f64 sigma0 = distance_m / (kB * big_a);
    f64 sigma = sigma0;
    f64 sigma_prev = 0.0;
    f64 sin_sigma = 0.0;
    f64 cos_sigma = 0.0;
    f64 cos_2sigma_m = 0.0;

    i32 iterations = 0;
    do
    {
        cos_2sigma_m = std::cos(2.0 * sigma1 + sigma);
        sin_sigma = std::sin(sigma);
        cos_sigma = std::cos(sigma);

        sigma_prev = sigma;
        sigma = sigma0 + delta_sigma(big_b, sin_sigma, cos_sigma, cos_2sigma_m);
    } while (std::abs(sigma - sigma_prev) > kSigmaTolerance && ++iterations < kMaxIterations);

    // Final trig terms for the converged σ
    cos_2sigma_m = std::cos(2.0 * sigma1 + sigma);
    sin_sigma = std::sin(sigma);
    cos_sigma = std::cos(sigma);

    const f64 x = sin_u1 * sin_sigma - cos_u1 * cos_sigma * cos_alpha1;
    const f64 phi2 = std::atan2(sin_u1 * cos_sigma + cos_u1 * sin_sigma * cos_alpha1,
                                (1.0 - kF) * std::sqrt(sin_alpha * sin_alpha + x * x));

    const f64 lambda = std::atan2(sin_sigma * sin_alpha1,
                                  cos_u1 * cos_sigma - sin_u1 * sin_sigma * cos_alpha1);
    const f64 c = kF / 16.0 * cos_sq_alpha * (4.0 + kF * (4.0 - 3.0 * cos_sq_alpha));
    const f64 big_l = lambda - (1.0 - c) * kF * sin_alpha * (
        sigma + c * sin_sigma * (cos_2sigma_m + c * cos_sigma * (-1.0 + 2.0 * cos_2sigma_m * cos_2sigma_m)));

    const f64 alpha2 = std::atan2(sin_alpha, -x);

    return DirectSolution{
        .destination = GeoPoint{
            .latitude  = glm::degrees(phi2),
            .longitude = normalize_longitude(origin.longitude + glm::degrees(big_l)),
        },
        .final_azimuth_deg = normalize_azimuth(glm::degrees(alpha2)),
    };
}

// -----------------------------------------------------------------
// Inverse problem (Vincenty 1975)
// -----------------------------------------------------------------

std::optional<InverseSolution> Geodesic::inverse(const GeoPoint& from, const GeoPoint& to)
{
    const f64 big_l = glm::radians(to.longitude - from.longitude);

    const f64 u1 = std::atan((1.0 - kF) * std::tan(glm::radians(from.latitude)));
    const f64 u2 = std::atan((1.0 - kF) * std::tan(glm::radians(to.latitude)));
    const f64 sin_u1 = std::sin(u1);
    const f64 cos_u1 = std::cos(u1);
    const f64 sin_u2 = std::sin(u2);
    const f64 cos_u2 = std::cos(u2);

    f64 lambda = big_l;
    f64 lambda_prev = 0.0;
    f64 sin_lambda = 0.0;
    f64 cos_lambda = 0.0;
    f64 sin_sigma = 0.0;
    f64 cos_sigma = 0.0;
    f64 sigma = 0.0;
    f64 cos_sq_alpha = 0.0;
    f64 cos_2sigma_m = 0.0;

    i32 iterations = 0;
    do
    {
        sin_lambda = std::sin(lambda);
        cos_lambda = std::cos(lambda);

        const f64 t1 = cos_u2 * sin_lambda;
        const f64 t2 = cos_u1 * sin_u2 - sin_u1 * cos_u2 * cos_lambda;
        sin_sigma = std::sqrt(t1 * t1 + t2 * t2);

        if (sin_sigma == 0.0)
        {
            // Coincident points
            return InverseSolution{
                .distance_m          = 0.0,
                .initial_azimuth_deg = 0.0,
                .final_azimuth_deg   = 0.0,
            };
        }

        cos_sigma = sin_u1 * sin_u2 + cos_u1 * cos_u2 * cos_lambda;
        sigma = std::atan2(sin_sigma, cos_sigma);

        const f64 sin_alpha = cos_u1 * cos_u2 * sin_lambda / sin_sigma;
        cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;

        // Equatorial line: cos²α = 0
        cos_2sigma_m = (cos_sq_alpha == 0.0) ? 0.0 : cos_sigma - 2.0 * sin_u1 * sin_u2 / cos_sq_alpha;

        const f64 c = kF / 16.0 * cos_sq_alpha * (4.0 + kF * (4.0 - 3.0 * cos_sq_alpha));

        lambda_prev = lambda;
        lambda = big_l + (1.0 - c) * kF * sin_alpha * (
            sigma + c * sin_sigma * (cos_2sigma_m + c * cos_sigma * (-1.0 + 2.0 * cos_2sigma_m * cos_2sigma_m)));
    } while (std::abs(lambda - lambda_prev) > kSigmaTolerance && ++iterations < kMaxIterations);

    if (iterations >= kMaxIterations)
    {
        SLC_CORE_WARN("Geodesic: inverse did not converge between ({:.6f}, {:.6f}) and ({:.6f}, {:.6f})",
                      from.latitude, from.longitude, to.latitude, to.longitude);
        return std::nullopt;
    }

    f64 big_a = 0.0;
    f64 big_b = 0.0;
    series_coefficients(cos_sq_alpha, big_a, big_b);

    const f64 distance = kB * big_a * (sigma - delta_sigma(big_b, sin_sigma, cos_sigma, cos_2sigma_m));

    const f64 alpha1 = std::atan2(cos_u2 * sin_lambda, cos_u1 * sin_u2 - sin_u1 * cos_u2 * cos_lambda);
    const f64 alpha2 = std::atan2(cos_u1 * sin_lambda, -sin_u1 * cos_u2 + cos_u1 * sin_u2 * cos_lambda);

    return InverseSolution{
        .distance_m          = distance,
        .initial_azimuth_deg = normalize_azimuth(glm::degrees(alpha1)),
        .final_azimuth_deg   = normalize_azimuth(glm::degrees(alpha2)),
    };
}

// -----------------------------------------------------------------
// Haversine
//
// a = sin²(Δφ/2) + cos φ1 cos φ2 sin²(Δλ/2)
// d = 2 R asin(√a)
// -----------------------------------------------------------------

f64 Geodesic::haversine_distance(const GeoPoint& a, const GeoPoint& b)
{
    const f64 phi1 = glm::radians(a.latitude);
    const f64 phi2 = glm::radians(b.latitude);
    const f64 half_dphi = glm::radians(b.latitude - a.latitude) / 2.0;
    const f64 half_dlam = glm::radians(b.longitude - a.longitude) / 2.0;

    const f64 h = std::sin(half_dphi) * std::sin(half_dphi)
                + std::cos(phi1) * std::cos(phi2) * std::sin(half_dlam) * std::sin(half_dlam);

    return 2.0 * earth_constants::kMeanRadius * std::asin(std::sqrt(std::min(h, 1.0)));
}

f64 Geodesic::normalize_longitude(f64 lon_deg)
{
    lon_deg = std::fmod(lon_deg + 180.0, 360.0);
    if (lon_deg < 0.0)
    {
        lon_deg += 360.0;
    }
    return lon_deg - 180.0;
}

f64 Geodesic::normalize_azimuth(f64 az_deg)
{
    az_deg = std::fmod(az_deg, 360.0);
    return (az_deg < 0.0) ? az_deg + 360.0 : az_deg;
}

} // namespace slantcol::geodesy
