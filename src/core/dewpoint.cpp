#include "core/dewpoint.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace humibridge
{
    namespace core
    {
        namespace
        {
            struct MagnusBand
            {
                double max_temperature;
                double a;
                double m;
                double tn;
            };

            // Equation 7 constants, valid up to and including max_temperature
            // (the 50..100 band is open at 100)
            constexpr MagnusBand kBands[] = {
                {50.0, 6.116441, 7.591386, 240.7263},
                {100.0, 6.004918, 7.337936, 229.3975},
                {150.0, 5.856548, 7.277310, 225.1033},
                {200.0, 6.002859, 7.290361, 227.1704},
                {350.0, 9.980622, 7.388931, 263.1239},
            };

            const MagnusBand &band_for(double temperature)
            {
                if (temperature <= kBands[0].max_temperature)
                    return kBands[0];
                if (temperature < kBands[1].max_temperature)
                    return kBands[1];
                for (size_t i = 2; i < sizeof(kBands) / sizeof(kBands[0]); ++i)
                {
                    if (temperature <= kBands[i].max_temperature)
                        return kBands[i];
                }
                return kBands[4];
            }

            // Saturation vapour pressure over water [hPa], equation 3
            double saturation_pressure(double temperature)
            {
                constexpr double C1 = -7.85951783;
                constexpr double C2 = 1.84408259;
                constexpr double C3 = -11.7866497;
                constexpr double C4 = 22.6807411;
                constexpr double C5 = -15.9618719;
                constexpr double C6 = 1.80122502;
                constexpr double Pc = 220640.0;
                constexpr double Tc = 647.096;

                double kelvin = temperature + 273.15;
                double x = 1.0 - kelvin / Tc;
                double y = (Tc / kelvin) * (C1 * x + C2 * std::pow(x, 1.5) + C3 * std::pow(x, 3.0) +
                                            C4 * std::pow(x, 3.5) + C5 * std::pow(x, 4.0) + C6 * std::pow(x, 7.5));
                return Pc * std::exp(y);
            }
        } // namespace

        double dewpoint(double temperature, double humidity)
        {
            if (!(temperature >= -20.0 && temperature <= 350.0))
            {
                std::ostringstream ss;
                ss << "temperature=" << temperature << " is not between -20 and +350 degree C";
                throw std::invalid_argument(ss.str());
            }
            if (!(humidity >= 0.0 && humidity <= 100.0))
            {
                std::ostringstream ss;
                ss << "humidity=" << humidity << " is not between 0 and 100 %RH";
                throw std::invalid_argument(ss.str());
            }

            double pw = saturation_pressure(temperature) * humidity / 100.0;

            const MagnusBand &band = band_for(temperature);
            return band.tn / (band.m / std::log10(pw / band.a) - 1.0);
        }

    } // namespace core
} // namespace humibridge
