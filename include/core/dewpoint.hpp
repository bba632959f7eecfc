#ifndef HUMIBRIDGE_CORE_DEWPOINT_HPP
#define HUMIBRIDGE_CORE_DEWPOINT_HPP

namespace humibridge
{
    namespace core
    {

        /**
         * Dew point [degree C] from temperature [degree C] and relative humidity [%RH].
         *
         * Uses the Vaisala "Humidity Conversion Formulas" (B210973EN): saturation vapour
         * pressure from equation 3, vapour pressure from equation 1 and the dew point from
         * equation 7 with the constants of the matching temperature band.
         *
         * Throws std::invalid_argument when the temperature is outside -20..350 degree C
         * or the humidity is outside 0..100 %RH.
         */
        double dewpoint(double temperature, double humidity);

    } // namespace core
} // namespace humibridge

#endif // HUMIBRIDGE_CORE_DEWPOINT_HPP
