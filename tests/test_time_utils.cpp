#include "core/time_utils.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace humibridge
{
    namespace core
    {
        namespace
        {

            TEST(TimeUtilsTest, ParseAndFormatAgree)
            {
                int64_t ms = parse_iso8601_ms("2021-03-04 05:06:07.123");
                EXPECT_EQ(ms % 1000, 123);
                EXPECT_EQ(format_iso8601(ms), "2021-03-04 05:06:07.123");
                EXPECT_EQ(format_iso8601(ms, 0), "2021-03-04 05:06:07");
                EXPECT_EQ(format_iso8601(ms, 6), "2021-03-04 05:06:07.123000");
            }

            TEST(TimeUtilsTest, AcceptsTSeparatorAndMicroseconds)
            {
                EXPECT_EQ(parse_iso8601_ms("2021-03-04T05:06:07.123456"),
                          parse_iso8601_ms("2021-03-04 05:06:07.123"));
                EXPECT_EQ(parse_iso8601_ms("2021-03-04 05:06:07.9996") - parse_iso8601_ms("2021-03-04 05:06:07"), 1000);
            }

            TEST(TimeUtilsTest, RejectsGarbage)
            {
                EXPECT_THROW(parse_iso8601_ms("yesterday"), std::invalid_argument);
                EXPECT_THROW(parse_iso8601_ms("2021-03-04 05:06:07.12x"), std::invalid_argument);
                EXPECT_THROW(parse_iso8601_ms("2021-03-04 05:06:07 trailing"), std::invalid_argument);
            }

            TEST(TimeUtilsTest, ConvertsEveryTimestampForm)
            {
                EXPECT_EQ(to_milliseconds(nlohmann::json(1234)), 1234);
                EXPECT_EQ(to_milliseconds(nlohmann::json(1.5)), 1500);
                EXPECT_EQ(to_milliseconds(nlohmann::json("2021-03-04 05:06:07")), parse_iso8601_ms("2021-03-04 05:06:07"));
                EXPECT_THROW(to_milliseconds(nlohmann::json(true)), std::invalid_argument);
                EXPECT_THROW(to_milliseconds(nlohmann::json::array()), std::invalid_argument);
            }

        } // namespace
    } // namespace core
} // namespace humibridge
