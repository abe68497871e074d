#include "doctest.h"

#include "batchnet/core/logging.h"

using batchnet::log::Level;

TEST_CASE("Logging: level names parse in any case")
{
    CHECK(batchnet::log::parse_level("error") == Level::Error);
    CHECK(batchnet::log::parse_level("WARN") == Level::Warn);
    CHECK(batchnet::log::parse_level("warning") == Level::Warn);
    CHECK(batchnet::log::parse_level(" Info ") == Level::Info);
    CHECK(batchnet::log::parse_level("debug") == Level::Debug);
    CHECK(batchnet::log::parse_level("Verbose") == Level::Verbose);

    CHECK_FALSE(batchnet::log::parse_level("").has_value());
    CHECK_FALSE(batchnet::log::parse_level("trace").has_value());
}

TEST_CASE("Logging: level_name is accepted by parse_level")
{
    for (Level l : {Level::Error, Level::Warn, Level::Info, Level::Debug, Level::Verbose}) {
        CHECK(batchnet::log::parse_level(batchnet::log::level_name(l)) == l);
    }
}

TEST_CASE("Logging: threshold can be changed at runtime")
{
    const Level saved = batchnet::log::threshold();
    CHECK(saved == Level::Info);

    batchnet::log::set_threshold(Level::Error);
    CHECK(batchnet::log::threshold() == Level::Error);

    // Suppressed and emitted calls both return normally.
    BN_LOGD("test", "dropped %d", 1);
    BN_LOGE("test", "kept %d", 2);

    batchnet::log::set_threshold(saved);
    CHECK(batchnet::log::threshold() == Level::Info);
}
