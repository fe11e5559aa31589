#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include "domain/Errors.hpp"
#include "domain/RowNormalizer.hpp"
#include "TestSupport.hpp"

using namespace crowdpulse::domain;
using crowdpulse::test::MakeRow;

int main() {
    std::cout << "[Test] Starting RowNormalizer Test..." << std::endl;

    const auto key = FilterKey::Make(202412, 8, DayType::Weekday);

    // Missing cells become 0.0, present cells are untouched
    auto raw = MakeRow(key, 1, 2, 80.0);
    raw.usersOver30Min = kMissing;
    raw.sex2 = kMissing;
    raw.ages[9] = kMissing;
    auto row = NormalizeRow(raw, key);
    assert(row.usersOver30Min == 0.0);
    assert(row.sex2 == 0.0);
    assert(row.ages[9] == 0.0);
    assert(row.totalUsers == 80.0);
    assert(row.sex1 == 50.0);
    assert(std::isnan(raw.sex2)); // input left as is

    // A fully missing metric row is all zeros
    auto blank = MakeRow(key, 3, 4, kMissing);
    blank.usersUnder10Min = blank.users10To30Min = blank.usersOver30Min = kMissing;
    blank.sex1 = blank.sex2 = kMissing;
    blank.ages.fill(kMissing);
    auto zero = NormalizeRow(blank, key);
    assert(zero.totalUsers == 0.0 && zero.usersUnder10Min == 0.0 && zero.sex1 == 0.0);
    for (double age : zero.ages) assert(age == 0.0);

    // Anomalies carry the offending key
    auto badCoord = MakeRow(key, 5, 6, 10.0);
    badCoord.lat = std::numeric_limits<double>::quiet_NaN();
    try {
        NormalizeRow(badCoord, key);
        assert(false && "non-finite coordinates must be rejected");
    } catch (const InternalAggregationError& e) {
        assert(std::string(e.what()).find("202412/08h/weekday") != std::string::npos);
    }

    auto infMetric = MakeRow(key, 5, 6, 10.0);
    infMetric.sex1 = std::numeric_limits<double>::infinity();
    bool infRejected = false;
    try {
        NormalizeRow(infMetric, key);
    } catch (const InternalAggregationError&) {
        infRejected = true;
    }
    assert(infRejected);

    auto negative = MakeRow(key, 7, 8, 10.0);
    negative.usersOver30Min = -2.0;
    bool negativeRejected = false;
    try {
        NormalizeRow(negative, key);
    } catch (const InternalAggregationError& e) {
        negativeRejected = std::string(e.what()).find("negative") != std::string::npos;
    }
    assert(negativeRejected);

    auto misfiled = MakeRow(FilterKey::Make(202412, 9, DayType::Weekday), 1, 1, 10.0);
    bool misfiledRejected = false;
    try {
        NormalizeRow(misfiled, key);
    } catch (const InternalAggregationError&) {
        misfiledRejected = true;
    }
    assert(misfiledRejected);

    std::cout << "[PASS] RowNormalizer Test." << std::endl;
    return 0;
}
