#pragma once
#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>
#include <chrono>
#include <cstdint>

namespace tether::models {

using TimePoint = std::chrono::system_clock::time_point;

inline google::protobuf::Timestamp ToProtoTimestamp(const TimePoint tp) {
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    return google::protobuf::util::TimeUtil::NanosecondsToTimestamp(static_cast<int64_t>(nanos.count()));
}

inline TimePoint FromProtoTimestamp(const google::protobuf::Timestamp& ts) {
    const int64_t nanos = google::protobuf::util::TimeUtil::TimestampToNanoseconds(ts);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::nanoseconds(nanos)));
}

}
