#pragma once

#include <QString>

#include <cstdint>

namespace tc {

struct FrameDuration {
	int64_t numerator = 1001;
	int64_t denominator = 24000;

	QString to_fcpx_time() const;
};

// Fixed broadcast table. Unknown rates fall back to the 23.976 entry.
FrameDuration frame_duration_for_rate(double frame_rate);
bool is_supported_frame_rate(double frame_rate);

QString rational_time(int64_t units, const FrameDuration &duration);
QString format_name_for_frame_rate(double frame_rate);

} // namespace tc
