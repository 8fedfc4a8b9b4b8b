#include "tc-frame-duration.hpp"

#include <cmath>

namespace tc {
namespace {

struct FrameDurationEntry {
	double rate;
	FrameDuration duration;
};

// 24 fps keeps the unreduced 100/2400 pair that editors already accept.
const FrameDurationEntry FRAME_DURATIONS[] = {
	{23.976, {1001, 24000}}, {24.0, {100, 2400}}, {25.0, {1, 25}},	{29.97, {1001, 30000}},
	{30.0, {1, 30}},	 {50.0, {1, 50}},     {59.94, {1001, 60000}}, {60.0, {1, 60}},
};

constexpr double RATE_TOLERANCE = 0.001;

const FrameDurationEntry *find_entry(double frame_rate)
{
	for (const FrameDurationEntry &entry : FRAME_DURATIONS) {
		if (std::fabs(entry.rate - frame_rate) < RATE_TOLERANCE)
			return &entry;
	}
	return nullptr;
}

} // namespace

QString FrameDuration::to_fcpx_time() const
{
	return rational_time(numerator, *this);
}

FrameDuration frame_duration_for_rate(double frame_rate)
{
	const FrameDurationEntry *entry = find_entry(frame_rate);
	if (!entry)
		return FRAME_DURATIONS[0].duration;
	return entry->duration;
}

bool is_supported_frame_rate(double frame_rate)
{
	return find_entry(frame_rate) != nullptr;
}

QString rational_time(int64_t units, const FrameDuration &duration)
{
	return QString("%1/%2s").arg(units).arg(duration.denominator);
}

QString format_name_for_frame_rate(double frame_rate)
{
	const double rounded = std::round(frame_rate * 100.0) / 100.0;
	return QString("FFVideoFormat3840x2160p%1").arg(QString::number(rounded, 'g', 10).remove('.'));
}

} // namespace tc
