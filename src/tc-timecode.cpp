#include "tc-timecode.hpp"

#include <QRegularExpression>
#include <QStringList>

#include <algorithm>
#include <climits>
#include <cmath>

namespace tc {
namespace {

constexpr int64_t MAX_HOURS = 999999;

QString two_digits(int64_t value)
{
	return QString("%1").arg(static_cast<qlonglong>(value), 2, 10, QChar('0'));
}

} // namespace

int round_frame_rate(double frame_rate)
{
	if (!std::isfinite(frame_rate))
		return 1;
	if (frame_rate >= static_cast<double>(INT_MAX))
		return INT_MAX;
	return std::max(1, static_cast<int>(std::lround(frame_rate)));
}

QString frames_to_timecode(int64_t frames, double frame_rate)
{
	const int64_t fps = round_frame_rate(frame_rate);
	const int64_t total = std::max<int64_t>(0, frames);

	const int64_t frames_per_minute = 60 * fps;
	const int64_t frames_per_hour = 3600 * fps;

	const int64_t hours = total / frames_per_hour;
	const int64_t minutes = (total % frames_per_hour) / frames_per_minute;
	const int64_t seconds = ((total % frames_per_hour) % frames_per_minute) / fps;
	const int64_t frs = ((total % frames_per_hour) % frames_per_minute) % fps;

	return QString("%1:%2:%3:%4").arg(two_digits(hours), two_digits(minutes), two_digits(seconds), two_digits(frs));
}

bool parse_timecode(const QString &timecode, double frame_rate, int64_t *frames)
{
	static const QRegularExpression separators("[:;]");
	const QStringList fields = timecode.trimmed().split(separators);
	if (fields.size() != 4)
		return false;

	int64_t values[4] = {0, 0, 0, 0};
	for (int i = 0; i < 4; ++i) {
		bool ok = false;
		values[i] = fields.at(i).toLongLong(&ok);
		if (!ok || values[i] < 0)
			return false;
	}
	if (values[0] > MAX_HOURS || values[1] > 59 || values[2] > 59 || values[3] > MAX_FRAME_COUNT)
		return false;

	const int64_t fps = round_frame_rate(frame_rate);
	const int64_t whole_seconds = values[0] * 3600 + values[1] * 60 + values[2];
	if (whole_seconds > (MAX_FRAME_COUNT - values[3]) / fps)
		return false;

	if (frames)
		*frames = whole_seconds * fps + values[3];
	return true;
}

int64_t timecode_to_frames(const QString &timecode, double frame_rate)
{
	int64_t frames = 0;
	if (!parse_timecode(timecode, frame_rate, &frames))
		return 0;
	return frames;
}

double frames_to_seconds(int64_t frames, double frame_rate)
{
	if (!(frame_rate > 0.0))
		return 0.0;
	return std::round((static_cast<double>(frames) / frame_rate) * 10.0) / 10.0;
}

int64_t floor_frames(double frames)
{
	const double limit = static_cast<double>(MAX_FRAME_COUNT);
	if (std::isnan(frames))
		return 0;
	return static_cast<int64_t>(std::clamp(std::floor(frames), -limit, limit));
}

int64_t seconds_to_frames(double seconds, double frame_rate)
{
	return floor_frames(seconds * frame_rate);
}

bool frame_count_in_range(double seconds, double frame_rate)
{
	const double frames = seconds * frame_rate;
	return std::isfinite(frames) && std::fabs(frames) <= static_cast<double>(MAX_FRAME_COUNT);
}

} // namespace tc
