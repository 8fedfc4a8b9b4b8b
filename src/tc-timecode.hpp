#pragma once

#include <QString>

#include <cstdint>

namespace tc {

// Largest frame count any conversion produces. Exact as a double, and a
// frame-duration numerator times it still fits in int64_t.
constexpr int64_t MAX_FRAME_COUNT = int64_t(1) << 52;

// Integer frames-per-second used as the divisor for all timecode fields.
// Never below 1.
int round_frame_rate(double frame_rate);

// HH:MM:SS:FF, every field zero-padded to two digits (hours may grow wider).
// Negative frame counts are clamped to zero.
QString frames_to_timecode(int64_t frames, double frame_rate);

// Accepts ':' or ';' separators. Drop-frame ';' is not treated differently.
// Minutes and seconds must be below 60, hours at most 999999, and the total
// at most MAX_FRAME_COUNT.
bool parse_timecode(const QString &timecode, double frame_rate, int64_t *frames);
int64_t timecode_to_frames(const QString &timecode, double frame_rate);

// Rounded to one decimal place.
double frames_to_seconds(int64_t frames, double frame_rate);

// floor(frames), saturated to [-MAX_FRAME_COUNT, MAX_FRAME_COUNT]. NaN gives 0.
int64_t floor_frames(double frames);

// floor(seconds * frame_rate) with the unrounded rate, saturated like floor_frames.
int64_t seconds_to_frames(double seconds, double frame_rate);

// True when seconds * frame_rate is finite and within MAX_FRAME_COUNT.
bool frame_count_in_range(double seconds, double frame_rate);

} // namespace tc
