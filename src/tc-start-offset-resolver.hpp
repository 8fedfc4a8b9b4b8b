#pragma once

#include "tc-media-probe.hpp"

#include <QString>

namespace tc {

enum class StartTimecodeSource {
	FormatTag,
	VideoStreamTag,
	DataStreamTag,
	VideoStreamStartTime,
	Default,
};

struct StartTimecode {
	QString timecode = "00:00:00:00";
	StartTimecodeSource source = StartTimecodeSource::Default;
};

const char *start_timecode_source_name(StartTimecodeSource source);

/*
 * Walks the lookups in priority order and stops at the first one that
 * yields a non-empty value:
 *   format "timecode" tag, video stream tag, data stream tag,
 *   video stream start_time, then 00:00:00:00.
 */
StartTimecode resolve_start_timecode(const ProbeData &probe, double frame_rate);

// Seconds between absolute recording time and frame 0 of the processed media.
bool start_offset_seconds(const StartTimecode &start, double frame_rate, double *seconds, QString *error);

} // namespace tc
