#include "tc-start-offset-resolver.hpp"

#include "tc-timecode.hpp"

#include <cmath>
#include <functional>

namespace tc {
namespace {

const QString TIMECODE_TAG = "timecode";

const ProbeStream *first_stream_of_type(const ProbeData &probe, const QString &codec_type)
{
	for (const ProbeStream &stream : probe.streams) {
		if (stream.codec_type == codec_type)
			return &stream;
	}
	return nullptr;
}

QString stream_tag(const ProbeData &probe, const QString &codec_type)
{
	const ProbeStream *stream = first_stream_of_type(probe, codec_type);
	return stream ? stream->tags.value(TIMECODE_TAG).trimmed() : QString();
}

QString stream_start_time(const ProbeData &probe, double frame_rate)
{
	const ProbeStream *stream = first_stream_of_type(probe, "video");
	if (!stream || stream->start_time.trimmed().isEmpty())
		return {};

	bool ok = false;
	const double seconds = stream->start_time.trimmed().toDouble(&ok);
	if (!ok || !std::isfinite(seconds) || seconds < 0.0)
		return {};
	return frames_to_timecode(seconds_to_frames(seconds, frame_rate), frame_rate);
}

struct StartTimecodeLookup {
	StartTimecodeSource source;
	std::function<QString(const ProbeData &, double)> lookup;
};

const StartTimecodeLookup LOOKUPS[] = {
	{StartTimecodeSource::FormatTag,
	 [](const ProbeData &probe, double) { return probe.format_tags.value(TIMECODE_TAG).trimmed(); }},
	{StartTimecodeSource::VideoStreamTag, [](const ProbeData &probe, double) { return stream_tag(probe, "video"); }},
	{StartTimecodeSource::DataStreamTag, [](const ProbeData &probe, double) { return stream_tag(probe, "data"); }},
	{StartTimecodeSource::VideoStreamStartTime, stream_start_time},
};

} // namespace

const char *start_timecode_source_name(StartTimecodeSource source)
{
	switch (source) {
	case StartTimecodeSource::FormatTag:
		return "format_tag";
	case StartTimecodeSource::VideoStreamTag:
		return "video_stream_tag";
	case StartTimecodeSource::DataStreamTag:
		return "data_stream_tag";
	case StartTimecodeSource::VideoStreamStartTime:
		return "video_stream_start_time";
	case StartTimecodeSource::Default:
	default:
		return "default";
	}
}

StartTimecode resolve_start_timecode(const ProbeData &probe, double frame_rate)
{
	for (const StartTimecodeLookup &lookup : LOOKUPS) {
		const QString value = lookup.lookup(probe, frame_rate);
		if (!value.isEmpty())
			return {value, lookup.source};
	}
	return {};
}

bool start_offset_seconds(const StartTimecode &start, double frame_rate, double *seconds, QString *error)
{
	int64_t frames = 0;
	if (!parse_timecode(start.timecode, frame_rate, &frames)) {
		if (error)
			*error = QString("Unreadable start timecode '%1' from %2")
					 .arg(start.timecode, QString::fromLatin1(start_timecode_source_name(start.source)));
		return false;
	}

	if (seconds)
		*seconds = frames_to_seconds(frames, frame_rate);
	return true;
}

} // namespace tc
