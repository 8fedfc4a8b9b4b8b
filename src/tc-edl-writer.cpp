#include "tc-edl-writer.hpp"

#include "tc-timecode.hpp"

#include <QTextStream>

namespace tc {

QString EdlWriter::header(const QString &title)
{
	return QString("TITLE: %1\nFCM: NON-DROP FRAME\n\n").arg(title);
}

QString EdlWriter::format_record(const EdlRecord &record, double frame_rate)
{
	// AX: auxiliary source, V: video only, C: straight cut.
	QString text;
	QTextStream stream(&text);
	stream << QString("%1").arg(record.edit_number, 3, 10, QChar('0')) << "  AX       V     C        "
	       << frames_to_timecode(record.source_in, frame_rate) << ' '
	       << frames_to_timecode(record.source_out, frame_rate) << ' '
	       << frames_to_timecode(record.record_in, frame_rate) << ' '
	       << frames_to_timecode(record.record_out, frame_rate) << '\n';
	stream << "* FROM CLIP NAME: " << record.clip_name << "\n\n";
	stream.flush();
	return text;
}

QVector<EdlRecord> EdlWriter::build_records(const EdlDocumentInput &input) const
{
	QVector<EdlRecord> records;
	records.reserve(input.clips.size());

	// Record side is laid back to back; source side stays on the recording timeline.
	int64_t record_cursor = 0;
	for (int i = 0; i < input.clips.size(); ++i) {
		const Clip &clip = input.clips.at(i);

		EdlRecord record;
		record.edit_number = i + 1;
		record.source_in = seconds_to_frames(clip.start + input.start_offset_seconds, input.frame_rate);
		record.source_out = seconds_to_frames(clip.end + input.start_offset_seconds, input.frame_rate);
		record.record_in = record_cursor;
		record.record_out = floor_frames(static_cast<double>(record_cursor) + clip_length(clip) * input.frame_rate);
		record.clip_name = input.clip_name;
		records.push_back(record);

		record_cursor = record.record_out;
	}

	return records;
}

QString EdlWriter::build_document(const EdlDocumentInput &input) const
{
	QString edl = header(input.title);
	for (const EdlRecord &record : build_records(input))
		edl += format_record(record, input.frame_rate);
	return edl;
}

} // namespace tc
