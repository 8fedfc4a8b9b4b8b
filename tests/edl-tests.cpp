#include "tc-edl-writer.hpp"
#include "tc-timecode.hpp"

#include <QStringList>

#include <cstdlib>
#include <iostream>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "EDL test failed: " << message << std::endl;
	std::exit(1);
}

tc::EdlDocumentInput example_input()
{
	tc::EdlDocumentInput input;
	input.title = "Silence Removed";
	input.clip_name = "interview";
	input.clips = {{2.0, 5.0}, {10.0, 12.0}};
	input.frame_rate = 30;
	input.start_offset_seconds = 0.0;
	return input;
}

void test_example_document_bytes()
{
	const QString expected = "TITLE: Silence Removed\n"
				 "FCM: NON-DROP FRAME\n"
				 "\n"
				 "001  AX       V     C        00:00:02:00 00:00:05:00 00:00:00:00 00:00:03:00\n"
				 "* FROM CLIP NAME: interview\n"
				 "\n"
				 "002  AX       V     C        00:00:10:00 00:00:12:00 00:00:03:00 00:00:05:00\n"
				 "* FROM CLIP NAME: interview\n"
				 "\n";

	const tc::EdlWriter writer;
	require(writer.build_document(example_input()) == expected, "two clip EDL matches byte for byte");
}

void test_empty_clip_list_is_header_only()
{
	tc::EdlDocumentInput input = example_input();
	input.clips.clear();

	const tc::EdlWriter writer;
	require(writer.build_document(input) == "TITLE: Silence Removed\nFCM: NON-DROP FRAME\n\n", "header only");
}

void test_record_cursor_is_gap_free()
{
	tc::EdlDocumentInput input = example_input();
	input.frame_rate = 23.976;
	input.clips.clear();
	for (int i = 0; i < 12; ++i)
		input.clips.push_back({i * 7.3 + 0.41, i * 7.3 + 0.41 + 1.3 + i * 0.17});

	const tc::EdlWriter writer;
	const QVector<tc::EdlRecord> records = writer.build_records(input);
	require(records.size() == input.clips.size(), "one record per clip");
	require(records.first().record_in == 0, "record side starts at zero");
	for (int i = 0; i < records.size(); ++i) {
		require(records.at(i).edit_number == i + 1, "edit numbers are sequential from one");
		require(records.at(i).record_out >= records.at(i).record_in, "record out not before record in");
		if (i + 1 < records.size())
			require(records.at(i).record_out == records.at(i + 1).record_in, "record out meets next record in");
	}

	const QString edl = writer.build_document(input);
	require(edl.contains("\n001  AX"), "first edit number padded");
	require(edl.contains("\n012  AX"), "twelfth edit number padded");
	require(edl.count("* FROM CLIP NAME: interview\n\n") == 12, "comment line per record");
}

void test_start_offset_moves_source_side_only()
{
	tc::EdlDocumentInput input = example_input();
	input.frame_rate = 25;
	input.start_offset_seconds = 3600.0;

	const tc::EdlWriter writer;
	const QVector<tc::EdlRecord> records = writer.build_records(input);
	require(tc::frames_to_timecode(records.at(0).source_in, 25) == "01:00:02:00", "source in on recording clock");
	require(tc::frames_to_timecode(records.at(1).source_out, 25) == "01:00:12:00", "source out on recording clock");
	require(records.at(0).record_in == 0, "record side ignores the offset");
	require(tc::frames_to_timecode(records.at(1).record_out, 25) == "00:00:05:00", "record out is total length");
}

void test_record_line_layout()
{
	tc::EdlRecord record;
	record.edit_number = 7;
	record.source_in = 30;
	record.source_out = 60;
	record.record_in = 0;
	record.record_out = 30;
	record.clip_name = "B-Roll";

	const QString text = tc::EdlWriter::format_record(record, 30);
	const QStringList lines = text.split('\n');
	require(lines.size() == 4, "record line, comment line, blank line");
	require(lines.at(0) == "007  AX       V     C        00:00:01:00 00:00:02:00 00:00:00:00 00:00:01:00",
		"fixed-width record line");
	require(lines.at(1) == "* FROM CLIP NAME: B-Roll", "clip name comment");
	require(lines.at(2).isEmpty() && lines.at(3).isEmpty(), "record ends with a blank line");
}

} // namespace

int main()
{
	test_example_document_bytes();
	test_empty_clip_list_is_header_only();
	test_record_cursor_is_gap_free();
	test_start_offset_moves_source_side_only();
	test_record_line_layout();
	return 0;
}
