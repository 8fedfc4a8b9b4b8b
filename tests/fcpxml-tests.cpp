#include "tc-fcpxml-writer.hpp"

#include <cstdlib>
#include <iostream>

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Test failed: " << message << std::endl;
	std::exit(1);
}

// "<units>/<denominator>s" -> units
long long rational_units(const QString &value)
{
	bool ok = false;
	const long long units = value.section('/', 0, 0).toLongLong(&ok);
	require(ok && value.endsWith('s'), "rational time is well formed");
	return units;
}

const tc::XmlElement *find_sequence(const tc::XmlElement &root)
{
	const tc::XmlElement *element = root.first_child("library");
	for (const char *name : {"event", "project", "sequence"}) {
		if (!element)
			return nullptr;
		element = element->first_child(name);
	}
	return element;
}

tc::FcpxmlDocumentInput example_input()
{
	tc::FcpxmlDocumentInput input;
	input.media_path = "/Volumes/Footage/interview.mov";
	input.clip_name = "interview";
	input.source_duration = 20.0;
	input.clips = {{2.0, 5.0}, {10.0, 12.0}};
	input.frame_rate = 30;
	input.start_offset_seconds = 0.0;
	return input;
}

void test_example_serialization()
{
	const tc::FcpxmlWriter writer;
	const QString xml = writer.build_document(example_input());

	const QString expected =
		"<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
		"<fcpxml version=\"1.10\">\n"
		"    <resources>\n"
		"        <format id=\"r0\" name=\"FFVideoFormat3840x2160p30\" frameDuration=\"1/30s\" width=\"3840\" "
		"height=\"2160\"/>\n"
		"        <asset id=\"r2\" name=\"interview\" start=\"0/30s\" duration=\"600/30s\" format=\"r0\" "
		"hasAudio=\"1\" audioSources=\"1\" audioChannels=\"1\">\n"
		"            <media-rep src=\"file:///Volumes/Footage/interview.mov\" kind=\"original-media\"/>\n"
		"        </asset>\n"
		"    </resources>\n"
		"    <library>\n"
		"        <event name=\"TurboCut interview\">\n"
		"            <project name=\"TurboCut interview\">\n"
		"                <sequence tcStart=\"0/1s\" format=\"r0\" tcFormat=\"NDF\">\n"
		"                    <spine>\n"
		"                        <asset-clip offset=\"0/30s\" enabled=\"1\" ref=\"r2\" duration=\"90/30s\" "
		"lane=\"2\" name=\"interview\" start=\"60/30s\"/>\n"
		"                        <asset-clip offset=\"90/30s\" enabled=\"1\" ref=\"r2\" duration=\"60/30s\" "
		"lane=\"2\" name=\"interview\" start=\"300/30s\"/>\n"
		"                    </spine>\n"
		"                </sequence>\n"
		"            </project>\n"
		"        </event>\n"
		"    </library>\n"
		"</fcpxml>\n";

	require(xml == expected, "two clip FCPXML matches byte for byte");
}

void test_escaping()
{
	tc::FcpxmlDocumentInput input = example_input();
	input.clip_name = "Take 1 & \"B\" <cam>";

	const tc::FcpxmlWriter writer;
	const QString xml = writer.build_document(input);
	require(xml.contains("name=\"Take 1 &amp; &quot;B&quot; &lt;cam&gt;\""), "asset name escaped");
	require(xml.contains("<event name=\"TurboCut Take 1 &amp; &quot;B&quot; &lt;cam&gt;\">"), "event name escaped");
	require(!xml.contains("<cam>"), "no raw markup from names");
}

void test_spine_offsets_are_gap_free()
{
	tc::FcpxmlDocumentInput input = example_input();
	input.frame_rate = 23.976;
	input.start_offset_seconds = 3600.0;
	input.clips.clear();
	for (int i = 0; i < 9; ++i)
		input.clips.push_back({i * 4.7 + 0.3, i * 4.7 + 0.3 + 1.1 + i * 0.23});

	const tc::FcpxmlWriter writer;
	const tc::XmlElement root = writer.build_document_tree(input);
	const tc::XmlElement *sequence = find_sequence(root);
	require(sequence, "sequence element");
	const tc::XmlElement *spine = sequence->first_child("spine");
	require(spine, "spine element");
	require(spine->children.size() == 9, "one asset-clip per clip");

	long long expected_offset = 0;
	long long total = 0;
	for (const tc::XmlElement &clip : spine->children) {
		require(clip.name == "asset-clip", "spine holds asset-clips");
		require(rational_units(clip.attribute("offset")) == expected_offset, "offset continues previous clip");
		const long long duration = rational_units(clip.attribute("duration"));
		require(duration > 0, "positive duration");
		require(duration % 1001 == 0, "duration is whole frames");
		require(clip.attribute("duration").endsWith("/24000s"), "shared denominator");
		expected_offset += duration;
		total += duration;
	}
	require(total == expected_offset, "total spine duration is the sum of clip durations");

	const tc::XmlElement &first = spine->children.front();
	require(first.attribute("start") == QString("%1/24000s").arg(1001LL * 86320), "start on recording clock");
}

void test_asset_uses_offset_and_duration()
{
	tc::FcpxmlDocumentInput input = example_input();
	input.frame_rate = 24;
	input.start_offset_seconds = 10.0;

	const tc::FcpxmlWriter writer;
	const tc::XmlElement root = writer.build_document_tree(input);
	const tc::XmlElement *asset = root.first_child("resources")->first_child("asset");
	require(asset, "asset element");
	require(asset->attribute("start") == "24000/2400s", "asset start scaled by unreduced 24 fps entry");
	require(asset->attribute("duration") == "48000/2400s", "asset duration scaled");
	require(asset->attribute("format") == root.first_child("resources")->first_child("format")->attribute("id"),
		"asset references the format resource");
}

void test_unknown_rate_and_empty_spine()
{
	tc::FcpxmlDocumentInput input = example_input();
	input.frame_rate = 48;
	input.clips.clear();

	const tc::FcpxmlWriter writer;
	const QString xml = writer.build_document(input);
	require(xml.contains("name=\"FFVideoFormat3840x2160p48\" frameDuration=\"1001/24000s\""),
		"unknown rate keeps its name and falls back to 23.976 duration");
	require(xml.contains("                    <spine/>\n"), "empty spine self-closes");
}

void test_bundle_path()
{
	require(tc::FcpxmlWriter::document_path_in_bundle("/tmp/out.fcpxmld") == "/tmp/out.fcpxmld/Info.fcpxml",
		"document lives inside the bundle");
	require(tc::FcpxmlWriter::file_url_from_path("/tmp/a b.mov") == "file:///tmp/a%20b.mov", "file url encoded");
}

} // namespace

int main()
{
	test_example_serialization();
	test_escaping();
	test_spine_offsets_are_gap_free();
	test_asset_uses_offset_and_duration();
	test_unknown_rate_and_empty_spine();
	test_bundle_path();
	return 0;
}
