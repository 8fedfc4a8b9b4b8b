#include "tc-fcpxml-writer.hpp"

#include "tc-frame-duration.hpp"
#include "tc-timecode.hpp"

#include <QDir>
#include <QUrl>

#include <utility>

namespace tc {
namespace {

constexpr int INDENT_WIDTH = 4;

XmlElement make_element(const QString &name, QVector<XmlAttribute> attributes, std::vector<XmlElement> children = {})
{
	XmlElement element;
	element.name = name;
	element.attributes = std::move(attributes);
	element.children = std::move(children);
	return element;
}

XmlElement make_format(const FcpxmlDocumentInput &input, const FrameDuration &frame_duration)
{
	return make_element("format", {
					      {"id", FcpxmlWriter::FORMAT_ID},
					      {"name", format_name_for_frame_rate(input.frame_rate)},
					      {"frameDuration", frame_duration.to_fcpx_time()},
					      {"width", "3840"},
					      {"height", "2160"},
				      });
}

XmlElement make_asset(const FcpxmlDocumentInput &input, const FrameDuration &frame_duration)
{
	const int64_t start = frame_duration.numerator * seconds_to_frames(input.start_offset_seconds, input.frame_rate);
	const int64_t duration = frame_duration.numerator * seconds_to_frames(input.source_duration, input.frame_rate);

	XmlElement media_rep = make_element("media-rep", {
								 {"src", FcpxmlWriter::file_url_from_path(input.media_path)},
								 {"kind", "original-media"},
							 });

	return make_element("asset",
			    {
				    {"id", FcpxmlWriter::ASSET_ID},
				    {"name", input.clip_name},
				    {"start", rational_time(start, frame_duration)},
				    {"duration", rational_time(duration, frame_duration)},
				    {"format", FcpxmlWriter::FORMAT_ID},
				    {"hasAudio", "1"},
				    {"audioSources", "1"},
				    {"audioChannels", "1"},
			    },
			    {media_rep});
}

XmlElement make_spine(const FcpxmlDocumentInput &input, const FrameDuration &frame_duration)
{
	std::vector<XmlElement> asset_clips;
	asset_clips.reserve(static_cast<size_t>(input.clips.size()));

	// Offsets are contiguous on the output timeline, starts stay on the source timeline.
	int64_t offset = 0;
	for (const Clip &clip : input.clips) {
		const int64_t start = frame_duration.numerator *
				      seconds_to_frames(input.start_offset_seconds + clip.start, input.frame_rate);
		const int64_t end = frame_duration.numerator *
				    seconds_to_frames(input.start_offset_seconds + clip.end, input.frame_rate);
		const int64_t duration = end - start;

		asset_clips.push_back(make_element("asset-clip", {
									 {"offset", rational_time(offset, frame_duration)},
									 {"enabled", "1"},
									 {"ref", FcpxmlWriter::ASSET_ID},
									 {"duration", rational_time(duration, frame_duration)},
									 {"lane", "2"},
									 {"name", input.clip_name},
									 {"start", rational_time(start, frame_duration)},
								 }));
		offset += duration;
	}

	return make_element("spine", {}, std::move(asset_clips));
}

} // namespace

QString XmlElement::attribute(const QString &attribute_name) const
{
	for (const XmlAttribute &attr : attributes) {
		if (attr.name == attribute_name)
			return attr.value;
	}
	return {};
}

const XmlElement *XmlElement::first_child(const QString &child_name) const
{
	for (const XmlElement &child : children) {
		if (child.name == child_name)
			return &child;
	}
	return nullptr;
}

QString FcpxmlWriter::file_url_from_path(const QString &path)
{
	return QUrl::fromLocalFile(path).toString(QUrl::FullyEncoded);
}

QString FcpxmlWriter::document_path_in_bundle(const QString &bundle_path)
{
	return QDir(bundle_path).filePath(DOCUMENT_FILE_NAME);
}

XmlElement FcpxmlWriter::build_document_tree(const FcpxmlDocumentInput &input) const
{
	const FrameDuration frame_duration = frame_duration_for_rate(input.frame_rate);
	const QString project_name = QString("TurboCut %1").arg(input.clip_name);

	XmlElement sequence = make_element("sequence",
					   {
						   {"tcStart", "0/1s"},
						   {"format", FORMAT_ID},
						   {"tcFormat", "NDF"},
					   },
					   {make_spine(input, frame_duration)});
	XmlElement project = make_element("project", {{"name", project_name}}, {std::move(sequence)});
	XmlElement event = make_element("event", {{"name", project_name}}, {std::move(project)});

	XmlElement resources =
		make_element("resources", {}, {make_format(input, frame_duration), make_asset(input, frame_duration)});
	XmlElement library = make_element("library", {}, {std::move(event)});

	return make_element("fcpxml", {{"version", "1.10"}}, {std::move(resources), std::move(library)});
}

QString FcpxmlWriter::serialize(const XmlElement &root) const
{
	QString xml;
	QTextStream stream(&xml);
	stream.setEncoding(QStringConverter::Utf8);

	stream << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
	append_element(stream, root, 0);
	stream.flush();
	return xml;
}

QString FcpxmlWriter::build_document(const FcpxmlDocumentInput &input) const
{
	return serialize(build_document_tree(input));
}

void FcpxmlWriter::append_element(QTextStream &stream, const XmlElement &element, int depth)
{
	const QString indent(depth * INDENT_WIDTH, ' ');
	stream << indent << '<' << element.name;
	for (const XmlAttribute &attr : element.attributes)
		stream << ' ' << attr.name << "=\"" << xml_escape(attr.value) << '"';

	if (element.children.empty()) {
		stream << "/>\n";
		return;
	}

	stream << ">\n";
	for (const XmlElement &child : element.children)
		append_element(stream, child, depth + 1);
	stream << indent << "</" << element.name << ">\n";
}

QString FcpxmlWriter::xml_escape(const QString &value)
{
	QString escaped = value;
	escaped.replace('&', "&amp;");
	escaped.replace('<', "&lt;");
	escaped.replace('>', "&gt;");
	escaped.replace('"', "&quot;");
	escaped.replace('\'', "&apos;");
	return escaped;
}

} // namespace tc
