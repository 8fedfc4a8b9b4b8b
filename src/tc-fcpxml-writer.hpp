#pragma once

#include "tc-clip-data.hpp"

#include <QString>
#include <QTextStream>
#include <QVector>

#include <vector>

namespace tc {

struct XmlAttribute {
	QString name;
	QString value;
};

struct XmlElement {
	QString name;
	QVector<XmlAttribute> attributes;
	std::vector<XmlElement> children;

	QString attribute(const QString &attribute_name) const;
	const XmlElement *first_child(const QString &child_name) const;
};

struct FcpxmlDocumentInput {
	QString media_path;
	QString clip_name;
	double source_duration = 0.0;
	QVector<Clip> clips;
	double frame_rate = 23.976;
	double start_offset_seconds = 0.0;
};

class FcpxmlWriter {
public:
	static constexpr const char *DOCUMENT_FILE_NAME = "Info.fcpxml";
	static constexpr const char *FORMAT_ID = "r0";
	static constexpr const char *ASSET_ID = "r2";

	static QString file_url_from_path(const QString &path);
	static QString document_path_in_bundle(const QString &bundle_path);

	XmlElement build_document_tree(const FcpxmlDocumentInput &input) const;
	QString serialize(const XmlElement &root) const;
	QString build_document(const FcpxmlDocumentInput &input) const;

private:
	static void append_element(QTextStream &stream, const XmlElement &element, int depth);
	static QString xml_escape(const QString &value);
};

} // namespace tc
