#pragma once

#include "tc-clip-data.hpp"

#include <QString>
#include <QVector>

#include <cstdint>

namespace tc {

struct EdlDocumentInput {
	QString title;
	QString clip_name;
	QVector<Clip> clips;
	double frame_rate = 23.976;
	double start_offset_seconds = 0.0;
};

struct EdlRecord {
	int edit_number = 0;
	int64_t source_in = 0;
	int64_t source_out = 0;
	int64_t record_in = 0;
	int64_t record_out = 0;
	QString clip_name;
};

class EdlWriter {
public:
	static QString header(const QString &title);
	static QString format_record(const EdlRecord &record, double frame_rate);

	QVector<EdlRecord> build_records(const EdlDocumentInput &input) const;
	QString build_document(const EdlDocumentInput &input) const;
};

} // namespace tc
