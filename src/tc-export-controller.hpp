#pragma once

#include "tc-clip-data.hpp"
#include "tc-export-collaborators.hpp"
#include "tc-media-probe.hpp"
#include "tc-settings.hpp"

#include <QString>
#include <QVector>

namespace tc {

enum class ExportStatus {
	Exported,
	Cancelled,
	Failed,
};

struct ExportResult {
	ExportStatus status = ExportStatus::Failed;
	QString artifact_path;
	QString error;
};

struct ExportRequest {
	QVector<Clip> clips;
	VideoInfo video;
	QString clip_name;
	double frame_rate = 23.976;
};

const char *export_status_name(ExportStatus status);

// Appends ".<extension>" unless the path already ends with it.
QString with_extension(const QString &path, const QString &extension);

/*
 * Runs one export end to end: validate clips, ask for a destination,
 * probe the source for its start timecode, generate, write.
 * Not reentrant; callers serialize exports to the same destination.
 */
class ExportController {
public:
	ExportController(MediaProbe *probe, DestinationPicker *picker, ArtifactWriter *writer);

	void set_settings(const ExportSettings &settings);
	const ExportSettings &settings() const;

	ExportResult export_edl(const ExportRequest &request);
	ExportResult export_fcpxml(const ExportRequest &request);

private:
	bool check_request(const ExportRequest &request, QString *error) const;
	bool resolve_offset(const ExportRequest &request, const char *format_tag, ProbeData *probe,
			    double *offset_seconds, QString *error) const;
	bool choose_destination(const DestinationRequest &destination, QString *path);

	static QString effective_clip_name(const ExportRequest &request);
	static ExportResult failure(const char *format_tag, const QString &error);

	MediaProbe *m_probe = nullptr;
	DestinationPicker *m_picker = nullptr;
	ArtifactWriter *m_writer = nullptr;
	ExportSettings m_settings;
};

} // namespace tc
