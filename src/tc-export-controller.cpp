#include "tc-export-controller.hpp"

#include "tc-edl-writer.hpp"
#include "tc-fcpxml-writer.hpp"
#include "tc-frame-duration.hpp"
#include "tc-start-offset-resolver.hpp"
#include "tc-timecode.hpp"

#include <util/base.h>
#include <util/platform.h>

#include <QFileInfo>

#include <cmath>

namespace tc {
namespace {

constexpr const char *EDL_TAG = "edl";
constexpr const char *FCPXML_TAG = "fcpxml";

QByteArray utf8(const QString &value)
{
	return value.toUtf8();
}

} // namespace

const char *export_status_name(ExportStatus status)
{
	switch (status) {
	case ExportStatus::Exported:
		return "exported";
	case ExportStatus::Cancelled:
		return "cancelled";
	case ExportStatus::Failed:
	default:
		return "failed";
	}
}

QString with_extension(const QString &path, const QString &extension)
{
	if (path.isEmpty() || extension.isEmpty())
		return path;

	const QString suffix = extension.startsWith('.') ? extension : QString(".%1").arg(extension);
	if (path.endsWith(suffix, Qt::CaseInsensitive))
		return path;
	return path + suffix;
}

ExportController::ExportController(MediaProbe *probe, DestinationPicker *picker, ArtifactWriter *writer)
	: m_probe(probe),
	  m_picker(picker),
	  m_writer(writer)
{
}

void ExportController::set_settings(const ExportSettings &settings)
{
	m_settings = settings;
}

const ExportSettings &ExportController::settings() const
{
	return m_settings;
}

ExportResult ExportController::export_edl(const ExportRequest &request)
{
	QString error;
	if (!check_request(request, &error))
		return failure(EDL_TAG, error);
	blog(LOG_INFO, "[turbocut-export][%s] export start: source='%s' clips=%lld fps=%.3f", EDL_TAG,
	     utf8(request.video.path).constData(), static_cast<long long>(request.clips.size()), request.frame_rate);

	DestinationRequest destination;
	destination.title = m_settings.edl_dialog_title;
	destination.suggested_name = QFileInfo(request.video.path).fileName() + ".edl";
	destination.filter_name = "EDL";
	destination.extension = "edl";

	QString path;
	if (!choose_destination(destination, &path)) {
		blog(LOG_DEBUG, "[turbocut-export][%s] destination selection cancelled", EDL_TAG);
		return {ExportStatus::Cancelled, {}, {}};
	}

	ProbeData probe;
	double offset_seconds = 0.0;
	if (!resolve_offset(request, EDL_TAG, &probe, &offset_seconds, &error))
		return failure(EDL_TAG, error);

	EdlDocumentInput input;
	input.title = m_settings.edl_title;
	input.clip_name = effective_clip_name(request);
	input.clips = request.clips;
	input.frame_rate = request.frame_rate;
	input.start_offset_seconds = offset_seconds;

	const QString edl = EdlWriter().build_document(input);
	if (!m_writer->write_text(path, edl, &error))
		return failure(EDL_TAG, error);

	blog(LOG_INFO, "[turbocut-export][%s] wrote %lld cuts to '%s'", EDL_TAG,
	     static_cast<long long>(request.clips.size()), utf8(path).constData());
	return {ExportStatus::Exported, path, {}};
}

ExportResult ExportController::export_fcpxml(const ExportRequest &request)
{
	QString error;
	if (!check_request(request, &error))
		return failure(FCPXML_TAG, error);
	blog(LOG_INFO, "[turbocut-export][%s] export start: source='%s' clips=%lld fps=%.3f", FCPXML_TAG,
	     utf8(request.video.path).constData(), static_cast<long long>(request.clips.size()), request.frame_rate);

	DestinationRequest destination;
	destination.title = m_settings.fcpxml_dialog_title;
	destination.suggested_name = QFileInfo(request.video.path).fileName() + ".fcpxmld";
	destination.filter_name = "FCPXML 1.10";
	destination.extension = "fcpxmld";

	QString bundle_path;
	if (!choose_destination(destination, &bundle_path)) {
		blog(LOG_DEBUG, "[turbocut-export][%s] destination selection cancelled", FCPXML_TAG);
		return {ExportStatus::Cancelled, {}, {}};
	}

	ProbeData probe;
	double offset_seconds = 0.0;
	if (!resolve_offset(request, FCPXML_TAG, &probe, &offset_seconds, &error))
		return failure(FCPXML_TAG, error);

	double source_duration = request.video.duration;
	if (source_duration <= 0.0) {
		source_duration = probe.duration;
		blog(LOG_DEBUG, "[turbocut-export][%s] source duration %.3fs taken from the probe", FCPXML_TAG,
		     source_duration);
	}
	if (source_duration <= 0.0)
		return failure(FCPXML_TAG, QString("Source duration of %1 is unknown").arg(request.video.path));
	if (!frame_count_in_range(source_duration, request.frame_rate))
		return failure(FCPXML_TAG, QString("Source duration %1s is out of range").arg(source_duration));

	if (!is_supported_frame_rate(request.frame_rate))
		blog(LOG_WARNING, "[turbocut-export][%s] frame rate %.3f has no frame duration entry; using 1001/24000s",
		     FCPXML_TAG, request.frame_rate);

	FcpxmlDocumentInput input;
	input.media_path = QFileInfo(request.video.path).absoluteFilePath();
	input.clip_name = effective_clip_name(request);
	input.source_duration = source_duration;
	input.clips = request.clips;
	input.frame_rate = request.frame_rate;
	input.start_offset_seconds = offset_seconds;

	const QString xml = FcpxmlWriter().build_document(input);

	bool created = false;
	if (!m_writer->make_bundle_directory(bundle_path, &created, &error))
		return failure(FCPXML_TAG, error);

	const QString document_path = FcpxmlWriter::document_path_in_bundle(bundle_path);
	if (!m_writer->write_text(document_path, xml, &error)) {
		QString cleanup_error;
		if (created && !m_writer->remove_bundle_directory(bundle_path, &cleanup_error))
			blog(LOG_WARNING, "[turbocut-export][%s] %s", FCPXML_TAG, utf8(cleanup_error).constData());
		return failure(FCPXML_TAG, error);
	}

	blog(LOG_INFO, "[turbocut-export][%s] wrote %lld clips to '%s'", FCPXML_TAG,
	     static_cast<long long>(request.clips.size()), utf8(document_path).constData());
	return {ExportStatus::Exported, bundle_path, {}};
}

bool ExportController::check_request(const ExportRequest &request, QString *error) const
{
	if (!m_probe || !m_picker || !m_writer) {
		if (error)
			*error = "Export controller is missing a collaborator";
		return false;
	}
	if (!std::isfinite(request.frame_rate) || request.frame_rate <= 0.0) {
		if (error)
			*error = QString("Invalid frame rate: %1").arg(request.frame_rate);
		return false;
	}
	if (request.video.path.isEmpty()) {
		if (error)
			*error = "Source video path is empty";
		return false;
	}
	if (!frame_count_in_range(request.video.duration, request.frame_rate)) {
		if (error)
			*error = QString("Source duration %1s is out of range").arg(request.video.duration);
		return false;
	}
	if (!validate_clips(request.clips, error))
		return false;

	// Clips are validated as 0 <= start < end, so the end bound is the largest.
	for (int i = 0; i < request.clips.size(); ++i) {
		if (!frame_count_in_range(request.clips.at(i).end, request.frame_rate)) {
			if (error)
				*error = QString("Clip %1 ends at %2s, beyond the frame range at %3 fps")
						 .arg(i)
						 .arg(request.clips.at(i).end)
						 .arg(request.frame_rate);
			return false;
		}
	}
	return true;
}

bool ExportController::resolve_offset(const ExportRequest &request, const char *format_tag, ProbeData *probe,
				      double *offset_seconds, QString *error) const
{
	const uint64_t probe_start_ns = os_gettime_ns();
	if (!m_probe->probe(request.video.path, probe, error))
		return false;
	blog(LOG_DEBUG, "[turbocut-export][%s] probed '%s' in %llu ms", format_tag,
	     utf8(request.video.path).constData(),
	     static_cast<unsigned long long>((os_gettime_ns() - probe_start_ns) / 1000000ULL));

	const StartTimecode start = resolve_start_timecode(*probe, request.frame_rate);
	if (!start_offset_seconds(start, request.frame_rate, offset_seconds, error))
		return false;

	blog(LOG_INFO, "[turbocut-export][%s] start timecode %s from %s, offset %.1fs", format_tag,
	     utf8(start.timecode).constData(), start_timecode_source_name(start.source), *offset_seconds);
	return true;
}

bool ExportController::choose_destination(const DestinationRequest &destination, QString *path)
{
	QString chosen;
	if (!m_picker->choose(destination, &chosen) || chosen.isEmpty())
		return false;

	*path = with_extension(chosen, destination.extension);
	return true;
}

QString ExportController::effective_clip_name(const ExportRequest &request)
{
	if (!request.clip_name.trimmed().isEmpty())
		return request.clip_name;
	return QFileInfo(request.video.path).completeBaseName();
}

ExportResult ExportController::failure(const char *format_tag, const QString &error)
{
	blog(LOG_ERROR, "[turbocut-export][%s] export failed: %s", format_tag, utf8(error).constData());
	return {ExportStatus::Failed, {}, error};
}

} // namespace tc
