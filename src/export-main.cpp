/*
TurboCut Export
Copyright (C) 2026 TurboCut contributors

This program is free software; you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation; either version 2 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License along
with this program. If not, see <https://www.gnu.org/licenses/>
*/

#include <util/base.h>

#include <QApplication>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStandardPaths>

#include <cstdarg>
#include <cstdio>
#include <memory>

#include "tc-export-controller.hpp"
#include "tc-file-dialog-picker.hpp"
#include "tc-save-file-writer.hpp"
#include "tc-settings.hpp"

namespace {

constexpr int EXIT_EXPORTED = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_CANCELLED = 2;
constexpr int EXIT_USAGE = 64;

bool g_verbose = false;

void cli_log_handler(int level, const char *format, va_list args, void *)
{
	if (level == LOG_DEBUG && !g_verbose)
		return;

	FILE *out = level <= LOG_WARNING ? stderr : stdout;
	vfprintf(out, format, args);
	fputc('\n', out);
}

bool load_clips(const QString &path, QVector<tc::Clip> *clips, QString *error)
{
	QFile file(path);
	if (!file.open(QIODevice::ReadOnly)) {
		*error = QString("Failed to open clip list: %1").arg(path);
		return false;
	}

	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isArray()) {
		*error = QString("Clip list is not a JSON array: %1").arg(path);
		return false;
	}

	return tc::clips_from_json(doc.array(), clips, error);
}

void log_clips(const QVector<tc::Clip> &clips)
{
	if (!g_verbose)
		return;

	QJsonArray json_array;
	for (const tc::Clip &clip : clips)
		json_array.append(tc::clip_to_json(clip));
	blog(LOG_DEBUG, "[turbocut-export] clips: %s",
	     QJsonDocument(json_array).toJson(QJsonDocument::Compact).constData());
}

int usage_error(const QString &message)
{
	blog(LOG_ERROR, "[turbocut-export] %s", message.toUtf8().constData());
	return EXIT_USAGE;
}

} // namespace

int main(int argc, char **argv)
{
	base_set_log_handler(cli_log_handler, nullptr);

	// The save dialog needs a GUI application; a fixed --output does not.
	std::unique_ptr<QCoreApplication> app;
	if (tc::has_long_option(argc, argv, "output"))
		app = std::make_unique<QCoreApplication>(argc, argv);
	else
		app = std::make_unique<QApplication>(argc, argv);
	QCoreApplication::setApplicationName("turbocut-export");

	QCommandLineParser parser;
	parser.setApplicationDescription("Export retained clips as an EDL or an FCPXML bundle");
	parser.addHelpOption();
	const QCommandLineOption format_option("format", "Output format: edl or fcpxml.", "format");
	const QCommandLineOption clips_option("clips", "JSON array of {start, end} clips in seconds.", "file");
	const QCommandLineOption video_option("video", "Source video file.", "path");
	const QCommandLineOption duration_option("duration", "Source duration in seconds; probed when omitted.", "seconds");
	const QCommandLineOption rate_option("frame-rate", "Nominal frame rate.", "rate");
	const QCommandLineOption name_option("name", "Source clip name.", "name");
	const QCommandLineOption output_option("output", "Destination path; skips the save dialog.", "path");
	const QCommandLineOption config_option("config", "Settings file.", "file");
	const QCommandLineOption verbose_option("verbose", "Print debug logging.");
	parser.addOptions({format_option, clips_option, video_option, duration_option, rate_option, name_option,
			   output_option, config_option, verbose_option});
	parser.process(*app);

	g_verbose = parser.isSet(verbose_option);

	const QString format = parser.value(format_option).toLower();
	if (format != "edl" && format != "fcpxml")
		return usage_error("--format must be 'edl' or 'fcpxml'");
	if (!parser.isSet(clips_option) || !parser.isSet(video_option))
		return usage_error("--clips and --video are required");

	tc::SettingsStore store;
	if (parser.isSet(config_option))
		store.set_settings_path(parser.value(config_option));
	else
		store.set_base_dir(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation));
	if (!store.load())
		blog(LOG_WARNING, "[turbocut-export] unreadable settings '%s'; using defaults",
		     store.settings_path().toUtf8().constData());

	tc::ExportRequest request;
	QString error;
	if (!load_clips(parser.value(clips_option), &request.clips, &error))
		return usage_error(error);
	log_clips(request.clips);

	bool ok = true;
	request.video.path = parser.value(video_option);
	// Without --duration the FCPXML asset length comes from ffprobe.
	if (parser.isSet(duration_option)) {
		request.video.duration = parser.value(duration_option).toDouble(&ok);
		if (!ok)
			return usage_error("--duration must be a number");
	}
	request.frame_rate = store.settings().frame_rate;
	if (parser.isSet(rate_option)) {
		request.frame_rate = parser.value(rate_option).toDouble(&ok);
		if (!ok)
			return usage_error("--frame-rate must be a number");
	}
	request.clip_name = parser.value(name_option);

	tc::FfprobeMediaProbe probe;
	probe.set_executable(store.settings().ffprobe_path);
	probe.set_timeout_ms(store.settings().probe_timeout_ms);

	std::unique_ptr<tc::DestinationPicker> picker;
	if (parser.isSet(output_option))
		picker = std::make_unique<tc::FixedDestinationPicker>(parser.value(output_option));
	else
		picker = std::make_unique<tc::FileDialogPicker>();

	tc::SaveFileArtifactWriter writer;
	tc::ExportController controller(&probe, picker.get(), &writer);
	controller.set_settings(store.settings());

	const tc::ExportResult result = format == "edl" ? controller.export_edl(request)
							: controller.export_fcpxml(request);
	switch (result.status) {
	case tc::ExportStatus::Exported:
		fprintf(stdout, "%s\n", result.artifact_path.toUtf8().constData());
		return EXIT_EXPORTED;
	case tc::ExportStatus::Cancelled:
		return EXIT_CANCELLED;
	case tc::ExportStatus::Failed:
	default:
		// ExportController already logged the error.
		return EXIT_FAILED;
	}
}
