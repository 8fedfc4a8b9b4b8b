#include "tc-media-probe.hpp"

#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QProcess>
#include <QStandardPaths>

#include <cmath>

namespace tc {
namespace {

QMap<QString, QString> tags_from_json(const QJsonValue &value)
{
	QMap<QString, QString> tags;
	if (!value.isObject())
		return tags;

	const QJsonObject obj = value.toObject();
	for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
		if (it.value().isString())
			tags.insert(it.key(), it.value().toString());
	}
	return tags;
}

QString start_time_from_json(const QJsonValue &value)
{
	if (value.isString())
		return value.toString();
	if (value.isDouble())
		return QString::number(value.toDouble(), 'f', 6);
	return {};
}

double duration_from_json(const QJsonValue &value)
{
	bool ok = value.isDouble();
	double seconds = value.toDouble();
	if (value.isString())
		seconds = value.toString().trimmed().toDouble(&ok);
	if (!ok || !std::isfinite(seconds) || seconds < 0.0)
		return 0.0;
	return seconds;
}

} // namespace

ProbeData probe_data_from_json(const QJsonObject &json_obj)
{
	ProbeData data;
	const QJsonObject format = json_obj.value("format").toObject();
	data.format_tags = tags_from_json(format.value("tags"));
	data.duration = duration_from_json(format.value("duration"));

	const QJsonArray streams = json_obj.value("streams").toArray();
	data.streams.reserve(streams.size());
	for (QJsonValue value : streams) {
		if (!value.isObject())
			continue;

		const QJsonObject obj = value.toObject();
		ProbeStream stream;
		stream.codec_type = obj.value("codec_type").toString();
		stream.tags = tags_from_json(obj.value("tags"));
		stream.start_time = start_time_from_json(obj.value("start_time"));
		data.streams.push_back(stream);
	}

	return data;
}

void FfprobeMediaProbe::set_executable(const QString &executable)
{
	m_executable = executable;
}

void FfprobeMediaProbe::set_timeout_ms(int timeout_ms)
{
	m_timeout_ms = timeout_ms > 0 ? timeout_ms : 20000;
}

QString FfprobeMediaProbe::resolve_executable() const
{
	if (!m_executable.isEmpty())
		return m_executable;
	return QStandardPaths::findExecutable("ffprobe");
}

bool FfprobeMediaProbe::probe(const QString &media_path, ProbeData *out, QString *error) const
{
	if (!QFileInfo::exists(media_path)) {
		if (error)
			*error = QString("Media file does not exist: %1").arg(media_path);
		return false;
	}

	const QString ffprobe = resolve_executable();
	if (ffprobe.isEmpty()) {
		if (error)
			*error = "ffprobe is not installed";
		return false;
	}

	QProcess process;
	process.start(ffprobe, {"-v", "error", "-print_format", "json", "-show_format", "-show_streams", media_path});
	if (!process.waitForStarted(1000)) {
		if (error)
			*error = "Failed to start ffprobe process";
		return false;
	}
	if (!process.waitForFinished(m_timeout_ms)) {
		process.kill();
		process.waitForFinished(1000);
		if (error)
			*error = "ffprobe process timed out";
		return false;
	}

	if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
		const QString stderr_text = QString::fromUtf8(process.readAllStandardError()).trimmed();
		if (error)
			*error = stderr_text.isEmpty() ? QString("ffprobe returned non-zero status")
						       : QString("ffprobe failed: %1").arg(stderr_text);
		return false;
	}

	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(process.readAllStandardOutput(), &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
		if (error)
			*error = QString("Unreadable ffprobe output for %1").arg(media_path);
		return false;
	}

	if (out)
		*out = probe_data_from_json(doc.object());
	return true;
}

} // namespace tc
