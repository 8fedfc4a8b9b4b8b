#include "tc-settings.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

namespace tc {
namespace {

bool read_json_file(const QString &path, QJsonObject *out_obj)
{
	QFile file(path);
	if (!file.exists()) {
		*out_obj = QJsonObject();
		return true;
	}
	if (!file.open(QIODevice::ReadOnly))
		return false;

	QJsonParseError parse_error;
	const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
	if (parse_error.error != QJsonParseError::NoError || !doc.isObject())
		return false;

	*out_obj = doc.object();
	return true;
}

bool write_json_file(const QString &path, const QJsonObject &json_obj)
{
	QFileInfo info(path);
	QDir dir = info.dir();
	if (!dir.exists() && !dir.mkpath("."))
		return false;

	QSaveFile file(path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
		return false;

	const QJsonDocument doc(json_obj);
	if (file.write(doc.toJson(QJsonDocument::Indented)) == -1)
		return false;

	return file.commit();
}

QString string_or(const QJsonObject &json_obj, const char *key, const QString &fallback)
{
	const QJsonValue value = json_obj.value(key);
	return value.isString() ? value.toString() : fallback;
}

} // namespace

QJsonObject export_settings_to_json(const ExportSettings &settings)
{
	QJsonObject json_obj;
	json_obj.insert("frameRate", settings.frame_rate);
	json_obj.insert("edlTitle", settings.edl_title);
	json_obj.insert("edlDialogTitle", settings.edl_dialog_title);
	json_obj.insert("fcpxmlDialogTitle", settings.fcpxml_dialog_title);
	json_obj.insert("ffprobePath", settings.ffprobe_path);
	json_obj.insert("probeTimeoutMs", settings.probe_timeout_ms);
	return json_obj;
}

ExportSettings export_settings_from_json(const QJsonObject &json_obj)
{
	ExportSettings settings;
	if (json_obj.isEmpty())
		return settings;

	const double frame_rate = json_obj.value("frameRate").toDouble(settings.frame_rate);
	if (frame_rate > 0.0)
		settings.frame_rate = frame_rate;
	settings.edl_title = string_or(json_obj, "edlTitle", settings.edl_title);
	settings.edl_dialog_title = string_or(json_obj, "edlDialogTitle", settings.edl_dialog_title);
	settings.fcpxml_dialog_title = string_or(json_obj, "fcpxmlDialogTitle", settings.fcpxml_dialog_title);
	settings.ffprobe_path = string_or(json_obj, "ffprobePath", settings.ffprobe_path);
	const int timeout_ms = json_obj.value("probeTimeoutMs").toInt(settings.probe_timeout_ms);
	if (timeout_ms > 0)
		settings.probe_timeout_ms = timeout_ms;
	return settings;
}

void SettingsStore::set_base_dir(const QString &base_dir)
{
	m_base_dir = base_dir;
}

void SettingsStore::set_settings_path(const QString &settings_path)
{
	m_settings_path = settings_path;
}

bool SettingsStore::load()
{
	QJsonObject json_obj;
	if (!read_json_file(settings_path(), &json_obj))
		return false;

	m_settings = export_settings_from_json(json_obj);
	return true;
}

bool SettingsStore::save() const
{
	return write_json_file(settings_path(), export_settings_to_json(m_settings));
}

ExportSettings &SettingsStore::settings()
{
	return m_settings;
}

const ExportSettings &SettingsStore::settings() const
{
	return m_settings;
}

QString SettingsStore::settings_path() const
{
	if (!m_settings_path.isEmpty())
		return m_settings_path;
	return m_base_dir + "/turbocut-export.json";
}

} // namespace tc
