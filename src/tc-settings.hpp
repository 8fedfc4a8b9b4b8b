#pragma once

#include <QJsonObject>
#include <QString>

namespace tc {

struct ExportSettings {
	double frame_rate = 23.976;
	QString edl_title = "Silence Removed";
	QString edl_dialog_title = "Export EDL";
	QString fcpxml_dialog_title = "Export FCPXML";
	QString ffprobe_path;
	int probe_timeout_ms = 20000;
};

QJsonObject export_settings_to_json(const ExportSettings &settings);
ExportSettings export_settings_from_json(const QJsonObject &json_obj);

class SettingsStore {
public:
	void set_base_dir(const QString &base_dir);
	void set_settings_path(const QString &settings_path);

	bool load();
	bool save() const;

	ExportSettings &settings();
	const ExportSettings &settings() const;

	QString settings_path() const;

private:
	QString m_base_dir;
	QString m_settings_path;
	ExportSettings m_settings;
};

} // namespace tc
