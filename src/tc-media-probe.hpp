#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QVector>

namespace tc {

struct ProbeStream {
	QString codec_type;
	QMap<QString, QString> tags;
	QString start_time;
};

struct ProbeData {
	QMap<QString, QString> format_tags;
	// Container duration in seconds; 0 when ffprobe reports none.
	double duration = 0.0;
	QVector<ProbeStream> streams;
};

ProbeData probe_data_from_json(const QJsonObject &json_obj);

class MediaProbe {
public:
	virtual ~MediaProbe() = default;

	virtual bool probe(const QString &media_path, ProbeData *out, QString *error) const = 0;
};

class FfprobeMediaProbe : public MediaProbe {
public:
	void set_executable(const QString &executable);
	void set_timeout_ms(int timeout_ms);

	bool probe(const QString &media_path, ProbeData *out, QString *error) const override;

private:
	QString resolve_executable() const;

	QString m_executable;
	int m_timeout_ms = 20000;
};

} // namespace tc
