#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QVector>

namespace tc {

struct Clip {
	double start = 0.0;
	double end = 0.0;
};

struct VideoInfo {
	QString path;
	double duration = 0.0;
};

bool validate_clips(const QVector<Clip> &clips, QString *error);

QJsonObject clip_to_json(const Clip &clip);
bool clips_from_json(const QJsonArray &json_array, QVector<Clip> *clips, QString *error);

inline double clip_length(const Clip &clip)
{
	return clip.end - clip.start;
}

} // namespace tc
