#include "tc-clip-data.hpp"

#include <cmath>

namespace tc {

bool validate_clips(const QVector<Clip> &clips, QString *error)
{
	for (int i = 0; i < clips.size(); ++i) {
		const Clip &clip = clips.at(i);
		if (!std::isfinite(clip.start) || !std::isfinite(clip.end)) {
			if (error)
				*error = QString("Clip %1 has a non-finite boundary").arg(i);
			return false;
		}
		if (clip.start < 0.0) {
			if (error)
				*error = QString("Clip %1 starts before zero (%2s)").arg(i).arg(clip.start);
			return false;
		}
		if (clip.end <= clip.start) {
			if (error)
				*error = QString("Clip %1 ends at %2s, not after its start %3s")
						 .arg(i)
						 .arg(clip.end)
						 .arg(clip.start);
			return false;
		}
	}
	return true;
}

QJsonObject clip_to_json(const Clip &clip)
{
	QJsonObject json_obj;
	json_obj.insert("start", clip.start);
	json_obj.insert("end", clip.end);
	return json_obj;
}

bool clips_from_json(const QJsonArray &json_array, QVector<Clip> *clips, QString *error)
{
	QVector<Clip> parsed;
	parsed.reserve(json_array.size());
	for (int i = 0; i < json_array.size(); ++i) {
		const QJsonObject obj = json_array.at(i).toObject();
		if (!obj.value("start").isDouble() || !obj.value("end").isDouble()) {
			if (error)
				*error = QString("Clip %1 needs numeric \"start\" and \"end\"").arg(i);
			return false;
		}
		parsed.push_back({obj.value("start").toDouble(), obj.value("end").toDouble()});
	}

	if (clips)
		*clips = parsed;
	return true;
}

} // namespace tc
