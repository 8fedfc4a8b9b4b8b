#include "tc-save-file-writer.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>

namespace tc {

bool SaveFileArtifactWriter::make_bundle_directory(const QString &path, bool *created, QString *error)
{
	if (created)
		*created = false;

	const QFileInfo info(path);
	if (info.isDir())
		return true;
	if (info.exists()) {
		if (error)
			*error = QString("Bundle path exists and is not a directory: %1").arg(path);
		return false;
	}

	if (!QDir().mkdir(path)) {
		if (error)
			*error = QString("Failed to create bundle directory: %1").arg(path);
		return false;
	}

	if (created)
		*created = true;
	return true;
}

bool SaveFileArtifactWriter::remove_bundle_directory(const QString &path, QString *error)
{
	QDir dir(path);
	if (!dir.exists())
		return true;
	if (!dir.removeRecursively()) {
		if (error)
			*error = QString("Failed to remove bundle directory: %1").arg(path);
		return false;
	}
	return true;
}

bool SaveFileArtifactWriter::write_text(const QString &path, const QString &text, QString *error)
{
	QSaveFile file(path);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
		if (error)
			*error = QString("Failed to open for write: %1").arg(path);
		return false;
	}

	const QByteArray payload = text.toUtf8();
	if (file.write(payload) == -1) {
		file.cancelWriting();
		if (error)
			*error = QString("Failed to write: %1").arg(path);
		return false;
	}

	if (!file.commit()) {
		if (error)
			*error = QString("Failed to commit: %1").arg(path);
		return false;
	}

	return true;
}

} // namespace tc
