#include "tc-file-dialog-picker.hpp"

#include <QDir>
#include <QFileDialog>

namespace tc {

FileDialogPicker::FileDialogPicker(QWidget *parent) : m_parent(parent) {}

bool FileDialogPicker::choose(const DestinationRequest &request, QString *path)
{
	const QString filter = QString("%1 (*.%2)").arg(request.filter_name, request.extension);
	const QString suggested = QDir::home().filePath(request.suggested_name);
	const QString chosen = QFileDialog::getSaveFileName(m_parent, request.title, suggested, filter);
	if (chosen.isEmpty())
		return false;

	if (path)
		*path = chosen;
	return true;
}

} // namespace tc
