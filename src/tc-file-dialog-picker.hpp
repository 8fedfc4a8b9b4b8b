#pragma once

#include "tc-export-collaborators.hpp"

class QWidget;

namespace tc {

class FileDialogPicker : public DestinationPicker {
public:
	explicit FileDialogPicker(QWidget *parent = nullptr);

	bool choose(const DestinationRequest &request, QString *path) override;

private:
	QWidget *m_parent = nullptr;
};

} // namespace tc
