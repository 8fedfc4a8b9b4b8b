#pragma once

#include "tc-export-collaborators.hpp"

namespace tc {

class SaveFileArtifactWriter : public ArtifactWriter {
public:
	bool make_bundle_directory(const QString &path, bool *created, QString *error) override;
	bool remove_bundle_directory(const QString &path, QString *error) override;
	bool write_text(const QString &path, const QString &text, QString *error) override;
};

} // namespace tc
