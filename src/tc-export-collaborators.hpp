#pragma once

#include <QString>

#include <cstring>

namespace tc {

struct DestinationRequest {
	QString title;
	QString suggested_name;
	QString filter_name;
	QString extension;
};

class DestinationPicker {
public:
	virtual ~DestinationPicker() = default;

	// Returns false when the user cancelled.
	virtual bool choose(const DestinationRequest &request, QString *path) = 0;
};

class ArtifactWriter {
public:
	virtual ~ArtifactWriter() = default;

	// An existing directory is not an error. *created reports whether this call made it.
	virtual bool make_bundle_directory(const QString &path, bool *created, QString *error) = 0;
	virtual bool remove_bundle_directory(const QString &path, QString *error) = 0;
	virtual bool write_text(const QString &path, const QString &text, QString *error) = 0;
};

class FixedDestinationPicker : public DestinationPicker {
public:
	explicit FixedDestinationPicker(const QString &path) : m_path(path) {}

	bool choose(const DestinationRequest &, QString *path) override
	{
		if (m_path.isEmpty())
			return false;
		if (path)
			*path = m_path;
		return true;
	}

private:
	QString m_path;
};

// Scans raw arguments before any QCoreApplication exists, to decide whether a
// fixed destination replaces the save dialog. Matches "--<name>" and
// "--<name>=<value>" only.
inline bool has_long_option(int argc, char **argv, const char *name)
{
	const size_t name_length = std::strlen(name);
	for (int i = 1; i < argc; ++i) {
		const char *arg = argv[i];
		if (std::strncmp(arg, "--", 2) != 0 || std::strncmp(arg + 2, name, name_length) != 0)
			continue;
		const char next = arg[2 + name_length];
		if (next == '\0' || next == '=')
			return true;
	}
	return false;
}

} // namespace tc
