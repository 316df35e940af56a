#pragma once

#include <string>

enum class ExtractOutcome { Extracted, NotAnArchive, Failed };

bool is_archive_name(const std::string& path);

// Unpacks the zip at `archivePath` into its own directory, then deletes it.
// Never throws; problems are logged and leave the archive in place.
ExtractOutcome extract_archive(const std::string& archivePath);
