#include "archive_extractor.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "url_utils.hpp"

#include <minizip/unzip.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {
constexpr size_t kReadBuffer = 64 * 1024;

// Closes the zip handle on scope exit.
struct UnzFileCloser {
    void operator()(void* file) const {
        if (file) unzClose(static_cast<unzFile>(file));
    }
};
using UnzHandle = std::unique_ptr<void, UnzFileCloser>;

// Rejects names that would land outside the destination.
bool is_safe_entry(const std::string& name) {
    if (name.empty() || name[0] == '/' || name[0] == '\\') return false;
    if (name.find(':') != std::string::npos) return false;
    fs::path p(name);
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

void extract_current(unzFile zip, const fs::path& target) {
    if (unzOpenCurrentFile(zip) != UNZ_OK) {
        throw ArchiveError("cannot open entry " + target.filename().string());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        unzCloseCurrentFile(zip);
        throw ArchiveError("cannot create " + target.string());
    }
    std::vector<char> buffer(kReadBuffer);
    int n = 0;
    while ((n = unzReadCurrentFile(zip, buffer.data(), static_cast<unsigned>(buffer.size()))) > 0) {
        out.write(buffer.data(), n);
        if (!out) break;
    }
    // UNZ_CRCERROR is reported here
    int closeRc = unzCloseCurrentFile(zip);
    out.close();
    if (n < 0) throw ArchiveError("read error " + std::to_string(n) + " in " + target.filename().string());
    if (closeRc != UNZ_OK) throw ArchiveError("checksum mismatch in " + target.filename().string());
    if (!out) throw ArchiveError("write to " + target.string() + " failed");
}

void extract_all(unzFile zip, const fs::path& destination) {
    unz_file_info64 info;
    int rc = unzGoToFirstFile(zip);
    while (rc == UNZ_OK) {
        // Names may be up to 64 KiB; size the buffer from the header first.
        if (unzGetCurrentFileInfo64(zip, &info, nullptr, 0, nullptr, 0, nullptr, 0) != UNZ_OK) {
            throw ArchiveError("cannot read entry header");
        }
        std::string name(static_cast<size_t>(info.size_filename), '\0');
        if (!name.empty() &&
            unzGetCurrentFileInfo64(zip, &info, &name[0], static_cast<uLong>(name.size()),
                                    nullptr, 0, nullptr, 0) != UNZ_OK) {
            throw ArchiveError("cannot read entry name");
        }
        if (!is_safe_entry(name)) {
            log_warn("Skipping unsafe archive entry " + name);
        } else if (ends_with(name, "/")) {
            fs::create_directories(destination / name);
        } else {
            fs::path target = destination / name;
            if (target.has_parent_path()) fs::create_directories(target.parent_path());
            extract_current(zip, target);
        }
        rc = unzGoToNextFile(zip);
    }
    if (rc != UNZ_END_OF_LIST_OF_FILE) throw ArchiveError("corrupt central directory");
}
} // namespace

bool is_archive_name(const std::string& path) {
    return ends_with_ci(path, ".zip");
}

ExtractOutcome extract_archive(const std::string& archivePath) {
    UnzHandle zip(unzOpen64(archivePath.c_str()));
    if (!zip) {
        log_warn(archivePath + " is not a valid zip file.");
        return ExtractOutcome::NotAnArchive;
    }

    const fs::path destination = fs::path(archivePath).parent_path();
    try {
        extract_all(static_cast<unzFile>(zip.get()), destination);
    } catch (const ArchiveError& e) {
        log_error("Failed to unzip " + archivePath + ": " + e.what());
        return ExtractOutcome::Failed;
    } catch (const fs::filesystem_error& e) {
        log_error("Failed to unzip " + archivePath + ": " + e.what());
        return ExtractOutcome::Failed;
    }
    zip.reset();

    std::error_code ec;
    fs::remove(archivePath, ec);
    if (ec) {
        log_error("Extracted " + archivePath + " but could not delete it: " + ec.message());
        return ExtractOutcome::Failed;
    }
    log_info("Extracted and deleted " + archivePath);
    return ExtractOutcome::Extracted;
}
