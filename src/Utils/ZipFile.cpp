// src/Utils/ZipFile.cpp
#include <Kiln/Utils/Logger.hpp>
#include <Kiln/Utils/ZipFile.hpp>

extern "C" {
    #include "mz.h"
    #include "mz_zip.h"
    #include "mz_zip_rw.h"
}

namespace Kiln::Utils {

    bool isSafeArchiveEntryName(const std::string &entryName) {
        if (entryName.empty())
            return false;
        if (entryName.front() == '/' || entryName.front() == '\\')
            return false;
        if (entryName.size() > 1 && entryName[1] == ':')
            return false;

        std::string::size_type start = 0;
        while (start <= entryName.size()) {
            auto end = entryName.find_first_of("/\\", start);
            if (end == std::string::npos)
                end = entryName.size();
            if (entryName.compare(start, end - start, "..") == 0)
                return false;
            start = end + 1;
        }
        return true;
    }

    ZipFile::ZipFile(const std::filesystem::path &archivePath) : m_archivePath(archivePath), m_zipReader(nullptr) {
        m_logger = Logger::GetOrCreateLogger("ZipFile");
        m_zipReader = mz_zip_reader_create();
        if (!m_zipReader) {
            m_lastErrorMsg = "Failed to create zip reader instance.";
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
        }
    }

    ZipFile::~ZipFile() {
        if (m_zipReader) {
            if (m_isOpen) {
                mz_zip_reader_close(m_zipReader);
            }
            mz_zip_reader_delete(&m_zipReader);
            m_logger->trace("[{}] Zip reader deleted.", m_archivePath.filename().string());
        }
    }

    void ZipFile::logMzError(int32_t err, const std::string &context) {
        m_lastErrorMsg = context + ": minizip-ng error " + std::to_string(err);
        m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
    }

    bool ZipFile::open() {
        if (!m_zipReader) {
            m_lastErrorMsg = "Zip reader was not created.";
            return false;
        }
        if (m_isOpen) {
            return true;
        }

        m_logger->debug("[{}] Opening archive...", m_archivePath.filename().string());
        int32_t err = mz_zip_reader_open_file(m_zipReader, m_archivePath.string().c_str());
        if (err != MZ_OK) {
            logMzError(err, "Failed to open zip file");
            return false;
        }
        m_isOpen = true;
        return true;
    }

    bool ZipFile::isOpen() const { return m_zipReader != nullptr && m_isOpen; }

    std::string ZipFile::getLastError() const { return m_lastErrorMsg; }

    bool ZipFile::ensureDirectoryExists(const std::filesystem::path &path) {
        if (path.empty())
            return true;

        std::error_code ec;
        if (std::filesystem::is_directory(path, ec))
            return true;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            m_lastErrorMsg = "Failed to create directory " + path.string() + ": " + ec.message();
            m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
            return false;
        }
        return true;
    }

    bool ZipFile::extractAll(const std::filesystem::path &outputDirectory) {
        return extractEntries(outputDirectory, nullptr, false);
    }

    bool ZipFile::extractMatching(const std::filesystem::path &outputDirectory, const EntryFilter &filter, bool flatten) {
        return extractEntries(outputDirectory, filter, flatten);
    }

    bool ZipFile::extractEntries(const std::filesystem::path &outputDirectory, const EntryFilter &filter, bool flatten) {
        if (!open()) {
            return false;
        }

        m_logger->debug("[{}] Extracting to: {}", m_archivePath.filename().string(), outputDirectory.string());
        if (!ensureDirectoryExists(outputDirectory))
            return false;

        int32_t err = mz_zip_reader_goto_first_entry(m_zipReader);
        if (err != MZ_OK && err != MZ_END_OF_LIST) {
            logMzError(err, "Failed to go to first entry");
            return false;
        }

        bool allSuccessful = true;
        size_t extracted = 0;
        while (err == MZ_OK) {
            // Owned by the reader, valid until the next goto call.
            mz_zip_file *fileInfo = nullptr;
            err = mz_zip_reader_entry_get_info(m_zipReader, &fileInfo);
            if (err != MZ_OK || fileInfo == nullptr) {
                logMzError(err, "Failed to get entry info");
                return false;
            }

            std::string entryName = fileInfo->filename ? fileInfo->filename : "";
            bool isDir = mz_zip_reader_entry_is_dir(m_zipReader) == MZ_OK;

            if (!isSafeArchiveEntryName(entryName)) {
                m_lastErrorMsg = "Refusing to extract entry outside of the target directory: " + entryName;
                m_logger->error("[{}] {}", m_archivePath.filename().string(), m_lastErrorMsg);
                allSuccessful = false;
            } else if (isDir) {
                if (!flatten && !filter) {
                    if (!ensureDirectoryExists(outputDirectory / std::filesystem::u8path(entryName)))
                        allSuccessful = false;
                }
            } else if (!filter || filter(entryName)) {
                std::filesystem::path entryPath = std::filesystem::u8path(entryName);
                std::filesystem::path outputPath = flatten ? outputDirectory / entryPath.filename()
                                                           : outputDirectory / entryPath;

                if (ensureDirectoryExists(outputPath.parent_path())) {
                    m_logger->trace("[{}] Extracting {} -> {}", m_archivePath.filename().string(), entryName,
                                    outputPath.string());
                    int32_t saveErr = mz_zip_reader_entry_save_file(m_zipReader, outputPath.string().c_str());
                    if (saveErr != MZ_OK) {
                        logMzError(saveErr, "Failed to save entry " + entryName + " to " + outputPath.string());
                        allSuccessful = false;
                    } else {
                        ++extracted;
                    }
                } else {
                    allSuccessful = false;
                }
            }

            err = mz_zip_reader_goto_next_entry(m_zipReader);
        }

        if (err != MZ_END_OF_LIST) {
            logMzError(err, "An error occurred during entry traversal");
            allSuccessful = false;
        }

        m_logger->debug("[{}] Extracted {} entries.", m_archivePath.filename().string(), extracted);
        return allSuccessful;
    }

} // namespace Kiln::Utils
