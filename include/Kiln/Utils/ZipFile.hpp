// include/Kiln/Utils/ZipFile.hpp
#ifndef KILN_ZIP_FILE_UTIL_HPP
#define KILN_ZIP_FILE_UTIL_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace Kiln::Utils {

    class ZipFile {
    public:
        // Receives the entry name as stored in the archive ('/' separated).
        using EntryFilter = std::function<bool(const std::string &entryName)>;

        explicit ZipFile(const std::filesystem::path &archivePath);
        ~ZipFile();

        ZipFile(const ZipFile &) = delete;
        ZipFile &operator=(const ZipFile &) = delete;

        // Attempts to open the zip file. Returns true on success.
        bool open();

        // Extracts every entry, keeping the archive's directory layout.
        bool extractAll(const std::filesystem::path &outputDirectory);

        // Extracts the file entries accepted by the filter. With flatten set, each entry is
        // written directly under outputDirectory using only its file name.
        bool extractMatching(const std::filesystem::path &outputDirectory, const EntryFilter &filter, bool flatten);

        bool isOpen() const;
        std::string getLastError() const;

    private:
        std::filesystem::path m_archivePath;
        void *m_zipReader; // Opaque pointer to mz_zip_reader
        bool m_isOpen = false;
        std::shared_ptr<spdlog::logger> m_logger;
        std::string m_lastErrorMsg;

        bool extractEntries(const std::filesystem::path &outputDirectory, const EntryFilter &filter, bool flatten);
        bool ensureDirectoryExists(const std::filesystem::path &path);
        void logMzError(int32_t err, const std::string &context);
    };

    // True when the entry name stays inside the extraction root (no absolute path, no "..").
    bool isSafeArchiveEntryName(const std::string &entryName);

} // namespace Kiln::Utils

#endif // KILN_ZIP_FILE_UTIL_HPP
