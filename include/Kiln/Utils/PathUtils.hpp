// include/Kiln/Utils/PathUtils.hpp
#ifndef KILN_PATH_UTILS_HPP
#define KILN_PATH_UTILS_HPP

#include <string>
#include <vector>

namespace Kiln::Utils {

    /**
     * @brief Produces a directory name valid on Windows, Linux and macOS at the same time.
     *
     * Input is UTF-8. Leading and trailing dots and spaces are trimmed, characters that are
     * illegal on any of the three systems (plus control, bidi and zero-width code points) are
     * replaced, reserved Windows device names get the replacement appended and the result is
     * cut to 255 bytes on a code point boundary.
     *
     * @throws std::invalid_argument if the name is empty or whitespace only, if the replacement
     *         is itself illegal, or if nothing is left after sanitizing.
     */
    std::string sanitizeDirectoryName(const std::string& name, char replacement = '_');

    /**
     * @brief Sanitizes the name and, when a folder with that name already exists
     * (case-insensitive), appends "_(n)" with n one above the highest existing suffix.
     */
    std::string incrementNumberedFolderNameIfExistsAndSanitize(const std::string& rawFolderName,
                                                               const std::vector<std::string>& existingFolders);

} // namespace Kiln::Utils

#endif // KILN_PATH_UTILS_HPP
