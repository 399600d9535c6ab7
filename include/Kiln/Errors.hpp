// include/Kiln/Errors.hpp
#ifndef KILN_ERRORS_HPP
#define KILN_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Kiln {

    class LauncherError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Transport failure (statusCode 0) or a non-2xx response.
    class NetworkError : public LauncherError {
    public:
        NetworkError(const std::string& message, long statusCode = 0)
            : LauncherError(message), m_statusCode(statusCode) {}

        long statusCode() const { return m_statusCode; }

        bool isTransient() const {
            return m_statusCode == 0 || m_statusCode == 408 || m_statusCode == 429 ||
                   (m_statusCode >= 500 && m_statusCode < 600);
        }

    private:
        long m_statusCode;
    };

    class IntegrityError : public LauncherError {
    public:
        using LauncherError::LauncherError;
    };

    class UnsupportedPlatformError : public LauncherError {
    public:
        using LauncherError::LauncherError;
    };

    class InstanceExistsError : public LauncherError {
    public:
        using LauncherError::LauncherError;
    };

    class LaunchError : public LauncherError {
    public:
        using LauncherError::LauncherError;
    };

    class ExtractionError : public LauncherError {
    public:
        using LauncherError::LauncherError;
    };

    class OperationCancelledError : public LauncherError {
    public:
        OperationCancelledError() : LauncherError("The operation was cancelled.") {}
        using LauncherError::LauncherError;
    };

    class TimeoutError : public OperationCancelledError {
    public:
        TimeoutError() : OperationCancelledError("The operation timed out.") {}
        using OperationCancelledError::OperationCancelledError;
    };

} // namespace Kiln

#endif // KILN_ERRORS_HPP
