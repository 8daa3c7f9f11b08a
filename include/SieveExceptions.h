#ifndef SIEVE_EXCEPTIONS_H
#define SIEVE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Sieve {

enum class ErrorKind { GENERIC, IO, DATASET, CONFIGURATION, DATA_CONTRACT, RESOLUTION };

const char* errorKindName(ErrorKind kind) noexcept;

class SieveException : public std::runtime_error {
public:
    explicit SieveException(const std::string& message,
                            ErrorKind kind = ErrorKind::GENERIC,
                            std::string identifier = "")
        : std::runtime_error(message), kind_(kind), identifier_(std::move(identifier)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& identifier() const noexcept { return identifier_; }

private:
    ErrorKind kind_;
    std::string identifier_;
};

class IOException : public SieveException {
public:
    explicit IOException(const std::string& message, std::string path = "")
        : SieveException("IO Error: " + message, ErrorKind::IO, std::move(path)) {}
};

class DatasetException : public SieveException {
public:
    explicit DatasetException(const std::string& message)
        : SieveException("Dataset Error: " + message, ErrorKind::DATASET) {}
};

class ConfigurationException : public SieveException {
public:
    explicit ConfigurationException(const std::string& message)
        : SieveException("Configuration Error: " + message, ErrorKind::CONFIGURATION) {}
};

/**
 * @brief Caller supplied inconsistent evaluation input.
 * @details identifier() is the missing column or statistic key.
 */
class DataContractException : public SieveException {
public:
    DataContractException(const std::string& identifier, const std::string& message)
        : SieveException("Data Contract Error: " + message, ErrorKind::DATA_CONTRACT, identifier) {}
};

/**
 * @brief An action could not be resolved against the dataset it was replayed on.
 * @details identifier() is the unresolved column (empty for an unknown action type).
 */
class ResolutionException : public SieveException {
public:
    ResolutionException(std::string actionType, const std::string& column, const std::string& message)
        : SieveException("Resolution Error: " + message, ErrorKind::RESOLUTION, column),
          actionType_(std::move(actionType)) {}

    const std::string& actionType() const noexcept { return actionType_; }

private:
    std::string actionType_;
};

} // namespace Sieve

#endif // SIEVE_EXCEPTIONS_H
