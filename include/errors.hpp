#pragma once
#include <stdexcept>
#include <string>

namespace data_assistance {

class DataAssistanceException : public std::runtime_error {
public:
    explicit DataAssistanceException(const std::string& message) : std::runtime_error(message) {}
};

// Query/info against a session that has no collection.
class NotFoundError : public DataAssistanceException {
public:
    explicit NotFoundError(const std::string& message) : DataAssistanceException("Not found: " + message) {}
};

// Zero chunks produced, or the store refused the collection.
class IngestionError : public DataAssistanceException {
public:
    explicit IngestionError(const std::string& message) : DataAssistanceException("Ingestion failed: " + message) {}
};

class EmbeddingError : public DataAssistanceException {
public:
    explicit EmbeddingError(const std::string& message) : DataAssistanceException("Embedding failed: " + message) {}
};

class TimeoutError : public DataAssistanceException {
public:
    explicit TimeoutError(const std::string& message) : DataAssistanceException("Deadline exceeded: " + message) {}
};

class DatasetError : public DataAssistanceException {
public:
    explicit DatasetError(const std::string& message) : DataAssistanceException("Dataset error: " + message) {}
};

class ConfigError : public DataAssistanceException {
public:
    explicit ConfigError(const std::string& message) : DataAssistanceException("Config error: " + message) {}
};

} // namespace data_assistance
