#ifndef BASKETRY_EXCEPTIONS_H
#define BASKETRY_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Basketry {

class BasketryException : public std::runtime_error {
public:
    explicit BasketryException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public BasketryException {
public:
    explicit IOException(const std::string& message) : BasketryException("IO Error: " + message) {}
};

class DatasetException : public BasketryException {
public:
    explicit DatasetException(const std::string& message) : BasketryException("Dataset Error: " + message) {}
};

class ConfigurationException : public BasketryException {
public:
    explicit ConfigurationException(const std::string& message) : BasketryException("Configuration Error: " + message) {}
};

// No column could be identified or inferred as the item column.
class NoItemColumnException : public BasketryException {
public:
    explicit NoItemColumnException(const std::string& message) : BasketryException("No Item Column: " + message) {}
};

class EmptyInputException : public BasketryException {
public:
    explicit EmptyInputException(const std::string& message) : BasketryException("Empty Input: " + message) {}
};

class AnalysisException : public BasketryException {
public:
    explicit AnalysisException(const std::string& message) : BasketryException("Analysis Error: " + message) {}
};

} // namespace Basketry

#endif // BASKETRY_EXCEPTIONS_H
