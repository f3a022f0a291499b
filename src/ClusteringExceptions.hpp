#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Root of the exceptions thrown by the clustering core.
 */
class ClusteringException : public std::runtime_error {
public:
    explicit ClusteringException(const std::string& message) : std::runtime_error(message) {}
};

/// Invalid call parameter (k, quantile count, perplexity, iteration caps...).
class ParameterException : public ClusteringException {
public:
    explicit ParameterException(const std::string& message)
        : ClusteringException("Parameter Error: " + message) {}
};

/// Input data the numeric code cannot work with.
class DataException : public ClusteringException {
public:
    explicit DataException(const std::string& message)
        : ClusteringException("Data Error: " + message) {}
};

class IOException : public ClusteringException {
public:
    explicit IOException(const std::string& message)
        : ClusteringException("IO Error: " + message) {}
};
