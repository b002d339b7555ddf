#pragma once

#include <stdexcept>
#include <string>

namespace amod {

/**
 * @brief Invalid configuration value, raised before any computation runs
 */
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(const std::string& parameter, const std::string& message)
        : std::invalid_argument("Invalid configuration '" + parameter + "': " + message),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

/**
 * @brief Network definition violates the bipartite metabolite/reaction model
 */
class StructuralError : public std::runtime_error {
public:
    StructuralError(const std::string& offending_id, const std::string& message)
        : std::runtime_error(message + " (id: " + offending_id + ")"),
          offending_id_(offending_id) {}

    const std::string& offending_id() const { return offending_id_; }

private:
    std::string offending_id_;
};

/**
 * @brief Lookup of an identifier that the network does not contain
 */
class NotFoundError : public std::out_of_range {
public:
    explicit NotFoundError(const std::string& id)
        : std::out_of_range("Node not found: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

/**
 * @brief Turn a "parameter: message" validation string into a ConfigurationError
 */
inline ConfigurationError configuration_error(const std::string& validation_message) {
    auto pos = validation_message.find(": ");
    if (pos == std::string::npos) {
        return ConfigurationError("config", validation_message);
    }
    return ConfigurationError(validation_message.substr(0, pos),
                              validation_message.substr(pos + 2));
}

// Malformed measurement row
class MeasurementError : public std::invalid_argument {
public:
    MeasurementError(const std::string& node_id, const std::string& study_id,
                     const std::string& message)
        : std::invalid_argument("Invalid measurement for node '" + node_id +
                                "' in study '" + study_id + "': " + message),
          node_id_(node_id), study_id_(study_id) {}

    const std::string& node_id() const { return node_id_; }
    const std::string& study_id() const { return study_id_; }

private:
    std::string node_id_;
    std::string study_id_;
};

} // namespace amod
