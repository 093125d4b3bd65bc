#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace relata {

class error : public std::runtime_error {
public:
    explicit error(const std::string& msg) : std::runtime_error(msg) {}
};

// Misconfigured gateway classes and unresolvable adapters
class configuration_error : public error {
public:
    explicit configuration_error(const std::string& msg) : error(msg) {}
};

class missing_adapter_identifier_error : public configuration_error {
public:
    explicit missing_adapter_identifier_error(const std::string& msg) : configuration_error(msg) {}
};

class adapter_load_error : public configuration_error {
public:
    explicit adapter_load_error(const std::string& msg) : configuration_error(msg) {}
};

class invalid_argument_error : public error {
public:
    explicit invalid_argument_error(const std::string& msg) : error(msg) {}
};

class attribute_not_found_error : public error {
public:
    explicit attribute_not_found_error(const std::string& msg) : error(msg) {}
};

class association_not_found_error : public error {
public:
    explicit association_not_found_error(const std::string& msg) : error(msg) {}
};

// loaded::one() on a result with more than one tuple
class tuple_count_mismatch_error : public error {
public:
    explicit tuple_count_mismatch_error(const std::string& msg) : error(msg) {}
};

} // namespace relata

#endif // __cplusplus
