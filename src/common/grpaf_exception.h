#ifndef GRPAF_EXCEPTION_H_
#define GRPAF_EXCEPTION_H_

#include <stdexcept>
#include <string>

#include "fmt/format.h"

namespace grpaf
{

/*! @brief label or dataset source unreadable */
class InputError : public std::runtime_error
{
public:
    explicit InputError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/*! @brief malformed label row, malformed or unsupported genotype call */
class FormatError : public std::runtime_error
{
public:
    explicit FormatError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/*! @brief label sample absent from the dataset sample order (strict mode only) */
class ConsistencyError : public std::runtime_error
{
public:
    explicit ConsistencyError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/*! @brief failure writing a header, descriptor or record */
class OutputError : public std::runtime_error
{
public:
    explicit OutputError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/*! @brief invalid tool configuration, e.g. an unknown tag name */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message)
    {}
};

}  // namespace grpaf

/**
 * @brief Check the condition, throw the given error type with a formatted message when it holds
 * @param cond bool type condition
 * @param error_type one of the grpaf error classes
 */
#define CHECK_CONDITION_THROW(cond, error_type, fmt_str, ...)                 \
    do {                                                                      \
        if (__glibc_unlikely(cond)) {                                         \
            throw error_type(fmt::format(fmt_str, ##__VA_ARGS__));            \
        }                                                                     \
    } while (false)

#endif  // GRPAF_EXCEPTION_H_
