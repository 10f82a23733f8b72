//===----------------------------------------------------------------------===//
//
// Part of the Prov project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Errors.hpp
/// @brief Exception types raised while loading YAML.
///
/// @details Three layers exist:
///   - MarkedYamlError: a grammar or construction failure tied to a Mark.
///   - StructuralConstructionError: a MarkedYamlError raised by the loader's
///     own tag handlers; its message is already precise, so error
///     classification never rewrites it.
///   - ParsingFailedError: the only exception leaving a Loader.  It carries the
///     normalized message, the Origin, a rendered source excerpt and the
///     underlying exception as its cause.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/origin.hpp"
#include "yaml/Node.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace prov::yaml
{

/// @brief Failure tied to a position in the YAML text.
class MarkedYamlError : public std::runtime_error
{
  public:
    MarkedYamlError(std::string context,
                    std::optional<Mark> contextMark,
                    std::string problem,
                    std::optional<Mark> problemMark,
                    std::string note = {});

    [[nodiscard]] const std::string &context() const
    {
        return context_;
    }

    [[nodiscard]] const std::optional<Mark> &contextMark() const
    {
        return contextMark_;
    }

    [[nodiscard]] const std::string &problem() const
    {
        return problem_;
    }

    [[nodiscard]] const std::optional<Mark> &problemMark() const
    {
        return problemMark_;
    }

    [[nodiscard]] const std::string &note() const
    {
        return note_;
    }

  private:
    std::string context_;
    std::optional<Mark> contextMark_;
    std::string problem_;
    std::optional<Mark> problemMark_;
    std::string note_;
};

/// @brief Construction failure raised by a loader tag handler.
class StructuralConstructionError : public MarkedYamlError
{
  public:
    using MarkedYamlError::MarkedYamlError;
};

/// @brief Normalized, user-facing parse failure.
class ParsingFailedError : public std::runtime_error
{
  public:
    ParsingFailedError(std::string message,
                       support::Origin origin,
                       std::string sourceContext,
                       std::optional<std::string> help,
                       std::exception_ptr cause);

    /// @brief Normalized message without the "YAML parsing failed" prefix.
    [[nodiscard]] const std::string &message() const
    {
        return message_;
    }

    [[nodiscard]] const support::Origin &origin() const
    {
        return origin_;
    }

    /// @brief Rendered excerpt of the source around origin().
    [[nodiscard]] const std::string &sourceContext() const
    {
        return sourceContext_;
    }

    [[nodiscard]] const std::optional<std::string> &help() const
    {
        return help_;
    }

    /// @brief The exception this failure was classified from.
    [[nodiscard]] std::exception_ptr cause() const
    {
        return cause_;
    }

    /// @brief Error-severity diagnostic carrying the same information.
    [[nodiscard]] support::Diagnostic toDiagnostic() const;

  private:
    std::string message_;
    support::Origin origin_;
    std::string sourceContext_;
    std::optional<std::string> help_;
    std::exception_ptr cause_;
};

} // namespace prov::yaml
