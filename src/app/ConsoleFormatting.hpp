/**
 * @file ConsoleFormatting.hpp
 * @brief Helpers for terminal output.
 */

#pragma once
#include <string>
#include "domain/ValidationResult.hpp"

namespace symbolgate::app {

/**
 * @brief Shortens text to maxLength by replacing its middle with "...".
 * @throws std::out_of_range if maxLength is below 5.
 */
std::string ShortenMiddle(const std::string& text, std::size_t maxLength);

/** @brief One-line human description of a verdict. */
std::string DescribeResult(domain::SymbolValidationResult result);

/** @brief Process exit code for a verdict: 0 when nothing is wrong, 1 otherwise. */
int ExitCodeFor(domain::SymbolValidationResult result);

} // namespace symbolgate::app
