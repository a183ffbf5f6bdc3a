#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse an integer from a string.
// Format: decimal with optional '+' or '-'; the whole string must be consumed.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure, trailing characters or out-of-range sets ok=false and
// returns 0.
int parse_int(const std::string& value, int min, int max, bool& ok);

// Parse a long from a string.
// Format and bounds as parse_int.
long parse_long(const std::string& value, long min, long max, bool& ok);

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB or GB (case-insensitive).
// Bounds: [0, SIZE_MAX].
// Invalid input: bad unit or parse failure sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, bool& ok);

// Interpret a config or environment value as a boolean switch.
// "", "1", "true", "yes" and "on" (case-insensitive) are true; everything else is false.
bool parse_bool(const std::string& value);

#endif // PARSE_UTILS_HPP
