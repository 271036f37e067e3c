#pragma once

#include <stdexcept>
#include <string>

namespace tracker {

// network failure or non-success HTTP status
class TransportError : public std::runtime_error {
public:
	TransportError(std::string message) : std::runtime_error(message) {}
};

// malformed payload, too short a series, unexpected unit multiplier
class DataError : public std::runtime_error {
public:
	DataError(std::string message) : std::runtime_error(message) {}
};

class PersistenceError : public std::runtime_error {
public:
	PersistenceError(std::string message) : std::runtime_error(message) {}
};

/**
 * No exchange rate was published for the requested day nor for any of the
 * days the retry budget allowed walking back to.
 */
class RateExhausted : public std::runtime_error {
public:
	RateExhausted(std::string message) : std::runtime_error(message) {}
};

}
