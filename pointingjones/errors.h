#ifndef POINTINGJONES_ERRORS_H
#define POINTINGJONES_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Base class of all errors raised by the pointing-jones pipeline. Each
 * subclass corresponds with one error kind, so that callers (and tests) can
 * tell a missing reference file apart from a corrupt one.
 */
class PointingJonesError : public std::runtime_error
{
public:
	explicit PointingJonesError(const std::string& message) : std::runtime_error(message) { }
};

/** A configuration, alignment or telescope-model file, or an entry in it, does not exist. */
class NotFoundError : public PointingJonesError
{
public:
	explicit NotFoundError(const std::string& message) : PointingJonesError(message) { }
};

/** Reference data that exists but can not be parsed. */
class MalformedError : public PointingJonesError
{
public:
	explicit MalformedError(const std::string& message) : PointingJonesError(message) { }
};

class InvalidArgumentError : public PointingJonesError
{
public:
	explicit InvalidArgumentError(const std::string& message) : PointingJonesError(message) { }
};

/** A requested frequency lies outside the band. */
class RangeError : public PointingJonesError
{
public:
	explicit RangeError(const std::string& message) : PointingJonesError(message) { }
};

/** A requested frequency lies inside the band, but no channel is close enough. */
class NoMatchingChannelError : public PointingJonesError
{
public:
	explicit NoMatchingChannelError(const std::string& message) : PointingJonesError(message) { }
};

/** A telescope-model file is corrupt or incompatible. */
class DeserializeError : public PointingJonesError
{
public:
	explicit DeserializeError(const std::string& message) : PointingJonesError(message) { }
};

/** The requested time window starts before the telescope model is available. */
class EpochError : public PointingJonesError
{
public:
	explicit EpochError(const std::string& message) : PointingJonesError(message) { }
};

/** A coordinate conversion could not be performed. */
class TransformError : public PointingJonesError
{
public:
	explicit TransformError(const std::string& message) : PointingJonesError(message) { }
};

#endif
