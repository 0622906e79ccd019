#pragma once

#include <stdexcept>
#include <string>

namespace barrace
{

// Base class for failures the bar race pipeline reports to its caller.
class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Options rejected before any rendering starts: non-positive fps or duration,
// an empty candidate limit, or a display list naming an unknown series.
class InvalidConfigurationError : public Error
{
   public:
    using Error::Error;
};

// The table cannot be animated: fewer than two rows or nothing to display.
class InsufficientDataError : public Error
{
   public:
    using Error::Error;
};

// The video or image encoder failed. No output file is left behind.
class EncodingError : public Error
{
   public:
    using Error::Error;
};

}  // namespace barrace
