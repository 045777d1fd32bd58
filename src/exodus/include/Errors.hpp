#pragma once
#include <stdexcept>
#include <string>

/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by the container adapter and the Exodus writer.
 *
 * @details
 * Every error is thrown synchronously by the call that detects it. Messages carry a bracketed
 * component tag, e.g. `[exodus.alloc] side set id 7 already exists`.
 *
 * - :cpp:class:`ValidationError`: a precondition was violated by the caller.
 * - :cpp:class:`NotFoundError`: a block id, side-set id or variable name does not exist.
 * - :cpp:class:`CapacityExhausted`: no free block / side-set slot remains.
 * - :cpp:class:`ContainerError`: the netCDF-C library reported a failure.
 */

namespace exodus
{

class Error : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class ValidationError : public Error
{
  public:
    using Error::Error;
};

class NotFoundError : public Error
{
  public:
    using Error::Error;
};

class CapacityExhausted : public Error
{
  public:
    using Error::Error;
};

class ContainerError : public Error
{
  public:
    using Error::Error;
};

} // namespace exodus
