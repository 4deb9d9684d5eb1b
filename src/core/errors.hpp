/**
 * @file    errors.hpp
 * @brief   Exception types thrown by the annotation core
 * @license MIT
 *
 * @details
 * Core components fail fast by throwing. Hosts (GUI controller, CLI)
 * catch std::exception, log it and present the message to the user.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace bba {

/**
 * Operation invoked in a state where it cannot run
 * (no image attached, non-positive magnification, non-finite point, ...)
 */
class PreconditionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Degenerate geometry, e.g. a crop that yields a zero-area raster
 */
class GeometryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Malformed annotation document or item
 */
class AnnotationFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Image file that could not be decoded
 */
class ImageDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace bba
