#ifndef TSM_ERRORS_HPP
#define TSM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tsm {

/**
 * Error taxonomy of the model contract layer.
 *
 * Argument problems derive from std::invalid_argument, state and I/O
 * problems from std::runtime_error, so callers may catch either the
 * specific kind or the standard base.
 */

// Trailing dimensions of an input or output do not match the declared shape
class ShapeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A structured data object failed its own consistency check
class IntegrityError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Negative steps, malformed shapes, unknown configuration fields, ...
class InvalidArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Fewer differenced rows than the lag window requires
class InsufficientDataError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// predict() called before a successful train()
class ModelNotTrainedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing, unwritable or unreadable dump/load path
class PathAccessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A loaded file does not hold a model of the expected kind
class TypeMismatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tsm

#endif // TSM_ERRORS_HPP
