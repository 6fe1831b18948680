#pragma once

#include <stdexcept>
#include <string>

namespace elan_eaf {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or out-of-range caller input.
class InvalidArgument : public Error {
public:
    using Error::Error;
};

// XML input does not have the expected structure.
class FormatError : public Error {
public:
    using Error::Error;
};

// A TIER tag was handed to the wrong class (PARENT_REF present or missing).
class WrongVariant : public FormatError {
public:
    using FormatError::FormatError;
};

class NotFound : public Error {
public:
    using Error::Error;
};

// More than one row carries an id that must be unique.
class Corruption : public Error {
public:
    using Error::Error;
};

class IoError : public Error {
public:
    using Error::Error;
};

// A save would replace an existing file and overwriting was not requested.
class AlreadyExists : public IoError {
public:
    using IoError::IoError;
};

}  // namespace elan_eaf
