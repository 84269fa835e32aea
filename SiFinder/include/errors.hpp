#pragma once

#include <stdexcept>
#include <string>

namespace sifinder {

// Base of every error the library raises on purpose
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Image file unreadable or not an image
class DecodeError : public Error {
public:
    using Error::Error;
};

// SQLite I/O, permission, lock or schema failure
class StoreError : public Error {
public:
    using Error::Error;
};

// Missing index or missing directory
class NotFoundError : public Error {
public:
    using Error::Error;
};

} // namespace sifinder
