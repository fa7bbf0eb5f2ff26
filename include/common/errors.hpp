#ifndef RIFT_ERRORS_HPP
#define RIFT_ERRORS_HPP

#include <stdexcept>
#include <string>

// Local disk failure. Fatal to the operation that hit it.
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& what) : std::runtime_error(what) {}
};

// Connect, timeout, reset or empty response from one peer.
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
};

// Received bytes do not hash to the expected digest.
class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed request header, chunk index or manifest encoding.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

#endif // RIFT_ERRORS_HPP
